#include <rpncalc/calculator.hpp>

#include <iostream>
#include <string_view>

static void print_usage(std::ostream& os) {
    os << "usage: rpncalc EXPRESSION\n"
          "\n"
          "Evaluate an arithmetic/comparison expression, e.g.\n"
          "  rpncalc \"2^3^4\"\n"
          "  rpncalc \"cos(hypot(3, 4)) >= -1\"\n";
}

int main(int argc, char** argv) {
    if (argc == 2) {
        std::string_view arg = argv[1];
        if (arg == "-h" || arg == "--help") {
            print_usage(std::cout);
            return 0;
        }
    }
    if (argc != 2) {
        print_usage(std::cerr);
        return 2;
    }

    auto result = rpncalc::calculate(argv[1]);
    if (!result) {
        std::cerr << "ERROR: " << result.error().message << "\n";
        return 1;
    }

    std::cout << rpncalc::format_value(result.value()) << "\n";
    return 0;
}
