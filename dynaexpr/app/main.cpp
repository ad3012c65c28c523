#include "ast/ast.hpp"
#include "parser/parser.hpp"
#include "parser/tokenizer.hpp"

#include <iostream>
#include <iterator>
#include <sstream>
#include <string>
#include <string_view>

namespace {

auto read_source(int argc, char **argv, int first) -> std::string {
    if (first >= argc) {
        return std::string(std::istreambuf_iterator<char>(std::cin),
                           std::istreambuf_iterator<char>());
    }

    std::ostringstream source;
    for (int i = first; i < argc; i++) {
        if (i > first) source << ' ';
        source << argv[i]; // NOLINT
    }
    return source.str();
}

} // namespace

auto main(int argc, char **argv) -> int {
    bool tree = false;
    int first = 1;

    if (argc > 1) {
        std::string_view flag(argv[1]); // NOLINT
        if (flag == "--help" || flag == "-h") {
            std::cout << "Use: dynaexpr_cli [--tree] [expression...]\n"
                         "Reads the expression from stdin when none is "
                         "given.\n";
            return 0;
        }
        if (flag == "--tree") {
            tree = true;
            first = 2;
        } else if (flag.starts_with("--")) {
            std::cerr << "Unknown option: " << flag << '\n';
            return 2;
        }
    }

    auto source = read_source(argc, argv, first);
    auto output = parse_condition(source);
    if (!output.ok()) {
        for (const auto &error : output.errors)
            std::cerr << "parse error: " << error << '\n';
        return 1;
    }

    if (tree) {
        ASTPrinter printer;
        printer(output.root);
    } else {
        std::cout << to_string(output.root) << '\n';
    }

    return 0;
}
