#include <cstddef>
#include <cstdio>
#include <cstdlib>
#include <exception>
#include <fstream>
#include <iostream>
#include <iterator>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include <eval/evaluator.hpp>
#include <fmt/format.h>
#include <object/object.hpp>
#include <parser/parser.hpp>

namespace
{
constexpr auto monkey_face = R"r(
             __,__
     .--. .-"     "-. .--.
    / .. \/ .-. .-. \/ .. \
   | |  '| /   Y   \ |'  | |
   | \   \ \ 0 | 0 / /  /  |
    \ '-,\.-"""""""-./,-' /
     ''-' /_  ^ ^  _\ '-''
         | \._   _./ |
         \  \ '~' /  /
          '._'-=-'_.'
            '-----'
)r";

auto monkey_business()
{
    std::cerr << monkey_face;
    std::cerr << "Woops! We ran into some monkey business here!\n  ";
}

auto print_parse_errors(const std::vector<std::string>& errors)
{
    monkey_business();
    std::cerr << "  parser errors: \n";
    for (const auto& error : errors) {
        std::cerr << "    " << error << '\n';
    }
}

struct command_line_args
{
    bool help {};
    bool debug {};
    std::string_view file;
};

[[noreturn]] auto show_usage(std::string_view program, std::string_view error_msg = {})
{
    auto exit_code = EXIT_SUCCESS;
    if (!error_msg.empty()) {
        fmt::print("Error: {}\n", error_msg);
        exit_code = EXIT_FAILURE;
    }
    fmt::print("Usage: {} [-d] [-h] [<file>]\n\n", program);
    fmt::print("  -d  print the parsed program before evaluating it\n");
    fmt::print("  -h  show this help\n");
    fmt::print("Reads standard input when no file is given.\n");
    // NOLINTBEGIN(concurrency-mt-unsafe)
    exit(exit_code);
    // NOLINTEND(concurrency-mt-unsafe)
}

auto parse_command_line(std::string_view program, int argc, char** argv) -> command_line_args
{
    command_line_args opts {};
    for (std::string_view arg : std::span(argv, static_cast<std::size_t>(argc))) {
        if (arg.empty()) {
            continue;
        }
        if (arg[0] == '-' && arg.size() == 1) {
            show_usage(program, fmt::format("invalid option {}", arg));
        }
        if (arg[0] == '-' && arg.size() > 1) {
            switch (arg[1]) {
                case 'h':
                    opts.help = true;
                    break;
                case 'd':
                    opts.debug = true;
                    break;
                default: {
                    show_usage(program, fmt::format("invalid option {}", arg));
                }
            }
        } else {
            if (opts.file.empty()) {
                opts.file = arg;
            } else {
                fmt::print("ignoring file argument {}, already have one set.\n", arg);
            }
        }
    }
    return opts;
}

auto run(std::string_view contents, const command_line_args& opts) -> int
{
    auto prsr = parser {contents};
    auto prgrm = prsr.parse_program();
    if (!prsr.errors().empty()) {
        print_parse_errors(prsr.errors());
        return 1;
    }
    if (opts.debug) {
        fmt::print(stderr, "{}\n", prgrm->string());
    }
    const auto result = eval(*prgrm);
    if (result) {
        std::cout << result->inspect() << '\n';
    }
    return 0;
}

auto run_file(const command_line_args& opts) -> int
{
    std::ifstream ifs(std::string {opts.file});
    if (!ifs) {
        std::cerr << "ERROR: could not open file: " << opts.file << '\n';
        return 1;
    }
    const std::string contents {(std::istreambuf_iterator<char>(ifs)), (std::istreambuf_iterator<char>())};
    return run(contents, opts);
}

auto run_stdin(const command_line_args& opts) -> int
{
    const std::string contents {(std::istreambuf_iterator<char>(std::cin)), (std::istreambuf_iterator<char>())};
    return run(contents, opts);
}
}  // namespace

auto main(int argc, char* argv[]) -> int
{
    auto program = std::string_view(argc > 0 ? *argv : "monkey");
    auto opts = argc > 0 ? parse_command_line(program, argc - 1, ++argv) : command_line_args {};
    if (opts.help) {
        show_usage(program);
    }
    try {
        if (!opts.file.empty()) {
            return run_file(opts);
        }
        return run_stdin(opts);
    } catch (const std::exception& e) {
        monkey_business();
        std::cerr << "Caught an exception: " << e.what() << '\n';
        return 1;
    }
}
