#include <cstdlib>
#include <exception>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <fmt/core.h>

#include "builtins.hpp"
#include "debug.hpp"
#include "parser.hpp"
#include "repl.hpp"
#include "schemer.hpp"
#include "utils.hpp"

namespace {

void print_usage(std::string_view program)
{
    fmt::print("Usage: {}                 start the REPL\n", program);
    fmt::print("       {} '(expr)'        evaluate one expression\n", program);
    fmt::print("       {} file [args...]  run a program; args are bound to `args`\n", program);
}

// Parses and evaluates one expression given on the command line.
int eval_expression(const std::string& text)
{
    try {
        auto env = reload_global_environment();
        parser p(text);
        auto result = eval(p.parse(), env);
        fmt::print("{}\n", value_to_string(result));
        return EXIT_SUCCESS;
    } catch (const std::exception& e) {
        println_red("Error: {}", e.what());
        return EXIT_FAILURE;
    }
}

// Runs a program file in a frame over the global environment in which
// `args` holds the remaining command line arguments as strings.
int run_program(const std::string& filename, const std::vector<std::string>& arguments)
{
    try {
        auto global_env = reload_global_environment();

        std::vector<value_ptr> arg_values;
        arg_values.reserve(arguments.size());
        for (const auto& argument : arguments) {
            arg_values.push_back(value::make(argument));
        }
        auto program_env = global_env->bind_vars({{"args", make_list(std::move(arg_values))}});
        // load must evaluate into the program's frame so that args is visible.
        builtins::define_load(program_env);

        auto load_form = make_list({make_symbol("load"), value::make(filename)});
        auto result = eval(load_form, program_env);
        fmt::print("{}\n", value_to_string(result));
        return EXIT_SUCCESS;
    } catch (const std::exception& e) {
        println_red("Error: {}", e.what());
        return EXIT_FAILURE;
    }
}

} // namespace

int main(int argc, char* argv[])
{
    std::vector<std::string> arguments(argv + 1, argv + argc);

    // SCHEMER_DEBUG=eval,apply enables those categories from the start.
    try {
        get_debug().configure(get_env_or("SCHEMER_DEBUG", ""));
    } catch (const std::runtime_error& e) {
        println_red("Error: {}", e.what());
        return EXIT_FAILURE;
    }

    if (arguments.empty()) {
        repl(reload_global_environment());
        return EXIT_SUCCESS;
    }

    const auto& first = arguments.front();
    if ("-h" == first or "--help" == first) {
        print_usage(argv[0]);
        return EXIT_SUCCESS;
    }

    if (first.starts_with("(")) {
        return eval_expression(first);
    }

    return run_program(first, {arguments.begin() + 1, arguments.end()});
}
