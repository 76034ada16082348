#include <algorithm>
#include <cstdlib>
#include <cstring>
#include <exception>
#include <memory>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>

#include <fmt/core.h>
#include <fmt/format.h>

#include <readline/history.h>
#include <readline/readline.h>

#include "builtins.hpp"
#include "debug.hpp"
#include "parser.hpp"
#include "repl.hpp"
#include "utils.hpp"

namespace {

// The environment tab completion draws its symbols from.
env_ptr completion_env;

std::optional<std::string> get_history_file()
{
    const char* home = std::getenv("HOME");
    if (not home) return std::nullopt;
    return fmt::format("{}/.schemer_history", home);
}

// Empty optional at end of input.
std::optional<std::string> read_with_readline(const std::string& prompt)
{
    std::unique_ptr<char, decltype([](char* p){ std::free(p); })>
        line(readline(prompt.c_str()));
    if (not line) return std::nullopt;
    return std::string(line.get());
}

char* symbol_generator(const char* prefix, int state)
{
    static std::vector<std::string> matches;
    static std::size_t match_index{0};

    if (0 == state) {
        matches.clear();
        match_index = 0;

        if (completion_env) {
            for (const auto& name : completion_env->get_all_symbols()) {
                if (std::string_view(name).starts_with(prefix)) {
                    matches.push_back(name);
                }
            }
        }

        std::ranges::sort(matches);
        const auto [first, last] = std::ranges::unique(matches);
        matches.erase(first, last);
    }

    if (match_index < matches.size()) {
        return strdup(matches[match_index++].c_str());
    }

    return nullptr;
}

char** symbol_completion(const char* text, int start, int)
{
    // Don't complete filenames
    rl_attempted_completion_over = 1;

    if (0 == start or std::strchr("(' \t\n", rl_line_buffer[start - 1])) {
        return rl_completion_matches(text, symbol_generator);
    }

    return nullptr;
}

void setup_completion()
{
    rl_attempted_completion_function = symbol_completion;
    rl_completer_word_break_characters = " \t\n()'";
}

void print_welcome()
{
    fmt::print("Welcome to the Schemer REPL!\n");
    fmt::print("Type expressions to evaluate them, or 'quit' to exit.\n");
    fmt::print("Multi-line expressions are supported - just keep typing!\n");
    fmt::print("Special commands start with ':' (try ':help')\n");
    fmt::print("Examples:\n");
    fmt::print("  (+ 1 2 3)\n");
    fmt::print("  (define (square x) (* x x))\n");
    fmt::print("  (map square '(1 2 3))\n");
    fmt::print("  :debug on eval\n");
    fmt::print("\n");
}

// True once parentheses balance outside strings, comments and character
// literals. Unbalanced closing parens count as complete so the reader can
// report them.
bool is_complete_expression(const std::string& input)
{
    int paren_count = 0;
    bool in_string = false;
    bool in_comment = false;
    bool escaped = false;

    for (std::size_t i = 0; i < input.size(); ++i) {
        char ch = input[i];
        if (in_comment) {
            if ('\n' == ch) in_comment = false;
            continue;
        }

        if (escaped) {
            escaped = false;
            continue;
        }

        if (in_string) {
            if ('\\' == ch) {
                escaped = true;
            } else if ('"' == ch) {
                in_string = false;
            }
            continue;
        }

        switch (ch) {
            case '"':
                in_string = true;
                break;
            case ';':
                in_comment = true;
                break;
            case '#':
                // #\( and #\) are characters, not parens
                if (i + 2 < input.size() and '\\' == input[i + 1]) {
                    i += 2;
                }
                break;
            case '(':
                paren_count++;
                break;
            case ')':
                paren_count--;
                if (paren_count < 0) return true;
                break;
        }
    }

    return not in_string and paren_count <= 0;
}

std::string trim(const std::string& text)
{
    auto first = text.find_first_not_of(" \t\n\r");
    if (std::string::npos == first) return "";
    auto last = text.find_last_not_of(" \t\n\r");
    return text.substr(first, last - first + 1);
}

// Reads lines until they form a complete expression. Empty optional at end
// of input.
std::optional<std::string> read_expression()
{
    std::string accumulated_input;

    while (true) {
        auto line = read_with_readline(
            accumulated_input.empty()? "Lisp>>> ": "...> ");
        if (not line) {
            if (accumulated_input.empty()) return std::nullopt;
            // End of input part way through: hand what we have to the reader.
            return trim(accumulated_input);
        }

        if (not accumulated_input.empty()) {
            accumulated_input += "\n";
        }
        accumulated_input += *line;

        std::string trimmed = trim(accumulated_input);
        if (trimmed.empty()) {
            accumulated_input.clear();
            continue;
        }

        if ("quit" == trimmed or "exit" == trimmed or trimmed.starts_with(":")) {
            return trimmed;
        }

        if (is_complete_expression(trimmed)) {
            add_history(trimmed.c_str());
            return trimmed;
        }
    }
}

bool is_quit_command(const std::string& input)
{
    return "quit" == input or "exit" == input;
}

void print_debug_help()
{
    fmt::print("Debug commands:\n");
    fmt::print("  :debug on [category]    - Enable debug output (all categories if none specified)\n");
    fmt::print("  :debug off [category]   - Disable debug output (all categories if none specified)\n");
    fmt::print("  :debug status           - Show current debug settings\n");
    fmt::print("  :debug colors on/off    - Enable/disable colored output\n");
    fmt::print("  :debug env-counts       - Show how many environments are alive\n");
    fmt::print("\n");
    fmt::print("Categories (or 'all' / 'none'):\n");
    for (const auto& category : debug_categories) {
        fmt::print("  {:<12} {}\n", category.name, category.description);
    }
}

bool handle_debug_command(const std::string& input)
{
    if (not input.starts_with(":debug")) {
        return false;
    }

    std::istringstream iss(input);
    std::string command, action, category;
    iss >> command >> action;

    if ("help" == action or action.empty()) {
        print_debug_help();
        return true;
    }

    if ("status" == action) {
        fmt::print("Debug status:\n");
        fmt::print("  Colors: {}\n", get_debug().are_colors_enabled()? "enabled": "disabled");
        fmt::print("  Enabled categories:\n");

        auto enabled = get_debug().enabled_categories();
        if (enabled.empty()) {
            fmt::print("    (none)\n");
        } else {
            fmt::print("    {}\n", fmt::join(enabled, ", "));
        }
        return true;
    }

    if ("colors" == action) {
        std::string setting;
        iss >> setting;
        if ("on" == setting) {
            get_debug().set_colors(true);
            fmt::print("Debug colors enabled\n");
        } else if ("off" == setting) {
            get_debug().set_colors(false);
            fmt::print("Debug colors disabled\n");
        } else {
            fmt::print("Usage: :debug colors on|off\n");
        }
        return true;
    }

    if ("on" == action) {
        iss >> category;
        if (category.empty()) {
            get_debug().enable_all();
            fmt::print("All debug output enabled\n");
        } else {
            try {
                get_debug().enable(category);
                fmt::print("Debug category '{}' enabled\n", category);
            } catch (const std::exception& e) {
                println_red("Error: {}", e.what());
            }
        }
        return true;
    }

    if ("off" == action) {
        iss >> category;
        if (category.empty()) {
            get_debug().disable_all();
            fmt::print("All debug output disabled\n");
        } else {
            get_debug().disable(category);
            fmt::print("Debug category '{}' disabled\n", category);
        }
        return true;
    }

    if ("env-counts" == action) {
        fmt::print("Environments alive: {}\n", environment::get_constructed_count());
        return true;
    }

    fmt::print("Unknown debug action: {}. Try ':debug help'\n", action);
    return true;
}

// Returns true if the input was a command and has been handled.
bool handle_special_command(const std::string& input, env_ptr& env)
{
    if (handle_debug_command(input)) {
        return true;
    }

    if (":help" == input) {
        fmt::print("Special commands:\n");
        fmt::print("  :help          - Show this help\n");
        fmt::print("  :reload        - Recreate the global environment and reload the library\n");
        fmt::print("  :debug ...     - Debug control commands (:debug help for details)\n");
        fmt::print("  quit, exit     - Exit the REPL\n");
        fmt::print("\n");
        fmt::print("Or enter any expression to evaluate it.\n");
        return true;
    }

    if (":reload" == input) {
        env = reload_global_environment();
        completion_env = env;
        fmt::print("Environment reloaded from {}\n", stdlib_path());
        return true;
    }

    if (input.starts_with(":")) {
        fmt::print("Unknown command: {}. Try ':help'\n", input);
        return true;
    }

    return false;
}

void eval_and_print(const std::string& input, const env_ptr& env)
{
    try {
        parser p(input);
        auto expr = p.parse_optional();
        if (not expr) return;

        call_stack_reset_max_depth();
        auto result = eval(*expr, env);
        SCHEMER_DEBUG(stack-depth, "max stack depth: {}", call_stack_get_max_depth());
        fmt::print("=> {}\n", value_to_string(result));
    } catch (const std::exception& e) {
        println_red("Error: {}", e.what());
    }
}

} // namespace

void repl(env_ptr env)
{
    auto history_file = get_history_file();
    if (history_file) {
        read_history(history_file->c_str());
    }
    completion_env = env;
    setup_completion();

    print_welcome();

    while (true) {
        auto input = read_expression();
        if (not input) {
            fmt::print("\n");
            break;
        }

        if (is_quit_command(*input)) {
            fmt::print("Goodbye!\n");
            break;
        }

        if (handle_special_command(*input, env)) {
            continue;
        }

        eval_and_print(*input, env);
    }

    if (history_file) {
        write_history(history_file->c_str());
    }
    completion_env.reset();
}
