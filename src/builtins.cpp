#include <cstdint>
#include <functional>
#include <memory>
#include <ranges>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

#include <fmt/core.h>

#include "builtins.hpp"
#include "debug.hpp"
#include "parser.hpp"
#include "unicode.hpp"
#include "utils.hpp"

#ifndef SCHEMER_STDLIB_PATH
#define SCHEMER_STDLIB_PATH "src/stdlib.scm"
#endif

using args_type = std::vector<value_ptr>;

namespace builtins {

    void expect_args(const args_type& args, std::size_t count)
    {
        if (args.size() != count) {
            throw num_args_error(count, args);
        }
    }

    bignum unpack_number(const value_ptr& val)
    {
        if (auto n = std::get_if<bignum>(&val->data)) return *n;
        throw type_mismatch_error("number", val);
    }

    std::string unpack_string(const value_ptr& val)
    {
        if (auto s = std::get_if<std::string>(&val->data)) return *s;
        throw type_mismatch_error("string", val);
    }

    bool unpack_bool(const value_ptr& val)
    {
        if (auto b = std::get_if<bool>(&val->data)) return *b;
        throw type_mismatch_error("boolean", val);
    }

    char32_t unpack_char(const value_ptr& val)
    {
        if (auto c = std::get_if<character>(&val->data)) return c->code;
        throw type_mismatch_error("character", val);
    }

    const list& unpack_list(const value_ptr& val)
    {
        if (auto l = std::get_if<list>(&val->data)) return *l;
        throw type_mismatch_error("list", val);
    }

    void check_divisor(const bignum& divisor)
    {
        if (divisor == 0) {
            throw default_error("Division by zero");
        }
    }

    // Division rounding towards negative infinity
    bignum floor_div(const bignum& lhs, const bignum& rhs)
    {
        check_divisor(rhs);
        bignum quotient = lhs / rhs;
        if (lhs % rhs != 0 and ((lhs < 0) != (rhs < 0))) {
            --quotient;
        }
        return quotient;
    }

    // Remainder with the sign of the divisor
    bignum floor_mod(const bignum& lhs, const bignum& rhs)
    {
        check_divisor(rhs);
        bignum remainder = lhs % rhs;
        if (remainder != 0 and ((remainder < 0) != (rhs < 0))) {
            remainder += rhs;
        }
        return remainder;
    }

    // Folds op over two or more numbers, left to right. Every argument is
    // type checked before any arithmetic happens.
    primitive_function numeric_binop(std::function<bignum(const bignum&, const bignum&)> op)
    {
        return [op](const args_type& args) -> value_ptr {
            if (args.size() < 2) {
                throw num_args_error(2, args);
            }
            std::vector<bignum> operands;
            operands.reserve(args.size());
            for (const auto& arg : args) {
                operands.push_back(unpack_number(arg));
            }
            bignum result = operands.front();
            for (const auto& operand : operands | std::views::drop(1)) {
                result = op(result, operand);
            }
            return make_number(std::move(result));
        };
    }

    template<typename Unpack, typename Compare>
    primitive_function bool_binop(Unpack unpack, Compare compare)
    {
        return [unpack, compare](const args_type& args) -> value_ptr {
            expect_args(args, 2);
            auto lhs = unpack(args[0]);
            auto rhs = unpack(args[1]);
            return make_bool(compare(lhs, rhs));
        };
    }

    primitive_function type_predicate(std::function<bool(const value_ptr&)> test)
    {
        return [test](const args_type& args) -> value_ptr {
            expect_args(args, 1);
            return make_bool(test(args[0]));
        };
    }

    value_ptr car(const args_type& args)
    {
        expect_args(args, 1);
        const auto& arg = args[0];
        if (auto l = std::get_if<list>(&arg->data); l and not l->items.empty()) {
            return l->items.front();
        }
        if (auto d = std::get_if<dotted_list>(&arg->data); d and not d->head.empty()) {
            return d->head.front();
        }
        throw type_mismatch_error("pair", arg);
    }

    value_ptr cdr(const args_type& args)
    {
        expect_args(args, 1);
        const auto& arg = args[0];
        if (auto l = std::get_if<list>(&arg->data); l and not l->items.empty()) {
            return make_list({l->items.begin() + 1, l->items.end()});
        }
        if (auto d = std::get_if<dotted_list>(&arg->data); d and not d->head.empty()) {
            if (1 == d->head.size()) {
                return d->tail;
            }
            return value::make(dotted_list{{d->head.begin() + 1, d->head.end()}, d->tail});
        }
        throw type_mismatch_error("pair", arg);
    }

    value_ptr cons(const args_type& args)
    {
        expect_args(args, 2);
        const auto& first = args[0];
        const auto& rest = args[1];
        if (auto l = std::get_if<list>(&rest->data)) {
            args_type items{first};
            items.insert(items.end(), l->items.begin(), l->items.end());
            return make_list(std::move(items));
        }
        if (auto d = std::get_if<dotted_list>(&rest->data)) {
            args_type head{first};
            head.insert(head.end(), d->head.begin(), d->head.end());
            return value::make(dotted_list{std::move(head), d->tail});
        }
        return value::make(dotted_list{{first}, rest});
    }

    value_ptr eqv(const args_type& args)
    {
        expect_args(args, 2);
        return make_bool(values_equal(args[0], args[1]));
    }

    value_ptr symbol_to_string(const args_type& args)
    {
        expect_args(args, 1);
        if (auto sym = std::get_if<symbol>(&args[0]->data)) {
            return value::make(sym->name);
        }
        throw type_mismatch_error("symbol", args[0]);
    }

    value_ptr string_to_symbol(const args_type& args)
    {
        expect_args(args, 1);
        return make_symbol(unpack_string(args[0]));
    }

    // Strings are UTF-8; anything that needs code points goes through here.
    std::u32string decode_string(const value_ptr& val)
    {
        auto text = unpack_string(val);
        try {
            return utf8_to_utf32(text);
        } catch (const std::invalid_argument& e) {
            throw default_error(fmt::format("Malformed string {}: {}", to_string(text), e.what()));
        }
    }

    value_ptr string_length(const args_type& args)
    {
        expect_args(args, 1);
        return make_number(decode_string(args[0]).size());
    }

    value_ptr string_append(const args_type& args)
    {
        std::string result;
        for (const auto& arg : args) {
            result += unpack_string(arg);
        }
        return value::make(std::move(result));
    }

    value_ptr string_to_list(const args_type& args)
    {
        expect_args(args, 1);
        args_type characters;
        for (char32_t code : decode_string(args[0])) {
            characters.push_back(value::make(character{code}));
        }
        return make_list(std::move(characters));
    }

    std::string encode_char(char32_t code)
    {
        try {
            return encode_utf8(code);
        } catch (const std::invalid_argument& e) {
            throw default_error(e.what());
        }
    }

    value_ptr list_to_string(const args_type& args)
    {
        expect_args(args, 1);
        std::string result;
        for (const auto& item : unpack_list(args[0]).items) {
            result += encode_char(unpack_char(item));
        }
        return value::make(std::move(result));
    }

    value_ptr char_to_integer(const args_type& args)
    {
        expect_args(args, 1);
        return make_number(static_cast<std::uint32_t>(unpack_char(args[0])));
    }

    value_ptr integer_to_char(const args_type& args)
    {
        expect_args(args, 1);
        auto code = unpack_number(args[0]);
        if (code < 0 or code > 0x10FFFF) {
            throw default_error(fmt::format("Invalid Unicode codepoint: {}", to_string(code)));
        }
        auto codepoint = static_cast<char32_t>(code.convert_to<std::uint32_t>());
        encode_char(codepoint);   // rejects surrogates
        return value::make(character{codepoint});
    }

    value_ptr number_to_string(const args_type& args)
    {
        expect_args(args, 1);
        return value::make(to_string(unpack_number(args[0])));
    }

    // Decimal integers with an optional sign; anything else is #f.
    value_ptr string_to_number(const args_type& args)
    {
        expect_args(args, 1);
        auto text = unpack_string(args[0]);
        std::string_view digits = text;
        bool negative = false;
        if (not digits.empty() and (digits.front() == '-' or digits.front() == '+')) {
            negative = digits.front() == '-';
            digits.remove_prefix(1);
        }
        if (digits.empty()) return make_bool(false);

        bignum result = 0;
        for (char digit : digits) {
            if (digit < '0' or digit > '9') return make_bool(false);
            result = result * 10 + (digit - '0');
        }
        return make_number(negative ? bignum(-result) : result);
    }

    // (apply proc (args...)) or (apply proc arg...)
    value_ptr apply(const args_type& args)
    {
        if (args.empty()) {
            throw num_args_error(2, args);
        }
        if (2 == args.size()) {
            if (auto spread = std::get_if<list>(&args[1]->data)) {
                return apply_procedure(args[0], spread->items);
            }
        }
        return apply_procedure(args[0], {args.begin() + 1, args.end()});
    }

    value_ptr display(const args_type& args)
    {
        expect_args(args, 1);
        const auto& val = args[0];
        if (auto s = std::get_if<std::string>(&val->data)) {
            fmt::print("{}", *s);
        } else if (auto c = std::get_if<character>(&val->data)) {
            fmt::print("{}", encode_char(c->code));
        } else {
            fmt::print("{}", value_to_string(val));
        }
        return val;
    }

    value_ptr write(const args_type& args)
    {
        expect_args(args, 1);
        fmt::print("{}", value_to_string(args[0]));
        return args[0];
    }

    value_ptr newline(const args_type& args)
    {
        expect_args(args, 0);
        fmt::print("\n");
        return make_list({});
    }

    value_ptr read(const args_type& args)
    {
        expect_args(args, 1);
        parser p(unpack_string(args[0]));
        return p.parse();
    }

    std::string read_source(const std::string& filename)
    {
        try {
            return read_file_content(filename);
        } catch (const std::runtime_error& e) {
            throw default_error(e.what());
        }
    }

    value_ptr read_contents(const args_type& args)
    {
        expect_args(args, 1);
        return value::make(read_source(unpack_string(args[0])));
    }

    value_ptr read_all(const args_type& args)
    {
        expect_args(args, 1);
        parser p(read_source(unpack_string(args[0])));
        return make_list(p.parse_all());
    }

    value_ptr load_file(const std::string& filename, const env_ptr& env)
    {
        SCHEMER_DEBUG(load, "Loading {}", filename);
        parser p(read_source(filename));
        auto expressions = p.parse_all();

        value_ptr result = make_list({});
        for (const auto& expr : expressions) {
            result = eval(expr, env);
            SCHEMER_DEBUG(load, "Loaded: {} => {}", value_to_string(expr), value_to_string(result));
        }
        return result;
    }

    void define_load(const env_ptr& env)
    {
        // Held weakly: the environment owns this primitive.
        std::weak_ptr<environment> target = env;
        env->define_var("load", value::make(primitive{"load",
            [target](const args_type& args) -> value_ptr {
                expect_args(args, 1);
                auto env = target.lock();
                if (not env) {
                    throw default_error("load: environment no longer exists");
                }
                return load_file(unpack_string(args[0]), env);
            }}));
    }

    primitive_table make_primitive_table()
    {
        auto bool_value = [](const value_ptr& val) { return unpack_bool(val); };
        auto number_value = [](const value_ptr& val) { return unpack_number(val); };
        auto string_value = [](const value_ptr& val) { return unpack_string(val); };
        auto char_value = [](const value_ptr& val) { return unpack_char(val); };

        auto holds = []<typename T>() {
            return [](const value_ptr& val) { return std::holds_alternative<T>(val->data); };
        };

        return primitive_table{
            // Arithmetic
            {"+", numeric_binop(std::plus<bignum>{})},
            {"-", numeric_binop(std::minus<bignum>{})},
            {"*", numeric_binop(std::multiplies<bignum>{})},
            {"/", numeric_binop(floor_div)},
            {"mod", numeric_binop(floor_mod)},
            {"quotient", numeric_binop([](const bignum& lhs, const bignum& rhs) {
                check_divisor(rhs);
                return bignum(lhs / rhs);
            })},
            {"remainder", numeric_binop([](const bignum& lhs, const bignum& rhs) {
                check_divisor(rhs);
                return bignum(lhs % rhs);
            })},
            // Comparisons
            {"=", bool_binop(number_value, std::equal_to<>{})},
            {"<", bool_binop(number_value, std::less<>{})},
            {">", bool_binop(number_value, std::greater<>{})},
            {"/=", bool_binop(number_value, std::not_equal_to<>{})},
            {">=", bool_binop(number_value, std::greater_equal<>{})},
            {"<=", bool_binop(number_value, std::less_equal<>{})},
            {"&&", bool_binop(bool_value, std::logical_and<>{})},
            {"||", bool_binop(bool_value, std::logical_or<>{})},
            {"string=?", bool_binop(string_value, std::equal_to<>{})},
            {"string<?", bool_binop(string_value, std::less<>{})},
            {"string>?", bool_binop(string_value, std::greater<>{})},
            {"string<=?", bool_binop(string_value, std::less_equal<>{})},
            {"string>=?", bool_binop(string_value, std::greater_equal<>{})},
            {"char=?", bool_binop(char_value, std::equal_to<>{})},
            {"char<?", bool_binop(char_value, std::less<>{})},
            {"char>?", bool_binop(char_value, std::greater<>{})},
            // Lists
            {"car", car},
            {"cdr", cdr},
            {"cons", cons},
            // Equivalence
            {"eq?", eqv},
            {"eqv?", eqv},
            {"equal?", eqv},
            // Type predicates
            {"symbol?", type_predicate(holds.operator()<symbol>())},
            {"string?", type_predicate(holds.operator()<std::string>())},
            {"number?", type_predicate(holds.operator()<bignum>())},
            {"boolean?", type_predicate(holds.operator()<bool>())},
            {"char?", type_predicate(holds.operator()<character>())},
            {"list?", type_predicate(holds.operator()<list>())},
            {"procedure?", type_predicate(is_procedure)},
            {"pair?", type_predicate([](const value_ptr& val) {
                auto l = std::get_if<list>(&val->data);
                return (l and not l->items.empty()) or std::holds_alternative<dotted_list>(val->data);
            })},
            {"null?", type_predicate([](const value_ptr& val) {
                auto l = std::get_if<list>(&val->data);
                return l and l->items.empty();
            })},
            // Symbols, strings and characters
            {"symbol->string", symbol_to_string},
            {"string->symbol", string_to_symbol},
            {"string-length", string_length},
            {"string-append", string_append},
            {"string->list", string_to_list},
            {"list->string", list_to_string},
            {"char->integer", char_to_integer},
            {"integer->char", integer_to_char},
            {"number->string", number_to_string},
            {"string->number", string_to_number},
            // Procedures
            {"apply", apply},
            // I/O
            {"display", display},
            {"write", write},
            {"newline", newline},
            {"read", read},
            {"read-contents", read_contents},
            {"read-all", read_all},
        };
    }

} // namespace builtins

env_ptr create_global_environment()
{
    auto env = make_global_environment(builtins::make_primitive_table());
    builtins::define_load(env);
    return env;
}

std::string stdlib_path()
{
    return get_env_or("SCHEMER_STDLIB", SCHEMER_STDLIB_PATH);
}

env_ptr reload_global_environment()
{
    auto global_env = create_global_environment();

    auto library = stdlib_path();
    try {
        builtins::load_file(library, global_env);
        SCHEMER_DEBUG(load, "Standard library loaded from {}", library);
    } catch (const std::exception& e) {
        fmt::print(stderr, "Warning: Could not load library {}: {}\n", library, e.what());
    }

    return global_env;
}
