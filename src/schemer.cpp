// Core of the interpreter: value printing, the error taxonomy, environment
// frames and the evaluator.
// Code style will use snake_case and other conventions of the standard library

#include <algorithm>
#include <cstddef>
#include <memory>
#include <optional>
#include <ranges>
#include <stdexcept>
#include <string>
#include <string_view>
#include <type_traits>
#include <unordered_map>
#include <utility>
#include <variant>
#include <vector>

#include <fmt/core.h>

#include "debug.hpp"
#include "schemer.hpp"
#include "unicode.hpp"

namespace {

// Names used when printing characters; the reader accepts more (see parser.cpp).
const std::vector<std::pair<char32_t, std::string_view>> printed_character_names{
    {U'\n', "newline"},
    {U' ', "space"},
    {U'\t', "tab"},
    {U'\r', "return"},
    {U'\x1B', "altmode"},
    {U'\x1F', "backnext"},
    {U'\b', "backspace"},
    {U'\x1A', "call"},
    {U'\f', "page"},
    {U'\x7F', "rubout"},
};

std::string join_values(const std::vector<value_ptr>& values)
{
    std::string result;
    for (const auto& val : values) {
        if (not result.empty()) result += ' ';
        result += value_to_string(val);
    }
    return result;
}

} // namespace

std::string to_string(const bignum& value) { return value.str(); }

std::string to_string(bool value) { return value? "#t": "#f"; }

std::string to_string(const std::string& value)
{
    std::string result = "\"";
    for (char c : value) {
        switch (c) {
            case '"': result += "\\\""; break;
            case '\\': result += "\\\\"; break;
            case '\n': result += "\\n"; break;
            case '\t': result += "\\t"; break;
            case '\r': result += "\\r"; break;
            default: result += c; break;
        }
    }
    result += "\"";
    return result;
}

std::string character::to_string() const
{
    auto named = std::ranges::find(printed_character_names, code,
        &std::pair<char32_t, std::string_view>::first);
    if (named != printed_character_names.end()) {
        return fmt::format("#\\{}", named->second);
    }
    return "#\\" + encode_utf8(code);
}

std::string list::to_string() const
{
    return "(" + join_values(items) + ")";
}

std::string dotted_list::to_string() const
{
    return fmt::format("({} . {})", join_values(head), value_to_string(tail));
}

std::string closure::to_string() const
{
    if (params.empty() and rest) {
        return fmt::format("(lambda {} ...)", *rest);
    }
    std::string names;
    for (const auto& param : params) {
        if (not names.empty()) names += ' ';
        names += param;
    }
    if (rest) {
        names += " . " + *rest;
    }
    return fmt::format("(lambda ({}) ...)", names);
}

std::string value_to_string(const value_ptr& val)
{
    return std::visit([](const auto& v) -> std::string {
        // Check if the type has a member to_string() function
        if constexpr (requires { v.to_string(); }) {
            return v.to_string();
        }
        // Otherwise use free function to_string()
        else {
            return to_string(v);
        }
    }, val->data);
}

struct typeof_visitor {
    std::string operator()(const symbol&) const { return "symbol"; }
    std::string operator()(const bignum&) const { return "number"; }
    std::string operator()(const std::string&) const { return "string"; }
    std::string operator()(bool) const { return "boolean"; }
    std::string operator()(const character&) const { return "character"; }
    std::string operator()(const list&) const { return "list"; }
    std::string operator()(const dotted_list&) const { return "dotted list"; }
    std::string operator()(const primitive&) const { return "primitive"; }
    std::string operator()(const closure&) const { return "procedure"; }
};

std::string value_type_string(const value_ptr& val)
{
    return std::visit(typeof_visitor{}, val->data);
}

bool is_procedure(const value_ptr& val)
{
    return std::holds_alternative<primitive>(val->data) or
           std::holds_alternative<closure>(val->data);
}

namespace {

bool sequences_equal(const std::vector<value_ptr>& lhs, const std::vector<value_ptr>& rhs)
{
    return std::ranges::equal(lhs, rhs, values_equal);
}

} // namespace

// Structural equality. Procedures are only equal to themselves.
bool values_equal(const value_ptr& lhs, const value_ptr& rhs)
{
    if (lhs == rhs) return true;
    if (lhs->data.index() != rhs->data.index()) return false;

    return std::visit([&](const auto& l) -> bool {
        using T = std::decay_t<decltype(l)>;
        const auto& r = std::get<T>(rhs->data);

        if constexpr (std::is_same_v<T, list>) {
            return sequences_equal(l.items, r.items);
        } else if constexpr (std::is_same_v<T, dotted_list>) {
            return sequences_equal(l.head, r.head) and values_equal(l.tail, r.tail);
        } else if constexpr (std::is_same_v<T, primitive> or std::is_same_v<T, closure>) {
            return false;
        } else {
            return l == r;
        }
    }, lhs->data);
}

value_ptr make_list(std::vector<value_ptr> items)
{
    return value::make(list{std::move(items)});
}

value_ptr make_symbol(std::string_view name)
{
    return value::make(symbol{name});
}

value_ptr make_number(bignum n)
{
    return value::make(std::move(n));
}

value_ptr make_bool(bool flag)
{
    return value::make(flag);
}

std::string position::to_string() const
{
    return fmt::format("{}:{}", line_, column_);
}

// Errors
num_args_error::num_args_error(std::size_t expected, std::vector<value_ptr> received)
    : scheme_error(error_kind::num_args,
        fmt::format("Expected {} args; found values {}", expected, join_values(received))),
      expected(expected),
      received(std::move(received)) {}

type_mismatch_error::type_mismatch_error(std::string expected, value_ptr found)
    : scheme_error(error_kind::type_mismatch,
        fmt::format("Invalid type: expected {}, found {}", expected, value_to_string(found))),
      expected(std::move(expected)),
      found(std::move(found)) {}

parse_error::parse_error(std::string message, position where)
    : scheme_error(error_kind::parse,
        fmt::format("Parse error at {}: {}", where.to_string(), message)),
      message(std::move(message)),
      where(where) {}

bad_special_form_error::bad_special_form_error(std::string message, value_ptr form)
    : scheme_error(error_kind::bad_special_form,
        fmt::format("{}: {}", message, value_to_string(form))),
      message(std::move(message)),
      form(std::move(form)) {}

unbound_variable_error::unbound_variable_error(std::string message, std::string name)
    : scheme_error(error_kind::unbound_variable, fmt::format("{}: {}", message, name)),
      message(std::move(message)),
      name(std::move(name)) {}

// Environment implementation
env_ptr environment::make()
{
    return env_ptr(new environment());
}

bool environment::is_bound(const std::string& name) const
{
    return bindings.contains(name);
}

value_ptr environment::get_var(const std::string& name) const
{
    SCHEMER_DEBUG(env_lookup, "Looking up '{}' in env {}", name, static_cast<const void*>(this));

    auto it = bindings.find(name);
    if (it == bindings.end()) {
        throw unbound_variable_error("Getting an unbound variable", name);
    }
    return it->second->value;
}

value_ptr environment::set_var(const std::string& name, value_ptr val)
{
    auto it = bindings.find(name);
    if (it == bindings.end()) {
        throw unbound_variable_error("Setting an unbound variable", name);
    }
    SCHEMER_DEBUG(env_binding, "Setting '{}' in env {} to {}",
        name, static_cast<const void*>(this), value_to_string(val));
    it->second->value = val;
    return val;
}

value_ptr environment::define_var(const std::string& name, value_ptr val)
{
    if (is_bound(name)) {
        return set_var(name, std::move(val));
    }
    SCHEMER_DEBUG(env_binding, "Binding '{}' in env {} to {}",
        name, static_cast<const void*>(this), value_to_string(val));
    bindings.emplace(name, std::make_shared<binding_cell>(val));
    return val;
}

env_ptr environment::bind_vars(const std::vector<std::pair<std::string, value_ptr>>& vars) const
{
    auto frame = bindings;
    // Walk backwards so that the first occurrence of a repeated name is the
    // one left in the frame.
    for (auto it = vars.rbegin(); it != vars.rend(); ++it) {
        SCHEMER_DEBUG(env_binding, "Binding '{}' to {}", it->first, value_to_string(it->second));
        frame.insert_or_assign(it->first, std::make_shared<binding_cell>(it->second));
    }
    return env_ptr(new environment(std::move(frame)));
}

std::vector<std::string> environment::get_all_symbols() const
{
    std::vector<std::string> symbols;
    symbols.reserve(bindings.size());
    for (const auto& [name, cell] : bindings) {
        symbols.push_back(name);
    }
    return symbols;
}

env_ptr make_global_environment(const primitive_table& primitives)
{
    std::vector<std::pair<std::string, value_ptr>> vars;
    vars.reserve(primitives.size());
    for (const auto& [name, func] : primitives) {
        vars.emplace_back(name, value::make(primitive{name, func}));
    }
    return environment::make()->bind_vars(vars);
}

struct call_stack {
private:
    inline static std::size_t depth_{0};
    inline static std::size_t max_depth_{0};
public:
    struct guard {
        guard()
        {
            ++depth_;
            max_depth_ = std::max(max_depth_, depth_);
        }
        ~guard() { --depth_; }
        guard(const guard&) = delete;
        guard& operator=(const guard&) = delete;
    };

    static std::size_t depth() { return depth_; }
    static std::size_t max_depth() { return max_depth_; }
    static void reset_max_depth() { max_depth_ = depth_; }
    static std::string indent() { return std::string(depth_ * 2, ' '); }
};

void call_stack_reset_max_depth() { call_stack::reset_max_depth(); }
std::size_t call_stack_get_max_depth() { return call_stack::max_depth(); }

namespace {

const symbol* as_symbol(const value_ptr& val)
{
    return std::get_if<symbol>(&val->data);
}

std::vector<std::string> param_names(const std::vector<value_ptr>& params, const value_ptr& form)
{
    std::vector<std::string> names;
    names.reserve(params.size());
    for (const auto& param : params) {
        auto name = as_symbol(param);
        if (not name) {
            throw bad_special_form_error("Parameter must be a symbol", form);
        }
        names.push_back(name->name);
    }
    return names;
}

value_ptr make_closure(std::vector<std::string> params, std::optional<std::string> rest,
    std::vector<value_ptr> body, const env_ptr& env, const value_ptr& form)
{
    if (body.empty()) {
        throw bad_special_form_error("Procedure body must not be empty", form);
    }
    return value::make(closure{std::move(params), std::move(rest), std::move(body), env});
}

// (params...), (params... . rest), or a bare rest symbol; body is everything
// after the parameter position.
value_ptr make_procedure(const value_ptr& formals, std::vector<value_ptr> body,
    const env_ptr& env, const value_ptr& form)
{
    if (auto params = std::get_if<list>(&formals->data)) {
        return make_closure(param_names(params->items, form), std::nullopt,
            std::move(body), env, form);
    }
    if (auto params = std::get_if<dotted_list>(&formals->data)) {
        auto rest = as_symbol(params->tail);
        if (not rest) {
            throw bad_special_form_error("Rest parameter must be a symbol", form);
        }
        return make_closure(param_names(params->head, form), rest->name,
            std::move(body), env, form);
    }
    auto rest = as_symbol(formals);
    if (not rest) {
        throw bad_special_form_error("Parameter list must be a list or a symbol", form);
    }
    return make_closure({}, rest->name, std::move(body), env, form);
}

std::vector<value_ptr> tail_of(const std::vector<value_ptr>& items, std::size_t from)
{
    return {items.begin() + static_cast<std::ptrdiff_t>(from), items.end()};
}

value_ptr eval_if(const std::vector<value_ptr>& items, env_ptr env)
{
    if (items.size() != 4) {
        throw num_args_error(3, tail_of(items, 1));
    }
    auto result = eval(items[1], env);
    auto flag = std::get_if<bool>(&result->data);
    if (flag and not *flag) {
        return eval(items[3], env);
    }
    return eval(items[2], env);
}

// (define (name params...) body...) or (define (name params... . rest) body...)
// Returns nullptr when the form doesn't have that shape.
value_ptr eval_define_procedure(const std::vector<value_ptr>& items, const value_ptr& expr, env_ptr env)
{
    const auto& target = items[1];
    if (auto header = std::get_if<list>(&target->data)) {
        if (header->items.empty()) return nullptr;
        auto name = as_symbol(header->items.front());
        if (not name) return nullptr;
        auto proc = make_procedure(make_list(tail_of(header->items, 1)),
            tail_of(items, 2), env, expr);
        return env->define_var(name->name, proc);
    }
    if (auto header = std::get_if<dotted_list>(&target->data)) {
        if (header->head.empty()) return nullptr;
        auto name = as_symbol(header->head.front());
        if (not name) return nullptr;
        auto params = value::make(dotted_list{tail_of(header->head, 1), header->tail});
        auto proc = make_procedure(params, tail_of(items, 2), env, expr);
        return env->define_var(name->name, proc);
    }
    return nullptr;
}

value_ptr eval_application(const std::vector<value_ptr>& items, env_ptr env)
{
    auto procedure = eval(items.front(), env);

    std::vector<value_ptr> args;
    args.reserve(items.size() - 1);
    for (const auto& arg : items | std::views::drop(1)) {
        args.push_back(eval(arg, env));
    }
    return apply_procedure(procedure, args);
}

// Special forms are recognised by shape, in this order, before falling back
// to application.
value_ptr eval_list(const list& form, const value_ptr& expr, env_ptr env)
{
    const auto& items = form.items;
    if (items.empty()) return expr;

    if (auto keyword = as_symbol(items.front())) {
        const auto& name = keyword->name;

        if ("quote" == name and 2 == items.size()) {
            return items[1];
        }

        if ("if" == name) {
            return eval_if(items, env);
        }

        if ("set!" == name and 3 == items.size()) {
            if (auto var = as_symbol(items[1])) {
                return env->set_var(var->name, eval(items[2], env));
            }
        }

        if ("define" == name) {
            if (3 == items.size()) {
                if (auto var = as_symbol(items[1])) {
                    return env->define_var(var->name, eval(items[2], env));
                }
            }
            if (items.size() >= 2) {
                if (auto defined = eval_define_procedure(items, expr, env)) {
                    return defined;
                }
            }
        }

        if ("lambda" == name and items.size() >= 2) {
            const auto& formals = items[1];
            if (std::holds_alternative<list>(formals->data) or
                std::holds_alternative<dotted_list>(formals->data) or
                std::holds_alternative<symbol>(formals->data)) {
                return make_procedure(formals, tail_of(items, 2), env, expr);
            }
        }
    }

    return eval_application(items, env);
}

value_ptr apply_closure(const closure& proc, const std::vector<value_ptr>& args)
{
    bool right_number_of_args = proc.rest
        ? args.size() >= proc.params.size()
        : args.size() == proc.params.size();
    if (not right_number_of_args) {
        throw num_args_error(proc.params.size(), args);
    }

    // The rest parameter gets a fresh cell like the fixed ones; assigning
    // it must never reach a captured binding of the same name.
    std::vector<std::pair<std::string, value_ptr>> vars;
    vars.reserve(proc.params.size() + 1);
    for (std::size_t i = 0; i < proc.params.size(); ++i) {
        vars.emplace_back(proc.params[i], args[i]);
    }
    if (proc.rest) {
        vars.emplace_back(*proc.rest, make_list(tail_of(args, proc.params.size())));
    }
    auto frame = proc.env->bind_vars(vars);

    // No tail calls: each body form is an ordinary nested eval.
    value_ptr result;
    for (const auto& form : proc.body) {
        result = eval(form, frame);
    }
    return result;
}

} // namespace

value_ptr apply_procedure(const value_ptr& procedure, const std::vector<value_ptr>& args)
{
    SCHEMER_DEBUG(apply, "{}Applying {} to ({})",
        call_stack::indent(), value_to_string(procedure), join_values(args));

    return std::visit([&](const auto& proc) -> value_ptr {
        using T = std::decay_t<decltype(proc)>;

        if constexpr (std::is_same_v<T, primitive>) {
            SCHEMER_DEBUG(primitive, "Invoking primitive '{}' with {} arguments",
                proc.name, args.size());
            return proc.func(args);
        } else if constexpr (std::is_same_v<T, closure>) {
            return apply_closure(proc, args);
        } else {
            throw type_mismatch_error("procedure", procedure);
        }
    }, procedure->data);
}

value_ptr eval(value_ptr expr, env_ptr env)
{
    call_stack::guard g;
    SCHEMER_DEBUG(eval, "{}[{}] Evaluating({}): {}",
        call_stack::indent(),
        call_stack::depth(),
        value_type_string(expr),
        value_to_string(expr));

    value_ptr result = std::visit([&](const auto& v) -> value_ptr {
        using T = std::decay_t<decltype(v)>;

        if constexpr (std::is_same_v<T, bignum> or
                      std::is_same_v<T, std::string> or
                      std::is_same_v<T, bool> or
                      std::is_same_v<T, character> or
                      std::is_same_v<T, dotted_list>) {
            return expr;
        } else if constexpr (std::is_same_v<T, symbol>) {
            return env->get_var(v.name);
        } else if constexpr (std::is_same_v<T, list>) {
            return eval_list(v, expr, env);
        } else {
            throw bad_special_form_error("Unrecognized special form", expr);
        }
    }, expr->data);

    SCHEMER_DEBUG(eval, "{}[{}] Result: {}",
        call_stack::indent(),
        call_stack::depth(),
        value_to_string(result));
    return result;
}
