#pragma once

#include <concepts>
#include <cstddef>
#include <functional>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <variant>
#include <vector>

#include <boost/multiprecision/cpp_int.hpp>

using bignum = boost::multiprecision::cpp_int;

// Forward declarations
struct environment;
struct value;

using value_ptr = std::shared_ptr<value>;
using env_ptr = std::shared_ptr<environment>;

// Native procedures receive their arguments already evaluated and report
// failure by throwing a scheme_error.
using primitive_function = std::function<value_ptr(const std::vector<value_ptr>&)>;
using primitive_table = std::unordered_map<std::string, primitive_function>;

// Core value types
struct symbol {
    std::string name;
    explicit symbol(std::convertible_to<std::string_view> auto&& n):
        name{std::forward<decltype(n)>(n)} {}
    std::string to_string() const { return name; }
    bool operator==(const symbol& that) const { return name == that.name; }
};

struct character {
    char32_t code;
    std::string to_string() const;
    bool operator==(const character& that) const { return code == that.code; }
};

// A proper list; the empty list is list{}.
struct list {
    std::vector<value_ptr> items;
    std::string to_string() const;
};

// (a b . c): head holds a and b, tail holds c.
struct dotted_list {
    std::vector<value_ptr> head;
    value_ptr tail;
    std::string to_string() const;
};

struct primitive {
    std::string name;
    primitive_function func;

    primitive(std::string n, primitive_function f)
        : name(std::move(n)), func(std::move(f)) {}
    std::string to_string() const { return "#<primitive:" + name + ">"; }
};

struct closure {
    std::vector<std::string> params;
    std::optional<std::string> rest;
    std::vector<value_ptr> body;
    // Shared with every other holder of the frame, so set! and define
    // through it are visible to all of them.
    env_ptr env;

    std::string to_string() const;
};

// The main value type
struct value {
    std::variant<
        symbol,
        bignum,
        std::string,
        bool,
        character,
        list,
        dotted_list,
        primitive,
        closure
    > data;

private:
    template<typename T>
    value(T&& t): data(std::forward<T>(t)) {}

public:
    template<typename T>
    static std::shared_ptr<value> make(T&& v)
    {
        return std::shared_ptr<value>(new value(std::forward<T>(v)));
    }
};

// Tracks where a parser is in its input.
struct position {
private:
    std::size_t line_;
    std::size_t column_;
    std::size_t offset_;

public:
    position(std::size_t line = 1, std::size_t column = 1, std::size_t offset = 0)
        : line_(line), column_(column), offset_(offset) {}

    std::size_t line() const { return line_; }
    std::size_t column() const { return column_; }
    std::size_t offset() const { return offset_; }

    // Advance position by one byte
    void advance(char ch)
    {
        if (ch == '\n') {
            line_++;
            column_ = 1;
        } else {
            column_++;
        }
        offset_++;
    }

    std::string to_string() const;
};

// Error taxonomy. what() is the display form shown to users.
enum class error_kind {
    num_args,
    type_mismatch,
    parse,
    bad_special_form,
    unbound_variable,
    default_error
};


class scheme_error: public std::runtime_error {
    error_kind kind_;
public:
    scheme_error(error_kind kind, const std::string& display)
        : std::runtime_error(display), kind_(kind) {}
    error_kind kind() const { return kind_; }
};

class num_args_error final: public scheme_error {
public:
    std::size_t expected;
    std::vector<value_ptr> received;
    num_args_error(std::size_t expected, std::vector<value_ptr> received);
};

class type_mismatch_error final: public scheme_error {
public:
    std::string expected;
    value_ptr found;
    type_mismatch_error(std::string expected, value_ptr found);
};

class parse_error final: public scheme_error {
public:
    std::string message;
    position where;
    parse_error(std::string message, position where);
};

class bad_special_form_error final: public scheme_error {
public:
    std::string message;
    value_ptr form;
    bad_special_form_error(std::string message, value_ptr form);
};

class unbound_variable_error final: public scheme_error {
public:
    std::string message;
    std::string name;
    unbound_variable_error(std::string message, std::string name);
};

class default_error final: public scheme_error {
public:
    explicit default_error(const std::string& message)
        : scheme_error(error_kind::default_error, message) {}
};

// One mutable slot. Frames share cells, so an assignment through any frame
// holding the cell is seen by all of them.
struct binding_cell {
    value_ptr value;
    explicit binding_cell(value_ptr v) : value(std::move(v)) {}
};

using cell_ptr = std::shared_ptr<binding_cell>;

// A single flat frame of bindings. Frames are not chained: bind_vars copies
// the cell references of its frame into a new one.
struct environment final {
private:
    // Keep a count of all constructed (& not destructed) environments for debugging
    static inline std::size_t count{0};

    std::unordered_map<std::string, cell_ptr> bindings;

    // Private ctor; must use environment::make to create instances
    environment() { ++count; }
    explicit environment(std::unordered_map<std::string, cell_ptr> b)
        : bindings(std::move(b)) { ++count; }

public:
    static env_ptr make();
    static std::size_t get_constructed_count() { return count; }

    ~environment() { --count; }

    bool is_bound(const std::string& name) const;
    value_ptr get_var(const std::string& name) const;
    value_ptr set_var(const std::string& name, value_ptr val);
    value_ptr define_var(const std::string& name, value_ptr val);
    // Returns a new frame holding these bindings on top of this frame's.
    // When a name repeats, its first occurrence wins.
    env_ptr bind_vars(const std::vector<std::pair<std::string, value_ptr>>& vars) const;

    std::vector<std::string> get_all_symbols() const;
};

// Helper functions
std::string value_to_string(const value_ptr& val);
std::string value_type_string(const value_ptr& val);
bool values_equal(const value_ptr& lhs, const value_ptr& rhs);
bool is_procedure(const value_ptr& val);

value_ptr make_list(std::vector<value_ptr> items);
value_ptr make_symbol(std::string_view name);
value_ptr make_number(bignum n);
value_ptr make_bool(bool flag);

// String conversion functions
std::string to_string(const bignum& value);
std::string to_string(const std::string& value);
std::string to_string(bool value);

// Core evaluation functions
value_ptr eval(value_ptr expr, env_ptr env);
value_ptr apply_procedure(const value_ptr& procedure, const std::vector<value_ptr>& args);
env_ptr make_global_environment(const primitive_table& primitives);

void   call_stack_reset_max_depth();
std::size_t call_stack_get_max_depth();
