#include <exception>
#include <memory>
#include <stdexcept>
#include <string>
#include <utility>
#include <variant>
#include <vector>

#include <fmt/core.h>

#include "builtins.hpp"
#include "debug.hpp"
#include "parser.hpp"
#include "schemer.hpp"
#include "tests.hpp"
#include "unicode.hpp"
#include "utils.hpp"

#ifndef SCHEMER_SOURCE_DIR
#define SCHEMER_SOURCE_DIR "."
#endif

// Helper for running tests
struct test_runner {
    env_ptr env;
    int failures = 0;

    explicit test_runner(env_ptr e) : env(std::move(e)) {}

    bool test_eval(const std::string& input, const std::string& expected_output);
    bool test_error(const std::string& input, const std::string& expected_error_substring);
    bool test_parse(const std::string& input, const std::string& expected_output);
    bool test_parse_error(const std::string& input, const std::string& expected_error_substring);
    bool check(bool condition, const std::string& description);

private:
    bool pass(const std::string& message);
    bool fail(const std::string& message);
};

bool test_runner::pass(const std::string& message)
{
    fmt::print("✓ {}\n", message);
    return true;
}

bool test_runner::fail(const std::string& message)
{
    println_red("✗ {}", message);
    failures++;
    return false;
}

bool test_runner::test_eval(const std::string& input, const std::string& expected_output)
{
    try {
        parser p(input);
        auto result = eval(p.parse(), env);
        auto actual_output = value_to_string(result);
        if (actual_output == expected_output) {
            return pass(fmt::format("{} => {}", input, actual_output));
        }
        return fail(fmt::format("{}: expected {}, got {}", input, expected_output, actual_output));
    } catch (const std::exception& e) {
        return fail(fmt::format("{}: threw exception: {}", input, e.what()));
    }
}

bool test_runner::test_error(const std::string& input, const std::string& expected_error_substring)
{
    try {
        parser p(input);
        auto result = eval(p.parse(), env);
        return fail(fmt::format("{}: expected error containing '{}', but got result: {}",
            input, expected_error_substring, value_to_string(result)));
    } catch (const std::exception& e) {
        std::string error_msg = e.what();
        if (error_msg.find(expected_error_substring) != std::string::npos) {
            return pass(fmt::format("{}: correctly threw error containing '{}'",
                input, expected_error_substring));
        }
        return fail(fmt::format("{}: expected error containing '{}', got '{}'",
            input, expected_error_substring, error_msg));
    }
}

bool test_runner::test_parse(const std::string& input, const std::string& expected_output)
{
    try {
        parser p(input);
        auto actual_output = value_to_string(p.parse());
        if (actual_output == expected_output) {
            return pass(fmt::format("parse {} => {}", input, actual_output));
        }
        return fail(fmt::format("parse {}: expected {}, got {}", input, expected_output, actual_output));
    } catch (const std::exception& e) {
        return fail(fmt::format("parse {}: threw exception: {}", input, e.what()));
    }
}

bool test_runner::test_parse_error(const std::string& input, const std::string& expected_error_substring)
{
    try {
        parser p(input);
        auto result = p.parse();
        return fail(fmt::format("parse {}: expected error containing '{}', but got: {}",
            input, expected_error_substring, value_to_string(result)));
    } catch (const parse_error& e) {
        std::string error_msg = e.what();
        if (error_msg.find(expected_error_substring) != std::string::npos) {
            return pass(fmt::format("parse {}: correctly threw error containing '{}'",
                input, expected_error_substring));
        }
        return fail(fmt::format("parse {}: expected error containing '{}', got '{}'",
            input, expected_error_substring, error_msg));
    }
}

bool test_runner::check(bool condition, const std::string& description)
{
    return condition? pass(description): fail(description);
}

namespace {

void print_header(const std::string& title)
{
    fmt::print("\n{}\n{}\n", title, std::string(60, '='));
}

int test_reader()
{
    print_header("Reader");
    test_runner runner(environment::make());

    // Numbers
    runner.test_parse("42", "42");
    runner.test_parse("#xFF", "255");
    runner.test_parse("#XfF", "255");
    runner.test_parse("#b101", "5");
    runner.test_parse("#o17", "15");
    runner.test_parse("#d99", "99");
    runner.test_parse("123456789012345678901234567890", "123456789012345678901234567890");

    // A leading sign makes an atom, not a number
    runner.test_parse("-5", "-5");
    runner.check(std::holds_alternative<symbol>(parser("-5").parse()->data), "-5 reads as an atom");
    runner.check(std::holds_alternative<symbol>(parser("#xZZ").parse()->data), "#xZZ falls back to an atom");

    // Booleans and atoms
    runner.test_parse("#t", "#t");
    runner.test_parse("#f", "#f");
    runner.test_parse("abc123", "abc123");
    runner.test_parse("string->list", "string->list");
    runner.test_parse("||", "||");
    runner.test_parse("λx", "λx");

    // Characters
    runner.test_parse("#\\newline", "#\\newline");
    runner.test_parse("#\\linefeed", "#\\newline");
    runner.test_parse("#\\NewLine", "#\\newline");
    runner.test_parse("#\\SPACE", "#\\space");
    runner.test_parse("#\\altmode", "#\\altmode");
    runner.test_parse("#\\rubout", "#\\rubout");
    runner.test_parse("#\\a", "#\\a");
    runner.test_parse("#\\A", "#\\A");
    runner.test_parse("#\\(", "#\\(");
    runner.test_parse("#\\ ", "#\\space");
    runner.test_parse("#\\λ", "#\\λ");
    runner.test_parse("(#\\a #\\b)", "(#\\a #\\b)");
    {
        auto parsed = parser("#\\newline").parse();
        auto ch = std::get_if<character>(&parsed->data);
        runner.check(ch and U'\n' == ch->code, "#\\newline reads as LF");
    }
    runner.test_parse_error("#\\bogus", "unrecognized character name 'bogus'");

    // Strings
    runner.test_parse(R"("hello")", R"("hello")");
    runner.test_parse(R"("say \"hi\"")", R"("say \"hi\"")");
    runner.test_parse(R"("a\\b")", R"("a\\b")");
    runner.test_parse(R"("tab\there\n")", R"("tab\there\n")");
    runner.test_parse(R"("")", R"("")");
    runner.test_parse_error(R"("bad \q")", "unknown escape sequence");
    runner.test_parse_error(R"("open)", "unterminated string literal");

    // Quote sugar
    runner.test_parse("'(1 2)", "(quote (1 2))");
    runner.test_parse("'a", "(quote a)");
    runner.test_parse("''a", "(quote (quote a))");

    // Lists and dotted lists
    runner.test_parse("()", "()");
    runner.test_parse("( )", "()");
    runner.test_parse("(1 2 3)", "(1 2 3)");
    runner.test_parse("( 1  2 )", "(1 2)");
    runner.test_parse("(a (b c) d)", "(a (b c) d)");
    runner.test_parse("(a b . c)", "(a b . c)");
    runner.test_parse("(a . b)", "(a . b)");
    runner.test_parse_error("(a .b)", "unexpected '.', expecting expression");
    runner.test_parse_error("(. a)", "expecting expression");
    runner.test_parse_error("(a . )", "expecting expression");
    runner.test_parse_error("(a . b c)", "expecting ')' after dotted list tail");
    runner.test_parse_error("(1\"a\")", "expecting space or ')'");

    // Comments
    runner.test_parse("; leading comment\n42", "42");
    runner.test_parse("(1 ; one\n 2)", "(1 2)");
    runner.test_parse("(1 2) ; trailing", "(1 2)");

    // Errors and positions
    runner.test_parse_error("", "unexpected end of input");
    runner.test_parse_error(")", "unexpected ')'");
    runner.test_parse_error("(1 2", "Parse error at 1:5");
    runner.test_parse_error("(1 2", "expected ')' to close list opened at 1:1");
    runner.test_parse_error("(1\n  ]", "Parse error at 2:3");
    runner.test_parse_error("1abc", "expecting end of input");
    runner.test_parse_error("1 2", "expecting end of input");

    // parse_all and parse_optional
    {
        auto values = parser("1 \"two\" (3) ; done\n").parse_all();
        runner.check(3 == values.size(), "parse_all reads three expressions");
        runner.check(parser("").parse_all().empty(), "parse_all of empty input is empty");
        runner.check(2 == parser("(a) b").parse_all().size(), "parse_all needs no separator after the last form");
        bool rejected = false;
        try {
            parser("(a)(b)").parse_all();
        } catch (const parse_error& e) {
            rejected = std::string(e.what()).find("expecting space or end of input") != std::string::npos;
        }
        runner.check(rejected, "parse_all requires a separator between forms");
        runner.check(not parser("  ; nothing here").parse_optional(), "parse_optional of a comment is empty");
        auto one = parser(" (a b) ").parse_optional();
        runner.check(one and "(a b)" == value_to_string(*one), "parse_optional reads one expression");
    }

    // Printing and reading back gives an equal value
    for (const char* text : {"atom", "12345", R"("esc\"aped\n")", "(1 (2 #t) \"s\" . x)", "(#\\space #\\z)"}) {
        auto first = parser(text).parse();
        auto second = parser(value_to_string(first)).parse();
        runner.check(values_equal(first, second), fmt::format("round trip of {}", text));
    }

    return runner.failures;
}

int test_environment()
{
    print_header("Environment");
    test_runner runner(environment::make());
    auto one = make_number(1);
    auto two = make_number(2);

    auto global = environment::make();
    global->define_var("x", one);
    runner.check(global->is_bound("x"), "define_var binds a name");
    runner.check(not global->is_bound("y"), "unbound name is not bound");
    runner.check(values_equal(global->get_var("x"), one), "get_var returns the defined value");

    try {
        global->set_var("y", two);
        runner.check(false, "set_var of an unbound name throws");
    } catch (const unbound_variable_error& e) {
        runner.check(error_kind::unbound_variable == e.kind() and "y" == e.name,
            "set_var of an unbound name throws unbound_variable_error");
        runner.check(std::string(e.what()) == "Setting an unbound variable: y", e.what());
    }

    try {
        global->get_var("missing");
        runner.check(false, "get_var of an unbound name throws");
    } catch (const unbound_variable_error& e) {
        runner.check(std::string(e.what()) == "Getting an unbound variable: missing", e.what());
    }

    // A frame made by bind_vars shares the cells it copied
    auto child = global->bind_vars({});
    child->set_var("x", two);
    runner.check(values_equal(global->get_var("x"), two), "set_var through a child frame is seen by the parent");
    global->define_var("x", one);
    runner.check(values_equal(child->get_var("x"), one), "define_var of a bound name assigns the shared cell");

    // New names stay in the frame they were defined in
    child->define_var("local", two);
    runner.check(not global->is_bound("local"), "define_var of a new name does not leak into the parent");
    global->define_var("later", two);
    runner.check(not child->is_bound("later"), "names defined in the parent later are not seen by the child");

    // Shadowing
    auto shadow = global->bind_vars({{"x", make_number(10)}});
    runner.check("10" == value_to_string(shadow->get_var("x")), "bind_vars shadows an outer binding");
    shadow->set_var("x", make_number(11));
    runner.check("1" == value_to_string(global->get_var("x")), "assigning a shadowing binding leaves the outer one alone");

    auto repeated = environment::make()->bind_vars({{"a", one}, {"a", two}});
    runner.check("1" == value_to_string(repeated->get_var("a")), "first occurrence of a repeated name wins");

    // Global environment from a primitive table
    primitive_table table{
        {"answer", [](const std::vector<value_ptr>&) { return make_number(42); }},
    };
    auto env = make_global_environment(table);
    runner.check(env->is_bound("answer") and is_procedure(env->get_var("answer")),
        "make_global_environment binds each primitive");
    runner.check("#<primitive:answer>" == value_to_string(env->get_var("answer")), "primitives print by name");
    runner.check("42" == value_to_string(apply_procedure(env->get_var("answer"), {})), "a primitive can be applied");

    return runner.failures;
}

int test_evaluator()
{
    print_header("Evaluator");
    test_runner runner(create_global_environment());

    // Self-evaluating forms
    runner.test_eval("42", "42");
    runner.test_eval(R"("hi")", R"("hi")");
    runner.test_eval("#t", "#t");
    runner.test_eval("#\\a", "#\\a");
    runner.test_eval("()", "()");
    runner.test_eval("(1 . 2)", "(1 . 2)");
    runner.test_eval("(* 99999999999 99999999999 99999999999)", "999999999970000000000299999999999");

    // quote
    runner.test_eval("(quote (a b))", "(a b)");
    runner.test_eval("'x", "x");
    runner.test_eval("'(1 . 2)", "(1 . 2)");

    // if: only #f is false
    runner.test_eval("(if #f 1 2)", "2");
    runner.test_eval("(if 0 1 2)", "1");
    runner.test_eval("(if '() 1 2)", "1");
    runner.test_eval(R"((if "" 1 2))", "1");
    runner.test_eval("(if (< 1 2) 'yes 'no)", "yes");
    runner.test_error("(if #t 1)", "Expected 3 args; found values #t 1");
    runner.test_error("(if #t 1 2 3)", "Expected 3 args; found values #t 1 2 3");

    // define and set!
    runner.test_eval("(define x 1)", "1");
    runner.test_eval("(set! x 2)", "2");
    runner.test_eval("x", "2");
    runner.test_eval("(define x 3)", "3");
    runner.test_eval("x", "3");
    runner.test_error("(set! undefined-var 1)", "Setting an unbound variable: undefined-var");
    runner.test_error("nope", "Getting an unbound variable: nope");

    // Forms with the wrong shape are applications
    runner.test_error("(define x 1 2)", "Getting an unbound variable: define");
    runner.test_error("(quote 1 2)", "Getting an unbound variable: quote");
    runner.test_error("(set! 5 1)", "Getting an unbound variable: set!");

    // Special forms are recognised before any binding of the keyword
    runner.test_eval("(define if 5)", "5");
    runner.test_eval("(if #f 1 2)", "2");

    // Procedure definitions
    runner.test_eval("(define (add a b) (+ a b))", "(lambda (a b) ...)");
    runner.test_eval("(add 2 3)", "5");
    runner.test_error("(add 1)", "Expected 2 args; found values 1");
    runner.test_error("(add 1 2 3)", "Expected 2 args; found values 1 2 3");
    runner.test_eval("(define (rest-of x . rest) rest)", "(lambda (x . rest) ...)");
    runner.test_eval("(rest-of 1 2 3)", "(2 3)");
    runner.test_eval("(rest-of 1)", "()");
    runner.test_error("(rest-of)", "Expected 1 args");
    runner.test_eval("(define (zero-args) 7)", "(lambda () ...)");
    runner.test_eval("(zero-args)", "7");

    // lambda
    runner.test_eval("((lambda (x y) (* x y)) 6 7)", "42");
    runner.test_eval("((lambda (x . y) (cons x (cons y '()))) 1 2 3)", "(1 (2 3))");
    runner.test_eval("((lambda args args) 1 2)", "(1 2)");
    runner.test_eval("((lambda args args))", "()");
    runner.test_eval("(lambda args args)", "(lambda args ...)");
    runner.test_eval("((lambda () 1 2 3))", "3");
    runner.test_error("(lambda (1) 1)", "Parameter must be a symbol");
    runner.test_error("(lambda (x . 1) x)", "Rest parameter must be a symbol");
    runner.test_error("(lambda (x))", "Procedure body must not be empty");

    // Applying something that isn't a procedure
    runner.test_error("(1 2)", "Invalid type: expected procedure, found 1");
    runner.test_error(R"(("f" 1))", R"(Invalid type: expected procedure, found "f")");

    // Closures capture their frame by reference
    runner.test_eval("(define counter 0)", "0");
    runner.test_eval("(define (get-counter) counter)", "(lambda () ...)");
    runner.test_eval("(set! counter 5)", "5");
    runner.test_eval("(get-counter)", "5");
    runner.test_eval("(define (make-counter) (define n 0) (lambda () (set! n (+ n 1)) n))", "(lambda () ...)");
    runner.test_eval("(define tick (make-counter))", "(lambda () ...)");
    runner.test_eval("(tick)", "1");
    runner.test_eval("(tick)", "2");
    runner.test_eval("(define (late-binding) (define v 1) (define get (lambda () v)) (set! v 42) get)",
        "(lambda () ...)");
    runner.test_eval("((late-binding))", "42");

    // A define in a body assigns a name the procedure's frame shares with
    // the global one
    runner.test_eval("(define z 1)", "1");
    runner.test_eval("(define (redefine-z) (define z 2) z)", "(lambda () ...)");
    runner.test_eval("(redefine-z)", "2");
    runner.test_eval("z", "2");

    // Parameters shadow globals without touching them
    runner.test_eval("(define w 1)", "1");
    runner.test_eval("((lambda (w) (set! w 99) w) 5)", "99");
    runner.test_eval("w", "1");
    runner.test_eval("(define rest 5)", "5");
    runner.test_eval("(define (first-of x . rest) x)", "(lambda (x . rest) ...)");
    runner.test_eval("(first-of 1 2 3)", "1");
    runner.test_eval("rest", "5");
    runner.test_eval("(define args 'outer)", "outer");
    runner.test_eval("((lambda args (set! args 'inner) args) 1 2)", "inner");
    runner.test_eval("args", "outer");

    // Arguments are evaluated left to right
    runner.test_eval("(define order '())", "()");
    runner.test_eval("(define (note x) (set! order (cons x order)) x)", "(lambda (x) ...)");
    runner.test_eval("(+ (note 1) (note 2) (note 3))", "6");
    runner.test_eval("order", "(3 2 1)");
    runner.test_eval("(define y 1)", "1");
    runner.test_eval("(cons (set! y 10) (cons y '()))", "(10 10)");

    // Recursion without tail calls, kept shallow
    runner.test_eval("(define (count n) (if (= n 0) 0 (+ 1 (count (- n 1)))))", "(lambda (n) ...)");
    runner.test_eval("(count 100)", "100");
    runner.test_eval("(define (fact n) (if (= n 0) 1 (* n (fact (- n 1)))))", "(lambda (n) ...)");
    runner.test_eval("(fact 25)", "15511210043330985984000000");

    // Primitives and closures themselves are not expressions
    try {
        eval(create_global_environment()->get_var("car"), create_global_environment());
        runner.check(false, "evaluating a procedure value throws");
    } catch (const bad_special_form_error& e) {
        runner.check(std::string(e.what()) == "Unrecognized special form: #<primitive:car>", e.what());
    }

    // Errors carry their kind
    try {
        eval(parser("(car 1)").parse(), runner.env);
        runner.check(false, "(car 1) throws");
    } catch (const type_mismatch_error& e) {
        runner.check(error_kind::type_mismatch == e.kind() and "pair" == e.expected,
            "type mismatch reports the expected kind");
    }
    try {
        eval(parser("(add 1)").parse(), runner.env);
        runner.check(false, "(add 1) throws");
    } catch (const num_args_error& e) {
        runner.check(2 == e.expected and 1 == e.received.size(), "num_args_error keeps expected and received");
    }

    return runner.failures;
}

int test_primitives()
{
    print_header("Primitives");
    test_runner runner(create_global_environment());

    // Arithmetic
    runner.test_eval("(+ 1 2 3)", "6");
    runner.test_eval("(- 10 1 2)", "7");
    runner.test_eval("(- 3 5)", "-2");
    runner.test_eval("(* 2 3 4)", "24");
    runner.test_eval("(/ 7 2)", "3");
    runner.test_eval("(/ (- 0 7) 2)", "-4");
    runner.test_eval("(mod (- 0 7) 2)", "1");
    runner.test_eval("(mod 7 (- 0 2))", "-1");
    runner.test_eval("(quotient (- 0 7) 2)", "-3");
    runner.test_eval("(remainder (- 0 7) 2)", "-1");
    runner.test_eval("(/ 100 5 2)", "10");
    runner.test_error("(/ 1 0)", "Division by zero");
    runner.test_error("(mod 1 0)", "Division by zero");
    runner.test_error("(+ 1)", "Expected 2 args; found values 1");
    runner.test_error(R"((+ 1 "a"))", R"(Invalid type: expected number, found "a")");

    // Comparisons
    runner.test_eval("(= 1 1)", "#t");
    runner.test_eval("(< 1 2)", "#t");
    runner.test_eval("(> 1 2)", "#f");
    runner.test_eval("(/= 1 2)", "#t");
    runner.test_eval("(>= 2 2)", "#t");
    runner.test_eval("(<= 3 2)", "#f");
    runner.test_error("(< 1 2 3)", "Expected 2 args; found values 1 2 3");
    runner.test_eval("(&& #t #f)", "#f");
    runner.test_eval("(|| #f #t)", "#t");
    runner.test_error("(&& 1 #t)", "Invalid type: expected boolean, found 1");
    runner.test_eval(R"((string=? "a" "a"))", "#t");
    runner.test_eval(R"((string<? "a" "b"))", "#t");
    runner.test_eval(R"((string>? "a" "b"))", "#f");
    runner.test_eval(R"((string<=? "b" "b"))", "#t");
    runner.test_eval(R"((string>=? "a" "b"))", "#f");
    runner.test_eval("(char=? #\\a #\\a)", "#t");
    runner.test_eval("(char<? #\\a #\\b)", "#t");
    runner.test_eval("(char>? #\\a #\\b)", "#f");
    runner.test_error("(char=? #\\a \"a\")", R"(Invalid type: expected character, found "a")");

    // Pairs and lists
    runner.test_eval("(car '(1 2))", "1");
    runner.test_eval("(car '(1 . 2))", "1");
    runner.test_eval("(cdr '(1 2))", "(2)");
    runner.test_eval("(cdr '(1))", "()");
    runner.test_eval("(cdr '(1 . 2))", "2");
    runner.test_eval("(cdr '(1 2 . 3))", "(2 . 3)");
    runner.test_error("(car '())", "Invalid type: expected pair, found ()");
    runner.test_error("(cdr 5)", "Invalid type: expected pair, found 5");
    runner.test_eval("(cons 1 '(2))", "(1 2)");
    runner.test_eval("(cons 1 '())", "(1)");
    runner.test_eval("(cons 1 2)", "(1 . 2)");
    runner.test_eval("(cons 1 '(2 . 3))", "(1 2 . 3)");

    // Equivalence
    runner.test_eval("(eqv? 'a 'a)", "#t");
    runner.test_eval("(eq? 1 2)", "#f");
    runner.test_eval(R"((eq? "a" "a"))", "#t");
    runner.test_eval("(equal? '(1 (2) . 3) '(1 (2) . 3))", "#t");
    runner.test_eval("(equal? '(1 2) '(1 2 3))", "#f");
    runner.test_eval("(eqv? 1 \"1\")", "#f");
    runner.test_eval("(eqv? car car)", "#t");
    runner.test_eval("(eqv? (lambda (x) x) (lambda (x) x))", "#f");

    // Type predicates
    runner.test_eval("(symbol? 'a)", "#t");
    runner.test_eval("(symbol? '-5)", "#t");
    runner.test_eval(R"((string? "s"))", "#t");
    runner.test_eval("(number? 1)", "#t");
    runner.test_eval("(number? 'one)", "#f");
    runner.test_eval("(boolean? #f)", "#t");
    runner.test_eval("(char? #\\a)", "#t");
    runner.test_eval("(list? '(1))", "#t");
    runner.test_eval("(list? '(1 . 2))", "#f");
    runner.test_eval("(procedure? car)", "#t");
    runner.test_eval("(procedure? (lambda (x) x))", "#t");
    runner.test_eval("(procedure? 'car)", "#f");
    runner.test_eval("(pair? '())", "#f");
    runner.test_eval("(pair? '(1))", "#t");
    runner.test_eval("(pair? '(1 . 2))", "#t");
    runner.test_eval("(null? '())", "#t");
    runner.test_eval("(null? '(1))", "#f");

    // Symbols, strings and characters
    runner.test_eval("(symbol->string 'abc)", R"("abc")");
    runner.test_eval(R"((string->symbol "xyz"))", "xyz");
    runner.test_eval(R"((string-length "hello"))", "5");
    runner.test_eval(R"((string-length "héllo"))", "5");
    runner.test_eval(R"((string-append "a" "b" "c"))", R"("abc")");
    runner.test_eval("(string-append)", R"("")");
    runner.test_eval(R"((string->list "hi"))", "(#\\h #\\i)");
    runner.test_eval(R"((string->list ""))", "()");
    runner.test_eval("(list->string '(#\\h #\\i))", R"("hi")");
    runner.test_error("(list->string '(1 2))", "Invalid type: expected character, found 1");
    runner.test_eval("(char->integer #\\A)", "65");
    runner.test_eval("(char->integer #\\newline)", "10");
    runner.test_eval("(integer->char 955)", "#\\λ");
    runner.test_eval("(integer->char 32)", "#\\space");
    runner.test_error("(integer->char 1114112)", "Invalid Unicode codepoint");
    runner.test_error("(integer->char 55296)", "surrogate");
    runner.test_eval("(number->string 42)", R"("42")");
    runner.test_eval(R"((string->number "-17"))", "-17");
    runner.test_eval(R"((string->number "abc"))", "#f");
    runner.test_eval(R"((string->number ""))", "#f");

    // Procedures
    runner.test_eval("(apply + '(1 2 3))", "6");
    runner.test_eval("(apply + 1 2)", "3");
    runner.test_eval("(apply (lambda args args) '())", "()");
    runner.test_error("(apply)", "Expected 2 args");

    // I/O
    runner.test_eval(R"((display ""))", R"("")");
    runner.test_eval(R"x((read "(1 2)"))x", "(1 2)");
    runner.test_eval(R"((read "'a"))", "(quote a)");
    runner.test_error(R"((read "(1"))", "Parse error");
    runner.test_error(R"((read-contents "/nonexistent/file.scm"))", "Could not open file");
    runner.test_error(R"((load "/nonexistent/file.scm"))", "Could not open file");

    auto stdlib = fmt::format("{}/src/stdlib.scm", SCHEMER_SOURCE_DIR);
    runner.test_eval(fmt::format(R"((car (read-all "{}")))", stdlib),
        "(define (not x) (if x #f #t))");
    runner.test_eval(fmt::format(R"((string? (read-contents "{}")))", stdlib), "#t");

    return runner.failures;
}

int test_unicode()
{
    print_header("Unicode");
    test_runner runner(environment::make());

    runner.check("A" == encode_utf8(U'A'), "encode ASCII");
    runner.check("\xC3\xA9" == encode_utf8(U'é'), "encode two-byte sequence");
    runner.check("\xE4\xB8\x96" == encode_utf8(U'世'), "encode three-byte sequence");
    runner.check("\xF0\x9F\x98\x80" == encode_utf8(U'\U0001F600'), "encode four-byte sequence");

    auto throws_invalid = [](auto&& func) {
        try {
            func();
            return false;
        } catch (const std::invalid_argument&) {
            return true;
        }
    };
    runner.check(throws_invalid([] { encode_utf8(0x110000); }), "encode rejects code points above U+10FFFF");
    runner.check(throws_invalid([] { encode_utf8(0xD800); }), "encode rejects surrogates");

    std::size_t index = 1;
    char32_t code = decode_utf8("a\xC3\xA9z", index);
    runner.check(U'é' == code and 3 == index, "decode advances past a multi-byte sequence");

    runner.check(throws_invalid([] { std::size_t i = 0; decode_utf8("\xC3", i); }), "decode rejects a truncated sequence");
    runner.check(throws_invalid([] { std::size_t i = 0; decode_utf8("\x80", i); }), "decode rejects a stray continuation byte");
    runner.check(throws_invalid([] { std::size_t i = 0; decode_utf8("\xC0\x80", i); }), "decode rejects overlong encodings");
    runner.check(throws_invalid([] { std::size_t i = 0; decode_utf8("\xED\xA0\x80", i); }), "decode rejects encoded surrogates");
    {
        std::size_t i = 0;
        bool threw = throws_invalid([&] { decode_utf8("\xC3", i); });
        runner.check(threw and 0 == i, "a failed decode leaves the index alone");
    }

    runner.check(U"Hello, 世界!" == utf8_to_utf32("Hello, 世界!"), "utf8_to_utf32");
    runner.check("Hello, 世界!" == utf32_to_utf8(U"Hello, 世界!"), "utf32_to_utf8");
    runner.check(utf8_to_utf32("").empty(), "empty string converts to nothing");

    return runner.failures;
}

int test_debug()
{
    print_header("Debug");
    test_runner runner(environment::make());
    debug_controller controller;

    controller.enable("eval");
    runner.check(controller.is_enabled("eval") and not controller.is_enabled("apply"), "enable one category");
    controller.disable("eval");
    runner.check(controller.enabled_categories().empty(), "disable a category");

    controller.enable("all");
    runner.check(debug_categories.size() == controller.enabled_categories().size(), "all enables every category");
    controller.enable("none");
    runner.check(controller.enabled_categories().empty(), "none disables every category");

    controller.configure("parse,,load");
    runner.check(std::vector<std::string>{"load", "parse"} == controller.enabled_categories(),
        "configure reads a comma separated list");

    try {
        controller.enable("bogus");
        runner.check(false, "enabling an unknown category throws");
    } catch (const std::runtime_error& e) {
        runner.check(std::string(e.what()) == "Unknown debug category: bogus", e.what());
    }

    return runner.failures;
}

int test_library()
{
    print_header("Library");
    test_runner runner(reload_global_environment());

    runner.test_eval("(not #f)", "#t");
    runner.test_eval("(list 1 2 3)", "(1 2 3)");
    runner.test_eval("(map (curry + 1) '(1 2 3))", "(2 3 4)");
    runner.test_eval("(filter even? '(1 2 3 4))", "(2 4)");
    runner.test_eval("(length '(a b c))", "3");
    runner.test_eval("(reverse '(1 2 3))", "(3 2 1)");
    runner.test_eval("(max 3 9 2)", "9");
    runner.test_eval("(assq 'b '((a 1) (b 2)))", "(b 2)");
    // Library procedures with rest parameters leave same-named globals alone
    runner.test_eval("(define lst 42)", "42");
    runner.test_eval("(sum 1 2)", "3");
    runner.test_eval("lst", "42");
    runner.test_eval("(define objs 'mine)", "mine");
    runner.test_eval("(list 1 2)", "(1 2)");
    runner.test_eval("objs", "mine");

    auto library_tests = fmt::format("{}/src/tests.scm", SCHEMER_SOURCE_DIR);
    runner.test_eval(fmt::format(R"((load "{}"))", library_tests), R"("All library tests passed!")");

    // args is bound the way the driver binds it for a program file
    auto program_env = runner.env->bind_vars({{"args", make_list({value::make(std::string("one"))})}});
    builtins::define_load(program_env);
    test_runner program(program_env);
    program.test_eval("args", R"(("one"))");
    program.test_eval("(length args)", "1");
    runner.failures += program.failures;

    return runner.failures;
}

} // namespace

bool run_tests()
{
    int failures{0};
    failures += test_reader();
    failures += test_environment();
    failures += test_evaluator();
    failures += test_primitives();
    failures += test_unicode();
    failures += test_debug();
    failures += test_library();
    fmt::print("{}\n", std::string(60, '='));

    if (failures != 0) {
        println_red("\n✗ {} test(s) failed!", failures);
        return false;
    }

    fmt::print("\n✓ All tests passed!\n");
    return true;
}
