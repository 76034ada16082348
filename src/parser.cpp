#include <cctype>
#include <cstddef>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <fmt/core.h>

#include "debug.hpp"
#include "parser.hpp"
#include "unicode.hpp"

namespace {

// MIT Scheme character names
const std::vector<std::pair<std::string_view, char32_t>> character_names{
    {"altmode", U'\x1B'},
    {"backnext", U'\x1F'},
    {"backspace", U'\b'},
    {"call", U'\x1A'},
    {"linefeed", U'\n'},
    {"newline", U'\n'},
    {"page", U'\f'},
    {"return", U'\r'},
    {"rubout", U'\x7F'},
    {"space", U' '},
    {"tab", U'\t'},
};

bool is_ascii_letter(char ch)
{
    return std::isalpha(static_cast<unsigned char>(ch)) != 0;
}

// Bytes of multi-byte UTF-8 sequences count as letters so that atoms may
// contain non-ASCII text.
bool is_letter(char ch)
{
    return is_ascii_letter(ch) or static_cast<unsigned char>(ch) >= 0x80;
}

bool is_digit(char ch)
{
    return std::isdigit(static_cast<unsigned char>(ch)) != 0;
}

bool is_symbol_char(char ch)
{
    return ch != '\0' and std::string_view("!#$%&|*+-/:<=>?@^_~").find(ch) != std::string_view::npos;
}

bool is_space(char ch)
{
    return std::isspace(static_cast<unsigned char>(ch)) != 0;
}

// Value of ch as a digit in radix, or -1 if it isn't one.
int digit_value(char ch, int radix)
{
    int digit = -1;
    if (ch >= '0' and ch <= '9') {
        digit = ch - '0';
    } else if (ch >= 'a' and ch <= 'f') {
        digit = ch - 'a' + 10;
    } else if (ch >= 'A' and ch <= 'F') {
        digit = ch - 'A' + 10;
    }
    return digit < radix ? digit : -1;
}

int radix_for_marker(char marker)
{
    switch (marker) {
        case 'x': case 'X': return 16;
        case 'o': case 'O': return 8;
        case 'd': case 'D': return 10;
        case 'b': case 'B': return 2;
        default: return 0;
    }
}

// Most significant digit first.
bignum digits_to_number(std::string_view digits, int radix)
{
    bignum result = 0;
    for (char digit : digits) {
        result = result * radix + digit_value(digit, radix);
    }
    return result;
}

} // namespace

parser::parser(std::string input) : input_(std::move(input)), current_pos_(1, 1, 0) {}

void parser::fail(const std::string& message) const
{
    fail(message, current_pos_);
}

void parser::fail(const std::string& message, const position& where) const
{
    SCHEMER_DEBUG(parse, "Failed at {}: {}", where.to_string(), message);
    throw parse_error(message, where);
}

std::string parser::describe_current() const
{
    if (at_end()) return "end of input";
    return fmt::format("'{}'", current_char());
}

bool parser::skip_whitespace_and_comments()
{
    bool skipped = false;
    while (not at_end()) {
        char ch = current_char();
        if (is_space(ch)) {
            advance();
        } else if (ch == ';') {
            // Skip comment - everything until newline or end of input
            while (not at_end() and current_char() != '\n') {
                advance();
            }
        } else {
            break;
        }
        skipped = true;
    }
    return skipped;
}

void parser::expect_end()
{
    skip_whitespace_and_comments();
    if (not at_end()) {
        fail(fmt::format("unexpected {}, expecting end of input", describe_current()));
    }
}

char parser::escaped_char()
{
    advance(); // skip backslash
    char ch = current_char();
    if (at_end()) {
        fail("unterminated string literal");
    }
    char result = '\0';
    switch (ch) {
        case '"' : result = '"';  break;
        case '\\': result = '\\'; break;
        case 't' : result = '\t'; break;
        case 'n' : result = '\n'; break;
        case 'r' : result = '\r'; break;
        default:
            fail(fmt::format("unknown escape sequence '\\{}' in string literal", ch));
    }
    advance();
    return result;
}

value_ptr parser::parse_string()
{
    position start = current_pos_;
    advance(); // skip opening quote

    std::string result;
    while (not at_end() and current_char() != '"') {
        if (current_char() == '\\') {
            result += escaped_char();
        } else {
            result += current_char();
            advance();
        }
    }

    if (at_end()) {
        fail(fmt::format("unterminated string literal starting at {}", start.to_string()));
    }
    advance(); // skip closing quote

    SCHEMER_DEBUG(parse, "Parsed string literal: {}", to_string(result));
    return value::make(std::move(result));
}

char32_t parser::read_literal_character()
{
    std::size_t index = current_pos_.offset();
    char32_t code = U'\0';
    try {
        code = decode_utf8(input_, index);
    } catch (const std::invalid_argument& e) {
        fail(fmt::format("invalid character literal: {}", e.what()));
    }
    while (current_pos_.offset() < index) {
        advance();
    }
    return code;
}

// #\name or #\c. A run of two or more letters must be a known name.
std::optional<value_ptr> parser::try_parse_character()
{
    if (current_char() != '#' or peek() != '\\') return std::nullopt;

    position start = current_pos_;
    advance(); // '#'
    advance(); // '\'
    if (at_end()) {
        current_pos_ = start;
        return std::nullopt;
    }

    if (is_ascii_letter(current_char()) and is_ascii_letter(peek())) {
        position name_start = current_pos_;
        std::string name;
        while (not at_end() and is_ascii_letter(current_char())) {
            name += static_cast<char>(std::tolower(static_cast<unsigned char>(current_char())));
            advance();
        }
        for (const auto& [known, code] : character_names) {
            if (known == name) {
                SCHEMER_DEBUG(parse, "Parsed named character: {}", name);
                return value::make(character{code});
            }
        }
        fail(fmt::format("unrecognized character name '{}'", name), name_start);
    }

    return value::make(character{read_literal_character()});
}

// Plain decimal digits, or #x/#o/#d/#b followed by digits of that radix.
std::optional<value_ptr> parser::try_parse_number()
{
    position start = current_pos_;
    int radix = 10;

    if (current_char() == '#') {
        radix = radix_for_marker(peek());
        if (0 == radix) return std::nullopt;
        advance(); // '#'
        advance(); // radix marker
    }

    std::string digits;
    while (not at_end() and digit_value(current_char(), radix) >= 0) {
        digits += current_char();
        advance();
    }

    if (digits.empty()) {
        current_pos_ = start;
        return std::nullopt;
    }

    SCHEMER_DEBUG(parse, "Parsed number: {} (radix {})", digits, radix);
    return make_number(digits_to_number(digits, radix));
}

value_ptr parser::parse_atom()
{
    std::string name;
    name += current_char();
    advance();
    while (not at_end() and
           (is_letter(current_char()) or is_digit(current_char()) or is_symbol_char(current_char()))) {
        name += current_char();
        advance();
    }

    SCHEMER_DEBUG(parse, "Parsed atom: {}", name);
    if ("#t" == name) return make_bool(true);
    if ("#f" == name) return make_bool(false);
    return make_symbol(name);
}

value_ptr parser::parse_quoted()
{
    advance(); // skip '
    return make_list({make_symbol("quote"), parse_expression()});
}

// (a b c) or (a b . c)
value_ptr parser::parse_list()
{
    position open_paren_position = current_pos_;
    advance(); // consume '('

    auto unterminated = [&] {
        fail(fmt::format("expected ')' to close list opened at {}, but reached end of input",
            open_paren_position.to_string()));
    };

    std::vector<value_ptr> elements;
    skip_whitespace_and_comments();
    if (current_char() == ')') {
        advance();
        return make_list({});
    }

    while (true) {
        if (at_end()) unterminated();
        elements.push_back(parse_expression());

        bool separated = skip_whitespace_and_comments();
        if (at_end()) unterminated();

        if (current_char() == ')') {
            advance();
            return make_list(std::move(elements));
        }

        if (not separated) {
            fail(fmt::format("unexpected {}, expecting space or ')'", describe_current()));
        }

        if (current_char() == '.' and (is_space(peek()) or peek() == ';')) {
            advance(); // consume '.'
            skip_whitespace_and_comments();
            if (at_end()) unterminated();
            auto tail = parse_expression();
            skip_whitespace_and_comments();
            if (at_end()) unterminated();
            if (current_char() != ')') {
                fail(fmt::format("unexpected {}, expecting ')' after dotted list tail",
                    describe_current()));
            }
            advance();
            return value::make(dotted_list{std::move(elements), std::move(tail)});
        }
    }
}

value_ptr parser::parse_expression()
{
    if (at_end()) {
        fail("unexpected end of input, expecting expression");
    }

    char ch = current_char();

    if (ch == '"') {
        return parse_string();
    }

    if (auto literal = try_parse_character()) {
        return *literal;
    }

    if (auto number = try_parse_number()) {
        return *number;
    }

    if (is_letter(ch) or is_symbol_char(ch)) {
        return parse_atom();
    }

    if (ch == '\'') {
        return parse_quoted();
    }

    if (ch == '(') {
        return parse_list();
    }

    fail(fmt::format("unexpected {}, expecting expression", describe_current()));
}

value_ptr parser::parse()
{
    skip_whitespace_and_comments();
    auto result = parse_expression();
    expect_end();
    return result;
}

std::optional<value_ptr> parser::parse_optional()
{
    skip_whitespace_and_comments();
    if (at_end()) return std::nullopt;
    auto result = parse_expression();
    expect_end();
    return result;
}

std::vector<value_ptr> parser::parse_all()
{
    std::vector<value_ptr> expressions;

    skip_whitespace_and_comments();
    while (not at_end()) {
        expressions.push_back(parse_expression());
        bool separated = skip_whitespace_and_comments();
        if (not at_end() and not separated) {
            fail(fmt::format("unexpected {}, expecting space or end of input", describe_current()));
        }
    }

    return expressions;
}
