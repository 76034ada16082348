#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include "schemer.hpp"

// Recursive-descent reader with backtracking. Alternatives that can fail
// part way through (character literals, radix numbers) save the position
// and restore it before the next alternative is tried.
class parser {
public:
    explicit parser(std::string input);

    // Exactly one expression, optionally surrounded by whitespace/comments.
    value_ptr parse();
    // As parse(), but blank or comment-only input yields nothing.
    std::optional<value_ptr> parse_optional();
    // Zero or more expressions separated by whitespace/comments.
    std::vector<value_ptr> parse_all();

private:
    std::string input_;
    position current_pos_;

    // Get current character (or '\0' if at end)
    char current_char() const {
        return current_pos_.offset() < input_.size() ? input_[current_pos_.offset()] : '\0';
    }

    // Check if at end of input
    bool at_end() const { return current_pos_.offset() >= input_.size(); }

    // Advance position by one byte
    void advance() {
        if (not at_end()) {
            current_pos_.advance(input_[current_pos_.offset()]);
        }
    }

    // Peek at next character without advancing
    char peek(std::size_t ahead = 1) const {
        std::size_t pos = current_pos_.offset() + ahead;
        return pos < input_.size() ? input_[pos] : '\0';
    }

    [[noreturn]] void fail(const std::string& message) const;
    [[noreturn]] void fail(const std::string& message, const position& where) const;
    std::string describe_current() const;

    // Returns true if at least one space or comment was skipped.
    bool skip_whitespace_and_comments();
    void expect_end();

    value_ptr parse_expression();
    value_ptr parse_string();
    std::optional<value_ptr> try_parse_character();
    std::optional<value_ptr> try_parse_number();
    value_ptr parse_atom();
    value_ptr parse_quoted();
    value_ptr parse_list();

    char escaped_char();
    char32_t read_literal_character();
};
