#pragma once

#include <cstdio>
#include <functional>
#include <set>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <fmt/core.h>

// Traces go to stderr; arguments are only formatted when the category is on.
#define SCHEMER_DEBUG(category, ...) \
    do { \
        if (get_debug().is_enabled(#category)) { \
            get_debug().log(#category, __VA_ARGS__); \
        } \
    } while (false)

struct debug_category {
    std::string_view name;
    std::string_view color;
    std::string_view description;
};

// Every category that can be enabled, in the order help lists them. The
// pseudo-categories "all" and "none" are accepted by enable() as well.
extern const std::vector<debug_category> debug_categories;

class debug_controller {
public:
    // Throws std::runtime_error for an unknown category.
    void enable(std::string_view category);
    void disable(std::string_view category);
    void enable_all();
    void disable_all();
    bool is_enabled(std::string_view category) const;
    std::vector<std::string> enabled_categories() const;

    // A comma separated list of categories, e.g. "eval,apply".
    void configure(std::string_view categories);

    void set_colors(bool enable) { use_colors_ = enable; }
    bool are_colors_enabled() const { return use_colors_; }

    template<typename... Args>
    void log(std::string_view category, std::string_view format_str, Args&&... args)
    {
        if (not is_enabled(category)) return;

        std::string message = fmt::format(fmt::runtime(format_str), std::forward<Args>(args)...);
        if (use_colors_) {
            fmt::print(stderr, "{}[{}]\033[0m {}\n", find(category).color, category, message);
        } else {
            fmt::print(stderr, "[{}] {}\n", category, message);
        }
    }

private:
    std::set<std::string, std::less<>> enabled_;
    bool use_colors_ = true;

    const debug_category& find(std::string_view category) const;
};

debug_controller& get_debug();
