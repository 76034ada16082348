#include <algorithm>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

#include <fmt/core.h>

#include "debug.hpp"

const std::vector<debug_category> debug_categories{
    {"eval", "\033[36m", "each expression evaluated and its result"},          // Cyan
    {"apply", "\033[34m", "procedure applications with their arguments"},      // Blue
    {"env_lookup", "\033[32m", "variable lookups"},                            // Green
    {"env_binding", "\033[33m", "definitions, assignments and new frames"},    // Yellow
    {"primitive", "\033[90m", "calls into primitive procedures"},             // Dark gray
    {"parse", "\033[31m", "tokens read and parse failures"},                   // Red
    {"load", "\033[95m", "files loaded and the forms evaluated from them"},    // Light magenta
    {"stack-depth", "\033[0m", "deepest evaluation after each REPL input"},
};

debug_controller& get_debug()
{
    static debug_controller instance;
    return instance;
}

const debug_category& debug_controller::find(std::string_view category) const
{
    auto it = std::ranges::find(debug_categories, category, &debug_category::name);
    if (it == debug_categories.end()) {
        throw std::runtime_error(fmt::format("Unknown debug category: {}", category));
    }
    return *it;
}

void debug_controller::enable(std::string_view category)
{
    if ("all" == category) {
        enable_all();
    } else if ("none" == category) {
        disable_all();
    } else {
        enabled_.emplace(find(category).name);
    }
}

void debug_controller::disable(std::string_view category)
{
    if (auto it = enabled_.find(category); it != enabled_.end()) {
        enabled_.erase(it);
    }
}

void debug_controller::enable_all()
{
    for (const auto& category : debug_categories) {
        enabled_.emplace(category.name);
    }
}

void debug_controller::disable_all() { enabled_.clear(); }

bool debug_controller::is_enabled(std::string_view category) const
{
    return enabled_.contains(category);
}

std::vector<std::string> debug_controller::enabled_categories() const
{
    return {enabled_.begin(), enabled_.end()};
}

void debug_controller::configure(std::string_view categories)
{
    while (not categories.empty()) {
        auto comma = categories.find(',');
        auto name = categories.substr(0, comma);
        if (not name.empty()) enable(name);
        if (std::string_view::npos == comma) break;
        categories.remove_prefix(comma + 1);
    }
}
