#pragma once

#include <string>
#include <string_view>
#include <utility>

#include <fmt/core.h>

template<typename... Args>
void println_red(std::string_view format_str, Args&&... args)
{
    fmt::print("\033[31m{}\033[0m\n",
        fmt::format(fmt::runtime(format_str), std::forward<Args>(args)...));
}

// Throws std::runtime_error if the file can't be opened.
std::string read_file_content(const std::string& filename);

// Returns the value of the environment variable, or fallback if it is unset.
std::string get_env_or(const char* name, const std::string& fallback);
