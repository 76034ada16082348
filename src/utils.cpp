#include <cstdlib>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <string>

#include "utils.hpp"

std::string read_file_content(const std::string& filename)
{
    std::ifstream file(filename);
    if (!file.is_open()) {
        throw std::runtime_error("Could not open file: " + filename);
    }

    std::ostringstream buffer;
    buffer << file.rdbuf();
    return buffer.str();
}

std::string get_env_or(const char* name, const std::string& fallback)
{
    const char* setting = std::getenv(name);
    if (not setting or '\0' == *setting) return fallback;
    return setting;
}
