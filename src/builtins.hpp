#pragma once

#include <string>

#include "schemer.hpp"

namespace builtins {

// Every primitive procedure except load, which needs an environment.
primitive_table make_primitive_table();

// Binds `load` in env: parse a file and evaluate each form in env, returning
// the last value.
void define_load(const env_ptr& env);

// Evaluates every form of the file in env. Returns the last value, or the
// empty list for an empty file.
value_ptr load_file(const std::string& filename, const env_ptr& env);

} // namespace builtins

// Primitives plus load, without the standard library.
env_ptr create_global_environment();

// A fresh global environment with the standard library loaded into it.
// A library that fails to load is reported and skipped.
env_ptr reload_global_environment();

// SCHEMER_STDLIB if set, otherwise the path compiled into the build.
std::string stdlib_path();
