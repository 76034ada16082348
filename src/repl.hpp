#pragma once

#include "schemer.hpp"

// Interactive read-eval-print loop over env. Returns at end of input or
// on quit/exit.
void repl(env_ptr env);
