#include <cstdlib>

#include "tests.hpp"

int main()
{
    return run_tests()? EXIT_SUCCESS: EXIT_FAILURE;
}
