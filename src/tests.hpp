#pragma once

// Runs every suite, printing one line per check. Returns false if any failed.
bool run_tests();
