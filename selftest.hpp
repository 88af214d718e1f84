#pragma once

// Runs every component's test(), throws std::runtime_error on the first failure.
void run_self_tests();
