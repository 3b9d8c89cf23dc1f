#pragma once
#include "cli.hpp"
#include <ostream>

// Runs one parsed command. Results go to out, warnings and errors to err.
// Returns the process exit status: 0 on success, 1 on any failure.
int run_command(const Args& args, std::ostream& out, std::ostream& err);
