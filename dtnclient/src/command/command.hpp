#pragma once

#include "command_base.hpp"

#include <ostream>
#include <string>
#include <vector>

namespace dtnclient::commands {

/// Runs the named command. Throws UsageError for an unknown command or bad arguments.
void run_command(const std::string& command, const std::vector<std::string>& args, const Client& client,
                 std::ostream& out);

void print_command_usage(std::ostream& out);

} // namespace dtnclient::commands
