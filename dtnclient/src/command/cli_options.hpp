#pragma once

#include "command_base.hpp"

#include <chrono>
#include <string>
#include <vector>

namespace dtnclient::commands {

/// Global options given before the command name.
struct CliOptions {
	std::string socket_path;
	std::string config_path = "log4cplus.ini";
	std::string dump_dir;
	std::chrono::milliseconds timeout{0};
	bool verbose = false;
	bool show_version = false;
	bool show_help = false;
	std::string command;
	std::vector<std::string> command_args;
};

/**
 * Parses argv up to the command name; everything after it is passed
 * through untouched in command_args. Stops early on --version and --help.
 *
 * Throws UsageError for unknown options, options missing their value,
 * and a --timeout that is not a non-negative integer.
 */
CliOptions parse_cli_options(int argc, const char* const* argv, const std::string& default_socket);

} // namespace dtnclient::commands
