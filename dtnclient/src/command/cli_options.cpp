#include "cli_options.hpp"

#include <cstring>
#include <stdexcept>

namespace dtnclient::commands {

namespace {

std::chrono::milliseconds parse_timeout(const std::string& text) {
	UsageError invalid("Invalid --timeout value: " + text);
	if (text.empty()) {
		throw invalid;
	}
	for (char c : text) {
		if (c < '0' || c > '9') {
			throw invalid;
		}
	}
	try {
		return std::chrono::milliseconds(std::stoll(text));
	} catch (const std::out_of_range&) {
		throw invalid;
	}
}

// Matches "--name value" (also the short alias) or "--name=value".
bool take_option(int argc, const char* const* argv, int& i, const char* long_name, const char* short_name,
                 std::string& value) {
	const char* arg = argv[i];
	if (strcmp(arg, long_name) == 0 || (short_name && strcmp(arg, short_name) == 0)) {
		if (i + 1 >= argc) {
			throw UsageError(std::string(long_name) + " requires a value");
		}
		value = argv[++i];
		return true;
	}
	std::size_t length = strlen(long_name);
	if (strncmp(arg, long_name, length) == 0 && arg[length] == '=') {
		value = arg + length + 1;
		return true;
	}
	return false;
}

} // namespace

CliOptions parse_cli_options(int argc, const char* const* argv, const std::string& default_socket) {
	CliOptions options;
	options.socket_path = default_socket;
	std::string timeout_text;

	for (int i = 1; i < argc; ++i) {
		if (!options.command.empty()) {
			options.command_args.emplace_back(argv[i]);
			continue;
		}

		if (strcmp(argv[i], "--version") == 0) {
			options.show_version = true;
			return options;
		}

		if (strcmp(argv[i], "-h") == 0 || strcmp(argv[i], "--help") == 0) {
			options.show_help = true;
			return options;
		}

		if (strcmp(argv[i], "-v") == 0) {
			options.verbose = true;
			continue;
		}

		if (take_option(argc, argv, i, "--socket", "-s", options.socket_path) ||
		    take_option(argc, argv, i, "--config", nullptr, options.config_path) ||
		    take_option(argc, argv, i, "--dump-dir", nullptr, options.dump_dir)) {
			continue;
		}

		if (take_option(argc, argv, i, "--timeout", nullptr, timeout_text)) {
			options.timeout = parse_timeout(timeout_text);
			continue;
		}

		if (argv[i][0] == '-') {
			throw UsageError(std::string("Unknown option: ") + argv[i]);
		}

		options.command = argv[i];
	}

	return options;
}

} // namespace dtnclient::commands
