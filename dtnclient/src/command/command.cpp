#include "command.hpp"

#include "command_registry.hpp"
#include "../logger.hpp"

#include <log4cplus/loggingmacros.h>

#include <cstring>

namespace dtnclient::commands {

namespace {

CommandRegistry& get_registry() {
	static CommandRegistry registry = [] {
		CommandRegistry reg;
		register_registration_commands(reg);
		register_bundle_commands(reg);
		return reg;
	}();

	return registry;
}

bool is_option(const std::string& arg) {
	return arg.size() > 1 && arg[0] == '-';
}

std::string option_name(const std::string& arg) {
	auto eq = arg.find('=');
	return eq == std::string::npos ? arg : arg.substr(0, eq);
}

} // namespace

Eid CommandHandler::parse_eid_arg(const std::string& text, const char* what) const {
	try {
		return Eid::parse(text);
	} catch (const EidError& exc) {
		throw UsageError(std::string("invalid ") + what + " '" + text + "': " + exc.what());
	}
}

bool CommandHandler::takes_value(const std::string&) const {
	return false;
}

std::vector<std::string> CommandHandler::positional_args(const CommandContext& ctx) const {
	std::vector<std::string> positional;
	for (std::size_t i = 0; i < ctx.args.size(); ++i) {
		const std::string& arg = ctx.args[i];
		if (arg == "--") {
			positional.insert(positional.end(), ctx.args.begin() + static_cast<std::ptrdiff_t>(i) + 1, ctx.args.end());
			break;
		}
		if (!is_option(arg)) {
			positional.push_back(arg);
			continue;
		}
		if (arg.find('=') == std::string::npos && takes_value(arg)) {
			++i;
		}
	}
	return positional;
}

bool CommandHandler::has_flag(const CommandContext& ctx, const char* long_name, const char* short_name) const {
	for (const auto& arg : ctx.args) {
		if (arg == "--") {
			break;
		}
		if (arg == long_name || (short_name && arg == short_name)) {
			return true;
		}
	}
	return false;
}

std::optional<std::string> CommandHandler::option_value(const CommandContext& ctx, const char* long_name) const {
	const std::size_t name_len = std::strlen(long_name);
	for (std::size_t i = 0; i < ctx.args.size(); ++i) {
		const std::string& arg = ctx.args[i];
		if (arg == "--") {
			break;
		}
		if (arg == long_name) {
			if (i + 1 >= ctx.args.size()) {
				throw UsageError(std::string(long_name) + " requires a value");
			}
			return ctx.args[i + 1];
		}
		if (option_name(arg) == long_name) {
			return arg.substr(name_len + 1);
		}
	}
	return std::nullopt;
}

void CommandHandler::require_positional(const std::vector<std::string>& positional, std::size_t count) const {
	if (positional.size() != count) {
		throw UsageError(std::string(name()) + " expects " + std::to_string(count) + " argument(s), got " +
		                 std::to_string(positional.size()));
	}
}

void run_command(const std::string& command, const std::vector<std::string>& args, const Client& client,
                 std::ostream& out) {
	CommandHandler* handler = get_registry().find(command);
	if (!handler) {
		LOG4CPLUS_WARN(core_logger(), "Unknown command: " << command);
		throw UsageError("unknown command '" + command + "'");
	}

	LOG4CPLUS_DEBUG(core_logger(), "Command: " << command);
	CommandContext ctx{command, args, client, out};
	handler->run(ctx);
}

void print_command_usage(std::ostream& out) {
	out << "Commands:\n";
	for (const CommandHandler* handler : get_registry().all()) {
		out << "  " << handler->usage() << "\n";
	}
}

} // namespace dtnclient::commands
