#pragma once

#include "../client.hpp"
#include "../errors.hpp"

#include <optional>
#include <ostream>
#include <string>
#include <vector>

namespace dtnclient::commands {

/// Bad command line; reported with the command's usage text.
class UsageError : public Error {
public:
	using Error::Error;
};

struct CommandContext {
	const std::string& command;
	const std::vector<std::string>& args;
	const Client& client;
	std::ostream& out;
};

class CommandHandler {
public:
	virtual ~CommandHandler() = default;
	virtual const char* name() const = 0;
	virtual const char* usage() const = 0;
	virtual void run(CommandContext& ctx) = 0;

protected:
	Eid parse_eid_arg(const std::string& text, const char* what) const;
	std::vector<std::string> positional_args(const CommandContext& ctx) const;
	bool has_flag(const CommandContext& ctx, const char* long_name, const char* short_name = nullptr) const;
	std::optional<std::string> option_value(const CommandContext& ctx, const char* long_name) const;
	void require_positional(const std::vector<std::string>& positional, std::size_t count) const;

	/// Options whose next argument is their value.
	virtual bool takes_value(const std::string& option) const;
};

} // namespace dtnclient::commands
