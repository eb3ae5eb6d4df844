#pragma once

#include "command_base.hpp"

#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

namespace dtnclient::commands {

class CommandRegistry {
public:
    void add(std::unique_ptr<CommandHandler> handler);
    CommandHandler* find(const std::string& command);
    std::vector<const CommandHandler*> all() const;

private:
    std::unordered_map<std::string, std::unique_ptr<CommandHandler>> handlers_;
    std::vector<std::string> order_;
};

void register_registration_commands(CommandRegistry& registry);
void register_bundle_commands(CommandRegistry& registry);

} // namespace dtnclient::commands
