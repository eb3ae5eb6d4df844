#include "command_registry.hpp"

namespace dtnclient::commands {

void CommandRegistry::add(std::unique_ptr<CommandHandler> handler) {
    if (!handler) {
        return;
    }
    std::string name = handler->name();
    if (handlers_.emplace(name, std::move(handler)).second) {
        order_.push_back(name);
    }
}

CommandHandler* CommandRegistry::find(const std::string& command) {
    auto it = handlers_.find(command);
    if (it == handlers_.end()) {
        return nullptr;
    }
    return it->second.get();
}

std::vector<const CommandHandler*> CommandRegistry::all() const {
    std::vector<const CommandHandler*> handlers;
    handlers.reserve(order_.size());
    for (const auto& name : order_) {
        handlers.push_back(handlers_.at(name).get());
    }
    return handlers;
}

} // namespace dtnclient::commands
