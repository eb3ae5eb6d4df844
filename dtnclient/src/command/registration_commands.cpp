#include "command_base.hpp"
#include "command_registry.hpp"

#include "../logger.hpp"

#include <log4cplus/loggingmacros.h>

#include <memory>

namespace dtnclient::commands {

namespace {

class RegisterCommand final : public CommandHandler {
public:
    const char* name() const override { return "register"; }
    const char* usage() const override { return "register [-u|--unregister] <EID>"; }

    void run(CommandContext& ctx) override {
        auto positional = positional_args(ctx);
        require_positional(positional, 1);
        Eid endpoint = parse_eid_arg(positional[0], "EndpointID");

        if (has_flag(ctx, "--unregister", "-u")) {
            ctx.client.unregister_endpoint(endpoint);
            LOG4CPLUS_INFO(client_logger(), "Unregistered " << endpoint);
        } else {
            ctx.client.register_endpoint(endpoint);
            LOG4CPLUS_INFO(client_logger(), "Registered " << endpoint);
        }
        ctx.out << "success" << std::endl;
    }
};

class UnregisterCommand final : public CommandHandler {
public:
    const char* name() const override { return "unregister"; }
    const char* usage() const override { return "unregister <EID>"; }

    void run(CommandContext& ctx) override {
        auto positional = positional_args(ctx);
        require_positional(positional, 1);
        Eid endpoint = parse_eid_arg(positional[0], "EndpointID");

        ctx.client.unregister_endpoint(endpoint);
        LOG4CPLUS_INFO(client_logger(), "Unregistered " << endpoint);
        ctx.out << "success" << std::endl;
    }
};

} // namespace

void register_registration_commands(CommandRegistry& registry) {
    registry.add(std::make_unique<RegisterCommand>());
    registry.add(std::make_unique<UnregisterCommand>());
}

} // namespace dtnclient::commands
