#include "lanbeam/core/command_registry.hpp"
#include <iomanip>
#include <iostream>

namespace lanbeam::core {

CommandRegistry::CommandRegistry() {
    register_command("daemon", std::make_unique<StartCommandHandler>());
    register_command("stop", std::make_unique<StopCommandHandler>());
    register_command("status", std::make_unique<StatusCommandHandler>());
    register_command("users", std::make_unique<UsersCommandHandler>());
    register_command("whoami", std::make_unique<WhoamiCommandHandler>());
    register_command("interfaces", std::make_unique<InterfacesCommandHandler>());
    register_command("settings", std::make_unique<SettingsCommandHandler>());
    register_command("send", std::make_unique<SendCommandHandler>());
    register_command("accept", std::make_unique<AcceptCommandHandler>());
    register_command("reject", std::make_unique<RejectCommandHandler>());
    register_command("offers", std::make_unique<OffersCommandHandler>());
    register_command("refresh", std::make_unique<RefreshCommandHandler>());
    register_command("watch", std::make_unique<WatchCommandHandler>());
}

void CommandRegistry::register_command(const std::string& name, std::unique_ptr<CommandHandler> handler) {
    handlers_[name] = std::move(handler);
}

CommandResult CommandRegistry::execute_command(const std::string& command, const std::vector<std::string>& args) {
    auto it = handlers_.find(command);
    if (it == handlers_.end()) {
        return CommandResult::error("Unknown command: " + command);
    }

    return it->second->execute(args);
}

bool CommandRegistry::has_command(const std::string& command) const {
    return handlers_.find(command) != handlers_.end();
}

void CommandRegistry::print_help() const {
    std::cout << "\nCommands:\n";

    for (const auto& [name, handler] : handlers_) {
        std::cout << "  " << std::left << std::setw(15) << name
                  << handler->get_description() << "\n";
        std::cout << "  " << std::left << std::setw(15) << " "
                  << "Usage: " << handler->get_usage() << "\n\n";
    }
}

}
