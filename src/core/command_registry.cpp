#include "routeweave/core/command_registry.hpp"
#include <iostream>
#include <iomanip>

namespace routeweave::core {

CommandRegistry::CommandRegistry(std::shared_ptr<RoutingSession> session) {
    register_command("provide", std::make_unique<ProvideCommandHandler>(session));
    register_command("providers", std::make_unique<ProvidersCommandHandler>(session));
    register_command("peer", std::make_unique<PeerCommandHandler>(session));
    register_command("put", std::make_unique<PutCommandHandler>(session));
    register_command("get", std::make_unique<GetCommandHandler>(session));
    register_command("search", std::make_unique<SearchCommandHandler>(session));
    register_command("bootstrap", std::make_unique<BootstrapCommandHandler>(session));
    register_command("routers", std::make_unique<RoutersCommandHandler>(session));
}

void CommandRegistry::register_command(const std::string& name, std::unique_ptr<CommandHandler> handler) {
    handlers_[name] = std::move(handler);
}

CommandResult CommandRegistry::execute_command(const std::string& command, const std::vector<std::string>& args) {
    auto it = handlers_.find(command);
    if (it == handlers_.end()) {
        return CommandResult::error("Unknown command: " + command);
    }
    
    try {
        return it->second->execute(args);
    } catch (const std::exception& e) {
        return CommandResult::error(command + " failed: " + e.what());
    }
}

bool CommandRegistry::has_command(const std::string& command) const {
    return handlers_.find(command) != handlers_.end();
}

std::vector<std::string> CommandRegistry::command_names() const {
    std::vector<std::string> names;
    names.reserve(handlers_.size());
    for (const auto& [name, handler] : handlers_) {
        names.push_back(name);
    }
    return names;
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
