#include "chunkvault/core/command_registry.hpp"
#include <iostream>
#include <iomanip>

namespace chunkvault::core {

CommandRegistry::CommandRegistry(const CommandOptions& options) {
    register_command("plan", std::make_unique<PlanCommandHandler>());
    register_command("upload", std::make_unique<UploadCommandHandler>(options));
    register_command("reassemble", std::make_unique<ReassembleCommandHandler>());
    register_command("status", std::make_unique<StatusCommandHandler>());
    register_command("cancel", std::make_unique<CancelCommandHandler>());
}

void CommandRegistry::register_command(const std::string& name, std::unique_ptr<CommandHandler> handler) {
    handlers_[name] = std::move(handler);
}

CommandResult CommandRegistry::execute_command(const std::string& command, const std::vector<std::string>& args) {
    auto it = handlers_.find(command);
    if (it == handlers_.end()) {
        return CommandResult::error("Unknown command: " + command, 2);
    }

    return it->second->execute(args);
}

bool CommandRegistry::has_command(const std::string& command) const {
    return handlers_.count(command) > 0;
}

void CommandRegistry::print_help() const {
    std::cout << "\nCommands:\n";

    for (const auto& [name, handler] : handlers_) {
        std::cout << "  " << std::left << std::setw(12) << name
                  << handler->get_description() << "\n";
        std::cout << "  " << std::left << std::setw(12) << " "
                  << "Usage: " << handler->get_usage() << "\n";
    }
}

} // namespace chunkvault::core
