#include "peerchunk/core/command_registry.hpp"
#include "peerchunk/core/utils.hpp"
#include <iomanip>

namespace peerchunk::core {

using utils::StringUtils;

void CommandRegistry::register_command(const std::string& name, std::unique_ptr<CommandHandler> handler) {
    handlers_[StringUtils::to_upper(name)] = std::move(handler);
}

CommandResult CommandRegistry::execute_command(const std::string& command, const std::vector<std::string>& args) {
    auto it = handlers_.find(StringUtils::to_upper(command));
    if (it == handlers_.end()) {
        return CommandResult::error("Unknown command: " + command);
    }
    
    return it->second->execute(args);
}

CommandResult CommandRegistry::execute_line(const std::string& line) {
    auto args = StringUtils::split_whitespace(line);
    if (args.empty()) {
        return CommandResult::ok();
    }
    
    return execute_command(args[0], args);
}

bool CommandRegistry::has_command(const std::string& command) const {
    return handlers_.find(StringUtils::to_upper(command)) != handlers_.end();
}

void CommandRegistry::print_help(std::ostream& out) const {
    out << "Commands:\n";
    
    for (const auto& [name, handler] : handlers_) {
        out << "  " << std::left << std::setw(15) << name 
            << handler->get_description() << "\n";
        out << "  " << std::left << std::setw(15) << " " 
            << "Usage: " << handler->get_usage() << "\n";
    }
}

}
