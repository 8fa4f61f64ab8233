#pragma once

#include "peerchunk/core/command_handler.hpp"
#include <map>
#include <memory>
#include <ostream>
#include <string>
#include <vector>

namespace peerchunk::core {

// Operator commands read line by line; command words are case-insensitive
class CommandRegistry {
public:
    void register_command(const std::string& name, std::unique_ptr<CommandHandler> handler);
    
    CommandResult execute_command(const std::string& command, const std::vector<std::string>& args);
    CommandResult execute_line(const std::string& line);
    
    bool has_command(const std::string& command) const;
    void print_help(std::ostream& out) const;
    
private:
    std::map<std::string, std::unique_ptr<CommandHandler>> handlers_;
};

}
