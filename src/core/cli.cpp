#include "peerchunk/core/cli.hpp"
#include "peerchunk/core/config.hpp"
#include "peerchunk/core/utils.hpp"
#include <iostream>
#include <iomanip>

namespace peerchunk::core {

CommandLineParser::CommandLineParser(const std::string& program_name) 
    : program_name_(program_name) {
    
    add_option("h", "help", "Show this help message");
    add_option("", "version", "Show version information");
    add_option("", "config", "Configuration file path", true);
    add_option("i", "identity", "Which node of the peer file am I", true);
    add_option("p", "peer-file", "Peer directory file", true, "nodes.map");
    add_option("c", "chunk-file", "Fragment file holding the local chunks", true);
    add_option("m", "max-conn", "Max number of concurrent uploads", true);
    add_option("v", "verbose", "Verbosity 0-3 (off, warn, info, debug)", true);
    add_option("t", "timeout", "Fixed retransmission timeout in seconds, 0 estimates it from RTT", true);
}

void CommandLineParser::add_option(const std::string& short_name, const std::string& long_name, 
                                  const std::string& description, bool has_value, 
                                  const std::string& default_value) {
    options_[long_name] = Option{long_name, description, has_value, default_value};
    if (!short_name.empty()) {
        short_to_long_[short_name] = long_name;
    }
}

bool CommandLineParser::parse(int argc, char* argv[]) {
    positional_args_.clear();
    parsed_options_.clear();
    error_.clear();
    
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        
        bool ok = true;
        if (arg.starts_with("--")) {
            ok = parse_long(arg, i, argc, argv);
        } else if (arg.starts_with("-") && arg.length() > 1) {
            ok = parse_short(arg, i, argc, argv);
        } else {
            positional_args_.push_back(arg);
        }
        
        if (!ok) {
            return false;
        }
    }
    
    return true;
}

bool CommandLineParser::parse_long(const std::string& arg, int& index, int argc, char* argv[]) {
    auto eq_pos = arg.find('=');
    std::string name = arg.substr(2, eq_pos == std::string::npos ? std::string::npos : eq_pos - 2);
    
    auto it = options_.find(name);
    if (it == options_.end()) {
        error_ = "Unknown option: --" + name;
        return false;
    }
    
    if (!it->second.has_value) {
        parsed_options_[name] = "true";
    } else if (eq_pos != std::string::npos) {
        parsed_options_[name] = arg.substr(eq_pos + 1);
    } else if (index + 1 < argc) {
        parsed_options_[name] = argv[++index];
    } else {
        error_ = "Option --" + name + " requires a value";
        return false;
    }
    
    return true;
}

// Flags may be grouped (-hv 2); a valued flag ends the group, its value
// either attached (-i1) or the next argument
bool CommandLineParser::parse_short(const std::string& arg, int& index, int argc, char* argv[]) {
    for (size_t j = 1; j < arg.length(); ++j) {
        std::string short_opt(1, arg[j]);
        
        auto long_it = short_to_long_.find(short_opt);
        if (long_it == short_to_long_.end()) {
            error_ = "Unknown option: -" + short_opt;
            return false;
        }
        
        const std::string& name = long_it->second;
        if (!options_.at(name).has_value) {
            parsed_options_[name] = "true";
            continue;
        }
        
        if (j + 1 < arg.length()) {
            parsed_options_[name] = arg.substr(j + 1);
        } else if (index + 1 < argc) {
            parsed_options_[name] = argv[++index];
        } else {
            error_ = "Option -" + short_opt + " requires a value";
            return false;
        }
        return true;
    }
    
    return true;
}

bool CommandLineParser::has_option(const std::string& name) const {
    return parsed_options_.count(normalize_option_name(name)) > 0;
}

std::string CommandLineParser::get_option(const std::string& name, const std::string& default_value) const {
    std::string normalized = normalize_option_name(name);
    auto it = parsed_options_.find(normalized);
    if (it != parsed_options_.end()) {
        return it->second;
    }
    
    auto opt_it = options_.find(normalized);
    if (opt_it != options_.end() && !opt_it->second.default_value.empty()) {
        return opt_it->second.default_value;
    }
    
    return default_value;
}

std::optional<std::uint32_t> CommandLineParser::identity() const {
    if (!has_option("identity")) {
        return std::nullopt;
    }
    
    auto value = utils::StringUtils::parse_unsigned(get_option("identity"));
    if (!value || *value > UINT32_MAX) {
        return std::nullopt;
    }
    return static_cast<std::uint32_t>(*value);
}

std::optional<int> CommandLineParser::verbosity() const {
    auto level = utils::StringUtils::parse_unsigned(get_option("verbose"));
    if (!level || *level > 3) {
        return std::nullopt;
    }
    return static_cast<int>(*level);
}

bool CommandLineParser::apply_overrides(Config& config) {
    using utils::StringUtils;
    
    if (has_option("peer-file")) {
        config.set("node.peer_file", get_option("peer-file"));
    }
    
    if (has_option("max-conn")) {
        auto value = StringUtils::parse_unsigned(get_option("max-conn"));
        if (!value || *value == 0) {
            error_ = "-m expects a positive number, got '" + get_option("max-conn") + "'";
            return false;
        }
        config.set("node.max_connections", std::to_string(*value));
    }
    
    if (has_option("timeout")) {
        auto seconds = StringUtils::parse_unsigned(get_option("timeout"));
        if (!seconds) {
            error_ = "-t expects whole seconds, got '" + get_option("timeout") + "'";
            return false;
        }
        config.set("transfer.fixed_timeout_ms", std::to_string(*seconds * 1000));
    }
    
    if (has_option("verbose") && !verbosity()) {
        error_ = "-v expects 0-3, got '" + get_option("verbose") + "'";
        return false;
    }
    
    return true;
}

void CommandLineParser::print_help() const {
    std::cout << "Usage: " << program_name_ << " -i <id> -p <peer-file> -c <chunk-file> -m <max-conn> [options]\n\n";
    std::cout << "Options:\n";
    
    for (const auto& [name, option] : options_) {
        std::string short_opt;
        for (const auto& [short_name, long_name] : short_to_long_) {
            if (long_name == name) {
                short_opt = "-" + short_name + ", ";
                break;
            }
        }
        
        std::cout << "  " << std::left << std::setw(24) 
                  << (short_opt + "--" + name + (option.has_value ? " <value>" : ""))
                  << option.description;
        
        if (!option.default_value.empty()) {
            std::cout << " (default: " << option.default_value << ")";
        }
        std::cout << "\n";
    }
    
    std::cout << "\nOperator commands (stdin):\n";
    std::cout << "  DOWNLOAD <chunk-list> <output>   Fetch every listed chunk into <output>\n";
}

void CommandLineParser::print_version() const {
    std::cout << program_name_ << " version 1.0.0\n";
    std::cout << "Built with C++20\n";
}

std::string CommandLineParser::normalize_option_name(const std::string& name) const {
    auto it = short_to_long_.find(name);
    return it != short_to_long_.end() ? it->second : name;
}

}
