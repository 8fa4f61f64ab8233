#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include <map>

namespace peerchunk::core {

class Config;

// Node command line: -i <id> -p <peer-file> -c <chunk-file> -m <max-conn> -v <level> -t <seconds>
class CommandLineParser {
public:
    explicit CommandLineParser(const std::string& program_name);
    
    void add_option(const std::string& short_name, const std::string& long_name,
                    const std::string& description, bool has_value = false,
                    const std::string& default_value = "");
    
    bool parse(int argc, char* argv[]);
    
    bool has_option(const std::string& name) const;
    std::string get_option(const std::string& name, const std::string& default_value = "") const;
    
    // Value of -i, if given and numeric
    std::optional<std::uint32_t> identity() const;
    
    // Value of -v when given and within 0-3
    std::optional<int> verbosity() const;
    
    // Copies the options that shadow config keys into config; false (with
    // get_error() set) when a value does not parse
    bool apply_overrides(Config& config);
    
    const std::vector<std::string>& get_positional_args() const { return positional_args_; }
    const std::string& get_error() const { return error_; }
    
    void print_help() const;
    void print_version() const;

private:
    struct Option {
        std::string long_name;
        std::string description;
        bool has_value = false;
        std::string default_value;
    };
    
    std::string program_name_;
    std::map<std::string, Option> options_;
    std::map<std::string, std::string> short_to_long_;
    std::map<std::string, std::string> parsed_options_;
    std::vector<std::string> positional_args_;
    std::string error_;
    
    bool parse_long(const std::string& arg, int& index, int argc, char* argv[]);
    bool parse_short(const std::string& arg, int& index, int argc, char* argv[]);
    std::string normalize_option_name(const std::string& name) const;
};

}
