#include "peerchunk/core/config.hpp"
#include "peerchunk/core/logger.hpp"
#include "peerchunk/core/utils.hpp"
#include <fstream>
#include <set>

namespace peerchunk::core {

using utils::StringUtils;

Config& Config::instance() {
    static Config instance;
    return instance;
}

bool Config::load_from_file(const std::string& filename) {
    std::ifstream file(filename);
    if (!file.is_open()) {
        return false;
    }
    
    std::string line;
    int line_number = 0;
    while (std::getline(file, line)) {
        line_number++;
        line = StringUtils::trim(line);
        
        if (line.empty() || line[0] == '#') {
            continue;
        }
        
        auto eq_pos = line.find('=');
        std::string key = eq_pos == std::string::npos ? "" : StringUtils::trim(line.substr(0, eq_pos));
        if (key.empty()) {
            LOG_WARN("{}:{}: expected key=value, ignoring '{}'", filename, line_number, line);
            continue;
        }
        
        values_[key] = StringUtils::trim(line.substr(eq_pos + 1));
    }
    
    return true;
}

void Config::set(const std::string& key, const std::string& value) {
    values_[key] = value;
}

std::optional<std::string> Config::get(const std::string& key) const {
    auto it = values_.find(key);
    if (it != values_.end()) {
        return it->second;
    }
    return std::nullopt;
}

int Config::get_int(const std::string& key, int default_value) const {
    auto value = get_as<int>(key);
    return value ? *value : default_value;
}

std::string Config::get_string(const std::string& key, const std::string& default_value) const {
    auto value = get(key);
    return value ? *value : default_value;
}

std::chrono::milliseconds Config::get_milliseconds(const std::string& key,
                                                   std::chrono::milliseconds default_value) const {
    auto value = get_as<long>(key);
    return value ? std::chrono::milliseconds(*value) : default_value;
}

void Config::set_defaults() {
    values_["node.max_connections"] = "1";
    values_["node.peer_file"] = "nodes.map";
    values_["transfer.chunk_size"] = "524288";
    values_["transfer.fixed_timeout_ms"] = "0";
    values_["transfer.stall_timeout_ms"] = "5000";
    values_["transfer.poll_interval_ms"] = "20";
    values_["transfer.cwnd_history_file"] = "";
    values_["log.level"] = "warn";
    values_["log.file"] = "peerchunk.log";
}

std::vector<std::string> Config::validate() const {
    std::vector<std::string> problems;
    
    require_at_least("node.max_connections", 1, problems);
    require_at_least("transfer.chunk_size", 1, problems);
    require_at_least("transfer.fixed_timeout_ms", 0, problems);
    require_at_least("transfer.stall_timeout_ms", 1, problems);
    require_at_least("transfer.poll_interval_ms", 1, problems);
    
    static const std::set<std::string> levels = {
        "trace", "debug", "info", "warn", "warning", "error", "critical", "off"
    };
    auto level = get("log.level");
    if (level && levels.count(StringUtils::to_lower(*level)) == 0) {
        problems.push_back("log.level: unknown level '" + *level + "'");
    }
    
    return problems;
}

void Config::require_at_least(const std::string& key, long minimum, std::vector<std::string>& problems) const {
    auto raw = get(key);
    if (!raw) {
        return;
    }
    
    auto value = get_as<long>(key);
    if (!value) {
        problems.push_back(key + ": '" + *raw + "' is not a number");
    } else if (*value < minimum) {
        problems.push_back(key + ": must be at least " + std::to_string(minimum));
    }
}

}
