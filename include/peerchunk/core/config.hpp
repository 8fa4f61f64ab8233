#pragma once

#include <chrono>
#include <string>
#include <map>
#include <optional>
#include <sstream>
#include <vector>

namespace peerchunk::core {

// Process-wide key=value settings: defaults, then the config file, then
// command-line overrides
class Config {
public:
    Config() = default;
    
    static Config& instance();
    
    // Missing file is an error; malformed lines are logged and skipped
    bool load_from_file(const std::string& filename);
    
    void set(const std::string& key, const std::string& value);
    std::optional<std::string> get(const std::string& key) const;
    
    template<typename T>
    std::optional<T> get_as(const std::string& key) const {
        auto value = get(key);
        if (!value) return std::nullopt;
        
        std::istringstream iss(*value);
        T result;
        if (!(iss >> result) || !iss.eof()) {
            return std::nullopt;
        }
        return result;
    }
    
    int get_int(const std::string& key, int default_value = 0) const;
    std::string get_string(const std::string& key, const std::string& default_value = "") const;
    std::chrono::milliseconds get_milliseconds(const std::string& key, std::chrono::milliseconds default_value) const;
    
    void set_defaults();
    
    // One message per node/transfer setting that is out of range
    std::vector<std::string> validate() const;
    
    void clear() { values_.clear(); }
    std::size_t size() const { return values_.size(); }

private:
    std::map<std::string, std::string> values_;
    
    void require_at_least(const std::string& key, long minimum, std::vector<std::string>& problems) const;
};

}
