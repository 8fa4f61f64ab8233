#pragma once

#include <string>
#include <vector>
#include <optional>
#include <filesystem>
#include <chrono>
#include <cstdint>

namespace peerchunk::core::utils {

class StringUtils {
public:
    static std::vector<std::string> split_whitespace(const std::string& str);
    static std::string trim(const std::string& str);
    static std::string to_lower(const std::string& str);
    static std::string to_upper(const std::string& str);
    static std::optional<std::uint64_t> parse_unsigned(const std::string& str);
    static std::string format_bytes(size_t bytes);
    static std::string format_duration(std::chrono::milliseconds duration);
};

class FileUtils {
public:
    static bool exists(const std::filesystem::path& path);
    static std::optional<std::vector<std::string>> read_lines(const std::filesystem::path& path);
    static std::filesystem::path expand_home(const std::string& path);
};

}
