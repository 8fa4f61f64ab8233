#pragma once

#include <filesystem>
#include <string>
#include <vector>

namespace peerchunk::core {

struct CommandResult {
    bool success;
    std::string message;
    
    static CommandResult ok(const std::string& message = "") { return {true, message}; }
    static CommandResult error(const std::string& message) { return {false, message}; }
};

class CommandHandler {
public:
    virtual ~CommandHandler() = default;
    
    // args[0] is the command word itself
    virtual CommandResult execute(const std::vector<std::string>& args) = 0;
    virtual std::string get_description() const = 0;
    virtual std::string get_usage() const = 0;
};

// Implemented by whatever owns the transfer machinery
class DownloadRequester {
public:
    virtual ~DownloadRequester() = default;
    virtual CommandResult request_download(const std::filesystem::path& chunk_list,
                                           const std::filesystem::path& output) = 0;
};

class DownloadCommandHandler : public CommandHandler {
public:
    explicit DownloadCommandHandler(DownloadRequester& requester) : requester_(requester) {}
    
    CommandResult execute(const std::vector<std::string>& args) override;
    std::string get_description() const override { return "Fetch every chunk in a chunk list"; }
    std::string get_usage() const override { return "DOWNLOAD <chunk-list> <output>"; }
    
private:
    DownloadRequester& requester_;
};

}
