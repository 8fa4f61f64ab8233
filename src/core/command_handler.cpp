#include "peerchunk/core/command_handler.hpp"
#include "peerchunk/core/logger.hpp"

namespace peerchunk::core {

CommandResult DownloadCommandHandler::execute(const std::vector<std::string>& args) {
    if (args.size() != 3) {
        return CommandResult::error("Usage: " + get_usage());
    }
    
    std::filesystem::path chunk_list = args[1];
    std::filesystem::path output = args[2];
    
    LOG_INFO("DOWNLOAD {} -> {}", chunk_list.string(), output.string());
    return requester_.request_download(chunk_list, output);
}

}
