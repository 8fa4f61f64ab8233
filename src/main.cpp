#include <iostream>
#include <string>
#include "peerchunk/core/logger.hpp"
#include "peerchunk/core/config.hpp"
#include "peerchunk/core/cli.hpp"
#include "peerchunk/core/utils.hpp"
#include "peerchunk/network/peer_node.hpp"

using peerchunk::core::Config;
using peerchunk::core::Logger;

namespace {

peerchunk::network::NodeOptions node_options_from(const Config& config, std::uint32_t identity,
                                                  const std::string& chunk_file) {
    peerchunk::network::NodeOptions options;
    options.identity = identity;
    options.peer_file = config.get_string("node.peer_file", "nodes.map");
    options.chunk_file = chunk_file;
    options.poll_interval = config.get_milliseconds("transfer.poll_interval_ms", std::chrono::milliseconds(20));
    options.cwnd_history_file = config.get_string("transfer.cwnd_history_file");
    
    options.dispatcher.max_upload_sessions = static_cast<std::size_t>(config.get_int("node.max_connections", 1));
    options.dispatcher.chunk_size = static_cast<std::size_t>(
        config.get_int("transfer.chunk_size", static_cast<int>(peerchunk::network::CHUNK_DATA_SIZE)));
    options.dispatcher.stall_timeout = config.get_milliseconds("transfer.stall_timeout_ms", std::chrono::milliseconds(5000));
    
    auto fixed_timeout = config.get_milliseconds("transfer.fixed_timeout_ms", std::chrono::milliseconds(0));
    if (fixed_timeout.count() > 0) {
        options.dispatcher.fixed_timeout = peerchunk::transfer::Seconds(fixed_timeout);
    }
    
    return options;
}

}

int main(int argc, char* argv[]) {
    peerchunk::core::CommandLineParser parser("peerchunk");
    
    if (!parser.parse(argc, argv)) {
        std::cerr << "Error: " << parser.get_error() << "\n\n";
        parser.print_help();
        return 1;
    }
    
    if (parser.has_option("help")) {
        parser.print_help();
        return 0;
    }
    
    if (parser.has_option("version")) {
        parser.print_version();
        return 0;
    }
    
    auto identity = parser.identity();
    if (!identity) {
        std::cerr << "Error: -i <id> is required\n\n";
        parser.print_help();
        return 1;
    }
    
    auto& config = Config::instance();
    config.set_defaults();
    
    if (parser.has_option("config")) {
        auto config_file = peerchunk::core::utils::FileUtils::expand_home(parser.get_option("config"));
        if (!config.load_from_file(config_file.string())) {
            std::cerr << "Error: cannot read config file " << config_file << "\n";
            return 1;
        }
    }
    
    // Command-line values take precedence over the config file
    if (!parser.apply_overrides(config)) {
        std::cerr << "Error: " << parser.get_error() << "\n";
        return 1;
    }
    
    auto problems = config.validate();
    if (!problems.empty()) {
        for (const auto& problem : problems) {
            std::cerr << "Error: " << problem << "\n";
        }
        return 1;
    }
    
    auto verbosity = parser.verbosity();
    auto console_level = verbosity ? Logger::level_from_verbosity(*verbosity)
                                   : Logger::level_from_string(config.get_string("log.level", "warn"));
    Logger::initialize(config.get_string("log.file"), console_level);
    
    auto options = node_options_from(config, *identity, parser.get_option("chunk-file"));
    LOG_INFO("peerchunk node {} starting", options.identity);
    
    int exit_code = 1;
    {
        peerchunk::network::PeerNode node(options);
        if (node.initialize()) {
            exit_code = node.run();
        }
    }
    
    LOG_INFO("peerchunk node {} stopped", options.identity);
    Logger::shutdown();
    return exit_code;
}
