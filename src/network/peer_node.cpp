#include "peerchunk/network/peer_node.hpp"
#include "peerchunk/network/peer_directory.hpp"
#include "peerchunk/storage/chunk_list.hpp"
#include "peerchunk/crypto/hash.hpp"
#include "peerchunk/core/logger.hpp"
#include "peerchunk/core/utils.hpp"
#include <boost/asio/post.hpp>
#include <boost/asio/read_until.hpp>
#include <csignal>
#include <fstream>
#include <iostream>
#include <istream>
#include <unistd.h>

namespace peerchunk::network {

using transfer::Clock;

PeerNode::PeerNode(NodeOptions options)
    : options_(std::move(options))
    , tick_timer_(io_context_)
    , signals_(io_context_) {
    commands_.register_command("DOWNLOAD", std::make_unique<core::DownloadCommandHandler>(*this));
}

PeerNode::~PeerNode() {
    shutdown();
}

bool PeerNode::initialize() {
    auto directory = PeerDirectory::load(options_.peer_file);
    if (!directory) {
        LOG_ERROR("Cannot load peer directory {}", options_.peer_file.string());
        return false;
    }
    
    auto self = directory->find(options_.identity);
    if (!self) {
        LOG_ERROR("Node {} is not listed in {}", options_.identity, options_.peer_file.string());
        return false;
    }
    
    if (options_.chunk_file.empty()) {
        LOG_WARN("No chunk file given, starting with an empty inventory");
    } else if (!core::utils::FileUtils::exists(options_.chunk_file)) {
        LOG_ERROR("Chunk file {} does not exist", options_.chunk_file.string());
        return false;
    } else {
        auto result = inventory_.load_fragment(options_.chunk_file);
        if (!result.success()) {
            LOG_ERROR("Cannot load chunk file: {}", result.message);
            return false;
        }
        for (const auto& digest : inventory_.digests()) {
            LOG_DEBUG("Holding chunk {}", crypto::hash_utils::digest_to_hex(digest));
        }
    }
    
    channel_ = std::make_unique<UdpChannel>(io_context_, *self);
    if (!channel_->open()) {
        return false;
    }
    
    dispatcher_ = std::make_unique<transfer::AcquisitionDispatcher>(
        *channel_, inventory_, directory->others(options_.identity), options_.dispatcher);
    
    LOG_INFO("Node {} ready on {} with {} chunks, {} peers",
             options_.identity, to_string(channel_->local_endpoint()),
             inventory_.size(), directory->size() - 1);
    return true;
}

int PeerNode::run() {
    if (!dispatcher_) {
        LOG_ERROR("Node not initialized");
        return 1;
    }
    
    channel_->start_receive([this](std::span<const std::uint8_t> datagram, const PeerEndpoint& from) {
        dispatcher_->handle_datagram(datagram, from, Clock::now());
    });
    
    if (options_.handle_signals) {
        signals_.add(SIGINT);
        signals_.add(SIGTERM);
        signals_.async_wait([this](const boost::system::error_code& ec, int signal_number) {
            if (!ec) {
                LOG_INFO("Received signal {}, shutting down", signal_number);
                io_context_.stop();
            }
        });
    }
    
    if (options_.read_console) {
        start_console();
    }
    
    schedule_tick();
    io_context_.run();
    
    shutdown();
    return 0;
}

void PeerNode::stop() {
    boost::asio::post(io_context_, [this]() { io_context_.stop(); });
}

core::CommandResult PeerNode::execute_command(const std::string& line) {
    auto result = commands_.execute_line(line);
    if (!result.success) {
        LOG_WARN("{}", result.message);
    }
    return result;
}

core::CommandResult PeerNode::request_download(const std::filesystem::path& chunk_list,
                                               const std::filesystem::path& output) {
    if (!dispatcher_) {
        return core::CommandResult::error("Node not initialized");
    }
    
    if (dispatcher_->download_in_progress()) {
        return core::CommandResult::error("A download is already in progress");
    }
    
    auto entries = storage::read_chunk_list(chunk_list);
    if (!entries) {
        return core::CommandResult::error("Cannot read chunk list " + chunk_list.string());
    }
    
    std::vector<crypto::ChunkDigest> digests;
    digests.reserve(entries->size());
    for (const auto& entry : *entries) {
        digests.push_back(entry.digest);
    }
    
    pending_output_ = output;
    download_started_ = Clock::now();
    bool started = dispatcher_->start_download(digests,
        [this](const storage::ChunkMap& chunks) { on_download_complete(chunks); },
        Clock::now());
    if (!started) {
        return core::CommandResult::error("Download could not be started");
    }
    
    return core::CommandResult::ok();
}

bool PeerNode::write_window_history(const std::filesystem::path& path) const {
    if (!dispatcher_) {
        return false;
    }
    
    std::ofstream file(path);
    if (!file.is_open()) {
        LOG_ERROR("Cannot write window history to {}", path.string());
        return false;
    }
    
    file << "peer,chunk,elapsed_seconds,cwnd\n";
    for (const auto& session : dispatcher_->window_history()) {
        std::string peer = to_string(session.peer);
        std::string chunk = crypto::hash_utils::digest_to_hex(session.digest);
        for (const auto& sample : session.samples) {
            file << peer << ',' << chunk << ',' << sample.elapsed_seconds << ',' << sample.cwnd << '\n';
        }
    }
    
    return file.good();
}

PeerEndpoint PeerNode::local_endpoint() const {
    return channel_ ? channel_->local_endpoint() : PeerEndpoint{};
}

void PeerNode::schedule_tick() {
    tick_timer_.expires_after(options_.poll_interval);
    tick_timer_.async_wait([this](const boost::system::error_code& ec) {
        if (ec) {
            return;
        }
        dispatcher_->on_tick(Clock::now());
        schedule_tick();
    });
}

void PeerNode::start_console() {
    int fd = ::dup(STDIN_FILENO);
    if (fd < 0) {
        LOG_WARN("Operator console unavailable: cannot duplicate stdin");
        return;
    }
    
    try {
        console_ = std::make_unique<boost::asio::posix::stream_descriptor>(io_context_, fd);
    } catch (const boost::system::system_error& e) {
        // Regular files and /dev/null cannot be watched by the reactor
        LOG_WARN("Operator console unavailable: {}", e.what());
        ::close(fd);
        return;
    }
    
    read_console_line();
}

void PeerNode::read_console_line() {
    boost::asio::async_read_until(*console_, console_buffer_, '\n',
        [this](const boost::system::error_code& ec, std::size_t) {
            if (ec) {
                if (ec != boost::asio::error::operation_aborted) {
                    LOG_INFO("Operator console closed: {}", ec.message());
                }
                return;
            }
            
            std::istream input(&console_buffer_);
            std::string line;
            std::getline(input, line);
            execute_command(line);
            
            read_console_line();
        });
}

void PeerNode::on_download_complete(const storage::ChunkMap& chunks) {
    auto result = storage::ChunkStore::save_fragment(pending_output_, chunks);
    if (!result.success()) {
        LOG_ERROR("Cannot write {}: {}", pending_output_.string(), result.message);
        return;
    }
    
    std::size_t total_bytes = 0;
    for (const auto& [digest, data] : chunks) {
        total_bytes += data->size();
    }
    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - download_started_);
    LOG_INFO("Saved {} chunks ({}) to {} in {}", chunks.size(),
             core::utils::StringUtils::format_bytes(total_bytes), pending_output_.string(),
             core::utils::StringUtils::format_duration(elapsed));
    
    std::cout << "GOT " << pending_output_.string() << std::endl;
    
    if (download_observer_) {
        download_observer_(pending_output_, chunks.size());
    }
}

void PeerNode::shutdown() {
    if (!channel_ || !channel_->is_open()) {
        return;
    }
    
    boost::system::error_code ec;
    tick_timer_.cancel();
    signals_.cancel(ec);
    if (console_) {
        console_->close(ec);
    }
    
    if (dispatcher_) {
        dispatcher_->cancel_download();
        dispatcher_->close_uploads();
        if (!options_.cwnd_history_file.empty()) {
            write_window_history(options_.cwnd_history_file);
        }
    }
    
    channel_->close();
}

}
