#pragma once

#include "peerchunk/core/command_handler.hpp"
#include "peerchunk/core/command_registry.hpp"
#include "peerchunk/network/datagram_channel.hpp"
#include "peerchunk/network/udp_channel.hpp"
#include "peerchunk/storage/chunk_store.hpp"
#include "peerchunk/transfer/acquisition_dispatcher.hpp"
#include <boost/asio/io_context.hpp>
#include <boost/asio/posix/stream_descriptor.hpp>
#include <boost/asio/signal_set.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/streambuf.hpp>
#include <chrono>
#include <filesystem>
#include <functional>
#include <memory>

namespace peerchunk::network {

struct NodeOptions {
    std::uint32_t identity = 0;
    std::filesystem::path peer_file = "nodes.map";
    std::filesystem::path chunk_file;
    transfer::DispatcherOptions dispatcher;
    std::chrono::milliseconds poll_interval{20};
    std::filesystem::path cwnd_history_file;
    bool read_console = true;
    bool handle_signals = true;
};

// One node of the swarm: owns the UDP channel, the local inventory and the
// dispatcher, all driven from a single io_context thread.
class PeerNode : public core::DownloadRequester {
public:
    using DownloadObserver = std::function<void(const std::filesystem::path& output, std::size_t chunks)>;
    
    explicit PeerNode(NodeOptions options);
    ~PeerNode() override;
    
    PeerNode(const PeerNode&) = delete;
    PeerNode& operator=(const PeerNode&) = delete;
    
    // Loads the peer directory and inventory and binds the channel
    bool initialize();
    // Blocks until stop() or a termination signal
    int run();
    // Safe to call from any thread
    void stop();
    
    core::CommandResult execute_command(const std::string& line);
    core::CommandResult request_download(const std::filesystem::path& chunk_list,
                                         const std::filesystem::path& output) override;
    
    // Runs on the node thread after an output fragment has been written
    void set_download_observer(DownloadObserver observer) { download_observer_ = std::move(observer); }
    
    bool write_window_history(const std::filesystem::path& path) const;
    
    boost::asio::io_context& io_context() { return io_context_; }
    PeerEndpoint local_endpoint() const;
    const storage::ChunkStore& inventory() const { return inventory_; }
    const transfer::AcquisitionDispatcher* dispatcher() const { return dispatcher_.get(); }
    
private:
    NodeOptions options_;
    
    boost::asio::io_context io_context_;
    boost::asio::steady_timer tick_timer_;
    boost::asio::signal_set signals_;
    std::unique_ptr<boost::asio::posix::stream_descriptor> console_;
    boost::asio::streambuf console_buffer_;
    
    std::unique_ptr<UdpChannel> channel_;
    storage::ChunkStore inventory_;
    std::unique_ptr<transfer::AcquisitionDispatcher> dispatcher_;
    core::CommandRegistry commands_;
    
    std::filesystem::path pending_output_;
    transfer::TimePoint download_started_;
    DownloadObserver download_observer_;
    
    void schedule_tick();
    void start_console();
    void read_console_line();
    void on_download_complete(const storage::ChunkMap& chunks);
    void shutdown();
};

}
