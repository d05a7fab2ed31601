#pragma once

#include "lobbylink/core/error.hpp"
#include "lobbylink/core/options.hpp"
#include "lobbylink/storage/file_store.hpp"
#include "lobbylink/storage/share_catalog.hpp"
#include "lobbylink/transfer/admission_queue.hpp"
#include "lobbylink/transfer/chunk_assembler.hpp"
#include "lobbylink/transfer/thread_completion_tracker.hpp"
#include "lobbylink/transfer/transfer_types.hpp"
#include "lobbylink/transport/data_channel_transport.hpp"
#include <utility>
#include <boost/asio.hpp>
#include <chrono>
#include <deque>
#include <filesystem>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <unordered_map>
#include <vector>

namespace lobbylink::transfer {

// Looks up the data channel pair of a connected peer.
class TransportProvider {
public:
    virtual ~TransportProvider() = default;

    virtual std::shared_ptr<transport::DataChannelTransport> transport_for(const std::string& peer_id) = 0;
};

// Parallel chunked downloads from remote shares and serving of local shares.
// Every method except the progress queries must run on the io_context thread.
class TransferEngine {
public:
    using ProgressHandler = std::function<void(const TransferProgress&)>;

    TransferEngine(boost::asio::io_context& io_context,
                   std::string local_id,
                   TransportProvider& transports,
                   storage::FileStore& file_store,
                   storage::ShareCatalog& catalog,
                   const core::TransferOptions& options);
    ~TransferEngine();

    TransferEngine(const TransferEngine&) = delete;
    TransferEngine& operator=(const TransferEngine&) = delete;

    // Returns the request id; the download waits for an admission slot if all are taken.
    std::string request_download(const FileDescriptor& file, const std::filesystem::path& save_path,
                                 std::string request_id = {});
    core::Result cancel(const std::string& request_id);

    // Thread safe.
    std::optional<TransferProgress> progress(const std::string& request_id) const;
    std::vector<TransferProgress> list_transfers() const;

    void handle_control(const std::string& peer_id, const transport::ControlMessage& message);
    void handle_frame(const std::string& peer_id, const transport::TransferFrame& frame);
    void handle_peer_closed(const std::string& peer_id);

    void set_progress_handler(ProgressHandler handler) { progress_handler_ = std::move(handler); }

    std::size_t active_count() const { return admission_.active_count(); }
    std::size_t queued_count() const { return admission_.waiting_count(); }
    bool has_buffers(const std::string& request_id) const;
    bool has_tracker(const std::string& request_id) const;
    std::size_t upload_count() const { return uploads_.size(); }

    static std::string generate_request_id();

private:
    struct Download {
        std::string request_id;
        FileDescriptor file;
        std::filesystem::path save_path;
        std::vector<ByteRange> ranges;
        std::unique_ptr<ChunkAssembler> assembler;
        std::unique_ptr<ThreadCompletionTracker> tracker;
        std::set<std::uint32_t> completes_pending;
        std::unique_ptr<boost::asio::steady_timer> straggler_timer;
        std::chrono::steady_clock::time_point sampled_at;
        std::uint64_t sampled_bytes = 0;
    };

    struct Upload {
        std::string peer_id;
        TransferRequest request;
        std::filesystem::path path;
        ByteRange range;
        std::size_t chunk_size = 0;
        std::uint32_t total_chunks = 0;
        std::uint32_t next_chunk = 0;
        std::size_t in_flight = 0;
        bool pumping = false;
    };

    void start_download(const std::string& request_id);
    void finish_download(const std::string& request_id, const core::Result& result);
    void fail_download(const std::string& request_id, const core::Result& error, TransferStatus status);
    void teardown_download(const std::string& request_id);
    void on_chunk(Download& download, std::uint32_t thread_index, const transport::TransferFrame& frame);
    void on_thread_complete(Download& download, std::uint32_t thread_index);
    void arm_straggler_timer(Download& download);

    void serve_request(const std::string& peer_id, const TransferRequest& request);
    void reject_request(const std::string& peer_id, const std::string& request_id, const std::string& reason);
    void pump_upload(const std::string& upload_id);
    void on_chunk_sent(const std::string& upload_id, const core::Result& result);
    void cancel_uploads(const std::string& peer_id, const std::string& request_id);

    void update_progress(const std::string& request_id, const std::function<void(TransferProgress&)>& mutate);

    boost::asio::io_context& io_context_;
    std::string local_id_;
    TransportProvider& transports_;
    storage::FileStore& file_store_;
    storage::ShareCatalog& catalog_;
    core::TransferOptions options_;

    AdmissionQueue admission_;
    std::unordered_map<std::string, std::unique_ptr<Download>> downloads_;
    std::unordered_map<std::string, std::unique_ptr<Upload>> uploads_;

    mutable std::mutex progress_mutex_;
    std::map<std::string, TransferProgress> progress_;
    std::deque<std::string> finished_;
    ProgressHandler progress_handler_;

    // Posted handlers hold a weak reference and skip running once the engine is gone
    std::shared_ptr<bool> alive_;
};

} // namespace lobbylink::transfer
