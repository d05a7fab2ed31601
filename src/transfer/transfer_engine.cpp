#include "lobbylink/transfer/transfer_engine.hpp"
#include "lobbylink/core/logger.hpp"
#include "lobbylink/core/utils.hpp"
#include "lobbylink/transfer/range_planner.hpp"
#include <fmt/format.h>
#include <algorithm>

namespace lobbylink::transfer {

using transport::ControlMessage;
using transport::FileTransferCancel;
using transport::FileTransferRequest;
using transport::FileTransferResponse;
using transport::FrameType;
using transport::TransferFrame;

TransferEngine::TransferEngine(boost::asio::io_context& io_context,
                               std::string local_id,
                               TransportProvider& transports,
                               storage::FileStore& file_store,
                               storage::ShareCatalog& catalog,
                               const core::TransferOptions& options)
    : io_context_(io_context)
    , local_id_(std::move(local_id))
    , transports_(transports)
    , file_store_(file_store)
    , catalog_(catalog)
    , options_(options)
    , admission_(options.max_concurrent)
    , alive_(std::make_shared<bool>(true))
{
    if (options_.chunk_size == 0) {
        options_.chunk_size = core::TransferOptions{}.chunk_size;
    }
    if (options_.batch_size == 0) {
        options_.batch_size = 1;
    }
}

TransferEngine::~TransferEngine() {
    alive_.reset();
    for (auto& [id, download] : downloads_) {
        if (download->straggler_timer) {
            download->straggler_timer->cancel();
        }
    }
}

std::string TransferEngine::generate_request_id() {
    return fmt::format("transfer-{}-{}", core::utils::TimeUtils::unix_millis(),
                       core::utils::StringUtils::random_base36(9));
}

std::string TransferEngine::request_download(const FileDescriptor& file, const std::filesystem::path& save_path,
                                             std::string request_id) {
    if (request_id.empty()) {
        request_id = generate_request_id();
    }

    LOG_INFO("Download {} requested: {} ({}) from {}", request_id, file.file_name,
             core::utils::StringUtils::format_bytes(file.file_size), file.owner_id);

    {
        std::lock_guard<std::mutex> lock(progress_mutex_);
        TransferProgress progress;
        progress.request_id = request_id;
        progress.file_name = file.file_name;
        progress.total_size = file.file_size;
        progress.status = TransferStatus::PENDING;
        progress_[request_id] = progress;
    }

    if (file.file_size == 0) {
        auto result = file_store_.write_file(save_path, {});
        if (!result) {
            update_progress(request_id, [&result](TransferProgress& p) {
                p.status = TransferStatus::FAILED;
                p.error = result.message;
            });
            return request_id;
        }
        update_progress(request_id, [](TransferProgress& p) {
            p.status = TransferStatus::COMPLETED;
            p.percent = 100.0;
        });
        return request_id;
    }

    auto download = std::make_unique<Download>();
    download->request_id = request_id;
    download->file = file;
    download->save_path = save_path;
    downloads_[request_id] = std::move(download);

    admission_.submit(request_id, [this, request_id] { start_download(request_id); });
    return request_id;
}

void TransferEngine::start_download(const std::string& request_id) {
    auto it = downloads_.find(request_id);
    if (it == downloads_.end()) {
        return;
    }
    auto& download = *it->second;

    download.ranges = RangePlanner::plan(download.file.file_size);
    const auto thread_count = static_cast<std::uint32_t>(download.ranges.size());
    download.assembler = std::make_unique<ChunkAssembler>(download.ranges);
    download.straggler_timer = std::make_unique<boost::asio::steady_timer>(io_context_);
    download.sampled_at = std::chrono::steady_clock::now();
    download.sampled_bytes = 0;

    std::weak_ptr<bool> alive = alive_;
    download.tracker = std::make_unique<ThreadCompletionTracker>(thread_count,
        [this, alive, request_id](const core::Result& result) {
            // Settles inside a frame handler; finish outside of it
            boost::asio::post(io_context_, [this, alive, request_id, result] {
                if (alive.lock()) {
                    finish_download(request_id, result);
                }
            });
        });

    update_progress(request_id, [](TransferProgress& p) { p.status = TransferStatus::TRANSFERRING; });

    auto transport = transports_.transport_for(download.file.owner_id);
    if (!transport || !transport->is_control_open()) {
        fail_download(request_id,
                      core::Result(core::ErrorCode::CHANNEL_UNAVAILABLE,
                                   "No open data channel to " + download.file.owner_id),
                      TransferStatus::FAILED);
        return;
    }

    LOG_INFO("Download {} starting with {} thread(s)", request_id, thread_count);

    for (std::uint32_t i = 0; i < thread_count; ++i) {
        TransferRequest request;
        request.request_id = RangePlanner::thread_request_id(request_id, i);
        request.parent_request_id = request_id;
        request.share_id = download.file.share_id;
        request.owner_id = download.file.owner_id;
        request.requester_id = local_id_;
        request.file_path = download.file.file_path;
        request.file_name = download.file.file_name;
        request.file_size = download.file.file_size;
        request.range = download.ranges[i];
        request.thread_index = i;

        auto result = transport->send_control(FileTransferRequest{request});
        if (!result) {
            fail_download(request_id, result, TransferStatus::FAILED);
            return;
        }
    }
}

core::Result TransferEngine::cancel(const std::string& request_id) {
    std::optional<TransferStatus> status;
    {
        std::lock_guard<std::mutex> lock(progress_mutex_);
        auto it = progress_.find(request_id);
        if (it != progress_.end()) {
            status = it->second.status;
        }
    }

    if (!status) {
        return core::Result(core::ErrorCode::NOT_FOUND, "Unknown transfer: " + request_id);
    }
    if (is_terminal(*status)) {
        return core::Result(core::ErrorCode::INVALID_STATE,
                            fmt::format("Transfer {} already {}", request_id, to_string(*status)));
    }

    LOG_INFO("Cancelling download {}", request_id);
    fail_download(request_id, core::Result(core::ErrorCode::CANCELLED, "Cancelled"), TransferStatus::CANCELLED);
    return core::Result();
}

std::optional<TransferProgress> TransferEngine::progress(const std::string& request_id) const {
    std::lock_guard<std::mutex> lock(progress_mutex_);
    auto it = progress_.find(request_id);
    if (it == progress_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<TransferProgress> TransferEngine::list_transfers() const {
    std::lock_guard<std::mutex> lock(progress_mutex_);
    std::vector<TransferProgress> transfers;
    transfers.reserve(progress_.size());
    for (const auto& [id, progress] : progress_) {
        transfers.push_back(progress);
    }
    return transfers;
}

bool TransferEngine::has_buffers(const std::string& request_id) const {
    auto it = downloads_.find(request_id);
    return it != downloads_.end() && it->second->assembler != nullptr;
}

bool TransferEngine::has_tracker(const std::string& request_id) const {
    auto it = downloads_.find(request_id);
    return it != downloads_.end() && it->second->tracker != nullptr;
}

void TransferEngine::handle_control(const std::string& peer_id, const ControlMessage& message) {
    if (auto* request = std::get_if<FileTransferRequest>(&message)) {
        serve_request(peer_id, request->request);
        return;
    }

    if (auto* cancel = std::get_if<FileTransferCancel>(&message)) {
        cancel_uploads(peer_id, cancel->request_id);
        return;
    }

    const auto& response = std::get<FileTransferResponse>(message);
    if (response.accepted) {
        LOG_DEBUG("{} accepted {}", peer_id, response.request_id);
        return;
    }

    auto parsed = RangePlanner::parse_thread_request_id(response.request_id);
    const auto parent = parsed ? parsed->first : response.request_id;
    auto it = downloads_.find(parent);
    if (it == downloads_.end() || it->second->file.owner_id != peer_id || !it->second->tracker) {
        return;
    }

    LOG_WARN("{} rejected {}: {}", peer_id, response.request_id, response.message);
    it->second->tracker->reject(core::Result(core::ErrorCode::THREAD_TRANSFER_FAILED,
                                             "Request rejected: " + response.message));
}

void TransferEngine::handle_frame(const std::string& peer_id, const TransferFrame& frame) {
    auto parsed = RangePlanner::parse_thread_request_id(frame.request_id);
    const auto parent = parsed ? parsed->first : frame.request_id;

    auto it = downloads_.find(parent);
    if (it == downloads_.end() || !it->second->tracker || it->second->tracker->is_settled()) {
        LOG_TRACE("Discarding frame for inactive request {}", frame.request_id);
        return;
    }
    auto& download = *it->second;

    if (download.file.owner_id != peer_id) {
        LOG_WARN("Frame for {} from unexpected peer {}", frame.request_id, peer_id);
        return;
    }

    if (frame.type == FrameType::ERROR) {
        LOG_ERROR("Thread {} of {} failed: {}", frame.request_id, parent, frame.error_message());
        download.tracker->reject(core::Result(core::ErrorCode::THREAD_TRANSFER_FAILED, frame.error_message()));
        return;
    }

    if (!parsed || parsed->second >= download.ranges.size()) {
        LOG_WARN("Frame with invalid thread id {}", frame.request_id);
        return;
    }

    if (frame.type == FrameType::CHUNK) {
        on_chunk(download, parsed->second, frame);
    } else {
        on_thread_complete(download, parsed->second);
    }
}

void TransferEngine::on_chunk(Download& download, std::uint32_t thread_index, const TransferFrame& frame) {
    auto added = download.assembler->add_chunk(thread_index, frame.chunk_index, frame.payload);
    if (added == 0) {
        return;
    }

    if (download.assembler->thread_bytes(thread_index) > download.ranges[thread_index].size()) {
        download.tracker->reject(core::Result(core::ErrorCode::THREAD_TRANSFER_FAILED,
                                              fmt::format("Thread {} overran its range", thread_index)));
        return;
    }

    const auto transferred = download.assembler->total_bytes();
    const auto now = std::chrono::steady_clock::now();
    std::optional<double> speed;
    const auto elapsed = now - download.sampled_at;
    if (elapsed >= options_.speed_sample_interval) {
        const auto seconds = std::chrono::duration<double>(elapsed).count();
        speed = static_cast<double>(transferred - download.sampled_bytes) / seconds;
        download.sampled_at = now;
        download.sampled_bytes = transferred;
    }

    update_progress(download.request_id, [transferred, speed](TransferProgress& p) {
        p.transferred = transferred;
        p.percent = p.total_size > 0 ? static_cast<double>(transferred) * 100.0 / static_cast<double>(p.total_size) : 100.0;
        if (speed) {
            p.speed = *speed;
        }
    });

    if (download.completes_pending.count(thread_index) > 0 && download.assembler->thread_filled(thread_index)) {
        download.completes_pending.erase(thread_index);
        download.tracker->mark_complete(thread_index);
    }
}

void TransferEngine::on_thread_complete(Download& download, std::uint32_t thread_index) {
    if (download.assembler->thread_filled(thread_index)) {
        LOG_DEBUG("Thread {} of {} complete", thread_index, download.request_id);
        download.tracker->mark_complete(thread_index);
        return;
    }

    // Chunks on the unordered channel may still be behind the complete frame
    download.completes_pending.insert(thread_index);
    arm_straggler_timer(download);
}

void TransferEngine::arm_straggler_timer(Download& download) {
    download.straggler_timer->expires_after(options_.completion_timeout);

    std::weak_ptr<bool> alive = alive_;
    auto request_id = download.request_id;
    download.straggler_timer->async_wait([this, alive, request_id](const boost::system::error_code& ec) {
        if (ec == boost::asio::error::operation_aborted || !alive.lock()) {
            return;
        }
        auto it = downloads_.find(request_id);
        if (it == downloads_.end() || it->second->completes_pending.empty() || !it->second->tracker) {
            return;
        }
        it->second->tracker->reject(core::Result(core::ErrorCode::THREAD_TRANSFER_FAILED,
                                                 fmt::format("{} thread(s) missing chunks after completion",
                                                             it->second->completes_pending.size())));
    });
}

void TransferEngine::finish_download(const std::string& request_id, const core::Result& result) {
    auto it = downloads_.find(request_id);
    if (it == downloads_.end()) {
        return;
    }

    if (!result) {
        fail_download(request_id, result, TransferStatus::FAILED);
        return;
    }

    auto& download = *it->second;
    std::vector<std::uint8_t> data;
    auto merged = download.assembler->merge(data);
    if (!merged) {
        fail_download(request_id, merged, TransferStatus::FAILED);
        return;
    }

    auto written = file_store_.write_file(download.save_path, data);
    if (!written) {
        fail_download(request_id, written, TransferStatus::FAILED);
        return;
    }

    LOG_INFO("Download {} complete: {} written to {}", request_id,
             core::utils::StringUtils::format_bytes(data.size()), download.save_path.string());

    const auto size = static_cast<std::uint64_t>(data.size());
    teardown_download(request_id);
    update_progress(request_id, [size](TransferProgress& p) {
        p.status = TransferStatus::COMPLETED;
        p.transferred = size;
        p.percent = 100.0;
    });
    admission_.release(request_id);
}

void TransferEngine::fail_download(const std::string& request_id, const core::Result& error, TransferStatus status) {
    auto it = downloads_.find(request_id);
    if (it != downloads_.end()) {
        const auto owner = it->second->file.owner_id;
        const bool started = it->second->tracker != nullptr;

        if (started) {
            if (auto transport = transports_.transport_for(owner)) {
                auto sent = transport->send_control(FileTransferCancel{request_id});
                if (!sent) {
                    LOG_DEBUG("Cancel notice for {} not delivered: {}", request_id, sent.describe());
                }
            }
        }
        teardown_download(request_id);
    }

    if (status == TransferStatus::FAILED) {
        LOG_ERROR("Download {} failed: {}", request_id, error.describe());
    }

    update_progress(request_id, [status, &error](TransferProgress& p) {
        p.status = status;
        p.speed = 0.0;
        p.error = error.message;
    });
    admission_.release(request_id);
}

void TransferEngine::teardown_download(const std::string& request_id) {
    auto it = downloads_.find(request_id);
    if (it == downloads_.end()) {
        return;
    }

    auto& download = *it->second;
    if (download.straggler_timer) {
        download.straggler_timer->cancel();
    }
    if (download.assembler) {
        download.assembler->release();
    }
    downloads_.erase(it);
}

void TransferEngine::handle_peer_closed(const std::string& peer_id) {
    std::vector<std::string> affected;
    for (const auto& [id, download] : downloads_) {
        if (download->file.owner_id == peer_id) {
            affected.push_back(id);
        }
    }
    for (const auto& id : affected) {
        fail_download(id, core::Result(core::ErrorCode::CHANNEL_UNAVAILABLE, "Peer " + peer_id + " disconnected"),
                      TransferStatus::FAILED);
    }

    for (auto it = uploads_.begin(); it != uploads_.end();) {
        if (it->second->peer_id == peer_id) {
            LOG_INFO("Dropping upload {} to disconnected peer {}", it->first, peer_id);
            it = uploads_.erase(it);
        } else {
            ++it;
        }
    }
}

void TransferEngine::serve_request(const std::string& peer_id, const TransferRequest& request) {
    std::filesystem::path path;
    auto resolved = catalog_.resolve_local_path(request.share_id, request.file_path, path);
    if (!resolved) {
        reject_request(peer_id, request.request_id, resolved.message);
        return;
    }

    std::uint64_t size = 0;
    auto sized = file_store_.file_size(path, size);
    if (!sized) {
        reject_request(peer_id, request.request_id, sized.message);
        return;
    }

    auto range = request.range.value_or(ByteRange{0, size});
    if (range.start > range.end || range.end > size) {
        reject_request(peer_id, request.request_id,
                       fmt::format("Range [{}, {}) outside file of {} bytes", range.start, range.end, size));
        return;
    }

    auto transport = transports_.transport_for(peer_id);
    if (!transport) {
        LOG_WARN("No transport to {} for request {}", peer_id, request.request_id);
        return;
    }

    // Chunks shrink to fit what the channel negotiated with the peer
    auto chunk_size = options_.chunk_size;
    if (const auto limit = transport->max_frame_size(); limit > 0) {
        const auto overhead = transport::FRAME_HEADER_SIZE + transport::CHUNK_HEADER_SIZE +
                              request.request_id.size();
        if (limit <= overhead) {
            reject_request(peer_id, request.request_id,
                           fmt::format("Channel message limit of {} bytes is too small", limit));
            return;
        }
        chunk_size = std::min(chunk_size, limit - overhead);
    }

    auto accepted = transport->send_control(FileTransferResponse{request.request_id, true, ""});
    if (!accepted) {
        LOG_WARN("Could not accept {}: {}", request.request_id, accepted.describe());
        return;
    }

    auto upload = std::make_unique<Upload>();
    upload->peer_id = peer_id;
    upload->request = request;
    upload->path = path;
    upload->range = range;
    upload->chunk_size = chunk_size;
    upload->total_chunks = RangePlanner::chunk_count(range, chunk_size);

    LOG_DEBUG("Serving {} to {}: bytes [{}, {}) in {} chunk(s)", request.request_id, peer_id,
              range.start, range.end, upload->total_chunks);

    uploads_[request.request_id] = std::move(upload);
    pump_upload(request.request_id);
}

void TransferEngine::reject_request(const std::string& peer_id, const std::string& request_id,
                                    const std::string& reason) {
    LOG_WARN("Rejecting {} from {}: {}", request_id, peer_id, reason);

    auto transport = transports_.transport_for(peer_id);
    if (!transport) {
        return;
    }

    auto sent = transport->send_control(FileTransferResponse{request_id, false, reason});
    if (!sent) {
        LOG_DEBUG("Rejection for {} not delivered: {}", request_id, sent.describe());
    }
    transport->send_frame(TransferFrame::error(request_id, reason));
}

void TransferEngine::pump_upload(const std::string& upload_id) {
    auto it = uploads_.find(upload_id);
    if (it == uploads_.end()) {
        return;
    }
    auto* upload = it->second.get();
    if (upload->pumping || upload->in_flight > 0) {
        return;
    }

    auto transport = transports_.transport_for(upload->peer_id);
    if (!transport) {
        uploads_.erase(it);
        return;
    }

    if (upload->next_chunk >= upload->total_chunks) {
        LOG_DEBUG("Upload {} sent, {} chunk(s)", upload_id, upload->total_chunks);
        uploads_.erase(it);
        transport->send_frame(TransferFrame::complete(upload_id));
        return;
    }

    // One batch at a time; the next starts when every frame of this one is out
    upload->pumping = true;
    const auto batch_end = std::min<std::uint64_t>(upload->next_chunk + options_.batch_size, upload->total_chunks);
    std::vector<TransferFrame> batch;
    for (auto index = upload->next_chunk; index < batch_end; ++index) {
        const auto offset = upload->range.start + static_cast<std::uint64_t>(index) * upload->chunk_size;
        const auto length = std::min<std::uint64_t>(upload->chunk_size, upload->range.end - offset);

        std::vector<std::uint8_t> data;
        auto read = file_store_.read_range(upload->path, offset, length, data);
        if (!read) {
            LOG_ERROR("Upload {} read failed: {}", upload_id, read.describe());
            uploads_.erase(it);
            transport->send_frame(TransferFrame::error(upload_id, read.message));
            return;
        }
        batch.push_back(TransferFrame::chunk(upload_id, index, upload->total_chunks, std::move(data)));
    }
    upload->next_chunk = static_cast<std::uint32_t>(batch_end);
    upload->in_flight = batch.size();

    std::weak_ptr<bool> alive = alive_;
    for (const auto& frame : batch) {
        transport->send_frame(frame, [this, alive, upload_id](const core::Result& result) {
            if (alive.lock()) {
                on_chunk_sent(upload_id, result);
            }
        });
    }

    it = uploads_.find(upload_id);
    if (it == uploads_.end()) {
        return;
    }
    it->second->pumping = false;
    if (it->second->in_flight == 0) {
        pump_upload(upload_id);
    }
}

void TransferEngine::on_chunk_sent(const std::string& upload_id, const core::Result& result) {
    auto it = uploads_.find(upload_id);
    if (it == uploads_.end()) {
        return;
    }
    auto* upload = it->second.get();

    if (!result) {
        LOG_ERROR("Upload {} aborted: {}", upload_id, result.describe());
        const auto peer_id = upload->peer_id;
        uploads_.erase(it);
        if (auto transport = transports_.transport_for(peer_id); transport && transport->is_transfer_open()) {
            transport->send_frame(TransferFrame::error(upload_id, result.message));
        }
        return;
    }

    if (upload->in_flight > 0) {
        --upload->in_flight;
    }
    if (upload->in_flight == 0 && !upload->pumping) {
        pump_upload(upload_id);
    }
}

void TransferEngine::cancel_uploads(const std::string& peer_id, const std::string& request_id) {
    const auto child_prefix = request_id + "-thread";
    std::size_t cancelled = 0;

    for (auto it = uploads_.begin(); it != uploads_.end();) {
        if (it->second->peer_id == peer_id &&
            (it->first == request_id || it->first.starts_with(child_prefix))) {
            it = uploads_.erase(it);
            ++cancelled;
        } else {
            ++it;
        }
    }

    if (auto transport = transports_.transport_for(peer_id)) {
        transport->drop_pending(request_id);
    }
    LOG_INFO("{} cancelled {}, stopped {} upload thread(s)", peer_id, request_id, cancelled);
}

void TransferEngine::update_progress(const std::string& request_id,
                                     const std::function<void(TransferProgress&)>& mutate) {
    TransferProgress snapshot;
    {
        std::lock_guard<std::mutex> lock(progress_mutex_);
        auto it = progress_.find(request_id);
        if (it == progress_.end()) {
            return;
        }
        const bool was_terminal = is_terminal(it->second.status);
        mutate(it->second);
        snapshot = it->second;

        // Only the newest finished records are kept
        if (!was_terminal && is_terminal(snapshot.status)) {
            finished_.push_back(request_id);
            while (finished_.size() > options_.history_limit) {
                progress_.erase(finished_.front());
                finished_.pop_front();
            }
        }
    }

    if (progress_handler_) {
        progress_handler_(snapshot);
    }
}

} // namespace lobbylink::transfer
