#include "lobbylink/transfer/thread_completion_tracker.hpp"
#include "lobbylink/core/logger.hpp"

namespace lobbylink::transfer {

ThreadCompletionTracker::ThreadCompletionTracker(std::uint32_t total_threads, JoinHandler handler)
    : total_threads_(total_threads)
    , handler_(std::move(handler))
    , settled_(false)
{
}

bool ThreadCompletionTracker::mark_complete(std::uint32_t thread_index) {
    if (settled_) {
        return false;
    }
    if (thread_index >= total_threads_) {
        LOG_WARN("Completion for unknown thread {} of {}", thread_index, total_threads_);
        return false;
    }

    completed_.insert(thread_index);
    if (completed_.size() < total_threads_) {
        return false;
    }

    settle(core::Result());
    return true;
}

bool ThreadCompletionTracker::reject(const core::Result& error) {
    if (settled_) {
        return false;
    }
    settle(error);
    return true;
}

void ThreadCompletionTracker::settle(const core::Result& result) {
    settled_ = true;
    if (auto handler = std::move(handler_)) {
        handler_ = nullptr;
        handler(result);
    }
}

} // namespace lobbylink::transfer
