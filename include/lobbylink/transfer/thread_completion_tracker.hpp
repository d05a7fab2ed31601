#pragma once

#include "lobbylink/core/error.hpp"
#include <cstdint>
#include <functional>
#include <set>

namespace lobbylink::transfer {

// Join point for the parallel streams of one download. Resolves exactly once:
// successfully when every thread index has completed, or with the first rejection.
class ThreadCompletionTracker {
public:
    using JoinHandler = std::function<void(const core::Result&)>;

    ThreadCompletionTracker(std::uint32_t total_threads, JoinHandler handler);

    // Returns true if this call resolved the join.
    bool mark_complete(std::uint32_t thread_index);
    bool reject(const core::Result& error);

    bool is_complete(std::uint32_t thread_index) const { return completed_.count(thread_index) > 0; }
    bool is_settled() const { return settled_; }
    std::uint32_t total_threads() const { return total_threads_; }
    std::size_t completed_count() const { return completed_.size(); }

private:
    void settle(const core::Result& result);

    std::uint32_t total_threads_;
    std::set<std::uint32_t> completed_;
    JoinHandler handler_;
    bool settled_;
};

} // namespace lobbylink::transfer
