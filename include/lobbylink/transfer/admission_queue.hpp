#pragma once

#include <cstddef>
#include <deque>
#include <functional>
#include <set>
#include <string>

namespace lobbylink::transfer {

// FIFO gate bounding how many whole-file transfers run at once.
class AdmissionQueue {
public:
    using StartFunction = std::function<void()>;

    explicit AdmissionQueue(std::size_t capacity);

    // Runs start now if a slot is free, otherwise when one frees up.
    // Returns true if it started immediately.
    bool submit(const std::string& id, StartFunction start);

    // Frees the slot held by id, or withdraws id from the wait list.
    void release(const std::string& id);

    bool is_active(const std::string& id) const { return active_.count(id) > 0; }
    bool is_waiting(const std::string& id) const;
    std::size_t active_count() const { return active_.size(); }
    std::size_t waiting_count() const { return waiting_.size(); }
    std::size_t capacity() const { return capacity_; }

private:
    struct Waiting {
        std::string id;
        StartFunction start;
    };

    void admit();

    std::size_t capacity_;
    std::set<std::string> active_;
    std::deque<Waiting> waiting_;
    bool admitting_;
};

} // namespace lobbylink::transfer
