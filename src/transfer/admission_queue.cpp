#include "lobbylink/transfer/admission_queue.hpp"
#include "lobbylink/core/logger.hpp"
#include <algorithm>

namespace lobbylink::transfer {

AdmissionQueue::AdmissionQueue(std::size_t capacity)
    : capacity_(std::max<std::size_t>(capacity, 1))
    , admitting_(false)
{
}

bool AdmissionQueue::submit(const std::string& id, StartFunction start) {
    if (active_.size() < capacity_ && waiting_.empty()) {
        active_.insert(id);
        start();
        return true;
    }

    LOG_INFO("Transfer {} queued ({} active, {} waiting)", id, active_.size(), waiting_.size());
    waiting_.push_back(Waiting{id, std::move(start)});
    return false;
}

void AdmissionQueue::release(const std::string& id) {
    if (active_.erase(id) == 0) {
        auto it = std::find_if(waiting_.begin(), waiting_.end(),
                               [&id](const Waiting& w) { return w.id == id; });
        if (it != waiting_.end()) {
            waiting_.erase(it);
        }
        return;
    }
    admit();
}

bool AdmissionQueue::is_waiting(const std::string& id) const {
    return std::any_of(waiting_.begin(), waiting_.end(),
                       [&id](const Waiting& w) { return w.id == id; });
}

void AdmissionQueue::admit() {
    // A start function may release synchronously; the outer call finishes the loop
    if (admitting_) {
        return;
    }
    admitting_ = true;

    while (active_.size() < capacity_ && !waiting_.empty()) {
        auto next = std::move(waiting_.front());
        waiting_.pop_front();
        active_.insert(next.id);
        LOG_INFO("Transfer {} admitted", next.id);
        next.start();
    }

    admitting_ = false;
}

} // namespace lobbylink::transfer
