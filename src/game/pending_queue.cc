#include "pending_queue.hh"
#include "core/logging.hh"

namespace eureka {

void PendingQueue::push(bytes_t ciphertext) {
    EUREKA_LOG_TRACE(log::queue) << "Queued " << ciphertext.size()
                                 << "-byte submission at position " << entries_.size();
    entries_.push_back(std::move(ciphertext));
}

std::optional<bytes_t> PendingQueue::pop() {
    if (entries_.empty()) {
        return std::nullopt;
    }
    bytes_t head = std::move(entries_.front());
    entries_.pop_front();
    return head;
}

const bytes_t* PendingQueue::front() const {
    return entries_.empty() ? nullptr : &entries_.front();
}

std::vector<bytes_t> PendingQueue::snapshot() const {
    return std::vector<bytes_t>(entries_.begin(), entries_.end());
}

}  // namespace eureka
