#pragma once

#include "core/types.hh"
#include <deque>
#include <optional>
#include <vector>

namespace eureka {

// ============================================================================
// Pending Queue
// ============================================================================

// FIFO of submitted ciphertexts awaiting evaluation. Entries are opaque;
// the queue never inspects them.
class PendingQueue {
public:
    PendingQueue() = default;

    void push(bytes_t ciphertext);

    // Remove and return the oldest entry; nullopt when empty
    std::optional<bytes_t> pop();

    // Oldest entry, or nullptr when empty
    [[nodiscard]] const bytes_t* front() const;

    [[nodiscard]] std::size_t size() const { return entries_.size(); }
    [[nodiscard]] bool empty() const { return entries_.empty(); }

    // Copy of all entries, oldest first
    [[nodiscard]] std::vector<bytes_t> snapshot() const;

    bool operator==(const PendingQueue&) const = default;

private:
    std::deque<bytes_t> entries_;
};

}  // namespace eureka
