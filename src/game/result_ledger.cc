#include "result_ledger.hh"
#include "core/logging.hh"
#include "crypto/hash.hh"

namespace eureka {

std::string derive_result_key(std::string_view content, ResultKeyPolicy policy) {
    switch (policy) {
        case ResultKeyPolicy::VERBATIM:
            return std::string(content);
        case ResultKeyPolicy::DIGEST:
            return sha3_256_hex(content);
    }
    return sha3_256_hex(content);
}

// ============================================================================
// ResultLedger Implementation
// ============================================================================

ResultLedger::InsertResult ResultLedger::insert(const std::string& key, const identity_t& claimant) {
    auto [it, inserted] = entries_.try_emplace(key, claimant);
    if (!inserted) {
        EUREKA_LOG_DEBUG(log::ledger) << "Result " << key << " already claimed by " << it->second;
        return InsertResult::DUPLICATE;
    }
    EUREKA_LOG_DEBUG(log::ledger) << "Result " << key << " claimed by " << claimant;
    return InsertResult::INSERTED;
}

bool ResultLedger::contains(const std::string& key) const {
    return entries_.find(key) != entries_.end();
}

std::optional<identity_t> ResultLedger::claimant(const std::string& key) const {
    auto it = entries_.find(key);
    if (it == entries_.end()) {
        return std::nullopt;
    }
    return it->second;
}

hash_t ResultLedger::fingerprint() const {
    return sha3_256(serialize());
}

bytes_t ResultLedger::serialize() const {
    bytes_t result;
    append_u32(result, static_cast<std::uint32_t>(entries_.size()));
    // std::map iterates in key order, so the encoding is canonical
    for (const auto& [key, claimant] : entries_) {
        append_string(result, key);
        append_string(result, claimant);
    }
    return result;
}

std::optional<ResultLedger> ResultLedger::deserialize(ByteReader& reader) {
    auto count = reader.read_u32();
    if (!count) {
        return std::nullopt;
    }

    result_map_t entries;
    for (std::uint32_t i = 0; i < *count; ++i) {
        auto key = reader.read_string();
        if (!key) {
            return std::nullopt;
        }
        auto claimant = reader.read_string();
        if (!claimant) {
            return std::nullopt;
        }
        // Repeated keys are not canonical
        if (!entries.emplace(std::move(*key), std::move(*claimant)).second) {
            return std::nullopt;
        }
    }

    return ResultLedger(std::move(entries));
}

}  // namespace eureka
