#pragma once

#include "core/config.hh"
#include "core/types.hh"
#include <optional>
#include <string>
#include <string_view>

namespace eureka {

// ============================================================================
// Result Key Derivation
// ============================================================================

// Canonical ledger key for evaluated content under the given policy
[[nodiscard]] std::string derive_result_key(std::string_view content, ResultKeyPolicy policy);

// ============================================================================
// Result Ledger
// ============================================================================

// Authoritative map of accepted results to the participant that claimed
// them. Insert-only: a key, once present, is never overwritten or removed.
class ResultLedger {
public:
    ResultLedger() = default;
    explicit ResultLedger(result_map_t entries) : entries_(std::move(entries)) {}

    enum class InsertResult {
        INSERTED,
        DUPLICATE,
    };
    InsertResult insert(const std::string& key, const identity_t& claimant);

    [[nodiscard]] bool contains(const std::string& key) const;
    [[nodiscard]] std::optional<identity_t> claimant(const std::string& key) const;

    [[nodiscard]] std::size_t size() const { return entries_.size(); }
    [[nodiscard]] bool empty() const { return entries_.empty(); }

    [[nodiscard]] const result_map_t& entries() const { return entries_; }

    // SHA3-256 over the canonical encoding; equal ledgers have equal fingerprints
    [[nodiscard]] hash_t fingerprint() const;

    // u32 count | { u32 key_len | key | u32 claimant_len | claimant }*
    [[nodiscard]] bytes_t serialize() const;
    [[nodiscard]] static std::optional<ResultLedger> deserialize(ByteReader& reader);

    bool operator==(const ResultLedger&) const = default;

private:
    result_map_t entries_;
};

}  // namespace eureka
