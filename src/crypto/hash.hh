#pragma once

#include "core/types.hh"
#include <span>
#include <string>
#include <string_view>

namespace eureka {

// ============================================================================
// SHA3-256 Hashing
// ============================================================================

class SHA3Hasher {
public:
    SHA3Hasher();
    ~SHA3Hasher();

    SHA3Hasher(const SHA3Hasher&) = delete;
    SHA3Hasher& operator=(const SHA3Hasher&) = delete;
    SHA3Hasher(SHA3Hasher&&) noexcept;
    SHA3Hasher& operator=(SHA3Hasher&&) noexcept;

    void update(std::span<const std::uint8_t> data);
    void update(std::string_view text);
    void update(const void* data, std::size_t len);
    [[nodiscard]] hash_t finalize();

    void reset();

private:
    void* ctx_;
};

// Convenience functions
[[nodiscard]] hash_t sha3_256(std::span<const std::uint8_t> data);
[[nodiscard]] hash_t sha3_256(const void* data, std::size_t len);

// Lowercase hex digest of a text value (64 characters)
[[nodiscard]] std::string sha3_256_hex(std::string_view text);

}  // namespace eureka
