#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace eureka {

// ============================================================================
// Cryptographic Constants
// ============================================================================

// SHA3-256 output size
inline constexpr std::size_t HASH_SIZE = 32;

// RSA key sizes accepted by the evaluator codec
inline constexpr std::size_t RSA_DEFAULT_BITS = 2048;
inline constexpr std::size_t RSA_MIN_BITS = 1024;

// PKCS#1 v1.5 encryption padding overhead (0x00 0x02 PS 0x00, |PS| >= 8)
inline constexpr std::size_t PKCS1_V15_OVERHEAD = 11;

// ============================================================================
// Timing Constants
// ============================================================================

// Reaction window armed for the credited participant after an accepted result
inline constexpr std::uint64_t ACTION_TIMEOUT_MS = 30'000;

// ============================================================================
// Capacity Constants
// ============================================================================

inline constexpr std::size_t MAX_IDENTITY_SIZE = 1024;
inline constexpr std::size_t MAX_EVENT_SIZE = 64 * 1024;          // 64KB

// ============================================================================
// Core Type Aliases
// ============================================================================

using hash_t = std::array<std::uint8_t, HASH_SIZE>;
using bytes_t = std::vector<std::uint8_t>;

// Participants are identified by an opaque address string
using identity_t = std::string;

// Canonical result key -> claiming participant identity
using result_map_t = std::map<std::string, identity_t>;

// ============================================================================
// Game Stage
// ============================================================================

enum class Stage : std::uint8_t {
    WAITING = 0,     // No submission outstanding, or last one was a duplicate
    SUBMITTED = 1,   // At least one submission arrived since the last reset
    EVALUATED = 2,
};

[[nodiscard]] inline std::string_view stage_name(Stage stage) {
    switch (stage) {
        case Stage::WAITING: return "waiting";
        case Stage::SUBMITTED: return "submitted";
        case Stage::EVALUATED: return "evaluated";
    }
    return "unknown";
}

// ============================================================================
// Serialization Helpers
// ============================================================================

// Little-endian encoding
inline void encode_u32(std::uint8_t* dst, std::uint32_t val) {
    dst[0] = static_cast<std::uint8_t>(val);
    dst[1] = static_cast<std::uint8_t>(val >> 8);
    dst[2] = static_cast<std::uint8_t>(val >> 16);
    dst[3] = static_cast<std::uint8_t>(val >> 24);
}

inline void encode_u64(std::uint8_t* dst, std::uint64_t val) {
    dst[0] = static_cast<std::uint8_t>(val);
    dst[1] = static_cast<std::uint8_t>(val >> 8);
    dst[2] = static_cast<std::uint8_t>(val >> 16);
    dst[3] = static_cast<std::uint8_t>(val >> 24);
    dst[4] = static_cast<std::uint8_t>(val >> 32);
    dst[5] = static_cast<std::uint8_t>(val >> 40);
    dst[6] = static_cast<std::uint8_t>(val >> 48);
    dst[7] = static_cast<std::uint8_t>(val >> 56);
}

[[nodiscard]] inline std::uint32_t decode_u32(const std::uint8_t* src) {
    return static_cast<std::uint32_t>(src[0]) |
           (static_cast<std::uint32_t>(src[1]) << 8) |
           (static_cast<std::uint32_t>(src[2]) << 16) |
           (static_cast<std::uint32_t>(src[3]) << 24);
}

[[nodiscard]] inline std::uint64_t decode_u64(const std::uint8_t* src) {
    return static_cast<std::uint64_t>(src[0]) |
           (static_cast<std::uint64_t>(src[1]) << 8) |
           (static_cast<std::uint64_t>(src[2]) << 16) |
           (static_cast<std::uint64_t>(src[3]) << 24) |
           (static_cast<std::uint64_t>(src[4]) << 32) |
           (static_cast<std::uint64_t>(src[5]) << 40) |
           (static_cast<std::uint64_t>(src[6]) << 48) |
           (static_cast<std::uint64_t>(src[7]) << 56);
}

// Append helpers for length-prefixed encodings
void append_u32(bytes_t& out, std::uint32_t val);
void append_u64(bytes_t& out, std::uint64_t val);
void append_bytes(bytes_t& out, std::span<const std::uint8_t> data);
void append_string(bytes_t& out, std::string_view str);

// ============================================================================
// Byte Reader
// ============================================================================

// Bounds-checked cursor over an encoded buffer. Every read returns nullopt
// once the buffer is exhausted; the cursor does not advance on failure.
class ByteReader {
public:
    explicit ByteReader(std::span<const std::uint8_t> data) : data_(data) {}

    [[nodiscard]] std::optional<std::uint8_t> read_u8();
    [[nodiscard]] std::optional<std::uint32_t> read_u32();
    [[nodiscard]] std::optional<std::uint64_t> read_u64();
    [[nodiscard]] std::optional<bytes_t> read_bytes();
    [[nodiscard]] std::optional<std::string> read_string();

    [[nodiscard]] std::size_t remaining() const { return data_.size() - offset_; }
    [[nodiscard]] bool at_end() const { return offset_ == data_.size(); }

private:
    std::span<const std::uint8_t> data_;
    std::size_t offset_ = 0;
};

// ============================================================================
// Hex Encoding
// ============================================================================

[[nodiscard]] std::string bytes_to_hex(std::span<const std::uint8_t> bytes);

// ============================================================================
// Zero Memory (for sensitive data)
// ============================================================================

void secure_zero(void* ptr, std::size_t len);

template<typename T>
void secure_zero(T& container) {
    secure_zero(container.data(), container.size());
}

}  // namespace eureka
