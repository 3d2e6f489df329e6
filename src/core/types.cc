#include "types.hh"
#include <algorithm>
#include <atomic>
#include <cstring>

namespace eureka {

// ============================================================================
// Append Helpers
// ============================================================================

void append_u32(bytes_t& out, std::uint32_t val) {
    std::array<std::uint8_t, 4> buf;
    encode_u32(buf.data(), val);
    out.insert(out.end(), buf.begin(), buf.end());
}

void append_u64(bytes_t& out, std::uint64_t val) {
    std::array<std::uint8_t, 8> buf;
    encode_u64(buf.data(), val);
    out.insert(out.end(), buf.begin(), buf.end());
}

void append_bytes(bytes_t& out, std::span<const std::uint8_t> data) {
    append_u32(out, static_cast<std::uint32_t>(data.size()));
    out.insert(out.end(), data.begin(), data.end());
}

void append_string(bytes_t& out, std::string_view str) {
    append_u32(out, static_cast<std::uint32_t>(str.size()));
    out.insert(out.end(), str.begin(), str.end());
}

// ============================================================================
// ByteReader Implementation
// ============================================================================

std::optional<std::uint8_t> ByteReader::read_u8() {
    if (remaining() < 1) {
        return std::nullopt;
    }
    return data_[offset_++];
}

std::optional<std::uint32_t> ByteReader::read_u32() {
    if (remaining() < sizeof(std::uint32_t)) {
        return std::nullopt;
    }
    auto val = decode_u32(data_.data() + offset_);
    offset_ += sizeof(std::uint32_t);
    return val;
}

std::optional<std::uint64_t> ByteReader::read_u64() {
    if (remaining() < sizeof(std::uint64_t)) {
        return std::nullopt;
    }
    auto val = decode_u64(data_.data() + offset_);
    offset_ += sizeof(std::uint64_t);
    return val;
}

std::optional<bytes_t> ByteReader::read_bytes() {
    if (remaining() < sizeof(std::uint32_t)) {
        return std::nullopt;
    }
    std::uint32_t len = decode_u32(data_.data() + offset_);
    if (remaining() - sizeof(std::uint32_t) < len) {
        return std::nullopt;
    }
    offset_ += sizeof(std::uint32_t);
    bytes_t result(data_.begin() + static_cast<std::ptrdiff_t>(offset_),
                   data_.begin() + static_cast<std::ptrdiff_t>(offset_ + len));
    offset_ += len;
    return result;
}

std::optional<std::string> ByteReader::read_string() {
    auto raw = read_bytes();
    if (!raw) {
        return std::nullopt;
    }
    return std::string(raw->begin(), raw->end());
}

// ============================================================================
// Hex Encoding
// ============================================================================

[[nodiscard]] std::string bytes_to_hex(std::span<const std::uint8_t> bytes) {
    static constexpr char hex_chars[] = "0123456789abcdef";
    std::string result;
    result.reserve(bytes.size() * 2);
    for (auto byte : bytes) {
        result.push_back(hex_chars[byte >> 4]);
        result.push_back(hex_chars[byte & 0x0F]);
    }
    return result;
}

// ============================================================================
// Secure Zero
// ============================================================================

void secure_zero(void* ptr, std::size_t len) {
    volatile std::uint8_t* p = static_cast<volatile std::uint8_t*>(ptr);
    while (len--) {
        *p++ = 0;
    }
    std::atomic_thread_fence(std::memory_order_seq_cst);
}

}  // namespace eureka
