#pragma once

/// @file id.hpp
/// @brief Hashing and ID generation for relic_core

#include "fwd.hpp"
#include "error.hpp"
#include <cstdint>
#include <cstddef>
#include <string>
#include <string_view>
#include <atomic>
#include <vector>

namespace relic_core {

// =============================================================================
// FNV-1a Hash
// =============================================================================

namespace detail {

/// FNV-1a hash constants
constexpr std::uint64_t FNV_OFFSET_BASIS = 0xcbf29ce484222325ULL;
constexpr std::uint64_t FNV_PRIME = 0x100000001b3ULL;

/// Continue an FNV-1a hash over a byte range
[[nodiscard]] constexpr std::uint64_t fnv1a_update(std::uint64_t hash, const char* data,
                                                   std::size_t len) noexcept {
    for (std::size_t i = 0; i < len; ++i) {
        hash ^= static_cast<std::uint64_t>(static_cast<unsigned char>(data[i]));
        hash *= FNV_PRIME;
    }
    return hash;
}

/// Compute FNV-1a hash of string
[[nodiscard]] constexpr std::uint64_t fnv1a_hash(const char* str, std::size_t len) noexcept {
    return fnv1a_update(FNV_OFFSET_BASIS, str, len);
}

[[nodiscard]] inline std::uint64_t fnv1a_hash(std::string_view str) noexcept {
    return fnv1a_hash(str.data(), str.size());
}

/// Compute FNV-1a hash of a byte buffer
[[nodiscard]] inline std::uint64_t fnv1a_hash(const std::vector<std::uint8_t>& bytes) noexcept {
    return fnv1a_hash(reinterpret_cast<const char*>(bytes.data()), bytes.size());
}

/// Mix a value into an existing hash
[[nodiscard]] inline std::uint64_t hash_combine(std::uint64_t hash, std::string_view part) noexcept {
    // Separator byte keeps ("ab","c") and ("a","bc") apart
    hash = fnv1a_update(hash, "\x1f", 1);
    return fnv1a_update(hash, part.data(), part.size());
}

} // namespace detail

// =============================================================================
// IdGenerator
// =============================================================================

/// Thread-safe monotonic 64-bit ID generator
class IdGenerator {
public:
    /// Constructor
    explicit IdGenerator(std::uint64_t first = 1) noexcept : m_next(first) {}

    /// Generate next ID (thread-safe)
    [[nodiscard]] std::uint64_t next() noexcept {
        return m_next.fetch_add(1, std::memory_order_relaxed);
    }

    /// Get current count (approximate, for debugging)
    [[nodiscard]] std::uint64_t current() const noexcept {
        return m_next.load(std::memory_order_relaxed);
    }

private:
    std::atomic<std::uint64_t> m_next;
};

// =============================================================================
// Hex Encoding (Implemented in id.cpp)
// =============================================================================

/// Format a 64-bit value as 16 lower-case hex digits
std::string to_hex(std::uint64_t value);

/// Parse 16 hex digits produced by to_hex
Result<std::uint64_t> from_hex(const std::string& text);

} // namespace relic_core
