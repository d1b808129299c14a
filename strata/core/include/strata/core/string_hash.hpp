#pragma once

#include <cstdint>
#include <cstddef>
#include <string_view>

namespace strata::core {

// FNV-1a hash constants for 64-bit
namespace detail {
    constexpr uint64_t FNV_OFFSET_BASIS = 14695981039346656037ULL;
    constexpr uint64_t FNV_PRIME = 1099511628211ULL;

    constexpr uint64_t fnv1a_append(uint64_t hash, const char* data, size_t len) {
        for (size_t i = 0; i < len; ++i) {
            hash ^= static_cast<uint64_t>(static_cast<unsigned char>(data[i]));
            hash *= FNV_PRIME;
        }
        return hash;
    }

    constexpr uint64_t fnv1a_hash(const char* str, size_t len) {
        return fnv1a_append(FNV_OFFSET_BASIS, str, len);
    }
} // namespace detail

/**
 * @brief Incremental FNV-1a hasher
 *
 * Values are folded in sequence, so the result depends on the order in which
 * they were fed. Integers are fed byte by byte (little-endian) and strings are
 * length-prefixed so that ("ab", "c") and ("a", "bc") hash differently.
 *
 * @code
 * SequentialHash h;
 * h.add(parent_id).add(child_index).add("button");
 * uint64_t id = h.value();
 * @endcode
 */
class SequentialHash {
public:
    constexpr SequentialHash() noexcept = default;
    constexpr explicit SequentialHash(uint64_t seed) noexcept { add(seed); }

    constexpr SequentialHash& add(uint64_t v) noexcept {
        for (int i = 0; i < 8; ++i) {
            m_hash ^= (v >> (i * 8)) & 0xFFu;
            m_hash *= detail::FNV_PRIME;
        }
        return *this;
    }

    constexpr SequentialHash& add(std::string_view str) noexcept {
        add(static_cast<uint64_t>(str.size()));
        m_hash = detail::fnv1a_append(m_hash, str.data(), str.size());
        return *this;
    }

    [[nodiscard]] constexpr uint64_t value() const noexcept { return m_hash; }

private:
    uint64_t m_hash = detail::FNV_OFFSET_BASIS;
};

[[nodiscard]] constexpr uint64_t hash_string(std::string_view str) noexcept {
    return detail::fnv1a_hash(str.data(), str.size());
}

} // namespace strata::core
