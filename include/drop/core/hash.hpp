#pragma once

#include "drop/core/result.hpp"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>
#include <vector>

namespace drop {

/**
 * @brief Content hash of one blob (64-bit FNV-1a)
 *
 * Rendered as 16 lowercase hex characters in logs, store file names and
 * JSON output.
 */
struct Hash {
    std::uint64_t value = 0;

    static constexpr std::size_t kEncodedSize = 8;

    std::string to_hex() const;
    static Result<Hash> from_hex(const std::string& hex);

    bool operator==(const Hash& other) const noexcept { return value == other.value; }
    bool operator!=(const Hash& other) const noexcept { return value != other.value; }
};

/**
 * @brief Incremental FNV-1a hasher
 *
 * Fed chunk by chunk while a file is imported or while a blob arrives from a
 * peer, so the full content never needs to sit in memory just to be hashed.
 */
class Hasher {
public:
    void update(const std::uint8_t* data, std::size_t length) noexcept;
    void update(const std::vector<std::uint8_t>& data) noexcept { update(data.data(), data.size()); }

    Hash finish() const noexcept { return Hash{state_}; }

private:
    std::uint64_t state_ = 0xcbf29ce484222325ULL;
};

Hash hash_bytes(const std::vector<std::uint8_t>& data);

} // namespace drop

namespace std {

template<>
struct hash<drop::Hash> {
    std::size_t operator()(const drop::Hash& h) const noexcept {
        return std::hash<std::uint64_t>{}(h.value);
    }
};

} // namespace std
