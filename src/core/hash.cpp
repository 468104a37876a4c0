#include "drop/core/hash.hpp"

#include <iomanip>
#include <sstream>

namespace drop {

void Hasher::update(const std::uint8_t* data, std::size_t length) noexcept {
    const std::uint64_t prime = 0x100000001b3ULL;
    for (std::size_t i = 0; i < length; ++i) {
        state_ ^= static_cast<std::uint64_t>(data[i]);
        state_ *= prime;
    }
}

Hash hash_bytes(const std::vector<std::uint8_t>& data) {
    Hasher hasher;
    hasher.update(data);
    return hasher.finish();
}

std::string Hash::to_hex() const {
    std::ostringstream oss;
    oss << std::hex << std::setw(sizeof(value) * 2) << std::setfill('0') << value;
    return oss.str();
}

Result<Hash> Hash::from_hex(const std::string& hex) {
    if (hex.size() != sizeof(std::uint64_t) * 2) {
        return Err<Hash>(ErrorKind::InvalidMetadata, "hash must be 16 hex characters: " + hex);
    }
    std::uint64_t parsed = 0;
    for (char c : hex) {
        std::uint64_t digit = 0;
        if (c >= '0' && c <= '9') {
            digit = static_cast<std::uint64_t>(c - '0');
        } else if (c >= 'a' && c <= 'f') {
            digit = static_cast<std::uint64_t>(c - 'a' + 10);
        } else if (c >= 'A' && c <= 'F') {
            digit = static_cast<std::uint64_t>(c - 'A' + 10);
        } else {
            return Err<Hash>(ErrorKind::InvalidMetadata, "invalid hex digit in hash: " + hex);
        }
        parsed = (parsed << 4) | digit;
    }
    return Ok(Hash{parsed});
}

} // namespace drop
