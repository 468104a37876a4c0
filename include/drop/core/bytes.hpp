#pragma once

/**
 * @file bytes.hpp
 * @brief Big-endian primitive encoding shared by every binary format in drop
 *
 * Collection metadata, hash sequences, peer locators and provider frames are
 * all built from the same handful of primitives:
 *   - integers in network byte order (u8, u16, u32, u64)
 *   - strings as [u32 length][bytes]
 *
 * Writers append to a std::vector<uint8_t>. ByteReader walks a buffer with a
 * cursor and reports underflow through Result instead of reading past the end.
 */

#include "drop/core/result.hpp"

#include <cstdint>
#include <cstring>
#include <string>
#include <vector>

// Cross-platform network byte order conversion
#ifdef _WIN32
    #include <winsock2.h>
    #pragma comment(lib, "ws2_32.lib")
#else
    #include <arpa/inet.h>
#endif

namespace drop {

using Bytes = std::vector<std::uint8_t>;

namespace bytes {

inline std::uint64_t swap64_if_little(std::uint64_t value) {
#ifdef _WIN32
    return ((value & 0x00000000000000FFULL) << 56) |
           ((value & 0x000000000000FF00ULL) << 40) |
           ((value & 0x0000000000FF0000ULL) << 24) |
           ((value & 0x00000000FF000000ULL) << 8)  |
           ((value & 0x000000FF00000000ULL) >> 8)  |
           ((value & 0x0000FF0000000000ULL) >> 24) |
           ((value & 0x00FF000000000000ULL) >> 40) |
           ((value & 0xFF00000000000000ULL) >> 56);
#else
    #if defined(__BYTE_ORDER__) && __BYTE_ORDER__ == __ORDER_LITTLE_ENDIAN__
        return __builtin_bswap64(value);
    #else
        return value;  // Already big-endian
    #endif
#endif
}

inline void write_uint8(Bytes& buffer, std::uint8_t value) {
    buffer.push_back(value);
}

inline void write_uint16(Bytes& buffer, std::uint16_t value) {
    std::uint16_t network_value = htons(value);
    const auto* raw = reinterpret_cast<const std::uint8_t*>(&network_value);
    buffer.insert(buffer.end(), raw, raw + 2);
}

inline void write_uint32(Bytes& buffer, std::uint32_t value) {
    std::uint32_t network_value = htonl(value);
    const auto* raw = reinterpret_cast<const std::uint8_t*>(&network_value);
    buffer.insert(buffer.end(), raw, raw + 4);
}

inline void write_uint64(Bytes& buffer, std::uint64_t value) {
    std::uint64_t network_value = swap64_if_little(value);
    const auto* raw = reinterpret_cast<const std::uint8_t*>(&network_value);
    buffer.insert(buffer.end(), raw, raw + 8);
}

inline void write_string(Bytes& buffer, const std::string& str) {
    write_uint32(buffer, static_cast<std::uint32_t>(str.size()));
    buffer.insert(buffer.end(), str.begin(), str.end());
}

inline void write_raw(Bytes& buffer, const std::uint8_t* data, std::size_t length) {
    buffer.insert(buffer.end(), data, data + length);
}

} // namespace bytes

/**
 * @brief Bounds-checked cursor over an immutable byte buffer
 *
 * Every read either advances the cursor or fails with the ErrorKind the
 * reader was constructed with, so each format reports its own error kind
 * (InvalidMetadata for metadata, DownloadError for frames, ...).
 */
class ByteReader {
public:
    ByteReader(const std::uint8_t* data, std::size_t size, ErrorKind failure_kind)
        : data_(data), size_(size), failure_kind_(failure_kind) {}

    ByteReader(const Bytes& buffer, ErrorKind failure_kind)
        : ByteReader(buffer.data(), buffer.size(), failure_kind) {}

    std::size_t position() const noexcept { return cursor_; }
    std::size_t remaining() const noexcept { return size_ - cursor_; }
    bool at_end() const noexcept { return cursor_ == size_; }

    Result<std::uint8_t> read_uint8() {
        if (remaining() < 1) {
            return underflow<std::uint8_t>("uint8");
        }
        return Ok(data_[cursor_++]);
    }

    Result<std::uint16_t> read_uint16() {
        if (remaining() < 2) {
            return underflow<std::uint16_t>("uint16");
        }
        std::uint16_t network_value;
        std::memcpy(&network_value, data_ + cursor_, 2);
        cursor_ += 2;
        return Ok(static_cast<std::uint16_t>(ntohs(network_value)));
    }

    Result<std::uint32_t> read_uint32() {
        if (remaining() < 4) {
            return underflow<std::uint32_t>("uint32");
        }
        std::uint32_t network_value;
        std::memcpy(&network_value, data_ + cursor_, 4);
        cursor_ += 4;
        return Ok(static_cast<std::uint32_t>(ntohl(network_value)));
    }

    Result<std::uint64_t> read_uint64() {
        if (remaining() < 8) {
            return underflow<std::uint64_t>("uint64");
        }
        std::uint64_t network_value;
        std::memcpy(&network_value, data_ + cursor_, 8);
        cursor_ += 8;
        return Ok(bytes::swap64_if_little(network_value));
    }

    Result<std::string> read_string() {
        auto length = read_uint32();
        if (length.is_error()) {
            return Err<std::string>(length.error());
        }
        if (remaining() < length.value()) {
            return underflow<std::string>("string");
        }
        std::string value(reinterpret_cast<const char*>(data_ + cursor_), length.value());
        cursor_ += length.value();
        return Ok(std::move(value));
    }

    Result<Bytes> read_raw(std::size_t length) {
        if (remaining() < length) {
            return underflow<Bytes>("raw bytes");
        }
        Bytes value(data_ + cursor_, data_ + cursor_ + length);
        cursor_ += length;
        return Ok(std::move(value));
    }

private:
    template<typename T>
    Result<T> underflow(const char* what) const {
        return Err<T>(failure_kind_, std::string("Buffer underflow reading ") + what);
    }

    const std::uint8_t* data_;
    std::size_t size_;
    std::size_t cursor_ = 0;
    ErrorKind failure_kind_;
};

} // namespace drop
