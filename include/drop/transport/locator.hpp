#pragma once

/**
 * @file locator.hpp
 * @brief Connection descriptor carried inside a ticket
 *
 * BINARY FORMAT (hex encoded into the ticket):
 * [version: 1 byte]
 * [format: 1 byte]        0 = raw blob, 1 = hash sequence
 * [collection hash: 8 bytes]
 * [port: 2 bytes]
 * [host_length: 1 byte] [host: N bytes]
 *
 * Hex keeps the locator inside the ticket alphabet and free of ':'.
 */

#include "drop/core/hash.hpp"
#include "drop/core/result.hpp"

#include <cstdint>
#include <string>

namespace drop::transport {

enum class BlobFormat : std::uint8_t {
    Raw = 0,
    HashSeq = 1
};

struct PeerLocator {
    static constexpr std::uint8_t kVersion = 1;

    std::string host;
    std::uint16_t port = 0;
    Hash collection;
    BlobFormat format = BlobFormat::HashSeq;

    std::string encode() const;

    /**
     * @brief Parse a hex locator
     *
     * Errors with InvalidTicket on bad hex, unknown version or truncation.
     * An unknown format byte decodes as Raw so callers can report
     * UnsupportedFormat instead of a parse failure.
     */
    static Result<PeerLocator> decode(const std::string& text);
};

} // namespace drop::transport
