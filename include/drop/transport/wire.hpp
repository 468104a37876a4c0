#pragma once

/**
 * @file wire.hpp
 * @brief Request and frame encoding spoken between Provider and DownloadStream
 *
 * REQUEST (receiver -> provider, once per connection):
 * [magic: "DRP1" 4 bytes]
 * [format: 1 byte]
 * [collection hash: 8 bytes]
 * [confirmation: 1 byte]
 *
 * RESPONSE: a sequence of frames, each
 * [type: 1 byte] [hash: 8 bytes] [value: 8 bytes] [payload_length: 4 bytes] [payload]
 *
 *   BlobHeader  hash = blob,  value = blob size,     no payload
 *   Chunk       hash = blob,  value = chunk offset,  payload = chunk bytes
 *   BlobEnd     hash = blob,  value = bytes sent
 *   Done        hash = collection, value = total bytes sent
 *   Error       payload = UTF-8 reason, connection closes afterwards
 *
 * Blobs are sent in hash sequence order: the sequence blob itself, the
 * metadata blob, then every file blob. Chunks of one blob may arrive in any
 * order; blobs never interleave.
 */

#include "drop/core/bytes.hpp"
#include "drop/core/hash.hpp"
#include "drop/core/result.hpp"
#include "drop/transport/locator.hpp"

#include <array>
#include <cstdint>
#include <string>

namespace drop::transport {

struct Request {
    static constexpr std::array<std::uint8_t, 4> kMagic = {'D', 'R', 'P', '1'};
    static constexpr std::size_t kSize = 4 + 1 + 8 + 1;

    BlobFormat format = BlobFormat::HashSeq;
    Hash collection;
    std::uint8_t confirmation = 0;

    Bytes encode() const;

    /**
     * @brief Parse exactly kSize bytes; DownloadError on a bad magic
     */
    static Result<Request> decode(const std::uint8_t* data, std::size_t size);
};

enum class FrameType : std::uint8_t {
    BlobHeader = 1,
    Chunk = 2,
    BlobEnd = 3,
    Done = 4,
    Error = 5
};

const char* frame_type_name(FrameType type);

struct FrameHeader {
    static constexpr std::size_t kSize = 1 + 8 + 8 + 4;
    static constexpr std::uint32_t kMaxPayload = 16 * 1024 * 1024;

    FrameType type = FrameType::Done;
    Hash hash;
    std::uint64_t value = 0;
    std::uint32_t payload_length = 0;

    Bytes encode() const;

    /**
     * @brief Parse kSize bytes
     *
     * DownloadError for an unknown type or a payload over kMaxPayload.
     */
    static Result<FrameHeader> decode(const std::uint8_t* data, std::size_t size);
};

} // namespace drop::transport
