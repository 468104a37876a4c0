#include "drop/transport/wire.hpp"

#include <algorithm>

namespace drop::transport {

Bytes Request::encode() const {
    Bytes buffer;
    buffer.reserve(kSize);
    bytes::write_raw(buffer, kMagic.data(), kMagic.size());
    bytes::write_uint8(buffer, static_cast<std::uint8_t>(format));
    bytes::write_uint64(buffer, collection.value);
    bytes::write_uint8(buffer, confirmation);
    return buffer;
}

Result<Request> Request::decode(const std::uint8_t* data, std::size_t size) {
    if (size != kSize) {
        return Err<Request>(ErrorKind::DownloadError,
                            "Request must be " + std::to_string(kSize) + " bytes, got " + std::to_string(size));
    }
    if (!std::equal(kMagic.begin(), kMagic.end(), data)) {
        return Err<Request>(ErrorKind::DownloadError, "Bad request magic");
    }

    ByteReader reader(data + kMagic.size(), size - kMagic.size(), ErrorKind::DownloadError);
    Request request;

    auto format = reader.read_uint8();
    if (format.is_error()) {
        return Err<Request>(format.error());
    }
    request.format = format.value() == static_cast<std::uint8_t>(BlobFormat::HashSeq) ? BlobFormat::HashSeq
                                                                                       : BlobFormat::Raw;

    auto hash = reader.read_uint64();
    if (hash.is_error()) {
        return Err<Request>(hash.error());
    }
    request.collection = Hash{hash.value()};

    auto confirmation = reader.read_uint8();
    if (confirmation.is_error()) {
        return Err<Request>(confirmation.error());
    }
    request.confirmation = confirmation.value();

    return Ok(request);
}

const char* frame_type_name(FrameType type) {
    switch (type) {
        case FrameType::BlobHeader: return "BlobHeader";
        case FrameType::Chunk:      return "Chunk";
        case FrameType::BlobEnd:    return "BlobEnd";
        case FrameType::Done:       return "Done";
        case FrameType::Error:      return "Error";
    }
    return "Unknown";
}

Bytes FrameHeader::encode() const {
    Bytes buffer;
    buffer.reserve(kSize);
    bytes::write_uint8(buffer, static_cast<std::uint8_t>(type));
    bytes::write_uint64(buffer, hash.value);
    bytes::write_uint64(buffer, value);
    bytes::write_uint32(buffer, payload_length);
    return buffer;
}

Result<FrameHeader> FrameHeader::decode(const std::uint8_t* data, std::size_t size) {
    ByteReader reader(data, size, ErrorKind::DownloadError);
    FrameHeader header;

    auto type = reader.read_uint8();
    if (type.is_error()) {
        return Err<FrameHeader>(type.error());
    }
    if (type.value() < static_cast<std::uint8_t>(FrameType::BlobHeader) ||
        type.value() > static_cast<std::uint8_t>(FrameType::Error)) {
        return Err<FrameHeader>(ErrorKind::DownloadError,
                                "Unknown frame type " + std::to_string(type.value()));
    }
    header.type = static_cast<FrameType>(type.value());

    auto hash = reader.read_uint64();
    if (hash.is_error()) {
        return Err<FrameHeader>(hash.error());
    }
    header.hash = Hash{hash.value()};

    auto value = reader.read_uint64();
    if (value.is_error()) {
        return Err<FrameHeader>(value.error());
    }
    header.value = value.value();

    auto length = reader.read_uint32();
    if (length.is_error()) {
        return Err<FrameHeader>(length.error());
    }
    if (length.value() > kMaxPayload) {
        return Err<FrameHeader>(ErrorKind::DownloadError,
                                "Frame payload of " + std::to_string(length.value()) + " bytes exceeds limit");
    }
    header.payload_length = length.value();

    return Ok(header);
}

} // namespace drop::transport
