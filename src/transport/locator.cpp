#include "drop/transport/locator.hpp"

#include "drop/core/bytes.hpp"

#include <iomanip>
#include <sstream>

namespace drop::transport {
namespace {

std::string hex_encode(const Bytes& data) {
    std::ostringstream oss;
    for (auto byte : data) {
        oss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(byte);
    }
    return oss.str();
}

int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

Result<Bytes> hex_decode(const std::string& hex) {
    if (hex.size() % 2 != 0) {
        return Err<Bytes>(ErrorKind::InvalidTicket, "locator has odd length");
    }
    Bytes bytes;
    bytes.reserve(hex.size() / 2);
    for (std::size_t i = 0; i < hex.size(); i += 2) {
        const int high = hex_value(hex[i]);
        const int low = hex_value(hex[i + 1]);
        if (high < 0 || low < 0) {
            return Err<Bytes>(ErrorKind::InvalidTicket, "locator is not hex encoded");
        }
        bytes.push_back(static_cast<std::uint8_t>((high << 4) | low));
    }
    return Ok(std::move(bytes));
}

} // namespace

std::string PeerLocator::encode() const {
    Bytes buffer;
    bytes::write_uint8(buffer, kVersion);
    bytes::write_uint8(buffer, static_cast<std::uint8_t>(format));
    bytes::write_uint64(buffer, collection.value);
    bytes::write_uint16(buffer, port);
    bytes::write_uint8(buffer, static_cast<std::uint8_t>(host.size()));
    buffer.insert(buffer.end(), host.begin(), host.end());
    return hex_encode(buffer);
}

Result<PeerLocator> PeerLocator::decode(const std::string& text) {
    auto raw = hex_decode(text);
    if (raw.is_error()) {
        return Err<PeerLocator>(raw.error());
    }

    ByteReader reader(raw.value(), ErrorKind::InvalidTicket);
    auto version = reader.read_uint8();
    if (version.is_error()) {
        return Err<PeerLocator>(version.error());
    }
    if (version.value() != kVersion) {
        return Err<PeerLocator>(ErrorKind::InvalidTicket,
                                "Unsupported locator version: " + std::to_string(version.value()));
    }

    auto format = reader.read_uint8();
    auto hash = reader.read_uint64();
    auto port = reader.read_uint16();
    auto host_length = reader.read_uint8();
    if (format.is_error() || hash.is_error() || port.is_error() || host_length.is_error()) {
        return Err<PeerLocator>(ErrorKind::InvalidTicket, "truncated locator");
    }
    auto host = reader.read_raw(host_length.value());
    if (host.is_error()) {
        return Err<PeerLocator>(host.error());
    }
    if (!reader.at_end()) {
        return Err<PeerLocator>(ErrorKind::InvalidTicket, "trailing bytes in locator");
    }

    PeerLocator locator;
    locator.format = format.value() == static_cast<std::uint8_t>(BlobFormat::HashSeq)
        ? BlobFormat::HashSeq
        : BlobFormat::Raw;
    locator.collection = Hash{hash.value()};
    locator.port = port.value();
    locator.host.assign(host.value().begin(), host.value().end());
    return Ok(std::move(locator));
}

} // namespace drop::transport
