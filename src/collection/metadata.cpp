#include "drop/collection/metadata.hpp"

#include <algorithm>

namespace drop::collection {

Result<CollectionMetadata> CollectionMetadata::from_bytes(const Bytes& data) {
    if (data.size() < kHeader.size() ||
        !std::equal(kHeader.begin(), kHeader.end(), data.begin(),
                    [](char expected, std::uint8_t actual) {
                        return static_cast<std::uint8_t>(expected) == actual;
                    })) {
        return Err<CollectionMetadata>(ErrorKind::InvalidMetadata, "collection header mismatch");
    }

    ByteReader reader(data.data() + kHeader.size(), data.size() - kHeader.size(),
                      ErrorKind::InvalidMetadata);

    auto count = reader.read_uint32();
    if (count.is_error()) {
        return Err<CollectionMetadata>(count.error());
    }

    // Each name needs at least its 4-byte length prefix
    if (static_cast<std::uint64_t>(count.value()) * 4 > reader.remaining()) {
        return Err<CollectionMetadata>(ErrorKind::InvalidMetadata,
                                       "name count " + std::to_string(count.value()) + " overruns record");
    }

    std::vector<std::string> names;
    names.reserve(count.value());
    for (std::uint32_t i = 0; i < count.value(); ++i) {
        auto name = reader.read_string();
        if (name.is_error()) {
            return Err<CollectionMetadata>(name.error());
        }
        names.push_back(std::move(name.value()));
    }

    if (!reader.at_end()) {
        return Err<CollectionMetadata>(ErrorKind::InvalidMetadata,
                                       std::to_string(reader.remaining()) + " trailing bytes after names");
    }

    return Ok(CollectionMetadata(std::move(names)));
}

Bytes CollectionMetadata::to_bytes() const {
    Bytes buffer(kHeader.begin(), kHeader.end());
    bytes::write_uint32(buffer, static_cast<std::uint32_t>(names_.size()));
    for (const auto& name : names_) {
        bytes::write_string(buffer, name);
    }
    return buffer;
}

Result<void> CollectionMetadata::validate_against_hash_sequence_length(std::size_t hash_sequence_length) const {
    if (names_.size() + 1 != hash_sequence_length) {
        return Err<void>(make_error(ErrorKind::MetadataMismatch,
            "metadata lists " + std::to_string(names_.size()) + " names but hash sequence has " +
            std::to_string(hash_sequence_length) + " entries"));
    }
    return Ok();
}

} // namespace drop::collection
