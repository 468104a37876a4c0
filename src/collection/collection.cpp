#include "drop/collection/collection.hpp"

namespace drop::collection {

Bytes encode_hash_sequence(const HashSequence& sequence) {
    Bytes buffer;
    buffer.reserve(sequence.size() * Hash::kEncodedSize);
    for (const auto& hash : sequence) {
        bytes::write_uint64(buffer, hash.value);
    }
    return buffer;
}

Result<HashSequence> decode_hash_sequence(const Bytes& data) {
    if (data.empty() || data.size() % Hash::kEncodedSize != 0) {
        return Err<HashSequence>(ErrorKind::InvalidMetadata,
            "hash sequence length " + std::to_string(data.size()) + " is not a positive multiple of 8");
    }

    ByteReader reader(data, ErrorKind::InvalidMetadata);
    HashSequence sequence;
    sequence.reserve(data.size() / Hash::kEncodedSize);
    while (!reader.at_end()) {
        auto value = reader.read_uint64();
        if (value.is_error()) {
            return Err<HashSequence>(value.error());
        }
        sequence.push_back(Hash{value.value()});
    }
    return Ok(std::move(sequence));
}

Result<void> validate_file_name(const std::string& name) {
    if (name.empty() || name == "." || name == "..") {
        return Err<void>(make_error(ErrorKind::InvalidMetadata, "invalid file name '" + name + "'"));
    }
    if (name.find('/') != std::string::npos || name.find('\\') != std::string::npos) {
        return Err<void>(make_error(ErrorKind::InvalidMetadata, "invalid path component '" + name + "'"));
    }
    return Ok();
}

} // namespace drop::collection
