#pragma once

#include "drop/core/bytes.hpp"
#include "drop/core/hash.hpp"
#include "drop/core/result.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace drop::collection {

/**
 * @brief One file of a collection as listed by the store
 */
struct CollectionEntry {
    std::string name;
    Hash hash;
    std::uint64_t size = 0;
};

using Collection = std::vector<CollectionEntry>;

/**
 * @brief Ordered hashes: [metadata, file_1, ..., file_n]
 *
 * Encoded as the concatenation of 8-byte big-endian hashes.
 */
using HashSequence = std::vector<Hash>;

Bytes encode_hash_sequence(const HashSequence& sequence);

/**
 * @brief Decode a hash sequence blob
 *
 * Fails with InvalidMetadata when the blob is empty or its length is not a
 * multiple of Hash::kEncodedSize.
 */
Result<HashSequence> decode_hash_sequence(const Bytes& data);

/**
 * @brief Reject names that would escape the output directory
 *
 * Empty names, ".", "..", and names containing '/' or '\\' fail with
 * InvalidMetadata.
 */
Result<void> validate_file_name(const std::string& name);

} // namespace drop::collection
