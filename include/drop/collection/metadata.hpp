#pragma once

/**
 * @file metadata.hpp
 * @brief Binary record naming the files of a collection
 *
 * A collection travels as a hash sequence:
 *   [metadata hash, file_1 hash, ..., file_n hash]
 * The first blob is this metadata record; it lists the n file names in the
 * same order as the remaining hashes, so names.size() + 1 must equal the
 * hash sequence length.
 *
 * BINARY FORMAT:
 * [header: "CollectionV0." 13 bytes]
 * [name_count: 4 bytes]
 * For each name:
 *   [name_length: 4 bytes] [name: N bytes UTF-8]
 *
 * Names are length-prefixed, so names containing spaces or newlines survive
 * the round trip.
 */

#include "drop/core/bytes.hpp"
#include "drop/core/result.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace drop::collection {

class CollectionMetadata {
public:
    static constexpr std::string_view kHeader = "CollectionV0.";

    CollectionMetadata() = default;
    explicit CollectionMetadata(std::vector<std::string> names) : names_(std::move(names)) {}

    /**
     * @brief Decode a metadata blob
     *
     * Fails with InvalidMetadata when the header does not match exactly,
     * when the record is truncated, or when bytes are left over.
     */
    static Result<CollectionMetadata> from_bytes(const Bytes& data);

    Bytes to_bytes() const;

    /**
     * @brief Check names.size() + 1 == hash_sequence_length
     *
     * Fails with MetadataMismatch otherwise.
     */
    Result<void> validate_against_hash_sequence_length(std::size_t hash_sequence_length) const;

    const std::vector<std::string>& names() const noexcept { return names_; }
    std::size_t file_count() const noexcept { return names_.size(); }

    bool operator==(const CollectionMetadata& other) const { return names_ == other.names_; }

private:
    std::vector<std::string> names_;
};

} // namespace drop::collection
