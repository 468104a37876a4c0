#pragma once

/**
 * @file download_event.hpp
 * @brief Low-level events produced while a hash sequence is downloaded
 *
 * For every item the transport produces, in order:
 *   ItemFound -> zero or more Progress -> ItemDone
 * Items of different ids may interleave. HashSequenceFound always precedes
 * the first ItemFound; AllDone, when present, is the last event.
 */

#include "drop/core/hash.hpp"

#include <chrono>
#include <cstdint>
#include <string>
#include <variant>

namespace drop::engine {

/// Connection to the provider is open (informational only)
struct Connected {
    std::string remote;
};

/// Head blob of the collection and its metadata blob are in the local store
struct HashSequenceFound {
    Hash hash;
};

/// Transfer of one item starts; id is unique within the download
struct ItemFound {
    std::uint64_t id = 0;
    Hash hash;
    std::uint64_t size = 0;
};

/// Cumulative bytes of item id received so far
struct Progress {
    std::uint64_t id = 0;
    std::uint64_t offset = 0;
};

struct ItemDone {
    std::uint64_t id = 0;
};

/// Item content was already complete in the local store
struct LocalFound {
    Hash hash;
    std::uint64_t size = 0;
};

/// Every blob of the collection has been received and verified
struct AllDone {
    std::uint64_t bytes_read = 0;
    std::chrono::milliseconds elapsed{0};
};

using DownloadEvent = std::variant<
    Connected,
    HashSequenceFound,
    ItemFound,
    Progress,
    ItemDone,
    LocalFound,
    AllDone>;

} // namespace drop::engine
