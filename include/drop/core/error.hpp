#pragma once

/**
 * @file error.hpp
 * @brief Error taxonomy shared by every drop module
 *
 * Every fallible operation returns drop::Result<T> whose error side is a
 * drop::Error: a kind that callers can switch on plus a human readable
 * message for logs.
 */

#include <string>

namespace drop {

enum class ErrorKind {
    InvalidTicket,     // malformed or unparseable ticket string
    UnsupportedFormat, // ticket does not name a hash-sequence collection
    InvalidMetadata,   // header mismatch or undecodable metadata bytes
    MetadataMismatch,  // names.size() + 1 != hash sequence length
    DownloadError,     // transport failure, store read failure, protocol violation
    NodeError,         // engine could not be set up or reached
    ImportError,       // sender-side file access or ingestion failure
    IoError,           // local filesystem failure
    SendError,         // progress consumer is gone (never fatal to a transfer)
    Cancelled,         // cooperative cancellation observed
    ConfigError,       // configuration could not be loaded
    InvalidState       // illegal session state transition
};

struct Error {
    ErrorKind kind = ErrorKind::NodeError;
    std::string message;

    Error() = default;
    Error(ErrorKind k, std::string msg) : kind(k), message(std::move(msg)) {}

    /**
     * @brief True for both metadata kinds (MetadataMismatch refines InvalidMetadata)
     */
    bool is_metadata_error() const noexcept {
        return kind == ErrorKind::InvalidMetadata || kind == ErrorKind::MetadataMismatch;
    }

    std::string to_string() const;
    const std::string& what() const noexcept { return message; }
};

const char* error_kind_name(ErrorKind kind) noexcept;

inline Error make_error(ErrorKind kind, std::string message = {}) {
    return Error(kind, std::move(message));
}

} // namespace drop
