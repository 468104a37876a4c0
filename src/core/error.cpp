#include "drop/core/error.hpp"

namespace drop {

const char* error_kind_name(ErrorKind kind) noexcept {
    switch (kind) {
        case ErrorKind::InvalidTicket: return "Invalid ticket";
        case ErrorKind::UnsupportedFormat: return "Unsupported format";
        case ErrorKind::InvalidMetadata: return "Invalid metadata";
        case ErrorKind::MetadataMismatch: return "Metadata mismatch";
        case ErrorKind::DownloadError: return "Download error";
        case ErrorKind::NodeError: return "Node error";
        case ErrorKind::ImportError: return "Import error";
        case ErrorKind::IoError: return "I/O error";
        case ErrorKind::SendError: return "Send error";
        case ErrorKind::Cancelled: return "Cancelled";
        case ErrorKind::ConfigError: return "Config error";
        case ErrorKind::InvalidState: return "Invalid state";
    }
    return "Unknown error";
}

std::string Error::to_string() const {
    if (message.empty()) {
        return error_kind_name(kind);
    }
    return std::string(error_kind_name(kind)) + ": " + message;
}

} // namespace drop
