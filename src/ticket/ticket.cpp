#include "drop/ticket/ticket.hpp"

#include "drop/transport/locator.hpp"

#include <cctype>
#include <optional>

namespace drop::ticket {
namespace {

bool is_locator_char(char c) noexcept {
    if (std::isalnum(static_cast<unsigned char>(c))) {
        return true;
    }
    return c == '-' || c == '_' || c == '=' || c == '+' || c == '/';
}

// Unsigned byte in decimal: an optional leading '+', any number of leading zeros
std::optional<std::uint8_t> parse_confirmation(const std::string& text) {
    std::size_t pos = 0;
    if (pos < text.size() && text[pos] == '+') {
        ++pos;
    }
    if (pos == text.size()) {
        return std::nullopt;
    }
    unsigned value = 0;
    for (; pos < text.size(); ++pos) {
        const char c = text[pos];
        if (c < '0' || c > '9') {
            return std::nullopt;
        }
        value = value * 10 + static_cast<unsigned>(c - '0');
        if (value > 255) {
            return std::nullopt;
        }
    }
    return static_cast<std::uint8_t>(value);
}

} // namespace

std::string Ticket::to_string() const {
    return encode(locator, confirmation);
}

std::string encode(const std::string& locator, std::uint8_t confirmation) {
    return locator + kSeparator + std::to_string(static_cast<unsigned>(confirmation));
}

bool is_valid_locator(const std::string& locator) noexcept {
    if (locator.size() < kMinLocatorLength || locator.size() > kMaxLocatorLength) {
        return false;
    }
    for (char c : locator) {
        if (!is_locator_char(c)) {
            return false;
        }
    }
    return true;
}

Result<Ticket> decode(const std::string& input) {
    const auto split = input.rfind(kSeparator);
    if (split != std::string::npos) {
        if (auto confirmation = parse_confirmation(input.substr(split + 1))) {
            std::string locator = input.substr(0, split);
            if (!is_valid_locator(locator)) {
                return Err<Ticket>(ErrorKind::InvalidTicket,
                                   "locator must be 10-200 characters of [A-Za-z0-9-_=+/]");
            }
            return Ok(Ticket{std::move(locator), *confirmation});
        }
    }

    // Legacy tickets carry no confirmation byte
    if (is_valid_locator(input)) {
        return Ok(Ticket{input, 0});
    }
    return Err<Ticket>(ErrorKind::InvalidTicket, "Invalid ticket format");
}

bool is_valid_ticket(const std::string& input) {
    auto ticket = decode(input);
    if (ticket.is_error()) {
        return false;
    }
    auto locator = transport::PeerLocator::decode(ticket.value().locator);
    if (locator.is_error()) {
        return false;
    }
    return locator.value().format == transport::BlobFormat::HashSeq;
}

} // namespace drop::ticket
