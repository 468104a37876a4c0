#pragma once

/**
 * @file ticket.hpp
 * @brief User-shareable transfer ticket: "<locator>:<confirmation>"
 *
 * The locator is an opaque connection descriptor produced by the engine
 * (see transport/locator.hpp); the confirmation byte is chosen by the sender
 * and must be presented by the receiver.
 *
 * FORMAT:
 *   "0a1b2c...ff:137"      locator + confirmation
 *   "0a1b2c...ff"          legacy form, confirmation defaults to 0
 *
 * The confirmation is split off at the LAST ':' so the locator never has
 * to be escaped.
 */

#include "drop/core/result.hpp"

#include <cstdint>
#include <string>

namespace drop::ticket {

constexpr std::size_t kMinLocatorLength = 10;
constexpr std::size_t kMaxLocatorLength = 200;
constexpr char kSeparator = ':';

struct Ticket {
    std::string locator;
    std::uint8_t confirmation = 0;

    std::string to_string() const;

    bool operator==(const Ticket& other) const noexcept {
        return locator == other.locator && confirmation == other.confirmation;
    }
};

/**
 * @brief Format a ticket string, never fails
 */
std::string encode(const std::string& locator, std::uint8_t confirmation);

/**
 * @brief Parse a ticket string
 *
 * Errors with InvalidTicket when the locator is shorter than 10 or longer
 * than 200 characters or contains anything outside [A-Za-z0-9-_=+/].
 */
Result<Ticket> decode(const std::string& input);

bool is_valid_locator(const std::string& locator) noexcept;

/**
 * @brief True if the ticket decodes and names a hash-sequence collection
 *
 * Pure check, no network access.
 */
bool is_valid_ticket(const std::string& input);

} // namespace drop::ticket
