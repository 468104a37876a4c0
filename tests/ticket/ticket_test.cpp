#include "drop/ticket/ticket.hpp"
#include "drop/transport/locator.hpp"

#include <gtest/gtest.h>

#include <string>

using drop::ErrorKind;
namespace ticket = drop::ticket;

TEST(TicketTest, EncodeThenDecodePreservesLocatorAndConfirmation) {
    const std::string locator = "0a1b2c3d4e5f60718293";
    for (unsigned confirmation : {0u, 1u, 137u, 255u}) {
        const auto text = ticket::encode(locator, static_cast<std::uint8_t>(confirmation));
        auto decoded = ticket::decode(text);
        ASSERT_TRUE(decoded.is_ok()) << text;
        EXPECT_EQ(decoded.value().locator, locator);
        EXPECT_EQ(decoded.value().confirmation, confirmation);
    }
}

TEST(TicketTest, FormatsAsLocatorColonConfirmation) {
    EXPECT_EQ(ticket::encode("abcdefghij", 42), "abcdefghij:42");
    EXPECT_EQ((ticket::Ticket{"abcdefghij", 7}).to_string(), "abcdefghij:7");
}

TEST(TicketTest, LegacyTicketWithoutConfirmationDefaultsToZero) {
    auto decoded = ticket::decode("abcdefghij");
    ASSERT_TRUE(decoded.is_ok());
    EXPECT_EQ(decoded.value().locator, "abcdefghij");
    EXPECT_EQ(decoded.value().confirmation, 0);
}

TEST(TicketTest, ConfirmationAcceptsPlusSignAndLeadingZeros) {
    auto plus = ticket::decode("abcdefghij:+5");
    ASSERT_TRUE(plus.is_ok());
    EXPECT_EQ(plus.value().locator, "abcdefghij");
    EXPECT_EQ(plus.value().confirmation, 5);

    auto zeros = ticket::decode("abcdefghij:0007");
    ASSERT_TRUE(zeros.is_ok());
    EXPECT_EQ(zeros.value().locator, "abcdefghij");
    EXPECT_EQ(zeros.value().confirmation, 7);

    auto padded_max = ticket::decode("abcdefghij:000255");
    ASSERT_TRUE(padded_max.is_ok());
    EXPECT_EQ(padded_max.value().confirmation, 255);
}

TEST(TicketTest, RejectsMalformedTickets) {
    for (const std::string& input : {std::string(), std::string("short"), std::string(201, 'a'),
                                     std::string("abc def ghij"), std::string("abcdefghij:256"),
                                     std::string("abcdefghij:0256"), std::string("abcdefghij:+"),
                                     std::string("abcdefghij:-1"), std::string("abcdefghij:++5"),
                                     std::string("short:12")}) {
        auto decoded = ticket::decode(input);
        ASSERT_TRUE(decoded.is_error()) << input;
        EXPECT_EQ(decoded.error().kind, ErrorKind::InvalidTicket);
    }
}

TEST(TicketTest, LocatorLengthBoundsAreInclusive) {
    EXPECT_TRUE(ticket::is_valid_locator(std::string(10, 'a')));
    EXPECT_TRUE(ticket::is_valid_locator(std::string(200, 'a')));
    EXPECT_FALSE(ticket::is_valid_locator(std::string(9, 'a')));
    EXPECT_FALSE(ticket::is_valid_locator(std::string(201, 'a')));
    EXPECT_TRUE(ticket::is_valid_locator("Ab0-_=+/xyz"));
}

TEST(TicketTest, ValidTicketMustNameAHashSequence) {
    drop::transport::PeerLocator locator;
    locator.host = "127.0.0.1";
    locator.port = 4919;
    locator.collection = drop::Hash{0x1234};

    locator.format = drop::transport::BlobFormat::HashSeq;
    EXPECT_TRUE(ticket::is_valid_ticket(ticket::encode(locator.encode(), 3)));

    locator.format = drop::transport::BlobFormat::Raw;
    EXPECT_FALSE(ticket::is_valid_ticket(ticket::encode(locator.encode(), 3)));

    EXPECT_FALSE(ticket::is_valid_ticket("abcdefghij:1"));
    EXPECT_FALSE(ticket::is_valid_ticket("x"));
}
