#include "drop/ticket/ticket.hpp"
#include "drop/transport/locator.hpp"

#include <gtest/gtest.h>

using drop::ErrorKind;
using drop::transport::BlobFormat;
using drop::transport::PeerLocator;

TEST(PeerLocatorTest, DecodesWhatItEncodes) {
    PeerLocator locator;
    locator.host = "192.168.1.20";
    locator.port = 50123;
    locator.collection = drop::Hash{0xfeedfacecafebeefULL};
    locator.format = BlobFormat::HashSeq;

    const auto text = locator.encode();
    EXPECT_TRUE(drop::ticket::is_valid_locator(text));
    EXPECT_EQ(text.find(':'), std::string::npos);

    auto decoded = PeerLocator::decode(text);
    ASSERT_TRUE(decoded.is_ok()) << decoded.error().to_string();
    EXPECT_EQ(decoded.value().host, locator.host);
    EXPECT_EQ(decoded.value().port, locator.port);
    EXPECT_EQ(decoded.value().collection, locator.collection);
    EXPECT_EQ(decoded.value().format, BlobFormat::HashSeq);
}

TEST(PeerLocatorTest, UnknownFormatDecodesAsRaw) {
    PeerLocator locator;
    locator.host = "h";
    locator.port = 1;
    auto text = locator.encode();
    text[2] = '0';
    text[3] = '7';  // format byte

    auto decoded = PeerLocator::decode(text);
    ASSERT_TRUE(decoded.is_ok());
    EXPECT_EQ(decoded.value().format, BlobFormat::Raw);
}

TEST(PeerLocatorTest, RejectsBrokenLocators) {
    PeerLocator locator;
    locator.host = "localhost";
    const auto text = locator.encode();

    EXPECT_EQ(PeerLocator::decode("abc").error().kind, ErrorKind::InvalidTicket);
    EXPECT_EQ(PeerLocator::decode("zz" + text.substr(2)).error().kind, ErrorKind::InvalidTicket);
    EXPECT_EQ(PeerLocator::decode("02" + text.substr(2)).error().kind, ErrorKind::InvalidTicket);
    EXPECT_EQ(PeerLocator::decode(text.substr(0, text.size() - 4)).error().kind, ErrorKind::InvalidTicket);
    EXPECT_EQ(PeerLocator::decode(text + "00").error().kind, ErrorKind::InvalidTicket);
}
