#include "drop/transport/wire.hpp"

#include <gtest/gtest.h>

using drop::ErrorKind;
using drop::Hash;
using drop::transport::BlobFormat;
using drop::transport::FrameHeader;
using drop::transport::FrameType;
using drop::transport::Request;

TEST(WireRequestTest, EncodesFourteenBytesStartingWithMagic) {
    Request request;
    request.collection = Hash{0x0102030405060708ULL};
    request.confirmation = 200;

    const auto bytes = request.encode();
    ASSERT_EQ(bytes.size(), Request::kSize);
    EXPECT_EQ(std::string(bytes.begin(), bytes.begin() + 4), "DRP1");
    EXPECT_EQ(bytes[4], static_cast<std::uint8_t>(BlobFormat::HashSeq));
    EXPECT_EQ(bytes[5], 0x01);
    EXPECT_EQ(bytes[13], 200);

    auto decoded = Request::decode(bytes.data(), bytes.size());
    ASSERT_TRUE(decoded.is_ok());
    EXPECT_EQ(decoded.value().collection, request.collection);
    EXPECT_EQ(decoded.value().confirmation, 200);
    EXPECT_EQ(decoded.value().format, BlobFormat::HashSeq);
}

TEST(WireRequestTest, RejectsBadMagicAndSize) {
    auto bytes = Request{}.encode();

    EXPECT_EQ(Request::decode(bytes.data(), bytes.size() - 1).error().kind, ErrorKind::DownloadError);

    bytes[0] = 'X';
    EXPECT_EQ(Request::decode(bytes.data(), bytes.size()).error().kind, ErrorKind::DownloadError);
}

TEST(WireFrameTest, HeaderFieldsSurviveEncoding) {
    FrameHeader header;
    header.type = FrameType::Chunk;
    header.hash = Hash{42};
    header.value = 65536;
    header.payload_length = 4096;

    const auto bytes = header.encode();
    ASSERT_EQ(bytes.size(), FrameHeader::kSize);

    auto decoded = FrameHeader::decode(bytes.data(), bytes.size());
    ASSERT_TRUE(decoded.is_ok());
    EXPECT_EQ(decoded.value().type, FrameType::Chunk);
    EXPECT_EQ(decoded.value().hash, Hash{42});
    EXPECT_EQ(decoded.value().value, 65536u);
    EXPECT_EQ(decoded.value().payload_length, 4096u);
}

TEST(WireFrameTest, RejectsUnknownTypeAndOversizedPayload) {
    FrameHeader header;
    auto bytes = header.encode();

    bytes[0] = 0;
    EXPECT_EQ(FrameHeader::decode(bytes.data(), bytes.size()).error().kind, ErrorKind::DownloadError);
    bytes[0] = 6;
    EXPECT_TRUE(FrameHeader::decode(bytes.data(), bytes.size()).is_error());

    header.payload_length = FrameHeader::kMaxPayload + 1;
    bytes = header.encode();
    EXPECT_TRUE(FrameHeader::decode(bytes.data(), bytes.size()).is_error());

    EXPECT_TRUE(FrameHeader::decode(bytes.data(), 5).is_error());
}

TEST(WireFrameTest, NamesEveryFrameType) {
    EXPECT_STREQ(drop::transport::frame_type_name(FrameType::BlobHeader), "BlobHeader");
    EXPECT_STREQ(drop::transport::frame_type_name(FrameType::Error), "Error");
}
