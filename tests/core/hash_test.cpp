#include "drop/core/bytes.hpp"
#include "drop/core/hash.hpp"

#include <gtest/gtest.h>

#include <string>
#include <unordered_set>

using drop::Hash;
using drop::Hasher;

namespace {

drop::Bytes to_bytes(const std::string& text) {
    return drop::Bytes(text.begin(), text.end());
}

} // namespace

TEST(HashTest, MatchesFnv1aReferenceValues) {
    EXPECT_EQ(drop::hash_bytes({}).value, 0xcbf29ce484222325ULL);
    EXPECT_EQ(drop::hash_bytes(to_bytes("a")).value, 0xaf63dc4c8601ec8cULL);
    EXPECT_EQ(drop::hash_bytes(to_bytes("foobar")).value, 0x85944171f73967e8ULL);
}

TEST(HashTest, IncrementalUpdatesMatchOneShot) {
    const auto data = to_bytes("the quick brown fox jumps over the lazy dog");

    Hasher hasher;
    hasher.update(data.data(), 10);
    hasher.update(data.data() + 10, data.size() - 10);

    EXPECT_EQ(hasher.finish(), drop::hash_bytes(data));
}

TEST(HashTest, HexRoundTripIsLowercaseAndPadded) {
    const Hash hash{0x00ab};
    EXPECT_EQ(hash.to_hex(), "00000000000000ab");

    auto parsed = Hash::from_hex("00000000000000AB");
    ASSERT_TRUE(parsed.is_ok());
    EXPECT_EQ(parsed.value(), hash);
}

TEST(HashTest, FromHexRejectsMalformedInput) {
    EXPECT_TRUE(Hash::from_hex("abc").is_error());
    EXPECT_TRUE(Hash::from_hex("zz000000000000ab").is_error());
}

TEST(HashTest, UsableAsUnorderedKey) {
    std::unordered_set<Hash> hashes{Hash{1}, Hash{2}, Hash{1}};
    EXPECT_EQ(hashes.size(), 2u);
}
