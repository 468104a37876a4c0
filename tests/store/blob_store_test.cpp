#include "drop/store/blob_store.hpp"

#include "drop/collection/collection.hpp"
#include "drop/collection/metadata.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <filesystem>
#include <fstream>
#include <memory>
#include <sstream>
#include <string>
#include <vector>

namespace fs = std::filesystem;
using drop::Bytes;
using drop::ErrorKind;
using drop::Hash;
using drop::store::BlobStore;

namespace {

fs::path create_temp_dir() {
    const auto base = fs::temp_directory_path();
    static std::atomic<uint64_t> counter{0};
    const auto id = counter.fetch_add(1);
    fs::path dir = base / fs::path("drop_blob_store_test_" + std::to_string(id));
    fs::create_directories(dir);
    return dir;
}

fs::path write_file(const fs::path& path, const std::string& content) {
    std::ofstream out(path, std::ios::binary);
    out << content;
    return path;
}

std::string read_file(const fs::path& path) {
    std::ifstream input(path, std::ios::binary);
    std::ostringstream oss;
    oss << input.rdbuf();
    return oss.str();
}

Bytes to_bytes(const std::string& text) {
    return Bytes(text.begin(), text.end());
}

} // namespace

class BlobStoreTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir_ = create_temp_dir();
        store_ = std::make_unique<BlobStore>(dir_ / "store");
    }

    void TearDown() override {
        store_.reset();
        fs::remove_all(dir_);
    }

    Hash add_collection(const std::vector<std::pair<std::string, Hash>>& files) {
        std::vector<std::string> names;
        drop::collection::HashSequence sequence;
        for (const auto& [name, hash] : files) {
            names.push_back(name);
        }
        sequence.push_back(store_->insert_bytes(drop::collection::CollectionMetadata(names).to_bytes()));
        for (const auto& [name, hash] : files) {
            sequence.push_back(hash);
        }
        return store_->insert_bytes(drop::collection::encode_hash_sequence(sequence));
    }

    fs::path dir_;
    std::unique_ptr<BlobStore> store_;
};

TEST_F(BlobStoreTest, ImportHashesContentAndKeepsFileByReference) {
    const auto path = write_file(dir_ / "notes.txt", "some notes");

    auto hash = store_->import_file(path, 3);
    ASSERT_TRUE(hash.is_ok()) << hash.error().to_string();
    EXPECT_EQ(hash.value(), drop::hash_bytes(to_bytes("some notes")));

    auto entry = store_->entry(hash.value());
    ASSERT_TRUE(entry.has_value());
    EXPECT_FALSE(entry->is_inline());
    EXPECT_EQ(entry->size, 10u);

    auto bytes = store_->read_to_bytes(hash.value());
    ASSERT_TRUE(bytes.is_ok());
    EXPECT_EQ(bytes.value(), to_bytes("some notes"));
}

TEST_F(BlobStoreTest, ImportOfMissingFileIsAnImportError) {
    auto hash = store_->import_file(dir_ / "missing.txt", 1024);
    ASSERT_TRUE(hash.is_error());
    EXPECT_EQ(hash.error().kind, ErrorKind::ImportError);
}

TEST_F(BlobStoreTest, InsertBytesIsContentAddressed) {
    const auto first = store_->insert_bytes(to_bytes("abc"));
    const auto second = store_->insert_bytes(to_bytes("abc"));

    EXPECT_EQ(first, second);
    EXPECT_EQ(store_->blob_count(), 1u);
    EXPECT_TRUE(store_->contains(first));
    EXPECT_EQ(store_->size_of(first).value(), 3u);
    EXPECT_FALSE(store_->contains(Hash{12345}));
}

TEST_F(BlobStoreTest, ReadingAMissingBlobIsADownloadError) {
    auto bytes = store_->read_to_bytes(Hash{99});
    ASSERT_TRUE(bytes.is_error());
    EXPECT_EQ(bytes.error().kind, ErrorKind::DownloadError);
}

TEST_F(BlobStoreTest, GetCollectionListsNamesHashesAndSizes) {
    const auto a = store_->import_file(write_file(dir_ / "a.txt", "alpha"), 64).value();
    const auto b = store_->insert_bytes(to_bytes("bravo!"));
    const auto root = add_collection({{"a.txt", a}, {"b file.txt", b}});

    auto listing = store_->get_collection(root);
    ASSERT_TRUE(listing.is_ok()) << listing.error().to_string();
    ASSERT_EQ(listing.value().size(), 2u);
    EXPECT_EQ(listing.value()[0].name, "a.txt");
    EXPECT_EQ(listing.value()[0].hash, a);
    EXPECT_EQ(listing.value()[0].size, 5u);
    EXPECT_EQ(listing.value()[1].name, "b file.txt");
    EXPECT_EQ(listing.value()[1].size, 6u);
}

TEST_F(BlobStoreTest, GetCollectionRequiresEveryFileBlob) {
    const auto root = add_collection({{"ghost.bin", Hash{0xdead}}});

    auto listing = store_->get_collection(root);
    ASSERT_TRUE(listing.is_error());
    EXPECT_EQ(listing.error().kind, ErrorKind::DownloadError);
    EXPECT_NE(listing.error().message.find("ghost.bin"), std::string::npos);
}

TEST_F(BlobStoreTest, GetCollectionReportsMetadataMismatch) {
    const auto metadata = store_->insert_bytes(drop::collection::CollectionMetadata({"one", "two"}).to_bytes());
    const auto file = store_->insert_bytes(to_bytes("1"));
    const auto root = store_->insert_bytes(drop::collection::encode_hash_sequence({metadata, file}));

    auto listing = store_->get_collection(root);
    ASSERT_TRUE(listing.is_error());
    EXPECT_EQ(listing.error().kind, ErrorKind::MetadataMismatch);
}

TEST_F(BlobStoreTest, ExportWritesInlineAndFileBlobs) {
    const auto imported = store_->import_file(write_file(dir_ / "source.bin", "file backed"), 4).value();
    const auto inline_blob = store_->insert_bytes(to_bytes("in memory"));

    const auto out = dir_ / "out" / "nested";
    ASSERT_TRUE(store_->export_blob(imported, out / "one.bin").is_ok());
    ASSERT_TRUE(store_->export_blob(inline_blob, out / "two.bin").is_ok());

    EXPECT_EQ(read_file(out / "one.bin"), "file backed");
    EXPECT_EQ(read_file(out / "two.bin"), "in memory");

    write_file(out / "one.bin", "stale");
    ASSERT_TRUE(store_->export_blob(imported, out / "one.bin").is_ok());
    EXPECT_EQ(read_file(out / "one.bin"), "file backed");

    EXPECT_TRUE(store_->export_blob(Hash{7}, out / "missing.bin").is_error());
}

TEST_F(BlobStoreTest, PartialPathsAreUniqueUnderTheStoreRoot) {
    const Hash hash{0xabc};
    const auto first = store_->partial_path(hash);
    const auto second = store_->partial_path(hash);

    EXPECT_NE(first, second);
    EXPECT_EQ(first.parent_path(), store_->root() / "partial");
    EXPECT_EQ(store_->blob_path(hash), store_->root() / "blobs" / hash.to_hex());
}
