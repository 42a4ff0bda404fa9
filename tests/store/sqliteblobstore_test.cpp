#include "store/sqliteblobstore.hpp"
#include "test_config.h"
#include <gtest/gtest.h>
#include <filesystem>
#include <future>
#include <memory>
#include <vector>

using namespace capshare;
using capshare::store::SqliteBlobStore;
using capshare::store::StoreError;

class SqliteBlobStoreTest : public ::testing::Test {
protected:
    void SetUp() override {
        testOutputPath = std::filesystem::path(TEST_OUTPUT_DIR) / "sqliteblobstore" /
            ::testing::UnitTest::GetInstance()->current_test_info()->name();
        std::filesystem::remove_all(testOutputPath);
        std::filesystem::create_directories(testOutputPath);
        dbPath = (testOutputPath / "blobs.db").string();
        store = std::make_unique<SqliteBlobStore>(dbPath, "/share/");
    }

    void TearDown() override {
        store.reset();
        std::filesystem::remove_all(testOutputPath);
    }

    std::filesystem::path testOutputPath;
    std::string dbPath;
    std::unique_ptr<SqliteBlobStore> store;
};

TEST_F(SqliteBlobStoreTest, UploadAndFetch) {
    auto blob = core::Blob::fromString("some file content");
    auto ref = store->upload(blob);
    EXPECT_EQ(ref, blob.ref());
    EXPECT_TRUE(store->contains(ref));

    auto fetched = store->fetch(ref);
    ASSERT_TRUE(fetched.has_value());
    EXPECT_EQ(fetched->str(), "some file content");
    EXPECT_TRUE(fetched->verify());
}

TEST_F(SqliteBlobStoreTest, LargeBinaryBlob) {
    std::vector<uint8_t> bytes(4 * 1024 * 1024 + 3);
    for (size_t i = 0; i < bytes.size(); ++i) {
        bytes[i] = static_cast<uint8_t>(i * 31);
    }
    core::Blob blob(bytes);
    ASSERT_EQ(store->upload(blob), blob.ref());

    auto fetched = store->fetch(blob.ref());
    ASSERT_TRUE(fetched.has_value());
    EXPECT_EQ(fetched->size(), bytes.size());
    EXPECT_EQ(fetched->data(), bytes);
    EXPECT_TRUE(fetched->verify());
}

TEST_F(SqliteBlobStoreTest, UploadIsIdempotent) {
    auto blob = core::Blob::fromString("dup");
    EXPECT_EQ(store->upload(blob), store->upload(blob));
    EXPECT_EQ(store->count(), 1u);
}

TEST_F(SqliteBlobStoreTest, EmptyBlob) {
    core::Blob empty(std::vector<uint8_t>{});
    auto ref = store->upload(empty);
    auto fetched = store->fetch(ref);
    ASSERT_TRUE(fetched.has_value());
    EXPECT_EQ(fetched->size(), 0u);
}

TEST_F(SqliteBlobStoreTest, RejectsMismatchedRef) {
    std::string text = "real";
    core::Blob forged(core::BlobRef::fromContent("fake"),
                      std::vector<uint8_t>(text.begin(), text.end()));
    EXPECT_THROW(store->upload(forged), StoreError);
    EXPECT_EQ(store->count(), 0u);
}

TEST_F(SqliteBlobStoreTest, FetchMissing) {
    EXPECT_FALSE(store->fetch(core::BlobRef::fromContent("never stored")).has_value());
    EXPECT_FALSE(store->contains(core::BlobRef::fromContent("never stored")));
}

TEST_F(SqliteBlobStoreTest, ServerIdentity) {
    EXPECT_THROW(store->serverIdentityRef(), StoreError);

    auto key = core::Blob::fromString("-----BEGIN PUBLIC KEY-----\n...\n");
    auto ref = store->setServerIdentity(key);
    EXPECT_EQ(ref, key.ref());
    EXPECT_EQ(store->serverIdentityRef(), key.ref());
    EXPECT_TRUE(store->contains(key.ref()));
}

TEST_F(SqliteBlobStoreTest, ShareRoot) {
    EXPECT_EQ(store->shareRoot(), "/share/");

    SqliteBlobStore noShare((testOutputPath / "other.db").string(), "");
    EXPECT_THROW(noShare.shareRoot(), StoreError);
}

TEST_F(SqliteBlobStoreTest, PersistsAcrossReopen) {
    auto blob = core::Blob::fromString("durable");
    store->upload(blob);
    store->setServerIdentity(core::Blob::fromString("identity"));
    store.reset();

    SqliteBlobStore reopened(dbPath, "/share/");
    EXPECT_TRUE(reopened.contains(blob.ref()));
    EXPECT_EQ(reopened.serverIdentityRef(), core::Blob::fromString("identity").ref());
}

TEST_F(SqliteBlobStoreTest, ConcurrentUploads) {
    std::vector<std::future<core::BlobRef>> pending;
    for (int i = 0; i < 16; ++i) {
        pending.push_back(std::async(std::launch::async, [this, i] {
            return store->upload(core::Blob::fromString("blob " + std::to_string(i % 8)));
        }));
    }
    for (auto& f : pending) {
        EXPECT_TRUE(f.get().valid());
    }
    EXPECT_EQ(store->count(), 8u);
}
