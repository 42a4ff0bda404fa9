#include "core/blobref.hpp"
#include <gtest/gtest.h>
#include <string>
#include <unordered_set>

using namespace capshare::core;

TEST(BlobRefTest, KnownDigests) {
    EXPECT_EQ(BlobRef::fromContent("", HashAlgorithm::SHA1).str(),
              "sha1-da39a3ee5e6b4b0d3255bfef95601890afd80709");
    EXPECT_EQ(BlobRef::fromContent("", HashAlgorithm::SHA224).str(),
              "sha224-d14a028c2a3a2bc9476102bb288234c415a2b01f828ea62ac5b3e42f");
    EXPECT_EQ(BlobRef::fromContent("abc", HashAlgorithm::SHA256).str(),
              "sha256-ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}

TEST(BlobRefTest, DefaultAlgorithmIsSha224) {
    auto ref = BlobRef::fromContent("hello");
    EXPECT_EQ(ref.algorithm(), HashAlgorithm::SHA224);
    EXPECT_EQ(ref.str().rfind("sha224-", 0), 0u);
    EXPECT_EQ(ref.digest().size(), 56u);
}

TEST(BlobRefTest, ParseAcceptsWellFormedRefs) {
    auto ref = BlobRef::parse("sha1-da39a3ee5e6b4b0d3255bfef95601890afd80709");
    ASSERT_TRUE(ref.has_value());
    EXPECT_TRUE(ref->valid());
    EXPECT_EQ(ref->algorithm(), HashAlgorithm::SHA1);
    EXPECT_EQ(ref->digest(), "da39a3ee5e6b4b0d3255bfef95601890afd80709");
}

TEST(BlobRefTest, ParseRejectsMalformedRefs) {
    EXPECT_FALSE(BlobRef::parse(""));
    EXPECT_FALSE(BlobRef::parse("sha1-"));
    EXPECT_FALSE(BlobRef::parse("sha1-aaa"));
    EXPECT_FALSE(BlobRef::parse("sha1-DA39A3EE5E6B4B0D3255BFEF95601890AFD80709"));
    EXPECT_FALSE(BlobRef::parse("md5-d41d8cd98f00b204e9800998ecf8427e"));
    EXPECT_FALSE(BlobRef::parse("da39a3ee5e6b4b0d3255bfef95601890afd80709"));
    EXPECT_FALSE(BlobRef::parse("sha1-da39a3ee5e6b4b0d3255bfef95601890afd8070g"));
    EXPECT_FALSE(BlobRef::parse("sha224-da39a3ee5e6b4b0d3255bfef95601890afd80709"));
}

TEST(BlobRefTest, DefaultConstructedIsInvalid) {
    BlobRef ref;
    EXPECT_FALSE(ref.valid());
    EXPECT_TRUE(ref.str().empty());
}

TEST(BlobRefTest, MatchesChecksContent) {
    std::string text = "payload";
    std::vector<uint8_t> data(text.begin(), text.end());
    auto ref = BlobRef::fromContent(data);
    EXPECT_TRUE(ref.matches(data));

    data.push_back('!');
    EXPECT_FALSE(ref.matches(data));
}

TEST(BlobRefTest, EqualityAndHashing) {
    auto a = BlobRef::fromContent("a");
    auto b = BlobRef::fromContent("b");
    EXPECT_EQ(a, *BlobRef::parse(a.str()));
    EXPECT_NE(a, b);

    std::unordered_set<BlobRef> refs{a, b, BlobRef::fromContent("a")};
    EXPECT_EQ(refs.size(), 2u);
}

TEST(BlobRefTest, AlgorithmNames) {
    EXPECT_EQ(BlobRef::algorithmName(HashAlgorithm::SHA256), "sha256");
    EXPECT_EQ(BlobRef::algorithmFromName("sha1"), HashAlgorithm::SHA1);
    EXPECT_FALSE(BlobRef::algorithmFromName("SHA1"));
    EXPECT_FALSE(BlobRef::algorithmFromName("blake2b"));
}
