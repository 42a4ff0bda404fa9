#include "schema/schemablob.hpp"
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include <chrono>

using namespace capshare;
using capshare::schema::SchemaBlob;

namespace {

core::BlobRef refOf(const std::string& content) {
    return core::BlobRef::fromContent(content);
}

// 2024-01-02T03:04:05Z
std::chrono::system_clock::time_point fixedTime() {
    return std::chrono::system_clock::from_time_t(1704164645);
}

} // anonymous namespace

TEST(SchemaBlobTest, StaticSetLayout) {
    auto a = refOf("a");
    auto b = refOf("b");
    auto blob = SchemaBlob::staticSet({a, b});

    std::string expected =
        "{\n"
        "  \"camliVersion\": 1,\n"
        "  \"camliType\": \"static-set\",\n"
        "  \"members\": [\n"
        "    \"" + a.str() + "\",\n"
        "    \"" + b.str() + "\"\n"
        "  ]\n"
        "}\n";
    EXPECT_EQ(blob.str(), expected);
    EXPECT_TRUE(blob.verify());
}

TEST(SchemaBlobTest, MergedStaticSetUsesMergeSets) {
    auto blob = SchemaBlob::mergedStaticSet({refOf("s1"), refOf("s2")});
    auto schema = SchemaBlob::parse(blob);
    ASSERT_TRUE(schema.has_value());
    EXPECT_EQ(schema->type(), "static-set");
    EXPECT_FALSE(schema->json().contains("members"));

    auto subsets = schema->refsAt("mergeSets");
    ASSERT_EQ(subsets.size(), 2u);
    EXPECT_EQ(subsets[0], refOf("s1"));
    EXPECT_EQ(subsets[1], refOf("s2"));
}

TEST(SchemaBlobTest, DirectoryLayout) {
    auto entries = refOf("set");
    auto blob = SchemaBlob::directory("shared-20240102030405", entries);

    std::string expected =
        "{\n"
        "  \"camliVersion\": 1,\n"
        "  \"camliType\": \"directory\",\n"
        "  \"entries\": \"" + entries.str() + "\",\n"
        "  \"fileName\": \"shared-20240102030405\"\n"
        "}\n";
    EXPECT_EQ(blob.str(), expected);
}

TEST(SchemaBlobTest, ShareClaimFields) {
    schema::ShareClaimFields fields;
    fields.signer = refOf("signer key");
    fields.target = refOf("target");
    fields.claimDate = fixedTime();

    auto body = nlohmann::json::parse(SchemaBlob::shareClaim(fields));
    EXPECT_EQ(body["camliVersion"], 1);
    EXPECT_EQ(body["camliType"], "claim");
    EXPECT_EQ(body["claimType"], "share");
    EXPECT_EQ(body["authType"], "haveref");
    EXPECT_EQ(body["transitive"], true);
    EXPECT_EQ(body["target"], fields.target.str());
    EXPECT_EQ(body["camliSigner"], fields.signer.str());
    EXPECT_EQ(body["claimDate"], "2024-01-02T03:04:05Z");
}

TEST(SchemaBlobTest, ShareClaimStartsWithVersion) {
    schema::ShareClaimFields fields;
    fields.signer = refOf("signer key");
    fields.target = refOf("target");
    fields.claimDate = fixedTime();

    auto text = SchemaBlob::shareClaim(fields);
    EXPECT_EQ(text.rfind("{\n  \"camliVersion\": 1,\n", 0), 0u);
    EXPECT_EQ(text.back(), '\n');
}

TEST(SchemaBlobTest, ShareClaimRequiresSignerAndTarget) {
    schema::ShareClaimFields fields;
    fields.target = refOf("target");
    EXPECT_THROW(SchemaBlob::shareClaim(fields), std::invalid_argument);

    fields.signer = refOf("signer");
    fields.target = core::BlobRef();
    EXPECT_THROW(SchemaBlob::shareClaim(fields), std::invalid_argument);
}

TEST(SchemaBlobTest, FormatClaimDate) {
    EXPECT_EQ(SchemaBlob::formatClaimDate(std::chrono::system_clock::from_time_t(0)),
              "1970-01-01T00:00:00Z");
    EXPECT_EQ(SchemaBlob::formatClaimDate(fixedTime()), "2024-01-02T03:04:05Z");
}

TEST(SchemaBlobTest, ParseRejectsNonSchemaBlobs) {
    EXPECT_FALSE(SchemaBlob::parse(core::Blob::fromString("not json")));
    EXPECT_FALSE(SchemaBlob::parse(core::Blob::fromString("[1, 2]")));
    EXPECT_FALSE(SchemaBlob::parse(core::Blob::fromString("{\"camliType\": \"file\"}")));
    EXPECT_FALSE(SchemaBlob::parse(
        core::Blob::fromString("{\"camliVersion\": 1, \"camliType\": 7}")));
}

TEST(SchemaBlobTest, RefsAtRejectsBadEntries) {
    auto blob = core::Blob::fromString(
        "{\"camliVersion\": 1, \"camliType\": \"static-set\", \"members\": [\"sha1-aaa\"]}");
    auto schema = SchemaBlob::parse(blob);
    ASSERT_TRUE(schema.has_value());
    EXPECT_THROW(schema->refsAt("members"), std::runtime_error);
    EXPECT_TRUE(schema->refsAt("mergeSets").empty());
}
