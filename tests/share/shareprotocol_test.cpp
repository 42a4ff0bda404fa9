#include "capshare/share/shareprotocol.hpp"
#include "config/shareconfig.hpp"
#include "test_config.h"
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include <filesystem>
#include <fstream>

using capshare::share::ShareProtocol;

class ShareProtocolTest : public ::testing::Test {
protected:
    void SetUp() override {
        testOutputPath = std::filesystem::path(TEST_OUTPUT_DIR) / "shareprotocol" /
            ::testing::UnitTest::GetInstance()->current_test_info()->name();
        std::filesystem::remove_all(testOutputPath);
        std::filesystem::create_directories(testOutputPath);
    }

    void TearDown() override {
        std::filesystem::remove_all(testOutputPath);
    }

    std::string writeConfig(const std::string& shareRoot) {
        nlohmann::json doc = {
            {"shareRoot", shareRoot},
            {"uiRoot", "/ui/"},
            {"authToken", "secret"},
            {"maxStaticSetMembers", 2},
            {"databasePath", (testOutputPath / "blobs.db").string()},
            {"signingKeyPath", (testOutputPath / "key.pem").string()}
        };
        auto path = (testOutputPath / "capshare.json").string();
        std::ofstream(path) << doc.dump(2);
        return path;
    }

    std::string writeFile(const std::string& name, const std::string& content) {
        auto path = (testOutputPath / name).string();
        std::ofstream(path, std::ios::binary) << content;
        return path;
    }

    struct Outcome {
        std::string url;
        std::string anchorText;
        std::string error;
    };

    Outcome share(ShareProtocol& protocol, ShareProtocol::Selection selection) {
        Outcome outcome;
        protocol.share(std::move(selection), "http://localhost:3179/ui/",
            [&outcome](const std::string& url, const std::string& anchorText) {
                outcome.url = url;
                outcome.anchorText = anchorText;
            },
            [&outcome](const std::string& message) {
                outcome.error = message;
            }).get();
        return outcome;
    }

    std::filesystem::path testOutputPath;
};

TEST_F(ShareProtocolTest, PutAndDescribeFile) {
    ShareProtocol protocol(writeConfig("/share/"));
    auto ref = protocol.putFile(writeFile("a.txt", "alpha"));

    auto desc = protocol.describe(ref);
    ASSERT_TRUE(desc.has_value());
    EXPECT_EQ(desc->ref, ref);
    EXPECT_EQ(desc->size, 5u);
    EXPECT_EQ(desc->content, "alpha");
    EXPECT_TRUE(desc->camliType.empty());
    EXPECT_FALSE(desc->signatureValid.has_value());
}

TEST_F(ShareProtocolTest, ShareSingleFile) {
    ShareProtocol protocol(writeConfig("/share/"));
    auto ref = protocol.putFile(writeFile("a.txt", "alpha"));

    auto outcome = share(protocol, {{{"blobRef", ref}, {"isDir", "false"}}});
    ASSERT_TRUE(outcome.error.empty()) << outcome.error;
    EXPECT_EQ(outcome.url.rfind("http://localhost:3179/share/" + ref + "?via=", 0), 0u);
    EXPECT_NE(outcome.url.find("&assemble=1"), std::string::npos);
}

TEST_F(ShareProtocolTest, ShareSelectionCreatesSignedDirectoryClaim) {
    ShareProtocol protocol(writeConfig("/share/"));
    std::vector<std::string> refs;
    ShareProtocol::Selection selection;
    for (int i = 0; i < 5; ++i) {
        refs.push_back(protocol.putBytes({static_cast<uint8_t>('a' + i)}));
        selection.push_back({{"blobRef", refs.back()}, {"isDir", "false"}});
    }

    auto outcome = share(protocol, selection);
    ASSERT_TRUE(outcome.error.empty()) << outcome.error;

    std::string prefix = "http://localhost:3179/share/";
    ASSERT_EQ(outcome.url.rfind(prefix, 0), 0u);
    auto claimRef = outcome.url.substr(prefix.size());

    auto claim = protocol.describe(claimRef);
    ASSERT_TRUE(claim.has_value());
    EXPECT_EQ(claim->camliType, "claim");
    ASSERT_TRUE(claim->signatureValid.has_value());
    EXPECT_TRUE(*claim->signatureValid);

    auto target = nlohmann::json::parse(claim->content)["target"].get<std::string>();
    auto dir = protocol.describe(target);
    ASSERT_TRUE(dir.has_value());
    EXPECT_EQ(dir->camliType, "directory");
    EXPECT_EQ(dir->members, refs);
}

TEST_F(ShareProtocolTest, ShareFailureReachesHandler) {
    ShareProtocol protocol(writeConfig("/share/"));
    auto outcome = share(protocol, {{{"blobRef", "sha1-aaa"}, {"isDir", "false"}}});
    EXPECT_TRUE(outcome.url.empty());
    EXPECT_EQ(outcome.error, "cannot share \"sha1-aaa\", not a valid blobRef");
}

TEST_F(ShareProtocolTest, SharingDisabledWithoutShareRoot) {
    ShareProtocol protocol(writeConfig(""));
    EXPECT_FALSE(protocol.sharingEnabled());
    EXPECT_THROW(share(protocol, {}), std::runtime_error);
}

TEST_F(ShareProtocolTest, IdentitySurvivesRestart) {
    std::string claimRef;
    auto config = writeConfig("/share/");
    {
        ShareProtocol protocol(config);
        auto ref = protocol.putBytes({'x'});
        auto outcome = share(protocol, {{{"blobRef", ref}, {"isDir", "true"}}});
        ASSERT_TRUE(outcome.error.empty()) << outcome.error;
        claimRef = outcome.url.substr(std::string("http://localhost:3179/share/").size());
    }

    ShareProtocol reopened(config);
    auto claim = reopened.describe(claimRef);
    ASSERT_TRUE(claim.has_value());
    ASSERT_TRUE(claim->signatureValid.has_value());
    EXPECT_TRUE(*claim->signatureValid);
}

TEST_F(ShareProtocolTest, DescribeUnknown) {
    ShareProtocol protocol(writeConfig("/share/"));
    EXPECT_FALSE(protocol.describe("not a ref").has_value());
    EXPECT_FALSE(protocol.describe(
        "sha224-d14a028c2a3a2bc9476102bb288234c415a2b01f828ea62ac5b3e42f").has_value());
}

TEST_F(ShareProtocolTest, BadConfig) {
    EXPECT_THROW(ShareProtocol((testOutputPath / "missing.json").string()),
                 capshare::config::ConfigError);
}
