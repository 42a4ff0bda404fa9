#include "share/claimissuer.hpp"
#include "share/shareerror.hpp"
#include "schema/schemablob.hpp"
#include "fakes.hpp"
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

using namespace capshare;
using namespace capshare::share;
using capshare::fakes::FakeClaimSigner;
using capshare::fakes::FakeStorageClient;
using capshare::fakes::refOf;

class ClaimIssuerTest : public ::testing::Test {
protected:
    static std::chrono::system_clock::time_point fixedTime() {
        return std::chrono::system_clock::from_time_t(1704164645);
    }

    template<typename Error>
    void expectFailure(const std::string& message) {
        ClaimIssuer issuer(client_, signer_, core::HashAlgorithm::SHA224, fixedTime);
        try {
            issuer.issue(refOf("target"));
            FAIL() << "expected failure";
        } catch (const Error& e) {
            EXPECT_EQ(std::string(e.what()), message);
        }
    }

    FakeStorageClient client_;
    FakeClaimSigner signer_;
};

TEST_F(ClaimIssuerTest, IssuesSignedHaverefClaim) {
    ClaimIssuer issuer(client_, signer_, core::HashAlgorithm::SHA224, fixedTime);
    auto target = refOf("target");
    auto claim = issuer.issue(target);

    ASSERT_EQ(client_.uploads().size(), 1u);
    EXPECT_EQ(client_.uploads().front(), claim);
    EXPECT_EQ(signer_.calls, 1);

    auto unsignedBody = nlohmann::json::parse(signer_.lastInput);
    EXPECT_EQ(unsignedBody["camliSigner"], client_.identity->str());
    EXPECT_EQ(unsignedBody["target"], target.str());
    EXPECT_EQ(unsignedBody["claimType"], "share");
    EXPECT_EQ(unsignedBody["authType"], "haveref");
    EXPECT_EQ(unsignedBody["transitive"], true);
    EXPECT_EQ(unsignedBody["claimDate"], "2024-01-02T03:04:05Z");
    EXPECT_FALSE(unsignedBody.contains("camliSig"));

    auto stored = client_.fetch(claim);
    ASSERT_TRUE(stored.has_value());
    auto signedBody = nlohmann::json::parse(stored->str());
    EXPECT_EQ(signedBody["camliSig"], "c2lnbmVk");
}

TEST_F(ClaimIssuerTest, IdentityFailure) {
    client_.identity.reset();
    expectFailure<IdentityError>(
        "could not get signer: discovery document has no signing section");
    EXPECT_EQ(signer_.calls, 0);
    EXPECT_TRUE(client_.uploads().empty());
}

TEST_F(ClaimIssuerTest, SigningFailure) {
    signer_.fail = true;
    expectFailure<SigningError>(
        "could not get signed share claim: signing service unavailable");
    EXPECT_TRUE(client_.uploads().empty());
}

TEST_F(ClaimIssuerTest, UploadFailure) {
    client_.failUpload = [](const core::Blob&) { return true; };
    expectFailure<UploadError>("could not upload share claim: connection reset by peer");
    EXPECT_EQ(signer_.calls, 1);
}

TEST_F(ClaimIssuerTest, InvalidTargetIsSigningError) {
    ClaimIssuer issuer(client_, signer_);
    EXPECT_THROW(issuer.issue(core::BlobRef()), SigningError);
}

TEST_F(ClaimIssuerTest, WorksWithEd25519Signer) {
    crypto::Ed25519ClaimSigner ed25519;
    client_.identity = ed25519.identityRef();

    ClaimIssuer issuer(client_, ed25519);
    auto claim = issuer.issue(refOf("target"));

    auto stored = client_.fetch(claim);
    ASSERT_TRUE(stored.has_value());
    EXPECT_TRUE(ed25519.verify(stored->str()));

    auto schema = schema::SchemaBlob::parse(*stored);
    ASSERT_TRUE(schema.has_value());
    EXPECT_EQ(schema->type(), "claim");
}
