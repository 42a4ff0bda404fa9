#include "capshare/share/shareprotocol.hpp"
#include "config/shareconfig.hpp"
#include "crypto/claimsigner.hpp"
#include "schema/schemablob.hpp"
#include "share/shareoperation.hpp"
#include "store/sqliteblobstore.hpp"
#include "core/log.hpp"
#include <nlohmann/json.hpp>
#include <fstream>
#include <iterator>
#include <stdexcept>

namespace capshare::share {

class ShareProtocol::Impl {
public:
    explicit Impl(const std::string& configPath)
        : config_(config::ShareConfig::load(configPath))
        , store_(config_.databasePath, config_.shareRoot)
        , signer_(crypto::Ed25519ClaimSigner::loadOrCreate(config_.signingKeyPath,
                                                           config_.hashAlgorithm)) {
        auto identity = store_.setServerIdentity(signer_->publicKeyBlob());
        log::get("share")->debug("server identity is {}", identity.str());
    }

    bool sharingEnabled() const { return config_.sharingEnabled(); }

    std::string putBytes(const std::vector<uint8_t>& data) {
        return store_.upload(core::Blob(data, config_.hashAlgorithm)).str();
    }

    std::future<void> share(Selection selection,
                            std::string location,
                            SharedHandler onShared,
                            FailureHandler onFailure) {
        if (!config_.sharingEnabled()) {
            throw std::runtime_error("sharing is disabled: no shareRoot configured");
        }
        if (!onShared || !onFailure) {
            throw std::invalid_argument("share handlers must both be set");
        }

        return std::async(std::launch::async,
            [this, selection = std::move(selection), location = std::move(location),
             onShared = std::move(onShared), onFailure = std::move(onFailure)] {
                CallbackSelectionSource source([&selection] { return selection; });
                ShareOperation operation(source, store_, *signer_, config_,
                                         [&location] { return location; });

                ShareCallbacks callbacks;
                callbacks.onShared = onShared;
                callbacks.onFailure = [&onFailure](const std::string& message, ErrorKind) {
                    onFailure(message);
                };
                operation.run(callbacks);
            });
    }

    std::optional<BlobDescription> describe(const std::string& text) const {
        auto ref = core::BlobRef::parse(text);
        if (!ref) {
            return std::nullopt;
        }
        auto blob = store_.fetch(*ref);
        if (!blob) {
            return std::nullopt;
        }

        BlobDescription desc;
        desc.ref = ref->str();
        desc.size = blob->size();
        desc.content = blob->str();

        auto schema = schema::SchemaBlob::parse(*blob);
        if (!schema) {
            return desc;
        }
        desc.camliType = schema->type();

        schema::StaticSetReader reader([this](const core::BlobRef& r) {
            return store_.fetch(r);
        });

        if (desc.camliType == schema::SchemaBlob::TYPE_STATIC_SET) {
            desc.members = toStrings(reader.flatten(*ref));
        } else if (desc.camliType == schema::SchemaBlob::TYPE_DIRECTORY) {
            auto entries = schema->json().value("entries", nlohmann::json());
            auto entriesRef = entries.is_string()
                ? core::BlobRef::parse(entries.get<std::string>())
                : std::nullopt;
            if (entriesRef) {
                desc.members = toStrings(reader.flatten(*entriesRef));
            }
        } else if (desc.camliType == schema::SchemaBlob::TYPE_CLAIM) {
            auto signer = schema->json().value("camliSigner", nlohmann::json());
            if (signer.is_string() && signer.get<std::string>() == signer_->identityRef().str()) {
                desc.signatureValid = signer_->verify(desc.content);
            }
        }
        return desc;
    }

private:
    static std::vector<std::string> toStrings(const std::vector<core::BlobRef>& refs) {
        std::vector<std::string> out;
        out.reserve(refs.size());
        for (const auto& r : refs) {
            out.push_back(r.str());
        }
        return out;
    }

    config::ShareConfig config_;
    store::SqliteBlobStore store_;
    std::unique_ptr<crypto::Ed25519ClaimSigner> signer_;
};

ShareProtocol::ShareProtocol(const std::string& configPath)
    : impl_(std::make_unique<Impl>(configPath)) {}

ShareProtocol::~ShareProtocol() = default;

bool ShareProtocol::sharingEnabled() const {
    return impl_->sharingEnabled();
}

std::string ShareProtocol::putFile(const fs::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        throw std::runtime_error("cannot open " + path.string());
    }
    std::vector<uint8_t> data((std::istreambuf_iterator<char>(in)),
                              std::istreambuf_iterator<char>());
    if (in.bad()) {
        throw std::runtime_error("failed reading " + path.string());
    }
    return impl_->putBytes(data);
}

std::string ShareProtocol::putBytes(const std::vector<uint8_t>& data) {
    return impl_->putBytes(data);
}

std::future<void> ShareProtocol::share(Selection selection,
                                       std::string location,
                                       SharedHandler onShared,
                                       FailureHandler onFailure) {
    return impl_->share(std::move(selection), std::move(location),
                        std::move(onShared), std::move(onFailure));
}

std::optional<BlobDescription> ShareProtocol::describe(const std::string& ref) const {
    return impl_->describe(ref);
}

} // namespace capshare::share
