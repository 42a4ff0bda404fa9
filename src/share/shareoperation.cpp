#include "share/shareoperation.hpp"
#include "share/claimissuer.hpp"
#include "share/staticsetassembler.hpp"
#include "share/urlbuilder.hpp"
#include "core/log.hpp"
#include <stdexcept>
#include <utility>

namespace capshare::share {

ShareOperation::ShareOperation(SelectionSource& selection,
                               store::StorageClient& client,
                               crypto::ClaimSigner& signer,
                               config::ShareConfig config,
                               LocationProvider location,
                               Clock clock)
    : selection_(selection)
    , client_(client)
    , signer_(signer)
    , config_(std::move(config))
    , location_(std::move(location))
    , clock_(std::move(clock)) {
    if (!location_) {
        throw std::invalid_argument("share operation needs a location provider");
    }
    if (!clock_) {
        clock_ = [] { return std::chrono::system_clock::now(); };
    }
}

ShareResult ShareOperation::share() {
    auto logger = log::get("share");

    auto items = SelectionResolver().resolve(selection_.getSelection());

    ShareResult result;
    if (items.size() == 1) {
        result.target = items.front().ref;
        result.isDir = items.front().isDir;
    } else {
        result.target = assembleDirectory(items);
        result.isDir = true;
    }

    try {
        result.claim = ClaimIssuer(client_, signer_, config_.hashAlgorithm, clock_)
            .issue(result.target);
    } catch (const ShareError&) {
        if (items.size() > 1) {
            logger->warn("directory {} was uploaded but is not shared", result.target.str());
        }
        throw;
    }

    std::string shareRoot;
    try {
        shareRoot = client_.shareRoot();
    } catch (const std::exception& e) {
        logger->warn("claim {} was uploaded but no URL can be built", result.claim.str());
        throw IdentityError(std::string("could not get share root: ") + e.what());
    }

    result.url = UrlBuilder::shareUrl(shareRoot, result.claim, result.target, result.isDir);
    logger->info("shared {} ({}) as {}", result.target.str(),
                 result.isDir ? "directory" : "file", result.url);
    return result;
}

core::BlobRef ShareOperation::assembleDirectory(const std::vector<ResolvedItem>& items) {
    std::vector<core::BlobRef> members;
    members.reserve(items.size());
    for (const auto& item : items) {
        members.push_back(item.ref);
    }

    auto logger = log::get("share");
    logger->debug("assembling directory over {} selected items", members.size());

    StaticSetAssembler::Options options;
    options.maxMembers = config_.maxStaticSetMembers;
    options.parallelUploads = config_.parallelUploads;
    options.hashAlgorithm = config_.hashAlgorithm;
    StaticSetAssembler sets(client_, options);

    try {
        auto setRef = sets.assemble(members);
        return DirectoryAssembler(client_, config_.hashAlgorithm, clock_).assemble(setRef);
    } catch (const ShareError& e) {
        if (sets.uploadedCount() > 0) {
            logger->warn("{} static sets were uploaded before the failure and are left in place",
                         sets.uploadedCount());
        }
        rethrowWithContext(e, "failed creating new directory for selected items");
    }
}

std::future<void> ShareOperation::start(ShareCallbacks callbacks) {
    if (!callbacks.onShared || !callbacks.onFailure) {
        throw std::invalid_argument("share callbacks must both be set");
    }

    return std::async(std::launch::async, [this, callbacks = std::move(callbacks)] {
        run(callbacks);
    });
}

void ShareOperation::run(const ShareCallbacks& callbacks) {
    auto logger = log::get("share");

    ShareResult result;
    try {
        result = share();
    } catch (const ShareError& e) {
        logger->error("share failed ({}): {}", errorKindName(e.kind()), e.what());
        callbacks.onFailure(e.what(), e.kind());
        return;
    } catch (const std::exception& e) {
        logger->error("share failed unexpectedly: {}", e.what());
        callbacks.onFailure(e.what(), ErrorKind::Internal);
        return;
    }

    std::string url;
    try {
        url = UrlBuilder::absoluteUrl(result.url, location_(), config_.uiRoot);
    } catch (const PrefixResolutionError& e) {
        logger->warn("claim {} issued, but the full URL is unknown: {}",
                     result.claim.str(), e.what());
        callbacks.onFailure(std::string("Cannot display full share URL: ") + e.what(),
                            e.kind());
        return;
    } catch (const std::exception& e) {
        logger->warn("claim {} issued, but the location is unavailable: {}",
                     result.claim.str(), e.what());
        callbacks.onFailure(std::string("Cannot display full share URL: ") + e.what(),
                            ErrorKind::PrefixResolution);
        return;
    }

    callbacks.onShared(url, UrlBuilder::anchorText(url));
}

} // namespace capshare::share
