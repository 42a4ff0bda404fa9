#pragma once

#include "core/core_export.hpp"
#include "core/blobref.hpp"
#include "config/shareconfig.hpp"
#include "crypto/claimsigner.hpp"
#include "share/directoryassembler.hpp"
#include "share/selectionresolver.hpp"
#include "share/shareerror.hpp"
#include "store/storageclient.hpp"
#include <functional>
#include <future>
#include <string>
#include <utility>
#include <vector>

namespace capshare::share {

/**
 * @brief Supplies the items currently selected by the user
 */
class CAPSHARE_CORE_EXPORT SelectionSource {
public:
    virtual ~SelectionSource() = default;
    virtual std::vector<SelectedItem> getSelection() = 0;
};

/**
 * @brief SelectionSource backed by a callback
 */
class CAPSHARE_CORE_EXPORT CallbackSelectionSource : public SelectionSource {
public:
    using Callback = std::function<std::vector<SelectedItem>()>;

    explicit CallbackSelectionSource(Callback callback) : callback_(std::move(callback)) {}

    std::vector<SelectedItem> getSelection() override { return callback_(); }

private:
    Callback callback_;
};

/**
 * @brief Outcome channel of an asynchronous share
 */
struct ShareCallbacks {
    std::function<void(const std::string& url, const std::string& anchorText)> onShared;
    std::function<void(const std::string& message, ErrorKind kind)> onFailure;
};

/**
 * @brief What a completed share produced
 */
struct ShareResult {
    core::BlobRef target;   // Shared item, or the directory made for a multi-item selection
    bool isDir = false;
    core::BlobRef claim;
    std::string url;        // Relative share URL, starting with the share root
};

/**
 * @brief One share of the current selection
 *
 * Resolves the selection, wraps multiple items in a fresh directory,
 * issues a signed share claim on the target and builds the share URL.
 * Blobs uploaded before a failure are left in place.
 */
class CAPSHARE_CORE_EXPORT ShareOperation {
public:
    using LocationProvider = std::function<std::string()>;

    /**
     * @param selection Source of the items to share
     * @param client Storage backend for all uploads
     * @param signer Signing service for the share claim
     * @param config Member limit, upload mode, digest and UI root
     * @param location Current location, used to make the URL absolute
     * @param clock Time source for names and claim dates; system clock when empty
     */
    ShareOperation(SelectionSource& selection,
                   store::StorageClient& client,
                   crypto::ClaimSigner& signer,
                   config::ShareConfig config,
                   LocationProvider location,
                   Clock clock = {});

    // Prevent copying
    ShareOperation(const ShareOperation&) = delete;
    ShareOperation& operator=(const ShareOperation&) = delete;

    /**
     * @brief Run the share on the calling thread
     * @return Target, claim and relative URL
     * @throws ShareError of the failing step's kind
     */
    ShareResult share();

    /**
     * @brief Run the share on a worker thread
     *
     * Exactly one callback is invoked per run. A share whose URL prefix
     * cannot be resolved is reported through onFailure with kind
     * PrefixResolution, as is a location provider that throws. Any other
     * unexpected exception is reported with kind Internal. The operation
     * must outlive the returned future.
     *
     * @return Future that becomes ready once a callback has returned
     * @throws std::invalid_argument if a callback is missing
     */
    std::future<void> start(ShareCallbacks callbacks);

    /**
     * @brief Run the share on the calling thread and report through callbacks
     */
    void run(const ShareCallbacks& callbacks);

private:
    core::BlobRef assembleDirectory(const std::vector<ResolvedItem>& items);

    SelectionSource& selection_;
    store::StorageClient& client_;
    crypto::ClaimSigner& signer_;
    config::ShareConfig config_;
    LocationProvider location_;
    Clock clock_;
};

} // namespace capshare::share
