#include "share/urlbuilder.hpp"
#include "share/shareerror.hpp"

namespace capshare::share {

std::string UrlBuilder::shareUrl(const std::string& shareRoot,
                                 const core::BlobRef& claim,
                                 const core::BlobRef& target,
                                 bool isDir) {
    if (isDir) {
        return shareRoot + claim.str();
    }
    return shareRoot + target.str() + "?via=" + claim.str() + "&assemble=1";
}

std::string UrlBuilder::urlPrefix(const std::string& location, const std::string& uiRoot) {
    if (uiRoot.empty()) {
        throw PrefixResolutionError("could not guess our URL prefix: no UI root configured");
    }

    if (location.size() >= uiRoot.size() &&
        location.compare(location.size() - uiRoot.size(), uiRoot.size(), uiRoot) == 0) {
        return location.substr(0, location.size() - uiRoot.size());
    }

    auto pos = location.find(uiRoot);
    if (pos == std::string::npos) {
        throw PrefixResolutionError("could not guess our URL prefix");
    }
    return location.substr(0, pos);
}

std::string UrlBuilder::absoluteUrl(const std::string& relative,
                                    const std::string& location,
                                    const std::string& uiRoot) {
    return urlPrefix(location, uiRoot) + relative;
}

std::string UrlBuilder::anchorText(const std::string& url) {
    if (url.size() <= 2 * ANCHOR_EDGE + 3) {
        return url;
    }
    return url.substr(0, ANCHOR_EDGE) + "..." + url.substr(url.size() - ANCHOR_EDGE);
}

} // namespace capshare::share
