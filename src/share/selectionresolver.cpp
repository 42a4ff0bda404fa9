#include "share/selectionresolver.hpp"
#include "share/shareerror.hpp"

namespace capshare::share {

std::vector<ResolvedItem> SelectionResolver::resolve(
    const std::vector<SelectedItem>& selection) const {

    if (selection.empty()) {
        throw ValidationError("nothing selected to share");
    }

    std::vector<ResolvedItem> items;
    items.reserve(selection.size());
    for (const auto& item : selection) {
        items.push_back(resolveItem(item));
    }
    return items;
}

ResolvedItem SelectionResolver::resolveItem(const SelectedItem& item) const {
    auto refIt = item.find(KEY_BLOB_REF);
    if (refIt == item.end()) {
        throw ValidationError("cannot share item, it's missing a blobRef");
    }

    auto ref = core::BlobRef::parse(refIt->second);
    if (!ref) {
        throw ValidationError("cannot share \"" + refIt->second + "\", not a valid blobRef");
    }

    auto dirIt = item.find(KEY_IS_DIR);
    if (dirIt == item.end()) {
        throw ValidationError("cannot share \"" + refIt->second + "\", it's missing isDir");
    }

    auto isDir = parseBool(dirIt->second);
    if (!isDir) {
        throw ValidationError("invalid boolean value \"" + dirIt->second + "\" for isDir");
    }

    return ResolvedItem{*ref, *isDir};
}

std::optional<bool> SelectionResolver::parseBool(std::string_view value) {
    if (value == "1" || value == "t" || value == "T" ||
        value == "TRUE" || value == "true" || value == "True") {
        return true;
    }
    if (value == "0" || value == "f" || value == "F" ||
        value == "FALSE" || value == "false" || value == "False") {
        return false;
    }
    return std::nullopt;
}

} // namespace capshare::share
