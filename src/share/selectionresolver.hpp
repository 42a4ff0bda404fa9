#pragma once

#include "core/core_export.hpp"
#include "core/blobref.hpp"
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace capshare::share {

/**
 * @brief One selected item as handed over by the selection source
 *
 * Expected keys are "blobRef" (e.g. "sha224-...") and "isDir" (a boolean
 * string such as "true" or "false"). Neither is trusted.
 */
using SelectedItem = std::map<std::string, std::string>;

struct ResolvedItem {
    core::BlobRef ref;
    bool isDir = false;
};

/**
 * @brief Validates a raw selection into typed references
 */
class CAPSHARE_CORE_EXPORT SelectionResolver {
public:
    static constexpr const char* KEY_BLOB_REF = "blobRef";
    static constexpr const char* KEY_IS_DIR = "isDir";

    /**
     * @brief Validate every item, preserving order
     * @param selection Raw selection
     * @return Validated (ref, isDir) pairs
     * @throws ValidationError on an empty selection or any malformed item
     */
    std::vector<ResolvedItem> resolve(const std::vector<SelectedItem>& selection) const;

    /**
     * @brief Parse a boolean string
     *
     * Accepts 1, t, T, TRUE, true, True, 0, f, F, FALSE, false, False.
     */
    static std::optional<bool> parseBool(std::string_view value);

private:
    ResolvedItem resolveItem(const SelectedItem& item) const;
};

} // namespace capshare::share
