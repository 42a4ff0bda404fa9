#pragma once

#include "core/core_export.hpp"
#include <spdlog/spdlog.h>
#include <memory>
#include <string>

namespace capshare::log {

/**
 * @brief Configure the shared log sink
 * @param verbose Enable debug level output
 *
 * Safe to call more than once; the last call sets the level.
 */
CAPSHARE_CORE_EXPORT void init(bool verbose = false);

/**
 * @brief Get (or create) the named component logger
 * @param name Component name, e.g. "share" or "store"
 */
CAPSHARE_CORE_EXPORT std::shared_ptr<spdlog::logger> get(const std::string& name);

} // namespace capshare::log
