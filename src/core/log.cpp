#include "core/log.hpp"
#include <spdlog/sinks/stdout_color_sinks.h>
#include <mutex>

namespace capshare::log {

namespace {

std::mutex g_log_mutex;
std::shared_ptr<spdlog::sinks::stderr_color_sink_mt> g_sink;
spdlog::level::level_enum g_level = spdlog::level::info;

// Caller holds g_log_mutex.
void ensure_sink() {
    if (g_sink) return;
    g_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    g_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] %v");
}

} // namespace

void init(bool verbose) {
    std::lock_guard<std::mutex> lock(g_log_mutex);
    ensure_sink();
    g_level = verbose ? spdlog::level::debug : spdlog::level::info;
    spdlog::apply_all([](const std::shared_ptr<spdlog::logger>& logger) {
        logger->set_level(g_level);
    });
}

std::shared_ptr<spdlog::logger> get(const std::string& name) {
    std::lock_guard<std::mutex> lock(g_log_mutex);
    if (auto existing = spdlog::get(name)) {
        return existing;
    }

    ensure_sink();
    auto logger = std::make_shared<spdlog::logger>(name, g_sink);
    logger->set_level(g_level);
    logger->flush_on(spdlog::level::warn);
    spdlog::register_logger(logger);
    return logger;
}

} // namespace capshare::log
