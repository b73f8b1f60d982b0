/**
 * @file log.cpp
 * @brief Shared logger and throttling helpers
 */

#include "cotlink/core/log.h"
#include <spdlog/sinks/stdout_color_sinks.h>
#include <algorithm>
#include <cctype>

namespace cotlink::log {

namespace {

std::mutex creation_mutex;

std::shared_ptr<spdlog::logger> create_logger() {
    std::lock_guard<std::mutex> lock(creation_mutex);

    // Respect a logger the host registered under our name
    if (auto existing = spdlog::get(LOGGER_NAME)) {
        return existing;
    }

    try {
        auto logger = spdlog::stderr_color_mt(LOGGER_NAME);
        logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] %v");
        return logger;
    } catch (const spdlog::spdlog_ex&) {
        // Host registered the name between the lookup and our registration
    }

    if (auto existing = spdlog::get(LOGGER_NAME)) {
        return existing;
    }
    return spdlog::default_logger();
}

} // anonymous namespace

std::shared_ptr<spdlog::logger> get() {
    if (auto logger = spdlog::get(LOGGER_NAME)) {
        return logger;
    }
    // First use, or the host dropped the registry
    return create_logger();
}

void set_level(spdlog::level::level_enum level) {
    get()->set_level(level);
}

spdlog::level::level_enum level_from_string(const std::string& name) {
    std::string lower(name);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "trace") return spdlog::level::trace;
    if (lower == "debug") return spdlog::level::debug;
    if (lower == "info") return spdlog::level::info;
    if (lower == "warn" || lower == "warning") return spdlog::level::warn;
    if (lower == "error") return spdlog::level::err;
    if (lower == "critical") return spdlog::level::critical;
    if (lower == "off") return spdlog::level::off;
    return spdlog::level::info;
}

// ============================================================================
// RateLimiter Implementation
// ============================================================================

bool RateLimiter::admit(UInt64& suppressed) {
    return admit(suppressed, Clock::now());
}

bool RateLimiter::admit(UInt64& suppressed, Clock::time_point now) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (!has_logged_ || now - last_logged_ >= interval_) {
        suppressed = suppressed_;
        suppressed_ = 0;
        last_logged_ = now;
        has_logged_ = true;
        return true;
    }

    ++suppressed_;
    suppressed = 0;
    return false;
}

} // namespace cotlink::log
