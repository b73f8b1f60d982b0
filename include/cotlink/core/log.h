#pragma once
/**
 * @file log.h
 * @brief Logging facade for CotLink
 *
 * All library components log through one named spdlog logger ("cotlink").
 * The host application may install its own sinks by registering a logger
 * under that name before first use, or adjust verbosity with set_level().
 *
 * Two helpers cover the noisy paths:
 * - RateLimiter: at most one line per interval, counting suppressed events
 *   (queue overflow, repeated transport failures)
 * - OnceFlag: a condition that is reported a single time (missing
 *   georeference, no viewpoint, output not configured)
 */

#include "cotlink/core/types.h"
#include <spdlog/spdlog.h>
#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>

namespace cotlink::log {

/// Name of the shared library logger
constexpr const char* LOGGER_NAME = "cotlink";

/**
 * @brief Get the shared library logger, creating a colored stderr logger on first use
 */
std::shared_ptr<spdlog::logger> get();

/**
 * @brief Set the library log level
 */
void set_level(spdlog::level::level_enum level);

/**
 * @brief Parse a level name ("trace", "debug", "info", "warn", "error", "off")
 * @return Parsed level, or info for unknown names
 */
spdlog::level::level_enum level_from_string(const std::string& name);

// ============================================================================
// Rate Limiter
// ============================================================================

/**
 * @brief Admits at most one log line per interval
 *
 * Events arriving while the limiter is closed are counted. The caller that
 * is admitted receives the number of events suppressed since the previous
 * admitted line so it can report them. Thread-safe.
 *
 * @code
 * UInt64 suppressed = 0;
 * if (overflow_limiter_.admit(suppressed)) {
 *     log::get()->warn("queue full, dropped oldest ({} more since last report)", suppressed);
 * }
 * @endcode
 */
class RateLimiter {
public:
    using Clock = std::chrono::steady_clock;

    explicit RateLimiter(std::chrono::milliseconds interval = std::chrono::seconds(5))
        : interval_(interval) {}

    /**
     * @brief Record one event and decide whether it may be logged
     * @param[out] suppressed Events swallowed since the last admitted one
     * @return True if the caller should log now
     */
    bool admit(UInt64& suppressed);

    /// Same as admit(), with an explicit clock reading (tests)
    bool admit(UInt64& suppressed, Clock::time_point now);

    std::chrono::milliseconds interval() const noexcept { return interval_; }

private:
    std::chrono::milliseconds interval_;
    std::mutex mutex_;
    bool has_logged_{false};
    Clock::time_point last_logged_{};
    UInt64 suppressed_{0};
};

// ============================================================================
// Once Flag
// ============================================================================

/**
 * @brief Latches on the first call to first_time()
 */
class OnceFlag {
public:
    /// True exactly once over the flag's lifetime
    bool first_time() noexcept { return !fired_.exchange(true); }

    /// Re-arm the flag (e.g. after the missing context became available)
    void reset() noexcept { fired_.store(false); }

    bool fired() const noexcept { return fired_.load(); }

private:
    std::atomic<bool> fired_{false};
};

} // namespace cotlink::log
