/**
 * @file broadcaster.cpp
 * @brief Broadcaster implementation
 */

#include "cotlink/network/broadcaster.h"
#include "cotlink/core/log.h"
#include <atomic>
#include <exception>
#include <stdexcept>
#include <limits>

namespace cotlink::network {

using Clock = std::chrono::steady_clock;

// ============================================================================
// Shared State
// ============================================================================

/**
 * Owned jointly by the Broadcaster and its consumer thread, so a detached
 * consumer keeps the queue and transport alive until it returns.
 */
struct Broadcaster::State {
    State(std::unique_ptr<ITransport> t, const BroadcasterOptions& options)
        : queue(options.queue_capacity)
        , transport(std::move(t))
        , poll_interval(options.poll_interval)
        , overflow_limiter(options.log_interval)
        , failure_limiter(options.log_interval) {}

    BoundedQueue<QueueItem> queue;
    std::unique_ptr<ITransport> transport;
    std::chrono::milliseconds poll_interval;

    // Drain deadline in steady_clock ticks; max() while running
    std::atomic<Clock::rep> deadline{std::numeric_limits<Clock::rep>::max()};

    std::atomic<UInt64> enqueued{0};
    std::atomic<UInt64> sent{0};
    std::atomic<UInt64> send_failures{0};
    std::atomic<UInt64> dropped_overflow{0};
    std::atomic<UInt64> dropped_on_dispose{0};

    log::RateLimiter overflow_limiter;
    log::RateLimiter failure_limiter;

    bool past_deadline() const {
        return Clock::now().time_since_epoch().count() >= deadline.load();
    }

    void discard_pending() {
        auto leftover = queue.drain();
        if (!leftover.empty()) {
            dropped_on_dispose += leftover.size();
        }
    }

    void report_failure(const std::string& reason) {
        send_failures++;
        UInt64 suppressed = 0;
        if (failure_limiter.admit(suppressed)) {
            log::get()->warn("CoT send to {} failed: {} ({} similar suppressed)",
                             transport->destination().to_string(), reason, suppressed);
        }
    }
};

// ============================================================================
// Lifecycle
// ============================================================================

Broadcaster::Broadcaster(std::unique_ptr<ITransport> transport, const BroadcasterOptions& options)
    : destination_(transport ? transport->destination() : Endpoint{}) {
    if (!transport) {
        throw std::invalid_argument("Broadcaster requires a transport");
    }

    state_ = std::make_shared<State>(std::move(transport), options);

    std::promise<void> done;
    consumer_done_ = done.get_future();
    consumer_ = std::thread(&Broadcaster::consume, state_, std::move(done));

    log::get()->info("CoT broadcaster started -> {}", destination_.to_string());
}

Broadcaster::~Broadcaster() {
    dispose(DEFAULT_DISPOSE_GRACE);
}

void Broadcaster::dispose(std::chrono::milliseconds grace) {
    std::lock_guard<std::mutex> lock(dispose_mutex_);
    if (disposed_) {
        return;
    }
    disposed_ = true;

    auto deadline = Clock::now() + grace;
    state_->deadline.store(deadline.time_since_epoch().count());
    state_->queue.close();

    if (consumer_done_.wait_until(deadline) == std::future_status::ready) {
        consumer_.join();
    } else {
        // Consumer is blocked inside the transport; let it finish on its own
        state_->discard_pending();
        consumer_.detach();
        log::get()->warn("CoT broadcaster for {} did not stop within {} ms, detached",
                         destination_.to_string(), grace.count());
    }

    auto s = stats();
    log::get()->info("CoT broadcaster stopped -> {} (sent {}, failed {}, overflow {}, discarded {})",
                     destination_.to_string(), s.sent, s.send_failures,
                     s.dropped_overflow, s.dropped_on_dispose);
}

// ============================================================================
// Producer Side
// ============================================================================

bool Broadcaster::enqueue(std::vector<UInt8>&& payload) {
    QueueItem item{std::move(payload), Clock::now()};

    switch (state_->queue.push(std::move(item))) {
        case PushResult::Accepted:
            state_->enqueued++;
            return true;
        case PushResult::AcceptedDroppedOldest: {
            state_->enqueued++;
            state_->dropped_overflow++;
            UInt64 suppressed = 0;
            if (state_->overflow_limiter.admit(suppressed)) {
                log::get()->warn("CoT queue full ({}), dropped oldest event ({} more since last report)",
                                 state_->queue.capacity(), suppressed);
            }
            return true;
        }
        case PushResult::Closed:
        default:
            payload = std::move(item.payload);
            return false;
    }
}

bool Broadcaster::enqueue(std::string_view text) {
    return enqueue(std::vector<UInt8>(text.begin(), text.end()));
}

// ============================================================================
// Consumer Side
// ============================================================================

void Broadcaster::consume(std::shared_ptr<State> state, std::promise<void> done) {
    for (;;) {
        if (state->past_deadline()) {
            state->discard_pending();
            break;
        }

        auto item = state->queue.pop(state->poll_interval);
        if (!item) {
            if (state->queue.is_closed()) {
                break;
            }
            continue;
        }

        if (state->past_deadline()) {
            state->dropped_on_dispose++;
            state->discard_pending();
            break;
        }

        try {
            auto result = state->transport->send(item->payload.data(), item->payload.size());
            if (result == TransportResult::Success) {
                state->sent++;
            } else {
                state->report_failure(transport_result_to_string(result));
            }
        } catch (const std::exception& e) {
            state->report_failure(e.what());
        } catch (...) {
            state->report_failure("unknown exception");
        }
    }

    state->transport->close();
    done.set_value();
}

// ============================================================================
// Queries
// ============================================================================

bool Broadcaster::is_running() const {
    std::lock_guard<std::mutex> lock(dispose_mutex_);
    return !disposed_;
}

SizeT Broadcaster::pending() const {
    return state_->queue.size();
}

BroadcasterStats Broadcaster::stats() const {
    BroadcasterStats s;
    s.enqueued = state_->enqueued.load();
    s.sent = state_->sent.load();
    s.send_failures = state_->send_failures.load();
    s.dropped_overflow = state_->dropped_overflow.load();
    s.dropped_on_dispose = state_->dropped_on_dispose.load();
    return s;
}

} // namespace cotlink::network
