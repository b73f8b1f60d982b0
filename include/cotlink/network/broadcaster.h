#pragma once
/**
 * @file broadcaster.h
 * @brief Non-blocking CoT sender: bounded queue plus one consumer thread
 *
 * The producer (simulation tick) calls enqueue(), which never blocks; when
 * the queue is full the oldest pending event is dropped. A single
 * background thread pops events in FIFO order and hands them to the
 * transport. Transport errors and exceptions are logged at a throttled rate,
 * counted, and never stop the loop.
 *
 * dispose() is bounded: the consumer may drain until the grace period
 * expires, after which anything still queued is discarded. A consumer stuck
 * in I/O past the grace period is detached; it owns the queue and transport
 * through shared state and releases them when it returns.
 *
 * Usage:
 * @code
 * auto transport = std::make_unique<UdpUnicastTransport>();
 * transport->initialize(Endpoint("127.0.0.1", 4242));
 * Broadcaster broadcaster(std::move(transport));
 * broadcaster.enqueue(event.to_xml());
 * broadcaster.dispose();
 * @endcode
 */

#include "cotlink/core/types.h"
#include "cotlink/network/bounded_queue.h"
#include "cotlink/network/transport.h"
#include <chrono>
#include <future>
#include <memory>
#include <mutex>
#include <string_view>
#include <thread>
#include <vector>

namespace cotlink::network {

/// Default grace period for draining on dispose
constexpr std::chrono::milliseconds DEFAULT_DISPOSE_GRACE{500};

/**
 * @brief One serialized event waiting to be sent
 */
struct QueueItem {
    std::vector<UInt8> payload;
    std::chrono::steady_clock::time_point enqueue_time;
};

/**
 * @brief Broadcaster counters
 */
struct BroadcasterStats {
    UInt64 enqueued{0};
    UInt64 sent{0};
    UInt64 send_failures{0};
    UInt64 dropped_overflow{0};
    UInt64 dropped_on_dispose{0};
};

struct BroadcasterOptions {
    SizeT queue_capacity{DEFAULT_QUEUE_CAPACITY};

    /// Consumer wake-up period while idle
    std::chrono::milliseconds poll_interval{50};

    /// Minimum spacing of overflow / send-failure log lines
    std::chrono::milliseconds log_interval{std::chrono::seconds(5)};
};

class Broadcaster {
public:
    /**
     * @brief Start the consumer thread over an initialized transport
     */
    explicit Broadcaster(std::unique_ptr<ITransport> transport,
                         const BroadcasterOptions& options = {});

    /// Disposes with the default grace period
    ~Broadcaster();

    Broadcaster(const Broadcaster&) = delete;
    Broadcaster& operator=(const Broadcaster&) = delete;

    /**
     * @brief Queue a payload for sending; never blocks
     * @return False once disposed, in which case payload is left intact
     */
    bool enqueue(std::vector<UInt8>&& payload);

    /// Convenience overload for serialized XML
    bool enqueue(std::string_view text);

    /**
     * @brief Stop accepting items, drain for at most grace, release the transport
     *
     * Idempotent. Returns within roughly grace even if the transport hangs.
     */
    void dispose(std::chrono::milliseconds grace = DEFAULT_DISPOSE_GRACE);

    bool is_running() const;

    /// Events waiting in the queue
    SizeT pending() const;

    BroadcasterStats stats() const;

    const Endpoint& destination() const noexcept { return destination_; }

private:
    struct State;

    static void consume(std::shared_ptr<State> state, std::promise<void> done);

    std::shared_ptr<State> state_;
    Endpoint destination_;
    std::thread consumer_;
    std::future<void> consumer_done_;
    mutable std::mutex dispose_mutex_;
    bool disposed_{false};
};

} // namespace cotlink::network
