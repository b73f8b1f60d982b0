#pragma once
/**
 * @file capturing_transport.h
 * @brief In-memory ITransport double for broadcaster and output tests
 */

#include "cotlink/network/transport.h"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace cotlink::test_support {

/**
 * @brief Record of everything sent through one or more CapturingTransports
 *
 * Outlives the transports, which may be destroyed on a detached consumer.
 */
class CaptureLog {
public:
    struct Datagram {
        network::Endpoint destination;
        std::string payload;
    };

    void record(const network::Endpoint& destination, std::string payload) {
        std::lock_guard<std::mutex> lock(mutex_);
        datagrams_.push_back({destination, std::move(payload)});
        cv_.notify_all();
    }

    std::vector<Datagram> datagrams() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return datagrams_;
    }

    std::vector<std::string> payloads_to(const network::Endpoint& destination) const {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<std::string> out;
        for (const auto& d : datagrams_) {
            if (d.destination == destination) {
                out.push_back(d.payload);
            }
        }
        return out;
    }

    SizeT count() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return datagrams_.size();
    }

    bool wait_for_count(SizeT n, std::chrono::milliseconds timeout = std::chrono::seconds(5)) {
        std::unique_lock<std::mutex> lock(mutex_);
        return cv_.wait_for(lock, timeout, [&] { return datagrams_.size() >= n; });
    }

    // Stall control: while stalled, send() blocks before recording
    void stall() {
        std::lock_guard<std::mutex> lock(mutex_);
        stalled_ = true;
    }

    void release() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            stalled_ = false;
        }
        cv_.notify_all();
    }

    bool wait_until_blocked(std::chrono::milliseconds timeout = std::chrono::seconds(5)) {
        std::unique_lock<std::mutex> lock(mutex_);
        return cv_.wait_for(lock, timeout, [&] { return blocked_senders_ > 0; });
    }

    void block_while_stalled() {
        std::unique_lock<std::mutex> lock(mutex_);
        blocked_senders_++;
        cv_.notify_all();
        cv_.wait(lock, [&] { return !stalled_; });
        blocked_senders_--;
    }

    int closed_count() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return closed_;
    }

    void on_close() {
        std::lock_guard<std::mutex> lock(mutex_);
        closed_++;
    }

private:
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::vector<Datagram> datagrams_;
    bool stalled_{false};
    int blocked_senders_{0};
    int closed_{0};
};

/**
 * @brief Transport that records payloads instead of sending them
 */
class CapturingTransport : public network::ITransport {
public:
    CapturingTransport(std::shared_ptr<CaptureLog> log, network::Endpoint destination)
        : log_(std::move(log)), destination_(std::move(destination)) {}

    network::TransportResult send(const UInt8* data, SizeT length) override {
        if (!open_) {
            return network::TransportResult::NotInitialized;
        }
        if (fail_sends_) {
            stats_.send_errors++;
            return network::TransportResult::NetworkUnreachable;
        }
        log_->block_while_stalled();
        log_->record(destination_, std::string(reinterpret_cast<const char*>(data), length));
        stats_.packets_sent++;
        stats_.bytes_sent += length;
        return network::TransportResult::Success;
    }

    void close() override {
        if (open_.exchange(false)) {
            log_->on_close();
        }
    }

    bool is_open() const override { return open_; }
    network::Endpoint destination() const override { return destination_; }
    network::TransportStats stats() const override { return stats_; }

    void fail_sends(bool fail) { fail_sends_ = fail; }

private:
    std::shared_ptr<CaptureLog> log_;
    network::Endpoint destination_;
    network::TransportStats stats_;
    std::atomic<bool> open_{true};
    std::atomic<bool> fail_sends_{false};
};

} // namespace cotlink::test_support
