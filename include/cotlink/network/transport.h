#pragma once
/**
 * @file transport.h
 * @brief UDP delivery of CoT datagrams
 *
 * Two transports share one contract (ITransport):
 * - UdpUnicastTransport: datagrams to a fixed host:port
 * - UdpMulticastTransport: datagrams to a multicast group:port with a
 *   configurable TTL, local loopback disabled and an optional outgoing
 *   interface
 *
 * Sockets are non-blocking. A full socket buffer is reported as WouldBlock,
 * so send() never stalls the calling thread. Failures are returned as
 * TransportResult codes; nothing is retried.
 *
 * Usage:
 * @code
 * UdpMulticastTransport transport;
 * auto result = transport.initialize(Endpoint("239.2.3.1", 6969), {});
 * if (result == TransportResult::Success) {
 *     transport.send(payload.data(), payload.size());
 * }
 * @endcode
 */

#include "cotlink/core/types.h"
#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

namespace cotlink::network {

//==============================================================================
// Transport Constants
//==============================================================================

/// Maximum UDP payload size over IPv4
constexpr SizeT MAX_UDP_PAYLOAD = 65507;

/// Default multicast TTL (local network segment only)
constexpr UInt8 DEFAULT_MULTICAST_TTL = 1;

/// Default socket send buffer size
constexpr SizeT DEFAULT_SEND_BUFFER_SIZE = 262144;

//==============================================================================
// Transport Result Codes
//==============================================================================

/**
 * @brief Result codes for transport operations
 */
enum class TransportResult : UInt32 {
    Success = 0,

    // Initialization errors
    AlreadyInitialized,
    NotInitialized,
    SocketCreationFailed,
    SetOptionFailed,

    // Address errors
    InvalidAddress,
    InvalidMulticastGroup,
    HostResolutionFailed,

    // Send errors
    SendFailed,
    WouldBlock,
    NetworkUnreachable,
    HostUnreachable,
    ConnectionRefused,
    PayloadTooLarge,
    PartialSend,

    // General errors
    InternalError
};

/**
 * @brief Convert TransportResult to string
 */
const char* transport_result_to_string(TransportResult result) noexcept;

//==============================================================================
// Endpoint
//==============================================================================

/**
 * @brief Network endpoint (host name or IPv4 address, and port)
 */
struct Endpoint {
    std::string host;
    UInt16 port{0};

    Endpoint() = default;
    Endpoint(std::string_view h, UInt16 p) : host(h), port(p) {}

    /// Convert to "host:port"
    std::string to_string() const;

    bool operator==(const Endpoint& other) const noexcept {
        return host == other.host && port == other.port;
    }
    bool operator!=(const Endpoint& other) const noexcept { return !(*this == other); }
};

//==============================================================================
// Transport Statistics
//==============================================================================

/**
 * @brief Transport I/O statistics
 */
struct TransportStats {
    UInt64 packets_sent{0};
    UInt64 bytes_sent{0};
    UInt64 send_errors{0};
    std::chrono::steady_clock::time_point last_send;

    void reset() noexcept {
        packets_sent = bytes_sent = send_errors = 0;
    }
};

//==============================================================================
// Transport Interface
//==============================================================================

/**
 * @brief Datagram delivery to one configured destination
 */
class ITransport {
public:
    virtual ~ITransport() = default;

    /**
     * @brief Send one datagram to the configured destination
     * @param data Payload
     * @param length Payload length (at most MAX_UDP_PAYLOAD)
     * @return Success or error code
     */
    virtual TransportResult send(const UInt8* data, SizeT length) = 0;

    /**
     * @brief Close the socket; later sends return NotInitialized
     */
    virtual void close() = 0;

    /**
     * @brief Check if the transport can send
     */
    virtual bool is_open() const = 0;

    /**
     * @brief Configured destination
     */
    virtual Endpoint destination() const = 0;

    /**
     * @brief I/O statistics snapshot
     */
    virtual TransportStats stats() const = 0;
};

//==============================================================================
// UDP Unicast Transport
//==============================================================================

/**
 * @brief Options for the unicast transport
 */
struct UnicastOptions {
    SizeT send_buffer_size{DEFAULT_SEND_BUFFER_SIZE};
};

/**
 * @brief UDP datagrams to a single host
 *
 * The host may be an IPv4 literal or a name; names are resolved once in
 * initialize().
 */
class UdpUnicastTransport : public ITransport {
public:
    UdpUnicastTransport();
    ~UdpUnicastTransport() override;

    UdpUnicastTransport(const UdpUnicastTransport&) = delete;
    UdpUnicastTransport& operator=(const UdpUnicastTransport&) = delete;

    /**
     * @brief Open the socket and resolve the destination
     */
    TransportResult initialize(const Endpoint& destination, const UnicastOptions& options = {});

    TransportResult send(const UInt8* data, SizeT length) override;
    void close() override;
    bool is_open() const override;
    Endpoint destination() const override;
    TransportStats stats() const override;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
    mutable std::mutex mutex_;
};

//==============================================================================
// UDP Multicast Transport
//==============================================================================

/**
 * @brief Options for the multicast transport
 */
struct MulticastOptions {
    UInt8 ttl{DEFAULT_MULTICAST_TTL};

    /// Outgoing interface: name ("eth0") or IPv4 address; empty = OS routing
    std::string interface;

    SizeT send_buffer_size{DEFAULT_SEND_BUFFER_SIZE};
};

/**
 * @brief UDP datagrams to a multicast group
 *
 * Local loopback is always disabled so the sending host does not receive
 * its own feed. An interface that cannot be resolved is reported as a
 * warning and the OS default route is used.
 */
class UdpMulticastTransport : public ITransport {
public:
    UdpMulticastTransport();
    ~UdpMulticastTransport() override;

    UdpMulticastTransport(const UdpMulticastTransport&) = delete;
    UdpMulticastTransport& operator=(const UdpMulticastTransport&) = delete;

    /**
     * @brief Open the socket and apply multicast options
     */
    TransportResult initialize(const Endpoint& group, const MulticastOptions& options = {});

    /// Interface address actually applied, nullopt if OS routing is used
    std::optional<std::string> bound_interface_address() const;

    TransportResult send(const UInt8* data, SizeT length) override;
    void close() override;
    bool is_open() const override;
    Endpoint destination() const override;
    TransportStats stats() const override;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
    mutable std::mutex mutex_;
};

//==============================================================================
// Utility Functions
//==============================================================================

/**
 * @brief Check if address is a valid IPv4 literal
 */
bool is_valid_ipv4(std::string_view address) noexcept;

/**
 * @brief Check if address is an IPv4 multicast address (224.0.0.0/4)
 */
bool is_multicast_ipv4(std::string_view address) noexcept;

/**
 * @brief Check if address is an IPv4 loopback address (127.0.0.0/8) or "localhost"
 */
bool is_loopback_host(std::string_view host) noexcept;

/**
 * @brief Resolve a host name or IPv4 literal to an IPv4 literal
 */
std::optional<std::string> resolve_ipv4(std::string_view host);

/**
 * @brief Resolve a network interface name or IPv4 literal to its IPv4 address
 */
std::optional<std::string> resolve_interface_address(std::string_view name_or_address);

} // namespace cotlink::network
