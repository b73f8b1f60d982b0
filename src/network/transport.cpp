/**
 * @file transport.cpp
 * @brief UDP unicast / multicast transport implementation
 */

#include "cotlink/network/transport.h"
#include "cotlink/core/log.h"
#include <cstring>
#include <sstream>

#ifdef _WIN32
    #include <winsock2.h>
    #include <ws2tcpip.h>
    #pragma comment(lib, "ws2_32.lib")
    using socket_t = SOCKET;
    constexpr socket_t INVALID_SOCKET_VALUE = INVALID_SOCKET;
    constexpr int SOCKET_ERROR_VALUE = SOCKET_ERROR;
    #define GET_SOCKET_ERROR() WSAGetLastError()

    inline void close_socket(socket_t sock) { closesocket(sock); }
#else
    #include <sys/types.h>
    #include <sys/socket.h>
    #include <netinet/in.h>
    #include <arpa/inet.h>
    #include <unistd.h>
    #include <fcntl.h>
    #include <errno.h>
    #include <netdb.h>
    #include <ifaddrs.h>
    using socket_t = int;
    constexpr socket_t INVALID_SOCKET_VALUE = -1;
    constexpr int SOCKET_ERROR_VALUE = -1;
    #define GET_SOCKET_ERROR() errno

    inline void close_socket(socket_t sock) { ::close(sock); }
#endif

namespace cotlink::network {

//==============================================================================
// Platform-Specific Utilities
//==============================================================================

#ifdef _WIN32
class WinsockInitializer {
public:
    WinsockInitializer() {
        WSADATA wsa_data;
        WSAStartup(MAKEWORD(2, 2), &wsa_data);
    }
    ~WinsockInitializer() {
        WSACleanup();
    }
};

static WinsockInitializer g_winsock_initializer;
#endif

//==============================================================================
// Error Code to String
//==============================================================================

const char* transport_result_to_string(TransportResult result) noexcept {
    switch (result) {
        case TransportResult::Success: return "Success";
        case TransportResult::AlreadyInitialized: return "AlreadyInitialized";
        case TransportResult::NotInitialized: return "NotInitialized";
        case TransportResult::SocketCreationFailed: return "SocketCreationFailed";
        case TransportResult::SetOptionFailed: return "SetOptionFailed";
        case TransportResult::InvalidAddress: return "InvalidAddress";
        case TransportResult::InvalidMulticastGroup: return "InvalidMulticastGroup";
        case TransportResult::HostResolutionFailed: return "HostResolutionFailed";
        case TransportResult::SendFailed: return "SendFailed";
        case TransportResult::WouldBlock: return "WouldBlock";
        case TransportResult::NetworkUnreachable: return "NetworkUnreachable";
        case TransportResult::HostUnreachable: return "HostUnreachable";
        case TransportResult::ConnectionRefused: return "ConnectionRefused";
        case TransportResult::PayloadTooLarge: return "PayloadTooLarge";
        case TransportResult::PartialSend: return "PartialSend";
        case TransportResult::InternalError: return "InternalError";
        default: return "Unknown";
    }
}

std::string Endpoint::to_string() const {
    std::ostringstream oss;
    oss << host << ":" << port;
    return oss.str();
}

namespace {

//==============================================================================
// Shared Socket Helpers
//==============================================================================

socket_t open_send_socket(SizeT send_buffer_size) {
    socket_t sock = socket(AF_INET, SOCK_DGRAM, IPPROTO_UDP);
    if (sock == INVALID_SOCKET_VALUE) {
        return INVALID_SOCKET_VALUE;
    }

    if (send_buffer_size > 0) {
        int size = static_cast<int>(send_buffer_size);
        // Best effort: the OS may clamp the buffer
        setsockopt(sock, SOL_SOCKET, SO_SNDBUF,
                   reinterpret_cast<const char*>(&size), sizeof(size));
    }

    // Non-blocking so a full buffer never stalls the sender
#ifdef _WIN32
    u_long mode = 1;
    ioctlsocket(sock, FIONBIO, &mode);
#else
    int flags = fcntl(sock, F_GETFL, 0);
    fcntl(sock, F_SETFL, flags | O_NONBLOCK);
#endif

    return sock;
}

TransportResult map_send_error(int error) {
#ifdef _WIN32
    if (error == WSAEWOULDBLOCK) return TransportResult::WouldBlock;
    if (error == WSAEMSGSIZE) return TransportResult::PayloadTooLarge;
    if (error == WSAENETUNREACH) return TransportResult::NetworkUnreachable;
    if (error == WSAEHOSTUNREACH) return TransportResult::HostUnreachable;
    if (error == WSAECONNREFUSED || error == WSAECONNRESET) return TransportResult::ConnectionRefused;
#else
    if (error == EWOULDBLOCK || error == EAGAIN) return TransportResult::WouldBlock;
    if (error == EMSGSIZE) return TransportResult::PayloadTooLarge;
    if (error == ENETUNREACH) return TransportResult::NetworkUnreachable;
    if (error == EHOSTUNREACH) return TransportResult::HostUnreachable;
    if (error == ECONNREFUSED) return TransportResult::ConnectionRefused;
#endif
    return TransportResult::SendFailed;
}

TransportResult send_datagram(socket_t sock, const sockaddr_in& dest,
                              const UInt8* data, SizeT length, TransportStats& stats) {
    if (length > MAX_UDP_PAYLOAD) {
        stats.send_errors++;
        return TransportResult::PayloadTooLarge;
    }

    auto sent = sendto(sock, reinterpret_cast<const char*>(data), static_cast<int>(length), 0,
                       reinterpret_cast<const struct sockaddr*>(&dest), sizeof(dest));

    if (sent == SOCKET_ERROR_VALUE) {
        stats.send_errors++;
        return map_send_error(GET_SOCKET_ERROR());
    }

    if (static_cast<SizeT>(sent) != length) {
        stats.send_errors++;
        return TransportResult::PartialSend;
    }

    stats.packets_sent++;
    stats.bytes_sent += static_cast<UInt64>(sent);
    stats.last_send = std::chrono::steady_clock::now();
    return TransportResult::Success;
}

bool make_sockaddr(const std::string& ipv4, UInt16 port, sockaddr_in& out) {
    std::memset(&out, 0, sizeof(out));
    out.sin_family = AF_INET;
    out.sin_port = htons(port);
    return inet_pton(AF_INET, ipv4.c_str(), &out.sin_addr) == 1;
}

} // anonymous namespace

//==============================================================================
// UdpUnicastTransport Implementation
//==============================================================================

struct UdpUnicastTransport::Impl {
    socket_t socket{INVALID_SOCKET_VALUE};
    Endpoint destination;
    sockaddr_in dest_addr{};
    TransportStats stats;

    ~Impl() {
        if (socket != INVALID_SOCKET_VALUE) {
            close_socket(socket);
        }
    }
};

UdpUnicastTransport::UdpUnicastTransport() : impl_(std::make_unique<Impl>()) {}

UdpUnicastTransport::~UdpUnicastTransport() {
    close();
}

TransportResult UdpUnicastTransport::initialize(const Endpoint& destination, const UnicastOptions& options) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (impl_->socket != INVALID_SOCKET_VALUE) {
        return TransportResult::AlreadyInitialized;
    }

    if (destination.port == 0 || destination.host.empty()) {
        return TransportResult::InvalidAddress;
    }

    auto resolved = resolve_ipv4(destination.host);
    if (!resolved) {
        return TransportResult::HostResolutionFailed;
    }

    if (!make_sockaddr(*resolved, destination.port, impl_->dest_addr)) {
        return TransportResult::InvalidAddress;
    }

    impl_->socket = open_send_socket(options.send_buffer_size);
    if (impl_->socket == INVALID_SOCKET_VALUE) {
        return TransportResult::SocketCreationFailed;
    }

    impl_->destination = destination;
    log::get()->debug("Unicast transport ready: {} ({})", destination.to_string(), *resolved);
    return TransportResult::Success;
}

TransportResult UdpUnicastTransport::send(const UInt8* data, SizeT length) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (impl_->socket == INVALID_SOCKET_VALUE) {
        return TransportResult::NotInitialized;
    }

    return send_datagram(impl_->socket, impl_->dest_addr, data, length, impl_->stats);
}

void UdpUnicastTransport::close() {
    std::lock_guard<std::mutex> lock(mutex_);

    if (impl_->socket != INVALID_SOCKET_VALUE) {
        close_socket(impl_->socket);
        impl_->socket = INVALID_SOCKET_VALUE;
    }
}

bool UdpUnicastTransport::is_open() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return impl_->socket != INVALID_SOCKET_VALUE;
}

Endpoint UdpUnicastTransport::destination() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return impl_->destination;
}

TransportStats UdpUnicastTransport::stats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return impl_->stats;
}

//==============================================================================
// UdpMulticastTransport Implementation
//==============================================================================

struct UdpMulticastTransport::Impl {
    socket_t socket{INVALID_SOCKET_VALUE};
    Endpoint group;
    sockaddr_in group_addr{};
    std::optional<std::string> interface_address;
    TransportStats stats;

    ~Impl() {
        if (socket != INVALID_SOCKET_VALUE) {
            close_socket(socket);
        }
    }
};

UdpMulticastTransport::UdpMulticastTransport() : impl_(std::make_unique<Impl>()) {}

UdpMulticastTransport::~UdpMulticastTransport() {
    close();
}

TransportResult UdpMulticastTransport::initialize(const Endpoint& group, const MulticastOptions& options) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (impl_->socket != INVALID_SOCKET_VALUE) {
        return TransportResult::AlreadyInitialized;
    }

    if (group.port == 0) {
        return TransportResult::InvalidAddress;
    }

    if (!is_multicast_ipv4(group.host)) {
        return TransportResult::InvalidMulticastGroup;
    }

    if (!make_sockaddr(group.host, group.port, impl_->group_addr)) {
        return TransportResult::InvalidAddress;
    }

    impl_->socket = open_send_socket(options.send_buffer_size);
    if (impl_->socket == INVALID_SOCKET_VALUE) {
        return TransportResult::SocketCreationFailed;
    }

    int ttl = options.ttl;
    if (setsockopt(impl_->socket, IPPROTO_IP, IP_MULTICAST_TTL,
                   reinterpret_cast<const char*>(&ttl), sizeof(ttl)) == SOCKET_ERROR_VALUE) {
        close_socket(impl_->socket);
        impl_->socket = INVALID_SOCKET_VALUE;
        return TransportResult::SetOptionFailed;
    }

    // Do not deliver our own feed back to this host
    UInt8 loop = 0;
    if (setsockopt(impl_->socket, IPPROTO_IP, IP_MULTICAST_LOOP,
                   reinterpret_cast<const char*>(&loop), sizeof(loop)) == SOCKET_ERROR_VALUE) {
        close_socket(impl_->socket);
        impl_->socket = INVALID_SOCKET_VALUE;
        return TransportResult::SetOptionFailed;
    }

    if (!options.interface.empty()) {
        auto address = resolve_interface_address(options.interface);
        struct in_addr if_addr;
        if (address && inet_pton(AF_INET, address->c_str(), &if_addr) == 1 &&
            setsockopt(impl_->socket, IPPROTO_IP, IP_MULTICAST_IF,
                       reinterpret_cast<const char*>(&if_addr), sizeof(if_addr)) != SOCKET_ERROR_VALUE) {
            impl_->interface_address = *address;
        } else {
            log::get()->warn("Multicast interface '{}' could not be applied, using default routing",
                             options.interface);
        }
    }

    impl_->group = group;
    log::get()->debug("Multicast transport ready: {} ttl={} interface={}",
                      group.to_string(), ttl, impl_->interface_address.value_or("default"));
    return TransportResult::Success;
}

std::optional<std::string> UdpMulticastTransport::bound_interface_address() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return impl_->interface_address;
}

TransportResult UdpMulticastTransport::send(const UInt8* data, SizeT length) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (impl_->socket == INVALID_SOCKET_VALUE) {
        return TransportResult::NotInitialized;
    }

    return send_datagram(impl_->socket, impl_->group_addr, data, length, impl_->stats);
}

void UdpMulticastTransport::close() {
    std::lock_guard<std::mutex> lock(mutex_);

    if (impl_->socket != INVALID_SOCKET_VALUE) {
        close_socket(impl_->socket);
        impl_->socket = INVALID_SOCKET_VALUE;
    }
}

bool UdpMulticastTransport::is_open() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return impl_->socket != INVALID_SOCKET_VALUE;
}

Endpoint UdpMulticastTransport::destination() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return impl_->group;
}

TransportStats UdpMulticastTransport::stats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return impl_->stats;
}

//==============================================================================
// Utility Functions
//==============================================================================

bool is_valid_ipv4(std::string_view address) noexcept {
    struct in_addr addr;
    return inet_pton(AF_INET, std::string(address).c_str(), &addr) == 1;
}

bool is_multicast_ipv4(std::string_view address) noexcept {
    struct in_addr addr;
    if (inet_pton(AF_INET, std::string(address).c_str(), &addr) != 1) {
        return false;
    }
    UInt32 ip = ntohl(addr.s_addr);
    // Multicast range: 224.0.0.0 to 239.255.255.255
    return (ip >= 0xE0000000) && (ip <= 0xEFFFFFFF);
}

bool is_loopback_host(std::string_view host) noexcept {
    if (host == "localhost") {
        return true;
    }
    struct in_addr addr;
    if (inet_pton(AF_INET, std::string(host).c_str(), &addr) != 1) {
        return false;
    }
    UInt32 ip = ntohl(addr.s_addr);
    // Loopback range: 127.0.0.0/8
    return (ip & 0xFF000000) == 0x7F000000;
}

std::optional<std::string> resolve_ipv4(std::string_view host) {
    if (host.empty()) {
        return std::nullopt;
    }
    if (is_valid_ipv4(host)) {
        return std::string(host);
    }

    struct addrinfo hints;
    std::memset(&hints, 0, sizeof(hints));
    hints.ai_family = AF_INET;
    hints.ai_socktype = SOCK_DGRAM;

    struct addrinfo* res = nullptr;
    std::string name(host);
    if (getaddrinfo(name.c_str(), nullptr, &hints, &res) != 0 || res == nullptr) {
        return std::nullopt;
    }

    std::optional<std::string> result;
    for (auto* p = res; p != nullptr; p = p->ai_next) {
        if (p->ai_family == AF_INET) {
            auto* addr = reinterpret_cast<struct sockaddr_in*>(p->ai_addr);
            char host_buf[INET_ADDRSTRLEN];
            inet_ntop(AF_INET, &addr->sin_addr, host_buf, sizeof(host_buf));
            result = std::string(host_buf);
            break;
        }
    }
    freeaddrinfo(res);

    return result;
}

std::optional<std::string> resolve_interface_address(std::string_view name_or_address) {
    if (name_or_address.empty()) {
        return std::nullopt;
    }
    if (is_valid_ipv4(name_or_address)) {
        return std::string(name_or_address);
    }

    std::optional<std::string> result;

#ifndef _WIN32
    struct ifaddrs* if_addrs = nullptr;
    if (getifaddrs(&if_addrs) != 0) {
        return std::nullopt;
    }

    for (struct ifaddrs* ifa = if_addrs; ifa != nullptr; ifa = ifa->ifa_next) {
        if (ifa->ifa_addr == nullptr || ifa->ifa_addr->sa_family != AF_INET) {
            continue;
        }
        if (name_or_address != ifa->ifa_name) {
            continue;
        }

        auto* addr = reinterpret_cast<struct sockaddr_in*>(ifa->ifa_addr);
        char addr_str[INET_ADDRSTRLEN];
        inet_ntop(AF_INET, &addr->sin_addr, addr_str, sizeof(addr_str));
        result = std::string(addr_str);
        break;
    }

    freeifaddrs(if_addrs);
#endif

    return result;
}

} // namespace cotlink::network
