/**
 * @file transport_tests.cpp
 * @brief Unit tests for UDP unicast and multicast transports
 */

#include <gtest/gtest.h>
#include "cotlink/network/transport.h"
#include <sys/socket.h>
#include <netinet/in.h>
#include <arpa/inet.h>
#include <unistd.h>
#include <cstring>
#include <string>
#include <vector>

using namespace cotlink;
using namespace cotlink::network;

namespace {

/// Loopback UDP receiver on an ephemeral port
class LoopbackReceiver {
public:
    LoopbackReceiver() {
        fd_ = ::socket(AF_INET, SOCK_DGRAM, 0);
        sockaddr_in addr{};
        addr.sin_family = AF_INET;
        addr.sin_port = 0;
        addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
        ::bind(fd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr));

        socklen_t len = sizeof(addr);
        ::getsockname(fd_, reinterpret_cast<sockaddr*>(&addr), &len);
        port_ = ntohs(addr.sin_port);

        timeval tv{2, 0};
        ::setsockopt(fd_, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
    }

    ~LoopbackReceiver() { ::close(fd_); }

    UInt16 port() const { return port_; }

    std::string receive() {
        char buffer[MAX_UDP_PAYLOAD];
        auto n = ::recv(fd_, buffer, sizeof(buffer), 0);
        return n > 0 ? std::string(buffer, static_cast<SizeT>(n)) : std::string();
    }

private:
    int fd_{-1};
    UInt16 port_{0};
};

} // anonymous namespace

// ============================================================================
// TransportResult Tests
// ============================================================================

TEST(TransportResultTest, SuccessValue) {
    EXPECT_EQ(static_cast<UInt32>(TransportResult::Success), 0u);
}

TEST(TransportResultTest, ToString) {
    EXPECT_STREQ(transport_result_to_string(TransportResult::Success), "Success");
    EXPECT_STREQ(transport_result_to_string(TransportResult::NotInitialized), "NotInitialized");
    EXPECT_STREQ(transport_result_to_string(TransportResult::InvalidMulticastGroup), "InvalidMulticastGroup");
    EXPECT_STREQ(transport_result_to_string(TransportResult::HostResolutionFailed), "HostResolutionFailed");
    EXPECT_STREQ(transport_result_to_string(TransportResult::WouldBlock), "WouldBlock");
    EXPECT_STREQ(transport_result_to_string(TransportResult::PayloadTooLarge), "PayloadTooLarge");
    EXPECT_STREQ(transport_result_to_string(TransportResult::InternalError), "InternalError");
}

// ============================================================================
// Endpoint Tests
// ============================================================================

TEST(EndpointTest, DefaultConstruction) {
    Endpoint endpoint;
    EXPECT_TRUE(endpoint.host.empty());
    EXPECT_EQ(endpoint.port, 0);
}

TEST(EndpointTest, ToStringAndEquality) {
    Endpoint a("239.2.3.1", 6969);
    EXPECT_EQ(a.to_string(), "239.2.3.1:6969");
    EXPECT_EQ(a, Endpoint("239.2.3.1", 6969));
    EXPECT_NE(a, Endpoint("239.2.3.1", 6970));
}

// ============================================================================
// Address Utility Tests
// ============================================================================

TEST(AddressUtilsTest, ValidIpv4) {
    EXPECT_TRUE(is_valid_ipv4("192.168.1.1"));
    EXPECT_TRUE(is_valid_ipv4("0.0.0.0"));
    EXPECT_FALSE(is_valid_ipv4("256.1.1.1"));
    EXPECT_FALSE(is_valid_ipv4("example.com"));
    EXPECT_FALSE(is_valid_ipv4(""));
}

TEST(AddressUtilsTest, MulticastRange) {
    EXPECT_TRUE(is_multicast_ipv4("224.0.0.0"));
    EXPECT_TRUE(is_multicast_ipv4("239.2.3.1"));
    EXPECT_TRUE(is_multicast_ipv4("239.255.255.255"));
    EXPECT_FALSE(is_multicast_ipv4("223.255.255.255"));
    EXPECT_FALSE(is_multicast_ipv4("240.0.0.0"));
    EXPECT_FALSE(is_multicast_ipv4("not-an-address"));
}

TEST(AddressUtilsTest, Loopback) {
    EXPECT_TRUE(is_loopback_host("127.0.0.1"));
    EXPECT_TRUE(is_loopback_host("127.1.2.3"));
    EXPECT_TRUE(is_loopback_host("localhost"));
    EXPECT_FALSE(is_loopback_host("10.0.0.1"));
    EXPECT_FALSE(is_loopback_host(""));
}

TEST(AddressUtilsTest, ResolveLiteralAndLocalhost) {
    EXPECT_EQ(resolve_ipv4("10.1.2.3"), std::optional<std::string>("10.1.2.3"));
    auto localhost = resolve_ipv4("localhost");
    ASSERT_TRUE(localhost.has_value());
    EXPECT_TRUE(is_loopback_host(*localhost));
    EXPECT_FALSE(resolve_ipv4("").has_value());
    EXPECT_FALSE(resolve_ipv4("no-such-host.invalid").has_value());
}

TEST(AddressUtilsTest, ResolveInterface) {
    EXPECT_EQ(resolve_interface_address("192.168.0.10"), std::optional<std::string>("192.168.0.10"));
    EXPECT_FALSE(resolve_interface_address("").has_value());
    EXPECT_FALSE(resolve_interface_address("definitely-not-an-interface0").has_value());

    auto lo = resolve_interface_address("lo");
    if (lo) {
        EXPECT_TRUE(is_loopback_host(*lo));
    }
}

// ============================================================================
// Unicast Transport Tests
// ============================================================================

TEST(UdpUnicastTransportTest, SendBeforeInitialize) {
    UdpUnicastTransport transport;
    EXPECT_FALSE(transport.is_open());
    const UInt8 data[] = {1, 2, 3};
    EXPECT_EQ(transport.send(data, sizeof(data)), TransportResult::NotInitialized);
}

TEST(UdpUnicastTransportTest, InitializeRejectsBadEndpoints) {
    UdpUnicastTransport transport;
    EXPECT_EQ(transport.initialize(Endpoint("127.0.0.1", 0)), TransportResult::InvalidAddress);
    EXPECT_EQ(transport.initialize(Endpoint("", 4242)), TransportResult::InvalidAddress);
    EXPECT_EQ(transport.initialize(Endpoint("no-such-host.invalid", 4242)),
              TransportResult::HostResolutionFailed);
    EXPECT_FALSE(transport.is_open());
}

TEST(UdpUnicastTransportTest, SendsToLoopbackReceiver) {
    LoopbackReceiver receiver;
    UdpUnicastTransport transport;
    ASSERT_EQ(transport.initialize(Endpoint("127.0.0.1", receiver.port())), TransportResult::Success);
    EXPECT_TRUE(transport.is_open());
    EXPECT_EQ(transport.initialize(Endpoint("127.0.0.1", receiver.port())),
              TransportResult::AlreadyInitialized);

    std::string message = "<event/>";
    auto result = transport.send(reinterpret_cast<const UInt8*>(message.data()), message.size());
    ASSERT_EQ(result, TransportResult::Success);
    EXPECT_EQ(receiver.receive(), message);

    auto stats = transport.stats();
    EXPECT_EQ(stats.packets_sent, 1u);
    EXPECT_EQ(stats.bytes_sent, message.size());
    EXPECT_EQ(transport.destination(), Endpoint("127.0.0.1", receiver.port()));
}

TEST(UdpUnicastTransportTest, OversizedPayloadRejected) {
    LoopbackReceiver receiver;
    UdpUnicastTransport transport;
    ASSERT_EQ(transport.initialize(Endpoint("127.0.0.1", receiver.port())), TransportResult::Success);

    std::vector<UInt8> payload(MAX_UDP_PAYLOAD + 1, 'x');
    EXPECT_EQ(transport.send(payload.data(), payload.size()), TransportResult::PayloadTooLarge);
    EXPECT_EQ(transport.stats().send_errors, 1u);
}

TEST(UdpUnicastTransportTest, CloseStopsSending) {
    LoopbackReceiver receiver;
    UdpUnicastTransport transport;
    ASSERT_EQ(transport.initialize(Endpoint("localhost", receiver.port())), TransportResult::Success);
    transport.close();
    transport.close();
    EXPECT_FALSE(transport.is_open());
    const UInt8 data[] = {0};
    EXPECT_EQ(transport.send(data, 1), TransportResult::NotInitialized);
}

// ============================================================================
// Multicast Transport Tests
// ============================================================================

TEST(UdpMulticastTransportTest, RejectsNonMulticastGroup) {
    UdpMulticastTransport transport;
    EXPECT_EQ(transport.initialize(Endpoint("192.168.1.1", 6969)), TransportResult::InvalidMulticastGroup);
    EXPECT_EQ(transport.initialize(Endpoint("239.2.3.1", 0)), TransportResult::InvalidAddress);
    EXPECT_FALSE(transport.is_open());
}

TEST(UdpMulticastTransportTest, InitializesWithDefaults) {
    UdpMulticastTransport transport;
    ASSERT_EQ(transport.initialize(Endpoint("239.2.3.1", 6969)), TransportResult::Success);
    EXPECT_TRUE(transport.is_open());
    EXPECT_FALSE(transport.bound_interface_address().has_value());
    EXPECT_EQ(transport.destination(), Endpoint("239.2.3.1", 6969));
}

TEST(UdpMulticastTransportTest, UnknownInterfaceFallsBack) {
    UdpMulticastTransport transport;
    MulticastOptions options;
    options.ttl = 4;
    options.interface = "definitely-not-an-interface0";
    ASSERT_EQ(transport.initialize(Endpoint("239.2.3.1", 6969), options), TransportResult::Success);
    EXPECT_FALSE(transport.bound_interface_address().has_value());
}
