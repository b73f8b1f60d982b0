/**
 * @file delivery_config_tests.cpp
 * @brief Unit tests for delivery configuration and its JSON store
 */

#include <gtest/gtest.h>
#include "cotlink/network/config_store.h"
#include "cotlink/network/delivery_config.h"
#include <nlohmann/json.hpp>
#include <cstdlib>
#include <filesystem>
#include <fstream>

using namespace cotlink;
using namespace cotlink::network;

// ============================================================================
// Enum Tests
// ============================================================================

TEST(DeliveryModeTest, ToStringAndParse) {
    EXPECT_STREQ(delivery_mode_to_string(DeliveryMode::Localhost), "Localhost");
    EXPECT_STREQ(delivery_mode_to_string(DeliveryMode::Unicast), "Unicast");
    EXPECT_STREQ(delivery_mode_to_string(DeliveryMode::Multicast), "Multicast");

    EXPECT_EQ(parse_delivery_mode("multicast"), DeliveryMode::Multicast);
    EXPECT_EQ(parse_delivery_mode("UNICAST"), DeliveryMode::Unicast);
    EXPECT_EQ(parse_delivery_mode("Localhost"), DeliveryMode::Localhost);
    EXPECT_FALSE(parse_delivery_mode("broadcast").has_value());
}

TEST(ConfigResultTest, ToString) {
    EXPECT_EQ(static_cast<UInt32>(ConfigResult::Success), 0u);
    EXPECT_STREQ(config_result_to_string(ConfigResult::InvalidPort), "InvalidPort");
    EXPECT_STREQ(config_result_to_string(ConfigResult::InvalidHost), "InvalidHost");
    EXPECT_STREQ(config_result_to_string(ConfigResult::InvalidMulticastGroup), "InvalidMulticastGroup");
    EXPECT_STREQ(config_result_to_string(ConfigResult::TransportCreationFailed), "TransportCreationFailed");
    EXPECT_STREQ(config_result_to_string(ConfigResult::PersistFailed), "PersistFailed");
}

// ============================================================================
// Normalization and Validation Tests
// ============================================================================

TEST(DeliveryConfigTest, LocalhostForcesLoopbackHost) {
    DeliveryConfig config;
    config.mode = DeliveryMode::Localhost;
    config.host = "10.0.0.5";
    auto normalized = config.normalized();
    EXPECT_EQ(normalized.host, "127.0.0.1");
    EXPECT_EQ(normalized.validate(), ConfigResult::Success);
}

TEST(DeliveryConfigTest, TrimsHostAndInterface) {
    auto config = DeliveryConfig::unicast("  tak.local ");
    config.bind_interface = "   ";
    auto normalized = config.normalized();
    EXPECT_EQ(normalized.host, "tak.local");
    EXPECT_FALSE(normalized.bind_interface.has_value());
}

TEST(DeliveryConfigTest, PortZeroRejected) {
    EXPECT_EQ(DeliveryConfig::localhost(0).normalized().validate(), ConfigResult::InvalidPort);
    EXPECT_EQ(DeliveryConfig::unicast("10.0.0.1", 0).validate(), ConfigResult::InvalidPort);
}

TEST(DeliveryConfigTest, UnicastHostRules) {
    EXPECT_EQ(DeliveryConfig::unicast("10.0.0.1").validate(), ConfigResult::Success);
    EXPECT_EQ(DeliveryConfig::unicast("tak-server").validate(), ConfigResult::Success);
    EXPECT_EQ(DeliveryConfig::unicast("").validate(), ConfigResult::InvalidHost);
    EXPECT_EQ(DeliveryConfig::unicast("bad host").validate(), ConfigResult::InvalidHost);
    EXPECT_EQ(DeliveryConfig::unicast("239.2.3.1").validate(), ConfigResult::InvalidHost);
}

TEST(DeliveryConfigTest, MulticastRequiresGroup) {
    EXPECT_EQ(DeliveryConfig::multicast().validate(), ConfigResult::Success);
    EXPECT_EQ(DeliveryConfig::multicast("192.168.1.10").validate(), ConfigResult::InvalidMulticastGroup);
    EXPECT_EQ(DeliveryConfig::multicast("tak.local").validate(), ConfigResult::InvalidMulticastGroup);
    EXPECT_EQ(DeliveryConfig::multicast("239.2.3.1", 6969, 0).validate(), ConfigResult::InvalidTtl);
}

TEST(DeliveryConfigTest, MulticastDefaults) {
    auto config = DeliveryConfig::multicast();
    EXPECT_EQ(config.host, "239.2.3.1");
    EXPECT_EQ(config.port, 6969);
    EXPECT_EQ(config.multicast_ttl, std::optional<UInt8>(1));
}

TEST(DeliveryConfigTest, FromDefaultsPicksModeByHost) {
    auto loopback = DeliveryConfig::from_defaults("127.0.0.1", 4242);
    EXPECT_EQ(loopback.mode, DeliveryMode::Localhost);

    auto named_loopback = DeliveryConfig::from_defaults("localhost", 5000);
    EXPECT_EQ(named_loopback.mode, DeliveryMode::Localhost);
    EXPECT_EQ(named_loopback.port, 5000);

    auto remote = DeliveryConfig::from_defaults("192.168.1.20", 4242);
    EXPECT_EQ(remote.mode, DeliveryMode::Unicast);
    EXPECT_EQ(remote.host, "192.168.1.20");
}

TEST(DeliveryConfigTest, ToString) {
    EXPECT_EQ(DeliveryConfig::localhost().to_string(), "Localhost 127.0.0.1:4242");
    auto mc = DeliveryConfig::multicast("239.2.3.1", 6969, 2);
    mc.bind_interface = "eth0";
    EXPECT_EQ(mc.to_string(), "Multicast 239.2.3.1:6969 ttl=2 if=eth0");
}

// ============================================================================
// JSON Tests
// ============================================================================

TEST(DeliveryConfigJsonTest, PersistedShape) {
    auto config = DeliveryConfig::multicast("239.2.3.1", 6969, 3);
    config.persist = true;

    nlohmann::json j = config;
    EXPECT_EQ(j["Mode"], "Multicast");
    EXPECT_EQ(j["Host"], "239.2.3.1");
    EXPECT_EQ(j["Port"], 6969);
    EXPECT_EQ(j["MulticastTtl"], 3);
    EXPECT_TRUE(j["BindInterfaceName"].is_null());
    EXPECT_EQ(j["Remember"], true);
}

TEST(DeliveryConfigJsonTest, UnsetTtlStaysUnset) {
    auto config = DeliveryConfig::unicast("10.0.0.7", 8087);
    config.persist = true;
    ASSERT_FALSE(config.multicast_ttl.has_value());

    nlohmann::json j = config;
    EXPECT_TRUE(j["MulticastTtl"].is_null());

    auto loaded = nlohmann::json::parse(j.dump()).get<DeliveryConfig>();
    EXPECT_FALSE(loaded.multicast_ttl.has_value());
    EXPECT_EQ(loaded, config);
}

TEST(DeliveryConfigJsonTest, ParsePersistedDocument) {
    auto j = nlohmann::json::parse(R"({
        "Mode": "Unicast", "Host": "10.0.0.7", "Port": 8087,
        "MulticastTtl": 1, "BindInterfaceName": "eth1", "Remember": true
    })");

    auto config = j.get<DeliveryConfig>();
    EXPECT_EQ(config.mode, DeliveryMode::Unicast);
    EXPECT_EQ(config.host, "10.0.0.7");
    EXPECT_EQ(config.port, 8087);
    EXPECT_EQ(config.bind_interface, std::optional<std::string>("eth1"));
    EXPECT_TRUE(config.persist);
}

TEST(DeliveryConfigJsonTest, RejectsBadValues) {
    auto bad_mode = nlohmann::json::parse(R"({"Mode": "Carrier", "Host": "x", "Port": 1})");
    EXPECT_THROW(bad_mode.get<DeliveryConfig>(), std::runtime_error);

    auto bad_port = nlohmann::json::parse(R"({"Mode": "Unicast", "Host": "x", "Port": 70000})");
    EXPECT_THROW(bad_port.get<DeliveryConfig>(), std::runtime_error);

    auto missing_host = nlohmann::json::parse(R"({"Mode": "Unicast", "Port": 4242})");
    EXPECT_THROW(missing_host.get<DeliveryConfig>(), nlohmann::json::exception);
}

// ============================================================================
// JSON File Store Tests
// ============================================================================

class JsonFileConfigStoreTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir_ = std::filesystem::path(::testing::TempDir()) / "cotlink_store_test";
        std::filesystem::remove_all(dir_);
    }

    void TearDown() override {
        std::filesystem::remove_all(dir_);
    }

    std::filesystem::path dir_;
};

TEST_F(JsonFileConfigStoreTest, MissingFileLoadsNothing) {
    JsonFileConfigStore store(dir_ / "output.json");
    EXPECT_FALSE(store.load().has_value());
}

TEST_F(JsonFileConfigStoreTest, SaveCreatesDirectoriesAndLoadsBack) {
    JsonFileConfigStore store(dir_ / "nested" / "output.json");
    auto config = DeliveryConfig::multicast("239.5.5.5", 7000, 2);
    config.bind_interface = "eth0";
    config.persist = true;

    ASSERT_TRUE(store.save(config));
    EXPECT_TRUE(std::filesystem::exists(store.path()));

    auto loaded = store.load();
    ASSERT_TRUE(loaded.has_value());
    EXPECT_EQ(*loaded, config);
}

TEST_F(JsonFileConfigStoreTest, MalformedFileThrows) {
    std::filesystem::create_directories(dir_);
    std::ofstream(dir_ / "output.json") << "{ not json";
    JsonFileConfigStore store(dir_ / "output.json");
    EXPECT_THROW(store.load(), std::runtime_error);
}

TEST_F(JsonFileConfigStoreTest, UnwritableLocationFails) {
    std::filesystem::create_directories(dir_);
    std::ofstream(dir_ / "blocker") << "file";
    JsonFileConfigStore store(dir_ / "blocker" / "output.json");
    EXPECT_FALSE(store.save(DeliveryConfig::localhost()));
}

TEST(JsonFileConfigStorePathTest, DefaultPathUnderConfigHome) {
    auto path = JsonFileConfigStore::default_path();
    EXPECT_EQ(path.filename(), "output.json");
    EXPECT_EQ(path.parent_path().filename(), "cotlink");
}
