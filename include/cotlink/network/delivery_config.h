#pragma once
/**
 * @file delivery_config.h
 * @brief Output destination settings and their validation
 *
 * A DeliveryConfig is built from caller input or from persisted storage,
 * normalized, validated, and then replaced wholesale on reconfiguration.
 * An active configuration is never mutated in place.
 */

#include "cotlink/core/types.h"
#include <nlohmann/json_fwd.hpp>
#include <optional>
#include <string>
#include <string_view>

namespace cotlink::network {

/// Default CoT input port of common display clients
constexpr UInt16 DEFAULT_UNICAST_PORT = 4242;

/// Default situational-awareness multicast group
constexpr const char* DEFAULT_MULTICAST_GROUP = "239.2.3.1";
constexpr UInt16 DEFAULT_MULTICAST_PORT = 6969;

// ============================================================================
// Delivery Mode
// ============================================================================

enum class DeliveryMode : UInt8 {
    Localhost = 0,  ///< Unicast to 127.0.0.1
    Unicast,        ///< Unicast to a named or literal host
    Multicast       ///< IPv4 multicast group
};

const char* delivery_mode_to_string(DeliveryMode mode) noexcept;

/**
 * @brief Parse "Localhost", "Unicast" or "Multicast" (case-insensitive)
 */
std::optional<DeliveryMode> parse_delivery_mode(std::string_view name);

// ============================================================================
// Configuration Result
// ============================================================================

/**
 * @brief Outcome of validating or applying a delivery configuration
 */
enum class ConfigResult : UInt32 {
    Success = 0,
    InvalidPort,
    InvalidHost,
    InvalidMulticastGroup,
    InvalidTtl,
    TransportCreationFailed,
    PersistFailed
};

const char* config_result_to_string(ConfigResult result) noexcept;

// ============================================================================
// Delivery Configuration
// ============================================================================

struct DeliveryConfig {
    DeliveryMode mode{DeliveryMode::Localhost};
    std::string host{"127.0.0.1"};
    UInt16 port{DEFAULT_UNICAST_PORT};
    std::optional<UInt8> multicast_ttl;
    std::optional<std::string> bind_interface;
    bool persist{false};

    /// Localhost delivery to the default port
    static DeliveryConfig localhost(UInt16 port = DEFAULT_UNICAST_PORT) {
        DeliveryConfig config;
        config.mode = DeliveryMode::Localhost;
        config.port = port;
        return config;
    }

    static DeliveryConfig unicast(std::string host, UInt16 port = DEFAULT_UNICAST_PORT) {
        DeliveryConfig config;
        config.mode = DeliveryMode::Unicast;
        config.host = std::move(host);
        config.port = port;
        return config;
    }

    static DeliveryConfig multicast(std::string group = DEFAULT_MULTICAST_GROUP,
                                    UInt16 port = DEFAULT_MULTICAST_PORT,
                                    UInt8 ttl = 1) {
        DeliveryConfig config;
        config.mode = DeliveryMode::Multicast;
        config.host = std::move(group);
        config.port = port;
        config.multicast_ttl = ttl;
        return config;
    }

    /**
     * @brief Defaults for a host/port pair: Localhost for loopback hosts, Unicast otherwise
     */
    static DeliveryConfig from_defaults(const std::string& host, UInt16 port);

    /**
     * @brief Copy with mode-implied fields applied
     *
     * Localhost forces host to 127.0.0.1. Whitespace around host and
     * interface is trimmed; an empty interface becomes nullopt.
     */
    DeliveryConfig normalized() const;

    /**
     * @brief Check invariants of a normalized configuration
     */
    ConfigResult validate() const;

    std::string to_string() const;

    bool operator==(const DeliveryConfig& other) const = default;
};

// ============================================================================
// JSON
// ============================================================================

/**
 * @brief Persisted form: {Mode, Host, Port, MulticastTtl, BindInterfaceName, Remember}
 */
void to_json(nlohmann::json& j, const DeliveryConfig& config);

/**
 * @brief Parse the persisted form
 * @throws nlohmann::json::exception on missing keys or wrong types
 * @throws std::runtime_error on unknown mode or out-of-range numbers
 */
void from_json(const nlohmann::json& j, DeliveryConfig& config);

} // namespace cotlink::network
