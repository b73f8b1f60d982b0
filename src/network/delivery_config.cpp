/**
 * @file delivery_config.cpp
 * @brief Delivery configuration implementation
 */

#include "cotlink/network/delivery_config.h"
#include "cotlink/network/transport.h"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <cctype>
#include <sstream>
#include <stdexcept>

namespace cotlink::network {

namespace {

std::string trim(const std::string& value) {
    auto begin = std::find_if_not(value.begin(), value.end(),
                                  [](unsigned char c) { return std::isspace(c); });
    auto end = std::find_if_not(value.rbegin(), value.rend(),
                                [](unsigned char c) { return std::isspace(c); }).base();
    return begin < end ? std::string(begin, end) : std::string();
}

std::string to_lower(std::string_view value) {
    std::string out(value);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

} // anonymous namespace

const char* delivery_mode_to_string(DeliveryMode mode) noexcept {
    switch (mode) {
        case DeliveryMode::Localhost: return "Localhost";
        case DeliveryMode::Unicast: return "Unicast";
        case DeliveryMode::Multicast: return "Multicast";
        default: return "Unknown";
    }
}

std::optional<DeliveryMode> parse_delivery_mode(std::string_view name) {
    auto lower = to_lower(name);
    if (lower == "localhost") return DeliveryMode::Localhost;
    if (lower == "unicast") return DeliveryMode::Unicast;
    if (lower == "multicast") return DeliveryMode::Multicast;
    return std::nullopt;
}

const char* config_result_to_string(ConfigResult result) noexcept {
    switch (result) {
        case ConfigResult::Success: return "Success";
        case ConfigResult::InvalidPort: return "InvalidPort";
        case ConfigResult::InvalidHost: return "InvalidHost";
        case ConfigResult::InvalidMulticastGroup: return "InvalidMulticastGroup";
        case ConfigResult::InvalidTtl: return "InvalidTtl";
        case ConfigResult::TransportCreationFailed: return "TransportCreationFailed";
        case ConfigResult::PersistFailed: return "PersistFailed";
        default: return "Unknown";
    }
}

// ============================================================================
// DeliveryConfig
// ============================================================================

DeliveryConfig DeliveryConfig::from_defaults(const std::string& host, UInt16 port) {
    if (is_loopback_host(trim(host))) {
        return localhost(port);
    }
    return unicast(host, port);
}

DeliveryConfig DeliveryConfig::normalized() const {
    DeliveryConfig out = *this;
    out.host = trim(host);

    if (out.mode == DeliveryMode::Localhost) {
        out.host = "127.0.0.1";
    }

    if (out.bind_interface) {
        auto name = trim(*out.bind_interface);
        out.bind_interface = name.empty() ? std::nullopt : std::optional<std::string>(name);
    }

    return out;
}

ConfigResult DeliveryConfig::validate() const {
    if (port == 0) {
        return ConfigResult::InvalidPort;
    }

    switch (mode) {
        case DeliveryMode::Localhost:
            if (!is_loopback_host(host)) {
                return ConfigResult::InvalidHost;
            }
            break;
        case DeliveryMode::Unicast:
            if (host.empty() || host.find_first_of(" \t") != std::string::npos) {
                return ConfigResult::InvalidHost;
            }
            if (is_valid_ipv4(host) && is_multicast_ipv4(host)) {
                return ConfigResult::InvalidHost;
            }
            break;
        case DeliveryMode::Multicast:
            if (!is_multicast_ipv4(host)) {
                return ConfigResult::InvalidMulticastGroup;
            }
            if (multicast_ttl && *multicast_ttl == 0) {
                return ConfigResult::InvalidTtl;
            }
            break;
        default:
            return ConfigResult::InvalidHost;
    }

    return ConfigResult::Success;
}

std::string DeliveryConfig::to_string() const {
    std::ostringstream oss;
    oss << delivery_mode_to_string(mode) << " " << host << ":" << port;
    if (mode == DeliveryMode::Multicast) {
        oss << " ttl=" << static_cast<int>(multicast_ttl.value_or(DEFAULT_MULTICAST_TTL));
    }
    if (bind_interface) {
        oss << " if=" << *bind_interface;
    }
    return oss.str();
}

// ============================================================================
// JSON
// ============================================================================

void to_json(nlohmann::json& j, const DeliveryConfig& config) {
    j = nlohmann::json{
        {"Mode", delivery_mode_to_string(config.mode)},
        {"Host", config.host},
        {"Port", config.port},
        {"MulticastTtl", nullptr},
        {"BindInterfaceName", nullptr},
        {"Remember", config.persist}
    };
    if (config.multicast_ttl) {
        j["MulticastTtl"] = *config.multicast_ttl;
    }
    if (config.bind_interface) {
        j["BindInterfaceName"] = *config.bind_interface;
    }
}

void from_json(const nlohmann::json& j, DeliveryConfig& config) {
    auto mode = parse_delivery_mode(j.at("Mode").get<std::string>());
    if (!mode) {
        throw std::runtime_error("Unknown delivery mode: " + j.at("Mode").get<std::string>());
    }

    auto port = j.at("Port").get<Int64>();
    if (port < 0 || port > 65535) {
        throw std::runtime_error("Port out of range: " + std::to_string(port));
    }

    config.mode = *mode;
    config.host = j.at("Host").get<std::string>();
    config.port = static_cast<UInt16>(port);

    config.multicast_ttl.reset();
    if (j.contains("MulticastTtl") && !j["MulticastTtl"].is_null()) {
        auto ttl = j["MulticastTtl"].get<Int64>();
        if (ttl < 0 || ttl > 255) {
            throw std::runtime_error("MulticastTtl out of range: " + std::to_string(ttl));
        }
        config.multicast_ttl = static_cast<UInt8>(ttl);
    }

    config.bind_interface.reset();
    if (j.contains("BindInterfaceName") && !j["BindInterfaceName"].is_null()) {
        config.bind_interface = j["BindInterfaceName"].get<std::string>();
    }

    config.persist = j.value("Remember", true);
}

} // namespace cotlink::network
