/**
 * @file output_service.cpp
 * @brief Output service implementation
 */

#include "cotlink/network/output_service.h"
#include <stdexcept>

namespace cotlink::network {

// ============================================================================
// Default Transport Factory
// ============================================================================

std::unique_ptr<ITransport> create_transport(const DeliveryConfig& config) {
    Endpoint endpoint(config.host, config.port);

    if (config.mode == DeliveryMode::Multicast) {
        auto transport = std::make_unique<UdpMulticastTransport>();
        MulticastOptions options;
        options.ttl = config.multicast_ttl.value_or(DEFAULT_MULTICAST_TTL);
        options.interface = config.bind_interface.value_or("");

        auto result = transport->initialize(endpoint, options);
        if (result != TransportResult::Success) {
            log::get()->error("Multicast transport to {} failed: {}",
                              endpoint.to_string(), transport_result_to_string(result));
            return nullptr;
        }
        return transport;
    }

    if (config.bind_interface) {
        log::get()->info("Interface '{}' is ignored for {} delivery",
                         *config.bind_interface, delivery_mode_to_string(config.mode));
    }

    auto transport = std::make_unique<UdpUnicastTransport>();
    auto result = transport->initialize(endpoint);
    if (result != TransportResult::Success) {
        log::get()->error("Unicast transport to {} failed: {}",
                          endpoint.to_string(), transport_result_to_string(result));
        return nullptr;
    }
    return transport;
}

// ============================================================================
// OutputService
// ============================================================================

OutputService::OutputService(std::shared_ptr<IConfigStore> store,
                             TransportFactory factory,
                             BroadcasterOptions options)
    : store_(std::move(store))
    , factory_(std::move(factory))
    , options_(options) {
    if (!factory_) {
        throw std::invalid_argument("OutputService requires a transport factory");
    }
}

OutputService::~OutputService() {
    shutdown();
}

ConfigResult OutputService::configure_and_start(const DeliveryConfig& config, bool persist) {
    std::lock_guard<std::mutex> lock(config_mutex_);
    return apply(config, persist);
}

ConfigResult OutputService::ensure_initialized_from(const std::string& default_host, UInt16 default_port) {
    std::lock_guard<std::mutex> lock(config_mutex_);

    if (active()) {
        return ConfigResult::Success;
    }

    if (store_) {
        try {
            if (auto remembered = store_->load()) {
                auto normalized = remembered->normalized();
                auto check = normalized.validate();
                if (check == ConfigResult::Success) {
                    auto result = apply(normalized, false);
                    if (result == ConfigResult::Success) {
                        log::get()->info("Using remembered CoT output: {}", normalized.to_string());
                        return result;
                    }
                    log::get()->warn("Remembered CoT output {} could not start ({}), using defaults",
                                     normalized.to_string(), config_result_to_string(result));
                } else {
                    log::get()->warn("Remembered CoT output {} is invalid ({}), using defaults",
                                     normalized.to_string(), config_result_to_string(check));
                }
            }
        } catch (const std::exception& e) {
            log::get()->warn("Could not read remembered CoT output: {}", e.what());
        }
    }

    return apply(DeliveryConfig::from_defaults(default_host, default_port), false);
}

ConfigResult OutputService::apply(const DeliveryConfig& requested, bool persist) {
    auto config = requested.normalized();
    config.persist = persist;

    auto check = config.validate();
    if (check != ConfigResult::Success) {
        log::get()->warn("Rejected CoT output {}: {}", config.to_string(), config_result_to_string(check));
        return check;
    }

    std::unique_ptr<ITransport> transport;
    try {
        transport = factory_(config);
    } catch (const std::exception& e) {
        log::get()->error("Transport factory failed for {}: {}", config.to_string(), e.what());
        return ConfigResult::TransportCreationFailed;
    }
    if (!transport) {
        return ConfigResult::TransportCreationFailed;
    }

    auto replacement = std::make_shared<Broadcaster>(std::move(transport), options_);

    std::shared_ptr<Broadcaster> previous;
    {
        std::lock_guard<std::mutex> lock(active_mutex_);
        previous = std::move(active_);
        active_ = std::move(replacement);
        active_config_ = config;
    }
    not_configured_reported_.reset();

    if (previous) {
        previous->dispose(dispose_grace_);
    }

    log::get()->info("CoT output active: {}", config.to_string());

    if (persist && store_) {
        if (!store_->save(config)) {
            return ConfigResult::PersistFailed;
        }
    }

    return ConfigResult::Success;
}

bool OutputService::enqueue(std::vector<UInt8> payload) {
    auto broadcaster = active();
    if (!broadcaster) {
        if (not_configured_reported_.first_time()) {
            log::get()->warn("CoT output is not configured, events are dropped");
        }
        return false;
    }

    // A reconfiguration may dispose the broadcaster fetched above before the
    // push lands; follow the swap until the refusing broadcaster is current.
    while (broadcaster) {
        if (broadcaster->enqueue(std::move(payload))) {
            return true;
        }
        auto current = active();
        if (current == broadcaster) {
            break;
        }
        broadcaster = std::move(current);
    }
    return false;
}

bool OutputService::enqueue(std::string_view text) {
    return enqueue(std::vector<UInt8>(text.begin(), text.end()));
}

std::optional<DeliveryConfig> OutputService::current_config() const {
    std::lock_guard<std::mutex> lock(active_mutex_);
    return active_config_;
}

bool OutputService::is_running() const {
    auto broadcaster = active();
    return broadcaster && broadcaster->is_running();
}

BroadcasterStats OutputService::stats() const {
    auto broadcaster = active();
    return broadcaster ? broadcaster->stats() : BroadcasterStats{};
}

void OutputService::shutdown() {
    std::lock_guard<std::mutex> lock(config_mutex_);

    std::shared_ptr<Broadcaster> previous;
    {
        std::lock_guard<std::mutex> active_lock(active_mutex_);
        previous = std::move(active_);
        active_.reset();
        active_config_.reset();
    }

    if (previous) {
        previous->dispose(dispose_grace_);
    }
}

std::shared_ptr<Broadcaster> OutputService::active() const {
    std::lock_guard<std::mutex> lock(active_mutex_);
    return active_;
}

} // namespace cotlink::network
