#pragma once
/**
 * @file output_service.h
 * @brief Process-scoped owner of the active CoT output
 *
 * The service holds at most one active Broadcaster. Reconfiguration is
 * swap-then-dispose: the replacement is fully built before it is
 * published, and the previous one is drained and released afterwards.
 * A rejected configuration never disturbs the active one.
 *
 * Usage:
 * @code
 * OutputService output(std::make_shared<JsonFileConfigStore>(JsonFileConfigStore::default_path()));
 * output.ensure_initialized_from("127.0.0.1", 4242);
 * output.enqueue(event.to_xml());
 *
 * auto result = output.configure_and_start(DeliveryConfig::multicast(), true);
 * if (result != ConfigResult::Success) {
 *     std::cerr << config_result_to_string(result) << "\n";
 * }
 * @endcode
 */

#include "cotlink/core/log.h"
#include "cotlink/network/broadcaster.h"
#include "cotlink/network/config_store.h"
#include "cotlink/network/delivery_config.h"
#include "cotlink/network/transport.h"
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

namespace cotlink::network {

/**
 * @brief Builds an initialized transport for a validated configuration
 * @return nullptr if the transport could not be opened
 */
using TransportFactory = std::function<std::unique_ptr<ITransport>(const DeliveryConfig&)>;

/**
 * @brief Default factory: UDP unicast for Localhost/Unicast, UDP multicast for Multicast
 */
std::unique_ptr<ITransport> create_transport(const DeliveryConfig& config);

class OutputService {
public:
    /**
     * @param store Remembered-configuration storage; nullptr disables persistence
     * @param factory Transport factory
     */
    explicit OutputService(std::shared_ptr<IConfigStore> store = nullptr,
                           TransportFactory factory = create_transport,
                           BroadcasterOptions options = {});

    /// Calls shutdown()
    ~OutputService();

    OutputService(const OutputService&) = delete;
    OutputService& operator=(const OutputService&) = delete;

    /**
     * @brief Validate, start and publish a new configuration
     *
     * On any error other than PersistFailed nothing changes. PersistFailed
     * means the new configuration is active but could not be remembered.
     */
    ConfigResult configure_and_start(const DeliveryConfig& config, bool persist);

    /**
     * @brief Start output if nothing is configured yet
     *
     * Prefers the remembered configuration; otherwise uses host:port
     * (Localhost mode for loopback hosts, Unicast otherwise).
     */
    ConfigResult ensure_initialized_from(const std::string& default_host, UInt16 default_port);

    /**
     * @brief Hand a payload to the active broadcaster
     * @return False if output is not configured
     */
    bool enqueue(std::vector<UInt8> payload);
    bool enqueue(std::string_view text);

    std::optional<DeliveryConfig> current_config() const;
    bool is_running() const;

    /// Counters of the active broadcaster (zero when not running)
    BroadcasterStats stats() const;

    /**
     * @brief Dispose the active broadcaster; idempotent
     */
    void shutdown();

    void set_dispose_grace(std::chrono::milliseconds grace) noexcept { dispose_grace_ = grace; }

private:
    ConfigResult apply(const DeliveryConfig& config, bool persist);
    std::shared_ptr<Broadcaster> active() const;

    std::shared_ptr<IConfigStore> store_;
    TransportFactory factory_;
    BroadcasterOptions options_;
    std::chrono::milliseconds dispose_grace_{DEFAULT_DISPOSE_GRACE};

    // Serializes configure / shutdown calls
    std::mutex config_mutex_;

    // Guards active_ and active_config_
    mutable std::mutex active_mutex_;
    std::shared_ptr<Broadcaster> active_;
    std::optional<DeliveryConfig> active_config_;

    log::OnceFlag not_configured_reported_;
};

} // namespace cotlink::network
