#pragma once
/**
 * @file config_store.h
 * @brief Persistence of the remembered delivery configuration
 */

#include "cotlink/network/delivery_config.h"
#include <filesystem>
#include <optional>

namespace cotlink::network {

/**
 * @brief Storage for the remembered delivery configuration
 */
class IConfigStore {
public:
    virtual ~IConfigStore() = default;

    /**
     * @brief Load the remembered configuration
     * @return nullopt if nothing is stored
     * @throws std::runtime_error if stored data is malformed
     */
    virtual std::optional<DeliveryConfig> load() = 0;

    /**
     * @brief Store a configuration, replacing any previous one
     * @return False if the write failed
     */
    virtual bool save(const DeliveryConfig& config) = 0;
};

/**
 * @brief JSON file store
 *
 * Writes go to a sibling temporary file that is renamed over the target,
 * so a crash never leaves a truncated document behind.
 */
class JsonFileConfigStore : public IConfigStore {
public:
    explicit JsonFileConfigStore(std::filesystem::path path);

    /**
     * @brief $XDG_CONFIG_HOME/cotlink/output.json, else ~/.config/cotlink/output.json
     */
    static std::filesystem::path default_path();

    std::optional<DeliveryConfig> load() override;
    bool save(const DeliveryConfig& config) override;

    const std::filesystem::path& path() const noexcept { return path_; }

private:
    std::filesystem::path path_;
};

} // namespace cotlink::network
