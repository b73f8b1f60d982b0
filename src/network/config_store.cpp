/**
 * @file config_store.cpp
 * @brief JSON file configuration store
 */

#include "cotlink/network/config_store.h"
#include "cotlink/core/log.h"
#include <nlohmann/json.hpp>
#include <cstdlib>
#include <fstream>
#include <stdexcept>
#include <system_error>

namespace cotlink::network {

JsonFileConfigStore::JsonFileConfigStore(std::filesystem::path path)
    : path_(std::move(path)) {}

std::filesystem::path JsonFileConfigStore::default_path() {
    if (const char* xdg = std::getenv("XDG_CONFIG_HOME"); xdg && *xdg) {
        return std::filesystem::path(xdg) / "cotlink" / "output.json";
    }
    if (const char* home = std::getenv("HOME"); home && *home) {
        return std::filesystem::path(home) / ".config" / "cotlink" / "output.json";
    }
    return std::filesystem::path("cotlink_output.json");
}

std::optional<DeliveryConfig> JsonFileConfigStore::load() {
    std::error_code ec;
    if (!std::filesystem::exists(path_, ec)) {
        return std::nullopt;
    }

    std::ifstream file(path_);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open config file: " + path_.string());
    }

    try {
        auto j = nlohmann::json::parse(file);
        return j.get<DeliveryConfig>();
    } catch (const nlohmann::json::exception& e) {
        throw std::runtime_error("Malformed config file " + path_.string() + ": " + e.what());
    }
}

bool JsonFileConfigStore::save(const DeliveryConfig& config) {
    std::error_code ec;
    if (path_.has_parent_path()) {
        std::filesystem::create_directories(path_.parent_path(), ec);
        if (ec) {
            log::get()->error("Cannot create config directory {}: {}",
                              path_.parent_path().string(), ec.message());
            return false;
        }
    }

    auto tmp = path_;
    tmp += ".tmp";

    {
        std::ofstream file(tmp, std::ios::trunc);
        if (!file.is_open()) {
            log::get()->error("Cannot write config file {}", tmp.string());
            return false;
        }
        file << nlohmann::json(config).dump(2) << '\n';
        if (!file.good()) {
            log::get()->error("Write to {} failed", tmp.string());
            return false;
        }
    }

    std::filesystem::rename(tmp, path_, ec);
    if (ec) {
        log::get()->error("Cannot replace config file {}: {}", path_.string(), ec.message());
        std::filesystem::remove(tmp, ec);
        return false;
    }

    log::get()->debug("Saved delivery config to {}", path_.string());
    return true;
}

} // namespace cotlink::network
