#pragma once

#include "infrastructure/network/SnmpClient.hpp"

#include <filesystem>
#include <nlohmann/json.hpp>
#include <string>

namespace snmpwire::infra {

/**
 * @brief User-configurable settings of the snmpwire tool.
 */
struct ClientConfig {
    // Agent defaults
    std::string community{"public"}; ///< Community string sent with requests.
    uint16_t port{161};              ///< Agent port when the address has none.

    // Bulk and walk tunables
    ClientOptions options; ///< GetBulk repetitions and walk iteration cap.

    // Logging
    std::string logLevel{"info"}; ///< spdlog level name ("debug", "info", ...).
    std::string logFile;          ///< Rotating log file path; empty disables it.

    bool operator==(const ClientConfig& other) const = default;
};

/**
 * @brief Manages configuration persistence.
 *
 * Loads and saves ClientConfig as JSON in <configDir>/snmpwire.json.
 */
class ConfigManager {
public:
    /**
     * @brief Constructs a ConfigManager for the specified config directory.
     * @param configDir Path to the configuration directory (created if missing).
     */
    explicit ConfigManager(const std::filesystem::path& configDir);

    /**
     * @brief Loads configuration from disk, writing defaults when the file
     *        does not exist.
     * @return True if loaded successfully, false otherwise (defaults are kept).
     */
    bool load();

    /**
     * @brief Saves configuration to disk.
     * @return True if saved successfully, false otherwise.
     */
    bool save();

    ClientConfig& config() { return config_; }
    const ClientConfig& config() const { return config_; }

    std::filesystem::path configPath() const { return configPath_; }

    /**
     * @brief Returns the default configuration directory
     *        ($XDG_CONFIG_HOME/snmpwire or ~/.config/snmpwire).
     */
    static std::filesystem::path defaultConfigDir();

private:
    nlohmann::json toJson() const;
    static ClientConfig fromJson(const nlohmann::json& j);

    std::filesystem::path configDir_;
    std::filesystem::path configPath_;
    ClientConfig config_;
};

} // namespace snmpwire::infra
