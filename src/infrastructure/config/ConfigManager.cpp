#include "infrastructure/config/ConfigManager.hpp"

#include <spdlog/spdlog.h>

#include <cstdlib>
#include <fstream>

namespace snmpwire::infra {

ConfigManager::ConfigManager(const std::filesystem::path& configDir) : configDir_(configDir) {
    if (!std::filesystem::exists(configDir_)) {
        std::filesystem::create_directories(configDir_);
    }

    configPath_ = configDir_ / "snmpwire.json";
}

bool ConfigManager::load() {
    if (!std::filesystem::exists(configPath_)) {
        spdlog::info("Config file not found, using defaults");
        return save();
    }

    try {
        std::ifstream file(configPath_);
        if (!file) {
            spdlog::error("Failed to open config file: {}", configPath_.string());
            return false;
        }

        nlohmann::json j;
        file >> j;

        config_ = fromJson(j);

        spdlog::debug("Loaded configuration from {}", configPath_.string());
        return true;
    } catch (const std::exception& e) {
        spdlog::error("Failed to load config: {}", e.what());
        return false;
    }
}

bool ConfigManager::save() {
    try {
        auto j = toJson();

        std::ofstream file(configPath_);
        if (!file) {
            spdlog::error("Failed to open config file for writing: {}", configPath_.string());
            return false;
        }

        file << j.dump(2);
        spdlog::debug("Saved configuration to {}", configPath_.string());
        return true;
    } catch (const std::exception& e) {
        spdlog::error("Failed to save config: {}", e.what());
        return false;
    }
}

nlohmann::json ConfigManager::toJson() const {
    nlohmann::json j;

    // Agent
    j["agent"]["community"] = config_.community;
    j["agent"]["port"] = config_.port;

    // Bulk
    j["bulk"]["non_repeaters"] = config_.options.nonRepeaters;
    j["bulk"]["max_repetitions"] = config_.options.maxRepetitions;

    // Walk
    j["walk"]["max_iterations"] = config_.options.walkMaxIterations;

    // Logging
    j["logging"]["level"] = config_.logLevel;
    j["logging"]["file"] = config_.logFile;

    return j;
}

ClientConfig ConfigManager::fromJson(const nlohmann::json& j) {
    const ClientConfig defaults;
    ClientConfig config;

    // Agent
    if (j.contains("agent")) {
        const auto& a = j["agent"];
        config.community = a.value("community", defaults.community);
        config.port = a.value("port", defaults.port);
    }

    // Bulk
    if (j.contains("bulk")) {
        const auto& b = j["bulk"];
        config.options.nonRepeaters = b.value("non_repeaters", defaults.options.nonRepeaters);
        config.options.maxRepetitions =
            b.value("max_repetitions", defaults.options.maxRepetitions);
    }

    // Walk
    if (j.contains("walk")) {
        const auto& w = j["walk"];
        config.options.walkMaxIterations =
            w.value("max_iterations", defaults.options.walkMaxIterations);
    }

    // Logging
    if (j.contains("logging")) {
        const auto& l = j["logging"];
        config.logLevel = l.value("level", defaults.logLevel);
        config.logFile = l.value("file", defaults.logFile);
    }

    return config;
}

std::filesystem::path ConfigManager::defaultConfigDir() {
    if (const char* xdg = std::getenv("XDG_CONFIG_HOME"); xdg && *xdg) {
        return std::filesystem::path(xdg) / "snmpwire";
    }
    if (const char* home = std::getenv("HOME"); home && *home) {
        return std::filesystem::path(home) / ".config" / "snmpwire";
    }
    return std::filesystem::temp_directory_path() / "snmpwire";
}

} // namespace snmpwire::infra
