#pragma once

#include "core/types/Binding.hpp"
#include "infrastructure/config/ConfigManager.hpp"
#include "infrastructure/network/SnmpClient.hpp"

#include <filesystem>
#include <iosfwd>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace snmpwire::app {

/**
 * @brief Thrown for malformed command lines; the tool exits with status 2.
 */
class UsageError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

enum class Command { Get, GetNext, Bulk, Walk, BulkWalk };

std::optional<Command> commandFromString(const std::string& name);

/**
 * @brief Parsed command line of the snmpwire tool.
 *
 * Unset optionals leave the configured value in place.
 */
struct CommandLine {
    Command command{Command::Get};
    std::string address;
    std::vector<core::ObjectIdentifier> names;

    std::optional<std::string> community;
    std::optional<std::filesystem::path> configDir;
    std::optional<int32_t> nonRepeaters;
    std::optional<int32_t> maxRepetitions;
    bool verbose{false};
    bool help{false};
};

/**
 * @brief Parses argv.
 * @throws UsageError on unknown commands or options, a missing address or
 *         OID, or an OID that does not parse.
 */
CommandLine parseCommandLine(int argc, const char* const argv[]);

/// Help text listing commands and options.
std::string usage();

/**
 * @brief Applies command-line overrides on top of the loaded configuration.
 */
void applyOverrides(const CommandLine& cmd, infra::ClientConfig& config);

/**
 * @brief Runs @p cmd through @p client and prints one line per binding.
 * @throws core::SnmpError when a request fails.
 */
void runCommand(const CommandLine& cmd, infra::SnmpClient& client, std::ostream& out);

/**
 * @brief The snmpwire command-line tool.
 */
class Application {
public:
    /**
     * @brief Parses the command line and loads the configuration.
     * @throws UsageError on a malformed command line.
     */
    Application(int argc, const char* const argv[]);

    /**
     * @brief Executes the command.
     * @return Process exit status: 0 on success, 1 when the SNMP exchange failed.
     */
    int run();

    [[nodiscard]] const CommandLine& commandLine() const { return cmd_; }
    [[nodiscard]] const infra::ClientConfig& config() const { return config_->config(); }

private:
    void initializeLogging();

    CommandLine cmd_;
    std::unique_ptr<infra::ConfigManager> config_;
};

} // namespace snmpwire::app
