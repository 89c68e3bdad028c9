#include <catch2/catch_test_macros.hpp>

#include "infrastructure/config/ConfigManager.hpp"

#include <nlohmann/json.hpp>

#include <filesystem>
#include <fstream>
#include <string>

using namespace snmpwire::infra;

namespace {

class TestConfigDir {
public:
    TestConfigDir()
        : configDir_(std::filesystem::temp_directory_path() / "snmpwire_config_test") {
        cleanup();
        std::filesystem::create_directories(configDir_);
    }

    ~TestConfigDir() { cleanup(); }

    std::filesystem::path path() const { return configDir_; }

    void write(const std::string& text) const {
        std::ofstream file(configDir_ / "snmpwire.json");
        file << text;
    }

private:
    void cleanup() {
        if (std::filesystem::exists(configDir_)) {
            std::filesystem::remove_all(configDir_);
        }
    }

    std::filesystem::path configDir_;
};

} // namespace

TEST_CASE("ConfigManager constructor", "[ConfigManager]") {
    SECTION("Creates config directory if it does not exist") {
        auto tempPath = std::filesystem::temp_directory_path() / "snmpwire_config_new_test";
        std::filesystem::remove_all(tempPath);

        REQUIRE_FALSE(std::filesystem::exists(tempPath));

        ConfigManager manager(tempPath);

        REQUIRE(std::filesystem::is_directory(tempPath));

        std::filesystem::remove_all(tempPath);
    }

    SECTION("Sets correct config path") {
        TestConfigDir testDir;
        ConfigManager manager(testDir.path());

        REQUIRE(manager.configPath() == testDir.path() / "snmpwire.json");
    }
}

TEST_CASE("ConfigManager default values", "[ConfigManager]") {
    TestConfigDir testDir;
    ConfigManager manager(testDir.path());
    const auto& config = manager.config();

    REQUIRE(config.community == "public");
    REQUIRE(config.port == 161);
    REQUIRE(config.options.nonRepeaters == 0);
    REQUIRE(config.options.maxRepetitions == 10);
    REQUIRE(config.options.walkMaxIterations == 1000);
    REQUIRE(config.logLevel == "info");
    REQUIRE(config.logFile.empty());
}

TEST_CASE("ConfigManager load", "[ConfigManager]") {
    TestConfigDir testDir;

    SECTION("Writes defaults when the file is missing") {
        ConfigManager manager(testDir.path());

        REQUIRE(manager.load());
        REQUIRE(std::filesystem::exists(manager.configPath()));

        std::ifstream file(manager.configPath());
        auto j = nlohmann::json::parse(file);
        REQUIRE(j["agent"]["community"].get<std::string>() == "public");
        REQUIRE(j["bulk"]["max_repetitions"].get<int>() == 10);
        REQUIRE(j["walk"]["max_iterations"].get<int>() == 1000);
    }

    SECTION("Reads every section") {
        testDir.write(R"({
            "agent": {"community": "private", "port": 1161},
            "bulk": {"non_repeaters": 1, "max_repetitions": 50},
            "walk": {"max_iterations": 20},
            "logging": {"level": "debug", "file": "/tmp/snmpwire.log"}
        })");

        ConfigManager manager(testDir.path());
        REQUIRE(manager.load());

        const auto& config = manager.config();
        REQUIRE(config.community == "private");
        REQUIRE(config.port == 1161);
        REQUIRE(config.options.nonRepeaters == 1);
        REQUIRE(config.options.maxRepetitions == 50);
        REQUIRE(config.options.walkMaxIterations == 20);
        REQUIRE(config.logLevel == "debug");
        REQUIRE(config.logFile == "/tmp/snmpwire.log");
    }

    SECTION("Missing keys fall back to defaults") {
        testDir.write(R"({"agent": {"community": "ops"}})");

        ConfigManager manager(testDir.path());
        REQUIRE(manager.load());
        REQUIRE(manager.config().community == "ops");
        REQUIRE(manager.config().port == 161);
        REQUIRE(manager.config().options == ClientOptions{});
    }

    SECTION("Malformed JSON keeps defaults") {
        testDir.write("{ not json");

        ConfigManager manager(testDir.path());
        REQUIRE_FALSE(manager.load());
        REQUIRE(manager.config() == ClientConfig{});
    }

    SECTION("Wrong value types keep defaults") {
        testDir.write(R"({"agent": {"community": "ops", "port": "snmp"}})");

        ConfigManager manager(testDir.path());
        REQUIRE_FALSE(manager.load());
        REQUIRE(manager.config() == ClientConfig{});
    }
}

TEST_CASE("ConfigManager save", "[ConfigManager]") {
    TestConfigDir testDir;

    ConfigManager writer(testDir.path());
    writer.config().community = "monitoring";
    writer.config().options.maxRepetitions = 25;
    writer.config().logFile = "/var/log/snmpwire.log";
    REQUIRE(writer.save());

    ConfigManager reader(testDir.path());
    REQUIRE(reader.load());
    REQUIRE(reader.config() == writer.config());
}
