#include "app/Application.hpp"

#include "core/types/SnmpErrors.hpp"
#include "infrastructure/network/SnmpTransport.hpp"

#include <boost/program_options.hpp>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <iostream>
#include <sstream>
#include <string>

namespace snmpwire::app {

namespace po = boost::program_options;

namespace {

po::options_description optionsDescription() {
    po::options_description desc("Options");
    desc.add_options()
        ("help,h", "produce help message")
        ("community,c", po::value<std::string>(), "community string")
        ("config", po::value<std::string>(), "configuration directory")
        ("non-repeaters", po::value<int32_t>(), "GetBulk non-repeaters")
        ("max-repetitions", po::value<int32_t>(), "GetBulk max-repetitions")
        ("verbose,v", po::bool_switch()->default_value(false), "log at debug level");
    return desc;
}

bool isBulkCommand(Command command) {
    return command == Command::Bulk || command == Command::BulkWalk;
}

void printBindings(const std::vector<core::Binding>& bindings, std::ostream& out) {
    for (const auto& binding : bindings) {
        out << binding.toString() << '\n';
    }
}

} // anonymous namespace

std::optional<Command> commandFromString(const std::string& name) {
    if (name == "get") return Command::Get;
    if (name == "getnext") return Command::GetNext;
    if (name == "bulk") return Command::Bulk;
    if (name == "walk") return Command::Walk;
    if (name == "bulkwalk") return Command::BulkWalk;
    return std::nullopt;
}

std::string usage() {
    std::ostringstream ss;
    ss << "Usage: snmpwire <get|getnext|bulk|walk|bulkwalk> <host[:port]> <oid>... [options]\n\n"
       << optionsDescription();
    return ss.str();
}

CommandLine parseCommandLine(int argc, const char* const argv[]) {
    po::options_description hidden;
    hidden.add_options()
        ("command", po::value<std::string>())
        ("address", po::value<std::string>())
        ("oid", po::value<std::vector<std::string>>());

    po::options_description all;
    all.add(optionsDescription()).add(hidden);

    po::positional_options_description positional;
    positional.add("command", 1).add("address", 1).add("oid", -1);

    po::variables_map vm;
    try {
        po::store(po::command_line_parser(argc, argv).options(all).positional(positional).run(),
                  vm);
        po::notify(vm);
    } catch (const po::error& e) {
        throw UsageError(e.what());
    }

    CommandLine cmd;
    if (vm.count("help")) {
        cmd.help = true;
        return cmd;
    }

    if (!vm.count("command")) {
        throw UsageError("missing command");
    }
    auto command = commandFromString(vm["command"].as<std::string>());
    if (!command) {
        throw UsageError("unknown command: " + vm["command"].as<std::string>());
    }
    cmd.command = *command;

    if (!vm.count("address")) {
        throw UsageError("missing agent address");
    }
    cmd.address = vm["address"].as<std::string>();

    if (!vm.count("oid")) {
        throw UsageError("missing object identifier");
    }
    for (const auto& text : vm["oid"].as<std::vector<std::string>>()) {
        try {
            cmd.names.push_back(core::ObjectIdentifier::fromString(text));
        } catch (const std::invalid_argument& e) {
            throw UsageError(e.what());
        }
    }

    if (vm.count("community")) {
        cmd.community = vm["community"].as<std::string>();
    }
    if (vm.count("config")) {
        cmd.configDir = vm["config"].as<std::string>();
    }
    if (vm.count("non-repeaters")) {
        cmd.nonRepeaters = vm["non-repeaters"].as<int32_t>();
    }
    if (vm.count("max-repetitions")) {
        cmd.maxRepetitions = vm["max-repetitions"].as<int32_t>();
    }
    cmd.verbose = vm["verbose"].as<bool>();

    if ((cmd.nonRepeaters && *cmd.nonRepeaters < 0) ||
        (cmd.maxRepetitions && *cmd.maxRepetitions < 0)) {
        throw UsageError("repetition counts must not be negative");
    }
    if (isBulkCommand(cmd.command) && cmd.maxRepetitions && *cmd.maxRepetitions < 1) {
        throw UsageError("--max-repetitions must be at least 1 for bulk requests");
    }

    return cmd;
}

void applyOverrides(const CommandLine& cmd, infra::ClientConfig& config) {
    if (cmd.community) {
        config.community = *cmd.community;
    }
    if (cmd.nonRepeaters) {
        config.options.nonRepeaters = *cmd.nonRepeaters;
    }
    if (cmd.maxRepetitions) {
        config.options.maxRepetitions = *cmd.maxRepetitions;
    }
    if (cmd.verbose) {
        config.logLevel = "debug";
    }
}

void runCommand(const CommandLine& cmd, infra::SnmpClient& client, std::ostream& out) {
    const auto& options = client.options();
    if (isBulkCommand(cmd.command) && options.maxRepetitions < 1) {
        throw UsageError("max repetitions must be at least 1 for bulk requests, got " +
                         std::to_string(options.maxRepetitions));
    }

    switch (cmd.command) {
        case Command::Get:
            printBindings(client.get(cmd.names), out);
            break;
        case Command::GetNext:
            printBindings(client.getNext(cmd.names), out);
            break;
        case Command::Bulk:
            printBindings(client.getBulk(cmd.names, options.nonRepeaters, options.maxRepetitions),
                          out);
            break;
        case Command::Walk:
            for (const auto& root : cmd.names) {
                printBindings(client.walk(root), out);
            }
            break;
        case Command::BulkWalk:
            for (const auto& root : cmd.names) {
                printBindings(client.bulkWalk(root, options.maxRepetitions), out);
            }
            break;
    }
}

Application::Application(int argc, const char* const argv[]) : cmd_(parseCommandLine(argc, argv)) {
    // Keep stdout for results until the configured logger is installed.
    spdlog::set_level(cmd_.verbose ? spdlog::level::debug : spdlog::level::warn);

    config_ = std::make_unique<infra::ConfigManager>(
        cmd_.configDir.value_or(infra::ConfigManager::defaultConfigDir()));
    config_->load();
    applyOverrides(cmd_, config_->config());

    initializeLogging();
}

void Application::initializeLogging() {
    const auto& cfg = config_->config();

    auto level = spdlog::level::from_str(cfg.logLevel);
    if (level == spdlog::level::off && cfg.logLevel != "off") {
        level = spdlog::level::info;
    }

    auto consoleSink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    consoleSink->set_level(level);

    std::vector<spdlog::sink_ptr> sinks{consoleSink};
    if (!cfg.logFile.empty()) {
        auto fileSink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            cfg.logFile, 5 * 1024 * 1024, 3);
        fileSink->set_level(spdlog::level::debug);
        sinks.push_back(fileSink);
    }

    auto logger = std::make_shared<spdlog::logger>("snmpwire", sinks.begin(), sinks.end());
    logger->set_level(cfg.logFile.empty() ? level : spdlog::level::debug);
    spdlog::set_default_logger(logger);

    spdlog::debug("Using configuration {}", config_->configPath().string());
}

int Application::run() {
    if (cmd_.help) {
        std::cout << usage();
        return 0;
    }

    const auto& cfg = config_->config();
    try {
        auto transport = infra::makeUdpTransport(cmd_.address, cfg.community, cfg.port);
        infra::SnmpClient client(transport, cfg.options);
        runCommand(cmd_, client, std::cout);
    } catch (const core::SnmpError& e) {
        spdlog::error("{}", e.what());
        return 1;
    }
    return 0;
}

} // namespace snmpwire::app
