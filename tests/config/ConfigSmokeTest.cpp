#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>
#include <nlohmann/json.hpp>
#include "netfetch/config/NetfetchConfig.hpp"
#include "netfetch/log/Logging.hpp"

using netfetch::config::NetfetchConfig;

namespace {

template<typename Exception, typename Fn>
bool throws(Fn&& fn) {
    try {
        fn();
    } catch (const Exception&) {
        return true;
    }
    return false;
}

std::string writeFile(const std::string& name, const std::string& content) {
    const auto path = std::filesystem::temp_directory_path() / name;
    std::ofstream out(path, std::ios::trunc);
    out << content;
    return path.string();
}

} // namespace

void smokeTestDefaults() {
    NetfetchConfig config;
    assert(config.validate());
    assert(config.requester.autostartEnabled);
    assert(config.cache.hardLimitBytes == 200u * 1024 * 1024);
    assert(config.cache.targetSizeBytes == 150u * 1024 * 1024);
    assert(config.transport.connectTimeoutSeconds == 10);
    assert(config.logging.level == "info");
    assert(config.logging.filePath.empty());
    std::cout << "[OK] NetfetchConfig defaults\n";
}

void testPartialJson() {
    auto j = nlohmann::json::parse(R"({
        "requester": { "autostart": false },
        "cache": { "hardLimitBytes": 4096, "targetSizeBytes": 1024 },
        "logging": { "level": "debug" }
    })");
    auto config = NetfetchConfig::fromJson(j);
    assert(!config.requester.autostartEnabled);
    assert(config.requester.dispatchQueueSize == 65536);
    assert(config.cache.hardLimitBytes == 4096);
    assert(config.cache.targetSizeBytes == 1024);
    assert(config.transport.requestTimeoutSeconds == 60);
    assert(config.logging.level == "debug");

    auto restored = NetfetchConfig::fromJson(config.toJson());
    assert(restored.toJson() == config.toJson());
    std::cout << "[OK] NetfetchConfig partial json\n";
}

void testInvalidJson() {
    using nlohmann::json;
    assert(throws<std::invalid_argument>([] { NetfetchConfig::fromJson(json::array()); }));
    assert(throws<std::invalid_argument>([] {
        NetfetchConfig::fromJson(json::parse(R"({"cache": 5})"));
    }));
    assert(throws<std::invalid_argument>([] {
        NetfetchConfig::fromJson(json::parse(R"({"cache": {"hardLimitBytes": "big"}})"));
    }));
    // targetSize больше hardLimit
    assert(throws<std::invalid_argument>([] {
        NetfetchConfig::fromJson(json::parse(R"({"cache": {"hardLimitBytes": 10, "targetSizeBytes": 20}})"));
    }));
    assert(throws<std::invalid_argument>([] {
        NetfetchConfig::fromJson(json::parse(R"({"logging": {"level": "loud"}})"));
    }));
    assert(throws<std::invalid_argument>([] {
        NetfetchConfig::fromJson(json::parse(R"({"transport": {"connectTimeoutSeconds": 0}})"));
    }));
    // Отрицательные и дробные размеры не приводятся к size_t
    assert(throws<std::invalid_argument>([] {
        NetfetchConfig::fromJson(json::parse(R"({"cache": {"hardLimitBytes": -1}})"));
    }));
    assert(throws<std::invalid_argument>([] {
        NetfetchConfig::fromJson(json::parse(R"({"requester": {"dispatchQueueSize": -5}})"));
    }));
    assert(throws<std::invalid_argument>([] {
        NetfetchConfig::fromJson(json::parse(R"({"cache": {"targetSizeBytes": 1.5}})"));
    }));
    std::cout << "[OK] NetfetchConfig invalid json\n";
}

void testLoadConfigFile() {
    const auto good = writeFile("netfetch_config_good.json",
                                R"({"transport": {"maxTotalConnections": 4}, "requester": {"dispatchQueueSize": 128}})");
    auto config = netfetch::config::loadConfigFile(good);
    assert(config.transport.maxTotalConnections == 4);
    assert(config.requester.dispatchQueueSize == 128);

    const auto broken = writeFile("netfetch_config_broken.json", "{ not json");
    assert(throws<std::runtime_error>([&broken] { netfetch::config::loadConfigFile(broken); }));
    assert(throws<std::runtime_error>([] {
        netfetch::config::loadConfigFile("/netfetch/definitely/missing.json");
    }));

    std::filesystem::remove(good);
    std::filesystem::remove(broken);
    std::cout << "[OK] loadConfigFile\n";
}

void testLoggingSetup() {
    const auto logPath = std::filesystem::temp_directory_path() / "netfetch_logging_test.log";
    std::filesystem::remove(logPath);

    netfetch::log::LoggingConfig config;
    config.level = "debug";
    config.filePath = logPath.string();
    netfetch::log::initializeLogging(config);

    auto logger = netfetch::log::getLogger("cache");
    assert(logger == netfetch::log::getLogger("cache"));
    assert(logger->level() == spdlog::level::debug);
    logger->info("logging smoke test");
    logger->flush();
    assert(std::filesystem::exists(logPath));
    assert(std::filesystem::file_size(logPath) > 0);

    netfetch::log::LoggingConfig invalid;
    invalid.level = "verbose";
    assert(throws<std::invalid_argument>([&invalid] { netfetch::log::initializeLogging(invalid); }));

    // Вернуть вывод только в консоль
    netfetch::log::initializeLogging(netfetch::log::LoggingConfig{});
    std::filesystem::remove(logPath);
    std::cout << "[OK] Logging setup\n";
}

int main() {
    smokeTestDefaults();
    testPartialJson();
    testInvalidJson();
    testLoadConfigFile();
    testLoggingSetup();
    std::cout << "All config tests passed!\n";
    return 0;
}
