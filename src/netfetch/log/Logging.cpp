#include "netfetch/log/Logging.hpp"
#include <mutex>
#include <stdexcept>
#include <vector>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace netfetch {
namespace log {

namespace {

struct LoggingState {
    std::mutex mutex;
    std::vector<spdlog::sink_ptr> sinks;
    spdlog::level::level_enum level = spdlog::level::info;
};

LoggingState& state() {
    static LoggingState instance;
    return instance;
}

// Вызывается под state().mutex
std::vector<spdlog::sink_ptr>& defaultSinks(LoggingState& s) {
    if (s.sinks.empty()) {
        auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
        console_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%n] [%t] %v");
        s.sinks.push_back(console_sink);
    }
    return s.sinks;
}

std::shared_ptr<spdlog::logger> makeLogger(LoggingState& s, const std::string& name) {
    auto& sinks = defaultSinks(s);
    auto logger = std::make_shared<spdlog::logger>(name, sinks.begin(), sinks.end());
    logger->set_level(s.level);
    spdlog::register_logger(logger);
    return logger;
}

} // namespace

void initializeLogging(const LoggingConfig& config) {
    if (!config.validate()) {
        throw std::invalid_argument("Некорректная конфигурация логирования");
    }

    auto& s = state();
    std::lock_guard<std::mutex> lock(s.mutex);

    std::vector<spdlog::sink_ptr> sinks;

    // Console sink
    auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    console_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%n] [%t] %v");
    sinks.push_back(console_sink);

    // File sink
    if (!config.filePath.empty()) {
        auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            config.filePath, config.maxFileSize, config.maxFiles);
        file_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] [%n] [%t] %v");
        sinks.push_back(file_sink);
    }

    s.sinks = std::move(sinks);
    s.level = spdlog::level::from_str(config.level);

    // Пересоздаём уже зарегистрированные логгеры с новыми sinks
    std::vector<std::string> names;
    spdlog::apply_all([&names](const std::shared_ptr<spdlog::logger>& logger) {
        if (!logger->name().empty()) {
            names.push_back(logger->name());
        }
    });
    for (const auto& name : names) {
        spdlog::drop(name);
        makeLogger(s, name);
    }
    spdlog::set_level(s.level);
}

std::shared_ptr<spdlog::logger> getLogger(const std::string& name) {
    auto logger = spdlog::get(name);
    if (logger) {
        return logger;
    }

    auto& s = state();
    std::lock_guard<std::mutex> lock(s.mutex);
    logger = spdlog::get(name);
    if (!logger) {
        logger = makeLogger(s, name);
    }
    return logger;
}

} // namespace log
} // namespace netfetch
