#pragma once

#include <cstddef>
#include <memory>
#include <string>
#include <spdlog/spdlog.h>

namespace netfetch {
namespace log {

// Конфигурация логирования
struct LoggingConfig {
    std::string level = "info";          // trace, debug, info, warn, error, critical, off
    std::string filePath;                // пусто = только консоль
    size_t maxFileSize = 1024 * 1024 * 5;
    size_t maxFiles = 3;

    bool validate() const {
        if (!filePath.empty() && (maxFileSize == 0 || maxFiles == 0)) return false;
        return spdlog::level::from_str(level) != spdlog::level::off || level == "off";
    }
};

/**
 * @brief Настроить общие sinks для всех именованных логгеров.
 * @details Уже созданные логгеры пересоздаются с новыми sinks.
 * @throws std::invalid_argument при некорректной конфигурации
 */
void initializeLogging(const LoggingConfig& config);

/**
 * @brief Получить именованный логгер ("cache", "requester", "transport", ...).
 * Создаёт логгер при первом обращении; безопасно вызывать из любого потока.
 */
std::shared_ptr<spdlog::logger> getLogger(const std::string& name);

} // namespace log
} // namespace netfetch
