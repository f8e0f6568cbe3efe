#pragma once

#include <string>
#include <nlohmann/json.hpp>
#include "netfetch/cache/metrics/CacheConfig.hpp"
#include "netfetch/log/Logging.hpp"
#include "netfetch/transfer/RequestCoordinator.hpp"
#include "netfetch/transport/CurlTransport.hpp"

namespace netfetch {
namespace config {

/**
 * @brief Конфигурация процесса. Создаётся один раз при запуске и передаётся
 * компонентам явно.
 *
 * Пример файла:
 * @code
 * {
 *   "requester": { "autostart": true },
 *   "cache": { "hardLimitBytes": 209715200, "targetSizeBytes": 157286400 },
 *   "transport": { "connectTimeoutSeconds": 10, "requestTimeoutSeconds": 60 },
 *   "logging": { "level": "info", "file": "logs/netfetch.log" }
 * }
 * @endcode
 * Отсутствующие ключи сохраняют значения по умолчанию.
 */
struct NetfetchConfig {
    transfer::RequesterConfig requester;
    cache::CacheConfig cache;
    transport::CurlTransportConfig transport;
    log::LoggingConfig logging;

    bool validate() const {
        return requester.validate() && cache.validate() && transport.validate() && logging.validate();
    }

    nlohmann::json toJson() const;

    /// @throws std::invalid_argument если значения некорректны или имеют неверный тип
    static NetfetchConfig fromJson(const nlohmann::json& j);
};

/// Загрузить конфигурацию из JSON-файла.
/// @throws std::runtime_error если файл не открывается или не разбирается
/// @throws std::invalid_argument если конфигурация некорректна
NetfetchConfig loadConfigFile(const std::string& path);

} // namespace config
} // namespace netfetch
