#pragma once
#include <cstddef>
#include <chrono>
#include <nlohmann/json.hpp>

namespace netfetch {
namespace cache {

struct CacheMetrics {
    size_t currentSize = 0;         // Текущий размер кэша (байт)
    size_t hardLimit = 0;           // Порог запуска очистки (байт)
    size_t targetSize = 0;          // Размер после очистки (байт)
    size_t entryCount = 0;          // Количество записей
    size_t hitCount = 0;            // Количество попаданий
    size_t missCount = 0;           // Количество промахов
    size_t evictionCount = 0;       // Количество вытеснений
    size_t purgeCount = 0;          // Количество запусков очистки
    double hitRate = 0.0;           // Частота попаданий
    std::chrono::steady_clock::time_point lastUpdate; // Время последнего обновления

    nlohmann::json toJson() const {
        return {
            {"currentSize", currentSize},
            {"hardLimit", hardLimit},
            {"targetSize", targetSize},
            {"entryCount", entryCount},
            {"hitCount", hitCount},
            {"missCount", missCount},
            {"evictionCount", evictionCount},
            {"purgeCount", purgeCount},
            {"hitRate", hitRate},
            {"lastUpdate", std::chrono::duration_cast<std::chrono::milliseconds>(lastUpdate.time_since_epoch()).count()}
        };
    }
};

} // namespace cache
} // namespace netfetch
