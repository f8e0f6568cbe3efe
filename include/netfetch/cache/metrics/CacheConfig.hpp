#pragma once

#include <cstddef>

namespace netfetch {
namespace cache {

// Конфигурация авто-очищаемого кэша
struct CacheConfig {
    // Размер (байт), при достижении которого запускается очистка
    size_t hardLimitBytes = 200 * 1024 * 1024;
    // Размер (байт), до которого очистка сокращает кэш
    size_t targetSizeBytes = 150 * 1024 * 1024;

    bool validate() const {
        if (hardLimitBytes == 0) return false;
        if (targetSizeBytes > hardLimitBytes) return false;
        return true;
    }
};

} // namespace cache
} // namespace netfetch
