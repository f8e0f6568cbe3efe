#pragma once
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <chrono>
#include <nlohmann/json.hpp>

namespace netfetch {
namespace transfer {

struct TransferMetrics {
    size_t createdCount = 0;        // Создано передач
    size_t startedCount = 0;        // Запущено
    size_t finishedCount = 0;       // Завершено успешно
    size_t failedCount = 0;         // Завершено с ошибкой транспорта
    size_t canceledCount = 0;       // Отменено
    size_t activeCount = 0;         // Сейчас в реестре
    size_t droppedEventCount = 0;   // Событий без соответствующей передачи
    uint64_t bytesReceived = 0;     // Всего получено байт
    std::chrono::steady_clock::time_point lastUpdate;

    nlohmann::json toJson() const {
        return {
            {"createdCount", createdCount},
            {"startedCount", startedCount},
            {"finishedCount", finishedCount},
            {"failedCount", failedCount},
            {"canceledCount", canceledCount},
            {"activeCount", activeCount},
            {"droppedEventCount", droppedEventCount},
            {"bytesReceived", bytesReceived},
            {"lastUpdate", std::chrono::duration_cast<std::chrono::milliseconds>(lastUpdate.time_since_epoch()).count()}
        };
    }
};

namespace detail {

// Счётчики, общие для координатора и его передач
struct TransferCounters {
    std::atomic<size_t> created{0};
    std::atomic<size_t> started{0};
    std::atomic<size_t> finished{0};
    std::atomic<size_t> failed{0};
    std::atomic<size_t> canceled{0};
    std::atomic<size_t> dropped{0};
    std::atomic<uint64_t> bytesReceived{0};
};

} // namespace detail

} // namespace transfer
} // namespace netfetch
