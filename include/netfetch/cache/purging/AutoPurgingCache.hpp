#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "netfetch/cache/base/BaseCache.hpp"
#include "netfetch/cache/metrics/CacheConfig.hpp"
#include "netfetch/cache/metrics/CacheMetrics.hpp"

namespace netfetch {
namespace cache {

// Запись кэша
struct CacheEntry {
    std::string key;
    std::vector<uint8_t> payload;
    std::chrono::steady_clock::time_point lastAccessed;
    // Порядковый номер последнего обращения; упорядочивает записи с равным lastAccessed
    uint64_t accessSequence = 0;
};

/**
 * @brief Ограниченный по размеру кэш в памяти с вытеснением давно неиспользуемых записей.
 * @details Две границы: при достижении hardLimit запускается очистка, которая
 * удаляет самые старые (по времени последнего обращения) записи, пока размер
 * не станет не больше targetSize. Все операции потокобезопасны.
 */
class AutoPurgingCache : public BaseCache<std::string, std::vector<uint8_t>> {
public:
    using Payload = std::vector<uint8_t>;
    // Источник времени для lastAccessed
    using Clock = std::function<std::chrono::steady_clock::time_point()>;

    /// @throws std::invalid_argument если targetSizeBytes > hardLimitBytes или hardLimitBytes == 0
    explicit AutoPurgingCache(const CacheConfig& config = CacheConfig{});
    /// То же, с собственным источником времени (по умолчанию steady_clock::now)
    AutoPurgingCache(const CacheConfig& config, Clock clock);
    ~AutoPurgingCache() override;

    AutoPurgingCache(const AutoPurgingCache&) = delete;
    AutoPurgingCache& operator=(const AutoPurgingCache&) = delete;

    /**
     * @brief Добавить или заменить запись и при необходимости очистить кэш.
     * Запись, которая сама больше hardLimit, тоже принимается; очистка
     * вытеснит всё остальное.
     */
    void add(const std::string& key, const Payload& payload) override;
    void add(const std::string& key, Payload&& payload);

    /// Вернуть данные и обновить время обращения. std::nullopt, если записи нет.
    std::optional<Payload> get(const std::string& key) override;

    /// Удалить запись, если она есть.
    void remove(const std::string& key) override;

    /// Удалить все записи. Обработчик сигнала нехватки памяти.
    void removeAll() override;

    /**
     * @brief Вытеснить самые старые записи, если размер достиг hardLimit.
     * Вызывается после каждого add(); можно вызывать и напрямую.
     * @return количество вытесненных записей
     */
    size_t purgeLeastUsed();

    // Проверка наличия без обновления времени обращения
    bool contains(const std::string& key) const;

    // Текущий суммарный размер данных (байт)
    size_t cacheSize() const;
    size_t entryCount() const override;

    size_t hardLimit() const;
    size_t targetSize() const;

    // Изменить границы; после изменения выполняется очистка
    void setLimits(size_t hardLimitBytes, size_t targetSizeBytes);

    CacheMetrics getMetrics() const;

private:
    // Реализация PIMPL
    struct Impl;
    std::unique_ptr<Impl> pImpl;
};

} // namespace cache
} // namespace netfetch
