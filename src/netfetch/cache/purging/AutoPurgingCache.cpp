#include "netfetch/cache/purging/AutoPurgingCache.hpp"
#include "netfetch/log/Logging.hpp"
#include <algorithm>
#include <mutex>
#include <stdexcept>
#include <unordered_map>

namespace netfetch {
namespace cache {

// Реализация PIMPL
struct AutoPurgingCache::Impl {
    CacheConfig config;                                   // Границы кэша
    Clock clock;                                          // Источник времени обращений
    std::unordered_map<std::string, CacheEntry> entries;  // Записи кэша
    size_t currentSize = 0;                               // Сумма размеров всех записей
    uint64_t sequence = 0;                                // Счётчик обращений
    mutable std::mutex cacheMutex;                        // Мьютекс для записей и размера
    size_t hitCount = 0;
    size_t missCount = 0;
    size_t evictionCount = 0;
    size_t purgeCount = 0;

    Impl(const CacheConfig& cfg, Clock clk) : config(cfg), clock(std::move(clk)) {}

    void touch(CacheEntry& entry) {
        entry.lastAccessed = clock();
        entry.accessSequence = ++sequence;
    }

    void insert(const std::string& key, Payload&& payload) {
        auto it = entries.find(key);
        if (it != entries.end()) {
            currentSize -= it->second.payload.size();
            it->second.payload = std::move(payload);
        } else {
            CacheEntry entry;
            entry.key = key;
            entry.payload = std::move(payload);
            it = entries.emplace(key, std::move(entry)).first;
        }
        currentSize += it->second.payload.size();
        touch(it->second);

        log::getLogger("cache")->debug(
            "Данные сохранены в кэш: key={}, size={}, cacheSize={}",
            key, it->second.payload.size(), currentSize);
    }

    // Вызывается под cacheMutex
    size_t purgeLocked() {
        if (currentSize < config.hardLimitBytes) {
            return 0;
        }

        std::vector<const CacheEntry*> ordered;
        ordered.reserve(entries.size());
        for (const auto& item : entries) {
            ordered.push_back(&item.second);
        }
        std::sort(ordered.begin(), ordered.end(), [](const CacheEntry* a, const CacheEntry* b) {
            if (a->lastAccessed != b->lastAccessed) {
                return a->lastAccessed < b->lastAccessed;
            }
            return a->accessSequence < b->accessSequence;
        });

        const size_t sizeBefore = currentSize;
        std::vector<std::string> victims;
        for (const CacheEntry* entry : ordered) {
            if (currentSize <= config.targetSizeBytes) {
                break;
            }
            currentSize -= entry->payload.size();
            victims.push_back(entry->key);
        }
        // Указатели в ordered ссылаются на entries: удаляем только после обхода
        for (const auto& key : victims) {
            entries.erase(key);
        }

        evictionCount += victims.size();
        ++purgeCount;

        log::getLogger("cache")->info(
            "Очистка кэша: вытеснено {} записей, размер {} -> {} байт",
            victims.size(), sizeBefore, currentSize);
        return victims.size();
    }
};

AutoPurgingCache::AutoPurgingCache(const CacheConfig& config)
    : AutoPurgingCache(config, [] { return std::chrono::steady_clock::now(); }) {}

AutoPurgingCache::AutoPurgingCache(const CacheConfig& config, Clock clock) {
    if (!config.validate()) {
        throw std::invalid_argument("Некорректная конфигурация кэша: targetSize > hardLimit или hardLimit == 0");
    }
    if (!clock) {
        throw std::invalid_argument("AutoPurgingCache: источник времени не задан");
    }
    pImpl = std::make_unique<Impl>(config, std::move(clock));
    log::getLogger("cache")->debug(
        "AutoPurgingCache создан: hardLimit={}, targetSize={}",
        config.hardLimitBytes, config.targetSizeBytes);
}

AutoPurgingCache::~AutoPurgingCache() = default;

void AutoPurgingCache::add(const std::string& key, const Payload& payload) {
    add(key, Payload(payload));
}

void AutoPurgingCache::add(const std::string& key, Payload&& payload) {
    std::lock_guard<std::mutex> lock(pImpl->cacheMutex);
    pImpl->insert(key, std::move(payload));
    pImpl->purgeLocked();
}

std::optional<AutoPurgingCache::Payload> AutoPurgingCache::get(const std::string& key) {
    std::lock_guard<std::mutex> lock(pImpl->cacheMutex);
    auto it = pImpl->entries.find(key);
    if (it == pImpl->entries.end()) {
        ++pImpl->missCount;
        log::getLogger("cache")->debug("Кэш-промах: {}", key);
        return std::nullopt;
    }

    ++pImpl->hitCount;
    pImpl->touch(it->second);
    return it->second.payload;
}

void AutoPurgingCache::remove(const std::string& key) {
    std::lock_guard<std::mutex> lock(pImpl->cacheMutex);
    auto it = pImpl->entries.find(key);
    if (it == pImpl->entries.end()) {
        return;
    }
    pImpl->currentSize -= it->second.payload.size();
    pImpl->entries.erase(it);
    log::getLogger("cache")->debug("Запись удалена: {}", key);
}

void AutoPurgingCache::removeAll() {
    std::lock_guard<std::mutex> lock(pImpl->cacheMutex);
    const size_t removed = pImpl->entries.size();
    pImpl->entries.clear();
    pImpl->currentSize = 0;
    log::getLogger("cache")->info("Кэш очищен полностью: удалено {} записей", removed);
}

size_t AutoPurgingCache::purgeLeastUsed() {
    std::lock_guard<std::mutex> lock(pImpl->cacheMutex);
    return pImpl->purgeLocked();
}

bool AutoPurgingCache::contains(const std::string& key) const {
    std::lock_guard<std::mutex> lock(pImpl->cacheMutex);
    return pImpl->entries.count(key) != 0;
}

size_t AutoPurgingCache::cacheSize() const {
    std::lock_guard<std::mutex> lock(pImpl->cacheMutex);
    return pImpl->currentSize;
}

size_t AutoPurgingCache::entryCount() const {
    std::lock_guard<std::mutex> lock(pImpl->cacheMutex);
    return pImpl->entries.size();
}

size_t AutoPurgingCache::hardLimit() const {
    std::lock_guard<std::mutex> lock(pImpl->cacheMutex);
    return pImpl->config.hardLimitBytes;
}

size_t AutoPurgingCache::targetSize() const {
    std::lock_guard<std::mutex> lock(pImpl->cacheMutex);
    return pImpl->config.targetSizeBytes;
}

void AutoPurgingCache::setLimits(size_t hardLimitBytes, size_t targetSizeBytes) {
    CacheConfig config;
    config.hardLimitBytes = hardLimitBytes;
    config.targetSizeBytes = targetSizeBytes;
    if (!config.validate()) {
        throw std::invalid_argument("Некорректная конфигурация кэша: targetSize > hardLimit или hardLimit == 0");
    }

    std::lock_guard<std::mutex> lock(pImpl->cacheMutex);
    pImpl->config = config;
    log::getLogger("cache")->info(
        "Границы кэша обновлены: hardLimit={}, targetSize={}", hardLimitBytes, targetSizeBytes);
    pImpl->purgeLocked();
}

CacheMetrics AutoPurgingCache::getMetrics() const {
    std::lock_guard<std::mutex> lock(pImpl->cacheMutex);
    CacheMetrics metrics;
    metrics.currentSize = pImpl->currentSize;
    metrics.hardLimit = pImpl->config.hardLimitBytes;
    metrics.targetSize = pImpl->config.targetSizeBytes;
    metrics.entryCount = pImpl->entries.size();
    metrics.hitCount = pImpl->hitCount;
    metrics.missCount = pImpl->missCount;
    metrics.evictionCount = pImpl->evictionCount;
    metrics.purgeCount = pImpl->purgeCount;
    const size_t requests = pImpl->hitCount + pImpl->missCount;
    metrics.hitRate = requests == 0 ? 0.0 : static_cast<double>(pImpl->hitCount) / requests;
    metrics.lastUpdate = std::chrono::steady_clock::now();
    return metrics;
}

} // namespace cache
} // namespace netfetch
