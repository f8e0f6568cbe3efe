#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <vector>
#include "netfetch/cache/base/BaseCache.hpp"

namespace netfetch {
namespace cache {

/**
 * @brief Рассылка сигнала нехватки памяти подписанным кэшам.
 * @details Источник сигнала (обработчик ОС, таймер, пользователь) вызывает notify(),
 * каждый подписанный кэш получает removeAll(). Кэши хранятся по weak_ptr:
 * уничтоженный кэш просто пропускается.
 */
class MemoryPressureNotifier {
public:
    using ByteCache = BaseCache<std::string, std::vector<uint8_t>>;

    // Подписка; отписывает кэш при разрушении
    class Subscription {
    public:
        Subscription() = default;
        ~Subscription();
        Subscription(Subscription&& other) noexcept;
        Subscription& operator=(Subscription&& other) noexcept;
        Subscription(const Subscription&) = delete;
        Subscription& operator=(const Subscription&) = delete;

        // Отписаться досрочно
        void reset();
        bool active() const;

    private:
        friend class MemoryPressureNotifier;
        struct State;
        Subscription(std::weak_ptr<State> state, uint64_t id);

        std::weak_ptr<State> state_;
        uint64_t id_ = 0;
    };

    MemoryPressureNotifier();
    ~MemoryPressureNotifier();

    MemoryPressureNotifier(const MemoryPressureNotifier&) = delete;
    MemoryPressureNotifier& operator=(const MemoryPressureNotifier&) = delete;

    [[nodiscard]] Subscription subscribe(const std::shared_ptr<ByteCache>& cache);

    // Очистить все подписанные кэши. Возвращает число очищенных кэшей.
    size_t notify();

    size_t subscriberCount() const;

private:
    std::shared_ptr<Subscription::State> state_;
};

} // namespace cache
} // namespace netfetch
