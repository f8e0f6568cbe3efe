#include "netfetch/cache/manager/MemoryPressureNotifier.hpp"
#include "netfetch/log/Logging.hpp"
#include <mutex>
#include <unordered_map>

namespace netfetch {
namespace cache {

struct MemoryPressureNotifier::Subscription::State {
    mutable std::mutex mutex;
    std::unordered_map<uint64_t, std::weak_ptr<ByteCache>> caches;
    uint64_t nextId = 1;

    void unsubscribe(uint64_t id) {
        std::lock_guard<std::mutex> lock(mutex);
        caches.erase(id);
    }
};

MemoryPressureNotifier::Subscription::Subscription(std::weak_ptr<State> state, uint64_t id)
    : state_(std::move(state)), id_(id) {}

MemoryPressureNotifier::Subscription::~Subscription() {
    reset();
}

MemoryPressureNotifier::Subscription::Subscription(Subscription&& other) noexcept
    : state_(std::move(other.state_)), id_(other.id_) {
    other.id_ = 0;
}

MemoryPressureNotifier::Subscription&
MemoryPressureNotifier::Subscription::operator=(Subscription&& other) noexcept {
    if (this != &other) {
        reset();
        state_ = std::move(other.state_);
        id_ = other.id_;
        other.id_ = 0;
    }
    return *this;
}

void MemoryPressureNotifier::Subscription::reset() {
    if (auto state = state_.lock()) {
        state->unsubscribe(id_);
    }
    state_.reset();
    id_ = 0;
}

bool MemoryPressureNotifier::Subscription::active() const {
    auto state = state_.lock();
    if (!state) return false;
    std::lock_guard<std::mutex> lock(state->mutex);
    return state->caches.count(id_) != 0;
}

MemoryPressureNotifier::MemoryPressureNotifier()
    : state_(std::make_shared<Subscription::State>()) {}

MemoryPressureNotifier::~MemoryPressureNotifier() = default;

MemoryPressureNotifier::Subscription
MemoryPressureNotifier::subscribe(const std::shared_ptr<ByteCache>& cache) {
    std::lock_guard<std::mutex> lock(state_->mutex);
    const uint64_t id = state_->nextId++;
    state_->caches.emplace(id, cache);
    log::getLogger("cache")->debug("Кэш подписан на сигнал нехватки памяти: id={}", id);
    return Subscription(state_, id);
}

size_t MemoryPressureNotifier::notify() {
    // Снимок под мьютексом, removeAll() вне его
    std::vector<std::shared_ptr<ByteCache>> targets;
    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        for (auto it = state_->caches.begin(); it != state_->caches.end();) {
            if (auto cache = it->second.lock()) {
                targets.push_back(std::move(cache));
                ++it;
            } else {
                it = state_->caches.erase(it);
            }
        }
    }

    log::getLogger("cache")->warn("Сигнал нехватки памяти: очистка {} кэшей", targets.size());
    for (const auto& cache : targets) {
        cache->removeAll();
    }
    return targets.size();
}

size_t MemoryPressureNotifier::subscriberCount() const {
    std::lock_guard<std::mutex> lock(state_->mutex);
    return state_->caches.size();
}

} // namespace cache
} // namespace netfetch
