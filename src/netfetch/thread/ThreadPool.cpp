#include "netfetch/thread/ThreadPool.hpp"
#include "netfetch/log/Logging.hpp"
#include <algorithm>
#include <stdexcept>
#include <system_error>

namespace netfetch {
namespace thread {

// Реализация PIMPL
struct ThreadPool::Impl {
    std::vector<std::thread> workers;           // Рабочие потоки
    std::queue<std::function<void()>> tasks;    // Очередь задач
    mutable std::mutex queueMutex;              // Мьютекс для очереди
    std::condition_variable condition;          // Пробуждение рабочих потоков
    std::condition_variable idle;               // Пробуждение ожидающих завершения
    bool stop;                                  // Флаг остановки (под queueMutex)
    std::atomic<size_t> activeThreads;          // Количество активных потоков
    std::atomic<size_t> completedTasks;         // Количество выполненных задач
    ThreadPoolConfig config;                    // Конфигурация пула потоков

    explicit Impl(const ThreadPoolConfig& cfg)
        : stop(false), activeThreads(0), completedTasks(0), config(cfg) {}

    // Каждый рабочий поток держит shared_ptr на Impl: пул, разрушенный из
    // собственной задачи, освобождается только после выхода этого потока
    static void startWorkers(const std::shared_ptr<Impl>& self) {
        self->workers.reserve(self->config.threadCount);
        for (size_t i = 0; i < self->config.threadCount; ++i) {
            self->workers.emplace_back([self] {
                self->processTasks();
            });
        }

        log::getLogger("threadpool")->debug(
            "Пул потоков '{}' инициализирован: {} потоков",
            self->config.name, self->workers.size()
        );
    }

    void shutdown() {
        const auto current = std::this_thread::get_id();
        const bool fromWorker = std::any_of(workers.begin(), workers.end(),
            [current](const std::thread& worker) { return worker.get_id() == current; });

        // Разрушаются вне queueMutex
        std::queue<std::function<void()>> droppedTasks;
        {
            std::unique_lock<std::mutex> lock(queueMutex);
            stop = true;
            if (fromWorker) {
                // Владелец пула уничтожается: оставшиеся задачи выполнять нельзя
                droppedTasks.swap(tasks);
            }
        }
        const size_t dropped = droppedTasks.size();
        condition.notify_all();
        idle.notify_all();

        if (dropped > 0) {
            log::getLogger("threadpool")->warn(
                "Пул '{}' остановлен из собственной задачи: отброшено {} задач", config.name, dropped);
        }

        for (auto& worker : workers) {
            if (!worker.joinable()) continue;
            // Присоединиться к себе нельзя: поток завершится после возврата из задачи
            if (worker.get_id() == current) {
                worker.detach();
            } else {
                worker.join();
            }
        }
    }

    void processTasks() {
        while (true) {
            std::function<void()> task;
            {
                std::unique_lock<std::mutex> lock(queueMutex);
                condition.wait(lock, [this] {
                    return stop || !tasks.empty();
                });

                if (stop && tasks.empty()) {
                    return;
                }

                task = std::move(tasks.front());
                tasks.pop();
                ++activeThreads;
            }

            try {
                task();
            } catch (const std::exception& e) {
                log::getLogger("threadpool")->error(
                    "Ошибка выполнения задачи в пуле '{}': {}", config.name, e.what());
            }

            {
                std::unique_lock<std::mutex> lock(queueMutex);
                --activeThreads;
                ++completedTasks;
            }
            idle.notify_all();
        }
    }
};

// Конструктор
ThreadPool::ThreadPool(const ThreadPoolConfig& config) {
    if (!config.validate()) {
        throw std::invalid_argument("Некорректная конфигурация пула потоков");
    }
    pImpl = std::make_shared<Impl>(config);
    try {
        Impl::startWorkers(pImpl);
    } catch (const std::system_error&) {
        // Уже запущенные потоки держат Impl: останавливаем их до выхода
        pImpl->shutdown();
        throw;
    }
}

// Деструктор
ThreadPool::~ThreadPool() {
    pImpl->shutdown();
}

// Добавление задачи в очередь
void ThreadPool::enqueue(std::function<void()> task) {
    if (!task) return;

    {
        std::unique_lock<std::mutex> lock(pImpl->queueMutex);

        if (pImpl->stop) {
            throw std::runtime_error("Пул потоков '" + pImpl->config.name + "' остановлен");
        }

        // Проверка размера очереди
        if (pImpl->tasks.size() >= pImpl->config.queueSize) {
            log::getLogger("threadpool")->error(
                "Очередь задач пула '{}' переполнена ({} задач)",
                pImpl->config.name, pImpl->tasks.size());
            throw std::runtime_error("Очередь задач переполнена");
        }

        pImpl->tasks.push(std::move(task));
    }
    pImpl->condition.notify_one();
}

// Получение количества активных потоков
size_t ThreadPool::getActiveThreadCount() const {
    return pImpl->activeThreads.load();
}

// Получение размера очереди
size_t ThreadPool::getQueueSize() const {
    std::unique_lock<std::mutex> lock(pImpl->queueMutex);
    return pImpl->tasks.size();
}

// Проверка пустоты очереди
bool ThreadPool::isQueueEmpty() const {
    std::unique_lock<std::mutex> lock(pImpl->queueMutex);
    return pImpl->tasks.empty();
}

bool ThreadPool::isWorkerThread() const {
    const auto self = std::this_thread::get_id();
    return std::any_of(pImpl->workers.begin(), pImpl->workers.end(),
                       [self](const std::thread& worker) { return worker.get_id() == self; });
}

// Ожидание завершения всех задач
void ThreadPool::waitForCompletion() {
    if (isWorkerThread()) {
        throw std::logic_error("waitForCompletion() вызван из рабочего потока пула");
    }

    std::unique_lock<std::mutex> lock(pImpl->queueMutex);
    pImpl->idle.wait(lock, [this] {
        return pImpl->tasks.empty() && pImpl->activeThreads.load() == 0;
    });
}

// Остановка пула потоков
void ThreadPool::stop() {
    pImpl->shutdown();
    log::getLogger("threadpool")->debug("Пул потоков '{}' остановлен", pImpl->config.name);
}

// Получение метрик
ThreadPoolMetrics ThreadPool::getMetrics() const {
    ThreadPoolMetrics metrics;
    metrics.activeThreads = pImpl->activeThreads.load();
    metrics.queueSize = getQueueSize();
    metrics.totalThreads = pImpl->workers.size();
    metrics.completedTasks = pImpl->completedTasks.load();
    return metrics;
}

ThreadPoolConfig ThreadPool::getConfiguration() const {
    return pImpl->config;
}

} // namespace thread
} // namespace netfetch
