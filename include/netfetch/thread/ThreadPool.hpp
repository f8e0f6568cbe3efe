#pragma once

#include <vector>
#include <queue>
#include <functional>
#include <thread>
#include <mutex>
#include <condition_variable>
#include <atomic>
#include <memory>
#include <string>

namespace netfetch {
namespace thread {

// Структура для хранения метрик пула потоков
struct ThreadPoolMetrics {
    size_t activeThreads;    // Количество активных потоков
    size_t queueSize;        // Размер очереди задач
    size_t totalThreads;     // Общее количество потоков
    size_t completedTasks;   // Количество выполненных задач
};

// Структура для конфигурации пула потоков
struct ThreadPoolConfig {
    std::string name = "threadpool"; // Имя пула (используется в логах)
    size_t threadCount = 1;          // Количество рабочих потоков
    size_t queueSize = 10000;        // Максимальный размер очереди

    bool validate() const {
        if (threadCount == 0) return false;
        if (queueSize == 0) return false;
        return true;
    }
};

// Пул потоков. С одним рабочим потоком задачи выполняются строго в порядке постановки.
class ThreadPool {
public:
    // Конструктор с конфигурацией
    explicit ThreadPool(const ThreadPoolConfig& config);

    // Деструктор (дожидается выполнения уже поставленных задач).
    // Допускается вызов из задачи этого пула: задачи, ещё стоящие в очереди,
    // отбрасываются, рабочий поток завершается после возврата из текущей задачи.
    ~ThreadPool();

    // Запрет копирования
    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    // Добавление задачи в очередь.
    // Бросает std::runtime_error при переполнении очереди или после stop().
    void enqueue(std::function<void()> task);

    // Получение количества активных потоков
    size_t getActiveThreadCount() const;

    // Получение размера очереди
    size_t getQueueSize() const;

    // Проверка пустоты очереди
    bool isQueueEmpty() const;

    // Вызывается ли код из рабочего потока этого пула
    bool isWorkerThread() const;

    // Ожидание завершения всех задач
    void waitForCompletion();

    // Остановка пула потоков (из задачи пула - см. деструктор)
    void stop();

    // Получение метрик
    ThreadPoolMetrics getMetrics() const;

    // Получение текущей конфигурации
    ThreadPoolConfig getConfiguration() const;

private:
    // Реализация PIMPL; рабочие потоки держат свою ссылку на Impl
    struct Impl;
    std::shared_ptr<Impl> pImpl;
};

} // namespace thread
} // namespace netfetch
