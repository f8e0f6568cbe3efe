#include "netfetch/transfer/RequestCoordinator.hpp"
#include "netfetch/log/Logging.hpp"
#include "netfetch/thread/ThreadPool.hpp"
#include <atomic>
#include <condition_variable>
#include <mutex>
#include <stdexcept>
#include <unordered_map>
#include <vector>
#include <spdlog/fmt/fmt.h>

namespace netfetch {
namespace transfer {

namespace {

// Уникален даже для передач одного url, созданных в один момент
std::string makeTransferId(const std::string& url) {
    static std::atomic<uint32_t> sequence{0};
    const auto now = std::chrono::system_clock::now().time_since_epoch();
    const double seconds = std::chrono::duration<double>(now).count();
    return fmt::format("{}-{:.6f}-{:08x}", url, seconds, ++sequence);
}

} // namespace

// Реализация PIMPL
struct RequestCoordinator::Impl : public transport::TransportListener {
    RequesterConfig config;
    std::atomic<bool> autostart;
    std::shared_ptr<transport::Transport> transport;
    std::shared_ptr<detail::TransferCounters> counters;

    mutable std::mutex registryMutex;
    std::condition_variable registryEmpty;
    std::unordered_map<transport::OperationId, std::shared_ptr<TransferHandle>> registry;

    // Контекст диспетчеризации: один поток, события обрабатываются по порядку
    std::unique_ptr<thread::ThreadPool> dispatcher;

    Impl(std::shared_ptr<transport::Transport> t, const RequesterConfig& cfg)
        : config(cfg)
        , autostart(cfg.autostartEnabled)
        , transport(std::move(t))
        , counters(std::make_shared<detail::TransferCounters>()) {
        thread::ThreadPoolConfig poolConfig;
        poolConfig.name = "requester-dispatch";
        poolConfig.threadCount = 1;
        poolConfig.queueSize = config.dispatchQueueSize;
        dispatcher = std::make_unique<thread::ThreadPool>(poolConfig);
    }

    ~Impl() override {
        // Сначала отключаем доставку событий, затем дорабатываем очередь
        transport->setListener(nullptr);
        dispatcher->stop();
    }

    // Поток транспорта: только постановка в очередь
    void onTransportEvent(transport::TransportEvent event) override {
        const auto op = event.operation;
        try {
            dispatcher->enqueue([this, ev = std::move(event)]() mutable {
                handleEvent(ev);
            });
        } catch (const std::exception& e) {
            ++counters->dropped;
            log::getLogger("requester")->error(
                "Событие транспорта для операции {} потеряно: {}", op, e.what());
        }
    }

    std::shared_ptr<TransferHandle> find(transport::OperationId op) const {
        std::lock_guard<std::mutex> lock(registryMutex);
        auto it = registry.find(op);
        return it == registry.end() ? nullptr : it->second;
    }

    void unregister(transport::OperationId op) {
        {
            std::lock_guard<std::mutex> lock(registryMutex);
            registry.erase(op);
            if (!registry.empty()) {
                return;
            }
        }
        registryEmpty.notify_all();
    }

    void handleEvent(transport::TransportEvent& event) {
        switch (event.kind) {
            case transport::TransportEvent::Kind::ResponseReceived:
                handleResponse(event);
                break;
            case transport::TransportEvent::Kind::DataReceived:
                handleData(event);
                break;
            case transport::TransportEvent::Kind::Completed:
                handleCompleted(event);
                break;
        }
    }

    void handleResponse(const transport::TransportEvent& event) {
        auto handle = find(event.operation);
        if (!handle) {
            ++counters->dropped;
            log::getLogger("requester")->warn(
                "Ответ для неизвестной операции {}: операция прерывается", event.operation);
            transport->cancel(event.operation);
            return;
        }

        handle->recordResponse(event.expectedSize);
        transport->proceed(event.operation);
        log::getLogger("requester")->debug(
            "Ответ получен: id={}, expectedSize={}", handle->id(), event.expectedSize);
    }

    void handleData(const transport::TransportEvent& event) {
        auto handle = find(event.operation);
        if (!handle) {
            ++counters->dropped;
            log::getLogger("requester")->debug(
                "Данные для неизвестной операции {} отброшены ({} байт)",
                event.operation, event.chunk.size());
            return;
        }

        auto progress = handle->appendChunk(event.chunk);
        if (!progress) {
            return;
        }
        invoke(*handle, "progress", [&handle, &progress] {
            if (handle->progressCallback()) handle->progressCallback()(*progress);
        });
    }

    void handleCompleted(const transport::TransportEvent& event) {
        auto handle = find(event.operation);
        if (!handle) {
            ++counters->dropped;
            log::getLogger("requester")->debug(
                "Завершение неизвестной операции {} отброшено", event.operation);
            return;
        }

        std::vector<uint8_t> data;
        std::optional<TransferError> error = event.error;
        if (!handle->complete(error, data)) {
            return;
        }
        unregister(event.operation);

        if (error) {
            log::getLogger("requester")->info(
                "Передача завершена с ошибкой: id={}, status={}, reason={}",
                handle->id(), toString(handle->status()), error->reason);
        } else {
            log::getLogger("requester")->info(
                "Передача завершена: id={}, status={}, size={}",
                handle->id(), toString(handle->status()), data.size());
        }

        invoke(*handle, "progress", [&handle] {
            if (handle->progressCallback()) handle->progressCallback()(1.0);
        });
        invoke(*handle, "completion", [&handle, &data, &error] {
            if (handle->completionCallback()) handle->completionCallback()(data, error);
        });
    }

    template<typename Fn>
    void invoke(const TransferHandle& handle, const char* what, Fn&& fn) {
        try {
            fn();
        } catch (const std::exception& e) {
            log::getLogger("requester")->error(
                "Исключение в обработчике {} передачи {}: {}", what, handle.id(), e.what());
        }
    }
};

RequestCoordinator::RequestCoordinator(std::shared_ptr<transport::Transport> transport,
                                       const RequesterConfig& config) {
    if (!transport) {
        throw std::invalid_argument("RequestCoordinator: транспорт не задан");
    }
    if (!config.validate()) {
        throw std::invalid_argument("Некорректная конфигурация координатора запросов");
    }

    pImpl = std::make_unique<Impl>(std::move(transport), config);
    pImpl->transport->setListener(pImpl.get());

    log::getLogger("requester")->info(
        "RequestCoordinator инициализирован: autostart={}", config.autostartEnabled);
}

RequestCoordinator::~RequestCoordinator() = default;

std::shared_ptr<TransferHandle> RequestCoordinator::newTransfer(const std::string& url,
                                                                ProgressCallback progressCallback,
                                                                CompletionCallback completionCallback) {
    const auto op = pImpl->transport->createOperation(url);
    std::shared_ptr<TransferHandle> handle(new TransferHandle(
        makeTransferId(url),
        url,
        op,
        pImpl->transport,
        pImpl->counters,
        std::move(progressCallback),
        std::move(completionCallback)));

    {
        std::lock_guard<std::mutex> lock(pImpl->registryMutex);
        pImpl->registry.emplace(op, handle);
    }
    ++pImpl->counters->created;

    log::getLogger("requester")->debug("Передача создана: id={}, op={}", handle->id(), op);

    if (pImpl->autostart.load()) {
        handle->start();
    }
    return handle;
}

bool RequestCoordinator::autostartEnabled() const {
    return pImpl->autostart.load();
}

void RequestCoordinator::setAutostart(bool enabled) {
    pImpl->autostart.store(enabled);
}

size_t RequestCoordinator::activeTransferCount() const {
    std::lock_guard<std::mutex> lock(pImpl->registryMutex);
    return pImpl->registry.size();
}

std::shared_ptr<TransferHandle> RequestCoordinator::findTransfer(const std::string& id) const {
    std::lock_guard<std::mutex> lock(pImpl->registryMutex);
    for (const auto& item : pImpl->registry) {
        if (item.second->id() == id) {
            return item.second;
        }
    }
    return nullptr;
}

size_t RequestCoordinator::cancelAll() {
    std::vector<std::shared_ptr<TransferHandle>> handles;
    {
        std::lock_guard<std::mutex> lock(pImpl->registryMutex);
        handles.reserve(pImpl->registry.size());
        for (const auto& item : pImpl->registry) {
            handles.push_back(item.second);
        }
    }

    size_t canceled = 0;
    for (const auto& handle : handles) {
        if (handle->status() == TransferStatus::Started) {
            handle->cancel();
            ++canceled;
        }
    }
    log::getLogger("requester")->info("Отменено передач: {}", canceled);
    return canceled;
}

void RequestCoordinator::waitForIdle() {
    pImpl->dispatcher->waitForCompletion();
}

bool RequestCoordinator::waitForAll(std::chrono::milliseconds timeout) {
    if (pImpl->dispatcher->isWorkerThread()) {
        throw std::logic_error("waitForAll() нельзя вызывать из обратного вызова передачи");
    }

    {
        std::unique_lock<std::mutex> lock(pImpl->registryMutex);
        if (!pImpl->registryEmpty.wait_for(lock, timeout, [this] { return pImpl->registry.empty(); })) {
            return false;
        }
    }
    // Передача удаляется из реестра до вызова её обработчиков
    pImpl->dispatcher->waitForCompletion();
    return true;
}

TransferMetrics RequestCoordinator::getMetrics() const {
    TransferMetrics metrics;
    metrics.createdCount = pImpl->counters->created.load();
    metrics.startedCount = pImpl->counters->started.load();
    metrics.finishedCount = pImpl->counters->finished.load();
    metrics.failedCount = pImpl->counters->failed.load();
    metrics.canceledCount = pImpl->counters->canceled.load();
    metrics.droppedEventCount = pImpl->counters->dropped.load();
    metrics.bytesReceived = pImpl->counters->bytesReceived.load();
    metrics.activeCount = activeTransferCount();
    metrics.lastUpdate = std::chrono::steady_clock::now();
    return metrics;
}

} // namespace transfer
} // namespace netfetch
