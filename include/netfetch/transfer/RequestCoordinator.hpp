#pragma once

#include <chrono>
#include <memory>
#include <string>
#include "netfetch/transfer/TransferHandle.hpp"
#include "netfetch/transfer/TransferMetrics.hpp"
#include "netfetch/transfer/TransferTypes.hpp"
#include "netfetch/transport/Transport.hpp"

namespace netfetch {
namespace transfer {

// Конфигурация координатора запросов
struct RequesterConfig {
    bool autostartEnabled = true;      // Запускать передачу сразу в newTransfer()
    size_t dispatchQueueSize = 65536;  // Максимум необработанных событий транспорта

    bool validate() const {
        return dispatchQueueSize > 0;
    }
};

/**
 * @brief Координатор запросов: создаёт, отслеживает, запускает и отменяет передачи
 * поверх одного общего транспорта.
 *
 * События транспорта ставятся в очередь однопоточного пула (контекст диспетчеризации)
 * и обрабатываются по одному в порядке поступления. Обратные вызовы прогресса и
 * завершения выполняются только в этом контексте, никогда в потоке транспорта и
 * никогда под внутренними мьютексами.
 *
 * Передача находится в реестре с момента создания до обработки события Completed;
 * поиск выполняется по идентификатору операции транспорта, а не по URL.
 */
class RequestCoordinator {
public:
    /// @throws std::invalid_argument при некорректной конфигурации или пустом транспорте
    RequestCoordinator(std::shared_ptr<transport::Transport> transport,
                       const RequesterConfig& config = RequesterConfig{});
    ~RequestCoordinator();

    RequestCoordinator(const RequestCoordinator&) = delete;
    RequestCoordinator& operator=(const RequestCoordinator&) = delete;

    /**
     * @brief Создать передачу для url.
     * Недоступность url не приводит к исключению: ошибка придёт в completionCallback.
     * Передача в состоянии Pending остаётся в реестре, пока её не запустят через
     * handle->start() и она не завершится; cancel() и освобождение handle её не удаляют.
     * @return handle в состоянии Pending или Started (если включён autostart)
     */
    std::shared_ptr<TransferHandle> newTransfer(const std::string& url,
                                                ProgressCallback progressCallback,
                                                CompletionCallback completionCallback);

    bool autostartEnabled() const;
    void setAutostart(bool enabled);

    // Количество передач в реестре (Pending и Started)
    size_t activeTransferCount() const;

    // Поиск активной передачи по её id
    std::shared_ptr<TransferHandle> findTransfer(const std::string& id) const;

    // Отменить все запущенные передачи. Возвращает число отменённых.
    size_t cancelAll();

    // Дождаться обработки всех уже поступивших событий
    void waitForIdle();

    /**
     * @brief Дождаться, пока реестр опустеет и все обратные вызовы будут выполнены.
     * Незапущенные (Pending) передачи тоже учитываются.
     * @return false по истечении timeout
     * @throws std::logic_error при вызове из обратного вызова
     */
    bool waitForAll(std::chrono::milliseconds timeout);

    TransferMetrics getMetrics() const;

private:
    // Реализация PIMPL
    struct Impl;
    std::unique_ptr<Impl> pImpl;
};

} // namespace transfer
} // namespace netfetch
