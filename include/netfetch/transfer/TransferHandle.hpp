#pragma once

#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include "netfetch/transfer/TransferTypes.hpp"
#include "netfetch/transport/Transport.hpp"

namespace netfetch {
namespace transfer {

class RequestCoordinator;

namespace detail {
struct TransferCounters;
}

/**
 * @brief Одна загрузка: выполняемая или завершённая.
 * @details Принадлежит реестру RequestCoordinator. Вызывающая сторона может только
 * запустить или отменить передачу и прочитать её состояние.
 * Переходы: Pending -> Started -> Finished | Canceled.
 */
class TransferHandle {
public:
    ~TransferHandle();

    TransferHandle(const TransferHandle&) = delete;
    TransferHandle& operator=(const TransferHandle&) = delete;

    // Уникальный идентификатор передачи
    const std::string& id() const { return id_; }
    const std::string& url() const { return url_; }
    transport::OperationId operation() const { return operation_; }

    TransferStatus status() const;
    uint64_t expectedTotalSize() const;
    size_t receivedSize() const;

    // Pending -> Started; в остальных состояниях ничего не делает
    void start();

    // Started -> Canceled; в остальных состояниях ничего не делает
    void cancel();

private:
    friend class RequestCoordinator;

    TransferHandle(std::string id,
                   std::string url,
                   transport::OperationId operation,
                   std::weak_ptr<transport::Transport> transport,
                   std::shared_ptr<detail::TransferCounters> counters,
                   ProgressCallback progressCallback,
                   CompletionCallback completionCallback);

    // Операции координатора; выполняются в контексте диспетчеризации

    // Сохранить ожидаемый размер
    void recordResponse(uint64_t expectedSize);

    // Добавить данные; возвращает прогресс, если данные приняты
    std::optional<double> appendChunk(const std::vector<uint8_t>& chunk);

    // Перевести в конечное состояние и забрать накопленные данные.
    // Для отменённой передачи error заменяется на TransferError::canceled().
    // false, если завершение уже было обработано.
    bool complete(std::optional<TransferError>& error, std::vector<uint8_t>& data);

    const ProgressCallback& progressCallback() const { return progressCallback_; }
    const CompletionCallback& completionCallback() const { return completionCallback_; }

    const std::string id_;
    const std::string url_;
    const transport::OperationId operation_;
    std::weak_ptr<transport::Transport> transport_;
    std::shared_ptr<detail::TransferCounters> counters_;
    const ProgressCallback progressCallback_;
    const CompletionCallback completionCallback_;

    mutable std::mutex mutex_;
    TransferStatus status_ = TransferStatus::Pending;
    bool completed_ = false;
    uint64_t expectedTotalSize_ = 0;
    size_t receivedSize_ = 0;
    std::vector<uint8_t> accumulatedData_;
};

} // namespace transfer
} // namespace netfetch
