#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include "netfetch/transfer/TransferTypes.hpp"

namespace netfetch {
namespace transport {

// Непрозрачный идентификатор операции транспорта. 0 не используется.
using OperationId = uint64_t;

// Событие транспорта для конкретной операции
struct TransportEvent {
    enum class Kind {
        ResponseReceived,   // получен ответ, известен ожидаемый размер
        DataReceived,       // получена порция данных
        Completed           // операция завершена (error задан при неудаче)
    };

    Kind kind = Kind::Completed;
    OperationId operation = 0;
    uint64_t expectedSize = 0;                      // ResponseReceived; 0 = неизвестен
    std::vector<uint8_t> chunk;                     // DataReceived
    std::optional<transfer::TransferError> error;   // Completed

    static TransportEvent response(OperationId op, uint64_t expectedSize) {
        TransportEvent event;
        event.kind = Kind::ResponseReceived;
        event.operation = op;
        event.expectedSize = expectedSize;
        return event;
    }

    static TransportEvent data(OperationId op, std::vector<uint8_t> chunk) {
        TransportEvent event;
        event.kind = Kind::DataReceived;
        event.operation = op;
        event.chunk = std::move(chunk);
        return event;
    }

    static TransportEvent completed(OperationId op, std::optional<transfer::TransferError> error) {
        TransportEvent event;
        event.kind = Kind::Completed;
        event.operation = op;
        event.error = std::move(error);
        return event;
    }
};

// Получатель событий транспорта
class TransportListener {
public:
    virtual ~TransportListener() = default;
    // Вызывается из потока транспорта; реализация не должна блокироваться надолго
    virtual void onTransportEvent(TransportEvent event) = 0;
};

/**
 * @brief Транспорт: асинхронная загрузка байтов по URL.
 * @details События одной операции доставляются в порядке возникновения.
 * Отмена запущенной операции завершается событием Completed с ошибкой Canceled.
 */
class Transport {
public:
    virtual ~Transport() = default;

    // Установить получателя событий (nullptr - отключить доставку).
    // После возврата прежний получатель больше не вызывается.
    virtual void setListener(TransportListener* listener) = 0;

    // Создать приостановленную операцию для url
    virtual OperationId createOperation(const std::string& url) = 0;

    // Запустить операцию
    virtual void resume(OperationId operation) = 0;

    // Прервать операцию
    virtual void cancel(OperationId operation) = 0;

    // Разрешить продолжение после ResponseReceived
    virtual void proceed(OperationId operation) = 0;
};

} // namespace transport
} // namespace netfetch
