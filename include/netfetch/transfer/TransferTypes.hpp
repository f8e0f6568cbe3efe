#pragma once

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace netfetch {
namespace transfer {

// Состояние передачи
enum class TransferStatus {
    Pending,    // создана, не запущена
    Started,    // запущена
    Finished,   // завершена (успешно или с ошибкой)
    Canceled    // отменена вызывающей стороной
};

const char* toString(TransferStatus status);

// Ошибка передачи. Передаётся только в CompletionCallback.
struct TransferError {
    enum class Kind {
        Failed,     // ошибка транспорта
        Canceled    // передача отменена
    };

    Kind kind = Kind::Failed;
    std::string reason;  // описание причины от транспорта
    int code = 0;        // код ошибки транспорта (для curl - CURLcode)

    static TransferError failed(std::string reason, int code = 0) {
        return TransferError{Kind::Failed, std::move(reason), code};
    }

    static TransferError canceled() {
        return TransferError{Kind::Canceled, "canceled", 0};
    }

    bool isCanceled() const { return kind == Kind::Canceled; }
};

using ProgressCallback = std::function<void(double progress)>;
// data содержит всё, что успели получить, даже при ошибке
using CompletionCallback =
    std::function<void(const std::vector<uint8_t>& data, const std::optional<TransferError>& error)>;

} // namespace transfer
} // namespace netfetch
