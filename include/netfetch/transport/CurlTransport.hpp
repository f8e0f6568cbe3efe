#pragma once

#include <cstddef>
#include <memory>
#include <string>
#include "netfetch/transport/Transport.hpp"

namespace netfetch {
namespace transport {

// Конфигурация транспорта libcurl
struct CurlTransportConfig {
    long connectTimeoutSeconds = 10;     // Таймаут установки соединения
    long requestTimeoutSeconds = 60;     // Таймаут всей операции
    long maxTotalConnections = 16;       // Максимум одновременных соединений
    long bufferSize = 64 * 1024;         // Размер приёмного буфера curl

    bool validate() const {
        if (connectTimeoutSeconds <= 0) return false;
        if (requestTimeoutSeconds <= 0) return false;
        if (maxTotalConnections <= 0) return false;
        if (bufferSize <= 0) return false;
        return true;
    }
};

/**
 * @brief Транспорт на основе curl multi.
 * @details Один фоновый поток обслуживает все операции через curl_multi_poll.
 * Команды из других потоков ставятся в очередь и применяются в этом потоке,
 * события доставляются слушателю тоже из него. ResponseReceived отправляется
 * перед первой порцией данных (или перед Completed, если тело пустое).
 * Доставка данных не ждёт proceed(); cancel() после ответа прерывает операцию.
 */
class CurlTransport : public Transport {
public:
    /// @throws std::invalid_argument при некорректной конфигурации
    /// @throws std::runtime_error если libcurl не удалось инициализировать
    explicit CurlTransport(const CurlTransportConfig& config = CurlTransportConfig{});
    ~CurlTransport() override;

    CurlTransport(const CurlTransport&) = delete;
    CurlTransport& operator=(const CurlTransport&) = delete;

    void setListener(TransportListener* listener) override;
    OperationId createOperation(const std::string& url) override;
    void resume(OperationId operation) override;
    void cancel(OperationId operation) override;
    void proceed(OperationId operation) override;

    // Количество операций, переданных в curl multi и ещё не завершённых
    size_t runningOperationCount() const;

private:
    // Реализация PIMPL
    struct Impl;
    std::unique_ptr<Impl> pImpl;
};

} // namespace transport
} // namespace netfetch
