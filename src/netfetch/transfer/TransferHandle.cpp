#include "netfetch/transfer/TransferHandle.hpp"
#include "netfetch/transfer/TransferMetrics.hpp"
#include "netfetch/log/Logging.hpp"

namespace netfetch {
namespace transfer {

const char* toString(TransferStatus status) {
    switch (status) {
        case TransferStatus::Pending:  return "pending";
        case TransferStatus::Started:  return "started";
        case TransferStatus::Finished: return "finished";
        case TransferStatus::Canceled: return "canceled";
    }
    return "unknown";
}

TransferHandle::TransferHandle(std::string id,
                               std::string url,
                               transport::OperationId operation,
                               std::weak_ptr<transport::Transport> transport,
                               std::shared_ptr<detail::TransferCounters> counters,
                               ProgressCallback progressCallback,
                               CompletionCallback completionCallback)
    : id_(std::move(id))
    , url_(std::move(url))
    , operation_(operation)
    , transport_(std::move(transport))
    , counters_(std::move(counters))
    , progressCallback_(std::move(progressCallback))
    , completionCallback_(std::move(completionCallback)) {
}

TransferHandle::~TransferHandle() = default;

TransferStatus TransferHandle::status() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return status_;
}

uint64_t TransferHandle::expectedTotalSize() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return expectedTotalSize_;
}

size_t TransferHandle::receivedSize() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return receivedSize_;
}

void TransferHandle::start() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (status_ != TransferStatus::Pending) {
        return;
    }

    auto transport = transport_.lock();
    if (!transport) {
        log::getLogger("requester")->warn("Транспорт недоступен, передача {} не запущена", id_);
        return;
    }

    // Команды транспорту отдаются под мьютексом: resume и cancel приходят в том же порядке
    transport->resume(operation_);
    status_ = TransferStatus::Started;
    ++counters_->started;

    log::getLogger("requester")->debug("Передача запущена: id={}, op={}", id_, operation_);
}

void TransferHandle::cancel() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (status_ != TransferStatus::Started) {
        return;
    }

    status_ = TransferStatus::Canceled;
    ++counters_->canceled;
    if (auto transport = transport_.lock()) {
        transport->cancel(operation_);
    }

    log::getLogger("requester")->debug("Передача отменена: id={}, op={}", id_, operation_);
}

void TransferHandle::recordResponse(uint64_t expectedSize) {
    std::lock_guard<std::mutex> lock(mutex_);
    expectedTotalSize_ = expectedSize;
}

std::optional<double> TransferHandle::appendChunk(const std::vector<uint8_t>& chunk) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (status_ != TransferStatus::Started || completed_) {
        return std::nullopt;
    }

    accumulatedData_.insert(accumulatedData_.end(), chunk.begin(), chunk.end());
    receivedSize_ = accumulatedData_.size();
    counters_->bytesReceived += chunk.size();

    if (expectedTotalSize_ == 0) {
        return 0.0;
    }
    return static_cast<double>(receivedSize_) / static_cast<double>(expectedTotalSize_);
}

bool TransferHandle::complete(std::optional<TransferError>& error, std::vector<uint8_t>& data) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (completed_) {
        return false;
    }
    completed_ = true;

    if (status_ == TransferStatus::Canceled) {
        // Отмена уже учтена в cancel(); транспорт мог успеть завершить операцию сам
        if (!error || !error->isCanceled()) {
            error = TransferError::canceled();
        }
    } else if (error && error->isCanceled()) {
        status_ = TransferStatus::Finished;
        ++counters_->canceled;
    } else if (error) {
        status_ = TransferStatus::Finished;
        ++counters_->failed;
    } else {
        status_ = TransferStatus::Finished;
        ++counters_->finished;
    }

    data = std::move(accumulatedData_);
    accumulatedData_.clear();
    return true;
}

} // namespace transfer
} // namespace netfetch
