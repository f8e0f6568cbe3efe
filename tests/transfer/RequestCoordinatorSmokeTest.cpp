#include <cassert>
#include <chrono>
#include <future>
#include <iostream>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>
#include "netfetch/transfer/RequestCoordinator.hpp"
#include "transfer/ScriptedTransport.hpp"

using netfetch::transfer::CompletionCallback;
using netfetch::transfer::ProgressCallback;
using netfetch::transfer::RequestCoordinator;
using netfetch::transfer::RequesterConfig;
using netfetch::transfer::TransferError;
using netfetch::transfer::TransferStatus;

namespace {

std::vector<uint8_t> text(const std::string& s) {
    return std::vector<uint8_t>(s.begin(), s.end());
}

// Запись всех обратных вызовов одной передачи
struct Recorder {
    mutable std::mutex mutex;
    std::vector<double> progress;
    size_t completions = 0;
    std::vector<uint8_t> data;
    std::optional<TransferError> error;
    std::vector<std::thread::id> callbackThreads;

    ProgressCallback onProgress() {
        return [this](double value) {
            std::lock_guard<std::mutex> lock(mutex);
            progress.push_back(value);
            callbackThreads.push_back(std::this_thread::get_id());
        };
    }

    CompletionCallback onCompletion() {
        return [this](const std::vector<uint8_t>& bytes, const std::optional<TransferError>& err) {
            std::lock_guard<std::mutex> lock(mutex);
            ++completions;
            data = bytes;
            error = err;
            callbackThreads.push_back(std::this_thread::get_id());
        };
    }
};

RequesterConfig manualStart() {
    RequesterConfig config;
    config.autostartEnabled = false;
    return config;
}

} // namespace

void smokeTestAutostartTransfer() {
    Recorder recorder;
    auto transport = std::make_shared<ScriptedTransport>();
    RequestCoordinator requester(transport);

    auto handle = requester.newTransfer("https://example.com/a", recorder.onProgress(), recorder.onCompletion());
    const auto op = handle->operation();
    assert(handle->status() == TransferStatus::Started);
    assert(handle->url() == "https://example.com/a");
    assert(transport->resumeCount(op) == 1);
    assert(requester.activeTransferCount() == 1);
    assert(requester.findTransfer(handle->id()) == handle);

    transport->respond(op, 6);
    transport->deliver(op, text("abc"));
    transport->deliver(op, text("def"));
    transport->complete(op);
    requester.waitForIdle();

    assert(transport->proceedCount(op) == 1);
    assert(handle->expectedTotalSize() == 6);
    assert(handle->receivedSize() == 6);
    assert(handle->status() == TransferStatus::Finished);
    assert(recorder.completions == 1);
    assert(recorder.data == text("abcdef"));
    assert(!recorder.error);
    assert(recorder.progress.size() == 3);
    assert(recorder.progress[0] == 0.5);
    assert(recorder.progress[1] == 1.0);
    assert(recorder.progress.back() == 1.0);

    // Обратные вызовы выполняются не в потоке транспорта и не в вызывающем потоке
    for (const auto& id : recorder.callbackThreads) {
        assert(id != transport->deliveryThread());
        assert(id != std::this_thread::get_id());
    }

    assert(requester.activeTransferCount() == 0);
    assert(requester.findTransfer(handle->id()) == nullptr);

    auto metrics = requester.getMetrics();
    assert(metrics.createdCount == 1);
    assert(metrics.startedCount == 1);
    assert(metrics.finishedCount == 1);
    assert(metrics.bytesReceived == 6);
    std::cout << "[OK] RequestCoordinator autostart transfer\n";
}

void testManualStart() {
    Recorder recorder;
    auto transport = std::make_shared<ScriptedTransport>();
    RequestCoordinator requester(transport, manualStart());
    assert(!requester.autostartEnabled());

    auto handle = requester.newTransfer("https://example.com/b", recorder.onProgress(), recorder.onCompletion());
    const auto op = handle->operation();
    assert(handle->status() == TransferStatus::Pending);
    assert(transport->resumeCount(op) == 0);

    // Отмена ещё не запущенной передачи ничего не делает
    handle->cancel();
    assert(handle->status() == TransferStatus::Pending);
    assert(transport->cancelCount(op) == 0);

    handle->start();
    handle->start();
    assert(handle->status() == TransferStatus::Started);
    assert(transport->resumeCount(op) == 1);

    requester.setAutostart(true);
    auto second = requester.newTransfer("https://example.com/c", nullptr, nullptr);
    assert(second->status() == TransferStatus::Started);
    std::cout << "[OK] RequestCoordinator manual start\n";
}

void testCancel() {
    Recorder recorder;
    auto transport = std::make_shared<ScriptedTransport>();
    RequestCoordinator requester(transport);

    auto handle = requester.newTransfer("https://example.com/d", recorder.onProgress(), recorder.onCompletion());
    const auto op = handle->operation();
    transport->respond(op, 100);
    transport->deliver(op, text("0123456789"));
    requester.waitForIdle();
    assert(recorder.progress.size() == 1);
    assert(recorder.progress[0] == 0.1);

    handle->cancel();
    handle->cancel();
    assert(handle->status() == TransferStatus::Canceled);
    assert(transport->cancelCount(op) == 1);

    // Данные после отмены отбрасываются
    transport->deliver(op, text("late"));
    transport->completeCanceled(op);
    requester.waitForIdle();

    assert(handle->status() == TransferStatus::Canceled);
    assert(std::string(netfetch::transfer::toString(handle->status())) == "canceled");
    assert(recorder.completions == 1);
    assert(recorder.error && recorder.error->isCanceled());
    assert(recorder.progress.size() == 2);
    assert(recorder.progress.back() == 1.0);
    assert(requester.activeTransferCount() == 0);
    assert(requester.getMetrics().canceledCount == 1);

    // Отмена после завершения ничего не делает
    handle->cancel();
    assert(transport->cancelCount(op) == 1);
    std::cout << "[OK] RequestCoordinator cancel\n";
}

void testCancelBeforeTransportCompletion() {
    Recorder finished;
    Recorder failed;
    auto transport = std::make_shared<ScriptedTransport>();
    RequestCoordinator requester(transport);

    auto a = requester.newTransfer("https://example.com/e", finished.onProgress(), finished.onCompletion());
    auto b = requester.newTransfer("https://example.com/f", failed.onProgress(), failed.onCompletion());
    a->cancel();
    b->cancel();

    // Транспорт завершил операции раньше, чем применил отмену
    transport->complete(a->operation());
    transport->fail(b->operation(), "Connection reset");
    requester.waitForIdle();

    for (const Recorder* recorder : {&finished, &failed}) {
        assert(recorder->completions == 1);
        assert(recorder->error);
        assert(recorder->error->isCanceled());
        assert(recorder->error->reason == "canceled");
        assert(recorder->progress.back() == 1.0);
    }
    assert(a->status() == TransferStatus::Canceled);
    assert(b->status() == TransferStatus::Canceled);

    auto metrics = requester.getMetrics();
    assert(metrics.canceledCount == 2);
    assert(metrics.finishedCount == 0);
    assert(metrics.failedCount == 0);
    std::cout << "[OK] RequestCoordinator cancel before transport completion\n";
}

void testSameUrlRoutedByOperation() {
    Recorder first;
    Recorder second;
    auto transport = std::make_shared<ScriptedTransport>();
    RequestCoordinator requester(transport);

    const std::string url = "https://example.com/same";
    auto a = requester.newTransfer(url, first.onProgress(), first.onCompletion());
    auto b = requester.newTransfer(url, second.onProgress(), second.onCompletion());
    assert(a->operation() != b->operation());
    assert(a->id() != b->id());
    assert(transport->operationCount() == 2);

    transport->respond(b->operation(), 5);
    transport->deliver(b->operation(), text("hello"));
    transport->complete(b->operation());
    transport->respond(a->operation(), 0);
    transport->complete(a->operation());
    requester.waitForIdle();

    assert(first.completions == 1);
    assert(first.data.empty());
    assert(second.completions == 1);
    assert(second.data == text("hello"));
    std::cout << "[OK] RequestCoordinator same url routing\n";
}

void testUnknownOperation() {
    auto transport = std::make_shared<ScriptedTransport>();
    RequestCoordinator requester(transport);

    const ScriptedTransport::OperationId stray = 999;
    transport->respond(stray, 10);
    transport->deliver(stray, text("stray"));
    transport->complete(stray);
    requester.waitForIdle();

    assert(transport->cancelCount(stray) == 1);
    assert(transport->proceedCount(stray) == 0);
    assert(requester.getMetrics().droppedEventCount == 3);
    std::cout << "[OK] RequestCoordinator unknown operation\n";
}

void testFailure() {
    Recorder recorder;
    auto transport = std::make_shared<ScriptedTransport>();
    RequestCoordinator requester(transport);

    auto handle = requester.newTransfer("https://unreachable.invalid/", recorder.onProgress(), recorder.onCompletion());
    const auto op = handle->operation();
    transport->fail(op, "Could not resolve host");
    // Повторное завершение уже не доставляется
    transport->complete(op);
    requester.waitForIdle();

    assert(recorder.completions == 1);
    assert(recorder.error);
    assert(recorder.error->kind == TransferError::Kind::Failed);
    assert(recorder.error->reason == "Could not resolve host");
    assert(recorder.error->code == 7);
    assert(recorder.data.empty());
    assert(recorder.progress.size() == 1);
    assert(recorder.progress[0] == 1.0);
    assert(handle->status() == TransferStatus::Finished);

    auto metrics = requester.getMetrics();
    assert(metrics.failedCount == 1);
    assert(metrics.droppedEventCount == 1);
    std::cout << "[OK] RequestCoordinator failure\n";
}

void testUnknownExpectedSize() {
    Recorder recorder;
    auto transport = std::make_shared<ScriptedTransport>();
    RequestCoordinator requester(transport);

    auto handle = requester.newTransfer("https://example.com/chunked", recorder.onProgress(), recorder.onCompletion());
    const auto op = handle->operation();
    transport->respond(op, 0);
    transport->deliver(op, text("chunk"));
    transport->complete(op);
    requester.waitForIdle();

    assert(recorder.progress.size() == 2);
    assert(recorder.progress[0] == 0.0);
    assert(recorder.progress[1] == 1.0);
    assert(recorder.data == text("chunk"));
    std::cout << "[OK] RequestCoordinator unknown expected size\n";
}

void testThrowingCallback() {
    Recorder recorder;
    auto transport = std::make_shared<ScriptedTransport>();
    RequestCoordinator requester(transport);

    auto handle = requester.newTransfer(
        "https://example.com/throw",
        [](double) { throw std::runtime_error("progress handler failure"); },
        recorder.onCompletion());
    const auto op = handle->operation();
    transport->respond(op, 2);
    transport->deliver(op, text("ok"));
    transport->complete(op);
    requester.waitForIdle();

    assert(recorder.completions == 1);
    assert(recorder.data == text("ok"));
    std::cout << "[OK] RequestCoordinator throwing callback\n";
}

void testWaitForAllAndCancelAll() {
    auto transport = std::make_shared<ScriptedTransport>();
    RequestCoordinator requester(transport);

    auto a = requester.newTransfer("https://example.com/1", nullptr, nullptr);
    auto b = requester.newTransfer("https://example.com/2", nullptr, nullptr);
    assert(!requester.waitForAll(std::chrono::milliseconds(50)));

    assert(requester.cancelAll() == 2);
    assert(a->status() == TransferStatus::Canceled);
    assert(b->status() == TransferStatus::Canceled);
    assert(transport->cancelCount(a->operation()) == 1);
    assert(transport->cancelCount(b->operation()) == 1);

    transport->completeCanceled(a->operation());
    transport->completeCanceled(b->operation());
    assert(requester.waitForAll(std::chrono::milliseconds(5000)));
    assert(requester.activeTransferCount() == 0);
    std::cout << "[OK] RequestCoordinator waitForAll/cancelAll\n";
}

void testConstructionAndTeardown() {
    bool thrown = false;
    try {
        RequestCoordinator invalid(nullptr);
    } catch (const std::invalid_argument&) {
        thrown = true;
    }
    assert(thrown);

    auto transport = std::make_shared<ScriptedTransport>();
    ScriptedTransport::OperationId op = 0;
    {
        RequestCoordinator requester(transport);
        op = requester.newTransfer("https://example.com/late", nullptr, nullptr)->operation();
    }
    // Координатор разрушен: события больше никому не доставляются
    transport->complete(op);
    std::cout << "[OK] RequestCoordinator construction/teardown\n";
}

void testPendingTransferBlocksWaitForAll() {
    auto transport = std::make_shared<ScriptedTransport>();
    RequestCoordinator requester(transport, manualStart());

    auto handle = requester.newTransfer("https://example.com/pending", nullptr, nullptr);
    // Незапущенная передача остаётся в реестре
    assert(!requester.waitForAll(std::chrono::milliseconds(50)));
    assert(requester.activeTransferCount() == 1);

    handle->start();
    transport->complete(handle->operation());
    assert(requester.waitForAll(std::chrono::milliseconds(5000)));
    std::cout << "[OK] RequestCoordinator pending transfer\n";
}

void testDestroyFromCompletionCallback() {
    std::promise<void> destroyed;
    auto destroyedFuture = destroyed.get_future();
    auto transport = std::make_shared<ScriptedTransport>();
    auto requester = std::make_unique<RequestCoordinator>(transport);

    auto handle = requester->newTransfer(
        "https://example.com/last",
        nullptr,
        [&requester, &destroyed](const std::vector<uint8_t>&, const std::optional<TransferError>&) {
            requester.reset();
            destroyed.set_value();
        });
    transport->complete(handle->operation());

    assert(destroyedFuture.wait_for(std::chrono::seconds(5)) == std::future_status::ready);
    assert(!requester);
    // Рабочий поток диспетчеризации завершается сам после возврата из обработчика
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
    assert(handle->status() == TransferStatus::Finished);
    std::cout << "[OK] RequestCoordinator destroyed from callback\n";
}

void stressTestManyTransfers() {
    auto transport = std::make_shared<ScriptedTransport>();
    RequestCoordinator requester(transport);

    std::mutex mutex;
    size_t completions = 0;
    size_t totalBytes = 0;
    std::vector<std::shared_ptr<netfetch::transfer::TransferHandle>> handles;
    for (int i = 0; i < 200; ++i) {
        handles.push_back(requester.newTransfer(
            "https://example.com/item/" + std::to_string(i % 10),
            nullptr,
            [&mutex, &completions, &totalBytes](const std::vector<uint8_t>& data,
                                                const std::optional<TransferError>&) {
                std::lock_guard<std::mutex> lock(mutex);
                ++completions;
                totalBytes += data.size();
            }));
    }

    for (const auto& handle : handles) {
        transport->respond(handle->operation(), 4);
        transport->deliver(handle->operation(), text("data"));
        transport->complete(handle->operation());
    }
    assert(requester.waitForAll(std::chrono::milliseconds(10000)));
    assert(completions == 200);
    assert(totalBytes == 800);
    std::cout << "[OK] RequestCoordinator stress test\n";
}

int main() {
    smokeTestAutostartTransfer();
    testManualStart();
    testCancel();
    testCancelBeforeTransportCompletion();
    testSameUrlRoutedByOperation();
    testUnknownOperation();
    testFailure();
    testUnknownExpectedSize();
    testThrowingCallback();
    testWaitForAllAndCancelAll();
    testConstructionAndTeardown();
    testPendingTransferBlocksWaitForAll();
    testDestroyFromCompletionCallback();
    stressTestManyTransfers();
    std::cout << "All RequestCoordinator tests passed!\n";
    return 0;
}
