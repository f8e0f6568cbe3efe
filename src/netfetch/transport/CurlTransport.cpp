#include "netfetch/transport/CurlTransport.hpp"
#include "netfetch/log/Logging.hpp"
#include <atomic>
#include <deque>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <unordered_map>
#include <vector>
#include <curl/curl.h>

namespace netfetch {
namespace transport {

namespace {

constexpr int kPollTimeoutMs = 1000;

void ensureCurlGlobalInit() {
    static std::once_flag flag;
    static CURLcode result = CURLE_OK;
    std::call_once(flag, [] {
        result = curl_global_init(CURL_GLOBAL_ALL);
    });
    if (result != CURLE_OK) {
        throw std::runtime_error(std::string("curl_global_init failed: ") + curl_easy_strerror(result));
    }
}

} // namespace

// Реализация PIMPL
struct CurlTransport::Impl {
    // Операция; поля easy/running/announced меняются только в потоке curl
    struct Operation {
        Impl* owner = nullptr;
        OperationId id = 0;
        std::string url;
        CURL* easy = nullptr;
        bool running = false;
        bool announced = false;
    };

    struct Command {
        enum class Kind { Start, Cancel };
        Kind kind;
        OperationId operation;
    };

    CurlTransportConfig config;
    CURLM* multi = nullptr;
    std::thread worker;
    std::atomic<bool> stopping{false};
    std::atomic<OperationId> nextId{1};
    std::atomic<size_t> running{0};

    std::mutex commandMutex;
    std::deque<Command> commands;

    // Вставка из любых потоков, удаление только в потоке curl
    std::mutex operationsMutex;
    std::unordered_map<OperationId, std::unique_ptr<Operation>> operations;

    // Доставка событий идёт под этим мьютексом, поэтому после setListener(nullptr)
    // прежний слушатель больше не вызывается
    std::mutex listenerMutex;
    TransportListener* listener = nullptr;

    explicit Impl(const CurlTransportConfig& cfg) : config(cfg) {
        ensureCurlGlobalInit();

        multi = curl_multi_init();
        if (!multi) {
            throw std::runtime_error("curl_multi_init failed");
        }
        curl_multi_setopt(multi, CURLMOPT_MAX_TOTAL_CONNECTIONS, config.maxTotalConnections);

        worker = std::thread([this] { run(); });
        log::getLogger("transport")->info(
            "CurlTransport запущен: {} (maxConnections={})",
            curl_version(), config.maxTotalConnections);
    }

    ~Impl() {
        stopping = true;
        curl_multi_wakeup(multi);
        if (worker.joinable()) {
            worker.join();
        }

        for (auto& item : operations) {
            releaseEasy(*item.second);
        }
        operations.clear();
        curl_multi_cleanup(multi);
        log::getLogger("transport")->info("CurlTransport остановлен");
    }

    void emit(TransportEvent event) {
        std::lock_guard<std::mutex> lock(listenerMutex);
        if (listener) {
            listener->onTransportEvent(std::move(event));
        }
    }

    void post(Command command) {
        {
            std::lock_guard<std::mutex> lock(commandMutex);
            commands.push_back(command);
        }
        curl_multi_wakeup(multi);
    }

    Operation* findOperation(OperationId id) {
        std::lock_guard<std::mutex> lock(operationsMutex);
        auto it = operations.find(id);
        return it == operations.end() ? nullptr : it->second.get();
    }

    void eraseOperation(OperationId id) {
        std::lock_guard<std::mutex> lock(operationsMutex);
        operations.erase(id);
    }

    void releaseEasy(Operation& op) {
        if (!op.easy) return;
        if (op.running) {
            curl_multi_remove_handle(multi, op.easy);
            op.running = false;
            --running;
        }
        curl_easy_cleanup(op.easy);
        op.easy = nullptr;
    }

    // Первое событие операции: ожидаемый размер, если curl его знает
    void announce(Operation& op) {
        if (op.announced) return;
        op.announced = true;

        curl_off_t contentLength = -1;
        if (curl_easy_getinfo(op.easy, CURLINFO_CONTENT_LENGTH_DOWNLOAD_T, &contentLength) != CURLE_OK) {
            contentLength = -1;
        }
        const uint64_t expected = contentLength > 0 ? static_cast<uint64_t>(contentLength) : 0;
        emit(TransportEvent::response(op.id, expected));
    }

    static size_t writeCallback(char* ptr, size_t size, size_t nmemb, void* userdata) {
        auto* op = static_cast<Operation*>(userdata);
        const size_t total = size * nmemb;
        try {
            op->owner->announce(*op);
            op->owner->emit(TransportEvent::data(op->id, std::vector<uint8_t>(ptr, ptr + total)));
            return total;
        } catch (const std::exception& e) {
            // Возврат значения, отличного от total, прерывает передачу с CURLE_WRITE_ERROR
            log::getLogger("transport")->error(
                "Ошибка обработки данных операции {}: {}", op->id, e.what());
            return 0;
        }
    }

    void failOperation(Operation& op, const std::string& reason, int code) {
        log::getLogger("transport")->error("Операция {} ({}) не запущена: {}", op.id, op.url, reason);
        releaseEasy(op);
        const OperationId id = op.id;
        eraseOperation(id);
        emit(TransportEvent::completed(id, transfer::TransferError::failed(reason, code)));
    }

    void startOperation(Operation& op) {
        if (op.easy) {
            return;
        }

        op.easy = curl_easy_init();
        if (!op.easy) {
            failOperation(op, "curl_easy_init failed", CURLE_FAILED_INIT);
            return;
        }

        curl_easy_setopt(op.easy, CURLOPT_URL, op.url.c_str());
        curl_easy_setopt(op.easy, CURLOPT_PRIVATE, &op);
        curl_easy_setopt(op.easy, CURLOPT_WRITEFUNCTION, &Impl::writeCallback);
        curl_easy_setopt(op.easy, CURLOPT_WRITEDATA, &op);
        curl_easy_setopt(op.easy, CURLOPT_NOSIGNAL, 1L);
        curl_easy_setopt(op.easy, CURLOPT_CONNECTTIMEOUT, config.connectTimeoutSeconds);
        curl_easy_setopt(op.easy, CURLOPT_TIMEOUT, config.requestTimeoutSeconds);
        curl_easy_setopt(op.easy, CURLOPT_BUFFERSIZE, config.bufferSize);

        const CURLMcode rc = curl_multi_add_handle(multi, op.easy);
        if (rc != CURLM_OK) {
            failOperation(op, curl_multi_strerror(rc), static_cast<int>(rc));
            return;
        }
        op.running = true;
        ++running;

        log::getLogger("transport")->debug("Операция {} запущена: {}", op.id, op.url);
    }

    void cancelOperation(Operation& op) {
        const OperationId id = op.id;
        releaseEasy(op);
        eraseOperation(id);
        log::getLogger("transport")->debug("Операция {} отменена", id);
        emit(TransportEvent::completed(id, transfer::TransferError::canceled()));
    }

    void applyCommands() {
        std::deque<Command> pending;
        {
            std::lock_guard<std::mutex> lock(commandMutex);
            pending.swap(commands);
        }

        for (const auto& command : pending) {
            Operation* op = findOperation(command.operation);
            if (!op) {
                log::getLogger("transport")->debug(
                    "Команда для неизвестной операции {} пропущена", command.operation);
                continue;
            }
            if (command.kind == Command::Kind::Start) {
                startOperation(*op);
            } else {
                cancelOperation(*op);
            }
        }
    }

    void drainMessages() {
        int left = 0;
        while (CURLMsg* msg = curl_multi_info_read(multi, &left)) {
            if (msg->msg != CURLMSG_DONE) {
                continue;
            }

            CURL* easy = msg->easy_handle;
            const CURLcode result = msg->data.result;

            char* privateData = nullptr;
            curl_easy_getinfo(easy, CURLINFO_PRIVATE, &privateData);
            auto* op = reinterpret_cast<Operation*>(privateData);
            if (!op) {
                curl_multi_remove_handle(multi, easy);
                curl_easy_cleanup(easy);
                continue;
            }

            // Пустое тело: ответ объявляется перед завершением
            announce(*op);

            std::optional<transfer::TransferError> error;
            if (result != CURLE_OK) {
                error = transfer::TransferError::failed(curl_easy_strerror(result), static_cast<int>(result));
                log::getLogger("transport")->warn(
                    "Операция {} ({}) завершилась ошибкой: {}", op->id, op->url, error->reason);
            } else {
                log::getLogger("transport")->debug("Операция {} завершена", op->id);
            }

            const OperationId id = op->id;
            releaseEasy(*op);
            eraseOperation(id);
            emit(TransportEvent::completed(id, std::move(error)));
        }
    }

    void run() {
        while (!stopping.load()) {
            applyCommands();

            int stillRunning = 0;
            CURLMcode rc = curl_multi_perform(multi, &stillRunning);
            if (rc != CURLM_OK) {
                log::getLogger("transport")->error("curl_multi_perform: {}", curl_multi_strerror(rc));
            }
            drainMessages();

            if (stopping.load()) {
                break;
            }
            rc = curl_multi_poll(multi, nullptr, 0, kPollTimeoutMs, nullptr);
            if (rc != CURLM_OK) {
                log::getLogger("transport")->error("curl_multi_poll: {}", curl_multi_strerror(rc));
            }
        }
    }
};

CurlTransport::CurlTransport(const CurlTransportConfig& config) {
    if (!config.validate()) {
        throw std::invalid_argument("Некорректная конфигурация транспорта");
    }
    pImpl = std::make_unique<Impl>(config);
}

CurlTransport::~CurlTransport() = default;

void CurlTransport::setListener(TransportListener* listener) {
    std::lock_guard<std::mutex> lock(pImpl->listenerMutex);
    pImpl->listener = listener;
}

OperationId CurlTransport::createOperation(const std::string& url) {
    auto op = std::make_unique<Impl::Operation>();
    op->owner = pImpl.get();
    op->id = pImpl->nextId++;
    op->url = url;

    const OperationId id = op->id;
    {
        std::lock_guard<std::mutex> lock(pImpl->operationsMutex);
        pImpl->operations.emplace(id, std::move(op));
    }
    return id;
}

void CurlTransport::resume(OperationId operation) {
    pImpl->post({Impl::Command::Kind::Start, operation});
}

void CurlTransport::cancel(OperationId operation) {
    pImpl->post({Impl::Command::Kind::Cancel, operation});
}

void CurlTransport::proceed(OperationId operation) {
    log::getLogger("transport")->trace("Операция {}: продолжение разрешено", operation);
}

size_t CurlTransport::runningOperationCount() const {
    return pImpl->running.load();
}

} // namespace transport
} // namespace netfetch
