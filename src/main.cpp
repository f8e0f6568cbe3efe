#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <memory>
#include <string>
#include <vector>
#include <spdlog/spdlog.h>

#include "netfetch/cache/manager/MemoryPressureNotifier.hpp"
#include "netfetch/cache/purging/AutoPurgingCache.hpp"
#include "netfetch/config/NetfetchConfig.hpp"
#include "netfetch/log/Logging.hpp"
#include "netfetch/transfer/RequestCoordinator.hpp"
#include "netfetch/transport/CurlTransport.hpp"

using namespace netfetch;

// Флаги, выставляемые обработчиками сигналов
std::atomic<bool> g_interrupted{false};
std::atomic<bool> g_memoryPressure{false};

void signalHandler(int signal) {
    if (signal == SIGUSR1) {
        g_memoryPressure = true;
    } else {
        g_interrupted = true;
    }
}

struct Options {
    std::string configPath;
    int repeat = 1;
    std::vector<std::string> urls;
};

void printUsage(const char* program) {
    std::cerr << "Usage: " << program << " [--config FILE] [--repeat N] URL...\n"
              << "  --config FILE  JSON configuration file\n"
              << "  --repeat N     fetch the URL list N times; later rounds are served from the cache\n"
              << "Signals: SIGINT cancels running transfers, SIGUSR1 purges the cache\n";
}

bool parseOptions(int argc, char* argv[], Options& options) {
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "--help" || arg == "-h") {
            return false;
        } else if (arg == "--config" && i + 1 < argc) {
            options.configPath = argv[++i];
        } else if (arg == "--repeat" && i + 1 < argc) {
            try {
                options.repeat = std::stoi(argv[++i]);
            } catch (const std::exception&) {
                std::cerr << "Invalid --repeat value: " << argv[i] << "\n";
                return false;
            }
            if (options.repeat < 1) {
                std::cerr << "--repeat must be at least 1\n";
                return false;
            }
        } else if (!arg.empty() && arg[0] == '-') {
            std::cerr << "Unknown option: " << arg << "\n";
            return false;
        } else {
            options.urls.push_back(arg);
        }
    }
    return !options.urls.empty();
}

// Ожидание завершения передач с обработкой сигналов
void waitForTransfers(transfer::RequestCoordinator& requester, cache::MemoryPressureNotifier& notifier) {
    bool cancelIssued = false;
    while (!requester.waitForAll(std::chrono::milliseconds(200))) {
        if (g_memoryPressure.exchange(false)) {
            notifier.notify();
        }
        if (g_interrupted.load() && !cancelIssued) {
            spdlog::warn("Interrupted, canceling {} transfers", requester.activeTransferCount());
            requester.cancelAll();
            cancelIssued = true;
        }
    }
}

int main(int argc, char* argv[]) {
    Options options;
    if (!parseOptions(argc, argv, options)) {
        printUsage(argv[0]);
        return 2;
    }

    config::NetfetchConfig config;
    try {
        if (!options.configPath.empty()) {
            config = config::loadConfigFile(options.configPath);
        }
        log::initializeLogging(config.logging);
        spdlog::set_default_logger(log::getLogger("netfetch"));
    } catch (const std::exception& e) {
        std::cerr << "Failed to initialize: " << e.what() << std::endl;
        return 1;
    }

    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);
    std::signal(SIGUSR1, signalHandler);

    try {
        auto responseCache = std::make_shared<cache::AutoPurgingCache>(config.cache);
        cache::MemoryPressureNotifier notifier;
        auto subscription = notifier.subscribe(responseCache);

        // Обработчики передач используют failures: объявлен раньше координатора
        std::atomic<size_t> failures{0};

        auto curlTransport = std::make_shared<transport::CurlTransport>(config.transport);
        transfer::RequestCoordinator requester(curlTransport, config.requester);

        for (int round = 0; round < options.repeat && !g_interrupted.load(); ++round) {
            spdlog::info("Round {}/{}: {} URLs", round + 1, options.repeat, options.urls.size());

            std::vector<std::shared_ptr<transfer::TransferHandle>> handles;
            for (const auto& url : options.urls) {
                if (auto cached = responseCache->get(url)) {
                    std::cout << url << ": " << cached->size() << " bytes (cache)\n";
                    continue;
                }

                auto handle = requester.newTransfer(
                    url,
                    [url](double progress) {
                        spdlog::debug("{}: {:.1f}%", url, progress * 100.0);
                    },
                    [url, responseCache, &failures](const std::vector<uint8_t>& data,
                                                    const std::optional<transfer::TransferError>& error) {
                        if (error) {
                            ++failures;
                            std::cout << url << ": " << (error->isCanceled() ? "canceled" : "failed")
                                      << " (" << error->reason << ")\n";
                            return;
                        }
                        std::cout << url << ": " << data.size() << " bytes (network)\n";
                        responseCache->add(url, data);
                    });
                handles.push_back(handle);
            }

            if (!requester.autostartEnabled()) {
                for (const auto& handle : handles) {
                    handle->start();
                }
            }
            waitForTransfers(requester, notifier);
        }

        spdlog::info("Cache metrics: {}", responseCache->getMetrics().toJson().dump());
        spdlog::info("Transfer metrics: {}", requester.getMetrics().toJson().dump());

        if (g_interrupted.load()) {
            return 130;
        }
        return failures.load() == 0 ? 0 : 1;
    } catch (const std::exception& e) {
        spdlog::critical("Fatal error: {}", e.what());
        return 1;
    }
}
