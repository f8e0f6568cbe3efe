#include "netfetch/config/NetfetchConfig.hpp"
#include <fstream>
#include <stdexcept>
#include <string>
#include <type_traits>

namespace netfetch {
namespace config {

namespace {

// Прочитать ключ, если он есть; иначе оставить значение по умолчанию
template<typename T>
void readOptional(const nlohmann::json& section, const char* key, T& target) {
    auto it = section.find(key);
    if (it != section.end() && !it->is_null()) {
        if constexpr (std::is_unsigned<T>::value && !std::is_same<T, bool>::value) {
            // Отрицательные и дробные числа в беззнаковые поля не принимаются
            if (!it->is_number_unsigned()) {
                throw std::invalid_argument(std::string("Ключ '") + key + "' должен быть неотрицательным целым");
            }
        }
        target = it->get<T>();
    }
}

const nlohmann::json& sectionOf(const nlohmann::json& j, const char* name) {
    static const nlohmann::json empty = nlohmann::json::object();
    auto it = j.find(name);
    if (it == j.end()) {
        return empty;
    }
    if (!it->is_object()) {
        throw std::invalid_argument(std::string("Секция конфигурации '") + name + "' должна быть объектом");
    }
    return *it;
}

} // namespace

nlohmann::json NetfetchConfig::toJson() const {
    return {
        {"requester", {
            {"autostart", requester.autostartEnabled},
            {"dispatchQueueSize", requester.dispatchQueueSize}
        }},
        {"cache", {
            {"hardLimitBytes", cache.hardLimitBytes},
            {"targetSizeBytes", cache.targetSizeBytes}
        }},
        {"transport", {
            {"connectTimeoutSeconds", transport.connectTimeoutSeconds},
            {"requestTimeoutSeconds", transport.requestTimeoutSeconds},
            {"maxTotalConnections", transport.maxTotalConnections},
            {"bufferSize", transport.bufferSize}
        }},
        {"logging", {
            {"level", logging.level},
            {"file", logging.filePath},
            {"maxFileSize", logging.maxFileSize},
            {"maxFiles", logging.maxFiles}
        }}
    };
}

NetfetchConfig NetfetchConfig::fromJson(const nlohmann::json& j) {
    if (!j.is_object()) {
        throw std::invalid_argument("Конфигурация должна быть JSON-объектом");
    }

    NetfetchConfig config;
    try {
        const auto& requester = sectionOf(j, "requester");
        readOptional(requester, "autostart", config.requester.autostartEnabled);
        readOptional(requester, "dispatchQueueSize", config.requester.dispatchQueueSize);

        const auto& cache = sectionOf(j, "cache");
        readOptional(cache, "hardLimitBytes", config.cache.hardLimitBytes);
        readOptional(cache, "targetSizeBytes", config.cache.targetSizeBytes);

        const auto& transport = sectionOf(j, "transport");
        readOptional(transport, "connectTimeoutSeconds", config.transport.connectTimeoutSeconds);
        readOptional(transport, "requestTimeoutSeconds", config.transport.requestTimeoutSeconds);
        readOptional(transport, "maxTotalConnections", config.transport.maxTotalConnections);
        readOptional(transport, "bufferSize", config.transport.bufferSize);

        const auto& logging = sectionOf(j, "logging");
        readOptional(logging, "level", config.logging.level);
        readOptional(logging, "file", config.logging.filePath);
        readOptional(logging, "maxFileSize", config.logging.maxFileSize);
        readOptional(logging, "maxFiles", config.logging.maxFiles);
    } catch (const nlohmann::json::exception& e) {
        throw std::invalid_argument(std::string("Неверный тип значения в конфигурации: ") + e.what());
    }

    if (!config.validate()) {
        throw std::invalid_argument("Некорректная конфигурация");
    }
    return config;
}

NetfetchConfig loadConfigFile(const std::string& path) {
    std::ifstream file(path);
    if (!file) {
        throw std::runtime_error("Не удалось открыть файл конфигурации: " + path);
    }

    nlohmann::json j;
    try {
        file >> j;
    } catch (const nlohmann::json::parse_error& e) {
        throw std::runtime_error("Ошибка разбора конфигурации " + path + ": " + e.what());
    }
    return NetfetchConfig::fromJson(j);
}

} // namespace config
} // namespace netfetch
