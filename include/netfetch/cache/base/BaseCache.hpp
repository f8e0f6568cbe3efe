#pragma once
#include <cstddef>
#include <optional>

namespace netfetch {
namespace cache {

/**
 * @brief Базовый шаблонный интерфейс кэша для всех реализаций.
 * @tparam Key Тип ключа (например, std::string)
 * @tparam Value Тип значения (например, std::vector<uint8_t>)
 */
template<typename Key, typename Value>
class BaseCache {
public:
    virtual ~BaseCache() = default;
    /// Сохранить значение по ключу (с заменой существующего).
    virtual void add(const Key& key, const Value& value) = 0;
    /// Получить значение по ключу. std::nullopt, если ключ отсутствует.
    virtual std::optional<Value> get(const Key& key) = 0;
    /// Удалить значение по ключу.
    virtual void remove(const Key& key) = 0;
    /// Очистить кэш полностью.
    virtual void removeAll() = 0;
    /// Получить количество элементов в кэше.
    virtual size_t entryCount() const = 0;
};

} // namespace cache
} // namespace netfetch
