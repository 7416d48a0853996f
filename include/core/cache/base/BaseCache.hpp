#pragma once
#include <cstddef>
#include <string>
#include <vector>
#include <optional>

namespace qsynth {
namespace core {
namespace cache {

/**
 * @brief Базовый шаблонный интерфейс хранилища ключ-значение.
 * @details Реализуется удалённым уровнем многоуровневого кэша. Реализации
 * должны быть потокобезопасны: кэш обращается к ним из разных потоков.
 * @tparam Key Тип ключа (например, std::string)
 * @tparam Value Тип значения (например, std::vector<uint8_t>)
 */
template<typename Key, typename Value>
class BaseCache {
public:
    virtual ~BaseCache() = default;
    /// Получить значение по ключу. Возвращает std::optional<Value>.
    virtual std::optional<Value> get(const Key& key) = 0;
    /// Сохранить значение по ключу.
    virtual void put(const Key& key, const Value& value) = 0;
    /// Удалить значение по ключу.
    virtual void remove(const Key& key) = 0;
    /// Очистить хранилище полностью.
    virtual void clear() = 0;
    /// Получить количество элементов.
    virtual size_t size() const = 0;
    /// Доступно ли хранилище.
    virtual bool ping() const { return true; }
};

// Удалённый уровень хранит сериализованные (и, возможно, сжатые) байты
using RemoteStore = BaseCache<std::string, std::vector<uint8_t>>;

} // namespace cache
} // namespace core
} // namespace qsynth
