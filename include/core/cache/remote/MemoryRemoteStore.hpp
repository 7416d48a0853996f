#pragma once

#include <atomic>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>
#include "core/cache/base/BaseCache.hpp"

namespace qsynth {
namespace core {
namespace cache {

// Удалённое хранилище в памяти процесса (для одного узла и тестов)
class MemoryRemoteStore : public RemoteStore {
public:
    MemoryRemoteStore() = default;

    std::optional<std::vector<uint8_t>> get(const std::string& key) override;
    void put(const std::string& key, const std::vector<uint8_t>& value) override;
    void remove(const std::string& key) override;
    void clear() override;
    size_t size() const override;
    bool ping() const override;

    // Имитация недоступности хранилища
    void setAvailable(bool available);
    // Суммарный объём хранимых байт
    size_t storedBytes() const;

private:
    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::vector<uint8_t>> data_;
    std::atomic<bool> available_{true};
};

} // namespace cache
} // namespace core
} // namespace qsynth
