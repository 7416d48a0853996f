#include "core/cache/remote/MemoryRemoteStore.hpp"
#include <numeric>
#include "core/common/Errors.hpp"

namespace qsynth {
namespace core {
namespace cache {

namespace {
void ensureAvailable(bool available) {
    if (!available) {
        throw common::SynthesisError("Удалённое хранилище недоступно");
    }
}
} // namespace

std::optional<std::vector<uint8_t>> MemoryRemoteStore::get(const std::string& key) {
    ensureAvailable(available_);
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = data_.find(key);
    if (it == data_.end()) {
        return std::nullopt;
    }
    return it->second;
}

void MemoryRemoteStore::put(const std::string& key, const std::vector<uint8_t>& value) {
    ensureAvailable(available_);
    std::lock_guard<std::mutex> lock(mutex_);
    data_[key] = value;
}

void MemoryRemoteStore::remove(const std::string& key) {
    ensureAvailable(available_);
    std::lock_guard<std::mutex> lock(mutex_);
    data_.erase(key);
}

void MemoryRemoteStore::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    data_.clear();
}

size_t MemoryRemoteStore::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return data_.size();
}

bool MemoryRemoteStore::ping() const {
    return available_;
}

void MemoryRemoteStore::setAvailable(bool available) {
    available_ = available;
}

size_t MemoryRemoteStore::storedBytes() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return std::accumulate(data_.begin(), data_.end(), size_t{0},
        [](size_t total, const auto& item) { return total + item.second.size(); });
}

} // namespace cache
} // namespace core
} // namespace qsynth
