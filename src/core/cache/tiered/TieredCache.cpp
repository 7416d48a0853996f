#include "core/cache/tiered/TieredCache.hpp"
#include <atomic>
#include <condition_variable>
#include <list>
#include <mutex>
#include <thread>
#include <unordered_map>
#include <spdlog/spdlog.h>
#include <zlib.h>
#include "core/common/Logging.hpp"

namespace qsynth {
namespace core {
namespace cache {

using Clock = std::chrono::steady_clock;

namespace {

constexpr uint8_t kRawFormat = 0;
constexpr uint8_t kZlibFormat = 1;
constexpr size_t kHeaderSize = 9;

void appendUint64(std::vector<uint8_t>& out, uint64_t value) {
    for (int i = 0; i < 8; ++i) {
        out.push_back(static_cast<uint8_t>((value >> (8 * i)) & 0xFF));
    }
}

uint64_t readUint64(const std::vector<uint8_t>& bytes, size_t offset) {
    uint64_t value = 0;
    for (int i = 0; i < 8; ++i) {
        value |= static_cast<uint64_t>(bytes[offset + i]) << (8 * i);
    }
    return value;
}

// Удалённое хранилище может быть общим для процессов, поэтому срок жизни в системном времени
int64_t wallClockMs() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

struct RemotePayload {
    std::string raw;
    int64_t expiresAtMs = 0;
};

// Формат удалённой записи:
// [флаг][8 байт срока жизни, мс эпохи][8 байт исходной длины, только для zlib][данные]
std::vector<uint8_t> encodeForRemote(const std::string& raw, size_t threshold,
                                     int64_t expiresAtMs, bool& compressed) {
    compressed = false;
    if (raw.size() <= threshold) {
        std::vector<uint8_t> out;
        out.reserve(raw.size() + kHeaderSize);
        out.push_back(kRawFormat);
        appendUint64(out, static_cast<uint64_t>(expiresAtMs));
        out.insert(out.end(), raw.begin(), raw.end());
        return out;
    }

    uLongf bound = compressBound(static_cast<uLong>(raw.size()));
    std::vector<uint8_t> buffer(bound);
    int rc = compress2(buffer.data(), &bound,
                       reinterpret_cast<const Bytef*>(raw.data()),
                       static_cast<uLong>(raw.size()), Z_DEFAULT_COMPRESSION);
    if (rc != Z_OK) {
        throw common::SynthesisError("zlib compress2 вернул " + std::to_string(rc));
    }
    buffer.resize(bound);

    std::vector<uint8_t> out;
    out.reserve(buffer.size() + kHeaderSize + 8);
    out.push_back(kZlibFormat);
    appendUint64(out, static_cast<uint64_t>(expiresAtMs));
    appendUint64(out, raw.size());
    out.insert(out.end(), buffer.begin(), buffer.end());
    compressed = true;
    return out;
}

RemotePayload decodeFromRemote(const std::vector<uint8_t>& bytes) {
    if (bytes.size() < kHeaderSize) {
        throw common::SynthesisError("Повреждённая запись удалённого хранилища");
    }
    RemotePayload payload;
    payload.expiresAtMs = static_cast<int64_t>(readUint64(bytes, 1));
    if (bytes[0] == kRawFormat) {
        payload.raw.assign(bytes.begin() + kHeaderSize, bytes.end());
        return payload;
    }
    if (bytes[0] != kZlibFormat || bytes.size() < kHeaderSize + 8) {
        throw common::SynthesisError("Неизвестный формат записи удалённого хранилища");
    }

    uint64_t length = readUint64(bytes, kHeaderSize);
    const size_t dataOffset = kHeaderSize + 8;
    std::string raw(length, '\0');
    uLongf destLength = static_cast<uLongf>(length);
    int rc = uncompress(reinterpret_cast<Bytef*>(&raw[0]), &destLength,
                        bytes.data() + dataOffset, static_cast<uLong>(bytes.size() - dataOffset));
    if (rc != Z_OK || destLength != length) {
        throw common::SynthesisError("zlib uncompress вернул " + std::to_string(rc));
    }
    payload.raw = std::move(raw);
    return payload;
}

} // namespace

// Реализация PIMPL
struct TieredCache::Impl {
    // Один локальный уровень: LRU-список и индекс
    struct TierStore {
        size_t capacity = 0;
        std::list<std::string> lru; // в начале самый свежий
        std::unordered_map<std::string, std::pair<std::list<std::string>::iterator, CacheEntry>> entries;
    };

    TieredCacheConfig config;
    std::shared_ptr<RemoteStore> remote;
    std::shared_ptr<spdlog::logger> logger;

    mutable std::mutex mutex;
    TierStore hot;
    TierStore warm;
    TierStore cold;
    TieredCacheStats stats;

    std::mutex maintenanceMutex;
    std::condition_variable maintenanceCv;
    std::thread maintenanceThread;
    bool stopMaintenance = false;
    std::atomic<bool> maintenanceRunning{false};
    std::atomic<bool> stopped{false};

    std::mutex listenerMutex;
    common::ComponentErrorListener errorListener;

    Impl(const TieredCacheConfig& cfg, std::shared_ptr<RemoteStore> store)
        : config(cfg), remote(std::move(store)) {
        logger = common::componentLogger("tieredcache");
        hot.capacity = config.hotCapacity;
        warm.capacity = config.warmCapacity;
        cold.capacity = config.coldCapacity;
    }

    TierStore& storeFor(CacheTier tier) {
        switch (tier) {
            case CacheTier::Hot: return hot;
            case CacheTier::Warm: return warm;
            case CacheTier::Cold: return cold;
            case CacheTier::Remote: break;
        }
        throw std::invalid_argument("Удалённый уровень не является локальным");
    }

    std::optional<CacheTier> findLocked(const std::string& key) const {
        if (hot.entries.count(key)) return CacheTier::Hot;
        if (warm.entries.count(key)) return CacheTier::Warm;
        if (cold.entries.count(key)) return CacheTier::Cold;
        return std::nullopt;
    }

    std::optional<CacheEntry> extractLocked(CacheTier tier, const std::string& key) {
        auto& store = storeFor(tier);
        auto it = store.entries.find(key);
        if (it == store.entries.end()) {
            return std::nullopt;
        }
        store.lru.erase(it->second.first);
        CacheEntry entry = std::move(it->second.second);
        store.entries.erase(it);
        return entry;
    }

    bool eraseEverywhereLocked(const std::string& key) {
        bool removed = false;
        for (auto tier : {CacheTier::Hot, CacheTier::Warm, CacheTier::Cold}) {
            removed = extractLocked(tier, key).has_value() || removed;
        }
        return removed;
    }

    // Вставка с вытеснением LRU при заполнении уровня
    void insertLocked(CacheTier tier, CacheEntry entry) {
        auto& store = storeFor(tier);
        while (store.entries.size() >= store.capacity && !store.lru.empty()) {
            const std::string victim = store.lru.back();
            store.lru.pop_back();
            store.entries.erase(victim);
            ++stats.evictionCount;
            logger->debug("Вытеснена запись {} из {}", victim, toString(tier));
        }
        entry.tier = tier;
        store.lru.push_front(entry.key);
        std::string key = entry.key;
        store.entries[key] = {store.lru.begin(), std::move(entry)};
    }

    void moveLocked(const std::string& key, CacheTier from, CacheTier to) {
        auto entry = extractLocked(from, key);
        if (entry) {
            insertLocked(to, std::move(*entry));
        }
    }

    bool isExpired(const CacheEntry& entry, Clock::time_point now) const {
        return now - entry.timestamp > entry.ttl;
    }

    size_t sweepLocked(Clock::time_point now, std::vector<std::string>& removedKeys) {
        size_t removed = 0;
        for (auto* store : {&hot, &warm, &cold}) {
            for (auto it = store->entries.begin(); it != store->entries.end();) {
                if (isExpired(it->second.second, now)) {
                    store->lru.erase(it->second.first);
                    removedKeys.push_back(it->first);
                    it = store->entries.erase(it);
                    ++removed;
                } else {
                    ++it;
                }
            }
        }
        stats.expiredCount += removed;
        return removed;
    }

    void rebalanceLocked(Clock::time_point now) {
        // Кандидаты собираются до перемещений, чтобы запись сдвигалась не больше чем на уровень
        std::vector<std::string> toWarm, toHot, toDemote;
        for (const auto& [key, item] : cold.entries) {
            if (item.second.accessCount >= config.promoteToWarmAccesses) toWarm.push_back(key);
        }
        for (const auto& [key, item] : warm.entries) {
            if (item.second.accessCount >= config.promoteToHotAccesses) toHot.push_back(key);
        }
        for (const auto& [key, item] : hot.entries) {
            if (now - item.second.lastAccess > config.inactivityWindow &&
                item.second.accessCount < config.demoteBelowAccesses) {
                toDemote.push_back(key);
            }
        }

        for (const auto& key : toDemote) moveLocked(key, CacheTier::Hot, CacheTier::Warm);
        for (const auto& key : toHot) moveLocked(key, CacheTier::Warm, CacheTier::Hot);
        for (const auto& key : toWarm) moveLocked(key, CacheTier::Cold, CacheTier::Warm);

        stats.promotions += toWarm.size() + toHot.size();
        stats.demotions += toDemote.size();
        logger->debug("Ребалансировка: L3->L2 {}, L2->L1 {}, L1->L2 {}",
                      toWarm.size(), toHot.size(), toDemote.size());
    }

    void removeRemote(const std::vector<std::string>& keys) {
        if (!remote) return;
        for (const auto& key : keys) {
            try {
                remote->remove(key);
            } catch (const std::exception& e) {
                std::lock_guard<std::mutex> lock(mutex);
                ++stats.remoteErrors;
                logger->warn("Не удалось удалить {} из удалённого хранилища: {}", key, e.what());
            }
        }
    }

    void writeRemote(const std::string& key, const std::string& raw, std::chrono::milliseconds ttl) {
        if (!remote) return;
        try {
            bool compressed = false;
            auto bytes = encodeForRemote(raw, config.compressionThreshold,
                                         wallClockMs() + ttl.count(), compressed);
            remote->put(key, bytes);
            std::lock_guard<std::mutex> lock(mutex);
            ++stats.remoteWrites;
            if (compressed) ++stats.compressedWrites;
        } catch (const std::exception& e) {
            std::lock_guard<std::mutex> lock(mutex);
            ++stats.remoteErrors;
            logger->warn("Запись {} в удалённое хранилище не удалась: {}", key, e.what());
        }
    }

    void reportError(const std::string& message) {
        common::ComponentErrorListener listener;
        {
            std::lock_guard<std::mutex> lock(listenerMutex);
            listener = errorListener;
        }
        if (listener) {
            listener("cache", message);
        }
    }

    void startMaintenance() {
        if (!config.enableMaintenance) return;
        {
            std::lock_guard<std::mutex> lock(maintenanceMutex);
            stopMaintenance = false;
        }
        maintenanceRunning = true;
        maintenanceThread = std::thread([this] { maintenanceLoop(); });
    }

    void stopMaintenanceThread() {
        {
            std::lock_guard<std::mutex> lock(maintenanceMutex);
            stopMaintenance = true;
        }
        maintenanceCv.notify_all();
        if (maintenanceThread.joinable()) {
            maintenanceThread.join();
        }
    }

    void maintenanceLoop();
};

// Фоновое обслуживание: очистка по TTL и ребалансировка
void TieredCache::Impl::maintenanceLoop() {
    auto nextRebalance = Clock::now() + config.rebalanceInterval;
    std::unique_lock<std::mutex> lock(maintenanceMutex);
    while (!stopMaintenance) {
        maintenanceCv.wait_for(lock, config.sweepInterval, [this] { return stopMaintenance; });
        if (stopMaintenance) break;
        lock.unlock();
        try {
            std::vector<std::string> removedKeys;
            {
                std::lock_guard<std::mutex> dataLock(mutex);
                sweepLocked(Clock::now(), removedKeys);
            }
            removeRemote(removedKeys);
            if (!removedKeys.empty()) {
                logger->debug("Удалено просроченных записей: {}", removedKeys.size());
            }
            if (Clock::now() >= nextRebalance) {
                nextRebalance = Clock::now() + config.rebalanceInterval;
                std::lock_guard<std::mutex> dataLock(mutex);
                rebalanceLocked(Clock::now());
            }
        } catch (const std::exception& e) {
            logger->error("Ошибка обслуживания кэша: {}", e.what());
            reportError(e.what());
        }
        lock.lock();
    }
    maintenanceRunning = false;
}

// Конструктор
TieredCache::TieredCache(const TieredCacheConfig& config, std::shared_ptr<RemoteStore> remote)
    : pImpl(std::make_unique<Impl>(config, std::move(remote))) {
    if (!config.validate()) {
        throw std::invalid_argument("Некорректная конфигурация кэша");
    }
    pImpl->startMaintenance();
    pImpl->logger->debug("TieredCache: L1={} L2={} L3={} remote={}",
                         config.hotCapacity, config.warmCapacity, config.coldCapacity,
                         pImpl->remote ? "да" : "нет");
}

// Деструктор
TieredCache::~TieredCache() {
    try {
        stop();
    } catch (const std::exception& e) {
        pImpl->logger->error("Ошибка остановки кэша: {}", e.what());
    }
}

std::optional<nlohmann::json> TieredCache::get(const std::string& key) {
    std::vector<std::string> expiredKeys;
    {
        std::lock_guard<std::mutex> lock(pImpl->mutex);
        ++pImpl->stats.requestCount;
        auto now = Clock::now();

        auto tier = pImpl->findLocked(key);
        if (tier) {
            auto& store = pImpl->storeFor(*tier);
            auto& item = store.entries.at(key);
            CacheEntry& entry = item.second;

            if (pImpl->isExpired(entry, now)) {
                pImpl->extractLocked(*tier, key);
                ++pImpl->stats.expiredCount;
                ++pImpl->stats.misses;
                expiredKeys.push_back(key);
            } else {
                ++entry.accessCount;
                entry.lastAccess = now;
                store.lru.splice(store.lru.begin(), store.lru, item.first);
                nlohmann::json value = entry.value;

                switch (*tier) {
                    case CacheTier::Hot:
                        ++pImpl->stats.hotHits;
                        break;
                    case CacheTier::Warm:
                        ++pImpl->stats.warmHits;
                        ++pImpl->stats.promotions;
                        pImpl->moveLocked(key, CacheTier::Warm, CacheTier::Hot);
                        break;
                    case CacheTier::Cold:
                        ++pImpl->stats.coldHits;
                        ++pImpl->stats.promotions;
                        pImpl->moveLocked(key, CacheTier::Cold, CacheTier::Warm);
                        break;
                    case CacheTier::Remote:
                        break;
                }
                return value;
            }
        }
    }

    if (!expiredKeys.empty()) {
        pImpl->removeRemote(expiredKeys);
        return std::nullopt;
    }

    if (pImpl->remote) {
        bool remoteExpired = false;
        try {
            auto bytes = pImpl->remote->get(key);
            if (bytes) {
                auto payload = decodeFromRemote(*bytes);
                int64_t remainingMs = payload.expiresAtMs - wallClockMs();
                if (remainingMs <= 0) {
                    remoteExpired = true;
                } else {
                    auto value = nlohmann::json::parse(payload.raw);
                    std::lock_guard<std::mutex> lock(pImpl->mutex);
                    ++pImpl->stats.remoteHits;
                    if (!pImpl->findLocked(key)) {
                        auto now = Clock::now();
                        CacheEntry entry;
                        entry.key = key;
                        entry.value = value;
                        entry.timestamp = now;
                        entry.lastAccess = now;
                        entry.accessCount = 1;
                        entry.sizeEstimate = key.size() + bytes->size();
                        // Локальная копия живёт не дольше удалённой записи
                        entry.ttl = std::chrono::milliseconds(remainingMs);
                        pImpl->insertLocked(CacheTier::Warm, std::move(entry));
                    }
                    return value;
                }
            }
        } catch (const std::exception& e) {
            std::lock_guard<std::mutex> lock(pImpl->mutex);
            ++pImpl->stats.remoteErrors;
            pImpl->logger->warn("Чтение {} из удалённого хранилища не удалось: {}", key, e.what());
        }
        if (remoteExpired) {
            pImpl->removeRemote({key});
            std::lock_guard<std::mutex> lock(pImpl->mutex);
            ++pImpl->stats.expiredCount;
            ++pImpl->stats.misses;
            return std::nullopt;
        }
    }

    std::lock_guard<std::mutex> lock(pImpl->mutex);
    ++pImpl->stats.misses;
    return std::nullopt;
}

void TieredCache::set(const std::string& key, const nlohmann::json& value,
                      CacheTier tier, std::optional<std::chrono::milliseconds> ttl) {
    if (tier == CacheTier::Remote && !pImpl->remote) {
        throw std::invalid_argument("Удалённое хранилище не подключено");
    }
    auto effectiveTtl = ttl.value_or(pImpl->config.defaultTtl);
    if (effectiveTtl.count() <= 0) {
        throw std::invalid_argument("TTL должен быть положительным");
    }

    std::string raw = value.dump();
    {
        std::lock_guard<std::mutex> lock(pImpl->mutex);
        pImpl->eraseEverywhereLocked(key);
        ++pImpl->stats.sets;
        if (tier != CacheTier::Remote) {
            auto now = Clock::now();
            CacheEntry entry;
            entry.key = key;
            entry.value = value;
            entry.timestamp = now;
            entry.lastAccess = now;
            entry.sizeEstimate = key.size() + raw.size();
            entry.ttl = effectiveTtl;
            pImpl->insertLocked(tier, std::move(entry));
        }
    }
    pImpl->writeRemote(key, raw, effectiveTtl);
}

void TieredCache::set(const std::string& key, const nlohmann::json& value,
                      CacheCategory category, CacheTier tier) {
    set(key, value, tier, pImpl->config.ttlFor(category));
}

bool TieredCache::remove(const std::string& key) {
    bool removed = false;
    {
        std::lock_guard<std::mutex> lock(pImpl->mutex);
        removed = pImpl->eraseEverywhereLocked(key);
    }
    pImpl->removeRemote({key});
    return removed;
}

void TieredCache::clear(std::optional<CacheTier> tier) {
    {
        std::lock_guard<std::mutex> lock(pImpl->mutex);
        for (auto t : {CacheTier::Hot, CacheTier::Warm, CacheTier::Cold}) {
            if (!tier || *tier == t) {
                auto& store = pImpl->storeFor(t);
                store.entries.clear();
                store.lru.clear();
            }
        }
    }
    if (pImpl->remote && (!tier || *tier == CacheTier::Remote)) {
        pImpl->remote->clear();
    }
    pImpl->logger->info("Кэш очищен: {}", tier ? toString(*tier) : "все уровни");
}

size_t TieredCache::prefetch(const std::vector<std::string>& keys, const PrefetchGenerator& generator) {
    if (!generator) {
        throw std::invalid_argument("Не задан генератор для prefetch");
    }
    size_t loaded = 0;
    for (const auto& key : keys) {
        if (tierOf(key)) continue;
        try {
            auto value = generator(key);
            if (value) {
                set(key, *value, CacheTier::Cold);
                ++loaded;
            }
        } catch (const std::exception& e) {
            pImpl->logger->warn("Prefetch {} не удался: {}", key, e.what());
        }
    }
    pImpl->logger->debug("Prefetch: загружено {} из {}", loaded, keys.size());
    return loaded;
}

size_t TieredCache::sweepExpired() {
    std::vector<std::string> removedKeys;
    size_t removed = 0;
    {
        std::lock_guard<std::mutex> lock(pImpl->mutex);
        removed = pImpl->sweepLocked(Clock::now(), removedKeys);
    }
    pImpl->removeRemote(removedKeys);
    return removed;
}

void TieredCache::rebalance() {
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    pImpl->rebalanceLocked(Clock::now());
}

std::optional<CacheTier> TieredCache::tierOf(const std::string& key) const {
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    return pImpl->findLocked(key);
}

std::optional<CacheEntry> TieredCache::inspect(const std::string& key) const {
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    auto tier = pImpl->findLocked(key);
    if (!tier) {
        return std::nullopt;
    }
    return pImpl->storeFor(*tier).entries.at(key).second;
}

// Получение метрик
TieredCacheStats TieredCache::getStats() const {
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    TieredCacheStats stats = pImpl->stats;
    stats.hotEntries = pImpl->hot.entries.size();
    stats.warmEntries = pImpl->warm.entries.size();
    stats.coldEntries = pImpl->cold.entries.size();

    stats.memoryUsage = 0;
    for (const auto* store : {&pImpl->hot, &pImpl->warm, &pImpl->cold}) {
        for (const auto& [key, item] : store->entries) {
            stats.memoryUsage += item.second.sizeEstimate;
        }
    }

    if (stats.requestCount > 0) {
        double requests = static_cast<double>(stats.requestCount);
        size_t hits = stats.hotHits + stats.warmHits + stats.coldHits + stats.remoteHits;
        stats.hitRate = static_cast<double>(hits) / requests;
        stats.efficiency = (stats.hotHits * TierWeights::hot +
                            stats.warmHits * TierWeights::warm +
                            stats.coldHits * TierWeights::cold +
                            stats.remoteHits * TierWeights::remote) / requests;
    }
    stats.lastUpdate = Clock::now();
    return stats;
}

TieredCacheConfig TieredCache::getConfiguration() const {
    return pImpl->config;
}

bool TieredCache::ping() const {
    if (pImpl->stopped) return false;
    if (pImpl->config.enableMaintenance && !pImpl->maintenanceRunning) return false;
    if (pImpl->remote && !pImpl->remote->ping()) return false;
    return true;
}

void TieredCache::restartMaintenance() {
    if (pImpl->stopped) {
        throw common::SynthesisError("Кэш остановлен");
    }
    pImpl->stopMaintenanceThread();
    pImpl->startMaintenance();
    pImpl->logger->info("Обслуживание кэша перезапущено");
}

void TieredCache::stop() {
    if (pImpl->stopped.exchange(true)) return;
    pImpl->stopMaintenanceThread();
    pImpl->logger->debug("TieredCache остановлен");
}

void TieredCache::setErrorListener(common::ComponentErrorListener listener) {
    std::lock_guard<std::mutex> lock(pImpl->listenerMutex);
    pImpl->errorListener = std::move(listener);
}

} // namespace cache
} // namespace core
} // namespace qsynth
