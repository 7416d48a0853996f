#include "core/cache/CacheKey.hpp"
#include <iomanip>
#include <sstream>
#include <openssl/sha.h>

namespace qsynth {
namespace core {
namespace cache {

namespace {
std::string digestHex(const unsigned char* data, size_t length) {
    unsigned char hash[SHA256_DIGEST_LENGTH];
    SHA256(data, length, hash);

    std::stringstream ss;
    for (int i = 0; i < SHA256_DIGEST_LENGTH; i++) {
        ss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(hash[i]);
    }
    return ss.str();
}
} // namespace

std::string sha256Hex(const std::string& data) {
    return digestHex(reinterpret_cast<const unsigned char*>(data.data()), data.size());
}

std::string sha256Hex(const std::vector<uint8_t>& data) {
    return digestHex(data.data(), data.size());
}

std::string deriveCacheKey(const std::string& operationType, const nlohmann::json& params) {
    // nlohmann::json хранит объекты в std::map, dump() без отступов уже канонический
    return operationType + ":" + sha256Hex(params.dump());
}

std::string toHex(const std::vector<uint8_t>& bytes) {
    std::stringstream ss;
    for (auto byte : bytes) {
        ss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(byte);
    }
    return ss.str();
}

} // namespace cache
} // namespace core
} // namespace qsynth
