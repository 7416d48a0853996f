#pragma once

#include <cstdint>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace qsynth {
namespace core {
namespace cache {

// Шестнадцатеричный SHA-256
std::string sha256Hex(const std::string& data);
std::string sha256Hex(const std::vector<uint8_t>& data);

/**
 * @brief Ключ кэша операции.
 * @details operationType + ":" + hex(SHA-256(канонический JSON)). Канонический
 * JSON: ключи объектов отсортированы, без пробелов.
 */
std::string deriveCacheKey(const std::string& operationType, const nlohmann::json& params);

// Байты в hex (для параметров ключа)
std::string toHex(const std::vector<uint8_t>& bytes);

} // namespace cache
} // namespace core
} // namespace qsynth
