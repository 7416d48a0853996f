#pragma once

#include <cstdint>
#include <string>
#include <variant>
#include <vector>
#include <gmpxx.h>
#include <nlohmann/json.hpp>
#include "core/crypto/CryptoBackend.hpp"

namespace qsynth {
namespace core {
namespace coordinator {

// Операции пакетной обработки координатора
struct CreateOp {
    mpz_class value;
    mpz_class frequency{1};
};

struct SignOp {
    std::string resourceId;
    std::vector<uint8_t> data;
};

struct VerifyOp {
    std::string resourceId;
    crypto::Signature signature;
    std::vector<uint8_t> data;
};

struct AdaptOp {
    std::string resourceId;
    mpz_class newValue;
    mpz_class newFrequency{1};
};

using Operation = std::variant<CreateOp, SignOp, VerifyOp, AdaptOp>;

std::string operationName(const Operation& op);

// Результат операции: ok + value либо текст ошибки
struct OperationResult {
    bool ok = false;
    nlohmann::json value;
    std::string error;

    nlohmann::json toJson() const {
        nlohmann::json j = {{"ok", ok}};
        if (ok) {
            j["value"] = value;
        } else {
            j["error"] = error;
        }
        return j;
    }
};

} // namespace coordinator
} // namespace core
} // namespace qsynth
