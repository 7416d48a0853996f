#pragma once

#include <functional>
#include <stdexcept>
#include <string>

namespace qsynth {
namespace core {
namespace common {

// Базовая ошибка ядра синтеза
class SynthesisError : public std::runtime_error {
public:
    explicit SynthesisError(const std::string& message)
        : std::runtime_error(message) {}
};

// Задача не уложилась в дедлайн
class TaskTimeoutError : public SynthesisError {
public:
    explicit TaskTimeoutError(const std::string& taskId)
        : SynthesisError("Задача " + taskId + " превысила таймаут"), taskId_(taskId) {}
    const std::string& taskId() const { return taskId_; }
private:
    std::string taskId_;
};

// Воркер упал во время выполнения задачи
class WorkerFailureError : public SynthesisError {
public:
    using SynthesisError::SynthesisError;
};

// Пул закрывается, новые задачи не принимаются
class PoolClosedError : public SynthesisError {
public:
    PoolClosedError() : SynthesisError("Пул воркеров завершает работу") {}
    using SynthesisError::SynthesisError;
};

// Очередь задач заполнена
class QueueFullError : public SynthesisError {
public:
    explicit QueueFullError(size_t capacity)
        : SynthesisError("Очередь задач переполнена (ёмкость " + std::to_string(capacity) + ")") {}
};

// Кворум собран, но одобрений недостаточно
class ConsensusRejectedError : public SynthesisError {
public:
    using SynthesisError::SynthesisError;
};

// Кворум не собран до истечения предложения
class ConsensusTimeoutError : public SynthesisError {
public:
    using SynthesisError::SynthesisError;
};

// Ошибка транспорта при отправке пиру
class PeerSendError : public SynthesisError {
public:
    PeerSendError(const std::string& peerId, const std::string& reason)
        : SynthesisError("Ошибка отправки пиру " + peerId + ": " + reason), peerId_(peerId) {}
    const std::string& peerId() const { return peerId_; }
private:
    std::string peerId_;
};

class ResourceNotFoundError : public SynthesisError {
public:
    explicit ResourceNotFoundError(const std::string& resourceId)
        : SynthesisError("Ресурс " + resourceId + " не найден") {}
};

// Ресурс заблокирован текущим раундом консенсуса
class ResourceLockedError : public SynthesisError {
public:
    explicit ResourceLockedError(const std::string& resourceId)
        : SynthesisError("Ресурс " + resourceId + " заблокирован раундом консенсуса") {}
};

// Обработчик ошибок фоновых потоков компонента (имя компонента, сообщение)
using ComponentErrorListener = std::function<void(const std::string& component, const std::string& message)>;

} // namespace common
} // namespace core
} // namespace qsynth
