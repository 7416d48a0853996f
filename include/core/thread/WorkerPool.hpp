#pragma once

#include <vector>
#include <functional>
#include <future>
#include <memory>
#include <chrono>
#include <string>
#include <nlohmann/json.hpp>

namespace qsynth {
namespace core {
namespace thread {

// Виды CPU-задач пула
enum class TaskKind {
    GenerateKeyMaterial,
    Sign,
    Verify,
    ComputeEnergy,
    Custom
};

std::string toString(TaskKind kind);

using TaskResult = nlohmann::json;
using TaskHandle = std::future<TaskResult>;

// Описание задачи для пула
struct TaskDescriptor {
    TaskKind kind = TaskKind::Custom;
    nlohmann::json payload;                 // Параметры задачи (для логов)
    int priority = 5;                       // Больший приоритет выполняется раньше
    std::chrono::milliseconds timeout{0};   // 0: таймаут пула по умолчанию
    std::function<TaskResult()> work;       // Сама работа
    // Вызывается один раз после выполнения промиса (успех, ошибка, таймаут, отмена), вне мьютекса пула
    std::function<void(const TaskResult&, std::exception_ptr)> onSettled;
};

// Статистика воркера
struct WorkerStats {
    size_t completed = 0;
    size_t errors = 0;
    double totalTimeMs = 0.0;
    double averageTimeMs = 0.0;
};

// Снимок записи воркера
struct WorkerRecord {
    std::string id;
    bool busy = false;
    bool retiring = false;
    WorkerStats stats;

    nlohmann::json toJson() const {
        return {
            {"workerId", id},
            {"busy", busy},
            {"retiring", retiring},
            {"completed", stats.completed},
            {"errors", stats.errors},
            {"totalTimeMs", stats.totalTimeMs},
            {"averageTimeMs", stats.averageTimeMs}
        };
    }
};

// События жизненного цикла пула
enum class PoolEventType {
    TaskAssigned,
    TaskCompleted,
    TaskError,
    TaskTimeout,
    WorkerCreated,
    WorkerReplaced,
    WorkerRetired,
    PoolScaled,
    PoolShutdown
};

std::string toString(PoolEventType type);

struct PoolEvent {
    PoolEventType type;
    uint64_t sequence = 0;          // Порядковый номер, назначается при диспетчеризации
    std::string taskId;
    std::string workerId;
    TaskKind kind = TaskKind::Custom;
    int priority = 0;
    double executionTimeMs = 0.0;
    std::string detail;
};

using PoolEventListener = std::function<void(const PoolEvent&)>;

// Метрики пула воркеров
struct WorkerPoolMetrics {
    size_t poolSize = 0;
    size_t activeWorkers = 0;
    size_t queuedTasks = 0;
    size_t totalCompleted = 0;
    size_t totalErrors = 0;
    size_t timeouts = 0;
    size_t workerFailures = 0;
    double averageResponseTimeMs = 0.0;
    double workerUtilization = 0.0;
    double queueUtilization = 0.0;
    double errorRate = 0.0;
    std::vector<WorkerRecord> workers;

    nlohmann::json toJson() const;
};

// Конфигурация пула воркеров
struct WorkerPoolConfig {
    size_t poolSize = 4;                          // Количество воркеров
    size_t maxQueueSize = 1000;                   // Макс. очередь
    std::chrono::milliseconds taskTimeout{30000}; // Таймаут задачи по умолчанию
    bool enableLoadBalancing = true;              // Выбор воркера по среднему времени
    bool enableFaultTolerance = true;             // Замена упавших воркеров
    std::chrono::milliseconds statsInterval{30000}; // Период логирования метрик

    bool validate() const {
        if (poolSize == 0) return false;
        if (maxQueueSize == 0) return false;
        if (taskTimeout.count() <= 0) return false;
        if (statsInterval.count() <= 0) return false;
        return true;
    }

    nlohmann::json toJson() const;
    static WorkerPoolConfig fromJson(const nlohmann::json& j);
};

// Пул воркеров с приоритетной очередью
class WorkerPool {
public:
    explicit WorkerPool(const WorkerPoolConfig& config);
    ~WorkerPool();

    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    // Поставить задачу в очередь; бросает PoolClosedError / QueueFullError
    TaskHandle submit(TaskDescriptor task);

    // Изменить количество воркеров
    void scale(size_t newSize);

    // Корректное завершение: дождаться задач не дольше deadline
    bool shutdown(std::chrono::milliseconds deadline);

    bool isShuttingDown() const;

    // Живой ли пул (для health-check)
    bool ping() const;

    size_t getWorkerCount() const;
    size_t getActiveWorkerCount() const;
    size_t getQueueSize() const;

    void addListener(PoolEventListener listener);

    WorkerPoolMetrics getMetrics() const;
    void updateMetrics();

    WorkerPoolConfig getConfiguration() const;

private:
    struct Impl;
    std::unique_ptr<Impl> pImpl;
};

} // namespace thread
} // namespace core
} // namespace qsynth
