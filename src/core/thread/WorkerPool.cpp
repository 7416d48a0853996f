#include "core/thread/WorkerPool.hpp"
#include <algorithm>
#include <atomic>
#include <condition_variable>
#include <map>
#include <mutex>
#include <thread>
#include <unordered_map>
#include <spdlog/spdlog.h>
#include "core/common/Errors.hpp"
#include "core/common/Logging.hpp"

namespace qsynth {
namespace core {
namespace thread {

using Clock = std::chrono::steady_clock;

std::string toString(TaskKind kind) {
    switch (kind) {
        case TaskKind::GenerateKeyMaterial: return "generate-key-material";
        case TaskKind::Sign: return "sign";
        case TaskKind::Verify: return "verify";
        case TaskKind::ComputeEnergy: return "compute-energy";
        case TaskKind::Custom: return "custom";
    }
    return "custom";
}

std::string toString(PoolEventType type) {
    switch (type) {
        case PoolEventType::TaskAssigned: return "task-assigned";
        case PoolEventType::TaskCompleted: return "task-completed";
        case PoolEventType::TaskError: return "task-error";
        case PoolEventType::TaskTimeout: return "task-timeout";
        case PoolEventType::WorkerCreated: return "worker-created";
        case PoolEventType::WorkerReplaced: return "worker-replaced";
        case PoolEventType::WorkerRetired: return "worker-retired";
        case PoolEventType::PoolScaled: return "pool-scaled";
        case PoolEventType::PoolShutdown: return "pool-shutdown";
    }
    return "unknown";
}

nlohmann::json WorkerPoolMetrics::toJson() const {
    nlohmann::json details = nlohmann::json::array();
    for (const auto& worker : workers) {
        details.push_back(worker.toJson());
    }
    return {
        {"poolSize", poolSize},
        {"activeWorkers", activeWorkers},
        {"queuedTasks", queuedTasks},
        {"totalCompleted", totalCompleted},
        {"totalErrors", totalErrors},
        {"timeouts", timeouts},
        {"workerFailures", workerFailures},
        {"averageResponseTimeMs", averageResponseTimeMs},
        {"workerUtilization", workerUtilization},
        {"queueUtilization", queueUtilization},
        {"errorRate", errorRate},
        {"workerDetails", details}
    };
}

nlohmann::json WorkerPoolConfig::toJson() const {
    return {
        {"poolSize", poolSize},
        {"maxQueueSize", maxQueueSize},
        {"taskTimeoutMs", taskTimeout.count()},
        {"enableLoadBalancing", enableLoadBalancing},
        {"enableFaultTolerance", enableFaultTolerance},
        {"statsIntervalMs", statsInterval.count()}
    };
}

WorkerPoolConfig WorkerPoolConfig::fromJson(const nlohmann::json& j) {
    WorkerPoolConfig config;
    config.poolSize = j.value("poolSize", config.poolSize);
    config.maxQueueSize = j.value("maxQueueSize", config.maxQueueSize);
    config.taskTimeout = std::chrono::milliseconds(j.value("taskTimeoutMs", config.taskTimeout.count()));
    config.enableLoadBalancing = j.value("enableLoadBalancing", config.enableLoadBalancing);
    config.enableFaultTolerance = j.value("enableFaultTolerance", config.enableFaultTolerance);
    config.statsInterval = std::chrono::milliseconds(j.value("statsIntervalMs", config.statsInterval.count()));
    return config;
}

// Реализация PIMPL
struct WorkerPool::Impl {
    // Задача в активном наборе
    struct ActiveTask {
        std::string id;
        TaskDescriptor descriptor;
        std::promise<TaskResult> promise;
        Clock::time_point submittedAt;
        Clock::time_point deadline;
        bool dispatched = false;
        bool settled = false;               // Промис уже выполнен
    };

    struct Worker {
        std::string id;
        std::thread thread;
        std::condition_variable cv;
        std::shared_ptr<ActiveTask> assigned;
        bool busy = false;
        bool retiring = false;
        bool faulty = false;
        bool exited = false;
        WorkerStats stats;
    };

    WorkerPoolConfig config;
    std::shared_ptr<spdlog::logger> logger;

    mutable std::mutex mutex;                                   // Защищает всё ниже
    std::multimap<int, std::shared_ptr<ActiveTask>, std::greater<int>> queue; // FIFO внутри приоритета
    std::unordered_map<std::string, std::shared_ptr<ActiveTask>> active;
    std::vector<std::shared_ptr<Worker>> workers;               // Текущий состав
    std::vector<std::shared_ptr<Worker>> retired;               // Ожидают join
    std::condition_variable monitorCv;
    std::condition_variable drainCv;
    bool shuttingDown = false;
    bool stopping = false;
    bool stopped = false;
    uint64_t nextTaskId = 1;
    uint64_t nextWorkerId = 1;
    uint64_t sequence = 0;
    size_t timeouts = 0;
    size_t workerFailures = 0;
    Clock::time_point lastStatsLog = Clock::now();

    std::mutex listenersMutex;
    std::vector<PoolEventListener> listeners;

    std::thread monitor;

    explicit Impl(const WorkerPoolConfig& cfg) : config(cfg) {
        logger = common::componentLogger("workerpool");
    }

    void record(std::vector<PoolEvent>& events, PoolEvent event) {
        event.sequence = ++sequence;
        events.push_back(std::move(event));
    }

    void emit(const std::vector<PoolEvent>& events) {
        if (events.empty()) return;
        std::vector<PoolEventListener> snapshot;
        {
            std::lock_guard<std::mutex> lock(listenersMutex);
            snapshot = listeners;
        }
        for (const auto& event : events) {
            for (const auto& listener : snapshot) {
                try {
                    listener(event);
                } catch (const std::exception& e) {
                    logger->error("Ошибка обработчика события {}: {}", toString(event.type), e.what());
                }
            }
        }
    }

    // Выполнение промиса; onSettled откладывается до снятия мьютекса
    void settleLocked(const std::shared_ptr<ActiveTask>& task, TaskResult result, std::exception_ptr error,
                      std::vector<std::function<void()>>& settlements) {
        task->settled = true;
        if (task->descriptor.onSettled) {
            auto callback = task->descriptor.onSettled;
            settlements.push_back([callback, result, error] { callback(result, error); });
        }
        if (error) {
            task->promise.set_exception(error);
        } else {
            task->promise.set_value(std::move(result));
        }
    }

    void runSettlements(std::vector<std::function<void()>>& settlements) {
        for (auto& settlement : settlements) {
            try {
                settlement();
            } catch (const std::exception& e) {
                logger->error("Ошибка обработчика завершения задачи: {}", e.what());
            }
        }
        settlements.clear();
    }

    size_t liveWorkerCount() const {
        return static_cast<size_t>(std::count_if(workers.begin(), workers.end(), [](const auto& w) {
            return !w->retiring && !w->faulty;
        }));
    }

    // Создание воркера (под мьютексом)
    std::shared_ptr<Worker> createWorkerLocked(std::vector<PoolEvent>& events) {
        auto worker = std::make_shared<Worker>();
        worker->id = "worker-" + std::to_string(nextWorkerId++);
        worker->thread = std::thread([this, worker] { workerLoop(worker); });
        workers.push_back(worker);

        PoolEvent event{PoolEventType::WorkerCreated};
        event.workerId = worker->id;
        record(events, std::move(event));
        return worker;
    }

    // Выбор свободного воркера: с минимальным средним временем или первый свободный
    std::shared_ptr<Worker> selectWorkerLocked() const {
        std::shared_ptr<Worker> selected;
        for (const auto& worker : workers) {
            if (worker->busy || worker->retiring || worker->faulty || worker->exited) continue;
            if (!config.enableLoadBalancing) {
                return worker;
            }
            if (!selected || worker->stats.averageTimeMs < selected->stats.averageTimeMs) {
                selected = worker;
            }
        }
        return selected;
    }

    // Диспетчеризация: задача с наивысшим приоритетом уходит свободному воркеру
    void dispatchLocked(std::vector<PoolEvent>& events) {
        while (!queue.empty()) {
            auto worker = selectWorkerLocked();
            if (!worker) break;

            auto it = queue.begin();
            auto task = it->second;
            queue.erase(it);

            task->dispatched = true;
            worker->assigned = task;
            worker->busy = true;
            worker->cv.notify_one();

            PoolEvent event{PoolEventType::TaskAssigned};
            event.taskId = task->id;
            event.workerId = worker->id;
            event.kind = task->descriptor.kind;
            event.priority = task->descriptor.priority;
            record(events, std::move(event));
        }
    }

    void retireLocked(const std::shared_ptr<Worker>& worker) {
        worker->exited = true;
        auto it = std::find(workers.begin(), workers.end(), worker);
        if (it != workers.end()) {
            workers.erase(it);
            retired.push_back(worker);
        }
    }

    void workerLoop(std::shared_ptr<Worker> self) {
        while (true) {
            std::shared_ptr<ActiveTask> task;
            std::vector<PoolEvent> events;
            std::vector<std::function<void()>> settlements;
            {
                std::unique_lock<std::mutex> lock(mutex);
                self->cv.wait(lock, [&] {
                    return self->assigned || self->retiring || stopping;
                });

                if (stopping || !self->assigned) {
                    // Выход: остановка пула или воркер выводится из состава без задачи
                    self->assigned.reset();
                    if (!stopping) {
                        PoolEvent event{PoolEventType::WorkerRetired};
                        event.workerId = self->id;
                        record(events, std::move(event));
                    }
                    retireLocked(self);
                    lock.unlock();
                    emit(events);
                    return;
                }
                task = self->assigned;
            }

            auto start = Clock::now();
            TaskResult result;
            std::exception_ptr error;
            std::string errorMessage;
            bool crashed = false;
            try {
                result = task->descriptor.work();
            } catch (const common::WorkerFailureError& e) {
                error = std::current_exception();
                errorMessage = e.what();
                crashed = true;
            } catch (const std::exception& e) {
                error = std::current_exception();
                errorMessage = e.what();
            } catch (...) {
                errorMessage = "неизвестное исключение";
                error = std::make_exception_ptr(common::WorkerFailureError(
                    "Воркер " + self->id + " аварийно завершился: " + errorMessage));
                crashed = true;
            }
            double elapsedMs = std::chrono::duration<double, std::milli>(Clock::now() - start).count();

            bool exitAfterTask = false;
            {
                std::lock_guard<std::mutex> lock(mutex);
                self->assigned.reset();
                self->busy = false;

                if (error) {
                    ++self->stats.errors;
                } else {
                    ++self->stats.completed;
                }
                self->stats.totalTimeMs += elapsedMs;
                self->stats.averageTimeMs = self->stats.totalTimeMs /
                    static_cast<double>(self->stats.completed + self->stats.errors);

                if (!task->settled) {
                    active.erase(task->id);

                    PoolEvent event{error ? PoolEventType::TaskError : PoolEventType::TaskCompleted};
                    event.taskId = task->id;
                    event.workerId = self->id;
                    event.kind = task->descriptor.kind;
                    event.priority = task->descriptor.priority;
                    event.executionTimeMs = elapsedMs;
                    event.detail = errorMessage;

                    if (crashed) {
                        error = std::make_exception_ptr(common::WorkerFailureError(
                            "Задача " + task->id + " потеряна: воркер " + self->id +
                            " аварийно завершился (" + errorMessage + ")"));
                    }
                    settleLocked(task, std::move(result), error, settlements);
                    record(events, std::move(event));
                } else {
                    logger->debug("Результат задачи {} отброшен: таймаут уже сработал", task->id);
                }

                if (crashed) {
                    ++workerFailures;
                    self->faulty = true;
                    logger->error("Воркер {} аварийно завершился: {}", self->id, errorMessage);
                    // Замена создаётся до удаления упавшего воркера; выводимый scale() не заменяется
                    if (config.enableFaultTolerance && !shuttingDown && !self->retiring) {
                        auto replacement = createWorkerLocked(events);
                        PoolEvent event{PoolEventType::WorkerReplaced};
                        event.workerId = replacement->id;
                        event.detail = self->id;
                        record(events, std::move(event));
                    }
                    retireLocked(self);
                    exitAfterTask = true;
                } else if (self->retiring) {
                    PoolEvent event{PoolEventType::WorkerRetired};
                    event.workerId = self->id;
                    record(events, std::move(event));
                    retireLocked(self);
                    exitAfterTask = true;
                }

                dispatchLocked(events);
                if (active.empty()) {
                    drainCv.notify_all();
                }
                monitorCv.notify_one();
            }
            emit(events);
            runSettlements(settlements);
            if (exitAfterTask) return;
        }
    }

    // Истечение дедлайнов (под мьютексом)
    void expireLocked(std::vector<PoolEvent>& events, std::vector<std::function<void()>>& settlements) {
        auto now = Clock::now();
        for (auto it = active.begin(); it != active.end();) {
            auto task = it->second;
            if (task->settled || task->deadline > now) {
                ++it;
                continue;
            }
            settleLocked(task, TaskResult(), std::make_exception_ptr(common::TaskTimeoutError(task->id)),
                         settlements);
            if (!task->dispatched) {
                for (auto q = queue.begin(); q != queue.end(); ++q) {
                    if (q->second == task) {
                        queue.erase(q);
                        break;
                    }
                }
            }
            ++timeouts;
            logger->warn("Задача {} превысила таймаут", task->id);

            PoolEvent event{PoolEventType::TaskTimeout};
            event.taskId = task->id;
            event.kind = task->descriptor.kind;
            event.priority = task->descriptor.priority;
            record(events, std::move(event));
            it = active.erase(it);
        }
        if (active.empty()) {
            drainCv.notify_all();
        }
    }

    void monitorLoop() {
        std::unique_lock<std::mutex> lock(mutex);
        while (!stopping) {
            auto wakeUp = lastStatsLog + config.statsInterval;
            for (const auto& [id, task] : active) {
                if (!task->settled && task->deadline < wakeUp) {
                    wakeUp = task->deadline;
                }
            }
            monitorCv.wait_until(lock, wakeUp);
            if (stopping) break;

            std::vector<PoolEvent> events;
            std::vector<std::function<void()>> settlements;
            std::vector<std::shared_ptr<Worker>> toJoin;
            try {
                expireLocked(events, settlements);
                for (auto it = retired.begin(); it != retired.end();) {
                    if ((*it)->exited) {
                        toJoin.push_back(*it);
                        it = retired.erase(it);
                    } else {
                        ++it;
                    }
                }
            } catch (const std::exception& e) {
                logger->error("Ошибка монитора пула: {}", e.what());
            }

            bool logStats = Clock::now() - lastStatsLog >= config.statsInterval;
            if (logStats) lastStatsLog = Clock::now();

            lock.unlock();
            for (auto& worker : toJoin) {
                if (worker->thread.joinable()) worker->thread.join();
            }
            emit(events);
            runSettlements(settlements);
            if (logStats) {
                logStatistics();
            }
            lock.lock();
        }
    }

    WorkerPoolMetrics collectMetricsLocked() const {
        WorkerPoolMetrics metrics;
        metrics.poolSize = liveWorkerCount();
        metrics.queuedTasks = queue.size();
        metrics.timeouts = timeouts;
        metrics.workerFailures = workerFailures;
        double totalTime = 0.0;
        for (const auto& worker : workers) {
            if (worker->busy) ++metrics.activeWorkers;
            metrics.totalCompleted += worker->stats.completed;
            metrics.totalErrors += worker->stats.errors;
            totalTime += worker->stats.totalTimeMs;
            metrics.workers.push_back(WorkerRecord{worker->id, worker->busy, worker->retiring, worker->stats});
        }
        size_t finished = metrics.totalCompleted + metrics.totalErrors;
        metrics.averageResponseTimeMs = finished > 0 ? totalTime / static_cast<double>(finished) : 0.0;
        metrics.workerUtilization = workers.empty() ? 0.0
            : static_cast<double>(metrics.activeWorkers) / static_cast<double>(workers.size());
        metrics.queueUtilization = static_cast<double>(metrics.queuedTasks) /
            static_cast<double>(config.maxQueueSize);
        metrics.errorRate = finished > 0
            ? static_cast<double>(metrics.totalErrors) / static_cast<double>(finished) : 0.0;
        return metrics;
    }

    void logStatistics() {
        WorkerPoolMetrics metrics;
        {
            std::lock_guard<std::mutex> lock(mutex);
            metrics = collectMetricsLocked();
        }
        logger->debug("Метрики пула: воркеров={}, активных={}, очередь={}, выполнено={}, ошибок={}",
                      metrics.poolSize, metrics.activeWorkers, metrics.queuedTasks,
                      metrics.totalCompleted, metrics.totalErrors);
    }
};

// Конструктор
WorkerPool::WorkerPool(const WorkerPoolConfig& config)
    : pImpl(std::make_unique<Impl>(config)) {
    if (!config.validate()) {
        throw std::invalid_argument("Некорректная конфигурация пула воркеров");
    }

    std::vector<PoolEvent> events;
    {
        std::lock_guard<std::mutex> lock(pImpl->mutex);
        for (size_t i = 0; i < config.poolSize; ++i) {
            pImpl->createWorkerLocked(events);
        }
    }
    pImpl->monitor = std::thread([this] { pImpl->monitorLoop(); });

    pImpl->logger->debug("Пул воркеров инициализирован: {} воркеров", config.poolSize);
}

// Деструктор
WorkerPool::~WorkerPool() {
    try {
        shutdown(std::chrono::milliseconds(0));
    } catch (const std::exception& e) {
        pImpl->logger->error("Ошибка остановки пула воркеров: {}", e.what());
    }
}

// Добавление задачи в очередь
TaskHandle WorkerPool::submit(TaskDescriptor task) {
    if (!task.work) {
        throw std::invalid_argument("Задача без функции выполнения");
    }

    std::vector<PoolEvent> events;
    TaskHandle handle;
    {
        std::lock_guard<std::mutex> lock(pImpl->mutex);
        if (pImpl->shuttingDown) {
            throw common::PoolClosedError();
        }
        if (pImpl->queue.size() >= pImpl->config.maxQueueSize) {
            pImpl->logger->warn("Очередь задач переполнена: {}", pImpl->queue.size());
            throw common::QueueFullError(pImpl->config.maxQueueSize);
        }

        auto active = std::make_shared<Impl::ActiveTask>();
        active->id = "task-" + std::to_string(pImpl->nextTaskId++);
        active->submittedAt = Clock::now();
        auto timeout = task.timeout.count() > 0 ? task.timeout : pImpl->config.taskTimeout;
        active->deadline = active->submittedAt + timeout;
        int priority = task.priority;
        active->descriptor = std::move(task);
        handle = active->promise.get_future();

        pImpl->active[active->id] = active;
        pImpl->queue.emplace(priority, active);

        pImpl->logger->debug("Задача {} ({}) добавлена: приоритет={}, очередь={}",
                             active->id, toString(active->descriptor.kind), priority,
                             pImpl->queue.size());

        pImpl->dispatchLocked(events);
        pImpl->monitorCv.notify_one();
    }
    pImpl->emit(events);
    return handle;
}

// Масштабирование пула
void WorkerPool::scale(size_t newSize) {
    if (newSize == 0) {
        throw std::invalid_argument("Размер пула должен быть больше нуля");
    }

    std::vector<PoolEvent> events;
    {
        std::lock_guard<std::mutex> lock(pImpl->mutex);
        if (pImpl->shuttingDown) {
            throw common::PoolClosedError();
        }

        size_t current = pImpl->liveWorkerCount();
        if (newSize > current) {
            for (size_t i = current; i < newSize; ++i) {
                pImpl->createWorkerLocked(events);
            }
        } else if (newSize < current) {
            // Сначала выводим свободных воркеров, затем занятых (они доработают задачу)
            size_t toRetire = current - newSize;
            for (int pass = 0; pass < 2 && toRetire > 0; ++pass) {
                for (auto it = pImpl->workers.rbegin(); it != pImpl->workers.rend() && toRetire > 0; ++it) {
                    auto& worker = *it;
                    if (worker->retiring || worker->faulty) continue;
                    if (pass == 0 && worker->busy) continue;
                    worker->retiring = true;
                    worker->cv.notify_one();
                    --toRetire;
                }
            }
        }

        PoolEvent event{PoolEventType::PoolScaled};
        event.detail = std::to_string(current) + "->" + std::to_string(newSize);
        pImpl->record(events, std::move(event));
        pImpl->config.poolSize = newSize;
        pImpl->dispatchLocked(events);
        pImpl->logger->info("Пул масштабирован: {} -> {}", current, newSize);
    }
    pImpl->emit(events);
}

// Корректное завершение работы
bool WorkerPool::shutdown(std::chrono::milliseconds deadline) {
    std::vector<PoolEvent> events;
    std::vector<std::function<void()>> settlements;
    std::vector<std::shared_ptr<Impl::Worker>> toJoin;
    bool drained = false;
    {
        std::unique_lock<std::mutex> lock(pImpl->mutex);
        if (pImpl->stopped) {
            return true;
        }
        pImpl->shuttingDown = true;

        drained = pImpl->drainCv.wait_for(lock, deadline, [this] {
            return pImpl->active.empty();
        });

        // Незавершённые задачи отклоняются
        for (auto& [id, task] : pImpl->active) {
            if (!task->settled) {
                pImpl->settleLocked(task, TaskResult(), std::make_exception_ptr(
                    common::PoolClosedError("Задача " + id + " отменена остановкой пула")), settlements);
            }
        }
        if (!pImpl->active.empty()) {
            pImpl->logger->warn("Остановка пула: отменено {} задач", pImpl->active.size());
        }
        pImpl->active.clear();
        pImpl->queue.clear();

        pImpl->stopping = true;
        pImpl->stopped = true;
        for (auto& worker : pImpl->workers) {
            worker->cv.notify_all();
            toJoin.push_back(worker);
        }
        for (auto& worker : pImpl->retired) {
            toJoin.push_back(worker);
        }
        pImpl->retired.clear();
        pImpl->monitorCv.notify_all();

        PoolEvent event{PoolEventType::PoolShutdown};
        event.detail = drained ? "drained" : "deadline";
        pImpl->record(events, std::move(event));
    }

    for (auto& worker : toJoin) {
        if (worker->thread.joinable()) worker->thread.join();
    }
    if (pImpl->monitor.joinable()) {
        pImpl->monitor.join();
    }
    {
        std::lock_guard<std::mutex> lock(pImpl->mutex);
        pImpl->workers.clear();
    }

    pImpl->emit(events);
    pImpl->runSettlements(settlements);
    pImpl->logger->info("Пул воркеров остановлен (drained={})", drained);
    return drained;
}

bool WorkerPool::isShuttingDown() const {
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    return pImpl->shuttingDown;
}

bool WorkerPool::ping() const {
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    return !pImpl->shuttingDown && pImpl->liveWorkerCount() > 0;
}

size_t WorkerPool::getWorkerCount() const {
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    return pImpl->liveWorkerCount();
}

size_t WorkerPool::getActiveWorkerCount() const {
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    return static_cast<size_t>(std::count_if(pImpl->workers.begin(), pImpl->workers.end(),
        [](const auto& w) { return w->busy; }));
}

size_t WorkerPool::getQueueSize() const {
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    return pImpl->queue.size();
}

void WorkerPool::addListener(PoolEventListener listener) {
    std::lock_guard<std::mutex> lock(pImpl->listenersMutex);
    pImpl->listeners.push_back(std::move(listener));
}

// Получение метрик
WorkerPoolMetrics WorkerPool::getMetrics() const {
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    return pImpl->collectMetricsLocked();
}

// Обновление метрик
void WorkerPool::updateMetrics() {
    try {
        pImpl->logStatistics();
    } catch (const std::exception& e) {
        pImpl->logger->error("Ошибка обновления метрик: {}", e.what());
    }
}

WorkerPoolConfig WorkerPool::getConfiguration() const {
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    return pImpl->config;
}

} // namespace thread
} // namespace core
} // namespace qsynth
