#include "sync/task_scheduler.hpp"

#include <algorithm>
#include <atomic>
#include <condition_variable>
#include <map>
#include <mutex>
#include <shared_mutex>
#include <thread>
#include <unordered_map>
#include <utility>
#include <vector>

#include <QThreadPool>

#include "common/json_utils.hpp"
#include "common/logging.hpp"
#include "sync/backoff_policy.hpp"

namespace engage {

namespace {

using Clock = std::chrono::steady_clock;

struct TaskSlot {
    std::mutex mutex;
    TaskState state = TaskState::Idle;
    TaskRequest request;
    // Set when enqueue() arrives while the task is running.
    bool rerun = false;
    std::optional<TaskRequest> rerunRequest;
    // The running attempt was cancelled by a Replace enqueue.
    bool replaced = false;
    bool parked = false;
    int failures = 0;
    // Fresh value from the scheduler-wide counter whenever the slot is
    // (re)queued; dispatch entries carrying another generation are stale.
    uint64_t generation = 0;
    CancellationToken token;
};

int64_t toMillis(std::chrono::milliseconds value)
{
    return static_cast<int64_t>(value.count());
}

} // namespace

struct TaskScheduler::Impl {
    explicit Impl(const EngageConfig &config)
        : backoff(config.minBackoff, config.maxBackoff)
        , maxPollInterval(config.maxPollInterval)
        , maxAttempts(config.maxAttempts)
    {
        pool.setMaxThreadCount(std::max(1, config.workerCount));
    }

    BackoffPolicy backoff;
    std::chrono::milliseconds maxPollInterval;
    int maxAttempts = 0;

    QThreadPool pool;

    // Idle slots are dropped from the arena; generations stay unique across
    // slot lifetimes so queue entries of a dropped slot never match a new one.
    mutable std::shared_mutex slotsMutex;
    std::unordered_map<std::string, std::shared_ptr<TaskSlot>> slots;
    std::atomic<uint64_t> nextGeneration{0};

    std::mutex launchersMutex;
    std::vector<std::pair<std::string, TaskLauncher>> launchers;

    std::mutex listenersMutex;
    TaskFailureListener failureListener;
    TaskRetryListener retryListener;

    std::atomic<bool> networkAvailable{true};

    std::mutex queueMutex;
    std::condition_variable queueCv;
    std::multimap<Clock::time_point, std::pair<std::string, uint64_t>> queue;
    bool stopping = false;
    bool stopped = false;
    std::thread dispatcher;

    std::shared_ptr<TaskSlot> findSlot(const std::string &taskId) const
    {
        std::shared_lock<std::shared_mutex> lock(slotsMutex);
        const auto it = slots.find(taskId);
        return it == slots.end() ? nullptr : it->second;
    }

    std::shared_ptr<TaskSlot> slotFor(const std::string &taskId)
    {
        if (auto slot = findSlot(taskId)) {
            return slot;
        }
        std::unique_lock<std::shared_mutex> lock(slotsMutex);
        auto &slot = slots[taskId];
        if (!slot) {
            slot = std::make_shared<TaskSlot>();
        }
        return slot;
    }

    // Drops an Idle slot nobody else references. The arena lock blocks new
    // references, so a use count of one means the map holds the only one.
    void releaseIfIdle(const std::string &taskId)
    {
        std::unique_lock<std::shared_mutex> lock(slotsMutex);
        const auto it = slots.find(taskId);
        if (it == slots.end() || it->second.use_count() != 1) {
            return;
        }
        {
            std::lock_guard<std::mutex> slotLock(it->second->mutex);
            if (it->second->state != TaskState::Idle) {
                return;
            }
        }
        slots.erase(it);
    }

    size_t slotCount() const
    {
        std::shared_lock<std::shared_mutex> lock(slotsMutex);
        return slots.size();
    }

    void schedule(const std::string &taskId, uint64_t generation, Clock::time_point due)
    {
        {
            std::lock_guard<std::mutex> lock(queueMutex);
            if (stopping) {
                return;
            }
            queue.emplace(due, std::make_pair(taskId, generation));
        }
        queueCv.notify_one();
    }

    // Caller holds slot.mutex.
    void queueLocked(const std::string &taskId,
                     TaskSlot &slot,
                     const TaskRequest &request,
                     std::chrono::milliseconds delay)
    {
        slot.state = TaskState::Queued;
        slot.request = request;
        slot.rerun = false;
        slot.rerunRequest.reset();
        slot.replaced = false;
        slot.parked = false;
        slot.generation = ++nextGeneration;
        schedule(taskId, slot.generation, Clock::now() + delay);
    }

    TaskLauncher launcherFor(const std::string &taskId)
    {
        std::lock_guard<std::mutex> lock(launchersMutex);
        const std::pair<std::string, TaskLauncher> *best = nullptr;
        for (const auto &entry : launchers) {
            if (taskId.compare(0, entry.first.size(), entry.first) != 0) {
                continue;
            }
            if (!best || entry.first.size() > best->first.size()) {
                best = &entry;
            }
        }
        return best ? best->second : TaskLauncher{};
    }

    void dispatchLoop();
    void tryDispatch(const std::string &taskId, uint64_t generation);
    void runAttempt(const TaskRequest &request,
                    const CancellationToken &token,
                    const TaskLauncher &launcher);
    void finishAttempt(const std::string &taskId, const TaskResult &result);
    void reportFailure(const std::string &taskId, const std::string &reason);
};

void TaskScheduler::Impl::dispatchLoop()
{
    std::unique_lock<std::mutex> lock(queueMutex);
    while (!stopping) {
        if (queue.empty()) {
            queueCv.wait(lock);
            continue;
        }
        const Clock::time_point due = queue.begin()->first;
        if (due > Clock::now()) {
            queueCv.wait_until(lock, due);
            continue;
        }
        const auto entry = queue.begin()->second;
        queue.erase(queue.begin());

        lock.unlock();
        tryDispatch(entry.first, entry.second);
        lock.lock();
    }
}

void TaskScheduler::Impl::tryDispatch(const std::string &taskId, uint64_t generation)
{
    const auto slot = findSlot(taskId);
    if (!slot) {
        return;
    }

    TaskRequest request;
    CancellationToken token;
    {
        std::lock_guard<std::mutex> lock(slot->mutex);
        if (slot->state != TaskState::Queued || slot->generation != generation) {
            return;
        }

        if (slot->request.requiresNetwork && !networkAvailable.load()) {
            if (!slot->parked) {
                ELOG_INFO(QStringLiteral("TaskScheduler"),
                          QStringLiteral("tryDispatch"),
                          QStringLiteral("task_parked"),
                          QStringLiteral("network_unavailable"),
                          QStringLiteral("precondition_check"),
                          logging::defaultWho(),
                          QString(),
                          (nlohmann::json{{"taskId", taskId},
                                          {"recheckMs", toMillis(maxPollInterval)}}));
            }
            slot->parked = true;
            slot->generation = ++nextGeneration;
            schedule(taskId, slot->generation, Clock::now() + maxPollInterval);
            return;
        }

        slot->parked = false;
        slot->state = TaskState::Running;
        slot->rerun = false;
        slot->rerunRequest.reset();
        slot->replaced = false;
        slot->token = CancellationToken();
        token = slot->token;
        request = slot->request;
    }

    TaskLauncher launcher = launcherFor(taskId);
    pool.start([this, request, token, launcher]() {
        runAttempt(request, token, launcher);
    });
}

void TaskScheduler::Impl::runAttempt(const TaskRequest &request,
                                     const CancellationToken &token,
                                     const TaskLauncher &launcher)
{
    ELOG_DEBUG(QStringLiteral("TaskScheduler"),
               QStringLiteral("runAttempt"),
               QStringLiteral("task_started"),
               QStringLiteral("due"),
               QStringLiteral("worker_pool"),
               logging::defaultWho(),
               QString(),
               (nlohmann::json{{"taskId", request.taskId}}));

    TaskResult result;
    if (!launcher) {
        result = TaskResult::failure("no launcher registered for " + request.taskId);
    } else {
        try {
            result = launcher(request, token);
        } catch (const std::exception &ex) {
            ELOG_ERROR(QStringLiteral("TaskScheduler"),
                       QStringLiteral("runAttempt"),
                       QStringLiteral("task_threw"),
                       QString::fromUtf8(ex.what()),
                       QStringLiteral("treat_as_retry"),
                       logging::defaultWho(),
                       QString(),
                       (nlohmann::json{{"taskId", request.taskId}}));
            result = TaskResult::retry(std::nullopt, ex.what());
        }
    }

    finishAttempt(request.taskId, result);
}

void TaskScheduler::Impl::finishAttempt(const std::string &taskId, const TaskResult &result)
{
    auto slot = findSlot(taskId);
    if (!slot) {
        return;
    }

    std::optional<std::string> failureReason;
    std::optional<std::pair<int, std::chrono::milliseconds>> retryInfo;
    {
        std::lock_guard<std::mutex> lock(slot->mutex);
        const TaskRequest next = slot->rerunRequest.value_or(slot->request);

        if (slot->replaced && result.kind != TaskResult::Kind::Success) {
            // The attempt was cut short on purpose; start the replacement now.
            queueLocked(taskId, *slot, next, std::chrono::milliseconds(0));
        } else {
            switch (result.kind) {
            case TaskResult::Kind::Success:
                slot->failures = 0;
                if (slot->rerun) {
                    queueLocked(taskId, *slot, next, std::chrono::milliseconds(0));
                } else {
                    slot->state = TaskState::Idle;
                }
                break;
            case TaskResult::Kind::Retry: {
                ++slot->failures;
                if (maxAttempts > 0 && slot->failures >= maxAttempts) {
                    failureReason = "gave up after " + std::to_string(slot->failures)
                        + " attempts: " + result.reason;
                    break;
                }
                const auto delay = backoff.withHint(backoff.delayForAttempt(slot->failures),
                                                    result.retryAfter);
                queueLocked(taskId, *slot, next, delay);
                retryInfo = std::make_pair(slot->failures, delay);
                break;
            }
            case TaskResult::Kind::Failure:
                failureReason = result.reason;
                break;
            }
        }

        if (failureReason) {
            slot->failures = 0;
            slot->state = TaskState::Failed;
        }
    }

    if (!retryInfo && !failureReason) {
        slot.reset();
        releaseIfIdle(taskId);
        return;
    }

    if (retryInfo) {
        ELOG_INFO(QStringLiteral("TaskScheduler"),
                  QStringLiteral("finishAttempt"),
                  QStringLiteral("task_retry_scheduled"),
                  QString::fromStdString(result.reason),
                  QStringLiteral("exponential_backoff"),
                  logging::defaultWho(),
                  QString(),
                  (nlohmann::json{{"taskId", taskId},
                                  {"attempt", retryInfo->first},
                                  {"delayMs", toMillis(retryInfo->second)},
                                  {"hintMs", result.retryAfter
                                       ? nlohmann::json(toMillis(*result.retryAfter))
                                       : nlohmann::json()}}));
        TaskRetryListener listener;
        {
            std::lock_guard<std::mutex> lock(listenersMutex);
            listener = retryListener;
        }
        if (listener) {
            listener(taskId, retryInfo->first, retryInfo->second);
        }
        return;
    }

    if (failureReason) {
        reportFailure(taskId, *failureReason);

        {
            std::lock_guard<std::mutex> lock(slot->mutex);
            if (slot->state == TaskState::Failed) {
                if (slot->rerun) {
                    queueLocked(taskId, *slot,
                                slot->rerunRequest.value_or(slot->request),
                                std::chrono::milliseconds(0));
                } else {
                    slot->state = TaskState::Idle;
                }
            }
        }
        slot.reset();
        releaseIfIdle(taskId);
    }
}

void TaskScheduler::Impl::reportFailure(const std::string &taskId, const std::string &reason)
{
    ELOG_ERROR(QStringLiteral("TaskScheduler"),
               QStringLiteral("reportFailure"),
               QStringLiteral("task_failed"),
               QString::fromStdString(reason),
               QStringLiteral("failure_listener"),
               logging::defaultWho(),
               QString(),
               (nlohmann::json{{"taskId", taskId}}));

    TaskFailureListener listener;
    {
        std::lock_guard<std::mutex> lock(listenersMutex);
        listener = failureListener;
    }
    if (listener) {
        listener(taskId, reason);
    }
}

TaskScheduler::TaskScheduler(const EngageConfig &config)
    : impl(std::make_unique<Impl>(config))
{
    impl->dispatcher = std::thread([this]() {
        impl->dispatchLoop();
    });
}

TaskScheduler::~TaskScheduler()
{
    shutdown();
}

void TaskScheduler::registerLauncher(const std::string &prefix, TaskLauncher launcher)
{
    std::lock_guard<std::mutex> lock(impl->launchersMutex);
    for (auto &entry : impl->launchers) {
        if (entry.first == prefix) {
            entry.second = std::move(launcher);
            return;
        }
    }
    impl->launchers.emplace_back(prefix, std::move(launcher));
}

void TaskScheduler::enqueue(const TaskRequest &request)
{
    const auto slotPtr = impl->slotFor(request.taskId);
    TaskSlot &slot = *slotPtr;
    std::lock_guard<std::mutex> lock(slot.mutex);

    switch (slot.state) {
    case TaskState::Idle:
    case TaskState::Failed:
        slot.failures = 0;
        impl->queueLocked(request.taskId, slot, request, request.initialDelay);
        break;
    case TaskState::Queued:
        if (request.conflictPolicy == ConflictPolicy::Replace) {
            impl->queueLocked(request.taskId, slot, request, request.initialDelay);
        }
        break;
    case TaskState::Running:
        slot.rerun = true;
        if (request.conflictPolicy == ConflictPolicy::Replace) {
            slot.rerunRequest = request;
            slot.replaced = true;
            slot.token.cancel();
        }
        break;
    }

    ELOG_DEBUG(QStringLiteral("TaskScheduler"),
               QStringLiteral("enqueue"),
               QStringLiteral("task_enqueued"),
               QStringLiteral("client_request"),
               QStringLiteral("conflict_policy"),
               logging::defaultWho(),
               QString(),
               (nlohmann::json{{"taskId", request.taskId},
                               {"policy", request.conflictPolicy == ConflictPolicy::Replace
                                    ? "replace" : "keep"},
                               {"state", toTaskStateString(slot.state)},
                               {"rerun", slot.rerun}}));
}

TaskState TaskScheduler::state(const std::string &taskId) const
{
    const auto slot = impl->findSlot(taskId);
    if (!slot) {
        return TaskState::Idle;
    }
    std::lock_guard<std::mutex> lock(slot->mutex);
    return slot->state;
}

void TaskScheduler::setNetworkAvailable(bool available)
{
    const bool previous = impl->networkAvailable.exchange(available);
    if (previous == available) {
        return;
    }

    ELOG_INFO(QStringLiteral("TaskScheduler"),
              QStringLiteral("setNetworkAvailable"),
              QStringLiteral("network_state_changed"),
              QStringLiteral("reachability"),
              QStringLiteral("precondition_update"),
              logging::defaultWho(),
              QString(),
              (nlohmann::json{{"available", available}}));

    if (!available) {
        return;
    }

    std::vector<std::pair<std::string, std::shared_ptr<TaskSlot>>> slots;
    {
        std::shared_lock<std::shared_mutex> lock(impl->slotsMutex);
        for (const auto &entry : impl->slots) {
            slots.emplace_back(entry.first, entry.second);
        }
    }
    for (const auto &[taskId, slot] : slots) {
        std::lock_guard<std::mutex> lock(slot->mutex);
        if (slot->state == TaskState::Queued && slot->parked) {
            slot->parked = false;
            slot->generation = ++impl->nextGeneration;
            impl->schedule(taskId, slot->generation, Clock::now());
        }
    }
}

bool TaskScheduler::isNetworkAvailable() const
{
    return impl->networkAvailable.load();
}

size_t TaskScheduler::trackedTaskCount() const
{
    return impl->slotCount();
}

void TaskScheduler::setFailureListener(TaskFailureListener listener)
{
    std::lock_guard<std::mutex> lock(impl->listenersMutex);
    impl->failureListener = std::move(listener);
}

void TaskScheduler::setRetryListener(TaskRetryListener listener)
{
    std::lock_guard<std::mutex> lock(impl->listenersMutex);
    impl->retryListener = std::move(listener);
}

void TaskScheduler::shutdown()
{
    {
        std::lock_guard<std::mutex> lock(impl->queueMutex);
        if (impl->stopped) {
            return;
        }
        impl->stopping = true;
        impl->stopped = true;
        impl->queue.clear();
    }
    impl->queueCv.notify_all();
    if (impl->dispatcher.joinable()) {
        impl->dispatcher.join();
    }

    {
        std::shared_lock<std::shared_mutex> lock(impl->slotsMutex);
        for (const auto &entry : impl->slots) {
            std::lock_guard<std::mutex> slotLock(entry.second->mutex);
            if (entry.second->state == TaskState::Running) {
                entry.second->token.cancel();
            }
        }
    }
    impl->pool.waitForDone();

    ELOG_INFO(QStringLiteral("TaskScheduler"),
              QStringLiteral("shutdown"),
              QStringLiteral("scheduler_stopped"),
              QStringLiteral("shutdown_requested"),
              QStringLiteral("join_workers"),
              logging::defaultWho(),
              QString(),
              nlohmann::json::object());
}

} // namespace engage
