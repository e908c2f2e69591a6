#pragma once

#include <chrono>
#include <cstddef>
#include <functional>
#include <memory>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

#include "common/cancellation.hpp"
#include "common/config.hpp"
#include "common/enums.hpp"

namespace engage {

struct TaskRequest {
    std::string taskId;
    ConflictPolicy conflictPolicy = ConflictPolicy::Replace;
    std::chrono::milliseconds initialDelay{0};
    bool requiresNetwork = true;
    nlohmann::json extras = nlohmann::json::object();
};

struct TaskResult {
    enum class Kind {
        Success,
        Retry,
        Failure
    };

    Kind kind = Kind::Success;
    std::optional<std::chrono::milliseconds> retryAfter;
    std::string reason;

    static TaskResult success()
    {
        return TaskResult{};
    }

    static TaskResult retry(std::optional<std::chrono::milliseconds> retryAfter = std::nullopt,
                            std::string reason = {})
    {
        return TaskResult{Kind::Retry, retryAfter, std::move(reason)};
    }

    static TaskResult failure(std::string reason)
    {
        return TaskResult{Kind::Failure, std::nullopt, std::move(reason)};
    }
};

using TaskLauncher = std::function<TaskResult(const TaskRequest &, const CancellationToken &)>;
using TaskFailureListener = std::function<void(const std::string &taskId, const std::string &reason)>;
using TaskRetryListener = std::function<void(const std::string &taskId,
                                             int attempt,
                                             std::chrono::milliseconds delay)>;

// TaskScheduler runs background work keyed by task id on a bounded worker pool.
// Each id moves through Idle -> Queued -> Running -> {Idle, Queued, Failed -> Idle}
// and never runs twice at the same time. Retries back off exponentially;
// tasks that need the network wait while it is unavailable.
class TaskScheduler {
public:
    explicit TaskScheduler(const EngageConfig &config);
    ~TaskScheduler();

    TaskScheduler(const TaskScheduler &) = delete;
    TaskScheduler &operator=(const TaskScheduler &) = delete;

    // Launchers are chosen by the longest prefix of the task id.
    void registerLauncher(const std::string &prefix, TaskLauncher launcher);

    void enqueue(const TaskRequest &request);

    // Ids without a slot are Idle.
    TaskState state(const std::string &taskId) const;

    // Number of ids currently holding a slot. Idle ids are released.
    size_t trackedTaskCount() const;

    void setNetworkAvailable(bool available);
    bool isNetworkAvailable() const;

    void setFailureListener(TaskFailureListener listener);
    void setRetryListener(TaskRetryListener listener);

    // Stops dispatching, cancels running attempts and waits for the workers.
    void shutdown();

private:
    struct Impl;
    std::unique_ptr<Impl> impl;
};

} // namespace engage
