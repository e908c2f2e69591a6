#pragma once

#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "common/config.hpp"
#include "common/models.hpp"
#include "storage/persistence_layer.hpp"
#include "sync/http_transport.hpp"
#include "sync/mutation_store.hpp"
#include "sync/sync_api_client.hpp"
#include "sync/task_scheduler.hpp"

namespace engage {

using SyncErrorListener = std::function<void(const std::string &identifier,
                                             const std::string &reason)>;

// SyncEngine is the entry point for the rule layer: it evaluates trigger
// predicates, records mutations and keeps one background sync task per
// identifier until the backend has accepted (or rejected) the pending mutation.
class SyncEngine {
public:
    SyncEngine(const EngageConfig &config, HttpTransport &transport);
    ~SyncEngine();

    SyncEngine(const SyncEngine &) = delete;
    SyncEngine &operator=(const SyncEngine &) = delete;

    // Resumes every pending mutation found on disk and records the time of
    // the resume in the meta table.
    void start();
    void shutdown();

    bool evaluate(const nlohmann::json &predicate, const nlohmann::json &event) const;

    // Throws StorageError when the mutation could not be persisted.
    CollapsedMutation recordMutation(const std::string &identifier, const Mutation &mutation);

    std::optional<CollapsedMutation> pending(const std::string &identifier) const;
    std::vector<CollapsedMutation> listPending() const;
    TaskState syncState(const std::string &identifier) const;

    bool integrityCheck(std::string *message) const;

    void setNetworkAvailable(bool available);
    bool isNetworkAvailable() const;

    // Called once per mutation the backend refused.
    void setSyncErrorListener(SyncErrorListener listener);

    TaskScheduler &scheduler()
    {
        return m_scheduler;
    }

    static std::string taskIdFor(const std::string &identifier);

private:
    TaskResult runSync(const TaskRequest &request, const CancellationToken &token);
    void requestSync(const std::string &identifier);

    PersistenceLayer m_persistence;
    MutationStore m_store;
    SyncApiClient m_client;
    TaskScheduler m_scheduler;

    std::mutex m_listenerMutex;
    SyncErrorListener m_errorListener;
};

} // namespace engage
