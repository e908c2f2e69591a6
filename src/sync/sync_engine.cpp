#include "sync/sync_engine.hpp"

#include <QUuid>

#include "common/json_utils.hpp"
#include "common/logging.hpp"
#include "predicate/json_predicate.hpp"

namespace engage {

namespace {

constexpr const char *kSyncTaskPrefix = "sync:";
constexpr const char *kLastResumedKey = "last_resumed_at";

std::string databasePathFor(const EngageConfig &config)
{
    return config.databasePath.empty() ? defaultDatabasePath() : config.databasePath;
}

std::string identifierFromTaskId(const std::string &taskId)
{
    const std::string prefix = kSyncTaskPrefix;
    if (taskId.compare(0, prefix.size(), prefix) == 0) {
        return taskId.substr(prefix.size());
    }
    return taskId;
}

} // namespace

SyncEngine::SyncEngine(const EngageConfig &config, HttpTransport &transport)
    : m_persistence(databasePathFor(config))
    , m_store(m_persistence)
    , m_client(transport, config)
    , m_scheduler(config)
{
    m_scheduler.registerLauncher(kSyncTaskPrefix,
                                 [this](const TaskRequest &request, const CancellationToken &token) {
                                     return runSync(request, token);
                                 });
    m_scheduler.setFailureListener([this](const std::string &taskId, const std::string &reason) {
        SyncErrorListener listener;
        {
            std::lock_guard<std::mutex> lock(m_listenerMutex);
            listener = m_errorListener;
        }
        if (listener) {
            listener(identifierFromTaskId(taskId), reason);
        }
    });
}

SyncEngine::~SyncEngine()
{
    shutdown();
}

std::string SyncEngine::taskIdFor(const std::string &identifier)
{
    return kSyncTaskPrefix + identifier;
}

void SyncEngine::start()
{
    const auto now = std::chrono::system_clock::now();
    nlohmann::json sinceLastResume;
    if (const auto previous = m_persistence.getMeta(kLastResumedKey)) {
        const auto resumedAt = fromIso8601Utc(*previous);
        if (resumedAt != std::chrono::system_clock::time_point{} && resumedAt <= now) {
            sinceLastResume = std::chrono::duration_cast<std::chrono::seconds>(now - resumedAt).count();
        }
    }
    m_persistence.setMeta(kLastResumedKey, toIso8601Utc(now));

    const auto pendingMutations = m_store.loadAllPending();
    ELOG_INFO(QStringLiteral("SyncEngine"),
              QStringLiteral("start"),
              QStringLiteral("pending_resumed"),
              QStringLiteral("startup"),
              QStringLiteral("load_all_pending"),
              logging::defaultWho(),
              QString(),
              (nlohmann::json{{"pending", pendingMutations.size()},
                              {"secondsSincePreviousResume", sinceLastResume},
                              {"database", m_persistence.databasePath()}}));
    for (const auto &mutation : pendingMutations) {
        requestSync(mutation.identifier);
    }
}

void SyncEngine::shutdown()
{
    m_scheduler.shutdown();
}

bool SyncEngine::evaluate(const nlohmann::json &predicate, const nlohmann::json &event) const
{
    return evaluatePredicateJson(predicate, event);
}

CollapsedMutation SyncEngine::recordMutation(const std::string &identifier,
                                             const Mutation &mutation)
{
    CollapsedMutation collapsed = m_store.append(identifier, mutation);
    if (!collapsed.empty()) {
        requestSync(identifier);
    }
    return collapsed;
}

std::optional<CollapsedMutation> SyncEngine::pending(const std::string &identifier) const
{
    return m_store.peek(identifier);
}

std::vector<CollapsedMutation> SyncEngine::listPending() const
{
    return m_store.loadAllPending();
}

TaskState SyncEngine::syncState(const std::string &identifier) const
{
    return m_scheduler.state(taskIdFor(identifier));
}

bool SyncEngine::integrityCheck(std::string *message) const
{
    return m_persistence.integrityCheck(message);
}

void SyncEngine::setNetworkAvailable(bool available)
{
    m_scheduler.setNetworkAvailable(available);
}

bool SyncEngine::isNetworkAvailable() const
{
    return m_scheduler.isNetworkAvailable();
}

void SyncEngine::setSyncErrorListener(SyncErrorListener listener)
{
    std::lock_guard<std::mutex> lock(m_listenerMutex);
    m_errorListener = std::move(listener);
}

void SyncEngine::requestSync(const std::string &identifier)
{
    TaskRequest request;
    request.taskId = taskIdFor(identifier);
    // Keep: a queued sync (possibly backing off) already picks up the newest
    // row; a running one is re-run once it completes.
    request.conflictPolicy = ConflictPolicy::Keep;
    request.requiresNetwork = true;
    request.extras = nlohmann::json{{"identifier", identifier}};
    m_scheduler.enqueue(request);
}

TaskResult SyncEngine::runSync(const TaskRequest &request, const CancellationToken &token)
{
    std::string identifier = identifierFromTaskId(request.taskId);
    if (request.extras.is_object()) {
        const auto it = request.extras.find("identifier");
        if (it != request.extras.end() && it->is_string()) {
            identifier = it->get<std::string>();
        }
    }
    const QString corrId = QUuid::createUuid().toString(QUuid::WithoutBraces);
    logging::CorrelationScope corrScope(corrId);

    std::optional<CollapsedMutation> sending;
    try {
        sending = m_store.beginSend(identifier);
    } catch (const CorruptRowError &ex) {
        return TaskResult::failure(ex.what());
    } catch (const StorageError &ex) {
        return TaskResult::retry(std::nullopt, ex.what());
    }

    if (!sending || sending->empty()) {
        ELOG_DEBUG(QStringLiteral("SyncEngine"),
                   QStringLiteral("runSync"),
                   QStringLiteral("nothing_pending"),
                   QStringLiteral("collapsed_or_confirmed"),
                   QStringLiteral("skip_network"),
                   logging::defaultWho(),
                   corrId,
                   (nlohmann::json{{"identifier", identifier}}));
        return TaskResult::success();
    }

    const SyncOutcome outcome = m_client.send(*sending, token);

    switch (outcome.kind) {
    case SyncOutcomeKind::Success: {
        ConfirmResult confirmed = ConfirmResult::Removed;
        try {
            confirmed = m_store.confirmSent(identifier, *sending);
        } catch (const StorageError &ex) {
            // The backend has it; resending carries the same idempotency token.
            return TaskResult::retry(std::nullopt, ex.what());
        }
        if (confirmed == ConfirmResult::Superseded) {
            requestSync(identifier);
        }
        return TaskResult::success();
    }
    case SyncOutcomeKind::RetryableFailure:
        return TaskResult::retry(outcome.retryAfter, outcome.reason);
    case SyncOutcomeKind::UnrecoverableFailure: {
        ConfirmResult discarded = ConfirmResult::Removed;
        try {
            discarded = m_store.discard(identifier, *sending);
        } catch (const StorageError &ex) {
            return TaskResult::retry(std::nullopt, ex.what());
        }
        ELOG_ERROR(QStringLiteral("SyncEngine"),
                   QStringLiteral("runSync"),
                   QStringLiteral("mutation_rejected"),
                   QString::fromStdString(outcome.reason),
                   QStringLiteral("discard_pending"),
                   logging::defaultWho(),
                   corrId,
                   (nlohmann::json{{"identifier", identifier},
                                   {"sequence", sending->sequence},
                                   {"status", outcome.statusCode},
                                   {"superseded", discarded == ConfirmResult::Superseded}}));
        if (discarded == ConfirmResult::Superseded) {
            requestSync(identifier);
        }
        return TaskResult::failure(outcome.reason);
    }
    }
    return TaskResult::retry();
}

} // namespace engage
