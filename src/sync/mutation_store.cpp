#include "sync/mutation_store.hpp"

#include <chrono>

#include "common/json_utils.hpp"
#include "common/logging.hpp"
#include "sync/mutation_collapse.hpp"

namespace engage {

CollapsedMutation collapsedFromRow(const PersistedRow &row)
{
    CollapsedMutation mutation;
    mutation.identifier = row.identifier;
    mutation.sequence = row.sequence;
    mutation.createdAt = row.createdAt;

    auto operations = operationsFromJson(row.operations);
    if (!operations) {
        throw CorruptRowError("pending row for '" + row.identifier + "' has corrupt operations");
    }
    mutation.operations = std::move(*operations);
    return mutation;
}

MutationStore::MutationStore(PersistenceLayer &persistence)
    : m_persistence(persistence)
{
}

std::shared_ptr<MutationStore::IdentifierState>
MutationStore::stateFor(const std::string &identifier) const
{
    std::lock_guard<std::mutex> lock(m_statesMutex);
    auto &slot = m_states[identifier];
    if (!slot) {
        slot = std::make_shared<IdentifierState>();
    }
    return slot;
}

void MutationStore::releaseState(const std::string &identifier,
                                 std::shared_ptr<IdentifierState> state) const
{
    std::lock_guard<std::mutex> lock(m_statesMutex);
    const auto it = m_states.find(identifier);
    // New references are only handed out under m_statesMutex, so two owners
    // (the map and this call) means no other call is using the state.
    if (it != m_states.end() && it->second == state && state.use_count() == 2) {
        m_states.erase(it);
    }
}

size_t MutationStore::trackedIdentifierCount() const
{
    std::lock_guard<std::mutex> lock(m_statesMutex);
    return m_states.size();
}

CollapsedMutation MutationStore::append(const std::string &identifier,
                                        const Mutation &mutation)
{
    auto statePtr = stateFor(identifier);
    IdentifierState &state = *statePtr;
    std::unique_lock<std::mutex> lock(state.mutex);

    Transaction transaction = m_persistence.beginTransaction();
    const auto existing = transaction.readRow(identifier);

    std::optional<CollapsedMutation> base;
    if (existing) {
        try {
            base = collapsedFromRow(*existing);
        } catch (const CorruptRowError &ex) {
            ELOG_ERROR(QStringLiteral("MutationStore"),
                       QStringLiteral("append"),
                       QStringLiteral("pending_row_replaced"),
                       QStringLiteral("corrupt_row"),
                       QStringLiteral("overwrite_row"),
                       logging::defaultWho(),
                       QString(),
                       (nlohmann::json{{"identifier", identifier},
                                       {"sequence", existing->sequence},
                                       {"error", ex.what()}}));
        }
    }

    std::vector<MutationOperation> baseOperations;
    std::chrono::system_clock::time_point createdAt = mutation.createdAt;
    if (base) {
        baseOperations = base->operations;
        createdAt = base->createdAt;
    }
    const bool baseSent = base.has_value() && !state.unsent;

    CollapsedMutation collapsed;
    collapsed.identifier = identifier;
    collapsed.operations =
        collapseOperations(baseOperations, mutation.operations, baseSent);

    if (collapsed.empty()) {
        if (existing) {
            transaction.deleteRow(identifier);
        }
        transaction.commit();
        state.unsent = false;

        ELOG_DEBUG(QStringLiteral("MutationStore"),
                   QStringLiteral("append"),
                   QStringLiteral("mutation_cancelled_out"),
                   QStringLiteral("collapse_empty"),
                   QStringLiteral("sqlite_delete"),
                   logging::defaultWho(),
                   QString(),
                   (nlohmann::json{{"identifier", identifier},
                                   {"hadPending", existing.has_value()}}));
        lock.unlock();
        releaseState(identifier, std::move(statePtr));
        return collapsed;
    }

    collapsed.sequence = transaction.nextSequence();
    collapsed.createdAt = createdAt;

    PersistedRow row;
    row.identifier = identifier;
    row.sequence = collapsed.sequence;
    row.createdAt = collapsed.createdAt;
    row.operations = operationsToJson(collapsed.operations);
    transaction.writeRow(row);
    transaction.commit();

    if (!base) {
        state.unsent = true;
    }

    ELOG_DEBUG(QStringLiteral("MutationStore"),
               QStringLiteral("append"),
               QStringLiteral("mutation_appended"),
               QStringLiteral("record_mutation"),
               QStringLiteral("collapse_and_persist"),
               logging::defaultWho(),
               QString(),
               (nlohmann::json{{"identifier", identifier},
                               {"sequence", collapsed.sequence},
                               {"incomingOperations", mutation.operations.size()},
                               {"collapsedOperations", collapsed.operations.size()}}));
    return collapsed;
}

std::optional<CollapsedMutation> MutationStore::peek(const std::string &identifier) const
{
    auto statePtr = stateFor(identifier);
    std::unique_lock<std::mutex> lock(statePtr->mutex);

    const auto row = m_persistence.getRow(identifier);
    if (!row) {
        lock.unlock();
        releaseState(identifier, std::move(statePtr));
        return std::nullopt;
    }
    return collapsedFromRow(*row);
}

std::optional<CollapsedMutation> MutationStore::beginSend(const std::string &identifier)
{
    auto statePtr = stateFor(identifier);
    std::unique_lock<std::mutex> lock(statePtr->mutex);

    const auto row = m_persistence.getRow(identifier);
    statePtr->unsent = false;
    if (!row) {
        lock.unlock();
        releaseState(identifier, std::move(statePtr));
        return std::nullopt;
    }

    try {
        return collapsedFromRow(*row);
    } catch (const CorruptRowError &ex) {
        // The row is only touched under this identifier's lock, so it is
        // still the one just read.
        Transaction transaction = m_persistence.beginTransaction();
        transaction.deleteRow(identifier);
        transaction.commit();

        ELOG_ERROR(QStringLiteral("MutationStore"),
                   QStringLiteral("beginSend"),
                   QStringLiteral("pending_row_dropped"),
                   QStringLiteral("corrupt_row"),
                   QStringLiteral("sqlite_delete"),
                   logging::defaultWho(),
                   QString(),
                   (nlohmann::json{{"identifier", identifier},
                                   {"sequence", row->sequence},
                                   {"error", ex.what()}}));
        lock.unlock();
        releaseState(identifier, std::move(statePtr));
        throw;
    }
}

ConfirmResult MutationStore::confirmSent(const std::string &identifier,
                                         const CollapsedMutation &sent)
{
    return removeIfCurrent(identifier, sent, "confirm_sent");
}

ConfirmResult MutationStore::discard(const std::string &identifier,
                                     const CollapsedMutation &sent)
{
    return removeIfCurrent(identifier, sent, "discard_rejected");
}

ConfirmResult MutationStore::removeIfCurrent(const std::string &identifier,
                                             const CollapsedMutation &sent,
                                             const char *reason)
{
    auto statePtr = stateFor(identifier);
    std::unique_lock<std::mutex> lock(statePtr->mutex);

    Transaction transaction = m_persistence.beginTransaction();
    const auto current = transaction.readRow(identifier);
    if (!current || current->sequence != sent.sequence) {
        ELOG_INFO(QStringLiteral("MutationStore"),
                  QStringLiteral("removeIfCurrent"),
                  QStringLiteral("mutation_superseded"),
                  QString::fromLatin1(reason),
                  QStringLiteral("sequence_compare"),
                  logging::defaultWho(),
                  QString(),
                  (nlohmann::json{{"identifier", identifier},
                                  {"sentSequence", sent.sequence},
                                  {"currentSequence",
                                   current ? current->sequence : int64_t{0}}}));
        return ConfirmResult::Superseded;
    }

    transaction.deleteRow(identifier);
    transaction.commit();
    statePtr->unsent = false;

    ELOG_DEBUG(QStringLiteral("MutationStore"),
               QStringLiteral("removeIfCurrent"),
               QStringLiteral("mutation_removed"),
               QString::fromLatin1(reason),
               QStringLiteral("sqlite_delete"),
               logging::defaultWho(),
               QString(),
               (nlohmann::json{{"identifier", identifier},
                               {"sequence", sent.sequence}}));
    lock.unlock();
    releaseState(identifier, std::move(statePtr));
    return ConfirmResult::Removed;
}

std::vector<CollapsedMutation> MutationStore::loadAllPending() const
{
    std::vector<CollapsedMutation> pending;
    for (const auto &row : m_persistence.listRows()) {
        try {
            pending.push_back(collapsedFromRow(row));
        } catch (const CorruptRowError &ex) {
            ELOG_ERROR(QStringLiteral("MutationStore"),
                       QStringLiteral("loadAllPending"),
                       QStringLiteral("pending_row_unreadable"),
                       QStringLiteral("corrupt_row"),
                       QStringLiteral("skip_row"),
                       logging::defaultWho(),
                       QString(),
                       (nlohmann::json{{"identifier", row.identifier},
                                       {"error", ex.what()}}));
        }
    }
    return pending;
}

} // namespace engage
