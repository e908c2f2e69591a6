#pragma once

#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "common/models.hpp"
#include "storage/persistence_layer.hpp"

namespace engage {

// A pending row whose operations column cannot be decoded.
class CorruptRowError : public StorageError {
public:
    explicit CorruptRowError(const std::string &message)
        : StorageError(message)
    {
    }
};

// MutationStore owns the single pending (collapsed) mutation of every
// identifier. All writes go through PersistenceLayer transactions; work on one
// identifier is serialized by that identifier's own lock.
class MutationStore {
public:
    explicit MutationStore(PersistenceLayer &persistence);

    // Persists mutation and folds it with the pending one. An empty fold
    // deletes the row and returns an empty mutation with sequence 0. A corrupt
    // pending row is replaced rather than folded. Throws StorageError.
    CollapsedMutation append(const std::string &identifier, const Mutation &mutation);

    std::optional<CollapsedMutation> peek(const std::string &identifier) const;

    // peek() for a sync attempt. From here on the pending adds of this
    // identifier are considered delivered and never cancel out locally.
    // A corrupt row can never be sent: it is deleted and CorruptRowError
    // is thrown.
    std::optional<CollapsedMutation> beginSend(const std::string &identifier);

    // Deletes the pending row only if it is still the one that was sent.
    // Throws StorageError.
    ConfirmResult confirmSent(const std::string &identifier, const CollapsedMutation &sent);

    // Same compare-and-delete, used when the backend rejected the mutation.
    ConfirmResult discard(const std::string &identifier, const CollapsedMutation &sent);

    // All pending mutations in sequence order, for resuming after a restart.
    std::vector<CollapsedMutation> loadAllPending() const;

    // Identifiers currently holding a lock slot.
    size_t trackedIdentifierCount() const;

private:
    struct IdentifierState {
        std::mutex mutex;
        // True while the pending row was written in this process and never
        // handed to the network. Rows found at startup are treated as sent.
        bool unsent = false;
    };

    std::shared_ptr<IdentifierState> stateFor(const std::string &identifier) const;
    // Forgets the state of an identifier without a pending row once no
    // other call holds it.
    void releaseState(const std::string &identifier,
                      std::shared_ptr<IdentifierState> state) const;
    ConfirmResult removeIfCurrent(const std::string &identifier,
                                  const CollapsedMutation &sent,
                                  const char *reason);

    PersistenceLayer &m_persistence;

    mutable std::mutex m_statesMutex;
    mutable std::unordered_map<std::string, std::shared_ptr<IdentifierState>> m_states;
};

// Throws CorruptRowError when the stored operations do not decode.
CollapsedMutation collapsedFromRow(const PersistedRow &row);

} // namespace engage
