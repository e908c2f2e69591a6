#pragma once

#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "common/models.hpp"

struct sqlite3;

namespace engage {

class StorageError : public std::runtime_error {
public:
    explicit StorageError(const std::string &message)
        : std::runtime_error(message)
    {
    }
};

class PersistenceLayer;

// Scoped write transaction (BEGIN IMMEDIATE). Holds the connection lock for
// its whole lifetime; rolls back on destruction unless commit() succeeded.
class Transaction {
public:
    Transaction(Transaction &&other) noexcept;
    Transaction(const Transaction &) = delete;
    Transaction &operator=(const Transaction &) = delete;
    Transaction &operator=(Transaction &&) = delete;
    ~Transaction();

    std::optional<PersistedRow> readRow(const std::string &identifier) const;
    void writeRow(const PersistedRow &row);
    void deleteRow(const std::string &identifier);

    // Returns the next value of the durable monotonic counter.
    int64_t nextSequence();

    void commit();

private:
    friend class PersistenceLayer;
    explicit Transaction(PersistenceLayer &layer);

    PersistenceLayer *m_layer;
    std::unique_lock<std::recursive_mutex> m_lock;
    bool m_active = false;
};

// PersistenceLayer is the SQLite access layer for the pending mutation rows
// (one per identifier) and the sequence counter.
class PersistenceLayer {
public:
    explicit PersistenceLayer(const std::string &databasePath);
    ~PersistenceLayer();

    PersistenceLayer(const PersistenceLayer &) = delete;
    PersistenceLayer &operator=(const PersistenceLayer &) = delete;

    Transaction beginTransaction();

    // Reads outside a transaction observe the last committed state.
    std::optional<PersistedRow> getRow(const std::string &identifier) const;
    std::vector<PersistedRow> listRows() const;

    std::optional<std::string> getMeta(const std::string &key) const;
    void setMeta(const std::string &key, const std::string &value);

    bool integrityCheck(std::string *message) const;

    const std::string &databasePath() const;

private:
    friend class Transaction;

    struct Impl;
    std::unique_ptr<Impl> impl;
};

} // namespace engage
