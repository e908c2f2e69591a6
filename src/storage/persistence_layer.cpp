#include "storage/persistence_layer.hpp"

#include <filesystem>
#include <utility>

#include <sqlite3.h>

#include "common/json_utils.hpp"
#include "common/logging.hpp"

namespace engage {

namespace {

constexpr const char *kCreatePendingTable =
    "CREATE TABLE IF NOT EXISTS pending_mutations ("
    "    identifier TEXT PRIMARY KEY,"
    "    sequence INTEGER NOT NULL,"
    "    created_at INTEGER NOT NULL,"
    "    operations TEXT NOT NULL"
    ");";

constexpr const char *kCreateMetaTable =
    "CREATE TABLE IF NOT EXISTS meta ("
    "    key TEXT PRIMARY KEY,"
    "    value TEXT NOT NULL"
    ");";

constexpr const char *kSequenceKey = "next_sequence";
constexpr int kBusyTimeoutMs = 5000;

class Statement {
public:
    Statement(sqlite3 *db, const char *sql)
    {
        if (sqlite3_prepare_v2(db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
            throw StorageError(std::string("sqlite prepare failed: ") + sqlite3_errmsg(db));
        }
    }

    ~Statement()
    {
        if (stmt) {
            sqlite3_finalize(stmt);
        }
    }

    Statement(const Statement &) = delete;
    Statement &operator=(const Statement &) = delete;

    sqlite3_stmt *get() const
    {
        return stmt;
    }

private:
    sqlite3_stmt *stmt = nullptr;
};

void execOrThrow(sqlite3 *db, const char *sql)
{
    char *error = nullptr;
    if (sqlite3_exec(db, sql, nullptr, nullptr, &error) != SQLITE_OK) {
        std::string message = error ? error : "sqlite exec failed";
        sqlite3_free(error);
        throw StorageError(message);
    }
}

void bindText(sqlite3_stmt *stmt, int index, const std::string &value)
{
    sqlite3_bind_text(stmt, index, value.c_str(), -1, SQLITE_TRANSIENT);
}

std::string columnText(sqlite3_stmt *stmt, int index)
{
    const unsigned char *text = sqlite3_column_text(stmt, index);
    if (!text) {
        return {};
    }
    return reinterpret_cast<const char *>(text);
}

// Unparsable text comes back as a discarded value so callers can tell a
// corrupt row from an empty one.
nlohmann::json columnJson(sqlite3_stmt *stmt, int index)
{
    const unsigned char *text = sqlite3_column_text(stmt, index);
    if (!text) {
        return nlohmann::json(nlohmann::json::value_t::discarded);
    }
    return nlohmann::json::parse(reinterpret_cast<const char *>(text), nullptr, false);
}

PersistedRow rowFromStatement(sqlite3_stmt *stmt)
{
    PersistedRow row;
    row.identifier = columnText(stmt, 0);
    row.sequence = sqlite3_column_int64(stmt, 1);
    row.createdAt = fromEpochMillis(sqlite3_column_int64(stmt, 2));
    row.operations = columnJson(stmt, 3);
    return row;
}

std::optional<PersistedRow> selectRow(sqlite3 *db, const std::string &identifier)
{
    Statement stmt(db,
                   "SELECT identifier, sequence, created_at, operations "
                   "FROM pending_mutations WHERE identifier = ? LIMIT 1;");
    bindText(stmt.get(), 1, identifier);

    const int rc = sqlite3_step(stmt.get());
    if (rc == SQLITE_DONE) {
        return std::nullopt;
    }
    if (rc != SQLITE_ROW) {
        throw StorageError(std::string("failed to read pending row: ") + sqlite3_errmsg(db));
    }
    return rowFromStatement(stmt.get());
}

std::optional<std::string> selectMeta(sqlite3 *db, const std::string &key)
{
    Statement stmt(db, "SELECT value FROM meta WHERE key = ? LIMIT 1;");
    bindText(stmt.get(), 1, key);

    if (sqlite3_step(stmt.get()) != SQLITE_ROW) {
        return std::nullopt;
    }
    return columnText(stmt.get(), 0);
}

void upsertMeta(sqlite3 *db, const std::string &key, const std::string &value)
{
    Statement stmt(db, "INSERT OR REPLACE INTO meta (key, value) VALUES (?, ?);");
    bindText(stmt.get(), 1, key);
    bindText(stmt.get(), 2, value);

    if (sqlite3_step(stmt.get()) != SQLITE_DONE) {
        throw StorageError(std::string("failed to set meta value: ") + sqlite3_errmsg(db));
    }
}

} // namespace

struct PersistenceLayer::Impl {
    sqlite3 *db = nullptr;
    std::string path;
    mutable std::recursive_mutex mutex;
};

Transaction::Transaction(PersistenceLayer &layer)
    : m_layer(&layer)
    , m_lock(layer.impl->mutex)
{
    execOrThrow(m_layer->impl->db, "BEGIN IMMEDIATE;");
    m_active = true;
}

Transaction::Transaction(Transaction &&other) noexcept
    : m_layer(other.m_layer)
    , m_lock(std::move(other.m_lock))
    , m_active(other.m_active)
{
    other.m_active = false;
}

Transaction::~Transaction()
{
    if (!m_active) {
        return;
    }
    char *error = nullptr;
    if (sqlite3_exec(m_layer->impl->db, "ROLLBACK;", nullptr, nullptr, &error) != SQLITE_OK) {
        ELOG_ERROR(QStringLiteral("PersistenceLayer"),
                   QStringLiteral("~Transaction"),
                   QStringLiteral("rollback_failed"),
                   QStringLiteral("transaction_abandoned"),
                   QStringLiteral("sqlite_exec"),
                   logging::defaultWho(),
                   QString(),
                   (nlohmann::json{{"error", error ? error : "unknown"}}));
        sqlite3_free(error);
    }
}

std::optional<PersistedRow> Transaction::readRow(const std::string &identifier) const
{
    return selectRow(m_layer->impl->db, identifier);
}

void Transaction::writeRow(const PersistedRow &row)
{
    Statement stmt(m_layer->impl->db,
                   "INSERT OR REPLACE INTO pending_mutations "
                   "(identifier, sequence, created_at, operations) VALUES (?, ?, ?, ?);");
    bindText(stmt.get(), 1, row.identifier);
    sqlite3_bind_int64(stmt.get(), 2, row.sequence);
    sqlite3_bind_int64(stmt.get(), 3, toEpochMillis(row.createdAt));
    bindText(stmt.get(), 4, row.operations.dump());

    if (sqlite3_step(stmt.get()) != SQLITE_DONE) {
        throw StorageError(std::string("failed to write pending row: ")
                           + sqlite3_errmsg(m_layer->impl->db));
    }
}

void Transaction::deleteRow(const std::string &identifier)
{
    Statement stmt(m_layer->impl->db,
                   "DELETE FROM pending_mutations WHERE identifier = ?;");
    bindText(stmt.get(), 1, identifier);

    if (sqlite3_step(stmt.get()) != SQLITE_DONE) {
        throw StorageError(std::string("failed to delete pending row: ")
                           + sqlite3_errmsg(m_layer->impl->db));
    }
}

int64_t Transaction::nextSequence()
{
    int64_t next = 1;
    if (const auto stored = selectMeta(m_layer->impl->db, kSequenceKey)) {
        try {
            next = std::stoll(*stored);
        } catch (const std::exception &) {
            throw StorageError("sequence counter is corrupt");
        }
    }
    upsertMeta(m_layer->impl->db, kSequenceKey, std::to_string(next + 1));
    return next;
}

void Transaction::commit()
{
    if (!m_active) {
        throw StorageError("transaction is not active");
    }
    execOrThrow(m_layer->impl->db, "COMMIT;");
    m_active = false;
    m_lock.unlock();
}

PersistenceLayer::PersistenceLayer(const std::string &databasePath)
    : impl(std::make_unique<Impl>())
{
    impl->path = databasePath;
    const std::filesystem::path dbPath(databasePath);
    if (dbPath.has_parent_path()) {
        std::error_code error;
        std::filesystem::create_directories(dbPath.parent_path(), error);
    }

    const int flags = SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX;
    if (sqlite3_open_v2(databasePath.c_str(), &impl->db, flags, nullptr) != SQLITE_OK) {
        const std::string message = impl->db ? sqlite3_errmsg(impl->db) : "out of memory";
        sqlite3_close(impl->db);
        impl->db = nullptr;
        throw StorageError("failed to open engage database: " + message);
    }

    sqlite3_busy_timeout(impl->db, kBusyTimeoutMs);
    execOrThrow(impl->db, "PRAGMA journal_mode=WAL;");
    execOrThrow(impl->db, "PRAGMA synchronous=FULL;");
    execOrThrow(impl->db, kCreatePendingTable);
    execOrThrow(impl->db, kCreateMetaTable);
}

PersistenceLayer::~PersistenceLayer()
{
    if (impl && impl->db) {
        sqlite3_close(impl->db);
        impl->db = nullptr;
    }
}

Transaction PersistenceLayer::beginTransaction()
{
    return Transaction(*this);
}

std::optional<PersistedRow> PersistenceLayer::getRow(const std::string &identifier) const
{
    std::lock_guard<std::recursive_mutex> lock(impl->mutex);
    return selectRow(impl->db, identifier);
}

std::vector<PersistedRow> PersistenceLayer::listRows() const
{
    std::lock_guard<std::recursive_mutex> lock(impl->mutex);
    Statement stmt(impl->db,
                   "SELECT identifier, sequence, created_at, operations "
                   "FROM pending_mutations ORDER BY sequence ASC;");

    std::vector<PersistedRow> rows;
    int rc = SQLITE_ROW;
    while ((rc = sqlite3_step(stmt.get())) == SQLITE_ROW) {
        rows.push_back(rowFromStatement(stmt.get()));
    }
    if (rc != SQLITE_DONE) {
        throw StorageError(std::string("failed to list pending rows: ")
                           + sqlite3_errmsg(impl->db));
    }
    return rows;
}

std::optional<std::string> PersistenceLayer::getMeta(const std::string &key) const
{
    std::lock_guard<std::recursive_mutex> lock(impl->mutex);
    return selectMeta(impl->db, key);
}

void PersistenceLayer::setMeta(const std::string &key, const std::string &value)
{
    std::lock_guard<std::recursive_mutex> lock(impl->mutex);
    upsertMeta(impl->db, key, value);
}

bool PersistenceLayer::integrityCheck(std::string *message) const
{
    std::lock_guard<std::recursive_mutex> lock(impl->mutex);
    Statement stmt(impl->db, "PRAGMA integrity_check;");

    if (sqlite3_step(stmt.get()) != SQLITE_ROW) {
        if (message) {
            *message = "integrity_check failed to return a result";
        }
        return false;
    }

    const std::string result = columnText(stmt.get(), 0);
    if (message) {
        *message = result;
    }
    return result == "ok";
}

const std::string &PersistenceLayer::databasePath() const
{
    return impl->path;
}

} // namespace engage
