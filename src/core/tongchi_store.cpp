#include "core/tongchi_store.hpp"

#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <mutex>
#include <stdexcept>

#include <nlohmann/json.hpp>
#include <sqlite3.h>

#include "common/json_utils.hpp"

namespace tongchi {

namespace {

constexpr const char *kCreateAlertsTable =
    "CREATE TABLE IF NOT EXISTS alerts ("
    "    id TEXT PRIMARY KEY,"
    "    timestamp INTEGER NOT NULL,"
    "    resource_id TEXT NOT NULL,"
    "    kind TEXT NOT NULL,"
    "    severity TEXT NOT NULL,"
    "    previous_status TEXT,"
    "    current_status TEXT,"
    "    title TEXT NOT NULL,"
    "    message TEXT"
    ");";

constexpr const char *kCreateAlertsIndex =
    "CREATE INDEX IF NOT EXISTS alerts_timestamp ON alerts (timestamp);";

constexpr const char *kCreateProcessHistoryTable =
    "CREATE TABLE IF NOT EXISTS process_history ("
    "    id TEXT PRIMARY KEY,"
    "    name TEXT NOT NULL,"
    "    description TEXT,"
    "    status TEXT NOT NULL,"
    "    started_at INTEGER,"
    "    finished_at INTEGER,"
    "    cancellable INTEGER NOT NULL DEFAULT 1,"
    "    result TEXT,"
    "    error TEXT"
    ");";

constexpr const char *kCreateMetaTable =
    "CREATE TABLE IF NOT EXISTS meta ("
    "    key TEXT PRIMARY KEY,"
    "    value TEXT NOT NULL"
    ");";

class Statement {
public:
    Statement(sqlite3 *db, const char *sql)
    {
        if (sqlite3_prepare_v2(db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
            throw std::runtime_error(std::string("sqlite prepare failed: ") + sqlite3_errmsg(db));
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

int64_t toEpochSeconds(std::chrono::system_clock::time_point timestamp)
{
    return std::chrono::duration_cast<std::chrono::seconds>(
               timestamp.time_since_epoch())
        .count();
}

std::chrono::system_clock::time_point fromEpochSeconds(int64_t value)
{
    return std::chrono::system_clock::time_point{
        std::chrono::seconds{value}};
}

void execOrThrow(sqlite3 *db, const char *sql)
{
    char *error = nullptr;
    if (sqlite3_exec(db, sql, nullptr, nullptr, &error) != SQLITE_OK) {
        std::string message = error ? error : "sqlite exec failed";
        sqlite3_free(error);
        throw std::runtime_error(message);
    }
}

void bindText(sqlite3_stmt *stmt, int index, const std::string &value)
{
    sqlite3_bind_text(stmt, index, value.c_str(), -1, SQLITE_TRANSIENT);
}

void bindOptionalTime(sqlite3_stmt *stmt, int index,
                      const std::optional<std::chrono::system_clock::time_point> &value)
{
    if (value) {
        sqlite3_bind_int64(stmt, index, toEpochSeconds(*value));
    } else {
        sqlite3_bind_null(stmt, index);
    }
}

std::string columnText(sqlite3_stmt *stmt, int index)
{
    const unsigned char *text = sqlite3_column_text(stmt, index);
    if (!text) {
        return {};
    }
    return reinterpret_cast<const char *>(text);
}

std::optional<std::chrono::system_clock::time_point> columnOptionalTime(sqlite3_stmt *stmt, int index)
{
    if (sqlite3_column_type(stmt, index) == SQLITE_NULL) {
        return std::nullopt;
    }
    return fromEpochSeconds(sqlite3_column_int64(stmt, index));
}

} // namespace

struct TongchiStore::Impl {
    sqlite3 *db = nullptr;
    mutable std::mutex mutex;
};

std::string TongchiStore::defaultDatabasePath()
{
    const char *home = std::getenv("HOME");
    std::filesystem::path basePath = home ? home : ".";
    basePath /= ".local/share/tongchi";
    return (basePath / "tongchi.db").string();
}

TongchiStore::TongchiStore()
    : TongchiStore(defaultDatabasePath())
{
}

TongchiStore::TongchiStore(const std::string &dbPath)
    : impl(std::make_unique<Impl>())
{
    const std::filesystem::path path(dbPath);
    if (path.has_parent_path()) {
        std::filesystem::create_directories(path.parent_path());
    }

    if (sqlite3_open(dbPath.c_str(), &impl->db) != SQLITE_OK) {
        const std::string message = impl->db ? sqlite3_errmsg(impl->db) : "out of memory";
        sqlite3_close(impl->db);
        impl->db = nullptr;
        throw std::runtime_error("failed to open tongchi database: " + message);
    }

    try {
        execOrThrow(impl->db, kCreateAlertsTable);
        execOrThrow(impl->db, kCreateAlertsIndex);
        execOrThrow(impl->db, kCreateProcessHistoryTable);
        execOrThrow(impl->db, kCreateMetaTable);
    } catch (const std::exception &) {
        sqlite3_close(impl->db);
        impl->db = nullptr;
        throw;
    }
}

TongchiStore::~TongchiStore()
{
    if (impl && impl->db) {
        sqlite3_close(impl->db);
        impl->db = nullptr;
    }
}

void TongchiStore::addAlert(const Alert &alert)
{
    std::lock_guard<std::mutex> lock(impl->mutex);
    Statement stmt(impl->db,
                   "INSERT OR REPLACE INTO alerts "
                   "(id, timestamp, resource_id, kind, severity, previous_status, "
                   "current_status, title, message) "
                   "VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?);");
    bindText(stmt.get(), 1, alert.id);
    sqlite3_bind_int64(stmt.get(), 2, toEpochSeconds(alert.timestamp));
    bindText(stmt.get(), 3, alert.resourceId);
    bindText(stmt.get(), 4, toAlertKindString(alert.kind));
    bindText(stmt.get(), 5, toAlertSeverityString(alert.severity));
    bindText(stmt.get(), 6, alert.previousStatus);
    bindText(stmt.get(), 7, alert.currentStatus);
    bindText(stmt.get(), 8, alert.title);
    bindText(stmt.get(), 9, alert.message);

    if (sqlite3_step(stmt.get()) != SQLITE_DONE) {
        throw std::runtime_error("failed to insert alert");
    }
}

std::vector<Alert> TongchiStore::getAlertsSince(std::chrono::system_clock::time_point since) const
{
    std::lock_guard<std::mutex> lock(impl->mutex);
    Statement stmt(impl->db,
                   "SELECT id, timestamp, resource_id, kind, severity, previous_status, "
                   "current_status, title, message FROM alerts "
                   "WHERE timestamp >= ? ORDER BY timestamp ASC, id ASC;");
    sqlite3_bind_int64(stmt.get(), 1, toEpochSeconds(since));

    std::vector<Alert> alerts;
    int rc = SQLITE_ROW;
    while ((rc = sqlite3_step(stmt.get())) == SQLITE_ROW) {
        Alert alert;
        alert.id = columnText(stmt.get(), 0);
        alert.timestamp = fromEpochSeconds(sqlite3_column_int64(stmt.get(), 1));
        alert.resourceId = columnText(stmt.get(), 2);
        alert.kind = parseAlertKindString(columnText(stmt.get(), 3));
        alert.severity = parseAlertSeverityString(columnText(stmt.get(), 4));
        alert.previousStatus = columnText(stmt.get(), 5);
        alert.currentStatus = columnText(stmt.get(), 6);
        alert.title = columnText(stmt.get(), 7);
        alert.message = columnText(stmt.get(), 8);
        alerts.push_back(std::move(alert));
    }
    if (rc != SQLITE_DONE) {
        throw std::runtime_error("failed to read alerts");
    }
    return alerts;
}

void TongchiStore::recordProcess(const ProcessHandle &handle)
{
    std::lock_guard<std::mutex> lock(impl->mutex);
    Statement stmt(impl->db,
                   "INSERT OR REPLACE INTO process_history "
                   "(id, name, description, status, started_at, finished_at, "
                   "cancellable, result, error) "
                   "VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?);");
    bindText(stmt.get(), 1, handle.id);
    bindText(stmt.get(), 2, handle.name);
    bindText(stmt.get(), 3, handle.description);
    bindText(stmt.get(), 4, toProcessStatusString(handle.status));
    bindOptionalTime(stmt.get(), 5, handle.startedAt);
    bindOptionalTime(stmt.get(), 6, handle.finishedAt);
    sqlite3_bind_int(stmt.get(), 7, handle.cancellable ? 1 : 0);
    if (handle.result.is_null()) {
        sqlite3_bind_null(stmt.get(), 8);
    } else {
        // Captured tool output is not always valid UTF-8.
        bindText(stmt.get(), 8,
                 handle.result.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace));
    }
    bindText(stmt.get(), 9, handle.error);

    if (sqlite3_step(stmt.get()) != SQLITE_DONE) {
        throw std::runtime_error("failed to record process");
    }
}

std::vector<ProcessHandle> TongchiStore::listProcessHistory(std::size_t limit) const
{
    std::lock_guard<std::mutex> lock(impl->mutex);
    Statement stmt(impl->db,
                   "SELECT id, name, description, status, started_at, finished_at, "
                   "cancellable, result, error FROM process_history "
                   "ORDER BY finished_at DESC, id ASC LIMIT ?;");
    sqlite3_bind_int64(stmt.get(), 1, static_cast<sqlite3_int64>(limit));

    std::vector<ProcessHandle> out;
    int rc = SQLITE_ROW;
    while ((rc = sqlite3_step(stmt.get())) == SQLITE_ROW) {
        ProcessHandle handle;
        handle.id = columnText(stmt.get(), 0);
        handle.name = columnText(stmt.get(), 1);
        handle.description = columnText(stmt.get(), 2);
        handle.status = parseProcessStatusString(columnText(stmt.get(), 3));
        handle.startedAt = columnOptionalTime(stmt.get(), 4);
        handle.finishedAt = columnOptionalTime(stmt.get(), 5);
        handle.cancellable = sqlite3_column_int(stmt.get(), 6) != 0;
        const std::string result = columnText(stmt.get(), 7);
        if (!result.empty()) {
            handle.result = nlohmann::json::parse(result, nullptr, false);
            if (handle.result.is_discarded()) {
                handle.result = nlohmann::json();
            }
        }
        handle.error = columnText(stmt.get(), 8);
        out.push_back(std::move(handle));
    }
    if (rc != SQLITE_DONE) {
        throw std::runtime_error("failed to read process history");
    }
    return out;
}

std::optional<std::string> TongchiStore::getMeta(const std::string &key) const
{
    std::lock_guard<std::mutex> lock(impl->mutex);
    Statement stmt(impl->db,
                   "SELECT value FROM meta WHERE key = ? LIMIT 1;");
    bindText(stmt.get(), 1, key);

    if (sqlite3_step(stmt.get()) != SQLITE_ROW) {
        return std::nullopt;
    }

    return columnText(stmt.get(), 0);
}

void TongchiStore::setMeta(const std::string &key, const std::string &value)
{
    std::lock_guard<std::mutex> lock(impl->mutex);
    Statement stmt(impl->db,
                   "INSERT OR REPLACE INTO meta (key, value) VALUES (?, ?);");
    bindText(stmt.get(), 1, key);
    bindText(stmt.get(), 2, value);

    if (sqlite3_step(stmt.get()) != SQLITE_DONE) {
        throw std::runtime_error("failed to set meta value");
    }
}

bool TongchiStore::integrityCheck() const
{
    std::lock_guard<std::mutex> lock(impl->mutex);
    Statement stmt(impl->db, "PRAGMA integrity_check;");
    if (sqlite3_step(stmt.get()) != SQLITE_ROW) {
        return false;
    }
    return columnText(stmt.get(), 0) == "ok";
}

} // namespace tongchi
