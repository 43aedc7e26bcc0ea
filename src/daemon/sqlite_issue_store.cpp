#include "daemon/sqlite_issue_store.hpp"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <mutex>
#include <stdexcept>

#include <sqlite3.h>

#include <nlohmann/json.hpp>

#include "common/json_utils.hpp"
#include "common/logging.hpp"

namespace triage {

namespace {

constexpr int kBusyTimeoutMs = 5000;
constexpr int kProgressOpsInterval = 1000;
constexpr const char *kSchemaVersion = "1";

constexpr const char *kCreateCustomersTable =
    "CREATE TABLE IF NOT EXISTS customers ("
    "    id INTEGER PRIMARY KEY AUTOINCREMENT,"
    "    name TEXT NOT NULL,"
    "    email TEXT NOT NULL UNIQUE,"
    "    company TEXT,"
    "    tier TEXT NOT NULL DEFAULT 'Basic',"
    "    created_at INTEGER NOT NULL"
    ");";

constexpr const char *kCreateIssuesTable =
    "CREATE TABLE IF NOT EXISTS issues ("
    "    id INTEGER PRIMARY KEY AUTOINCREMENT,"
    "    customer_id INTEGER NOT NULL REFERENCES customers(id),"
    "    title TEXT NOT NULL,"
    "    description TEXT NOT NULL,"
    "    category TEXT NOT NULL DEFAULT 'General',"
    "    product_area TEXT,"
    "    severity TEXT NOT NULL DEFAULT 'Normal',"
    "    status TEXT NOT NULL DEFAULT 'Open',"
    "    priority INTEGER NOT NULL DEFAULT 5,"
    "    created_at INTEGER NOT NULL,"
    "    updated_at INTEGER NOT NULL,"
    "    resolved_at INTEGER,"
    "    resolution_hours REAL,"
    "    tags TEXT"
    ");";

constexpr const char *kCreateIssueIndexes =
    "CREATE INDEX IF NOT EXISTS idx_issues_customer ON issues(customer_id);"
    "CREATE INDEX IF NOT EXISTS idx_issues_status ON issues(status);"
    "CREATE INDEX IF NOT EXISTS idx_issues_created ON issues(created_at);";

constexpr const char *kCreateResolutionsTable =
    "CREATE TABLE IF NOT EXISTS issue_resolutions ("
    "    id INTEGER PRIMARY KEY AUTOINCREMENT,"
    "    issue_id INTEGER NOT NULL REFERENCES issues(id),"
    "    summary TEXT NOT NULL,"
    "    customer_satisfaction INTEGER,"
    "    created_at INTEGER NOT NULL"
    ");";

constexpr const char *kCreateSimilarIssuesTable =
    "CREATE TABLE IF NOT EXISTS similar_issues ("
    "    id INTEGER PRIMARY KEY AUTOINCREMENT,"
    "    source_issue_id INTEGER NOT NULL REFERENCES issues(id),"
    "    similar_issue_id INTEGER NOT NULL REFERENCES issues(id),"
    "    similarity_score REAL NOT NULL,"
    "    created_at INTEGER NOT NULL"
    ");";

constexpr const char *kCreateAlertsTable =
    "CREATE TABLE IF NOT EXISTS critical_alerts ("
    "    id INTEGER PRIMARY KEY AUTOINCREMENT,"
    "    issue_id INTEGER REFERENCES issues(id),"
    "    customer_id INTEGER NOT NULL,"
    "    alert_type TEXT NOT NULL,"
    "    severity TEXT NOT NULL DEFAULT 'High',"
    "    message TEXT NOT NULL,"
    "    status TEXT NOT NULL DEFAULT 'Active',"
    "    created_at INTEGER NOT NULL,"
    "    acknowledged_at INTEGER,"
    "    acknowledged_by TEXT,"
    "    resolved_at INTEGER"
    ");";

// At most one Active alert per (issue, type).
constexpr const char *kCreateAlertIndexes =
    "CREATE UNIQUE INDEX IF NOT EXISTS idx_alerts_active_issue_type "
    "    ON critical_alerts(issue_id, alert_type) WHERE status = 'Active';"
    "CREATE INDEX IF NOT EXISTS idx_alerts_status ON critical_alerts(status);";

constexpr const char *kCreateMetaTable =
    "CREATE TABLE IF NOT EXISTS meta ("
    "    key TEXT PRIMARY KEY,"
    "    value TEXT NOT NULL"
    ");";

constexpr const char *kCustomerColumns =
    "id, name, email, company, tier, created_at";

constexpr const char *kIssueColumns =
    "id, customer_id, title, description, category, product_area, severity, "
    "status, priority, created_at, updated_at, resolved_at, resolution_hours, tags";

constexpr const char *kAlertColumns =
    "id, issue_id, customer_id, alert_type, severity, message, status, "
    "created_at, acknowledged_at, acknowledged_by, resolved_at";

// Raised inside the store and mapped to an Outcome at the public boundary.
class StoreError : public std::runtime_error {
public:
    StoreError(ErrorKind kind, const std::string &message)
        : std::runtime_error(message)
        , m_kind(kind)
    {
    }

    ErrorKind kind() const
    {
        return m_kind;
    }

private:
    ErrorKind m_kind;
};

class Statement {
public:
    Statement(sqlite3 *db, const std::string &sql)
        : m_db(db)
    {
        if (sqlite3_prepare_v2(db, sql.c_str(), -1, &stmt, nullptr) != SQLITE_OK) {
            throw StoreError(ErrorKind::Internal,
                             std::string("sqlite prepare failed: ") + sqlite3_errmsg(db));
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

    // Returns SQLITE_ROW or SQLITE_DONE; anything else throws.
    int step()
    {
        const int rc = sqlite3_step(stmt);
        if (rc == SQLITE_ROW || rc == SQLITE_DONE) {
            return rc;
        }
        const std::string message = sqlite3_errmsg(m_db);
        const int extended = sqlite3_extended_errcode(m_db);
        if (rc == SQLITE_BUSY || rc == SQLITE_LOCKED) {
            throw StoreError(ErrorKind::CollaboratorUnavailable, "database busy: " + message);
        }
        if (extended == SQLITE_CONSTRAINT_FOREIGNKEY) {
            throw StoreError(ErrorKind::NotFound, "referenced record does not exist");
        }
        if (extended == SQLITE_CONSTRAINT_UNIQUE) {
            throw StoreError(ErrorKind::InvalidInput, "duplicate record: " + message);
        }
        throw StoreError(ErrorKind::Internal, "sqlite step failed: " + message);
    }

private:
    sqlite3 *m_db = nullptr;
    sqlite3_stmt *stmt = nullptr;
};

void execOrThrow(sqlite3 *db, const char *sql)
{
    char *error = nullptr;
    if (sqlite3_exec(db, sql, nullptr, nullptr, &error) != SQLITE_OK) {
        std::string message = error ? error : "sqlite exec failed";
        sqlite3_free(error);
        throw StoreError(ErrorKind::Internal, message);
    }
}

// Rolls back unless commit() ran.
class Transaction {
public:
    explicit Transaction(sqlite3 *db)
        : m_db(db)
    {
        execOrThrow(m_db, "BEGIN IMMEDIATE;");
    }

    ~Transaction()
    {
        if (!m_committed) {
            sqlite3_exec(m_db, "ROLLBACK;", nullptr, nullptr, nullptr);
        }
    }

    void commit()
    {
        execOrThrow(m_db, "COMMIT;");
        m_committed = true;
    }

private:
    sqlite3 *m_db;
    bool m_committed = false;
};

struct QueryBudget {
    const CancellationToken *cancel = nullptr;
    std::chrono::steady_clock::time_point deadline;
    bool cancelled = false;
    bool timedOut = false;
};

int progressCallback(void *data)
{
    auto *budget = static_cast<QueryBudget *>(data);
    if (budget->cancel && budget->cancel->isCancelled()) {
        budget->cancelled = true;
        return 1;
    }
    if (std::chrono::steady_clock::now() >= budget->deadline) {
        budget->timedOut = true;
        return 1;
    }
    return 0;
}

class ProgressGuard {
public:
    ProgressGuard(sqlite3 *db, QueryBudget *budget)
        : m_db(db)
    {
        sqlite3_progress_handler(m_db, kProgressOpsInterval, progressCallback, budget);
    }

    ~ProgressGuard()
    {
        sqlite3_progress_handler(m_db, 0, nullptr, nullptr);
    }

private:
    sqlite3 *m_db;
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

TimePoint nowOr(TimePoint value)
{
    return value == TimePoint{} ? std::chrono::system_clock::now() : value;
}

void bindText(sqlite3_stmt *stmt, int index, const std::string &value)
{
    sqlite3_bind_text(stmt, index, value.c_str(), -1, SQLITE_TRANSIENT);
}

void bindOptionalText(sqlite3_stmt *stmt, int index, const std::string &value)
{
    if (value.empty()) {
        sqlite3_bind_null(stmt, index);
        return;
    }
    bindText(stmt, index, value);
}

void bindOptionalTime(sqlite3_stmt *stmt, int index, const std::optional<TimePoint> &value)
{
    if (!value) {
        sqlite3_bind_null(stmt, index);
        return;
    }
    sqlite3_bind_int64(stmt, index, toEpochSeconds(*value));
}

void bindOptionalId(sqlite3_stmt *stmt, int index, std::int64_t id)
{
    if (id == 0) {
        sqlite3_bind_null(stmt, index);
        return;
    }
    sqlite3_bind_int64(stmt, index, id);
}

std::string columnText(sqlite3_stmt *stmt, int index)
{
    const unsigned char *text = sqlite3_column_text(stmt, index);
    if (!text) {
        return {};
    }
    return reinterpret_cast<const char *>(text);
}

nlohmann::json columnJson(sqlite3_stmt *stmt, int index)
{
    const unsigned char *text = sqlite3_column_text(stmt, index);
    if (!text) {
        return nlohmann::json::object();
    }
    try {
        return nlohmann::json::parse(reinterpret_cast<const char *>(text));
    } catch (const nlohmann::json::parse_error &) {
        return nlohmann::json::object();
    }
}

std::optional<TimePoint> columnOptionalTime(sqlite3_stmt *stmt, int index)
{
    if (sqlite3_column_type(stmt, index) == SQLITE_NULL) {
        return std::nullopt;
    }
    return fromEpochSeconds(sqlite3_column_int64(stmt, index));
}

std::optional<double> columnOptionalDouble(sqlite3_stmt *stmt, int index)
{
    if (sqlite3_column_type(stmt, index) == SQLITE_NULL) {
        return std::nullopt;
    }
    return sqlite3_column_double(stmt, index);
}

Customer readCustomer(sqlite3_stmt *stmt)
{
    Customer customer;
    customer.id = sqlite3_column_int64(stmt, 0);
    customer.name = columnText(stmt, 1);
    customer.email = columnText(stmt, 2);
    customer.company = columnText(stmt, 3);
    customer.tier = parseTierString(columnText(stmt, 4)).value_or(CustomerTier::Basic);
    customer.createdAt = fromEpochSeconds(sqlite3_column_int64(stmt, 5));
    return customer;
}

Issue readIssue(sqlite3_stmt *stmt)
{
    Issue issue;
    issue.id = sqlite3_column_int64(stmt, 0);
    issue.customerId = sqlite3_column_int64(stmt, 1);
    issue.title = columnText(stmt, 2);
    issue.description = columnText(stmt, 3);
    issue.category = parseCategoryString(columnText(stmt, 4)).value_or(IssueCategory::General);
    issue.productArea = columnText(stmt, 5);
    issue.severity = parseSeverityString(columnText(stmt, 6)).value_or(Severity::Normal);
    issue.status = parseStatusString(columnText(stmt, 7)).value_or(IssueStatus::Open);
    issue.priority = sqlite3_column_int(stmt, 8);
    issue.createdAt = fromEpochSeconds(sqlite3_column_int64(stmt, 9));
    issue.updatedAt = fromEpochSeconds(sqlite3_column_int64(stmt, 10));
    issue.resolvedAt = columnOptionalTime(stmt, 11);
    issue.resolutionHours = columnOptionalDouble(stmt, 12);
    issue.tags = tagsFromJson(columnJson(stmt, 13));
    return issue;
}

CriticalAlert readAlert(sqlite3_stmt *stmt)
{
    CriticalAlert alert;
    alert.id = sqlite3_column_int64(stmt, 0);
    alert.issueId = sqlite3_column_type(stmt, 1) == SQLITE_NULL
        ? 0
        : sqlite3_column_int64(stmt, 1);
    alert.customerId = sqlite3_column_int64(stmt, 2);
    alert.type = parseAlertTypeString(columnText(stmt, 3)).value_or(AlertType::Unattended);
    alert.severity = parseSeverityString(columnText(stmt, 4)).value_or(Severity::High);
    alert.message = columnText(stmt, 5);
    alert.status = parseAlertStatusString(columnText(stmt, 6)).value_or(AlertStatus::Active);
    alert.createdAt = fromEpochSeconds(sqlite3_column_int64(stmt, 7));
    alert.acknowledgedAt = columnOptionalTime(stmt, 8);
    alert.acknowledgedBy = columnText(stmt, 9);
    alert.resolvedAt = columnOptionalTime(stmt, 10);
    return alert;
}

std::optional<CriticalAlert> fetchAlert(sqlite3 *db, std::int64_t id)
{
    Statement stmt(db, std::string("SELECT ") + kAlertColumns
                           + " FROM critical_alerts WHERE id = ? LIMIT 1;");
    sqlite3_bind_int64(stmt.get(), 1, id);
    if (stmt.step() != SQLITE_ROW) {
        return std::nullopt;
    }
    return readAlert(stmt.get());
}

std::optional<Issue> fetchIssue(sqlite3 *db, std::int64_t id)
{
    Statement stmt(db, std::string("SELECT ") + kIssueColumns
                           + " FROM issues WHERE id = ? LIMIT 1;");
    sqlite3_bind_int64(stmt.get(), 1, id);
    if (stmt.step() != SQLITE_ROW) {
        return std::nullopt;
    }
    return readIssue(stmt.get());
}

void logStoreFailure(const char *where, const TriageError &error)
{
    TLOG_WARN(QStringLiteral("SqliteIssueStore"),
              QString::fromUtf8(where),
              QStringLiteral("store_operation_failed"),
              QString::fromStdString(errorKindName(error.kind)),
              QStringLiteral("sqlite"),
              logging::defaultWho(),
              QString(),
              (nlohmann::json{{"error", error.message}}));
}

// Runs fn and converts store exceptions into a typed failure.
template <typename T, typename Fn>
Outcome<T> guarded(const char *where, Fn &&fn)
{
    try {
        return fn();
    } catch (const StoreError &ex) {
        const TriageError error = makeError(ex.kind(), ex.what());
        logStoreFailure(where, error);
        return error;
    } catch (const std::exception &ex) {
        const TriageError error = makeError(ErrorKind::Internal, ex.what());
        logStoreFailure(where, error);
        return error;
    }
}

} // namespace

struct SqliteIssueStore::Impl {
    sqlite3 *db = nullptr;
    // Serializes statements on the shared connection.
    mutable std::timed_mutex mutex;
};

SqliteIssueStore::SqliteIssueStore(const std::string &path)
    : impl(std::make_unique<Impl>())
{
    const std::filesystem::path dbPath(path);
    if (dbPath.has_parent_path()) {
        std::error_code error;
        std::filesystem::create_directories(dbPath.parent_path(), error);
    }

    const int flags = SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX;
    if (sqlite3_open_v2(path.c_str(), &impl->db, flags, nullptr) != SQLITE_OK) {
        const std::string message = impl->db ? sqlite3_errmsg(impl->db) : "out of memory";
        sqlite3_close(impl->db);
        impl->db = nullptr;
        throw std::runtime_error("failed to open triage database: " + message);
    }

    sqlite3_busy_timeout(impl->db, kBusyTimeoutMs);
    execOrThrow(impl->db, "PRAGMA foreign_keys = ON;");
    execOrThrow(impl->db, "PRAGMA journal_mode = WAL;");

    execOrThrow(impl->db, kCreateCustomersTable);
    execOrThrow(impl->db, kCreateIssuesTable);
    execOrThrow(impl->db, kCreateIssueIndexes);
    execOrThrow(impl->db, kCreateResolutionsTable);
    execOrThrow(impl->db, kCreateSimilarIssuesTable);
    execOrThrow(impl->db, kCreateAlertsTable);
    execOrThrow(impl->db, kCreateAlertIndexes);
    execOrThrow(impl->db, kCreateMetaTable);

    if (!getMeta("schema_version").has_value()) {
        setMeta("schema_version", kSchemaVersion);
    }
}

SqliteIssueStore::~SqliteIssueStore()
{
    if (impl && impl->db) {
        sqlite3_close(impl->db);
        impl->db = nullptr;
    }
}

std::string SqliteIssueStore::defaultDatabasePath()
{
    const char *home = std::getenv("HOME");
    std::filesystem::path basePath = home ? home : ".";
    basePath /= ".local/share/triage/triage.db";
    return basePath.string();
}

Outcome<Customer> SqliteIssueStore::getCustomer(std::int64_t id)
{
    std::lock_guard<std::timed_mutex> lock(impl->mutex);
    return guarded<Customer>("getCustomer", [&]() -> Outcome<Customer> {
        Statement stmt(impl->db, std::string("SELECT ") + kCustomerColumns
                                     + " FROM customers WHERE id = ? LIMIT 1;");
        sqlite3_bind_int64(stmt.get(), 1, id);
        if (stmt.step() != SQLITE_ROW) {
            return makeError(ErrorKind::NotFound,
                             "customer " + std::to_string(id) + " not found");
        }
        return readCustomer(stmt.get());
    });
}

Outcome<Customer> SqliteIssueStore::insertCustomer(const Customer &customer)
{
    if (customer.name.empty() || customer.email.empty()) {
        return makeError(ErrorKind::InvalidInput, "customer name and email are required");
    }

    std::lock_guard<std::timed_mutex> lock(impl->mutex);
    return guarded<Customer>("insertCustomer", [&]() -> Outcome<Customer> {
        Statement stmt(impl->db,
                       "INSERT INTO customers (name, email, company, tier, created_at) "
                       "VALUES (?, ?, ?, ?, ?);");
        Customer stored = customer;
        stored.createdAt = nowOr(customer.createdAt);
        bindText(stmt.get(), 1, stored.name);
        bindText(stmt.get(), 2, stored.email);
        bindOptionalText(stmt.get(), 3, stored.company);
        bindText(stmt.get(), 4, toTierString(stored.tier));
        sqlite3_bind_int64(stmt.get(), 5, toEpochSeconds(stored.createdAt));
        stmt.step();
        stored.id = sqlite3_last_insert_rowid(impl->db);
        return stored;
    });
}

Outcome<std::vector<Customer>> SqliteIssueStore::listCustomers()
{
    std::lock_guard<std::timed_mutex> lock(impl->mutex);
    return guarded<std::vector<Customer>>("listCustomers",
                                          [&]() -> Outcome<std::vector<Customer>> {
        Statement stmt(impl->db, std::string("SELECT ") + kCustomerColumns
                                     + " FROM customers ORDER BY id ASC;");
        std::vector<Customer> customers;
        while (stmt.step() == SQLITE_ROW) {
            customers.push_back(readCustomer(stmt.get()));
        }
        return customers;
    });
}

Outcome<Issue> SqliteIssueStore::getIssue(std::int64_t id)
{
    std::lock_guard<std::timed_mutex> lock(impl->mutex);
    return guarded<Issue>("getIssue", [&]() -> Outcome<Issue> {
        auto issue = fetchIssue(impl->db, id);
        if (!issue) {
            return makeError(ErrorKind::NotFound, "issue " + std::to_string(id) + " not found");
        }
        return *issue;
    });
}

Outcome<Issue> SqliteIssueStore::insertIssue(const Issue &issue)
{
    if (issue.customerId <= 0) {
        return makeError(ErrorKind::InvalidInput, "issue requires a customer id");
    }

    std::lock_guard<std::timed_mutex> lock(impl->mutex);
    return guarded<Issue>("insertIssue", [&]() -> Outcome<Issue> {
        Issue stored = issue;
        stored.createdAt = nowOr(issue.createdAt);
        stored.updatedAt = issue.updatedAt == TimePoint{} ? stored.createdAt : issue.updatedAt;
        if (stored.status == IssueStatus::Resolved) {
            if (!stored.resolvedAt) {
                stored.resolvedAt = stored.updatedAt;
            }
            if (*stored.resolvedAt < stored.createdAt) {
                return makeError(ErrorKind::InvalidInput, "resolvedAt precedes createdAt");
            }
            if (!stored.resolutionHours) {
                const auto seconds =
                    toEpochSeconds(*stored.resolvedAt) - toEpochSeconds(stored.createdAt);
                stored.resolutionHours = std::round(seconds / 36.0) / 100.0;
            } else if (*stored.resolutionHours < 0.0) {
                return makeError(ErrorKind::InvalidInput, "resolution hours must not be negative");
            }
        } else {
            stored.resolvedAt.reset();
            stored.resolutionHours.reset();
        }

        Statement stmt(impl->db,
                       "INSERT INTO issues (customer_id, title, description, category, "
                       "product_area, severity, status, priority, created_at, updated_at, "
                       "resolved_at, resolution_hours, tags) "
                       "VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?);");
        sqlite3_bind_int64(stmt.get(), 1, stored.customerId);
        bindText(stmt.get(), 2, stored.title);
        bindText(stmt.get(), 3, stored.description);
        bindText(stmt.get(), 4, toCategoryString(stored.category));
        bindOptionalText(stmt.get(), 5, stored.productArea);
        bindText(stmt.get(), 6, toSeverityString(stored.severity));
        bindText(stmt.get(), 7, toStatusString(stored.status));
        sqlite3_bind_int(stmt.get(), 8, stored.priority);
        sqlite3_bind_int64(stmt.get(), 9, toEpochSeconds(stored.createdAt));
        sqlite3_bind_int64(stmt.get(), 10, toEpochSeconds(stored.updatedAt));
        bindOptionalTime(stmt.get(), 11, stored.resolvedAt);
        if (stored.resolutionHours) {
            sqlite3_bind_double(stmt.get(), 12, *stored.resolutionHours);
        } else {
            sqlite3_bind_null(stmt.get(), 12);
        }
        bindText(stmt.get(), 13, tagsToJson(stored.tags).dump());
        stmt.step();
        stored.id = sqlite3_last_insert_rowid(impl->db);
        return stored;
    });
}

Status SqliteIssueStore::updateIssueAnalysis(std::int64_t id,
                                             Severity severity,
                                             int priority,
                                             const TagMap &tags)
{
    std::lock_guard<std::timed_mutex> lock(impl->mutex);
    return guarded<bool>("updateIssueAnalysis", [&]() -> Status {
        Statement stmt(impl->db,
                       "UPDATE issues SET severity = ?, priority = ?, tags = ?, "
                       "updated_at = ? WHERE id = ?;");
        bindText(stmt.get(), 1, toSeverityString(severity));
        sqlite3_bind_int(stmt.get(), 2, priority);
        bindText(stmt.get(), 3, tagsToJson(tags).dump());
        sqlite3_bind_int64(stmt.get(), 4, toEpochSeconds(std::chrono::system_clock::now()));
        sqlite3_bind_int64(stmt.get(), 5, id);
        stmt.step();
        if (sqlite3_changes(impl->db) == 0) {
            return makeError(ErrorKind::NotFound, "issue " + std::to_string(id) + " not found");
        }
        return true;
    });
}

Outcome<Issue> SqliteIssueStore::updateIssueStatus(std::int64_t id,
                                                   IssueStatus status,
                                                   TimePoint now)
{
    std::lock_guard<std::timed_mutex> lock(impl->mutex);
    return guarded<Issue>("updateIssueStatus", [&]() -> Outcome<Issue> {
        // SET expressions see the pre-update row, so an already resolved issue
        // keeps its first resolvedAt.
        Statement stmt(impl->db,
                       "UPDATE issues SET status = ?1, updated_at = ?2, "
                       "resolved_at = CASE WHEN ?1 = 'Resolved' "
                       "    THEN COALESCE(resolved_at, ?2) ELSE NULL END, "
                       "resolution_hours = CASE WHEN ?1 = 'Resolved' "
                       "    THEN ROUND((COALESCE(resolved_at, ?2) - created_at) / 3600.0, 2) "
                       "    ELSE NULL END "
                       "WHERE id = ?3;");
        bindText(stmt.get(), 1, toStatusString(status));
        sqlite3_bind_int64(stmt.get(), 2, toEpochSeconds(nowOr(now)));
        sqlite3_bind_int64(stmt.get(), 3, id);
        stmt.step();
        if (sqlite3_changes(impl->db) == 0) {
            return makeError(ErrorKind::NotFound, "issue " + std::to_string(id) + " not found");
        }
        auto issue = fetchIssue(impl->db, id);
        if (!issue) {
            return makeError(ErrorKind::NotFound, "issue " + std::to_string(id) + " not found");
        }
        return *issue;
    });
}

Outcome<std::vector<Issue>> SqliteIssueStore::listIssues(const IssueFilter &filter)
{
    std::lock_guard<std::timed_mutex> lock(impl->mutex);
    return guarded<std::vector<Issue>>("listIssues", [&]() -> Outcome<std::vector<Issue>> {
        std::string sql = std::string("SELECT ") + kIssueColumns + " FROM issues WHERE 1 = 1";
        if (filter.customerId) {
            sql += " AND customer_id = ?";
        }
        if (filter.status) {
            sql += " AND status = ?";
        }
        if (filter.severity) {
            sql += " AND severity = ?";
        }
        if (filter.createdAfter) {
            sql += " AND created_at >= ?";
        }
        sql += " ORDER BY created_at DESC, id DESC LIMIT ? OFFSET ?;";

        Statement stmt(impl->db, sql);
        int bindIndex = 1;
        if (filter.customerId) {
            sqlite3_bind_int64(stmt.get(), bindIndex++, *filter.customerId);
        }
        if (filter.status) {
            bindText(stmt.get(), bindIndex++, toStatusString(*filter.status));
        }
        if (filter.severity) {
            bindText(stmt.get(), bindIndex++, toSeverityString(*filter.severity));
        }
        if (filter.createdAfter) {
            sqlite3_bind_int64(stmt.get(), bindIndex++, toEpochSeconds(*filter.createdAfter));
        }
        sqlite3_bind_int(stmt.get(), bindIndex++, filter.limit > 0 ? filter.limit : -1);
        sqlite3_bind_int(stmt.get(), bindIndex++, std::max(0, filter.offset));

        std::vector<Issue> issues;
        while (stmt.step() == SQLITE_ROW) {
            issues.push_back(readIssue(stmt.get()));
        }
        return issues;
    });
}

Outcome<std::vector<Issue>> SqliteIssueStore::recentResolvedIssues(
    int limit,
    const CancellationToken &cancel,
    std::chrono::milliseconds timeout)
{
    if (cancel.isCancelled()) {
        return makeError(ErrorKind::Cancelled, "corpus read cancelled");
    }

    std::unique_lock<std::timed_mutex> lock(impl->mutex, std::defer_lock);
    if (!lock.try_lock_for(timeout)) {
        return makeError(ErrorKind::CollaboratorUnavailable, "store busy past corpus timeout");
    }

    return guarded<std::vector<Issue>>("recentResolvedIssues",
                                       [&]() -> Outcome<std::vector<Issue>> {
        QueryBudget budget;
        budget.cancel = &cancel;
        budget.deadline = std::chrono::steady_clock::now() + timeout;
        ProgressGuard progress(impl->db, &budget);

        Statement stmt(impl->db, std::string("SELECT ") + kIssueColumns
                                     + " FROM issues WHERE status = 'Resolved' "
                                       "AND resolution_hours IS NOT NULL "
                                       "ORDER BY created_at DESC, id DESC LIMIT ?;");
        sqlite3_bind_int(stmt.get(), 1, limit > 0 ? limit : -1);

        std::vector<Issue> issues;
        while (true) {
            const int rc = sqlite3_step(stmt.get());
            if (rc == SQLITE_ROW) {
                issues.push_back(readIssue(stmt.get()));
                continue;
            }
            if (rc == SQLITE_DONE) {
                break;
            }
            if (rc == SQLITE_INTERRUPT && budget.cancelled) {
                return makeError(ErrorKind::Cancelled, "corpus read cancelled");
            }
            if (rc == SQLITE_INTERRUPT || rc == SQLITE_BUSY || rc == SQLITE_LOCKED) {
                return makeError(ErrorKind::CollaboratorUnavailable, "corpus read timed out");
            }
            throw StoreError(ErrorKind::Internal,
                             std::string("corpus read failed: ") + sqlite3_errmsg(impl->db));
        }
        return issues;
    });
}

Outcome<std::optional<double>> SqliteIssueStore::averageSatisfaction(std::int64_t customerId)
{
    std::lock_guard<std::timed_mutex> lock(impl->mutex);
    return guarded<std::optional<double>>("averageSatisfaction",
                                          [&]() -> Outcome<std::optional<double>> {
        Statement stmt(impl->db,
                       "SELECT AVG(r.customer_satisfaction) FROM issue_resolutions r "
                       "JOIN issues i ON i.id = r.issue_id "
                       "WHERE i.customer_id = ? AND r.customer_satisfaction IS NOT NULL;");
        sqlite3_bind_int64(stmt.get(), 1, customerId);
        if (stmt.step() != SQLITE_ROW) {
            return std::optional<double>{};
        }
        return columnOptionalDouble(stmt.get(), 0);
    });
}

Outcome<IssueResolution> SqliteIssueStore::addResolution(const IssueResolution &resolution)
{
    if (resolution.summary.empty()) {
        return makeError(ErrorKind::InvalidInput, "resolution summary is required");
    }
    if (resolution.customerSatisfaction
        && (*resolution.customerSatisfaction < 1 || *resolution.customerSatisfaction > 5)) {
        return makeError(ErrorKind::InvalidInput, "customer satisfaction must be within 1-5");
    }

    std::lock_guard<std::timed_mutex> lock(impl->mutex);
    return guarded<IssueResolution>("addResolution", [&]() -> Outcome<IssueResolution> {
        IssueResolution stored = resolution;
        stored.createdAt = nowOr(resolution.createdAt);
        Statement stmt(impl->db,
                       "INSERT INTO issue_resolutions (issue_id, summary, "
                       "customer_satisfaction, created_at) VALUES (?, ?, ?, ?);");
        sqlite3_bind_int64(stmt.get(), 1, stored.issueId);
        bindText(stmt.get(), 2, stored.summary);
        if (stored.customerSatisfaction) {
            sqlite3_bind_int(stmt.get(), 3, *stored.customerSatisfaction);
        } else {
            sqlite3_bind_null(stmt.get(), 3);
        }
        sqlite3_bind_int64(stmt.get(), 4, toEpochSeconds(stored.createdAt));
        stmt.step();
        stored.id = sqlite3_last_insert_rowid(impl->db);
        return stored;
    });
}

Outcome<AlertInsertResult> SqliteIssueStore::insertAlertIfAbsent(const CriticalAlert &alert)
{
    std::lock_guard<std::timed_mutex> lock(impl->mutex);
    return guarded<AlertInsertResult>("insertAlertIfAbsent",
                                      [&]() -> Outcome<AlertInsertResult> {
        Statement stmt(impl->db,
                       "INSERT OR IGNORE INTO critical_alerts (issue_id, customer_id, "
                       "alert_type, severity, message, status, created_at) "
                       "VALUES (?, ?, ?, ?, ?, 'Active', ?);");
        bindOptionalId(stmt.get(), 1, alert.issueId);
        sqlite3_bind_int64(stmt.get(), 2, alert.customerId);
        bindText(stmt.get(), 3, toAlertTypeString(alert.type));
        bindText(stmt.get(), 4, toSeverityString(alert.severity));
        bindText(stmt.get(), 5, alert.message);
        sqlite3_bind_int64(stmt.get(), 6, toEpochSeconds(nowOr(alert.createdAt)));
        stmt.step();

        AlertInsertResult result;
        if (sqlite3_changes(impl->db) == 1) {
            auto stored = fetchAlert(impl->db, sqlite3_last_insert_rowid(impl->db));
            if (!stored) {
                throw StoreError(ErrorKind::Internal, "inserted alert vanished");
            }
            result.alert = *stored;
            result.created = true;
            return result;
        }

        Statement existing(impl->db, std::string("SELECT ") + kAlertColumns
                                         + " FROM critical_alerts WHERE issue_id = ? "
                                           "AND alert_type = ? AND status = 'Active' LIMIT 1;");
        sqlite3_bind_int64(existing.get(), 1, alert.issueId);
        bindText(existing.get(), 2, toAlertTypeString(alert.type));
        if (existing.step() != SQLITE_ROW) {
            throw StoreError(ErrorKind::Internal, "alert insert ignored without an active duplicate");
        }
        result.alert = readAlert(existing.get());
        result.created = false;
        return result;
    });
}

Outcome<std::vector<CriticalAlert>> SqliteIssueStore::listAlerts(
    std::optional<AlertStatus> status,
    std::optional<std::int64_t> customerId)
{
    std::lock_guard<std::timed_mutex> lock(impl->mutex);
    return guarded<std::vector<CriticalAlert>>("listAlerts",
                                               [&]() -> Outcome<std::vector<CriticalAlert>> {
        std::string sql = std::string("SELECT ") + kAlertColumns
            + " FROM critical_alerts WHERE 1 = 1";
        if (status) {
            sql += " AND status = ?";
        }
        if (customerId) {
            sql += " AND customer_id = ?";
        }
        sql += " ORDER BY created_at DESC, id DESC;";

        Statement stmt(impl->db, sql);
        int bindIndex = 1;
        if (status) {
            bindText(stmt.get(), bindIndex++, toAlertStatusString(*status));
        }
        if (customerId) {
            sqlite3_bind_int64(stmt.get(), bindIndex++, *customerId);
        }

        std::vector<CriticalAlert> alerts;
        while (stmt.step() == SQLITE_ROW) {
            alerts.push_back(readAlert(stmt.get()));
        }
        return alerts;
    });
}

Outcome<CriticalAlert> SqliteIssueStore::acknowledgeAlert(std::int64_t id,
                                                          const std::string &actor,
                                                          TimePoint now)
{
    if (actor.empty()) {
        return makeError(ErrorKind::InvalidInput, "acknowledging actor is required");
    }

    std::lock_guard<std::timed_mutex> lock(impl->mutex);
    return guarded<CriticalAlert>("acknowledgeAlert", [&]() -> Outcome<CriticalAlert> {
        Statement stmt(impl->db,
                       "UPDATE critical_alerts SET status = 'Acknowledged', "
                       "acknowledged_at = ?, acknowledged_by = ? "
                       "WHERE id = ? AND status = 'Active';");
        sqlite3_bind_int64(stmt.get(), 1, toEpochSeconds(nowOr(now)));
        bindText(stmt.get(), 2, actor);
        sqlite3_bind_int64(stmt.get(), 3, id);
        stmt.step();
        const bool changed = sqlite3_changes(impl->db) == 1;

        auto alert = fetchAlert(impl->db, id);
        if (!alert) {
            return makeError(ErrorKind::NotFound, "alert " + std::to_string(id) + " not found");
        }
        if (!changed) {
            return makeError(ErrorKind::InvalidInput,
                             "alert " + std::to_string(id) + " is "
                                 + toAlertStatusString(alert->status) + ", not Active");
        }
        return *alert;
    });
}

Outcome<CriticalAlert> SqliteIssueStore::resolveAlert(std::int64_t id, TimePoint now)
{
    std::lock_guard<std::timed_mutex> lock(impl->mutex);
    return guarded<CriticalAlert>("resolveAlert", [&]() -> Outcome<CriticalAlert> {
        Statement stmt(impl->db,
                       "UPDATE critical_alerts SET status = 'Resolved', resolved_at = ? "
                       "WHERE id = ? AND status = 'Acknowledged';");
        sqlite3_bind_int64(stmt.get(), 1, toEpochSeconds(nowOr(now)));
        sqlite3_bind_int64(stmt.get(), 2, id);
        stmt.step();
        const bool changed = sqlite3_changes(impl->db) == 1;

        auto alert = fetchAlert(impl->db, id);
        if (!alert) {
            return makeError(ErrorKind::NotFound, "alert " + std::to_string(id) + " not found");
        }
        if (!changed) {
            return makeError(ErrorKind::InvalidInput,
                             "alert " + std::to_string(id) + " is "
                                 + toAlertStatusString(alert->status) + ", not Acknowledged");
        }
        return *alert;
    });
}

Outcome<int> SqliteIssueStore::purgeResolvedAlertsBefore(TimePoint cutoff)
{
    std::lock_guard<std::timed_mutex> lock(impl->mutex);
    return guarded<int>("purgeResolvedAlertsBefore", [&]() -> Outcome<int> {
        Statement stmt(impl->db,
                       "DELETE FROM critical_alerts WHERE status = 'Resolved' "
                       "AND resolved_at < ?;");
        sqlite3_bind_int64(stmt.get(), 1, toEpochSeconds(cutoff));
        stmt.step();
        return sqlite3_changes(impl->db);
    });
}

Status SqliteIssueStore::recordSimilarIssues(std::int64_t sourceIssueId,
                                             const std::vector<SimilarIssue> &similar)
{
    std::lock_guard<std::timed_mutex> lock(impl->mutex);
    return guarded<bool>("recordSimilarIssues", [&]() -> Status {
        Transaction transaction(impl->db);

        Statement clear(impl->db, "DELETE FROM similar_issues WHERE source_issue_id = ?;");
        sqlite3_bind_int64(clear.get(), 1, sourceIssueId);
        clear.step();

        const auto now = toEpochSeconds(std::chrono::system_clock::now());
        for (const auto &entry : similar) {
            Statement insert(impl->db,
                             "INSERT INTO similar_issues (source_issue_id, similar_issue_id, "
                             "similarity_score, created_at) VALUES (?, ?, ?, ?);");
            sqlite3_bind_int64(insert.get(), 1, sourceIssueId);
            sqlite3_bind_int64(insert.get(), 2, entry.issueId);
            sqlite3_bind_double(insert.get(), 3, entry.score);
            sqlite3_bind_int64(insert.get(), 4, now);
            insert.step();
        }

        transaction.commit();
        return true;
    });
}

std::optional<std::string> SqliteIssueStore::getMeta(const std::string &key) const
{
    std::lock_guard<std::timed_mutex> lock(impl->mutex);
    Statement stmt(impl->db,
                   "SELECT value FROM meta WHERE key = ? LIMIT 1;");
    bindText(stmt.get(), 1, key);

    if (stmt.step() != SQLITE_ROW) {
        return std::nullopt;
    }

    return columnText(stmt.get(), 0);
}

void SqliteIssueStore::setMeta(const std::string &key, const std::string &value)
{
    std::lock_guard<std::timed_mutex> lock(impl->mutex);
    Statement stmt(impl->db,
                   "INSERT OR REPLACE INTO meta (key, value) VALUES (?, ?);");
    bindText(stmt.get(), 1, key);
    bindText(stmt.get(), 2, value);

    if (stmt.step() != SQLITE_DONE) {
        throw std::runtime_error("failed to set meta value");
    }
}

bool SqliteIssueStore::integrityCheck(std::string *message) const
{
    std::lock_guard<std::timed_mutex> lock(impl->mutex);
    Statement stmt(impl->db, "PRAGMA integrity_check;");

    if (stmt.step() != SQLITE_ROW) {
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

} // namespace triage
