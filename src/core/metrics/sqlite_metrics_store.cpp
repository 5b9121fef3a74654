#include "core/metrics/sqlite_metrics_store.h"

#include "core/shared/logging.h"

#include <QFile>

#include <sqlite3.h>

#include <algorithm>

namespace ak {

namespace {

constexpr const char* kPragmas = R"(
    PRAGMA journal_mode = WAL;
    PRAGMA synchronous = NORMAL;
)";

constexpr const char* kSchema = R"(
    CREATE TABLE IF NOT EXISTS adaptation_metrics (
        id INTEGER PRIMARY KEY AUTOINCREMENT,
        request_id TEXT NOT NULL,
        recorded_at TEXT NOT NULL,
        pattern TEXT,
        examples_count INTEGER NOT NULL DEFAULT 0,
        steps_run INTEGER NOT NULL DEFAULT 0,
        elapsed_ms INTEGER NOT NULL DEFAULT 0,
        confidence REAL NOT NULL DEFAULT 0,
        convergence REAL NOT NULL DEFAULT 0,
        accepted INTEGER NOT NULL DEFAULT 0,
        rejection_reason TEXT
    );
    CREATE INDEX IF NOT EXISTS idx_adaptation_metrics_recorded
        ON adaptation_metrics(recorded_at);
)";

QString columnText(sqlite3_stmt* stmt, int column)
{
    const unsigned char* text = sqlite3_column_text(stmt, column);
    return text ? QString::fromUtf8(reinterpret_cast<const char*>(text)) : QString();
}

} // namespace

SqliteMetricsStore::~SqliteMetricsStore()
{
    if (m_db) {
        sqlite3_close(m_db);
        m_db = nullptr;
    }
}

SqliteMetricsStore::SqliteMetricsStore(SqliteMetricsStore&& other) noexcept
{
    std::lock_guard<std::mutex> lock(other.m_mutex);
    m_db = other.m_db;
    other.m_db = nullptr;
}

SqliteMetricsStore& SqliteMetricsStore::operator=(SqliteMetricsStore&& other) noexcept
{
    if (this != &other) {
        std::scoped_lock lock(m_mutex, other.m_mutex);
        if (m_db) {
            sqlite3_close(m_db);
        }
        m_db = other.m_db;
        other.m_db = nullptr;
    }
    return *this;
}

std::optional<SqliteMetricsStore> SqliteMetricsStore::open(const QString& dbPath)
{
    SqliteMetricsStore store;
    if (!store.init(dbPath)) {
        return std::nullopt;
    }
    return store;
}

bool SqliteMetricsStore::init(const QString& dbPath)
{
    int rc = sqlite3_open(dbPath.toUtf8().constData(), &m_db);
    if (rc != SQLITE_OK) {
        LOG_ERROR(akMetrics, "Failed to open metrics database: %s",
                  m_db ? sqlite3_errmsg(m_db) : "out of memory");
        return false;
    }

    sqlite3_busy_timeout(m_db, 5000);

    if (!execSql(kPragmas)) {
        LOG_WARN(akMetrics, "Failed to set metrics database pragmas");
    }
    if (!execSql(kSchema)) {
        LOG_ERROR(akMetrics, "Failed to create metrics schema");
        return false;
    }

    QFile dbFile(dbPath);
    dbFile.setPermissions(QFile::ReadOwner | QFile::WriteOwner);

    LOG_INFO(akMetrics, "Metrics database opened: %s", qUtf8Printable(dbPath));
    return true;
}

bool SqliteMetricsStore::execSql(const char* sql)
{
    char* errMsg = nullptr;
    const int rc = sqlite3_exec(m_db, sql, nullptr, nullptr, &errMsg);
    if (rc != SQLITE_OK) {
        LOG_ERROR(akMetrics, "SQL error: %s", errMsg ? errMsg : "unknown");
        sqlite3_free(errMsg);
        return false;
    }
    return true;
}

void SqliteMetricsStore::record(const AdaptationMetricsRecord& record)
{
    std::lock_guard<std::mutex> lock(m_mutex);

    sqlite3_stmt* stmt = nullptr;
    const char* sql = R"(
        INSERT INTO adaptation_metrics (
            request_id, recorded_at, pattern, examples_count, steps_run,
            elapsed_ms, confidence, convergence, accepted, rejection_reason
        ) VALUES (?1, ?2, ?3, ?4, ?5, ?6, ?7, ?8, ?9, ?10)
    )";
    if (sqlite3_prepare_v2(m_db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        LOG_WARN(akMetrics, "Failed to prepare metrics insert: %s", sqlite3_errmsg(m_db));
        return;
    }

    const QByteArray requestId = record.requestId.toUtf8();
    const QByteArray recordedAt = record.recordedAt.toUTC().toString(Qt::ISODateWithMs).toUtf8();
    const QByteArray pattern = record.patternDetected
        ? patternKindToString(*record.patternDetected).toUtf8()
        : QByteArray();
    const QByteArray reason = adaptationReasonToString(record.rejectionReason).toUtf8();

    sqlite3_bind_text(stmt, 1, requestId.constData(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 2, recordedAt.constData(), -1, SQLITE_TRANSIENT);
    if (record.patternDetected) {
        sqlite3_bind_text(stmt, 3, pattern.constData(), -1, SQLITE_TRANSIENT);
    } else {
        sqlite3_bind_null(stmt, 3);
    }
    sqlite3_bind_int(stmt, 4, record.examplesCount);
    sqlite3_bind_int(stmt, 5, record.stepsRun);
    sqlite3_bind_int64(stmt, 6, record.elapsedMs);
    sqlite3_bind_double(stmt, 7, record.confidenceScore);
    sqlite3_bind_double(stmt, 8, record.convergenceScore);
    sqlite3_bind_int(stmt, 9, record.accepted ? 1 : 0);
    if (record.accepted) {
        sqlite3_bind_null(stmt, 10);
    } else {
        sqlite3_bind_text(stmt, 10, reason.constData(), -1, SQLITE_TRANSIENT);
    }

    if (sqlite3_step(stmt) != SQLITE_DONE) {
        LOG_WARN(akMetrics, "Failed to insert metrics row for %s: %s",
                 requestId.constData(), sqlite3_errmsg(m_db));
    }
    sqlite3_finalize(stmt);
}

std::vector<AdaptationMetricsRecord> SqliteMetricsStore::recentRecords(int limit) const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    std::vector<AdaptationMetricsRecord> records;

    sqlite3_stmt* stmt = nullptr;
    const char* sql = R"(
        SELECT request_id, recorded_at, pattern, examples_count, steps_run,
               elapsed_ms, confidence, convergence, accepted, rejection_reason
        FROM adaptation_metrics
        ORDER BY id DESC
        LIMIT ?1
    )";
    if (sqlite3_prepare_v2(m_db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        LOG_WARN(akMetrics, "Failed to prepare metrics query: %s", sqlite3_errmsg(m_db));
        return records;
    }
    sqlite3_bind_int(stmt, 1, std::max(0, limit));

    while (sqlite3_step(stmt) == SQLITE_ROW) {
        AdaptationMetricsRecord record;
        record.requestId = columnText(stmt, 0);
        record.recordedAt = QDateTime::fromString(columnText(stmt, 1), Qt::ISODateWithMs);
        if (sqlite3_column_type(stmt, 2) != SQLITE_NULL) {
            PatternKind kind;
            if (patternKindFromString(columnText(stmt, 2), &kind)) {
                record.patternDetected = kind;
            }
        }
        record.examplesCount = sqlite3_column_int(stmt, 3);
        record.stepsRun = sqlite3_column_int(stmt, 4);
        record.elapsedMs = sqlite3_column_int64(stmt, 5);
        record.confidenceScore = sqlite3_column_double(stmt, 6);
        record.convergenceScore = sqlite3_column_double(stmt, 7);
        record.accepted = sqlite3_column_int(stmt, 8) != 0;
        record.rejectionReason = adaptationReasonFromString(columnText(stmt, 9));
        records.push_back(record);
    }
    sqlite3_finalize(stmt);
    return records;
}

int64_t SqliteMetricsStore::recordCount() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    int64_t count = 0;
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(m_db, "SELECT count(*) FROM adaptation_metrics", -1, &stmt, nullptr)
        == SQLITE_OK
        && sqlite3_step(stmt) == SQLITE_ROW) {
        count = sqlite3_column_int64(stmt, 0);
    }
    sqlite3_finalize(stmt);
    return count;
}

} // namespace ak
