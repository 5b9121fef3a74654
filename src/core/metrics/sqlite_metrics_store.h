#pragma once

#include "core/metrics/metrics_sink.h"

#include <QString>

#include <mutex>
#include <optional>
#include <vector>

struct sqlite3;

namespace ak {

// SqliteMetricsStore -- durable metrics sink, one row per request in
// table adaptation_metrics. Owns its sqlite3 handle; calls are serialized
// internally so the store may be shared by concurrent requests.
class SqliteMetricsStore final : public MetricsSink {
public:
    ~SqliteMetricsStore() override;

    // Move-only (owns sqlite3* handle). The moved-to store gets a fresh mutex.
    SqliteMetricsStore(SqliteMetricsStore&& other) noexcept;
    SqliteMetricsStore& operator=(SqliteMetricsStore&& other) noexcept;
    SqliteMetricsStore(const SqliteMetricsStore&) = delete;
    SqliteMetricsStore& operator=(const SqliteMetricsStore&) = delete;

    // Open or create the database and its schema.
    static std::optional<SqliteMetricsStore> open(const QString& dbPath);

    void record(const AdaptationMetricsRecord& record) override;

    // Newest first.
    std::vector<AdaptationMetricsRecord> recentRecords(int limit) const;
    int64_t recordCount() const;

private:
    SqliteMetricsStore() = default;
    bool init(const QString& dbPath);
    bool execSql(const char* sql);

    mutable std::mutex m_mutex;
    sqlite3* m_db = nullptr;
};

} // namespace ak
