#pragma once

#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>
#include <sqlite3.h>

#include "InventorySink.hpp"
#include "MetricsSink.hpp"

namespace lanwatch::storage
{
    struct MetricPoint
    {
        std::string measurement;
        MetricTags tags;
        MetricFields fields;
        common::Timestamp ts;
    };

    class SqliteStore : public InventorySink, public MetricsSink
    {
    private:
        sqlite3 *db_;
        std::mutex db_mutex_;

        sqlite3_stmt *stmt_upsert_device_;
        sqlite3_stmt *stmt_get_device_;
        sqlite3_stmt *stmt_insert_metric_;
        sqlite3_stmt *stmt_update_status_;

        bool Prepare(const char *sql, sqlite3_stmt **stmt);
        std::set<std::string> StoredTags(const std::string &device_id);

    public:
        SqliteStore();
        ~SqliteStore();

        SqliteStore(const SqliteStore &) = delete;
        SqliteStore &operator=(const SqliteStore &) = delete;

        // Opens (or creates) the database. Use ":memory:" for a private in-memory store.
        bool Initialize(const std::string &db_path);
        void Shutdown();

        std::optional<common::Device> Get(const std::string &device_id) override;
        std::vector<common::Device> List() override;
        bool Upsert(const common::Device &device) override;
        bool UpdateStatus(const std::string &device_id,
                          common::DeviceStatus status,
                          std::optional<common::Timestamp> last_seen) override;

        bool Write(const std::string &measurement,
                   const MetricTags &tags,
                   const MetricFields &fields,
                   common::Timestamp ts) override;

        std::vector<MetricPoint> RecentMetrics(const std::string &measurement, const std::string &device_id, int limit = 50);
    };
}
