#include "SqliteStore.hpp"
#include <iomanip>
#include <iostream>
#include <sstream>

namespace lanwatch::storage
{
    using common::Device;

    namespace
    {
        std::string EncodeTags(const MetricTags &tags)
        {
            std::string out;
            for (const auto &pair : tags)
            {
                if (!out.empty())
                    out += ';';
                out += pair.first + "=" + pair.second;
            }
            return out;
        }

        std::string EncodeFields(const MetricFields &fields)
        {
            std::ostringstream ss;
            ss << std::setprecision(17);
            bool first = true;
            for (const auto &pair : fields)
            {
                if (!first)
                    ss << ';';
                ss << pair.first << '=' << pair.second;
                first = false;
            }
            return ss.str();
        }

        std::vector<std::pair<std::string, std::string>> SplitPairs(const std::string &text)
        {
            std::vector<std::pair<std::string, std::string>> pairs;
            std::stringstream ss(text);
            std::string item;
            while (std::getline(ss, item, ';'))
            {
                auto eq = item.find('=');
                if (eq == std::string::npos)
                    continue;
                pairs.emplace_back(item.substr(0, eq), item.substr(eq + 1));
            }
            return pairs;
        }

        std::optional<std::string> ColumnText(sqlite3_stmt *stmt, int col)
        {
            if (sqlite3_column_type(stmt, col) == SQLITE_NULL)
                return std::nullopt;
            const char *text = reinterpret_cast<const char *>(sqlite3_column_text(stmt, col));
            if (!text)
                return std::nullopt;
            return std::string(text);
        }

        void BindOptional(sqlite3_stmt *stmt, int index, const std::optional<std::string> &value)
        {
            if (value)
                sqlite3_bind_text(stmt, index, value->c_str(), -1, SQLITE_TRANSIENT);
            else
                sqlite3_bind_null(stmt, index);
        }

        Device ReadDeviceRow(sqlite3_stmt *stmt)
        {
            Device d;
            d.id = ColumnText(stmt, 0).value_or("");
            d.ip = ColumnText(stmt, 1).value_or("");
            d.mac = ColumnText(stmt, 2);
            d.hostname = ColumnText(stmt, 3);
            d.vendor = ColumnText(stmt, 4);
            d.device_class = ColumnText(stmt, 5);
            d.status = common::StatusFromString(ColumnText(stmt, 6).value_or("unknown"));
            d.first_seen = common::FromUnixMillis(sqlite3_column_int64(stmt, 7));
            d.last_seen = common::FromUnixMillis(sqlite3_column_int64(stmt, 8));
            d.tags = common::SplitTags(ColumnText(stmt, 9).value_or(""));
            return d;
        }

        const char *DEVICE_COLUMNS =
            "id, ip, mac, hostname, vendor, device_class, status, first_seen, last_seen, tags";
    }

    SqliteStore::SqliteStore()
        : db_(nullptr), stmt_upsert_device_(nullptr), stmt_get_device_(nullptr), stmt_insert_metric_(nullptr),
          stmt_update_status_(nullptr) {}

    SqliteStore::~SqliteStore()
    {
        Shutdown();
    }

    bool SqliteStore::Prepare(const char *sql, sqlite3_stmt **stmt)
    {
        if (sqlite3_prepare_v2(db_, sql, -1, stmt, nullptr) != SQLITE_OK)
        {
            std::cerr << "[DB] Prepare failed: " << sqlite3_errmsg(db_) << std::endl;
            return false;
        }
        return true;
    }

    bool SqliteStore::Initialize(const std::string &db_path)
    {
        std::lock_guard<std::mutex> lock(db_mutex_);

        if (sqlite3_open(db_path.c_str(), &db_) != SQLITE_OK)
        {
            std::cerr << "[DB] Open failed: " << sqlite3_errmsg(db_) << std::endl;
            sqlite3_close(db_);
            db_ = nullptr;
            return false;
        }

        sqlite3_exec(db_, "PRAGMA journal_mode=WAL;", nullptr, nullptr, nullptr);

        const char *sql_tables =
            "CREATE TABLE IF NOT EXISTS devices ("
            "id TEXT PRIMARY KEY, "
            "ip TEXT NOT NULL, "
            "mac TEXT, "
            "hostname TEXT, "
            "vendor TEXT, "
            "device_class TEXT, "
            "status TEXT NOT NULL DEFAULT 'unknown', "
            "first_seen INTEGER NOT NULL, "
            "last_seen INTEGER NOT NULL, "
            "tags TEXT NOT NULL DEFAULT ''"
            ");"

            "CREATE TABLE IF NOT EXISTS metrics ("
            "id INTEGER PRIMARY KEY AUTOINCREMENT, "
            "measurement TEXT NOT NULL, "
            "device_id TEXT, "
            "tags TEXT NOT NULL, "
            "fields TEXT NOT NULL, "
            "ts INTEGER NOT NULL"
            ");"

            "CREATE INDEX IF NOT EXISTS idx_metrics_device ON metrics (measurement, device_id, ts);";

        char *err_msg = nullptr;
        if (sqlite3_exec(db_, sql_tables, nullptr, nullptr, &err_msg) != SQLITE_OK)
        {
            std::cerr << "[DB] Schema error: " << err_msg << std::endl;
            sqlite3_free(err_msg);
            return false;
        }

        const char *upsert_sql =
            "INSERT INTO devices (id, ip, mac, hostname, vendor, device_class, status, first_seen, last_seen, tags) "
            "VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?) "
            "ON CONFLICT(id) DO UPDATE SET "
            "ip = excluded.ip, "
            "mac = COALESCE(excluded.mac, devices.mac), "
            "hostname = COALESCE(excluded.hostname, devices.hostname), "
            "vendor = COALESCE(excluded.vendor, devices.vendor), "
            "device_class = COALESCE(excluded.device_class, devices.device_class), "
            "status = devices.status, "
            "first_seen = MIN(devices.first_seen, excluded.first_seen), "
            "last_seen = MAX(devices.last_seen, excluded.last_seen), "
            "tags = excluded.tags;"; // caller binds the union with the stored tags

        std::string get_sql = std::string("SELECT ") + DEVICE_COLUMNS + " FROM devices WHERE id = ?;";

        const char *metric_sql =
            "INSERT INTO metrics (measurement, device_id, tags, fields, ts) VALUES (?, ?, ?, ?, ?);";

        const char *status_sql =
            "UPDATE devices SET status = ?, last_seen = MAX(last_seen, COALESCE(?, last_seen)) WHERE id = ?;";

        return Prepare(upsert_sql, &stmt_upsert_device_) &&
               Prepare(get_sql.c_str(), &stmt_get_device_) &&
               Prepare(metric_sql, &stmt_insert_metric_) &&
               Prepare(status_sql, &stmt_update_status_);
    }

    void SqliteStore::Shutdown()
    {
        std::lock_guard<std::mutex> lock(db_mutex_);
        for (sqlite3_stmt **stmt : {&stmt_upsert_device_, &stmt_get_device_, &stmt_insert_metric_, &stmt_update_status_})
        {
            if (*stmt)
            {
                sqlite3_finalize(*stmt);
                *stmt = nullptr;
            }
        }
        if (db_)
        {
            sqlite3_close(db_);
            db_ = nullptr;
        }
    }

    std::optional<Device> SqliteStore::Get(const std::string &device_id)
    {
        std::lock_guard<std::mutex> lock(db_mutex_);
        if (!stmt_get_device_)
            return std::nullopt;

        sqlite3_reset(stmt_get_device_);
        sqlite3_clear_bindings(stmt_get_device_);
        sqlite3_bind_text(stmt_get_device_, 1, device_id.c_str(), -1, SQLITE_TRANSIENT);

        std::optional<Device> result = std::nullopt;
        if (sqlite3_step(stmt_get_device_) == SQLITE_ROW)
            result = ReadDeviceRow(stmt_get_device_);

        sqlite3_reset(stmt_get_device_);
        return result;
    }

    std::vector<Device> SqliteStore::List()
    {
        std::lock_guard<std::mutex> lock(db_mutex_);
        std::vector<Device> devices;
        if (!db_)
            return devices;

        std::string sql = std::string("SELECT ") + DEVICE_COLUMNS + " FROM devices ORDER BY id;";
        sqlite3_stmt *stmt;
        if (sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr) != SQLITE_OK)
            return devices;

        while (sqlite3_step(stmt) == SQLITE_ROW)
            devices.push_back(ReadDeviceRow(stmt));

        sqlite3_finalize(stmt);
        return devices;
    }

    bool SqliteStore::Upsert(const Device &device)
    {
        std::lock_guard<std::mutex> lock(db_mutex_);
        if (!stmt_upsert_device_)
            return false;

        sqlite3_stmt *stmt = stmt_upsert_device_;
        sqlite3_reset(stmt);
        sqlite3_clear_bindings(stmt);

        std::set<std::string> merged = StoredTags(device.id);
        merged.insert(device.tags.begin(), device.tags.end());
        std::string tags = common::JoinTags(merged);

        sqlite3_bind_text(stmt, 1, device.id.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_text(stmt, 2, device.ip.c_str(), -1, SQLITE_TRANSIENT);
        BindOptional(stmt, 3, device.mac);
        BindOptional(stmt, 4, device.hostname);
        BindOptional(stmt, 5, device.vendor);
        BindOptional(stmt, 6, device.device_class);
        sqlite3_bind_text(stmt, 7, common::StatusToString(device.status), -1, SQLITE_STATIC);
        sqlite3_bind_int64(stmt, 8, common::ToUnixMillis(device.first_seen));
        sqlite3_bind_int64(stmt, 9, common::ToUnixMillis(device.last_seen));
        sqlite3_bind_text(stmt, 10, tags.c_str(), -1, SQLITE_TRANSIENT);

        bool success = (sqlite3_step(stmt) == SQLITE_DONE);
        if (!success)
            std::cerr << "[DB] Upsert failed for " << device.id << ": " << sqlite3_errmsg(db_) << std::endl;

        sqlite3_reset(stmt);
        return success;
    }

    std::set<std::string> SqliteStore::StoredTags(const std::string &device_id)
    {
        std::set<std::string> tags;
        sqlite3_reset(stmt_get_device_);
        sqlite3_clear_bindings(stmt_get_device_);
        sqlite3_bind_text(stmt_get_device_, 1, device_id.c_str(), -1, SQLITE_TRANSIENT);
        if (sqlite3_step(stmt_get_device_) == SQLITE_ROW)
            tags = ReadDeviceRow(stmt_get_device_).tags;
        sqlite3_reset(stmt_get_device_);
        return tags;
    }

    bool SqliteStore::UpdateStatus(const std::string &device_id,
                                   common::DeviceStatus status,
                                   std::optional<common::Timestamp> last_seen)
    {
        std::lock_guard<std::mutex> lock(db_mutex_);
        if (!stmt_update_status_)
            return false;

        sqlite3_stmt *stmt = stmt_update_status_;
        sqlite3_reset(stmt);
        sqlite3_clear_bindings(stmt);

        sqlite3_bind_text(stmt, 1, common::StatusToString(status), -1, SQLITE_STATIC);
        if (last_seen)
            sqlite3_bind_int64(stmt, 2, common::ToUnixMillis(*last_seen));
        else
            sqlite3_bind_null(stmt, 2);
        sqlite3_bind_text(stmt, 3, device_id.c_str(), -1, SQLITE_TRANSIENT);

        bool success = (sqlite3_step(stmt) == SQLITE_DONE);
        if (!success)
            std::cerr << "[DB] Status update failed for " << device_id << ": " << sqlite3_errmsg(db_) << std::endl;
        bool updated = success && sqlite3_changes(db_) > 0;

        sqlite3_reset(stmt);
        return updated;
    }

    bool SqliteStore::Write(const std::string &measurement,
                            const MetricTags &tags,
                            const MetricFields &fields,
                            common::Timestamp ts)
    {
        std::lock_guard<std::mutex> lock(db_mutex_);
        if (!stmt_insert_metric_)
            return false;

        sqlite3_stmt *stmt = stmt_insert_metric_;
        sqlite3_reset(stmt);
        sqlite3_clear_bindings(stmt);

        std::string tag_text = EncodeTags(tags);
        std::string field_text = EncodeFields(fields);

        sqlite3_bind_text(stmt, 1, measurement.c_str(), -1, SQLITE_TRANSIENT);
        auto device_it = tags.find("device_id");
        if (device_it != tags.end())
            sqlite3_bind_text(stmt, 2, device_it->second.c_str(), -1, SQLITE_TRANSIENT);
        else
            sqlite3_bind_null(stmt, 2);
        sqlite3_bind_text(stmt, 3, tag_text.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_text(stmt, 4, field_text.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_int64(stmt, 5, common::ToUnixMillis(ts));

        bool success = (sqlite3_step(stmt) == SQLITE_DONE);
        sqlite3_reset(stmt);
        return success;
    }

    std::vector<MetricPoint> SqliteStore::RecentMetrics(const std::string &measurement, const std::string &device_id, int limit)
    {
        std::lock_guard<std::mutex> lock(db_mutex_);
        std::vector<MetricPoint> points;
        if (!db_)
            return points;

        const char *sql =
            "SELECT measurement, tags, fields, ts FROM metrics "
            "WHERE measurement = ? AND device_id = ? "
            "ORDER BY ts DESC, id DESC LIMIT ?;";

        sqlite3_stmt *stmt;
        if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK)
            return points;

        sqlite3_bind_text(stmt, 1, measurement.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_text(stmt, 2, device_id.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_int(stmt, 3, limit);

        while (sqlite3_step(stmt) == SQLITE_ROW)
        {
            MetricPoint point;
            point.measurement = ColumnText(stmt, 0).value_or("");
            for (const auto &pair : SplitPairs(ColumnText(stmt, 1).value_or("")))
                point.tags[pair.first] = pair.second;
            for (const auto &pair : SplitPairs(ColumnText(stmt, 2).value_or("")))
            {
                try
                {
                    point.fields[pair.first] = std::stod(pair.second);
                }
                catch (const std::exception &)
                {
                    std::cerr << "[DB] Skipping malformed field '" << pair.first << "'\n";
                }
            }
            point.ts = common::FromUnixMillis(sqlite3_column_int64(stmt, 3));
            points.push_back(std::move(point));
        }

        sqlite3_finalize(stmt);
        return points;
    }
}
