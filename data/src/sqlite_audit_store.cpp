#include "sqlite_audit_store.hpp"
#include "logging.hpp"
#include "utils.hpp"

namespace data
{

    SqliteAuditStore::SqliteAuditStore(const std::string &db_path)
        : database_path_(db_path), db_(nullptr), connected_(false)
    {
        core::logging::getLogger()->debug("SqliteAuditStore created for path: {}", db_path);
    }

    SqliteAuditStore::~SqliteAuditStore()
    {
        disconnect();
    }

    bool SqliteAuditStore::connect()
    {
        std::lock_guard<std::mutex> lock(db_mutex_);
        if (connected_)
        {
            core::logging::getLogger()->warn("Already connected to audit database {}.", database_path_);
            return true;
        }

        core::logging::getLogger()->info("Connecting to audit database: {}", database_path_);
        int rc = sqlite3_open_v2(database_path_.c_str(), &db_,
                                 SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_NOMUTEX,
                                 nullptr);
        if (rc != SQLITE_OK)
        {
            core::logging::getLogger()->error("Cannot open audit database '{}': {}", database_path_, sqlite3_errmsg(db_));
            sqlite3_close(db_); // Close handle even if open failed (as per docs)
            db_ = nullptr;
            return false;
        }

        sqlite3_busy_timeout(db_, 5000);
        connected_ = true;
        core::logging::getLogger()->info("Connected to audit database: {}", database_path_);
        return true;
    }

    void SqliteAuditStore::disconnect()
    {
        std::lock_guard<std::mutex> lock(db_mutex_);
        if (!connected_)
        {
            return;
        }
        core::logging::getLogger()->info("Disconnecting from audit database: {}", database_path_);
        int rc = sqlite3_close(db_);
        if (rc != SQLITE_OK)
        {
            // Usually a statement that was never finalized
            core::logging::getLogger()->error("Error disconnecting from audit database: {}", sqlite3_errmsg(db_));
        }
        db_ = nullptr;
        connected_ = false;
    }

    bool SqliteAuditStore::isConnected() const
    {
        return connected_ && (db_ != nullptr);
    }

    bool SqliteAuditStore::executeSQL(const std::string &sql)
    {
        if (!isConnected())
        {
            core::logging::getLogger()->error("Cannot execute SQL: Not connected to audit database.");
            return false;
        }

        char *error_msg = nullptr;
        int rc = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &error_msg);
        if (rc != SQLITE_OK)
        {
            core::logging::getLogger()->error("SQL error: {}", error_msg ? error_msg : "unknown");
            sqlite3_free(error_msg);
            return false;
        }
        core::logging::getLogger()->trace("SQL executed successfully: {}", sql);
        return true;
    }

    bool SqliteAuditStore::initializeSchema()
    {
        std::lock_guard<std::mutex> lock(db_mutex_);
        if (!isConnected())
        {
            core::logging::getLogger()->error("Cannot initialize schema: Not connected to audit database.");
            return false;
        }

        const std::string create_events_sql = R"(
        CREATE TABLE IF NOT EXISTS audit_events (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            ts TEXT NOT NULL,          -- IST ISO8601
            ts_epoch_ms INTEGER NOT NULL,
            type TEXT NOT NULL,
            instrument_key TEXT,
            payload TEXT               -- JSON
        );
    )";
        const std::string create_events_index_sql = R"(
        CREATE INDEX IF NOT EXISTS idx_audit_type_ts
        ON audit_events (type, ts_epoch_ms);
     )";

        bool success = true;
        success &= executeSQL(create_events_sql);
        success &= executeSQL(create_events_index_sql);

        if (success)
        {
            core::logging::getLogger()->info("Audit database schema initialization check complete.");
        }
        else
        {
            core::logging::getLogger()->error("Audit database schema initialization failed for one or more statements.");
        }
        return success;
    }

    bool SqliteAuditStore::write(const std::vector<audit::AuditEvent> &batch)
    {
        auto logger = core::logging::getLogger();
        std::lock_guard<std::mutex> lock(db_mutex_);
        if (!isConnected())
        {
            logger->error("Cannot write audit events: Not connected to audit database.");
            return false;
        }
        if (batch.empty())
        {
            return true;
        }

        const char *sql = R"(
            INSERT INTO audit_events (ts, ts_epoch_ms, type, instrument_key, payload)
            VALUES (?, ?, ?, ?, ?);
        )";

        sqlite3_stmt *stmt = nullptr;
        int rc = sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr);
        if (rc != SQLITE_OK)
        {
            logger->error("Failed to prepare audit INSERT statement [{}]: {}", rc, sqlite3_errmsg(db_));
            sqlite3_finalize(stmt);
            return false;
        }

        if (!executeSQL("BEGIN TRANSACTION;"))
        {
            logger->error("Failed to begin transaction for audit batch.");
            sqlite3_finalize(stmt);
            return false;
        }

        bool success = true;
        for (const auto &event : batch)
        {
            std::string ts_str = core::utils::timestampToString(event.timestamp);
            std::string type_str = audit::auditEventTypeToString(event.type);
            std::string payload_str = event.payload.dump();

            sqlite3_bind_text(stmt, 1, ts_str.c_str(), -1, SQLITE_TRANSIENT);
            sqlite3_bind_int64(stmt, 2, core::utils::toEpochMillis(event.timestamp));
            sqlite3_bind_text(stmt, 3, type_str.c_str(), -1, SQLITE_TRANSIENT);
            if (event.instrument_key.empty())
            {
                sqlite3_bind_null(stmt, 4);
            }
            else
            {
                sqlite3_bind_text(stmt, 4, event.instrument_key.c_str(), -1, SQLITE_TRANSIENT);
            }
            sqlite3_bind_text(stmt, 5, payload_str.c_str(), -1, SQLITE_TRANSIENT);

            rc = sqlite3_step(stmt);
            if (rc != SQLITE_DONE)
            {
                logger->error("Failed to execute audit insert step [{}]: {}", rc, sqlite3_errmsg(db_));
                success = false;
                break;
            }
            rc = sqlite3_reset(stmt);
            if (rc != SQLITE_OK)
            {
                logger->error("Failed to reset prepared statement [{}]: {}", rc, sqlite3_errmsg(db_));
                success = false;
                break;
            }
        }

        // Finalize the statement BEFORE commit/rollback
        sqlite3_finalize(stmt);

        const std::string final_sql = success ? "COMMIT;" : "ROLLBACK;";
        if (!executeSQL(final_sql))
        {
            logger->error("Failed to {} audit transaction.", success ? "COMMIT" : "ROLLBACK");
            if (success)
            {
                executeSQL("ROLLBACK;");
            }
            return false;
        }
        if (success)
        {
            logger->trace("Wrote {} audit events.", batch.size());
        }
        else
        {
            logger->warn("Audit batch of {} events rolled back.", batch.size());
        }
        return success;
    }

    std::vector<SqliteAuditStore::StoredEvent> SqliteAuditStore::queryEvents(const std::string &type, int limit)
    {
        std::vector<StoredEvent> events;
        auto logger = core::logging::getLogger();
        std::lock_guard<std::mutex> lock(db_mutex_);
        if (!isConnected())
        {
            logger->error("Cannot query audit events: Not connected to database.");
            return events;
        }

        const char *sql = R"(
            SELECT id, ts, type, instrument_key, payload
            FROM audit_events
            WHERE (?1 = '' OR type = ?1)
            ORDER BY id DESC
            LIMIT ?2;
        )";

        sqlite3_stmt *stmt = nullptr;
        int rc = sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr);
        if (rc != SQLITE_OK)
        {
            logger->error("Failed to prepare audit query [{}]: {}", rc, sqlite3_errmsg(db_));
            sqlite3_finalize(stmt);
            return events;
        }
        sqlite3_bind_text(stmt, 1, type.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_int(stmt, 2, limit);

        auto column_text = [stmt](int col) {
            const unsigned char *text = sqlite3_column_text(stmt, col);
            return text ? std::string(reinterpret_cast<const char *>(text)) : std::string();
        };

        while ((rc = sqlite3_step(stmt)) == SQLITE_ROW)
        {
            StoredEvent event;
            event.id = sqlite3_column_int64(stmt, 0);
            event.timestamp = column_text(1);
            event.type = column_text(2);
            event.instrument_key = column_text(3);
            event.payload = column_text(4);
            events.push_back(std::move(event));
        }
        if (rc != SQLITE_DONE)
        {
            logger->error("Error stepping through audit query results [{}]: {}", rc, sqlite3_errmsg(db_));
        }
        sqlite3_finalize(stmt);
        return events;
    }

    long long SqliteAuditStore::countEvents(const std::string &type)
    {
        auto logger = core::logging::getLogger();
        std::lock_guard<std::mutex> lock(db_mutex_);
        if (!isConnected())
        {
            logger->error("Cannot count audit events: Not connected to database.");
            return -1;
        }

        const char *sql = "SELECT COUNT(*) FROM audit_events WHERE (?1 = '' OR type = ?1);";
        sqlite3_stmt *stmt = nullptr;
        int rc = sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr);
        if (rc != SQLITE_OK)
        {
            logger->error("Failed to prepare audit count [{}]: {}", rc, sqlite3_errmsg(db_));
            sqlite3_finalize(stmt);
            return -1;
        }
        sqlite3_bind_text(stmt, 1, type.c_str(), -1, SQLITE_TRANSIENT);
        long long count = -1;
        if (sqlite3_step(stmt) == SQLITE_ROW)
        {
            count = sqlite3_column_int64(stmt, 0);
        }
        sqlite3_finalize(stmt);
        return count;
    }

} // namespace data
