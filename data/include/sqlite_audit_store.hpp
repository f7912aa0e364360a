#pragma once

#include <string>
#include <vector>
#include <mutex>

#include <sqlite3.h>

#include "audit_event.hpp"

namespace data {

// Persists audit batches into a local SQLite file (":memory:" works for tests)
class SqliteAuditStore : public audit::IAuditSink {
public:
    struct StoredEvent {
        long long id = 0;
        std::string timestamp; // IST ISO-8601, as written
        std::string type;
        std::string instrument_key;
        std::string payload;   // JSON text
    };

    explicit SqliteAuditStore(const std::string& db_path);
    ~SqliteAuditStore() override;

    SqliteAuditStore(const SqliteAuditStore&) = delete;
    SqliteAuditStore& operator=(const SqliteAuditStore&) = delete;

    bool connect();
    void disconnect();
    bool isConnected() const;

    bool initializeSchema();

    // One transaction per batch
    bool write(const std::vector<audit::AuditEvent>& batch) override;

    // Most recent first; empty type means all types
    std::vector<StoredEvent> queryEvents(const std::string& type = "", int limit = 100);
    long long countEvents(const std::string& type = "");

private:
    bool executeSQL(const std::string& sql);

    std::string database_path_;
    sqlite3* db_ = nullptr;
    bool connected_ = false;
    std::mutex db_mutex_; // Writer thread and status queries may overlap
};

} // namespace data
