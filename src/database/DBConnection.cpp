#include "database/DBConnection.hpp"
#include "config/Config.hpp"
#include "logging/LogRegistry.hpp"
#include "util/files.hpp"

#include <pqxx/pqxx>

using namespace es::logging;

namespace es::database {

static std::string quoteConnValue(const std::string& value) {
    std::string out = "'";
    for (const char c : value) {
        if (c == '\'' || c == '\\') out.push_back('\\');
        out.push_back(c);
    }
    out.push_back('\'');
    return out;
}

static std::string readPassword(const std::filesystem::path& f) {
    std::string pass;
    try {
        pass = util::readFile(f);
    } catch (const std::system_error& e) {
        LogRegistry::db()->error("[DBConnection] Failed to read database password file {}: {}", f.string(), e.what());
        throw std::runtime_error("Database password file unreadable: " + f.string());
    }

    while (!pass.empty() && (pass.back() == '\n' || pass.back() == '\r' || pass.back() == ' ')) pass.pop_back();
    if (pass.empty()) throw std::runtime_error("Database password file is empty: " + f.string());
    return pass;
}

std::string connectionStringFor(const config::PostgresConfig& cfg) {
    return "host=" + quoteConnValue(cfg.host) +
           " port=" + std::to_string(cfg.port) +
           " dbname=" + quoteConnValue(cfg.name) +
           " user=" + quoteConnValue(cfg.user) +
           " password=" + quoteConnValue(readPassword(cfg.password_file));
}

DBConnection::DBConnection(std::string connectionString) : DB_CONNECTION_STR(std::move(connectionString)) {
    open();
}

DBConnection::~DBConnection() { if (conn_ && conn_->is_open()) conn_->close(); }

pqxx::connection& DBConnection::get() const { return *conn_; }

void DBConnection::open() {
    conn_ = std::make_unique<pqxx::connection>(DB_CONNECTION_STR);
    initSchema();
    initPrepared();
}

void DBConnection::reopenIfClosed() {
    if (conn_ && conn_->is_open()) return;
    LogRegistry::db()->warn("[DBConnection] Connection lost, reconnecting");
    open();
}

void DBConnection::initSchema() const {
    pqxx::nontransaction txn(*conn_);
    txn.exec(R"SQL(
        CREATE TABLE IF NOT EXISTS sync_jobs (
            job_id             TEXT PRIMARY KEY,
            resource_id        TEXT NOT NULL,
            source_path        TEXT NOT NULL,
            file_size          BIGINT NOT NULL CHECK (file_size > 0),
            chunk_size         BIGINT NOT NULL CHECK (chunk_size > 0),
            chunk_count        BIGINT NOT NULL CHECK (chunk_count > 0),
            chunks_done        TEXT NOT NULL DEFAULT '[]',
            status             TEXT NOT NULL,
            priority           INTEGER NOT NULL,
            created_at         BIGINT NOT NULL,
            updated_at         BIGINT NOT NULL,
            retry_count        INTEGER NOT NULL DEFAULT 0,
            error_message      TEXT,
            remote_transfer_id TEXT,
            metadata           TEXT NOT NULL DEFAULT '{}',
            next_attempt_at    BIGINT,
            cancelled          BOOLEAN NOT NULL DEFAULT FALSE
        )
    )SQL");
    txn.exec("CREATE INDEX IF NOT EXISTS idx_sync_jobs_schedule ON sync_jobs (status, priority, created_at, job_id)");
}

void DBConnection::initPrepared() const {
    if (!conn_ || !conn_->is_open()) throw std::runtime_error("Database connection is not open");

    initPreparedSyncJobs();
}

} // namespace es::database
