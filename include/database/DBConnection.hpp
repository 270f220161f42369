#pragma once

#include <memory>
#include <string>
#include <pqxx/connection>

namespace es::config { struct PostgresConfig; }

namespace es::database {

class DBConnection {
  public:
    explicit DBConnection(std::string connectionString);
    ~DBConnection();

    DBConnection(const DBConnection&) = delete;
    DBConnection& operator=(const DBConnection&) = delete;

    [[nodiscard]] pqxx::connection& get() const;

    // A connection dropped by the server is replaced in place.
    void reopenIfClosed();

  private:
    std::string DB_CONNECTION_STR;
    std::unique_ptr<pqxx::connection> conn_;

    void open();
    void initSchema() const;
    void initPrepared() const;
    void initPreparedSyncJobs() const;
};

// "host=... port=... dbname=... user=... password=..." with the password read
// from the operator-managed file.
std::string connectionStringFor(const config::PostgresConfig& cfg);

} // namespace es::database
