#ifndef POSTSCHED_DB_CONNECTION_HPP
#define POSTSCHED_DB_CONNECTION_HPP

#include <cstdint>
#include <string>
#include <memory>
#include <libpq-fe.h>

namespace postsched {

class DatabaseConnection {
public:
    DatabaseConnection(const std::string& host,
                      const std::string& port,
                      const std::string& dbname,
                      const std::string& user,
                      const std::string& password);
    ~DatabaseConnection();

    DatabaseConnection(const DatabaseConnection&) = delete;
    DatabaseConnection& operator=(const DatabaseConnection&) = delete;

    bool connect();
    void disconnect();
    bool isConnected() const;

    // Both return nullptr on failure; the caller owns (PQclear) a non-null result.
    PGresult* executeQuery(const std::string& query);
    PGresult* executePrepared(const std::string& stmt_name,
                              int n_params,
                              const char* const* param_values);

    bool prepareStatement(const std::string& stmt_name,
                          const std::string& query);

    bool begin();
    bool commit();
    void rollback();

    std::string getLastError() const;

    static int64_t getInt64(const PGresult* res, int row, int col);
    static std::string getString(const PGresult* res, int row, int col);

private:
    bool runCommand(const char* sql);
    void logError();

    std::string host_;
    std::string port_;
    std::string dbname_;
    std::string user_;
    std::string password_;
    PGconn* conn_;
};

} // namespace postsched

#endif // POSTSCHED_DB_CONNECTION_HPP
