#include "../../include/database/db_connection.hpp"
#include "../../include/utils/logger.hpp"
#include <cctype>
#include <cstdlib>
#include <cstring>
#include <vector>

namespace postsched {

DatabaseConnection::DatabaseConnection(const std::string& host,
                                     const std::string& port,
                                     const std::string& dbname,
                                     const std::string& user,
                                     const std::string& password)
    : host_(host), port_(port), dbname_(dbname), user_(user), password_(password), conn_(nullptr) {
}

DatabaseConnection::~DatabaseConnection() {
    disconnect();
}

bool DatabaseConnection::connect() {
    std::string conninfo = "host=" + host_ +
                          " port=" + port_ +
                          " dbname=" + dbname_ +
                          " user=" + user_ +
                          " password=" + password_;

    conn_ = PQconnectdb(conninfo.c_str());

    if (PQstatus(conn_) != CONNECTION_OK) {
        logError();
        return false;
    }

    Logger::getInstance().info("Connected to PostgreSQL database " + dbname_ + " at " + host_ + ":" + port_);
    return true;
}

void DatabaseConnection::disconnect() {
    if (conn_) {
        PQfinish(conn_);
        conn_ = nullptr;
    }
}

bool DatabaseConnection::isConnected() const {
    return conn_ != nullptr && PQstatus(conn_) == CONNECTION_OK;
}

PGresult* DatabaseConnection::executeQuery(const std::string& query) {
    if (!isConnected()) {
        Logger::getInstance().error("Database not connected");
        return nullptr;
    }

    PGresult* res = PQexec(conn_, query.c_str());

    if (PQresultStatus(res) != PGRES_COMMAND_OK && PQresultStatus(res) != PGRES_TUPLES_OK) {
        logError();
        PQclear(res);
        return nullptr;
    }

    return res;
}

PGresult* DatabaseConnection::executePrepared(const std::string& stmt_name,
                                             int n_params,
                                             const char* const* param_values) {
    if (!isConnected()) {
        Logger::getInstance().error("Database not connected");
        return nullptr;
    }

    std::vector<int> param_lengths(static_cast<size_t>(n_params));
    std::vector<int> param_formats(static_cast<size_t>(n_params), 0);  // text format
    for (int i = 0; i < n_params; i++) {
        // -1 marks a NULL parameter
        param_lengths[i] = param_values[i] ? static_cast<int>(std::strlen(param_values[i])) : -1;
    }

    PGresult* res = PQexecPrepared(conn_, stmt_name.c_str(), n_params, param_values,
                                   param_lengths.data(), param_formats.data(), 0);

    if (PQresultStatus(res) != PGRES_COMMAND_OK && PQresultStatus(res) != PGRES_TUPLES_OK) {
        std::string error_msg = PQresultErrorMessage(res) ? PQresultErrorMessage(res) : "Unknown error";
        Logger::getInstance().error("PostgreSQL prepared statement error (" + stmt_name + "): " + error_msg);
        PQclear(res);
        return nullptr;
    }

    return res;
}

bool DatabaseConnection::prepareStatement(const std::string& stmt_name, const std::string& query) {
    if (!isConnected()) {
        Logger::getInstance().error("Database not connected");
        return false;
    }

    // Highest $N placeholder is the parameter count.
    int param_count = 0;
    size_t pos = 0;
    while ((pos = query.find('$', pos)) != std::string::npos) {
        pos++;
        if (pos < query.length() && std::isdigit(static_cast<unsigned char>(query[pos]))) {
            int num = 0;
            while (pos < query.length() && std::isdigit(static_cast<unsigned char>(query[pos]))) {
                num = num * 10 + (query[pos] - '0');
                pos++;
            }
            if (num > param_count) param_count = num;
        }
    }

    PGresult* res = PQprepare(conn_, stmt_name.c_str(), query.c_str(), param_count, nullptr);
    const bool ok = PQresultStatus(res) == PGRES_COMMAND_OK;
    if (!ok) {
        Logger::getInstance().error("Failed to prepare statement '" + stmt_name + "' with " +
                                    std::to_string(param_count) + " params: " + PQerrorMessage(conn_));
    } else {
        Logger::getInstance().debug("Prepared statement '" + stmt_name + "' (" + std::to_string(param_count) + " params)");
    }
    PQclear(res);
    return ok;
}

bool DatabaseConnection::runCommand(const char* sql) {
    PGresult* res = executeQuery(sql);
    if (!res) return false;
    PQclear(res);
    return true;
}

bool DatabaseConnection::begin() {
    return runCommand("BEGIN");
}

bool DatabaseConnection::commit() {
    if (runCommand("COMMIT")) return true;
    rollback();
    return false;
}

void DatabaseConnection::rollback() {
    if (!runCommand("ROLLBACK")) {
        Logger::getInstance().warning("ROLLBACK failed: " + getLastError());
    }
}

std::string DatabaseConnection::getLastError() const {
    if (conn_) {
        return PQerrorMessage(conn_);
    }
    return "No connection";
}

int64_t DatabaseConnection::getInt64(const PGresult* res, int row, int col) {
    if (PQgetisnull(res, row, col)) return 0;
    return std::strtoll(PQgetvalue(res, row, col), nullptr, 10);
}

std::string DatabaseConnection::getString(const PGresult* res, int row, int col) {
    if (PQgetisnull(res, row, col)) return "";
    return PQgetvalue(res, row, col);
}

void DatabaseConnection::logError() {
    if (conn_) {
        Logger::getInstance().error("PostgreSQL error: " + std::string(PQerrorMessage(conn_)));
    }
}

} // namespace postsched
