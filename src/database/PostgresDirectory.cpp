#include "PostgresDirectory.h"
#include "../Errors.h"
#include <climits>
#include <iostream>

namespace {

const char* REVIEWER_COLUMNS =
    "u.id, u.name, u.phone, u.role, u.available, u.status, "
    "FLOOR(EXTRACT(EPOCH FROM u.status_since) * 1000000)::bigint, u.backlog_pages";

const char* SCHEMA_SQL =
    "CREATE TABLE IF NOT EXISTS reviewers ("
    "  id TEXT PRIMARY KEY,"
    "  name TEXT NOT NULL DEFAULT '',"
    "  phone TEXT NOT NULL DEFAULT '',"
    "  role SMALLINT NOT NULL DEFAULT 0,"
    "  available BOOLEAN NOT NULL DEFAULT true,"
    "  status SMALLINT NOT NULL DEFAULT 0 CHECK (status IN (0, 1, 2)),"
    "  status_since TIMESTAMPTZ NOT NULL DEFAULT CURRENT_TIMESTAMP,"
    "  backlog_pages INTEGER NOT NULL DEFAULT 0"
    ");"
    "CREATE TABLE IF NOT EXISTS active_assignments ("
    "  id BIGSERIAL PRIMARY KEY,"
    "  reviewer_id TEXT NOT NULL DEFAULT '',"
    "  started_at TIMESTAMPTZ NOT NULL DEFAULT CURRENT_TIMESTAMP"
    ");"
    "CREATE TABLE IF NOT EXISTS assignment_history ("
    "  id BIGSERIAL PRIMARY KEY,"
    "  reviewer_id TEXT NOT NULL,"
    "  ended_at TIMESTAMPTZ NOT NULL DEFAULT CURRENT_TIMESTAMP"
    ");";

std::string columnName(const PGresult* res, int column) {
    const char* name = PQfname(res, column);
    return name ? name : "column " + std::to_string(column);
}

const char* requireValue(const PGresult* res, int row, int column) {
    if (PQgetisnull(res, row, column)) {
        throw StorageError("Malformed row: " + columnName(res, column) + " is NULL");
    }
    return PQgetvalue(res, row, column);
}

long long columnBigint(const PGresult* res, int row, int column) {
    return parseBigint(requireValue(res, row, column), columnName(res, column));
}

int columnInt(const PGresult* res, int row, int column) {
    return parseInt(requireValue(res, row, column), columnName(res, column));
}

} // namespace

PostgresDirectory& PostgresDirectory::getInstance() {
    static PostgresDirectory instance;
    return instance;
}

bool PostgresDirectory::connect(const std::string& connectionString) {
    disconnect();
    connection_ = PQconnectdb(connectionString.c_str());
    if (PQstatus(connection_) != CONNECTION_OK) {
        std::cerr << "Database connection failed: " << PQerrorMessage(connection_) << std::endl;
        disconnect();
        return false;
    }
    std::cout << "Connected to PostgreSQL database" << std::endl;
    return true;
}

void PostgresDirectory::disconnect() {
    if (connection_) {
        PQfinish(connection_);
        connection_ = nullptr;
    }
}

bool PostgresDirectory::isConnected() const {
    return connection_ && PQstatus(connection_) == CONNECTION_OK;
}

PGconn* PostgresDirectory::requireConnection() {
    if (!isConnected()) {
        throw StorageError("Reviewer directory is not connected");
    }
    return connection_;
}

PGresult* PostgresDirectory::execute(const char* sql, const std::vector<std::string>& params,
                                     ExecStatusType expected) {
    PGconn* conn = requireConnection();

    std::vector<const char*> values;
    values.reserve(params.size());
    for (const auto& param : params) {
        values.push_back(param.c_str());
    }

    PGresult* res = PQexecParams(conn, sql, static_cast<int>(values.size()), nullptr,
                                 values.empty() ? nullptr : values.data(), nullptr, nullptr, 0);
    if (PQresultStatus(res) != expected) {
        std::string message = PQresultErrorMessage(res);
        if (message.empty()) {
            message = PQerrorMessage(conn);
        }
        PQclear(res);
        throw StorageError("Query failed: " + message);
    }
    return res;
}

void PostgresDirectory::createSchema() {
    PGresult* res = PQexec(requireConnection(), SCHEMA_SQL);
    if (PQresultStatus(res) != PGRES_COMMAND_OK) {
        std::string message = PQresultErrorMessage(res);
        PQclear(res);
        throw StorageError("Failed to create schema: " + message);
    }
    PQclear(res);
}

std::vector<ReviewerLoad> PostgresDirectory::listEligibleReviewersWithWorkload() {
    const std::string sql = std::string("SELECT ") + REVIEWER_COLUMNS + ", COALESCE(c.current, 0) "
        "FROM reviewers u LEFT JOIN ("
        "    SELECT reviewer_id, COUNT(1) AS current "
        "    FROM active_assignments GROUP BY reviewer_id"
        ") AS c ON u.id = c.reviewer_id "
        "WHERE u.available = true AND u.role = 1 "
        "ORDER BY u.id";

    PGresult* res = execute(sql.c_str(), {}, PGRES_TUPLES_OK);

    std::vector<ReviewerLoad> loads;
    try {
        for (int i = 0; i < PQntuples(res); i++) {
            loads.emplace_back(reviewerFromRow(res, i), columnInt(res, i, 8));
        }
    } catch (...) {
        PQclear(res);
        throw;
    }

    PQclear(res);
    return loads;
}

std::unique_ptr<HistoryRecord> PostgresDirectory::latestHistoryRecord() {
    PGresult* res = execute(
        "SELECT id, reviewer_id, FLOOR(EXTRACT(EPOCH FROM ended_at) * 1000000)::bigint "
        "FROM assignment_history ORDER BY id DESC LIMIT 1",
        {}, PGRES_TUPLES_OK);

    if (PQntuples(res) == 0) {
        PQclear(res);
        return nullptr;
    }

    std::unique_ptr<HistoryRecord> record;
    try {
        record = std::make_unique<HistoryRecord>(
            columnBigint(res, 0, 0),
            PQgetvalue(res, 0, 1),
            epochMicrosToTime(requireValue(res, 0, 2))
        );
    } catch (...) {
        PQclear(res);
        throw;
    }

    PQclear(res);
    return record;
}

std::vector<ActiveAssignment> PostgresDirectory::listActiveAssignments() {
    PGresult* res = execute(
        "SELECT reviewer_id, FLOOR(EXTRACT(EPOCH FROM started_at) * 1000000)::bigint "
        "FROM active_assignments ORDER BY id",
        {}, PGRES_TUPLES_OK);

    std::vector<ActiveAssignment> assignments;
    try {
        for (int i = 0; i < PQntuples(res); i++) {
            assignments.emplace_back(
                PQgetvalue(res, i, 0),
                epochMicrosToTime(requireValue(res, i, 1))
            );
        }
    } catch (...) {
        PQclear(res);
        throw;
    }

    PQclear(res);
    return assignments;
}

std::unique_ptr<Reviewer> PostgresDirectory::findReviewer(const std::string& reviewerId) {
    const std::string sql = std::string("SELECT ") + REVIEWER_COLUMNS +
        " FROM reviewers u WHERE u.id = $1";

    PGresult* res = execute(sql.c_str(), {reviewerId}, PGRES_TUPLES_OK);

    if (PQntuples(res) == 0) {
        PQclear(res);
        return nullptr;
    }

    std::unique_ptr<Reviewer> reviewer;
    try {
        reviewer = std::make_unique<Reviewer>(reviewerFromRow(res, 0));
    } catch (...) {
        PQclear(res);
        throw;
    }

    PQclear(res);
    return reviewer;
}

std::vector<Reviewer> PostgresDirectory::searchReviewers(const ReviewerQuery& query) {
    const std::string sql = std::string("SELECT ") + REVIEWER_COLUMNS +
        " FROM reviewers u "
        "WHERE u.available = true AND ($4::boolean = false OR u.role = 1) "
        "AND u.id LIKE '%' || $1 || '%' "
        "AND u.name LIKE '%' || $2 || '%' "
        "AND u.phone LIKE '%' || $3 || '%' "
        "ORDER BY u.id";

    PGresult* res = execute(sql.c_str(),
        {query.id, query.name, query.phone, query.only_reviewers ? "true" : "false"},
        PGRES_TUPLES_OK);

    std::vector<Reviewer> reviewers;
    try {
        for (int i = 0; i < PQntuples(res); i++) {
            reviewers.push_back(reviewerFromRow(res, i));
        }
    } catch (...) {
        PQclear(res);
        throw;
    }

    PQclear(res);
    return reviewers;
}

bool PostgresDirectory::updateStatus(const std::string& reviewerId, ReviewerStatus status,
                                     std::chrono::system_clock::time_point changedAt) {
    PGresult* res = execute(
        "UPDATE reviewers SET status = $1, status_since = to_timestamp($2::bigint / 1000000.0) "
        "WHERE id = $3",
        {std::to_string(static_cast<int>(status)), timeToEpochMicros(changedAt), reviewerId},
        PGRES_COMMAND_OK);

    bool updated = PQcmdTuples(res)[0] != '0';
    PQclear(res);
    return updated;
}

int PostgresDirectory::bulkResetStatus(int timeoutDays, std::chrono::system_clock::time_point now) {
    PGresult* res = execute(
        "UPDATE reviewers SET status = 0, status_since = to_timestamp($2::bigint / 1000000.0) "
        "WHERE status != 0 "
        "AND (to_timestamp($2::bigint / 1000000.0) AT TIME ZONE 'UTC')::date "
        "    - (status_since AT TIME ZONE 'UTC')::date >= $1::integer",
        {std::to_string(timeoutDays), timeToEpochMicros(now)},
        PGRES_COMMAND_OK);

    std::string affected = PQcmdTuples(res);
    PQclear(res);
    return parseInt(affected.c_str(), "affected row count");
}

std::string timeToEpochMicros(const std::chrono::system_clock::time_point& time) {
    auto micros = std::chrono::duration_cast<std::chrono::microseconds>(time.time_since_epoch());
    return std::to_string(micros.count());
}

Reviewer reviewerFromRow(const PGresult* res, int row) {
    std::string id = PQgetvalue(res, row, 0);
    int status = columnInt(res, row, 5);
    if (status < 0 || status > 2) {
        throw StorageError("Malformed row: reviewer " + id + " has invalid stored status " +
                           std::to_string(status));
    }

    std::string available = requireValue(res, row, 4);
    if (available != "t" && available != "f") {
        throw StorageError("Malformed row: reviewer " + id + " has invalid available flag '" +
                           available + "'");
    }

    Reviewer reviewer(
        id,
        PQgetvalue(res, row, 1),
        PQgetvalue(res, row, 2),
        roleFromInt(columnInt(res, row, 3)),
        available == "t",
        static_cast<ReviewerStatus>(status),
        columnInt(res, row, 7)
    );
    reviewer.status_since = epochMicrosToTime(requireValue(res, row, 6));
    return reviewer;
}

long long parseBigint(const char* value, const std::string& column) {
    std::string text = value ? value : "";
    size_t parsed = 0;
    long long result = 0;
    try {
        result = std::stoll(text, &parsed);
    } catch (const std::exception&) {
        throw StorageError("Malformed row: " + column + " is not an integer: '" + text + "'");
    }
    if (parsed != text.size()) {
        throw StorageError("Malformed row: " + column + " is not an integer: '" + text + "'");
    }
    return result;
}

int parseInt(const char* value, const std::string& column) {
    long long result = parseBigint(value, column);
    if (result < INT_MIN || result > INT_MAX) {
        throw StorageError("Malformed row: " + column + " is out of range: " + std::to_string(result));
    }
    return static_cast<int>(result);
}

std::chrono::system_clock::time_point epochMicrosToTime(const char* value) {
    std::chrono::microseconds micros(parseBigint(value, "timestamp"));
    return std::chrono::system_clock::time_point(
        std::chrono::duration_cast<std::chrono::system_clock::duration>(micros));
}
