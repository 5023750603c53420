#pragma once
#include <memory>
#include <string>
#include <vector>
#include <libpq-fe.h>
#include "ReviewerDirectory.h"

class PostgresDirectory : public ReviewerDirectory {
public:
    static PostgresDirectory& getInstance();

    bool connect(const std::string& connectionString);
    void disconnect();
    bool isConnected() const;
    void createSchema();

    std::vector<ReviewerLoad> listEligibleReviewersWithWorkload() override;
    std::unique_ptr<HistoryRecord> latestHistoryRecord() override;
    std::vector<ActiveAssignment> listActiveAssignments() override;

    std::unique_ptr<Reviewer> findReviewer(const std::string& reviewerId) override;
    std::vector<Reviewer> searchReviewers(const ReviewerQuery& query) override;

    bool updateStatus(const std::string& reviewerId, ReviewerStatus status,
                      std::chrono::system_clock::time_point changedAt) override;
    int bulkResetStatus(int timeoutDays, std::chrono::system_clock::time_point now) override;

    PostgresDirectory(const PostgresDirectory&) = delete;
    PostgresDirectory& operator=(const PostgresDirectory&) = delete;

private:
    PostgresDirectory() = default;
    PGconn* connection_ = nullptr;

    PGconn* requireConnection();
    PGresult* execute(const char* sql, const std::vector<std::string>& params, ExecStatusType expected);
};

// Row conversion. NULL or malformed values raise StorageError.
Reviewer reviewerFromRow(const PGresult* res, int row);
long long parseBigint(const char* value, const std::string& column);
int parseInt(const char* value, const std::string& column);

std::string timeToEpochMicros(const std::chrono::system_clock::time_point& time);
std::chrono::system_clock::time_point epochMicrosToTime(const char* value);
