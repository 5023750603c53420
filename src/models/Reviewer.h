#pragma once
#include <string>
#include <chrono>

enum class ReviewerRole {
    ORDINARY = 0,
    REVIEWER = 1
};

enum class ReviewerStatus {
    IDLE = 0,
    BUSY = 1,
    VERY_BUSY = 2
};

struct Reviewer {
    std::string id;
    std::string name;
    std::string phone;
    ReviewerRole role;
    bool available;
    ReviewerStatus status;
    std::chrono::system_clock::time_point status_since;
    int backlog_pages;

    Reviewer(const std::string& id, const std::string& name, const std::string& phone,
             ReviewerRole role = ReviewerRole::REVIEWER, bool available = true,
             ReviewerStatus status = ReviewerStatus::IDLE, int backlog_pages = 0)
        : id(id), name(name), phone(phone), role(role), available(available),
          status(status), status_since(std::chrono::system_clock::now()),
          backlog_pages(backlog_pages) {}

    bool isEligible() const { return available && role == ReviewerRole::REVIEWER; }

    std::string getStatusString() const;
};

struct ActiveAssignment {
    std::string reviewer_id;
    std::chrono::system_clock::time_point started_at;

    ActiveAssignment(const std::string& reviewer_id,
                     std::chrono::system_clock::time_point started_at)
        : reviewer_id(reviewer_id), started_at(started_at) {}
};

struct HistoryRecord {
    long long id;
    std::string reviewer_id;
    std::chrono::system_clock::time_point ended_at;

    HistoryRecord(long long id, const std::string& reviewer_id,
                  std::chrono::system_clock::time_point ended_at)
        : id(id), reviewer_id(reviewer_id), ended_at(ended_at) {}
};

// Fuzzy lookup filter. Empty fragments match everything.
struct ReviewerQuery {
    std::string id;
    std::string name;
    std::string phone;
    bool only_reviewers = false;
};

// Throws ValidationError for values outside {0, 1, 2}.
ReviewerStatus statusFromInt(int value);
ReviewerRole roleFromInt(int value);
bool isValidStatus(ReviewerStatus status);
std::string statusToString(ReviewerStatus status);
