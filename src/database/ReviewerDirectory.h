#pragma once
#include <chrono>
#include <memory>
#include <string>
#include <vector>
#include "../models/Reviewer.h"
#include "../models/ReviewerWorkload.h"

// Read/write contract of the reviewer store. Implementations report
// failures by throwing StorageError.
class ReviewerDirectory {
public:
    virtual ~ReviewerDirectory() = default;

    // Available reviewers with role REVIEWER, joined with their active
    // assignment counts, in the store's stable enumeration order.
    virtual std::vector<ReviewerLoad> listEligibleReviewersWithWorkload() = 0;
    // Record with the highest id, or nullptr when the history is empty.
    virtual std::unique_ptr<HistoryRecord> latestHistoryRecord() = 0;
    virtual std::vector<ActiveAssignment> listActiveAssignments() = 0;

    virtual std::unique_ptr<Reviewer> findReviewer(const std::string& reviewerId) = 0;
    virtual std::vector<Reviewer> searchReviewers(const ReviewerQuery& query) = 0;

    virtual bool updateStatus(const std::string& reviewerId, ReviewerStatus status,
                              std::chrono::system_clock::time_point changedAt) = 0;
    // Resets every non-idle status older than timeoutDays calendar days.
    virtual int bulkResetStatus(int timeoutDays, std::chrono::system_clock::time_point now) = 0;
};
