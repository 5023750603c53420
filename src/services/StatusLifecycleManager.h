#pragma once
#include <chrono>
#include <functional>
#include <string>
#include <utility>
#include "../database/ReviewerDirectory.h"

class StatusLifecycleManager {
public:
    using Clock = std::function<std::chrono::system_clock::time_point()>;

    StatusLifecycleManager(ReviewerDirectory& directory,
                           Clock clock = std::chrono::system_clock::now)
        : directory_(directory), clock_(std::move(clock)) {}

    void setStatus(const std::string& reviewerId, ReviewerStatus status);
    // Lease-expiry sweep: statuses left non-idle for at least timeoutDays
    // calendar days fall back to IDLE. Returns the number of reviewers reset.
    int resetStaleStatus(int timeoutDays);

private:
    ReviewerDirectory& directory_;
    Clock clock_;
};
