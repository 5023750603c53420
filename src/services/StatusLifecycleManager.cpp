#include "StatusLifecycleManager.h"
#include "../Errors.h"

void StatusLifecycleManager::setStatus(const std::string& reviewerId, ReviewerStatus status) {
    if (reviewerId.empty()) {
        throw ValidationError("reviewer id must not be empty");
    }
    if (!isValidStatus(status)) {
        throw ValidationError("invalid reviewer status: " + std::to_string(static_cast<int>(status)));
    }

    auto reviewer = directory_.findReviewer(reviewerId);
    if (!reviewer) {
        throw NotFoundError("Reviewer not found: " + reviewerId);
    }
    // Role is not checked: any available user may carry a status.
    if (!reviewer->available) {
        throw NotFoundError("Reviewer is not available: " + reviewerId);
    }

    if (!directory_.updateStatus(reviewerId, status, clock_())) {
        throw NotFoundError("Reviewer not found: " + reviewerId);
    }
}

int StatusLifecycleManager::resetStaleStatus(int timeoutDays) {
    if (timeoutDays < 0) {
        throw ValidationError("timeoutDays must not be negative: " + std::to_string(timeoutDays));
    }
    return directory_.bulkResetStatus(timeoutDays, clock_());
}
