#include "Reviewer.h"
#include "ReviewerWorkload.h"
#include "../Errors.h"

ReviewerStatus statusFromInt(int value) {
    switch (value) {
        case 0: return ReviewerStatus::IDLE;
        case 1: return ReviewerStatus::BUSY;
        case 2: return ReviewerStatus::VERY_BUSY;
    }
    throw ValidationError("invalid reviewer status: " + std::to_string(value));
}

ReviewerRole roleFromInt(int value) {
    return value == 1 ? ReviewerRole::REVIEWER : ReviewerRole::ORDINARY;
}

bool isValidStatus(ReviewerStatus status) {
    int value = static_cast<int>(status);
    return value >= 0 && value <= 2;
}

std::string statusToString(ReviewerStatus status) {
    switch (status) {
        case ReviewerStatus::IDLE: return "IDLE";
        case ReviewerStatus::BUSY: return "BUSY";
        case ReviewerStatus::VERY_BUSY: return "VERY_BUSY";
    }
    return "UNKNOWN";
}

std::string Reviewer::getStatusString() const {
    return statusToString(status);
}

EffectiveStatus toEffectiveStatus(ReviewerStatus status) {
    return static_cast<EffectiveStatus>(static_cast<int>(status));
}

std::string effectiveStatusToString(EffectiveStatus status) {
    if (status == EffectiveStatus::ANTI_REPEAT) {
        return "ANTI_REPEAT";
    }
    return statusToString(static_cast<ReviewerStatus>(static_cast<int>(status)));
}
