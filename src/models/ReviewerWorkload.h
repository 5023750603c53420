#pragma once
#include <string>
#include "Reviewer.h"

// Status as seen by the selection policy. ANTI_REPEAT never gets stored.
enum class EffectiveStatus {
    ANTI_REPEAT = -1,
    IDLE = 0,
    BUSY = 1,
    VERY_BUSY = 2
};

struct ReviewerWorkload {
    std::string id;
    std::string name;
    std::string phone;
    ReviewerRole role;
    EffectiveStatus effective_status;
    int backlog_differential;
    int current_count;

    ReviewerWorkload(const std::string& id, const std::string& name, const std::string& phone,
                     ReviewerRole role, EffectiveStatus effective_status,
                     int backlog_differential, int current_count)
        : id(id), name(name), phone(phone), role(role), effective_status(effective_status),
          backlog_differential(backlog_differential), current_count(current_count) {}

    bool isIdle() const { return effective_status == EffectiveStatus::IDLE; }
};

// Pre-joined directory row: a reviewer with its active assignment count.
struct ReviewerLoad {
    Reviewer reviewer;
    int current_count;

    ReviewerLoad(const Reviewer& reviewer, int current_count)
        : reviewer(reviewer), current_count(current_count) {}
};

EffectiveStatus toEffectiveStatus(ReviewerStatus status);
std::string effectiveStatusToString(EffectiveStatus status);
