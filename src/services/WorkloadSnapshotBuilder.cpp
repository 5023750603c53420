#include "WorkloadSnapshotBuilder.h"
#include <algorithm>

std::vector<ReviewerWorkload> WorkloadSnapshotBuilder::buildSnapshot() {
    auto loads = directory_.listEligibleReviewersWithWorkload();
    auto latestHistory = directory_.latestHistoryRecord();

    std::vector<ActiveAssignment> assignments;
    if (latestHistory) {
        assignments = directory_.listActiveAssignments();
    }

    return computeWorkloads(loads, latestHistory.get(), assignments);
}

std::vector<ReviewerWorkload> WorkloadSnapshotBuilder::computeWorkloads(
    const std::vector<ReviewerLoad>& loads,
    const HistoryRecord* latestHistory,
    const std::vector<ActiveAssignment>& assignments) {

    std::vector<ReviewerWorkload> workloads;
    if (loads.empty()) {
        return workloads;
    }

    auto minLoad = std::min_element(loads.begin(), loads.end(),
        [](const ReviewerLoad& a, const ReviewerLoad& b) {
            return a.reviewer.backlog_pages < b.reviewer.backlog_pages;
        });
    int minBacklog = minLoad->reviewer.backlog_pages;

    // Only the most recent finisher can be flagged, and only while nobody
    // has picked up new work since it finished.
    std::string antiRepeatId;
    if (latestHistory && !hasStartedSince(assignments, latestHistory->ended_at)) {
        antiRepeatId = latestHistory->reviewer_id;
    }

    workloads.reserve(loads.size());
    for (const auto& load : loads) {
        const Reviewer& reviewer = load.reviewer;
        EffectiveStatus status = toEffectiveStatus(reviewer.status);
        if (!antiRepeatId.empty() && reviewer.id == antiRepeatId) {
            status = EffectiveStatus::ANTI_REPEAT;
        }

        workloads.emplace_back(
            reviewer.id,
            reviewer.name,
            reviewer.phone,
            reviewer.role,
            status,
            reviewer.backlog_pages - minBacklog,
            std::max(load.current_count, 0)
        );
    }

    std::stable_sort(workloads.begin(), workloads.end(),
        [](const ReviewerWorkload& a, const ReviewerWorkload& b) {
            if (a.current_count != b.current_count) {
                return a.current_count < b.current_count;
            }
            return a.backlog_differential < b.backlog_differential;
        });

    return workloads;
}

bool WorkloadSnapshotBuilder::hasStartedSince(const std::vector<ActiveAssignment>& assignments,
                                              std::chrono::system_clock::time_point since) {
    return std::any_of(assignments.begin(), assignments.end(),
        [since](const ActiveAssignment& assignment) {
            return !assignment.reviewer_id.empty() && assignment.started_at > since;
        });
}
