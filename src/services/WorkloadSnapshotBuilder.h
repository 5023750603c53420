#pragma once
#include <memory>
#include <vector>
#include "../database/ReviewerDirectory.h"
#include "../models/ReviewerWorkload.h"

class WorkloadSnapshotBuilder {
public:
    WorkloadSnapshotBuilder(ReviewerDirectory& directory) : directory_(directory) {}

    // Eligible reviewers ordered by (current_count, backlog_differential),
    // ties kept in directory order.
    std::vector<ReviewerWorkload> buildSnapshot();

    static std::vector<ReviewerWorkload> computeWorkloads(
        const std::vector<ReviewerLoad>& loads,
        const HistoryRecord* latestHistory,
        const std::vector<ActiveAssignment>& assignments);

private:
    ReviewerDirectory& directory_;

    static bool hasStartedSince(const std::vector<ActiveAssignment>& assignments,
                                std::chrono::system_clock::time_point since);
};
