#pragma once
#include <set>
#include <string>
#include <vector>
#include "WorkloadSnapshotBuilder.h"

// Picks the next reviewers to receive work. Selection is advisory: nothing
// is reserved, so callers must record the new assignment themselves and
// serialize select-then-assign if double booking matters.
class AssignmentSelector {
public:
    AssignmentSelector(WorkloadSnapshotBuilder& builder) : builder_(builder) {}

    std::vector<ReviewerWorkload> select(int count = 1,
                                         const std::set<std::string>& excludes = {},
                                         bool urgent = false,
                                         bool hideBusy = true);
    std::vector<std::string> selectIds(int count = 1,
                                       const std::set<std::string>& excludes = {},
                                       bool urgent = false,
                                       bool hideBusy = true);

    // Pipeline stages, applied by select() in this order.
    static std::vector<ReviewerWorkload> excludeReviewers(std::vector<ReviewerWorkload> workloads,
                                                          const std::set<std::string>& excludes);
    static std::vector<ReviewerWorkload> boostIdle(std::vector<ReviewerWorkload> workloads);
    static std::vector<ReviewerWorkload> hideBusyReviewers(std::vector<ReviewerWorkload> workloads);
    static std::vector<ReviewerWorkload> truncate(std::vector<ReviewerWorkload> workloads, int count);

private:
    WorkloadSnapshotBuilder& builder_;
};
