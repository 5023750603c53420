#include "AssignmentSelector.h"
#include "../Errors.h"
#include <algorithm>
#include <utility>

std::vector<ReviewerWorkload> AssignmentSelector::select(
    int count, const std::set<std::string>& excludes, bool urgent, bool hideBusy) {

    if (count < 0) {
        throw ValidationError("count must not be negative: " + std::to_string(count));
    }
    if (count == 0) {
        return {};
    }

    auto workloads = excludeReviewers(builder_.buildSnapshot(), excludes);
    if (urgent) {
        workloads = boostIdle(std::move(workloads));
    }
    if (hideBusy) {
        workloads = hideBusyReviewers(std::move(workloads));
    }
    return truncate(std::move(workloads), count);
}

std::vector<std::string> AssignmentSelector::selectIds(
    int count, const std::set<std::string>& excludes, bool urgent, bool hideBusy) {

    std::vector<std::string> ids;
    for (const auto& workload : select(count, excludes, urgent, hideBusy)) {
        ids.push_back(workload.id);
    }
    return ids;
}

std::vector<ReviewerWorkload> AssignmentSelector::excludeReviewers(
    std::vector<ReviewerWorkload> workloads, const std::set<std::string>& excludes) {

    if (excludes.empty()) {
        return workloads;
    }
    workloads.erase(std::remove_if(workloads.begin(), workloads.end(),
        [&excludes](const ReviewerWorkload& workload) {
            return excludes.count(workload.id) > 0;
        }), workloads.end());
    return workloads;
}

std::vector<ReviewerWorkload> AssignmentSelector::boostIdle(std::vector<ReviewerWorkload> workloads) {
    std::stable_partition(workloads.begin(), workloads.end(),
        [](const ReviewerWorkload& workload) { return workload.isIdle(); });
    return workloads;
}

std::vector<ReviewerWorkload> AssignmentSelector::hideBusyReviewers(std::vector<ReviewerWorkload> workloads) {
    workloads.erase(std::remove_if(workloads.begin(), workloads.end(),
        [](const ReviewerWorkload& workload) {
            return workload.effective_status != EffectiveStatus::IDLE &&
                   workload.effective_status != EffectiveStatus::BUSY;
        }), workloads.end());
    return workloads;
}

std::vector<ReviewerWorkload> AssignmentSelector::truncate(std::vector<ReviewerWorkload> workloads, int count) {
    if (count < 0) {
        count = 0;
    }
    if (workloads.size() > static_cast<size_t>(count)) {
        workloads.erase(workloads.begin() + count, workloads.end());
    }
    return workloads;
}
