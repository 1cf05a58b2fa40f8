// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "reconciliation_planner.h"

#include <algorithm>

namespace chitusync {

ReconciliationPlan ReconciliationPlanner::plan(const LocalSnapshot& local,
                                               const RemoteSnapshot& remote,
                                               bool remote_deletion) {
    ReconciliationPlan result;

    if (remote_deletion) {
        for (const auto& [name, record] : remote.records()) {
            if (!local.contains(name)) {
                result.push_back({PlanOperation::Kind::DELETE, name});
            }
        }
    }

    for (const auto& [name, record] : local.records()) {
        const RemoteFileRecord* remote_record = remote.find(name);
        if (!remote_record || remote_record->size != record.size) {
            result.push_back({PlanOperation::Kind::UPLOAD, name});
        }
    }

    return result;
}

ReconciliationPlan ReconciliationPlanner::plan_for_names(const std::set<std::string>& names,
                                                         const LocalSnapshot& local,
                                                         const RemoteSnapshot* remote,
                                                         bool remote_deletion) {
    ReconciliationPlan result;
    for (const auto& name : names) {
        if (local.contains(name)) {
            result.push_back({PlanOperation::Kind::UPLOAD, name});
        } else if (remote_deletion && (!remote || remote->contains(name))) {
            result.push_back({PlanOperation::Kind::DELETE, name});
        }
    }
    order(result);
    return result;
}

void ReconciliationPlanner::order(ReconciliationPlan& plan) {
    std::stable_partition(plan.begin(), plan.end(), [](const PlanOperation& op) {
        return op.kind == PlanOperation::Kind::DELETE;
    });
}

} // namespace chitusync
