// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

/**
 * @file test_reconciliation_planner.cpp
 * @brief Plan computation from local/remote snapshot pairs
 *
 * Randomized snapshot pairs check the one-operation-per-difference rule and
 * that applying a plan converges; the named scenarios pin down the behavior
 * users see.
 */

#include "reconciliation_planner.h"

#include <algorithm>
#include <random>
#include <set>

#include <catch2/catch.hpp>

using namespace chitusync;

namespace {

constexpr uint64_t TEN_MB = 10ull * 1024 * 1024;

LocalSnapshot make_local(std::initializer_list<std::pair<const char*, uint64_t>> files) {
    LocalSnapshot::Map map;
    for (const auto& [name, size] : files) {
        map[name] = LocalFileRecord{name, size, 1};
    }
    return LocalSnapshot(std::move(map));
}

RemoteSnapshot make_remote(std::initializer_list<std::pair<const char*, uint64_t>> files) {
    RemoteSnapshot::Map map;
    for (const auto& [name, size] : files) {
        map[name] = RemoteFileRecord{name, size};
    }
    return RemoteSnapshot(std::move(map));
}

/// Apply a plan to a remote listing the way a fully successful pass would
RemoteSnapshot apply(const ReconciliationPlan& plan, const LocalSnapshot& local,
                     const RemoteSnapshot& remote) {
    RemoteSnapshot::Map map = remote.records();
    for (const auto& op : plan) {
        if (op.kind == PlanOperation::Kind::DELETE) {
            map.erase(op.name);
        } else {
            map[op.name] = RemoteFileRecord{op.name, local.find(op.name)->size};
        }
    }
    return RemoteSnapshot(std::move(map));
}

/// Random pair drawn from a small name pool so overlaps are common
std::pair<LocalSnapshot, RemoteSnapshot> random_pair(std::mt19937& rng) {
    static const char* POOL[] = {"a.ctb", "b.ctb", "c.goo", "d.ctb", "e.goo", "f.ctb", "g.ctb"};
    std::uniform_int_distribution<int> coin(0, 2);
    std::uniform_int_distribution<uint64_t> size(1, 4);

    LocalSnapshot::Map local;
    RemoteSnapshot::Map remote;
    for (const char* name : POOL) {
        int where = coin(rng);
        if (where == 0 || where == 2) {
            local[name] = LocalFileRecord{name, size(rng) * 1000, 1};
        }
        if (where == 1 || where == 2) {
            remote[name] = RemoteFileRecord{name, size(rng) * 1000};
        }
    }
    return {LocalSnapshot(std::move(local)), RemoteSnapshot(std::move(remote))};
}

} // namespace

// ============================================================================
// Scenarios
// ============================================================================

TEST_CASE("ReconciliationPlanner: new local file is uploaded, then the plan is empty",
          "[planner][scenario]") {
    auto local = make_local({{"a.ctb", TEN_MB}});
    auto remote = make_remote({});

    auto plan = ReconciliationPlanner::plan(local, remote, true);
    REQUIRE(plan.size() == 1);
    REQUIRE(plan[0] == PlanOperation{PlanOperation::Kind::UPLOAD, "a.ctb"});

    // Board now lists a.ctb at 10 MB
    auto after = make_remote({{"a.ctb", TEN_MB}});
    REQUIRE(ReconciliationPlanner::plan(local, after, true).empty());
}

TEST_CASE("ReconciliationPlanner: remote-only file kept when deletion is disabled",
          "[planner][scenario]") {
    auto local = make_local({{"a.ctb", 100}});
    auto remote = make_remote({{"a.ctb", 100}, {"old.ctb", 500}});

    auto plan = ReconciliationPlanner::plan(local, remote, false);
    REQUIRE(std::none_of(plan.begin(), plan.end(), [](const PlanOperation& op) {
        return op.kind == PlanOperation::Kind::DELETE;
    }));
    REQUIRE(plan.empty());

    auto with_deletion = ReconciliationPlanner::plan(local, remote, true);
    REQUIRE(with_deletion.size() == 1);
    REQUIRE(with_deletion[0] == PlanOperation{PlanOperation::Kind::DELETE, "old.ctb"});
}

TEST_CASE("ReconciliationPlanner: size change overwrites without deleting first",
          "[planner]") {
    auto local = make_local({{"a.ctb", 200}});
    auto remote = make_remote({{"a.ctb", 100}});

    auto plan = ReconciliationPlanner::plan(local, remote, true);
    REQUIRE(plan.size() == 1);
    REQUIRE(plan[0].kind == PlanOperation::Kind::UPLOAD);
}

TEST_CASE("ReconciliationPlanner: deletes are ordered before uploads", "[planner]") {
    auto local = make_local({{"a.ctb", 1}, {"z.ctb", 1}});
    auto remote = make_remote({{"m.ctb", 1}, {"y.goo", 1}});

    auto plan = ReconciliationPlanner::plan(local, remote, true);
    REQUIRE(plan.size() == 4);
    REQUIRE(plan[0].kind == PlanOperation::Kind::DELETE);
    REQUIRE(plan[1].kind == PlanOperation::Kind::DELETE);
    REQUIRE(plan[2].kind == PlanOperation::Kind::UPLOAD);
    REQUIRE(plan[3].kind == PlanOperation::Kind::UPLOAD);
}

// ============================================================================
// Properties over random snapshot pairs
// ============================================================================

TEST_CASE("ReconciliationPlanner: exactly one operation per differing name",
          "[planner][property]") {
    std::mt19937 rng(20251019);

    for (int iteration = 0; iteration < 500; iteration++) {
        auto [local, remote] = random_pair(rng);
        auto plan = ReconciliationPlanner::plan(local, remote, true);

        std::set<std::string> differing;
        for (const auto& [name, rec] : local.records()) {
            const auto* r = remote.find(name);
            if (!r || r->size != rec.size) {
                differing.insert(name);
            }
        }
        for (const auto& [name, rec] : remote.records()) {
            if (!local.contains(name)) {
                differing.insert(name);
            }
        }

        std::set<std::string> planned;
        for (const auto& op : plan) {
            INFO("iteration " << iteration << " op " << op.name);
            REQUIRE(planned.insert(op.name).second);
        }
        REQUIRE(planned == differing);
    }
}

TEST_CASE("ReconciliationPlanner: applying a plan converges", "[planner][property]") {
    std::mt19937 rng(42);

    for (int iteration = 0; iteration < 500; iteration++) {
        auto [local, remote] = random_pair(rng);
        for (bool deletion : {true, false}) {
            auto plan = ReconciliationPlanner::plan(local, remote, deletion);
            auto converged = apply(plan, local, remote);
            INFO("iteration " << iteration << " deletion " << deletion);
            REQUIRE(ReconciliationPlanner::plan(local, converged, deletion).empty());
        }
    }
}

// ============================================================================
// Event-driven plans
// ============================================================================

TEST_CASE("ReconciliationPlanner: plan_for_names uploads present files", "[planner][events]") {
    auto local = make_local({{"a.ctb", 10}});
    auto remote = make_remote({{"gone.ctb", 10}});

    auto plan = ReconciliationPlanner::plan_for_names({"a.ctb", "gone.ctb", "never.ctb"}, local,
                                                      &remote, true);

    REQUIRE(plan.size() == 2);
    REQUIRE(plan[0] == PlanOperation{PlanOperation::Kind::DELETE, "gone.ctb"});
    REQUIRE(plan[1] == PlanOperation{PlanOperation::Kind::UPLOAD, "a.ctb"});
}

TEST_CASE("ReconciliationPlanner: plan_for_names without a listing", "[planner][events]") {
    auto local = make_local({});

    SECTION("deletes when remote state is unknown") {
        auto plan = ReconciliationPlanner::plan_for_names({"x.ctb"}, local, nullptr, true);
        REQUIRE(plan.size() == 1);
        REQUIRE(plan[0].kind == PlanOperation::Kind::DELETE);
    }

    SECTION("never deletes when deletion is disabled") {
        auto plan = ReconciliationPlanner::plan_for_names({"x.ctb"}, local, nullptr, false);
        REQUIRE(plan.empty());
    }
}
