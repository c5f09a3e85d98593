/**
 * Invariant Checker Test
 *
 * One check per invariant, the mechanical repairs, and the cases that must
 * stay unresolved (cycles, conflicting copies of one id).
 */

#include "foreman/invariant_checker.hpp"
#include "test_helpers.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>

using namespace foreman;
using namespace foreman::testing;

namespace {

const TimePoint T0 = from_epoch_ms(1700000000000);

WorkItem item(const std::string& id, std::set<std::string> deps = {}) {
    WorkItem w;
    w.id = id;
    w.description = "task " + id;
    w.dependencies = std::move(deps);
    w.created_at = T0;
    return w;
}

WorkItem active(const std::string& id, int started_offset_s, std::set<std::string> deps = {}) {
    WorkItem w = item(id, std::move(deps));
    w.status = WorkStatus::ACTIVE;
    w.agent = "agent";
    w.started_at = T0 + std::chrono::seconds(started_offset_s);
    return w;
}

CompletedRecord done(const std::string& id) {
    return CompletedRecord{id, T0, std::nullopt, std::nullopt};
}

bool has(const std::vector<Violation>& violations, InvariantKind kind) {
    return std::any_of(violations.begin(), violations.end(),
                       [&](const Violation& v) { return v.kind == kind; });
}

} // namespace

// Test 1: A consistent state has no violations
bool test_clean_state() {
    std::cout << "\n=== Test 1: Clean State ===" << std::endl;

    QueueState state;
    state.wip_limit = 2;
    state.completed.push_back(done("a"));
    state.active.push_back(active("b", 0, {"a"}));
    state.queued.push_back(item("c", {"b"}));
    state.failed.push_back(item("d"));

    InvariantChecker checker;
    TEST_ASSERT(checker.check(state).empty(), "No violations in a consistent state");

    return true;
}

// Test 2: Each invariant detected independently
bool test_each_invariant_detected() {
    std::cout << "\n=== Test 2: Detection ===" << std::endl;

    InvariantChecker checker;

    QueueState wip;
    wip.wip_limit = 1;
    wip.active = {active("a", 0), active("b", 1)};
    auto v1 = checker.check(wip);
    TEST_ASSERT(v1.size() == 1 && v1[0].kind == InvariantKind::WIP_LIMIT_EXCEEDED, "Invariant 1: WIP excess");

    QueueState placement;
    placement.queued = {item("a")};
    placement.failed = {item("a")};
    auto v2 = checker.check(placement);
    TEST_ASSERT(v2.size() == 1 && v2[0].kind == InvariantKind::MISPLACED_ID, "Invariant 2: id in two collections");
    TEST_ASSERT(v2[0].ids == std::vector<std::string>{"a"}, "Offending id reported");

    QueueState deps;
    deps.active = {active("a", 0, {"missing"})};
    auto v3 = checker.check(deps);
    TEST_ASSERT(v3.size() == 1 && v3[0].kind == InvariantKind::UNMET_ACTIVE_DEPENDENCY,
                "Invariant 3: active item with incomplete dependency");

    QueueState dup;
    dup.queued = {item("a"), item("a")};
    auto v4 = checker.check(dup);
    TEST_ASSERT(v4.size() == 1 && v4[0].kind == InvariantKind::DUPLICATE_ID, "Invariant 4: duplicate in one collection");

    QueueState cycle;
    cycle.queued = {item("a", {"c"}), item("b", {"a"}), item("c", {"b"})};
    auto v5 = checker.check(cycle);
    TEST_ASSERT(v5.size() == 1 && v5[0].kind == InvariantKind::DEPENDENCY_CYCLE, "Invariant 5: cycle");
    TEST_ASSERT(v5[0].ids.size() == 4 && v5[0].ids.front() == v5[0].ids.back(), "Cycle reported as a closed path");

    return true;
}

// Test 3: Dependencies on completed or failed items are not graph edges
bool test_cycle_only_among_pending() {
    std::cout << "\n=== Test 3: Pending Graph ===" << std::endl;

    QueueState state;
    state.completed.push_back(done("x"));
    state.failed.push_back(item("y"));
    state.queued = {item("a", {"x", "y"}), item("b", {"a"})};

    auto graph = InvariantChecker::pending_graph(state);
    TEST_ASSERT(graph.size() == 2, "Graph covers queued and active items only");
    TEST_ASSERT(graph["a"].empty(), "Edges to completed/failed ids dropped");
    TEST_ASSERT(graph["b"] == std::set<std::string>{"a"}, "Pending edge kept");
    TEST_ASSERT(!InvariantChecker::find_cycle(graph), "No cycle");

    DependencyGraph self = {{"s", {"s"}}};
    auto found = InvariantChecker::find_cycle(self);
    TEST_ASSERT(found && found->size() == 2, "Self-loop is a cycle");

    return true;
}

// Test 4: Mechanical repairs
bool test_repairs() {
    std::cout << "\n=== Test 4: Auto-Repair ===" << std::endl;

    InvariantChecker checker;

    // Identical duplicate: keep one copy
    QueueState dup;
    dup.queued = {item("a"), item("a")};
    auto r1 = checker.attempt_auto_repair(dup, checker.check(dup));
    TEST_ASSERT(r1.resolved() && r1.state.queued.size() == 1, "Identical duplicate dropped");
    TEST_ASSERT(r1.repaired.size() == 1, "Duplicate reported as repaired");

    // Same id completed and active: completed wins
    QueueState placement;
    placement.wip_limit = 3;
    placement.completed.push_back(done("a"));
    placement.active.push_back(active("a", 0));
    auto r2 = checker.attempt_auto_repair(placement, checker.check(placement));
    TEST_ASSERT(r2.resolved(), "Completed/active conflict resolved");
    TEST_ASSERT(r2.state.active.empty() && r2.state.completed.size() == 1, "Completed copy kept");

    // Same id failed and queued: failed wins
    QueueState failed;
    failed.failed.push_back(item("f"));
    failed.queued.push_back(item("f"));
    auto r3 = checker.attempt_auto_repair(failed, checker.check(failed));
    TEST_ASSERT(r3.resolved() && r3.state.queued.empty() && r3.state.failed.size() == 1, "Failed copy kept");

    // Active with unmet dependency goes back to queued
    QueueState deps;
    deps.queued.push_back(item("p"));
    deps.active.push_back(active("a", 0, {"p"}));
    auto r4 = checker.attempt_auto_repair(deps, checker.check(deps));
    TEST_ASSERT(r4.resolved() && r4.state.active.empty(), "Blocked active item demoted");
    auto demoted = std::find_if(r4.state.queued.begin(), r4.state.queued.end(),
                                [](const WorkItem& w) { return w.id == "a"; });
    TEST_ASSERT(demoted != r4.state.queued.end(), "Demoted item is queued");
    TEST_ASSERT(demoted->status == WorkStatus::QUEUED && !demoted->agent && !demoted->started_at,
                "Demoted item lost its claim");

    // WIP excess: most recently started are requeued
    QueueState wip;
    wip.wip_limit = 1;
    wip.active = {active("late", 50), active("early", 10), active("middle", 30)};
    auto r5 = checker.attempt_auto_repair(wip, checker.check(wip));
    TEST_ASSERT(r5.resolved() && r5.state.active.size() == 1, "WIP excess repaired");
    TEST_ASSERT(r5.state.active.front().id == "early", "Earliest started item stays active");
    TEST_ASSERT(r5.state.queued.size() == 2, "Two items requeued");

    // A recent heartbeat does not make a long-running item look newly started
    QueueState beating;
    beating.wip_limit = 1;
    WorkItem veteran = active("veteran", 10);
    veteran.heartbeat_at = T0 + std::chrono::seconds(100);
    beating.active = {veteran, active("newcomer", 50)};
    auto r6 = checker.attempt_auto_repair(beating, checker.check(beating));
    TEST_ASSERT(r6.resolved() && r6.state.active.size() == 1, "WIP excess repaired with heartbeats present");
    TEST_ASSERT(r6.state.active.front().id == "veteran", "Ranked by startedAt, not by last heartbeat");
    TEST_ASSERT(r6.state.queued.front().id == "newcomer", "Newest claim requeued");

    return true;
}

// Test 5: Repairs that would require guessing stay unresolved
bool test_unresolved() {
    std::cout << "\n=== Test 5: Unresolved Violations ===" << std::endl;

    InvariantChecker checker;

    QueueState cycle;
    cycle.queued = {item("a", {"b"}), item("b", {"a"})};
    auto r1 = checker.attempt_auto_repair(cycle, checker.check(cycle));
    TEST_ASSERT(!r1.resolved(), "Cycle is not repaired");
    TEST_ASSERT(has(r1.unresolved, InvariantKind::DEPENDENCY_CYCLE), "Cycle listed as unresolved");
    TEST_ASSERT(r1.repaired.empty(), "Nothing claimed as repaired");

    QueueState conflict;
    WorkItem first = item("a");
    WorkItem second = item("a");
    second.description = "something else entirely";
    conflict.queued = {first, second};
    auto r2 = checker.attempt_auto_repair(conflict, checker.check(conflict));
    TEST_ASSERT(!r2.resolved() && has(r2.unresolved, InvariantKind::DUPLICATE_ID),
                "Conflicting duplicate left for the operator");
    TEST_ASSERT(r2.state.queued.size() == 2, "Both conflicting copies kept");

    QueueState cross;
    WorkItem queued_copy = item("b");
    WorkItem failed_copy = item("b");
    failed_copy.priority = 9;
    cross.queued = {queued_copy};
    cross.failed = {failed_copy};
    auto r3 = checker.attempt_auto_repair(cross, checker.check(cross));
    TEST_ASSERT(!r3.resolved() && has(r3.unresolved, InvariantKind::MISPLACED_ID),
                "Cross-collection copies with different content left unresolved");

    auto json = InvariantChecker::violations_to_json(r3.unresolved);
    TEST_ASSERT(json.is_array() && json[0]["kind"] == "misplaced_id", "Violations serialize for error details");

    return true;
}

// Main test runner
int main() {
    spdlog::set_level(spdlog::level::warn);  // Reduce noise during tests

    std::cout << "╔══════════════════════════════════════════════════════════╗" << std::endl;
    std::cout << "║     Invariant Checker Tests                              ║" << std::endl;
    std::cout << "╚══════════════════════════════════════════════════════════╝" << std::endl;

    bool all_passed = true;

    all_passed &= test_clean_state();
    all_passed &= test_each_invariant_detected();
    all_passed &= test_cycle_only_among_pending();
    all_passed &= test_repairs();
    all_passed &= test_unresolved();

    return report(all_passed) ? 0 : 1;
}
