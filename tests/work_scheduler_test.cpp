/**
 * Work Scheduler Test
 *
 * Selection policy, add validation, claim/complete/fail transitions,
 * dependency removal, failed-item replacement and history pinning.
 */

#include "foreman/errors.hpp"
#include "foreman/state_store.hpp"
#include "foreman/work_scheduler.hpp"
#include "test_helpers.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>

using namespace foreman;
using namespace foreman::testing;

namespace {

AddWorkResult add(WorkScheduler& scheduler, const std::string& id, int priority,
                  std::vector<std::string> deps = {}) {
    AddWorkRequest request;
    request.id = id;
    request.description = "task " + id;
    request.priority = priority;
    request.dependencies = std::move(deps);
    return scheduler.add_work(request);
}

bool in_queue(const std::vector<WorkItem>& items, const std::string& id) {
    return std::any_of(items.begin(), items.end(), [&](const WorkItem& w) { return w.id == id; });
}

} // namespace

// Test 1: wipLimit=2; A(5), B(8), C(3, deps=[A])
bool test_scheduling_example() {
    std::cout << "\n=== Test 1: Scheduling Example ===" << std::endl;

    TempDir dir;
    FakeClock clock;
    Config config = test_config(dir, 2);
    config.scheduler.auto_claim_on_complete = false;
    StateStore store(config.store, config.scheduler.wip_limit, clock.fn());
    WorkScheduler scheduler(store, config);

    TEST_ASSERT(add(scheduler, "A", 5).ok(), "Added A");
    clock.advance(std::chrono::seconds(1));
    TEST_ASSERT(add(scheduler, "B", 8).ok(), "Added B");
    clock.advance(std::chrono::seconds(1));
    TEST_ASSERT(add(scheduler, "C", 3, {"A"}).ok(), "Added C depending on A");

    auto first = scheduler.schedule_pass(std::string("worker"));
    TEST_ASSERT(first.size() == 2, "First pass fills both slots");
    TEST_ASSERT(first[0].id == "A", "A first: it unblocks C");
    TEST_ASSERT(first[1].id == "B", "B second");

    QueueState state = store.read_state();
    TEST_ASSERT(state.queued.size() == 1 && state.queued[0].id == "C", "C stays queued");
    TEST_ASSERT(state.active.size() == 2, "Two active items");

    scheduler.complete_work("A", std::nullopt);
    auto second = scheduler.schedule_pass(std::string("worker"));
    TEST_ASSERT(second.size() == 1 && second[0].id == "C", "Next pass claims C");
    TEST_ASSERT(second[0].agent == std::optional<std::string>("worker"), "Claimed for the given agent");
    TEST_ASSERT(second[0].started_at == clock.now(), "startedAt set at claim");

    return true;
}

// Test 2: Tie-break order
bool test_selection_policy() {
    std::cout << "\n=== Test 2: Selection Policy ===" << std::endl;

    const TimePoint t = from_epoch_ms(1000);
    auto make = [&](const std::string& id, int priority, int created_offset, std::set<std::string> deps = {}) {
        WorkItem w;
        w.id = id;
        w.description = id;
        w.priority = priority;
        w.created_at = t + std::chrono::seconds(created_offset);
        w.dependencies = std::move(deps);
        return w;
    };

    QueueState by_priority;
    by_priority.queued = {make("low", 2, 0), make("high", 9, 5)};
    TEST_ASSERT(by_priority.queued[*WorkScheduler::select_next(by_priority)].id == "high",
                "Highest priority wins without dependents");

    QueueState by_age;
    by_age.queued = {make("newer", 5, 10), make("older", 5, 1)};
    TEST_ASSERT(by_age.queued[*WorkScheduler::select_next(by_age)].id == "older", "Earliest createdAt breaks priority ties");

    QueueState by_id;
    by_id.queued = {make("b", 5, 0), make("a", 5, 0)};
    TEST_ASSERT(by_id.queued[*WorkScheduler::select_next(by_id)].id == "a", "Id breaks exact timestamp ties");

    QueueState by_unblock;
    by_unblock.queued = {make("urgent", 10, 0), make("enabler", 1, 0), make("waiting", 3, 0, {"enabler"}),
                         make("waiting2", 3, 0, {"enabler"})};
    TEST_ASSERT(by_unblock.queued[*WorkScheduler::select_next(by_unblock)].id == "enabler",
                "Unblocking count beats priority");
    TEST_ASSERT(WorkScheduler::unblock_count(by_unblock, "enabler") == 2, "Unblock count counts queued dependents");

    QueueState blocked;
    blocked.queued = {make("x", 5, 0, {"missing"})};
    TEST_ASSERT(!WorkScheduler::select_next(blocked), "Nothing eligible when dependencies are incomplete");

    return true;
}

// Test 3: AddWork rejections
bool test_add_validation() {
    std::cout << "\n=== Test 3: AddWork Validation ===" << std::endl;

    TempDir dir;
    FakeClock clock;
    Config config = test_config(dir);
    StateStore store(config.store, config.scheduler.wip_limit, clock.fn());
    WorkScheduler scheduler(store, config);

    AddWorkRequest empty;
    empty.description = "   ";
    TEST_ASSERT(scheduler.add_work(empty).error == ErrorCode::INVALID_INPUT, "Blank description rejected");

    TEST_ASSERT(add(scheduler, "p0", 0).error == ErrorCode::INVALID_INPUT, "Priority 0 rejected");
    TEST_ASSERT(add(scheduler, "p11", 11).error == ErrorCode::INVALID_INPUT, "Priority 11 rejected");

    AddWorkRequest complex;
    complex.description = "too complex";
    complex.estimated_complexity = 6;
    TEST_ASSERT(scheduler.add_work(complex).error == ErrorCode::INVALID_INPUT, "Complexity 6 rejected");

    TEST_ASSERT(add(scheduler, "a", 5).ok(), "Valid item accepted");
    TEST_ASSERT(add(scheduler, "a", 5).error == ErrorCode::DUPLICATE_ID, "Duplicate id rejected");
    TEST_ASSERT(add(scheduler, "b", 5, {"ghost"}).error == ErrorCode::UNKNOWN_DEPENDENCY, "Unknown dependency rejected");
    TEST_ASSERT(add(scheduler, "self", 5, {"self"}).error == ErrorCode::CYCLE_DETECTED, "Self-dependency rejected");

    AddWorkRequest generated;
    generated.description = "no id given";
    auto result = scheduler.add_work(generated);
    TEST_ASSERT(result.ok(), "Item without id accepted");
    TEST_ASSERT(result.id.size() == 36 && result.id[14] == '7', "Generated id is a UUIDv7");

    QueueState state = store.read_state();
    TEST_ASSERT(state.queued.size() == 2, "Only accepted items were stored");
    TEST_ASSERT(state.version == 2, "Rejected adds did not commit");

    return true;
}

// Test 4: Retries, permanent failure, dependency removal and replacement
bool test_failure_paths() {
    std::cout << "\n=== Test 4: Failure Handling ===" << std::endl;

    TempDir dir;
    FakeClock clock;
    Config config = test_config(dir, 1);
    config.scheduler.max_retries = 2;
    config.scheduler.auto_claim_on_complete = false;
    StateStore store(config.store, config.scheduler.wip_limit, clock.fn());
    WorkScheduler scheduler(store, config);

    add(scheduler, "F", 5);
    add(scheduler, "D", 5, {"F"});

    for (int attempt = 1; attempt <= 2; attempt++) {
        auto claim = scheduler.claim_work("worker");
        TEST_ASSERT(claim.claimed() && claim.item->id == "F", "F claimed");
        auto failed = scheduler.fail_work("F", "boom " + std::to_string(attempt));
        TEST_ASSERT(failed.retried, "Failure with budget left requeues");
        TEST_ASSERT(failed.item.retry_count == attempt, "retryCount incremented");
        TEST_ASSERT(failed.item.last_error == std::optional<std::string>("boom " + std::to_string(attempt)),
                    "lastError recorded");
        TEST_ASSERT(failed.item.priority == 5 && failed.item.status == WorkStatus::QUEUED,
                    "Priority kept, status queued");
    }

    scheduler.claim_work("worker");
    auto final_failure = scheduler.fail_work("F", "boom 3");
    TEST_ASSERT(!final_failure.retried, "Exhausted retries fail permanently");

    QueueState state = store.read_state();
    TEST_ASSERT(state.failed.size() == 1 && state.failed[0].id == "F", "F in failed");
    TEST_ASSERT(!state.failed[0].agent, "Failed item has no agent");

    auto blocked = scheduler.claim_work("worker");
    TEST_ASSERT(!blocked.claimed() && blocked.reason == ErrorCode::NO_ELIGIBLE_WORK,
                "Dependent of a failed item is not eligible");

    // Replacement: plain re-add is a duplicate, replace_failed queues it again
    TEST_ASSERT(add(scheduler, "F", 6).error == ErrorCode::DUPLICATE_ID, "Re-add without replace rejected");

    AddWorkRequest cyclic;
    cyclic.id = "F";
    cyclic.description = "replacement that waits on its dependent";
    cyclic.dependencies = {"D"};
    cyclic.replace_failed = true;
    TEST_ASSERT(scheduler.add_work(cyclic).error == ErrorCode::CYCLE_DETECTED, "Replacement closing a cycle rejected");

    AddWorkRequest replacement;
    replacement.id = "F";
    replacement.description = "replacement";
    replacement.priority = 6;
    replacement.replace_failed = true;
    TEST_ASSERT(scheduler.add_work(replacement).ok(), "Replacement accepted");

    state = store.read_state();
    TEST_ASSERT(state.failed.empty(), "Failed copy removed");
    TEST_ASSERT(state.queued.size() == 2, "Replacement queued beside D");

    // Dependency removal unblocks D independently
    auto updated = scheduler.remove_dependency("D", "F");
    TEST_ASSERT(updated.dependencies.empty(), "Dependency removed");
    try {
        scheduler.remove_dependency("D", "F");
        TEST_ASSERT(false, "Removing a missing dependency must throw");
    } catch (const CoordinatorError& e) {
        TEST_ASSERT(e.code() == ErrorCode::INVALID_INPUT, "Missing dependency is InvalidInput");
    }

    return true;
}

// Test 5: Capacity, auto-claim on completion, heartbeat
bool test_claim_and_complete() {
    std::cout << "\n=== Test 5: Claim and Complete ===" << std::endl;

    TempDir dir;
    FakeClock clock;
    Config config = test_config(dir, 1);
    StateStore store(config.store, config.scheduler.wip_limit, clock.fn());
    WorkScheduler scheduler(store, config);

    auto nothing = scheduler.claim_work("w1");
    TEST_ASSERT(!nothing.claimed() && nothing.reason == ErrorCode::NO_ELIGIBLE_WORK, "Empty queue: NoEligibleWork");

    add(scheduler, "one", 5);
    add(scheduler, "two", 4);

    auto claim = scheduler.claim_work("w1");
    TEST_ASSERT(claim.claimed() && claim.item->id == "one", "Claimed highest priority");
    TEST_ASSERT(claim.item->status == WorkStatus::ACTIVE, "Claimed item is active");

    auto full = scheduler.claim_work("w2");
    TEST_ASSERT(!full.claimed() && full.reason == ErrorCode::CAPACITY_EXCEEDED, "Full: CapacityExceeded");
    TEST_ASSERT(store.read_state().version == 3, "Capacity signal committed nothing");

    clock.advance(std::chrono::minutes(5));
    auto beat = scheduler.heartbeat("one");
    TEST_ASSERT(beat.heartbeat_at == clock.now(), "Heartbeat recorded");
    TEST_ASSERT(beat.status == WorkStatus::ACTIVE, "Heartbeat keeps the item active");

    auto done = scheduler.complete_work("one", std::string("artifact://one"));
    TEST_ASSERT(done.record.result_ref == std::optional<std::string>("artifact://one"), "resultRef recorded");
    TEST_ASSERT(done.next && done.next->id == "two", "Freed slot refilled");
    TEST_ASSERT(done.next->agent == std::optional<std::string>("w1"), "Next item goes to the completing agent");

    QueueState state = store.read_state();
    TEST_ASSERT(state.is_completed("one") && state.find_active("two"), "Collections updated");

    try {
        scheduler.complete_work("one", std::nullopt);
        TEST_ASSERT(false, "Completing twice must throw");
    } catch (const CoordinatorError& e) {
        TEST_ASSERT(e.code() == ErrorCode::INVALID_STATE, "Completed item is InvalidState");
    }
    try {
        scheduler.fail_work("nope", "x");
        TEST_ASSERT(false, "Failing an unknown id must throw");
    } catch (const CoordinatorError& e) {
        TEST_ASSERT(e.code() == ErrorCode::NOT_FOUND, "Unknown id is NotFound");
    }

    return true;
}

// Test 6: Completed history keeps ids still needed by dependents
bool test_history_pinning() {
    std::cout << "\n=== Test 6: History Pinning ===" << std::endl;

    TempDir dir;
    FakeClock clock;
    Config config = test_config(dir, 1);
    config.scheduler.completed_retention = 2;
    config.scheduler.auto_claim_on_complete = false;
    StateStore store(config.store, config.scheduler.wip_limit, clock.fn());
    WorkScheduler scheduler(store, config);

    add(scheduler, "P", 5);
    add(scheduler, "D", 1, {"P"});
    for (const char* id : {"X1", "X2", "X3"}) add(scheduler, id, 9);

    auto first = scheduler.claim_work("w");
    TEST_ASSERT(first.item && first.item->id == "P", "P claimed first: it unblocks D");
    scheduler.complete_work("P", std::nullopt);

    for (const char* id : {"X1", "X2", "X3"}) {
        clock.advance(std::chrono::seconds(10));
        auto claim = scheduler.claim_work("w");
        TEST_ASSERT(claim.item && claim.item->id == id, std::string("Claimed ") + id);
        scheduler.complete_work(id, std::nullopt);
    }

    QueueState state = store.read_state();
    TEST_ASSERT(state.completed.size() == 2, "History truncated to the retention cap");
    TEST_ASSERT(state.is_completed("P"), "Pinned id kept");
    TEST_ASSERT(state.is_completed("X3") && !state.is_completed("X1"), "Oldest unpinned records dropped");

    auto summary = scheduler.status();
    TEST_ASSERT(summary.eligible.count("D") == 1, "Dependent still eligible");

    return true;
}

// Test 7: Status summary
bool test_status_summary() {
    std::cout << "\n=== Test 7: Status ===" << std::endl;

    TempDir dir;
    FakeClock clock;
    Config config = test_config(dir, 2);
    config.scheduler.auto_claim_on_complete = false;
    StateStore store(config.store, config.scheduler.wip_limit, clock.fn());
    WorkScheduler scheduler(store, config);

    add(scheduler, "a", 5);
    add(scheduler, "b", 5, {"a"});
    add(scheduler, "c", 3);
    scheduler.claim_work("w");          // a (unblocks b)
    clock.advance(std::chrono::hours(2));

    auto summary = scheduler.status();
    TEST_ASSERT(summary.wip_limit == 2, "WIP limit reported");
    TEST_ASSERT(summary.active.size() == 1 && summary.active[0].id == "a", "Active list");
    TEST_ASSERT(summary.eligible == std::set<std::string>{"c"}, "Eligible queued items");
    TEST_ASSERT(summary.blocked_by.at("b") == std::vector<std::string>{"a"}, "Blocking dependency listed");
    TEST_ASSERT(summary.stale.size() == 1, "Idle active item reported stale");

    auto json = summary.to_json();
    TEST_ASSERT(json["counts"]["queued"] == 2 && json["counts"]["blocked"] == 1, "JSON counts");
    TEST_ASSERT(in_queue(summary.queued, "b"), "Queued list carries blocked items");

    return true;
}

// Main test runner
int main() {
    spdlog::set_level(spdlog::level::warn);  // Reduce noise during tests

    std::cout << "╔══════════════════════════════════════════════════════════╗" << std::endl;
    std::cout << "║     Work Scheduler Tests                                 ║" << std::endl;
    std::cout << "╚══════════════════════════════════════════════════════════╝" << std::endl;

    bool all_passed = true;

    all_passed &= test_scheduling_example();
    all_passed &= test_selection_policy();
    all_passed &= test_add_validation();
    all_passed &= test_failure_paths();
    all_passed &= test_claim_and_complete();
    all_passed &= test_history_pinning();
    all_passed &= test_status_summary();

    return report(all_passed) ? 0 : 1;
}
