/**
 * Recovery Manager Test
 *
 * Stale detection against an injected clock, the three resolutions, the
 * stalled transition recorded once per episode, and unattended abandon.
 */

#include "foreman/errors.hpp"
#include "foreman/recovery_manager.hpp"
#include "foreman/state_store.hpp"
#include "foreman/work_scheduler.hpp"
#include "test_helpers.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <memory>

using namespace foreman;
using namespace foreman::testing;

namespace {

struct Fixture {
    TempDir dir;
    FakeClock clock;
    Config config;
    std::unique_ptr<StateStore> store;
    std::unique_ptr<WorkScheduler> scheduler;
    std::unique_ptr<RecoveryManager> recovery;

    Fixture() {
        config = test_config(dir, 3);
        config.scheduler.auto_claim_on_complete = false;
        store = std::make_unique<StateStore>(config.store, config.scheduler.wip_limit, clock.fn());
        scheduler = std::make_unique<WorkScheduler>(*store, config);
        recovery = std::make_unique<RecoveryManager>(*store, config.recovery);
    }

    void add_and_claim(const std::string& id) {
        AddWorkRequest request;
        request.id = id;
        request.description = "task " + id;
        scheduler->add_work(request);
        scheduler->claim_work("agent-" + id);
    }

    size_t transitions_of(TransitionKind kind, const std::string& id) {
        QueueState state = store->read_state();
        return std::count_if(state.transitions.begin(), state.transitions.end(),
                             [&](const Transition& t) { return t.kind == kind && t.id == id; });
    }
};

} // namespace

// Test 1: Staleness measured from heartbeat, else start
bool test_detection() {
    std::cout << "\n=== Test 1: Stale Detection ===" << std::endl;

    Fixture f;
    f.add_and_claim("quiet");
    f.add_and_claim("chatty");

    f.clock.advance(std::chrono::minutes(50));
    f.scheduler->heartbeat("chatty");
    f.clock.advance(std::chrono::minutes(20));

    auto stale = f.recovery->report_stale();
    TEST_ASSERT(stale.size() == 1 && stale[0].id == "quiet", "Only the item without recent activity is stale");
    TEST_ASSERT(stale[0].idle == std::chrono::minutes(70), "Idle time measured from startedAt");
    TEST_ASSERT(stale[0].agent == std::optional<std::string>("agent-quiet"), "Agent reported");
    TEST_ASSERT(!stale[0].unattended, "Not yet unattended");

    QueueState state = f.store->read_state();
    auto at_threshold = RecoveryManager::detect(state, f.clock.now(), std::chrono::minutes(70),
                                                std::chrono::hours(24));
    TEST_ASSERT(at_threshold.empty(), "Exactly the threshold is not stale");

    return true;
}

// Test 2: Sweep marks stale items once
bool test_sweep_marks_once() {
    std::cout << "\n=== Test 2: Sweep ===" << std::endl;

    Fixture f;
    f.add_and_claim("a");
    f.clock.advance(std::chrono::hours(2));

    auto first = f.recovery->sweep();
    TEST_ASSERT(first.committed, "First sweep commits");
    TEST_ASSERT(first.newly_stalled == std::vector<std::string>{"a"}, "Item marked stalled");
    TEST_ASSERT(first.abandoned.empty(), "Nothing abandoned before the unattended timeout");

    QueueState state = f.store->read_state();
    TEST_ASSERT(state.find_active("a")->stalled_at == f.clock.now(), "stalledAt set");

    auto second = f.recovery->sweep();
    TEST_ASSERT(second.stale.size() == 1 && second.newly_stalled.empty(), "Second sweep reports but does not re-mark");
    TEST_ASSERT(!second.committed, "Second sweep commits nothing");
    TEST_ASSERT(f.transitions_of(TransitionKind::STALLED, "a") == 1, "One stalled transition per episode");

    f.scheduler->heartbeat("a");
    state = f.store->read_state();
    TEST_ASSERT(!state.find_active("a")->stalled_at, "Heartbeat clears stalledAt");

    return true;
}

// Test 3: Operator resolutions
bool test_resolutions() {
    std::cout << "\n=== Test 3: Resolutions ===" << std::endl;

    Fixture f;
    f.add_and_claim("resume-me");
    f.add_and_claim("requeue-me");
    f.add_and_claim("drop-me");
    f.clock.advance(std::chrono::hours(3));

    auto resumed = f.recovery->resolve_stale("resume-me", Resolution::RESUME);
    TEST_ASSERT(resumed.status == WorkStatus::ACTIVE, "Resume keeps the item active");
    TEST_ASSERT(resumed.started_at == f.clock.now(), "Resume resets startedAt");

    auto rescheduled = f.recovery->resolve_stale("requeue-me", Resolution::RESCHEDULE);
    TEST_ASSERT(rescheduled.status == WorkStatus::QUEUED, "Reschedule requeues");
    TEST_ASSERT(!rescheduled.agent && !rescheduled.started_at, "Reschedule clears the claim");
    TEST_ASSERT(rescheduled.priority == 5, "Priority unchanged");

    auto abandoned = f.recovery->resolve_stale("drop-me", Resolution::ABANDON);
    TEST_ASSERT(abandoned.status == WorkStatus::FAILED, "Abandon fails the item");

    QueueState state = f.store->read_state();
    TEST_ASSERT(state.find_active("resume-me") != nullptr, "Resumed item active");
    TEST_ASSERT(state.find_queued("requeue-me") != nullptr, "Rescheduled item queued");
    TEST_ASSERT(state.find_failed("drop-me") != nullptr, "Abandoned item failed");

    try {
        f.recovery->resolve_stale("resume-me", Resolution::ABANDON);
        TEST_ASSERT(false, "Resolving a fresh item must throw");
    } catch (const CoordinatorError& e) {
        TEST_ASSERT(e.code() == ErrorCode::INVALID_STATE, "Non-stale item is InvalidState");
    }
    try {
        f.recovery->resolve_stale("ghost", Resolution::RESUME);
        TEST_ASSERT(false, "Resolving an unknown id must throw");
    } catch (const CoordinatorError& e) {
        TEST_ASSERT(e.code() == ErrorCode::NOT_FOUND, "Unknown id is NotFound");
    }

    TEST_ASSERT(resolution_from_string("reschedule") == Resolution::RESCHEDULE, "Resolution parsed");
    TEST_ASSERT(!resolution_from_string("retry"), "Unknown resolution rejected");

    return true;
}

// Test 4: Unattended items are abandoned by the sweep
bool test_unattended_abandon() {
    std::cout << "\n=== Test 4: Unattended Abandon ===" << std::endl;

    Fixture f;
    f.add_and_claim("forgotten");
    f.add_and_claim("recent");
    f.clock.advance(std::chrono::hours(23));
    f.scheduler->heartbeat("recent");
    f.clock.advance(std::chrono::hours(2));

    auto sweep = f.recovery->sweep();
    TEST_ASSERT(sweep.abandoned == std::vector<std::string>{"forgotten"}, "Item idle beyond 24h abandoned");

    QueueState state = f.store->read_state();
    TEST_ASSERT(state.find_failed("forgotten") != nullptr, "Abandoned item in failed");
    TEST_ASSERT(state.find_active("recent") != nullptr, "Recently active item untouched");
    TEST_ASSERT(f.transitions_of(TransitionKind::ABANDONED, "forgotten") == 1, "Abandon transition recorded");

    return true;
}

// Main test runner
int main() {
    spdlog::set_level(spdlog::level::off);  // Stale reports warn on purpose

    std::cout << "╔══════════════════════════════════════════════════════════╗" << std::endl;
    std::cout << "║     Recovery Manager Tests                               ║" << std::endl;
    std::cout << "╚══════════════════════════════════════════════════════════╝" << std::endl;

    bool all_passed = true;

    all_passed &= test_detection();
    all_passed &= test_sweep_marks_once();
    all_passed &= test_resolutions();
    all_passed &= test_unattended_abandon();

    return report(all_passed) ? 0 : 1;
}
