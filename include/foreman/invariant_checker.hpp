#pragma once

#include "foreman/work_types.hpp"
#include <nlohmann/json.hpp>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace foreman {

/**
 * The five structural invariants of a QueueState
 */
enum class InvariantKind {
    WIP_LIMIT_EXCEEDED = 1,      // len(active) <= wip_limit
    MISPLACED_ID = 2,            // id in exactly one of queued/active/completed/failed
    UNMET_ACTIVE_DEPENDENCY = 3, // active dependencies all completed
    DUPLICATE_ID = 4,            // no duplicate ids within a collection
    DEPENDENCY_CYCLE = 5         // queued/active dependency graph is acyclic
};

inline const char* invariant_kind_to_string(InvariantKind kind) {
    switch (kind) {
        case InvariantKind::WIP_LIMIT_EXCEEDED: return "wip_limit_exceeded";
        case InvariantKind::MISPLACED_ID: return "misplaced_id";
        case InvariantKind::UNMET_ACTIVE_DEPENDENCY: return "unmet_active_dependency";
        case InvariantKind::DUPLICATE_ID: return "duplicate_id";
        case InvariantKind::DEPENDENCY_CYCLE: return "dependency_cycle";
        default: return "unknown";
    }
}

struct Violation {
    InvariantKind kind;
    std::vector<std::string> ids;   // Offending id(s); the cycle path for DEPENDENCY_CYCLE
    std::string detail;

    bool operator==(const Violation& other) const {
        return kind == other.kind && ids == other.ids;
    }

    nlohmann::json to_json() const {
        return {
            {"invariant", static_cast<int>(kind)},
            {"kind", invariant_kind_to_string(kind)},
            {"ids", ids},
            {"detail", detail}
        };
    }
};

struct RepairResult {
    QueueState state;
    std::vector<Violation> repaired;
    std::vector<Violation> unresolved;

    bool resolved() const { return unresolved.empty(); }
};

using DependencyGraph = std::map<std::string, std::set<std::string>>;

/**
 * InvariantChecker - validates a QueueState before commit and after load
 *
 * Repairs are mechanical only: dropping identical duplicate copies and
 * re-partitioning active/queued with completed/failed as ground truth.
 * Cycles and conflicting copies of one id are never guessed at.
 */
class InvariantChecker {
public:
    std::vector<Violation> check(const QueueState& state) const;

    RepairResult attempt_auto_repair(const QueueState& state,
                                     const std::vector<Violation>& violations) const;

    // One cycle (as a closed id path) if the graph has any
    static std::optional<std::vector<std::string>> find_cycle(const DependencyGraph& graph);

    // Dependency graph over queued and active items
    static DependencyGraph pending_graph(const QueueState& state);

    static nlohmann::json violations_to_json(const std::vector<Violation>& violations);

private:
    void check_wip_limit(const QueueState& state, std::vector<Violation>& out) const;
    void check_placement(const QueueState& state, std::vector<Violation>& out) const;
    void check_active_dependencies(const QueueState& state, std::vector<Violation>& out) const;
    void check_duplicates(const QueueState& state, std::vector<Violation>& out) const;
    void check_acyclic(const QueueState& state, std::vector<Violation>& out) const;

    bool repair_duplicates(QueueState& state) const;
    bool repair_placement(QueueState& state) const;
    void repair_active_dependencies(QueueState& state) const;
    void repair_wip_limit(QueueState& state) const;
};

} // namespace foreman
