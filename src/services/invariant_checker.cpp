#include "foreman/invariant_checker.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <functional>

namespace foreman {

namespace {

bool has_kind(const std::vector<Violation>& violations, InvariantKind kind) {
    return std::any_of(violations.begin(), violations.end(),
                       [&](const Violation& v) { return v.kind == kind; });
}

void demote_to_queued(WorkItem& item) {
    item.status = WorkStatus::QUEUED;
    item.agent.reset();
    item.started_at.reset();
    item.heartbeat_at.reset();
    item.stalled_at.reset();
}

// Keep the last copy of ids whose copies all describe the same unit of work
bool dedupe_items(std::vector<WorkItem>& items) {
    std::map<std::string, std::vector<size_t>> positions;
    for (size_t i = 0; i < items.size(); i++) {
        positions[items[i].id].push_back(i);
    }

    std::vector<bool> drop(items.size(), false);
    bool changed = false;
    for (const auto& [id, where] : positions) {
        if (where.size() < 2) continue;

        const WorkItem& last = items[where.back()];
        bool same = std::all_of(where.begin(), where.end(),
                                [&](size_t i) { return items[i].same_identity(last); });
        if (!same) continue;   // Conflicting content: left for the operator

        for (size_t k = 0; k + 1 < where.size(); k++) {
            drop[where[k]] = true;
        }
        changed = true;
    }

    if (changed) {
        std::vector<WorkItem> kept;
        kept.reserve(items.size());
        for (size_t i = 0; i < items.size(); i++) {
            if (!drop[i]) kept.push_back(std::move(items[i]));
        }
        items = std::move(kept);
    }
    return changed;
}

bool dedupe_completed(std::vector<CompletedRecord>& records) {
    std::map<std::string, size_t> last_index;
    for (size_t i = 0; i < records.size(); i++) {
        last_index[records[i].id] = i;
    }
    if (last_index.size() == records.size()) return false;

    std::vector<CompletedRecord> kept;
    kept.reserve(last_index.size());
    for (size_t i = 0; i < records.size(); i++) {
        if (last_index[records[i].id] == i) kept.push_back(std::move(records[i]));
    }
    records = std::move(kept);
    return true;
}

void erase_id(std::vector<WorkItem>& items, const std::string& id) {
    items.erase(std::remove_if(items.begin(), items.end(),
                               [&](const WorkItem& w) { return w.id == id; }),
                items.end());
}

} // namespace

// ============================================================================
// Checks
// ============================================================================

std::vector<Violation> InvariantChecker::check(const QueueState& state) const {
    std::vector<Violation> violations;
    check_wip_limit(state, violations);
    check_placement(state, violations);
    check_active_dependencies(state, violations);
    check_duplicates(state, violations);
    check_acyclic(state, violations);
    return violations;
}

void InvariantChecker::check_wip_limit(const QueueState& state, std::vector<Violation>& out) const {
    if (static_cast<int>(state.active.size()) <= state.wip_limit) return;

    Violation v{InvariantKind::WIP_LIMIT_EXCEEDED, {}, {}};
    for (const auto& item : state.active) {
        v.ids.push_back(item.id);
    }
    v.detail = std::to_string(state.active.size()) + " active items exceed wip_limit " +
               std::to_string(state.wip_limit);
    out.push_back(std::move(v));
}

void InvariantChecker::check_placement(const QueueState& state, std::vector<Violation>& out) const {
    std::map<std::string, std::set<std::string>> where;
    for (const auto& item : state.queued) where[item.id].insert("queued");
    for (const auto& item : state.active) where[item.id].insert("active");
    for (const auto& record : state.completed) where[record.id].insert("completed");
    for (const auto& item : state.failed) where[item.id].insert("failed");

    for (const auto& [id, collections] : where) {
        if (collections.size() < 2) continue;

        std::string detail = "id present in";
        for (const auto& name : collections) {
            detail += " " + name;
        }
        out.push_back(Violation{InvariantKind::MISPLACED_ID, {id}, detail});
    }
}

void InvariantChecker::check_active_dependencies(const QueueState& state, std::vector<Violation>& out) const {
    auto completed = state.completed_ids();
    for (const auto& item : state.active) {
        std::vector<std::string> missing;
        for (const auto& dep : item.dependencies) {
            if (completed.count(dep) == 0) missing.push_back(dep);
        }
        if (missing.empty()) continue;

        Violation v{InvariantKind::UNMET_ACTIVE_DEPENDENCY, {item.id}, {}};
        v.detail = "active with " + std::to_string(missing.size()) + " incomplete dependencies";
        v.ids.insert(v.ids.end(), missing.begin(), missing.end());
        out.push_back(std::move(v));
    }
}

void InvariantChecker::check_duplicates(const QueueState& state, std::vector<Violation>& out) const {
    auto scan = [&](const char* name, auto const& items) {
        std::map<std::string, int> counts;
        for (const auto& item : items) counts[item.id]++;
        for (const auto& [id, count] : counts) {
            if (count < 2) continue;
            out.push_back(Violation{InvariantKind::DUPLICATE_ID, {id},
                                    "appears " + std::to_string(count) + " times in " + name});
        }
    };
    scan("queued", state.queued);
    scan("active", state.active);
    scan("completed", state.completed);
    scan("failed", state.failed);
}

void InvariantChecker::check_acyclic(const QueueState& state, std::vector<Violation>& out) const {
    auto cycle = find_cycle(pending_graph(state));
    if (!cycle) return;
    out.push_back(Violation{InvariantKind::DEPENDENCY_CYCLE, *cycle,
                            "dependency cycle among queued/active items"});
}

DependencyGraph InvariantChecker::pending_graph(const QueueState& state) {
    DependencyGraph graph;
    for (const auto* items : {&state.queued, &state.active}) {
        for (const auto& item : *items) {
            graph[item.id].insert(item.dependencies.begin(), item.dependencies.end());
        }
    }
    // Restrict edges to pending nodes
    for (auto& [id, deps] : graph) {
        for (auto it = deps.begin(); it != deps.end();) {
            it = graph.count(*it) ? std::next(it) : deps.erase(it);
        }
    }
    return graph;
}

std::optional<std::vector<std::string>> InvariantChecker::find_cycle(const DependencyGraph& graph) {
    enum class Color { WHITE, GREY, BLACK };
    std::map<std::string, Color> color;
    std::vector<std::string> stack;
    std::optional<std::vector<std::string>> found;

    std::function<bool(const std::string&)> visit = [&](const std::string& node) -> bool {
        color[node] = Color::GREY;
        stack.push_back(node);

        auto it = graph.find(node);
        if (it != graph.end()) {
            for (const auto& next : it->second) {
                Color c = color.count(next) ? color[next] : Color::WHITE;
                if (c == Color::GREY) {
                    auto start = std::find(stack.begin(), stack.end(), next);
                    std::vector<std::string> path(start, stack.end());
                    path.push_back(next);
                    found = std::move(path);
                    return true;
                }
                if (c == Color::WHITE && visit(next)) return true;
            }
        }

        stack.pop_back();
        color[node] = Color::BLACK;
        return false;
    };

    for (const auto& [node, deps] : graph) {
        if (color.count(node) == 0 && visit(node)) break;
    }
    return found;
}

nlohmann::json InvariantChecker::violations_to_json(const std::vector<Violation>& violations) {
    nlohmann::json arr = nlohmann::json::array();
    for (const auto& v : violations) {
        arr.push_back(v.to_json());
    }
    return arr;
}

// ============================================================================
// Repairs
// ============================================================================

RepairResult InvariantChecker::attempt_auto_repair(const QueueState& state,
                                                   const std::vector<Violation>& violations) const {
    RepairResult result;
    result.state = state;
    QueueState& s = result.state;

    if (has_kind(violations, InvariantKind::DUPLICATE_ID)) {
        repair_duplicates(s);
    }
    if (has_kind(violations, InvariantKind::MISPLACED_ID)) {
        repair_placement(s);
    }
    // Re-partition active/queued after the collections are settled
    if (has_kind(violations, InvariantKind::UNMET_ACTIVE_DEPENDENCY) ||
        has_kind(violations, InvariantKind::MISPLACED_ID)) {
        repair_active_dependencies(s);
    }
    if (has_kind(violations, InvariantKind::WIP_LIMIT_EXCEEDED)) {
        repair_wip_limit(s);
    }

    result.unresolved = check(s);
    for (const auto& v : violations) {
        bool still_there = std::find(result.unresolved.begin(), result.unresolved.end(), v) !=
                           result.unresolved.end();
        if (!still_there) result.repaired.push_back(v);
    }
    return result;
}

bool InvariantChecker::repair_duplicates(QueueState& state) const {
    bool changed = false;
    changed |= dedupe_items(state.queued);
    changed |= dedupe_items(state.active);
    changed |= dedupe_items(state.failed);
    changed |= dedupe_completed(state.completed);
    return changed;
}

bool InvariantChecker::repair_placement(QueueState& state) const {
    bool changed = false;
    auto completed = state.completed_ids();

    std::set<std::string> ids;
    for (const auto* items : {&state.queued, &state.active, &state.failed}) {
        for (const auto& item : *items) ids.insert(item.id);
    }

    for (const auto& id : ids) {
        std::vector<const WorkItem*> copies;
        int collections = completed.count(id) ? 1 : 0;
        for (const auto* items : {&state.queued, &state.active, &state.failed}) {
            bool seen = false;
            for (const auto& item : *items) {
                if (item.id == id) {
                    copies.push_back(&item);
                    seen = true;
                }
            }
            if (seen) collections++;
        }
        if (collections < 2) continue;

        bool same = std::all_of(copies.begin(), copies.end(),
                                [&](const WorkItem* w) { return w->same_identity(*copies.front()); });
        if (!same) {
            spdlog::debug("Id {} has conflicting copies, not repairable", id);
            continue;
        }

        // Most advanced collection wins: completed > failed > active > queued
        if (completed.count(id)) {
            erase_id(state.queued, id);
            erase_id(state.active, id);
            erase_id(state.failed, id);
        } else if (state.find_failed(id)) {
            erase_id(state.queued, id);
            erase_id(state.active, id);
        } else {
            erase_id(state.queued, id);
        }
        changed = true;
    }
    return changed;
}

void InvariantChecker::repair_active_dependencies(QueueState& state) const {
    auto completed = state.completed_ids();
    std::vector<WorkItem> still_active;
    for (auto& item : state.active) {
        bool ready = std::all_of(item.dependencies.begin(), item.dependencies.end(),
                                 [&](const std::string& dep) { return completed.count(dep) > 0; });
        if (ready) {
            still_active.push_back(std::move(item));
        } else {
            demote_to_queued(item);
            state.queued.push_back(std::move(item));
        }
    }
    state.active = std::move(still_active);
}

void InvariantChecker::repair_wip_limit(QueueState& state) const {
    // Most recently started items have the least progress to lose; heartbeats
    // do not count as a restart
    std::stable_sort(state.active.begin(), state.active.end(),
                     [](const WorkItem& a, const WorkItem& b) {
                         return a.started_at.value_or(a.created_at) < b.started_at.value_or(b.created_at);
                     });
    while (static_cast<int>(state.active.size()) > state.wip_limit) {
        WorkItem item = std::move(state.active.back());
        state.active.pop_back();
        demote_to_queued(item);
        state.queued.push_back(std::move(item));
    }
}

} // namespace foreman
