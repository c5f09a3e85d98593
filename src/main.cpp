#include "foreman/config.hpp"
#include "foreman/errors.hpp"
#include "foreman/recovery_manager.hpp"
#include "foreman/state_store.hpp"
#include "foreman/work_scheduler.hpp"
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <iostream>
#include <map>
#include <set>
#include <string>
#include <vector>

using namespace foreman;

namespace {

// Exit codes
constexpr int EXIT_OK = 0;
constexpr int EXIT_INVALID = 1;
constexpr int EXIT_LOCK = 2;
constexpr int EXIT_CONFLICT = 3;
constexpr int EXIT_NO_WORK = 4;
constexpr int EXIT_CORRUPT = 5;

int exit_code_for(ErrorCode code) {
    switch (code) {
        case ErrorCode::LOCK_TIMEOUT:
        case ErrorCode::LOCK_HELD:
            return EXIT_LOCK;
        case ErrorCode::CYCLE_DETECTED:
        case ErrorCode::DUPLICATE_ID:
            return EXIT_CONFLICT;
        case ErrorCode::CAPACITY_EXCEEDED:
        case ErrorCode::NO_ELIGIBLE_WORK:
            return EXIT_NO_WORK;
        case ErrorCode::STATE_CORRUPTION:
        case ErrorCode::INVARIANT_VIOLATION:
        case ErrorCode::MANUAL_INTERVENTION_REQUIRED:
            return EXIT_CORRUPT;
        default:
            return EXIT_INVALID;
    }
}

void print_usage(const char* program_name) {
    std::cout << "Usage: " << program_name << " [options] <command> [args]\n"
              << "Options:\n"
              << "  --state-file PATH    State file (default: $HOME/.foreman/state/work-queue.json)\n"
              << "  --lock-timeout MS    Lock acquisition timeout (default: 30000)\n"
              << "  --verbose            Debug logging\n"
              << "  --help               Show this help message\n"
              << "\n"
              << "Commands:\n"
              << "  add <desc> --priority N [--deps id1,id2] [--id ID] [--complexity N] [--replace]\n"
              << "  claim --agent <id>\n"
              << "  complete <id> [--result <ref>]\n"
              << "  fail <id> --reason <msg>\n"
              << "  heartbeat <id>\n"
              << "  status [--json]\n"
              << "  resolve <id> --resolution resume|abandon|reschedule\n"
              << "  remove-dep <id> <dependency-id>\n"
              << "  schedule [--agent <id>]\n"
              << "  sweep\n"
              << "  tune\n"
              << "  verify [--repair]\n"
              << "\n"
              << "Environment variables:\n"
              << "  FOREMAN_STATE_FILE             State file path\n"
              << "  FOREMAN_WIP_LIMIT              Baseline WIP limit (default: 3)\n"
              << "  FOREMAN_MAX_RETRIES            Retries before an item fails (default: 3)\n"
              << "  FOREMAN_STALE_THRESHOLD_S      Idle seconds before an item is stale (default: 3600)\n"
              << "  FOREMAN_ADAPTIVE_WIP           Adaptive WIP tuning (default: true)\n"
              << "  FOREMAN_LOG_LEVEL              trace|debug|info|warn|error (default: info)\n"
              << std::endl;
}

/**
 * Positional arguments and --options of one command
 */
struct CommandArgs {
    std::vector<std::string> positional;
    std::map<std::string, std::string> options;
    std::set<std::string> flags;

    const std::string* option(const std::string& name) const {
        auto it = options.find(name);
        return it == options.end() ? nullptr : &it->second;
    }

    const std::string& required(const std::string& name) const {
        const std::string* value = option(name);
        if (!value) {
            throw CoordinatorError(ErrorCode::INVALID_INPUT, "missing required option " + name);
        }
        return *value;
    }

    const std::string& arg(size_t index, const char* what) const {
        if (index >= positional.size()) {
            throw CoordinatorError(ErrorCode::INVALID_INPUT, std::string("missing argument <") + what + ">");
        }
        return positional[index];
    }
};

CommandArgs parse_command_args(const std::vector<std::string>& raw, const std::set<std::string>& known_flags) {
    CommandArgs args;
    for (size_t i = 0; i < raw.size(); ++i) {
        const std::string& a = raw[i];
        if (a.rfind("--", 0) != 0) {
            args.positional.push_back(a);
        } else if (known_flags.count(a)) {
            args.flags.insert(a);
        } else if (i + 1 < raw.size()) {
            args.options[a] = raw[++i];
        } else {
            throw CoordinatorError(ErrorCode::INVALID_INPUT, "option " + a + " requires a value");
        }
    }
    return args;
}

int parse_int(const std::string& value, const std::string& what) {
    size_t consumed = 0;
    int result = 0;
    try {
        result = std::stoi(value, &consumed);
    } catch (const std::logic_error&) {
        consumed = 0;   // invalid_argument or out_of_range
    }
    if (consumed == 0 || consumed != value.size()) {
        throw CoordinatorError(ErrorCode::INVALID_INPUT, what + " must be an integer, got '" + value + "'");
    }
    return result;
}

std::vector<std::string> split_csv(const std::string& value) {
    std::vector<std::string> parts;
    std::string current;
    for (char c : value) {
        if (c == ',') {
            if (!current.empty()) parts.push_back(current);
            current.clear();
        } else if (c != ' ') {
            current += c;
        }
    }
    if (!current.empty()) parts.push_back(current);
    return parts;
}

std::string ago(TimePoint then, TimePoint now) {
    auto minutes = std::chrono::duration_cast<std::chrono::minutes>(now - then).count();
    if (minutes < 1) return "just now";
    if (minutes < 120) return std::to_string(minutes) + "m ago";
    return std::to_string(minutes / 60) + "h ago";
}

// ============================================================================
// Dashboard
// ============================================================================

void print_dashboard(const QueueSummary& summary, TimePoint now) {
    std::set<std::string> stale_ids;
    for (const auto& s : summary.stale) stale_ids.insert(s.id);

    std::cout << "=== Work Queue (version " << summary.version << ") ===\n\n";

    std::cout << "Active (" << summary.active.size() << "/" << summary.wip_limit << "):\n";
    if (summary.active.empty()) std::cout << "  (none)\n";
    for (const auto& item : summary.active) {
        std::cout << "  ▶ " << item.id << "  " << item.description
                  << "  [" << item.agent.value_or("unassigned") << "]";
        if (item.started_at) std::cout << "  started " << ago(*item.started_at, now);
        if (stale_ids.count(item.id)) std::cout << "  ⚠ stale";
        std::cout << "\n";
    }

    // Top 5 by priority
    std::vector<WorkItem> queued = summary.queued;
    std::stable_sort(queued.begin(), queued.end(),
                     [](const WorkItem& a, const WorkItem& b) { return a.priority > b.priority; });

    std::cout << "\nQueued (" << queued.size() << ", " << summary.eligible.size() << " eligible):\n";
    if (queued.empty()) std::cout << "  (none)\n";
    for (size_t i = 0; i < queued.size() && i < 5; i++) {
        const auto& item = queued[i];
        auto blocked = summary.blocked_by.find(item.id);
        std::cout << "  " << (blocked == summary.blocked_by.end() ? "⏸" : "🔒") << " "
                  << item.id << " (P" << item.priority << ") " << item.description;
        if (item.retry_count > 0) std::cout << "  retry " << item.retry_count;
        std::cout << "\n";
        if (blocked != summary.blocked_by.end()) {
            std::cout << "      Blocked by: ";
            for (size_t k = 0; k < blocked->second.size(); k++) {
                std::cout << (k ? ", " : "") << blocked->second[k];
            }
            std::cout << "\n";
        }
    }
    if (queued.size() > 5) std::cout << "  ... and " << queued.size() - 5 << " more\n";

    std::cout << "\nRecently Completed (" << summary.completed_count << " total):\n";
    if (summary.recent_completed.empty()) std::cout << "  (none)\n";
    for (size_t i = 0; i < summary.recent_completed.size() && i < 3; i++) {
        const auto& record = summary.recent_completed[i];
        std::cout << "  ✓ " << record.id << "  " << ago(record.completed_at, now);
        if (record.result_ref) std::cout << "  -> " << *record.result_ref;
        std::cout << "\n";
    }

    if (!summary.failed.empty()) {
        std::cout << "\nFailed (" << summary.failed.size() << "):\n";
        for (const auto& item : summary.failed) {
            std::cout << "  ✗ " << item.id << "  " << item.description;
            if (item.last_error) std::cout << "  (" << *item.last_error << ")";
            std::cout << "\n";
        }
    }
    std::cout << std::flush;
}

// ============================================================================
// Commands
// ============================================================================

int cmd_add(WorkScheduler& scheduler, const CommandArgs& args) {
    AddWorkRequest request;
    request.description = args.arg(0, "desc");
    request.priority = parse_int(args.required("--priority"), "--priority");
    if (auto deps = args.option("--deps")) request.dependencies = split_csv(*deps);
    if (auto id = args.option("--id")) request.id = *id;
    if (auto complexity = args.option("--complexity")) {
        request.estimated_complexity = parse_int(*complexity, "--complexity");
    }
    request.replace_failed = args.flags.count("--replace") > 0;

    auto result = scheduler.add_work(request);
    if (!result.ok()) {
        std::cerr << error_code_to_string(*result.error) << ": " << result.message << std::endl;
        return exit_code_for(*result.error);
    }
    std::cout << result.id << std::endl;
    return EXIT_OK;
}

int cmd_claim(WorkScheduler& scheduler, const CommandArgs& args) {
    auto result = scheduler.claim_work(args.required("--agent"));
    if (!result.claimed()) {
        std::cerr << error_code_to_string(*result.reason) << std::endl;
        return exit_code_for(*result.reason);
    }
    std::cout << result.item->to_json().dump(2) << std::endl;
    return EXIT_OK;
}

int cmd_complete(WorkScheduler& scheduler, const CommandArgs& args) {
    std::optional<std::string> result_ref;
    if (auto ref = args.option("--result")) result_ref = *ref;

    auto result = scheduler.complete_work(args.arg(0, "id"), result_ref);
    std::cout << "Completed " << result.record.id << std::endl;
    if (result.next) {
        std::cout << "Next: " << result.next->to_json().dump(2) << std::endl;
    }
    return EXIT_OK;
}

int cmd_fail(WorkScheduler& scheduler, const CommandArgs& args) {
    auto result = scheduler.fail_work(args.arg(0, "id"), args.required("--reason"));
    if (result.retried) {
        std::cout << "Requeued " << result.item.id << " (retry " << result.item.retry_count << ")" << std::endl;
    } else {
        std::cout << "Failed " << result.item.id << std::endl;
    }
    return EXIT_OK;
}

int cmd_status(WorkScheduler& scheduler, StateStore& store, const CommandArgs& args) {
    auto summary = scheduler.status();
    if (args.flags.count("--json")) {
        std::cout << summary.to_json().dump(2) << std::endl;
    } else {
        print_dashboard(summary, store.now());
    }
    return EXIT_OK;
}

int cmd_resolve(RecoveryManager& recovery, const CommandArgs& args) {
    const std::string& value = args.required("--resolution");
    auto resolution = resolution_from_string(value);
    if (!resolution) {
        throw CoordinatorError(ErrorCode::INVALID_INPUT,
                               "resolution must be resume, abandon or reschedule, got '" + value + "'");
    }
    auto item = recovery.resolve_stale(args.arg(0, "id"), *resolution);
    std::cout << item.id << " -> " << work_status_to_string(item.status) << std::endl;
    return EXIT_OK;
}

int cmd_verify(WorkScheduler& scheduler, const CommandArgs& args) {
    bool repair = args.flags.count("--repair") > 0;
    auto report = scheduler.verify(repair);

    if (report.clean()) {
        std::cout << "State is consistent" << std::endl;
        return EXIT_OK;
    }

    for (const auto& v : report.violations) {
        std::cout << "violation: " << invariant_kind_to_string(v.kind) << " " << v.detail << std::endl;
    }
    if (!repair) {
        std::cout << report.repaired.size() << " repairable, " << report.unresolved.size()
                  << " need manual intervention" << std::endl;
        return EXIT_CORRUPT;
    }
    if (!report.unresolved.empty()) {
        std::cout << "Not repaired: " << report.unresolved.size() << " violation(s) need manual intervention"
                  << std::endl;
        return EXIT_CORRUPT;
    }
    std::cout << "Repaired " << report.repaired.size() << " violation(s)" << std::endl;
    return EXIT_OK;
}

int run_command(const std::string& command, const std::vector<std::string>& raw, const Config& config) {
    StateStore store(config.store, config.scheduler.wip_limit);
    WorkScheduler scheduler(store, config);
    RecoveryManager recovery(store, config.recovery);

    auto args = parse_command_args(raw, {"--json", "--repair", "--replace"});

    // Stale items are reported at startup; sweep and verify handle state themselves
    if (command != "sweep" && command != "verify") {
        recovery.report_stale();
    }

    if (command == "add") return cmd_add(scheduler, args);
    if (command == "claim") return cmd_claim(scheduler, args);
    if (command == "complete") return cmd_complete(scheduler, args);
    if (command == "fail") return cmd_fail(scheduler, args);
    if (command == "status") return cmd_status(scheduler, store, args);
    if (command == "resolve") return cmd_resolve(recovery, args);
    if (command == "verify") return cmd_verify(scheduler, args);

    if (command == "heartbeat") {
        auto item = scheduler.heartbeat(args.arg(0, "id"));
        std::cout << "Heartbeat recorded for " << item.id << std::endl;
        return EXIT_OK;
    }
    if (command == "remove-dep") {
        auto item = scheduler.remove_dependency(args.arg(0, "id"), args.arg(1, "dependency-id"));
        std::cout << item.id << " now has " << item.dependencies.size() << " dependencies" << std::endl;
        return EXIT_OK;
    }
    if (command == "schedule") {
        std::optional<std::string> agent;
        if (auto a = args.option("--agent")) agent = *a;
        auto started = scheduler.schedule_pass(agent);
        for (const auto& item : started) {
            std::cout << item.id << "\t" << item.description << std::endl;
        }
        return EXIT_OK;
    }
    if (command == "sweep") {
        auto report = recovery.sweep();
        nlohmann::json out = {
            {"stale", report.stale.size()},
            {"newly_stalled", report.newly_stalled},
            {"abandoned", report.abandoned}
        };
        std::cout << out.dump(2) << std::endl;
        return EXIT_OK;
    }
    if (command == "tune") {
        std::cout << scheduler.tune_wip().to_json().dump(2) << std::endl;
        return EXIT_OK;
    }

    throw CoordinatorError(ErrorCode::INVALID_INPUT, "unknown command '" + command + "'");
}

} // namespace

int main(int argc, char* argv[]) {
    foreman::Config config = foreman::Config::load();
    bool verbose = false;

    int i = 1;
    for (; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--help" || arg == "-h") {
            print_usage(argv[0]);
            return EXIT_OK;
        } else if (arg == "--state-file" && i + 1 < argc) {
            config.store.state_file = argv[++i];
        } else if (arg == "--lock-timeout" && i + 1 < argc) {
            config.store.lock_timeout_ms = std::atoi(argv[++i]);
        } else if (arg == "--verbose") {
            verbose = true;
        } else if (arg.rfind("--", 0) == 0) {
            std::cerr << "Unknown argument: " << arg << std::endl;
            print_usage(argv[0]);
            return EXIT_INVALID;
        } else {
            break;
        }
    }

    // Command output goes to stdout, logs to stderr
    auto logger = spdlog::stderr_color_mt("foreman");
    spdlog::set_default_logger(logger);
    spdlog::set_level(verbose ? spdlog::level::debug : spdlog::level::from_str(config.logging.log_level));
    spdlog::set_pattern(config.logging.log_pattern);

    if (i >= argc) {
        print_usage(argv[0]);
        return EXIT_INVALID;
    }

    std::string command = argv[i++];
    std::vector<std::string> raw(argv + i, argv + argc);

    try {
        return run_command(command, raw, config);
    } catch (const CoordinatorError& e) {
        spdlog::error("{}: {}", error_code_to_string(e.code()), e.what());
        if (!e.details().empty()) {
            spdlog::debug("Details: {}", e.details().dump());
        }
        return exit_code_for(e.code());
    } catch (const std::exception& e) {
        spdlog::error("Unexpected error: {}", e.what());
        return EXIT_INVALID;
    }
}
