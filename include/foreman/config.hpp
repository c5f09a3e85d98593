#pragma once

#include <algorithm>
#include <string>
#include <cstdlib>
#include <cstring>

namespace foreman {

// Helper function to get boolean from environment
inline bool get_env_bool(const char* name, bool default_value) {
    const char* value = std::getenv(name);
    if (!value) return default_value;
    return std::strcmp(value, "true") == 0 || std::strcmp(value, "1") == 0;
}

// Helper function to get int from environment
inline int get_env_int(const char* name, int default_value) {
    const char* value = std::getenv(name);
    return value ? std::atoi(value) : default_value;
}

// Helper function to get double from environment
inline double get_env_double(const char* name, double default_value) {
    const char* value = std::getenv(name);
    return value ? std::atof(value) : default_value;
}

// Helper function to get string from environment
inline std::string get_env_string(const char* name, const std::string& default_value) {
    const char* value = std::getenv(name);
    return value ? std::string(value) : default_value;
}

inline std::string default_state_file() {
    std::string home = get_env_string("HOME", ".");
    return home + "/.foreman/state/work-queue.json";
}

struct StoreConfig {
    std::string state_file = default_state_file();
    int lock_timeout_ms = 30000;          // 30 seconds
    int lock_poll_interval_ms = 100;      // Poll interval while waiting for the lock
    int backup_count = 3;                 // Rolling backups kept beside the state file
    bool fsync = true;                    // fsync temp file and directory on commit
    int transition_retention_hours = 24;  // Transition log kept on disk

    static StoreConfig from_env() {
        StoreConfig config;
        config.state_file = get_env_string("FOREMAN_STATE_FILE", default_state_file());
        config.lock_timeout_ms = get_env_int("FOREMAN_LOCK_TIMEOUT_MS", 30000);
        config.lock_poll_interval_ms = get_env_int("FOREMAN_LOCK_POLL_INTERVAL_MS", 100);
        config.backup_count = get_env_int("FOREMAN_BACKUP_COUNT", 3);
        config.fsync = get_env_bool("FOREMAN_FSYNC", true);
        config.transition_retention_hours = get_env_int("FOREMAN_TRANSITION_RETENTION_HOURS", 24);
        return config;
    }
};

struct SchedulerConfig {
    int wip_limit = 3;                    // Baseline WIP ceiling
    int max_retries = 3;
    int completed_retention = 1000;       // Completed records kept for dependency lookups
    bool auto_claim_on_complete = true;   // Refill the freed slot for the completing agent

    static SchedulerConfig from_env() {
        SchedulerConfig config;
        config.wip_limit = get_env_int("FOREMAN_WIP_LIMIT", 3);
        config.max_retries = get_env_int("FOREMAN_MAX_RETRIES", 3);
        config.completed_retention = get_env_int("FOREMAN_COMPLETED_RETENTION", 1000);
        config.auto_claim_on_complete = get_env_bool("FOREMAN_AUTO_CLAIM_ON_COMPLETE", true);
        return config;
    }
};

struct RecoveryConfig {
    int stale_threshold_s = 3600;         // 1 hour without activity
    int unattended_timeout_s = 86400;     // 24 hours - default policy abandons

    static RecoveryConfig from_env() {
        RecoveryConfig config;
        config.stale_threshold_s = get_env_int("FOREMAN_STALE_THRESHOLD_S", 3600);
        config.unattended_timeout_s = get_env_int("FOREMAN_UNATTENDED_TIMEOUT_S", 86400);
        return config;
    }
};

struct AdaptiveWipConfig {
    bool enabled = true;
    int window_hours = 24;
    int wip_cap = 4;
    double stall_rate_high = 0.3;         // Above this the ceiling collapses to 1
    double stall_rate_low = 0.1;          // Below this (with fast completions) the ceiling grows
    double completion_rate_high = 2.0;    // Completions per hour

    static AdaptiveWipConfig from_env() {
        AdaptiveWipConfig config;
        config.enabled = get_env_bool("FOREMAN_ADAPTIVE_WIP", true);
        config.window_hours = get_env_int("FOREMAN_WIP_WINDOW_HOURS", 24);
        config.wip_cap = get_env_int("FOREMAN_WIP_CAP", 4);
        config.stall_rate_high = get_env_double("FOREMAN_STALL_RATE_HIGH", 0.3);
        config.stall_rate_low = get_env_double("FOREMAN_STALL_RATE_LOW", 0.1);
        config.completion_rate_high = get_env_double("FOREMAN_COMPLETION_RATE_HIGH", 2.0);
        return config;
    }
};

struct LoggingConfig {
    std::string log_level = "info";
    std::string log_pattern = "[%Y-%m-%d %H:%M:%S.%e] [%l] %v";

    static LoggingConfig from_env() {
        LoggingConfig config;
        config.log_level = get_env_string("FOREMAN_LOG_LEVEL", "info");
        config.log_pattern = get_env_string("FOREMAN_LOG_PATTERN", "[%Y-%m-%d %H:%M:%S.%e] [%l] %v");
        return config;
    }
};

struct Config {
    StoreConfig store;
    SchedulerConfig scheduler;
    RecoveryConfig recovery;
    AdaptiveWipConfig adaptive;
    LoggingConfig logging;

    static Config load() {
        Config config;
        config.store = StoreConfig::from_env();
        config.scheduler = SchedulerConfig::from_env();
        config.recovery = RecoveryConfig::from_env();
        config.adaptive = AdaptiveWipConfig::from_env();
        config.logging = LoggingConfig::from_env();

        // The WIP window is computed from the transition log
        config.store.transition_retention_hours =
            std::max(config.store.transition_retention_hours, config.adaptive.window_hours);
        return config;
    }
};

} // namespace foreman
