#pragma once

#include "core/coordinator_config.h"
#include "core/dispatch_error.h"
#include "core/result.h"

#include <chrono>
#include <cstdlib>
#include <string>

namespace runq::infra {

/// Read one environment variable; nullptr or empty means unset.
inline const char* env_value(const char* name) {
    const char* value = std::getenv(name);
    if (value && value[0] != '\0') {
        return value;
    }
    return nullptr;
}

/// Parse a strictly positive integer. Rejects signs, garbage and overflow.
inline bool parse_positive(const std::string& text, long& out) {
    if (text.empty() || text.size() > 9) {
        return false;
    }
    long value = 0;
    for (char c : text) {
        if (c < '0' || c > '9') {
            return false;
        }
        value = value * 10 + (c - '0');
    }
    if (value <= 0) {
        return false;
    }
    out = value;
    return true;
}

/// runqd configuration
struct DaemonConfig {
    std::string bind_host = "127.0.0.1";
    int port = 8765;
    std::string log_level = "info";
    core::CoordinatorConfig coordinator{};

    /// Defaults overridden by RUNQ_* environment variables. Durations are
    /// whole seconds.
    static core::Result<DaemonConfig, core::DispatchError> from_environment() {
        using R = core::Result<DaemonConfig, core::DispatchError>;
        DaemonConfig config;

        if (const char* host = env_value("RUNQ_BIND_HOST")) {
            config.bind_host = host;
        }
        if (const char* level = env_value("RUNQ_LOG_LEVEL")) {
            config.log_level = level;
        }
        if (const char* port = env_value("RUNQ_PORT")) {
            long value = 0;
            if (!parse_positive(port, value) || value > 65535) {
                return R::Err(core::DispatchError::Validation(
                    std::string("RUNQ_PORT must be in 1..65535, got '") + port + "'"));
            }
            config.port = static_cast<int>(value);
        }

        struct SecondsVar {
            const char* name;
            std::chrono::milliseconds* target;
        };
        auto& c = config.coordinator;
        const SecondsVar seconds_vars[] = {
            {"RUNQ_HEARTBEAT_TIMEOUT", &c.heartbeat.timeout},
            {"RUNQ_HEARTBEAT_INTERVAL", &c.heartbeat.interval_hint},
            {"RUNQ_CLAIM_GRACE", &c.recovery.claim_grace},
            {"RUNQ_NO_MATCH_TIMEOUT", &c.recovery.no_match_timeout},
            {"RUNQ_SWEEP_INTERVAL", &c.recovery.sweep_interval},
            {"RUNQ_POLL_TIMEOUT", &c.poll.default_wait},
            {"RUNQ_MAX_POLL_TIMEOUT", &c.poll.max_wait},
        };
        for (const auto& var : seconds_vars) {
            const char* raw = env_value(var.name);
            if (!raw) {
                continue;
            }
            long value = 0;
            if (!parse_positive(raw, value)) {
                return R::Err(core::DispatchError::Validation(
                    std::string(var.name) + " must be a positive number of seconds, got '" +
                    raw + "'"));
            }
            *var.target = std::chrono::seconds(value);
        }

        if (const char* affinity = env_value("RUNQ_SESSION_AFFINITY")) {
            const std::string v = affinity;
            if (v == "1" || v == "true") {
                c.session_affinity = true;
            } else if (v == "0" || v == "false") {
                c.session_affinity = false;
            } else {
                return R::Err(core::DispatchError::Validation(
                    "RUNQ_SESSION_AFFINITY must be true or false, got '" + v + "'"));
            }
        }

        config.coordinator = core::CoordinatorConfig::normalize(config.coordinator);
        return R::Ok(config);
    }
};

} // namespace runq::infra
