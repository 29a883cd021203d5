#pragma once

/**
 * @file backend_provider.h
 * @brief Readiness contract shared by every backend family
 *
 * A provider is registered under a stable id, prepared once (asset fetch,
 * model load, warmup) on a registry thread, then probed for health.
 * Capability operations live in the family interfaces
 * (stt::TranscriptionProvider, tts::SynthesisProvider).
 */

#include "common.h"
#include "errors.h"
#include <string>
#include <nlohmann/json.hpp>

namespace conductor {

/**
 * @brief Readiness state of a registered provider
 */
enum class BackendState {
    Unregistered,
    Registered,     ///< Added, preparation not started
    Initializing,   ///< prepare() running
    Ready,
    Degraded,       ///< Prepared, but the last health probe failed
    Failed          ///< prepare() failed; not selectable until re-initialized
};

const char* backend_state_name(BackendState state);

/**
 * @brief Result of a cheap health probe
 */
struct HealthProbe {
    bool ready = false;
    std::string reason;       ///< Why not ready (empty when ready)
    std::string remediation;  ///< What an operator can do about it

    static HealthProbe healthy() {
        HealthProbe probe;
        probe.ready = true;
        return probe;
    }

    static HealthProbe unhealthy(const std::string& reason, const std::string& remediation = "") {
        HealthProbe probe;
        probe.ready = false;
        probe.reason = reason;
        probe.remediation = remediation;
        return probe;
    }
};

/**
 * @brief Readiness half of a backend: identity, one-time preparation, health
 */
class BackendProvider {
public:
    virtual ~BackendProvider() = default;

    /// Stable key, e.g. "whisper_api"
    virtual std::string id() const = 0;

    virtual std::string display_name() const = 0;

    virtual std::string description() const { return ""; }

    /**
     * @brief One-time readiness preparation
     *
     * Called at most once per successful attempt, on a registry thread.
     * Must be safe to retry after a failure.
     */
    virtual VoidResult prepare() = 0;

    /**
     * @brief Cheap probe; must not redo preparation
     */
    virtual HealthProbe health_check() = 0;
};

/**
 * @brief Per-provider status snapshot returned by BackendRegistry::health()/list()
 */
struct BackendStatus {
    std::string id;
    std::string display_name;
    std::string description;
    BackendState state = BackendState::Unregistered;
    bool selected = false;
    std::string reason;
    std::string remediation;
    std::string checked_at;  ///< ISO timestamp of the cached probe, empty if never probed

    bool ready() const { return state == BackendState::Ready; }

    nlohmann::json to_json() const;
};

} // namespace conductor
