#pragma once

#include <v6boot/config/bootstrap_settings.h>
#include <v6boot/core/types.h>
#include <v6boot/environment/derived_env.h>
#include <v6boot/guard/bootstrap_guard.h>
#include <v6boot/hooks/hook_loader.h>
#include <v6boot/hooks/hook_registry.h>
#include <v6boot/launcher/process_launcher.h>
#include <v6boot/probe/readiness_prober.h>
#include <v6boot/resolver/config_resolver.h>

#include <optional>

namespace v6boot::launcher {

/**
 * Collaborators a bootstrap run talks to. Not owned.
 */
struct BootstrapDependencies {
    probe::IHttpProbe* httpProbe{nullptr}; // required for the node role
    probe::ReadinessProber::Sleeper sleeper;
    guard::IMarkerStore* markerStore{nullptr};
    IProcessExecutor* executor{nullptr};
};

struct BootstrapReport {
    std::optional<probe::ProbeReport> probe;
    guard::GuardOutcome setup{guard::GuardOutcome::AlreadyDone};
    std::optional<resolver::ResolveOutcome> resolve; // only when setup ran
    environment::EnvAssignments exported;
    bool hookLoaded{false};
    LaunchSpec launched;
};

/**
 * The per-role startup sequence.
 *
 * node:   probe upstream -> run once(provision dirs + resolve config) -> export
 *         database environment -> load hook -> after_setup -> before_launch -> exec
 * server: run once(resolve config) -> load hook -> after_setup -> before_launch -> exec
 *
 * Every failure aborts the sequence before anything is launched. With a real
 * executor run() only returns on failure.
 */
class BootstrapSequence {
public:
    BootstrapSequence(config::BootstrapSettings settings, BootstrapDependencies deps);
    ~BootstrapSequence();

    BootstrapSequence(const BootstrapSequence&) = delete;
    BootstrapSequence& operator=(const BootstrapSequence&) = delete;

    // In-process hook registrations, in addition to whatever the hook file adds
    hooks::HookRegistry& hooks() { return registry_; }

    Result<BootstrapReport> run();

    const config::BootstrapSettings& settings() const { return settings_; }

private:
    Result<void> waitForUpstream(BootstrapReport& report);
    Result<void> runSetup(BootstrapReport& report);
    Result<void> provisionDirectories();
    Result<resolver::ResolveOutcome> resolveConfiguration();
    Result<void> exportDerivedEnvironment(BootstrapReport& report);
    Result<void> launch(BootstrapReport& report);

    config::BootstrapSettings settings_;
    BootstrapDependencies deps_;
    hooks::HookRegistry registry_;
    hooks::HookLoader loader_;
};

// Process exit status for a fatal error (distinct per cause)
int exitCodeFor(const Error& error);

} // namespace v6boot::launcher
