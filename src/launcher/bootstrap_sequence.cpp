#include <v6boot/launcher/bootstrap_sequence.h>
#include <v6boot/render/template_renderer.h>

#include <spdlog/spdlog.h>

namespace v6boot::launcher {

namespace fs = std::filesystem;

BootstrapSequence::BootstrapSequence(config::BootstrapSettings settings, BootstrapDependencies deps)
    : settings_(std::move(settings)), deps_(std::move(deps)), loader_(registry_) {}

BootstrapSequence::~BootstrapSequence() = default;

Result<BootstrapReport> BootstrapSequence::run() {
    if (!deps_.markerStore || !deps_.executor) {
        return Error{ErrorCode::InvalidArgument, "Bootstrap needs a marker store and an executor"};
    }

    const bool node = settings_.role == config::Role::Node;
    BootstrapReport report;

    if (node) {
        if (auto r = waitForUpstream(report); !r) {
            return r.error();
        }
    }

    if (auto r = runSetup(report); !r) {
        return r.error();
    }

    if (node) {
        spdlog::info("Reading databases config and setting environment for the dockerized node");
        if (auto r = exportDerivedEnvironment(report); !r) {
            return r.error();
        }
    }

    auto loaded = loader_.loadHookIfPresent(settings_.hookPath);
    if (!loaded) {
        return loaded.error();
    }
    report.hookLoaded = loaded.value();

    if (auto r = launch(report); !r) {
        return r.error();
    }
    return report;
}

Result<void> BootstrapSequence::waitForUpstream(BootstrapReport& report) {
    if (!deps_.httpProbe) {
        return Error{ErrorCode::InvalidArgument, "Node bootstrap needs an HTTP probe"};
    }
    probe::ReadinessProber prober(*deps_.httpProbe, deps_.sleeper);
    probe::ProbePolicy policy;
    policy.attempts = settings_.probe.attempts;
    policy.timeoutPerAttempt = settings_.probe.timeout;
    policy.interval = settings_.probe.interval;

    auto outcome = prober.waitUntilReady(settings_.probe.url, policy);
    report.probe = outcome;
    return probe::toResult(outcome, settings_.probe.url);
}

Result<void> BootstrapSequence::runSetup(BootstrapReport& report) {
    const bool node = settings_.role == config::Role::Node;
    guard::BootstrapGuard guard(*deps_.markerStore);

    auto outcome = guard.runOnce(settings_.setupRoutineName(), [&]() -> Result<void> {
        if (node) {
            if (auto r = provisionDirectories(); !r) {
                return r;
            }
        } else {
            spdlog::info("This is the first time we're upping this container");
        }
        auto resolved = resolveConfiguration();
        if (!resolved) {
            return resolved.error();
        }
        report.resolve = resolved.value();
        return {};
    });
    if (!outcome) {
        return outcome.error();
    }
    report.setup = outcome.value();
    return {};
}

Result<void> BootstrapSequence::provisionDirectories() {
    for (const auto& dir : settings_.workingDirs) {
        std::error_code ec;
        fs::create_directories(dir, ec);
        if (ec) {
            return Error{ErrorCode::PermissionDenied,
                         "Cannot create directory " + dir.string() + ": " + ec.message()};
        }
        spdlog::debug("Provisioned {}", dir.string());
    }
    return {};
}

Result<resolver::ResolveOutcome> BootstrapSequence::resolveConfiguration() {
    auto context = render::SubstitutionContext::fromEnvironment(settings_.substitutionPrefix);
    resolver::ConfigResolver resolver(context);

    resolver::ResolveRequest request;
    request.targetPath = settings_.configPath;
    request.templateCandidates =
        resolver::standardCandidates(settings_.templatePath, settings_.minimalTemplatePath);
    if (settings_.role == config::Role::Node && !settings_.databasesDir.empty()) {
        request.auxiliaryDirs.push_back(settings_.databasesDir);
    }
    return resolver.resolve(request);
}

Result<void> BootstrapSequence::exportDerivedEnvironment(BootstrapReport& report) {
    auto resources =
        environment::loadAuxiliaryResources(settings_.configPath, settings_.databasesSection);
    if (!resources) {
        return resources.error();
    }
    if (resources.value().empty()) {
        spdlog::warn("No databases declared under '{}' in {}", settings_.databasesSection,
                     settings_.configPath.string());
    }

    environment::NamingConvention naming;
    naming.mountPrefix = settings_.databasesMountPrefix;
    auto assignments = environment::deriveEnv(resources.value(), naming);
    if (!assignments) {
        return assignments.error();
    }
    if (auto r = environment::exportToProcess(assignments.value()); !r) {
        return r;
    }
    report.exported = assignments.value();
    return {};
}

Result<void> BootstrapSequence::launch(BootstrapReport& report) {
    LaunchContext context;
    context.role = settings_.role;
    context.configPath = settings_.configPath;
    context.spec = buildLaunchSpec(settings_.launch, settings_.configPath);

    if (auto r = registry_.run(hooks::HookPoint::AfterSetup, context); !r) {
        return r;
    }
    if (auto r = registry_.run(hooks::HookPoint::BeforeLaunch, context); !r) {
        return r;
    }

    report.launched = context.spec;
    spdlog::info("Starting vantage6 {}", config::roleName(settings_.role));
    return deps_.executor->replaceProcess(context.spec);
}

int exitCodeFor(const Error& error) {
    switch (error.code) {
        case ErrorCode::ReadinessTimeout: return 2;
        case ErrorCode::InterruptedSetup: return 3;
        case ErrorCode::UnresolvableTemplate: return 4;
        case ErrorCode::DuplicateResourceName: return 5;
        default: return 1;
    }
}

} // namespace v6boot::launcher
