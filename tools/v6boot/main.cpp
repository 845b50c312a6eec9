#include <v6boot/config/bootstrap_settings.h>
#include <v6boot/config/config_helpers.h>
#include <v6boot/guard/marker_store.h>
#include <v6boot/launcher/bootstrap_sequence.h>
#include <v6boot/probe/readiness_prober.h>
#include <v6boot/version.hpp>

#include <CLI/CLI.hpp>
#include <spdlog/sinks/stderr_color_sink.h>
#include <spdlog/spdlog.h>

#include <chrono>
#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <exception>
#include <optional>
#include <string>
#include <thread>

namespace {

void log_fatal(const char* what) {
    try {
        spdlog::critical("FATAL: {}", what);
    } catch (const std::exception&) {
        std::fprintf(stderr, "FATAL: %s\n", what);
    }
}

void signal_handler(int signo) {
    const char* sigstr = (signo == SIGSEGV)   ? "SIGSEGV"
                         : (signo == SIGABRT) ? "SIGABRT"
                                              : "UNKNOWN";
    log_fatal(sigstr);
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    std::_Exit(128 + signo);
}

void setup_fatal_handlers() {
    std::signal(SIGSEGV, signal_handler);
    std::signal(SIGABRT, signal_handler);
}

void setup_logging(const std::string& level) {
    auto logger = spdlog::stderr_color_mt("v6boot");
    spdlog::set_default_logger(logger);
    spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] %v");
    auto lvl = spdlog::level::from_str(v6boot::config::to_lower(level));
    if (lvl == spdlog::level::off && v6boot::config::to_lower(level) != "off") {
        lvl = spdlog::level::info;
    }
    spdlog::set_level(lvl);
}

// Options that override the environment for one run
struct Overrides {
    std::string configPath;
    std::string templatePath;
    std::string minimalTemplatePath;
    std::string markerDir;
    std::string hookPath;
    std::string probeUrl;
    std::optional<int> probeAttempts;
    std::optional<long long> probeTimeoutMs;
    std::optional<long long> probeIntervalMs;
    bool dryRun{false};
};

void add_common_options(CLI::App* cmd, Overrides& o) {
    cmd->add_option("--config", o.configPath, "Resolved configuration path [V6_CONFIG_PATH]");
    cmd->add_option("--template", o.templatePath,
                    "Operator template path [V6_CONFIG_TEMPLATE_PATH]");
    cmd->add_option("--minimal-template", o.minimalTemplatePath,
                    "Built-in minimal template path [V6_MINIMAL_CONFIG_TEMPLATE_PATH]");
    cmd->add_option("--marker-dir", o.markerDir,
                    "Directory holding run-once markers [V6_RUN_MARKER_DIR]");
    cmd->add_option("--hook", o.hookPath, "Extension hook shared object [V6_PRE_HOOK_PATH]");
    cmd->add_flag("--dry-run", o.dryRun, "Run every stage but log the launch instead of exec");
}

void apply(const Overrides& o, v6boot::config::BootstrapSettings& s) {
    if (!o.configPath.empty())
        s.configPath = o.configPath;
    if (!o.templatePath.empty())
        s.templatePath = o.templatePath;
    if (!o.minimalTemplatePath.empty())
        s.minimalTemplatePath = o.minimalTemplatePath;
    if (!o.markerDir.empty())
        s.markerDir = o.markerDir;
    if (!o.hookPath.empty())
        s.hookPath = o.hookPath;
    if (!o.probeUrl.empty())
        s.probe.url = o.probeUrl;
    if (o.probeAttempts)
        s.probe.attempts = *o.probeAttempts;
    if (o.probeTimeoutMs)
        s.probe.timeout = std::chrono::milliseconds(*o.probeTimeoutMs);
    if (o.probeIntervalMs)
        s.probe.interval = std::chrono::milliseconds(*o.probeIntervalMs);
    s.dryRun = o.dryRun;
}

int run_role(v6boot::config::Role role, const Overrides& overrides) {
    using namespace v6boot;

    // An explicit probe URL makes V6_SERVER_URL optional
    if (role == config::Role::Node && !overrides.probeUrl.empty() &&
        !config::get_env("V6_SERVER_PROBE_URL")) {
        ::setenv("V6_SERVER_PROBE_URL", overrides.probeUrl.c_str(), 1);
    }

    auto settings = config::BootstrapSettings::fromEnvironment(role);
    if (!settings) {
        spdlog::error("{}", settings.error().message);
        return launcher::exitCodeFor(settings.error());
    }
    auto s = std::move(settings).value();
    apply(overrides, s);

    auto markers = guard::makeFileMarkerStore(s.markerDir);
    std::unique_ptr<probe::IHttpProbe> http;
    if (role == config::Role::Node) {
        http = probe::makeCurlHttpProbe();
    }
    std::unique_ptr<launcher::IProcessExecutor> executor;
    if (s.dryRun) {
        executor = std::make_unique<launcher::DryRunExecutor>();
    } else {
        executor = launcher::makeExecProcessExecutor();
    }

    launcher::BootstrapDependencies deps;
    deps.httpProbe = http.get();
    deps.markerStore = markers.get();
    deps.executor = executor.get();

    spdlog::info("v6boot {} bootstrapping vantage6 {}", V6BOOT_VERSION_STRING,
                 config::roleName(role));
    launcher::BootstrapSequence sequence(std::move(s), deps);
    auto result = sequence.run();
    if (!result) {
        const auto& err = result.error();
        spdlog::critical("{}: {}", errorToString(err.code), err.message);
        return launcher::exitCodeFor(err);
    }
    return 0;
}

} // namespace

int main(int argc, char* argv[]) {
    setup_fatal_handlers();

    CLI::App app{"v6boot - prepares the container and launches a vantage6 node or server",
                 "v6boot"};
    app.set_version_flag("--version", V6BOOT_VERSION_LONG_STRING);
    app.require_subcommand(1);

    std::string logLevel = v6boot::config::env_or("V6_BOOT_LOG_LEVEL", "info");
    app.add_option("--log-level", logLevel, "Log level (trace/debug/info/warn/error)")
        ->capture_default_str();

    Overrides nodeOpts;
    auto* node = app.add_subcommand("node", "Wait for the server, set up once and start the node");
    add_common_options(node, nodeOpts);
    node->add_option("--probe-url", nodeOpts.probeUrl,
                     "Readiness URL [V6_SERVER_PROBE_URL or V6_SERVER_URL:PORT/API_PATH/version]");
    node->add_option("--probe-attempts", nodeOpts.probeAttempts, "Readiness attempts (default 5)")
        ->check(CLI::PositiveNumber);
    node->add_option("--probe-timeout", nodeOpts.probeTimeoutMs,
                     "Per-attempt timeout in ms (default 4000)")
        ->check(CLI::PositiveNumber);
    node->add_option("--probe-interval", nodeOpts.probeIntervalMs,
                     "Wait between attempts in ms (default 5000)")
        ->check(CLI::NonNegativeNumber);

    Overrides serverOpts;
    auto* server = app.add_subcommand("server", "Set up once and start the server");
    add_common_options(server, serverOpts);

    CLI11_PARSE(app, argc, argv);

    setup_logging(logLevel);

    try {
        if (node->parsed()) {
            return run_role(v6boot::config::Role::Node, nodeOpts);
        }
        return run_role(v6boot::config::Role::Server, serverOpts);
    } catch (const std::exception& e) {
        spdlog::critical("Unhandled exception: {}", e.what());
        return 1;
    }
}
