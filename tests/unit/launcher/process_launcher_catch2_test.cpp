// Launch specs and the dry-run executor

#include <catch2/catch_test_macros.hpp>

#include <common/test_helpers_catch2.h>
#include <v6boot/launcher/bootstrap_sequence.h>
#include <v6boot/hooks/launch_context.h>
#include <v6boot/launcher/process_launcher.h>

#include <type_traits>

using namespace v6boot;
using namespace v6boot::launcher;
using v6boot::test::ScopedLogCapture;

TEST_CASE("ProcessLauncher - node launch command", "[launcher][catch2]") {
    config::LaunchCommand cmd{"vnode-local", {"start", "--dockerized", "-e", "application"}};
    auto spec = buildLaunchSpec(cmd, "/mnt/config/config.yaml");

    CHECK(spec.program == "vnode-local");
    CHECK(spec.args == std::vector<std::string>{"start", "--dockerized", "-e", "application",
                                                "--config", "/mnt/config/config.yaml"});
    CHECK(describe(spec) ==
          "vnode-local start --dockerized -e application --config /mnt/config/config.yaml");
}

TEST_CASE("ProcessLauncher - describe quotes arguments with spaces", "[launcher][catch2]") {
    LaunchSpec spec;
    spec.program = "vserver-local";
    spec.args = {"start", "--config", "/mnt/my config.yaml"};
    CHECK(describe(spec) == "vserver-local start --config '/mnt/my config.yaml'");
}

TEST_CASE("LaunchSpec - setEnv replaces existing entries", "[launcher][catch2]") {
    LaunchSpec spec;
    spec.setEnv("A", "1");
    spec.setEnv("B", "2");
    spec.setEnv("A", "3");
    REQUIRE(spec.env.size() == 2);
    CHECK(spec.env[0].second == "3");
    CHECK(spec.env[1].first == "B");
}

TEST_CASE("LaunchSpec - hooks and launcher share one type", "[launcher][catch2]") {
    STATIC_REQUIRE(std::is_same_v<LaunchSpec, hooks::LaunchSpec>);
    STATIC_REQUIRE(std::is_same_v<LaunchContext, hooks::LaunchContext>);
}

TEST_CASE("DryRunExecutor - logs instead of replacing the process", "[launcher][catch2]") {
    LaunchSpec spec;
    spec.program = "vserver-local";
    spec.args = {"start", "-e", "application"};
    spec.setEnv("V6_PRE_HOOK_APPLIED", "1");

    ScopedLogCapture logs;
    DryRunExecutor executor;
    REQUIRE(executor.replaceProcess(spec));
    CHECK(logs.contains("[dry-run] env V6_PRE_HOOK_APPLIED=1"));
    CHECK(logs.contains("[dry-run] would exec: vserver-local start -e application"));
}

TEST_CASE("ExecProcessExecutor - rejects an empty program", "[launcher][catch2]") {
    ExecProcessExecutor executor;
    auto r = executor.replaceProcess(LaunchSpec{});
    REQUIRE_FALSE(r);
    CHECK(r.error().code == ErrorCode::InvalidArgument);
}

TEST_CASE("ExecProcessExecutor - unknown program returns instead of exiting", "[launcher][catch2]") {
    LaunchSpec spec;
    spec.program = "/nonexistent/v6boot-test-binary";
    auto executor = makeExecProcessExecutor();
    auto r = executor->replaceProcess(spec);
    REQUIRE_FALSE(r);
    CHECK(r.error().code == ErrorCode::InternalError);
}

TEST_CASE("BootstrapSequence - exit codes per failure cause", "[launcher][catch2]") {
    CHECK(exitCodeFor(Error{ErrorCode::ReadinessTimeout}) == 2);
    CHECK(exitCodeFor(Error{ErrorCode::InterruptedSetup}) == 3);
    CHECK(exitCodeFor(Error{ErrorCode::UnresolvableTemplate}) == 4);
    CHECK(exitCodeFor(Error{ErrorCode::DuplicateResourceName}) == 5);
    CHECK(exitCodeFor(Error{ErrorCode::FileNotFound}) == 1);
    CHECK(exitCodeFor(Error{ErrorCode::HookFailed}) == 1);
}
