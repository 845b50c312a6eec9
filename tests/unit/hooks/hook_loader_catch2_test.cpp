// Extension hooks: registry ordering and loading the example shared object

#include <catch2/catch_test_macros.hpp>

#include <common/test_helpers_catch2.h>
#include <v6boot/hooks/hook_loader.h>
#include <v6boot/hooks/hook_registry.h>

#include <vector>

using namespace v6boot;
using namespace v6boot::hooks;
using v6boot::test::ScopedEnvVar;
using v6boot::test::ScopedLogCapture;
using v6boot::test::TempDir;
using v6boot::test::write_file;

namespace {

LaunchContext nodeContext() {
    LaunchContext ctx;
    ctx.role = config::Role::Node;
    ctx.configPath = "/mnt/config/config.yaml";
    ctx.spec.program = "vnode-local";
    ctx.spec.args = {"start", "--dockerized", "-e", "application", "--config",
                     "/mnt/config/config.yaml"};
    return ctx;
}

} // namespace

TEST_CASE("HookRegistry - runs callbacks of one point in order", "[hooks][catch2]") {
    HookRegistry registry;
    std::vector<std::string> order;
    registry.on(HookPoint::BeforeLaunch, "first", [&](LaunchContext&) -> Result<void> {
        order.push_back("first");
        return {};
    });
    registry.on(HookPoint::AfterSetup, "setup", [&](LaunchContext&) -> Result<void> {
        order.push_back("setup");
        return {};
    });
    registry.on(HookPoint::BeforeLaunch, "second", [&](LaunchContext& ctx) -> Result<void> {
        order.push_back("second");
        ctx.spec.setEnv("V6_SEEN", "1");
        return {};
    });

    CHECK(registry.count(HookPoint::BeforeLaunch) == 2);
    CHECK(registry.count(HookPoint::AfterSetup) == 1);

    auto ctx = nodeContext();
    REQUIRE(registry.run(HookPoint::BeforeLaunch, ctx));
    CHECK(order == std::vector<std::string>{"first", "second"});
    REQUIRE(ctx.spec.env.size() == 1);
    CHECK(ctx.spec.env[0].first == "V6_SEEN");
}

TEST_CASE("HookRegistry - failure stops the point", "[hooks][catch2]") {
    HookRegistry registry;
    int later = 0;
    registry.on(HookPoint::AfterSetup, "broken", [](LaunchContext&) -> Result<void> {
        return Error{ErrorCode::InvalidState, "nope"};
    });
    registry.on(HookPoint::AfterSetup, "later", [&](LaunchContext&) -> Result<void> {
        ++later;
        return {};
    });

    auto ctx = nodeContext();
    auto r = registry.run(HookPoint::AfterSetup, ctx);
    REQUIRE_FALSE(r);
    CHECK(r.error().code == ErrorCode::HookFailed);
    CHECK(r.error().message.find("'broken'") != std::string::npos);
    CHECK(later == 0);
}

TEST_CASE("HookLoader - absent hook is logged and skipped", "[hooks][catch2]") {
    TempDir dir;
    HookRegistry registry;
    HookLoader loader(registry);
    ScopedLogCapture logs;

    auto r = loader.loadHookIfPresent(dir / "pre_run.so");
    REQUIRE(r);
    CHECK_FALSE(r.value());
    CHECK(loader.loadedCount() == 0);
    CHECK(logs.contains("No pre-hook found"));
}

TEST_CASE("HookLoader - directory at the hook path is not a hook", "[hooks][catch2]") {
    TempDir dir;
    std::filesystem::create_directories(dir / "pre_run.so");
    HookRegistry registry;
    HookLoader loader(registry);
    ScopedLogCapture logs;

    auto r = loader.loadHookIfPresent(dir / "pre_run.so");
    REQUIRE(r);
    CHECK_FALSE(r.value());
    CHECK(loader.loadedCount() == 0);
    CHECK(logs.contains("No pre-hook found"));
}

TEST_CASE("HookLoader - file that is not a shared object", "[hooks][catch2]") {
    TempDir dir;
    auto path = write_file(dir / "pre_run.so", "#!/bin/sh\necho hi\n");
    HookRegistry registry;
    HookLoader loader(registry);

    auto r = loader.loadHookIfPresent(path);
    REQUIRE_FALSE(r);
    CHECK(r.error().code == ErrorCode::HookFailed);
}

TEST_CASE("HookLoader - example hook registers both points", "[hooks][catch2]") {
    ScopedEnvVar program("V6_EXAMPLE_PROGRAM", std::nullopt);
    ScopedEnvVar fail("V6_EXAMPLE_FAIL", std::nullopt);

    HookRegistry registry;
    HookLoader loader(registry);
    ScopedLogCapture logs;

    auto r = loader.loadHookIfPresent(V6BOOT_TEST_HOOK_PATH);
    REQUIRE(r);
    CHECK(r.value());
    CHECK(loader.loadedCount() == 1);
    CHECK(registry.count(HookPoint::AfterSetup) == 1);
    CHECK(registry.count(HookPoint::BeforeLaunch) == 1);

    auto ctx = nodeContext();
    REQUIRE(registry.run(HookPoint::AfterSetup, ctx));
    CHECK(logs.contains("[hook] configuration ready at /mnt/config/config.yaml for node"));

    REQUIRE(registry.run(HookPoint::BeforeLaunch, ctx));
    CHECK(ctx.spec.program == "vnode-local");
    REQUIRE(ctx.spec.env.size() == 1);
    CHECK(ctx.spec.env[0] == std::pair<std::string, std::string>{"V6_PRE_HOOK_APPLIED", "1"});
}

TEST_CASE("HookLoader - example hook can replace the launch", "[hooks][catch2]") {
    ScopedEnvVar program("V6_EXAMPLE_PROGRAM", std::string("/usr/bin/env"));
    ScopedEnvVar arg("V6_EXAMPLE_ARG", std::string("-u"));
    ScopedEnvVar fail("V6_EXAMPLE_FAIL", std::nullopt);

    HookRegistry registry;
    HookLoader loader(registry);
    REQUIRE(loader.loadHookIfPresent(V6BOOT_TEST_HOOK_PATH));

    auto ctx = nodeContext();
    const auto originalArgs = ctx.spec.args;
    REQUIRE(registry.run(HookPoint::BeforeLaunch, ctx));
    CHECK(ctx.spec.program == "/usr/bin/env");
    REQUIRE(ctx.spec.args.size() == originalArgs.size() + 1);
    CHECK(ctx.spec.args.front() == "-u");
    CHECK(std::vector<std::string>(ctx.spec.args.begin() + 1, ctx.spec.args.end()) ==
          originalArgs);
}

TEST_CASE("HookLoader - failing hook callback surfaces as an error", "[hooks][catch2]") {
    ScopedEnvVar program("V6_EXAMPLE_PROGRAM", std::nullopt);
    ScopedEnvVar fail("V6_EXAMPLE_FAIL", std::string("1"));

    HookRegistry registry;
    HookLoader loader(registry);
    REQUIRE(loader.loadHookIfPresent(V6BOOT_TEST_HOOK_PATH));

    auto ctx = nodeContext();
    auto r = registry.run(HookPoint::BeforeLaunch, ctx);
    REQUIRE_FALSE(r);
    CHECK(r.error().code == ErrorCode::HookFailed);
}
