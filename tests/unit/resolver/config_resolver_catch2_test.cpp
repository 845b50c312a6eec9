// Configuration resolution: existing document, operator template, built-in fallback

#include <catch2/catch_test_macros.hpp>

#include <common/test_helpers_catch2.h>
#include <v6boot/resolver/config_resolver.h>

#include <sys/stat.h>

using namespace v6boot;
using namespace v6boot::resolver;
using v6boot::test::read_file;
using v6boot::test::ScopedLogCapture;
using v6boot::test::TempDir;
using v6boot::test::write_file;

namespace fs = std::filesystem;

namespace {

ResolveRequest requestFor(const TempDir& dir) {
    ResolveRequest req;
    req.targetPath = dir / "config" / "config.yaml";
    req.templateCandidates =
        standardCandidates(dir / "config" / "config.yaml.j2", dir / "builtin" / "minimal.yaml.j2");
    return req;
}

} // namespace

TEST_CASE("ConfigResolver - existing document is used verbatim", "[resolver][catch2]") {
    TempDir dir;
    auto req = requestFor(dir);
    write_file(req.targetPath, "application: {}\n");
    write_file(req.templateCandidates[0].path, "application: {{ V6_UNDEFINED }}\n");

    render::SubstitutionContext ctx;
    ConfigResolver resolver(ctx);
    auto out = resolver.resolve(req);
    REQUIRE(out);
    CHECK(out.value().action == ResolveAction::NoOp);
    CHECK(out.value().sourceKind == CandidateKind::Resolved);
    CHECK(out.value().configPath == req.targetPath);
    CHECK(read_file(req.targetPath) == "application: {}\n");
}

TEST_CASE("ConfigResolver - operator template takes precedence", "[resolver][catch2]") {
    TempDir dir;
    auto req = requestFor(dir);
    write_file(req.templateCandidates[0].path, "api_key: {{ V6_API_KEY }}\n");
    write_file(req.templateCandidates[1].path, "minimal: true\n");

    render::SubstitutionContext ctx(std::map<std::string, std::string>{{"V6_API_KEY", "k"}});
    ConfigResolver resolver(ctx);
    ScopedLogCapture logs;
    auto out = resolver.resolve(req);
    REQUIRE(out);
    CHECK(out.value().action == ResolveAction::Rendered);
    CHECK(out.value().sourceKind == CandidateKind::Operator);
    CHECK_FALSE(out.value().usedFallback());
    CHECK(out.value().bytesWritten == std::string("api_key: k").size());
    CHECK(read_file(req.targetPath) == "api_key: k");
    CHECK_FALSE(logs.contains("only meant for testing"));
}

TEST_CASE("ConfigResolver - built-in template is a logged fallback", "[resolver][catch2]") {
    TempDir dir;
    auto req = requestFor(dir);
    write_file(req.templateCandidates[1].path, "minimal: {{ V6_FLAG | default(\"on\") }}\n");

    render::SubstitutionContext ctx;
    ConfigResolver resolver(ctx);
    ScopedLogCapture logs;
    auto out = resolver.resolve(req);
    REQUIRE(out);
    CHECK(out.value().usedFallback());
    CHECK(out.value().source == req.templateCandidates[1].path);
    CHECK(read_file(req.targetPath) == "minimal: on");
    CHECK(logs.contains("[warning] This minimal config is only meant for testing purposes!"));
}

TEST_CASE("ConfigResolver - second resolve does not rewrite", "[resolver][catch2]") {
    TempDir dir;
    auto req = requestFor(dir);
    write_file(req.templateCandidates[0].path, "n: {{ V6_N }}\n");

    render::SubstitutionContext first(std::map<std::string, std::string>{{"V6_N", "1"}});
    REQUIRE(ConfigResolver(first).resolve(req));

    render::SubstitutionContext second(std::map<std::string, std::string>{{"V6_N", "2"}});
    auto again = ConfigResolver(second).resolve(req);
    REQUIRE(again);
    CHECK(again.value().action == ResolveAction::NoOp);
    CHECK(read_file(req.targetPath) == "n: 1");
}

TEST_CASE("ConfigResolver - resolved document is private to the owner", "[resolver][catch2]") {
    TempDir dir;
    auto req = requestFor(dir);
    write_file(req.templateCandidates[0].path, "secret: {{ V6_SECRET }}\n");

    render::SubstitutionContext ctx(std::map<std::string, std::string>{{"V6_SECRET", "hunter2"}});
    const mode_t before = ::umask(022);
    auto out = ConfigResolver(ctx).resolve(req);
    const mode_t after = ::umask(before);
    REQUIRE(out);

    CHECK(after == 022);
    const auto perms = fs::status(req.targetPath).permissions();
    CHECK((perms & (fs::perms::group_all | fs::perms::others_all)) == fs::perms::none);
    CHECK((perms & fs::perms::owner_read) == fs::perms::owner_read);
}

TEST_CASE("ConfigResolver - undefined variable leaves nothing behind", "[resolver][catch2]") {
    TempDir dir;
    auto req = requestFor(dir);
    write_file(req.templateCandidates[0].path, "api_key: {{ V6_API_KEY }}\n");

    render::SubstitutionContext ctx;
    auto out = ConfigResolver(ctx).resolve(req);
    REQUIRE_FALSE(out);
    CHECK(out.error().code == ErrorCode::UnresolvableTemplate);
    CHECK_FALSE(fs::exists(req.targetPath));
    for (const auto& entry : fs::directory_iterator(req.targetPath.parent_path())) {
        CHECK(entry.path().filename().string().find(".tmp.") == std::string::npos);
    }
}

TEST_CASE("ConfigResolver - no candidate at all", "[resolver][catch2]") {
    TempDir dir;
    auto req = requestFor(dir);

    render::SubstitutionContext ctx;
    auto out = ConfigResolver(ctx).resolve(req);
    REQUIRE_FALSE(out);
    CHECK(out.error().code == ErrorCode::FileNotFound);
}

TEST_CASE("ConfigResolver - auxiliary directories feed includes", "[resolver][catch2]") {
    TempDir dir;
    auto req = requestFor(dir);
    req.auxiliaryDirs.push_back(dir / "databases");
    write_file(req.templateCandidates[0].path,
               "databases:\n{% include \"databases.yaml.j2\" ignore missing %}");
    write_file(dir / "databases" / "databases.yaml.j2", "  - label: main\n");

    render::SubstitutionContext ctx;
    auto out = ConfigResolver(ctx).resolve(req);
    REQUIRE(out);
    CHECK(read_file(req.targetPath) == "databases:\n  - label: main");
}

TEST_CASE("UmaskGuard - restores the previous mask", "[resolver][catch2]") {
    const mode_t original = ::umask(022);
    {
        UmaskGuard guard(077);
        CHECK(guard.previous() == 022);
        const mode_t inside = ::umask(077);
        CHECK(inside == 077);
    }
    const mode_t restored = ::umask(original);
    CHECK(restored == 022);
}
