#pragma once

#include <v6boot/core/types.h>

#include <filesystem>
#include <string>
#include <vector>

namespace v6boot::config {

enum class Role { Node, Server };

constexpr const char* roleName(Role role) {
    switch (role) {
        case Role::Node: return "node";
        case Role::Server: return "server";
    }
    return "unknown";
}

// Fixed defaults; every one of them can be overridden from the environment.
inline constexpr const char* kDefaultConfigPath = "/mnt/config/config.yaml";
inline constexpr const char* kDefaultTemplatePath = "/mnt/config/config.yaml.j2";
inline constexpr const char* kDefaultMinimalTemplateRoot = "/vantage6/docker";
inline constexpr const char* kDefaultDatabasesDir = "/mnt/databases";
inline constexpr const char* kDefaultMarkerDir = "/var/run";
inline constexpr const char* kDefaultHookPath = "/custom-start.d/pre_run.so";
inline constexpr const char* kDefaultApiPath = "/api";
inline constexpr const char* kDefaultDatabasesSection = "application.databases";
inline constexpr const char* kDefaultDatabasesMount = "/databases";

struct ProbeSettings {
    std::string url;
    int attempts{5};
    Duration timeout{4000};
    Duration interval{5000};
};

struct LaunchCommand {
    std::string program;
    std::vector<std::string> args; // config path is appended by the launcher
};

/**
 * Everything one bootstrap run needs to know, resolved once at startup.
 */
struct BootstrapSettings {
    Role role{Role::Node};

    std::filesystem::path configPath{kDefaultConfigPath};
    std::filesystem::path templatePath{kDefaultTemplatePath};
    std::filesystem::path minimalTemplatePath;
    std::filesystem::path markerDir{kDefaultMarkerDir};
    std::filesystem::path hookPath{kDefaultHookPath};

    // Node role only
    std::filesystem::path databasesDir{kDefaultDatabasesDir};
    std::vector<std::filesystem::path> workingDirs;
    std::string databasesSection{kDefaultDatabasesSection};
    std::string databasesMountPrefix{kDefaultDatabasesMount};
    ProbeSettings probe;

    LaunchCommand launch;
    std::string substitutionPrefix{"V6_"};
    bool dryRun{false};

    // Name of the one-time setup routine guarded by the marker
    std::string setupRoutineName() const;

    static Result<BootstrapSettings> fromEnvironment(Role role);
};

// "<V6_SERVER_URL>:<V6_SERVER_PORT><V6_API_PATH>/version", or V6_SERVER_PROBE_URL verbatim
Result<std::string> probeUrlFromEnvironment();

} // namespace v6boot::config
