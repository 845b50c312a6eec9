#include <v6boot/config/bootstrap_settings.h>
#include <v6boot/config/config_helpers.h>

#include <spdlog/spdlog.h>

namespace v6boot::config {

namespace fs = std::filesystem;

std::string BootstrapSettings::setupRoutineName() const {
    return std::string("setup_") + roleName(role);
}

Result<std::string> probeUrlFromEnvironment() {
    if (auto explicitUrl = get_env("V6_SERVER_PROBE_URL")) {
        return *explicitUrl;
    }

    auto server = get_env("V6_SERVER_URL");
    if (!server) {
        return Error{ErrorCode::InvalidArgument,
                     "V6_SERVER_URL is not set; cannot determine the server to wait for"};
    }

    std::string base = *server;
    while (!base.empty() && base.back() == '/') {
        base.pop_back();
    }
    if (auto port = get_env("V6_SERVER_PORT")) {
        base += ":" + *port;
    }
    const auto apiPath = env_or("V6_API_PATH", kDefaultApiPath);
    return join_url(base, {apiPath, "version"});
}

Result<BootstrapSettings> BootstrapSettings::fromEnvironment(Role role) {
    BootstrapSettings s;
    s.role = role;

    s.configPath = env_path_or("V6_CONFIG_PATH", kDefaultConfigPath);
    s.templatePath = env_path_or("V6_CONFIG_TEMPLATE_PATH", kDefaultTemplatePath);
    s.minimalTemplatePath =
        env_path_or("V6_MINIMAL_CONFIG_TEMPLATE_PATH",
                    fs::path(kDefaultMinimalTemplateRoot) / roleName(role) / "minimal_config.yaml.j2");
    s.markerDir = env_path_or("V6_RUN_MARKER_DIR", kDefaultMarkerDir);
    s.hookPath = env_path_or("V6_PRE_HOOK_PATH", kDefaultHookPath);

    if (role == Role::Node) {
        s.databasesDir = env_path_or("V6_NODE_DATABASES_DIR", kDefaultDatabasesDir);
        s.workingDirs = {
            env_path_or("V6_NODE_DIR_DATA", "/mnt/data"),
            env_path_or("V6_NODE_DIR_LOG", "/mnt/log"),
            env_path_or("V6_NODE_DIR_VPN", "/mnt/vpn"),
            env_path_or("V6_NODE_DIR_SSH", "/mnt/ssh"),
            env_path_or("V6_NODE_DIR_SQUID", "/mnt/squid"),
        };

        auto url = probeUrlFromEnvironment();
        if (!url) {
            return url.error();
        }
        s.probe.url = url.value();

        s.launch.program = env_or("V6_NODE_COMMAND", "vnode-local");
        s.launch.args = {"start", "--dockerized", "-e", "application"};
    } else {
        s.launch.program = env_or("V6_SERVER_COMMAND", "vserver-local");
        s.launch.args = {"start", "-e", "application"};
    }

    spdlog::debug("Settings for {}: config={} template={} minimal={} markers={} hook={}",
                  roleName(role), s.configPath.string(), s.templatePath.string(),
                  s.minimalTemplatePath.string(), s.markerDir.string(), s.hookPath.string());
    return s;
}

} // namespace v6boot::config
