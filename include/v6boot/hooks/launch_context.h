#pragma once

#include <v6boot/config/bootstrap_settings.h>

#include <filesystem>
#include <string>
#include <utility>
#include <vector>

namespace v6boot::hooks {

/**
 * The process that replaces the bootstrap: program (searched on PATH), its
 * arguments (argv[1..]) and environment entries set right before exec.
 */
struct LaunchSpec {
    std::string program;
    std::vector<std::string> args;
    std::vector<std::pair<std::string, std::string>> env;

    void setEnv(std::string name, std::string value) {
        for (auto& entry : env) {
            if (entry.first == name) {
                entry.second = std::move(value);
                return;
            }
        }
        env.emplace_back(std::move(name), std::move(value));
    }
};

// What hook callbacks see and may modify
struct LaunchContext {
    config::Role role{config::Role::Node};
    std::filesystem::path configPath;
    LaunchSpec spec;
};

} // namespace v6boot::hooks
