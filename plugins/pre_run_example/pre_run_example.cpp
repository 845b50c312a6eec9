/*
 * Example extension hook for v6boot.
 *
 * Build as a shared object and mount it at /custom-start.d/pre_run.so (or point
 * V6_PRE_HOOK_PATH at it). It shows both hook points:
 * - after_setup:   logs the resolved configuration path
 * - before_launch: marks the environment, and when V6_EXAMPLE_PROGRAM is set,
 *                  replaces the launched program and prepends V6_EXAMPLE_ARG
 *                  (if set) to the argument list
 */

#include <v6boot/hooks/abi.h>

#include <cstdlib>
#include <string>
#include <vector>

namespace {

const v6boot_hook_host_v1* g_host = nullptr;

void log(int level, const std::string& msg) {
    if (g_host && g_host->log) {
        g_host->log(g_host->impl, level, msg.c_str());
    }
}

int after_setup(v6boot_launch_v1* launch, void* /*user*/) {
    log(V6BOOT_LOG_INFO, std::string("configuration ready at ") +
                             launch->config_path(launch->impl) + " for " +
                             launch->role(launch->impl));
    return V6BOOT_HOOK_OK;
}

int before_launch(v6boot_launch_v1* launch, void* /*user*/) {
    launch->set_env(launch->impl, "V6_PRE_HOOK_APPLIED", "1");

    const char* program = std::getenv("V6_EXAMPLE_PROGRAM");
    if (program && *program) {
        std::vector<std::string> args;
        const size_t n = launch->arg_count(launch->impl);
        for (size_t i = 0; i < n; ++i) {
            args.emplace_back(launch->arg(launch->impl, i));
        }
        launch->set_program(launch->impl, program);
        launch->clear_args(launch->impl);
        if (const char* extra = std::getenv("V6_EXAMPLE_ARG"); extra && *extra) {
            launch->add_arg(launch->impl, extra);
        }
        for (const auto& a : args) {
            launch->add_arg(launch->impl, a.c_str());
        }
        log(V6BOOT_LOG_INFO, std::string("launch replaced with ") + program);
    }

    if (std::getenv("V6_EXAMPLE_FAIL")) {
        log(V6BOOT_LOG_ERROR, "failing on request");
        return V6BOOT_HOOK_ERR_FAILED;
    }
    return V6BOOT_HOOK_OK;
}

} // namespace

extern "C" {

V6BOOT_HOOK_API int v6boot_hook_get_abi_version(void) {
    return V6BOOT_HOOK_ABI_VERSION;
}

V6BOOT_HOOK_API int v6boot_hook_init(const v6boot_hook_host_v1* host) {
    if (!host || host->abi_version != V6BOOT_HOOK_ABI_VERSION || !host->register_hook) {
        return V6BOOT_HOOK_ERR_INVALID;
    }
    g_host = host;
    int rc = host->register_hook(host->impl, V6BOOT_HOOK_AFTER_SETUP, "example.after_setup",
                                 after_setup, nullptr);
    if (rc != V6BOOT_HOOK_OK) {
        return rc;
    }
    return host->register_hook(host->impl, V6BOOT_HOOK_BEFORE_LAUNCH, "example.before_launch",
                               before_launch, nullptr);
}

} // extern "C"
