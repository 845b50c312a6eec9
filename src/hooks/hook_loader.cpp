#include <v6boot/hooks/abi.h>
#include <v6boot/hooks/hook_loader.h>

#include <spdlog/spdlog.h>

#include <dlfcn.h>

namespace v6boot::hooks {

namespace fs = std::filesystem;

namespace {

using AbiVersionFn = int (*)();
using InitFn = int (*)(const v6boot_hook_host_v1*);

// Backs one v6boot_launch_v1 table for the duration of a callback
struct LaunchAdapter {
    LaunchContext* ctx{nullptr};
    std::string configPath;
};

LaunchAdapter* adapter(void* impl) {
    return static_cast<LaunchAdapter*>(impl);
}

const char* launch_role(void* impl) {
    return config::roleName(adapter(impl)->ctx->role);
}

const char* launch_config_path(void* impl) {
    return adapter(impl)->configPath.c_str();
}

const char* launch_program(void* impl) {
    return adapter(impl)->ctx->spec.program.c_str();
}

void launch_set_program(void* impl, const char* program) {
    if (program) {
        adapter(impl)->ctx->spec.program = program;
    }
}

size_t launch_arg_count(void* impl) {
    return adapter(impl)->ctx->spec.args.size();
}

const char* launch_arg(void* impl, size_t index) {
    const auto& args = adapter(impl)->ctx->spec.args;
    return index < args.size() ? args[index].c_str() : nullptr;
}

void launch_clear_args(void* impl) {
    adapter(impl)->ctx->spec.args.clear();
}

void launch_add_arg(void* impl, const char* arg) {
    if (arg) {
        adapter(impl)->ctx->spec.args.emplace_back(arg);
    }
}

void launch_set_env(void* impl, const char* name, const char* value) {
    if (name && *name) {
        adapter(impl)->ctx->spec.setEnv(name, value ? value : "");
    }
}

HookRegistry::Callback wrapCallback(v6boot_hook_fn fn, void* user) {
    return [fn, user](LaunchContext& ctx) -> Result<void> {
        LaunchAdapter state{&ctx, ctx.configPath.string()};
        v6boot_launch_v1 table{&state,           launch_role,       launch_config_path,
                               launch_program,   launch_set_program, launch_arg_count,
                               launch_arg,       launch_clear_args, launch_add_arg,
                               launch_set_env};
        int rc = fn(&table, user);
        if (rc != V6BOOT_HOOK_OK) {
            return Error{ErrorCode::HookFailed, "callback returned " + std::to_string(rc)};
        }
        return {};
    };
}

int host_register_hook(void* impl, int point, const char* name, v6boot_hook_fn fn, void* user) {
    if (!impl || !fn) {
        return V6BOOT_HOOK_ERR_INVALID;
    }
    HookPoint hp;
    switch (point) {
        case V6BOOT_HOOK_AFTER_SETUP:
            hp = HookPoint::AfterSetup;
            break;
        case V6BOOT_HOOK_BEFORE_LAUNCH:
            hp = HookPoint::BeforeLaunch;
            break;
        default:
            spdlog::warn("Hook tried to register at unknown hook point {}", point);
            return V6BOOT_HOOK_ERR_INVALID;
    }
    auto* registry = static_cast<HookRegistry*>(impl);
    registry->on(hp, name && *name ? name : "pre_run", wrapCallback(fn, user));
    return V6BOOT_HOOK_OK;
}

void host_log(void* /*impl*/, int level, const char* message) {
    if (!message) {
        return;
    }
    switch (level) {
        case V6BOOT_LOG_DEBUG:
            spdlog::debug("[hook] {}", message);
            break;
        case V6BOOT_LOG_WARN:
            spdlog::warn("[hook] {}", message);
            break;
        case V6BOOT_LOG_ERROR:
            spdlog::error("[hook] {}", message);
            break;
        default:
            spdlog::info("[hook] {}", message);
            break;
    }
}

std::string lastDlError() {
    const char* err = dlerror();
    return err ? err : "unknown error";
}

} // namespace

LoadedHook::LoadedHook(fs::path path, void* handle) : path_(std::move(path)), handle_(handle) {}

LoadedHook::~LoadedHook() {
    if (handle_) {
        dlclose(handle_);
        handle_ = nullptr;
    }
}

HookLoader::HookLoader(HookRegistry& registry)
    : registry_(registry), host_(std::make_unique<v6boot_hook_host_v1>()) {
    // Hooks may keep the host pointer for later logging; it lives as long as the loader
    host_->abi_version = V6BOOT_HOOK_ABI_VERSION;
    host_->impl = &registry_;
    host_->register_hook = host_register_hook;
    host_->log = host_log;
}

HookLoader::~HookLoader() = default;

Result<bool> HookLoader::loadHookIfPresent(const fs::path& path) {
    std::error_code ec;
    if (path.empty() || !fs::is_regular_file(path, ec)) {
        spdlog::info("No pre-hook found (expected at {})", path.string());
        return false;
    }

    spdlog::info("Loading pre-hook ({})", path.string());
    void* handle = dlopen(path.c_str(), RTLD_NOW | RTLD_LOCAL);
    if (!handle) {
        return Error{ErrorCode::HookFailed,
                     "Failed to open pre-hook " + path.string() + ": " + lastDlError()};
    }
    auto hook = std::make_unique<LoadedHook>(path, handle);

    dlerror();
    auto getAbi = reinterpret_cast<AbiVersionFn>(dlsym(handle, "v6boot_hook_get_abi_version"));
    auto init = reinterpret_cast<InitFn>(dlsym(handle, "v6boot_hook_init"));
    if (!getAbi || !init) {
        return Error{ErrorCode::InvalidData,
                     "Pre-hook " + path.string() +
                         " does not export v6boot_hook_get_abi_version/v6boot_hook_init"};
    }

    const int abi = getAbi();
    if (abi != V6BOOT_HOOK_ABI_VERSION) {
        return Error{ErrorCode::InvalidData, "Pre-hook " + path.string() + " targets ABI " +
                                                 std::to_string(abi) + ", expected " +
                                                 std::to_string(V6BOOT_HOOK_ABI_VERSION)};
    }

    const int rc = init(host_.get());
    if (rc != V6BOOT_HOOK_OK) {
        return Error{ErrorCode::HookFailed,
                     "Pre-hook " + path.string() + " init returned " + std::to_string(rc)};
    }

    spdlog::info("Pre-hook {} loaded ({} after_setup, {} before_launch callbacks)",
                 path.string(), registry_.count(HookPoint::AfterSetup),
                 registry_.count(HookPoint::BeforeLaunch));
    loaded_.push_back(std::move(hook));
    return true;
}

} // namespace v6boot::hooks
