#pragma once

#include <v6boot/core/types.h>
#include <v6boot/hooks/hook_registry.h>

#include <filesystem>
#include <memory>
#include <vector>

struct v6boot_hook_host_v1;

namespace v6boot::hooks {

/**
 * An opened hook shared object. The library stays loaded for the lifetime of
 * this object, which must outlive any use of the callbacks it registered.
 */
class LoadedHook {
public:
    LoadedHook(std::filesystem::path path, void* handle);
    ~LoadedHook();

    LoadedHook(const LoadedHook&) = delete;
    LoadedHook& operator=(const LoadedHook&) = delete;

    const std::filesystem::path& path() const { return path_; }

private:
    std::filesystem::path path_;
    void* handle_{nullptr};
};

/**
 * Loads the operator's extension hook into this process and lets it register
 * callbacks on the registry through the C ABI in abi.h.
 */
class HookLoader {
public:
    explicit HookLoader(HookRegistry& registry);
    ~HookLoader();

    /**
     * Absent file: logged, returns false. Present file: loaded and initialised,
     * returns true. A present hook that cannot be opened, has the wrong ABI
     * version, or whose init fails is an error.
     */
    Result<bool> loadHookIfPresent(const std::filesystem::path& path);

    std::size_t loadedCount() const { return loaded_.size(); }

private:
    HookRegistry& registry_;
    std::unique_ptr<v6boot_hook_host_v1> host_;
    std::vector<std::unique_ptr<LoadedHook>> loaded_;
};

} // namespace v6boot::hooks
