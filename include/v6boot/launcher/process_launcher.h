#pragma once

#include <v6boot/core/types.h>
#include <v6boot/hooks/launch_context.h>

#include <memory>
#include <vector>

namespace v6boot::launcher {

using hooks::LaunchContext;
using hooks::LaunchSpec;

/**
 * Replaces the current process image. Only returns on failure.
 */
class IProcessExecutor {
public:
    virtual ~IProcessExecutor() = default;

    virtual Result<void> replaceProcess(const LaunchSpec& spec) = 0;
};

// setenv() for spec.env, then execvp(); the application becomes the container's main process
class ExecProcessExecutor final : public IProcessExecutor {
public:
    Result<void> replaceProcess(const LaunchSpec& spec) override;
};

// Logs what would be exec'd and returns success without replacing anything (--dry-run)
class DryRunExecutor final : public IProcessExecutor {
public:
    Result<void> replaceProcess(const LaunchSpec& spec) override;
};

std::unique_ptr<IProcessExecutor> makeExecProcessExecutor();

// Default launch for a role: "<program> <args...> --config <configPath>"
LaunchSpec buildLaunchSpec(const config::LaunchCommand& command,
                           const std::filesystem::path& configPath);

// Shell-style rendering for logs
std::string describe(const LaunchSpec& spec);

} // namespace v6boot::launcher
