#pragma once

#include <v6boot/core/types.h>
#include <v6boot/guard/marker_store.h>

#include <functional>
#include <string>
#include <string_view>

namespace v6boot::guard {

enum class GuardOutcome {
    Ran,        // routine executed and completed in this invocation
    AlreadyDone // marker was finished; routine skipped
};

/**
 * Runs a named setup routine at most once per container lifetime.
 *
 * A routine that fails (error result or exception) leaves its marker in progress.
 * An in-progress marker found on entry is InterruptedSetup and is never cleared
 * automatically: the operator must recreate the container.
 */
class BootstrapGuard {
public:
    using Routine = std::function<Result<void>()>;

    explicit BootstrapGuard(IMarkerStore& store);

    Result<GuardOutcome> runOnce(std::string_view name, const Routine& routine);

private:
    IMarkerStore& store_;
};

} // namespace v6boot::guard
