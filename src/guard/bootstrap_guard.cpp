#include <v6boot/guard/bootstrap_guard.h>

#include <spdlog/spdlog.h>

namespace v6boot::guard {

BootstrapGuard::BootstrapGuard(IMarkerStore& store) : store_(store) {}

Result<GuardOutcome> BootstrapGuard::runOnce(std::string_view name, const Routine& routine) {
    if (!routine) {
        return Error{ErrorCode::InvalidArgument, "No routine given for '" + std::string(name) + "'"};
    }

    auto state = store_.load(name);
    if (!state) {
        return state.error();
    }

    switch (state.value()) {
        case MarkerState::Finished:
            spdlog::info("Already ran {} previously.", name);
            return GuardOutcome::AlreadyDone;
        case MarkerState::InProgress:
            spdlog::error("Last time {} was interrupted it seems. Please remove the container "
                          "and start again.",
                          name);
            return Error{ErrorCode::InterruptedSetup,
                         "Setup routine '" + std::string(name) +
                             "' was interrupted on a previous start; remove the container and "
                             "start again"};
        case MarkerState::Absent:
            break;
    }

    if (auto marked = store_.store(name, MarkerState::InProgress); !marked) {
        return marked.error();
    }

    spdlog::info("Running one-time setup routine {}", name);
    auto ran = routine();
    if (!ran) {
        spdlog::error("Setup routine {} failed: {}", name, ran.error().message);
        return ran.error();
    }

    if (auto marked = store_.store(name, MarkerState::Finished); !marked) {
        return marked.error();
    }
    spdlog::info("Setup routine {} finished", name);
    return GuardOutcome::Ran;
}

} // namespace v6boot::guard
