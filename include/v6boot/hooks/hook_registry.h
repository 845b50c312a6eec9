#pragma once

#include <v6boot/core/types.h>
#include <v6boot/hooks/launch_context.h>

#include <functional>
#include <string>
#include <vector>

namespace v6boot::hooks {

enum class HookPoint {
    AfterSetup,  // one-time setup and environment export are done
    BeforeLaunch // last chance to change what gets exec'd
};

constexpr const char* hookPointName(HookPoint point) {
    switch (point) {
        case HookPoint::AfterSetup: return "after_setup";
        case HookPoint::BeforeLaunch: return "before_launch";
    }
    return "unknown";
}

/**
 * Callbacks attached to named hook points, run in registration order.
 */
class HookRegistry {
public:
    using Callback = std::function<Result<void>(LaunchContext&)>;

    void on(HookPoint point, std::string name, Callback callback);

    // Runs every callback for point; stops at the first failure
    Result<void> run(HookPoint point, LaunchContext& context) const;

    std::size_t count(HookPoint point) const;

private:
    struct Entry {
        HookPoint point;
        std::string name;
        Callback callback;
    };

    std::vector<Entry> entries_;
};

} // namespace v6boot::hooks
