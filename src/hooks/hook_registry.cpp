#include <v6boot/hooks/hook_registry.h>

#include <spdlog/spdlog.h>

#include <algorithm>

namespace v6boot::hooks {

void HookRegistry::on(HookPoint point, std::string name, Callback callback) {
    spdlog::debug("Hook '{}' registered at {}", name, hookPointName(point));
    entries_.push_back(Entry{point, std::move(name), std::move(callback)});
}

Result<void> HookRegistry::run(HookPoint point, LaunchContext& context) const {
    for (const auto& entry : entries_) {
        if (entry.point != point) {
            continue;
        }
        spdlog::info("Running hook '{}' ({})", entry.name, hookPointName(point));
        auto r = entry.callback(context);
        if (!r) {
            return Error{ErrorCode::HookFailed, "Hook '" + entry.name + "' at " +
                                                    hookPointName(point) +
                                                    " failed: " + r.error().message};
        }
    }
    return {};
}

std::size_t HookRegistry::count(HookPoint point) const {
    return static_cast<std::size_t>(std::count_if(
        entries_.begin(), entries_.end(), [point](const Entry& e) { return e.point == point; }));
}

} // namespace v6boot::hooks
