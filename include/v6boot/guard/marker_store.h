#pragma once

#include <v6boot/core/types.h>

#include <filesystem>
#include <memory>
#include <string>
#include <string_view>

namespace v6boot::guard {

enum class MarkerState { Absent, InProgress, Finished };

constexpr const char* markerStateName(MarkerState state) {
    switch (state) {
        case MarkerState::Absent: return "absent";
        case MarkerState::InProgress: return "in_progress";
        case MarkerState::Finished: return "finished";
    }
    return "unknown";
}

/**
 * Durable per-routine marker storage.
 */
class IMarkerStore {
public:
    virtual ~IMarkerStore() = default;

    virtual Result<MarkerState> load(std::string_view routine) const = 0;
    virtual Result<void> store(std::string_view routine, MarkerState state) = 0;
};

/**
 * One file per routine, "ran_once_<routine>", holding a small JSON record.
 *
 * Writes go through a temporary file in the same directory followed by a rename,
 * so a reader sees either the previous record or the new one. Plain-text markers
 * from the shell bootstrap ("starting"/"finished") are still understood.
 */
class FileMarkerStore final : public IMarkerStore {
public:
    explicit FileMarkerStore(std::filesystem::path directory);

    Result<MarkerState> load(std::string_view routine) const override;
    Result<void> store(std::string_view routine, MarkerState state) override;

    std::filesystem::path markerPath(std::string_view routine) const;
    const std::filesystem::path& directory() const { return directory_; }

private:
    std::filesystem::path directory_;
};

// Routine names become file names: [A-Za-z0-9_.-]+
bool isValidRoutineName(std::string_view routine);

std::unique_ptr<IMarkerStore> makeFileMarkerStore(std::filesystem::path directory);

} // namespace v6boot::guard
