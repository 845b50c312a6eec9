#include <v6boot/config/config_helpers.h>
#include <v6boot/guard/marker_store.h>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <unistd.h>

#include <cctype>
#include <chrono>
#include <fstream>
#include <sstream>

namespace v6boot::guard {

namespace fs = std::filesystem;
using json = nlohmann::json;

bool isValidRoutineName(std::string_view routine) {
    if (routine.empty() || routine == "." || routine == "..") {
        return false;
    }
    for (unsigned char c : routine) {
        if (!std::isalnum(c) && c != '_' && c != '.' && c != '-') {
            return false;
        }
    }
    return true;
}

FileMarkerStore::FileMarkerStore(fs::path directory) : directory_(std::move(directory)) {}

fs::path FileMarkerStore::markerPath(std::string_view routine) const {
    return directory_ / ("ran_once_" + std::string(routine));
}

Result<MarkerState> FileMarkerStore::load(std::string_view routine) const {
    if (!isValidRoutineName(routine)) {
        return Error{ErrorCode::InvalidArgument,
                     "Invalid routine name '" + std::string(routine) + "'"};
    }

    const auto path = markerPath(routine);
    std::error_code ec;
    if (!fs::exists(path, ec)) {
        if (ec) {
            return Error{ErrorCode::PermissionDenied,
                         "Cannot inspect marker " + path.string() + ": " + ec.message()};
        }
        return MarkerState::Absent;
    }

    std::ifstream in(path, std::ios::binary);
    if (!in) {
        return Error{ErrorCode::PermissionDenied, "Cannot read marker " + path.string()};
    }
    std::ostringstream ss;
    ss << in.rdbuf();
    const std::string raw = ss.str();

    auto doc = json::parse(raw, nullptr, /*allow_exceptions=*/false);
    if (doc.is_discarded() || !doc.is_object()) {
        // Marker written by the shell bootstrap
        const auto text = config::trimmed(raw);
        spdlog::debug("Marker {} holds legacy text '{}'", path.string(), text);
        return text == "finished" ? MarkerState::Finished : MarkerState::InProgress;
    }

    const auto it = doc.find("state");
    if (it == doc.end() || !it->is_string()) {
        spdlog::warn("Marker {} has no textual state; treating it as interrupted", path.string());
        return MarkerState::InProgress;
    }
    const auto& state = it->get_ref<const std::string&>();
    if (state == markerStateName(MarkerState::Finished)) {
        return MarkerState::Finished;
    }
    if (state != markerStateName(MarkerState::InProgress)) {
        spdlog::warn("Marker {} has unexpected state '{}'; treating it as interrupted",
                     path.string(), state);
    }
    return MarkerState::InProgress;
}

Result<void> FileMarkerStore::store(std::string_view routine, MarkerState state) {
    if (!isValidRoutineName(routine)) {
        return Error{ErrorCode::InvalidArgument,
                     "Invalid routine name '" + std::string(routine) + "'"};
    }
    if (state == MarkerState::Absent) {
        return Error{ErrorCode::InvalidArgument, "Markers are never reset to absent"};
    }

    std::error_code ec;
    fs::create_directories(directory_, ec);
    if (ec) {
        return Error{ErrorCode::PermissionDenied,
                     "Cannot create marker directory " + directory_.string() + ": " +
                         ec.message()};
    }

    json doc;
    doc["routine"] = std::string(routine);
    doc["state"] = markerStateName(state);
    doc["updated_at"] = std::chrono::duration_cast<std::chrono::seconds>(
                            std::chrono::system_clock::now().time_since_epoch())
                            .count();
    const std::string payload = doc.dump() + "\n";

    const auto path = markerPath(routine);
    fs::path tempPath = path;
    tempPath += ".tmp." + std::to_string(::getpid());
    {
        std::ofstream out(tempPath, std::ios::binary | std::ios::trunc);
        if (!out) {
            return Error{ErrorCode::WriteError, "Cannot create " + tempPath.string()};
        }
        out.write(payload.data(), static_cast<std::streamsize>(payload.size()));
        out.flush();
        if (!out) {
            out.close();
            fs::remove(tempPath, ec);
            return Error{ErrorCode::WriteError, "Failed writing " + tempPath.string()};
        }
    }

    fs::rename(tempPath, path, ec);
    if (ec) {
        std::error_code rmEc;
        fs::remove(tempPath, rmEc);
        return Error{ErrorCode::WriteError,
                     "Cannot move marker into place at " + path.string() + ": " + ec.message()};
    }

    spdlog::debug("Marker {} -> {}", path.string(), markerStateName(state));
    return {};
}

std::unique_ptr<IMarkerStore> makeFileMarkerStore(fs::path directory) {
    return std::make_unique<FileMarkerStore>(std::move(directory));
}

} // namespace v6boot::guard
