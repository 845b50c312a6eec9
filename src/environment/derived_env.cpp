#include <v6boot/config/config_helpers.h>
#include <v6boot/environment/derived_env.h>

#include <spdlog/spdlog.h>
#include <yaml-cpp/yaml.h>

#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <map>
#include <set>

namespace v6boot::environment {

namespace {

bool isValidLabel(const std::string& label) {
    if (label.empty() || !std::isalpha(static_cast<unsigned char>(label.front()))) {
        return false;
    }
    for (unsigned char c : label) {
        if (!std::isalnum(c) && c != '_') {
            return false;
        }
    }
    return true;
}

bool isValidEnvName(const std::string& name) {
    return !name.empty() && name.find('=') == std::string::npos &&
           !std::isdigit(static_cast<unsigned char>(name.front()));
}

std::string scalarOr(const YAML::Node& entry, const char* key, std::string fallback) {
    const auto value = entry[key];
    if (!value || value.IsNull()) {
        return fallback;
    }
    return value.as<std::string>();
}

std::string mapUri(const std::string& uri, const std::string& mountPrefix) {
    if (uri.empty() || uri.front() == '/' || uri.find("://") != std::string::npos ||
        mountPrefix.empty()) {
        return uri;
    }
    return config::join_url(mountPrefix, {uri});
}

} // namespace

Result<std::vector<ResourceDescriptor>> parseAuxiliaryResources(const YAML::Node& root,
                                                                const std::string& sectionPath) {
    std::vector<ResourceDescriptor> out;

    YAML::Node section;
    section.reset(root);
    for (const auto& key : config::split_list(sectionPath, '.')) {
        if (!section.IsMap()) {
            spdlog::debug("Section '{}' not present in configuration", sectionPath);
            return out;
        }
        const YAML::Node& current = section;
        YAML::Node next = current[key];
        if (!next.IsDefined() || next.IsNull()) {
            spdlog::debug("Section '{}' not present in configuration", sectionPath);
            return out;
        }
        section.reset(next);
    }

    if (!section.IsSequence()) {
        return Error{ErrorCode::InvalidData,
                     "Configuration section '" + sectionPath + "' must be a list"};
    }

    try {
        std::size_t index = 0;
        for (const auto& entry : section) {
            if (!entry.IsMap()) {
                return Error{ErrorCode::InvalidData, "Entry " + std::to_string(index) + " of '" +
                                                         sectionPath + "' is not a mapping"};
            }
            ResourceDescriptor d;
            d.name = scalarOr(entry, "label", "");
            d.type = scalarOr(entry, "type", "");
            d.uri = scalarOr(entry, "uri", "");
            if (d.name.empty()) {
                return Error{ErrorCode::InvalidData, "Entry " + std::to_string(index) + " of '" +
                                                         sectionPath + "' has no label"};
            }
            if (d.type.empty()) {
                return Error{ErrorCode::InvalidData,
                             "Resource '" + d.name + "' in '" + sectionPath + "' has no type"};
            }
            out.push_back(std::move(d));
            ++index;
        }
    } catch (const YAML::Exception& e) {
        return Error{ErrorCode::InvalidData,
                     "Malformed entry in '" + sectionPath + "': " + std::string(e.what())};
    }
    return out;
}

Result<std::vector<ResourceDescriptor>> loadAuxiliaryResources(const std::filesystem::path& configPath,
                                                               const std::string& sectionPath) {
    YAML::Node root;
    try {
        root = YAML::LoadFile(configPath.string());
    } catch (const YAML::BadFile& e) {
        return Error{ErrorCode::FileNotFound,
                     "Cannot read configuration " + configPath.string() + ": " + e.what()};
    } catch (const YAML::Exception& e) {
        return Error{ErrorCode::InvalidData,
                     "Cannot parse configuration " + configPath.string() + ": " + e.what()};
    }
    return parseAuxiliaryResources(root, sectionPath);
}

Result<EnvAssignments> deriveEnv(const std::vector<ResourceDescriptor>& resources,
                                 const NamingConvention& naming) {
    // Validate everything first; nothing is produced unless the whole set is sound
    std::map<std::string, std::string> seen; // upper-cased name -> original label
    for (const auto& r : resources) {
        if (!isValidLabel(r.name)) {
            return Error{ErrorCode::InvalidData,
                         "Resource name '" + r.name +
                             "' cannot be used in an environment variable name"};
        }
        auto upper = config::to_upper(r.name);
        auto [it, inserted] = seen.emplace(upper, r.name);
        if (!inserted) {
            return Error{ErrorCode::DuplicateResourceName,
                         "Resource name '" + r.name + "' is declared more than once (collides with '" +
                             it->second + "')"};
        }
    }

    EnvAssignments out;
    out.reserve(resources.size() * 3 + 1);
    std::string labels;
    for (const auto& r : resources) {
        const auto upper = config::to_upper(r.name);
        const auto uri = mapUri(r.uri, naming.mountPrefix);
        out.push_back({naming.uriPrefix + "_" + upper, uri});
        if (!naming.uriSuffixAlias.empty()) {
            out.push_back({upper + "_" + naming.uriSuffixAlias, uri});
        }
        out.push_back({naming.typePrefix + "_" + upper, r.type});
        if (!labels.empty()) {
            labels += ",";
        }
        labels += r.name;
    }
    if (!naming.labelsVariable.empty()) {
        out.push_back({naming.labelsVariable, labels});
    }

    // Distinct labels can still derive the same variable name through the prefix and the alias
    std::set<std::string> names;
    for (const auto& a : out) {
        if (!isValidEnvName(a.name)) {
            return Error{ErrorCode::InvalidData,
                         "Derived environment variable name '" + a.name + "' is not valid"};
        }
        if (!names.insert(a.name).second) {
            return Error{ErrorCode::DuplicateResourceName,
                         "Environment variable '" + a.name +
                             "' would be derived from more than one resource"};
        }
    }
    return out;
}

Result<void> exportToProcess(const EnvAssignments& assignments) {
    for (const auto& a : assignments) {
        if (!isValidEnvName(a.name)) {
            return Error{ErrorCode::InvalidArgument,
                         "Invalid environment variable name '" + a.name + "'"};
        }
    }
    for (const auto& a : assignments) {
        if (::setenv(a.name.c_str(), a.value.c_str(), 1) != 0) {
            return Error{ErrorCode::InternalError,
                         "setenv(" + a.name + ") failed: " + std::strerror(errno)};
        }
        spdlog::info("export {}=\"{}\"", a.name, a.value);
    }
    return {};
}

} // namespace v6boot::environment
