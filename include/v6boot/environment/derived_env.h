#pragma once

#include <v6boot/core/types.h>

#include <filesystem>
#include <string>
#include <utility>
#include <vector>

namespace YAML {
class Node;
}

namespace v6boot::environment {

/**
 * One auxiliary resource (a node database) as declared in the resolved configuration.
 */
struct ResourceDescriptor {
    std::string name; // "label" in the configuration
    std::string type;
    std::string uri;
};

struct EnvAssignment {
    std::string name;
    std::string value;

    bool operator==(const EnvAssignment& other) const {
        return name == other.name && value == other.value;
    }
};

using EnvAssignments = std::vector<EnvAssignment>;

struct NamingConvention {
    std::string uriPrefix{"DATABASE_URI"};
    std::string typePrefix{"DATABASE_TYPE"};
    std::string labelsVariable{"DATABASE_LABELS"};
    // <NAME>_<uriSuffixAlias> repeats the uri variable; empty disables it
    std::string uriSuffixAlias{"DATABASE_URI"};
    // Prepended to relative uris; where the databases volume is mounted for the node
    std::string mountPrefix{"/databases"};
};

/**
 * Read the descriptor sequence found at sectionPath ("application.databases").
 * A missing section is an empty set.
 */
Result<std::vector<ResourceDescriptor>> loadAuxiliaryResources(const std::filesystem::path& configPath,
                                                               const std::string& sectionPath);

Result<std::vector<ResourceDescriptor>> parseAuxiliaryResources(const YAML::Node& root,
                                                                const std::string& sectionPath);

/**
 * Map descriptors to environment assignments:
 *   <uriPrefix>_<NAME>=<mountPrefix>/<uri>, <NAME>_<uriSuffixAlias>=<same value>,
 *   <typePrefix>_<NAME>=<type>, plus the label list.
 * All generated names are validated and checked for duplicates before anything is returned.
 */
Result<EnvAssignments> deriveEnv(const std::vector<ResourceDescriptor>& resources,
                                 const NamingConvention& naming = {});

// setenv() every assignment so the exec'd process inherits them
Result<void> exportToProcess(const EnvAssignments& assignments);

} // namespace v6boot::environment
