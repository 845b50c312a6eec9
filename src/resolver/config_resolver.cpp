#include <v6boot/resolver/config_resolver.h>

#include <spdlog/spdlog.h>

#include <sys/stat.h>
#include <unistd.h>

#include <fstream>

namespace v6boot::resolver {

namespace fs = std::filesystem;

bool ConfigCandidate::exists() const {
    std::error_code ec;
    return !path.empty() && fs::is_regular_file(path, ec);
}

std::vector<ConfigCandidate> standardCandidates(const fs::path& operatorTemplate,
                                                const fs::path& builtInTemplate) {
    return {ConfigCandidate{CandidateKind::Operator, operatorTemplate},
            ConfigCandidate{CandidateKind::BuiltIn, builtInTemplate}};
}

UmaskGuard::UmaskGuard(mode_t mask) : previous_(::umask(mask)) {}

UmaskGuard::~UmaskGuard() {
    ::umask(previous_);
}

ConfigResolver::ConfigResolver(const render::SubstitutionContext& context) : context_(context) {}

Result<ResolveOutcome> ConfigResolver::resolve(const ResolveRequest& request) const {
    if (request.targetPath.empty()) {
        return Error{ErrorCode::InvalidArgument, "Configuration target path is empty"};
    }

    ConfigCandidate resolved{CandidateKind::Resolved, request.targetPath};
    if (resolved.exists()) {
        spdlog::info("Using config file at \"{}\"", request.targetPath.string());
        ResolveOutcome outcome;
        outcome.action = ResolveAction::NoOp;
        outcome.configPath = request.targetPath;
        outcome.source = request.targetPath;
        outcome.sourceKind = CandidateKind::Resolved;
        return outcome;
    }

    const ConfigCandidate* selected = nullptr;
    bool sawOperator = false;
    for (const auto& candidate : request.templateCandidates) {
        if (candidate.kind == CandidateKind::Operator) {
            sawOperator = true;
        }
        if (candidate.exists()) {
            selected = &candidate;
            break;
        }
        spdlog::debug("No {} template at \"{}\"", candidateKindName(candidate.kind),
                      candidate.path.string());
    }

    if (!selected) {
        return Error{ErrorCode::FileNotFound,
                     "No config file at \"" + request.targetPath.string() +
                         "\" and none of the template candidates exist"};
    }

    if (selected->kind == CandidateKind::BuiltIn) {
        spdlog::warn("No config file found at \"{}\"{}", request.targetPath.string(),
                     sawOperator ? " and no operator template config file found" : "");
        spdlog::warn("Using minimal config template at \"{}\"", selected->path.string());
        spdlog::warn("This minimal config is only meant for testing purposes!");
    } else {
        spdlog::info("Using template config file at \"{}\"", selected->path.string());
    }

    render::RenderOptions options;
    options.searchPaths = request.auxiliaryDirs;
    render::TemplateRenderer renderer(context_, options);

    auto rendered = renderer.renderFile(selected->path);
    if (!rendered) {
        const auto& err = rendered.error();
        spdlog::error("Template {} could not be rendered: {}", selected->path.string(),
                      err.message);
        return err;
    }

    spdlog::info("Generating configuration from \"{}\" and writing to \"{}\"",
                 selected->path.string(), request.targetPath.string());
    auto written = writeResolved(request.targetPath, rendered.value());
    if (!written) {
        return written.error();
    }

    ResolveOutcome outcome;
    outcome.action = ResolveAction::Rendered;
    outcome.configPath = request.targetPath;
    outcome.source = selected->path;
    outcome.sourceKind = selected->kind;
    outcome.bytesWritten = written.value();
    return outcome;
}

Result<std::size_t> ConfigResolver::writeResolved(const fs::path& target,
                                                  const std::string& content) const {
    // The document may carry secrets: nothing created here is readable by others
    UmaskGuard mask(077);

    std::error_code ec;
    if (target.has_parent_path()) {
        fs::create_directories(target.parent_path(), ec);
        if (ec) {
            spdlog::error("Failed to create directory {}: {}", target.parent_path().string(),
                          ec.message());
            return Error{ErrorCode::PermissionDenied,
                         "Cannot create " + target.parent_path().string() + ": " + ec.message()};
        }
    }

    fs::path tempPath = target;
    tempPath += ".tmp." + std::to_string(::getpid());
    {
        std::ofstream file(tempPath, std::ios::binary | std::ios::trunc);
        if (!file) {
            spdlog::error("Failed to create temp file: {}", tempPath.string());
            return Error{ErrorCode::WriteError, "Cannot create " + tempPath.string()};
        }
        file.write(content.data(), static_cast<std::streamsize>(content.size()));
        file.flush();
        if (!file) {
            file.close();
            fs::remove(tempPath, ec);
            return Error{ErrorCode::WriteError, "Failed writing " + tempPath.string()};
        }
    }

    fs::permissions(tempPath, fs::perms::owner_read | fs::perms::owner_write,
                    fs::perm_options::replace, ec);
    if (ec) {
        spdlog::warn("Could not restrict permissions of {}: {}", tempPath.string(), ec.message());
    }

    if (fs::exists(target, ec)) {
        fs::remove(tempPath, ec);
        return Error{ErrorCode::InvalidState,
                     "Output file at " + target.string() + " already exists! Won't override"};
    }

    fs::rename(tempPath, target, ec);
    if (ec) {
        std::error_code rmEc;
        fs::remove(tempPath, rmEc);
        spdlog::error("Failed to rename {} to {}: {}", tempPath.string(), target.string(),
                      ec.message());
        return Error{ErrorCode::WriteError,
                     "Cannot move configuration into place at " + target.string()};
    }
    return content.size();
}

} // namespace v6boot::resolver
