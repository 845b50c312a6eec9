#pragma once

#include <v6boot/core/types.h>
#include <v6boot/render/template_renderer.h>

#include <sys/types.h>

#include <filesystem>
#include <vector>

namespace v6boot::resolver {

/**
 * Where a configuration may come from, in precedence order.
 */
enum class CandidateKind {
    Resolved, // final document already at the target path; used verbatim
    Operator, // operator-supplied template
    BuiltIn   // minimal template shipped with the image; not for production
};

constexpr const char* candidateKindName(CandidateKind kind) {
    switch (kind) {
        case CandidateKind::Resolved: return "resolved";
        case CandidateKind::Operator: return "operator";
        case CandidateKind::BuiltIn: return "built-in";
    }
    return "unknown";
}

struct ConfigCandidate {
    CandidateKind kind{CandidateKind::Operator};
    std::filesystem::path path;

    bool exists() const;
};

struct ResolveRequest {
    std::filesystem::path targetPath;
    // Template candidates in precedence order (Operator before BuiltIn)
    std::vector<ConfigCandidate> templateCandidates;
    // Searched by {% include %} after the template's own directory
    std::vector<std::filesystem::path> auxiliaryDirs;
};

enum class ResolveAction {
    NoOp,    // target already existed; nothing written
    Rendered // target produced from a template
};

struct ResolveOutcome {
    ResolveAction action{ResolveAction::NoOp};
    std::filesystem::path configPath;
    std::filesystem::path source;
    CandidateKind sourceKind{CandidateKind::Resolved};
    std::size_t bytesWritten{0};

    bool usedFallback() const { return sourceKind == CandidateKind::BuiltIn; }
};

// Operator template then built-in template
std::vector<ConfigCandidate> standardCandidates(const std::filesystem::path& operatorTemplate,
                                                const std::filesystem::path& builtInTemplate);

/**
 * Sets the process file-creation mask and restores the previous one on scope exit.
 */
class UmaskGuard {
public:
    explicit UmaskGuard(mode_t mask);
    ~UmaskGuard();

    UmaskGuard(const UmaskGuard&) = delete;
    UmaskGuard& operator=(const UmaskGuard&) = delete;

    mode_t previous() const { return previous_; }

private:
    mode_t previous_;
};

class ConfigResolver {
public:
    explicit ConfigResolver(const render::SubstitutionContext& context);

    /**
     * Produce the final configuration document at request.targetPath.
     *
     * Returns NoOp when the target already exists, whatever the candidates are.
     * Otherwise renders the first existing candidate and writes it with mode 0600
     * under umask 077. Undefined template variables fail with UnresolvableTemplate
     * and leave no file behind.
     */
    Result<ResolveOutcome> resolve(const ResolveRequest& request) const;

private:
    Result<std::size_t> writeResolved(const std::filesystem::path& target,
                                      const std::string& content) const;

    const render::SubstitutionContext& context_;
};

} // namespace v6boot::resolver
