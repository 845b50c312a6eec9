#pragma once

#include <v6boot/core/types.h>

#include <filesystem>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace v6boot::render {

/**
 * Variables available to a template, plus the reader used by the read_secret filter.
 */
class SubstitutionContext {
public:
    using SecretReader = std::function<Result<std::string>(const std::filesystem::path&)>;

    SubstitutionContext();
    explicit SubstitutionContext(std::map<std::string, std::string> variables);

    // All environment variables whose name starts with prefix (e.g. "V6_")
    static SubstitutionContext fromEnvironment(std::string_view prefix);

    void set(std::string name, std::string value);
    std::optional<std::string> lookup(std::string_view name) const;
    const std::map<std::string, std::string, std::less<>>& variables() const { return vars_; }

    void setSecretReader(SecretReader reader) { secretReader_ = std::move(reader); }
    Result<std::string> readSecret(const std::filesystem::path& path) const;

private:
    std::map<std::string, std::string, std::less<>> vars_;
    SecretReader secretReader_;
};

// Reads a mounted secret file and trims surrounding whitespace
Result<std::string> readSecretFile(const std::filesystem::path& path);

struct RenderOptions {
    // Directories searched by {% include %} after the template's own directory
    std::vector<std::filesystem::path> searchPaths;
    int maxIncludeDepth{16};
    // Jinja's keep_trailing_newline; by default one trailing newline per template is dropped
    bool keepTrailingNewline{false};
};

/**
 * Strict renderer for the Jinja2 subset used by the configuration templates.
 *
 * Supported: {{ NAME }}, {{ "literal" }}, filters read_secret, default("x"), upper,
 * lower, trim; {% include "file" [ignore missing] %}; {# comments #}; '-' whitespace
 * control on every tag; one trailing newline per template is dropped unless
 * keepTrailingNewline is set. An undefined variable without default() is an
 * UnresolvableTemplate error; nothing is ever substituted by an empty string.
 */
class TemplateRenderer {
public:
    TemplateRenderer(const SubstitutionContext& context, RenderOptions options = {});

    Result<std::string> renderFile(const std::filesystem::path& templatePath) const;
    Result<std::string> renderString(std::string_view text,
                                     std::string_view sourceName = "<string>") const;

private:
    struct Frame {
        std::vector<std::filesystem::path> searchPaths;
        int depth{0};
    };

    Result<std::string> render(std::string_view text, std::string_view source,
                               const Frame& frame) const;
    std::string_view sourceText(std::string_view text) const;
    Result<std::string> evalExpression(std::string_view expr, std::string_view source,
                                       size_t line) const;
    Result<std::string> evalStatement(std::string_view stmt, std::string_view source, size_t line,
                                      const Frame& frame) const;
    Result<std::string> renderInclude(const std::filesystem::path& path,
                                      const Frame& frame) const;
    std::optional<std::filesystem::path> findTemplate(std::string_view name,
                                                      const Frame& frame) const;

    const SubstitutionContext& context_;
    RenderOptions options_;
};

} // namespace v6boot::render
