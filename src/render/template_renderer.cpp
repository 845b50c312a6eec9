#include <v6boot/config/config_helpers.h>
#include <v6boot/render/template_renderer.h>

#include <spdlog/spdlog.h>

#include <cctype>
#include <fstream>
#include <sstream>

extern char** environ;

namespace v6boot::render {

namespace fs = std::filesystem;

namespace {

size_t lineOf(std::string_view text, size_t pos) {
    size_t line = 1;
    for (size_t i = 0; i < pos && i < text.size(); ++i) {
        if (text[i] == '\n') {
            ++line;
        }
    }
    return line;
}

std::string where(std::string_view source, size_t line) {
    return std::string(source) + ":" + std::to_string(line);
}

bool isIdentStart(char c) {
    return std::isalpha(static_cast<unsigned char>(c)) || c == '_';
}

bool isIdentChar(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_';
}

// Minimal cursor over the inside of a {{ }} or {% %} tag
struct Cursor {
    std::string_view text;
    size_t pos{0};

    void skipSpace() {
        while (pos < text.size() && std::isspace(static_cast<unsigned char>(text[pos]))) {
            ++pos;
        }
    }

    bool atEnd() {
        skipSpace();
        return pos >= text.size();
    }

    bool consume(char c) {
        skipSpace();
        if (pos < text.size() && text[pos] == c) {
            ++pos;
            return true;
        }
        return false;
    }

    bool peekQuote() {
        skipSpace();
        return pos < text.size() && (text[pos] == '"' || text[pos] == '\'');
    }

    std::optional<std::string> identifier() {
        skipSpace();
        if (pos >= text.size() || !isIdentStart(text[pos])) {
            return std::nullopt;
        }
        size_t start = pos;
        while (pos < text.size() && isIdentChar(text[pos])) {
            ++pos;
        }
        return std::string(text.substr(start, pos - start));
    }

    std::optional<std::string> stringLiteral() {
        skipSpace();
        if (pos >= text.size() || (text[pos] != '"' && text[pos] != '\'')) {
            return std::nullopt;
        }
        const char quote = text[pos++];
        std::string out;
        while (pos < text.size()) {
            char c = text[pos++];
            if (c == '\\' && pos < text.size()) {
                out.push_back(text[pos++]);
                continue;
            }
            if (c == quote) {
                return out;
            }
            out.push_back(c);
        }
        return std::nullopt; // unterminated
    }
};

// Finds the closing delimiter of a tag, ignoring delimiters inside string literals
size_t findClose(std::string_view text, size_t from, std::string_view close) {
    char quote = 0;
    for (size_t i = from; i + close.size() <= text.size(); ++i) {
        char c = text[i];
        if (quote) {
            if (c == '\\') {
                ++i;
            } else if (c == quote) {
                quote = 0;
            }
            continue;
        }
        if (c == '"' || c == '\'') {
            quote = c;
            continue;
        }
        if (text.compare(i, close.size(), close) == 0) {
            return i;
        }
    }
    return std::string_view::npos;
}

} // namespace

// ---------------------------------------------------------------------------
// SubstitutionContext
// ---------------------------------------------------------------------------

SubstitutionContext::SubstitutionContext() : secretReader_(readSecretFile) {}

SubstitutionContext::SubstitutionContext(std::map<std::string, std::string> variables)
    : vars_(variables.begin(), variables.end()), secretReader_(readSecretFile) {}

SubstitutionContext SubstitutionContext::fromEnvironment(std::string_view prefix) {
    SubstitutionContext ctx;
    for (char** env = environ; env && *env; ++env) {
        std::string_view entry(*env);
        auto eq = entry.find('=');
        if (eq == std::string_view::npos) {
            continue;
        }
        auto name = entry.substr(0, eq);
        if (name.substr(0, prefix.size()) != prefix) {
            continue;
        }
        ctx.set(std::string(name), std::string(entry.substr(eq + 1)));
    }
    spdlog::debug("Substitution context holds {} '{}*' variables", ctx.vars_.size(), prefix);
    return ctx;
}

void SubstitutionContext::set(std::string name, std::string value) {
    vars_[std::move(name)] = std::move(value);
}

std::optional<std::string> SubstitutionContext::lookup(std::string_view name) const {
    auto it = vars_.find(name);
    if (it == vars_.end()) {
        return std::nullopt;
    }
    return it->second;
}

Result<std::string> SubstitutionContext::readSecret(const fs::path& path) const {
    if (!secretReader_) {
        return Error{ErrorCode::NotSupported, "No secret reader configured"};
    }
    return secretReader_(path);
}

Result<std::string> readSecretFile(const fs::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        return Error{ErrorCode::FileNotFound, "Cannot read secret file " + path.string()};
    }
    std::ostringstream ss;
    ss << in.rdbuf();
    return config::trimmed(ss.str());
}

// ---------------------------------------------------------------------------
// TemplateRenderer
// ---------------------------------------------------------------------------

TemplateRenderer::TemplateRenderer(const SubstitutionContext& context, RenderOptions options)
    : context_(context), options_(std::move(options)) {}

Result<std::string> TemplateRenderer::renderFile(const fs::path& templatePath) const {
    Frame frame;
    frame.searchPaths.push_back(templatePath.parent_path());
    frame.searchPaths.insert(frame.searchPaths.end(), options_.searchPaths.begin(),
                             options_.searchPaths.end());
    return renderInclude(templatePath, frame);
}

Result<std::string> TemplateRenderer::renderString(std::string_view text,
                                                   std::string_view sourceName) const {
    Frame frame;
    frame.searchPaths = options_.searchPaths;
    return render(sourceText(text), sourceName, frame);
}

Result<std::string> TemplateRenderer::renderInclude(const fs::path& path,
                                                    const Frame& frame) const {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        return Error{ErrorCode::FileNotFound, "Cannot open template " + path.string()};
    }
    std::ostringstream ss;
    ss << in.rdbuf();
    const std::string text = ss.str();
    spdlog::debug("Rendering template {} ({} bytes, depth {})", path.string(), text.size(),
                  frame.depth);
    return render(sourceText(text), path.string(), frame);
}

std::string_view TemplateRenderer::sourceText(std::string_view text) const {
    if (options_.keepTrailingNewline) {
        return text;
    }
    // Jinja drops a single trailing newline of every template it loads
    if (text.size() >= 2 && text.substr(text.size() - 2) == "\r\n") {
        text.remove_suffix(2);
    } else if (!text.empty() && (text.back() == '\n' || text.back() == '\r')) {
        text.remove_suffix(1);
    }
    return text;
}

std::optional<fs::path> TemplateRenderer::findTemplate(std::string_view name,
                                                       const Frame& frame) const {
    fs::path rel(name);
    if (rel.is_absolute()) {
        std::error_code ec;
        if (fs::is_regular_file(rel, ec)) {
            return rel;
        }
        return std::nullopt;
    }
    for (const auto& dir : frame.searchPaths) {
        auto candidate = dir / rel;
        std::error_code ec;
        if (fs::is_regular_file(candidate, ec)) {
            return candidate;
        }
    }
    return std::nullopt;
}

Result<std::string> TemplateRenderer::render(std::string_view text, std::string_view source,
                                             const Frame& frame) const {
    std::string out;
    out.reserve(text.size());

    size_t pos = 0;
    bool stripLeading = false;
    while (pos < text.size()) {
        size_t open = text.find('{', pos);
        while (open != std::string_view::npos && open + 1 < text.size() &&
               text[open + 1] != '{' && text[open + 1] != '%' && text[open + 1] != '#') {
            open = text.find('{', open + 1);
        }
        if (open == std::string_view::npos || open + 1 >= text.size()) {
            open = std::string_view::npos;
        }

        std::string_view literal =
            text.substr(pos, open == std::string_view::npos ? std::string_view::npos : open - pos);
        const size_t literalStart = out.size();
        if (stripLeading) {
            while (!literal.empty() && std::isspace(static_cast<unsigned char>(literal.front()))) {
                literal.remove_prefix(1);
            }
            stripLeading = false;
        }
        out.append(literal);
        if (open == std::string_view::npos) {
            break;
        }

        const char kind = text[open + 1];
        const std::string_view close = kind == '{' ? "}}" : (kind == '%' ? "%}" : "#}");
        size_t bodyStart = open + 2;
        const size_t line = lineOf(text, open);

        size_t closePos = kind == '#' ? text.find(close, bodyStart)
                                      : findClose(text, bodyStart, close);
        if (closePos == std::string_view::npos) {
            return Error{ErrorCode::InvalidData,
                         "Unterminated tag at " + where(source, line)};
        }

        std::string_view body = text.substr(bodyStart, closePos - bodyStart);
        if (!body.empty() && body.front() == '-') {
            // Only the template text before the tag; rendered values keep their whitespace
            while (out.size() > literalStart &&
                   std::isspace(static_cast<unsigned char>(out.back()))) {
                out.pop_back();
            }
            body.remove_prefix(1);
        }
        if (!body.empty() && body.back() == '-') {
            stripLeading = true;
            body.remove_suffix(1);
        }
        pos = closePos + close.size();

        if (kind == '#') {
            continue;
        }

        auto piece = kind == '{' ? evalExpression(body, source, line)
                                 : evalStatement(body, source, line, frame);
        if (!piece) {
            return piece.error();
        }
        out.append(piece.value());
    }
    return out;
}

Result<std::string> TemplateRenderer::evalExpression(std::string_view expr,
                                                     std::string_view source,
                                                     size_t line) const {
    Cursor cur{expr};
    std::optional<std::string> value;
    std::string subject;

    if (cur.peekQuote()) {
        auto lit = cur.stringLiteral();
        if (!lit) {
            return Error{ErrorCode::InvalidData,
                         "Unterminated string literal at " + where(source, line)};
        }
        value = *lit;
        subject = "\"" + *lit + "\"";
    } else if (auto name = cur.identifier()) {
        subject = *name;
        value = context_.lookup(*name);
    } else {
        return Error{ErrorCode::InvalidData, "Expected a variable name or string literal at " +
                                                 where(source, line) + ": '" +
                                                 config::trimmed(expr) + "'"};
    }

    while (cur.consume('|')) {
        auto filter = cur.identifier();
        if (!filter) {
            return Error{ErrorCode::InvalidData, "Expected filter name at " + where(source, line)};
        }
        std::vector<std::string> args;
        if (cur.consume('(')) {
            if (!cur.consume(')')) {
                do {
                    auto arg = cur.stringLiteral();
                    if (!arg) {
                        return Error{ErrorCode::InvalidData,
                                     "Filter '" + *filter +
                                         "' takes string literal arguments at " +
                                         where(source, line)};
                    }
                    args.push_back(std::move(*arg));
                } while (cur.consume(','));
                if (!cur.consume(')')) {
                    return Error{ErrorCode::InvalidData,
                                 "Expected ')' after filter arguments at " + where(source, line)};
                }
            }
        }

        if (*filter == "default") {
            if (args.size() != 1) {
                return Error{ErrorCode::InvalidData,
                             "default() takes exactly one argument at " + where(source, line)};
            }
            if (!value) {
                value = args.front();
            }
            continue;
        }

        if (!value) {
            return Error{ErrorCode::UnresolvableTemplate,
                         "'" + subject + "' is undefined at " + where(source, line)};
        }

        if (*filter == "read_secret") {
            auto secret = context_.readSecret(fs::path(*value));
            if (!secret) {
                return Error{secret.error().code,
                             secret.error().message + " (at " + where(source, line) + ")"};
            }
            value = secret.value();
        } else if (*filter == "upper") {
            value = config::to_upper(*value);
        } else if (*filter == "lower") {
            value = config::to_lower(*value);
        } else if (*filter == "trim") {
            value = config::trimmed(*value);
        } else {
            return Error{ErrorCode::NotSupported,
                         "Unknown filter '" + *filter + "' at " + where(source, line)};
        }
    }

    if (!cur.atEnd()) {
        return Error{ErrorCode::InvalidData, "Unexpected input in expression at " +
                                                 where(source, line) + ": '" +
                                                 config::trimmed(expr) + "'"};
    }
    if (!value) {
        return Error{ErrorCode::UnresolvableTemplate,
                     "'" + subject + "' is undefined at " + where(source, line)};
    }
    return *value;
}

Result<std::string> TemplateRenderer::evalStatement(std::string_view stmt, std::string_view source,
                                                    size_t line, const Frame& frame) const {
    Cursor cur{stmt};
    auto keyword = cur.identifier();
    if (!keyword) {
        return Error{ErrorCode::InvalidData, "Empty statement at " + where(source, line)};
    }
    if (*keyword != "include") {
        return Error{ErrorCode::NotSupported,
                     "Unsupported statement '" + *keyword + "' at " + where(source, line)};
    }

    auto name = cur.stringLiteral();
    if (!name) {
        return Error{ErrorCode::InvalidData,
                     "include expects a quoted template name at " + where(source, line)};
    }

    bool ignoreMissing = false;
    if (auto word = cur.identifier()) {
        auto second = cur.identifier();
        if (*word != "ignore" || !second || *second != "missing") {
            return Error{ErrorCode::InvalidData,
                         "Unexpected input after include at " + where(source, line)};
        }
        ignoreMissing = true;
    }
    if (!cur.atEnd()) {
        return Error{ErrorCode::InvalidData,
                     "Unexpected input after include at " + where(source, line)};
    }

    if (frame.depth + 1 > options_.maxIncludeDepth) {
        return Error{ErrorCode::InvalidData, "Include depth exceeded (" +
                                                 std::to_string(options_.maxIncludeDepth) +
                                                 ") at " + where(source, line)};
    }

    auto found = findTemplate(*name, frame);
    if (!found) {
        if (ignoreMissing) {
            spdlog::debug("Optional include '{}' not found ({})", *name, where(source, line));
            return std::string{};
        }
        return Error{ErrorCode::FileNotFound,
                     "Included template '" + *name + "' not found at " + where(source, line)};
    }

    Frame child = frame;
    child.depth = frame.depth + 1;
    return renderInclude(*found, child);
}

} // namespace v6boot::render
