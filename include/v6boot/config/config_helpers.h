#pragma once

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace v6boot::config {

// String trimming utilities
inline void ltrim(std::string& s) {
    s.erase(s.begin(),
            std::find_if(s.begin(), s.end(), [](unsigned char ch) { return !std::isspace(ch); }));
}

inline void rtrim(std::string& s) {
    s.erase(std::find_if(s.rbegin(), s.rend(), [](unsigned char ch) { return !std::isspace(ch); })
                .base(),
            s.end());
}

inline void trim(std::string& s) {
    ltrim(s);
    rtrim(s);
}

inline std::string trimmed(std::string_view in) {
    std::string s(in);
    trim(s);
    return s;
}

inline std::string to_upper(std::string_view in) {
    std::string out(in);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return out;
}

inline std::string to_lower(std::string_view in) {
    std::string out(in);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

// Non-empty environment value, or nullopt
inline std::optional<std::string> get_env(const char* name) {
    if (const char* v = std::getenv(name); v && *v) {
        return std::string(v);
    }
    return std::nullopt;
}

inline std::string env_or(const char* name, std::string fallback) {
    if (auto v = get_env(name)) {
        return *v;
    }
    return fallback;
}

inline std::filesystem::path env_path_or(const char* name, const std::filesystem::path& fallback) {
    if (auto v = get_env(name)) {
        return std::filesystem::path(*v);
    }
    return fallback;
}

// Parse a non-negative integer millisecond count; nullopt on malformed input
std::optional<std::chrono::milliseconds> parse_ms(std::string_view s);

// Join URL pieces with exactly one '/' between them. Empty pieces are skipped.
std::string join_url(std::string_view base, const std::vector<std::string_view>& segments);

// Split "a,b , c" into trimmed, non-empty parts
std::vector<std::string> split_list(std::string_view raw, char sep = ',');

} // namespace v6boot::config
