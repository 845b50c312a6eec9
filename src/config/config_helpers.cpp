#include <v6boot/config/config_helpers.h>

#include <charconv>

namespace v6boot::config {

std::optional<std::chrono::milliseconds> parse_ms(std::string_view s) {
    auto t = trimmed(s);
    if (t.empty()) {
        return std::nullopt;
    }
    long long value = 0;
    const char* first = t.data();
    const char* last = t.data() + t.size();
    auto res = std::from_chars(first, last, value);
    if (res.ec != std::errc() || res.ptr != last || value < 0) {
        return std::nullopt;
    }
    return std::chrono::milliseconds(value);
}

std::string join_url(std::string_view base, const std::vector<std::string_view>& segments) {
    std::string out(base);
    while (!out.empty() && out.back() == '/') {
        out.pop_back();
    }
    for (auto seg : segments) {
        while (!seg.empty() && seg.front() == '/') {
            seg.remove_prefix(1);
        }
        while (!seg.empty() && seg.back() == '/') {
            seg.remove_suffix(1);
        }
        if (seg.empty()) {
            continue;
        }
        out.push_back('/');
        out.append(seg);
    }
    return out;
}

std::vector<std::string> split_list(std::string_view raw, char sep) {
    std::vector<std::string> out;
    size_t start = 0;
    while (start <= raw.size()) {
        size_t end = raw.find(sep, start);
        if (end == std::string_view::npos) {
            end = raw.size();
        }
        auto part = trimmed(raw.substr(start, end - start));
        if (!part.empty()) {
            out.push_back(std::move(part));
        }
        start = end + 1;
    }
    return out;
}

} // namespace v6boot::config
