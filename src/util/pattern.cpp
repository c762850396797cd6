#include <sieve/pattern.hpp>
#include <algorithm>
#include <cstring>

namespace sieve {

// ---- Helpers ----

static bool is_regex_meta(char c) {
    return c != '\0' && std::strchr("\\^$.|?*+()[]{}", c) != nullptr;
}

static std::string regex_source_from(const std::string& segment, size_t start) {
    // The anchor is never part of the name
    if (start < segment.size() && segment[start] == '/') start++;

    std::string body;
    body.reserve((segment.size() - start) * 2);
    for (size_t i = start; i < segment.size(); i++) {
        char c = segment[i];
        if (c == '?') {
            body += "[^/]?";
        } else if (c == '*') {
            body += "[^/]*";
        } else {
            if (is_regex_meta(c)) body.push_back('\\');
            body.push_back(c);
        }
    }

    // Whole-component match, with or without a leading '/'
    return "^[/]?" + body + "$";
}

// ---- Public API ----

std::string segment_regex_source(const std::string& segment) {
    size_t start = !segment.empty() && segment[0] == '!' ? 1 : 0;
    return regex_source_from(segment, start);
}

std::string name_regex_source(const std::string& name) {
    return regex_source_from(name, 0);
}

std::regex segment_regex(const std::string& segment) {
    return std::regex(segment_regex_source(segment), std::regex::ECMAScript);
}

std::regex name_regex(const std::string& name) {
    return std::regex(name_regex_source(name), std::regex::ECMAScript);
}

bool has_wildcards(const std::string& segment) {
    return segment.find_first_of("*?") != std::string::npos;
}

bool any_match(const std::vector<std::regex>& regexes, const std::string& name) {
    return std::any_of(regexes.begin(), regexes.end(),
        [&](const std::regex& re) { return std::regex_match(name, re); });
}

} // namespace sieve
