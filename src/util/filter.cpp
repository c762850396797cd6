#include <sieve/filter.hpp>
#include <sieve/pattern.hpp>
#include <fstream>
#include <unordered_set>

namespace sieve {

// ---- Helpers ----

static std::vector<std::string> split_segments(const std::string& s) {
    std::vector<std::string> segs;
    std::string cur;
    for (char c : s) {
        if (c == '/') {
            // Empty components ("//", leading or trailing '/') are dropped
            if (!cur.empty()) segs.push_back(cur);
            cur.clear();
        } else {
            cur.push_back(c);
        }
    }
    if (!cur.empty()) segs.push_back(cur);
    return segs;
}

static std::string trim(const std::string& s) {
    auto start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    auto end = s.find_last_not_of(" \t\r\n");
    return s.substr(start, end - start + 1);
}

static std::string join_segments(const std::vector<std::string>& segs, size_t from) {
    std::string out;
    for (size_t i = from; i < segs.size(); i++) {
        if (i > from) out.push_back('/');
        out += segs[i];
    }
    return out;
}

// ---- Splitting ----

Result<std::vector<DecomposedFilter>> split_filter(const std::string& raw) {
    DecomposedFilter f;
    std::string body = raw;
    if (!body.empty() && body[0] == '!') {
        f.excludes = true;
        body = body.substr(1);
    }

    f.segments = split_segments(body);
    if (f.segments.empty()) {
        return SieveError{SieveError::InvalidArg,
            "filter has no path segments: '" + raw + "'",
            "remove blank filters and filters made only of '!' or '/'"};
    }

    std::vector<DecomposedFilter> out;
    out.push_back(f);
    if (f.segments[0] == "**") {
        DecomposedFilter here;
        here.excludes = f.excludes;
        here.segments.assign(f.segments.begin() + 1, f.segments.end());
        // "**" alone leaves nothing to match at this level
        if (!here.segments.empty()) out.push_back(std::move(here));
    }
    return Result<std::vector<DecomposedFilter>>::ok(std::move(out));
}

Result<std::vector<DecomposedFilter>> split_filters(const std::vector<std::string>& raws) {
    std::vector<DecomposedFilter> out;
    out.reserve(raws.size());
    for (const auto& raw : raws) {
        auto split = split_filter(raw);
        SIEVE_TRY(split);
        for (auto& f : split.value()) out.push_back(std::move(f));
    }
    return Result<std::vector<DecomposedFilter>>::ok(std::move(out));
}

// ---- Classification ----

std::string rewrite_folder_filter(const DecomposedFilter& f) {
    size_t join_start = f.segments[0] == "**" ? 0 : 1;
    std::string rewritten = f.excludes ? "!/" : "/";
    rewritten += join_segments(f.segments, join_start);
    return rewritten;
}

ClassifiedFilters classify_filters(const std::vector<DecomposedFilter>& filters) {
    ClassifiedFilters out;
    std::unordered_set<std::string> seen_files;
    std::unordered_set<std::string> seen_folders;

    for (const auto& f : filters) {
        if (f.is_file_filter()) {
            const auto& seg = f.segments[0];
            std::string key = (f.excludes ? "!" : "") + seg;
            if (!seen_files.insert(key).second) continue;
            if (f.excludes) {
                out.exclusive_file_regexes.push_back(segment_regex(key));
            } else {
                out.inclusive_files.push_back(seg);
            }
        } else if (f.is_folder_filter()) {
            const auto& selector = f.segments[0];
            out.folder_rewrites.push_back(
                FolderRewrite{segment_regex(selector), rewrite_folder_filter(f)});
            if (!f.excludes && seen_folders.insert(selector).second) {
                out.inclusive_folders.push_back(selector);
            }
        }
    }
    return out;
}

// ---- Filter files ----

Result<std::vector<std::string>> load_filter_file(const std::filesystem::path& path) {
    std::ifstream in(path);
    if (!in.is_open()) {
        return SieveError{SieveError::IO,
            "cannot open filter file: " + path.string(),
            "check the path passed with --from or filter-files"};
    }

    std::vector<std::string> filters;
    std::string line;
    while (std::getline(in, line)) {
        auto t = trim(line);
        if (t.empty() || t[0] == '#') continue;
        filters.push_back(std::move(t));
    }
    return Result<std::vector<std::string>>::ok(std::move(filters));
}

} // namespace sieve
