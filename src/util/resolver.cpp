#include <sieve/resolver.hpp>
#include <sieve/pattern.hpp>
#include <sieve/log.hpp>

#include <set>

namespace sieve {

namespace fs = std::filesystem;

// "/a/./b/" -> "/a/b", so joined child paths are canonical keys
static fs::path normalized(const fs::path& p) {
    auto n = p.lexically_normal();
    if (!n.has_filename() && n.has_relative_path()) n = n.parent_path();
    return n;
}

// ---------------------------------------------------------------------------
// MatchedFile / MatchSet
// ---------------------------------------------------------------------------

bool MatchedFile::exists() const {
    std::error_code ec;
    return fs::is_regular_file(path, ec);
}

bool MatchSet::insert(MatchedFile file) {
    auto key = file.path.string();
    return files_.emplace(std::move(key), std::move(file)).second;
}

void MatchSet::merge(const MatchSet& other) {
    for (const auto& [key, file] : other.files_) {
        files_.emplace(key, file);
    }
}

bool MatchSet::contains(const fs::path& path) const {
    return files_.count(normalized(path).string()) > 0;
}

std::vector<fs::path> MatchSet::paths() const {
    std::vector<fs::path> out;
    out.reserve(files_.size());
    for (const auto& [key, file] : files_) out.push_back(file.path);
    return out;
}

std::vector<std::string> MatchSet::relative_paths(const fs::path& base) const {
    auto norm_base = normalized(base);
    std::vector<std::string> out;
    out.reserve(files_.size());
    for (const auto& [key, file] : files_) {
        out.push_back(file.path.lexically_relative(norm_base).generic_string());
    }
    return out;
}

// ---------------------------------------------------------------------------
// Filesystem helpers
// ---------------------------------------------------------------------------

static SieveError io_error(const std::string& what, const fs::path& p,
                           const std::error_code& ec) {
    return SieveError{SieveError::IO,
        what + " '" + p.string() + "': " + ec.message()};
}

// A path that does not exist is simply "not of this type"; any other
// failure to stat it is an error.
static Result<bool> is_type(const fs::path& p, fs::file_type type) {
    std::error_code ec;
    auto st = fs::status(p, ec);
    bool missing = ec == std::errc::no_such_file_or_directory ||
                   ec == std::errc::not_a_directory;
    if (ec && !missing) {
        return io_error("cannot stat", p, ec);
    }
    return Result<bool>::ok(!ec && st.type() == type);
}

// Immediate children of `dir` whose (followed) type is `type`.
static Result<std::vector<fs::path>> list_children(const fs::path& dir,
                                                   fs::file_type type) {
    std::vector<fs::path> out;
    std::error_code ec;
    fs::directory_iterator it(dir, ec);
    if (ec) return io_error("cannot read directory", dir, ec);

    for (; it != fs::directory_iterator(); it.increment(ec)) {
        auto matches = is_type(it->path(), type);
        SIEVE_TRY(matches);
        if (matches.value()) out.push_back(it->path());
    }
    if (ec) return io_error("error iterating directory", dir, ec);
    return Result<std::vector<fs::path>>::ok(std::move(out));
}

// ---------------------------------------------------------------------------
// Directory walker
// ---------------------------------------------------------------------------

std::vector<std::string> rewritten_filters_for(
    const std::string& dir_name,
    const std::vector<FolderRewrite>& rewrites)
{
    std::vector<std::string> out;
    for (const auto& rw : rewrites) {
        if (std::regex_match(dir_name, rw.selector)) out.push_back(rw.filter);
    }
    return out;
}

static Status descend(const fs::path& dir,
                      const std::vector<FolderRewrite>& rewrites,
                      std::set<std::string>& visited,
                      MatchSet& out)
{
    // Rewritten filters depend only on the name, so one descent per directory
    if (!visited.insert(dir.string()).second) return ok_status();

    auto sub_filters = rewritten_filters_for(dir.filename().string(), rewrites);
    if (sub_filters.empty()) return ok_status();

    log::trace("descend %s (%zu filter(s))", dir.c_str(), sub_filters.size());
    auto found = resolve(sub_filters, dir);
    SIEVE_TRY(found);
    out.merge(found.value());
    return ok_status();
}

static Status walk_folder(const fs::path& root,
                          const std::string& selector,
                          const std::vector<FolderRewrite>& rewrites,
                          std::set<std::string>& visited,
                          MatchSet& out)
{
    if (!has_wildcards(selector)) {
        // "." and ".." resolve to directories whose real names the selector
        // does not match, so they never step outside the walk
        auto dir = normalized(root / selector);
        auto is_dir = is_type(dir, fs::file_type::directory);
        SIEVE_TRY(is_dir);
        if (!is_dir.value()) return ok_status();
        return descend(dir, rewrites, visited, out);
    }

    auto re = segment_regex(selector);
    auto dirs = list_children(root, fs::file_type::directory);
    SIEVE_TRY(dirs);
    for (const auto& dir : dirs.value()) {
        if (!std::regex_match(dir.filename().string(), re)) continue;
        SIEVE_TRY(descend(dir, rewrites, visited, out));
    }
    return ok_status();
}

Result<MatchSet> match_folder_filter(
    const fs::path& root,
    const std::string& selector,
    const std::vector<FolderRewrite>& rewrites)
{
    MatchSet out;
    std::set<std::string> visited;
    SIEVE_TRY(walk_folder(root, selector, rewrites, visited, out));
    return Result<MatchSet>::ok(std::move(out));
}

// ---------------------------------------------------------------------------
// File matcher
// ---------------------------------------------------------------------------

Result<MatchSet> match_file_filter(
    const fs::path& root,
    const std::string& filter,
    const std::vector<std::regex>& exclusions)
{
    MatchSet out;

    if (!has_wildcards(filter)) {
        auto file = root / filter;
        auto is_file = is_type(file, fs::file_type::regular);
        SIEVE_TRY(is_file);
        if (is_file.value() && !any_match(exclusions, file.filename().string())) {
            out.insert(MatchedFile{file});
        }
        return Result<MatchSet>::ok(std::move(out));
    }

    auto re = name_regex(filter);
    auto files = list_children(root, fs::file_type::regular);
    SIEVE_TRY(files);
    for (auto& file : files.value()) {
        auto name = file.filename().string();
        if (std::regex_match(name, re) && !any_match(exclusions, name)) {
            log::trace("match %s", file.c_str());
            out.insert(MatchedFile{std::move(file)});
        }
    }
    return Result<MatchSet>::ok(std::move(out));
}

// ---------------------------------------------------------------------------
// resolve()
// ---------------------------------------------------------------------------

static bool is_blank(const std::string& s) {
    return s.find_first_not_of(" \t\r\n\v\f") == std::string::npos;
}

Result<MatchSet> resolve(const std::vector<std::string>& filters,
                         const fs::path& root)
{
    if (is_blank(root.string())) {
        return SieveError{SieveError::InvalidArg,
            "root directory must not be empty",
            "pass a directory with --root or set 'root' in Sieve.toml"};
    }

    std::error_code ec;
    auto abs_root = normalized(fs::absolute(root, ec));
    if (ec) return io_error("cannot resolve root", root, ec);

    auto is_dir = is_type(abs_root, fs::file_type::directory);
    SIEVE_TRY(is_dir);
    if (!is_dir.value()) {
        return SieveError{SieveError::NotFound,
            "directory not found: " + root.string(),
            "the root must be an existing directory"};
    }

    if (filters.empty()) return Result<MatchSet>::ok(MatchSet{});

    // Validate every filter before touching the tree
    auto split = split_filters(filters);
    SIEVE_TRY(split);
    auto classified = classify_filters(split.value());

    log::debug("resolve %zu filter(s) in %s", filters.size(), abs_root.c_str());

    MatchSet out;
    for (const auto& filter : classified.inclusive_files) {
        auto found = match_file_filter(abs_root, filter, classified.exclusive_file_regexes);
        SIEVE_TRY(found);
        out.merge(found.value());
    }

    std::set<std::string> visited;
    for (const auto& selector : classified.inclusive_folders) {
        SIEVE_TRY(walk_folder(abs_root, selector, classified.folder_rewrites, visited, out));
    }

    return Result<MatchSet>::ok(std::move(out));
}

Result<MatchSet> resolve_optional(const std::optional<std::vector<std::string>>& filters,
                                  const fs::path& root)
{
    if (!filters.has_value()) {
        return SieveError{SieveError::InvalidArg,
            "no filter list given",
            "pass patterns on the command line or set 'filters' in Sieve.toml"};
    }
    return resolve(*filters, root);
}

} // namespace sieve
