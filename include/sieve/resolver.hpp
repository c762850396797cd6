#pragma once

#include <sieve/filter.hpp>
#include <sieve/result.hpp>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace sieve {

// A file selected by a filter, identified by its absolute path.
struct MatchedFile {
    std::filesystem::path path;

    std::string name() const { return path.filename().string(); }
    bool exists() const;
};

// Matched files keyed by absolute path. Inserting a path twice keeps one entry.
class MatchSet {
public:
    using Map = std::map<std::string, MatchedFile>;
    using const_iterator = Map::const_iterator;

    // Returns false if the path was already present.
    bool insert(MatchedFile file);
    void merge(const MatchSet& other);

    bool contains(const std::filesystem::path& path) const;
    size_t size() const { return files_.size(); }
    bool empty() const { return files_.empty(); }

    const_iterator begin() const { return files_.begin(); }
    const_iterator end() const { return files_.end(); }

    // Paths in sorted order.
    std::vector<std::filesystem::path> paths() const;

    // Paths relative to `base`, with '/' separators, in sorted order.
    std::vector<std::string> relative_paths(const std::filesystem::path& base) const;

private:
    Map files_;
};

// Resolve gitignore-style filters against the directory tree at `root`.
//   name, dir/name   literal path segments
//   * ?              wildcards inside one segment
//   **               as a leading segment: this directory and any depth below
//   !filter          exclusion (suppresses file matches in the same scope)
//   /filter          leading '/' is cosmetic
// Errors: InvalidArg (blank root, filter without segments), NotFound (root is
// not a directory), IO (a directory could not be enumerated).
Result<MatchSet> resolve(const std::vector<std::string>& filters,
                         const std::filesystem::path& root);

// As above; an absent filter list is an InvalidArg error.
Result<MatchSet> resolve_optional(const std::optional<std::vector<std::string>>& filters,
                                  const std::filesystem::path& root);

// Filters that apply inside a subdirectory named `dir_name`: the rewritten
// filter of every folder rewrite whose selector matches, in order.
std::vector<std::string> rewritten_filters_for(
    const std::string& dir_name,
    const std::vector<FolderRewrite>& rewrites);

// Files under the subdirectories of `root` selected by `selector`.
Result<MatchSet> match_folder_filter(
    const std::filesystem::path& root,
    const std::string& selector,
    const std::vector<FolderRewrite>& rewrites);

// Files directly in `root` matching `filter` and none of `exclusions`.
Result<MatchSet> match_file_filter(
    const std::filesystem::path& root,
    const std::string& filter,
    const std::vector<std::regex>& exclusions);

} // namespace sieve
