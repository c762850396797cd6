#pragma once

#include <sieve/result.hpp>
#include <filesystem>
#include <regex>
#include <string>
#include <vector>

namespace sieve {

// A raw filter split into its non-empty path segments.
// `excludes` is set when the raw filter started with '!'.
struct DecomposedFilter {
    std::vector<std::string> segments;
    bool excludes = false;

    bool is_file_filter() const { return segments.size() == 1; }
    bool is_folder_filter() const { return segments.size() > 1; }
};

// Subdirectory selector regex paired with the filter to apply inside a
// matching subdirectory.
struct FolderRewrite {
    std::regex selector;
    std::string filter;
};

struct ClassifiedFilters {
    std::vector<std::string> inclusive_files;
    std::vector<std::regex> exclusive_file_regexes;
    std::vector<std::string> inclusive_folders;
    std::vector<FolderRewrite> folder_rewrites;
};

// Split one raw filter. A leading "**" segment yields a second filter with
// that segment removed, so "**/x" matches "x" at this level too.
// Fails with InvalidArg if the filter has no segments ("", "!", "/").
Result<std::vector<DecomposedFilter>> split_filter(const std::string& raw);

// Split every raw filter, preserving order.
Result<std::vector<DecomposedFilter>> split_filters(const std::vector<std::string>& raws);

// Rewritten filter for a folder filter: "(!)/" + remaining segments.
// A leading "**" is kept so the descent can continue at any depth.
std::string rewrite_folder_filter(const DecomposedFilter& f);

// Partition decomposed filters into file/folder and inclusive/exclusive views.
ClassifiedFilters classify_filters(const std::vector<DecomposedFilter>& filters);

// Read raw filters from a file, one per line. Blank lines and lines starting
// with '#' are skipped; surrounding whitespace is trimmed.
Result<std::vector<std::string>> load_filter_file(const std::filesystem::path& path);

} // namespace sieve
