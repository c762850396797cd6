#pragma once

#include <regex>
#include <string>
#include <vector>

namespace sieve {

// Compile one wildcard segment into a regex matching a single path component.
// A leading '!' and then a leading '/' are stripped first.
// Supports: * (zero or more chars except /), ? (zero or one char except /).
// The result also accepts the component with a leading '/'.
std::regex segment_regex(const std::string& segment);

// Returns the regex source that segment_regex() compiles.
std::string segment_regex_source(const std::string& segment);

// Like segment_regex(), but only a leading '/' is stripped: a leading '!' is
// part of the name. Used for file names whose negation was already removed.
std::regex name_regex(const std::string& name);

// Returns the regex source that name_regex() compiles.
std::string name_regex_source(const std::string& name);

// True if the segment contains '*' or '?'.
bool has_wildcards(const std::string& segment);

// True if any of the regexes matches the whole name.
bool any_match(const std::vector<std::regex>& regexes, const std::string& name);

} // namespace sieve
