#pragma once

#include <sieve/result.hpp>
#include <sieve/log.hpp>
#include <string>
#include <vector>
#include <optional>

namespace sieve {

struct OutputConfig {
    bool absolute = false;
};

struct LogConfig {
    log::Level level = log::Info;
    bool color = true;
};

// Layered configuration: global > project > command line
// Lower layers override higher layers (command line wins over project wins over global)
struct Config {
    std::optional<std::string> root;
    // Absent when no layer names a filter list
    std::optional<std::vector<std::string>> filters;
    std::vector<std::string> filter_files;
    OutputConfig output;
    LogConfig logging;
    // Track which scalar fields were explicitly set (for merge)
    bool filter_files_set = false;
    bool output_absolute_set = false;
    bool log_level_set = false;
    bool log_color_set = false;

    // Load from a TOML config file (global or project-level)
    static Result<Config> load(const std::string& path);

    // Parse from TOML string
    static Result<Config> parse(const std::string& toml_str);

    // Merge another config on top (other's values override this)
    void merge(const Config& other);

    // Build effective config from layers: global -> project -> cli
    static Config effective(const std::optional<Config>& global,
                            const std::optional<Config>& project,
                            const std::optional<Config>& cli);
};

// Discover the global config file path: ~/.sieve/config.toml
std::string global_config_path();

// Name of the per-project config file looked up in the working directory
constexpr const char* kProjectConfigName = "Sieve.toml";

} // namespace sieve
