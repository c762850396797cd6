#include <sieve/config.hpp>
#include <tomlplusplus/toml.hpp>
#include <fstream>
#include <sstream>
#include <cstdlib>

namespace sieve {

// Read an array of strings; any other element type is a config error.
static Result<std::vector<std::string>> string_array(const toml::node& node,
                                                     const std::string& key) {
    auto arr = node.as_array();
    if (!arr) {
        return SieveError{SieveError::Config,
            "'" + key + "' must be an array of strings"};
    }
    std::vector<std::string> out;
    for (const auto& elem : *arr) {
        auto s = elem.value<std::string>();
        if (!s) {
            return SieveError{SieveError::Config,
                "'" + key + "' must contain only strings"};
        }
        out.push_back(std::string(*s));
    }
    return Result<std::vector<std::string>>::ok(std::move(out));
}

Result<Config> Config::parse(const std::string& toml_str) {
    toml::table doc;
    try {
        doc = toml::parse(toml_str);
    } catch (const toml::parse_error& e) {
        return SieveError{SieveError::Parse,
            std::string("config TOML parse error: ") + e.what()};
    }

    Config cfg;

    if (auto node = doc["root"].node()) {
        auto s = node->value<std::string>();
        if (!s) return SieveError{SieveError::Config, "'root' must be a string"};
        cfg.root = std::string(*s);
    }

    if (auto node = doc["filters"].node()) {
        auto filters = string_array(*node, "filters");
        SIEVE_TRY(filters);
        cfg.filters = std::move(filters).value();
    }

    if (auto node = doc["filter-files"].node()) {
        auto files = string_array(*node, "filter-files");
        SIEVE_TRY(files);
        cfg.filter_files = std::move(files).value();
        cfg.filter_files_set = true;
    }

    // [output] section
    if (auto output = doc["output"].as_table()) {
        if (auto node = (*output)["absolute"].node()) {
            auto v = node->value_exact<bool>();
            if (!v) return SieveError{SieveError::Config, "'output.absolute' must be a boolean"};
            cfg.output.absolute = *v;
            cfg.output_absolute_set = true;
        }
    }

    // [log] section
    if (auto lg = doc["log"].as_table()) {
        if (auto node = (*lg)["level"].node()) {
            auto v = node->value<std::string>();
            if (!v) return SieveError{SieveError::Config, "'log.level' must be a string"};
            if (!log::parse_level(*v, cfg.logging.level)) {
                return SieveError{SieveError::Config,
                    "unknown log level: " + *v,
                    "expected one of: trace, debug, info, warn, error"};
            }
            cfg.log_level_set = true;
        }
        if (auto node = (*lg)["color"].node()) {
            auto v = node->value_exact<bool>();
            if (!v) return SieveError{SieveError::Config, "'log.color' must be a boolean"};
            cfg.logging.color = *v;
            cfg.log_color_set = true;
        }
    }

    return Result<Config>::ok(std::move(cfg));
}

Result<Config> Config::load(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return SieveError{SieveError::IO,
            "cannot open config file: " + path};
    }
    std::ostringstream ss;
    ss << file.rdbuf();
    auto cfg = Config::parse(ss.str());
    if (cfg.is_err()) cfg.error().file = path;
    return cfg;
}

void Config::merge(const Config& other) {
    if (other.root.has_value()) root = other.root;

    // Lists are replaced wholesale, not concatenated
    if (other.filters.has_value()) filters = other.filters;
    if (other.filter_files_set) {
        filter_files = other.filter_files;
        filter_files_set = true;
    }

    if (other.output_absolute_set) {
        output.absolute = other.output.absolute;
        output_absolute_set = true;
    }
    if (other.log_level_set) {
        logging.level = other.logging.level;
        log_level_set = true;
    }
    if (other.log_color_set) {
        logging.color = other.logging.color;
        log_color_set = true;
    }
}

Config Config::effective(const std::optional<Config>& global,
                          const std::optional<Config>& project,
                          const std::optional<Config>& cli) {
    Config result;
    if (global.has_value()) result.merge(global.value());
    if (project.has_value()) result.merge(project.value());
    if (cli.has_value()) result.merge(cli.value());
    return result;
}

std::string global_config_path() {
    const char* home = std::getenv("HOME");
    if (!home) home = std::getenv("USERPROFILE");
    if (!home) return "";
    return std::string(home) + "/.sieve/config.toml";
}

} // namespace sieve
