// sieve: print the files of a directory tree selected by gitignore-style filters.
//
//     sieve '**/*.cpp' '!**/test_*.cpp'
//     sieve -C build -f package.filters --absolute
//
// Settings are layered: ~/.sieve/config.toml, then Sieve.toml in the working
// directory (or --config FILE), then the command line.

#include <sieve/config.hpp>
#include <sieve/filter.hpp>
#include <sieve/log.hpp>
#include <sieve/resolver.hpp>
#include <sieve/result.hpp>

#include <filesystem>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

namespace fs = std::filesystem;
using namespace sieve;

static const char* kUsage =
    "usage: sieve [options] [PATTERN...]\n"
    "\n"
    "options:\n"
    "  -C, --root DIR      directory to resolve against (default: .)\n"
    "  -c, --config FILE   project config file (default: ./Sieve.toml if present)\n"
    "  -f, --from FILE     read patterns from FILE, one per line (repeatable)\n"
    "  -a, --absolute      print absolute paths\n"
    "  -v, --verbose       debug logging\n"
    "  -q, --quiet         only log errors\n"
    "      --color         force colored log output\n"
    "      --no-color      disable colored log output\n"
    "  -h, --help          show this help\n";

struct CliOptions {
    Config layer;
    std::optional<std::string> config_path;
    bool help = false;
};

// ---------------------------------------------------------------------------
// Argument parsing
// ---------------------------------------------------------------------------

static Result<CliOptions> parse_args(int argc, char** argv) {
    CliOptions opts;
    std::vector<std::string> patterns;
    bool only_patterns = false;

    auto take_value = [&](int& i, const std::string& flag) -> Result<std::string> {
        if (i + 1 >= argc) {
            return SieveError{SieveError::InvalidArg,
                "missing value for " + flag, "see sieve --help"};
        }
        return Result<std::string>::ok(argv[++i]);
    };

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        // "!pattern" and "/pattern" are patterns, never options
        if (only_patterns || arg.empty() || arg[0] != '-') {
            patterns.push_back(arg);
            continue;
        }

        if (arg == "--") {
            only_patterns = true;
        } else if (arg == "-h" || arg == "--help") {
            opts.help = true;
        } else if (arg == "-C" || arg == "--root") {
            auto v = take_value(i, arg);
            SIEVE_TRY(v);
            opts.layer.root = v.value();
        } else if (arg == "-c" || arg == "--config") {
            auto v = take_value(i, arg);
            SIEVE_TRY(v);
            opts.config_path = v.value();
        } else if (arg == "-f" || arg == "--from") {
            auto v = take_value(i, arg);
            SIEVE_TRY(v);
            opts.layer.filter_files.push_back(v.value());
            opts.layer.filter_files_set = true;
        } else if (arg == "-a" || arg == "--absolute") {
            opts.layer.output.absolute = true;
            opts.layer.output_absolute_set = true;
        } else if (arg == "-v" || arg == "--verbose") {
            opts.layer.logging.level = log::Debug;
            opts.layer.log_level_set = true;
        } else if (arg == "-q" || arg == "--quiet") {
            opts.layer.logging.level = log::Error;
            opts.layer.log_level_set = true;
        } else if (arg == "--color" || arg == "--no-color") {
            opts.layer.logging.color = arg == "--color";
            opts.layer.log_color_set = true;
        } else {
            return SieveError{SieveError::InvalidArg,
                "unknown option: " + arg, "see sieve --help"};
        }
    }

    if (!patterns.empty()) opts.layer.filters = std::move(patterns);
    return Result<CliOptions>::ok(std::move(opts));
}

// ---------------------------------------------------------------------------
// Configuration layers
// ---------------------------------------------------------------------------

// Load `path` if it exists; a missing optional file is not an error.
static Result<std::optional<Config>> load_optional(const std::string& path) {
    std::error_code ec;
    if (path.empty() || !fs::is_regular_file(path, ec)) {
        return Result<std::optional<Config>>::ok(std::nullopt);
    }
    log::debug("loading config %s", path.c_str());
    auto cfg = Config::load(path);
    SIEVE_TRY(cfg);
    return Result<std::optional<Config>>::ok(std::move(cfg).value());
}

static Result<Config> effective_config(const CliOptions& opts) {
    auto global = load_optional(global_config_path());
    SIEVE_TRY(global);

    std::optional<Config> project;
    if (opts.config_path) {
        // An explicitly named config must exist
        auto cfg = Config::load(*opts.config_path);
        SIEVE_TRY(cfg);
        project = std::move(cfg).value();
    } else {
        auto cfg = load_optional(kProjectConfigName);
        SIEVE_TRY(cfg);
        project = std::move(cfg).value();
    }

    return Result<Config>::ok(Config::effective(global.value(), project, opts.layer));
}

// Inline filters followed by the contents of every filter file.
// Stays absent when neither is given.
static Result<std::optional<std::vector<std::string>>> collect_filters(const Config& cfg) {
    std::optional<std::vector<std::string>> filters = cfg.filters;
    for (const auto& file : cfg.filter_files) {
        auto loaded = load_filter_file(file);
        SIEVE_TRY(loaded);
        if (!filters) filters.emplace();
        filters->insert(filters->end(), loaded.value().begin(), loaded.value().end());
        log::debug("read %zu filter(s) from %s", loaded.value().size(), file.c_str());
    }
    return Result<std::optional<std::vector<std::string>>>::ok(std::move(filters));
}

// ---------------------------------------------------------------------------
// main
// ---------------------------------------------------------------------------

static Status run(const CliOptions& opts) {
    auto cfg = effective_config(opts);
    SIEVE_TRY(cfg);

    log::set_level(cfg.value().logging.level);
    if (cfg.value().log_color_set) log::set_color_enabled(cfg.value().logging.color);

    auto filters = collect_filters(cfg.value());
    SIEVE_TRY(filters);

    fs::path root = cfg.value().root.value_or(".");
    auto matched = resolve_optional(filters.value(), root);
    SIEVE_TRY(matched);

    log::debug("%zu file(s) matched", matched.value().size());

    if (cfg.value().output.absolute) {
        for (const auto& p : matched.value().paths()) {
            std::cout << p.generic_string() << "\n";
        }
    } else {
        std::error_code ec;
        auto base = fs::absolute(root, ec);
        if (ec) {
            return SieveError{SieveError::IO,
                "cannot resolve root '" + root.string() + "': " + ec.message()};
        }
        for (const auto& p : matched.value().relative_paths(base)) {
            std::cout << p << "\n";
        }
    }
    return ok_status();
}

int main(int argc, char** argv) {
    auto opts = parse_args(argc, argv);
    if (opts.is_err()) {
        std::cerr << opts.error().format() << "\n";
        return 2;
    }
    if (opts.value().help) {
        std::cout << kUsage;
        return 0;
    }

    auto status = run(opts.value());
    if (status.is_err()) {
        std::cerr << status.error().format() << "\n";
        return 1;
    }
    return 0;
}
