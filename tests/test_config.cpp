#include <catch2/catch.hpp>
#include <sieve/config.hpp>

using namespace sieve;

using Strings = std::vector<std::string>;

// ===== Parsing =====

TEST_CASE("parse config with root and filters", "[config]") {
    auto r = Config::parse(R"(
root = "site"
filters = ["**/*.html", "!**/drafts/*"]
)");
    REQUIRE(r.is_ok());
    REQUIRE(r.value().root == std::optional<std::string>("site"));
    REQUIRE(r.value().filters.has_value());
    REQUIRE(*r.value().filters == Strings{"**/*.html", "!**/drafts/*"});
}

TEST_CASE("parse config with output and log sections", "[config]") {
    auto r = Config::parse(R"(
filter-files = ["package.filters"]

[output]
absolute = true

[log]
level = "debug"
color = false
)");
    REQUIRE(r.is_ok());
    const auto& cfg = r.value();
    REQUIRE(cfg.filter_files == Strings{"package.filters"});
    REQUIRE(cfg.filter_files_set);
    REQUIRE(cfg.output.absolute);
    REQUIRE(cfg.output_absolute_set);
    REQUIRE(cfg.logging.level == log::Debug);
    REQUIRE_FALSE(cfg.logging.color);
    REQUIRE(cfg.log_color_set);
}

TEST_CASE("parse empty config leaves filters absent", "[config]") {
    auto r = Config::parse("");
    REQUIRE(r.is_ok());
    REQUIRE_FALSE(r.value().filters.has_value());
    REQUIRE_FALSE(r.value().root.has_value());
    REQUIRE(r.value().filter_files.empty());
}

TEST_CASE("parse empty filter array is present but empty", "[config]") {
    auto r = Config::parse("filters = []");
    REQUIRE(r.is_ok());
    REQUIRE(r.value().filters.has_value());
    REQUIRE(r.value().filters->empty());
}

TEST_CASE("parse invalid TOML config", "[config]") {
    auto r = Config::parse("not valid [toml");
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == SieveError::Parse);
}

TEST_CASE("parse rejects non-string filters", "[config]") {
    auto r = Config::parse("filters = [\"*.txt\", 3]");
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == SieveError::Config);
}

TEST_CASE("parse rejects filters given as a string", "[config]") {
    auto r = Config::parse("filters = \"*.txt\"");
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == SieveError::Config);
}

TEST_CASE("parse rejects non-string root", "[config]") {
    auto r = Config::parse("root = 42");
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == SieveError::Config);
}

TEST_CASE("parse rejects unknown log level", "[config]") {
    auto r = Config::parse("[log]\nlevel = \"loud\"\n");
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == SieveError::Config);
    REQUIRE(r.error().hint.find("trace") != std::string::npos);
}

TEST_CASE("parse rejects wrongly typed scalar settings", "[config]") {
    for (const char* doc : {
             "[output]\nabsolute = \"yes\"\n",
             "[log]\nlevel = 3\n",
             "[log]\ncolor = \"never\"\n"}) {
        auto r = Config::parse(doc);
        INFO("config: " << doc);
        REQUIRE(r.is_err());
        REQUIRE(r.error().code == SieveError::Config);
    }
}

TEST_CASE("load missing config file returns IO error", "[config]") {
    auto r = Config::load("/nonexistent_dir_xyz_123/Sieve.toml");
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == SieveError::IO);
}

// ===== Merge =====

TEST_CASE("merge replaces filter lists", "[config]") {
    auto base = Config::parse(R"(filters = ["*.txt", "*.md"])").value();
    auto over = Config::parse(R"(filters = ["*.cs"])").value();
    base.merge(over);
    REQUIRE(*base.filters == Strings{"*.cs"});
}

TEST_CASE("merge keeps values the other layer does not set", "[config]") {
    auto base = Config::parse(R"(
root = "src"
filters = ["*.txt"]

[output]
absolute = true

[log]
level = "warn"
)").value();
    auto over = Config::parse(R"(
[log]
color = false
)").value();
    base.merge(over);
    REQUIRE(*base.root == "src");
    REQUIRE(*base.filters == Strings{"*.txt"});
    REQUIRE(base.output.absolute);
    REQUIRE(base.logging.level == log::Warn);
    REQUIRE_FALSE(base.logging.color);
}

TEST_CASE("merge can switch absolute output back off", "[config]") {
    auto base = Config::parse("[output]\nabsolute = true\n").value();
    auto over = Config::parse("[output]\nabsolute = false\n").value();
    base.merge(over);
    REQUIRE_FALSE(base.output.absolute);
}

// ===== Layering =====

TEST_CASE("effective config: cli wins over project wins over global", "[config]") {
    auto global = Config::parse(R"(
filters = ["**/*"]
[log]
level = "error"
)").value();
    auto project = Config::parse(R"(
root = "site"
filters = ["**/*.html"]
)").value();
    Config cli;
    cli.logging.level = log::Debug;
    cli.log_level_set = true;

    auto eff = Config::effective(global, project, cli);
    REQUIRE(*eff.root == "site");
    REQUIRE(*eff.filters == Strings{"**/*.html"});
    REQUIRE(eff.logging.level == log::Debug);
}

TEST_CASE("effective config with no layers has no filters", "[config]") {
    auto eff = Config::effective(std::nullopt, std::nullopt, std::nullopt);
    REQUIRE_FALSE(eff.filters.has_value());
    REQUIRE_FALSE(eff.output.absolute);
    REQUIRE(eff.logging.level == log::Info);
}
