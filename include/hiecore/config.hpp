#pragma once

#include <hiecore/result.hpp>
#include <hiecore/log.hpp>
#include <filesystem>
#include <optional>
#include <string>

namespace hiecore {

// Executable names of the build tools and compiler.
struct ToolNames {
    std::string stack = "stack";
    std::string cabal = "cabal";
    std::string ghc = "ghc";
};

// Layered configuration: global (~/.hiecore/config.toml) then project
// (<root>/.hiecore.toml). A later layer overrides only the fields it sets.
struct Config {
    log::Level log_level = log::Info;
    bool log_color = false;
    ToolNames tools;
    int process_timeout = 60;   // seconds

    bool log_level_set = false;
    bool log_color_set = false;
    bool stack_set = false;
    bool cabal_set = false;
    bool ghc_set = false;
    bool process_timeout_set = false;

    static Result<Config> load(const std::string& path);
    static Result<Config> parse(const std::string& toml_str);

    void merge(const Config& other);

    static Config effective(const std::optional<Config>& global,
                            const std::optional<Config>& project);

    // Global layer plus `<project_root>/.hiecore.toml`, each only if present.
    static Result<Config> discover(const std::filesystem::path& project_root);

    // Push the [log] settings into hiecore::log.
    void apply_logging() const;
};

// ~/.hiecore/config.toml, or "" when HOME is unset.
std::string global_config_path();

} // namespace hiecore
