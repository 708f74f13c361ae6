#include <hiecore/config.hpp>
#include <tomlplusplus/toml.hpp>
#include <cstdlib>
#include <fstream>
#include <sstream>

namespace hiecore {

namespace fs = std::filesystem;

static Status read_tool(const toml::table& tools, const char* key,
                        std::string& out, bool& set) {
    auto node = tools[key];
    if (!node) return ok_status();

    auto v = node.value<std::string>();
    if (!v || v->empty()) {
        return HieError{HieError::Config,
            std::string("[tools] ") + key + " must be a non-empty string"};
    }
    out = *v;
    set = true;
    return ok_status();
}

Result<Config> Config::parse(const std::string& toml_str) {
    toml::table doc;
    try {
        doc = toml::parse(toml_str);
    } catch (const toml::parse_error& e) {
        return HieError{HieError::Parse,
            std::string("config TOML parse error: ") + e.what()};
    }

    Config cfg;

    if (auto logs = doc["log"].as_table()) {
        if (auto lvl = (*logs)["level"].value<std::string>()) {
            auto parsed = log::parse_level(*lvl);
            if (parsed.is_err()) return std::move(parsed).error();
            cfg.log_level = parsed.value();
            cfg.log_level_set = true;
        }
        if (auto color = (*logs)["color"].value<bool>()) {
            cfg.log_color = *color;
            cfg.log_color_set = true;
        }
    }

    if (auto tools = doc["tools"].as_table()) {
        HIECORE_TRY(read_tool(*tools, "stack", cfg.tools.stack, cfg.stack_set));
        HIECORE_TRY(read_tool(*tools, "cabal", cfg.tools.cabal, cfg.cabal_set));
        HIECORE_TRY(read_tool(*tools, "ghc", cfg.tools.ghc, cfg.ghc_set));
    }

    if (auto proc = doc["process"].as_table()) {
        if (auto t = (*proc)["timeout"].value<int64_t>()) {
            if (*t <= 0) {
                return HieError{HieError::Config,
                    "[process] timeout must be positive, got " + std::to_string(*t)};
            }
            cfg.process_timeout = static_cast<int>(*t);
            cfg.process_timeout_set = true;
        }
    }

    return Result<Config>::ok(std::move(cfg));
}

Result<Config> Config::load(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return HieError{HieError::IO, "cannot open config file: " + path};
    }
    std::ostringstream ss;
    ss << file.rdbuf();

    auto cfg = Config::parse(ss.str());
    if (cfg.is_err()) {
        auto err = std::move(cfg).error();
        err.file = path;
        return err;
    }
    return cfg;
}

void Config::merge(const Config& other) {
    if (other.log_level_set) {
        log_level = other.log_level;
        log_level_set = true;
    }
    if (other.log_color_set) {
        log_color = other.log_color;
        log_color_set = true;
    }
    if (other.stack_set) {
        tools.stack = other.tools.stack;
        stack_set = true;
    }
    if (other.cabal_set) {
        tools.cabal = other.tools.cabal;
        cabal_set = true;
    }
    if (other.ghc_set) {
        tools.ghc = other.tools.ghc;
        ghc_set = true;
    }
    if (other.process_timeout_set) {
        process_timeout = other.process_timeout;
        process_timeout_set = true;
    }
}

Config Config::effective(const std::optional<Config>& global,
                         const std::optional<Config>& project) {
    Config result;
    if (global.has_value()) result.merge(global.value());
    if (project.has_value()) result.merge(project.value());
    return result;
}

Result<Config> Config::discover(const fs::path& project_root) {
    std::error_code ec;
    std::optional<Config> global;
    std::optional<Config> project;

    std::string global_path = global_config_path();
    if (!global_path.empty() && fs::exists(global_path, ec)) {
        auto g = Config::load(global_path);
        if (g.is_err()) return std::move(g).error();
        global = std::move(g).value();
    }

    fs::path local_path = project_root / ".hiecore.toml";
    if (fs::exists(local_path, ec)) {
        auto p = Config::load(local_path.string());
        if (p.is_err()) return std::move(p).error();
        project = std::move(p).value();
    }

    return Result<Config>::ok(Config::effective(global, project));
}

void Config::apply_logging() const {
    log::set_level(log_level);
    if (log_color_set) log::set_color_enabled(log_color);
}

std::string global_config_path() {
    const char* home = std::getenv("HOME");
    if (!home) return "";
    return std::string(home) + "/.hiecore/config.toml";
}

} // namespace hiecore
