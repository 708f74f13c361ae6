#include <hiecore/cradle/configuration.hpp>
#include <hiecore/process.hpp>
#include <hiecore/log.hpp>

namespace hiecore {

Configuration::Configuration(std::string root_dir, std::string name, Action action)
    : root_dir_(std::move(root_dir)), name_(std::move(name)), action_(std::move(action)) {}

Configuration Configuration::none(std::string root_dir, std::string name, HieError reason) {
    Configuration c(std::move(root_dir), std::move(name),
        [reason](const std::string&) -> Result<CompileFlags> { return reason; });
    c.none_ = true;
    return c;
}

bool Configuration::is_stack() const {
    return name_ == "Stack" || name_ == "Stack-None";
}

Result<CompileFlags> Configuration::resolve(const std::string& file) const {
    if (!action_) {
        return HieError{HieError::NoProject, "configuration has no resolve action"};
    }
    return action_(file);
}

Result<std::string> compiler_version(const Configuration& config,
                                     const ToolNames& tools,
                                     int timeout_seconds) {
    std::vector<std::string> args;
    if (config.is_stack()) {
        args = {tools.stack, "ghc", "--", "--numeric-version"};
    } else {
        args = {tools.ghc, "--numeric-version"};
    }

    auto r = run_command(args, config.root_dir(), timeout_seconds);
    if (r.is_err()) return std::move(r).error();

    const CommandResult& out = r.value();
    if (out.exit_code != 0) {
        return HieError{HieError::IO,
            "'" + args[0] + "' exited with code " + std::to_string(out.exit_code),
            out.stderr_str};
    }

    std::string version = out.stdout_str;
    while (!version.empty() && (version.back() == '\n' || version.back() == '\r' ||
                                version.back() == ' ')) {
        version.pop_back();
    }
    if (version.empty()) {
        return HieError{HieError::Parse, "'" + args[0] + "' printed no version"};
    }
    log::debug("compiler version for %s: %s", config.root_dir().c_str(), version.c_str());
    return Result<std::string>::ok(version);
}

} // namespace hiecore
