#pragma once

#include <hiecore/result.hpp>
#include <hiecore/config.hpp>
#include <functional>
#include <string>
#include <vector>

namespace hiecore {

struct CompileFlags {
    std::vector<std::string> options;        // flags followed by targets
    std::vector<std::string> dependencies;   // files whose change invalidates the flags
};

// A resolved build configuration ("cradle"): a root directory and a lazy
// action that computes the flags for one file. Finding a configuration is
// cheap; flags are only computed when a file is actually requested.
class Configuration {
public:
    using Action = std::function<Result<CompileFlags>(const std::string& file)>;

    Configuration(std::string root_dir, std::string name, Action action);

    // A configuration that can answer metadata queries but never compiles.
    // `reason` is reported by every resolve().
    static Configuration none(std::string root_dir, std::string name, HieError reason);

    const std::string& root_dir() const { return root_dir_; }

    // "Stack", "Cabal-V2", ... ; "<layout>-None" when no package owns the
    // file and "None" when there is no project at all.
    const std::string& name() const { return name_; }

    bool is_none() const { return none_; }
    bool is_stack() const;

    Result<CompileFlags> resolve(const std::string& file) const;

private:
    std::string root_dir_;
    std::string name_;
    Action action_;
    bool none_ = false;
};

// Version of the compiler a configuration builds with. Works for "None"
// configurations too. Stack configurations ask `stack ghc`, others `ghc`.
Result<std::string> compiler_version(const Configuration& config,
                                     const ToolNames& tools,
                                     int timeout_seconds = 60);

} // namespace hiecore
