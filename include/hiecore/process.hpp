#pragma once

#include <hiecore/result.hpp>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace hiecore {

struct CommandResult {
    int exit_code;
    std::string stdout_str;
    std::string stderr_str;
};

// Run an external command, capturing stdout and stderr.
// Fails on fork/exec failure (exit code 127 is reported as NotFound) or
// when the command outlives `timeout_seconds`.
Result<CommandResult> run_command(const std::vector<std::string>& args,
                                  const std::string& working_dir = "",
                                  int timeout_seconds = 60);

// Full path of `name` on $PATH, if present and executable. Names that
// contain a '/' are checked as given.
std::optional<std::string> find_executable(const std::string& name);

// Answers "is this build tool installed?".
class ToolProbe {
public:
    virtual ~ToolProbe() = default;
    virtual bool is_executable_on_path(const std::string& name) const = 0;
};

// Probes $PATH, remembering each answer for the lifetime of the probe.
class SystemToolProbe : public ToolProbe {
public:
    bool is_executable_on_path(const std::string& name) const override;

private:
    mutable std::mutex mutex_;
    mutable std::unordered_map<std::string, bool> known_;
};

} // namespace hiecore
