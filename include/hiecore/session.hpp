#pragma once

#include <hiecore/config.hpp>
#include <hiecore/process.hpp>
#include <hiecore/cache/artifact_cache.hpp>
#include <hiecore/cradle/backend.hpp>
#include <hiecore/cradle/configuration.hpp>
#include <hiecore/cradle/resolver.hpp>
#include <string>

namespace hiecore {

// Turns a file plus its configuration into an artifact.
class Compiler {
public:
    virtual ~Compiler() = default;

    // Errors are reported as HieError::Compile.
    virtual Result<ArtifactPtr> compile(const Configuration& config,
                                        const std::string& file,
                                        const CompileFlags& flags) = 0;
};

// Owns the artifact cache and drives a load: configuration, flags,
// compile, then store or mark_failed so that waiters are released
// whatever happens.
class Session {
public:
    Session(Config config, const BuildToolBackend& backend, const ToolProbe& probe,
            Compiler& compiler);

    Status load_file(const std::string& path);

    Configuration configuration_for(const std::string& path) const;

    // Compiler version the file's configuration builds with.
    Result<std::string> compiler_version(const std::string& path) const;

    ArtifactCache& cache() { return cache_; }
    const ArtifactCache& cache() const { return cache_; }
    const Config& config() const { return config_; }

private:
    Config config_;
    ConfigurationResolver resolver_;
    Compiler& compiler_;
    ArtifactCache cache_;
};

} // namespace hiecore
