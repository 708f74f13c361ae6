#include <hiecore/session.hpp>
#include <hiecore/log.hpp>

namespace hiecore {

Session::Session(Config config, const BuildToolBackend& backend, const ToolProbe& probe,
                 Compiler& compiler)
    : config_(std::move(config)),
      resolver_(backend, probe, config_.tools),
      compiler_(compiler) {}

Configuration Session::configuration_for(const std::string& path) const {
    return resolver_.resolve(path);
}

Status Session::load_file(const std::string& path) {
    log::Context context(path);

    // Resolution runs external tools and reads the filesystem; no cache
    // lock is held until the result is stored.
    Configuration config = resolver_.resolve(path);
    log::debug("loading with configuration %s (%s)",
               config.name().c_str(), config.root_dir().c_str());

    auto flags = config.resolve(path);
    if (flags.is_err()) {
        log::warn("cannot load: %s", flags.error().message.c_str());
        cache_.mark_failed(path);
        return std::move(flags).error();
    }

    auto artifact = compiler_.compile(config, path, flags.value());
    if (artifact.is_err()) {
        HieError err = std::move(artifact).error();
        if (err.file.empty()) err.file = path;
        log::warn("compile failed: %s", err.message.c_str());
        cache_.mark_failed(path);
        return err;
    }

    cache_.store(path, std::move(artifact).value());
    return ok_status();
}

Result<std::string> Session::compiler_version(const std::string& path) const {
    return hiecore::compiler_version(resolver_.resolve(path), config_.tools,
                                     config_.process_timeout);
}

} // namespace hiecore
