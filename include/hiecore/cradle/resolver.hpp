#pragma once

#include <hiecore/config.hpp>
#include <hiecore/process.hpp>
#include <hiecore/cradle/backend.hpp>
#include <hiecore/cradle/configuration.hpp>
#include <hiecore/cradle/locator.hpp>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace hiecore {

// Introspected units of one package, each introspected at most once.
// Failed introspections are not remembered, so a later request retries.
class UnitInfoMemo {
public:
    Result<UnitInfo> get(const BuildToolBackend& backend, const Unit& unit);

private:
    std::mutex mutex_;
    std::unordered_map<std::string, UnitInfo> infos_;
};

// Package whose source directory is the longest prefix of `file`, or
// nullptr. `file` and the source dirs are compared lexically.
const Package* find_package_for(const std::vector<Package>& packages, const std::string& file);

// Module names and entry files a component loads for `relative` (a path
// relative to the package dir).
std::vector<std::string> component_targets(const Component& comp, const std::string& relative);

// Does the component compile `relative`, either as one of its modules or
// as its main file?
bool part_of_component(const std::string& relative, const Component& comp);

// Rewrites a relative "-i<dir>[:<dir>...]" flag against `base_dir`.
// Everything else, including a bare "-i" and absolute dirs, is unchanged.
std::string fix_import_dirs(const std::string& base_dir, const std::string& flag);

// First component, over all units in order, that claims `relative`.
// Units that fail to introspect are logged and skipped.
std::optional<Component> find_component(const BuildToolBackend& backend,
                                        const std::vector<Unit>& units,
                                        const std::string& relative,
                                        UnitInfoMemo& memo);

// file -> Configuration. Never fails: missing projects and packages
// produce "None" configurations whose resolve() reports why.
class ConfigurationResolver {
public:
    ConfigurationResolver(const BuildToolBackend& backend, const ToolProbe& probe,
                          ToolNames tools = {});

    Configuration resolve(const std::string& file) const;

    const ProjectLocator& locator() const { return locator_; }

private:
    // Unit infos are shared by every configuration of the same package
    // until one of its .cabal descriptors changes.
    struct PackageMemo {
        std::string fingerprint;
        std::shared_ptr<UnitInfoMemo> memo;
    };

    std::shared_ptr<UnitInfoMemo> memo_for(const std::string& key,
                                           const std::vector<std::string>& descriptors) const;

    const BuildToolBackend& backend_;
    ProjectLocator locator_;
    mutable std::mutex memo_mutex_;
    mutable std::unordered_map<std::string, PackageMemo> memos_;
};

} // namespace hiecore
