#include <hiecore/cradle/resolver.hpp>
#include <hiecore/content_hash.hpp>
#include <hiecore/log.hpp>
#include <hiecore/path_match.hpp>
#include <algorithm>
#include <filesystem>

namespace hiecore {

namespace fs = std::filesystem;

// ---------------------------------------------------------------------------
// UnitInfoMemo
// ---------------------------------------------------------------------------

Result<UnitInfo> UnitInfoMemo::get(const BuildToolBackend& backend, const Unit& unit) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = infos_.find(unit.id);
        if (it != infos_.end()) return Result<UnitInfo>::ok(it->second);
    }

    // Introspection can be slow; two racing callers both introspect and the
    // later result wins.
    auto info = backend.introspect_unit(unit);
    if (info.is_ok()) {
        std::lock_guard<std::mutex> lock(mutex_);
        infos_[unit.id] = info.value();
    }
    return info;
}

// ---------------------------------------------------------------------------
// Matching
// ---------------------------------------------------------------------------

const Package* find_package_for(const std::vector<Package>& packages, const std::string& file) {
    const Package* best = nullptr;
    size_t best_depth = 0;
    for (const auto& pkg : packages) {
        if (!is_prefix_of(pkg.source_dir, file)) continue;
        size_t depth = split_path(normalise(pkg.source_dir)).size();
        if (!best || depth > best_depth) {
            best = &pkg;
            best_depth = depth;
        }
    }
    return best;
}

std::vector<std::string> component_targets(const Component& comp, const std::string& relative) {
    const Entrypoint& ep = comp.entrypoint;
    std::vector<std::string> targets;

    switch (ep.kind) {
    case EntrypointKind::Setup:
        break;
    case EntrypointKind::Library:
        targets = ep.exposed_modules;
        targets.insert(targets.end(), ep.other_modules.begin(), ep.other_modules.end());
        break;
    case EntrypointKind::Executable:
        // main-is is relative to one of the source dirs; use the one the
        // requested file lives under.
        for (const auto& dir : comp.source_dirs) {
            if (is_prefix_of(dir, relative)) {
                targets.push_back(normalise(dir + "/" + ep.main_is));
                break;
            }
        }
        targets.insert(targets.end(), ep.other_modules.begin(), ep.other_modules.end());
        break;
    }
    return targets;
}

bool part_of_component(const std::string& relative, const Component& comp) {
    auto stripped = relative_to(relative, comp.source_dirs);
    if (!stripped) return false;

    auto targets = component_targets(comp, relative);
    std::string mod = module_name(*stripped);
    std::string file = normalise(relative);
    for (const auto& t : targets) {
        if (t == mod || t == file) return true;
    }

    const Entrypoint& ep = comp.entrypoint;
    if ((ep.kind == EntrypointKind::Executable || ep.kind == EntrypointKind::Setup) &&
        !ep.main_is.empty()) {
        return normalise(ep.main_is) == *stripped;
    }
    return false;
}

// GHC flags that start with "-i" but take no search path.
static bool is_non_path_i_flag(const std::string& flag) {
    static const char* const kFlags[] = {
        "-ignore-", "-interactive", "-include-", "-instantiated-with"
    };
    for (const char* f : kFlags) {
        if (flag.rfind(f, 0) == 0) return true;
    }
    return false;
}

std::string fix_import_dirs(const std::string& base_dir, const std::string& flag) {
    if (flag.rfind("-i", 0) != 0 || flag.size() == 2 || is_non_path_i_flag(flag)) {
        return flag;
    }

    std::string out = "-i";
    std::string rest = flag.substr(2);
    size_t start = 0;
    while (true) {
        size_t colon = rest.find(':', start);
        std::string dir = rest.substr(start, colon == std::string::npos ? std::string::npos
                                                                        : colon - start);
        if (!dir.empty() && !is_absolute(dir)) {
            dir = normalise((fs::path(base_dir) / dir).string());
        }
        out += dir;
        if (colon == std::string::npos) break;
        out += ':';
        start = colon + 1;
    }
    return out;
}

std::optional<Component> find_component(const BuildToolBackend& backend,
                                        const std::vector<Unit>& units,
                                        const std::string& relative,
                                        UnitInfoMemo& memo) {
    for (const auto& unit : units) {
        auto info = memo.get(backend, unit);
        if (info.is_err()) {
            log::warn("skipping unit %s while looking for \"%s\": %s",
                      unit.id.c_str(), relative.c_str(), info.error().message.c_str());
            continue;
        }
        for (const auto& comp : info.value().components) {
            if (part_of_component(relative, comp)) return comp;
        }
    }
    return std::nullopt;
}

// ---------------------------------------------------------------------------
// ConfigurationResolver
// ---------------------------------------------------------------------------

ConfigurationResolver::ConfigurationResolver(const BuildToolBackend& backend,
                                             const ToolProbe& probe, ToolNames tools)
    : backend_(backend), locator_(backend, probe, std::move(tools)) {}

std::shared_ptr<UnitInfoMemo>
ConfigurationResolver::memo_for(const std::string& key,
                                const std::vector<std::string>& descriptors) const {
    ContentHash h;
    for (const auto& d : descriptors) {
        auto digest = ContentHash::hash_file(d);
        h.update(d);
        h.update(digest.is_ok() ? digest.value() : std::string("-"));
    }
    std::string fingerprint = h.finish();

    std::lock_guard<std::mutex> lock(memo_mutex_);
    auto& slot = memos_[key];
    if (!slot.memo || slot.fingerprint != fingerprint) {
        if (slot.memo) log::debug("package descriptors of %s changed, forgetting units", key.c_str());
        slot.fingerprint = std::move(fingerprint);
        slot.memo = std::make_shared<UnitInfoMemo>();
    }
    return slot.memo;
}

static std::string current_dir() {
    std::error_code ec;
    fs::path cwd = fs::current_path(ec);
    return ec ? std::string(".") : cwd.string();
}

Configuration ConfigurationResolver::resolve(const std::string& file) const {
    auto project = locator_.find_entry_point(file);
    if (!project) {
        log::error("could not find a project for file: %s", file.c_str());
        return Configuration::none(current_dir(), "None",
            HieError{HieError::NoProject, "no project found for " + file,
                     "no stack.yaml, cabal.project or .cabal file with an installed build tool"});
    }

    std::string root = project->root_dir();
    std::string disc = project->discriminator();
    log::debug("project for %s: %s at %s", file.c_str(), disc.c_str(), root.c_str());

    auto packages = backend_.list_packages(*project);
    if (packages.is_err()) {
        log::warn("cannot list packages of %s: %s", root.c_str(),
                  packages.error().format().c_str());
        return Configuration::none(root, disc + "-None",
            HieError{HieError::NoPackage, "cannot list packages of " + root + ": " +
                     packages.error().message});
    }

    std::string target = canonicalize(file);
    const Package* pkg = find_package_for(packages.value(), target);
    if (!pkg) {
        log::debug("no package of %s contains %s", root.c_str(), file.c_str());
        return Configuration::none(root, disc + "-None",
            HieError{HieError::NoPackage, "no package in " + root + " contains " + file});
    }

    std::string pkg_root = canonicalize(pkg->source_dir);
    log::debug("package for %s: %s (%s)", file.c_str(), pkg->name.c_str(), pkg_root.c_str());

    const BuildToolBackend* backend = &backend_;
    auto units = pkg->units;
    std::vector<std::string> descriptors;
    for (const auto& u : units) {
        if (!u.descriptor.empty() &&
            std::find(descriptors.begin(), descriptors.end(), u.descriptor) == descriptors.end()) {
            descriptors.push_back(u.descriptor);
        }
    }
    auto memo = memo_for(project->marker + "|" + pkg_root, descriptors);

    auto action = [backend, units, descriptors, memo, pkg_root](const std::string& fp) -> Result<CompileFlags> {
        std::string abs = canonicalize(fp);
        std::string relative = strip_prefix(pkg_root, abs).value_or(abs);

        auto comp = find_component(*backend, units, relative, *memo);
        if (!comp) {
            return HieError{HieError::NoComponent,
                "could not obtain flags for " + fp,
                "no component of the package lists this file as a module or main file",
                fp, 0};
        }

        CompileFlags flags;
        for (const auto& f : comp->flags) flags.options.push_back(fix_import_dirs(pkg_root, f));
        for (auto& t : component_targets(*comp, relative)) flags.options.push_back(std::move(t));
        flags.dependencies = descriptors;

        log::debug("flags for \"%s\" from %s: %zu options",
                   fp.c_str(), comp->name.c_str(), flags.options.size());
        return Result<CompileFlags>::ok(std::move(flags));
    };

    return Configuration(pkg_root, disc, std::move(action));
}

} // namespace hiecore
