#include <hiecore/cradle/cabal_backend.hpp>
#include <hiecore/log.hpp>
#include <hiecore/path_match.hpp>
#include <yaml-cpp/yaml.h>

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <set>

namespace hiecore {

namespace fs = std::filesystem;

// ---------------------------------------------------------------------------
// Helpers
// ---------------------------------------------------------------------------

static bool ends_with(const std::string& s, const std::string& suffix) {
    return s.size() >= suffix.size() &&
           s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

// All *.cabal files directly inside dir, sorted.
static std::vector<std::string> cabal_files_in(const fs::path& dir) {
    std::vector<std::string> out;
    std::error_code ec;
    for (const auto& entry : fs::directory_iterator(dir, ec)) {
        std::string name = entry.path().filename().string();
        if (name.size() > 6 && ends_with(name, ".cabal") && entry.is_regular_file(ec)) {
            out.push_back(entry.path().string());
        }
    }
    std::sort(out.begin(), out.end());
    return out;
}

static std::string unit_prefix(StanzaKind kind) {
    switch (kind) {
        case StanzaKind::Library:        return "lib:";
        case StanzaKind::ForeignLibrary: return "flib:";
        case StanzaKind::Executable:     return "exe:";
        case StanzaKind::TestSuite:      return "test:";
        case StanzaKind::Benchmark:      return "bench:";
        case StanzaKind::Common:
        case StanzaKind::CustomSetup:
        case StanzaKind::Other:
            break;
    }
    return "";
}

static std::string unit_id_for(const CabalStanza& st, const std::string& package_name) {
    std::string prefix = unit_prefix(st.kind);
    if (prefix.empty()) return "";
    return prefix + (st.name.empty() ? package_name : st.name);
}

static bool has_custom_setup(const CabalFile& file) {
    std::string bt = file.field("build-type");
    std::transform(bt.begin(), bt.end(), bt.begin(),
        [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return bt.find("custom") != std::string::npos;
}

static std::string package_name_of(const CabalFile& file) {
    std::string name = file.package_name();
    if (!name.empty()) return name;
    return fs::path(file.path).stem().string();
}

// ---------------------------------------------------------------------------
// Project discovery
// ---------------------------------------------------------------------------

std::vector<ProjectReference> CabalBackend::find_projects(const std::string& dir) const {
    std::vector<ProjectReference> found;
    std::error_code ec;
    fs::path base(dir);

    auto marker = [&](const char* name) { return normalise((base / name).string()); };

    if (fs::is_regular_file(base / "cabal.project", ec)) {
        found.push_back({ProjectKind::CabalV2File, marker("cabal.project")});
    }
    if (fs::is_directory(base / "dist-newstyle", ec)) {
        found.push_back({ProjectKind::CabalV2Dir, marker("dist-newstyle")});
    }
    if (fs::is_regular_file(base / "stack.yaml", ec)) {
        found.push_back({ProjectKind::StackYaml, marker("stack.yaml")});
    }
    auto cabal_files = cabal_files_in(base);
    if (!cabal_files.empty()) {
        found.push_back({ProjectKind::CabalV1File, normalise(cabal_files.front())});
    }
    if (fs::is_directory(base / "dist", ec)) {
        found.push_back({ProjectKind::CabalV1Dir, marker("dist")});
    }
    return found;
}

Result<std::vector<std::string>> CabalBackend::package_entries(const ProjectReference& project) {
    std::vector<std::string> entries;

    switch (project.kind) {
    case ProjectKind::StackYaml: {
        YAML::Node doc;
        try {
            doc = YAML::LoadFile(project.marker);
        } catch (const YAML::Exception& e) {
            return HieError{HieError::Parse,
                std::string("stack.yaml: ") + e.what(), "", project.marker, 0};
        }
        YAML::Node packages = doc["packages"];
        if (packages && packages.IsSequence()) {
            for (const auto& node : packages) {
                if (node.IsScalar()) entries.push_back(node.as<std::string>());
            }
        }
        if (entries.empty()) entries.push_back(".");
        break;
    }
    case ProjectKind::CabalV2File: {
        auto file = CabalFile::load(project.marker);
        if (file.is_err()) return std::move(file).error();
        for (auto& e : split_field_list(file.value().field("packages"))) {
            if (e.find("://") != std::string::npos) continue;
            entries.push_back(std::move(e));
        }
        if (entries.empty()) entries.push_back("./*.cabal");
        break;
    }
    case ProjectKind::CabalV2Dir:
    case ProjectKind::CabalV1File:
    case ProjectKind::CabalV1Dir:
        entries.push_back(".");
        break;
    }

    return Result<std::vector<std::string>>::ok(std::move(entries));
}

// Directories (relative to root) that the package entry designates.
static std::vector<std::string> expand_entry(const fs::path& root, const std::string& entry) {
    std::vector<std::string> dirs;
    std::error_code ec;

    bool glob_like = entry.find_first_of("*?") != std::string::npos || ends_with(entry, ".cabal");
    if (!glob_like) {
        if (fs::is_directory(root / entry, ec)) dirs.push_back(normalise(entry));
        return dirs;
    }

    auto matches = glob_expand(entry, root);
    if (matches.is_err()) {
        log::warn("package entry '%s': %s", entry.c_str(), matches.error().message.c_str());
        return dirs;
    }
    for (const auto& m : matches.value()) {
        if (ends_with(m, ".cabal")) {
            dirs.push_back(parent_dir(m));
        } else if (fs::is_directory(root / m, ec)) {
            dirs.push_back(m);
        }
    }
    return dirs;
}

Result<std::vector<Package>> CabalBackend::list_packages(const ProjectReference& project) const {
    auto entries = package_entries(project);
    if (entries.is_err()) return std::move(entries).error();

    fs::path root(project.root_dir());
    std::set<std::string> seen;
    std::vector<Package> packages;

    for (const auto& entry : entries.value()) {
        for (const auto& rel : expand_entry(root, entry)) {
            std::string pkg_dir = canonicalize(root / rel);
            if (!seen.insert(pkg_dir).second) continue;

            auto cabal_files = cabal_files_in(pkg_dir);
            if (cabal_files.empty()) {
                log::debug("no .cabal file in package dir %s", pkg_dir.c_str());
                continue;
            }
            if (cabal_files.size() > 1) {
                log::warn("several .cabal files in %s, using %s",
                          pkg_dir.c_str(), cabal_files.front().c_str());
            }

            auto file = CabalFile::load(cabal_files.front());
            if (file.is_err()) {
                log::warn("skipping package in %s: %s",
                          pkg_dir.c_str(), file.error().format().c_str());
                continue;
            }

            Package pkg;
            pkg.name = package_name_of(file.value());
            pkg.source_dir = pkg_dir;
            for (const auto& st : file.value().stanzas) {
                std::string id = unit_id_for(st, pkg.name);
                if (id.empty() || !st.is_buildable()) continue;
                pkg.units.push_back(Unit{id, pkg_dir, cabal_files.front()});
            }
            if (has_custom_setup(file.value())) {
                pkg.units.push_back(Unit{"setup:" + pkg.name, pkg_dir, cabal_files.front()});
            }

            if (pkg.units.empty()) {
                log::debug("package %s has no buildable units", pkg.name.c_str());
                continue;
            }
            packages.push_back(std::move(pkg));
        }
    }

    return Result<std::vector<Package>>::ok(std::move(packages));
}

// ---------------------------------------------------------------------------
// Unit introspection
// ---------------------------------------------------------------------------

std::vector<std::string> CabalBackend::stanza_flags(const CabalStanza& stanza,
                                                    const std::vector<std::string>& source_dirs) {
    std::vector<std::string> flags;

    // A bare "-i" clears the search path before the component's own dirs.
    flags.push_back("-i");
    for (const auto& dir : source_dirs) flags.push_back("-i" + dir);

    flags.push_back("-hide-all-packages");
    for (const auto& dep : dependency_names(stanza.field("build-depends"))) {
        flags.push_back("-package");
        flags.push_back(dep);
    }

    for (const auto& lang : split_field_list(stanza.field("default-language"))) {
        flags.push_back("-X" + lang);
    }
    for (const auto& key : {"default-extensions", "extensions"}) {
        for (const auto& ext : split_field_list(stanza.field(key))) {
            flags.push_back("-X" + ext);
        }
    }
    for (const auto& key : {"ghc-options", "cpp-options"}) {
        for (auto& opt : split_words(stanza.field(key))) {
            flags.push_back(std::move(opt));
        }
    }
    return flags;
}

Result<UnitInfo> CabalBackend::introspect_unit(const Unit& unit) const {
    auto file = CabalFile::load(unit.descriptor);
    if (file.is_err()) {
        return HieError{HieError::Introspection,
            "cannot introspect " + unit.id + ": " + file.error().message,
            "", unit.descriptor, file.error().line};
    }

    const CabalFile& cabal = file.value();
    std::string pkg_name = package_name_of(cabal);

    UnitInfo info;
    info.unit_id = unit.id;

    if (unit.id.rfind("setup:", 0) == 0) {
        std::error_code ec;
        std::string main_is = fs::exists(fs::path(unit.package_dir) / "Setup.lhs", ec)
            ? "Setup.lhs" : "Setup.hs";
        Component comp;
        comp.name = unit.id;
        comp.source_dirs = {"."};
        comp.entrypoint = Entrypoint::setup(main_is);
        info.components.push_back(std::move(comp));
        return Result<UnitInfo>::ok(std::move(info));
    }

    for (const auto& raw : cabal.stanzas) {
        if (unit_id_for(raw, pkg_name) != unit.id) continue;

        auto resolved = cabal.resolve_imports(raw);
        if (resolved.is_err()) {
            return HieError{HieError::Introspection,
                "cannot introspect " + unit.id + ": " + resolved.error().message,
                "", unit.descriptor, resolved.error().line};
        }
        const CabalStanza& st = resolved.value();

        Component comp;
        comp.name = unit.id;
        comp.source_dirs = split_field_list(st.field("hs-source-dirs"));
        for (auto& d : split_field_list(st.field("hs-source-dir"))) {
            comp.source_dirs.push_back(std::move(d));
        }
        if (comp.source_dirs.empty()) comp.source_dirs.push_back(".");

        auto other = split_field_list(st.field("other-modules"));
        if (st.kind == StanzaKind::Library || st.kind == StanzaKind::ForeignLibrary) {
            comp.entrypoint = Entrypoint::library(
                split_field_list(st.field("exposed-modules")), std::move(other));
        } else if (st.has_field("main-is")) {
            auto main_is = split_field_list(st.field("main-is"));
            comp.entrypoint = Entrypoint::executable(
                main_is.empty() ? "" : main_is.front(), std::move(other));
        } else {
            // detailed-0.9 test suites name a module instead of a main file
            for (auto& m : split_field_list(st.field("test-module"))) {
                other.push_back(std::move(m));
            }
            comp.entrypoint = Entrypoint::library({}, std::move(other));
        }

        comp.flags = stanza_flags(st, comp.source_dirs);
        info.components.push_back(std::move(comp));
        return Result<UnitInfo>::ok(std::move(info));
    }

    return HieError{HieError::Introspection,
        "unit " + unit.id + " no longer exists in " + unit.descriptor};
}

} // namespace hiecore
