#pragma once

#include <hiecore/result.hpp>
#include <hiecore/cradle/project.hpp>
#include <string>
#include <vector>

namespace hiecore {

enum class EntrypointKind { Library, Executable, Setup };

// What a component compiles: exposed/other modules for libraries, a main
// file plus other modules for executables, a main file for Setup scripts.
struct Entrypoint {
    EntrypointKind kind = EntrypointKind::Library;
    std::vector<std::string> exposed_modules;
    std::vector<std::string> other_modules;
    std::string main_is;   // relative to one of the component's source dirs

    static Entrypoint library(std::vector<std::string> exposed,
                              std::vector<std::string> other);
    static Entrypoint executable(std::string main_is,
                                 std::vector<std::string> other);
    static Entrypoint setup(std::string main_is);
};

struct Component {
    std::string name;
    std::vector<std::string> source_dirs;   // relative to the package dir
    Entrypoint entrypoint;
    std::vector<std::string> flags;         // compiler flags, package-relative
};

struct UnitInfo {
    std::string unit_id;
    std::vector<Component> components;
};

// A buildable target of a package. Its components are only known after
// the backend introspects it.
struct Unit {
    std::string id;            // e.g. "lib:foo", "exe:foo-cli"
    std::string package_dir;
    std::string descriptor;    // backend-specific handle, e.g. the .cabal path
};

struct Package {
    std::string name;
    std::string source_dir;    // canonical, unique within a project
    std::vector<Unit> units;   // never empty
};

// The build-tool side of configuration resolution. Implementations must
// be safe to call from several threads at once.
class BuildToolBackend {
public:
    virtual ~BuildToolBackend() = default;

    // Project markers present directly in `dir`.
    virtual std::vector<ProjectReference> find_projects(const std::string& dir) const = 0;

    virtual Result<std::vector<Package>> list_packages(const ProjectReference& project) const = 0;

    // Failures here are transient: callers skip the unit and carry on.
    virtual Result<UnitInfo> introspect_unit(const Unit& unit) const = 0;
};

} // namespace hiecore
