#pragma once

#include <hiecore/cradle/backend.hpp>
#include <hiecore/cradle/cabal_file.hpp>

namespace hiecore {

// Backend that reads project and package metadata straight from
// stack.yaml, cabal.project and .cabal files, without running the
// build tools.
//
// Units map one-to-one onto buildable stanzas:
//   library        -> lib:<pkg>        library foo    -> lib:foo
//   executable foo -> exe:foo          test-suite foo -> test:foo
//   benchmark foo  -> bench:foo        foreign-library foo -> flib:foo
//   build-type: Custom -> setup:<pkg>
class CabalBackend : public BuildToolBackend {
public:
    std::vector<ProjectReference> find_projects(const std::string& dir) const override;
    Result<std::vector<Package>> list_packages(const ProjectReference& project) const override;
    Result<UnitInfo> introspect_unit(const Unit& unit) const override;

    // Package directory entries named by the project file, relative to
    // the project root.
    static Result<std::vector<std::string>> package_entries(const ProjectReference& project);

    // Compiler flags for one stanza, relative to the package directory.
    static std::vector<std::string> stanza_flags(const CabalStanza& stanza,
                                                 const std::vector<std::string>& source_dirs);
};

} // namespace hiecore
