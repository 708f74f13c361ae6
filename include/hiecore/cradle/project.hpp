#pragma once

#include <hiecore/config.hpp>
#include <string>

namespace hiecore {

// Build-tool layouts a project can be recognised by.
enum class ProjectKind {
    StackYaml,    // <root>/stack.yaml
    CabalV2File,  // <root>/cabal.project
    CabalV2Dir,   // <root>/dist-newstyle/
    CabalV1File,  // <root>/<pkg>.cabal
    CabalV1Dir    // <root>/dist/
};

// A discovered project. `marker` is the file or directory that identified
// it; the project root is always the marker's directory.
struct ProjectReference {
    ProjectKind kind;
    std::string marker;

    std::string root_dir() const;

    // Stable name of the layout: "Stack", "Cabal-V2", "Cabal-V2-Dir",
    // "Cabal-V1", "Cabal-V1-Dir".
    const char* discriminator() const;

    // Stack and Cabal v2 layouts; these win over v1 layouts.
    bool is_modern() const;

    // Executable needed to build this project.
    const std::string& required_tool(const ToolNames& tools) const;

    bool operator==(const ProjectReference& other) const {
        return kind == other.kind && marker == other.marker;
    }
};

const char* project_kind_name(ProjectKind kind);

} // namespace hiecore
