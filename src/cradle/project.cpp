#include <hiecore/cradle/project.hpp>
#include <hiecore/path_match.hpp>

namespace hiecore {

const char* project_kind_name(ProjectKind kind) {
    switch (kind) {
        case ProjectKind::StackYaml:   return "Stack";
        case ProjectKind::CabalV2File: return "Cabal-V2";
        case ProjectKind::CabalV2Dir:  return "Cabal-V2-Dir";
        case ProjectKind::CabalV1File: return "Cabal-V1";
        case ProjectKind::CabalV1Dir:  return "Cabal-V1-Dir";
    }
    return "Unknown";
}

std::string ProjectReference::root_dir() const {
    return parent_dir(marker);
}

const char* ProjectReference::discriminator() const {
    return project_kind_name(kind);
}

bool ProjectReference::is_modern() const {
    switch (kind) {
        case ProjectKind::StackYaml:
        case ProjectKind::CabalV2File:
        case ProjectKind::CabalV2Dir:
            return true;
        case ProjectKind::CabalV1File:
        case ProjectKind::CabalV1Dir:
            return false;
    }
    return false;
}

const std::string& ProjectReference::required_tool(const ToolNames& tools) const {
    return kind == ProjectKind::StackYaml ? tools.stack : tools.cabal;
}

} // namespace hiecore
