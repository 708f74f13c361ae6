#pragma once

#include <hiecore/config.hpp>
#include <hiecore/process.hpp>
#include <hiecore/cradle/backend.hpp>
#include <optional>
#include <string>

namespace hiecore {

// Finds the project a file belongs to.
//
// Every ancestor of the file's directory is asked for project markers and
// the candidates are pooled. Candidates whose build tool is not installed
// are dropped. Any Stack or Cabal v2 candidate then beats every Cabal v1
// candidate, wherever they sit in the hierarchy: a v1 package nested in
// a v2/Stack project belongs to that project. Among equals the nearest one
// found first wins; this is a heuristic, nothing more.
class ProjectLocator {
public:
    ProjectLocator(const BuildToolBackend& backend, const ToolProbe& probe,
                   ToolNames tools = {});

    std::optional<ProjectReference> find_entry_point(const std::string& file) const;

    // Root of the file's project, or the file's own directory when it
    // belongs to none. Per-project settings live here.
    std::string project_root(const std::string& file) const;

    // Every candidate in every ancestor of `dir`, nearest first.
    std::vector<ProjectReference> candidates(const std::string& dir) const;

private:
    const BuildToolBackend& backend_;
    const ToolProbe& probe_;
    ToolNames tools_;
};

} // namespace hiecore
