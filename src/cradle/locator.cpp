#include <hiecore/cradle/locator.hpp>
#include <hiecore/log.hpp>
#include <hiecore/path_match.hpp>
#include <filesystem>

namespace hiecore {

ProjectLocator::ProjectLocator(const BuildToolBackend& backend, const ToolProbe& probe,
                               ToolNames tools)
    : backend_(backend), probe_(probe), tools_(std::move(tools)) {}

static std::string describe(const std::vector<ProjectReference>& projects) {
    std::string out = "[";
    for (size_t i = 0; i < projects.size(); ++i) {
        if (i) out += ", ";
        out += projects[i].discriminator();
        out += " ";
        out += projects[i].root_dir();
    }
    return out + "]";
}

std::vector<ProjectReference> ProjectLocator::candidates(const std::string& dir) const {
    std::vector<ProjectReference> all;
    for (const auto& ancestor : ancestors(dir)) {
        for (auto& p : backend_.find_projects(ancestor)) {
            all.push_back(std::move(p));
        }
    }
    return all;
}

std::optional<ProjectReference> ProjectLocator::find_entry_point(const std::string& file) const {
    std::error_code ec;
    std::string abs = std::filesystem::absolute(file, ec).string();
    if (ec) abs = file;

    auto all = candidates(parent_dir(abs));
    log::debug("projects found for %s: %s", file.c_str(), describe(all).c_str());

    std::vector<ProjectReference> supported;
    for (auto& p : all) {
        if (probe_.is_executable_on_path(p.required_tool(tools_))) {
            supported.push_back(std::move(p));
        }
    }
    log::debug("projects with their build tool installed: %s", describe(supported).c_str());

    for (const auto& p : supported) {
        if (p.is_modern()) return p;
    }
    if (!supported.empty()) return supported.front();
    return std::nullopt;
}

std::string ProjectLocator::project_root(const std::string& file) const {
    auto project = find_entry_point(file);
    if (project) return project->root_dir();

    std::error_code ec;
    std::string abs = std::filesystem::absolute(file, ec).string();
    return parent_dir(ec ? file : abs);
}

} // namespace hiecore
