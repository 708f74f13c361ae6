#include <hiecore/path_match.hpp>
#include <algorithm>

namespace hiecore {

namespace fs = std::filesystem;

// ---------------------------------------------------------------------------
// Lexical helpers
// ---------------------------------------------------------------------------

bool is_absolute(const std::string& path) {
    return !path.empty() && (path[0] == '/' || path[0] == '\\');
}

std::vector<std::string> split_path(const std::string& path) {
    std::vector<std::string> segs;
    if (is_absolute(path)) segs.push_back("/");

    std::string cur;
    for (char c : path) {
        if (c == '/' || c == '\\') {
            if (!cur.empty()) segs.push_back(cur);
            cur.clear();
        } else {
            cur.push_back(c);
        }
    }
    if (!cur.empty()) segs.push_back(cur);
    return segs;
}

static std::string join_segments(const std::vector<std::string>& segs, size_t from) {
    std::string out;
    for (size_t i = from; i < segs.size(); ++i) {
        if (segs[i] == "/") {
            out = "/";
            continue;
        }
        if (!out.empty() && out.back() != '/') out.push_back('/');
        out += segs[i];
    }
    return out;
}

std::string normalise(const std::string& path) {
    if (path.empty()) return path;

    std::vector<std::string> kept;
    for (auto& seg : split_path(path)) {
        if (seg == ".") continue;
        kept.push_back(std::move(seg));
    }

    std::string out = join_segments(kept, 0);
    return out.empty() ? "." : out;
}

std::optional<std::string> strip_prefix(const std::string& dir, const std::string& file) {
    if (normalise(dir) == ".") {
        if (is_absolute(file)) return std::nullopt;
        std::string rel = normalise(file);
        return rel == "." ? std::string() : rel;
    }

    auto dir_segs = split_path(normalise(dir));
    auto file_segs = split_path(normalise(file));
    if (file_segs.size() == 1 && file_segs[0] == ".") file_segs.clear();

    if (dir_segs.size() > file_segs.size()) return std::nullopt;
    for (size_t i = 0; i < dir_segs.size(); ++i) {
        if (dir_segs[i] != file_segs[i]) return std::nullopt;
    }
    return join_segments(file_segs, dir_segs.size());
}

bool is_prefix_of(const std::string& dir, const std::string& file) {
    return strip_prefix(dir, file).has_value();
}

std::optional<std::string> relative_to(const std::string& file,
                                       const std::vector<std::string>& dirs) {
    for (const auto& dir : dirs) {
        if (auto rel = strip_prefix(dir, file)) return rel;
    }
    return std::nullopt;
}

std::string module_name(const std::string& relative) {
    std::string stem = relative;
    size_t slash = stem.find_last_of("/\\");
    size_t dot = stem.find_last_of('.');
    if (dot != std::string::npos && (slash == std::string::npos || dot > slash) &&
        dot != slash + 1) {
        stem.erase(dot);
    }
    for (char& c : stem) {
        if (c == '/' || c == '\\') c = '.';
    }
    return stem;
}

std::string parent_dir(const std::string& path) {
    auto segs = split_path(normalise(path));
    if (segs.empty() || (segs.size() == 1 && (segs[0] == "/" || segs[0] == "."))) {
        return segs.empty() ? "." : segs[0];
    }
    segs.pop_back();
    if (segs.empty()) return ".";
    return join_segments(segs, 0);
}

std::vector<std::string> ancestors(const std::string& dir) {
    std::vector<std::string> out;
    std::string cur = normalise(dir);
    while (true) {
        out.push_back(cur);
        std::string up = parent_dir(cur);
        if (up == cur) break;
        cur = up;
    }
    return out;
}

std::string canonicalize(const fs::path& path) {
    std::error_code ec;
    fs::path abs = fs::absolute(path, ec);
    if (ec) abs = path;

    fs::path resolved = fs::weakly_canonical(abs, ec);
    if (ec) resolved = abs;

    return normalise(resolved.lexically_normal().string());
}

// ---------------------------------------------------------------------------
// Globbing
// ---------------------------------------------------------------------------

static bool has_wildcard(const std::string& seg) {
    return seg.find_first_of("*?") != std::string::npos;
}

static bool match_segment(const std::string& pat, size_t pi,
                          const std::string& str, size_t si) {
    while (pi < pat.size()) {
        if (pat[pi] == '*') {
            while (pi < pat.size() && pat[pi] == '*') ++pi;
            if (pi == pat.size()) return true;
            for (size_t k = si; k <= str.size(); ++k) {
                if (match_segment(pat, pi, str, k)) return true;
            }
            return false;
        }
        if (si == str.size()) return false;
        if (pat[pi] != '?' && pat[pi] != str[si]) return false;
        ++pi;
        ++si;
    }
    return si == str.size();
}

static bool match_segments(const std::vector<std::string>& pat, size_t pi,
                           const std::vector<std::string>& path, size_t si) {
    while (pi < pat.size()) {
        if (pat[pi] == "**") {
            for (size_t k = si; k <= path.size(); ++k) {
                if (match_segments(pat, pi + 1, path, k)) return true;
            }
            return false;
        }
        if (si == path.size() || !match_segment(pat[pi], 0, path[si], 0)) return false;
        ++pi;
        ++si;
    }
    return si == path.size();
}

bool glob_match(const std::string& pattern, const std::string& path) {
    return match_segments(split_path(normalise(pattern)), 0,
                          split_path(normalise(path)), 0);
}

static void expand_from(const fs::path& root, const std::vector<std::string>& segs,
                        size_t idx, const std::string& prefix,
                        std::vector<std::string>& out) {
    fs::path here = prefix.empty() ? root : root / prefix;
    auto child = [&](const std::string& name) {
        return prefix.empty() ? name : prefix + "/" + name;
    };

    if (idx == segs.size()) {
        out.push_back(prefix.empty() ? "." : prefix);
        return;
    }

    const std::string& seg = segs[idx];
    std::error_code ec;

    if (seg == "**") {
        expand_from(root, segs, idx + 1, prefix, out);
        for (const auto& entry : fs::directory_iterator(here, ec)) {
            std::string name = entry.path().filename().string();
            if (name.empty() || name[0] == '.') continue;
            if (entry.is_directory(ec)) expand_from(root, segs, idx, child(name), out);
        }
        return;
    }

    if (!has_wildcard(seg)) {
        if (fs::exists(here / seg, ec)) expand_from(root, segs, idx + 1, child(seg), out);
        return;
    }

    for (const auto& entry : fs::directory_iterator(here, ec)) {
        std::string name = entry.path().filename().string();
        if (name.empty() || name[0] == '.') continue;
        if (!match_segment(seg, 0, name, 0)) continue;
        if (idx + 1 < segs.size() && !entry.is_directory(ec)) continue;
        expand_from(root, segs, idx + 1, child(name), out);
    }
}

Result<std::vector<std::string>> glob_expand(const std::string& pattern,
                                             const fs::path& root) {
    std::error_code ec;
    if (!fs::is_directory(root, ec)) {
        return HieError{HieError::IO,
            "glob root is not a directory: " + root.string()};
    }
    if (is_absolute(pattern)) {
        return HieError{HieError::InvalidArg,
            "glob pattern must be relative: " + pattern};
    }

    auto segs = split_path(normalise(pattern));
    if (segs.size() == 1 && segs[0] == ".") segs.clear();

    std::vector<std::string> out;
    expand_from(root, segs, 0, "", out);

    std::sort(out.begin(), out.end());
    out.erase(std::unique(out.begin(), out.end()), out.end());
    return Result<std::vector<std::string>>::ok(std::move(out));
}

} // namespace hiecore
