#pragma once

#include <hiecore/result.hpp>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace hiecore {

// Pure path utilities over '/'-separated strings. Nothing here touches the
// filesystem except canonicalize() and glob_expand().

// Lexical normalisation: collapses "//", drops "." segments (a lone "."
// survives), strips trailing separators except for "/". ".." is kept.
//
//   normalise("./src/././Lib.hs") == "src/Lib.hs"
//   normalise("/a//b/")           == "/a/b"
std::string normalise(const std::string& path);

// Split a normalised path into segments; an absolute path starts with "/".
std::vector<std::string> split_path(const std::string& path);

bool is_absolute(const std::string& path);

// Strip `dir` from `file` iff `dir` is a component-wise prefix of it.
//
//   strip_prefix("app", "app/File.hs")        == "File.hs"
//   strip_prefix("src", "src-dir/File.hs")    == nullopt
//   strip_prefix(".", "src/File.hs")          == "src/File.hs"
//   strip_prefix("app/", "./app/Lib/File.hs") == "Lib/File.hs"
//   strip_prefix("/app/", "./app/File.hs")    == nullopt
std::optional<std::string> strip_prefix(const std::string& dir, const std::string& file);

bool is_prefix_of(const std::string& dir, const std::string& file);

// First directory in `dirs` that strips `file`, applied.
std::optional<std::string> relative_to(const std::string& file,
                                       const std::vector<std::string>& dirs);

// "Lib/Foo.hs" -> "Lib.Foo"
std::string module_name(const std::string& relative);

// The directory itself followed by every parent, ending in "/" for
// absolute paths and "." for relative ones.
//
//   ancestors("a/b/c") == {"a/b/c", "a/b", "a", "."}
//   ancestors("/a/b")  == {"/a/b", "/a", "/"}
std::vector<std::string> ancestors(const std::string& dir);

std::string parent_dir(const std::string& path);

// Absolute, symlink-resolved, lexically normal. The file need not exist;
// the existing part of the path is resolved.
std::string canonicalize(const std::filesystem::path& path);

// Glob over path segments: '*' and '?' within a segment, '**' for any
// number of segments.
bool glob_match(const std::string& pattern, const std::string& path);

// Expand `pattern` relative to `root` into existing files and directories,
// returned relative to `root` and sorted.
Result<std::vector<std::string>> glob_expand(const std::string& pattern,
                                             const std::filesystem::path& root);

} // namespace hiecore
