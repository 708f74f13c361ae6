#pragma once

#include <hiecore/result.hpp>
#include <string>
#include <utility>
#include <vector>

namespace hiecore {

enum class StanzaKind {
    Library,
    ForeignLibrary,
    Executable,
    TestSuite,
    Benchmark,
    Common,
    CustomSetup,
    Other           // flag, source-repository, package, ...
};

using CabalField = std::pair<std::string, std::string>;   // lowercased key, raw value

struct CabalStanza {
    StanzaKind kind = StanzaKind::Other;
    std::string name;      // empty for the main library
    int line = 0;
    std::vector<CabalField> fields;

    bool has_field(const std::string& key) const;

    // Every occurrence of `key`, joined by newlines (conditional blocks are
    // flattened, so a field may occur more than once).
    std::string field(const std::string& key) const;

    bool is_buildable() const;
};

// A parsed .cabal or cabal.project file: top-level fields plus stanzas.
//
// Layout is indentation based: a field's value continues on every
// following line indented deeper than its key. Full-line "--" comments
// are ignored and `if`/`else` blocks are merged into their stanza.
struct CabalFile {
    std::string path;
    std::vector<CabalField> top_fields;
    std::vector<CabalStanza> stanzas;

    static Result<CabalFile> parse(const std::string& text, const std::string& origin = "");
    static Result<CabalFile> load(const std::string& path);

    std::string field(const std::string& key) const;
    std::string package_name() const;

    const CabalStanza* find_common(const std::string& name) const;

    // Copy of `stanza` with every `import:` replaced by the fields of the
    // named common stanzas (recursively).
    Result<CabalStanza> resolve_imports(const CabalStanza& stanza) const;
};

// Splits on commas and whitespace: module lists, source dirs, extensions.
std::vector<std::string> split_field_list(const std::string& value);

// Splits on whitespace only: ghc-options, cpp-options.
std::vector<std::string> split_words(const std::string& value);

// Package names from a build-depends value, constraints dropped.
//   "base >=4 && <5, text" -> {"base", "text"}
std::vector<std::string> dependency_names(const std::string& build_depends);

} // namespace hiecore
