#include <catch2/catch.hpp>
#include <hiecore/cradle/cabal_file.hpp>
#include "test_helpers.hpp"

using namespace hiecore;
using hiecore_test::TempDir;

using Strings = std::vector<std::string>;

static const char* SAMPLE_CABAL = R"(cabal-version: 2.4
-- a comment
Name:          sample
version:       0.1.0
build-type:    Simple

common warnings
    ghc-options: -Wall

library
    import:           warnings
    exposed-modules:  Lib.Foo
                      Lib.Bar
    other-modules:    Lib.Internal
    hs-source-dirs:   src
    build-depends:    base >=4.14 && <5,
                      text ^>=2.0
    default-language: Haskell2010
    if flag(dev)
        ghc-options:  -O0

executable sample-cli
    main-is:          Main.hs
    hs-source-dirs:   app
    build-depends:    base, sample

test-suite spec
    type:             exitcode-stdio-1.0
    main-is:          Spec.hs
    hs-source-dirs:   test
    buildable:        False
)";

TEST_CASE("parse top-level fields and stanzas", "[cabal]") {
    auto r = CabalFile::parse(SAMPLE_CABAL, "sample.cabal");
    REQUIRE(r.is_ok());
    const CabalFile& f = r.value();

    REQUIRE(f.package_name() == "sample");
    REQUIRE(f.field("build-type") == "Simple");
    REQUIRE(f.stanzas.size() == 4);

    REQUIRE(f.stanzas[0].kind == StanzaKind::Common);
    REQUIRE(f.stanzas[0].name == "warnings");
    REQUIRE(f.stanzas[1].kind == StanzaKind::Library);
    REQUIRE(f.stanzas[1].name.empty());
    REQUIRE(f.stanzas[2].kind == StanzaKind::Executable);
    REQUIRE(f.stanzas[2].name == "sample-cli");
    REQUIRE(f.stanzas[3].kind == StanzaKind::TestSuite);
}

TEST_CASE("multi-line values and conditional blocks", "[cabal]") {
    auto r = CabalFile::parse(SAMPLE_CABAL);
    REQUIRE(r.is_ok());
    const CabalStanza& lib = r.value().stanzas[1];

    REQUIRE(split_field_list(lib.field("exposed-modules")) == Strings{"Lib.Foo", "Lib.Bar"});
    REQUIRE(lib.field("hs-source-dirs") == "src");
    // the body of `if flag(dev)` is merged into the stanza
    REQUIRE(lib.field("ghc-options") == "-O0");
    REQUIRE(lib.is_buildable());
    REQUIRE_FALSE(r.value().stanzas[3].is_buildable());
}

TEST_CASE("imports splice common stanzas", "[cabal]") {
    auto r = CabalFile::parse(SAMPLE_CABAL);
    REQUIRE(r.is_ok());
    auto lib = r.value().resolve_imports(r.value().stanzas[1]);
    REQUIRE(lib.is_ok());
    REQUIRE_FALSE(lib.value().has_field("import"));
    REQUIRE(split_words(lib.value().field("ghc-options")) == Strings{"-Wall", "-O0"});
}

TEST_CASE("unknown and cyclic imports are errors", "[cabal]") {
    auto unknown = CabalFile::parse("name: x\nlibrary\n  import: nope\n");
    REQUIRE(unknown.is_ok());
    auto r1 = unknown.value().resolve_imports(unknown.value().stanzas[0]);
    REQUIRE(r1.is_err());
    REQUIRE(r1.error().code == HieError::Parse);

    auto cyclic = CabalFile::parse("common a\n  import: b\ncommon b\n  import: a\nlibrary\n  import: a\n");
    REQUIRE(cyclic.is_ok());
    auto r2 = cyclic.value().resolve_imports(cyclic.value().stanzas[2]);
    REQUIRE(r2.is_err());
}

TEST_CASE("malformed stanza lines carry a location", "[cabal]") {
    auto r = CabalFile::parse("name: x\nlibrary\n  this is not a field\n", "x.cabal");
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == HieError::Parse);
    REQUIRE(r.error().file == "x.cabal");
    REQUIRE(r.error().line == 3);
}

TEST_CASE("field names are case-insensitive", "[cabal]") {
    auto r = CabalFile::parse("Name: Upper\nLibrary\n  Exposed-Modules: A\n");
    REQUIRE(r.is_ok());
    REQUIRE(r.value().package_name() == "Upper");
    REQUIRE(r.value().stanzas[0].kind == StanzaKind::Library);
    REQUIRE(r.value().stanzas[0].field("exposed-modules") == "A");
}

TEST_CASE("dependency_names drops version constraints", "[cabal]") {
    REQUIRE(dependency_names("base >=4 && <5, text") == Strings{"base", "text"});
    REQUIRE(dependency_names("base\n, containers ^>=0.6\n, base") == Strings{"base", "containers"});
    REQUIRE(dependency_names("").empty());
}

TEST_CASE("load reads from disk", "[cabal]") {
    TempDir td;
    std::string path = td.write_file("sample.cabal", SAMPLE_CABAL);
    auto r = CabalFile::load(path);
    REQUIRE(r.is_ok());
    REQUIRE(r.value().path == path);

    auto missing = CabalFile::load(td.str("none.cabal"));
    REQUIRE(missing.is_err());
    REQUIRE(missing.error().code == HieError::IO);
}
