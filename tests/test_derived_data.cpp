#include <catch2/catch.hpp>
#include <hiecore/cache/derived_data.hpp>
#include "test_helpers.hpp"
#include <algorithm>
#include <string>
#include <vector>

using namespace hiecore;
using hiecore_test::TempDir;

struct SourceArtifact : Artifact {
    std::string text;
    explicit SourceArtifact(std::string t) : text(std::move(t)) {}
};

static const std::string& text_of(const Artifact& a) {
    return static_cast<const SourceArtifact&>(a).text;
}

static const DerivedKey<size_t> kLength("length");
static const DerivedKey<size_t> kLines("lines");
static const DerivedKey<std::vector<std::string>> kWords("words");

TEST_CASE("keys get distinct ids", "[derived]") {
    REQUIRE(kLength.id() != kLines.id());
    REQUIRE(kLines.id() != kWords.id());
    REQUIRE(kWords.name() == "words");
}

TEST_CASE("get_or_compute computes once per entry", "[derived]") {
    TempDir td;
    std::string path = td.write_file("Foo.hs", "x = 1\n");
    ArtifactCache cache;
    CacheEntry entry = cache.store(path, std::make_shared<SourceArtifact>("x = 1\n"));

    int calls = 0;
    auto length = [&](const Artifact& a) { ++calls; return text_of(a).size(); };

    auto first = get_or_compute(cache, entry, kLength, length);
    REQUIRE(first.is_ok());
    REQUIRE(first.value() == 6);

    auto second = get_or_compute(cache, entry, kLength, length);
    REQUIRE(second.value() == 6);
    REQUIRE(calls == 1);
}

TEST_CASE("keys of the same type do not collide", "[derived]") {
    TempDir td;
    std::string path = td.write_file("Foo.hs", "a\nb\n");
    ArtifactCache cache;
    CacheEntry entry = cache.store(path, std::make_shared<SourceArtifact>("a\nb\nc"));

    auto length = get_or_compute(cache, entry, kLength,
        [](const Artifact& a) { return text_of(a).size(); });
    auto lines = get_or_compute(cache, entry, kLines, [](const Artifact& a) {
        const std::string& t = text_of(a);
        return static_cast<size_t>(std::count(t.begin(), t.end(), '\n') + 1);
    });
    REQUIRE(length.value() == 5);
    REQUIRE(lines.value() == 3);

    auto length_again = get_or_compute(cache, entry, kLength,
        [](const Artifact&) { return size_t{0}; });
    REQUIRE(length_again.value() == 5);
}

TEST_CASE("storing a new artifact clears derived data", "[derived]") {
    TempDir td;
    std::string path = td.write_file("Foo.hs", "x = 1\n");
    ArtifactCache cache;

    CacheEntry old_entry = cache.store(path, std::make_shared<SourceArtifact>("old"));
    get_or_compute(cache, old_entry, kLength, [](const Artifact& a) { return text_of(a).size(); });
    get_or_compute(cache, old_entry, kWords, [](const Artifact& a) {
        return std::vector<std::string>{text_of(a)};
    });

    CacheEntry new_entry = cache.store(path, std::make_shared<SourceArtifact>("newer"));
    REQUIRE(cache.find_derived(new_entry, kLength.id()) == nullptr);
    REQUIRE(cache.find_derived(new_entry, kWords.id()) == nullptr);

    auto words = get_or_compute(cache, new_entry, kWords, [](const Artifact& a) {
        return std::vector<std::string>{text_of(a)};
    });
    REQUIRE(words.value() == std::vector<std::string>{"newer"});
}

TEST_CASE("values for a replaced entry are returned but not stored", "[derived]") {
    TempDir td;
    std::string path = td.write_file("Foo.hs", "x = 1\n");
    ArtifactCache cache;

    CacheEntry old_entry = cache.store(path, std::make_shared<SourceArtifact>("old"));
    CacheEntry new_entry = cache.store(path, std::make_shared<SourceArtifact>("new!"));

    auto stale = get_or_compute(cache, old_entry, kLength,
        [](const Artifact& a) { return text_of(a).size(); });
    REQUIRE(stale.value() == 3);
    REQUIRE(cache.find_derived(new_entry, kLength.id()) == nullptr);
    REQUIRE(cache.find_derived(old_entry, kLength.id()) == nullptr);
}

TEST_CASE("values are not stored once the file has changed", "[derived]") {
    TempDir td;
    std::string path = td.write_file("Foo.hs", "x = 1\n");
    ArtifactCache cache;
    CacheEntry entry = cache.store(path, std::make_shared<SourceArtifact>("x = 1\n"));

    auto value = get_or_compute(cache, entry, kLength, [&](const Artifact& a) {
        td.write_file("Foo.hs", "x = 2\n");
        return text_of(a).size();
    });
    REQUIRE(value.value() == 6);
    REQUIRE(cache.find_derived(entry, kLength.id()) == nullptr);
}

TEST_CASE("failed entries have no derived data", "[derived]") {
    TempDir td;
    std::string path = td.write_file("Bad.hs", "x =\n");
    ArtifactCache cache;
    cache.mark_failed(path);

    auto entry = cache.lookup(path);
    REQUIRE(entry.has_value());
    auto r = get_or_compute(cache, *entry, kLength, [](const Artifact&) { return size_t{1}; });
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == HieError::NotFound);
}
