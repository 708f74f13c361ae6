#include <catch2/catch.hpp>
#include <hiecore/content_hash.hpp>
#include "test_helpers.hpp"

using namespace hiecore;
using hiecore_test::TempDir;

TEST_CASE("SHA-256 known vectors", "[hash]") {
    REQUIRE(ContentHash::hash_bytes("") ==
            "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
    REQUIRE(ContentHash::hash_bytes("abc") ==
            "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
    REQUIRE(ContentHash::hash_bytes(
                "abcdbcdecdefdefgefghfghighijhijkijkljklmklmnlmnomnopnopq") ==
            "248d6a61d20638b8e5c026930c3e6039a33ce45964ff2167f6ecedd419db06c1");
}

TEST_CASE("Streaming updates match a single update", "[hash]") {
    std::string text(1000, 'x');
    for (size_t i = 0; i < text.size(); ++i) text[i] = static_cast<char>('a' + i % 26);

    ContentHash h;
    h.update(text.substr(0, 3));
    h.update(text.substr(3, 61));
    h.update(text.substr(64));
    REQUIRE(h.finish() == ContentHash::hash_bytes(text));
}

TEST_CASE("hash_file follows the file's bytes", "[hash]") {
    TempDir td;
    std::string path = td.write_file("Foo.hs", "module Foo where\n");

    auto first = ContentHash::hash_file(path);
    REQUIRE(first.is_ok());
    REQUIRE(first.value() == ContentHash::hash_bytes("module Foo where\n"));

    td.write_file("Foo.hs", "module Foo where\nx = 1\n");
    auto second = ContentHash::hash_file(path);
    REQUIRE(second.is_ok());
    REQUIRE(second.value() != first.value());
}

TEST_CASE("hash_file reports missing files", "[hash]") {
    TempDir td;
    auto r = ContentHash::hash_file(td.path / "missing.hs");
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == HieError::IO);
}
