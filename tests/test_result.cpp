#include <catch2/catch.hpp>
#include <hiecore/result.hpp>
#include <string>

using namespace hiecore;

static Result<int> try_double(Result<int> input) {
    HIECORE_TRY(input);
    return Result<int>::ok(input.value() * 2);
}

static Status check_positive(int x) {
    if (x <= 0) return HieError{HieError::InvalidArg, "not positive"};
    return ok_status();
}

static Result<std::string> describe(int x) {
    HIECORE_TRY(check_positive(x));
    return Result<std::string>::ok("n=" + std::to_string(x));
}

TEST_CASE("Ok result holds its value", "[result]") {
    auto r = Result<int>::ok(42);
    REQUIRE(r.is_ok());
    REQUIRE_FALSE(r.is_err());
    REQUIRE(r.value() == 42);
    REQUIRE(static_cast<bool>(r));
}

TEST_CASE("Err result holds its error", "[result]") {
    auto r = Result<int>::err(HieError{HieError::NoPackage, "no package"});
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == HieError::NoPackage);
    REQUIRE(r.error().message == "no package");
    REQUIRE_THROWS_AS(r.value(), std::bad_variant_access);
}

TEST_CASE("Implicit conversion from HieError", "[result]") {
    Result<std::string> r = HieError{HieError::Timeout, "too slow"};
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == HieError::Timeout);
}

TEST_CASE("value_or falls back on error", "[result]") {
    REQUIRE(Result<int>::ok(3).value_or(9) == 3);
    REQUIRE(Result<int>::err(HieError{HieError::IO, "x"}).value_or(9) == 9);
}

TEST_CASE("map and and_then", "[result]") {
    auto r = Result<int>::ok(5);
    REQUIRE(r.map([](int x) { return x * 2; }).value() == 10);
    REQUIRE(r.and_then([](int x) { return Result<int>::ok(x + 1); }).value() == 6);

    auto e = Result<int>::err(HieError{HieError::Parse, "bad"});
    bool called = false;
    auto mapped = e.map([&](int x) { called = true; return x; });
    REQUIRE(mapped.is_err());
    REQUIRE_FALSE(called);
    REQUIRE(mapped.error().message == "bad");
}

TEST_CASE("HIECORE_TRY forwards errors across result types", "[result]") {
    REQUIRE(try_double(Result<int>::ok(7)).value() == 14);

    auto failed = try_double(Result<int>::err(HieError{HieError::Parse, "syntax"}));
    REQUIRE(failed.is_err());
    REQUIRE(failed.error().code == HieError::Parse);

    REQUIRE(describe(4).value() == "n=4");
    auto bad = describe(0);
    REQUIRE(bad.is_err());
    REQUIRE(bad.error().code == HieError::InvalidArg);
}

TEST_CASE("HieError::format renders hint and location", "[result]") {
    HieError e{HieError::NoComponent, "could not obtain flags for src/X.hs",
               "add it to other-modules", "pkg.cabal", 12};
    std::string out = e.format();
    REQUIRE(out.find("error[NoComponent]: could not obtain flags for src/X.hs") == 0);
    REQUIRE(out.find("\n  hint: add it to other-modules") != std::string::npos);
    REQUIRE(out.find("\n  --> pkg.cabal:12") != std::string::npos);

    HieError plain{HieError::IO, "boom"};
    REQUIRE(plain.format() == "error[IO]: boom");
}

TEST_CASE("code_name covers the resolution codes", "[result]") {
    REQUIRE(std::string(HieError::code_name(HieError::NoProject)) == "NoProject");
    REQUIRE(std::string(HieError::code_name(HieError::Introspection)) == "Introspection");
    REQUIRE(std::string(HieError::code_name(HieError::Compile)) == "Compile");
}
