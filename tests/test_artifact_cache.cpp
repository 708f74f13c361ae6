#include <catch2/catch.hpp>
#include <hiecore/cache/artifact_cache.hpp>
#include "test_helpers.hpp"
#include <atomic>
#include <chrono>
#include <stdexcept>
#include <thread>
#include <vector>

using namespace hiecore;
using hiecore_test::TempDir;

struct TestArtifact : Artifact {
    int id;
    Stage reached;

    explicit TestArtifact(int i, Stage s = Stage::Typechecked) : id(i), reached(s) {}
    Stage stage() const override { return reached; }
};

static ArtifactPtr artifact(int id, Stage s = Stage::Typechecked) {
    return std::make_shared<TestArtifact>(id, s);
}

static int id_of(const CacheEntry& e) {
    return static_cast<const TestArtifact&>(*e.artifact).id;
}

// ===== Entries =====

TEST_CASE("store then lookup returns the artifact", "[cache]") {
    TempDir td;
    std::string path = td.write_file("Foo.hs", "module Foo where\n");
    ArtifactCache cache;

    ArtifactPtr a = artifact(1);
    CacheEntry stored = cache.store(path, a);
    REQUIRE(stored.ok());
    REQUIRE(stored.path == path);

    auto hit = cache.lookup(path);
    REQUIRE(hit.has_value());
    REQUIRE(hit->ok());
    REQUIRE(hit->artifact == a);
    REQUIRE(hit->generation == stored.generation);
}

TEST_CASE("paths are canonicalised", "[cache]") {
    TempDir td;
    td.write_file("src/Foo.hs", "module Foo where\n");
    std::filesystem::create_directory_symlink(td.path / "src", td.path / "alias");
    ArtifactCache cache;

    cache.store(td.str("src/./Foo.hs"), artifact(1));
    REQUIRE(cache.lookup(td.str("alias/Foo.hs")).has_value());
    REQUIRE(cache.contains(td.str("src/Foo.hs")));
    REQUIRE(cache.size() == 1);
}

TEST_CASE("a changed file makes lookup miss without dropping the entry", "[cache]") {
    TempDir td;
    std::string path = td.write_file("Foo.hs", "module Foo where\n");
    ArtifactCache cache;
    cache.store(path, artifact(1));

    td.write_file("Foo.hs", "module Foo where\nx = 1\n");
    REQUIRE_FALSE(cache.lookup(path).has_value());
    REQUIRE(cache.contains(path));
    REQUIRE(cache.size() == 1);

    // restoring the bytes makes the entry fresh again
    td.write_file("Foo.hs", "module Foo where\n");
    REQUIRE(cache.lookup(path).has_value());
}

TEST_CASE("each store gets a new generation", "[cache]") {
    TempDir td;
    std::string path = td.write_file("Foo.hs", "x = 1\n");
    ArtifactCache cache;
    auto first = cache.store(path, artifact(1));
    auto second = cache.store(path, artifact(2));
    REQUIRE(second.generation > first.generation);
    REQUIRE(id_of(*cache.lookup(path)) == 2);
}

TEST_CASE("mark_failed never replaces an existing entry", "[cache]") {
    TempDir td;
    std::string path = td.write_file("Foo.hs", "x = 1\n");
    ArtifactCache cache;
    ArtifactPtr a = artifact(1);
    cache.store(path, a);

    cache.mark_failed(path);
    auto hit = cache.lookup(path);
    REQUIRE(hit.has_value());
    REQUIRE(hit->ok());
    REQUIRE(hit->artifact == a);
}

TEST_CASE("mark_failed records a failure for unknown paths", "[cache]") {
    TempDir td;
    std::string path = td.write_file("Bad.hs", "x =\n");
    ArtifactCache cache;

    cache.mark_failed(path);
    auto hit = cache.lookup(path);
    REQUIRE(hit.has_value());
    REQUIRE_FALSE(hit->ok());
    REQUIRE(hit->artifact == nullptr);

    // a later success replaces the failure
    cache.store(path, artifact(3));
    REQUIRE(cache.lookup(path)->ok());
}

TEST_CASE("remove and clear drop entries", "[cache]") {
    TempDir td;
    std::string a = td.write_file("A.hs", "a = 1\n");
    std::string b = td.write_file("B.hs", "b = 1\n");
    ArtifactCache cache;
    cache.store(a, artifact(1));
    cache.store(b, artifact(2));

    REQUIRE(cache.remove(a));
    REQUIRE_FALSE(cache.remove(a));
    REQUIRE_FALSE(cache.lookup(a).has_value());
    REQUIRE(cache.size() == 1);

    cache.clear();
    REQUIRE(cache.size() == 0);
}

// ===== Waiting =====

TEST_CASE("deferred continuations run once, in order", "[cache]") {
    TempDir td;
    std::string path = td.write_file("Foo.hs", "x = 1\n");
    ArtifactCache cache;

    std::vector<int> order;
    for (int i = 0; i < 3; ++i) {
        cache.await_or_defer(path, [&order, i](const CacheEntry& e) {
            REQUIRE(e.ok());
            order.push_back(i);
        });
    }
    REQUIRE(order.empty());
    REQUIRE(cache.pending_count(path) == 3);

    cache.store(path, artifact(1));
    REQUIRE(order == std::vector<int>{0, 1, 2});
    REQUIRE(cache.pending_count(path) == 0);

    cache.store(path, artifact(2));
    REQUIRE(order.size() == 3);
}

TEST_CASE("await_or_defer runs immediately on a fresh entry", "[cache]") {
    TempDir td;
    std::string path = td.write_file("Foo.hs", "x = 1\n");
    ArtifactCache cache;
    cache.store(path, artifact(7));

    int seen = 0;
    cache.await_or_defer(path, [&](const CacheEntry& e) { seen = id_of(e); });
    REQUIRE(seen == 7);
    REQUIRE(cache.pending_count(path) == 0);
}

TEST_CASE("await_or_defer waits when the entry is stale", "[cache]") {
    TempDir td;
    std::string path = td.write_file("Foo.hs", "x = 1\n");
    ArtifactCache cache;
    cache.store(path, artifact(1));
    td.write_file("Foo.hs", "x = 2\n");

    int seen = 0;
    cache.await_or_defer(path, [&](const CacheEntry& e) { seen = id_of(e); });
    REQUIRE(seen == 0);

    cache.store(path, artifact(2));
    REQUIRE(seen == 2);
}

TEST_CASE("failures are delivered to waiters", "[cache]") {
    TempDir td;
    std::string path = td.write_file("Bad.hs", "x =\n");
    ArtifactCache cache;

    std::vector<CacheEntry::State> states;
    cache.await_or_defer(path, [&](const CacheEntry& e) { states.push_back(e.state); });
    cache.mark_failed(path);
    REQUIRE(states == std::vector<CacheEntry::State>{CacheEntry::Failed});

    // an existing failure is delivered straight away
    cache.await_or_defer(path, [&](const CacheEntry& e) { states.push_back(e.state); });
    REQUIRE(states.size() == 2);
}

TEST_CASE("mark_failed releases waiters even over a success", "[cache]") {
    TempDir td;
    std::string path = td.write_file("Foo.hs", "x = 1\n");
    ArtifactCache cache;
    cache.store(path, artifact(1));

    bool called = false;
    cache.defer(path, [&](const CacheEntry& e) {
        called = true;
        REQUIRE_FALSE(e.ok());
    });
    cache.mark_failed(path);
    REQUIRE(called);
    REQUIRE(cache.lookup(path)->ok());
}

TEST_CASE("remove leaves waiters queued", "[cache]") {
    TempDir td;
    std::string path = td.write_file("Foo.hs", "x = 1\n");
    ArtifactCache cache;
    cache.store(path, artifact(1));

    int calls = 0;
    cache.defer(path, [&](const CacheEntry&) { ++calls; });
    cache.remove(path);
    REQUIRE(cache.pending_count(path) == 1);

    cache.store(path, artifact(2));
    REQUIRE(calls == 1);
}

TEST_CASE("continuations can re-defer themselves", "[cache]") {
    TempDir td;
    std::string path = td.write_file("Foo.hs", "x = 1\n");
    ArtifactCache cache;

    std::vector<int> seen;
    std::function<void(const CacheEntry&)> waiter;
    waiter = [&](const CacheEntry& e) {
        seen.push_back(id_of(e));
        if (id_of(e) < 3) cache.defer(path, waiter);
    };
    cache.await_or_defer(path, waiter);

    cache.store(path, artifact(1));
    cache.store(path, artifact(2));
    cache.store(path, artifact(3));
    cache.store(path, artifact(4));
    REQUIRE(seen == std::vector<int>{1, 2, 3});
    REQUIRE(cache.pending_count(path) == 0);
}

TEST_CASE("await_stage waits for a complete artifact", "[cache]") {
    TempDir td;
    std::string path = td.write_file("Foo.hs", "x = 1\n");
    ArtifactCache cache;

    int seen = 0;
    cache.await_stage(path, Stage::Typechecked, [&](const CacheEntry& e) { seen = id_of(e); });

    cache.store(path, artifact(1, Stage::Parsed));
    REQUIRE(seen == 0);
    REQUIRE(cache.pending_count(path) == 1);

    cache.store(path, artifact(2, Stage::Typechecked));
    REQUIRE(seen == 2);
    REQUIRE(cache.pending_count(path) == 0);

    int parsed = 0;
    cache.await_stage(path, Stage::Parsed, [&](const CacheEntry& e) { parsed = id_of(e); });
    REQUIRE(parsed == 2);
}

TEST_CASE("await_stage delivers failures", "[cache]") {
    TempDir td;
    std::string path = td.write_file("Foo.hs", "x =\n");
    ArtifactCache cache;

    bool failed = false;
    cache.await_stage(path, Stage::Typechecked, [&](const CacheEntry& e) { failed = !e.ok(); });
    cache.mark_failed(path);
    REQUIRE(failed);
}

TEST_CASE("wait_for resolves its future", "[cache]") {
    TempDir td;
    std::string path = td.write_file("Foo.hs", "x = 1\n");
    ArtifactCache cache;

    auto fut = cache.wait_for(path);
    REQUIRE(fut.wait_for(std::chrono::milliseconds(0)) == std::future_status::timeout);

    std::thread producer([&] { cache.store(path, artifact(5)); });
    CacheEntry e = fut.get();
    producer.join();
    REQUIRE(id_of(e) == 5);

    // nobody listens to this one
    { auto abandoned = cache.wait_for(td.str("Other.hs")); }
    cache.mark_failed(td.str("Other.hs"));
    REQUIRE(cache.pending_count(td.str("Other.hs")) == 0);
}

TEST_CASE("a throwing continuation does not stop delivery", "[cache]") {
    TempDir td;
    std::string path = td.write_file("Foo.hs", "x = 1\n");
    ArtifactCache cache;

    bool second = false;
    cache.defer(path, [](const CacheEntry&) { throw std::runtime_error("handler broke"); });
    cache.defer(path, [&](const CacheEntry&) { second = true; });
    cache.store(path, artifact(1));
    REQUIRE(second);
}

TEST_CASE("concurrent waiters are each delivered exactly once", "[cache]") {
    TempDir td;
    std::string path = td.write_file("Foo.hs", "x = 1\n");
    ArtifactCache cache;

    constexpr int kThreads = 4;
    constexpr int kPerThread = 100;
    std::atomic<int> delivered{0};

    std::vector<std::thread> threads;
    for (int t = 0; t < kThreads; ++t) {
        threads.emplace_back([&] {
            for (int i = 0; i < kPerThread; ++i) {
                cache.await_or_defer(path, [&](const CacheEntry&) { ++delivered; });
            }
        });
    }
    std::thread storer([&] { cache.store(path, artifact(1)); });

    for (auto& th : threads) th.join();
    storer.join();

    REQUIRE(delivered.load() == kThreads * kPerThread);
    REQUIRE(cache.pending_count(path) == 0);
}

TEST_CASE("non-standard exceptions from continuations are contained", "[cache]") {
    TempDir td;
    std::string path = td.write_file("Foo.hs", "x = 1\n");
    ArtifactCache cache;

    bool second = false;
    cache.defer(path, [](const CacheEntry&) { throw 42; });
    cache.defer(path, [&](const CacheEntry&) { second = true; });
    REQUIRE_NOTHROW(cache.mark_failed(path));
    REQUIRE(second);
    REQUIRE(cache.pending_count(path) == 0);
}

TEST_CASE("waiters racing with rewrites and stores are never stranded", "[cache]") {
    TempDir td;
    std::string path = td.write_file("Foo.hs", "x = 0\n");
    ArtifactCache cache;

    constexpr int kStores = 500;
    std::atomic<bool> writing{true};
    std::atomic<int> registered{0};
    std::atomic<int> delivered{0};

    std::thread writer([&] {
        for (int i = 1; i <= kStores; ++i) {
            td.write_file("Foo.hs", "x = " + std::to_string(i) + "\n");
            cache.store(path, artifact(i));
        }
        writing = false;
    });
    std::thread waiter([&] {
        do {
            ++registered;
            cache.await_or_defer(path, [&](const CacheEntry&) { ++delivered; });
        } while (writing.load());
    });

    writer.join();
    waiter.join();

    auto entry = cache.lookup(path);
    REQUIRE(entry.has_value());
    REQUIRE(id_of(*entry) == kStores);
    REQUIRE(cache.pending_count(path) == 0);
    REQUIRE(delivered.load() == registered.load());
}
