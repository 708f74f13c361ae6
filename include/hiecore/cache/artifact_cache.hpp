#pragma once

#include <hiecore/result.hpp>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <functional>
#include <future>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>

namespace hiecore {

// How far compilation of a file got. A Parsed artifact is usable for
// syntactic queries only.
enum class Stage { Parsed, Typechecked };

const char* stage_name(Stage stage);

// The compiled form of a file. Opaque to the cache; concrete compilers
// derive from it.
class Artifact {
public:
    virtual ~Artifact() = default;
    virtual Stage stage() const { return Stage::Typechecked; }
};

using ArtifactPtr = std::shared_ptr<const Artifact>;

// Snapshot of the cache's entry for one path. Holding a snapshot keeps its
// artifact alive after the cache has moved on.
struct CacheEntry {
    enum State { Success, Failed };

    State state = Failed;
    std::string path;           // canonical
    ArtifactPtr artifact;       // null when Failed
    std::string content_hash;   // hash of the bytes `artifact` was built from
    uint64_t generation = 0;    // bumped on every store

    bool ok() const { return state == Success; }
};

using Continuation = std::function<void(const CacheEntry&)>;

// Per-path store of compiled artifacts with a queue of continuations
// waiting for paths that have no entry yet.
//
// Entries are replaced whole under an exclusive lock; lookups take a
// shared lock. Continuations always run with no lock held, so they may
// call back into the cache (including to re-defer themselves).
// Content hashing happens outside the lock as well.
class ArtifactCache {
public:
    ArtifactCache() = default;
    ArtifactCache(const ArtifactCache&) = delete;
    ArtifactCache& operator=(const ArtifactCache&) = delete;

    // The entry for `path`, unless it is a Success whose file has changed
    // since it was stored. A stale entry is reported as a miss and left
    // in place. Failed entries are returned as they are.
    std::optional<CacheEntry> lookup(const std::string& path) const;

    // Replace the entry with a Success, dropping its derived data, then
    // run every queued continuation for `path` in FIFO order.
    CacheEntry store(const std::string& path, ArtifactPtr artifact);

    // Record a failure unless an entry already exists, then run the queued
    // continuations with a Failed entry either way.
    void mark_failed(const std::string& path);

    // Drop the entry. Waiters stay queued.
    bool remove(const std::string& path);

    // Run `k` now if lookup() hits, otherwise queue it for the next
    // store() or mark_failed() of `path`.
    void await_or_defer(const std::string& path, Continuation k);

    // Queue `k` unconditionally. A continuation that finds the entry not
    // ready yet calls this to wait for the next one.
    void defer(const std::string& path, Continuation k);

    // Like await_or_defer, but a Success whose artifact has not reached
    // `stage` keeps waiting. Failed entries are delivered.
    void await_stage(const std::string& path, Stage stage, Continuation k);

    // await_or_defer as a future. Dropping the future is harmless; the
    // queued continuation still runs and finds nobody listening.
    std::future<CacheEntry> wait_for(const std::string& path);

    size_t pending_count(const std::string& path) const;
    size_t size() const;
    bool contains(const std::string& path) const;

    // Drop every entry. Waiters stay queued.
    void clear();

    // Derived data, see derived_data.hpp. find_derived() returns null
    // unless `entry` is still the current generation for its path.
    std::shared_ptr<const void> find_derived(const CacheEntry& entry, size_t key) const;

    // Stores `value` only if `entry` is still current and the file still
    // hashes to entry.content_hash. Returns whether it was stored.
    bool put_derived(const CacheEntry& entry, size_t key, std::shared_ptr<const void> value);

private:
    struct Slot {
        CacheEntry entry;
        std::unordered_map<size_t, std::shared_ptr<const void>> derived;
    };

    void deliver(const std::string& path, std::deque<Continuation> waiters,
                 const CacheEntry& entry);
    std::deque<Continuation> take_pending_locked(const std::string& path);

    mutable std::shared_mutex mutex_;
    std::unordered_map<std::string, Slot> slots_;
    std::unordered_map<std::string, std::deque<Continuation>> pending_;
    uint64_t next_generation_ = 1;
};

} // namespace hiecore
