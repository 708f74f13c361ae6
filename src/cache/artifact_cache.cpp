#include <hiecore/cache/artifact_cache.hpp>
#include <hiecore/content_hash.hpp>
#include <hiecore/log.hpp>
#include <hiecore/path_match.hpp>
#include <exception>
#include <mutex>

namespace hiecore {

const char* stage_name(Stage stage) {
    switch (stage) {
        case Stage::Parsed:      return "parsed";
        case Stage::Typechecked: return "typechecked";
    }
    return "unknown";
}

// Current hash of `path`, or nullopt when it cannot be read.
static std::optional<std::string> current_hash(const std::string& path) {
    auto h = ContentHash::hash_file(path);
    if (h.is_err()) return std::nullopt;
    return std::move(h).value();
}

static bool still_fresh(const CacheEntry& entry, const std::optional<std::string>& hash) {
    if (!entry.ok()) return true;
    return hash && *hash == entry.content_hash;
}

// ---------------------------------------------------------------------------
// Entries
// ---------------------------------------------------------------------------

std::optional<CacheEntry> ArtifactCache::lookup(const std::string& path) const {
    std::string key = canonicalize(path);

    std::optional<CacheEntry> found;
    {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        auto it = slots_.find(key);
        if (it == slots_.end()) return std::nullopt;
        found = it->second.entry;
    }

    if (found->ok() && !still_fresh(*found, current_hash(key))) {
        log::debug("cache: %s changed since it was compiled", key.c_str());
        return std::nullopt;
    }
    return found;
}

CacheEntry ArtifactCache::store(const std::string& path, ArtifactPtr artifact) {
    std::string key = canonicalize(path);

    auto hash = ContentHash::hash_file(key);
    if (hash.is_err()) {
        log::warn("cache: storing %s without a content hash: %s",
                  key.c_str(), hash.error().message.c_str());
    }

    CacheEntry entry;
    entry.state = CacheEntry::Success;
    entry.path = key;
    entry.artifact = std::move(artifact);
    entry.content_hash = hash.is_ok() ? hash.value() : std::string();

    std::deque<Continuation> waiters;
    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        entry.generation = next_generation_++;
        slots_[key] = Slot{entry, {}};
        waiters = take_pending_locked(key);
    }

    log::debug("cache: stored %s (generation %llu, %zu waiting)", key.c_str(),
               static_cast<unsigned long long>(entry.generation), waiters.size());
    deliver(key, std::move(waiters), entry);
    return entry;
}

void ArtifactCache::mark_failed(const std::string& path) {
    std::string key = canonicalize(path);

    CacheEntry failed;
    failed.state = CacheEntry::Failed;
    failed.path = key;

    std::deque<Continuation> waiters;
    bool recorded = false;
    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        auto it = slots_.find(key);
        if (it == slots_.end()) {
            failed.generation = next_generation_++;
            slots_[key] = Slot{failed, {}};
            recorded = true;
        } else if (!it->second.entry.ok()) {
            failed.generation = it->second.entry.generation;
        }
        waiters = take_pending_locked(key);
    }

    log::debug("cache: %s failed%s (%zu waiting)", key.c_str(),
               recorded ? "" : ", keeping existing entry", waiters.size());
    deliver(key, std::move(waiters), failed);
}

bool ArtifactCache::remove(const std::string& path) {
    std::string key = canonicalize(path);
    std::unique_lock<std::shared_mutex> lock(mutex_);
    bool erased = slots_.erase(key) > 0;
    if (erased) log::debug("cache: removed %s", key.c_str());
    return erased;
}

size_t ArtifactCache::size() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return slots_.size();
}

bool ArtifactCache::contains(const std::string& path) const {
    std::string key = canonicalize(path);
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return slots_.count(key) > 0;
}

void ArtifactCache::clear() {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    slots_.clear();
}

// ---------------------------------------------------------------------------
// Waiting
// ---------------------------------------------------------------------------

std::deque<Continuation> ArtifactCache::take_pending_locked(const std::string& key) {
    std::deque<Continuation> waiters;
    auto it = pending_.find(key);
    if (it != pending_.end()) {
        waiters = std::move(it->second);
        pending_.erase(it);
    }
    return waiters;
}

void ArtifactCache::deliver(const std::string& path, std::deque<Continuation> waiters,
                            const CacheEntry& entry) {
    for (auto& k : waiters) {
        try {
            k(entry);
        } catch (const std::exception& e) {
            log::error("cache: continuation for %s failed: %s", path.c_str(), e.what());
        } catch (...) {
            log::error("cache: continuation for %s failed with a non-standard exception",
                       path.c_str());
        }
    }
}

void ArtifactCache::await_or_defer(const std::string& path, Continuation k) {
    std::string key = canonicalize(path);
    auto hash = current_hash(key);

    std::optional<CacheEntry> hit;
    std::optional<uint64_t> stale_generation;
    {
        // Exclusive: the hit-or-enqueue decision must not interleave with
        // a store() that is about to drain the queue.
        std::unique_lock<std::shared_mutex> lock(mutex_);
        auto it = slots_.find(key);
        if (it != slots_.end() && still_fresh(it->second.entry, hash)) {
            hit = it->second.entry;
        } else {
            if (it != slots_.end()) stale_generation = it->second.entry.generation;
            pending_[key].push_back(std::move(k));
        }
    }

    if (hit) {
        std::deque<Continuation> now;
        now.push_back(std::move(k));
        deliver(key, std::move(now), *hit);
        return;
    }
    if (!stale_generation) return;

    // `hash` was taken before the lock: it may predate the store that made
    // the entry, or come from a half-written file. If the same entry is
    // fresh by a hash taken after queueing, no store will come to drain
    // the queue, so drain it here.
    auto again = current_hash(key);
    std::deque<Continuation> waiters;
    CacheEntry entry;
    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        auto it = slots_.find(key);
        if (it != slots_.end() && it->second.entry.generation == *stale_generation &&
            still_fresh(it->second.entry, again)) {
            entry = it->second.entry;
            waiters = take_pending_locked(key);
        }
    }
    if (!waiters.empty()) {
        log::trace("cache: %s was fresh after all, releasing %zu waiting", key.c_str(),
                   waiters.size());
        deliver(key, std::move(waiters), entry);
    }
}

void ArtifactCache::defer(const std::string& path, Continuation k) {
    std::string key = canonicalize(path);
    std::unique_lock<std::shared_mutex> lock(mutex_);
    pending_[key].push_back(std::move(k));
}

namespace {

// Re-queues itself until the artifact reaches the wanted stage.
struct StageWaiter {
    ArtifactCache* cache;
    Stage wanted;
    Continuation k;

    void operator()(const CacheEntry& entry) const {
        if (entry.ok() && entry.artifact && entry.artifact->stage() < wanted) {
            log::trace("cache: %s is only %s, waiting for %s", entry.path.c_str(),
                       stage_name(entry.artifact->stage()), stage_name(wanted));
            cache->defer(entry.path, *this);
            return;
        }
        k(entry);
    }
};

} // namespace

void ArtifactCache::await_stage(const std::string& path, Stage stage, Continuation k) {
    await_or_defer(path, StageWaiter{this, stage, std::move(k)});
}

std::future<CacheEntry> ArtifactCache::wait_for(const std::string& path) {
    auto promise = std::make_shared<std::promise<CacheEntry>>();
    auto future = promise->get_future();
    await_or_defer(path, [promise](const CacheEntry& entry) { promise->set_value(entry); });
    return future;
}

size_t ArtifactCache::pending_count(const std::string& path) const {
    std::string key = canonicalize(path);
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = pending_.find(key);
    return it == pending_.end() ? 0 : it->second.size();
}

// ---------------------------------------------------------------------------
// Derived data
// ---------------------------------------------------------------------------

std::shared_ptr<const void> ArtifactCache::find_derived(const CacheEntry& entry, size_t key) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = slots_.find(entry.path);
    if (it == slots_.end() || it->second.entry.generation != entry.generation) return nullptr;
    auto d = it->second.derived.find(key);
    return d == it->second.derived.end() ? nullptr : d->second;
}

bool ArtifactCache::put_derived(const CacheEntry& entry, size_t key,
                                std::shared_ptr<const void> value) {
    if (!entry.ok()) return false;
    if (!still_fresh(entry, current_hash(entry.path))) return false;

    std::unique_lock<std::shared_mutex> lock(mutex_);
    auto it = slots_.find(entry.path);
    if (it == slots_.end() || it->second.entry.generation != entry.generation) return false;
    it->second.derived[key] = std::move(value);
    return true;
}

} // namespace hiecore
