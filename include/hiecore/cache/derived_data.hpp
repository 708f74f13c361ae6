#pragma once

#include <hiecore/cache/artifact_cache.hpp>
#include <hiecore/log.hpp>
#include <cstddef>
#include <memory>
#include <string>
#include <utility>

namespace hiecore {

namespace detail {
size_t next_derived_key_id();
}

// Typed handle for one kind of value computed from an artifact. Each key
// gets its own slot in an entry's derived data, so two keys never collide
// even when they share a value type. Keys are usually namespace-scope
// constants:
//
//   const DerivedKey<SymbolTable> kSymbols("symbols");
template<typename T>
class DerivedKey {
public:
    explicit DerivedKey(std::string name)
        : id_(detail::next_derived_key_id()), name_(std::move(name)) {}

    size_t id() const { return id_; }
    const std::string& name() const { return name_; }

private:
    size_t id_;
    std::string name_;
};

// Value of `key` for `entry`, computing it with `producer(const Artifact&)`
// on a miss. No lock is held while the producer runs, so two callers may
// both compute; the later store wins and both get an equal value.
//
// The result is only remembered if `entry` is still current and its file
// unchanged; otherwise it is returned without being stored.
template<typename T, typename Producer>
Result<T> get_or_compute(ArtifactCache& cache, const CacheEntry& entry,
                         const DerivedKey<T>& key, Producer&& producer) {
    if (!entry.ok() || !entry.artifact) {
        return HieError{HieError::NotFound,
            "no compiled artifact for " + entry.path, "", entry.path, 0};
    }

    if (auto found = cache.find_derived(entry, key.id())) {
        return Result<T>::ok(*std::static_pointer_cast<const T>(found));
    }

    auto value = std::make_shared<const T>(producer(*entry.artifact));
    if (!cache.put_derived(entry, key.id(), value)) {
        log::debug("derived '%s' for %s not stored: entry was replaced or the file changed",
                   key.name().c_str(), entry.path.c_str());
    }
    return Result<T>::ok(*value);
}

} // namespace hiecore
