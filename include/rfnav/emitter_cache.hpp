#pragma once

#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "emitter.hpp"
#include "emitter_store.hpp"
#include "identity.hpp"

namespace rfnav {

struct CacheConfig {
    int max_age = 30;             // sync cycles without get() before eviction
    size_t max_working_set = 500; // above this the whole working set is dropped
};

// In-memory working set of emitter records in front of an IEmitterStore.
// Every public operation holds the cache mutex. Returned record pointers stay
// valid until the record is evicted by sync() or close(); only the worker
// thread that drives sync() may hold on to them.
class EmitterCache {
public:
    EmitterCache(std::unique_ptr<IEmitterStore> store, const CacheConfig& config = CacheConfig());
    ~EmitterCache();

    EmitterCache(const EmitterCache&) = delete;
    EmitterCache& operator=(const EmitterCache&) = delete;

    // Opens the store. False if it cannot be opened.
    bool open();

    // Loads every persisted row for ids not yet resident in one query. Ids
    // still missing afterwards get a fresh Unknown record.
    void batch_load(const std::vector<Identity>& ids);

    // Resident record, created Unknown if absent; resets its age.
    // Null after close().
    EmitterRecord* get(const Identity& id);

    // Resident record or null; age untouched
    EmitterRecord* find(const Identity& id);

    // Age, flush dirty records in one transaction, evict. False if the
    // flush failed; nothing changes in that case.
    bool sync();

    // sync(), clear and release the store
    void close();

    size_t size() const;
    bool is_open() const;

    bool identities_in_area(EmitterType type, double north, double south, double east, double west,
                            std::vector<Identity>& out);

private:
    bool flush_locked(std::vector<EmitterRecord*>& dirty);
    bool sync_locked();

    mutable std::mutex mutex_;
    std::unique_ptr<IEmitterStore> store_;
    CacheConfig config_;
    std::unordered_map<std::string, std::unique_ptr<EmitterRecord>> working_set_;
    bool closed_ = false;
};

} // namespace rfnav
