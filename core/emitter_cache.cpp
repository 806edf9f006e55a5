#include "emitter_cache.hpp"
#include "log.hpp"

#include <unordered_set>
#include <utility>

namespace rfnav {

static const char* TAG = "cache";

EmitterCache::EmitterCache(std::unique_ptr<IEmitterStore> store, const CacheConfig& config)
    : store_(std::move(store)), config_(config) {}

EmitterCache::~EmitterCache() {
    close();
}

bool EmitterCache::open() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!store_) return false;
    if (store_->is_open()) return true;
    if (!store_->open()) {
        log::error(TAG, "failed to open emitter store");
        return false;
    }
    closed_ = false;
    return true;
}

bool EmitterCache::is_open() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return !closed_ && store_ && store_->is_open();
}

size_t EmitterCache::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return working_set_.size();
}

void EmitterCache::batch_load(const std::vector<Identity>& ids) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (closed_) return;

    std::vector<Identity> missing;
    std::unordered_set<std::string> requested;
    for (const auto& id : ids) {
        if (working_set_.count(id.key()) || !requested.insert(id.key()).second) continue;
        missing.push_back(id);
    }
    if (missing.empty()) return;
    std::unordered_map<std::string, const Identity*> by_key;
    for (const auto& id : missing) by_key[id.key()] = &id;

    std::vector<EmitterRow> rows;
    if (store_ && store_->is_open()) {
        if (!store_->load(missing, rows)) {
            log::warn(TAG, "batch load failed, treating " + std::to_string(missing.size()) + " emitters as unknown");
            rows.clear();
        }
    }
    for (const auto& row : rows) {
        auto it = by_key.find(row.unique_key);
        if (it == by_key.end()) continue;
        working_set_[row.unique_key] = std::make_unique<EmitterRecord>(*it->second, row);
    }
    for (const auto& id : missing) {
        if (!working_set_.count(id.key()))
            working_set_[id.key()] = std::make_unique<EmitterRecord>(id);
    }
    log::verbose(TAG, "batch load of " + std::to_string(missing.size()) + " ids found "
                          + std::to_string(rows.size()) + " rows");
}

EmitterRecord* EmitterCache::get(const Identity& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (closed_) return nullptr;
    auto it = working_set_.find(id.key());
    if (it == working_set_.end()) {
        it = working_set_.emplace(id.key(), std::make_unique<EmitterRecord>(id)).first;
    }
    it->second->reset_age();
    return it->second.get();
}

EmitterRecord* EmitterCache::find(const Identity& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = working_set_.find(id.key());
    return it == working_set_.end() ? nullptr : it->second.get();
}

bool EmitterCache::flush_locked(std::vector<EmitterRecord*>& dirty) {
    if (dirty.empty()) return true;
    if (!store_ || !store_->is_open()) {
        log::error(TAG, "flush of " + std::to_string(dirty.size()) + " emitters without an open store");
        return false;
    }
    if (!store_->begin_transaction()) return false;
    for (EmitterRecord* rec : dirty) {
        if (!rec->write_sync(*store_)) {
            log::error(TAG, "write failed for " + rec->key() + ", rolling back");
            store_->cancel_transaction();
            return false;
        }
    }
    if (!store_->end_transaction()) {
        log::error(TAG, "commit failed, rolling back");
        store_->cancel_transaction();
        return false;
    }
    for (EmitterRecord* rec : dirty) rec->complete_sync();
    log::debug(TAG, "flushed " + std::to_string(dirty.size()) + " emitters");
    return true;
}

bool EmitterCache::sync_locked() {
    std::vector<std::string> expired;
    std::vector<EmitterRecord*> dirty;
    for (auto& [key, rec] : working_set_) {
        rec->increment_age();
        if (rec->age() >= config_.max_age) expired.push_back(key);
        if (rec->sync_needed()) dirty.push_back(rec.get());
    }

    const bool flushed = flush_locked(dirty);

    size_t evicted = 0;
    for (const auto& key : expired) {
        auto it = working_set_.find(key);
        if (it == working_set_.end()) continue;
        if (it->second->sync_needed()) continue;
        working_set_.erase(it);
        ++evicted;
    }
    if (evicted > 0) log::verbose(TAG, "evicted " + std::to_string(evicted) + " idle emitters");

    if (flushed && working_set_.size() > config_.max_working_set) {
        log::warn(TAG, "working set at " + std::to_string(working_set_.size()) + ", clearing");
        working_set_.clear();
    }
    return flushed;
}

bool EmitterCache::sync() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (closed_) return false;
    return sync_locked();
}

void EmitterCache::close() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (closed_) return;
    if (!working_set_.empty() && !sync_locked())
        log::error(TAG, "final sync failed, unsaved coverage is lost");
    working_set_.clear();
    if (store_) store_->close();
    closed_ = true;
}

bool EmitterCache::identities_in_area(EmitterType type, double north, double south, double east, double west,
                                      std::vector<Identity>& out) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (closed_ || !store_ || !store_->is_open()) return false;
    return store_->identities_in_area(type, north, south, east, west, out);
}

} // namespace rfnav
