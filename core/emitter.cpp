#include "emitter.hpp"
#include "geo.hpp"
#include "log.hpp"
#include "mobile_blacklist.hpp"

#include <algorithm>
#include <cmath>
#include <cstdlib>

namespace rfnav {

static const char* TAG = "emitter";

// Fixes older or newer than this relative to the observation may describe a
// different place than the one the scan was taken at
static constexpr int64_t MAX_FIX_OBSERVATION_SKEW_NS = 10LL * 1000 * 1000 * 1000;

const char* to_string(EmitterStatus status) {
    switch (status) {
        case EmitterStatus::Unknown: return "unknown";
        case EmitterStatus::New: return "new";
        case EmitterStatus::Changed: return "changed";
        case EmitterStatus::Cached: return "cached";
        case EmitterStatus::Blacklisted: return "blacklisted";
    }
    return "?";
}

const char* to_string(SyncAction action) {
    switch (action) {
        case SyncAction::None: return "none";
        case SyncAction::Insert: return "insert";
        case SyncAction::Update: return "update";
        case SyncAction::Invalidate: return "invalidate";
        case SyncAction::Drop: return "drop";
    }
    return "?";
}

EmitterStatus next_status(EmitterStatus current, EmitterStatus requested) {
    if (requested == current) return current;
    switch (current) {
        case EmitterStatus::Blacklisted:
            return current;
        case EmitterStatus::Cached:
        case EmitterStatus::Changed:
            if (requested == EmitterStatus::Blacklisted || requested == EmitterStatus::Cached
                || requested == EmitterStatus::Changed)
                return requested;
            return current;
        case EmitterStatus::New:
            if (requested == EmitterStatus::Blacklisted || requested == EmitterStatus::Cached)
                return requested;
            return current;
        case EmitterStatus::Unknown:
            if (requested == EmitterStatus::Blacklisted || requested == EmitterStatus::Cached
                || requested == EmitterStatus::New)
                return requested;
            return current;
    }
    return current;
}

EmitterRecord::EmitterRecord(const Identity& identity)
    : identity_(identity), characteristics_(characteristics_for(identity.type())) {}

EmitterRecord::EmitterRecord(const Identity& identity, const EmitterRow& row)
    : identity_(identity), characteristics_(characteristics_for(identity.type())) {
    if (row.radius_ew < 0.0) {
        status_ = EmitterStatus::Blacklisted;
    } else {
        coverage_ = std::make_unique<CoverageBox>(row.lat, row.lon, row.radius_ns, row.radius_ew);
        status_ = EmitterStatus::Cached;
    }
    set_label(row.label);
    // rows written before the range limit existed
    if (row.radius_ew > characteristics_.maximum_range || row.radius_ns > characteristics_.maximum_range)
        change_status(EmitterStatus::Blacklisted, "loaded with radius above maximum range");
}

void EmitterRecord::set_observation(const Observation& obs) {
    last_observation_ = obs;
    has_observation_ = true;
    set_label(obs.label);
}

void EmitterRecord::set_label(const std::string& label) {
    if (label == label_) return;
    label_ = label;
    if (blacklisted_by_label())
        change_status(EmitterStatus::Blacklisted, "label marks a mobile emitter");
}

bool EmitterRecord::blacklisted_by_label() const {
    return label_blacklisted(identity_, label_);
}

EmitterStatus EmitterRecord::change_status(EmitterStatus requested, const char* reason) {
    EmitterStatus before = status_;
    status_ = next_status(status_, requested);
    if (log::enabled(log::Level::Debug) && before != requested) {
        log::debug(TAG, key() + ": " + reason + ", " + to_string(before) + " -> " + to_string(requested)
                            + " gives " + to_string(status_));
    }
    return status_;
}

EmitterStatus EmitterRecord::update_location(const Fix& fix) {
    if (status_ == EmitterStatus::Blacklisted) return status_;
    if (!has_observation_) return status_;
    if (last_observation_.suspicious) {
        log::verbose(TAG, key() + ": no update, latest observation suspicious");
        return status_;
    }
    if (std::llabs(last_observation_.capture_time_ns - fix.capture_time_ns) > MAX_FIX_OBSERVATION_SKEW_NS) {
        log::verbose(TAG, key() + ": no update, fix and observation more than 10 s apart");
        return status_;
    }

    // Inaccurate fixes still count when they put the emitter far out of its
    // range, so it ends up blacklisted instead of silently kept
    if (fix.accuracy_m > characteristics_.required_fix_accuracy) {
        bool far_away = coverage_
            && geo::approximate_distance(fix.lat, fix.lon, coverage_->center_lat(), coverage_->center_lon())
                   > (characteristics_.maximum_range + fix.accuracy_m) * 2.0;
        if (!far_away) {
            log::verbose(TAG, key() + ": no update, fix accuracy " + std::to_string(fix.accuracy_m) + " m");
            return status_;
        }
    }

    if (!coverage_) {
        coverage_ = std::make_unique<CoverageBox>(fix.lat, fix.lon);
        return change_status(EmitterStatus::New, "first coverage");
    }

    if (coverage_->update(fix.lat, fix.lon)) {
        if (coverage_->radius() > characteristics_.maximum_range)
            return change_status(EmitterStatus::Blacklisted, "coverage above maximum range");
        return change_status(EmitterStatus::Changed, "coverage grew");
    }
    return status_;
}

SyncAction EmitterRecord::pending_sync() const {
    switch (status_) {
        case EmitterStatus::New: return SyncAction::Insert;
        case EmitterStatus::Changed: return SyncAction::Update;
        case EmitterStatus::Blacklisted:
            // coverage still set means a normal row may exist in the store
            if (!coverage_) return SyncAction::None;
            return blacklisted_by_label() ? SyncAction::Drop : SyncAction::Invalidate;
        default:
            return SyncAction::None;
    }
}

bool EmitterRecord::write_sync(IEmitterStore& store) const {
    switch (pending_sync()) {
        case SyncAction::None: return true;
        case SyncAction::Insert: return store.insert(to_row());
        case SyncAction::Update: return store.update(to_row());
        case SyncAction::Invalidate: return store.invalidate(to_row());
        case SyncAction::Drop: return store.drop(key());
    }
    return false;
}

void EmitterRecord::complete_sync() {
    switch (pending_sync()) {
        case SyncAction::Insert:
        case SyncAction::Update:
            change_status(EmitterStatus::Cached, "synced");
            break;
        case SyncAction::Invalidate:
        case SyncAction::Drop:
            coverage_.reset();
            break;
        case SyncAction::None:
            break;
    }
}

bool EmitterRecord::sync(IEmitterStore& store) {
    if (!write_sync(store)) return false;
    complete_sync();
    return true;
}

bool EmitterRecord::location(RfLocation& out) const {
    if (!has_observation_) return false;
    if (status_ == EmitterStatus::Blacklisted) return false;
    if (!coverage_) return false;
    if (!geo::not_null_island(coverage_->center_lat(), coverage_->center_lon())) return false;

    out.key = key();
    out.type = type();
    out.lat = coverage_->center_lat();
    out.lon = coverage_->center_lon();
    out.radius = coverage_->radius();
    out.accuracy_estimate = std::max(out.radius, characteristics_.minimum_range);
    out.signal = last_observation_.signal;
    out.suspicious = last_observation_.suspicious;
    out.time_ms = last_observation_.time_ms;
    out.capture_time_ns = last_observation_.capture_time_ns;
    out.minimum_group_size = characteristics_.minimum_group_size;
    return true;
}

EmitterRow EmitterRecord::to_row() const {
    EmitterRow row;
    row.unique_key = key();
    row.id = identity_.id();
    row.type = type();
    if (coverage_) {
        row.lat = coverage_->center_lat();
        row.lon = coverage_->center_lon();
        row.radius_ns = coverage_->radius_ns();
        row.radius_ew = coverage_->radius_ew();
    }
    row.label = label_;
    return row;
}

} // namespace rfnav
