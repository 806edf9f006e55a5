#pragma once

#include <memory>
#include <string>

#include "characteristics.hpp"
#include "coverage_box.hpp"
#include "emitter_store.hpp"
#include "identity.hpp"
#include "observation.hpp"
#include "rf_location.hpp"

namespace rfnav {

enum class EmitterStatus {
    Unknown,     // seen, nothing known about it yet
    New,         // has coverage, not in the store yet
    Changed,     // in the store, coverage grew
    Cached,      // in the store, nothing pending
    Blacklisted  // moved or mobile; terminal
};

const char* to_string(EmitterStatus status);

// Legal transitions:
//   Unknown -> New | Cached | Blacklisted
//   New -> Cached | Blacklisted
//   Cached <-> Changed, either -> Blacklisted
// Any other request returns current unchanged.
EmitterStatus next_status(EmitterStatus current, EmitterStatus requested);

// What a sync would do to the store
enum class SyncAction { None, Insert, Update, Invalidate, Drop };

const char* to_string(SyncAction action);

// Everything known about one emitter: coverage, status and the latest
// observation. Owned by the EmitterCache while resident. Not synchronized;
// only the processing thread mutates records.
class EmitterRecord {
public:
    explicit EmitterRecord(const Identity& identity);
    // Loaded from the store
    EmitterRecord(const Identity& identity, const EmitterRow& row);

    const Identity& identity() const { return identity_; }
    EmitterType type() const { return identity_.type(); }
    const std::string& key() const { return identity_.key(); }
    EmitterStatus status() const { return status_; }
    const std::string& label() const { return label_; }

    bool has_coverage() const { return coverage_ != nullptr; }
    const CoverageBox* coverage() const { return coverage_.get(); }

    bool has_observation() const { return has_observation_; }
    const Observation& last_observation() const { return last_observation_; }

    // Latest sighting; also takes the label from it
    void set_observation(const Observation& obs);
    // Changing the label re-runs the mobile blacklist
    void set_label(const std::string& label);

    // Learn coverage from a trusted fix. Returns the resulting status.
    EmitterStatus update_location(const Fix& fix);

    SyncAction pending_sync() const;
    bool sync_needed() const { return pending_sync() != SyncAction::None; }
    // Performs pending_sync() on the store; record untouched
    bool write_sync(IEmitterStore& store) const;
    // Applies the status change of a committed write
    void complete_sync();
    // write_sync() then complete_sync() on success
    bool sync(IEmitterStore& store);

    // Coverage projection for synthesis. False when never observed,
    // blacklisted, without coverage, or centered on null island.
    bool location(RfLocation& out) const;

    // Cache bookkeeping
    int age() const { return age_; }
    void reset_age() { age_ = 0; }
    void increment_age() { ++age_; }

    EmitterRow to_row() const;

    bool operator==(const EmitterRecord& o) const { return identity_ == o.identity_; }

private:
    EmitterStatus change_status(EmitterStatus requested, const char* reason);
    bool blacklisted_by_label() const;

    Identity identity_;
    const Characteristics& characteristics_;
    std::unique_ptr<CoverageBox> coverage_;
    EmitterStatus status_ = EmitterStatus::Unknown;
    std::string label_;
    bool has_observation_ = false;
    Observation last_observation_;
    int age_ = 0;
};

} // namespace rfnav
