#include "location_engine.hpp"

#include "fusion/position_synthesis.hpp"
#include "rfnav/characteristics.hpp"
#include "rfnav/geo.hpp"
#include "rfnav/log.hpp"

#include <algorithm>
#include <utility>

namespace rfnav::engine {

static const char* TAG = "engine";

LocationEngine::LocationEngine(EmitterCache& cache, SignalCorrection& corrections, const EngineConfig& config)
    : cache_(cache), corrections_(corrections), config_(config) {}

LocationEngine::~LocationEngine() {
    stop();
}

void LocationEngine::start() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (running_) return;
    running_ = true;
    worker_ = std::thread(&LocationEngine::worker_loop, this);
}

void LocationEngine::stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!running_) return;
        running_ = false;
    }
    cv_.notify_all();
    if (worker_.joinable()) worker_.join();
    idle_cv_.notify_all();
}

bool LocationEngine::is_running() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return running_;
}

bool LocationEngine::enqueue(Job job) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!running_) return false;
        jobs_.push_back(std::move(job));
    }
    cv_.notify_one();
    return true;
}

void LocationEngine::submit_observations(std::vector<Observation> batch) {
    if (batch.empty()) return;
    if (!enqueue([this, batch = std::move(batch)]() mutable { process_batch(batch); }))
        log::warn(TAG, "engine not running, observations dropped");
}

void LocationEngine::submit_fix(const Fix& fix) {
    if (!geo::not_null_island(fix.lat, fix.lon)) {
        log::debug(TAG, "fix at null island dropped");
        return;
    }
    if (!enqueue([this, fix]() { process_fix(fix); })) log::warn(TAG, "engine not running, fix dropped");
}

void LocationEngine::end_period() {
    if (!enqueue([this]() { process_end_of_period(); })) log::warn(TAG, "engine not running, period end dropped");
}

void LocationEngine::flush() {
    std::unique_lock<std::mutex> lock(mutex_);
    idle_cv_.wait(lock, [this] { return !running_ || (jobs_.empty() && !busy_); });
}

void LocationEngine::worker_loop() {
    for (;;) {
        Job job;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            cv_.wait(lock, [this] { return !running_ || !jobs_.empty(); });
            if (jobs_.empty()) {
                // stopping and drained
                idle_cv_.notify_all();
                return;
            }
            job = std::move(jobs_.front());
            jobs_.pop_front();
            busy_ = true;
        }
        job();
        {
            std::lock_guard<std::mutex> lock(mutex_);
            busy_ = false;
        }
        idle_cv_.notify_all();
    }
}

void LocationEngine::process_batch(std::vector<Observation>& batch) {
    std::vector<Identity> ids;
    ids.reserve(batch.size());
    for (auto& obs : batch) {
        obs.signal = corrections_.corrected(obs.identity.type(), obs.signal);
        ids.push_back(obs.identity);
    }
    cache_.batch_load(ids);

    std::vector<EmitterRecord*> records;
    for (const auto& obs : batch) {
        EmitterRecord* rec = cache_.get(obs.identity);
        if (!rec) {
            log::warn(TAG, "cache closed, batch dropped");
            return;
        }
        rec->set_observation(obs);
        seen_.insert(obs.identity);
        records.push_back(rec);
    }
    if (!has_period_fix_) return;
    for (EmitterRecord* rec : records) rec->update_location(period_fix_);
}

void LocationEngine::process_fix(const Fix& fix) {
    period_fix_ = fix;
    has_period_fix_ = true;
}

void LocationEngine::process_end_of_period() {
    has_period_fix_ = false;
    if (seen_.empty()) {
        log::debug(TAG, "no emitters seen this period");
        if (report_cb_) report_cb_(false, FusedLocation());
        return;
    }

    std::vector<RfLocation> locations;
    for (const auto& id : seen_) {
        const EmitterRecord* rec = cache_.find(id);
        RfLocation loc;
        if (rec && rec->location(loc)) locations.push_back(loc);
    }
    if (locations.empty()) request_fix_if_useful();
    seen_.clear();

    if (!cache_.sync()) log::warn(TAG, "cache sync failed, retrying next period");
    if (corrections_.dirty() && !config_.signal_correction_path.empty()
        && !corrections_.save(config_.signal_correction_path.c_str()))
        log::warn(TAG, "signal corrections not saved");

    FusedLocation fused;
    bool found = !locations.empty() && fusion::synthesize(locations, config_.cull_mode, fused, config_.synthesis);
    if (found) {
        log::debug(TAG, "location from " + std::to_string(fused.source_count) + " emitters, accuracy "
                            + std::to_string(fused.accuracy_m) + " m");
    }
    if (report_cb_) report_cb_(found, fused);
}

void LocationEngine::request_fix_if_useful() {
    if (!fix_request_cb_) return;
    bool any_short = false, any_long = false;
    double short_max = 0.0, long_min = 0.0;
    for (const auto& id : seen_) {
        const EmitterRecord* rec = cache_.find(id);
        if (rec && rec->status() == EmitterStatus::Blacklisted) continue;
        const double range = characteristics_for(id.type()).minimum_range;
        if (is_short_range(id.type())) {
            short_max = any_short ? std::max(short_max, range) : range;
            any_short = true;
        } else {
            long_min = any_long ? std::min(long_min, range) : range;
            any_long = true;
        }
    }
    // one located short-range emitter is enough; long range ones we want all of
    if (any_short) fix_request_cb_((float)short_max);
    else if (any_long) fix_request_cb_((float)long_min);
}

} // namespace rfnav::engine
