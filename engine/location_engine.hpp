#pragma once

#include <condition_variable>
#include <deque>
#include <functional>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_set>
#include <vector>

#include "rfnav/emitter_cache.hpp"
#include "rfnav/observation.hpp"
#include "rfnav/rf_location.hpp"
#include "rfnav/signal_correction.hpp"
#include "rfnav/synthesis_config.hpp"

namespace rfnav::engine {

struct EngineConfig {
    CullMode cull_mode = CullMode::MedianSafe;
    SynthesisConfig synthesis;
    std::string signal_correction_path; // empty: corrections are not saved
};

// Drives learning and synthesis on one worker thread. Producers on any thread
// submit observation batches, trusted fixes and period ends; the worker
// applies them in submission order. The cache and the signal corrections are
// owned by the caller and must outlive the engine.
class LocationEngine {
public:
    // has_location false: the period produced no usable position
    using ReportCallback = std::function<void(bool has_location, const FusedLocation& location)>;
    // Emitters were seen but none is located yet; a fix this accurate would
    // teach us at least one of them
    using FixRequestCallback = std::function<void(float required_accuracy_m)>;

    LocationEngine(EmitterCache& cache, SignalCorrection& corrections, const EngineConfig& config = EngineConfig());
    ~LocationEngine();

    LocationEngine(const LocationEngine&) = delete;
    LocationEngine& operator=(const LocationEngine&) = delete;

    // Callbacks run on the worker thread; set them before start()
    void set_report_callback(ReportCallback cb) { report_cb_ = std::move(cb); }
    void set_fix_request_callback(FixRequestCallback cb) { fix_request_cb_ = std::move(cb); }

    void start();
    // Runs everything already queued, then joins the worker
    void stop();
    bool is_running() const;

    // Submissions while the engine is not running are dropped with a warning
    void submit_observations(std::vector<Observation> batch);
    // Becomes the fix of the current period; null island is dropped
    void submit_fix(const Fix& fix);
    void end_period();

    // Blocks until every job submitted so far has run
    void flush();

private:
    using Job = std::function<void()>;

    // False when not running; the job is discarded
    bool enqueue(Job job);
    void worker_loop();

    void process_batch(std::vector<Observation>& batch);
    void process_fix(const Fix& fix);
    void process_end_of_period();
    void request_fix_if_useful();

    EmitterCache& cache_;
    SignalCorrection& corrections_;
    EngineConfig config_;
    ReportCallback report_cb_;
    FixRequestCallback fix_request_cb_;

    // Queue state, guarded by mutex_
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::condition_variable idle_cv_;
    std::deque<Job> jobs_;
    bool running_ = false;
    bool busy_ = false;
    std::thread worker_;

    // Worker-owned period state
    std::unordered_set<Identity> seen_;
    bool has_period_fix_ = false;
    Fix period_fix_;
};

} // namespace rfnav::engine
