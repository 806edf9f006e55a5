// Replays a text trace of scans, fixes and period ends through the engine and
// prints every fused location.
//
//   obs <t_ns> <TYPE> <id> <signal> <suspicious 0|1> [label...]
//   fix <t_ns> <lat> <lon> <accuracy>
//   end

#include <cstdio>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

#include "engine/location_engine.hpp"
#include "rfnav/emitter_cache.hpp"
#include "rfnav/engine_settings.hpp"
#include "rfnav/engine_settings_io.hpp"
#include "rfnav/log.hpp"
#include "rfnav/signal_correction.hpp"

using namespace rfnav;

namespace {

const char* TAG = "replay";

bool parse_observation(std::istringstream& in, Observation& obs) {
    int64_t t_ns = 0;
    std::string type, id;
    int signal = 0, suspicious = 0;
    if (!(in >> t_ns >> type >> id >> signal >> suspicious)) return false;
    std::string label;
    std::getline(in, label);
    size_t start = label.find_first_not_of(" \t");
    label = start == std::string::npos ? std::string() : label.substr(start);

    EmitterType t = emitter_type_from_string(type);
    obs.identity = Identity(is_wlan(t) ? normalize_bssid(id) : id, t);
    obs.signal = signal;
    obs.capture_time_ns = t_ns;
    obs.time_ms = t_ns / 1000000;
    obs.suspicious = suspicious != 0;
    obs.label = label;
    return true;
}

bool parse_fix(std::istringstream& in, Fix& fix) {
    int64_t t_ns = 0;
    if (!(in >> t_ns >> fix.lat >> fix.lon >> fix.accuracy_m)) return false;
    fix.capture_time_ns = t_ns;
    fix.time_ms = t_ns / 1000000;
    return true;
}

int replay(std::istream& input, engine::LocationEngine& runner) {
    std::vector<Observation> batch;
    std::string line;
    int line_no = 0;
    int errors = 0;
    auto submit_batch = [&]() {
        if (!batch.empty()) runner.submit_observations(std::move(batch));
        batch.clear();
    };

    while (std::getline(input, line)) {
        ++line_no;
        size_t hash = line.find('#');
        if (hash != std::string::npos) line.erase(hash);
        std::istringstream in(line);
        std::string cmd;
        if (!(in >> cmd)) continue;

        if (cmd == "obs") {
            Observation obs;
            if (parse_observation(in, obs)) {
                batch.push_back(obs);
                continue;
            }
        } else if (cmd == "fix") {
            submit_batch();
            Fix fix;
            if (parse_fix(in, fix)) {
                runner.submit_fix(fix);
                continue;
            }
        } else if (cmd == "end") {
            submit_batch();
            runner.end_period();
            runner.flush();
            continue;
        }
        log::warn(TAG, "line " + std::to_string(line_no) + " ignored: " + line);
        ++errors;
    }
    submit_batch();
    runner.flush();
    return errors;
}

} // namespace

int main(int argc, char* argv[]) {
    std::string db_path;
    std::string settings_path;
    std::string input_path;
    bool verbose = false;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--db" && i + 1 < argc) {
            db_path = argv[++i];
        } else if (arg == "--settings" && i + 1 < argc) {
            settings_path = argv[++i];
        } else if (arg == "--input" && i + 1 < argc) {
            input_path = argv[++i];
        } else if (arg == "--verbose") {
            verbose = true;
        } else if (arg == "--help" || arg == "-h") {
            std::cout << "Usage: " << argv[0] << " [options]\n"
                      << "Options:\n"
                      << "  --db <path>        Emitter database (default from settings, rfnav.db)\n"
                      << "  --settings <path>  JSON settings file\n"
                      << "  --input <file>     Trace to replay (default: stdin)\n"
                      << "  --verbose          Debug logging\n";
            return 0;
        } else {
            std::cerr << "Unknown argument: " << arg << "\n";
            return 2;
        }
    }

    EngineSettings settings;
    if (!settings_path.empty() && !load_settings(settings_path.c_str(), settings))
        std::cerr << "Settings " << settings_path << " not readable, using defaults\n";
    if (!db_path.empty()) settings.database_path = db_path;
    log::set_level(verbose ? log::Level::Debug : settings.log_level);

    StoreConfig store_cfg;
    store_cfg.path = settings.database_path;
    EmitterCache cache(createSqliteEmitterStore(store_cfg), settings.cache);
    if (!cache.open()) {
        std::cerr << "Cannot open emitter database " << settings.database_path << "\n";
        return 1;
    }

    SignalCorrection corrections;
    if (!settings.signal_correction_path.empty() && !corrections.load(settings.signal_correction_path.c_str()))
        log::debug(TAG, "no saved signal corrections, starting fresh");

    engine::EngineConfig cfg;
    cfg.cull_mode = settings.cull_mode;
    cfg.synthesis = settings.synthesis;
    cfg.signal_correction_path = settings.signal_correction_path;

    engine::LocationEngine runner(cache, corrections, cfg);
    runner.set_report_callback([](bool has_location, const FusedLocation& loc) {
        if (!has_location) {
            std::printf("no location\n");
        } else {
            std::printf("location %.7f %.7f %.1f %d\n", loc.lat, loc.lon, loc.accuracy_m, loc.source_count);
        }
        std::fflush(stdout);
    });
    runner.set_fix_request_callback([](float accuracy) {
        log::info(TAG, "a fix of " + std::to_string(accuracy) + " m would locate the current emitters");
    });
    runner.start();

    int errors = 0;
    if (input_path.empty()) {
        errors = replay(std::cin, runner);
    } else {
        std::ifstream file(input_path);
        if (!file) {
            std::cerr << "Cannot open " << input_path << "\n";
            runner.stop();
            return 1;
        }
        errors = replay(file, runner);
    }

    runner.stop();
    cache.close();
    return errors == 0 ? 0 : 3;
}
