#include "signal_correction.hpp"
#include "log.hpp"
#include "observation.hpp"

#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <string>

namespace rfnav {

static const char* TAG = "signal";

SignalCorrection::SignalCorrection() {
    values_.fill(UNSEEN);
}

int SignalCorrection::stored(EmitterType type) const {
    return values_[static_cast<size_t>(type)];
}

int SignalCorrection::corrected(EmitterType type, int signal) {
    signal = clamp_signal(signal);
    int& v = values_[static_cast<size_t>(type)];
    if (v == TRUSTED) return signal;
    if (v == UNSEEN) {
        v = signal;
        dirty_ = true;
        return signal;
    }
    if (v == signal) return MINIMUM_SIGNAL;
    log::info(TAG, std::string(to_string(type)) + " reports varying signal, trusting it from now on");
    v = TRUSTED;
    dirty_ = true;
    return signal;
}

bool SignalCorrection::load(const char* path) {
    FILE* f = std::fopen(path, "rb");
    if (!f) return false;
    std::fseek(f, 0, SEEK_END);
    long sz = std::ftell(f);
    std::fseek(f, 0, SEEK_SET);
    if (sz <= 0 || sz > 1 << 16) { std::fclose(f); return false; }
    std::string buf; buf.resize((size_t)sz);
    size_t n = std::fread(buf.data(), 1, (size_t)sz, f);
    std::fclose(f);
    if (n != (size_t)sz) return false;

    for (size_t i = 0; i < TYPE_COUNT; ++i) {
        std::string key = std::string("\"") + to_string(static_cast<EmitterType>(i)) + "\"";
        const char* p = std::strstr(buf.c_str(), key.c_str());
        if (!p) continue;
        p = std::strchr(p, ':'); if (!p) continue; ++p;
        long v = std::strtol(p, nullptr, 10);
        if (v < UNSEEN || v > MAXIMUM_SIGNAL) continue;
        values_[i] = (int)v;
    }
    dirty_ = false;
    return true;
}

bool SignalCorrection::save(const char* path) {
    FILE* f = std::fopen(path, "wb");
    if (!f) {
        log::error(TAG, std::string("cannot write ") + path);
        return false;
    }
    std::fprintf(f, "{\n");
    bool first = true;
    for (size_t i = 0; i < TYPE_COUNT; ++i) {
        if (values_[i] == UNSEEN) continue;
        std::fprintf(f, "%s  \"%s\": %d", first ? "" : ",\n", to_string(static_cast<EmitterType>(i)), values_[i]);
        first = false;
    }
    std::fprintf(f, "\n}\n");
    bool ok = std::fclose(f) == 0;
    if (ok) dirty_ = false;
    return ok;
}

} // namespace rfnav
