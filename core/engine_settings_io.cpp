#include "engine_settings.hpp"
#include "engine_settings_io.hpp"
#include <string>
#include <cstdlib>
#include <cstdio>
#include <cstring>

namespace rfnav {

// Flat JSON, hand-rolled. Expects a well-formed file like the one we write.
static bool parse_key_value(const char* s, const char* key, double& out) {
    const char* p = std::strstr(s, key);
    if (!p) return false;
    p = std::strchr(p, ':'); if (!p) return false; ++p;
    out = std::strtod(p, nullptr);
    return true;
}
static bool parse_key_value(const char* s, const char* key, int& out) {
    const char* p = std::strstr(s, key);
    if (!p) return false;
    p = std::strchr(p, ':'); if (!p) return false; ++p;
    out = (int)std::strtol(p, nullptr, 10);
    return true;
}
static bool parse_key_value(const char* s, const char* key, std::string& out) {
    const char* p = std::strstr(s, key);
    if (!p) return false;
    p = std::strchr(p, ':'); if (!p) return false; ++p;
    while (*p == ' ' || *p == '\t') ++p;
    if (*p != '"') return false;
    ++p;
    const char* start = p;
    while (*p && *p != '"' && *p != '\n' && *p != '\r') ++p;
    out.assign(start, p - start);
    return true;
}

bool load_settings(const char* path, EngineSettings& st) {
    FILE* f = std::fopen(path, "rb");
    if (!f) return false;
    std::fseek(f, 0, SEEK_END);
    long sz = std::ftell(f);
    std::fseek(f, 0, SEEK_SET);
    if (sz <= 0 || sz > 1<<20) { std::fclose(f); return false; }
    std::string buf; buf.resize((size_t)sz);
    size_t n = std::fread(buf.data(), 1, (size_t)sz, f);
    std::fclose(f);
    if (n != (size_t)sz) return false;
    const char* s = buf.c_str();

    parse_key_value(s, "\"database_path\"", st.database_path);
    parse_key_value(s, "\"signal_correction_path\"", st.signal_correction_path);

    int cull = static_cast<int>(st.cull_mode);
    if (parse_key_value(s, "\"cull_mode\"", cull) && cull >= 0 && cull <= 2)
        st.cull_mode = static_cast<CullMode>(cull);
    int level = static_cast<int>(st.log_level);
    if (parse_key_value(s, "\"log_level\"", level) && level >= 0 && level <= 5)
        st.log_level = static_cast<log::Level>(level);

    int max_age = st.cache.max_age;
    if (parse_key_value(s, "\"cache_max_age\"", max_age) && max_age > 0)
        st.cache.max_age = max_age;
    int max_set = (int)st.cache.max_working_set;
    if (parse_key_value(s, "\"cache_max_working_set\"", max_set) && max_set > 0)
        st.cache.max_working_set = (size_t)max_set;

    SynthesisConfig& sy = st.synthesis;
    parse_key_value(s, "\"group_distance_factor\"", sy.group_distance_factor);
    parse_key_value(s, "\"minimum_believable_accuracy\"", sy.minimum_believable_accuracy);
    parse_key_value(s, "\"signal_accuracy_pull\"", sy.signal_accuracy_pull);
    parse_key_value(s, "\"median_keep_factor\"", sy.median_keep_factor);
    parse_key_value(s, "\"median_max_trim_fraction\"", sy.median_max_trim_fraction);
    parse_key_value(s, "\"weak_result_inflation\"", sy.weak_result_inflation);
    return true;
}

bool save_settings(const char* path, const EngineSettings& st) {
    FILE* f = std::fopen(path, "wb");
    if (!f) return false;
    const SynthesisConfig& sy = st.synthesis;
    std::fprintf(f,
        "{\n"
        "  \"database_path\": \"%s\",\n"
        "  \"signal_correction_path\": \"%s\",\n"
        "  \"cull_mode\": %d,\n"
        "  \"cache_max_age\": %d,\n"
        "  \"cache_max_working_set\": %d,\n"
        "  \"log_level\": %d,\n"
        "  \"group_distance_factor\": %.4f,\n"
        "  \"minimum_believable_accuracy\": %.3f,\n"
        "  \"signal_accuracy_pull\": %.4f,\n"
        "  \"median_keep_factor\": %.4f,\n"
        "  \"median_max_trim_fraction\": %.4f,\n"
        "  \"weak_result_inflation\": %.4f\n"
        "}\n",
        st.database_path.c_str(),
        st.signal_correction_path.c_str(),
        static_cast<int>(st.cull_mode),
        st.cache.max_age,
        (int)st.cache.max_working_set,
        static_cast<int>(st.log_level),
        sy.group_distance_factor,
        sy.minimum_believable_accuracy,
        sy.signal_accuracy_pull,
        sy.median_keep_factor,
        sy.median_max_trim_fraction,
        sy.weak_result_inflation);
    return std::fclose(f) == 0;
}

} // namespace rfnav
