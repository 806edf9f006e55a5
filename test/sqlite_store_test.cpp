#include "rfnav/emitter_cache.hpp"
#include "rfnav/emitter_store.hpp"
#include "test_common.hpp"

#include <cstdio>
#include <string>

using namespace rfnav;

static EmitterRow make_row(const Identity& id, double lat, double lon, double r) {
    EmitterRow row;
    row.unique_key = id.key();
    row.id = id.id();
    row.type = id.type();
    row.lat = lat;
    row.lon = lon;
    row.radius_ns = r;
    row.radius_ew = r;
    row.label = "Cafe \"Zentral\"";
    return row;
}

static const Identity k_a("aa:00:00:00:00:01", EmitterType::WLAN5);
static const Identity k_b("LTE/262/1/1234/5/678", EmitterType::LTE);
static const Identity k_c("GSM/262/2/100/200", EmitterType::GSM);

static void test_round_trip() {
    test::section("rows round trip through sqlite");
    StoreConfig cfg;
    cfg.path = ":memory:";
    auto store = createSqliteEmitterStore(cfg);
    test::check(store->open(), __LINE__);
    test::check(store->is_open(), __LINE__);

    test::check(store->begin_transaction(), __LINE__);
    test::check(store->insert(make_row(k_a, 48.0, 11.0, 20)), __LINE__);
    test::check(store->insert(make_row(k_b, 48.1, 11.1, 900)), __LINE__);
    test::check(store->end_transaction(), __LINE__);

    std::vector<EmitterRow> rows;
    test::check(store->load({k_a, k_b, k_c}, rows), __LINE__);
    test::check(rows.size() == 2, __LINE__);

    EmitterRow row;
    test::check(store->load_one(k_a, row), __LINE__);
    test::check(row.unique_key == k_a.key(), __LINE__);
    test::check(row.id == k_a.id(), __LINE__);
    test::check(row.type == EmitterType::WLAN5, __LINE__);
    test::check_near(row.lat, 48.0, 1e-12, __LINE__);
    test::check_near(row.radius_ew, 20.0, 1e-12, __LINE__);
    test::check(row.label == "Cafe \"Zentral\"", __LINE__);
    test::check(!store->load_one(k_c, row), __LINE__);

    test::check(store->update(make_row(k_a, 48.0001, 11.0, 30)), __LINE__);
    test::check(store->load_one(k_a, row) && row.radius_ns == 30.0, __LINE__);
    // update of a missing row inserts it
    test::check(store->update(make_row(k_c, 48.2, 11.2, 1000)), __LINE__);
    test::check(store->load_one(k_c, row), __LINE__);

    test::check(store->invalidate(make_row(k_b, 48.1, 11.1, 900)), __LINE__);
    test::check(store->load_one(k_b, row) && row.radius_ew == INVALID_RADIUS, __LINE__);

    test::check(store->drop(k_a.key()), __LINE__);
    test::check(!store->load_one(k_a, row), __LINE__);

    // retrying an insert is harmless
    test::check(store->insert(make_row(k_a, 48.0, 11.0, 20)), __LINE__);
    test::check(store->insert(make_row(k_a, 48.0, 11.0, 20)), __LINE__);
    store->close();
    test::check(!store->is_open(), __LINE__);
}

static void test_transactions() {
    test::section("cancel rolls back, nested begin is a no-op");
    StoreConfig cfg;
    cfg.path = ":memory:";
    auto store = createSqliteEmitterStore(cfg);
    test::check(store->open(), __LINE__);
    test::check(store->begin_transaction(), __LINE__);
    test::check(store->begin_transaction(), __LINE__);
    test::check(store->insert(make_row(k_a, 48.0, 11.0, 20)), __LINE__);
    store->cancel_transaction();
    EmitterRow row;
    test::check(!store->load_one(k_a, row), __LINE__);
    test::check(!store->end_transaction(), __LINE__);
}

static void test_area() {
    test::section("area query by type and center");
    StoreConfig cfg;
    cfg.path = ":memory:";
    auto store = createSqliteEmitterStore(cfg);
    test::check(store->open(), __LINE__);
    test::check(store->insert(make_row(k_a, 48.0, 11.0, 20)), __LINE__);
    test::check(store->insert(make_row(k_b, 48.0, 11.0, 900)), __LINE__);
    std::vector<Identity> ids;
    test::check(store->identities_in_area(EmitterType::WLAN5, 48.1, 47.9, 11.1, 10.9, ids), __LINE__);
    test::check(ids.size() == 1 && ids[0] == k_a, __LINE__);
    ids.clear();
    test::check(store->identities_in_area(EmitterType::WLAN5, 49.1, 48.9, 11.1, 10.9, ids), __LINE__);
    test::check(ids.empty(), __LINE__);
}

static void test_persistence_across_instances() {
    test::section("cache state survives reopening a database file");
    const std::string path = "rfnav_sqlite_store_test.db";
    std::remove(path.c_str());
    StoreConfig cfg;
    cfg.path = path;
    {
        EmitterCache cache(createSqliteEmitterStore(cfg));
        test::check(cache.open(), __LINE__);
        EmitterRecord* rec = cache.get(k_a);
        Observation obs;
        obs.identity = k_a;
        obs.capture_time_ns = 1;
        rec->set_observation(obs);
        Fix fix;
        fix.lat = 48.0;
        fix.lon = 11.0;
        fix.accuracy_m = 3;
        fix.capture_time_ns = 1;
        test::check(rec->update_location(fix) == EmitterStatus::New, __LINE__);
        cache.close();
    }
    {
        EmitterCache cache(createSqliteEmitterStore(cfg));
        test::check(cache.open(), __LINE__);
        cache.batch_load({k_a});
        EmitterRecord* rec = cache.get(k_a);
        test::check(rec && rec->status() == EmitterStatus::Cached, __LINE__);
        test::check(rec && rec->has_coverage() && std::fabs(rec->coverage()->center_lat() - 48.0) < 1e-9, __LINE__);
        cache.close();
    }
    std::remove(path.c_str());
}

int main() {
    std::cout << "SQLite store test" << std::endl;
    test_round_trip();
    test_transactions();
    test_area();
    test_persistence_across_instances();
    return test::finish("sqlite_store_test");
}
