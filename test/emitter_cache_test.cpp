#include "memory_store.hpp"
#include "rfnav/emitter_cache.hpp"
#include "test_common.hpp"

#include <cstdio>
#include <memory>
#include <thread>

using namespace rfnav;

static const int64_t SEC = 1000000000LL;

struct Harness {
    test::MemoryStore* store = nullptr;
    std::unique_ptr<EmitterCache> cache;

    explicit Harness(const CacheConfig& cfg = CacheConfig()) {
        auto s = std::make_unique<test::MemoryStore>();
        store = s.get();
        cache = std::make_unique<EmitterCache>(std::move(s), cfg);
        cache->open();
    }
};

static Identity wifi(int n) {
    char buf[32];
    std::snprintf(buf, sizeof(buf), "02:00:00:00:00:%02x", n & 0xff);
    return Identity(buf, EmitterType::WLAN2);
}

static void learn(EmitterRecord* rec, double lat, double lon) {
    Observation obs;
    obs.identity = rec->identity();
    obs.signal = 20;
    obs.capture_time_ns = 100 * SEC;
    rec->set_observation(obs);
    Fix fix;
    fix.lat = lat;
    fix.lon = lon;
    fix.accuracy_m = 5;
    fix.capture_time_ns = 100 * SEC;
    rec->update_location(fix);
}

static void test_batch_load() {
    test::section("batch load reads once and creates unknown records");
    Harness h;
    EmitterRow row;
    row.unique_key = wifi(1).key();
    row.id = wifi(1).id();
    row.type = EmitterType::WLAN2;
    row.lat = 48.0;
    row.lon = 11.0;
    row.radius_ns = 10;
    row.radius_ew = 10;
    h.store->rows[row.unique_key] = row;

    h.cache->batch_load({wifi(1), wifi(2), wifi(2)});
    test::check(h.store->load_calls == 1, __LINE__);
    test::check(h.cache->size() == 2, __LINE__);
    EmitterRecord* known = h.cache->get(wifi(1));
    EmitterRecord* fresh = h.cache->get(wifi(2));
    test::check(known && known->status() == EmitterStatus::Cached, __LINE__);
    test::check(fresh && fresh->status() == EmitterStatus::Unknown, __LINE__);

    // resident ids are not queried again
    h.cache->batch_load({wifi(1), wifi(2)});
    test::check(h.store->load_calls == 1, __LINE__);
    test::check(h.store->load_one_calls == 0, __LINE__);

    // get never reads the store
    EmitterRecord* other = h.cache->get(wifi(3));
    test::check(other && other->status() == EmitterStatus::Unknown, __LINE__);
    test::check(h.store->load_one_calls == 0, __LINE__);
    test::check(h.cache->find(wifi(4)) == nullptr, __LINE__);
}

static void test_sync_flushes_dirty() {
    test::section("sync writes dirty records in one transaction");
    Harness h;
    learn(h.cache->get(wifi(1)), 48.0, 11.0);
    learn(h.cache->get(wifi(2)), 48.0001, 11.0);
    h.cache->get(wifi(3)); // unknown, nothing to write
    test::check(h.cache->sync(), __LINE__);
    test::check(h.store->commits == 1, __LINE__);
    test::check(h.store->rows.size() == 2, __LINE__);
    test::check(h.cache->find(wifi(1))->status() == EmitterStatus::Cached, __LINE__);
    test::check(!h.cache->find(wifi(1))->sync_needed(), __LINE__);

    // nothing dirty: no transaction
    test::check(h.cache->sync(), __LINE__);
    test::check(h.store->commits == 1, __LINE__);
}

static void test_failed_flush() {
    test::section("failed flush rolls back and leaves records dirty");
    CacheConfig cfg;
    cfg.max_age = 2;
    Harness h(cfg);
    learn(h.cache->get(wifi(1)), 48.0, 11.0);
    learn(h.cache->get(wifi(2)), 48.0001, 11.0);
    h.store->fail_writes = true;
    test::check(!h.cache->sync(), __LINE__);
    test::check(h.store->rollbacks == 1, __LINE__);
    test::check(h.store->rows.empty(), __LINE__);
    test::check(h.cache->find(wifi(1))->status() == EmitterStatus::New, __LINE__);
    test::check(h.cache->find(wifi(2))->sync_needed(), __LINE__);

    // aged out but dirty: kept
    test::check(!h.cache->sync(), __LINE__);
    test::check(h.cache->size() == 2, __LINE__);

    h.store->fail_writes = false;
    h.store->fail_commit = true;
    test::check(!h.cache->sync(), __LINE__);
    test::check(h.cache->find(wifi(1))->status() == EmitterStatus::New, __LINE__);

    // retry succeeds, then the idle records go
    h.store->fail_commit = false;
    test::check(h.cache->sync(), __LINE__);
    test::check(h.store->rows.size() == 2, __LINE__);
    test::check(h.cache->size() == 0, __LINE__);
}

static void test_eviction() {
    test::section("idle records are evicted after max_age syncs");
    CacheConfig cfg;
    cfg.max_age = 3;
    Harness h(cfg);
    h.cache->get(wifi(1));
    h.cache->get(wifi(2));
    test::check(h.cache->sync(), __LINE__);
    test::check(h.cache->sync(), __LINE__);
    h.cache->get(wifi(2)); // resets age
    test::check(h.cache->sync(), __LINE__);
    test::check(h.cache->find(wifi(1)) == nullptr, __LINE__);
    test::check(h.cache->find(wifi(2)) != nullptr, __LINE__);
    // find does not reset the age
    test::check(h.cache->sync(), __LINE__);
    test::check(h.cache->sync(), __LINE__);
    test::check(h.cache->find(wifi(2)) == nullptr, __LINE__);
}

static void test_safety_valve() {
    test::section("working set above the cap is cleared");
    CacheConfig cfg;
    cfg.max_working_set = 10;
    Harness h(cfg);
    for (int i = 0; i < 11; ++i) h.cache->get(wifi(i));
    test::check(h.cache->size() == 11, __LINE__);
    test::check(h.cache->sync(), __LINE__);
    test::check(h.cache->size() == 0, __LINE__);
}

static void test_close() {
    test::section("close syncs and releases the store");
    Harness h;
    learn(h.cache->get(wifi(1)), 48.0, 11.0);
    h.cache->close();
    test::check(h.store->rows.size() == 1, __LINE__);
    test::check(!h.store->is_open(), __LINE__);
    test::check(h.cache->get(wifi(1)) == nullptr, __LINE__);
    test::check(h.cache->size() == 0, __LINE__);
    test::check(!h.cache->sync(), __LINE__);
}

static void test_area_query() {
    test::section("area query passes through to the store");
    Harness h;
    learn(h.cache->get(wifi(1)), 48.0, 11.0);
    learn(h.cache->get(wifi(2)), 49.0, 11.0);
    test::check(h.cache->sync(), __LINE__);
    std::vector<Identity> ids;
    test::check(h.cache->identities_in_area(EmitterType::WLAN2, 48.5, 47.5, 11.5, 10.5, ids), __LINE__);
    test::check(ids.size() == 1 && ids[0] == wifi(1), __LINE__);
}

static void test_concurrent_access() {
    test::section("concurrent get and find keep the map consistent");
    Harness h;
    std::thread a([&] { for (int i = 0; i < 2000; ++i) h.cache->get(wifi(i % 64)); });
    std::thread b([&] { for (int i = 0; i < 2000; ++i) h.cache->find(wifi(i % 64)); });
    a.join();
    b.join();
    test::check(h.cache->size() == 64, __LINE__);
}

int main() {
    std::cout << "Emitter cache test" << std::endl;
    test_batch_load();
    test_sync_flushes_dirty();
    test_failed_flush();
    test_eviction();
    test_safety_valve();
    test_close();
    test_area_query();
    test_concurrent_access();
    return test::finish("emitter_cache_test");
}
