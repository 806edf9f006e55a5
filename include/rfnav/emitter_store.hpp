#pragma once

#include <memory>
#include <string>
#include <vector>

#include "emitter_type.hpp"
#include "identity.hpp"

namespace rfnav {

// Persisted form of one emitter. A negative radius_ew marks a row invalidated
// for exceeding the type's maximum range.
struct EmitterRow {
    std::string unique_key;
    std::string id;
    EmitterType type = EmitterType::INVALID;
    double lat = 0.0;
    double lon = 0.0;
    double radius_ns = 0.0;
    double radius_ew = 0.0;
    std::string label;
};

constexpr double INVALID_RADIUS = -1.0;

struct StoreConfig {
    std::string path = "rfnav.db"; // ":memory:" for a private in-memory store
};

// Row store behind the emitter cache. Not thread safe; the cache serializes
// all access.
class IEmitterStore {
public:
    virtual ~IEmitterStore() = default;

    virtual bool open() = 0;
    virtual void close() = 0;
    virtual bool is_open() const = 0;

    // All persisted rows for ids, in a single query
    virtual bool load(const std::vector<Identity>& ids, std::vector<EmitterRow>& rows) = 0;
    // False if absent or on error
    virtual bool load_one(const Identity& id, EmitterRow& row) = 0;
    // Identities of one type whose center lies inside the rectangle
    virtual bool identities_in_area(EmitterType type, double north, double south,
                                    double east, double west, std::vector<Identity>& out) = 0;

    // Nested begin is a warning and a no-op
    virtual bool begin_transaction() = 0;
    // Commit
    virtual bool end_transaction() = 0;
    // Roll back everything since begin
    virtual void cancel_transaction() = 0;

    virtual bool insert(const EmitterRow& row) = 0;
    virtual bool update(const EmitterRow& row) = 0;
    // Keep the row but mark its radius degenerate
    virtual bool invalidate(const EmitterRow& row) = 0;
    virtual bool drop(const std::string& unique_key) = 0;
};

// SQLite backend
std::unique_ptr<IEmitterStore> createSqliteEmitterStore(const StoreConfig& config);

} // namespace rfnav
