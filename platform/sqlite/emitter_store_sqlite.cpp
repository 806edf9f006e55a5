#include "rfnav/emitter_store.hpp"
#include "rfnav/log.hpp"

#include <sqlite3.h>
#include <algorithm>
#include <initializer_list>
#include <string>
#include <vector>

namespace rfnav {

static const char* TAG = "store";

namespace {

// Bound variables per IN (...) query, below the SQLite default limit
constexpr size_t MAX_IDS_PER_QUERY = 500;

const char* k_create_table =
    "CREATE TABLE IF NOT EXISTS emitters ("
    "rfHash TEXT PRIMARY KEY, "
    "rfID TEXT NOT NULL, "
    "rfType TEXT NOT NULL, "
    "latitude REAL, "
    "longitude REAL, "
    "radius_ns REAL, "
    "radius_ew REAL, "
    "note TEXT);";
const char* k_create_index =
    "CREATE INDEX IF NOT EXISTS emitters_index ON emitters(latitude, longitude);";

const char* k_insert =
    "INSERT OR REPLACE INTO emitters (rfHash, rfID, rfType, latitude, longitude, radius_ns, radius_ew, note) "
    "VALUES (?, ?, ?, ?, ?, ?, ?, ?);";
const char* k_update =
    "UPDATE emitters SET latitude = ?, longitude = ?, radius_ns = ?, radius_ew = ?, note = ? "
    "WHERE rfHash = ?;";
const char* k_drop = "DELETE FROM emitters WHERE rfHash = ?;";
const char* k_select_one =
    "SELECT rfHash, rfID, rfType, latitude, longitude, radius_ns, radius_ew, note "
    "FROM emitters WHERE rfHash = ?;";
const char* k_select_area =
    "SELECT rfID, rfType FROM emitters WHERE rfType = ? "
    "AND latitude >= ? AND latitude <= ? AND longitude >= ? AND longitude <= ?;";

std::string column_text(sqlite3_stmt* stmt, int col) {
    const unsigned char* t = sqlite3_column_text(stmt, col);
    return t ? std::string(reinterpret_cast<const char*>(t)) : std::string();
}

EmitterRow read_row(sqlite3_stmt* stmt) {
    EmitterRow row;
    row.unique_key = column_text(stmt, 0);
    row.id = column_text(stmt, 1);
    row.type = emitter_type_from_string(column_text(stmt, 2));
    row.lat = sqlite3_column_double(stmt, 3);
    row.lon = sqlite3_column_double(stmt, 4);
    row.radius_ns = sqlite3_column_double(stmt, 5);
    row.radius_ew = sqlite3_column_double(stmt, 6);
    row.label = column_text(stmt, 7);
    return row;
}

} // namespace

class SqliteEmitterStore : public IEmitterStore {
public:
    explicit SqliteEmitterStore(const StoreConfig& cfg) : config_(cfg) {}

    ~SqliteEmitterStore() override { close(); }

    bool open() override {
        if (db_) return true;
        if (sqlite3_open(config_.path.c_str(), &db_) != SQLITE_OK) {
            report("open " + config_.path);
            sqlite3_close(db_);
            db_ = nullptr;
            return false;
        }
        if (!exec(k_create_table) || !exec(k_create_index)) {
            close();
            return false;
        }
        if (!prepare(k_insert, insert_) || !prepare(k_update, update_) || !prepare(k_drop, drop_)
            || !prepare(k_select_one, select_one_) || !prepare(k_select_area, select_area_)) {
            close();
            return false;
        }
        log::debug(TAG, "opened " + config_.path);
        return true;
    }

    void close() override {
        if (!db_) return;
        if (in_transaction_) cancel_transaction();
        for (sqlite3_stmt** s : {&insert_, &update_, &drop_, &select_one_, &select_area_}) {
            sqlite3_finalize(*s);
            *s = nullptr;
        }
        sqlite3_close(db_);
        db_ = nullptr;
    }

    bool is_open() const override { return db_ != nullptr; }

    bool load(const std::vector<Identity>& ids, std::vector<EmitterRow>& rows) override {
        if (!db_) return false;
        for (size_t first = 0; first < ids.size(); first += MAX_IDS_PER_QUERY) {
            const size_t count = std::min(MAX_IDS_PER_QUERY, ids.size() - first);
            std::string sql = "SELECT rfHash, rfID, rfType, latitude, longitude, radius_ns, radius_ew, note "
                              "FROM emitters WHERE rfHash IN (";
            for (size_t i = 0; i < count; ++i) sql += i == 0 ? "?" : ",?";
            sql += ");";

            sqlite3_stmt* stmt = nullptr;
            if (!prepare(sql.c_str(), stmt)) return false;
            for (size_t i = 0; i < count; ++i)
                sqlite3_bind_text(stmt, (int)i + 1, ids[first + i].key().c_str(), -1, SQLITE_TRANSIENT);
            int rc;
            while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) rows.push_back(read_row(stmt));
            sqlite3_finalize(stmt);
            if (rc != SQLITE_DONE) {
                report("batch load");
                return false;
            }
        }
        return true;
    }

    bool load_one(const Identity& id, EmitterRow& row) override {
        if (!db_) return false;
        sqlite3_reset(select_one_);
        sqlite3_bind_text(select_one_, 1, id.key().c_str(), -1, SQLITE_TRANSIENT);
        int rc = sqlite3_step(select_one_);
        bool found = rc == SQLITE_ROW;
        if (found) row = read_row(select_one_);
        else if (rc != SQLITE_DONE) report("load " + id.key());
        sqlite3_reset(select_one_);
        return found;
    }

    bool identities_in_area(EmitterType type, double north, double south, double east, double west,
                            std::vector<Identity>& out) override {
        if (!db_) return false;
        sqlite3_reset(select_area_);
        sqlite3_bind_text(select_area_, 1, to_string(type), -1, SQLITE_STATIC);
        sqlite3_bind_double(select_area_, 2, south);
        sqlite3_bind_double(select_area_, 3, north);
        sqlite3_bind_double(select_area_, 4, west);
        sqlite3_bind_double(select_area_, 5, east);
        int rc;
        while ((rc = sqlite3_step(select_area_)) == SQLITE_ROW) {
            out.emplace_back(column_text(select_area_, 0), emitter_type_from_string(column_text(select_area_, 1)));
        }
        sqlite3_reset(select_area_);
        if (rc != SQLITE_DONE) {
            report("area query");
            return false;
        }
        return true;
    }

    bool begin_transaction() override {
        if (!db_) return false;
        if (in_transaction_) {
            log::warn(TAG, "transaction already open");
            return true;
        }
        if (!exec("BEGIN TRANSACTION;")) return false;
        in_transaction_ = true;
        return true;
    }

    bool end_transaction() override {
        if (!db_ || !in_transaction_) return false;
        if (!exec("COMMIT;")) return false;
        in_transaction_ = false;
        return true;
    }

    void cancel_transaction() override {
        if (!db_ || !in_transaction_) return;
        if (!exec("ROLLBACK;")) log::error(TAG, "rollback failed");
        in_transaction_ = false;
    }

    bool insert(const EmitterRow& row) override {
        if (!db_) return false;
        sqlite3_reset(insert_);
        sqlite3_bind_text(insert_, 1, row.unique_key.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_text(insert_, 2, row.id.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_text(insert_, 3, to_string(row.type), -1, SQLITE_STATIC);
        sqlite3_bind_double(insert_, 4, row.lat);
        sqlite3_bind_double(insert_, 5, row.lon);
        sqlite3_bind_double(insert_, 6, row.radius_ns);
        sqlite3_bind_double(insert_, 7, row.radius_ew);
        sqlite3_bind_text(insert_, 8, row.label.c_str(), -1, SQLITE_TRANSIENT);
        return step_done(insert_, "insert " + row.unique_key);
    }

    bool update(const EmitterRow& row) override {
        if (!db_) return false;
        sqlite3_reset(update_);
        sqlite3_bind_double(update_, 1, row.lat);
        sqlite3_bind_double(update_, 2, row.lon);
        sqlite3_bind_double(update_, 3, row.radius_ns);
        sqlite3_bind_double(update_, 4, row.radius_ew);
        sqlite3_bind_text(update_, 5, row.label.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_text(update_, 6, row.unique_key.c_str(), -1, SQLITE_TRANSIENT);
        if (!step_done(update_, "update " + row.unique_key)) return false;
        // row vanished underneath us, e.g. a rolled back insert
        if (sqlite3_changes(db_) == 0) return insert(row);
        return true;
    }

    bool invalidate(const EmitterRow& row) override {
        // Written as a full row so an emitter blacklisted before its first
        // insert is still remembered
        EmitterRow invalid = row;
        invalid.radius_ns = INVALID_RADIUS;
        invalid.radius_ew = INVALID_RADIUS;
        return insert(invalid);
    }

    bool drop(const std::string& unique_key) override {
        if (!db_) return false;
        sqlite3_reset(drop_);
        sqlite3_bind_text(drop_, 1, unique_key.c_str(), -1, SQLITE_TRANSIENT);
        return step_done(drop_, "drop " + unique_key);
    }

private:
    StoreConfig config_;
    sqlite3* db_ = nullptr;
    bool in_transaction_ = false;

    sqlite3_stmt* insert_ = nullptr;
    sqlite3_stmt* update_ = nullptr;
    sqlite3_stmt* drop_ = nullptr;
    sqlite3_stmt* select_one_ = nullptr;
    sqlite3_stmt* select_area_ = nullptr;

    void report(const std::string& what) const {
        log::error(TAG, what + " failed: " + (db_ ? sqlite3_errmsg(db_) : "no database"));
    }

    bool exec(const char* sql) {
        char* err = nullptr;
        if (sqlite3_exec(db_, sql, nullptr, nullptr, &err) != SQLITE_OK) {
            log::error(TAG, std::string(sql) + " failed: " + (err ? err : "?"));
            sqlite3_free(err);
            return false;
        }
        return true;
    }

    bool prepare(const char* sql, sqlite3_stmt*& stmt) {
        if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
            report("prepare");
            stmt = nullptr;
            return false;
        }
        return true;
    }

    bool step_done(sqlite3_stmt* stmt, const std::string& what) {
        int rc = sqlite3_step(stmt);
        if (rc != SQLITE_DONE) report(what);
        sqlite3_reset(stmt);
        return rc == SQLITE_DONE;
    }
};

std::unique_ptr<IEmitterStore> createSqliteEmitterStore(const StoreConfig& config) {
    return std::make_unique<SqliteEmitterStore>(config);
}

} // namespace rfnav
