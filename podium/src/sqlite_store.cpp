#include <podium/sqlite_store.hpp>
#include <podium/log.hpp>
#include <podium/version.hpp>
#include <sqlite3.h>
#include <chrono>
#include <filesystem>
#include <iostream>
#include <map>
#include <optional>

namespace podium {

namespace {

const char* SCHEMA_SQL = R"SQL(
CREATE TABLE IF NOT EXISTS meta (
    key TEXT PRIMARY KEY,
    value INTEGER NOT NULL
);
CREATE TABLE IF NOT EXISTS partitions (
    category INTEGER NOT NULL,
    timeframe INTEGER NOT NULL,
    capacity INTEGER NOT NULL,
    PRIMARY KEY (category, timeframe)
);
CREATE TABLE IF NOT EXISTS entries (
    category INTEGER NOT NULL,
    timeframe INTEGER NOT NULL,
    position INTEGER NOT NULL,
    entity TEXT NOT NULL,
    score INTEGER NOT NULL,
    PRIMARY KEY (category, timeframe, position)
);
CREATE TABLE IF NOT EXISTS cooldowns (
    category INTEGER NOT NULL,
    timeframe INTEGER NOT NULL,
    entity TEXT NOT NULL,
    last_update INTEGER NOT NULL,
    PRIMARY KEY (category, timeframe, entity)
);
CREATE TABLE IF NOT EXISTS configs (
    category INTEGER NOT NULL,
    timeframe INTEGER NOT NULL,
    is_active INTEGER NOT NULL,
    max_entries INTEGER NOT NULL,
    update_cooldown INTEGER NOT NULL,
    season_start INTEGER NOT NULL,
    season_duration INTEGER NOT NULL,
    PRIMARY KEY (category, timeframe)
);
CREATE TABLE IF NOT EXISTS activity (
    scope TEXT NOT NULL,
    entity TEXT NOT NULL,
    mask INTEGER NOT NULL,
    last_activity INTEGER NOT NULL,
    PRIMARY KEY (scope, entity)
);
CREATE TABLE IF NOT EXISTS records (
    scope TEXT NOT NULL,
    slot INTEGER NOT NULL,
    value INTEGER NOT NULL,
    holder TEXT NOT NULL,
    PRIMARY KEY (scope, slot)
);
CREATE TABLE IF NOT EXISTS components (
    scope TEXT NOT NULL,
    entity TEXT NOT NULL,
    slot INTEGER NOT NULL,
    value INTEGER NOT NULL,
    PRIMARY KEY (scope, entity, slot)
);
CREATE TABLE IF NOT EXISTS streak_users (
    entity TEXT PRIMARY KEY,
    longest INTEGER NOT NULL,
    achievements INTEGER NOT NULL,
    xp INTEGER NOT NULL,
    badges INTEGER NOT NULL
);
CREATE TABLE IF NOT EXISTS streak_current (
    entity TEXT NOT NULL,
    type INTEGER NOT NULL,
    streak INTEGER NOT NULL,
    PRIMARY KEY (entity, type)
);
CREATE TABLE IF NOT EXISTS streak_boards (
    board INTEGER NOT NULL,
    position INTEGER NOT NULL,
    entity TEXT NOT NULL,
    score INTEGER NOT NULL,
    PRIMARY KEY (board, position)
);
CREATE TABLE IF NOT EXISTS streak_counts (
    type INTEGER PRIMARY KEY,
    count INTEGER NOT NULL
);
CREATE TABLE IF NOT EXISTS daily_stats (
    day INTEGER PRIMARY KEY,
    active_users INTEGER NOT NULL,
    total_activities INTEGER NOT NULL,
    new_activations INTEGER NOT NULL
);
CREATE TABLE IF NOT EXISTS daily_seen (
    day INTEGER NOT NULL,
    entity TEXT NOT NULL,
    PRIMARY KEY (day, entity)
);
)SQL";

// Board index of the totals board in streak_boards
constexpr int64_t TOTALS_BOARD = static_cast<int64_t>(STREAK_TYPE_COUNT);

// Record slot of the aggregate best in records
constexpr int64_t AGGREGATE_SLOT = -1;

// Prepared statement, finalized on scope exit
class Statement {
public:
    Statement(sqlite3* db, const char* sql) : db_(db) {
        if (sqlite3_prepare_v2(db, sql, -1, &stmt_, nullptr) != SQLITE_OK) {
            std::cerr << "[store] Prepare failed: " << sqlite3_errmsg(db) << "\n";
            stmt_ = nullptr;
        }
    }

    ~Statement() {
        if (stmt_) sqlite3_finalize(stmt_);
    }

    Statement(const Statement&) = delete;
    Statement& operator=(const Statement&) = delete;

    bool ok() const { return stmt_ != nullptr; }
    bool failed() const { return failed_; }

    Statement& bind(int idx, int64_t value) {
        sqlite3_bind_int64(stmt_, idx, static_cast<sqlite3_int64>(value));
        return *this;
    }

    // Scores are stored as the bit pattern of the unsigned value
    Statement& bind_score(int idx, Score value) {
        sqlite3_bind_int64(stmt_, idx, static_cast<sqlite3_int64>(value));
        return *this;
    }

    Statement& bind(int idx, const std::string& value) {
        sqlite3_bind_text(stmt_, idx, value.c_str(), static_cast<int>(value.size()),
                          SQLITE_TRANSIENT);
        return *this;
    }

    // Execute a write and reset for the next set of bindings
    bool run() {
        int rc = sqlite3_step(stmt_);
        sqlite3_reset(stmt_);
        sqlite3_clear_bindings(stmt_);
        if (rc != SQLITE_DONE) {
            std::cerr << "[store] Write failed: " << sqlite3_errmsg(db_) << "\n";
            failed_ = true;
            return false;
        }
        return true;
    }

    // Advance a query; false at the end or on error (see failed())
    bool row() {
        int rc = sqlite3_step(stmt_);
        if (rc == SQLITE_ROW) return true;
        if (rc != SQLITE_DONE) {
            std::cerr << "[store] Read failed: " << sqlite3_errmsg(db_) << "\n";
            failed_ = true;
        }
        return false;
    }

    int64_t i64(int col) const { return sqlite3_column_int64(stmt_, col); }
    Score score(int col) const { return static_cast<Score>(sqlite3_column_int64(stmt_, col)); }

    std::string text(int col) const {
        const auto* p = reinterpret_cast<const char*>(sqlite3_column_text(stmt_, col));
        return p ? std::string(p) : std::string();
    }

private:
    sqlite3* db_;
    sqlite3_stmt* stmt_ = nullptr;
    bool failed_ = false;
};

std::optional<PartitionKey> key_from(int64_t category, int64_t timeframe) {
    if (category < 0 || category >= static_cast<int64_t>(CATEGORY_COUNT)) return std::nullopt;
    if (timeframe < 0 || timeframe >= static_cast<int64_t>(TIMEFRAME_COUNT)) return std::nullopt;
    return PartitionKey{static_cast<Category>(category), static_cast<Timeframe>(timeframe)};
}

bool corrupt(const char* table, const std::string& detail) {
    std::cerr << "[store] Rejected row in " << table << ": " << detail << "\n";
    return false;
}

bool save_activity(sqlite3* db, const std::string& scope, const ActivityMask& activity) {
    Statement ins(db, "INSERT INTO activity (scope, entity, mask, last_activity) "
                      "VALUES (?, ?, ?, ?)");
    if (!ins.ok()) return false;
    for (const auto& [entity, rec] : activity.records()) {
        if (!ins.bind(1, scope).bind(2, entity).bind(3, rec.mask)
                .bind(4, rec.last_activity).run()) {
            return false;
        }
    }
    return true;
}

bool load_activity(sqlite3* db, const std::string& scope, ActivityMask& activity) {
    Statement q(db, "SELECT entity, mask, last_activity FROM activity WHERE scope = ?");
    if (!q.ok()) return false;
    q.bind(1, scope);
    while (q.row()) {
        int64_t mask = q.i64(1);
        if (mask < 0 || mask > static_cast<int64_t>(UINT32_MAX)) {
            return corrupt("activity", "mask out of range for " + q.text(0));
        }
        activity.restore(q.text(0), {static_cast<CategoryMask>(mask), q.i64(2)});
    }
    return !q.failed();
}

bool save_record(sqlite3* db, const std::string& scope, const GlobalRecord& record) {
    Statement ins(db, "INSERT INTO records (scope, slot, value, holder) VALUES (?, ?, ?, ?)");
    if (!ins.ok()) return false;

    const auto& best = record.best();
    if (!ins.bind(1, scope).bind(2, AGGREGATE_SLOT).bind_score(3, best.value)
            .bind(4, best.holder).run()) {
        return false;
    }

    const auto& slots = record.category_bests();
    for (size_t i = 0; i < slots.size(); ++i) {
        if (!slots[i].held()) continue;
        if (!ins.bind(1, scope).bind(2, static_cast<int64_t>(i)).bind_score(3, slots[i].value)
                .bind(4, slots[i].holder).run()) {
            return false;
        }
    }

    Statement comp(db, "INSERT INTO components (scope, entity, slot, value) VALUES (?, ?, ?, ?)");
    if (!comp.ok()) return false;
    for (const auto& [entity, values] : record.components()) {
        for (size_t i = 0; i < values.size(); ++i) {
            if (values[i] == 0) continue;
            if (!comp.bind(1, scope).bind(2, entity).bind(3, static_cast<int64_t>(i))
                    .bind_score(4, values[i]).run()) {
                return false;
            }
        }
    }
    return true;
}

bool load_record(sqlite3* db, const std::string& scope, GlobalRecord& record) {
    Statement q(db, "SELECT slot, value, holder FROM records WHERE scope = ?");
    if (!q.ok()) return false;
    q.bind(1, scope);
    while (q.row()) {
        int64_t slot = q.i64(0);
        RecordHolder holder{q.score(1), q.text(2)};
        if (slot == AGGREGATE_SLOT) {
            record.restore_best(holder);
        } else if (slot < 0 || !record.restore_category_best(static_cast<size_t>(slot), holder)) {
            return corrupt("records", scope + " slot " + std::to_string(slot));
        }
    }
    if (q.failed()) return false;

    Statement c(db, "SELECT entity, slot, value FROM components WHERE scope = ? "
                    "ORDER BY entity, slot");
    if (!c.ok()) return false;
    c.bind(1, scope);

    std::string current;
    std::vector<Score> values;
    while (c.row()) {
        std::string entity = c.text(0);
        int64_t slot = c.i64(1);
        if (slot < 0 || slot >= static_cast<int64_t>(record.categories())) {
            return corrupt("components", entity + " slot " + std::to_string(slot));
        }
        if (entity != current) {
            if (!current.empty()) record.restore_components(current, values);
            current = entity;
            values.assign(record.categories(), 0);
        }
        values[static_cast<size_t>(slot)] = c.score(2);
    }
    if (!current.empty()) record.restore_components(current, values);
    return !c.failed();
}

// Copy the database aside before an in-place schema upgrade
bool create_backup(const std::string& path, int version) {
    namespace fs = std::filesystem;

    std::string backup = path + ".bak.v" + std::to_string(version);

    // If backup exists, add timestamp
    std::error_code ec;
    if (fs::exists(backup, ec)) {
        auto ts = std::chrono::duration_cast<std::chrono::seconds>(
            std::chrono::system_clock::now().time_since_epoch()).count();
        backup += "." + std::to_string(ts);
    }

    fs::copy_file(path, backup, ec);
    if (ec) {
        std::cerr << "[store] Backup to " << backup << " failed: " << ec.message() << "\n";
        return false;
    }
    std::cerr << "[store] Backed up schema " << version << " database to " << backup << "\n";
    return true;
}

bool save_board(Statement& ins, int64_t board, const ScorePartition& partition) {
    const auto& entries = partition.entries();
    for (size_t i = 0; i < entries.size(); ++i) {
        if (!ins.bind(1, board).bind(2, static_cast<int64_t>(i)).bind(3, entries[i].entity)
                .bind_score(4, entries[i].score).run()) {
            return false;
        }
    }
    return true;
}

} // namespace

SqliteStore::SqliteStore(std::string path) : path_(std::move(path)) {}

SqliteStore::~SqliteStore() {
    close();
}

bool SqliteStore::open() {
    if (db_) return true;

    namespace fs = std::filesystem;
    fs::path parent = fs::path(path_).parent_path();
    if (!parent.empty() && path_ != ":memory:") {
        std::error_code ec;
        fs::create_directories(parent, ec);
        if (ec) {
            std::cerr << "[store] Cannot create " << parent.string() << ": " << ec.message() << "\n";
            return false;
        }
    }

    if (sqlite3_open(path_.c_str(), &db_) != SQLITE_OK) {
        std::cerr << "[store] Cannot open " << path_ << ": " << sqlite3_errmsg(db_) << "\n";
        sqlite3_close(db_);
        db_ = nullptr;
        return false;
    }

    int stored = schema_version();
    if (!version::schema_compatible(stored)) {
        std::cerr << "[store] " << path_ << " has schema " << stored
                  << ", this build understands up to " << PODIUM_SCHEMA_VERSION << "\n";
        close();
        return false;
    }

    if (stored > 0 && stored < PODIUM_SCHEMA_VERSION && !create_backup(path_, stored)) {
        close();
        return false;
    }

    if (!create_schema()) {
        close();
        return false;
    }

    if (stored != PODIUM_SCHEMA_VERSION) {
        std::string pragma = "PRAGMA user_version = " + std::to_string(PODIUM_SCHEMA_VERSION);
        if (!exec(pragma.c_str())) {
            close();
            return false;
        }
        if (stored > 0) {
            std::cerr << "[store] Upgraded schema " << stored << " -> "
                      << PODIUM_SCHEMA_VERSION << "\n";
        }
    }

    log_debug("store", "opened %s (schema %d)", path_.c_str(), PODIUM_SCHEMA_VERSION);
    return true;
}

void SqliteStore::close() {
    if (db_) {
        sqlite3_close(db_);
        db_ = nullptr;
    }
}

int SqliteStore::schema_version() const {
    if (!db_) return -1;
    Statement q(db_, "PRAGMA user_version");
    if (!q.ok() || !q.row()) return -1;
    return static_cast<int>(q.i64(0));
}

bool SqliteStore::exec(const char* sql) {
    char* err = nullptr;
    if (sqlite3_exec(db_, sql, nullptr, nullptr, &err) != SQLITE_OK) {
        std::cerr << "[store] " << (err ? err : "unknown error") << "\n";
        sqlite3_free(err);
        return false;
    }
    return true;
}

bool SqliteStore::create_schema() {
    return exec(SCHEMA_SQL);
}

bool SqliteStore::begin() { return exec("BEGIN IMMEDIATE"); }
bool SqliteStore::commit() { return exec("COMMIT"); }

void SqliteStore::rollback() {
    if (!exec("ROLLBACK")) {
        std::cerr << "[store] Rollback failed, database may hold a partial save\n";
    }
}

int64_t SqliteStore::meta(const char* key, int64_t fallback) const {
    if (!db_) return fallback;
    Statement q(db_, "SELECT value FROM meta WHERE key = ?");
    if (!q.ok()) return fallback;
    q.bind(1, std::string(key));
    return q.row() ? q.i64(0) : fallback;
}

bool SqliteStore::set_meta(const char* key, int64_t value) {
    Statement ins(db_, "INSERT OR REPLACE INTO meta (key, value) VALUES (?, ?)");
    return ins.ok() && ins.bind(1, std::string(key)).bind(2, value).run();
}

bool SqliteStore::has_engine_state() const {
    return meta("engine_saved_at", -1) >= 0;
}

bool SqliteStore::has_streak_state() const {
    return meta("streaks_saved_at", -1) >= 0;
}

// ═══════════════════════════════════════════════════════════════════
// Leaderboard engine
// ═══════════════════════════════════════════════════════════════════

bool SqliteStore::save(const LeaderboardEngine& engine) {
    if (!db_) {
        std::cerr << "[store] Not open\n";
        return false;
    }
    if (!begin()) return false;

    auto fail = [this] {
        rollback();
        return false;
    };

    if (!exec("DELETE FROM partitions") || !exec("DELETE FROM entries") ||
        !exec("DELETE FROM cooldowns") || !exec("DELETE FROM configs") ||
        !exec("DELETE FROM activity WHERE scope = 'engine'") ||
        !exec("DELETE FROM records WHERE scope = 'engine'") ||
        !exec("DELETE FROM components WHERE scope = 'engine'")) {
        return fail();
    }

    {
        Statement part(db_, "INSERT INTO partitions (category, timeframe, capacity) VALUES (?, ?, ?)");
        Statement ent(db_, "INSERT INTO entries (category, timeframe, position, entity, score) "
                           "VALUES (?, ?, ?, ?, ?)");
        Statement cd(db_, "INSERT INTO cooldowns (category, timeframe, entity, last_update) "
                          "VALUES (?, ?, ?, ?)");
        if (!part.ok() || !ent.ok() || !cd.ok()) return fail();

        for (const auto& [key, st] : engine.partitions_) {
            auto c = static_cast<int64_t>(index_of(key.category));
            auto t = static_cast<int64_t>(index_of(key.timeframe));

            if (!part.bind(1, c).bind(2, t).bind(3, static_cast<int64_t>(st.board.capacity())).run()) {
                return fail();
            }

            const auto& entries = st.board.entries();
            for (size_t i = 0; i < entries.size(); ++i) {
                if (!ent.bind(1, c).bind(2, t).bind(3, static_cast<int64_t>(i))
                        .bind(4, entries[i].entity).bind_score(5, entries[i].score).run()) {
                    return fail();
                }
            }

            for (const auto& [entity, stamp] : st.last_update) {
                if (!cd.bind(1, c).bind(2, t).bind(3, entity).bind(4, stamp).run()) return fail();
            }
        }
    }

    {
        Statement cfg(db_, "INSERT INTO configs (category, timeframe, is_active, max_entries, "
                           "update_cooldown, season_start, season_duration) "
                           "VALUES (?, ?, ?, ?, ?, ?, ?)");
        if (!cfg.ok()) return fail();

        for (const auto& key : engine.seasons_.configured_keys()) {
            const auto& c = engine.seasons_.config(key);
            if (!cfg.bind(1, static_cast<int64_t>(index_of(key.category)))
                    .bind(2, static_cast<int64_t>(index_of(key.timeframe)))
                    .bind(3, c.is_active ? 1 : 0)
                    .bind(4, static_cast<int64_t>(c.max_entries))
                    .bind(5, c.update_cooldown)
                    .bind(6, c.season_start)
                    .bind(7, c.season_duration)
                    .run()) {
                return fail();
            }
        }
    }

    if (!save_activity(db_, "engine", engine.activity_)) return fail();
    if (!save_record(db_, "engine", engine.records_)) return fail();
    if (!set_meta("engine_saved_at", engine.current_time())) return fail();

    if (!commit()) return fail();

    log_debug("store", "saved %zu partitions, %zu activity records",
              engine.partitions_.size(), engine.activity_.tracked_entities());
    return true;
}

bool SqliteStore::load(LeaderboardEngine& engine) {
    if (!db_) {
        std::cerr << "[store] Not open\n";
        return false;
    }

    const auto& ec = engine.config_;
    SeasonRegistry seasons(ec.defaults);
    std::unordered_map<PartitionKey, LeaderboardEngine::PartitionState, PartitionKeyHash> partitions;
    ActivityMask activity(ec.inactivity_threshold);
    GlobalRecord records(Aggregation::PerEvent, CATEGORY_COUNT, ec.track_category_records);

    {
        Statement q(db_, "SELECT category, timeframe, is_active, max_entries, update_cooldown, "
                         "season_start, season_duration FROM configs");
        if (!q.ok()) return false;
        while (q.row()) {
            auto key = key_from(q.i64(0), q.i64(1));
            if (!key) return corrupt("configs", "bad key");
            SeasonConfig c;
            c.is_active = q.i64(2) != 0;
            c.max_entries = static_cast<uint32_t>(q.i64(3));
            c.update_cooldown = q.i64(4);
            c.season_start = q.i64(5);
            c.season_duration = q.i64(6);
            seasons.set_config(*key, c);
        }
        if (q.failed()) return false;
    }

    {
        Statement q(db_, "SELECT category, timeframe, capacity FROM partitions");
        if (!q.ok()) return false;
        while (q.row()) {
            auto key = key_from(q.i64(0), q.i64(1));
            if (!key || q.i64(2) < 0) return corrupt("partitions", "bad key or capacity");
            partitions.emplace(*key, LeaderboardEngine::PartitionState(static_cast<size_t>(q.i64(2))));
            seasons.touch(*key);
        }
        if (q.failed()) return false;
    }

    {
        Statement q(db_, "SELECT category, timeframe, entity, score FROM entries "
                         "ORDER BY category, timeframe, position");
        if (!q.ok()) return false;
        while (q.row()) {
            auto key = key_from(q.i64(0), q.i64(1));
            auto it = key ? partitions.find(*key) : partitions.end();
            if (it == partitions.end()) return corrupt("entries", "entry without partition");
            std::string entity = q.text(2);
            if (!it->second.board.restore_append(entity, q.score(3))) {
                return corrupt("entries", key->to_string() + " " + entity);
            }
        }
        if (q.failed()) return false;
    }

    {
        Statement q(db_, "SELECT category, timeframe, entity, last_update FROM cooldowns");
        if (!q.ok()) return false;
        while (q.row()) {
            auto key = key_from(q.i64(0), q.i64(1));
            auto it = key ? partitions.find(*key) : partitions.end();
            if (it == partitions.end()) return corrupt("cooldowns", "stamp without partition");
            it->second.last_update[q.text(2)] = q.i64(3);
        }
        if (q.failed()) return false;
    }

    if (!load_activity(db_, "engine", activity)) return false;
    if (!load_record(db_, "engine", records)) return false;

    engine.seasons_ = std::move(seasons);
    engine.partitions_ = std::move(partitions);
    engine.activity_ = std::move(activity);
    engine.records_ = std::move(records);

    log_debug("store", "loaded %zu partitions, %llu active", engine.partitions_.size(),
              static_cast<unsigned long long>(engine.activity_.total_active()));
    return true;
}

// ═══════════════════════════════════════════════════════════════════
// Streak statistics
// ═══════════════════════════════════════════════════════════════════

bool SqliteStore::save(const StreakStats& stats) {
    if (!db_) {
        std::cerr << "[store] Not open\n";
        return false;
    }
    if (!begin()) return false;

    auto fail = [this] {
        rollback();
        return false;
    };

    if (!exec("DELETE FROM streak_users") || !exec("DELETE FROM streak_current") ||
        !exec("DELETE FROM streak_boards") || !exec("DELETE FROM streak_counts") ||
        !exec("DELETE FROM daily_stats") || !exec("DELETE FROM daily_seen") ||
        !exec("DELETE FROM activity WHERE scope = 'streaks'") ||
        !exec("DELETE FROM records WHERE scope IN ('streaks', 'streak_types')") ||
        !exec("DELETE FROM components WHERE scope IN ('streaks', 'streak_types')")) {
        return fail();
    }

    {
        Statement user(db_, "INSERT INTO streak_users (entity, longest, achievements, xp, badges) "
                            "VALUES (?, ?, ?, ?, ?)");
        Statement cur(db_, "INSERT INTO streak_current (entity, type, streak) VALUES (?, ?, ?)");
        if (!user.ok() || !cur.ok()) return fail();

        for (const auto& [entity, rec] : stats.users_) {
            if (!user.bind(1, entity).bind_score(2, rec.longest_streak)
                    .bind_score(3, rec.achievements).bind_score(4, rec.xp)
                    .bind_score(5, rec.badges).run()) {
                return fail();
            }
            for (size_t t = 0; t < STREAK_TYPE_COUNT; ++t) {
                if (rec.current[t] == 0) continue;
                if (!cur.bind(1, entity).bind(2, static_cast<int64_t>(t))
                        .bind_score(3, rec.current[t]).run()) {
                    return fail();
                }
            }
        }
    }

    {
        Statement board(db_, "INSERT INTO streak_boards (board, position, entity, score) "
                             "VALUES (?, ?, ?, ?)");
        if (!board.ok()) return fail();
        for (size_t t = 0; t < stats.boards_.size(); ++t) {
            if (!save_board(board, static_cast<int64_t>(t), stats.boards_[t])) return fail();
        }
        if (!save_board(board, TOTALS_BOARD, stats.totals_)) return fail();
    }

    {
        Statement counts(db_, "INSERT INTO streak_counts (type, count) VALUES (?, ?)");
        if (!counts.ok()) return fail();
        for (size_t t = 0; t < STREAK_TYPE_COUNT; ++t) {
            if (!counts.bind(1, static_cast<int64_t>(t))
                    .bind_score(2, stats.type_counts_[t]).run()) {
                return fail();
            }
        }
    }

    {
        Statement day(db_, "INSERT INTO daily_stats (day, active_users, total_activities, "
                           "new_activations) VALUES (?, ?, ?, ?)");
        Statement seen(db_, "INSERT INTO daily_seen (day, entity) VALUES (?, ?)");
        if (!day.ok() || !seen.ok()) return fail();

        for (const auto& [index, rec] : stats.daily_.days()) {
            if (!day.bind(1, index).bind_score(2, rec.stats.active_users)
                    .bind_score(3, rec.stats.total_activities)
                    .bind_score(4, rec.stats.new_activations).run()) {
                return fail();
            }
            for (const auto& entity : rec.seen) {
                if (!seen.bind(1, index).bind(2, entity).run()) return fail();
            }
        }
    }

    if (!save_activity(db_, "streaks", stats.activity_)) return fail();
    if (!save_record(db_, "streaks", stats.global_)) return fail();
    if (!save_record(db_, "streak_types", stats.type_leaders_)) return fail();
    if (!set_meta("streak_total_updates", static_cast<int64_t>(stats.total_updates_))) return fail();
    if (!set_meta("streaks_saved_at", stats.clock_())) return fail();

    if (!commit()) return fail();

    log_debug("store", "saved streak stats for %zu users", stats.users_.size());
    return true;
}

bool SqliteStore::load(StreakStats& stats) {
    if (!db_) {
        std::cerr << "[store] Not open\n";
        return false;
    }

    const auto& sc = stats.config_;
    ActivityMask activity(sc.inactivity_threshold);
    GlobalRecord global(sc.aggregation, STREAK_TYPE_COUNT, false);
    GlobalRecord type_leaders(Aggregation::PerEvent, STREAK_TYPE_COUNT, true);
    std::vector<ScorePartition> boards;
    for (size_t i = 0; i < STREAK_TYPE_COUNT; ++i) boards.emplace_back(sc.board_capacity);
    ScorePartition totals(sc.totals_capacity);
    std::array<uint64_t, STREAK_TYPE_COUNT> counts{};
    std::unordered_map<EntityId, StreakStats::UserRecord> users;
    DailyActivityLog daily;

    {
        Statement q(db_, "SELECT entity, longest, achievements, xp, badges FROM streak_users");
        if (!q.ok()) return false;
        while (q.row()) {
            auto& rec = users[q.text(0)];
            rec.longest_streak = q.score(1);
            rec.achievements = q.score(2);
            rec.xp = q.score(3);
            rec.badges = q.score(4);
        }
        if (q.failed()) return false;
    }

    {
        Statement q(db_, "SELECT entity, type, streak FROM streak_current");
        if (!q.ok()) return false;
        while (q.row()) {
            int64_t t = q.i64(1);
            if (t < 0 || t >= static_cast<int64_t>(STREAK_TYPE_COUNT)) {
                return corrupt("streak_current", "bad type " + std::to_string(t));
            }
            users[q.text(0)].current[static_cast<size_t>(t)] = q.score(2);
        }
        if (q.failed()) return false;
    }

    {
        Statement q(db_, "SELECT board, entity, score FROM streak_boards ORDER BY board, position");
        if (!q.ok()) return false;
        while (q.row()) {
            int64_t b = q.i64(0);
            ScorePartition* target = nullptr;
            if (b == TOTALS_BOARD) {
                target = &totals;
            } else if (b >= 0 && b < TOTALS_BOARD) {
                target = &boards[static_cast<size_t>(b)];
            }
            std::string entity = q.text(1);
            if (!target || !target->restore_append(entity, q.score(2))) {
                return corrupt("streak_boards", "board " + std::to_string(b) + " " + entity);
            }
        }
        if (q.failed()) return false;
    }

    {
        Statement q(db_, "SELECT type, count FROM streak_counts");
        if (!q.ok()) return false;
        while (q.row()) {
            int64_t t = q.i64(0);
            if (t < 0 || t >= static_cast<int64_t>(STREAK_TYPE_COUNT)) {
                return corrupt("streak_counts", "bad type " + std::to_string(t));
            }
            counts[static_cast<size_t>(t)] = q.score(1);
        }
        if (q.failed()) return false;
    }

    {
        Statement q(db_, "SELECT day, active_users, total_activities, new_activations "
                         "FROM daily_stats");
        if (!q.ok()) return false;
        while (q.row()) {
            DailyActivityLog::DayRecord rec;
            rec.stats.active_users = q.score(1);
            rec.stats.total_activities = q.score(2);
            rec.stats.new_activations = q.score(3);
            daily.restore(q.i64(0), std::move(rec));
        }
        if (q.failed()) return false;

        Statement s(db_, "SELECT day, entity FROM daily_seen");
        if (!s.ok()) return false;
        std::map<int64_t, std::vector<EntityId>> seen;
        while (s.row()) seen[s.i64(0)].push_back(s.text(1));
        if (s.failed()) return false;

        for (auto& [index, entities] : seen) {
            auto it = daily.days().find(index);
            if (it == daily.days().end()) return corrupt("daily_seen", "day without stats");
            DailyActivityLog::DayRecord rec = it->second;
            rec.seen.insert(entities.begin(), entities.end());
            daily.restore(index, std::move(rec));
        }
    }

    if (!load_activity(db_, "streaks", activity)) return false;
    if (!load_record(db_, "streaks", global)) return false;
    if (!load_record(db_, "streak_types", type_leaders)) return false;

    stats.activity_ = std::move(activity);
    stats.global_ = std::move(global);
    stats.type_leaders_ = std::move(type_leaders);
    stats.boards_ = std::move(boards);
    stats.totals_ = std::move(totals);
    stats.type_counts_ = counts;
    stats.total_updates_ = static_cast<uint64_t>(meta("streak_total_updates", 0));
    stats.users_ = std::move(users);
    stats.daily_ = std::move(daily);

    log_debug("store", "loaded streak stats for %zu users", stats.users_.size());
    return true;
}

bool SqliteStore::persist(LeaderboardEngine& engine, StreakStats& stats) {
    if (save(engine) && save(stats)) return true;

    std::cerr << "[store] Save failed, reloading last committed state from " << path_ << "\n";
    if (!load(engine) || !load(stats)) {
        std::cerr << "[store] Reload failed, memory no longer matches " << path_ << "\n";
    }
    return false;
}

} // namespace podium
