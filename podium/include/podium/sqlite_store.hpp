#pragma once
// SQLite Store: persistent keyed storage for engine and streak state
//
// Layout (one database file, schema version in PRAGMA user_version):
//   partitions   (category, timeframe) -> capacity
//   entries      (category, timeframe, position) -> entity, score
//   cooldowns    (category, timeframe, entity) -> last update
//   configs      (category, timeframe) -> SeasonConfig
//   activity     (scope, entity) -> mask, last activity
//   records      (scope, slot) -> best value, holder      slot -1 = aggregate
//   components   (scope, entity, slot) -> value
//   streak_users, streak_boards, streak_counts, daily_stats, daily_seen
//
// Every save runs in one transaction and replaces the scope's rows
// wholesale. Loads build the new state off to the side and only swap it in
// when every row was accepted, so a corrupt file leaves memory untouched.
// Failures return false with a "[store]" line on stderr.

#include "leaderboard_engine.hpp"
#include "streak_stats.hpp"
#include <string>

struct sqlite3;

namespace podium {

class SqliteStore {
public:
    explicit SqliteStore(std::string path);
    ~SqliteStore();

    SqliteStore(const SqliteStore&) = delete;
    SqliteStore& operator=(const SqliteStore&) = delete;

    // Opens (creating if needed) and brings the schema up to date
    bool open();
    void close();
    bool is_open() const { return db_ != nullptr; }

    const std::string& path() const { return path_; }
    int schema_version() const;

    bool save(const LeaderboardEngine& engine);
    bool load(LeaderboardEngine& engine);

    bool save(const StreakStats& stats);
    bool load(StreakStats& stats);

    // Saves both scopes. On failure the last committed state is loaded back
    // so memory matches the file, and false is returned.
    bool persist(LeaderboardEngine& engine, StreakStats& stats);

    // True once a save has written the scope at least once
    bool has_engine_state() const;
    bool has_streak_state() const;

private:
    bool exec(const char* sql);
    bool create_schema();
    bool begin();
    bool commit();
    void rollback();
    int64_t meta(const char* key, int64_t fallback) const;
    bool set_meta(const char* key, int64_t value);

    std::string path_;
    sqlite3* db_ = nullptr;
};

} // namespace podium
