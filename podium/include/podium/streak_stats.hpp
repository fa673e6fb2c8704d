#pragma once
// Streak Stats: aggregate statistics over per-type user streaks
//
// Built from the same primitives as the leaderboard engine:
//   - ActivityMask    one bit per StreakType, set while the streak is > 0
//   - ScorePartition  one bounded board per StreakType plus a totals board
//   - GlobalRecord    global streak leader (summed streaks or reported totals)
//                     and the per-type leaders (raw streak values)
//   - DailyActivityLog  active users / activities / new activations per day
//
// A streak that misses its per-type board is still recorded everywhere
// else; the board refusal is reported in the result, not as an error.

#include "types.hpp"
#include "access.hpp"
#include "activity_mask.hpp"
#include "events.hpp"
#include "global_record.hpp"
#include "score_partition.hpp"
#include <array>
#include <functional>
#include <optional>
#include <unordered_map>
#include <vector>

namespace podium {

class SqliteStore;

struct StreakStatsConfig {
    size_t board_capacity = 100;        // per StreakType
    size_t totals_capacity = 10;        // top users by summed streaks
    Aggregation aggregation = Aggregation::SumOfComponents;
    int64_t inactivity_threshold = DEFAULT_INACTIVITY_THRESHOLD;
};

struct StreakUpdateResult {
    Error error = Error::None;
    Admission admission = Admission::Ignored;   // per-type board outcome
    std::optional<uint32_t> rank;               // per-type board rank
    Score total = 0;                            // entity's summed streaks afterwards
    bool new_global_leader = false;

    bool ok() const { return error == Error::None; }
};

struct GlobalStreakStats {
    uint64_t total_active = 0;          // entities with any streak running
    Score longest_global_streak = 0;
    EntityId streak_leader;
    uint64_t total_updates = 0;         // nonzero streak updates, all types
};

struct UserStreakStats {
    CategoryMask active_types = 0;
    Timestamp last_activity = 0;
    std::array<Score, STREAK_TYPE_COUNT> current{};
    Score total_streak = 0;
    Score longest_streak = 0;           // best single-type streak ever reported
    uint64_t total_achievements = 0;
    Score total_xp = 0;
    Score total_badges = 0;
};

class StreakStats {
public:
    explicit StreakStats(StreakStatsConfig config = {}, CapabilityCheck gate = allow_all());

    // reported_total is the comparison value under Aggregation::PerEvent
    // (falls back to current_streak when absent); ignored otherwise.
    StreakUpdateResult update_activity(const EntityId& entity, StreakType type,
                                       Score current_streak,
                                       std::optional<Score> reported_total = std::nullopt);

    Error record_achievement(const EntityId& entity, Score xp, Score badges);

    CleanupResult cleanup_inactive(const std::vector<EntityId>& entities);

    // Drop daily figures for days before `before_day`
    Error prune_daily_stats(int64_t before_day);

    // Records, counts and boards restart; per-user data is kept
    Error reset_global_stats();

    // Reads
    GlobalStreakStats global_stats() const;
    UserStreakStats user_stats(const EntityId& entity) const;
    std::vector<RankedEntry> leaderboard(StreakType type, size_t limit) const;
    std::vector<RankedEntry> totals_leaderboard(size_t limit) const;
    std::vector<RecordHolder> type_leaders() const;
    std::optional<uint32_t> rank(const EntityId& entity, StreakType type) const;
    uint64_t type_update_count(StreakType type) const;
    DailyStats daily_stats(int64_t day) const { return daily_.get(day); }
    DailyStats today() const { return daily_.get(day_index(clock_())); }
    size_t tracked_days() const { return daily_.day_count(); }
    size_t tracked_users() const { return users_.size(); }

    bool is_active(const EntityId& entity) const { return activity_.is_active(entity); }
    CategoryMask active_types(const EntityId& entity) const {
        return activity_.active_categories(entity);
    }

    const ActivityMask& activity() const { return activity_; }
    const StreakStatsConfig& config() const { return config_; }

    EventBus& events() { return bus_; }
    void set_gate(CapabilityCheck gate) { gate_ = std::move(gate); }
    void set_clock(Clock clock) { clock_ = std::move(clock); }

    bool check_invariants() const;

private:
    friend class SqliteStore;

    struct UserRecord {
        std::array<Score, STREAK_TYPE_COUNT> current{};
        Score longest_streak = 0;
        uint64_t achievements = 0;
        Score xp = 0;
        Score badges = 0;
    };

    static Score sum(const std::array<Score, STREAK_TYPE_COUNT>& streaks);

    StreakStatsConfig config_;
    CapabilityCheck gate_;
    Clock clock_;
    ActivityMask activity_;
    GlobalRecord global_;          // aggregate leader, no per-type slots
    GlobalRecord type_leaders_;    // per-type leaders on raw streaks
    std::vector<ScorePartition> boards_;
    ScorePartition totals_;
    std::array<uint64_t, STREAK_TYPE_COUNT> type_counts_{};
    uint64_t total_updates_ = 0;
    std::unordered_map<EntityId, UserRecord> users_;
    DailyActivityLog daily_;
    EventBus bus_;
};

} // namespace podium
