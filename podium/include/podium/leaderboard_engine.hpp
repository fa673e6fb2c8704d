#pragma once
// Leaderboard Engine: (category, timeframe) partitions behind one API
//
// Every mutating call runs the same pipeline:
//   1. access gate (injected CapabilityCheck)
//   2. boundary validation (entity, category, timeframe)
//   3. season gate: active flag, season window, per-entity cooldown
//   4. admission check against the partition
//   5. commit: partition upsert, activity bit, global record
//   6. publish buffered events
//
// Steps 1-4 never mutate. Once step 5 starts the call cannot fail, so a
// call either completes fully or leaves no trace. Subscribers run in step 6
// and may call back into the engine.
//
// The activity bit for category c is set after an update iff the entity
// is present in at least one timeframe partition of c. Evicted entities are
// re-evaluated the same way.

#include "types.hpp"
#include "access.hpp"
#include "activity_mask.hpp"
#include "events.hpp"
#include "global_record.hpp"
#include "score_partition.hpp"
#include "season_config.hpp"
#include <functional>
#include <optional>
#include <unordered_map>
#include <vector>

namespace podium {

class SqliteStore;

struct EngineConfig {
    SeasonConfig defaults;                                  // for keys never configured
    int64_t inactivity_threshold = DEFAULT_INACTIVITY_THRESHOLD;
    bool track_category_records = true;
};

struct UpdateResult {
    Error error = Error::None;
    Admission admission = Admission::Ignored;
    Score score = 0;                        // score stored after the call
    std::optional<uint32_t> rank;           // nullopt when not on the board
    std::optional<ScoreEntry> evicted;

    bool ok() const { return error == Error::None; }

    static UpdateResult failure(Error e) {
        UpdateResult r;
        r.error = e;
        return r;
    }
};

struct BatchResult {
    Error error = Error::None;
    size_t failed_index = 0;                // offending element when error != None
    std::vector<UpdateResult> results;      // one per element on success

    bool ok() const { return error == Error::None; }
};

struct UserScore {
    Score score = 0;
    std::optional<uint32_t> rank;
};

// Parallel lists, as consumed by list views
struct TopEntities {
    std::vector<EntityId> entities;
    std::vector<Score> scores;
};

class LeaderboardEngine {
public:
    explicit LeaderboardEngine(EngineConfig config = {}, CapabilityCheck gate = allow_all());

    // ═══════════════════════════════════════════════════════════════════
    // Score updates
    // ═══════════════════════════════════════════════════════════════════

    UpdateResult update_score(const EntityId& entity, Category category,
                              Timeframe timeframe, Score score);

    // update_score(entity, ..., current + delta), saturating
    UpdateResult increment_score(const EntityId& entity, Category category,
                                 Timeframe timeframe, Score delta);

    // All elements are admitted or nothing changes
    BatchResult batch_update_scores(const std::vector<EntityId>& entities,
                                    Category category, Timeframe timeframe,
                                    const std::vector<Score>& scores);

    // ═══════════════════════════════════════════════════════════════════
    // Reads (never gated)
    // ═══════════════════════════════════════════════════════════════════

    Score get_score(const EntityId& entity, Category category, Timeframe timeframe) const;
    std::optional<uint32_t> get_rank(const EntityId& entity, Category category,
                                     Timeframe timeframe) const;
    UserScore get_user_score(const EntityId& entity, Category category,
                             Timeframe timeframe) const;

    std::vector<RankedEntry> get_leaderboard(Category category, Timeframe timeframe,
                                             size_t limit) const;
    std::vector<RankedEntry> get_page(Category category, Timeframe timeframe,
                                      size_t offset, size_t count) const;
    TopEntities get_top_entities(Category category, Timeframe timeframe, size_t limit) const;

    size_t entry_count(Category category, Timeframe timeframe) const;

    const SeasonConfig& config(Category category, Timeframe timeframe) const;
    SeasonState season_state(Category category, Timeframe timeframe) const;

    const ActivityMask& activity() const { return activity_; }
    const GlobalRecord& records() const { return records_; }

    // nullptr until the partition is first written
    const ScorePartition* partition(Category category, Timeframe timeframe) const;
    std::vector<PartitionKey> partition_keys() const;

    // ═══════════════════════════════════════════════════════════════════
    // Administration
    // ═══════════════════════════════════════════════════════════════════

    Error reset_leaderboard(Category category, Timeframe timeframe);
    Error set_config(Category category, Timeframe timeframe, const SeasonConfig& config);
    Error start_new_season(Category category, int64_t duration,
                           Timeframe timeframe = Timeframe::Daily);
    CleanupResult cleanup_inactive(const std::vector<EntityId>& entities);

    // ═══════════════════════════════════════════════════════════════════
    // Wiring
    // ═══════════════════════════════════════════════════════════════════

    EventBus& events() { return bus_; }
    void set_gate(CapabilityCheck gate) { gate_ = std::move(gate); }
    void set_clock(Clock clock) { clock_ = std::move(clock); }
    Timestamp current_time() const { return clock_(); }

    // Ordering and index bijection for every partition, plus the active counter
    bool check_invariants() const;

private:
    friend class SqliteStore;

    struct PartitionState {
        ScorePartition board;
        std::unordered_map<EntityId, Timestamp> last_update;

        explicit PartitionState(size_t capacity) : board(capacity) {}
    };

    Error validate(const EntityId& entity, Category category, Timeframe timeframe) const;
    Error check_write(const EntityId& entity, const PartitionKey& key, Timestamp now) const;
    Error check_admission(const EntityId& entity, const PartitionKey& key, Score score) const;

    PartitionState& state_for(const PartitionKey& key);
    const PartitionState* find_state(const PartitionKey& key) const;

    // Commit one already-validated update
    UpdateResult apply(const EntityId& entity, const PartitionKey& key, Score score,
                       Timestamp now, PendingEvents& pending);

    void evict(const ScoreEntry& entry, const PartitionKey& key, Timestamp now,
               PendingEvents& pending);
    void refresh_activity(const EntityId& entity, Category category, Timestamp now,
                          PendingEvents& pending);
    bool present_in_category(const EntityId& entity, Category category) const;

    EngineConfig config_;
    CapabilityCheck gate_;
    Clock clock_;
    SeasonRegistry seasons_;
    std::unordered_map<PartitionKey, PartitionState, PartitionKeyHash> partitions_;
    ActivityMask activity_;
    GlobalRecord records_;
    EventBus bus_;
};

} // namespace podium
