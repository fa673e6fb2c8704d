#pragma once
// Activity Mask: per-entity set of active categories + global active count
//
// Each entity carries a bitmask with one bit per category. The global
// counter tracks how many entities have a nonzero mask and moves exactly
// once per 0 <-> nonzero transition, never on a flip that stays on the
// same side of that boundary.
//
// Inactivity cleanup zeroes masks of entities whose last activity is older
// than the configured threshold. Unknown or already-inactive entities are
// left alone.

#include "types.hpp"
#include <unordered_map>
#include <unordered_set>
#include <map>
#include <vector>

namespace podium {

using CategoryMask = uint32_t;

constexpr size_t MAX_ACTIVITY_BITS = 32;
constexpr int64_t DEFAULT_INACTIVITY_THRESHOLD = 7 * SECONDS_PER_DAY;

struct ActivityRecord {
    CategoryMask mask = 0;
    Timestamp last_activity = 0;
};

// Result of a single bit flip
struct ActivityTransition {
    Error error = Error::None;      // InvalidCategory for a bit outside the mask
    CategoryMask before = 0;
    CategoryMask after = 0;
    bool became_active = false;     // 0 -> nonzero
    bool became_inactive = false;   // nonzero -> 0

    bool ok() const { return error == Error::None; }
    bool mask_changed() const { return before != after; }
    bool count_changed() const { return became_active || became_inactive; }
};

// An entity zeroed by cleanup
struct CleanedEntity {
    EntityId entity;
    CategoryMask previous_mask = 0;
};

// Result of an inactivity sweep
struct CleanupResult {
    Error error = Error::None;
    std::vector<CleanedEntity> cleaned;

    bool ok() const { return error == Error::None; }
};

class ActivityMask {
public:
    explicit ActivityMask(int64_t inactivity_threshold = DEFAULT_INACTIVITY_THRESHOLD)
        : inactivity_threshold_(inactivity_threshold) {}

    static bool valid_bit(size_t bit) { return bit < MAX_ACTIVITY_BITS; }

    // Out-of-range bits are refused with no state change
    ActivityTransition set_category_active(const EntityId& entity, size_t bit,
                                           bool active, Timestamp now) {
        ActivityTransition t;
        if (!valid_bit(bit)) {
            t.error = Error::InvalidCategory;
            return t;
        }
        CategoryMask flag = CategoryMask(1) << bit;

        auto it = records_.find(entity);
        if (it == records_.end()) {
            // Clearing a bit on an unseen entity creates nothing
            if (!active) return t;
            it = records_.emplace(entity, ActivityRecord{}).first;
        }

        auto& rec = it->second;
        t.before = rec.mask;
        rec.mask = active ? (rec.mask | flag) : (rec.mask & ~flag);
        t.after = rec.mask;

        if (active) {
            rec.last_activity = now;
        }

        if (t.before == 0 && t.after != 0) {
            ++total_active_;
            t.became_active = true;
        } else if (t.before != 0 && t.after == 0) {
            --total_active_;
            t.became_inactive = true;
        }
        return t;
    }

    // Zero the masks of entities idle for longer than the threshold
    std::vector<CleanedEntity> cleanup(const std::vector<EntityId>& entities, Timestamp now) {
        std::vector<CleanedEntity> cleaned;
        for (const auto& entity : entities) {
            auto it = records_.find(entity);
            if (it == records_.end()) continue;

            auto& rec = it->second;
            if (rec.mask == 0) continue;
            if (now - rec.last_activity <= inactivity_threshold_) continue;

            cleaned.push_back({entity, rec.mask});
            rec.mask = 0;
            --total_active_;
        }
        return cleaned;
    }

    bool is_active(const EntityId& entity) const {
        return active_categories(entity) != 0;
    }

    CategoryMask active_categories(const EntityId& entity) const {
        auto it = records_.find(entity);
        return it != records_.end() ? it->second.mask : 0;
    }

    Timestamp last_activity(const EntityId& entity) const {
        auto it = records_.find(entity);
        return it != records_.end() ? it->second.last_activity : 0;
    }

    uint64_t total_active() const { return total_active_; }
    size_t tracked_entities() const { return records_.size(); }

    // Bulk load; the counter is recomputed so it cannot drift from the masks
    void restore(const EntityId& entity, const ActivityRecord& rec) {
        auto& slot = records_[entity];
        if (slot.mask != 0) --total_active_;
        slot = rec;
        if (slot.mask != 0) ++total_active_;
    }

    // Counter agrees with the masks
    bool check_invariants() const {
        uint64_t count = 0;
        for (const auto& [_, rec] : records_) {
            if (rec.mask != 0) ++count;
        }
        return count == total_active_;
    }

    const std::unordered_map<EntityId, ActivityRecord>& records() const { return records_; }

    void clear() {
        records_.clear();
        total_active_ = 0;
    }

private:
    int64_t inactivity_threshold_;
    uint64_t total_active_ = 0;
    std::unordered_map<EntityId, ActivityRecord> records_;
};

// Per-day activity figures
struct DailyStats {
    uint64_t active_users = 0;       // distinct entities with activity that day
    uint64_t total_activities = 0;   // every recorded update
    uint64_t new_activations = 0;    // 0 -> nonzero mask transitions
};

// Daily activity log keyed by day index (Unix seconds / 86400)
class DailyActivityLog {
public:
    struct DayRecord {
        DailyStats stats;
        std::unordered_set<EntityId> seen;
    };

    void record(const EntityId& entity, Timestamp now, bool became_active) {
        auto& day = days_[day_index(now)];
        day.stats.total_activities++;
        if (day.seen.insert(entity).second) {
            day.stats.active_users++;
        }
        if (became_active) {
            day.stats.new_activations++;
        }
    }

    DailyStats get(int64_t day) const {
        auto it = days_.find(day);
        return it != days_.end() ? it->second.stats : DailyStats{};
    }

    // Drop days strictly before `day`; returns how many were dropped
    size_t prune(int64_t day) {
        size_t removed = 0;
        for (auto it = days_.begin(); it != days_.end() && it->first < day; ) {
            it = days_.erase(it);
            removed++;
        }
        return removed;
    }

    size_t day_count() const { return days_.size(); }

    const std::map<int64_t, DayRecord>& days() const { return days_; }

    void restore(int64_t day, DayRecord rec) { days_[day] = std::move(rec); }

    void clear() { days_.clear(); }

private:
    std::map<int64_t, DayRecord> days_;
};

} // namespace podium
