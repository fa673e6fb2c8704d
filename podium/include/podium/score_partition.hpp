#pragma once
// Score Partition: bounded, rank-ordered registry for one (category, timeframe)
//
// Entries are kept in a flat vector sorted by descending score. Equal
// scores keep their relative (insertion) order: an entry only moves past
// a neighbour it strictly beats. The index maps entity -> position and is
// rewritten only over the range a mutation shifted.
//
// Admission when full: a newcomer replaces the lowest entry only if its
// score is strictly greater. Otherwise the upsert is refused with
// Admission::NotAdmitted and nothing changes.

#include "types.hpp"
#include <algorithm>
#include <optional>
#include <unordered_map>
#include <vector>

namespace podium {

constexpr size_t DEFAULT_PARTITION_CAPACITY = 1000;

struct ScoreEntry {
    EntityId entity;
    Score score = 0;
};

// Entry with its 1-indexed rank, as returned by list queries
struct RankedEntry {
    EntityId entity;
    Score score = 0;
    uint32_t rank = 0;
};

// What an upsert did to the partition
enum class Admission : uint8_t {
    Inserted,     // new entry, room was available
    Replaced,     // new entry, lowest entry evicted to make room
    Moved,        // existing entry repositioned (or rescored in place)
    Removed,      // score dropped to zero, entry deleted
    Ignored,      // zero score for an absent entity
    NotAdmitted,  // full, and score not above the lowest entry
};

inline std::string admission_name(Admission a) {
    switch (a) {
        case Admission::Inserted: return "inserted";
        case Admission::Replaced: return "replaced";
        case Admission::Moved: return "moved";
        case Admission::Removed: return "removed";
        case Admission::Ignored: return "ignored";
        case Admission::NotAdmitted: return "not_admitted";
        default: return "unknown";
    }
}

struct UpsertOutcome {
    Admission admission = Admission::Ignored;
    std::optional<uint32_t> rank;           // 1-indexed, nullopt when not present afterwards
    std::optional<uint32_t> previous_rank;
    std::optional<ScoreEntry> evicted;

    bool changed() const {
        return admission != Admission::Ignored && admission != Admission::NotAdmitted;
    }
};

class ScorePartition {
public:
    explicit ScorePartition(size_t capacity = DEFAULT_PARTITION_CAPACITY)
        : capacity_(capacity) {
        entries_.reserve(std::min(capacity_, size_t(1024)));
    }

    UpsertOutcome upsert(const EntityId& entity, Score new_score) {
        UpsertOutcome out;

        auto it = index_.find(entity);
        if (it != index_.end()) {
            size_t old_pos = it->second;
            out.previous_rank = static_cast<uint32_t>(old_pos + 1);

            if (new_score == 0) {
                erase_at(old_pos);
                out.admission = Admission::Removed;
                return out;
            }

            size_t new_pos = reposition(old_pos, new_score);
            out.admission = Admission::Moved;
            out.rank = static_cast<uint32_t>(new_pos + 1);
            return out;
        }

        if (new_score == 0) {
            out.admission = Admission::Ignored;
            return out;
        }

        if (entries_.size() >= capacity_) {
            if (entries_.empty() || new_score <= entries_.back().score) {
                out.admission = Admission::NotAdmitted;
                return out;
            }
            out.evicted = entries_.back();
            index_.erase(entries_.back().entity);
            entries_.pop_back();
            out.admission = Admission::Replaced;
        } else {
            out.admission = Admission::Inserted;
        }

        // After all entries with score >= new_score (ties keep arrival order)
        size_t pos = lower_position(0, entries_.size(), new_score);
        entries_.insert(entries_.begin() + static_cast<std::ptrdiff_t>(pos),
                        ScoreEntry{entity, new_score});
        reindex(pos, entries_.size());
        out.rank = static_cast<uint32_t>(pos + 1);
        return out;
    }

    // Would upsert(entity, score) be admitted? Pure, no state change.
    bool admits(const EntityId& entity, Score score) const {
        if (index_.count(entity) || score == 0) return true;
        if (entries_.size() < capacity_) return true;
        return !entries_.empty() && score > entries_.back().score;
    }

    // No-op when absent
    bool remove(const EntityId& entity) {
        auto it = index_.find(entity);
        if (it == index_.end()) return false;
        erase_at(it->second);
        return true;
    }

    std::optional<uint32_t> rank(const EntityId& entity) const {
        auto it = index_.find(entity);
        if (it == index_.end()) return std::nullopt;
        return static_cast<uint32_t>(it->second + 1);
    }

    std::optional<Score> score(const EntityId& entity) const {
        auto it = index_.find(entity);
        if (it == index_.end()) return std::nullopt;
        return entries_[it->second].score;
    }

    bool contains(const EntityId& entity) const {
        return index_.count(entity) > 0;
    }

    // Up to count entries starting at offset; empty past the end
    std::vector<ScoreEntry> page(size_t offset, size_t count) const {
        std::vector<ScoreEntry> result;
        if (offset >= entries_.size() || count == 0) return result;
        size_t end = offset + std::min(count, entries_.size() - offset);
        result.assign(entries_.begin() + static_cast<std::ptrdiff_t>(offset),
                      entries_.begin() + static_cast<std::ptrdiff_t>(end));
        return result;
    }

    std::vector<RankedEntry> ranked_page(size_t offset, size_t count) const {
        std::vector<RankedEntry> result;
        if (offset >= entries_.size() || count == 0) return result;
        size_t end = offset + std::min(count, entries_.size() - offset);
        result.reserve(end - offset);
        for (size_t i = offset; i < end; ++i) {
            result.push_back({entries_[i].entity, entries_[i].score, static_cast<uint32_t>(i + 1)});
        }
        return result;
    }

    const ScoreEntry* leader() const {
        return entries_.empty() ? nullptr : &entries_.front();
    }

    // Shrinking evicts from the bottom; returns the evicted entries
    std::vector<ScoreEntry> set_capacity(size_t capacity) {
        std::vector<ScoreEntry> evicted;
        capacity_ = capacity;
        while (entries_.size() > capacity_) {
            evicted.push_back(entries_.back());
            index_.erase(entries_.back().entity);
            entries_.pop_back();
        }
        return evicted;
    }

    void clear() {
        entries_.clear();
        index_.clear();
    }

    // Append in stored order, used when loading persisted state.
    // Refuses anything that would break ordering, capacity or uniqueness.
    bool restore_append(const EntityId& entity, Score score) {
        if (entity.empty() || score == 0) return false;
        if (entries_.size() >= capacity_ || index_.count(entity)) return false;
        if (!entries_.empty() && entries_.back().score < score) return false;
        index_[entity] = entries_.size();
        entries_.push_back(ScoreEntry{entity, score});
        return true;
    }

    // Ordering, capacity and index bijection
    bool check_invariants() const {
        if (entries_.size() > capacity_) return false;
        if (index_.size() != entries_.size()) return false;
        for (size_t i = 0; i < entries_.size(); ++i) {
            if (i > 0 && entries_[i - 1].score < entries_[i].score) return false;
            auto it = index_.find(entries_[i].entity);
            if (it == index_.end() || it->second != i) return false;
        }
        return true;
    }

    const std::vector<ScoreEntry>& entries() const { return entries_; }
    size_t size() const { return entries_.size(); }
    size_t capacity() const { return capacity_; }
    bool empty() const { return entries_.empty(); }
    bool full() const { return entries_.size() >= capacity_; }

private:
    // First position in [first, last) whose score is strictly below s
    size_t lower_position(size_t first, size_t last, Score s) const {
        auto begin = entries_.begin() + static_cast<std::ptrdiff_t>(first);
        auto end = entries_.begin() + static_cast<std::ptrdiff_t>(last);
        auto it = std::partition_point(begin, end,
            [s](const ScoreEntry& e) { return e.score >= s; });
        return static_cast<size_t>(it - entries_.begin());
    }

    // First position in [first, last) whose score is at or below s
    size_t upper_position(size_t first, size_t last, Score s) const {
        auto begin = entries_.begin() + static_cast<std::ptrdiff_t>(first);
        auto end = entries_.begin() + static_cast<std::ptrdiff_t>(last);
        auto it = std::partition_point(begin, end,
            [s](const ScoreEntry& e) { return e.score > s; });
        return static_cast<size_t>(it - entries_.begin());
    }

    size_t reposition(size_t old_pos, Score new_score) {
        ScoreEntry entry = entries_[old_pos];
        Score old_score = entry.score;
        entry.score = new_score;

        if (new_score == old_score) {
            entries_[old_pos] = entry;
            return old_pos;
        }

        entries_.erase(entries_.begin() + static_cast<std::ptrdiff_t>(old_pos));

        size_t new_pos;
        if (new_score > old_score) {
            // Climb past strictly lower entries above the old slot
            new_pos = lower_position(0, old_pos, new_score);
        } else {
            // Sink past strictly higher entries below the old slot
            new_pos = upper_position(old_pos, entries_.size(), new_score);
        }

        entries_.insert(entries_.begin() + static_cast<std::ptrdiff_t>(new_pos), entry);
        reindex(std::min(old_pos, new_pos), std::max(old_pos, new_pos) + 1);
        return new_pos;
    }

    void erase_at(size_t pos) {
        index_.erase(entries_[pos].entity);
        entries_.erase(entries_.begin() + static_cast<std::ptrdiff_t>(pos));
        reindex(pos, entries_.size());
    }

    void reindex(size_t from, size_t to) {
        to = std::min(to, entries_.size());
        for (size_t i = from; i < to; ++i) {
            index_[entries_[i].entity] = i;
        }
    }

    size_t capacity_;
    std::vector<ScoreEntry> entries_;
    std::unordered_map<EntityId, size_t> index_;
};

} // namespace podium
