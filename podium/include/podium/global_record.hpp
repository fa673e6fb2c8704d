#pragma once
// Global Record: monotonic best-value-ever tracker
//
// One (best, holder) pair across all categories, plus an optional pair per
// category. A candidate replaces the incumbent only when strictly greater,
// so the first entity to reach a value keeps the record at that value.
//
// Aggregation strategy:
//   PerEvent        - the observed value is the candidate
//   SumOfComponents - the observed value replaces one named component of the
//                     entity; the entity's (saturated) sum is the candidate

#include "types.hpp"
#include <optional>
#include <unordered_map>
#include <vector>

namespace podium {

enum class Aggregation : uint8_t {
    PerEvent = 0,
    SumOfComponents = 1,
};

inline std::string aggregation_name(Aggregation a) {
    switch (a) {
        case Aggregation::PerEvent: return "per_event";
        case Aggregation::SumOfComponents: return "sum_of_components";
        default: return "unknown";
    }
}

struct RecordHolder {
    Score value = 0;
    EntityId holder;   // empty until someone beats zero

    bool held() const { return !holder.empty(); }
};

// Which records an observation replaced
struct RecordChange {
    bool aggregate = false;
    bool category = false;
    Score candidate = 0;     // value compared against the aggregate best

    bool any() const { return aggregate || category; }
};

class GlobalRecord {
public:
    GlobalRecord(Aggregation strategy, size_t categories, bool per_category = true)
        : strategy_(strategy),
          categories_(categories),
          per_category_(per_category),
          category_best_(per_category ? categories : 0) {}

    // Caller validates `category` < categories()
    RecordChange observe(const EntityId& entity, size_t category, Score value) {
        RecordChange change;

        if (strategy_ == Aggregation::SumOfComponents) {
            auto& comps = components_[entity];
            if (comps.size() < categories_) comps.resize(categories_, 0);
            comps[category] = value;
            change.candidate = sum(comps);
        } else {
            change.candidate = value;
        }

        if (change.candidate > best_.value) {
            best_.value = change.candidate;
            best_.holder = entity;
            change.aggregate = true;
        }

        if (per_category_) {
            auto& slot = category_best_[category];
            if (value > slot.value) {
                slot.value = value;
                slot.holder = entity;
                change.category = true;
            }
        }
        return change;
    }

    // Entity's running total (SumOfComponents); 0 otherwise or when unseen
    Score total(const EntityId& entity) const {
        auto it = components_.find(entity);
        return it != components_.end() ? sum(it->second) : 0;
    }

    const RecordHolder& best() const { return best_; }

    std::optional<RecordHolder> category_best(size_t category) const {
        if (!per_category_ || category >= category_best_.size()) return std::nullopt;
        return category_best_[category];
    }

    const std::vector<RecordHolder>& category_bests() const { return category_best_; }

    // Start a new record lifetime. Per-entity components are kept.
    void reset() {
        best_ = RecordHolder{};
        for (auto& slot : category_best_) slot = RecordHolder{};
    }

    // Restore persisted state
    void restore_best(const RecordHolder& best) { best_ = best; }

    bool restore_category_best(size_t category, const RecordHolder& slot) {
        if (!per_category_ || category >= category_best_.size()) return false;
        category_best_[category] = slot;
        return true;
    }

    void restore_components(const EntityId& entity, std::vector<Score> comps) {
        comps.resize(categories_, 0);
        components_[entity] = std::move(comps);
    }

    const std::unordered_map<EntityId, std::vector<Score>>& components() const {
        return components_;
    }

    size_t categories() const { return categories_; }

private:
    static Score sum(const std::vector<Score>& comps) {
        Score total = 0;
        for (Score c : comps) total = saturating_add(total, c);
        return total;
    }

    Aggregation strategy_;
    size_t categories_;
    bool per_category_;
    RecordHolder best_;
    std::vector<RecordHolder> category_best_;
    std::unordered_map<EntityId, std::vector<Score>> components_;
};

} // namespace podium
