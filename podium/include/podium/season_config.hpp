#pragma once
// Season Config: per-partition settings and the write gate they imply
//
// Every (category, timeframe) key has a config; keys never written read as
// the defaults (Uninitialized). Configs change only through admin calls and
// survive leaderboard resets.
//
// Write gate, checked before any partition mutation:
//   isActive == false                      -> PartitionInactive
//   duration > 0 and now outside window    -> SeasonClosed

#include "types.hpp"
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace podium {

struct SeasonConfig {
    bool is_active = true;
    uint32_t max_entries = 1000;
    int64_t update_cooldown = 0;     // seconds between updates per entity, 0 = none
    Timestamp season_start = 0;
    int64_t season_duration = 0;     // 0 = open-ended

    bool operator==(const SeasonConfig& o) const {
        return is_active == o.is_active && max_entries == o.max_entries &&
               update_cooldown == o.update_cooldown && season_start == o.season_start &&
               season_duration == o.season_duration;
    }

    bool in_window(Timestamp now) const {
        if (season_duration <= 0) return true;
        return now >= season_start && now - season_start < season_duration;
    }

    Timestamp season_end() const {
        return season_duration > 0 ? season_start + season_duration : 0;
    }
};

enum class SeasonState : uint8_t {
    Uninitialized = 0,   // defaults, never written
    Active = 1,
    Inactive = 2,
};

inline std::string season_state_name(SeasonState s) {
    switch (s) {
        case SeasonState::Uninitialized: return "uninitialized";
        case SeasonState::Active: return "active";
        case SeasonState::Inactive: return "inactive";
        default: return "unknown";
    }
}

class SeasonRegistry {
public:
    explicit SeasonRegistry(SeasonConfig defaults = {}) : defaults_(defaults) {}

    const SeasonConfig& config(const PartitionKey& key) const {
        auto it = configs_.find(key);
        return it != configs_.end() ? it->second : defaults_;
    }

    void set_config(const PartitionKey& key, const SeasonConfig& cfg) {
        configs_[key] = cfg;
    }

    // Open a fresh season window for one timeframe of a category
    SeasonConfig start_new_season(const PartitionKey& key, int64_t duration, Timestamp now) {
        SeasonConfig cfg = config(key);
        cfg.season_start = now;
        cfg.season_duration = duration;
        cfg.is_active = true;
        configs_[key] = cfg;
        return cfg;
    }

    SeasonState state(const PartitionKey& key) const {
        auto it = configs_.find(key);
        if (it == configs_.end()) {
            // First use materialises the defaults
            return touched_.count(key) ? (defaults_.is_active ? SeasonState::Active
                                                              : SeasonState::Inactive)
                                       : SeasonState::Uninitialized;
        }
        return it->second.is_active ? SeasonState::Active : SeasonState::Inactive;
    }

    // Mark a key as in use without writing a config
    void touch(const PartitionKey& key) { touched_.insert(key); }

    Error admits_writes(const PartitionKey& key, Timestamp now) const {
        const auto& cfg = config(key);
        if (!cfg.is_active) return Error::PartitionInactive;
        if (!cfg.in_window(now)) return Error::SeasonClosed;
        return Error::None;
    }

    std::vector<PartitionKey> configured_keys() const {
        std::vector<PartitionKey> keys;
        keys.reserve(configs_.size());
        for (const auto& [key, _] : configs_) keys.push_back(key);
        return keys;
    }

private:
    SeasonConfig defaults_;
    std::unordered_map<PartitionKey, SeasonConfig, PartitionKeyHash> configs_;
    std::unordered_set<PartitionKey, PartitionKeyHash> touched_;
};

} // namespace podium
