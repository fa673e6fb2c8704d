#pragma once
// Events: notifications for downstream collaborators (badges, XP, UI)
//
// Mutating calls queue events in a PendingEvents buffer and hand the
// buffer to the bus only after every piece of bookkeeping is committed, so
// a subscriber that calls back into the engine never sees half an update.

#include "types.hpp"
#include "activity_mask.hpp"
#include <functional>
#include <vector>

namespace podium {

enum class EventType : uint8_t {
    ScoreUpdated,
    NewLeader,
    LeaderboardUpdated,
    EntryEvicted,
    LeaderboardReset,
    ActivityChanged,
    ActiveCountChanged,
    ConfigChanged,
    AchievementRecorded,
};

// What a NewLeader event refers to
enum class LeaderScope : uint8_t {
    Partition,   // new holder of rank 1 in one (category, timeframe)
    Category,    // new per-category record
    Global,      // new aggregate record
};

struct Event {
    EventType type = EventType::ScoreUpdated;
    LeaderScope scope = LeaderScope::Partition;
    EntityId entity;
    uint8_t category = 0;        // Category or StreakType index, per source
    Timeframe timeframe = Timeframe::AllTime;
    Score score = 0;
    uint32_t rank = 0;           // 1-indexed, 0 when the entity left the board
    uint64_t count = 0;          // ActiveCountChanged total
    CategoryMask mask_before = 0;
    CategoryMask mask_after = 0;
};

inline std::string event_name(EventType t) {
    switch (t) {
        case EventType::ScoreUpdated: return "ScoreUpdated";
        case EventType::NewLeader: return "NewLeader";
        case EventType::LeaderboardUpdated: return "LeaderboardUpdated";
        case EventType::EntryEvicted: return "EntryEvicted";
        case EventType::LeaderboardReset: return "LeaderboardReset";
        case EventType::ActivityChanged: return "ActivityChanged";
        case EventType::ActiveCountChanged: return "ActiveCountChanged";
        case EventType::ConfigChanged: return "ConfigChanged";
        case EventType::AchievementRecorded: return "AchievementRecorded";
        default: return "Unknown";
    }
}

using EventHandler = std::function<void(const Event&)>;

class EventBus {
public:
    // Returns a token for unsubscribe()
    size_t subscribe(EventHandler handler) {
        handlers_.push_back({next_token_, std::move(handler)});
        return next_token_++;
    }

    void unsubscribe(size_t token) {
        for (auto it = handlers_.begin(); it != handlers_.end(); ++it) {
            if (it->token == token) {
                handlers_.erase(it);
                return;
            }
        }
    }

    // Subscribers may subscribe/unsubscribe while being notified;
    // delivery uses a snapshot of the list.
    void publish(const std::vector<Event>& events) const {
        if (events.empty() || handlers_.empty()) return;
        auto snapshot = handlers_;
        for (const auto& ev : events) {
            for (const auto& h : snapshot) {
                h.fn(ev);
            }
        }
    }

    size_t subscriber_count() const { return handlers_.size(); }

private:
    struct Slot {
        size_t token;
        EventHandler fn;
    };

    std::vector<Slot> handlers_;
    size_t next_token_ = 1;
};

// Per-call event buffer
class PendingEvents {
public:
    void push(Event ev) { events_.push_back(std::move(ev)); }

    void score_updated(const EntityId& entity, const PartitionKey& key, Score score, uint32_t rank) {
        Event ev;
        ev.type = EventType::ScoreUpdated;
        ev.entity = entity;
        ev.category = static_cast<uint8_t>(key.category);
        ev.timeframe = key.timeframe;
        ev.score = score;
        ev.rank = rank;
        push(std::move(ev));
    }

    void active_count(uint64_t total) {
        Event ev;
        ev.type = EventType::ActiveCountChanged;
        ev.count = total;
        push(std::move(ev));
    }

    void activity(const EntityId& entity, uint8_t category, const ActivityTransition& t) {
        Event ev;
        ev.type = EventType::ActivityChanged;
        ev.entity = entity;
        ev.category = category;
        ev.mask_before = t.before;
        ev.mask_after = t.after;
        push(std::move(ev));
    }

    void new_leader(LeaderScope scope, const EntityId& entity, uint8_t category,
                    Timeframe timeframe, Score score) {
        Event ev;
        ev.type = EventType::NewLeader;
        ev.scope = scope;
        ev.entity = entity;
        ev.category = category;
        ev.timeframe = timeframe;
        ev.score = score;
        ev.rank = 1;
        push(std::move(ev));
    }

    const std::vector<Event>& events() const { return events_; }
    bool empty() const { return events_.empty(); }

private:
    std::vector<Event> events_;
};

} // namespace podium
