#include <podium/streak_stats.hpp>
#include <podium/log.hpp>
#include <algorithm>
#include <iostream>

namespace podium {

StreakStats::StreakStats(StreakStatsConfig config, CapabilityCheck gate)
    : config_(config),
      gate_(gate ? std::move(gate) : allow_all()),
      clock_([] { return podium::now(); }),
      activity_(config.inactivity_threshold),
      global_(config.aggregation, STREAK_TYPE_COUNT, false),
      type_leaders_(Aggregation::PerEvent, STREAK_TYPE_COUNT, true),
      totals_(config.totals_capacity) {
    boards_.reserve(STREAK_TYPE_COUNT);
    for (size_t i = 0; i < STREAK_TYPE_COUNT; ++i) {
        boards_.emplace_back(config.board_capacity);
    }
}

Score StreakStats::sum(const std::array<Score, STREAK_TYPE_COUNT>& streaks) {
    Score total = 0;
    for (Score s : streaks) total = saturating_add(total, s);
    return total;
}

StreakUpdateResult StreakStats::update_activity(const EntityId& entity, StreakType type,
                                                Score current_streak,
                                                std::optional<Score> reported_total) {
    StreakUpdateResult result;
    if (Error e = gate_(Capability::UpdateScore); e != Error::None) {
        result.error = e;
        return result;
    }
    if (!valid(type)) {
        result.error = Error::InvalidCategory;
        return result;
    }
    if (entity.empty()) {
        result.error = Error::InvalidEntity;
        return result;
    }

    const size_t t = index_of(type);
    const auto type_id = static_cast<uint8_t>(t);
    Timestamp now = clock_();
    PendingEvents pending;

    // A zero streak from an entity never seen before changes nothing
    if (current_streak == 0 && users_.find(entity) == users_.end()) {
        log_debug("streaks", "ignored zero %s streak for unknown %s",
                  streak_type_name(type).c_str(), entity.c_str());
        return result;
    }

    // Per-user figures
    auto& user = users_[entity];
    user.current[t] = current_streak;
    user.longest_streak = std::max(user.longest_streak, current_streak);
    Score total = sum(user.current);
    result.total = total;

    // Activity bit follows whether the streak is running
    auto transition = activity_.set_category_active(entity, t, current_streak > 0, now);
    if (transition.mask_changed()) {
        pending.activity(entity, type_id, transition);
    }
    if (transition.count_changed()) {
        pending.active_count(activity_.total_active());
    }
    daily_.record(entity, now, transition.became_active);

    // Per-type board
    auto& board = boards_[t];
    EntityId previous_leader;
    if (const auto* lead = board.leader()) previous_leader = lead->entity;

    auto out = board.upsert(entity, current_streak);
    result.admission = out.admission;
    result.rank = out.rank;
    if (out.evicted) {
        log_debug("streaks", "evicted %s from %s board", out.evicted->entity.c_str(),
                  streak_type_name(type).c_str());
    }
    if (const auto* lead = board.leader(); lead && lead->entity != previous_leader) {
        pending.new_leader(LeaderScope::Partition, lead->entity, type_id, Timeframe::AllTime,
                           lead->score);
    }
    if (out.changed() && out.rank != out.previous_rank) {
        Event ev;
        ev.type = EventType::LeaderboardUpdated;
        ev.entity = entity;
        ev.category = type_id;
        ev.score = current_streak;
        ev.rank = out.rank.value_or(0);
        pending.push(std::move(ev));
    }

    // Totals board; refusal here is expected for everyone outside the top
    totals_.upsert(entity, total);

    if (current_streak > 0) {
        type_counts_[t]++;
        total_updates_++;
    }

    // Global leader
    Score candidate = config_.aggregation == Aggregation::PerEvent
        ? reported_total.value_or(current_streak)
        : current_streak;
    auto change = global_.observe(entity, t, candidate);
    if (change.aggregate) {
        result.new_global_leader = true;
        pending.new_leader(LeaderScope::Global, entity, type_id, Timeframe::AllTime,
                           change.candidate);
    }

    // Per-type leader
    auto type_change = type_leaders_.observe(entity, t, current_streak);
    if (type_change.category) {
        pending.new_leader(LeaderScope::Category, entity, type_id, Timeframe::AllTime,
                           current_streak);
    }

    Event updated;
    updated.type = EventType::ScoreUpdated;
    updated.entity = entity;
    updated.category = type_id;
    updated.score = current_streak;
    updated.rank = out.rank.value_or(0);
    pending.push(std::move(updated));

    log_debug("streaks", "%s %s = %llu (total %llu)", entity.c_str(),
              streak_type_name(type).c_str(), static_cast<unsigned long long>(current_streak),
              static_cast<unsigned long long>(total));

    bus_.publish(pending.events());
    return result;
}

Error StreakStats::record_achievement(const EntityId& entity, Score xp, Score badges) {
    if (Error e = gate_(Capability::UpdateScore); e != Error::None) return e;
    if (entity.empty()) return Error::InvalidEntity;

    auto& user = users_[entity];
    user.achievements = saturating_add(user.achievements, 1);
    user.xp = saturating_add(user.xp, xp);
    user.badges = saturating_add(user.badges, badges);

    PendingEvents pending;
    Event ev;
    ev.type = EventType::AchievementRecorded;
    ev.entity = entity;
    ev.score = xp;
    ev.count = badges;
    pending.push(std::move(ev));
    bus_.publish(pending.events());
    return Error::None;
}

CleanupResult StreakStats::cleanup_inactive(const std::vector<EntityId>& entities) {
    CleanupResult result;
    if (Error e = gate_(Capability::Administer); e != Error::None) {
        result.error = e;
        return result;
    }
    if (entities.empty()) {
        result.error = Error::EmptyInput;
        return result;
    }

    result.cleaned = activity_.cleanup(entities, clock_());

    PendingEvents pending;
    for (const auto& c : result.cleaned) {
        Event ev;
        ev.type = EventType::ActivityChanged;
        ev.entity = c.entity;
        ev.mask_before = c.previous_mask;
        ev.mask_after = 0;
        pending.push(std::move(ev));
    }
    if (!result.cleaned.empty()) {
        pending.active_count(activity_.total_active());
        std::cerr << "[streaks] Cleaned " << result.cleaned.size() << " inactive streakers\n";
    }

    bus_.publish(pending.events());
    return result;
}

Error StreakStats::prune_daily_stats(int64_t before_day) {
    if (Error e = gate_(Capability::Administer); e != Error::None) return e;
    size_t pruned = daily_.prune(before_day);
    log_debug("streaks", "pruned %zu day records before day %lld", pruned,
              static_cast<long long>(before_day));
    return Error::None;
}

Error StreakStats::reset_global_stats() {
    if (Error e = gate_(Capability::Administer); e != Error::None) return e;

    global_.reset();
    type_leaders_.reset();
    for (auto& board : boards_) board.clear();
    totals_.clear();
    type_counts_.fill(0);
    total_updates_ = 0;

    std::cerr << "[streaks] Global statistics reset (" << users_.size()
              << " user records kept)\n";

    PendingEvents pending;
    Event ev;
    ev.type = EventType::LeaderboardReset;
    pending.push(std::move(ev));
    bus_.publish(pending.events());
    return Error::None;
}

GlobalStreakStats StreakStats::global_stats() const {
    GlobalStreakStats stats;
    stats.total_active = activity_.total_active();
    stats.longest_global_streak = global_.best().value;
    stats.streak_leader = global_.best().holder;
    stats.total_updates = total_updates_;
    return stats;
}

UserStreakStats StreakStats::user_stats(const EntityId& entity) const {
    UserStreakStats stats;
    stats.active_types = activity_.active_categories(entity);
    stats.last_activity = activity_.last_activity(entity);

    auto it = users_.find(entity);
    if (it == users_.end()) return stats;

    const auto& user = it->second;
    stats.current = user.current;
    stats.total_streak = sum(user.current);
    stats.longest_streak = user.longest_streak;
    stats.total_achievements = user.achievements;
    stats.total_xp = user.xp;
    stats.total_badges = user.badges;
    return stats;
}

std::vector<RankedEntry> StreakStats::leaderboard(StreakType type, size_t limit) const {
    if (!valid(type)) return {};
    return boards_[index_of(type)].ranked_page(0, limit);
}

std::vector<RankedEntry> StreakStats::totals_leaderboard(size_t limit) const {
    return totals_.ranked_page(0, limit);
}

std::vector<RecordHolder> StreakStats::type_leaders() const {
    return type_leaders_.category_bests();
}

std::optional<uint32_t> StreakStats::rank(const EntityId& entity, StreakType type) const {
    if (!valid(type)) return std::nullopt;
    return boards_[index_of(type)].rank(entity);
}

uint64_t StreakStats::type_update_count(StreakType type) const {
    return valid(type) ? type_counts_[index_of(type)] : 0;
}

bool StreakStats::check_invariants() const {
    for (const auto& board : boards_) {
        if (!board.check_invariants()) return false;
    }
    return totals_.check_invariants() && activity_.check_invariants();
}

} // namespace podium
