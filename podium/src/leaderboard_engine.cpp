#include <podium/leaderboard_engine.hpp>
#include <podium/log.hpp>
#include <algorithm>
#include <iostream>
#include <unordered_set>

namespace podium {

LeaderboardEngine::LeaderboardEngine(EngineConfig config, CapabilityCheck gate)
    : config_(config),
      gate_(gate ? std::move(gate) : allow_all()),
      clock_([] { return podium::now(); }),
      seasons_(config.defaults),
      activity_(config.inactivity_threshold),
      records_(Aggregation::PerEvent, CATEGORY_COUNT, config.track_category_records) {}

// ═══════════════════════════════════════════════════════════════════
// Validation
// ═══════════════════════════════════════════════════════════════════

Error LeaderboardEngine::validate(const EntityId& entity, Category category,
                                  Timeframe timeframe) const {
    if (!valid(category)) return Error::InvalidCategory;
    if (!valid(timeframe)) return Error::InvalidTimeframe;
    if (entity.empty()) return Error::InvalidEntity;
    return Error::None;
}

Error LeaderboardEngine::check_write(const EntityId& entity, const PartitionKey& key,
                                     Timestamp now) const {
    if (Error e = seasons_.admits_writes(key, now); e != Error::None) return e;

    const auto& cfg = seasons_.config(key);
    if (cfg.update_cooldown > 0) {
        if (const auto* st = find_state(key)) {
            auto it = st->last_update.find(entity);
            if (it != st->last_update.end() && now - it->second < cfg.update_cooldown) {
                return Error::CooldownActive;
            }
        }
    }
    return Error::None;
}

Error LeaderboardEngine::check_admission(const EntityId& entity, const PartitionKey& key,
                                         Score score) const {
    if (const auto* st = find_state(key)) {
        return st->board.admits(entity, score) ? Error::None : Error::NotAdmitted;
    }
    // Partition not materialised yet: only a zero capacity can refuse
    if (score > 0 && seasons_.config(key).max_entries == 0) return Error::NotAdmitted;
    return Error::None;
}

LeaderboardEngine::PartitionState& LeaderboardEngine::state_for(const PartitionKey& key) {
    auto it = partitions_.find(key);
    if (it == partitions_.end()) {
        it = partitions_.emplace(key, PartitionState(seasons_.config(key).max_entries)).first;
    }
    return it->second;
}

const LeaderboardEngine::PartitionState* LeaderboardEngine::find_state(const PartitionKey& key) const {
    auto it = partitions_.find(key);
    return it != partitions_.end() ? &it->second : nullptr;
}

bool LeaderboardEngine::present_in_category(const EntityId& entity, Category category) const {
    for (size_t t = 0; t < TIMEFRAME_COUNT; ++t) {
        const auto* st = find_state({category, static_cast<Timeframe>(t)});
        if (st && st->board.contains(entity)) return true;
    }
    return false;
}

// ═══════════════════════════════════════════════════════════════════
// Commit
// ═══════════════════════════════════════════════════════════════════

void LeaderboardEngine::refresh_activity(const EntityId& entity, Category category,
                                         Timestamp now, PendingEvents& pending) {
    bool present = present_in_category(entity, category);
    auto t = activity_.set_category_active(entity, index_of(category), present, now);
    if (t.mask_changed()) {
        pending.activity(entity, static_cast<uint8_t>(category), t);
    }
    if (t.count_changed()) {
        pending.active_count(activity_.total_active());
    }
}

void LeaderboardEngine::evict(const ScoreEntry& entry, const PartitionKey& key,
                              Timestamp now, PendingEvents& pending) {
    log_debug("engine", "evicted %s (%llu) from %s", entry.entity.c_str(),
              static_cast<unsigned long long>(entry.score), key.to_string().c_str());

    Event ev;
    ev.type = EventType::EntryEvicted;
    ev.entity = entry.entity;
    ev.category = static_cast<uint8_t>(key.category);
    ev.timeframe = key.timeframe;
    ev.score = entry.score;
    pending.push(std::move(ev));

    auto it = partitions_.find(key);
    if (it != partitions_.end()) {
        it->second.last_update.erase(entry.entity);
    }

    // Still ranked in another timeframe of the category: bit stays, stamp untouched
    if (present_in_category(entry.entity, key.category)) return;

    auto t = activity_.set_category_active(entry.entity, index_of(key.category), false, now);
    if (t.mask_changed()) {
        pending.activity(entry.entity, static_cast<uint8_t>(key.category), t);
    }
    if (t.count_changed()) {
        pending.active_count(activity_.total_active());
    }
}

UpdateResult LeaderboardEngine::apply(const EntityId& entity, const PartitionKey& key,
                                      Score score, Timestamp now, PendingEvents& pending) {
    auto& st = state_for(key);
    seasons_.touch(key);

    EntityId previous_leader;
    if (const auto* lead = st.board.leader()) previous_leader = lead->entity;

    UpsertOutcome out = st.board.upsert(entity, score);

    UpdateResult result;
    result.admission = out.admission;
    result.rank = out.rank;
    result.evicted = out.evicted;
    result.score = out.rank ? score : 0;

    if (out.admission == Admission::Ignored) return result;

    st.last_update[entity] = now;

    refresh_activity(entity, key.category, now, pending);
    if (out.evicted) {
        evict(*out.evicted, key, now, pending);
    }

    const auto category = static_cast<uint8_t>(key.category);

    if (score > 0) {
        auto change = records_.observe(entity, index_of(key.category), score);
        if (change.aggregate) {
            pending.new_leader(LeaderScope::Global, entity, category, key.timeframe,
                               change.candidate);
        }
        if (change.category) {
            pending.new_leader(LeaderScope::Category, entity, category, key.timeframe, score);
        }
    }

    if (const auto* lead = st.board.leader(); lead && lead->entity != previous_leader) {
        pending.new_leader(LeaderScope::Partition, lead->entity, category, key.timeframe,
                           lead->score);
    }

    pending.score_updated(entity, key, result.score, out.rank.value_or(0));

    if (out.rank != out.previous_rank) {
        Event ev;
        ev.type = EventType::LeaderboardUpdated;
        ev.entity = entity;
        ev.category = category;
        ev.timeframe = key.timeframe;
        ev.score = result.score;
        ev.rank = out.rank.value_or(0);
        pending.push(std::move(ev));
    }

    log_debug("engine", "%s %s -> %llu (rank %u)", key.to_string().c_str(), entity.c_str(),
              static_cast<unsigned long long>(result.score), out.rank.value_or(0));
    return result;
}

// ═══════════════════════════════════════════════════════════════════
// Score updates
// ═══════════════════════════════════════════════════════════════════

UpdateResult LeaderboardEngine::update_score(const EntityId& entity, Category category,
                                             Timeframe timeframe, Score score) {
    if (Error e = gate_(Capability::UpdateScore); e != Error::None) {
        return UpdateResult::failure(e);
    }
    if (Error e = validate(entity, category, timeframe); e != Error::None) {
        return UpdateResult::failure(e);
    }

    PartitionKey key{category, timeframe};
    Timestamp now = clock_();

    if (Error e = check_write(entity, key, now); e != Error::None) {
        return UpdateResult::failure(e);
    }
    if (Error e = check_admission(entity, key, score); e != Error::None) {
        log_debug("engine", "%s not admitted to %s (%llu)", entity.c_str(),
                  key.to_string().c_str(), static_cast<unsigned long long>(score));
        return UpdateResult::failure(e);
    }

    PendingEvents pending;
    UpdateResult result = apply(entity, key, score, now, pending);
    bus_.publish(pending.events());
    return result;
}

UpdateResult LeaderboardEngine::increment_score(const EntityId& entity, Category category,
                                                Timeframe timeframe, Score delta) {
    Score current = get_score(entity, category, timeframe);
    return update_score(entity, category, timeframe, saturating_add(current, delta));
}

BatchResult LeaderboardEngine::batch_update_scores(const std::vector<EntityId>& entities,
                                                   Category category, Timeframe timeframe,
                                                   const std::vector<Score>& scores) {
    BatchResult batch;

    auto fail = [&batch](Error e, size_t index) {
        batch.error = e;
        batch.failed_index = index;
        return batch;
    };

    if (Error e = gate_(Capability::UpdateScore); e != Error::None) return fail(e, 0);
    if (entities.size() != scores.size()) return fail(Error::ArrayLengthMismatch, 0);
    if (entities.empty()) return fail(Error::EmptyInput, 0);
    if (!valid(category)) return fail(Error::InvalidCategory, 0);
    if (!valid(timeframe)) return fail(Error::InvalidTimeframe, 0);

    PartitionKey key{category, timeframe};
    Timestamp now = clock_();
    const auto& cfg = seasons_.config(key);

    // Dry run every element against a scratch copy of the partition
    const auto* existing = find_state(key);
    ScorePartition trial = existing ? existing->board : ScorePartition(cfg.max_entries);
    std::unordered_set<EntityId> seen;

    for (size_t i = 0; i < entities.size(); ++i) {
        const auto& entity = entities[i];
        if (entity.empty()) return fail(Error::InvalidEntity, i);
        if (Error e = check_write(entity, key, now); e != Error::None) return fail(e, i);

        // A second write in the same call is as recent as it gets
        if (!seen.insert(entity).second && cfg.update_cooldown > 0) {
            return fail(Error::CooldownActive, i);
        }
        if (!trial.admits(entity, scores[i])) return fail(Error::NotAdmitted, i);
        trial.upsert(entity, scores[i]);
    }

    PendingEvents pending;
    batch.results.reserve(entities.size());
    for (size_t i = 0; i < entities.size(); ++i) {
        batch.results.push_back(apply(entities[i], key, scores[i], now, pending));
    }
    log_debug("engine", "batch of %zu applied to %s", entities.size(), key.to_string().c_str());

    bus_.publish(pending.events());
    return batch;
}

// ═══════════════════════════════════════════════════════════════════
// Reads
// ═══════════════════════════════════════════════════════════════════

Score LeaderboardEngine::get_score(const EntityId& entity, Category category,
                                   Timeframe timeframe) const {
    if (!valid(category) || !valid(timeframe)) return 0;
    const auto* st = find_state({category, timeframe});
    if (!st) return 0;
    return st->board.score(entity).value_or(0);
}

std::optional<uint32_t> LeaderboardEngine::get_rank(const EntityId& entity, Category category,
                                                    Timeframe timeframe) const {
    if (!valid(category) || !valid(timeframe)) return std::nullopt;
    const auto* st = find_state({category, timeframe});
    if (!st) return std::nullopt;
    return st->board.rank(entity);
}

UserScore LeaderboardEngine::get_user_score(const EntityId& entity, Category category,
                                            Timeframe timeframe) const {
    return {get_score(entity, category, timeframe), get_rank(entity, category, timeframe)};
}

std::vector<RankedEntry> LeaderboardEngine::get_page(Category category, Timeframe timeframe,
                                                     size_t offset, size_t count) const {
    if (!valid(category) || !valid(timeframe)) return {};
    const auto* st = find_state({category, timeframe});
    if (!st) return {};
    return st->board.ranked_page(offset, count);
}

std::vector<RankedEntry> LeaderboardEngine::get_leaderboard(Category category, Timeframe timeframe,
                                                            size_t limit) const {
    return get_page(category, timeframe, 0, limit);
}

TopEntities LeaderboardEngine::get_top_entities(Category category, Timeframe timeframe,
                                                size_t limit) const {
    TopEntities top;
    for (auto& entry : get_page(category, timeframe, 0, limit)) {
        top.entities.push_back(std::move(entry.entity));
        top.scores.push_back(entry.score);
    }
    return top;
}

size_t LeaderboardEngine::entry_count(Category category, Timeframe timeframe) const {
    if (!valid(category) || !valid(timeframe)) return 0;
    const auto* st = find_state({category, timeframe});
    return st ? st->board.size() : 0;
}

const SeasonConfig& LeaderboardEngine::config(Category category, Timeframe timeframe) const {
    return seasons_.config({category, timeframe});
}

SeasonState LeaderboardEngine::season_state(Category category, Timeframe timeframe) const {
    return seasons_.state({category, timeframe});
}

const ScorePartition* LeaderboardEngine::partition(Category category, Timeframe timeframe) const {
    const auto* st = find_state({category, timeframe});
    return st ? &st->board : nullptr;
}

std::vector<PartitionKey> LeaderboardEngine::partition_keys() const {
    std::vector<PartitionKey> keys;
    keys.reserve(partitions_.size());
    for (const auto& [key, _] : partitions_) keys.push_back(key);
    std::sort(keys.begin(), keys.end(), [](const PartitionKey& a, const PartitionKey& b) {
        if (a.category != b.category) return a.category < b.category;
        return a.timeframe < b.timeframe;
    });
    return keys;
}

// ═══════════════════════════════════════════════════════════════════
// Administration
// ═══════════════════════════════════════════════════════════════════

Error LeaderboardEngine::reset_leaderboard(Category category, Timeframe timeframe) {
    if (Error e = gate_(Capability::Administer); e != Error::None) return e;
    if (!valid(category)) return Error::InvalidCategory;
    if (!valid(timeframe)) return Error::InvalidTimeframe;

    PartitionKey key{category, timeframe};
    size_t cleared = 0;
    auto it = partitions_.find(key);
    if (it != partitions_.end()) {
        cleared = it->second.board.size();
        it->second.board.clear();
        it->second.last_update.clear();
    }

    std::cerr << "[engine] Reset " << key.to_string() << " (" << cleared << " entries)\n";

    PendingEvents pending;
    Event ev;
    ev.type = EventType::LeaderboardReset;
    ev.category = static_cast<uint8_t>(category);
    ev.timeframe = timeframe;
    ev.count = cleared;
    pending.push(std::move(ev));
    bus_.publish(pending.events());
    return Error::None;
}

Error LeaderboardEngine::set_config(Category category, Timeframe timeframe,
                                    const SeasonConfig& cfg) {
    if (Error e = gate_(Capability::Administer); e != Error::None) return e;
    if (!valid(category)) return Error::InvalidCategory;
    if (!valid(timeframe)) return Error::InvalidTimeframe;

    PartitionKey key{category, timeframe};
    seasons_.set_config(key, cfg);

    PendingEvents pending;
    auto it = partitions_.find(key);
    if (it != partitions_.end()) {
        Timestamp now = clock_();
        auto evicted = it->second.board.set_capacity(cfg.max_entries);
        for (const auto& entry : evicted) {
            evict(entry, key, now, pending);
        }
        if (!evicted.empty()) {
            std::cerr << "[engine] Capacity of " << key.to_string() << " now "
                      << cfg.max_entries << ", evicted " << evicted.size() << "\n";
        }
    }

    Event ev;
    ev.type = EventType::ConfigChanged;
    ev.category = static_cast<uint8_t>(category);
    ev.timeframe = timeframe;
    ev.count = cfg.max_entries;
    pending.push(std::move(ev));

    log_debug("engine", "config %s active=%d max=%u cooldown=%lld", key.to_string().c_str(),
              cfg.is_active ? 1 : 0, cfg.max_entries, static_cast<long long>(cfg.update_cooldown));
    bus_.publish(pending.events());
    return Error::None;
}

Error LeaderboardEngine::start_new_season(Category category, int64_t duration,
                                          Timeframe timeframe) {
    if (Error e = gate_(Capability::Administer); e != Error::None) return e;
    if (!valid(category)) return Error::InvalidCategory;
    if (!valid(timeframe)) return Error::InvalidTimeframe;

    PartitionKey key{category, timeframe};
    auto cfg = seasons_.start_new_season(key, std::max<int64_t>(duration, 0), clock_());

    std::cerr << "[engine] New season for " << key.to_string() << " starting "
              << cfg.season_start << " for " << cfg.season_duration << "s\n";

    PendingEvents pending;
    Event ev;
    ev.type = EventType::ConfigChanged;
    ev.category = static_cast<uint8_t>(category);
    ev.timeframe = timeframe;
    ev.count = cfg.max_entries;
    pending.push(std::move(ev));
    bus_.publish(pending.events());
    return Error::None;
}

CleanupResult LeaderboardEngine::cleanup_inactive(const std::vector<EntityId>& entities) {
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
        std::cerr << "[engine] Cleaned " << result.cleaned.size() << " inactive of "
                  << entities.size() << " checked\n";
    }
    bus_.publish(pending.events());
    return result;
}

bool LeaderboardEngine::check_invariants() const {
    for (const auto& [key, st] : partitions_) {
        if (!st.board.check_invariants()) return false;
        if (st.board.capacity() != seasons_.config(key).max_entries) return false;
    }
    return activity_.check_invariants();
}

} // namespace podium
