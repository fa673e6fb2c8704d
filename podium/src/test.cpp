#include <podium/podium.hpp>
#include <podium/rpc/handler.hpp>
#include <sqlite3.h>
#include <iostream>
#include <cassert>
#include <cstdio>
#include <string>
#include <vector>

using namespace podium;
using rpc::json;

static const Category XP = Category::XpTotal;

size_t count_events(const std::vector<Event>& events, EventType type) {
    size_t n = 0;
    for (const auto& ev : events) {
        if (ev.type == type) ++n;
    }
    return n;
}

size_t count_leaders(const std::vector<Event>& events, LeaderScope scope) {
    size_t n = 0;
    for (const auto& ev : events) {
        if (ev.type == EventType::NewLeader && ev.scope == scope) ++n;
    }
    return n;
}

SeasonConfig capped(uint32_t max_entries, int64_t cooldown = 0) {
    SeasonConfig cfg;
    cfg.max_entries = max_entries;
    cfg.update_cooldown = cooldown;
    return cfg;
}

// ═══════════════════════════════════════════════════════════════════
// ScorePartition
// ═══════════════════════════════════════════════════════════════════

void test_partition_ordering() {
    std::cout << "Testing ScorePartition ordering..." << std::endl;

    LeaderboardEngine engine;
    assert(engine.update_score("A", XP, Timeframe::AllTime, 100).ok());
    assert(engine.update_score("B", XP, Timeframe::AllTime, 150).ok());
    assert(engine.update_score("C", XP, Timeframe::AllTime, 50).ok());

    auto lb = engine.get_leaderboard(XP, Timeframe::AllTime, 10);
    assert(lb.size() == 3);
    assert(lb[0].entity == "B" && lb[0].score == 150 && lb[0].rank == 1);
    assert(lb[1].entity == "A" && lb[1].score == 100 && lb[1].rank == 2);
    assert(lb[2].entity == "C" && lb[2].score == 50 && lb[2].rank == 3);

    auto r = engine.update_score("C", XP, Timeframe::AllTime, 120);
    assert(r.ok());
    assert(r.admission == Admission::Moved);
    assert(r.rank == 2u);

    lb = engine.get_leaderboard(XP, Timeframe::AllTime, 10);
    assert(lb[0].entity == "B" && lb[0].rank == 1);
    assert(lb[1].entity == "C" && lb[1].score == 120 && lb[1].rank == 2);
    assert(lb[2].entity == "A" && lb[2].score == 100 && lb[2].rank == 3);
    assert(engine.check_invariants());

    std::cout << "  PASS" << std::endl;
}

void test_partition_eviction() {
    std::cout << "Testing ScorePartition eviction..." << std::endl;

    ScorePartition p(10);
    for (int i = 0; i < 10; ++i) {
        auto out = p.upsert("e" + std::to_string(i), static_cast<Score>(100 - 10 * i));
        assert(out.admission == Admission::Inserted);
    }
    assert(p.full());

    auto out = p.upsert("newcomer", 15);
    assert(out.admission == Admission::Replaced);
    assert(out.evicted.has_value());
    assert(out.evicted->entity == "e9" && out.evicted->score == 10);
    assert(out.rank == 10u);
    assert(!p.contains("e9"));
    assert(p.size() == 10);

    auto before = p.entries();
    out = p.upsert("late", 5);
    assert(out.admission == Admission::NotAdmitted);
    assert(!out.rank.has_value());
    assert(!out.changed());
    assert(p.size() == 10);
    for (size_t i = 0; i < before.size(); ++i) {
        assert(p.entries()[i].entity == before[i].entity);
        assert(p.entries()[i].score == before[i].score);
    }

    // Equal to the lowest is not enough
    assert(!p.admits("late", 15));
    assert(p.upsert("late", 15).admission == Admission::NotAdmitted);

    // Members may always move, even when full
    out = p.upsert("e0", 1);
    assert(out.admission == Admission::Moved);
    assert(out.rank == 10u);
    assert(p.check_invariants());

    // Engine reports the refusal as an error and keeps no trace
    LeaderboardEngine engine;
    assert(engine.set_config(XP, Timeframe::Weekly, capped(2)) == Error::None);
    assert(engine.update_score("a", XP, Timeframe::Weekly, 20).ok());
    assert(engine.update_score("b", XP, Timeframe::Weekly, 30).ok());
    auto r = engine.update_score("c", XP, Timeframe::Weekly, 20);
    assert(r.error == Error::NotAdmitted);
    assert(engine.entry_count(XP, Timeframe::Weekly) == 2);
    assert(!engine.activity().is_active("c"));
    assert(engine.activity().tracked_entities() == 2);

    std::cout << "  PASS" << std::endl;
}

void test_partition_ties() {
    std::cout << "Testing ScorePartition ties..." << std::endl;

    ScorePartition p(5);
    p.upsert("a", 50);
    p.upsert("b", 50);
    p.upsert("c", 50);
    assert(p.rank("a") == 1u);
    assert(p.rank("b") == 2u);
    assert(p.rank("c") == 3u);

    p.upsert("b", 60);
    assert(p.rank("b") == 1u);
    assert(p.rank("a") == 2u);

    // Dropping back to a tie does not pass the equal neighbours
    p.upsert("b", 50);
    assert(p.rank("b") == 1u);
    assert(p.rank("a") == 2u);
    assert(p.rank("c") == 3u);

    // Same score: rescored in place
    auto out = p.upsert("a", 50);
    assert(out.admission == Admission::Moved);
    assert(out.rank == 2u);

    p.upsert("a", 40);
    assert(p.rank("a") == 3u);
    assert(p.rank("c") == 2u);
    assert(p.check_invariants());

    std::cout << "  PASS" << std::endl;
}

void test_partition_remove_and_page() {
    std::cout << "Testing ScorePartition remove/page..." << std::endl;

    ScorePartition p(10);
    p.upsert("a", 30);
    p.upsert("b", 20);
    p.upsert("c", 10);

    auto out = p.upsert("b", 0);
    assert(out.admission == Admission::Removed);
    assert(!out.rank.has_value());
    assert(out.previous_rank == 2u);
    assert(p.size() == 2);
    assert(p.rank("c") == 2u);

    assert(p.upsert("ghost", 0).admission == Admission::Ignored);
    assert(!p.contains("ghost"));
    assert(!p.remove("ghost"));
    assert(!p.score("ghost").has_value());

    assert(p.page(5, 10).empty());
    assert(p.page(0, 0).empty());
    auto page = p.ranked_page(1, 10);
    assert(page.size() == 1);
    assert(page[0].entity == "c" && page[0].rank == 2);

    auto evicted = p.set_capacity(1);
    assert(evicted.size() == 1 && evicted[0].entity == "c");
    assert(p.size() == 1 && p.capacity() == 1);

    ScorePartition restored(3);
    assert(restored.restore_append("x", 9));
    assert(!restored.restore_append("y", 10));    // out of order
    assert(!restored.restore_append("x", 1));     // duplicate
    assert(!restored.restore_append("z", 0));     // zero score
    assert(restored.check_invariants());

    std::cout << "  PASS" << std::endl;
}

// ═══════════════════════════════════════════════════════════════════
// ActivityMask / GlobalRecord
// ═══════════════════════════════════════════════════════════════════

void test_activity_mask() {
    std::cout << "Testing ActivityMask..." << std::endl;

    const size_t daily_login = index_of(StreakType::DailyLogin);
    const size_t quest = index_of(StreakType::QuestCompletion);

    ActivityMask mask;
    auto t = mask.set_category_active("U", daily_login, true, 1000);
    assert(t.became_active);
    t = mask.set_category_active("U", quest, true, 1000);
    assert(!t.count_changed());
    assert(mask.total_active() == 1);
    assert(mask.active_categories("U") == 0b11);

    t = mask.set_category_active("U", daily_login, false, 1001);
    assert(t.mask_changed() && !t.count_changed());
    assert(mask.total_active() == 1);
    assert(mask.last_activity("U") == 1000);

    t = mask.set_category_active("U", quest, false, 1002);
    assert(t.became_inactive);
    assert(mask.total_active() == 0);

    // Clearing on an unseen entity creates nothing
    t = mask.set_category_active("nobody", quest, false, 1002);
    assert(!t.mask_changed());
    assert(mask.tracked_entities() == 1);

    assert(ActivityMask::valid_bit(31));
    assert(!ActivityMask::valid_bit(32));

    // Bits beyond the mask width are refused and leave nothing behind
    for (size_t bit : {size_t(32), size_t(40)}) {
        t = mask.set_category_active("W", bit, true, 1003);
        assert(t.error == Error::InvalidCategory);
        assert(!t.mask_changed() && !t.count_changed());
        assert(mask.total_active() == 0);
        assert(mask.active_categories("W") == 0);
        assert(mask.tracked_entities() == 1);
    }
    t = mask.set_category_active("W", 31, true, 1003);
    assert(t.ok() && t.became_active);
    assert(mask.active_categories("W") == 0x80000000u);
    assert(mask.check_invariants());

    std::cout << "  PASS" << std::endl;
}

void test_activity_cleanup() {
    std::cout << "Testing ActivityMask cleanup..." << std::endl;

    ActivityMask mask(100);
    mask.set_category_active("U", 0, true, 1000);
    mask.set_category_active("V", 1, true, 1100);
    assert(mask.total_active() == 2);

    auto cleaned = mask.cleanup({"U", "unknown"}, 1050);
    assert(cleaned.empty());

    cleaned = mask.cleanup({"U", "V", "unknown"}, 1101);
    assert(cleaned.size() == 1);
    assert(cleaned[0].entity == "U" && cleaned[0].previous_mask == 1);
    assert(mask.total_active() == 1);
    assert(!mask.is_active("U"));

    // Idempotent
    cleaned = mask.cleanup({"U", "U"}, 1200);
    assert(cleaned.empty());
    assert(mask.check_invariants());

    std::cout << "  PASS" << std::endl;
}

void test_global_record() {
    std::cout << "Testing GlobalRecord..." << std::endl;

    GlobalRecord rec(Aggregation::PerEvent, CATEGORY_COUNT);
    auto c = rec.observe("A", 0, 100);
    assert(c.aggregate && c.category);

    c = rec.observe("B", 1, 100);
    assert(!c.aggregate);           // tie keeps the incumbent
    assert(c.category);
    c = rec.observe("B", 0, 100);
    assert(!c.any());
    rec.observe("A", 0, 50);
    assert(rec.best().value == 100 && rec.best().holder == "A");
    assert(rec.category_best(1)->holder == "B");
    assert(!rec.category_best(CATEGORY_COUNT).has_value());

    GlobalRecord sum(Aggregation::SumOfComponents, STREAK_TYPE_COUNT, false);
    sum.observe("A", 0, 10);
    sum.observe("B", 0, 8);
    c = sum.observe("B", 1, 5);
    assert(c.aggregate && c.candidate == 13);
    assert(sum.best().holder == "B");

    // Components are replaced, and a lower total never lowers the record
    sum.observe("A", 0, 3);
    assert(sum.total("A") == 3);
    assert(sum.best().value == 13);
    assert(!sum.category_best(0).has_value());

    sum.observe("C", 0, MAX_SCORE);
    sum.observe("C", 1, 5);
    assert(sum.total("C") == MAX_SCORE);

    sum.reset();
    assert(sum.best().value == 0 && !sum.best().held());
    assert(sum.total("B") == 13);

    std::cout << "  PASS" << std::endl;
}

// ═══════════════════════════════════════════════════════════════════
// LeaderboardEngine
// ═══════════════════════════════════════════════════════════════════

void test_engine_reset() {
    std::cout << "Testing LeaderboardEngine reset..." << std::endl;

    LeaderboardEngine engine;
    engine.update_score("A", XP, Timeframe::AllTime, 100);
    engine.update_score("B", XP, Timeframe::AllTime, 80);
    engine.update_score("A", XP, Timeframe::Weekly, 40);
    engine.update_score("A", Category::TradingVolume, Timeframe::AllTime, 70);

    assert(engine.reset_leaderboard(XP, Timeframe::AllTime) == Error::None);
    assert(engine.get_leaderboard(XP, Timeframe::AllTime, 10).empty());
    assert(engine.get_score("A", XP, Timeframe::AllTime) == 0);
    assert(engine.get_score("B", XP, Timeframe::AllTime) == 0);
    assert(!engine.get_rank("A", XP, Timeframe::AllTime).has_value());

    assert(engine.get_score("A", XP, Timeframe::Weekly) == 40);
    assert(engine.get_score("A", Category::TradingVolume, Timeframe::AllTime) == 70);
    assert(engine.records().best().value == 100);
    assert(engine.records().best().holder == "A");
    assert(engine.activity().is_active("B"));
    assert(engine.season_state(XP, Timeframe::AllTime) == SeasonState::Active);

    assert(engine.reset_leaderboard(static_cast<Category>(8), Timeframe::AllTime) ==
           Error::InvalidCategory);
    assert(engine.check_invariants());

    std::cout << "  PASS" << std::endl;
}

void test_engine_validation() {
    std::cout << "Testing LeaderboardEngine validation..." << std::endl;

    LeaderboardEngine engine;
    assert(engine.update_score("", XP, Timeframe::Daily, 1).error == Error::InvalidEntity);
    assert(engine.update_score("A", static_cast<Category>(8), Timeframe::Daily, 1).error ==
           Error::InvalidCategory);
    assert(engine.update_score("A", XP, static_cast<Timeframe>(4), 1).error ==
           Error::InvalidTimeframe);
    assert(engine.partition_keys().empty());
    assert(engine.season_state(XP, Timeframe::Daily) == SeasonState::Uninitialized);

    // Zero for an absent entity: no entry, no activity
    auto r = engine.update_score("A", XP, Timeframe::Daily, 0);
    assert(r.ok() && r.admission == Admission::Ignored);
    assert(engine.entry_count(XP, Timeframe::Daily) == 0);
    assert(!engine.activity().is_active("A"));

    assert(engine.get_page(static_cast<Category>(9), Timeframe::Daily, 0, 10).empty());
    assert(engine.get_score("A", static_cast<Category>(9), Timeframe::Daily) == 0);

    std::cout << "  PASS" << std::endl;
}

void test_engine_increment() {
    std::cout << "Testing LeaderboardEngine increment..." << std::endl;

    LeaderboardEngine engine;
    auto r = engine.increment_score("A", XP, Timeframe::Monthly, 25);
    assert(r.ok() && r.score == 25);
    r = engine.increment_score("A", XP, Timeframe::Monthly, 5);
    assert(r.score == 30);

    engine.update_score("B", XP, Timeframe::Monthly, MAX_SCORE - 5);
    r = engine.increment_score("B", XP, Timeframe::Monthly, 10);
    assert(r.ok());
    assert(engine.get_score("B", XP, Timeframe::Monthly) == MAX_SCORE);

    auto us = engine.get_user_score("A", XP, Timeframe::Monthly);
    assert(us.score == 30 && us.rank == 2u);

    std::cout << "  PASS" << std::endl;
}

void test_engine_batch() {
    std::cout << "Testing LeaderboardEngine batch..." << std::endl;

    LeaderboardEngine engine;
    const auto quests = Category::QuestCompletion;

    auto b = engine.batch_update_scores({"a", "b"}, quests, Timeframe::AllTime, {1});
    assert(b.error == Error::ArrayLengthMismatch);
    b = engine.batch_update_scores({}, quests, Timeframe::AllTime, {});
    assert(b.error == Error::EmptyInput);
    b = engine.batch_update_scores({"a", ""}, quests, Timeframe::AllTime, {1, 2});
    assert(b.error == Error::InvalidEntity && b.failed_index == 1);
    assert(engine.entry_count(quests, Timeframe::AllTime) == 0);

    assert(engine.set_config(quests, Timeframe::AllTime, capped(2)) == Error::None);

    // Third element cannot get in: the whole batch is refused
    b = engine.batch_update_scores({"a", "b", "c"}, quests, Timeframe::AllTime, {30, 20, 10});
    assert(b.error == Error::NotAdmitted);
    assert(b.failed_index == 2);
    assert(engine.entry_count(quests, Timeframe::AllTime) == 0);
    assert(engine.activity().total_active() == 0);

    b = engine.batch_update_scores({"a", "b", "c"}, quests, Timeframe::AllTime, {10, 20, 30});
    assert(b.ok());
    assert(b.results.size() == 3);
    assert(b.results[2].admission == Admission::Replaced);
    assert(b.results[2].evicted->entity == "a");

    auto top = engine.get_top_entities(quests, Timeframe::AllTime, 10);
    assert(top.entities.size() == 2);
    assert(top.entities[0] == "c" && top.scores[0] == 30);
    assert(top.entities[1] == "b" && top.scores[1] == 20);
    assert(!engine.activity().is_active("a"));
    assert(engine.activity().total_active() == 2);
    assert(engine.check_invariants());

    std::cout << "  PASS" << std::endl;
}

void test_engine_cooldown() {
    std::cout << "Testing LeaderboardEngine cooldown..." << std::endl;

    Timestamp t = 1000;
    LeaderboardEngine engine;
    engine.set_clock([&t] { return t; });
    assert(engine.set_config(XP, Timeframe::Daily, capped(1000, 60)) == Error::None);

    assert(engine.update_score("A", XP, Timeframe::Daily, 10).ok());
    t = 1030;
    assert(engine.update_score("A", XP, Timeframe::Daily, 20).error == Error::CooldownActive);
    assert(engine.get_score("A", XP, Timeframe::Daily) == 10);
    assert(engine.update_score("B", XP, Timeframe::Daily, 5).ok());
    t = 1060;
    assert(engine.update_score("A", XP, Timeframe::Daily, 20).ok());

    // The same entity twice in one batch is rejected by the cooldown
    t = 2000;
    auto b = engine.batch_update_scores({"C", "C"}, XP, Timeframe::Daily, {1, 2});
    assert(b.error == Error::CooldownActive && b.failed_index == 1);
    assert(engine.get_score("C", XP, Timeframe::Daily) == 0);

    // Reset clears the stamps along with the entries
    assert(engine.update_score("B", XP, Timeframe::Daily, 6).ok());
    assert(engine.update_score("B", XP, Timeframe::Daily, 7).error == Error::CooldownActive);
    assert(engine.reset_leaderboard(XP, Timeframe::Daily) == Error::None);
    assert(engine.update_score("B", XP, Timeframe::Daily, 7).ok());

    // Eviction drops the evicted entity's stamp
    assert(engine.set_config(XP, Timeframe::Weekly, capped(1, 100)) == Error::None);
    assert(engine.update_score("X", XP, Timeframe::Weekly, 10).ok());
    assert(engine.update_score("Y", XP, Timeframe::Weekly, 20).ok());
    t = 2001;
    assert(engine.update_score("X", XP, Timeframe::Weekly, 30).ok());
    assert(engine.get_rank("X", XP, Timeframe::Weekly) == 1u);

    std::cout << "  PASS" << std::endl;
}

void test_engine_seasons() {
    std::cout << "Testing LeaderboardEngine seasons..." << std::endl;

    Timestamp t = 2000;
    LeaderboardEngine engine;
    engine.set_clock([&t] { return t; });
    const auto trading = Category::TradingVolume;

    assert(engine.start_new_season(trading, 100, Timeframe::Weekly) == Error::None);
    assert(engine.season_state(trading, Timeframe::Weekly) == SeasonState::Active);
    assert(engine.config(trading, Timeframe::Weekly).season_start == 2000);

    t = 2050;
    assert(engine.update_score("A", trading, Timeframe::Weekly, 5).ok());
    t = 2100;
    assert(engine.update_score("A", trading, Timeframe::Weekly, 6).error == Error::SeasonClosed);
    t = 1999;
    assert(engine.update_score("A", trading, Timeframe::Weekly, 6).error == Error::SeasonClosed);
    assert(engine.get_score("A", trading, Timeframe::Weekly) == 5);

    // Default timeframe is Daily; a negative duration means open-ended
    assert(engine.start_new_season(trading, -5) == Error::None);
    assert(engine.config(trading, Timeframe::Daily).season_duration == 0);
    t = 999999;
    assert(engine.update_score("A", trading, Timeframe::Daily, 1).ok());

    SeasonConfig off;
    off.is_active = false;
    assert(engine.set_config(trading, Timeframe::Monthly, off) == Error::None);
    assert(engine.season_state(trading, Timeframe::Monthly) == SeasonState::Inactive);
    assert(engine.update_score("A", trading, Timeframe::Monthly, 1).error ==
           Error::PartitionInactive);
    assert(engine.entry_count(trading, Timeframe::Monthly) == 0);

    std::cout << "  PASS" << std::endl;
}

void test_engine_set_config_shrink() {
    std::cout << "Testing LeaderboardEngine capacity shrink..." << std::endl;

    LeaderboardEngine engine;
    std::vector<Event> events;
    engine.events().subscribe([&events](const Event& ev) { events.push_back(ev); });

    engine.update_score("A", XP, Timeframe::Monthly, 30);
    engine.update_score("B", XP, Timeframe::Monthly, 20);
    engine.update_score("C", XP, Timeframe::Monthly, 10);
    engine.update_score("B", XP, Timeframe::Weekly, 5);
    events.clear();

    assert(engine.set_config(XP, Timeframe::Monthly, capped(1)) == Error::None);
    assert(engine.entry_count(XP, Timeframe::Monthly) == 1);
    assert(engine.partition(XP, Timeframe::Monthly)->capacity() == 1);
    assert(count_events(events, EventType::EntryEvicted) == 2);
    assert(count_events(events, EventType::ConfigChanged) == 1);

    // B is still ranked weekly, C is gone everywhere
    assert(engine.activity().is_active("B"));
    assert(!engine.activity().is_active("C"));
    assert(engine.activity().total_active() == 2);
    assert(engine.check_invariants());

    std::cout << "  PASS" << std::endl;
}

void test_engine_activity() {
    std::cout << "Testing LeaderboardEngine activity..." << std::endl;

    Timestamp t = 10000;
    EngineConfig cfg;
    cfg.inactivity_threshold = 100;
    LeaderboardEngine engine(cfg);
    engine.set_clock([&t] { return t; });

    engine.update_score("A", XP, Timeframe::Daily, 10);
    engine.update_score("A", XP, Timeframe::Weekly, 5);
    engine.update_score("A", Category::SocialEngagement, Timeframe::Daily, 1);
    CategoryMask both = (1u << index_of(XP)) | (1u << index_of(Category::SocialEngagement));
    assert(engine.activity().active_categories("A") == both);

    // Removed daily, still weekly: bit stays
    engine.update_score("A", XP, Timeframe::Daily, 0);
    assert(engine.activity().active_categories("A") == both);
    engine.update_score("A", XP, Timeframe::Weekly, 0);
    assert(engine.activity().active_categories("A") ==
           (1u << index_of(Category::SocialEngagement)));
    assert(engine.activity().total_active() == 1);

    engine.update_score("B", XP, Timeframe::Daily, 3);
    t = 10101;
    engine.update_score("B", XP, Timeframe::Daily, 4);

    auto cleaned = engine.cleanup_inactive({"A", "B", "nobody"});
    assert(cleaned.ok());
    assert(cleaned.cleaned.size() == 1 && cleaned.cleaned[0].entity == "A");
    assert(engine.activity().total_active() == 1);
    assert(engine.cleanup_inactive({"A"}).cleaned.empty());
    auto none = engine.cleanup_inactive({});
    assert(none.error == Error::EmptyInput && none.cleaned.empty());
    assert(engine.activity().total_active() == 1);
    assert(engine.check_invariants());

    std::cout << "  PASS" << std::endl;
}

void test_engine_gate() {
    std::cout << "Testing LeaderboardEngine access gate..." << std::endl;

    RoleGate gate("owner");
    LeaderboardEngine engine;
    engine.update_score("A", XP, Timeframe::AllTime, 10);

    engine.set_gate(gate.for_caller("mallory"));
    assert(engine.update_score("A", XP, Timeframe::AllTime, 99).error == Error::Unauthorized);
    assert(engine.reset_leaderboard(XP, Timeframe::AllTime) == Error::Unauthorized);
    assert(engine.cleanup_inactive({"A"}).error == Error::Unauthorized);
    assert(engine.batch_update_scores({"M"}, XP, Timeframe::AllTime, {1}).error ==
           Error::Unauthorized);
    assert(engine.get_score("A", XP, Timeframe::AllTime) == 10);

    gate.grant("mallory", Role::ScoreManager);
    assert(engine.update_score("M", XP, Timeframe::AllTime, 5).ok());
    assert(engine.set_config(XP, Timeframe::AllTime, capped(5)) == Error::Unauthorized);

    engine.set_gate(gate.for_caller("owner"));
    gate.pause();
    assert(engine.update_score("A", XP, Timeframe::AllTime, 11).error == Error::Paused);
    assert(engine.increment_score("A", XP, Timeframe::AllTime, 1).error == Error::Paused);
    assert(engine.set_config(XP, Timeframe::AllTime, capped(5)) == Error::None);
    assert(engine.start_new_season(XP, 0) == Error::None);
    assert(engine.get_leaderboard(XP, Timeframe::AllTime, 10).size() == 2);

    gate.unpause();
    assert(engine.update_score("A", XP, Timeframe::AllTime, 11).ok());

    gate.revoke("owner", Role::Admin);
    assert(engine.reset_leaderboard(XP, Timeframe::AllTime) == Error::Unauthorized);

    std::cout << "  PASS" << std::endl;
}

void test_engine_events() {
    std::cout << "Testing LeaderboardEngine events..." << std::endl;

    LeaderboardEngine engine;
    std::vector<Event> events;
    bool consistent = true;

    size_t token = engine.events().subscribe([&](const Event& ev) {
        events.push_back(ev);
        // Delivery happens after commit
        if (ev.type == EventType::ScoreUpdated) {
            auto c = static_cast<Category>(ev.category);
            if (engine.get_score(ev.entity, c, ev.timeframe) != ev.score) consistent = false;
            if (!engine.check_invariants()) consistent = false;
        }
    });

    engine.update_score("A", XP, Timeframe::AllTime, 100);
    assert(count_leaders(events, LeaderScope::Global) == 1);
    assert(count_leaders(events, LeaderScope::Category) == 1);
    assert(count_leaders(events, LeaderScope::Partition) == 1);
    assert(count_events(events, EventType::ScoreUpdated) == 1);
    assert(count_events(events, EventType::LeaderboardUpdated) == 1);
    assert(count_events(events, EventType::ActivityChanged) == 1);
    assert(count_events(events, EventType::ActiveCountChanged) == 1);

    events.clear();
    engine.update_score("B", XP, Timeframe::AllTime, 50);
    assert(count_events(events, EventType::NewLeader) == 0);

    events.clear();
    engine.update_score("B", XP, Timeframe::AllTime, 200);
    assert(count_events(events, EventType::NewLeader) == 3);
    assert(count_events(events, EventType::ActivityChanged) == 0);

    // Failed calls publish nothing
    events.clear();
    engine.update_score("", XP, Timeframe::AllTime, 1);
    assert(events.empty());

    engine.update_score("B", XP, Timeframe::AllTime, 0);
    assert(consistent);

    // Subscribers may call back into the engine
    engine.events().unsubscribe(token);
    engine.events().subscribe([&engine](const Event& ev) {
        if (ev.type == EventType::NewLeader && ev.scope == LeaderScope::Partition &&
            static_cast<Category>(ev.category) == XP) {
            engine.update_score(ev.entity, Category::SocialEngagement, Timeframe::AllTime, 1);
        }
    });
    assert(engine.events().subscriber_count() == 1);
    engine.update_score("Z", XP, Timeframe::Daily, 1);
    assert(engine.get_score("Z", Category::SocialEngagement, Timeframe::AllTime) == 1);
    assert(engine.check_invariants());

    std::cout << "  PASS" << std::endl;
}

// ═══════════════════════════════════════════════════════════════════
// StreakStats
// ═══════════════════════════════════════════════════════════════════

void test_streak_daily_stats() {
    std::cout << "Testing StreakStats daily stats..." << std::endl;

    Timestamp t = 100 * SECONDS_PER_DAY + 10;
    StreakStats stats;
    stats.set_clock([&t] { return t; });

    stats.update_activity("u", StreakType::DailyLogin, 3);
    stats.update_activity("u", StreakType::QuestCompletion, 2);
    stats.update_activity("u", StreakType::DailyLogin, 4);
    stats.update_activity("v", StreakType::DailyLogin, 1);

    auto d = stats.daily_stats(100);
    assert(d.active_users == 2);
    assert(d.total_activities == 4);
    assert(d.new_activations == 2);

    t += SECONDS_PER_DAY;
    stats.update_activity("u", StreakType::Trading, 1);
    d = stats.today();
    assert(d.active_users == 1 && d.total_activities == 1 && d.new_activations == 0);
    assert(stats.daily_stats(100).total_activities == 4);
    assert(stats.tracked_days() == 2);

    stats.update_activity("v", StreakType::DailyLogin, 0);
    assert(!stats.is_active("v"));
    assert(!stats.rank("v", StreakType::DailyLogin).has_value());

    // Zero from a stranger leaves no user record and no daily activity
    auto before = stats.today();
    size_t users = stats.tracked_users();
    auto z = stats.update_activity("stranger", StreakType::Trading, 0);
    assert(z.ok() && z.admission == Admission::Ignored && z.total == 0);
    assert(stats.tracked_users() == users);
    assert(stats.today().total_activities == before.total_activities);
    assert(stats.today().active_users == before.active_users);
    assert(stats.activity().tracked_entities() == 2);

    auto g = stats.global_stats();
    assert(g.total_active == 1);
    assert(g.total_updates == 5);
    assert(g.longest_global_streak == 7);
    assert(g.streak_leader == "u");
    assert(stats.type_update_count(StreakType::DailyLogin) == 3);
    assert(stats.type_update_count(StreakType::QuestCompletion) == 1);

    auto u = stats.user_stats("u");
    assert(u.total_streak == 7);
    assert(u.longest_streak == 4);
    assert(u.current[index_of(StreakType::DailyLogin)] == 4);
    assert(u.active_types == 0b111);
    assert(u.last_activity == t);

    auto totals = stats.totals_leaderboard(10);
    assert(!totals.empty() && totals[0].entity == "u" && totals[0].score == 7);

    assert(stats.prune_daily_stats(101) == Error::None);
    assert(stats.tracked_days() == 1);
    assert(stats.daily_stats(100).total_activities == 0);
    assert(stats.check_invariants());

    std::cout << "  PASS" << std::endl;
}

void test_streak_leaders() {
    std::cout << "Testing StreakStats leaders..." << std::endl;

    StreakStats sum;
    sum.update_activity("a", StreakType::DailyLogin, 5);
    sum.update_activity("a", StreakType::Trading, 5);
    auto r = sum.update_activity("b", StreakType::DailyLogin, 8);
    assert(r.ok() && !r.new_global_leader);
    assert(sum.global_stats().streak_leader == "a");
    r = sum.update_activity("b", StreakType::QuestCompletion, 3);
    assert(r.new_global_leader && r.total == 11);
    assert(sum.global_stats().longest_global_streak == 11);

    auto leaders = sum.type_leaders();
    assert(leaders.size() == STREAK_TYPE_COUNT);
    assert(leaders[index_of(StreakType::DailyLogin)].holder == "b");
    assert(leaders[index_of(StreakType::Trading)].holder == "a");
    assert(!leaders[index_of(StreakType::Governance)].held());

    sum.update_activity("a", StreakType::Governance, 9);
    sum.update_activity("b", StreakType::Governance, 9);
    assert(sum.type_leaders()[index_of(StreakType::Governance)].holder == "a");

    StreakStatsConfig cfg;
    cfg.aggregation = Aggregation::PerEvent;
    StreakStats per_event(cfg);
    r = per_event.update_activity("a", StreakType::DailyLogin, 5, 40);
    assert(r.new_global_leader);
    assert(per_event.global_stats().longest_global_streak == 40);
    per_event.update_activity("b", StreakType::DailyLogin, 50);
    assert(per_event.global_stats().streak_leader == "b");
    r = per_event.update_activity("c", StreakType::Trading, 1, 50);
    assert(!r.new_global_leader);
    assert(per_event.global_stats().streak_leader == "b");

    std::cout << "  PASS" << std::endl;
}

void test_streak_boards() {
    std::cout << "Testing StreakStats boards..." << std::endl;

    StreakStatsConfig cfg;
    cfg.board_capacity = 2;
    StreakStats stats(cfg);

    stats.update_activity("a", StreakType::DailyLogin, 10);
    stats.update_activity("b", StreakType::DailyLogin, 20);
    auto r = stats.update_activity("c", StreakType::DailyLogin, 5);
    assert(r.ok());
    assert(r.admission == Admission::NotAdmitted);
    assert(!r.rank.has_value());
    assert(stats.is_active("c"));
    assert(stats.user_stats("c").current[index_of(StreakType::DailyLogin)] == 5);

    auto board = stats.leaderboard(StreakType::DailyLogin, 10);
    assert(board.size() == 2);
    assert(board[0].entity == "b" && board[1].entity == "a");

    r = stats.update_activity("u", static_cast<StreakType>(9), 1);
    assert(r.error == Error::InvalidCategory);
    assert(stats.update_activity("", StreakType::Trading, 1).error == Error::InvalidEntity);
    assert(stats.leaderboard(static_cast<StreakType>(9), 10).empty());
    assert(stats.check_invariants());

    std::cout << "  PASS" << std::endl;
}

void test_streak_achievements() {
    std::cout << "Testing StreakStats achievements..." << std::endl;

    StreakStats stats;
    std::vector<Event> events;
    stats.events().subscribe([&events](const Event& ev) { events.push_back(ev); });

    assert(stats.record_achievement("u", MAX_SCORE - 1, 1) == Error::None);
    assert(stats.record_achievement("u", 10, 2) == Error::None);
    auto u = stats.user_stats("u");
    assert(u.total_achievements == 2);
    assert(u.total_xp == MAX_SCORE);
    assert(u.total_badges == 3);
    assert(count_events(events, EventType::AchievementRecorded) == 2);

    assert(stats.record_achievement("", 1, 1) == Error::InvalidEntity);
    assert(!stats.is_active("u"));

    std::cout << "  PASS" << std::endl;
}

void test_streak_reset_and_gate() {
    std::cout << "Testing StreakStats reset/gate..." << std::endl;

    StreakStats stats;
    stats.update_activity("u", StreakType::DailyLogin, 4);
    stats.update_activity("u", StreakType::QuestCompletion, 3);

    RoleGate gate("owner");
    stats.set_gate(gate.for_caller("owner"));
    gate.pause();
    assert(stats.update_activity("u", StreakType::Trading, 1).error == Error::Paused);
    assert(stats.record_achievement("u", 1, 1) == Error::Paused);
    assert(stats.reset_global_stats() == Error::None);
    gate.unpause();

    auto g = stats.global_stats();
    assert(g.longest_global_streak == 0);
    assert(g.streak_leader.empty());
    assert(g.total_updates == 0);
    assert(stats.leaderboard(StreakType::DailyLogin, 10).empty());
    assert(stats.totals_leaderboard(10).empty());
    assert(!stats.type_leaders()[0].held());

    // Per-user data survives
    assert(stats.user_stats("u").total_streak == 7);
    assert(stats.is_active("u"));

    auto r = stats.update_activity("u", StreakType::QuestCompletion, 3);
    assert(r.new_global_leader);
    assert(stats.global_stats().longest_global_streak == 7);

    assert(stats.cleanup_inactive({}).error == Error::EmptyInput);
    assert(stats.is_active("u"));

    stats.set_gate(gate.for_caller("stranger"));
    assert(stats.cleanup_inactive({"u"}).error == Error::Unauthorized);
    assert(stats.prune_daily_stats(0) == Error::Unauthorized);

    std::cout << "  PASS" << std::endl;
}

// ═══════════════════════════════════════════════════════════════════
// SqliteStore
// ═══════════════════════════════════════════════════════════════════

void test_store_roundtrip() {
    std::cout << "Testing SqliteStore round trip..." << std::endl;

    const std::string path = "/tmp/podium_store_test.db";
    std::remove(path.c_str());

    Timestamp t = 100 * SECONDS_PER_DAY + 50;
    {
        LeaderboardEngine engine;
        StreakStats stats;
        engine.set_clock([&t] { return t; });
        stats.set_clock([&t] { return t; });

        assert(engine.set_config(XP, Timeframe::Weekly, capped(5, 30)) == Error::None);
        engine.update_score("A", XP, Timeframe::AllTime, 100);
        engine.update_score("B", XP, Timeframe::AllTime, 100);
        engine.update_score("C", XP, Timeframe::AllTime, 50);
        engine.update_score("D", XP, Timeframe::Weekly, 10);
        engine.update_score("A", Category::TradingVolume, Timeframe::AllTime, 70);

        stats.update_activity("a", StreakType::DailyLogin, 6);
        stats.update_activity("a", StreakType::Trading, 2);
        stats.update_activity("b", StreakType::DailyLogin, 3);
        stats.record_achievement("b", 250, 1);

        SqliteStore store(path);
        assert(store.open());
        assert(store.schema_version() == PODIUM_SCHEMA_VERSION);
        assert(!store.has_engine_state());
        assert(store.save(engine));
        assert(store.save(stats));
        assert(store.has_engine_state());
        assert(store.has_streak_state());

        store.close();
        assert(!store.is_open());
        assert(!store.save(engine));
    }

    t += 10;
    {
        SqliteStore store(path);
        assert(store.open());

        LeaderboardEngine engine;
        engine.set_clock([&t] { return t; });
        assert(store.load(engine));

        auto lb = engine.get_leaderboard(XP, Timeframe::AllTime, 10);
        assert(lb.size() == 3);
        assert(lb[0].entity == "A" && lb[1].entity == "B" && lb[2].entity == "C");
        assert(engine.get_rank("B", XP, Timeframe::AllTime) == 2u);
        assert(engine.config(XP, Timeframe::Weekly).max_entries == 5);
        assert(engine.config(XP, Timeframe::Weekly).update_cooldown == 30);
        assert(engine.partition(XP, Timeframe::Weekly)->capacity() == 5);
        assert(engine.season_state(XP, Timeframe::AllTime) == SeasonState::Active);
        assert(engine.activity().total_active() == 4);
        assert(engine.records().best().holder == "A");
        assert(engine.records().category_best(index_of(Category::TradingVolume))->value == 70);
        assert(engine.check_invariants());

        // Cooldown stamps survive
        assert(engine.update_score("D", XP, Timeframe::Weekly, 11).error == Error::CooldownActive);

        StreakStats stats;
        stats.set_clock([&t] { return t; });
        assert(store.load(stats));

        auto g = stats.global_stats();
        assert(g.longest_global_streak == 8 && g.streak_leader == "a");
        assert(g.total_updates == 3);
        assert(g.total_active == 2);
        assert(stats.user_stats("b").total_xp == 250);
        assert(stats.user_stats("a").current[index_of(StreakType::Trading)] == 2);
        assert(stats.leaderboard(StreakType::DailyLogin, 10)[0].entity == "a");
        assert(stats.type_leaders()[index_of(StreakType::DailyLogin)].value == 6);

        // Same day after reload: no double count
        stats.update_activity("a", StreakType::DailyLogin, 7);
        auto d = stats.daily_stats(100);
        assert(d.active_users == 2);
        assert(d.total_activities == 4);
        assert(stats.check_invariants());
    }

    // A corrupt row leaves memory untouched
    {
        sqlite3* db = nullptr;
        assert(sqlite3_open(path.c_str(), &db) == SQLITE_OK);
        int rc = sqlite3_exec(db, "UPDATE entries SET score = 999 WHERE category = 0 "
                                  "AND timeframe = 3 AND position = 2",
                              nullptr, nullptr, nullptr);
        assert(rc == SQLITE_OK);
        sqlite3_close(db);

        SqliteStore store(path);
        assert(store.open());
        LeaderboardEngine engine;
        engine.update_score("X", XP, Timeframe::AllTime, 1);
        assert(!store.load(engine));
        assert(engine.get_score("X", XP, Timeframe::AllTime) == 1);
        assert(engine.entry_count(XP, Timeframe::AllTime) == 1);
    }

    std::remove(path.c_str());
    std::cout << "  PASS" << std::endl;
}

void set_user_version(const std::string& path, int version) {
    sqlite3* db = nullptr;
    assert(sqlite3_open(path.c_str(), &db) == SQLITE_OK);
    std::string sql = "PRAGMA user_version = " + std::to_string(version);
    assert(sqlite3_exec(db, sql.c_str(), nullptr, nullptr, nullptr) == SQLITE_OK);
    sqlite3_close(db);
}

void test_store_schema() {
    std::cout << "Testing SqliteStore schema versions..." << std::endl;

    const std::string path = "/tmp/podium_schema_test.db";
    const std::string backup = path + ".bak.v1";
    std::remove(path.c_str());
    std::remove(backup.c_str());

    // Older schema: backed up, then upgraded in place
    set_user_version(path, 1);
    {
        SqliteStore store(path);
        assert(store.open());
        assert(store.schema_version() == PODIUM_SCHEMA_VERSION);
    }
    FILE* f = std::fopen(backup.c_str(), "rb");
    assert(f != nullptr);
    std::fclose(f);

    // Newer schema: refused
    set_user_version(path, PODIUM_SCHEMA_VERSION + 1);
    {
        SqliteStore store(path);
        assert(!store.open());
        assert(!store.is_open());
    }

    std::remove(path.c_str());
    std::remove(backup.c_str());
    std::cout << "  PASS" << std::endl;
}

// ═══════════════════════════════════════════════════════════════════
// JSON-RPC
// ═══════════════════════════════════════════════════════════════════

json call(rpc::Handler& handler, const std::string& method, const json& params) {
    static int next_id = 0;
    json request = {
        {"jsonrpc", "2.0"},
        {"id", ++next_id},
        {"method", method},
        {"params", params}
    };
    return json::parse(handler.handle(request.dump()));
}

void test_rpc_handler() {
    std::cout << "Testing RPC handler..." << std::endl;

    LeaderboardEngine engine;
    StreakStats stats;
    rpc::Handler handler(engine, stats);

    auto r = call(handler, "leaderboard/update_score",
                  {{"entity", "A"}, {"category", "xp_total"}, {"timeframe", "all_time"},
                   {"score", 100}});
    assert(r.contains("result"));
    assert(r["result"]["rank"] == 1);
    assert(r["result"]["admission"] == "inserted");
    assert(handler.take_dirty());
    assert(!handler.take_dirty());

    r = call(handler, "leaderboard/get_score",
             {{"entity", "A"}, {"category", 0}, {"timeframe", 3}});
    assert(r["result"]["score"] == 100);
    assert(!handler.take_dirty());

    r = call(handler, "leaderboard/update_score",
             {{"entity", "A"}, {"category", 42}, {"timeframe", "all_time"}, {"score", 1}});
    assert(r["error"]["code"] == rpc::error::ENGINE_ERROR);
    assert(r["error"]["data"]["error"] == "invalid_category");
    assert(!handler.take_dirty());

    r = call(handler, "leaderboard/update_score", {{"entity", "A"}, {"category", 0}});
    assert(r["error"]["code"] == rpc::error::INVALID_PARAMS);

    r = call(handler, "leaderboard/update_score",
             {{"entity", "A"}, {"category", 0}, {"timeframe", 3}, {"score", -4}});
    assert(r["error"]["code"] == rpc::error::INVALID_PARAMS);

    r = call(handler, "leaderboard/set_config",
             {{"category", 0}, {"timeframe", 3}, {"config", {{"max_entries", 1}}}});
    assert(r["result"]["config"]["max_entries"] == 1);
    r = call(handler, "leaderboard/update_score",
             {{"entity", "B"}, {"category", 0}, {"timeframe", 3}, {"score", 100}});
    assert(r["error"]["data"]["error"] == "not_admitted");

    // Numbers that do not fit the field are refused, never wrapped
    for (const json& bad : {json(-1), json(4294967298ull), json(2.5), json("7")}) {
        r = call(handler, "leaderboard/set_config",
                 {{"category", 0}, {"timeframe", 3}, {"config", {{"max_entries", bad}}}});
        assert(r["error"]["code"] == rpc::error::INVALID_PARAMS);
    }
    assert(engine.config(XP, Timeframe::AllTime).max_entries == 1);
    assert(!handler.take_dirty());

    r = call(handler, "streaks/achievement", {{"entity", "u"}, {"xp", -5}});
    assert(r["error"]["code"] == rpc::error::INVALID_PARAMS);
    r = call(handler, "streaks/achievement", {{"entity", "u"}, {"badges", -1}});
    assert(r["error"]["code"] == rpc::error::INVALID_PARAMS);
    auto big = json::parse(handler.handle(
        R"({"jsonrpc":"2.0","id":7,"method":"streaks/achievement",)"
        R"("params":{"entity":"u","xp":18446744073709551616}})"));
    assert(big["error"]["code"] == rpc::error::INVALID_PARAMS);
    assert(stats.user_stats("u").total_xp == 0);
    assert(stats.user_stats("u").total_achievements == 0);
    r = call(handler, "leaderboard/get", {{"category", 0}, {"timeframe", 3}, {"limit", -1}});
    assert(r["error"]["code"] == rpc::error::INVALID_PARAMS);

    r = call(handler, "streaks/update",
             {{"entity", "u"}, {"type", "daily_login"}, {"streak", 3}});
    assert(r["result"]["total"] == 3);
    r = call(handler, "streaks/global", json::object());
    assert(r["result"]["streak_leader"] == "u");

    r = call(handler, "no/such_method", json::object());
    assert(r["error"]["code"] == rpc::error::METHOD_NOT_FOUND);

    auto raw = json::parse(handler.handle("{not json"));
    assert(raw["error"]["code"] == rpc::error::PARSE_ERROR);
    raw = json::parse(handler.handle(R"({"id":1,"method":"initialize"})"));
    assert(raw["error"]["code"] == rpc::error::INVALID_REQUEST);

    r = call(handler, "methods/list", json::object());
    assert(r["result"]["methods"].size() == handler.method_names().size());

    std::cout << "  PASS" << std::endl;
}

void test_rpc_reads() {
    std::cout << "Testing RPC reads and admin methods..." << std::endl;

    LeaderboardEngine engine;
    StreakStats stats;
    Timestamp t = 1700000000;
    engine.set_clock([&t] { return t; });
    stats.set_clock([&t] { return t; });
    rpc::Handler handler(engine, stats);

    json key = {{"category", "xp_total"}, {"timeframe", "all_time"}};
    json batch = key;
    batch["entities"] = {"A", "B", "C"};
    batch["scores"] = {30, 50, 10};
    auto r = call(handler, "leaderboard/batch_update", batch);
    assert(r["result"]["applied"] == 3);

    batch["entities"] = json::array({"D"});
    r = call(handler, "leaderboard/batch_update", batch);
    assert(r["error"]["data"]["error"] == "array_length_mismatch");

    json inc = key;
    inc["entity"] = "C";
    inc["delta"] = 35;
    r = call(handler, "leaderboard/increment_score", inc);
    assert(r["result"]["score"] == 45);
    assert(r["result"]["rank"] == 2);

    json get = key;
    get["limit"] = 2;
    r = call(handler, "leaderboard/get", get);
    assert(r["result"]["size"] == 3);
    assert(r["result"]["entries"].size() == 2);
    assert(r["result"]["entries"][0]["entity"] == "B");
    assert(r["result"]["entries"][1]["entity"] == "C");

    json page = key;
    page["offset"] = 2;
    page["count"] = 5;
    r = call(handler, "leaderboard/page", page);
    assert(r["result"]["entries"].size() == 1);
    assert(r["result"]["entries"][0]["entity"] == "A");
    assert(r["result"]["entries"][0]["rank"] == 3);
    page["offset"] = 10;
    assert(call(handler, "leaderboard/page", page)["result"]["entries"].empty());

    r = call(handler, "leaderboard/top", key);
    assert((r["result"]["entities"] == json::array({"B", "C", "A"})));
    assert((r["result"]["scores"] == json::array({50, 45, 30})));

    r = call(handler, "leaderboard/config", key);
    assert(r["result"]["state"] == "active");
    assert(r["result"]["config"]["is_active"] == true);

    r = call(handler, "activity/get", {{"entity", "A"}});
    assert(r["result"]["mask"] == 1);
    assert(r["result"]["active"] == true);
    assert(r["result"]["total_active"] == 3);

    r = call(handler, "records/get", json::object());
    assert(r["result"]["best"]["holder"] == "B");
    assert(r["result"]["best"]["value"] == 50);
    assert(r["result"]["categories"]["xp_total"]["holder"] == "B");
    assert(r["result"]["categories"]["trading_volume"]["holder"].is_null());

    // Season window on the daily board
    r = call(handler, "leaderboard/start_season", {{"category", "xp_total"}, {"duration", 3600}});
    assert(r["result"]["config"]["season_start"] == t);
    assert(r["result"]["config"]["season_end"] == t + 3600);
    r = call(handler, "leaderboard/start_season", {{"category", "xp_total"}, {"duration", -1}});
    assert(r["error"]["code"] == rpc::error::INVALID_PARAMS);
    json daily = {{"entity", "A"}, {"category", "xp_total"}, {"timeframe", "daily"},
                  {"score", 5}};
    assert(call(handler, "leaderboard/update_score", daily).contains("result"));
    t += 3600;
    r = call(handler, "leaderboard/update_score", daily);
    assert(r["error"]["data"]["error"] == "season_closed");

    // Idle for eight days
    t += 8 * 86400;
    r = call(handler, "leaderboard/cleanup", {{"entities", {"A", "ghost"}}});
    assert((r["result"]["cleaned"] == json::array({"A"})));
    assert(r["result"]["total_active"] == 2);
    assert(call(handler, "leaderboard/get_score",
                {{"entity", "A"}, {"category", 0}, {"timeframe", 3}})["result"]["score"] == 30);

    // Streak surface
    assert(call(handler, "streaks/update",
                {{"entity", "u"}, {"type", "trading"}, {"streak", 4}}).contains("result"));
    assert(call(handler, "streaks/update",
                {{"entity", "v"}, {"type", "trading"}, {"streak", 9}}).contains("result"));
    r = call(handler, "streaks/update", {{"entity", "u"}, {"type", "nope"}, {"streak", 1}});
    assert(r["error"]["data"]["error"] == "invalid_category");

    r = call(handler, "streaks/leaderboard", {{"type", "trading"}, {"limit", 5}});
    assert(r["result"]["entries"].size() == 2);
    assert(r["result"]["entries"][0]["entity"] == "v");
    r = call(handler, "streaks/totals", json::object());
    assert(r["result"]["entries"][0]["entity"] == "v");
    r = call(handler, "streaks/leaders", json::object());
    assert(r["result"]["trading"]["holder"] == "v");
    assert(r["result"]["trading"]["value"] == 9);
    assert(r["result"]["governance"]["holder"].is_null());

    r = call(handler, "streaks/achievement", {{"entity", "u"}, {"xp", 40}, {"badges", 2}});
    assert(r["result"]["total_xp"] == 40);
    assert(r["result"]["total_badges"] == 2);
    assert(r["result"]["total_achievements"] == 1);
    r = call(handler, "streaks/user", {{"entity", "u"}});
    assert(r["result"]["current"]["trading"] == 4);
    assert(r["result"]["longest_streak"] == 4);

    r = call(handler, "streaks/daily", json::object());
    assert(r["result"]["day"] == day_index(t));
    assert(r["result"]["active_users"] == 2);
    assert(r["result"]["total_activities"] == 2);
    r = call(handler, "streaks/daily", {{"day", day_index(t) - 30}});
    assert(r["result"]["active_users"] == 0);

    t += 8 * 86400;
    r = call(handler, "streaks/cleanup", {{"entities", json::array()}});
    assert(r["error"]["data"]["error"] == "empty_input");
    r = call(handler, "streaks/cleanup", {{"entities", {"u", "v"}}});
    assert(r["result"]["cleaned"].size() == 2);
    assert(r["result"]["total_active"] == 0);

    assert(call(handler, "streaks/reset", json::object())["result"]["reset"] == true);
    r = call(handler, "streaks/leaders", json::object());
    assert(r["result"]["trading"]["holder"].is_null());
    r = call(handler, "streaks/user", {{"entity", "u"}});
    assert(r["result"]["total_xp"] == 40);

    std::cout << "  PASS" << std::endl;
}

void test_rpc_access() {
    std::cout << "Testing RPC access control..." << std::endl;

    LeaderboardEngine engine;
    StreakStats stats;
    RoleGate gate("owner");
    {
        rpc::Handler handler(engine, stats, &gate, {"owner"});

        json update = {{"entity", "A"}, {"category", 0}, {"timeframe", 3}, {"score", 5},
                       {"caller", "eve"}};
        auto r = call(handler, "leaderboard/update_score", update);
        assert(r["error"]["code"] == rpc::error::ACCESS_DENIED);
        assert(r["error"]["data"]["error"] == "unauthorized");

        r = call(handler, "access/grant",
                 {{"account", "eve"}, {"role", "score_manager"}, {"caller", "eve"}});
        assert(r["error"]["code"] == rpc::error::ACCESS_DENIED);

        r = call(handler, "access/grant", {{"account", "eve"}, {"role", "score_manager"}});
        assert(r.contains("result"));
        assert(call(handler, "leaderboard/update_score", update).contains("result"));

        assert(call(handler, "access/pause", json::object()).contains("result"));
        r = call(handler, "leaderboard/update_score", update);
        assert(r["error"]["data"]["error"] == "paused");
        r = call(handler, "leaderboard/reset", {{"category", 0}, {"timeframe", 3}});
        assert(r["result"]["reset"] == true);
        assert(call(handler, "access/unpause", json::object()).contains("result"));
    }

    // Handler gone: engines fall back to open access
    assert(engine.update_score("A", XP, Timeframe::AllTime, 9).ok());

    std::cout << "  PASS" << std::endl;
}

void test_rpc_persist() {
    std::cout << "Testing RPC persistence failures..." << std::endl;

    const std::string path = "/tmp/podium_rpc_persist_test.db";
    std::remove(path.c_str());

    LeaderboardEngine engine;
    StreakStats stats;
    SqliteStore store(path);
    assert(store.open());
    rpc::HandlerContext ctx{"", [&] { return store.persist(engine, stats); }};
    rpc::Handler handler(engine, stats, nullptr, ctx);

    json update = {{"entity", "A"}, {"category", 0}, {"timeframe", 3}, {"score", 100}};
    assert(call(handler, "leaderboard/update_score", update).contains("result"));
    assert(handler.take_dirty());

    // A second connection makes every write to entries fail
    sqlite3* db = nullptr;
    assert(sqlite3_open(path.c_str(), &db) == SQLITE_OK);
    assert(sqlite3_exec(db, "CREATE TRIGGER refuse_entries BEFORE INSERT ON entries "
                            "BEGIN SELECT RAISE(ABORT, 'disk full'); END",
                        nullptr, nullptr, nullptr) == SQLITE_OK);

    update["entity"] = "B";
    update["score"] = 150;
    auto r = call(handler, "leaderboard/update_score", update);
    assert(r["error"]["code"] == rpc::error::STORE_ERROR);
    assert(r["error"]["data"]["error"] == "store_error");
    assert(!handler.take_dirty());

    // Memory went back to what the file holds
    assert(engine.get_score("B", XP, Timeframe::AllTime) == 0);
    assert(engine.get_rank("A", XP, Timeframe::AllTime) == 1u);
    assert(engine.entry_count(XP, Timeframe::AllTime) == 1);
    assert(!engine.activity().is_active("B"));

    assert(sqlite3_exec(db, "DROP TRIGGER refuse_entries", nullptr, nullptr, nullptr) == SQLITE_OK);
    sqlite3_close(db);

    r = call(handler, "leaderboard/update_score", update);
    assert(r["result"]["rank"] == 1);
    {
        LeaderboardEngine reloaded;
        SqliteStore other(path);
        assert(other.open());
        assert(other.load(reloaded));
        assert(reloaded.get_score("B", XP, Timeframe::AllTime) == 150);
        assert(reloaded.get_rank("A", XP, Timeframe::AllTime) == 2u);
    }

    store.close();
    std::remove(path.c_str());
    std::cout << "  PASS" << std::endl;
}

int main() {
    std::cout << "=== Podium C++ Tests ===" << std::endl;
    std::cout << "podium " << PODIUM_VERSION << ", schema " << PODIUM_SCHEMA_VERSION << std::endl;
    std::cout << std::endl;

    test_partition_ordering();
    test_partition_eviction();
    test_partition_ties();
    test_partition_remove_and_page();
    test_activity_mask();
    test_activity_cleanup();
    test_global_record();

    std::cout << std::endl;
    std::cout << "=== Engine Tests ===" << std::endl;
    test_engine_reset();
    test_engine_validation();
    test_engine_increment();
    test_engine_batch();
    test_engine_cooldown();
    test_engine_seasons();
    test_engine_set_config_shrink();
    test_engine_activity();
    test_engine_gate();
    test_engine_events();

    std::cout << std::endl;
    std::cout << "=== Streak Tests ===" << std::endl;
    test_streak_daily_stats();
    test_streak_leaders();
    test_streak_boards();
    test_streak_achievements();
    test_streak_reset_and_gate();

    std::cout << std::endl;
    std::cout << "=== Store & RPC Tests ===" << std::endl;
    test_store_roundtrip();
    test_store_schema();
    test_rpc_handler();
    test_rpc_reads();
    test_rpc_access();
    test_rpc_persist();

    std::cout << std::endl;
    std::cout << "=== All tests passed! ===" << std::endl;
    return 0;
}
