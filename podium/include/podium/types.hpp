#pragma once
// Core types: entities, scores, partition keys, error codes
//
// Scores are unsigned and saturate instead of wrapping.
// Time is Unix seconds. Every enum that arrives from outside is
// range-checked at the boundary before it indexes anything.

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <limits>
#include <optional>
#include <string>

namespace podium {

// Entity identifier (wallet address, user id, ...). Empty is invalid.
using EntityId = std::string;

using Score = uint64_t;

// Timestamp as Unix seconds
using Timestamp = int64_t;

constexpr int64_t SECONDS_PER_DAY = 24 * 60 * 60;

inline Timestamp now() {
    auto duration = std::chrono::system_clock::now().time_since_epoch();
    return std::chrono::duration_cast<std::chrono::seconds>(duration).count();
}

// Injectable time source; engines default to now()
using Clock = std::function<Timestamp()>;

inline int64_t day_index(Timestamp t) {
    return t / SECONDS_PER_DAY;
}

constexpr Score MAX_SCORE = std::numeric_limits<Score>::max();

inline Score saturating_add(Score a, Score b) {
    return (b > MAX_SCORE - a) ? MAX_SCORE : a + b;
}

// Leaderboard categories
enum class Category : uint8_t {
    XpTotal = 0,
    TradingVolume = 1,
    QuestCompletion = 2,
    GovernanceParticipation = 3,
    ReferralCount = 4,
    StreakLength = 5,
    GuildContribution = 6,
    SocialEngagement = 7,
};

constexpr size_t CATEGORY_COUNT = 8;

enum class Timeframe : uint8_t {
    Daily = 0,
    Weekly = 1,
    Monthly = 2,
    AllTime = 3,
};

constexpr size_t TIMEFRAME_COUNT = 4;

// Streak kinds tracked by StreakStats
enum class StreakType : uint8_t {
    DailyLogin = 0,
    QuestCompletion = 1,
    Trading = 2,
    Governance = 3,
    SocialInteraction = 4,
};

constexpr size_t STREAK_TYPE_COUNT = 5;

inline bool valid(Category c) { return static_cast<size_t>(c) < CATEGORY_COUNT; }
inline bool valid(Timeframe t) { return static_cast<size_t>(t) < TIMEFRAME_COUNT; }
inline bool valid(StreakType s) { return static_cast<size_t>(s) < STREAK_TYPE_COUNT; }

inline size_t index_of(Category c) { return static_cast<size_t>(c); }
inline size_t index_of(Timeframe t) { return static_cast<size_t>(t); }
inline size_t index_of(StreakType s) { return static_cast<size_t>(s); }

inline std::string category_name(Category c) {
    switch (c) {
        case Category::XpTotal: return "xp_total";
        case Category::TradingVolume: return "trading_volume";
        case Category::QuestCompletion: return "quest_completion";
        case Category::GovernanceParticipation: return "governance_participation";
        case Category::ReferralCount: return "referral_count";
        case Category::StreakLength: return "streak_length";
        case Category::GuildContribution: return "guild_contribution";
        case Category::SocialEngagement: return "social_engagement";
        default: return "unknown";
    }
}

inline std::string timeframe_name(Timeframe t) {
    switch (t) {
        case Timeframe::Daily: return "daily";
        case Timeframe::Weekly: return "weekly";
        case Timeframe::Monthly: return "monthly";
        case Timeframe::AllTime: return "all_time";
        default: return "unknown";
    }
}

inline std::string streak_type_name(StreakType s) {
    switch (s) {
        case StreakType::DailyLogin: return "daily_login";
        case StreakType::QuestCompletion: return "quest_completion";
        case StreakType::Trading: return "trading";
        case StreakType::Governance: return "governance";
        case StreakType::SocialInteraction: return "social_interaction";
        default: return "unknown";
    }
}

// Parse by name or numeric index; nullopt for anything out of range
inline std::optional<Category> category_from_string(const std::string& s) {
    for (size_t i = 0; i < CATEGORY_COUNT; ++i) {
        auto c = static_cast<Category>(i);
        if (s == category_name(c) || s == std::to_string(i)) return c;
    }
    return std::nullopt;
}

inline std::optional<Timeframe> timeframe_from_string(const std::string& s) {
    for (size_t i = 0; i < TIMEFRAME_COUNT; ++i) {
        auto t = static_cast<Timeframe>(i);
        if (s == timeframe_name(t) || s == std::to_string(i)) return t;
    }
    return std::nullopt;
}

// (category, timeframe) partition key
struct PartitionKey {
    Category category = Category::XpTotal;
    Timeframe timeframe = Timeframe::AllTime;

    bool operator==(const PartitionKey& other) const {
        return category == other.category && timeframe == other.timeframe;
    }

    std::string to_string() const {
        return category_name(category) + "/" + timeframe_name(timeframe);
    }
};

struct PartitionKeyHash {
    size_t operator()(const PartitionKey& k) const {
        return std::hash<uint16_t>{}(
            static_cast<uint16_t>((index_of(k.category) << 8) | index_of(k.timeframe)));
    }
};

// Failure taxonomy. Every mutating entry point reports one of these;
// anything other than None means nothing changed.
enum class Error : uint8_t {
    None = 0,
    InvalidCategory,
    InvalidTimeframe,
    InvalidEntity,
    ArrayLengthMismatch,
    EmptyInput,
    NotAdmitted,        // partition full and score not above the lowest entry
    PartitionInactive,
    SeasonClosed,       // outside [seasonStartTime, seasonStartTime + seasonDuration)
    CooldownActive,
    Unauthorized,       // raised by the injected access gate only
    Paused,             // raised by the injected access gate only
};

inline std::string error_name(Error e) {
    switch (e) {
        case Error::None: return "none";
        case Error::InvalidCategory: return "invalid_category";
        case Error::InvalidTimeframe: return "invalid_timeframe";
        case Error::InvalidEntity: return "invalid_entity";
        case Error::ArrayLengthMismatch: return "array_length_mismatch";
        case Error::EmptyInput: return "empty_input";
        case Error::NotAdmitted: return "not_admitted";
        case Error::PartitionInactive: return "partition_inactive";
        case Error::SeasonClosed: return "season_closed";
        case Error::CooldownActive: return "cooldown_active";
        case Error::Unauthorized: return "unauthorized";
        case Error::Paused: return "paused";
        default: return "unknown";
    }
}

} // namespace podium
