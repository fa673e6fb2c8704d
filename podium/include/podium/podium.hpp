#pragma once
// Podium: bounded ranked registries and aggregate statistics
//
// - Types: entities, scores, categories, timeframes, errors
// - ScorePartition: rank-ordered bounded registry per (category, timeframe)
// - ActivityMask: per-entity category bits + global active count
// - GlobalRecord: monotonic best-ever tracker
// - SeasonConfig: write gate (active flag, season window, cooldown)
// - LeaderboardEngine: the partitions behind one atomic API
// - StreakStats: streak boards, leaders and daily statistics
// - SqliteStore: persistence

#include "types.hpp"
#include "score_partition.hpp"
#include "activity_mask.hpp"
#include "global_record.hpp"
#include "season_config.hpp"
#include "events.hpp"
#include "access.hpp"
#include "leaderboard_engine.hpp"
#include "streak_stats.hpp"
#include "sqlite_store.hpp"
#include "version.hpp"
