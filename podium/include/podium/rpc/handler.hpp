#pragma once
// RPC Handler: JSON-RPC 2.0 dispatcher over the engine and streak stats
//
// One request per call to handle(). Engine errors come back as JSON-RPC
// errors carrying the stable error name in error.data.error, so clients
// can tell NotAdmitted from CooldownActive without parsing messages.
//
// Persistence: when the context carries a persist hook, a mutation is
// only reported as a success once the hook has stored it.
//
// Access: each request may name a "caller" in its params. When a RoleGate
// is attached, the engines' capability checks are answered for that
// caller; without one every call is allowed.

#include "protocol.hpp"
#include "../access.hpp"
#include "../leaderboard_engine.hpp"
#include "../log.hpp"
#include "../streak_stats.hpp"
#include "../version.hpp"
#include <functional>
#include <iostream>
#include <limits>
#include <string>
#include <type_traits>
#include <unordered_map>
#include <utility>
#include <vector>

namespace podium::rpc {

using json = nlohmann::json;

inline const json& require(const json& params, const char* key) {
    if (!params.is_object() || !params.contains(key)) {
        throw ParamError(std::string("Missing required parameter: ") + key);
    }
    return params[key];
}

// Integers must fit T exactly; negative or oversized values are refused
template<typename T>
inline T integer_value(const json& v, const char* key) {
    using limits = std::numeric_limits<T>;
    if (v.is_number_unsigned()) {
        auto n = v.get<uint64_t>();
        if (n <= static_cast<uint64_t>(limits::max())) return static_cast<T>(n);
    } else if (v.is_number_integer()) {
        auto n = v.get<int64_t>();
        if (n >= 0) {
            if (static_cast<uint64_t>(n) <= static_cast<uint64_t>(limits::max())) {
                return static_cast<T>(n);
            }
        } else if (std::is_signed<T>::value && n >= static_cast<int64_t>(limits::min())) {
            return static_cast<T>(n);
        }
    }
    throw ParamError(std::string("Parameter out of range: ") + key);
}

// Safe parameter access with default
template<typename T>
inline T get_param(const json& params, const char* key, T default_val) {
    if (params.is_object() && params.contains(key)) {
        if constexpr (std::is_integral<T>::value && !std::is_same<T, bool>::value) {
            return integer_value<T>(params[key], key);
        } else {
            try {
                return params[key].get<T>();
            } catch (const json::exception&) {
                throw ParamError(std::string("Invalid parameter: ") + key);
            }
        }
    }
    return default_val;
}

inline Score score_value(const json& v, const char* key) {
    return integer_value<Score>(v, key);
}

inline Score score_param(const json& params, const char* key) {
    return score_value(require(params, key), key);
}

inline std::string entity_param(const json& params, const char* key = "entity") {
    const auto& v = require(params, key);
    if (!v.is_string()) throw ParamError(std::string("Parameter must be a string: ") + key);
    return v.get<std::string>();
}

// Names or indices; out-of-range values surface as engine errors
inline Category category_param(const json& params, const char* key = "category") {
    const auto& v = require(params, key);
    if (v.is_number_integer()) {
        auto n = v.get<int64_t>();
        if (n < 0 || n > 255) throw EngineError(Error::InvalidCategory);
        return static_cast<Category>(n);
    }
    if (v.is_string()) {
        auto c = category_from_string(v.get<std::string>());
        if (!c) throw EngineError(Error::InvalidCategory);
        return *c;
    }
    throw ParamError(std::string("Invalid parameter: ") + key);
}

inline Timeframe timeframe_param(const json& params, const char* key = "timeframe") {
    const auto& v = require(params, key);
    if (v.is_number_integer()) {
        auto n = v.get<int64_t>();
        if (n < 0 || n > 255) throw EngineError(Error::InvalidTimeframe);
        return static_cast<Timeframe>(n);
    }
    if (v.is_string()) {
        auto t = timeframe_from_string(v.get<std::string>());
        if (!t) throw EngineError(Error::InvalidTimeframe);
        return *t;
    }
    throw ParamError(std::string("Invalid parameter: ") + key);
}

inline StreakType streak_type_param(const json& params, const char* key = "type") {
    const auto& v = require(params, key);
    if (v.is_number_integer()) {
        auto n = v.get<int64_t>();
        if (n < 0 || n > 255) throw EngineError(Error::InvalidCategory);
        return static_cast<StreakType>(n);
    }
    if (v.is_string()) {
        std::string s = v.get<std::string>();
        for (size_t i = 0; i < STREAK_TYPE_COUNT; ++i) {
            auto t = static_cast<StreakType>(i);
            if (s == streak_type_name(t) || s == std::to_string(i)) return t;
        }
        throw EngineError(Error::InvalidCategory);
    }
    throw ParamError(std::string("Invalid parameter: ") + key);
}

inline void check(Error e) {
    if (e != Error::None) throw EngineError(e);
}

// ═══════════════════════════════════════════════════════════════════
// Result encoding
// ═══════════════════════════════════════════════════════════════════

inline json rank_json(const std::optional<uint32_t>& rank) {
    return rank ? json(*rank) : json();
}

inline json ranked_json(const std::vector<RankedEntry>& entries) {
    json arr = json::array();
    for (const auto& e : entries) {
        arr.push_back({{"entity", e.entity}, {"score", e.score}, {"rank", e.rank}});
    }
    return arr;
}

inline json update_json(const UpdateResult& r) {
    json out = {
        {"admission", admission_name(r.admission)},
        {"score", r.score},
        {"rank", rank_json(r.rank)},
        {"evicted", nullptr}
    };
    if (r.evicted) {
        out["evicted"] = {{"entity", r.evicted->entity}, {"score", r.evicted->score}};
    }
    return out;
}

inline json config_json(const SeasonConfig& c) {
    return {
        {"is_active", c.is_active},
        {"max_entries", c.max_entries},
        {"update_cooldown", c.update_cooldown},
        {"season_start", c.season_start},
        {"season_duration", c.season_duration},
        {"season_end", c.season_end()}
    };
}

// Fields not present keep the value from `base`
inline SeasonConfig config_from_json(const json& j, SeasonConfig base) {
    base.is_active = get_param<bool>(j, "is_active", base.is_active);
    base.max_entries = get_param<uint32_t>(j, "max_entries", base.max_entries);
    base.update_cooldown = get_param<int64_t>(j, "update_cooldown", base.update_cooldown);
    base.season_start = get_param<int64_t>(j, "season_start", base.season_start);
    base.season_duration = get_param<int64_t>(j, "season_duration", base.season_duration);
    if (base.update_cooldown < 0 || base.season_duration < 0) {
        throw ParamError("Cooldown and season duration must be non-negative");
    }
    return base;
}

inline json holder_json(const RecordHolder& h) {
    return {{"value", h.value}, {"holder", h.held() ? json(h.holder) : json()}};
}

struct HandlerContext {
    std::string default_caller;   // used when a request names no caller
    // Called after every successful mutation; false turns the response
    // into STORE_ERROR
    std::function<bool()> persist;
};

using MethodHandler = std::function<json(const json&)>;

struct Method {
    std::string description;
    bool mutates = false;
    MethodHandler fn;
};

class Handler {
public:
    Handler(LeaderboardEngine& engine, StreakStats& streaks, RoleGate* gate = nullptr,
            HandlerContext context = {})
        : engine_(engine),
          streaks_(streaks),
          gate_(gate),
          context_(std::move(context)) {
        auto check_caller = [this](Capability cap) {
            return gate_ ? gate_->check(caller_, cap) : Error::None;
        };
        engine_.set_gate(check_caller);
        streaks_.set_gate(check_caller);
        register_all_methods();
    }

    // The engines' checks point back into this handler
    ~Handler() {
        engine_.set_gate(allow_all());
        streaks_.set_gate(allow_all());
    }

    Handler(const Handler&) = delete;
    Handler& operator=(const Handler&) = delete;

    // Process a JSON-RPC request string, return response string
    std::string handle(const std::string& request_str) {
        try {
            auto request = json::parse(request_str);
            auto response = handle_request(request);
            try {
                return response.dump();
            } catch (const json::type_error&) {
                // UTF-8 encoding issue - try with replacement
                return response.dump(-1, ' ', false, json::error_handler_t::replace);
            }
        } catch (const json::parse_error& e) {
            return make_error(json(), error::PARSE_ERROR,
                              std::string("JSON parse error: ") + e.what()).dump();
        } catch (const std::exception& e) {
            return make_error(json(), error::INTERNAL_ERROR,
                              std::string("Internal error: ") + e.what()).dump();
        }
    }

    json handle_request(const json& request) {
        std::string error_msg;
        if (!validate_request(request, error_msg)) {
            json id = request.is_object() ? request.value("id", json()) : json();
            return make_error(id, error::INVALID_REQUEST, error_msg);
        }

        auto info = parse_request(request);
        if (!info.params.is_object()) {
            return make_error(info.id, error::INVALID_PARAMS, "params must be an object");
        }

        if (info.method == "initialize") {
            return make_result(info.id, {
                {"serverInfo", {{"name", "podium"}, {"version", PODIUM_VERSION}}},
                {"schemaVersion", PODIUM_SCHEMA_VERSION}
            });
        }
        if (info.method == "methods/list") {
            json list = json::array();
            for (const auto& name : order_) {
                const auto& m = methods_.at(name);
                list.push_back({{"name", name}, {"description", m.description},
                                {"mutates", m.mutates}});
            }
            return make_result(info.id, {{"methods", list}});
        }

        auto it = methods_.find(info.method);
        if (it == methods_.end()) {
            return make_error(info.id, error::METHOD_NOT_FOUND, "Unknown method: " + info.method);
        }

        caller_ = info.params.value("caller", context_.default_caller);
        try {
            json result = it->second.fn(info.params);
            if (it->second.mutates) {
                if (context_.persist && !context_.persist()) {
                    std::cerr << "[rpc] " << info.method << " not persisted\n";
                    return make_error(info.id, error::STORE_ERROR, "State could not be persisted",
                                      {{"error", "store_error"}});
                }
                dirty_ = true;
            }
            log_debug("rpc", "%s ok (caller=%s)", info.method.c_str(), caller_.c_str());
            return make_result(info.id, result);
        } catch (const EngineError& e) {
            log_debug("rpc", "%s failed: %s", info.method.c_str(), e.what());
            return make_engine_error(info.id, e.code());
        } catch (const ParamError& e) {
            return make_error(info.id, error::INVALID_PARAMS, e.what());
        }
    }

    // True when a mutating method succeeded since the last call
    bool take_dirty() {
        bool d = dirty_;
        dirty_ = false;
        return d;
    }

    std::vector<std::string> method_names() const { return order_; }

private:
    LeaderboardEngine& engine_;
    StreakStats& streaks_;
    RoleGate* gate_;
    HandlerContext context_;
    std::string caller_;
    bool dirty_ = false;
    std::unordered_map<std::string, Method> methods_;
    std::vector<std::string> order_;

    void add(const std::string& name, const std::string& description, bool mutates,
             MethodHandler fn) {
        order_.push_back(name);
        methods_[name] = Method{description, mutates, std::move(fn)};
    }

    void require_admin() {
        if (gate_) check(gate_->check(caller_, Capability::Administer));
    }

    void register_all_methods() {
        register_score_methods();
        register_read_methods();
        register_admin_methods();
        register_streak_methods();
        register_access_methods();
    }

    // ═══════════════════════════════════════════════════════════════════
    // Score updates
    // ═══════════════════════════════════════════════════════════════════

    void register_score_methods() {
        add("leaderboard/update_score", "Set an entity's score in one partition", true,
            [this](const json& p) {
                auto r = engine_.update_score(entity_param(p), category_param(p),
                                              timeframe_param(p), score_param(p, "score"));
                check(r.error);
                return update_json(r);
            });

        add("leaderboard/increment_score", "Add to an entity's score (saturating)", true,
            [this](const json& p) {
                auto r = engine_.increment_score(entity_param(p), category_param(p),
                                                 timeframe_param(p), score_param(p, "delta"));
                check(r.error);
                return update_json(r);
            });

        add("leaderboard/batch_update", "Set several scores atomically", true,
            [this](const json& p) {
                const auto& ents = require(p, "entities");
                const auto& vals = require(p, "scores");
                if (!ents.is_array() || !vals.is_array()) {
                    throw ParamError("entities and scores must be arrays");
                }
                std::vector<EntityId> entities;
                for (const auto& e : ents) {
                    if (!e.is_string()) throw ParamError("entities must be strings");
                    entities.push_back(e.get<std::string>());
                }
                std::vector<Score> scores;
                for (const auto& v : vals) scores.push_back(score_value(v, "scores"));

                auto batch = engine_.batch_update_scores(entities, category_param(p),
                                                         timeframe_param(p), scores);
                if (!batch.ok()) {
                    log_debug("rpc", "batch rejected at index %zu", batch.failed_index);
                    throw EngineError(batch.error);
                }
                json results = json::array();
                for (const auto& r : batch.results) results.push_back(update_json(r));
                return json{{"applied", batch.results.size()}, {"results", results}};
            });
    }

    // ═══════════════════════════════════════════════════════════════════
    // Reads
    // ═══════════════════════════════════════════════════════════════════

    void register_read_methods() {
        add("leaderboard/get_score", "Score and rank of an entity", false,
            [this](const json& p) {
                auto us = engine_.get_user_score(entity_param(p), category_param(p),
                                                 timeframe_param(p));
                return json{{"score", us.score}, {"rank", rank_json(us.rank)}};
            });

        add("leaderboard/get", "Top entries of a partition", false,
            [this](const json& p) {
                auto c = category_param(p);
                auto t = timeframe_param(p);
                check(valid(c) ? Error::None : Error::InvalidCategory);
                check(valid(t) ? Error::None : Error::InvalidTimeframe);
                size_t limit = get_param<size_t>(p, "limit", 10);
                return json{{"entries", ranked_json(engine_.get_leaderboard(c, t, limit))},
                            {"size", engine_.entry_count(c, t)}};
            });

        add("leaderboard/page", "Entries starting at an offset", false,
            [this](const json& p) {
                auto c = category_param(p);
                auto t = timeframe_param(p);
                check(valid(c) ? Error::None : Error::InvalidCategory);
                check(valid(t) ? Error::None : Error::InvalidTimeframe);
                size_t offset = get_param<size_t>(p, "offset", 0);
                size_t count = get_param<size_t>(p, "count", 10);
                return json{{"entries", ranked_json(engine_.get_page(c, t, offset, count))}};
            });

        add("leaderboard/top", "Top entities and scores as parallel lists", false,
            [this](const json& p) {
                auto c = category_param(p);
                auto t = timeframe_param(p);
                check(valid(c) ? Error::None : Error::InvalidCategory);
                check(valid(t) ? Error::None : Error::InvalidTimeframe);
                auto top = engine_.get_top_entities(c, t, get_param<size_t>(p, "limit", 10));
                return json{{"entities", top.entities}, {"scores", top.scores}};
            });

        add("leaderboard/config", "Season config and state of a partition", false,
            [this](const json& p) {
                auto c = category_param(p);
                auto t = timeframe_param(p);
                check(valid(c) ? Error::None : Error::InvalidCategory);
                check(valid(t) ? Error::None : Error::InvalidTimeframe);
                return json{{"config", config_json(engine_.config(c, t))},
                            {"state", season_state_name(engine_.season_state(c, t))}};
            });

        add("activity/get", "Active categories of an entity", false,
            [this](const json& p) {
                auto entity = entity_param(p);
                const auto& a = engine_.activity();
                return json{{"mask", a.active_categories(entity)},
                            {"active", a.is_active(entity)},
                            {"last_activity", a.last_activity(entity)},
                            {"total_active", a.total_active()}};
            });

        add("records/get", "Best score ever, overall and per category", false,
            [this](const json&) {
                const auto& rec = engine_.records();
                json per = json::object();
                const auto& bests = rec.category_bests();
                for (size_t i = 0; i < bests.size(); ++i) {
                    per[category_name(static_cast<Category>(i))] = holder_json(bests[i]);
                }
                return json{{"best", holder_json(rec.best())}, {"categories", per}};
            });
    }

    // ═══════════════════════════════════════════════════════════════════
    // Administration
    // ═══════════════════════════════════════════════════════════════════

    void register_admin_methods() {
        add("leaderboard/reset", "Clear one partition", true,
            [this](const json& p) {
                check(engine_.reset_leaderboard(category_param(p), timeframe_param(p)));
                return json{{"reset", true}};
            });

        add("leaderboard/set_config", "Replace a partition's season config", true,
            [this](const json& p) {
                auto c = category_param(p);
                auto t = timeframe_param(p);
                check(valid(c) ? Error::None : Error::InvalidCategory);
                check(valid(t) ? Error::None : Error::InvalidTimeframe);
                auto cfg = config_from_json(require(p, "config"), engine_.config(c, t));
                check(engine_.set_config(c, t, cfg));
                return json{{"config", config_json(engine_.config(c, t))}};
            });

        add("leaderboard/start_season", "Open a new season window", true,
            [this](const json& p) {
                auto c = category_param(p);
                auto t = p.contains("timeframe") ? timeframe_param(p) : Timeframe::Daily;
                auto duration = get_param<int64_t>(p, "duration", 0);
                if (duration < 0) throw ParamError("duration must be non-negative");
                check(engine_.start_new_season(c, duration, t));
                return json{{"config", config_json(engine_.config(c, t))}};
            });

        add("leaderboard/cleanup", "Clear activity of long-idle entities", true,
            [this](const json& p) {
                auto r = engine_.cleanup_inactive(entity_list(p));
                check(r.error);
                return cleaned_json(r, engine_.activity().total_active());
            });
    }

    // ═══════════════════════════════════════════════════════════════════
    // Streak statistics
    // ═══════════════════════════════════════════════════════════════════

    void register_streak_methods() {
        add("streaks/update", "Report an entity's current streak of one type", true,
            [this](const json& p) {
                std::optional<Score> reported;
                if (p.contains("reported_total")) reported = score_param(p, "reported_total");
                auto r = streaks_.update_activity(entity_param(p), streak_type_param(p),
                                                  score_param(p, "streak"), reported);
                check(r.error);
                return json{{"admission", admission_name(r.admission)},
                            {"rank", rank_json(r.rank)},
                            {"total", r.total},
                            {"new_global_leader", r.new_global_leader}};
            });

        add("streaks/achievement", "Record an achievement with its rewards", true,
            [this](const json& p) {
                auto entity = entity_param(p);
                check(streaks_.record_achievement(entity, get_param<Score>(p, "xp", 0),
                                                  get_param<Score>(p, "badges", 0)));
                return user_json(entity);
            });

        add("streaks/cleanup", "Clear streak activity of long-idle entities", true,
            [this](const json& p) {
                auto r = streaks_.cleanup_inactive(entity_list(p));
                check(r.error);
                return cleaned_json(r, streaks_.activity().total_active());
            });

        add("streaks/reset", "Restart global streak records and boards", true,
            [this](const json&) {
                check(streaks_.reset_global_stats());
                return json{{"reset", true}};
            });

        add("streaks/global", "Global streak statistics", false,
            [this](const json&) {
                auto g = streaks_.global_stats();
                json counts = json::object();
                for (size_t i = 0; i < STREAK_TYPE_COUNT; ++i) {
                    auto t = static_cast<StreakType>(i);
                    counts[streak_type_name(t)] = streaks_.type_update_count(t);
                }
                return json{{"total_active", g.total_active},
                            {"longest_global_streak", g.longest_global_streak},
                            {"streak_leader", g.streak_leader.empty() ? json() : json(g.streak_leader)},
                            {"total_updates", g.total_updates},
                            {"type_counts", counts}};
            });

        add("streaks/user", "Streak statistics of one entity", false,
            [this](const json& p) { return user_json(entity_param(p)); });

        add("streaks/leaderboard", "Top streaks of one type", false,
            [this](const json& p) {
                auto t = streak_type_param(p);
                check(valid(t) ? Error::None : Error::InvalidCategory);
                return json{{"entries", ranked_json(
                    streaks_.leaderboard(t, get_param<size_t>(p, "limit", 10)))}};
            });

        add("streaks/totals", "Top entities by summed streaks", false,
            [this](const json& p) {
                return json{{"entries", ranked_json(
                    streaks_.totals_leaderboard(get_param<size_t>(p, "limit", 10)))}};
            });

        add("streaks/leaders", "Longest streak holder per type", false,
            [this](const json&) {
                json out = json::object();
                auto leaders = streaks_.type_leaders();
                for (size_t i = 0; i < leaders.size(); ++i) {
                    out[streak_type_name(static_cast<StreakType>(i))] = holder_json(leaders[i]);
                }
                return out;
            });

        add("streaks/daily", "Activity figures for one day", false,
            [this](const json& p) {
                int64_t day = p.contains("day") ? get_param<int64_t>(p, "day", 0)
                                                : day_index(engine_.current_time());
                auto d = streaks_.daily_stats(day);
                return json{{"day", day},
                            {"active_users", d.active_users},
                            {"total_activities", d.total_activities},
                            {"new_activations", d.new_activations}};
            });
    }

    // ═══════════════════════════════════════════════════════════════════
    // Access control (only with a RoleGate attached)
    // ═══════════════════════════════════════════════════════════════════

    void register_access_methods() {
        add("access/grant", "Grant a role", true, [this](const json& p) {
            require_admin();
            auto role = role_param(p);
            if (gate_) gate_->grant(entity_param(p, "account"), role);
            return json{{"granted", role_name(role)}};
        });

        add("access/revoke", "Revoke a role", true, [this](const json& p) {
            require_admin();
            auto role = role_param(p);
            if (gate_) gate_->revoke(entity_param(p, "account"), role);
            return json{{"revoked", role_name(role)}};
        });

        add("access/pause", "Stop score updates", true, [this](const json&) {
            require_admin();
            if (gate_) gate_->pause();
            return json{{"paused", true}};
        });

        add("access/unpause", "Resume score updates", true, [this](const json&) {
            require_admin();
            if (gate_) gate_->unpause();
            return json{{"paused", false}};
        });
    }

    // ═══════════════════════════════════════════════════════════════════
    // Helpers
    // ═══════════════════════════════════════════════════════════════════

    static std::vector<EntityId> entity_list(const json& p) {
        const auto& arr = require(p, "entities");
        if (!arr.is_array()) throw ParamError("entities must be an array");
        std::vector<EntityId> out;
        for (const auto& e : arr) {
            if (!e.is_string()) throw ParamError("entities must be strings");
            out.push_back(e.get<std::string>());
        }
        return out;
    }

    static Role role_param(const json& p) {
        auto name = get_param<std::string>(p, "role", "");
        if (name == role_name(Role::Admin)) return Role::Admin;
        if (name == role_name(Role::ScoreManager)) return Role::ScoreManager;
        throw ParamError("role must be admin or score_manager");
    }

    static json cleaned_json(const CleanupResult& r, uint64_t total_active) {
        json cleaned = json::array();
        for (const auto& c : r.cleaned) cleaned.push_back(c.entity);
        return json{{"cleaned", cleaned}, {"total_active", total_active}};
    }

    json user_json(const EntityId& entity) const {
        auto u = streaks_.user_stats(entity);
        json current = json::object();
        for (size_t i = 0; i < STREAK_TYPE_COUNT; ++i) {
            current[streak_type_name(static_cast<StreakType>(i))] = u.current[i];
        }
        return json{{"entity", entity},
                    {"active_types", u.active_types},
                    {"last_activity", u.last_activity},
                    {"current", current},
                    {"total_streak", u.total_streak},
                    {"longest_streak", u.longest_streak},
                    {"total_achievements", u.total_achievements},
                    {"total_xp", u.total_xp},
                    {"total_badges", u.total_badges}};
    }
};

} // namespace podium::rpc
