// podium: leaderboard administration and JSON-RPC line server
//
// Usage: podium [--db PATH] <command> [options]
//
// Commands:
//   serve        JSON-RPC 2.0, one request per line on stdin, one response per line on stdout
//   stats        Show registry statistics
//   leaderboard  Show one partition
//   streaks      Show a streak board or the totals board
//   help         Show this help

#include <podium/leaderboard_engine.hpp>
#include <podium/log.hpp>
#include <podium/rpc/handler.hpp>
#include <podium/sqlite_store.hpp>
#include <podium/streak_stats.hpp>
#include <podium/version.hpp>
#include <iostream>
#include <iomanip>
#include <string>
#include <cstring>
#include <cstdlib>

using namespace podium;

// Get program name from path
static const char* prog_name(const char* path) {
    const char* last = path;
    for (const char* p = path; *p; ++p) {
        if (*p == '/') last = p + 1;
    }
    return last;
}

void print_usage(const char* prog) {
    const char* name = prog_name(prog);
    std::cerr << "podium " << PODIUM_VERSION << " - Ranked registry administration\n\n"
              << "Usage: " << name << " [--db PATH] <command> [options]\n\n"
              << "Commands:\n"
              << "  serve                          JSON-RPC 2.0 over stdin/stdout (one request per line)\n"
              << "  stats                          Show partitions, activity and records\n"
              << "  leaderboard <category> <tf>    Show one partition (names or indices)\n"
              << "  streaks [type]                 Show a streak board, or the totals board\n"
              << "  help                           Show this help\n\n"
              << "Options:\n"
              << "  --db PATH          Database path (default: ~/.podium/podium.db)\n"
              << "  --limit N          Rows to show (default: 10)\n"
              << "  --owner NAME       serve: caller holding every role (default: admin)\n"
              << "  --open             serve: no role checks\n"
              << "  --json             Output as JSON\n"
              << "  --verbose          Enable verbose debug logging\n"
              << "  -v, --version      Show version\n";
}

std::string default_db_path() {
    const char* home = std::getenv("HOME");
    if (!home) home = ".";
    return std::string(home) + "/.podium/podium.db";
}

bool load_state(SqliteStore& store, LeaderboardEngine& engine, StreakStats& streaks) {
    if (!store.open()) return false;
    if (store.has_engine_state() && !store.load(engine)) return false;
    if (store.has_streak_state() && !store.load(streaks)) return false;
    return true;
}

int cmd_serve(SqliteStore& store, LeaderboardEngine& engine, StreakStats& streaks,
              const std::string& owner, bool open_access) {
    RoleGate gate(owner);
    rpc::HandlerContext ctx{owner, [&] { return store.persist(engine, streaks); }};
    rpc::Handler handler(engine, streaks, open_access ? nullptr : &gate, ctx);

    std::cerr << "[serve] podium " << PODIUM_VERSION << " on " << store.path()
              << (open_access ? " (open access)" : "") << "\n";

    if (verbose()) {
        auto trace = [](const char* source) {
            return [source](const Event& ev) {
                log_debug(source, "event %s entity=%s score=%llu rank=%u",
                          event_name(ev.type).c_str(), ev.entity.c_str(),
                          static_cast<unsigned long long>(ev.score), ev.rank);
            };
        };
        engine.events().subscribe(trace("engine"));
        streaks.events().subscribe(trace("streaks"));
    }

    size_t requests = 0;
    std::string line;
    while (std::getline(std::cin, line)) {
        if (line.empty()) continue;
        ++requests;

        std::string response = handler.handle(line);
        if (handler.take_dirty()) log_debug("serve", "request #%zu persisted", requests);

        std::cout << response << "\n";
        std::cout.flush();
    }

    log_debug("serve", "stdin closed after %zu requests", requests);
    return 0;
}

int cmd_stats(const LeaderboardEngine& engine, const StreakStats& streaks, bool json_output) {
    const auto& records = engine.records();
    auto g = streaks.global_stats();

    if (json_output) {
        rpc::json partitions = rpc::json::array();
        for (const auto& key : engine.partition_keys()) {
            partitions.push_back({
                {"category", category_name(key.category)},
                {"timeframe", timeframe_name(key.timeframe)},
                {"entries", engine.entry_count(key.category, key.timeframe)},
                {"state", season_state_name(engine.season_state(key.category, key.timeframe))}
            });
        }
        rpc::json out = {
            {"version", PODIUM_VERSION},
            {"partitions", partitions},
            {"total_active", engine.activity().total_active()},
            {"tracked_entities", engine.activity().tracked_entities()},
            {"best", rpc::holder_json(records.best())},
            {"streaks", {
                {"aggregation", aggregation_name(streaks.config().aggregation)},
                {"total_active", g.total_active},
                {"longest_global_streak", g.longest_global_streak},
                {"streak_leader", g.streak_leader},
                {"total_updates", g.total_updates},
                {"tracked_users", streaks.tracked_users()}
            }}
        };
        std::cout << out.dump(2) << "\n";
        return 0;
    }

    std::cout << "Registry Statistics\n";
    std::cout << "═══════════════════════════════\n";
    std::cout << "Partitions:\n";
    auto keys = engine.partition_keys();
    if (keys.empty()) std::cout << "  (none)\n";
    for (const auto& key : keys) {
        std::cout << "  " << std::left << std::setw(36) << key.to_string()
                  << engine.entry_count(key.category, key.timeframe) << " entries, "
                  << season_state_name(engine.season_state(key.category, key.timeframe)) << "\n";
    }
    std::cout << "\nActivity:\n";
    std::cout << "  Active:   " << engine.activity().total_active() << "\n";
    std::cout << "  Tracked:  " << engine.activity().tracked_entities() << "\n";
    std::cout << "\nBest score: " << records.best().value;
    if (records.best().held()) std::cout << " (" << records.best().holder << ")";
    std::cout << "\n";
    std::cout << "\nStreaks (" << aggregation_name(streaks.config().aggregation) << "):\n";
    std::cout << "  Active streakers: " << g.total_active << "\n";
    std::cout << "  Longest global:   " << g.longest_global_streak;
    if (!g.streak_leader.empty()) std::cout << " (" << g.streak_leader << ")";
    std::cout << "\n";
    std::cout << "  Updates:          " << g.total_updates << "\n";
    std::cout << "  Users:            " << streaks.tracked_users() << "\n";
    return 0;
}

void print_entries(const std::vector<RankedEntry>& entries, bool json_output) {
    if (json_output) {
        std::cout << rpc::ranked_json(entries).dump(2) << "\n";
        return;
    }
    if (entries.empty()) {
        std::cout << "  (empty)\n";
        return;
    }
    for (const auto& e : entries) {
        std::cout << "  #" << std::left << std::setw(5) << e.rank
                  << std::setw(44) << e.entity << e.score << "\n";
    }
}

int cmd_leaderboard(const LeaderboardEngine& engine, const std::string& category_arg,
                    const std::string& timeframe_arg, size_t limit, bool json_output) {
    auto category = category_from_string(category_arg);
    if (!category) {
        std::cerr << "Unknown category: " << category_arg << "\n";
        return 1;
    }
    auto timeframe = timeframe_from_string(timeframe_arg);
    if (!timeframe) {
        std::cerr << "Unknown timeframe: " << timeframe_arg << "\n";
        return 1;
    }

    if (!json_output) {
        PartitionKey key{*category, *timeframe};
        const auto& cfg = engine.config(*category, *timeframe);
        std::cout << key.to_string() << " (" << engine.entry_count(*category, *timeframe)
                  << "/" << cfg.max_entries << ", "
                  << season_state_name(engine.season_state(*category, *timeframe));
        if (cfg.season_duration > 0) {
            std::cout << ", season " << cfg.season_start << ".." << cfg.season_end();
        }
        std::cout << ")\n";
    }
    print_entries(engine.get_leaderboard(*category, *timeframe, limit), json_output);
    return 0;
}

int cmd_streaks(const StreakStats& streaks, const std::string& type_arg, size_t limit,
                bool json_output) {
    if (type_arg.empty()) {
        if (!json_output) std::cout << "Top streakers (summed streaks)\n";
        print_entries(streaks.totals_leaderboard(limit), json_output);
        return 0;
    }
    for (size_t i = 0; i < STREAK_TYPE_COUNT; ++i) {
        auto t = static_cast<StreakType>(i);
        if (type_arg == streak_type_name(t) || type_arg == std::to_string(i)) {
            if (!json_output) std::cout << streak_type_name(t) << " streaks\n";
            print_entries(streaks.leaderboard(t, limit), json_output);
            return 0;
        }
    }
    std::cerr << "Unknown streak type: " << type_arg << "\n";
    return 1;
}

int main(int argc, char* argv[]) {
    std::string db_path = default_db_path();
    std::string owner = "admin";
    std::string command;
    std::vector<std::string> args;
    size_t limit = 10;
    bool json_output = false;
    bool open_access = false;

    for (int i = 1; i < argc; ++i) {
        if (strcmp(argv[i], "--db") == 0 && i + 1 < argc) {
            db_path = argv[++i];
        } else if (strcmp(argv[i], "--limit") == 0 && i + 1 < argc) {
            char* end = nullptr;
            unsigned long long n = std::strtoull(argv[++i], &end, 10);
            if (!end || *end != '\0') {
                std::cerr << "Invalid --limit: " << argv[i] << "\n";
                return 1;
            }
            limit = static_cast<size_t>(n);
        } else if (strcmp(argv[i], "--owner") == 0 && i + 1 < argc) {
            owner = argv[++i];
        } else if (strcmp(argv[i], "--open") == 0) {
            open_access = true;
        } else if (strcmp(argv[i], "--json") == 0) {
            json_output = true;
        } else if (strcmp(argv[i], "--verbose") == 0) {
            set_verbose(true);
        } else if (strcmp(argv[i], "-v") == 0 || strcmp(argv[i], "--version") == 0) {
            std::cout << "podium " << PODIUM_VERSION << " (schema " << PODIUM_SCHEMA_VERSION << ")\n";
            return 0;
        } else if (strcmp(argv[i], "-h") == 0 || strcmp(argv[i], "--help") == 0) {
            print_usage(argv[0]);
            return 0;
        } else if (argv[i][0] == '-') {
            std::cerr << "Unknown option: " << argv[i] << "\n";
            print_usage(argv[0]);
            return 1;
        } else if (command.empty()) {
            command = argv[i];
        } else {
            args.push_back(argv[i]);
        }
    }

    if (command.empty() || command == "help") {
        print_usage(argv[0]);
        return command.empty() ? 1 : 0;
    }

    if (command != "serve" && command != "stats" && command != "leaderboard" &&
        command != "streaks") {
        std::cerr << "Unknown command: " << command << "\n";
        print_usage(argv[0]);
        return 1;
    }

    LeaderboardEngine engine;
    StreakStats streaks;
    SqliteStore store(db_path);
    if (!load_state(store, engine, streaks)) {
        std::cerr << "Failed to load state from " << db_path << "\n";
        return 1;
    }

    if (command == "serve") {
        return cmd_serve(store, engine, streaks, owner, open_access);
    }
    if (command == "stats") {
        return cmd_stats(engine, streaks, json_output);
    }
    if (command == "leaderboard") {
        if (args.size() < 2) {
            std::cerr << "Usage: " << prog_name(argv[0]) << " leaderboard <category> <timeframe>\n";
            return 1;
        }
        return cmd_leaderboard(engine, args[0], args[1], limit, json_output);
    }
    return cmd_streaks(streaks, args.empty() ? std::string() : args[0], limit, json_output);
}
