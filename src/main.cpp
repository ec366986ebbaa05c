#include <FileJsonStorage.hpp>
#include <ReservationEngine.hpp>
#include <config.hpp>
#include <log.hpp>

#include <iostream>
#include <map>
#include <memory>
#include <sstream>

using namespace NReservation;

namespace {

    void PrintError(const TError& err) {
        std::cout << "Error(" << ErrorKindName(err.Kind) << "): " << err.Message << "\n";
    }

    std::optional<uint64_t> ParseId(const std::string& text) {
        if (text.empty() || text.find_first_not_of("0123456789") != std::string::npos) {
            return std::nullopt;
        }
        try {
            return std::stoull(text);
        } catch (const std::out_of_range&) {
            return std::nullopt;
        }
    }

    // key=value tokens; tokens without '=' are ignored.
    std::map<std::string, std::string> ParseKeyValues(std::istringstream& iss) {
        std::map<std::string, std::string> out;
        std::string token;
        while (iss >> token) {
            auto eq = token.find('=');
            if (eq == std::string::npos) {
                continue;
            }
            out[token.substr(0, eq)] = token.substr(eq + 1);
        }
        return out;
    }

    std::optional<TReservationPatch> BuildPatch(const std::map<std::string, std::string>& kv, std::string& error) {
        TReservationPatch patch;
        for (auto const& [key, value] : kv) {
            if (key == "resource" || key == "station") {
                auto id = ParseId(value);
                if (!id) {
                    error = "bad station id: " + value;
                    return std::nullopt;
                }
                patch.ResourceIdInternal = *id;
            } else if (key == "user") {
                auto id = ParseId(value);
                if (!id) {
                    error = "bad user id: " + value;
                    return std::nullopt;
                }
                patch.UserIdInternal = *id;
            } else if (key == "start" || key == "end") {
                auto tp = ParseTimestamp(value);
                if (!tp) {
                    error = "bad timestamp: " + value;
                    return std::nullopt;
                }
                (key == "start" ? patch.StartTime : patch.EndTime) = *tp;
            } else if (key == "status") {
                auto st = ParseStatus(value);
                if (!st) {
                    error = "bad status: " + value;
                    return std::nullopt;
                }
                patch.Status = *st;
            } else {
                error = "unknown field: " + key;
                return std::nullopt;
            }
        }
        return patch;
    }

    std::shared_ptr<IStorage> MakeStorage(const TStorageConfig& cfg) {
        if (cfg.Kind == EStorageKind::File) {
            return std::make_shared<TFileJsonStorage>(cfg.Snapshot, cfg.Journal);
        }
        return std::make_shared<TMemoryStorage>();
    }

} // namespace

int main(int argc, char** argv) {
    TEngineConfig cfg;
    if (argc > 1) {
        auto loaded = LoadConfig(argv[1]);
        if (loaded.IsErr()) {
            std::cerr << "Config error: " << loaded.Error().Message << "\n";
            return 1;
        }
        cfg = std::move(loaded).Value();
    }

    std::shared_ptr<TReservationEngine> engine;
    try {
        TLogger::Instance().SetLevel(cfg.LogLevel);
        if (cfg.LogFile) {
            TLogger::Instance().SetFile(*cfg.LogFile);
        }

        auto catalog = std::make_shared<TMemoryCatalog>();
        if (cfg.CatalogSeed) {
            catalog->LoadSeedFile(*cfg.CatalogSeed);
        }
        auto store = std::make_shared<TReservationStore>(MakeStorage(cfg.Storage), catalog, catalog);
        engine = std::make_shared<TReservationEngine>(store, catalog, catalog, cfg.Engine);
        LogInfo("Reservation engine ready: {} reservations, {} storage, {} status policy, log level {}",
                engine->Count(),
                cfg.Storage.Kind == EStorageKind::File ? cfg.Storage.Snapshot.string() : std::string("in-memory"),
                engine->Options().StatusPolicy == EStatusPolicy::Strict ? "strict" : "open",
                LogLevelName(TLogger::Instance().GetLevel()));
    } catch (const std::exception& ex) {
        std::cerr << "Startup failed: " << ex.what() << "\n";
        return 1;
    }

    std::cout << "Station reservations. Commands:\n"
              << "  create <station> <user> <start> <end> [status]\n"
              << "  update <id> [station=..] [user=..] [start=..] [end=..] [status=..]\n"
              << "  remove <id>\n"
              << "  get <id>\n"
              << "  list [status=..] [limit=..] [offset=..]\n"
              << "  all\n"
              << "  count\n"
              << "  exit\n"
              << "Timestamps are ISO-8601 UTC, e.g. 2025-12-05T14:00:00Z\n";

    std::string line;
    while (true) {
        std::cout << "> ";
        if (!std::getline(std::cin, line)) {
            break;
        }
        std::istringstream iss(line);
        std::string cmd;
        if (!(iss >> cmd)) {
            continue;
        }
        if (cmd == "exit") {
            break;
        }

        if (cmd == "create") {
            std::string station, user, start, end, status;
            iss >> station >> user >> start >> end;
            if (!iss) {
                std::cout << "Usage: create <station> <user> <start> <end> [status]\n";
                continue;
            }
            iss >> status;

            auto sid = ParseId(station);
            auto uid = ParseId(user);
            auto st = ParseTimestamp(start);
            auto en = ParseTimestamp(end);
            auto stat = status.empty() ? std::optional<EReservationStatus>(EReservationStatus::Pending) : ParseStatus(status);
            if (!sid || !uid || !st || !en || !stat) {
                std::cout << "Usage: create <station> <user> <start> <end> [pending|confirmed|cancelled]\n";
                continue;
            }

            TReservationDraft draft;
            draft.ResourceIdInternal = *sid;
            draft.UserIdInternal = *uid;
            draft.StartTime = *st;
            draft.EndTime = *en;
            draft.Status = *stat;
            auto res = engine->Create(draft);
            if (res.IsErr()) {
                PrintError(res.Error());
                continue;
            }
            std::cout << "Created reservation id=" << res.Value().Id << "\n";
            continue;
        }

        if (cmd == "update") {
            std::string idText;
            iss >> idText;
            auto id = ParseId(idText);
            if (!id) {
                std::cout << "Usage: update <id> [station=..] [user=..] [start=..] [end=..] [status=..]\n";
                continue;
            }
            std::string error;
            auto patch = BuildPatch(ParseKeyValues(iss), error);
            if (!patch) {
                std::cout << "Usage: " << error << "\n";
                continue;
            }
            auto res = engine->Update(*id, *patch);
            if (res.IsErr()) {
                PrintError(res.Error());
                continue;
            }
            std::cout << "Updated reservation id=" << res.Value().Id << "\n";
            continue;
        }

        if (cmd == "remove") {
            std::string idText;
            iss >> idText;
            auto id = ParseId(idText);
            if (!id) {
                std::cout << "Usage: remove <id>\n";
                continue;
            }
            auto res = engine->Remove(*id);
            if (res.IsErr()) {
                PrintError(res.Error());
                continue;
            }
            std::cout << "Removed id=" << *id << "\n";
            continue;
        }

        if (cmd == "get") {
            std::string idText;
            iss >> idText;
            auto id = ParseId(idText);
            if (!id) {
                std::cout << "Usage: get <id>\n";
                continue;
            }
            auto res = engine->Get(*id);
            if (res.IsErr()) {
                PrintError(res.Error());
                continue;
            }
            std::cout << ViewToJSON(res.Value()).dump(2) << "\n";
            continue;
        }

        if (cmd == "list") {
            auto page = engine->List(ParseListFilter(ParseKeyValues(iss)));
            json out = {{"total", page.Total}, {"count", page.Count}, {"bookings", json::array()}};
            for (auto const& v : page.Items) {
                out["bookings"].push_back(ViewToJSON(v));
            }
            std::cout << out.dump(2) << "\n";
            continue;
        }

        if (cmd == "all") {
            json out = json::array();
            for (auto const& v : engine->ListAll()) {
                out.push_back(ViewToJSON(v));
            }
            std::cout << out.dump(2) << "\n";
            continue;
        }

        if (cmd == "count") {
            std::cout << engine->Count() << "\n";
            continue;
        }

        std::cout << "Unknown command\n";
    }

    return 0;
}
