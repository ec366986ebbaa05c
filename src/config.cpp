#include <config.hpp>

#include <fstream>

namespace NReservation {

    namespace {

        std::filesystem::path Resolve(const std::filesystem::path& baseDir, const std::string& value) {
            std::filesystem::path p(value);
            if (p.is_relative() && !baseDir.empty()) {
                return baseDir / p;
            }
            return p;
        }

    } // namespace

    TResult<TEngineConfig> ParseConfig(const nlohmann::json& j, const std::filesystem::path& baseDir) {
        if (!j.is_object()) {
            return TResult<TEngineConfig>::Err(EErrorKind::Validation, "Config must be a JSON object");
        }

        TEngineConfig cfg;
        try {
            if (j.contains("storage")) {
                auto const& s = j.at("storage");
                std::string kind = s.value("kind", "memory");
                if (kind == "memory") {
                    cfg.Storage.Kind = EStorageKind::Memory;
                } else if (kind == "file") {
                    cfg.Storage.Kind = EStorageKind::File;
                } else {
                    return TResult<TEngineConfig>::Err(EErrorKind::Validation, "Unknown storage kind: " + kind);
                }
                if (s.contains("snapshot")) {
                    cfg.Storage.Snapshot = Resolve(baseDir, s.at("snapshot").get<std::string>());
                }
                if (s.contains("journal")) {
                    cfg.Storage.Journal = Resolve(baseDir, s.at("journal").get<std::string>());
                }
            }

            if (j.contains("catalog") && j.at("catalog").contains("seed")) {
                cfg.CatalogSeed = Resolve(baseDir, j.at("catalog").at("seed").get<std::string>());
            }

            if (j.contains("engine")) {
                auto const& e = j.at("engine");
                bool strict = e.value("strict_status", false);
                cfg.Engine.StatusPolicy = strict ? EStatusPolicy::Strict : EStatusPolicy::Open;
                cfg.Engine.ExcludeCancelledFromConflicts = e.value("exclude_cancelled", false);
            }

            if (j.contains("query")) {
                auto limit = j.at("query").value("default_limit", static_cast<int64_t>(DEFAULT_PAGE_LIMIT));
                if (limit <= 0) {
                    return TResult<TEngineConfig>::Err(EErrorKind::Validation, "query.default_limit must be positive");
                }
                cfg.Engine.DefaultPageLimit = static_cast<size_t>(limit);
            }

            if (j.contains("log")) {
                auto const& l = j.at("log");
                if (l.contains("level")) {
                    auto text = l.at("level").get<std::string>();
                    auto level = ParseLogLevel(text);
                    if (!level) {
                        return TResult<TEngineConfig>::Err(EErrorKind::Validation, "Unknown log level: " + text);
                    }
                    cfg.LogLevel = *level;
                }
                if (l.contains("file")) {
                    cfg.LogFile = Resolve(baseDir, l.at("file").get<std::string>());
                }
            }
        } catch (const nlohmann::json::exception& e) {
            return TResult<TEngineConfig>::Err(EErrorKind::Validation, std::string("Malformed config: ") + e.what());
        }
        return TResult<TEngineConfig>::Ok(std::move(cfg));
    }

    TResult<TEngineConfig> LoadConfig(const std::filesystem::path& path) {
        std::ifstream in(path);
        if (!in) {
            return TResult<TEngineConfig>::Err(EErrorKind::Validation, "Cannot open config file: " + path.string());
        }
        nlohmann::json j;
        try {
            in >> j;
        } catch (const nlohmann::json::parse_error& e) {
            return TResult<TEngineConfig>::Err(EErrorKind::Validation,
                                               "Cannot parse config " + path.string() + ": " + e.what());
        }
        return ParseConfig(j, path.parent_path());
    }

} // namespace NReservation
