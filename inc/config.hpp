#pragma once
#include <filesystem>
#include <optional>
#include <string>

#include "ReservationEngine.hpp"
#include "log.hpp"
#include "result.hpp"

namespace NReservation {

    enum class EStorageKind {
        Memory,
        File
    };

    struct TStorageConfig {
        EStorageKind Kind = EStorageKind::Memory;
        std::filesystem::path Snapshot = "data/reservations.json";
        std::filesystem::path Journal = "data/reservations.journal";
    };

    struct TEngineConfig {
        TStorageConfig Storage;
        std::optional<std::filesystem::path> CatalogSeed;
        TEngineOptions Engine;
        ELogLevel LogLevel = ELogLevel::Info;
        std::optional<std::filesystem::path> LogFile;
    };

    // Every key is optional:
    //   {"storage": {"kind": "memory"|"file", "snapshot": "...", "journal": "..."},
    //    "catalog": {"seed": "..."},
    //    "engine": {"strict_status": true, "exclude_cancelled": false},
    //    "query": {"default_limit": 10},
    //    "log": {"level": "info", "file": "..."}}
    // Relative paths are resolved against the config file's directory.
    TResult<TEngineConfig> LoadConfig(const std::filesystem::path& path);
    TResult<TEngineConfig> ParseConfig(const nlohmann::json& j, const std::filesystem::path& baseDir = {});

} // namespace NReservation
