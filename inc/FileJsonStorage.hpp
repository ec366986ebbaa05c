#pragma once
#include "storage.hpp"
#include <filesystem>
#include <mutex>
#include <nlohmann/json.hpp>

namespace NReservation {

    class TFileJsonStorage: public IStorage {
    public:
        TFileJsonStorage(std::filesystem::path snapshotPath, std::filesystem::path journalPath);

        void SaveState(const nlohmann::json& snapshot) override;
        nlohmann::json LoadState() override;
        void AppendJournal(const nlohmann::json& entry) override;
        std::vector<nlohmann::json> LoadJournal() override;

    private:
        // Write to "<path>.tmp" then rename over the target.
        void AtomicWrite(const std::filesystem::path& path, const nlohmann::json& j);

    private:
        std::filesystem::path SnapshotPath;
        std::filesystem::path JournalPath;
        std::mutex Mutex_;
    };

} // namespace NReservation
