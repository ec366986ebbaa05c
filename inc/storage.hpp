#pragma once
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace NReservation {

    // Durable backend for the reservation table: the latest full snapshot plus
    // an append-only journal of applied operations. Implementations report I/O
    // failures with std::runtime_error.
    struct IStorage {
        virtual ~IStorage() = default;
        virtual void SaveState(const nlohmann::json& snapshot) = 0;
        virtual nlohmann::json LoadState() = 0;
        virtual void AppendJournal(const nlohmann::json& entry) = 0;
        virtual std::vector<nlohmann::json> LoadJournal() = 0;
    };

    // Keeps everything in process memory. A write failure can be armed to
    // exercise the store's StoreUnavailable path without touching disk.
    class TMemoryStorage: public IStorage {
    public:
        TMemoryStorage() = default;

        void SaveState(const nlohmann::json& snapshot) override {
            std::scoped_lock lk(Mutex_);
            if (WriteFailure) {
                throw std::runtime_error(*WriteFailure);
            }
            Snapshot = snapshot;
            ++Saves;
        }

        nlohmann::json LoadState() override {
            std::scoped_lock lk(Mutex_);
            return Snapshot;
        }

        void AppendJournal(const nlohmann::json& entry) override {
            std::scoped_lock lk(Mutex_);
            Journal.push_back(entry);
        }

        std::vector<nlohmann::json> LoadJournal() override {
            std::scoped_lock lk(Mutex_);
            return Journal;
        }

        // While set, SaveState throws std::runtime_error with this message.
        void FailWrites(std::optional<std::string> reason) {
            std::scoped_lock lk(Mutex_);
            WriteFailure = std::move(reason);
        }

        size_t SnapshotWrites() const {
            std::scoped_lock lk(Mutex_);
            return Saves;
        }

    private:
        nlohmann::json Snapshot = nlohmann::json::object();
        std::vector<nlohmann::json> Journal;
        std::optional<std::string> WriteFailure;
        size_t Saves = 0;
        mutable std::mutex Mutex_;
    };

} // namespace NReservation
