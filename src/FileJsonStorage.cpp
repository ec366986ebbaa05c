#include <FileJsonStorage.hpp>
#include <log.hpp>

#include <fstream>
#include <stdexcept>
#include <system_error>

namespace NReservation {

    TFileJsonStorage::TFileJsonStorage(std::filesystem::path snapshotPath, std::filesystem::path journalPath)
        : SnapshotPath(std::move(snapshotPath))
        , JournalPath(std::move(journalPath)) {
    }

    void TFileJsonStorage::AtomicWrite(const std::filesystem::path& path, const nlohmann::json& j) {
        std::error_code ec;
        auto tmp = path;
        tmp += ".tmp";

        std::ofstream ofs(tmp, std::ios::trunc);
        if (!ofs) {
            throw std::runtime_error("Cannot open temp file for writing: " + tmp.string());
        }
        ofs << j.dump(2);
        ofs.close();
        if (!ofs) {
            std::filesystem::remove(tmp, ec);
            throw std::runtime_error("Short write to temp file: " + tmp.string());
        }

        std::filesystem::rename(tmp, path, ec);
        if (ec) {
            std::error_code ignored;
            std::filesystem::remove(tmp, ignored);
            throw std::runtime_error("Atomic rename failed: " + ec.message());
        }
    }

    void TFileJsonStorage::SaveState(const nlohmann::json& snapshot) {
        std::scoped_lock lk(Mutex_);
        if (!SnapshotPath.parent_path().empty()) {
            std::filesystem::create_directories(SnapshotPath.parent_path());
        }
        AtomicWrite(SnapshotPath, snapshot);
    }

    nlohmann::json TFileJsonStorage::LoadState() {
        std::scoped_lock lk(Mutex_);
        if (!std::filesystem::exists(SnapshotPath)) {
            return nlohmann::json::object();
        }
        std::ifstream ifs(SnapshotPath);
        if (!ifs) {
            throw std::runtime_error("Cannot open snapshot for reading: " + SnapshotPath.string());
        }
        try {
            return nlohmann::json::parse(ifs);
        } catch (const nlohmann::json::parse_error& e) {
            throw std::runtime_error("Corrupt snapshot " + SnapshotPath.string() + ": " + e.what());
        }
    }

    void TFileJsonStorage::AppendJournal(const nlohmann::json& entry) {
        std::scoped_lock lk(Mutex_);
        if (!JournalPath.parent_path().empty()) {
            std::filesystem::create_directories(JournalPath.parent_path());
        }
        std::ofstream ofs(JournalPath, std::ios::app);
        if (!ofs) {
            throw std::runtime_error("Cannot open journal file for append: " + JournalPath.string());
        }
        ofs << entry.dump() << '\n';
    }

    std::vector<nlohmann::json> TFileJsonStorage::LoadJournal() {
        std::scoped_lock lk(Mutex_);
        std::vector<nlohmann::json> out;
        if (!std::filesystem::exists(JournalPath)) {
            return out;
        }
        std::ifstream ifs(JournalPath);
        if (!ifs) {
            throw std::runtime_error("Cannot open journal for reading: " + JournalPath.string());
        }
        std::string line;
        size_t lineNo = 0;
        while (std::getline(ifs, line)) {
            ++lineNo;
            if (line.empty()) {
                continue;
            }
            try {
                out.push_back(nlohmann::json::parse(line));
            } catch (const nlohmann::json::parse_error& e) {
                // a torn trailing line is expected after a crash mid-append
                LogWarn("Skipping malformed journal line {} in {}: {}", lineNo, JournalPath.string(), e.what());
            }
        }
        return out;
    }

} // namespace NReservation
