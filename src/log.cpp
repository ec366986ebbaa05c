#include <log.hpp>

#include <algorithm>
#include <cctype>
#include <chrono>
#include <ctime>
#include <iostream>
#include <stdexcept>

namespace NReservation {

    std::optional<ELogLevel> ParseLogLevel(const std::string& text) {
        std::string lower = text;
        std::transform(lower.begin(), lower.end(), lower.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        if (lower == "debug") {
            return ELogLevel::Debug;
        }
        if (lower == "info") {
            return ELogLevel::Info;
        }
        if (lower == "warn" || lower == "warning") {
            return ELogLevel::Warn;
        }
        if (lower == "error") {
            return ELogLevel::Error;
        }
        return std::nullopt;
    }

    const char* LogLevelName(ELogLevel level) {
        switch (level) {
            case ELogLevel::Debug:
                return "DEBUG";
            case ELogLevel::Info:
                return "INFO";
            case ELogLevel::Warn:
                return "WARN";
            case ELogLevel::Error:
                return "ERROR";
        }
        return "INFO";
    }

    TLogger& TLogger::Instance() {
        static TLogger logger;
        return logger;
    }

    void TLogger::SetLevel(ELogLevel level) {
        std::lock_guard lk(Mutex_);
        Level = level;
    }

    ELogLevel TLogger::GetLevel() const {
        std::lock_guard lk(Mutex_);
        return Level;
    }

    void TLogger::SetFile(const std::filesystem::path& path) {
        if (!path.parent_path().empty()) {
            std::filesystem::create_directories(path.parent_path());
        }
        std::ofstream out(path, std::ios::app);
        if (!out) {
            throw std::runtime_error("Cannot open log file for append: " + path.string());
        }
        std::lock_guard lk(Mutex_);
        File = std::move(out);
    }

    bool TLogger::Enabled(ELogLevel level) const {
        std::lock_guard lk(Mutex_);
        return static_cast<int>(level) >= static_cast<int>(Level);
    }

    void TLogger::Write(ELogLevel level, const std::string& msg) {
        auto now = std::chrono::system_clock::now();
        auto t = std::chrono::system_clock::to_time_t(now);
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                      now.time_since_epoch()) %
                  1000;
        std::tm tm_buf{};
        localtime_r(&t, &tm_buf);

        std::string line = fmt::format("[{:02d}:{:02d}:{:02d}.{:03d}] {} {}\n",
                                       tm_buf.tm_hour, tm_buf.tm_min, tm_buf.tm_sec,
                                       static_cast<int>(ms.count()), LogLevelName(level), msg);

        std::lock_guard lk(Mutex_);
        if (File) {
            *File << line;
            File->flush();
        } else {
            std::cerr << line;
        }
    }

} // namespace NReservation
