#pragma once
#include <filesystem>
#include <fstream>
#include <mutex>
#include <optional>
#include <string>
#include <fmt/format.h>

namespace NReservation {

    enum class ELogLevel {
        Debug,
        Info,
        Warn,
        Error
    };

    std::optional<ELogLevel> ParseLogLevel(const std::string& text);
    const char* LogLevelName(ELogLevel level);

    // Process-wide line logger: "[HH:MM:SS.mmm] LEVEL message".
    // Writes to stderr until a file sink is set.
    class TLogger {
    public:
        static TLogger& Instance();

        void SetLevel(ELogLevel level);
        ELogLevel GetLevel() const;

        // Throws std::runtime_error if the file cannot be opened for append.
        void SetFile(const std::filesystem::path& path);

        bool Enabled(ELogLevel level) const;
        void Write(ELogLevel level, const std::string& msg);

    private:
        TLogger() = default;

        mutable std::mutex Mutex_;
        ELogLevel Level = ELogLevel::Info;
        std::optional<std::ofstream> File;
    };

    template <typename... Args>
    void Log(ELogLevel level, fmt::format_string<Args...> format, Args&&... args) {
        auto& logger = TLogger::Instance();
        if (!logger.Enabled(level)) {
            return;
        }
        logger.Write(level, fmt::format(format, std::forward<Args>(args)...));
    }

    template <typename... Args>
    void LogDebug(fmt::format_string<Args...> format, Args&&... args) {
        Log(ELogLevel::Debug, format, std::forward<Args>(args)...);
    }

    template <typename... Args>
    void LogInfo(fmt::format_string<Args...> format, Args&&... args) {
        Log(ELogLevel::Info, format, std::forward<Args>(args)...);
    }

    template <typename... Args>
    void LogWarn(fmt::format_string<Args...> format, Args&&... args) {
        Log(ELogLevel::Warn, format, std::forward<Args>(args)...);
    }

    template <typename... Args>
    void LogError(fmt::format_string<Args...> format, Args&&... args) {
        Log(ELogLevel::Error, format, std::forward<Args>(args)...);
    }

} // namespace NReservation
