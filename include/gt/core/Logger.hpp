#pragma once
#include <algorithm>
#include <atomic>
#include <cctype>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <functional>
#include <initializer_list>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

#include <fmt/format.h>

namespace gt {
namespace core {

enum class LogLevel {
    Debug,
    Info,
    Warning,
    Error
};

inline std::optional<LogLevel> ParseLogLevel(std::string_view text) {
    std::string value(text);
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (value == "debug") return LogLevel::Debug;
    if (value == "info") return LogLevel::Info;
    if (value == "warning" || value == "warn") return LogLevel::Warning;
    if (value == "error") return LogLevel::Error;
    return std::nullopt;
}

class Logger {
public:
    using LogCallback = std::function<void(LogLevel, const std::string&)>;

    template<typename... Args>
    static void Debug(fmt::format_string<Args...> format, Args&&... args) {
#ifdef GT_DEBUG
        if (!ShouldLog(LogLevel::Debug)) {
            return;
        }
        Write(LogLevel::Debug, fmt::format(format, std::forward<Args>(args)...));
#else
        (void)format;
        (void)std::initializer_list<int>{((void)args, 0)...};
#endif
    }

    template<typename... Args>
    static void Info(fmt::format_string<Args...> format, Args&&... args) {
        if (ShouldLog(LogLevel::Info)) {
            Write(LogLevel::Info, fmt::format(format, std::forward<Args>(args)...));
        }
    }

    template<typename... Args>
    static void Warning(fmt::format_string<Args...> format, Args&&... args) {
        if (ShouldLog(LogLevel::Warning)) {
            Write(LogLevel::Warning, fmt::format(format, std::forward<Args>(args)...));
        }
    }

    template<typename... Args>
    static void Error(fmt::format_string<Args...> format, Args&&... args) {
        Write(LogLevel::Error, fmt::format(format, std::forward<Args>(args)...));
    }

    // Errors are always written regardless of the minimum level.
    static void SetMinimumLevel(LogLevel level) {
        s_minimumLevel.store(static_cast<int>(level), std::memory_order_release);
        s_configured.store(true, std::memory_order_release);
    }

    static LogLevel MinimumLevel() {
        EnsureConfigured();
        return static_cast<LogLevel>(s_minimumLevel.load(std::memory_order_acquire));
    }

    // Reads GT_LOG_LEVEL; unknown values leave the current level untouched.
    static void ConfigureFromEnvironment() {
        if (const char* env = std::getenv("GT_LOG_LEVEL")) {
            if (auto level = ParseLogLevel(env)) {
                s_minimumLevel.store(static_cast<int>(*level), std::memory_order_release);
            }
        }
        s_configured.store(true, std::memory_order_release);
    }

    static void SetLogFile(const std::filesystem::path& path) {
        std::lock_guard<std::mutex> lock(s_logMutex);
        if (s_logStream.is_open()) {
            s_logStream.close();
        }
        s_logFilePath = path;
        if (s_logFilePath.empty()) {
            return;
        }
        std::error_code ec;
        if (s_logFilePath.has_parent_path()) {
            std::filesystem::create_directories(s_logFilePath.parent_path(), ec);
        }
        s_logStream.open(s_logFilePath, std::ios::out | std::ios::app);
    }

    static size_t RegisterListener(LogCallback callback) {
        if (!callback) {
            return 0;
        }
        std::lock_guard<std::mutex> lock(s_logMutex);
        const size_t token = s_listenerCounter.fetch_add(1, std::memory_order_relaxed);
        s_listeners.emplace_back(token, std::move(callback));
        return token;
    }

    static void UnregisterListener(size_t token) {
        if (token == 0) {
            return;
        }
        std::lock_guard<std::mutex> lock(s_logMutex);
        s_listeners.erase(std::remove_if(s_listeners.begin(), s_listeners.end(),
                                         [token](const auto& entry) { return entry.first == token; }),
                          s_listeners.end());
    }

private:
    static bool ShouldLog(LogLevel level) {
        return static_cast<int>(level) >= static_cast<int>(MinimumLevel());
    }

    static void EnsureConfigured() {
        if (!s_configured.load(std::memory_order_acquire)) {
            ConfigureFromEnvironment();
        }
    }

    static void Write(LogLevel level, const std::string& message) {
        const std::string line = fmt::format("[{}] {}{}", FormatTimestamp(), LogLevelPrefix(level), message);

        fmt::print(stderr, "{}\n", line);

        std::vector<LogCallback> listenersCopy;
        {
            std::lock_guard<std::mutex> lock(s_logMutex);
            if (s_logStream.is_open()) {
                s_logStream << line << '\n';
                s_logStream.flush();
            }
            listenersCopy.reserve(s_listeners.size());
            for (const auto& [token, callback] : s_listeners) {
                listenersCopy.push_back(callback);
            }
        }

        for (auto& callback : listenersCopy) {
            callback(level, line);
        }
    }

    static constexpr const char* LogLevelPrefix(LogLevel level) {
        switch (level) {
            case LogLevel::Debug:   return "[Debug] ";
            case LogLevel::Info:    return "[Info] ";
            case LogLevel::Warning: return "[Warning] ";
            case LogLevel::Error:   return "[Error] ";
        }
        return "";
    }

    static std::string FormatTimestamp() {
        using namespace std::chrono;
        const auto now = system_clock::now();
        const auto timeT = system_clock::to_time_t(now);
        std::tm tm{};
#ifdef _WIN32
        localtime_s(&tm, &timeT);
#else
        localtime_r(&timeT, &tm);
#endif
        const auto ms = duration_cast<milliseconds>(now.time_since_epoch()) % 1000;
        return fmt::format("{:02}:{:02}:{:02}.{:03}", tm.tm_hour, tm.tm_min, tm.tm_sec, ms.count());
    }

    static inline std::atomic<int> s_minimumLevel{static_cast<int>(LogLevel::Info)};
    static inline std::atomic<bool> s_configured{false};
    static inline std::mutex s_logMutex{};
    static inline std::filesystem::path s_logFilePath{};
    static inline std::ofstream s_logStream{};
    static inline std::vector<std::pair<size_t, LogCallback>> s_listeners{};
    static inline std::atomic<size_t> s_listenerCounter{1};
};

}} // namespace gt::core
