// Copyright (c) 2026 The ArtDNA Core developers
// Distributed under the MIT software license

#ifndef ARTDNA_UTIL_LOGGING_H
#define ARTDNA_UTIL_LOGGING_H

#include <string>
#include <fstream>
#include <mutex>
#include <atomic>
#include <memory>
#include <cstdint>

/**
 * Process-wide logging for the DNA engine
 *
 * Features:
 * - Log categories (ENCODER, PIPELINE, WORKER, STORAGE, ...)
 * - Log levels (ERROR, WARN, INFO, DEBUG)
 * - Thread-safe: encoders log from worker threads
 * - File and console output
 * - Size-based log rotation
 */

/**
 * Log categories (bitmask, so several can be enabled at once)
 */
enum class LogCategory : uint32_t {
    NONE = 0,
    ENCODER = (1 << 0),       // Stroke/image/temporal encoders
    PIPELINE = (1 << 1),      // Hot/cold path orchestration
    WORKER = (1 << 2),        // Worker pool
    STORAGE = (1 << 3),       // Session persistence
    ANALYSIS = (1 << 4),      // Distance, blend, projection, scoring
    CONTEXT = (1 << 5),       // Artist context tracking
    CONFIG = (1 << 6),        // Configuration loading
    ALL = 0xFFFFFFFF
};

/**
 * Log levels
 * Note: Using LVL_ prefix to avoid conflicts with Windows ERROR macro
 */
enum class LogLevel {
    LVL_ERROR = 0,
    LVL_WARN = 1,
    LVL_INFO = 2,
    LVL_DEBUG = 3
};

/**
 * Logging configuration
 */
class CLoggingConfig {
public:
    static CLoggingConfig& GetInstance();

    // Enable/disable categories
    void EnableCategory(LogCategory category);
    void DisableCategory(LogCategory category);
    bool IsCategoryEnabled(LogCategory category) const;

    void SetLogLevel(LogLevel level);
    LogLevel GetLogLevel() const;

    // File logging
    void SetLogFile(const std::string& path);
    std::string GetLogFile() const;
    bool IsFileLoggingEnabled() const;

    // Console logging
    void SetConsoleLogging(bool enable);
    bool IsConsoleLoggingEnabled() const { return m_consoleLogging; }

    // Log rotation
    void SetMaxLogSize(size_t maxSize);
    size_t GetMaxLogSize() const;
    void SetMaxLogFiles(size_t maxFiles);
    size_t GetMaxLogFiles() const;

private:
    CLoggingConfig();
    ~CLoggingConfig() = default;

    std::atomic<uint32_t> m_enabledCategories{static_cast<uint32_t>(LogCategory::ALL)};
    std::atomic<LogLevel> m_logLevel{LogLevel::LVL_INFO};
    std::string m_logFile;
    std::atomic<bool> m_consoleLogging{true};
    size_t m_maxLogSize{10 * 1024 * 1024};  // 10 MB default
    size_t m_maxLogFiles{5};
    mutable std::mutex m_configMutex;
};

/**
 * Parse a level name ("error", "warn", "info", "debug").
 * Unknown names map to LVL_INFO.
 */
LogLevel ParseLogLevel(const std::string& name);

/**
 * Parse a category name ("encoder", "storage", "all", ...).
 * @return false if the name is unknown
 */
bool ParseLogCategory(const std::string& name, LogCategory& category);

/**
 * Main logging class
 */
class CLogger {
public:
    static CLogger& GetInstance();

    /**
     * Open the log file if one is configured.
     * @param datadir Directory used for artdna.log when no explicit path is set
     * @return false if the file could not be opened
     */
    bool Initialize(const std::string& datadir);

    void Shutdown();

    void Log(LogCategory category, LogLevel level, const std::string& message);

    void LogPrint(LogCategory category, LogLevel level, const std::string& str);
    void LogPrintFormat(LogCategory category, LogLevel level, const char* format, ...)
#if defined(__GNUC__)
        __attribute__((format(printf, 4, 5)))
#endif
        ;

private:
    CLogger();
    ~CLogger();

    void RotateLogIfNeeded();
    void WriteToFile(const std::string& message);
    void WriteToConsole(LogLevel level, const std::string& message);

    // Format log message (not FormatMessage to avoid Windows API conflict)
    std::string FormatLogMsg(LogCategory category, LogLevel level, const std::string& message);

    std::unique_ptr<std::ofstream> m_logFile;
    std::string m_logPath;
    std::mutex m_logMutex;
    std::atomic<bool> m_initialized{false};
    size_t m_currentLogSize{0};
};

#define LogPrintf(category, level, format, ...) \
    CLogger::GetInstance().LogPrintFormat(LogCategory::category, LogLevel::LVL_##level, format, ##__VA_ARGS__)

// Category-specific macros (with format string)
#define LogPrintEncoder(level, format, ...) LogPrintf(ENCODER, level, format, ##__VA_ARGS__)
#define LogPrintPipeline(level, format, ...) LogPrintf(PIPELINE, level, format, ##__VA_ARGS__)
#define LogPrintWorker(level, format, ...) LogPrintf(WORKER, level, format, ##__VA_ARGS__)
#define LogPrintStorage(level, format, ...) LogPrintf(STORAGE, level, format, ##__VA_ARGS__)
#define LogPrintAnalysis(level, format, ...) LogPrintf(ANALYSIS, level, format, ##__VA_ARGS__)
#define LogPrintContext(level, format, ...) LogPrintf(CONTEXT, level, format, ##__VA_ARGS__)
#define LogPrintConfig(level, format, ...) LogPrintf(CONFIG, level, format, ##__VA_ARGS__)

#endif // ARTDNA_UTIL_LOGGING_H
