// Copyright (c) 2025 The Tally Core developers
// Distributed under the MIT software license

#ifndef TALLY_UTIL_LOGGING_H
#define TALLY_UTIL_LOGGING_H

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <fstream>
#include <memory>
#include <mutex>
#include <string>

/**
 * Logging for the wallet core
 *
 * Messages carry a category and a level. CLoggingConfig holds the filters
 * and sink settings, CLogger formats and writes. Console output goes to
 * stdout (stderr for errors); file output is appended to one log file that
 * is rotated by size.
 *
 * Line format: "YYYY-MM-DD HH:MM:SS [LEVEL] [CATEGORY] message"
 */

enum class LogCategory : uint32_t {
    NONE = 0,
    WALLET = (1 << 0),        // Transaction scanning, coin bookkeeping
    SCRIPT = (1 << 1),        // Script template matching
    DB = (1 << 2),            // Wallet database
    CONFIG = (1 << 3),        // Configuration loading
    ALL = 0xFFFFFFFF
};

// LVL_ prefix: ERROR is a macro on some platforms
enum class LogLevel {
    LVL_ERROR = 0,
    LVL_WARN = 1,
    LVL_INFO = 2,
    LVL_DEBUG = 3
};

/** Upper-case name for a single category, "" for NONE/ALL/combinations */
const char* GetLogCategoryName(LogCategory category);
const char* GetLogLevelName(LogLevel level);

/**
 * Parse a comma separated category list ("wallet,db", "all", "none")
 * @param str Category list
 * @param[out] mask Resulting category mask, untouched on failure
 * @return false if an unknown category name was found
 */
bool ParseLogCategories(const std::string& str, uint32_t& mask);

/** Parse "error", "warn"/"warning", "info" or "debug" (any case) */
bool ParseLogLevel(const std::string& str, LogLevel& level);

/**
 * Filters and sink settings. Defaults: every category, INFO, console on,
 * no log file, rotation at 10 MiB keeping 10 old files.
 */
class CLoggingConfig {
public:
    static CLoggingConfig& GetInstance();

    void EnableCategory(LogCategory category);
    void DisableCategory(LogCategory category);
    bool IsCategoryEnabled(LogCategory category) const;
    void SetCategories(uint32_t mask);
    uint32_t GetCategories() const { return m_categories.load(); }

    void SetLogLevel(LogLevel level) { m_level.store(level); }
    LogLevel GetLogLevel() const { return m_level.load(); }

    /** True if a message with this category and level passes the filters */
    bool ShouldLog(LogCategory category, LogLevel level) const;

    // Empty path disables file output
    void SetLogFile(const std::string& path);
    std::string GetLogFile() const;
    bool IsFileLoggingEnabled() const;

    void SetConsoleLogging(bool enable) { m_console.store(enable); }
    bool IsConsoleLoggingEnabled() const { return m_console.load(); }

    // Rotation; a max size of 0 disables it
    void SetMaxLogSize(size_t nBytes);
    void SetMaxLogFiles(size_t nFiles);
    size_t GetMaxLogSize() const;
    size_t GetMaxLogFiles() const;

private:
    CLoggingConfig() = default;

    std::atomic<uint32_t> m_categories{static_cast<uint32_t>(LogCategory::ALL)};
    std::atomic<LogLevel> m_level{LogLevel::LVL_INFO};
    std::atomic<bool> m_console{true};

    mutable std::mutex cs_config;
    std::string m_logFile;
    size_t m_maxLogSize{10 * 1024 * 1024};
    size_t m_maxLogFiles{10};
};

class CLogger {
public:
    static CLogger& GetInstance();

    /**
     * Open the configured log file, if any. A relative file name is placed
     * in datadir and the configured path is updated to match.
     * @return false if the file cannot be opened
     */
    bool Initialize(const std::string& datadir);

    /** Flush and close the log file. Initialize may be called again. */
    void Shutdown();

    void Log(LogCategory category, LogLevel level, const std::string& message);
    void LogPrintFormat(LogCategory category, LogLevel level, const char* format, ...);

    /** Messages that passed the filters since startup */
    uint64_t GetMessageCount() const { return m_messageCount.load(); }

private:
    CLogger() = default;
    ~CLogger();

    // All three require cs_log
    bool OpenLogFile(const std::string& path);
    void RotateIfNeeded();
    void WriteLine(LogLevel level, const std::string& line);

    std::mutex cs_log;
    std::unique_ptr<std::ofstream> m_file;
    std::string m_filePath;
    size_t m_fileSize{0};
    std::atomic<uint64_t> m_messageCount{0};
};

#define LogPrintf(category, level, format, ...) \
    CLogger::GetInstance().LogPrintFormat(LogCategory::category, LogLevel::LVL_##level, format, ##__VA_ARGS__)

#define LogPrintWallet(level, format, ...) LogPrintf(WALLET, level, format, ##__VA_ARGS__)
#define LogPrintScript(level, format, ...) LogPrintf(SCRIPT, level, format, ##__VA_ARGS__)
#define LogPrintDB(level, format, ...) LogPrintf(DB, level, format, ##__VA_ARGS__)
#define LogPrintConfig(level, format, ...) LogPrintf(CONFIG, level, format, ##__VA_ARGS__)

#endif // TALLY_UTIL_LOGGING_H
