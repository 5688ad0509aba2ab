// Copyright (c) 2025 The Tally Core developers
// Distributed under the MIT software license

#include <util/logging.h>
#include <util/strencodings.h>

#include <cerrno>
#include <cstdarg>
#include <cstdio>
#include <cstring>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <vector>

namespace {

struct LogCategoryName {
    LogCategory category;
    const char* name;
};

const LogCategoryName LOG_CATEGORIES[] = {
    {LogCategory::WALLET, "wallet"},
    {LogCategory::SCRIPT, "script"},
    {LogCategory::DB, "db"},
    {LogCategory::CONFIG, "config"},
    {LogCategory::ALL, "all"},
    {LogCategory::ALL, "1"},
    {LogCategory::NONE, "none"},
    {LogCategory::NONE, "0"},
};

std::string FormatLogLine(LogCategory category, LogLevel level, const std::string& message) {
    std::time_t now = std::time(nullptr);
    std::tm tm_buf;
    localtime_r(&now, &tm_buf);

    std::ostringstream oss;
    oss << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S") << " [" << GetLogLevelName(level) << "]";
    const char* name = GetLogCategoryName(category);
    if (name[0] != '\0') {
        oss << " [" << name << "]";
    }
    oss << " " << message;
    return oss.str();
}

} // namespace

const char* GetLogCategoryName(LogCategory category) {
    switch (category) {
        case LogCategory::WALLET: return "WALLET";
        case LogCategory::SCRIPT: return "SCRIPT";
        case LogCategory::DB: return "DB";
        case LogCategory::CONFIG: return "CONFIG";
        default: return "";
    }
}

const char* GetLogLevelName(LogLevel level) {
    switch (level) {
        case LogLevel::LVL_ERROR: return "ERROR";
        case LogLevel::LVL_WARN: return "WARN";
        case LogLevel::LVL_INFO: return "INFO";
        case LogLevel::LVL_DEBUG: return "DEBUG";
    }
    return "";
}

bool ParseLogCategories(const std::string& str, uint32_t& mask) {
    uint32_t result = 0;
    for (const std::string& item : SplitString(str, ',')) {
        std::string name = ToLower(item);
        bool found = false;
        for (const LogCategoryName& entry : LOG_CATEGORIES) {
            if (name == entry.name) {
                result |= static_cast<uint32_t>(entry.category);
                found = true;
                break;
            }
        }
        if (!found) {
            return false;
        }
    }

    mask = result;
    return true;
}

bool ParseLogLevel(const std::string& str, LogLevel& level) {
    std::string name = ToLower(str);
    if (name == "warning") {
        name = "warn";
    }

    const LogLevel levels[] = {LogLevel::LVL_ERROR, LogLevel::LVL_WARN, LogLevel::LVL_INFO, LogLevel::LVL_DEBUG};
    for (LogLevel candidate : levels) {
        if (name == ToLower(GetLogLevelName(candidate))) {
            level = candidate;
            return true;
        }
    }
    return false;
}

// CLoggingConfig

CLoggingConfig& CLoggingConfig::GetInstance() {
    static CLoggingConfig instance;
    return instance;
}

void CLoggingConfig::EnableCategory(LogCategory category) {
    m_categories.fetch_or(static_cast<uint32_t>(category));
}

void CLoggingConfig::DisableCategory(LogCategory category) {
    m_categories.fetch_and(~static_cast<uint32_t>(category));
}

bool CLoggingConfig::IsCategoryEnabled(LogCategory category) const {
    return (m_categories.load() & static_cast<uint32_t>(category)) != 0;
}

void CLoggingConfig::SetCategories(uint32_t mask) {
    m_categories.store(mask);
}

bool CLoggingConfig::ShouldLog(LogCategory category, LogLevel level) const {
    return IsCategoryEnabled(category) && level <= GetLogLevel();
}

void CLoggingConfig::SetLogFile(const std::string& path) {
    std::lock_guard<std::mutex> lock(cs_config);
    m_logFile = path;
}

std::string CLoggingConfig::GetLogFile() const {
    std::lock_guard<std::mutex> lock(cs_config);
    return m_logFile;
}

bool CLoggingConfig::IsFileLoggingEnabled() const {
    std::lock_guard<std::mutex> lock(cs_config);
    return !m_logFile.empty();
}

void CLoggingConfig::SetMaxLogSize(size_t nBytes) {
    std::lock_guard<std::mutex> lock(cs_config);
    m_maxLogSize = nBytes;
}

void CLoggingConfig::SetMaxLogFiles(size_t nFiles) {
    std::lock_guard<std::mutex> lock(cs_config);
    m_maxLogFiles = nFiles;
}

size_t CLoggingConfig::GetMaxLogSize() const {
    std::lock_guard<std::mutex> lock(cs_config);
    return m_maxLogSize;
}

size_t CLoggingConfig::GetMaxLogFiles() const {
    std::lock_guard<std::mutex> lock(cs_config);
    return m_maxLogFiles;
}

// CLogger

CLogger& CLogger::GetInstance() {
    static CLogger instance;
    return instance;
}

CLogger::~CLogger() {
    Shutdown();
}

bool CLogger::Initialize(const std::string& datadir) {
    CLoggingConfig& config = CLoggingConfig::GetInstance();
    std::string path = config.GetLogFile();

    std::lock_guard<std::mutex> lock(cs_log);
    if (m_file) {
        return true;
    }
    if (path.empty()) {
        return true;
    }

    if (!datadir.empty() && path[0] != '/') {
        path = datadir + "/" + path;
        config.SetLogFile(path);
    }
    return OpenLogFile(path);
}

void CLogger::Shutdown() {
    std::lock_guard<std::mutex> lock(cs_log);
    if (m_file) {
        m_file->flush();
        m_file.reset();
    }
    m_filePath.clear();
    m_fileSize = 0;
}

bool CLogger::OpenLogFile(const std::string& path) {
    auto file = std::make_unique<std::ofstream>(path, std::ios::app);
    if (!file->is_open()) {
        std::cerr << "Warning: Failed to open log file " << path << " (" << strerror(errno) << ")" << std::endl;
        return false;
    }

    file->seekp(0, std::ios::end);
    std::streamoff pos = file->tellp();
    m_fileSize = pos > 0 ? static_cast<size_t>(pos) : 0;
    m_file = std::move(file);
    m_filePath = path;
    return true;
}

void CLogger::RotateIfNeeded() {
    CLoggingConfig& config = CLoggingConfig::GetInstance();
    size_t nMaxSize = config.GetMaxLogSize();
    if (nMaxSize == 0 || m_fileSize < nMaxSize) {
        return;
    }

    m_file.reset();

    // debug.log.1 .. debug.log.(N-1) shift up by one, the oldest is overwritten
    size_t nMaxFiles = config.GetMaxLogFiles();
    for (size_t i = nMaxFiles; i > 1; i--) {
        std::string from = m_filePath + "." + std::to_string(i - 1);
        std::string to = m_filePath + "." + std::to_string(i);
        if (rename(from.c_str(), to.c_str()) != 0 && errno != ENOENT) {
            std::cerr << "Warning: Failed to rotate " << from << " (" << strerror(errno) << ")" << std::endl;
        }
    }

    std::string rotated = m_filePath + ".1";
    if (nMaxFiles == 0 || rename(m_filePath.c_str(), rotated.c_str()) != 0) {
        // Nowhere to keep it; start the live file over
        m_file = std::make_unique<std::ofstream>(m_filePath, std::ios::trunc);
    } else {
        m_file = std::make_unique<std::ofstream>(m_filePath, std::ios::app);
    }
    m_fileSize = 0;
    if (!m_file->is_open()) {
        std::cerr << "Warning: Failed to reopen log file " << m_filePath << std::endl;
        m_file.reset();
    }
}

void CLogger::WriteLine(LogLevel level, const std::string& line) {
    if (CLoggingConfig::GetInstance().IsConsoleLoggingEnabled()) {
        std::ostream& out = (level == LogLevel::LVL_ERROR) ? std::cerr : std::cout;
        out << line << std::endl;
    }

    if (m_file) {
        RotateIfNeeded();
    }
    if (m_file) {
        *m_file << line << '\n';
        m_file->flush();
        m_fileSize += line.size() + 1;
    }
}

void CLogger::Log(LogCategory category, LogLevel level, const std::string& message) {
    if (!CLoggingConfig::GetInstance().ShouldLog(category, level)) {
        return;
    }

    std::string line = FormatLogLine(category, level, message);

    std::lock_guard<std::mutex> lock(cs_log);
    m_messageCount++;
    WriteLine(level, line);
}

void CLogger::LogPrintFormat(LogCategory category, LogLevel level, const char* format, ...) {
    if (!CLoggingConfig::GetInstance().ShouldLog(category, level)) {
        return;
    }

    std::vector<char> buffer(512);
    va_list args;
    va_start(args, format);
    va_list retry;
    va_copy(retry, args);
    int n = vsnprintf(buffer.data(), buffer.size(), format, args);
    if (n >= 0 && static_cast<size_t>(n) >= buffer.size()) {
        buffer.resize(static_cast<size_t>(n) + 1);
        n = vsnprintf(buffer.data(), buffer.size(), format, retry);
    }
    va_end(retry);
    va_end(args);

    if (n < 0) {
        Log(category, level, std::string("log format error: ") + format);
        return;
    }
    Log(category, level, std::string(buffer.data(), static_cast<size_t>(n)));
}
