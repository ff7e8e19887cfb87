// Copyright (c) 2026 The ArtDNA Core developers
// Distributed under the MIT software license

#include <util/logging.h>
#include <util/strencodings.h>
#include <iostream>
#include <iomanip>
#include <sstream>
#include <ctime>
#include <cstdarg>
#include <cstdio>
#include <cerrno>
#include <cstring>
#include <algorithm>

// CLoggingConfig implementation
CLoggingConfig& CLoggingConfig::GetInstance() {
    static CLoggingConfig instance;
    return instance;
}

CLoggingConfig::CLoggingConfig() {
    m_enabledCategories = static_cast<uint32_t>(LogCategory::ALL);
    m_logLevel = LogLevel::LVL_INFO;
}

void CLoggingConfig::EnableCategory(LogCategory category) {
    m_enabledCategories.fetch_or(static_cast<uint32_t>(category));
}

void CLoggingConfig::DisableCategory(LogCategory category) {
    m_enabledCategories.fetch_and(~static_cast<uint32_t>(category));
}

bool CLoggingConfig::IsCategoryEnabled(LogCategory category) const {
    uint32_t cat = static_cast<uint32_t>(category);
    return (m_enabledCategories.load() & cat) != 0;
}

void CLoggingConfig::SetLogLevel(LogLevel level) {
    m_logLevel.store(level);
}

LogLevel CLoggingConfig::GetLogLevel() const {
    return m_logLevel.load();
}

void CLoggingConfig::SetLogFile(const std::string& path) {
    std::lock_guard<std::mutex> lock(m_configMutex);
    m_logFile = path;
}

std::string CLoggingConfig::GetLogFile() const {
    std::lock_guard<std::mutex> lock(m_configMutex);
    return m_logFile;
}

bool CLoggingConfig::IsFileLoggingEnabled() const {
    std::lock_guard<std::mutex> lock(m_configMutex);
    return !m_logFile.empty();
}

void CLoggingConfig::SetConsoleLogging(bool enable) {
    m_consoleLogging.store(enable);
}

void CLoggingConfig::SetMaxLogSize(size_t maxSize) {
    std::lock_guard<std::mutex> lock(m_configMutex);
    m_maxLogSize = maxSize;
}

size_t CLoggingConfig::GetMaxLogSize() const {
    std::lock_guard<std::mutex> lock(m_configMutex);
    return m_maxLogSize;
}

void CLoggingConfig::SetMaxLogFiles(size_t maxFiles) {
    std::lock_guard<std::mutex> lock(m_configMutex);
    m_maxLogFiles = std::max<size_t>(maxFiles, 1);
}

size_t CLoggingConfig::GetMaxLogFiles() const {
    std::lock_guard<std::mutex> lock(m_configMutex);
    return m_maxLogFiles;
}

LogLevel ParseLogLevel(const std::string& name) {
    std::string lower = ToLower(name);
    if (lower == "error") return LogLevel::LVL_ERROR;
    if (lower == "warn" || lower == "warning") return LogLevel::LVL_WARN;
    if (lower == "debug") return LogLevel::LVL_DEBUG;
    return LogLevel::LVL_INFO;
}

bool ParseLogCategory(const std::string& name, LogCategory& category) {
    std::string lower = ToLower(name);
    static const struct { const char* name; LogCategory category; } names[] = {
        {"none", LogCategory::NONE},
        {"encoder", LogCategory::ENCODER},
        {"pipeline", LogCategory::PIPELINE},
        {"worker", LogCategory::WORKER},
        {"storage", LogCategory::STORAGE},
        {"analysis", LogCategory::ANALYSIS},
        {"context", LogCategory::CONTEXT},
        {"config", LogCategory::CONFIG},
        {"all", LogCategory::ALL},
    };
    for (const auto& entry : names) {
        if (lower == entry.name) {
            category = entry.category;
            return true;
        }
    }
    return false;
}

// CLogger implementation
CLogger& CLogger::GetInstance() {
    static CLogger instance;
    return instance;
}

CLogger::CLogger() {
}

CLogger::~CLogger() {
    Shutdown();
}

bool CLogger::Initialize(const std::string& datadir) {
    std::lock_guard<std::mutex> lock(m_logMutex);

    if (m_initialized.load()) {
        return true;
    }

    CLoggingConfig& config = CLoggingConfig::GetInstance();

    if (config.IsFileLoggingEnabled() || !datadir.empty()) {
        std::string logPath = config.GetLogFile();
        if (logPath.empty()) {
            logPath = datadir + "/artdna.log";
        }

        m_logFile = std::make_unique<std::ofstream>(logPath, std::ios::app);
        if (!m_logFile->is_open()) {
            std::cerr << "Warning: Failed to open log file: " << logPath << std::endl;
            m_logFile.reset();
            return false;
        }

        m_logFile->seekp(0, std::ios::end);
        m_currentLogSize = static_cast<size_t>(m_logFile->tellp());
        m_logPath = logPath;
    }

    m_initialized.store(true);
    return true;
}

void CLogger::Shutdown() {
    std::lock_guard<std::mutex> lock(m_logMutex);

    if (m_logFile && m_logFile->is_open()) {
        m_logFile->flush();
        m_logFile->close();
    }
    m_logFile.reset();

    m_initialized.store(false);
}

void CLogger::Log(LogCategory category, LogLevel level, const std::string& message) {
    CLoggingConfig& config = CLoggingConfig::GetInstance();

    if (!config.IsCategoryEnabled(category)) {
        return;
    }

    if (level > config.GetLogLevel()) {
        return;
    }

    std::string formatted = FormatLogMsg(category, level, message);

    std::lock_guard<std::mutex> lock(m_logMutex);

    if (config.IsConsoleLoggingEnabled()) {
        WriteToConsole(level, formatted);
    }

    if (m_initialized.load() && m_logFile && m_logFile->is_open()) {
        WriteToFile(formatted);
    }
}

void CLogger::LogPrint(LogCategory category, LogLevel level, const std::string& str) {
    Log(category, level, str);
}

void CLogger::LogPrintFormat(LogCategory category, LogLevel level, const char* format, ...) {
    char buffer[4096];
    va_list args;
    va_start(args, format);
    vsnprintf(buffer, sizeof(buffer), format, args);
    va_end(args);

    Log(category, level, std::string(buffer));
}

// Caller holds m_logMutex
void CLogger::RotateLogIfNeeded() {
    CLoggingConfig& config = CLoggingConfig::GetInstance();

    if (m_currentLogSize < config.GetMaxLogSize()) {
        return;
    }

    if (!m_logFile || !m_logFile->is_open() || m_logPath.empty()) {
        return;
    }

    m_logFile->flush();
    m_logFile->close();

    // artdna.log.N-1 -> artdna.log.N, oldest one is overwritten
    size_t maxFiles = config.GetMaxLogFiles();
    for (size_t i = maxFiles - 1; i > 0; i--) {
        std::string oldFile = m_logPath + "." + std::to_string(i);
        std::string newFile = m_logPath + "." + std::to_string(i + 1);
        if (std::rename(oldFile.c_str(), newFile.c_str()) != 0 && errno != ENOENT) {
            std::cerr << "[Logger] Warning: Failed to rotate log file " << oldFile
                      << " to " << newFile << " (" << std::strerror(errno) << ")" << std::endl;
        }
    }

    std::string rotatedFile = m_logPath + ".1";
    if (std::rename(m_logPath.c_str(), rotatedFile.c_str()) != 0) {
        std::cerr << "[Logger] Warning: Failed to rotate current log file to " << rotatedFile
                  << " (" << std::strerror(errno) << ")" << std::endl;
    }

    m_logFile = std::make_unique<std::ofstream>(m_logPath, std::ios::trunc);
    m_currentLogSize = 0;
}

void CLogger::WriteToFile(const std::string& message) {
    RotateLogIfNeeded();

    if (!m_logFile || !m_logFile->is_open()) {
        return;
    }

    *m_logFile << message << std::endl;
    m_currentLogSize += message.size() + 1;
}

void CLogger::WriteToConsole(LogLevel level, const std::string& message) {
    std::ostream& stream = (level <= LogLevel::LVL_WARN) ? std::cerr : std::cout;
    stream << message << std::endl;
}

std::string CLogger::FormatLogMsg(LogCategory category, LogLevel level, const std::string& message) {
    std::ostringstream oss;

    std::time_t now = std::time(nullptr);
    std::tm tm_buf{};
#ifdef _WIN32
    localtime_s(&tm_buf, &now);
#else
    localtime_r(&now, &tm_buf);
#endif
    oss << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S");

    const char* levelStr = "";
    switch (level) {
        case LogLevel::LVL_ERROR: levelStr = "ERROR"; break;
        case LogLevel::LVL_WARN: levelStr = "WARN"; break;
        case LogLevel::LVL_INFO: levelStr = "INFO"; break;
        case LogLevel::LVL_DEBUG: levelStr = "DEBUG"; break;
    }
    oss << " [" << levelStr << "]";

    const char* catStr = "";
    switch (category) {
        case LogCategory::ENCODER: catStr = "ENCODER"; break;
        case LogCategory::PIPELINE: catStr = "PIPELINE"; break;
        case LogCategory::WORKER: catStr = "WORKER"; break;
        case LogCategory::STORAGE: catStr = "STORAGE"; break;
        case LogCategory::ANALYSIS: catStr = "ANALYSIS"; break;
        case LogCategory::CONTEXT: catStr = "CONTEXT"; break;
        case LogCategory::CONFIG: catStr = "CONFIG"; break;
        default: catStr = ""; break;
    }
    if (catStr[0] != '\0') {
        oss << " [" << catStr << "]";
    }

    oss << " " << message;

    return oss.str();
}
