// Copyright (c) 2026 The ArtDNA Core developers
// Distributed under the MIT software license

/**
 * Structured error messages with recovery guidance
 */

#ifndef ARTDNA_UTIL_ERROR_FORMAT_H
#define ARTDNA_UTIL_ERROR_FORMAT_H

#include <string>
#include <vector>

/**
 * Error severity levels
 */
enum class ErrorSeverity {
    INFO,      // Informational message
    WARNING,   // Operation may have issues
    ERROR,     // Operation failed but recoverable
    CRITICAL   // Operation failed, may require intervention
};

/**
 * Structured error message with context and recovery guidance
 */
struct ErrorMessage {
    ErrorSeverity severity;
    std::string title;
    std::string description;
    std::string cause;
    std::vector<std::string> recovery_steps;
    std::string error_code;  // For technical reference

    ErrorMessage(ErrorSeverity sev, const std::string& t, const std::string& desc)
        : severity(sev), title(t), description(desc) {}
};

class CErrorFormatter {
public:
    /**
     * Format error for log output (single line)
     */
    static std::string FormatForLog(const ErrorMessage& error);

    /**
     * Session storage failure
     * @param operation e.g. "save", "load", "archive"
     */
    static ErrorMessage StorageError(const std::string& operation, const std::string& details);

    /**
     * Background task failure or worker crash
     */
    static ErrorMessage WorkerError(const std::string& task_type, const std::string& details);

    static ErrorMessage ConfigError(const std::string& option, const std::string& details);

    /**
     * Rejected encoder or analysis input
     */
    static ErrorMessage InputError(const std::string& object, const std::string& details);
};

#endif // ARTDNA_UTIL_ERROR_FORMAT_H
