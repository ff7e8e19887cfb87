// Copyright (c) 2026 The ArtDNA Core developers
// Distributed under the MIT software license

#include <util/error_format.h>
#include <algorithm>
#include <cctype>
#include <sstream>

namespace {

// "batch distance" -> "BATCH_DISTANCE"
std::string CodeSuffix(const std::string& text) {
    std::string code = text;
    std::transform(code.begin(), code.end(), code.begin(), [](unsigned char c) {
        return std::isalnum(c) ? static_cast<char>(std::toupper(c)) : '_';
    });
    return code;
}

} // namespace

std::string CErrorFormatter::FormatForLog(const ErrorMessage& error) {
    std::ostringstream oss;

    const char* severity_str = "";
    switch (error.severity) {
        case ErrorSeverity::INFO: severity_str = "INFO"; break;
        case ErrorSeverity::WARNING: severity_str = "WARNING"; break;
        case ErrorSeverity::ERROR: severity_str = "ERROR"; break;
        case ErrorSeverity::CRITICAL: severity_str = "CRITICAL"; break;
    }

    oss << "[" << severity_str << "] " << error.title;
    if (!error.error_code.empty()) {
        oss << " (code: " << error.error_code << ")";
    }
    oss << ": " << error.description;

    if (!error.cause.empty()) {
        oss << " Cause: " << error.cause;
    }

    return oss.str();
}

ErrorMessage CErrorFormatter::StorageError(const std::string& operation, const std::string& details) {
    ErrorMessage error(ErrorSeverity::ERROR,
                       "Session Storage Failed",
                       "Failed to " + operation + " session: " + details);
    error.cause = "Storage backend unavailable, I/O error or corrupted record";
    error.recovery_steps = {
        "Check disk space and permissions on the storage path",
        "Make sure no other process holds the session database open",
        "Switch storage_mode to 'memory' to continue without persistence"
    };
    error.error_code = "STORAGE_" + CodeSuffix(operation);
    return error;
}

ErrorMessage CErrorFormatter::WorkerError(const std::string& task_type, const std::string& details) {
    ErrorMessage error(ErrorSeverity::WARNING,
                       "Background Task Failed",
                       "Task '" + task_type + "' failed: " + details);
    error.cause = "Cold-path encoder raised an error or the worker crashed";
    error.recovery_steps = {
        "The task was rejected; resubmit it if the result is still needed",
        "Check the snapshot and session passed to the task"
    };
    error.error_code = "WORKER_" + CodeSuffix(task_type);
    return error;
}

ErrorMessage CErrorFormatter::ConfigError(const std::string& option, const std::string& details) {
    ErrorMessage error(ErrorSeverity::ERROR,
                       "Configuration Error",
                       "Invalid configuration for '" + option + "': " + details);
    error.cause = "Invalid or malformed configuration value";
    error.recovery_steps = {
        "Check artdna.conf for syntax errors",
        "Check ARTDNA_* environment variables, which override the file",
        "Remove the option to fall back to the built-in default"
    };
    error.error_code = "CONFIG_" + CodeSuffix(option);
    return error;
}

ErrorMessage CErrorFormatter::InputError(const std::string& object, const std::string& details) {
    ErrorMessage error(ErrorSeverity::ERROR,
                       "Invalid Input",
                       "Rejected " + object + ": " + details);
    error.cause = "Empty, degenerate or mis-sized input";
    error.recovery_steps = {
        "Verify the data captured from the canvas"
    };
    error.error_code = "INPUT_" + CodeSuffix(object);
    return error;
}
