#pragma once
#include "keyspot_common.hpp"

// -------- Logging (levels) --------
enum class LogLevel { INFO, WARN, ERROR, ALERT }; // levels

struct LogContext {
    std::string userId;
    std::string host;
    std::string sessionId;
};

extern LogContext g_log_ctx;

// Initialize global logging context
void init_log_context();

const char* log_level_str(LogLevel lvl);

// Log with level, message, optional event + outcome
// audit_log_level(LogLevel::INFO, "Candidate classified", "classify", "secret");
void audit_log_level(
    LogLevel lvl,
    const std::string& entry,
    const std::string& event = "",
    const std::string& outcome = ""
);
