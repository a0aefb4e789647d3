#pragma once

#include <quill/Backend.h>
#include <quill/Frontend.h>
#include <quill/Logger.h>
#include <quill/LogMacros.h>
#include <quill/sinks/RotatingFileSink.h>
#include <quill/sinks/RotatingJsonFileSink.h>

#include <string>
#include <string_view>

// Forward declaration to avoid circular dependency
namespace portico::control {
struct LogConfig;
}

namespace portico::logging {

// Initialize Quill logging backend (called once at startup)
void init_logging_system();

// Initialize the registry logger with config-driven settings
// Returns the logger and installs it as the current thread's logger
quill::Logger* init_logger(const portico::control::LogConfig& config);

// Shutdown logging system (called at exit)
void shutdown_logging();

// UUID v4 based correlation IDs for rebuild cycles
std::string generate_correlation_id();

// Validate correlation ID format ({uuid}#{counter})
bool is_valid_uuid(std::string_view uuid);

// Get current thread's logger (returns nullptr if not initialized)
quill::Logger* get_current_logger();

// Rebuild cycle summary logging
#define LOG_CYCLE(logger, correlation_id, reload, added, removed)                      \
    LOG_INFO(logger, "Cycle completed: correlation_id={}, reload={}, added={}, removed={}", \
             correlation_id, reload, added, removed)

// Error logging with context
#define LOG_ERROR_CTX(logger, message, correlation_id, error_detail)                    \
    LOG_ERROR(logger, "{}: correlation_id={}, error_detail={}", message, correlation_id, \
              error_detail)

}  // namespace portico::logging
