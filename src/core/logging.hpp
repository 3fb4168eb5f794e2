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
namespace sluice::control {
struct LogConfig;
}

namespace sluice::logging {

// Initialize Quill logging backend (called once at startup)
void init_logging_system();

// Create the process logger with config-driven sink, format and level
// Safe to call more than once; later calls return the existing logger
quill::Logger* init_logger(const sluice::control::LogConfig& config);

// Flush and stop the backend (called at exit)
void shutdown_logging();

// Process logger (nullptr until init_logger() has run)
quill::Logger* get_logger() noexcept;

// Correlation ID for one relayed connection: {uuid-v4}#{counter}
std::string generate_correlation_id();

// Validate correlation ID format
bool is_valid_correlation_id(std::string_view id);

// Logging macros for structured logging

// Rejected frame; direction is "client" or "pool"
#define LOG_INVALID_FRAME(logger, direction, pool_address, reason, session_id, frame)      \
    LOG_WARNING(logger,                                                                   \
                "Invalid message from {}: pool={}, reason={}, session={}, frame={}",      \
                direction, pool_address, reason, session_id, frame)

// Pool health transition
#define LOG_POOL_HEALTH(logger, host, port, previous, current, detail)                  \
    LOG_WARNING(logger, "Pool {}:{} health changed: {} -> {} ({})", host, port, previous, \
                current, detail)

// Session lifecycle event
#define LOG_SESSION(logger, event, session_id, client_address, pool_address)           \
    LOG_INFO(logger, "Session {}: session={}, client={}, pool={}", event, session_id, \
             client_address, pool_address)

}  // namespace sluice::logging
