#pragma once

#include <quill/Backend.h>
#include <quill/Frontend.h>
#include <quill/LogMacros.h>
#include <quill/Logger.h>
#include <quill/sinks/ConsoleSink.h>
#include <quill/sinks/RotatingFileSink.h>
#include <quill/sinks/RotatingJsonFileSink.h>

#include <string>
#include <string_view>

// Forward declaration to avoid circular dependency
namespace veritas::control {
struct LogConfig;
}

namespace veritas::logging {

// Initialize Quill logging backend (called once at startup)
void init_logging_system();

// Create the engine logger from config: console when output is empty,
// otherwise a rotating text or JSON file under the output directory.
// Installs it as the current logger and returns it.
quill::Logger* init_logger(const veritas::control::LogConfig& config);

// Map a level name (debug, info, warning/warn, error) to a quill level; Info when unknown
quill::LogLevel parse_log_level(std::string_view level);

// Shutdown logging system (called at exit)
void shutdown_logging();

// Current logger (returns nullptr if not initialized)
quill::Logger* get_current_logger();

// Failed validation, logged by the dispatcher at debug level
#define LOG_VALIDATION_FAILURE(logger, input_type, error_kind, message)                  \
    LOG_DEBUG(logger, "Validation failed: type={}, kind={}, message={}", input_type,      \
              error_kind, message)

}  // namespace veritas::logging
