#pragma once

#include <filesystem>
#include <memory>
#include <string>

#include <spdlog/logger.h>

namespace guard_link {

// === Logging ===
// Every component logs one JSON object per line, e.g.
// {"component":"alert_engine","event":"escalated",...}. The file sink wraps
// that object with a UTC timestamp, the level and the emitting thread.

/**
 * @brief Creates the shared `guard_link` logger on first call.
 *
 * Later calls return the same logger and ignore @p log_directory.
 * Warnings and errors are flushed to the file as soon as they are written.
 * @throws std::runtime_error if the log directory cannot be created.
 */
std::shared_ptr<spdlog::logger> initialize_logger(const std::string& log_directory);

/// @throws std::runtime_error before initialize_logger has run.
std::shared_ptr<spdlog::logger> get_logger();

/// Path of the JSON-line log file inside @p log_directory.
std::filesystem::path log_file_path(const std::string& log_directory);

/// Unknown level names fall back to info.
void set_log_level(const std::string& str_level);

}  // namespace guard_link
