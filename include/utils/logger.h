// logger.h - lightweight logging wrapper around spdlog
#pragma once

#include <spdlog/spdlog.h>
#include <string>
#include <vector>

namespace ontoreg::logger {

// Convert textual level to spdlog level (case-insensitive). Unknown -> info.
spdlog::level::level_enum parse_level(const std::string& level_text);

// Log directory: $ONTOREG_LOG_DIR, or ~/.ontoreg/logs.
std::string get_log_dir();

// Today's log file path (ontoreg.jsonl.YYYY-MM-DD).
std::string get_log_file_path();

// $ONTOREG_LOG_RETENTION_DAYS when in 1..364, else 7.
int get_retention_days();

// Remove ontoreg.jsonl.* files older than retention_days.
void cleanup_old_logs(const std::string& log_dir, int retention_days);

// Initialize default logger with optional pattern and file sink.
// additional_sinks is mainly for testing (e.g., ostream sink injection).
void init(const std::string& level = "info",
          const std::string& pattern = "[%Y-%m-%d %T.%e] [%l] %v",
          const std::string& file_path = "",
          std::vector<spdlog::sink_ptr> additional_sinks = {});

// stderr (human-readable) + JSON-lines file, level from $ONTOREG_LOG_LEVEL.
// stdout is left to command output.
void init_from_env();

}  // namespace ontoreg::logger
