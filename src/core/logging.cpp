#include "logging.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <cctype>
#include <atomic>
#include <filesystem>

#include "../control/config.hpp"

namespace veritas::logging {

static std::atomic<quill::Logger*> g_current_logger{nullptr};

void init_logging_system() {
  quill::Backend::start();
}

quill::LogLevel parse_log_level(std::string_view level) {
  std::string level_lower{level};
  std::transform(level_lower.begin(), level_lower.end(), level_lower.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

  if (level_lower == "debug") {
    return quill::LogLevel::Debug;
  }
  if (level_lower == "warning" || level_lower == "warn") {
    return quill::LogLevel::Warning;
  }
  if (level_lower == "error") {
    return quill::LogLevel::Error;
  }
  return quill::LogLevel::Info;
}

quill::Logger* init_logger(const control::LogConfig& log_config) {
  quill::Logger* logger = nullptr;

  if (log_config.output.empty()) {
    auto console_sink = quill::Frontend::create_or_get_sink<quill::ConsoleSink>("veritas_console");
    logger = quill::Frontend::create_or_get_logger("veritas", std::move(console_sink));
  } else {
    std::filesystem::create_directories(log_config.output);

    quill::RotatingFileSinkConfig config;
    config.set_rotation_max_file_size(log_config.rotation.max_size_mb * 1'000'000);
    config.set_max_backup_files(log_config.rotation.max_files);
    config.set_open_mode('a');

    std::string log_path = fmt::format("{}/veritas.log", log_config.output);

    if (log_config.format == "json") {
      auto json_sink =
          quill::Frontend::create_or_get_sink<quill::RotatingJsonFileSink>(log_path, config);
      logger = quill::Frontend::create_or_get_logger("veritas", std::move(json_sink));
    } else {
      auto file_sink = quill::Frontend::create_or_get_sink<quill::RotatingFileSink>(log_path, config);
      logger = quill::Frontend::create_or_get_logger("veritas", std::move(file_sink));
    }
  }

  logger->set_log_level(parse_log_level(log_config.level));

  g_current_logger.store(logger);
  return logger;
}

void shutdown_logging() {
  g_current_logger.store(nullptr);
  quill::Backend::stop();
}

quill::Logger* get_current_logger() {
  return g_current_logger.load();
}

}  // namespace veritas::logging
