#pragma once

#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <memory>
#include <mutex>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/null_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <string>

namespace gatvst {

/**
 * @class Logger
 * @brief Process-wide logger shared by every gatvst stage.
 *
 * Created on first use. Everything at or above the active level goes to the
 * log file; warnings and errors are echoed to stderr as well. The file path
 * and the level can be overridden with GATVST_LOG_FILE and GATVST_LOG_LEVEL
 * (any spdlog level name) before the first call.
 */
class Logger {
public:
  static constexpr const char *kName = "gatvst";
  static constexpr const char *kDefaultFile = "logs/gatvst.log";

  static std::shared_ptr<spdlog::logger> getInstance() {
    static std::once_flag flag;
    static std::shared_ptr<spdlog::logger> instance;
    std::call_once(flag, []() { instance = create(); });
    return instance;
  }

  /// GATVST_LOG_LEVEL, or debug when unset. Unknown names map to off.
  static spdlog::level::level_enum levelFromEnvironment() {
    const char *value = std::getenv("GATVST_LOG_LEVEL");
    if (value == nullptr || *value == '\0') {
      return spdlog::level::debug;
    }
    return spdlog::level::from_str(value);
  }

  static std::filesystem::path fileFromEnvironment() {
    const char *value = std::getenv("GATVST_LOG_FILE");
    if (value == nullptr || *value == '\0') {
      return kDefaultFile;
    }
    return value;
  }

private:
  static std::shared_ptr<spdlog::logger> create() {
    const auto path = fileFromEnvironment();
    try {
      if (path.has_parent_path()) {
        std::filesystem::create_directories(path.parent_path());
      }
      auto file =
          std::make_shared<spdlog::sinks::basic_file_sink_mt>(path.string());
      auto console = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
      console->set_level(spdlog::level::warn);

      auto logger = std::make_shared<spdlog::logger>(
          kName, spdlog::sinks_init_list{file, console});
      logger->set_level(levelFromEnvironment());
      logger->flush_on(spdlog::level::warn);
      return logger;
    } catch (const std::exception &ex) {
      std::cerr << "gatvst: cannot open log file " << path << ": " << ex.what()
                << std::endl;
      return spdlog::null_logger_mt(std::string(kName) + "_null");
    }
  }
};

} // namespace gatvst
