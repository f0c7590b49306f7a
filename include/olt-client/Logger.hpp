#pragma once
#include "olt-client/export.h"

#include <fmt/format.h>
#include <memory>
#include <mutex>
#include <spdlog/spdlog.h>
#include <string>

namespace oltclient {

/// Process-wide logger. Every line carries the device name and the session
/// step (or component tag) it came from. Calls made before init() are
/// dropped.
class OLT_CLIENT_API OltLogger {
public:
  static OltLogger &instance();

  /// Console sink at info and above, rotating file sink at every level.
  /// A second call only changes the level.
  void init(const std::string &log_file = "olt_client.log",
            spdlog::level::level_enum level = spdlog::level::info);

  void set_level(spdlog::level::level_enum level);

  /// Release the sinks; init() may be called again afterwards
  void shutdown();

  bool is_initialized() const;

  /// Raw device text made printable on one line: CR and LF escaped, cut at
  /// `max_len` with a trailing "..."
  static std::string excerpt(const std::string &text, size_t max_len = 200);

  template <typename... Args>
  void trace(const std::string &device, const std::string &tag,
             const std::string &fmt_str, Args &&...args) {
    log(spdlog::level::trace, device, tag, fmt_str,
        std::forward<Args>(args)...);
  }

  template <typename... Args>
  void debug(const std::string &device, const std::string &tag,
             const std::string &fmt_str, Args &&...args) {
    log(spdlog::level::debug, device, tag, fmt_str,
        std::forward<Args>(args)...);
  }

  template <typename... Args>
  void info(const std::string &device, const std::string &tag,
            const std::string &fmt_str, Args &&...args) {
    log(spdlog::level::info, device, tag, fmt_str,
        std::forward<Args>(args)...);
  }

  template <typename... Args>
  void warn(const std::string &device, const std::string &tag,
            const std::string &fmt_str, Args &&...args) {
    log(spdlog::level::warn, device, tag, fmt_str,
        std::forward<Args>(args)...);
  }

  template <typename... Args>
  void error(const std::string &device, const std::string &tag,
             const std::string &fmt_str, Args &&...args) {
    log(spdlog::level::err, device, tag, fmt_str,
        std::forward<Args>(args)...);
  }

private:
  OltLogger() = default;

  template <typename... Args>
  void log(spdlog::level::level_enum level, const std::string &device,
           const std::string &tag, const std::string &fmt_str,
           Args &&...args) {
    std::shared_ptr<spdlog::logger> logger;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      logger = logger_;
    }
    if (!logger || !logger->should_log(level))
      return;

    // [OLT1] [AUTH] message
    logger->log(level, "[{}] [{}] {}", device, tag,
                fmt::format(fmt::runtime(fmt_str), std::forward<Args>(args)...));
  }

  std::shared_ptr<spdlog::logger> logger_;
  mutable std::mutex mutex_;
};

#define LOG_TRACE(device, tag, ...)                                            \
  oltclient::OltLogger::instance().trace(device, tag, __VA_ARGS__)
#define LOG_DEBUG(device, tag, ...)                                            \
  oltclient::OltLogger::instance().debug(device, tag, __VA_ARGS__)
#define LOG_INFO(device, tag, ...)                                             \
  oltclient::OltLogger::instance().info(device, tag, __VA_ARGS__)
#define LOG_WARN(device, tag, ...)                                             \
  oltclient::OltLogger::instance().warn(device, tag, __VA_ARGS__)
#define LOG_ERROR(device, tag, ...)                                            \
  oltclient::OltLogger::instance().error(device, tag, __VA_ARGS__)

} // namespace oltclient
