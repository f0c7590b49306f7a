#include "olt-client/Logger.hpp"

#include <algorithm>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <vector>

namespace oltclient {

namespace {
const char *LOGGER_NAME = "olt";
constexpr size_t LOG_FILE_BYTES = 10 * 1024 * 1024;
constexpr size_t LOG_FILE_COUNT = 3;
} // namespace

OltLogger &OltLogger::instance() {
  static OltLogger logger;
  return logger;
}

void OltLogger::init(const std::string &log_file,
                     spdlog::level::level_enum level) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (logger_) {
    logger_->set_level(level);
    logger_->flush_on(level);
    return;
  }

  try {
    auto console = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    console->set_level(spdlog::level::info);
    auto file = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
        log_file, LOG_FILE_BYTES, LOG_FILE_COUNT);
    file->set_level(spdlog::level::trace);

    std::vector<spdlog::sink_ptr> sinks{console, file};
    auto logger = std::make_shared<spdlog::logger>(LOGGER_NAME, sinks.begin(),
                                                   sinks.end());
    logger->set_level(level);
    logger->flush_on(level);

    // A logger left registered by an earlier init/shutdown cycle is replaced
    spdlog::drop(LOGGER_NAME);
    spdlog::register_logger(logger);
    logger_ = std::move(logger);
  } catch (const spdlog::spdlog_ex &ex) {
    fmt::print(stderr, "Cannot open log file {}: {}\n", log_file, ex.what());
  }
}

void OltLogger::set_level(spdlog::level::level_enum level) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (logger_) {
    logger_->set_level(level);
    logger_->flush_on(level);
  }
}

void OltLogger::shutdown() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (logger_) {
    logger_->flush();
    spdlog::drop(LOGGER_NAME);
    logger_.reset();
  }
}

bool OltLogger::is_initialized() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return logger_ != nullptr;
}

std::string OltLogger::excerpt(const std::string &text, size_t max_len) {
  std::string out;
  out.reserve(std::min(text.size(), max_len) + 4);
  for (size_t i = 0; i < text.size() && i < max_len; ++i) {
    switch (text[i]) {
    case '\r':
      out += "\\r";
      break;
    case '\n':
      out += "\\n";
      break;
    default:
      out += text[i];
    }
  }
  if (text.size() > max_len)
    out += "...";
  return out;
}

} // namespace oltclient
