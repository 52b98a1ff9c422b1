#include "log.hpp"
#include "config.hpp"
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/null_sink.h>

std::shared_ptr<spdlog::logger> make_logger(const std::string& path, bool append, bool trace, std::string& err) {
  spdlog::sink_ptr sink;
  if (!path.empty()) {
    try {
      sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(path, !append);
    } catch (const spdlog::spdlog_ex& e) {
      err = std::string("cannot open log file: ") + e.what();
    }
  }
  if (!sink) sink = std::make_shared<spdlog::sinks::null_sink_mt>();
  auto logger = std::make_shared<spdlog::logger>(TUIB_LOGGER_NAME, std::move(sink));
  logger->set_level(trace ? spdlog::level::trace : spdlog::level::info);
  logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] %v");
  logger->flush_on(spdlog::level::warn);
  return logger;
}
