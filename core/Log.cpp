#include "Log.hpp"

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <vector>

namespace Log {

static std::shared_ptr<spdlog::logger> s_Logger;

void Init() {
  if (s_Logger) {
    return;
  }

  std::vector<spdlog::sink_ptr> sinks;

  auto consoleSink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
  consoleSink->set_pattern("%^[%T] %n: %v%$");
  sinks.push_back(consoleSink);

  auto fileSink =
      std::make_shared<spdlog::sinks::basic_file_sink_mt>("runner.log", true);
  fileSink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] %n: %v");
  sinks.push_back(fileSink);

  s_Logger =
      std::make_shared<spdlog::logger>("RUNNER", sinks.begin(), sinks.end());
  spdlog::register_logger(s_Logger);

  s_Logger->set_level(spdlog::level::trace);
  s_Logger->flush_on(spdlog::level::trace);

  LOG_INFO("Logging initialized");
}

void SetLevel(const spdlog::level::level_enum level) {
  GetLogger()->set_level(level);
}

void Shutdown() {
  s_Logger.reset();
  spdlog::shutdown();
}

std::shared_ptr<spdlog::logger> &GetLogger() {
  // Library code (tests, the headless runner) may log before Init().
  if (!s_Logger) {
    s_Logger = spdlog::stdout_color_mt("RUNNER");
  }
  return s_Logger;
}

} // namespace Log
