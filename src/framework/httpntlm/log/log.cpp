#include "httpntlm/log/log.h"

#ifdef HTTPNTLM_DISABLE_LOGS

namespace httpntlm {
namespace log {

void SetLogLevel(spdlog::level::level_enum level) {}

}  // log
}  // httpntlm

#else

#include <spdlog/sinks/ansicolor_sink.h>
#ifdef HTTPNTLM_ENABLE_SYSLOG
#include <spdlog/sinks/syslog_sink.h>
#endif

namespace httpntlm {
namespace log {

void SetLogLevel(spdlog::level::level_enum level) {
  GetManager().SetLevel(level);
}

Manager& GetManager() {
  static Manager manager;
  return manager;
}

Manager::Manager() {
  spdlog::set_level(spdlog::level::info);
  spdlog::set_pattern("[%Y-%m-%dT%H:%M:%S%z] [%l] [%n] %v");
}

std::shared_ptr<spdlog::logger> Manager::GetChannel(const std::string& name) {
  auto channel = spdlog::get(name);
  if (!channel) {
    channel = CreateChannel(name);
  }
  return channel;
}

void Manager::SetLevel(spdlog::level::level_enum level) {
  spdlog::set_level(level);
}

std::shared_ptr<spdlog::logger> Manager::CreateChannel(
    const std::string& name) {
  std::vector<spdlog::sink_ptr> sinks;

  sinks.push_back(std::make_shared<spdlog::sinks::ansicolor_stderr_sink_mt>());
#if defined(HTTPNTLM_ENABLE_SYSLOG)
  sinks.push_back(std::make_shared<spdlog::sinks::syslog_sink_mt>(
      "httpntlm", 0, LOG_USER, false));
#endif

  std::shared_ptr<spdlog::logger> logger;
  try {
    logger = std::make_shared<spdlog::logger>(name, sinks.cbegin(),
                                              sinks.cend());
    spdlog::initialize_logger(logger);
  } catch (const spdlog::spdlog_ex&) {
    // registered concurrently by another thread
    logger = spdlog::get(name);
  }

  return logger;
}

}  // log
}  // httpntlm

#endif  // HTTPNTLM_DISABLE_LOGS
