#ifndef HTTPNTLM_LOG_LOG_H_
#define HTTPNTLM_LOG_LOG_H_

#include <spdlog/spdlog.h>

namespace httpntlm {
namespace log {

void SetLogLevel(spdlog::level::level_enum level = spdlog::level::info);

}  // log
}  // httpntlm

#ifdef HTTPNTLM_DISABLE_LOGS
#define HTTPNTLM_LOG(...)
#else

#include <memory>
#include <string>
#include <vector>

namespace httpntlm {
namespace log {

// Named spdlog loggers, one per channel (transport, http, ntlm, config)
class Manager {
 public:
  Manager();

  std::shared_ptr<spdlog::logger> GetChannel(const std::string& channel);
  void SetLevel(spdlog::level::level_enum level);

 private:
  std::shared_ptr<spdlog::logger> CreateChannel(const std::string& channel);
};

Manager& GetManager();

#define HTTPNTLM_LOG(channel, level, ...) \
  httpntlm::log::GetManager().GetChannel(channel)->level(__VA_ARGS__);

}  // log
}  // httpntlm

#endif  // HTTPNTLM_DISABLE_LOGS

#endif  // HTTPNTLM_LOG_LOG_H_
