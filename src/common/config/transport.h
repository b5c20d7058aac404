#ifndef HTTPNTLM_COMMON_CONFIG_TRANSPORT_H_
#define HTTPNTLM_COMMON_CONFIG_TRANSPORT_H_

#include <cstddef>

#include <nlohmann/json.hpp>

#include "common/config/tls.h"

namespace httpntlm {
namespace config {

class Transport {
 public:
  using Json = nlohmann::json;

 public:
  Transport();

 public:
  void Update(const Json& transport_prop);

  void Log() const;

  inline std::size_t max_idle_connections_per_host() const {
    return max_idle_connections_per_host_;
  }

  const Tls& tls() const { return tls_; }
  Tls& tls() { return tls_; }

 private:
  // Keep-alive connections kept per origin
  std::size_t max_idle_connections_per_host_;
  Tls tls_;
};

}  // config
}  // httpntlm

#endif  // HTTPNTLM_COMMON_CONFIG_TRANSPORT_H_
