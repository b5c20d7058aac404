#include <httpntlm/log/log.h>

#include "common/config/transport.h"

namespace httpntlm {
namespace config {

Transport::Transport() : max_idle_connections_per_host_(2), tls_() {}

void Transport::Update(const Json& transport_prop) {
  if (transport_prop.count("max_idle_connections_per_host") == 1) {
    auto max_idle =
        transport_prop.at("max_idle_connections_per_host").get<int>();
    if (max_idle >= 0) {
      max_idle_connections_per_host_ = static_cast<std::size_t>(max_idle);
    } else {
      HTTPNTLM_LOG("config", warn,
                   "[transport] invalid max idle connections <{}>", max_idle);
    }
  }

  if (transport_prop.count("tls") == 1) {
    tls_.Update(transport_prop.at("tls"));
  }
}

void Transport::Log() const {
  HTTPNTLM_LOG("config", info, "[transport] max idle connections per host: <{}>",
               max_idle_connections_per_host_);
  tls_.Log();
}

}  // config
}  // httpntlm
