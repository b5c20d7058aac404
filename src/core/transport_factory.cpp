#include <httpntlm/log/log.h>
#include <httpntlm/ntlm/default_engine.h>

#include "core/transport_factory.h"

namespace httpntlm {
namespace core {

http::TcpTransportOptions MakeTcpTransportOptions(
    const config::Config& httpntlm_config) {
  const auto& transport_config = httpntlm_config.transport();

  http::TcpTransportOptions options;
  options.max_idle_connections_per_host =
      transport_config.max_idle_connections_per_host();
  options.verify_peer = transport_config.tls().verify_peer();
  options.ca_file = transport_config.tls().ca_file();

  return options;
}

transport::Credentials MakeCredentials(const config::Config& httpntlm_config) {
  const auto& credentials = httpntlm_config.credentials();

  return transport::Credentials(credentials.domain(), credentials.username(),
                                credentials.password(),
                                credentials.workstation());
}

std::shared_ptr<transport::NtlmTransport> MakeNtlmTransport(
    const config::Config& httpntlm_config,
    std::shared_ptr<http::CookieJar> p_jar) {
  auto p_tcp_transport = std::make_shared<http::TcpTransport>(
      MakeTcpTransportOptions(httpntlm_config));

  HTTPNTLM_LOG("transport", debug, "NTLM transport for user <{}>",
               httpntlm_config.credentials().username());

  return std::make_shared<transport::NtlmTransport>(
      MakeCredentials(httpntlm_config), p_tcp_transport, std::move(p_jar),
      std::make_shared<ntlm::DefaultEngine>());
}

}  // core
}  // httpntlm
