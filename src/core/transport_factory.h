#ifndef HTTPNTLM_CORE_TRANSPORT_FACTORY_H_
#define HTTPNTLM_CORE_TRANSPORT_FACTORY_H_

#include <memory>

#include <httpntlm/http/cookie_jar.h>
#include <httpntlm/http/tcp_transport.h>
#include <httpntlm/transport/ntlm_transport.h>

#include "common/config/config.h"

namespace httpntlm {
namespace core {

http::TcpTransportOptions MakeTcpTransportOptions(
    const config::Config& httpntlm_config);

transport::Credentials MakeCredentials(const config::Config& httpntlm_config);

// NTLM transport over a TcpTransport built from the configuration
std::shared_ptr<transport::NtlmTransport> MakeNtlmTransport(
    const config::Config& httpntlm_config,
    std::shared_ptr<http::CookieJar> p_jar = nullptr);

}  // core
}  // httpntlm

#endif  // HTTPNTLM_CORE_TRANSPORT_FACTORY_H_
