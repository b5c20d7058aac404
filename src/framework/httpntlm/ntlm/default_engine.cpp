#include "httpntlm/error/error.h"
#include "httpntlm/log/log.h"
#include "httpntlm/ntlm/default_engine.h"
#include "httpntlm/ntlm/v2_client_session.h"

namespace httpntlm {
namespace ntlm {

DefaultEngine::DefaultEngine() {}

Buffer DefaultEngine::Negotiate() { return GenerateNegotiateMessage(); }

std::unique_ptr<ClientSession> DefaultEngine::CreateClientSession(
    Version version, Mode mode, boost::system::error_code& ec) {
  if (version != kVersion2) {
    HTTPNTLM_LOG("ntlm", debug, "NTLM version {} not supported",
                 static_cast<int>(version));
    ec.assign(error::ntlm_unsupported_version, error::get_httpntlm_category());
    return nullptr;
  }

  if (mode != kConnectionlessMode) {
    HTTPNTLM_LOG("ntlm", debug, "connection oriented mode not supported");
    ec.assign(error::ntlm_unsupported_mode, error::get_httpntlm_category());
    return nullptr;
  }

  ec.assign(error::success, error::get_httpntlm_category());
  return std::unique_ptr<ClientSession>(new V2ClientSession());
}

ChallengeMessage DefaultEngine::ParseChallengeMessage(
    const Buffer& bytes, boost::system::error_code& ec) {
  return ntlm::ParseChallengeMessage(bytes, ec);
}

}  // ntlm
}  // httpntlm
