#ifndef HTTPNTLM_NTLM_DEFAULT_ENGINE_H_
#define HTTPNTLM_NTLM_DEFAULT_ENGINE_H_

#include <memory>

#include <boost/system/error_code.hpp>

#include "httpntlm/ntlm/ntlm_engine.h"

namespace httpntlm {
namespace ntlm {

// NTLMv2 engine, connectionless mode only
class DefaultEngine : public Engine {
 public:
  DefaultEngine();

  Buffer Negotiate() override;

  std::unique_ptr<ClientSession> CreateClientSession(
      Version version, Mode mode, boost::system::error_code& ec) override;

  ChallengeMessage ParseChallengeMessage(
      const Buffer& bytes, boost::system::error_code& ec) override;
};

}  // ntlm
}  // httpntlm

#endif  // HTTPNTLM_NTLM_DEFAULT_ENGINE_H_
