#ifndef HTTPNTLM_NTLM_NTLM_ENGINE_H_
#define HTTPNTLM_NTLM_NTLM_ENGINE_H_

#include <memory>
#include <string>

#include <boost/system/error_code.hpp>

#include "httpntlm/ntlm/ntlm_constants.h"
#include "httpntlm/ntlm/ntlm_messages.h"

namespace httpntlm {
namespace ntlm {

enum Version : int { kVersion1 = 1, kVersion2 = 2 };

enum Mode : int { kConnectionOrientedMode = 0, kConnectionlessMode = 1 };

// Client side of one NTLM authentication. A session is used for a single
// handshake: SetUserInfo, ProcessChallengeMessage then
// GenerateAuthenticateMessage.
class ClientSession {
 public:
  virtual ~ClientSession() {}

  // Empty username and password select anonymous authentication
  virtual void SetUserInfo(const std::string& username,
                           const std::string& password,
                           const std::string& domain,
                           const std::string& workstation) = 0;

  virtual void ProcessChallengeMessage(const ChallengeMessage& challenge,
                                       boost::system::error_code& ec) = 0;

  virtual AuthenticateMessage GenerateAuthenticateMessage(
      boost::system::error_code& ec) = 0;
};

class Engine {
 public:
  virtual ~Engine() {}

  // NEGOTIATE_MESSAGE sent with the first request of a handshake
  virtual Buffer Negotiate() = 0;

  virtual std::unique_ptr<ClientSession> CreateClientSession(
      Version version, Mode mode, boost::system::error_code& ec) = 0;

  virtual ChallengeMessage ParseChallengeMessage(
      const Buffer& bytes, boost::system::error_code& ec) = 0;
};

}  // ntlm
}  // httpntlm

#endif  // HTTPNTLM_NTLM_NTLM_ENGINE_H_
