#ifndef HTTPNTLM_NTLM_V2_CLIENT_SESSION_H_
#define HTTPNTLM_NTLM_V2_CLIENT_SESSION_H_

#include <cstdint>

#include <string>

#include <boost/system/error_code.hpp>

#include "httpntlm/ntlm/ntlm_engine.h"

namespace httpntlm {
namespace ntlm {

// NTLMv2 connectionless client session ([MS-NLMP] 3.1.5.2 and 3.3.2)
class V2ClientSession : public ClientSession {
 public:
  V2ClientSession();

  void SetUserInfo(const std::string& username, const std::string& password,
                   const std::string& domain,
                   const std::string& workstation) override;

  void ProcessChallengeMessage(const ChallengeMessage& challenge,
                               boost::system::error_code& ec) override;

  AuthenticateMessage GenerateAuthenticateMessage(
      boost::system::error_code& ec) override;

  inline uint32_t negotiated_flags() const { return negotiated_flags_; }

 private:
  bool anonymous() const;

  Buffer EncodeString(const std::string& value) const;

  // MsvAvTimestamp of the challenge if any, current time otherwise
  uint64_t Timestamp(bool* p_from_server) const;

 private:
  std::string username_;
  std::string password_;
  std::string domain_;
  std::string workstation_;
  bool challenge_processed_;
  uint32_t negotiated_flags_;
  ChallengeMessage challenge_;
};

}  // ntlm
}  // httpntlm

#endif  // HTTPNTLM_NTLM_V2_CLIENT_SESSION_H_
