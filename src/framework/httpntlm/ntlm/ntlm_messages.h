#ifndef HTTPNTLM_NTLM_NTLM_MESSAGES_H_
#define HTTPNTLM_NTLM_NTLM_MESSAGES_H_

#include <cstdint>

#include <vector>

#include <boost/system/error_code.hpp>

#include "httpntlm/ntlm/ntlm_constants.h"

namespace httpntlm {
namespace ntlm {

// Decoded CHALLENGE_MESSAGE ([MS-NLMP] 2.2.1.2)
struct ChallengeMessage {
  ChallengeMessage();

  // Null if the server did not send the pair
  const AvPair* FindAvPair(TargetInfoAvId avid) const;

  uint32_t flags;
  // Raw bytes, encoding depends on the negotiated flags
  Buffer target_name;
  Buffer server_challenge;
  // Raw target info, terminator included
  Buffer target_info;
  std::vector<AvPair> av_pairs;
  bool has_version;
  Buffer version;
};

// AUTHENTICATE_MESSAGE ([MS-NLMP] 2.2.1.3) produced by a client session
class AuthenticateMessage {
 public:
  AuthenticateMessage();
  AuthenticateMessage(uint32_t flags, const Buffer& lm_response,
                      const Buffer& nt_response, const Buffer& domain,
                      const Buffer& user, const Buffer& workstation,
                      const Buffer& encrypted_random_session_key,
                      const Buffer& exported_session_key);

  inline uint32_t flags() const { return flags_; }
  inline const Buffer& lm_response() const { return lm_response_; }
  inline const Buffer& nt_response() const { return nt_response_; }
  inline const Buffer& domain() const { return domain_; }
  inline const Buffer& user() const { return user_; }
  inline const Buffer& workstation() const { return workstation_; }
  inline const Buffer& encrypted_random_session_key() const {
    return encrypted_random_session_key_;
  }
  inline const Buffer& exported_session_key() const {
    return exported_session_key_;
  }

  // Wire form. The version field is written when kNegotiateVersion is set.
  Buffer Bytes() const;

 private:
  uint32_t flags_;
  Buffer lm_response_;
  Buffer nt_response_;
  Buffer domain_;
  Buffer user_;
  Buffer workstation_;
  Buffer encrypted_random_session_key_;
  Buffer exported_session_key_;
};

// NEGOTIATE_MESSAGE with empty domain and workstation
Buffer GenerateNegotiateMessage();

ChallengeMessage ParseChallengeMessage(const Buffer& bytes,
                                       boost::system::error_code& ec);

}  // ntlm
}  // httpntlm

#endif  // HTTPNTLM_NTLM_NTLM_MESSAGES_H_
