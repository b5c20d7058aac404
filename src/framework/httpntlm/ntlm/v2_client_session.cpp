#include "httpntlm/error/error.h"
#include "httpntlm/log/log.h"
#include "httpntlm/ntlm/ntlm_crypto.h"
#include "httpntlm/ntlm/v2_client_session.h"

namespace httpntlm {
namespace ntlm {

namespace {

bool FitsSecurityBuffer(const Buffer& payload) {
  return payload.size() <= kMaxSecurityBufferPayload;
}

}  // namespace

V2ClientSession::V2ClientSession()
    : username_(),
      password_(),
      domain_(),
      workstation_(),
      challenge_processed_(false),
      negotiated_flags_(0),
      challenge_() {}

void V2ClientSession::SetUserInfo(const std::string& username,
                                  const std::string& password,
                                  const std::string& domain,
                                  const std::string& workstation) {
  username_ = username;
  password_ = password;
  domain_ = domain;
  workstation_ = workstation;
}

void V2ClientSession::ProcessChallengeMessage(
    const ChallengeMessage& challenge, boost::system::error_code& ec) {
  if (challenge.server_challenge.size() != kChallengeLength) {
    ec.assign(error::ntlm_invalid_message, error::get_httpntlm_category());
    return;
  }

  challenge_ = challenge;
  negotiated_flags_ = challenge.flags & kClientSupportedFlags;
  challenge_processed_ = true;

  HTTPNTLM_LOG("ntlm", debug, "challenge flags {:#010x}, negotiated {:#010x}",
               challenge.flags, negotiated_flags_);

  ec.assign(error::success, error::get_httpntlm_category());
}

AuthenticateMessage V2ClientSession::GenerateAuthenticateMessage(
    boost::system::error_code& ec) {
  if (!challenge_processed_) {
    ec.assign(error::ntlm_invalid_session_state,
              error::get_httpntlm_category());
    return AuthenticateMessage();
  }

  auto flags = negotiated_flags_;
  auto domain = EncodeString(domain_);
  auto user = EncodeString(username_);
  auto workstation = EncodeString(workstation_);
  if (!FitsSecurityBuffer(domain) || !FitsSecurityBuffer(user) ||
      !FitsSecurityBuffer(workstation)) {
    HTTPNTLM_LOG("ntlm", error, "user information too long");
    ec.assign(error::ntlm_invalid_message, error::get_httpntlm_category());
    return AuthenticateMessage();
  }

  if (anonymous()) {
    HTTPNTLM_LOG("ntlm", debug, "anonymous authentication");
    flags = (flags | kNegotiateAnonymous) & ~kNegotiateKeyExchange;
    ec.assign(error::success, error::get_httpntlm_category());
    return AuthenticateMessage(flags, Buffer(1, 0), Buffer(), domain, user,
                               workstation, Buffer(),
                               Buffer(kSessionKeyLength, 0));
  }

  auto v2_hash = NtowfV2(username_, password_, domain_, ec);
  if (ec) {
    return AuthenticateMessage();
  }

  auto client_challenge = RandomBytes(kChallengeLength, ec);
  if (ec) {
    return AuthenticateMessage();
  }

  bool server_timestamp = false;
  auto timestamp = Timestamp(&server_timestamp);
  auto proof_input =
      ProofInputV2(timestamp, client_challenge, challenge_.target_info);

  auto nt_proof =
      NtProofV2(v2_hash, challenge_.server_challenge, proof_input, ec);
  if (ec) {
    return AuthenticateMessage();
  }

  Buffer nt_response(nt_proof);
  nt_response.insert(nt_response.end(), proof_input.begin(),
                     proof_input.end());
  if (!FitsSecurityBuffer(nt_response)) {
    HTTPNTLM_LOG("ntlm", error, "target information too long ({} bytes)",
                 challenge_.target_info.size());
    ec.assign(error::ntlm_invalid_message, error::get_httpntlm_category());
    return AuthenticateMessage();
  }

  // the LMv2 response is replaced by zeros when the server sent a timestamp
  Buffer lm_response(kLmV2ResponseLength, 0);
  if (!server_timestamp) {
    lm_response = LmResponseV2(v2_hash, challenge_.server_challenge,
                               client_challenge, ec);
    if (ec) {
      return AuthenticateMessage();
    }
  }

  auto session_base_key = SessionBaseKeyV2(v2_hash, nt_proof, ec);
  if (ec) {
    return AuthenticateMessage();
  }

  Buffer encrypted_random_session_key;
  Buffer exported_session_key(session_base_key);
  if (flags & kNegotiateKeyExchange) {
    exported_session_key = RandomBytes(kSessionKeyLength, ec);
    if (ec) {
      return AuthenticateMessage();
    }
    encrypted_random_session_key =
        Rc4(session_base_key, exported_session_key, ec);
    if (ec) {
      return AuthenticateMessage();
    }
  }

  ec.assign(error::success, error::get_httpntlm_category());
  return AuthenticateMessage(flags, lm_response, nt_response, domain, user,
                             workstation, encrypted_random_session_key,
                             exported_session_key);
}

bool V2ClientSession::anonymous() const {
  return username_.empty() && password_.empty();
}

Buffer V2ClientSession::EncodeString(const std::string& value) const {
  if (negotiated_flags_ & kNegotiateUnicode) {
    return ToUtf16Le(value);
  }

  return Buffer(value.begin(), value.end());
}

uint64_t V2ClientSession::Timestamp(bool* p_from_server) const {
  auto p_timestamp = challenge_.FindAvPair(kAvTimestamp);
  if (p_timestamp == nullptr || p_timestamp->buffer.size() != 8) {
    *p_from_server = false;
    return WindowsTimestamp();
  }

  uint64_t timestamp = 0;
  for (std::size_t i = 0; i < 8; ++i) {
    timestamp |= static_cast<uint64_t>(p_timestamp->buffer[i]) << (8 * i);
  }
  *p_from_server = true;

  return timestamp;
}

}  // ntlm
}  // httpntlm
