#include "httpntlm/error/error.h"
#include "httpntlm/log/log.h"
#include "httpntlm/ntlm/ntlm_buffer.h"
#include "httpntlm/ntlm/ntlm_messages.h"

namespace httpntlm {
namespace ntlm {

ChallengeMessage::ChallengeMessage()
    : flags(0),
      target_name(),
      server_challenge(),
      target_info(),
      av_pairs(),
      has_version(false),
      version() {}

const AvPair* ChallengeMessage::FindAvPair(TargetInfoAvId avid) const {
  for (const auto& av_pair : av_pairs) {
    if (av_pair.avid == avid) {
      return &av_pair;
    }
  }

  return nullptr;
}

AuthenticateMessage::AuthenticateMessage()
    : flags_(0),
      lm_response_(),
      nt_response_(),
      domain_(),
      user_(),
      workstation_(),
      encrypted_random_session_key_(),
      exported_session_key_() {}

AuthenticateMessage::AuthenticateMessage(
    uint32_t flags, const Buffer& lm_response, const Buffer& nt_response,
    const Buffer& domain, const Buffer& user, const Buffer& workstation,
    const Buffer& encrypted_random_session_key,
    const Buffer& exported_session_key)
    : flags_(flags),
      lm_response_(lm_response),
      nt_response_(nt_response),
      domain_(domain),
      user_(user),
      workstation_(workstation),
      encrypted_random_session_key_(encrypted_random_session_key),
      exported_session_key_(exported_session_key) {}

Buffer AuthenticateMessage::Bytes() const {
  std::size_t header_length = kAuthenticateHeaderLength;
  if (flags_ & kNegotiateVersion) {
    header_length += kVersionLength;
  }

  // payload order: domain, user, workstation, LM, NT, session key
  const Buffer* payloads[] = {&domain_,      &user_,
                              &workstation_, &lm_response_,
                              &nt_response_, &encrypted_random_session_key_};
  SecurityBuffer security_buffers[6];
  auto offset = static_cast<uint32_t>(header_length);
  for (std::size_t i = 0; i < 6; ++i) {
    if (payloads[i]->size() > kMaxSecurityBufferPayload) {
      HTTPNTLM_LOG("ntlm", debug, "authenticate payload too large ({} bytes)",
                   payloads[i]->size());
      return Buffer();
    }
    security_buffers[i] =
        SecurityBuffer(offset, static_cast<uint16_t>(payloads[i]->size()));
    offset += static_cast<uint32_t>(payloads[i]->size());
  }

  NtlmBufferWriter writer(offset);
  bool written =
      writer.WriteSignature() &&
      writer.WriteMessageType(kAuthenticateMessage) &&
      writer.WriteSecurityBuffer(security_buffers[3]) &&
      writer.WriteSecurityBuffer(security_buffers[4]) &&
      writer.WriteSecurityBuffer(security_buffers[0]) &&
      writer.WriteSecurityBuffer(security_buffers[1]) &&
      writer.WriteSecurityBuffer(security_buffers[2]) &&
      writer.WriteSecurityBuffer(security_buffers[5]) &&
      writer.WriteUInt32(flags_);
  if (written && (flags_ & kNegotiateVersion)) {
    written = writer.WriteBytes(kClientVersion, kVersionLength);
  }
  for (std::size_t i = 0; written && i < 6; ++i) {
    written = writer.WriteBytes(*payloads[i]);
  }

  if (!written || !writer.IsEndOfBuffer()) {
    return Buffer();
  }

  return writer.Pass();
}

Buffer GenerateNegotiateMessage() {
  NtlmBufferWriter writer(kNegotiateMessageLength);
  bool written = writer.WriteSignature() &&
                 writer.WriteMessageType(kNegotiateMessage) &&
                 writer.WriteUInt32(kNegotiateMessageFlags) &&
                 writer.WriteSecurityBuffer(SecurityBuffer()) &&
                 writer.WriteSecurityBuffer(SecurityBuffer()) &&
                 writer.WriteBytes(kClientVersion, kVersionLength);
  if (!written) {
    return Buffer();
  }

  return writer.Pass();
}

ChallengeMessage ParseChallengeMessage(const Buffer& bytes,
                                       boost::system::error_code& ec) {
  ChallengeMessage challenge;
  NtlmBufferReader reader(bytes);
  SecurityBuffer target_name_buffer;
  challenge.server_challenge.resize(kChallengeLength);

  if (!reader.MatchSignature() ||
      !reader.MatchMessageType(kChallengeMessage) ||
      !reader.ReadSecurityBuffer(&target_name_buffer) ||
      !reader.ReadUInt32(&challenge.flags) ||
      !reader.ReadBytes(challenge.server_challenge.data(), kChallengeLength) ||
      !reader.ReadBytesFrom(target_name_buffer, &challenge.target_name)) {
    HTTPNTLM_LOG("ntlm", debug, "invalid challenge message header");
    ec.assign(error::ntlm_invalid_message, error::get_httpntlm_category());
    return ChallengeMessage();
  }

  // reserved and target info fields are missing from the shortest form
  SecurityBuffer target_info_buffer;
  bool extended_header =
      reader.CanRead(kChallengeLength + kSecurityBufferLength);
  if (extended_header) {
    if (!reader.SkipBytes(kChallengeLength) ||
        !reader.ReadSecurityBuffer(&target_info_buffer)) {
      ec.assign(error::ntlm_invalid_message, error::get_httpntlm_category());
      return ChallengeMessage();
    }
  }

  if (extended_header && (challenge.flags & kNegotiateVersion) &&
      reader.CanRead(kVersionLength)) {
    challenge.version.resize(kVersionLength);
    challenge.has_version =
        reader.ReadBytes(challenge.version.data(), kVersionLength);
  }

  if ((challenge.flags & kNegotiateTargetInfo) &&
      target_info_buffer.length > 0) {
    if (!reader.ReadBytesFrom(target_info_buffer, &challenge.target_info)) {
      HTTPNTLM_LOG("ntlm", debug, "target info out of message bounds");
      ec.assign(error::ntlm_invalid_message, error::get_httpntlm_category());
      return ChallengeMessage();
    }

    NtlmBufferReader target_info_reader(challenge.target_info);
    if (!target_info_reader.ReadTargetInfo(&challenge.av_pairs)) {
      HTTPNTLM_LOG("ntlm", debug, "invalid target info");
      ec.assign(error::ntlm_invalid_message, error::get_httpntlm_category());
      return ChallengeMessage();
    }
  }

  ec.assign(error::success, error::get_httpntlm_category());
  return challenge;
}

}  // ntlm
}  // httpntlm
