#ifndef HTTPNTLM_NTLM_NTLM_CONSTANTS_H_
#define HTTPNTLM_NTLM_NTLM_CONSTANTS_H_

#include <cstddef>
#include <cstdint>

#include <vector>

namespace httpntlm {
namespace ntlm {

using Buffer = std::vector<uint8_t>;

// [MS-NLMP] 2.2.2.5
enum NegotiateFlags : uint32_t {
  kNegotiateUnicode = 0x00000001,
  kNegotiateOem = 0x00000002,
  kRequestTarget = 0x00000004,
  kNegotiateSign = 0x00000010,
  kNegotiateSeal = 0x00000020,
  kNegotiateDatagram = 0x00000040,
  kNegotiateLmKey = 0x00000080,
  kNegotiateNtlm = 0x00000200,
  kNegotiateAnonymous = 0x00000800,
  kNegotiateOemDomainSupplied = 0x00001000,
  kNegotiateOemWorkstationSupplied = 0x00002000,
  kNegotiateAlwaysSign = 0x00008000,
  kTargetTypeDomain = 0x00010000,
  kTargetTypeServer = 0x00020000,
  kNegotiateExtendedSessionSecurity = 0x00080000,
  kNegotiateIdentify = 0x00100000,
  kRequestNonNtSessionKey = 0x00400000,
  kNegotiateTargetInfo = 0x00800000,
  kNegotiateVersion = 0x02000000,
  kNegotiate128 = 0x20000000,
  kNegotiateKeyExchange = 0x40000000,
  kNegotiate56 = 0x80000000
};

enum MessageType : uint32_t {
  kNegotiateMessage = 1,
  kChallengeMessage = 2,
  kAuthenticateMessage = 3
};

// [MS-NLMP] 2.2.2.1
enum TargetInfoAvId : uint16_t {
  kAvEol = 0x0000,
  kAvNbComputerName = 0x0001,
  kAvNbDomainName = 0x0002,
  kAvDnsComputerName = 0x0003,
  kAvDnsDomainName = 0x0004,
  kAvDnsTreeName = 0x0005,
  kAvFlags = 0x0006,
  kAvTimestamp = 0x0007,
  kAvSingleHost = 0x0008,
  kAvTargetName = 0x0009,
  kAvChannelBindings = 0x000A
};

const uint8_t kSignature[] = {'N', 'T', 'L', 'M', 'S', 'S', 'P', '\0'};
const std::size_t kSignatureLength = sizeof(kSignature);

const std::size_t kSecurityBufferLength = 8;
const std::size_t kMaxSecurityBufferPayload = 0xffff;
const std::size_t kVersionLength = 8;
const std::size_t kChallengeLength = 8;
const std::size_t kResponseKeyLength = 16;
const std::size_t kSessionKeyLength = 16;
const std::size_t kNtProofLength = 16;
const std::size_t kLmV2ResponseLength = 24;

const std::size_t kNegotiateMessageLength = 40;
const std::size_t kChallengeHeaderLength = 32;
const std::size_t kAuthenticateHeaderLength = 64;

const uint32_t kNegotiateMessageFlags =
    kNegotiateUnicode | kNegotiateOem | kRequestTarget | kNegotiateNtlm |
    kNegotiateAlwaysSign | kNegotiateExtendedSessionSecurity |
    kNegotiateVersion | kNegotiate128 | kNegotiate56;

// Flags a client session accepts from a challenge
const uint32_t kClientSupportedFlags =
    kNegotiateUnicode | kNegotiateOem | kRequestTarget | kNegotiateSign |
    kNegotiateSeal | kNegotiateNtlm | kNegotiateAlwaysSign |
    kTargetTypeDomain | kTargetTypeServer |
    kNegotiateExtendedSessionSecurity | kNegotiateTargetInfo |
    kNegotiateVersion | kNegotiate128 | kNegotiateKeyExchange | kNegotiate56;

// Windows 7 SP1 (6.1.7601), NTLMSSP revision 15
const uint8_t kClientVersion[kVersionLength] = {0x06, 0x01, 0xb1, 0x1d,
                                                0x00, 0x00, 0x00, 0x0f};

struct SecurityBuffer {
  SecurityBuffer() : offset(0), length(0) {}
  SecurityBuffer(uint32_t buffer_offset, uint16_t buffer_length)
      : offset(buffer_offset), length(buffer_length) {}

  uint32_t offset;
  uint16_t length;
};

struct AvPair {
  AvPair() : avid(kAvEol), buffer() {}
  AvPair(TargetInfoAvId pair_avid, const Buffer& pair_buffer)
      : avid(pair_avid), buffer(pair_buffer) {}

  TargetInfoAvId avid;
  Buffer buffer;
};

}  // ntlm
}  // httpntlm

#endif  // HTTPNTLM_NTLM_NTLM_CONSTANTS_H_
