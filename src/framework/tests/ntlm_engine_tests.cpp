#include <cstdint>

#include <string>
#include <vector>

#include <boost/system/error_code.hpp>
#include <gtest/gtest.h>

#include "httpntlm/error/error.h"
#include "httpntlm/ntlm/default_engine.h"
#include "httpntlm/ntlm/ntlm_buffer.h"
#include "httpntlm/ntlm/ntlm_crypto.h"
#include "httpntlm/ntlm/ntlm_messages.h"
#include "httpntlm/ntlm/v2_client_session.h"

namespace ntlm = httpntlm::ntlm;

using ntlm::Buffer;

namespace {

Buffer FromHex(const std::string& hex) {
  Buffer bytes;
  for (std::size_t i = 0; i + 1 < hex.size(); i += 2) {
    bytes.push_back(
        static_cast<uint8_t>(std::stoul(hex.substr(i, 2), nullptr, 16)));
  }
  return bytes;
}

Buffer Slice(const Buffer& bytes, std::size_t offset, std::size_t length) {
  return Buffer(bytes.begin() + offset, bytes.begin() + offset + length);
}

uint32_t ReadUInt32At(const Buffer& bytes, std::size_t offset) {
  ntlm::NtlmBufferReader reader(bytes.data() + offset, bytes.size() - offset);
  uint32_t value = 0;
  reader.ReadUInt32(&value);
  return value;
}

ntlm::SecurityBuffer ReadSecurityBufferAt(const Buffer& bytes,
                                          std::size_t offset) {
  ntlm::NtlmBufferReader reader(bytes.data() + offset, bytes.size() - offset);
  ntlm::SecurityBuffer security_buffer;
  reader.ReadSecurityBuffer(&security_buffer);
  return security_buffer;
}

// [MS-NLMP] 4.2.1 common values
const char kUser[] = "User";
const char kPassword[] = "Password";
const char kDomain[] = "Domain";
const char kWorkstation[] = "COMPUTER";
const char kServerChallenge[] = "0123456789abcdef";
const char kClientChallenge[] = "aaaaaaaaaaaaaaaa";

// MsvAvNbDomainName "Domain", MsvAvNbComputerName "Server", MsvAvEOL
Buffer SampleTargetInfo() {
  std::vector<ntlm::AvPair> av_pairs = {
      ntlm::AvPair(ntlm::kAvNbDomainName, ntlm::ToUtf16Le("Domain")),
      ntlm::AvPair(ntlm::kAvNbComputerName, ntlm::ToUtf16Le("Server"))};

  std::size_t length = 4;
  for (const auto& av_pair : av_pairs) {
    length += 4 + av_pair.buffer.size();
  }

  ntlm::NtlmBufferWriter writer(length);
  for (const auto& av_pair : av_pairs) {
    writer.WriteAvPair(av_pair);
  }
  writer.WriteAvPairTerminator();

  return writer.Pass();
}

Buffer TimestampPair(uint64_t timestamp) {
  ntlm::NtlmBufferWriter writer(4 + 8);
  writer.WriteUInt16(ntlm::kAvTimestamp);
  writer.WriteUInt16(8);
  writer.WriteUInt64(timestamp);
  return writer.Pass();
}

// Complete CHALLENGE_MESSAGE with a target name, a target info block and a
// version field
Buffer MakeChallengeMessage(uint32_t flags, const Buffer& target_info) {
  auto target_name = ntlm::ToUtf16Le("Server");
  const std::size_t header_length = 56;
  auto target_name_offset = static_cast<uint32_t>(header_length);
  auto target_info_offset =
      static_cast<uint32_t>(header_length + target_name.size());

  ntlm::NtlmBufferWriter writer(header_length + target_name.size() +
                                target_info.size());
  writer.WriteSignature();
  writer.WriteMessageType(ntlm::kChallengeMessage);
  writer.WriteSecurityBuffer(ntlm::SecurityBuffer(
      target_name_offset, static_cast<uint16_t>(target_name.size())));
  writer.WriteUInt32(flags);
  writer.WriteBytes(FromHex(kServerChallenge));
  writer.WriteZeros(8);
  writer.WriteSecurityBuffer(ntlm::SecurityBuffer(
      target_info_offset, static_cast<uint16_t>(target_info.size())));
  writer.WriteBytes(ntlm::kClientVersion, ntlm::kVersionLength);
  writer.WriteBytes(target_name);
  writer.WriteBytes(target_info);

  return writer.Pass();
}

const uint32_t kServerFlags =
    ntlm::kNegotiateUnicode | ntlm::kRequestTarget | ntlm::kNegotiateNtlm |
    ntlm::kNegotiateAlwaysSign | ntlm::kTargetTypeServer |
    ntlm::kNegotiateExtendedSessionSecurity | ntlm::kNegotiateTargetInfo |
    ntlm::kNegotiateVersion | ntlm::kNegotiate128 | ntlm::kNegotiate56;

ntlm::ChallengeMessage SampleChallenge(uint32_t flags,
                                       const Buffer& target_info) {
  boost::system::error_code ec;
  auto challenge =
      ntlm::ParseChallengeMessage(MakeChallengeMessage(flags, target_info), ec);
  EXPECT_FALSE(ec) << ec.message();
  return challenge;
}

}  // namespace

TEST(NtlmCryptoTest, NtowfV1) {
  boost::system::error_code ec;
  auto response_key = ntlm::NtowfV1(kPassword, ec);

  ASSERT_FALSE(ec);
  ASSERT_EQ(FromHex("a4f49c406510bdcab6824ee7c30fd852"), response_key);
}

TEST(NtlmCryptoTest, NtowfV2) {
  boost::system::error_code ec;
  auto response_key = ntlm::NtowfV2(kUser, kPassword, kDomain, ec);

  ASSERT_FALSE(ec);
  ASSERT_EQ(FromHex("0c868a403bfd7a93a3001ef22ef02e3f"), response_key);

  // user name is case insensitive, domain is not
  auto upper_user_key = ntlm::NtowfV2("USER", kPassword, kDomain, ec);
  ASSERT_FALSE(ec);
  ASSERT_EQ(response_key, upper_user_key);

  auto upper_domain_key = ntlm::NtowfV2(kUser, kPassword, "DOMAIN", ec);
  ASSERT_FALSE(ec);
  ASSERT_NE(response_key, upper_domain_key);
}

TEST(NtlmCryptoTest, NtlmV2Responses) {
  boost::system::error_code ec;
  auto v2_hash = ntlm::NtowfV2(kUser, kPassword, kDomain, ec);
  ASSERT_FALSE(ec);

  auto server_challenge = FromHex(kServerChallenge);
  auto client_challenge = FromHex(kClientChallenge);

  auto lm_response =
      ntlm::LmResponseV2(v2_hash, server_challenge, client_challenge, ec);
  ASSERT_FALSE(ec);
  ASSERT_EQ(FromHex("86c35097ac9cec102554764a57cccc19aaaaaaaaaaaaaaaa"),
            lm_response);

  auto proof_input =
      ntlm::ProofInputV2(0, client_challenge, SampleTargetInfo());
  auto nt_proof =
      ntlm::NtProofV2(v2_hash, server_challenge, proof_input, ec);
  ASSERT_FALSE(ec);
  ASSERT_EQ(FromHex("68cd0ab851e51c96aabc927bebef6a1c"), nt_proof);

  auto session_base_key = ntlm::SessionBaseKeyV2(v2_hash, nt_proof, ec);
  ASSERT_FALSE(ec);
  ASSERT_EQ(FromHex("8de40ccadbc14a82f15cb0ad0de95ca3"), session_base_key);
}

TEST(NtlmCryptoTest, ProofInputLayout) {
  auto client_challenge = FromHex(kClientChallenge);
  auto target_info = SampleTargetInfo();
  auto proof_input =
      ntlm::ProofInputV2(0x0102030405060708ULL, client_challenge, target_info);

  ASSERT_EQ(28 + target_info.size() + 4, proof_input.size());
  ASSERT_EQ(FromHex("0101000000000000"), Slice(proof_input, 0, 8));
  ASSERT_EQ(FromHex("0807060504030201"), Slice(proof_input, 8, 8));
  ASSERT_EQ(client_challenge, Slice(proof_input, 16, 8));
  ASSERT_EQ(FromHex("00000000"), Slice(proof_input, 24, 4));
  ASSERT_EQ(target_info, Slice(proof_input, 28, target_info.size()));
  ASSERT_EQ(FromHex("00000000"),
            Slice(proof_input, 28 + target_info.size(), 4));
}

TEST(NtlmCryptoTest, Rc4RoundTrip) {
  boost::system::error_code ec;
  auto key = FromHex("55555555555555555555555555555555");
  auto data = FromHex("00112233445566778899aabbccddeeff");

  auto encrypted = ntlm::Rc4(key, data, ec);
  ASSERT_FALSE(ec);
  ASSERT_NE(data, encrypted);

  auto decrypted = ntlm::Rc4(key, encrypted, ec);
  ASSERT_FALSE(ec);
  ASSERT_EQ(data, decrypted);

  ntlm::Rc4(Buffer(), data, ec);
  ASSERT_EQ(httpntlm::error::ntlm_crypto_error, ec.value());
}

TEST(NtlmCryptoTest, Md5) {
  boost::system::error_code ec;
  auto digest = ntlm::Md5(Buffer({'a', 'b', 'c'}), ec);

  ASSERT_FALSE(ec);
  ASSERT_EQ(FromHex("900150983cd24fb0d6963f7d28e17f72"), digest);
}

TEST(NtlmCryptoTest, Utf16Le) {
  ASSERT_EQ(FromHex("5500730065007200"), ntlm::ToUtf16Le("User"));
  // U+00E9
  ASSERT_EQ(FromHex("e900"), ntlm::ToUtf16Le("\xc3\xa9"));
  ASSERT_EQ("USER\xc3\xa9", ntlm::ToUpperAscii("user\xc3\xa9"));
}

TEST(NtlmCryptoTest, WindowsTimestamp) {
  // 2001-01-01 in 100ns intervals since 1601-01-01
  const uint64_t year_2001 = 126227808000000000ULL;
  ASSERT_GT(ntlm::WindowsTimestamp(), year_2001);
}

TEST(NtlmMessagesTest, NegotiateMessage) {
  auto negotiate = ntlm::GenerateNegotiateMessage();

  ASSERT_EQ(ntlm::kNegotiateMessageLength, negotiate.size());
  ASSERT_EQ(Buffer({'N', 'T', 'L', 'M', 'S', 'S', 'P', '\0'}),
            Slice(negotiate, 0, 8));
  ASSERT_EQ(1u, ReadUInt32At(negotiate, 8));
  ASSERT_EQ(0xa2088207u, ReadUInt32At(negotiate, 12));
  // empty domain and workstation
  ASSERT_EQ(Buffer(16, 0), Slice(negotiate, 16, 16));
  ASSERT_EQ(FromHex("0601b11d0000000f"), Slice(negotiate, 32, 8));

  ntlm::DefaultEngine engine;
  ASSERT_EQ(negotiate, engine.Negotiate());
}

TEST(NtlmMessagesTest, ParseChallenge) {
  boost::system::error_code ec;
  auto target_info = SampleTargetInfo();
  auto challenge = ntlm::ParseChallengeMessage(
      MakeChallengeMessage(kServerFlags, target_info), ec);

  ASSERT_FALSE(ec) << ec.message();
  ASSERT_EQ(kServerFlags, challenge.flags);
  ASSERT_EQ(FromHex(kServerChallenge), challenge.server_challenge);
  ASSERT_EQ(ntlm::ToUtf16Le("Server"), challenge.target_name);
  ASSERT_EQ(target_info, challenge.target_info);
  ASSERT_TRUE(challenge.has_version);
  ASSERT_EQ(FromHex("0601b11d0000000f"), challenge.version);

  ASSERT_EQ(2, challenge.av_pairs.size());
  ASSERT_EQ(ntlm::kAvNbDomainName, challenge.av_pairs[0].avid);
  ASSERT_EQ(ntlm::ToUtf16Le("Domain"), challenge.av_pairs[0].buffer);

  auto p_computer = challenge.FindAvPair(ntlm::kAvNbComputerName);
  ASSERT_NE(nullptr, p_computer);
  ASSERT_EQ(ntlm::ToUtf16Le("Server"), p_computer->buffer);
  ASSERT_EQ(nullptr, challenge.FindAvPair(ntlm::kAvTimestamp));
}

TEST(NtlmMessagesTest, ParseShortChallenge) {
  ntlm::NtlmBufferWriter writer(32);
  writer.WriteSignature();
  writer.WriteMessageType(ntlm::kChallengeMessage);
  writer.WriteSecurityBuffer(ntlm::SecurityBuffer());
  writer.WriteUInt32(ntlm::kNegotiateUnicode | ntlm::kNegotiateNtlm);
  writer.WriteBytes(FromHex(kServerChallenge));

  boost::system::error_code ec;
  auto challenge = ntlm::ParseChallengeMessage(writer.Pass(), ec);

  ASSERT_FALSE(ec) << ec.message();
  ASSERT_EQ(FromHex(kServerChallenge), challenge.server_challenge);
  ASSERT_TRUE(challenge.target_name.empty());
  ASSERT_TRUE(challenge.target_info.empty());
  ASSERT_TRUE(challenge.av_pairs.empty());
  ASSERT_FALSE(challenge.has_version);
}

TEST(NtlmMessagesTest, ParseInvalidChallenge) {
  auto valid = MakeChallengeMessage(kServerFlags, SampleTargetInfo());

  auto truncated = Slice(valid, 0, 20);

  auto bad_signature = valid;
  bad_signature[0] = 'X';

  auto wrong_type = valid;
  wrong_type[8] = 3;

  // target info offset beyond the end of the message
  auto out_of_bounds = valid;
  out_of_bounds[44] = 0xff;

  // target info without terminator
  auto target_info = SampleTargetInfo();
  Buffer unterminated_info(target_info.begin(), target_info.end() - 4);
  auto unterminated = MakeChallengeMessage(kServerFlags, unterminated_info);

  std::vector<Buffer> invalid_messages = {Buffer(), truncated, bad_signature,
                                          wrong_type, out_of_bounds,
                                          unterminated};

  for (const auto& invalid_message : invalid_messages) {
    boost::system::error_code ec;
    ntlm::ParseChallengeMessage(invalid_message, ec);

    ASSERT_EQ(httpntlm::error::ntlm_invalid_message, ec.value());
    ASSERT_EQ(httpntlm::error::get_httpntlm_category(), ec.category());
  }
}

TEST(NtlmMessagesTest, TargetInfoIgnoredWithoutFlag) {
  boost::system::error_code ec;
  auto challenge = ntlm::ParseChallengeMessage(
      MakeChallengeMessage(kServerFlags & ~ntlm::kNegotiateTargetInfo,
                           SampleTargetInfo()),
      ec);

  ASSERT_FALSE(ec);
  ASSERT_TRUE(challenge.target_info.empty());
  ASSERT_TRUE(challenge.av_pairs.empty());
}

TEST(NtlmMessagesTest, AuthenticateMessageLayout) {
  auto lm = FromHex("0102");
  auto nt = FromHex("030405");
  auto domain = ntlm::ToUtf16Le("D");
  auto user = ntlm::ToUtf16Le("U");
  auto workstation = ntlm::ToUtf16Le("W");
  auto key = FromHex("0607");
  ntlm::AuthenticateMessage message(
      ntlm::kNegotiateUnicode | ntlm::kNegotiateVersion, lm, nt, domain, user,
      workstation, key, Buffer(16, 0));

  auto bytes = message.Bytes();

  ASSERT_EQ(72u + 2 + 3 + 2 + 2 + 2 + 2, bytes.size());
  ASSERT_EQ(3u, ReadUInt32At(bytes, 8));

  auto lm_buffer = ReadSecurityBufferAt(bytes, 12);
  auto nt_buffer = ReadSecurityBufferAt(bytes, 20);
  auto domain_buffer = ReadSecurityBufferAt(bytes, 28);
  auto user_buffer = ReadSecurityBufferAt(bytes, 36);
  auto workstation_buffer = ReadSecurityBufferAt(bytes, 44);
  auto key_buffer = ReadSecurityBufferAt(bytes, 52);

  ASSERT_EQ(ntlm::kNegotiateUnicode | ntlm::kNegotiateVersion,
            ReadUInt32At(bytes, 60));
  ASSERT_EQ(FromHex("0601b11d0000000f"), Slice(bytes, 64, 8));

  // payload order: domain, user, workstation, LM, NT, session key
  ASSERT_EQ(72u, domain_buffer.offset);
  ASSERT_EQ(74u, user_buffer.offset);
  ASSERT_EQ(76u, workstation_buffer.offset);
  ASSERT_EQ(78u, lm_buffer.offset);
  ASSERT_EQ(80u, nt_buffer.offset);
  ASSERT_EQ(83u, key_buffer.offset);

  ASSERT_EQ(lm, Slice(bytes, lm_buffer.offset, lm_buffer.length));
  ASSERT_EQ(nt, Slice(bytes, nt_buffer.offset, nt_buffer.length));
  ASSERT_EQ(user, Slice(bytes, user_buffer.offset, user_buffer.length));
  ASSERT_EQ(key, Slice(bytes, key_buffer.offset, key_buffer.length));
}

TEST(NtlmMessagesTest, AuthenticateMessageWithoutVersion) {
  ntlm::AuthenticateMessage message(ntlm::kNegotiateUnicode, Buffer(1, 0),
                                    Buffer(), Buffer(), Buffer(), Buffer(),
                                    Buffer(), Buffer());

  auto bytes = message.Bytes();

  ASSERT_EQ(ntlm::kAuthenticateHeaderLength + 1, bytes.size());
  ASSERT_EQ(64u, ReadSecurityBufferAt(bytes, 12).offset);
  ASSERT_EQ(1u, ReadSecurityBufferAt(bytes, 12).length);
}

TEST(NtlmMessagesTest, AuthenticateMessageTooLarge) {
  ntlm::AuthenticateMessage message(ntlm::kNegotiateUnicode, Buffer(1, 0),
                                    Buffer(0x10000, 0), Buffer(), Buffer(),
                                    Buffer(), Buffer(), Buffer());

  ASSERT_TRUE(message.Bytes().empty());
}

TEST(NtlmEngineTest, CreateClientSession) {
  ntlm::DefaultEngine engine;
  boost::system::error_code ec;

  auto p_v1 =
      engine.CreateClientSession(ntlm::kVersion1, ntlm::kConnectionlessMode, ec);
  ASSERT_EQ(nullptr, p_v1);
  ASSERT_EQ(httpntlm::error::ntlm_unsupported_version, ec.value());

  auto p_oriented = engine.CreateClientSession(
      ntlm::kVersion2, ntlm::kConnectionOrientedMode, ec);
  ASSERT_EQ(nullptr, p_oriented);
  ASSERT_EQ(httpntlm::error::ntlm_unsupported_mode, ec.value());

  auto p_session =
      engine.CreateClientSession(ntlm::kVersion2, ntlm::kConnectionlessMode, ec);
  ASSERT_FALSE(ec);
  ASSERT_NE(nullptr, p_session);
}

TEST(NtlmClientSessionTest, AuthenticateBeforeChallenge) {
  ntlm::V2ClientSession session;
  session.SetUserInfo(kUser, kPassword, kDomain, kWorkstation);

  boost::system::error_code ec;
  session.GenerateAuthenticateMessage(ec);

  ASSERT_EQ(httpntlm::error::ntlm_invalid_session_state, ec.value());
}

TEST(NtlmClientSessionTest, InvalidServerChallenge) {
  ntlm::ChallengeMessage challenge;
  challenge.flags = kServerFlags;
  challenge.server_challenge = FromHex("0123");

  ntlm::V2ClientSession session;
  boost::system::error_code ec;
  session.ProcessChallengeMessage(challenge, ec);

  ASSERT_EQ(httpntlm::error::ntlm_invalid_message, ec.value());
}

TEST(NtlmClientSessionTest, NtlmV2Response) {
  auto target_info = SampleTargetInfo();
  ntlm::V2ClientSession session;
  session.SetUserInfo(kUser, kPassword, kDomain, kWorkstation);

  boost::system::error_code ec;
  session.ProcessChallengeMessage(SampleChallenge(kServerFlags, target_info),
                                  ec);
  ASSERT_FALSE(ec);
  ASSERT_EQ(kServerFlags, session.negotiated_flags());

  auto message = session.GenerateAuthenticateMessage(ec);
  ASSERT_FALSE(ec) << ec.message();

  ASSERT_EQ(kServerFlags, message.flags());
  ASSERT_EQ(ntlm::ToUtf16Le(kUser), message.user());
  ASSERT_EQ(ntlm::ToUtf16Le(kDomain), message.domain());
  ASSERT_EQ(ntlm::ToUtf16Le(kWorkstation), message.workstation());
  ASSERT_TRUE(message.encrypted_random_session_key().empty());

  const auto& nt_response = message.nt_response();
  ASSERT_EQ(16 + 28 + target_info.size() + 4, nt_response.size());

  auto nt_proof = Slice(nt_response, 0, 16);
  Buffer proof_input(nt_response.begin() + 16, nt_response.end());
  auto client_challenge = Slice(proof_input, 16, 8);
  ASSERT_EQ(target_info, Slice(proof_input, 28, target_info.size()));

  auto v2_hash = ntlm::NtowfV2(kUser, kPassword, kDomain, ec);
  ASSERT_FALSE(ec);
  ASSERT_EQ(nt_proof, ntlm::NtProofV2(v2_hash, FromHex(kServerChallenge),
                                      proof_input, ec));
  ASSERT_EQ(ntlm::LmResponseV2(v2_hash, FromHex(kServerChallenge),
                               client_challenge, ec),
            message.lm_response());
  ASSERT_EQ(ntlm::SessionBaseKeyV2(v2_hash, nt_proof, ec),
            message.exported_session_key());

  auto bytes = message.Bytes();
  ASSERT_FALSE(bytes.empty());
  ASSERT_EQ(3u, ReadUInt32At(bytes, 8));
}

TEST(NtlmClientSessionTest, ServerTimestamp) {
  const uint64_t server_time = 0x01d0a1b2c3d4e5f6ULL;
  auto timestamp_pair = TimestampPair(server_time);
  auto target_info = SampleTargetInfo();
  target_info.insert(target_info.end() - 4, timestamp_pair.begin(),
                     timestamp_pair.end());

  ntlm::V2ClientSession session;
  session.SetUserInfo(kUser, kPassword, kDomain, kWorkstation);

  boost::system::error_code ec;
  session.ProcessChallengeMessage(SampleChallenge(kServerFlags, target_info),
                                  ec);
  ASSERT_FALSE(ec);

  auto message = session.GenerateAuthenticateMessage(ec);
  ASSERT_FALSE(ec);

  ASSERT_EQ(Buffer(24, 0), message.lm_response());
  ASSERT_EQ(Slice(timestamp_pair, 4, 8), Slice(message.nt_response(), 24, 8));
}

TEST(NtlmClientSessionTest, KeyExchange) {
  ntlm::V2ClientSession session;
  session.SetUserInfo(kUser, kPassword, kDomain, kWorkstation);

  boost::system::error_code ec;
  session.ProcessChallengeMessage(
      SampleChallenge(kServerFlags | ntlm::kNegotiateKeyExchange,
                      SampleTargetInfo()),
      ec);
  ASSERT_FALSE(ec);

  auto message = session.GenerateAuthenticateMessage(ec);
  ASSERT_FALSE(ec);
  ASSERT_TRUE(message.flags() & ntlm::kNegotiateKeyExchange);

  auto v2_hash = ntlm::NtowfV2(kUser, kPassword, kDomain, ec);
  auto nt_proof = Slice(message.nt_response(), 0, 16);
  auto session_base_key = ntlm::SessionBaseKeyV2(v2_hash, nt_proof, ec);
  ASSERT_FALSE(ec);

  ASSERT_EQ(16u, message.encrypted_random_session_key().size());
  ASSERT_EQ(16u, message.exported_session_key().size());
  ASSERT_EQ(message.exported_session_key(),
            ntlm::Rc4(session_base_key, message.encrypted_random_session_key(),
                      ec));
}

TEST(NtlmClientSessionTest, UnsupportedFlagsAreDropped) {
  ntlm::V2ClientSession session;

  boost::system::error_code ec;
  session.ProcessChallengeMessage(
      SampleChallenge(kServerFlags | ntlm::kNegotiateDatagram |
                          ntlm::kNegotiateLmKey,
                      SampleTargetInfo()),
      ec);
  ASSERT_FALSE(ec);

  ASSERT_EQ(kServerFlags, session.negotiated_flags());
}

TEST(NtlmClientSessionTest, OemStrings) {
  ntlm::V2ClientSession session;
  session.SetUserInfo(kUser, kPassword, kDomain, kWorkstation);

  boost::system::error_code ec;
  session.ProcessChallengeMessage(
      SampleChallenge((kServerFlags & ~ntlm::kNegotiateUnicode) |
                          ntlm::kNegotiateOem,
                      SampleTargetInfo()),
      ec);
  ASSERT_FALSE(ec);

  auto message = session.GenerateAuthenticateMessage(ec);
  ASSERT_FALSE(ec);
  ASSERT_EQ(Buffer({'U', 's', 'e', 'r'}), message.user());
  ASSERT_EQ(Buffer({'D', 'o', 'm', 'a', 'i', 'n'}), message.domain());
}

TEST(NtlmClientSessionTest, Anonymous) {
  ntlm::V2ClientSession session;
  session.SetUserInfo("", "", "", "");

  boost::system::error_code ec;
  session.ProcessChallengeMessage(
      SampleChallenge(kServerFlags | ntlm::kNegotiateKeyExchange,
                      SampleTargetInfo()),
      ec);
  ASSERT_FALSE(ec);

  auto message = session.GenerateAuthenticateMessage(ec);
  ASSERT_FALSE(ec);

  ASSERT_TRUE(message.flags() & ntlm::kNegotiateAnonymous);
  ASSERT_FALSE(message.flags() & ntlm::kNegotiateKeyExchange);
  ASSERT_EQ(Buffer(1, 0), message.lm_response());
  ASSERT_TRUE(message.nt_response().empty());
  ASSERT_TRUE(message.user().empty());
  ASSERT_TRUE(message.encrypted_random_session_key().empty());
  ASSERT_EQ(Buffer(16, 0), message.exported_session_key());
}

TEST(NtlmClientSessionTest, TargetInfoTooLong) {
  ntlm::ChallengeMessage challenge;
  challenge.flags = kServerFlags;
  challenge.server_challenge = FromHex(kServerChallenge);
  challenge.target_info = Buffer(0xfff0, 0);

  ntlm::V2ClientSession session;
  session.SetUserInfo(kUser, kPassword, kDomain, kWorkstation);

  boost::system::error_code ec;
  session.ProcessChallengeMessage(challenge, ec);
  ASSERT_FALSE(ec);

  session.GenerateAuthenticateMessage(ec);
  ASSERT_EQ(httpntlm::error::ntlm_invalid_message, ec.value());
}

TEST(NtlmClientSessionTest, UserInfoTooLong) {
  ntlm::V2ClientSession session;
  session.SetUserInfo(std::string(0x8000, 'u'), kPassword, kDomain,
                      kWorkstation);

  boost::system::error_code ec;
  session.ProcessChallengeMessage(
      SampleChallenge(kServerFlags, SampleTargetInfo()), ec);
  ASSERT_FALSE(ec);

  session.GenerateAuthenticateMessage(ec);
  ASSERT_EQ(httpntlm::error::ntlm_invalid_message, ec.value());
}
