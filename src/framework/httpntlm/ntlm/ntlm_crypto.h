#ifndef HTTPNTLM_NTLM_NTLM_CRYPTO_H_
#define HTTPNTLM_NTLM_NTLM_CRYPTO_H_

#include <cstddef>
#include <cstdint>

#include <string>

#include <boost/system/error_code.hpp>

#include "httpntlm/ntlm/ntlm_constants.h"

namespace httpntlm {
namespace ntlm {

// OpenSSL libcrypto primitives. Errors are reported as ntlm_crypto_error.

Buffer Md4(const Buffer& input, boost::system::error_code& ec);

Buffer Md5(const Buffer& input, boost::system::error_code& ec);

Buffer HmacMd5(const Buffer& key, const Buffer& data,
               boost::system::error_code& ec);

Buffer Rc4(const Buffer& key, const Buffer& data,
           boost::system::error_code& ec);

Buffer RandomBytes(std::size_t count, boost::system::error_code& ec);

// UTF-8 to UTF-16LE bytes
Buffer ToUtf16Le(const std::string& utf8);

// ASCII letters only, other characters are kept as is
std::string ToUpperAscii(const std::string& input);

// MD4(UTF16LE(password))
Buffer NtowfV1(const std::string& password, boost::system::error_code& ec);

// HMAC_MD5(NTOWFv1(password), UTF16LE(UPPER(user) + domain))
Buffer NtowfV2(const std::string& username, const std::string& password,
               const std::string& domain, boost::system::error_code& ec);

// NTLMv2_CLIENT_CHALLENGE structure ("temp" in [MS-NLMP] 3.3.2). The target
// info is copied as received, terminator included.
Buffer ProofInputV2(uint64_t timestamp, const Buffer& client_challenge,
                    const Buffer& target_info);

// HMAC_MD5(ResponseKeyNT, server challenge + proof input)
Buffer NtProofV2(const Buffer& v2_hash, const Buffer& server_challenge,
                 const Buffer& proof_input, boost::system::error_code& ec);

// HMAC_MD5(ResponseKeyNT, NTProofStr)
Buffer SessionBaseKeyV2(const Buffer& v2_hash, const Buffer& nt_proof,
                        boost::system::error_code& ec);

// HMAC_MD5(ResponseKeyLM, server challenge + client challenge) followed by
// the client challenge
Buffer LmResponseV2(const Buffer& v2_hash, const Buffer& server_challenge,
                    const Buffer& client_challenge,
                    boost::system::error_code& ec);

// 100ns intervals since January 1, 1601 (UTC)
uint64_t WindowsTimestamp();

}  // ntlm
}  // httpntlm

#endif  // HTTPNTLM_NTLM_NTLM_CRYPTO_H_
