#include <chrono>
#include <memory>

#include <boost/locale/encoding_utf.hpp>

#include <openssl/evp.h>
#include <openssl/hmac.h>
#include <openssl/md4.h>
#include <openssl/rand.h>
#include <openssl/rc4.h>

#include "httpntlm/error/error.h"
#include "httpntlm/ntlm/ntlm_crypto.h"

namespace httpntlm {
namespace ntlm {

namespace {

// Seconds between 1601-01-01 and 1970-01-01
const uint64_t kWindowsEpochOffset = 11644473600ULL;

struct EvpMdCtxDeleter {
  void operator()(EVP_MD_CTX* p_ctx) const { EVP_MD_CTX_free(p_ctx); }
};

void SetCryptoError(boost::system::error_code& ec) {
  ec.assign(error::ntlm_crypto_error, error::get_httpntlm_category());
}

Buffer Concat(const Buffer& lhs, const Buffer& rhs) {
  Buffer result(lhs);
  result.insert(result.end(), rhs.begin(), rhs.end());
  return result;
}

}  // namespace

// MD4 and RC4 are not served by the default provider of OpenSSL 3: the low
// level functions are used instead of EVP
Buffer Md4(const Buffer& input, boost::system::error_code& ec) {
  Buffer digest(MD4_DIGEST_LENGTH, 0);
  if (::MD4(input.data(), input.size(), digest.data()) == nullptr) {
    SetCryptoError(ec);
    return Buffer();
  }

  ec.assign(error::success, error::get_httpntlm_category());
  return digest;
}

Buffer Md5(const Buffer& input, boost::system::error_code& ec) {
  std::unique_ptr<EVP_MD_CTX, EvpMdCtxDeleter> p_ctx(EVP_MD_CTX_new());
  Buffer digest(EVP_MAX_MD_SIZE, 0);
  unsigned int digest_length = 0;
  if (p_ctx == nullptr ||
      EVP_DigestInit_ex(p_ctx.get(), EVP_md5(), nullptr) <= 0 ||
      EVP_DigestUpdate(p_ctx.get(), input.data(), input.size()) <= 0 ||
      EVP_DigestFinal_ex(p_ctx.get(), digest.data(), &digest_length) <= 0) {
    SetCryptoError(ec);
    return Buffer();
  }

  digest.resize(digest_length);
  ec.assign(error::success, error::get_httpntlm_category());
  return digest;
}

Buffer HmacMd5(const Buffer& key, const Buffer& data,
               boost::system::error_code& ec) {
  Buffer digest(EVP_MAX_MD_SIZE, 0);
  unsigned int digest_length = 0;
  if (::HMAC(EVP_md5(), key.data(), static_cast<int>(key.size()), data.data(),
             data.size(), digest.data(), &digest_length) == nullptr) {
    SetCryptoError(ec);
    return Buffer();
  }

  digest.resize(digest_length);
  ec.assign(error::success, error::get_httpntlm_category());
  return digest;
}

Buffer Rc4(const Buffer& key, const Buffer& data,
           boost::system::error_code& ec) {
  if (key.empty()) {
    SetCryptoError(ec);
    return Buffer();
  }

  RC4_KEY rc4_key;
  ::RC4_set_key(&rc4_key, static_cast<int>(key.size()), key.data());

  Buffer output(data.size(), 0);
  ::RC4(&rc4_key, data.size(), data.data(), output.data());

  ec.assign(error::success, error::get_httpntlm_category());
  return output;
}

Buffer RandomBytes(std::size_t count, boost::system::error_code& ec) {
  Buffer bytes(count, 0);
  if (count > 0 &&
      ::RAND_bytes(bytes.data(), static_cast<int>(bytes.size())) != 1) {
    SetCryptoError(ec);
    return Buffer();
  }

  ec.assign(error::success, error::get_httpntlm_category());
  return bytes;
}

Buffer ToUtf16Le(const std::string& utf8) {
  auto utf16 = boost::locale::conv::utf_to_utf<char16_t>(utf8);

  Buffer bytes;
  bytes.reserve(utf16.size() * 2);
  for (auto code_unit : utf16) {
    bytes.push_back(static_cast<uint8_t>(code_unit & 0xff));
    bytes.push_back(static_cast<uint8_t>((code_unit >> 8) & 0xff));
  }

  return bytes;
}

std::string ToUpperAscii(const std::string& input) {
  std::string output(input);
  for (auto& c : output) {
    if (c >= 'a' && c <= 'z') {
      c = static_cast<char>(c - 'a' + 'A');
    }
  }

  return output;
}

Buffer NtowfV1(const std::string& password, boost::system::error_code& ec) {
  return Md4(ToUtf16Le(password), ec);
}

Buffer NtowfV2(const std::string& username, const std::string& password,
               const std::string& domain, boost::system::error_code& ec) {
  auto password_hash = NtowfV1(password, ec);
  if (ec) {
    return Buffer();
  }

  return HmacMd5(password_hash, ToUtf16Le(ToUpperAscii(username) + domain),
                 ec);
}

Buffer ProofInputV2(uint64_t timestamp, const Buffer& client_challenge,
                    const Buffer& target_info) {
  // RespType, HiRespType, Reserved1 (2), Reserved2 (4)
  Buffer proof_input = {0x01, 0x01, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00};
  for (std::size_t i = 0; i < sizeof(timestamp); ++i) {
    proof_input.push_back(static_cast<uint8_t>((timestamp >> (8 * i)) & 0xff));
  }
  proof_input.insert(proof_input.end(), client_challenge.begin(),
                     client_challenge.end());
  proof_input.insert(proof_input.end(), 4, 0x00);
  proof_input.insert(proof_input.end(), target_info.begin(),
                     target_info.end());
  proof_input.insert(proof_input.end(), 4, 0x00);

  return proof_input;
}

Buffer NtProofV2(const Buffer& v2_hash, const Buffer& server_challenge,
                 const Buffer& proof_input, boost::system::error_code& ec) {
  return HmacMd5(v2_hash, Concat(server_challenge, proof_input), ec);
}

Buffer SessionBaseKeyV2(const Buffer& v2_hash, const Buffer& nt_proof,
                        boost::system::error_code& ec) {
  return HmacMd5(v2_hash, nt_proof, ec);
}

Buffer LmResponseV2(const Buffer& v2_hash, const Buffer& server_challenge,
                    const Buffer& client_challenge,
                    boost::system::error_code& ec) {
  auto lm_response =
      HmacMd5(v2_hash, Concat(server_challenge, client_challenge), ec);
  if (ec) {
    return Buffer();
  }

  return Concat(lm_response, client_challenge);
}

uint64_t WindowsTimestamp() {
  auto since_unix_epoch =
      std::chrono::duration_cast<std::chrono::microseconds>(
          std::chrono::system_clock::now().time_since_epoch())
          .count();

  return (kWindowsEpochOffset * 1000000ULL +
          static_cast<uint64_t>(since_unix_epoch)) *
         10ULL;
}

}  // ntlm
}  // httpntlm
