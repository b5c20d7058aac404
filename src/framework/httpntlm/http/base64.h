#ifndef HTTPNTLM_HTTP_BASE64_H_
#define HTTPNTLM_HTTP_BASE64_H_

#include <cstdint>

#include <string>
#include <vector>

#include <boost/system/error_code.hpp>

namespace httpntlm {
namespace http {

class Base64 {
 public:
  using Buffer = std::vector<uint8_t>;

 public:
  static std::string Encode(const std::string& input);
  static std::string Encode(const Buffer& input);

  // Strict standard alphabet decoding: the input length must be a multiple
  // of 4 and padding may only appear at the end
  static Buffer Decode(const std::string& input, boost::system::error_code& ec);

 private:
  static bool IsValid(const std::string& input);
};

}  // http
}  // httpntlm

#endif  // HTTPNTLM_HTTP_BASE64_H_
