#include <algorithm>
#include <sstream>
#include <string>

#include <boost/archive/iterators/base64_from_binary.hpp>
#include <boost/archive/iterators/binary_from_base64.hpp>
#include <boost/archive/iterators/dataflow_exception.hpp>
#include <boost/archive/iterators/ostream_iterator.hpp>
#include <boost/archive/iterators/transform_width.hpp>

#include "httpntlm/error/error.h"
#include "httpntlm/http/base64.h"

namespace httpntlm {
namespace http {

std::string Base64::Encode(const std::string& input) {
  return Encode(Buffer(input.begin(), input.end()));
}

std::string Base64::Encode(const Base64::Buffer& input) {
  using namespace boost::archive::iterators;
  using Base64EncodeIterator =
      base64_from_binary<transform_width<Buffer::const_iterator, 6, 8> >;

  std::stringstream ss_encoded_input;

  std::copy(Base64EncodeIterator(input.begin()),
            Base64EncodeIterator(input.end()),
            ostream_iterator<char>(ss_encoded_input));

  // pad with '='
  switch (input.size() % 3) {
    case 1:
      ss_encoded_input << "==";
      break;
    case 2:
      ss_encoded_input << '=';
      break;
    default:
      break;
  }

  return ss_encoded_input.str();
}

Base64::Buffer Base64::Decode(const std::string& input,
                              boost::system::error_code& ec) {
  using namespace boost::archive::iterators;
  using Base64DecodeIterator =
      transform_width<binary_from_base64<std::string::const_iterator>, 8, 6>;

  ec.assign(error::success, error::get_httpntlm_category());

  if (input.empty()) {
    return Buffer();
  }

  if (!IsValid(input)) {
    ec.assign(error::invalid_base64, error::get_httpntlm_category());
    return Buffer();
  }

  std::size_t padding_size = 0;
  while (input[input.size() - 1 - padding_size] == '=') {
    ++padding_size;
  }

  // padding characters are decoded as 'A' then cut off below
  std::string unpadded(input.begin(), input.end() - padding_size);
  unpadded.append(padding_size, 'A');

  Buffer buf;
  try {
    buf.assign(Base64DecodeIterator(unpadded.cbegin()),
               Base64DecodeIterator(unpadded.cend()));
  } catch (const dataflow_exception&) {
    ec.assign(error::invalid_base64, error::get_httpntlm_category());
    return Buffer();
  }

  buf.resize(buf.size() - padding_size);

  return buf;
}

bool Base64::IsValid(const std::string& input) {
  if (input.size() % 4 != 0) {
    return false;
  }

  std::size_t padding_size = 0;
  for (std::size_t i = 0; i < input.size(); ++i) {
    char c = input[i];
    if (c == '=') {
      ++padding_size;
      continue;
    }

    // data after padding
    if (padding_size > 0) {
      return false;
    }

    bool in_alphabet = (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') ||
                       (c >= '0' && c <= '9') || c == '+' || c == '/';
    if (!in_alphabet) {
      return false;
    }
  }

  return padding_size <= 2;
}

}  // http
}  // httpntlm
