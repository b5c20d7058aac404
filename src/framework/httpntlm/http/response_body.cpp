#include <algorithm>
#include <array>

#include <boost/asio/error.hpp>

#include "httpntlm/error/error.h"
#include "httpntlm/http/response_body.h"

namespace httpntlm {
namespace http {

StringBody::StringBody() : content_(), offset_(0), closed_(false) {}

StringBody::StringBody(const std::string& content)
    : content_(content), offset_(0), closed_(false) {}

std::size_t StringBody::Read(char* p_data, std::size_t size,
                             boost::system::error_code& ec) {
  if (closed_) {
    ec.assign(error::body_closed, error::get_httpntlm_category());
    return 0;
  }

  if (offset_ >= content_.size()) {
    ec = boost::asio::error::eof;
    return 0;
  }

  std::size_t read_size = std::min(size, content_.size() - offset_);
  std::copy(content_.begin() + offset_, content_.begin() + offset_ + read_size,
            p_data);
  offset_ += read_size;
  ec.assign(error::success, error::get_httpntlm_category());

  return read_size;
}

void StringBody::Close(boost::system::error_code& ec) {
  closed_ = true;
  ec.assign(error::success, error::get_httpntlm_category());
}

void DiscardBody(ResponseBody* p_body, boost::system::error_code& ec) {
  std::array<char, 4 * 1024> buffer;

  do {
    p_body->Read(buffer.data(), buffer.size(), ec);
  } while (!ec);

  if (ec == boost::asio::error::eof) {
    ec.assign(error::success, error::get_httpntlm_category());
  }
}

std::string ReadBody(ResponseBody* p_body, boost::system::error_code& ec) {
  std::array<char, 4 * 1024> buffer;
  std::string content;

  do {
    auto read_size = p_body->Read(buffer.data(), buffer.size(), ec);
    content.append(buffer.data(), read_size);
  } while (!ec);

  if (ec == boost::asio::error::eof) {
    ec.assign(error::success, error::get_httpntlm_category());
  }

  return content;
}

}  // http
}  // httpntlm
