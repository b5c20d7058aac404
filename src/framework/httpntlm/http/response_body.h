#ifndef HTTPNTLM_HTTP_RESPONSE_BODY_H_
#define HTTPNTLM_HTTP_RESPONSE_BODY_H_

#include <cstddef>

#include <string>

#include <boost/system/error_code.hpp>

namespace httpntlm {
namespace http {

// Streamed response payload.
//
// Read returns boost::asio::error::eof once the payload is exhausted.
// A connection backing the body can only be reused by its transport when
// the body was read up to eof and then closed. Any intermediate response
// must therefore be drained and closed before a dependent request is sent
// on the same client.
class ResponseBody {
 public:
  virtual ~ResponseBody() {}

  virtual std::size_t Read(char* p_data, std::size_t size,
                           boost::system::error_code& ec) = 0;

  virtual void Close(boost::system::error_code& ec) = 0;
};

class StringBody : public ResponseBody {
 public:
  StringBody();
  explicit StringBody(const std::string& content);

  std::size_t Read(char* p_data, std::size_t size,
                   boost::system::error_code& ec) override;

  void Close(boost::system::error_code& ec) override;

  inline bool closed() const { return closed_; }

 private:
  std::string content_;
  std::size_t offset_;
  bool closed_;
};

// Reads the body up to eof, dropping the payload
void DiscardBody(ResponseBody* p_body, boost::system::error_code& ec);

// Reads the body up to eof
std::string ReadBody(ResponseBody* p_body, boost::system::error_code& ec);

}  // http
}  // httpntlm

#endif  // HTTPNTLM_HTTP_RESPONSE_BODY_H_
