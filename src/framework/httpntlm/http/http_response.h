#ifndef HTTPNTLM_HTTP_HTTP_RESPONSE_H_
#define HTTPNTLM_HTTP_HTTP_RESPONSE_H_

#include <list>
#include <memory>
#include <string>

#include "httpntlm/http/http_headers.h"
#include "httpntlm/http/response_body.h"

namespace httpntlm {
namespace http {

class HttpResponse {
 public:
  enum StatusCode : int {
    kOk = 200,
    kMovedPermanently = 301,
    kMovedTemporarily = 302,
    kUnauthorized = 401,
    kProxyAuthenticationRequired = 407
  };

 public:
  HttpResponse();

  inline int status_code() const { return status_code_; }
  inline void set_status_code(int status_code) { status_code_ = status_code; }

  inline std::string reason() const { return reason_; }
  inline void set_reason(const std::string& reason) { reason_ = reason; }

  inline HttpHeaders& headers() { return headers_; }
  inline const HttpHeaders& headers() const { return headers_; }

  // Never null, defaults to an empty body
  inline std::shared_ptr<ResponseBody> body() const { return p_body_; }
  void set_body(std::shared_ptr<ResponseBody> p_body);

  std::list<std::string> Header(const std::string& name) const;
  void AddHeader(const std::string& name, const std::string& value);

  void Reset();

  bool Success() const;
  bool Unauthorized() const;

 private:
  int status_code_;
  std::string reason_;
  HttpHeaders headers_;
  std::shared_ptr<ResponseBody> p_body_;
};

using HttpResponsePtr = std::shared_ptr<HttpResponse>;

}  // http
}  // httpntlm

#endif  // HTTPNTLM_HTTP_HTTP_RESPONSE_H_
