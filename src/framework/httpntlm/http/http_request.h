#ifndef HTTPNTLM_HTTP_HTTP_REQUEST_H_
#define HTTPNTLM_HTTP_HTTP_REQUEST_H_

#include <string>

#include "httpntlm/http/http_headers.h"
#include "httpntlm/http/url.h"

namespace httpntlm {
namespace http {

class HttpRequest {
 public:
  HttpRequest();

  HttpRequest(const std::string& method, const Url& url);

  // Invalid url leaves the request url invalid (see Url::valid)
  HttpRequest(const std::string& method, const std::string& url);

  inline std::string method() const { return method_; }
  inline const Url& url() const { return url_; }
  inline void set_url(const Url& url) { url_ = url; }

  inline const std::string& body() const { return body_; }
  inline void set_body(const std::string& body) { body_ = body; }

  inline HttpHeaders& headers() { return headers_; }
  inline const HttpHeaders& headers() const { return headers_; }

  void AddHeader(const std::string& name, const std::string& value);
  void SetHeader(const std::string& name, const std::string& value);
  std::string Header(const std::string& name) const;

  // HTTP/1.1 wire form with origin form target
  std::string Serialize() const;

 private:
  bool BodyAllowed() const;

 private:
  std::string method_;
  Url url_;
  HttpHeaders headers_;
  std::string body_;
};

}  // http
}  // httpntlm

#endif  // HTTPNTLM_HTTP_HTTP_REQUEST_H_
