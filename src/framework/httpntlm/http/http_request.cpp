#include <sstream>

#include "httpntlm/http/http_request.h"

namespace httpntlm {
namespace http {

HttpRequest::HttpRequest() : method_("GET"), url_(), headers_(), body_() {}

HttpRequest::HttpRequest(const std::string& method, const Url& url)
    : method_(method), url_(url), headers_(), body_() {}

HttpRequest::HttpRequest(const std::string& method, const std::string& url)
    : method_(method), url_(), headers_(), body_() {
  boost::system::error_code ec;
  url_ = Url::Parse(url, ec);
}

void HttpRequest::AddHeader(const std::string& name, const std::string& value) {
  headers_.Add(name, value);
}

void HttpRequest::SetHeader(const std::string& name, const std::string& value) {
  headers_.Set(name, value);
}

std::string HttpRequest::Header(const std::string& name) const {
  return headers_.Get(name);
}

std::string HttpRequest::Serialize() const {
  std::stringstream ss_request;
  std::string eol("\r\n");

  ss_request << method_ << " " << url_.Target() << " HTTP/1.1" << eol;

  if (!headers_.Has("Host")) {
    ss_request << "Host: " << url_.HostHeader() << eol;
  }

  for (const auto& header : headers_) {
    for (const auto& value : header.second) {
      ss_request << header.first << ": " << value << eol;
    }
  }

  if (!headers_.Has("Content-Length") && BodyAllowed()) {
    ss_request << "Content-Length: " << body_.size() << eol;
  }
  ss_request << eol;
  ss_request << body_;

  return ss_request.str();
}

bool HttpRequest::BodyAllowed() const {
  return !body_.empty() || method_ == "POST" || method_ == "PUT" ||
         method_ == "PATCH";
}

}  // http
}  // httpntlm
