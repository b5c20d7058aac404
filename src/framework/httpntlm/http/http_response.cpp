#include "httpntlm/http/http_response.h"

namespace httpntlm {
namespace http {

HttpResponse::HttpResponse()
    : status_code_(0),
      reason_(),
      headers_(),
      p_body_(std::make_shared<StringBody>()) {}

void HttpResponse::set_body(std::shared_ptr<ResponseBody> p_body) {
  if (!p_body) {
    p_body_ = std::make_shared<StringBody>();
    return;
  }

  p_body_ = std::move(p_body);
}

bool HttpResponse::Success() const { return status_code_ == StatusCode::kOk; }

bool HttpResponse::Unauthorized() const {
  return status_code_ == StatusCode::kUnauthorized;
}

void HttpResponse::AddHeader(const std::string& name,
                             const std::string& value) {
  headers_.Add(name, value);
}

void HttpResponse::Reset() {
  status_code_ = 0;
  reason_.clear();
  headers_.Clear();
  p_body_ = std::make_shared<StringBody>();
}

std::list<std::string> HttpResponse::Header(const std::string& name) const {
  return headers_.GetValues(name);
}

}  // http
}  // httpntlm
