#include "httpntlm/http/http_headers.h"

namespace httpntlm {
namespace http {

HttpHeaders::HttpHeaders() : headers_() {}

void HttpHeaders::Add(const std::string& name, const std::string& value) {
  headers_[name].push_back(value);
}

void HttpHeaders::Set(const std::string& name, const std::string& value) {
  auto& values = headers_[name];
  values.clear();
  values.push_back(value);
}

void HttpHeaders::Remove(const std::string& name) { headers_.erase(name); }

bool HttpHeaders::Has(const std::string& name) const {
  return headers_.find(name) != headers_.end();
}

std::string HttpHeaders::Get(const std::string& name) const {
  auto it = headers_.find(name);
  if (it == headers_.end() || it->second.empty()) {
    return "";
  }

  return it->second.front();
}

HttpHeaders::Values HttpHeaders::GetValues(const std::string& name) const {
  auto it = headers_.find(name);
  if (it == headers_.end()) {
    // header not found
    return {};
  }

  return it->second;
}

void HttpHeaders::Clear() { headers_.clear(); }

}  // http
}  // httpntlm
