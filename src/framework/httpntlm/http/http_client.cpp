#include <string>

#include "httpntlm/error/error.h"
#include "httpntlm/http/http_client.h"

namespace httpntlm {
namespace http {

HttpClient::HttpClient(std::shared_ptr<Transport> p_transport,
                       std::shared_ptr<CookieJar> p_jar)
    : p_transport_(std::move(p_transport)), p_jar_(std::move(p_jar)) {}

HttpResponsePtr HttpClient::Do(const HttpRequest& request,
                               boost::system::error_code& ec) {
  if (!p_transport_) {
    ec.assign(error::not_connected, error::get_httpntlm_category());
    return nullptr;
  }

  if (!request.url().valid()) {
    ec.assign(error::invalid_url, error::get_httpntlm_category());
    return nullptr;
  }

  if (!p_jar_) {
    return p_transport_->RoundTrip(request, ec);
  }

  HttpRequest outgoing_request(request);
  auto cookies = p_jar_->Cookies(outgoing_request.url());
  if (!cookies.empty()) {
    // jar cookies are appended to the caller's Cookie header, if any
    std::string cookie_header;
    for (const auto& value : outgoing_request.headers().GetValues("Cookie")) {
      if (value.empty()) {
        continue;
      }
      cookie_header += value + "; ";
    }
    cookie_header += CookieHeader(cookies);
    outgoing_request.SetHeader("Cookie", cookie_header);
  }

  auto p_response = p_transport_->RoundTrip(outgoing_request, ec);
  if (ec) {
    return nullptr;
  }

  auto set_cookie_values = p_response->Header("Set-Cookie");
  if (!set_cookie_values.empty()) {
    p_jar_->SetCookies(outgoing_request.url(), set_cookie_values);
  }

  return p_response;
}

}  // http
}  // httpntlm
