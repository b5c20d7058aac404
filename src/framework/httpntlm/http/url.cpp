#include <cctype>

#include <boost/algorithm/string/case_conv.hpp>

#include "httpntlm/error/error.h"
#include "httpntlm/http/url.h"

namespace httpntlm {
namespace http {

Url::Url()
    : valid_(false), scheme_(), host_(), port_(), path_(), query_() {}

Url Url::Parse(const std::string& url, boost::system::error_code& ec) {
  Url result;

  auto scheme_end = url.find("://");
  if (scheme_end == std::string::npos || scheme_end == 0 ||
      !std::isalpha(static_cast<unsigned char>(url[0]))) {
    ec.assign(error::invalid_url, error::get_httpntlm_category());
    return Url();
  }

  for (std::size_t i = 0; i < scheme_end; ++i) {
    auto c = static_cast<unsigned char>(url[i]);
    if (!std::isalnum(c) && c != '+' && c != '-' && c != '.') {
      ec.assign(error::invalid_url, error::get_httpntlm_category());
      return Url();
    }
  }
  result.scheme_ = boost::algorithm::to_lower_copy(url.substr(0, scheme_end));

  auto authority_begin = scheme_end + 3;
  auto authority_end = url.find_first_of("/?#", authority_begin);
  std::string authority =
      url.substr(authority_begin, authority_end == std::string::npos
                                      ? std::string::npos
                                      : authority_end - authority_begin);

  // userinfo is not used for authentication
  auto userinfo_end = authority.rfind('@');
  if (userinfo_end != std::string::npos) {
    authority = authority.substr(userinfo_end + 1);
  }

  std::string port;
  if (!authority.empty() && authority[0] == '[') {
    // IPv6 literal
    auto literal_end = authority.find(']');
    if (literal_end == std::string::npos) {
      ec.assign(error::invalid_url, error::get_httpntlm_category());
      return Url();
    }
    result.host_ = authority.substr(1, literal_end - 1);
    auto remaining = authority.substr(literal_end + 1);
    if (!remaining.empty()) {
      if (remaining[0] != ':') {
        ec.assign(error::invalid_url, error::get_httpntlm_category());
        return Url();
      }
      port = remaining.substr(1);
    }
  } else {
    auto port_begin = authority.rfind(':');
    if (port_begin != std::string::npos) {
      result.host_ = authority.substr(0, port_begin);
      port = authority.substr(port_begin + 1);
    } else {
      result.host_ = authority;
    }
  }

  if (result.host_.empty()) {
    ec.assign(error::invalid_url, error::get_httpntlm_category());
    return Url();
  }
  boost::algorithm::to_lower(result.host_);

  if (port.empty()) {
    result.port_ = DefaultPort(result.scheme_);
  } else {
    if (port.size() > 5) {
      ec.assign(error::invalid_url, error::get_httpntlm_category());
      return Url();
    }
    for (auto c : port) {
      if (!std::isdigit(static_cast<unsigned char>(c))) {
        ec.assign(error::invalid_url, error::get_httpntlm_category());
        return Url();
      }
    }
    if (std::stoul(port) > 65535) {
      ec.assign(error::invalid_url, error::get_httpntlm_category());
      return Url();
    }
    result.port_ = port;
  }

  if (authority_end != std::string::npos) {
    auto remaining = url.substr(authority_end);
    auto fragment_begin = remaining.find('#');
    if (fragment_begin != std::string::npos) {
      remaining.resize(fragment_begin);
    }
    auto query_begin = remaining.find('?');
    if (query_begin != std::string::npos) {
      result.query_ = remaining.substr(query_begin + 1);
      remaining.resize(query_begin);
    }
    result.path_ = remaining;
  }

  result.valid_ = true;
  ec.assign(error::success, error::get_httpntlm_category());

  return result;
}

std::string Url::Target() const {
  std::string target = path_.empty() ? "/" : path_;
  if (!query_.empty()) {
    target += '?';
    target += query_;
  }

  return target;
}

std::string Url::HostHeader() const {
  std::string host_header =
      (host_.find(':') != std::string::npos) ? "[" + host_ + "]" : host_;
  if (!port_.empty() && port_ != DefaultPort(scheme_)) {
    host_header += ':';
    host_header += port_;
  }

  return host_header;
}

std::string Url::ToString() const {
  if (!valid_) {
    return "";
  }

  return scheme_ + "://" + HostHeader() + Target();
}

std::string Url::DefaultPort(const std::string& scheme) {
  if (scheme == "http") {
    return "80";
  }
  if (scheme == "https") {
    return "443";
  }

  return "";
}

}  // http
}  // httpntlm
