#include <cstdlib>

#include <vector>

#include <boost/algorithm/string.hpp>

#include "httpntlm/http/cookie_jar.h"

namespace httpntlm {
namespace http {

Cookie::Cookie()
    : name(), value(), domain(), path(), secure(false), host_only(true) {}

MemoryCookieJar::MemoryCookieJar() : mutex_(), cookies_() {}

void MemoryCookieJar::SetCookies(
    const Url& url, const std::list<std::string>& set_cookie_values) {
  std::unique_lock<std::mutex> lock(mutex_);

  for (const auto& set_cookie_value : set_cookie_values) {
    Cookie cookie;
    bool remove = false;
    if (!ParseSetCookie(url, set_cookie_value, &cookie, &remove)) {
      continue;
    }

    cookies_.remove_if([&cookie](const Cookie& stored) {
      return stored.name == cookie.name && stored.domain == cookie.domain &&
             stored.path == cookie.path;
    });

    if (!remove) {
      cookies_.push_back(cookie);
    }
  }
}

std::list<Cookie> MemoryCookieJar::Cookies(const Url& url) {
  std::unique_lock<std::mutex> lock(mutex_);

  std::list<Cookie> cookies;
  auto request_path = url.path().empty() ? std::string("/") : url.path();
  for (const auto& cookie : cookies_) {
    if (!DomainMatch(url.host(), cookie) ||
        !PathMatch(request_path, cookie.path) ||
        (cookie.secure && !url.secure())) {
      continue;
    }
    cookies.push_back(cookie);
  }

  // longer paths first
  cookies.sort([](const Cookie& lhs, const Cookie& rhs) {
    return lhs.path.size() > rhs.path.size();
  });

  return cookies;
}

std::size_t MemoryCookieJar::size() {
  std::unique_lock<std::mutex> lock(mutex_);
  return cookies_.size();
}

bool MemoryCookieJar::ParseSetCookie(const Url& url,
                                     const std::string& set_cookie_value,
                                     Cookie* p_cookie, bool* p_remove) const {
  std::vector<std::string> parts;
  boost::split(parts, set_cookie_value, boost::is_any_of(";"));

  auto name_value = parts.front();
  auto separator = name_value.find('=');
  if (separator == std::string::npos) {
    return false;
  }

  p_cookie->name = boost::trim_copy(name_value.substr(0, separator));
  p_cookie->value = boost::trim_copy(name_value.substr(separator + 1));
  if (p_cookie->name.empty()) {
    return false;
  }
  if (p_cookie->value.size() >= 2 && p_cookie->value.front() == '"' &&
      p_cookie->value.back() == '"') {
    p_cookie->value = p_cookie->value.substr(1, p_cookie->value.size() - 2);
  }

  *p_remove = p_cookie->value.empty();
  p_cookie->domain = url.host();
  p_cookie->host_only = true;
  p_cookie->path = DefaultPath(url.path());

  for (std::size_t i = 1; i < parts.size(); ++i) {
    auto attribute = boost::trim_copy(parts[i]);
    std::string attribute_value;
    auto attribute_separator = attribute.find('=');
    if (attribute_separator != std::string::npos) {
      attribute_value =
          boost::trim_copy(attribute.substr(attribute_separator + 1));
      attribute.resize(attribute_separator);
      boost::trim(attribute);
    }

    if (boost::iequals(attribute, "Domain")) {
      auto domain = boost::to_lower_copy(attribute_value);
      if (!domain.empty() && domain.front() == '.') {
        domain.erase(0, 1);
      }
      if (domain.empty()) {
        continue;
      }
      Cookie domain_cookie;
      domain_cookie.domain = domain;
      domain_cookie.host_only = false;
      if (!DomainMatch(url.host(), domain_cookie)) {
        // cookie for a foreign domain
        return false;
      }
      p_cookie->domain = domain;
      p_cookie->host_only = false;
    } else if (boost::iequals(attribute, "Path")) {
      if (!attribute_value.empty() && attribute_value.front() == '/') {
        p_cookie->path = attribute_value;
      }
    } else if (boost::iequals(attribute, "Secure")) {
      p_cookie->secure = true;
    } else if (boost::iequals(attribute, "Max-Age")) {
      char* p_end = nullptr;
      long max_age = std::strtol(attribute_value.c_str(), &p_end, 10);
      if (!attribute_value.empty() && p_end != nullptr && *p_end == '\0' &&
          max_age <= 0) {
        *p_remove = true;
      }
    }
  }

  return true;
}

bool MemoryCookieJar::DomainMatch(const std::string& host,
                                  const Cookie& cookie) {
  if (host == cookie.domain) {
    return true;
  }

  if (cookie.host_only) {
    return false;
  }

  return host.size() > cookie.domain.size() &&
         boost::ends_with(host, "." + cookie.domain);
}

bool MemoryCookieJar::PathMatch(const std::string& request_path,
                                const std::string& cookie_path) {
  if (request_path == cookie_path) {
    return true;
  }

  if (!boost::starts_with(request_path, cookie_path)) {
    return false;
  }

  return cookie_path.back() == '/' || request_path[cookie_path.size()] == '/';
}

std::string MemoryCookieJar::DefaultPath(const std::string& request_path) {
  if (request_path.empty() || request_path.front() != '/') {
    return "/";
  }

  auto last_slash = request_path.rfind('/');
  if (last_slash == 0) {
    return "/";
  }

  return request_path.substr(0, last_slash);
}

std::string CookieHeader(const std::list<Cookie>& cookies) {
  std::string header;
  for (const auto& cookie : cookies) {
    if (!header.empty()) {
      header += "; ";
    }
    header += cookie.name + "=" + cookie.value;
  }

  return header;
}

}  // http
}  // httpntlm
