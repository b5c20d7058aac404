#ifndef HTTPNTLM_HTTP_COOKIE_JAR_H_
#define HTTPNTLM_HTTP_COOKIE_JAR_H_

#include <list>
#include <mutex>
#include <string>

#include "httpntlm/http/url.h"

namespace httpntlm {
namespace http {

struct Cookie {
  Cookie();

  std::string name;
  std::string value;
  std::string domain;
  std::string path;
  bool secure;
  bool host_only;
};

class CookieJar {
 public:
  virtual ~CookieJar() {}

  // Stores the cookies of the Set-Cookie header values received from url
  virtual void SetCookies(const Url& url,
                          const std::list<std::string>& set_cookie_values) = 0;

  // Cookies to send with a request to url
  virtual std::list<Cookie> Cookies(const Url& url) = 0;
};

// In memory session cookie store (RFC 6265 domain and path matching,
// expiration limited to deletion through Max-Age or an empty value)
class MemoryCookieJar : public CookieJar {
 public:
  MemoryCookieJar();

  void SetCookies(const Url& url,
                  const std::list<std::string>& set_cookie_values) override;

  std::list<Cookie> Cookies(const Url& url) override;

  std::size_t size();

 private:
  // Returns false if the header value should be ignored
  bool ParseSetCookie(const Url& url, const std::string& set_cookie_value,
                      Cookie* p_cookie, bool* p_remove) const;

  static bool DomainMatch(const std::string& host, const Cookie& cookie);
  static bool PathMatch(const std::string& request_path,
                        const std::string& cookie_path);
  static std::string DefaultPath(const std::string& request_path);

 private:
  std::mutex mutex_;
  std::list<Cookie> cookies_;
};

// Cookie header value ("name1=value1; name2=value2")
std::string CookieHeader(const std::list<Cookie>& cookies);

}  // http
}  // httpntlm

#endif  // HTTPNTLM_HTTP_COOKIE_JAR_H_
