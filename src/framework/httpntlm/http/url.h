#ifndef HTTPNTLM_HTTP_URL_H_
#define HTTPNTLM_HTTP_URL_H_

#include <string>

#include <boost/system/error_code.hpp>

namespace httpntlm {
namespace http {

// Absolute URL: scheme://[userinfo@]host[:port][/path][?query][#fragment]
class Url {
 public:
  Url();

  static Url Parse(const std::string& url, boost::system::error_code& ec);

  inline bool valid() const { return valid_; }
  inline std::string scheme() const { return scheme_; }
  inline std::string host() const { return host_; }
  inline std::string port() const { return port_; }
  inline std::string path() const { return path_; }
  inline std::string query() const { return query_; }

  inline bool secure() const { return scheme_ == "https"; }

  // Origin form request target ("/path?query")
  std::string Target() const;

  // Host header value, port omitted when it is the scheme default
  std::string HostHeader() const;

  std::string ToString() const;

  static std::string DefaultPort(const std::string& scheme);

 private:
  bool valid_;
  std::string scheme_;
  std::string host_;
  std::string port_;
  std::string path_;
  std::string query_;
};

}  // http
}  // httpntlm

#endif  // HTTPNTLM_HTTP_URL_H_
