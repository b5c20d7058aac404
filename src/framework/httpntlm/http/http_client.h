#ifndef HTTPNTLM_HTTP_HTTP_CLIENT_H_
#define HTTPNTLM_HTTP_HTTP_CLIENT_H_

#include <memory>

#include <boost/system/error_code.hpp>

#include "httpntlm/http/cookie_jar.h"
#include "httpntlm/http/http_request.h"
#include "httpntlm/http/http_response.h"
#include "httpntlm/http/transport.h"

namespace httpntlm {
namespace http {

// Sends requests through a transport, keeping the cookie jar (if any) in
// sync with the exchanged Cookie and Set-Cookie headers
class HttpClient {
 public:
  HttpClient(std::shared_ptr<Transport> p_transport,
             std::shared_ptr<CookieJar> p_jar);

  HttpResponsePtr Do(const HttpRequest& request,
                     boost::system::error_code& ec);

  inline std::shared_ptr<Transport> transport() const { return p_transport_; }
  inline std::shared_ptr<CookieJar> jar() const { return p_jar_; }

 private:
  std::shared_ptr<Transport> p_transport_;
  std::shared_ptr<CookieJar> p_jar_;
};

}  // http
}  // httpntlm

#endif  // HTTPNTLM_HTTP_HTTP_CLIENT_H_
