#ifndef HTTPNTLM_TRANSPORT_NTLM_TRANSPORT_H_
#define HTTPNTLM_TRANSPORT_NTLM_TRANSPORT_H_

#include <memory>
#include <string>

#include <boost/system/error_code.hpp>

#include "httpntlm/http/cookie_jar.h"
#include "httpntlm/http/http_client.h"
#include "httpntlm/http/http_request.h"
#include "httpntlm/http/http_response.h"
#include "httpntlm/http/transport.h"
#include "httpntlm/ntlm/ntlm_engine.h"

namespace httpntlm {
namespace transport {

struct Credentials {
  Credentials();
  Credentials(const std::string& domain, const std::string& username,
              const std::string& password, const std::string& workstation);

  std::string domain;
  std::string username;
  std::string password;
  std::string workstation;
};

namespace detail {

// Payload of the first "NTLM" WWW-Authenticate value of response.
// Errors: www_authenticate_header_missing, wrong_www_authenticate_header
// and empty_ntlm_challenge.
std::string ExtractNtlmChallenge(const http::HttpResponse& response,
                                 boost::system::error_code& ec);

}  // detail

// Transport authenticating each request with an NTLM handshake:
//   1. GET probe carrying the Negotiate message
//   2. on 401, the probe body is drained and closed so that the connection
//      can be reused, and the server challenge is read from WWW-Authenticate
//   3. the original request is sent with the Authenticate message
// A probe that is not answered with 401 is returned as the response.
// The whole handshake is attempted once more if the server sends an empty
// NTLM challenge.
class NtlmTransport : public http::Transport {
 public:
  enum { kMaxHandshakeAttempts = 2 };

 public:
  // Null inner transport defaults to a TcpTransport, null engine to a
  // DefaultEngine. Without a cookie jar, cookies are not kept between the
  // handshake requests.
  explicit NtlmTransport(const Credentials& credentials,
                         std::shared_ptr<http::Transport> p_inner = nullptr,
                         std::shared_ptr<http::CookieJar> p_jar = nullptr,
                         std::shared_ptr<ntlm::Engine> p_engine = nullptr);

  // Sets the Authorization header of *p_request to the final NTLM
  // Authenticate message
  http::HttpResponsePtr Send(http::HttpRequest* p_request,
                             boost::system::error_code& ec);

  // Send on a copy of request
  http::HttpResponsePtr RoundTrip(const http::HttpRequest& request,
                                  boost::system::error_code& ec) override;

  inline const Credentials& credentials() const { return credentials_; }
  inline std::shared_ptr<http::Transport> inner() const { return p_inner_; }
  inline std::shared_ptr<http::CookieJar> jar() const { return p_jar_; }
  inline std::shared_ptr<ntlm::Engine> engine() const { return p_engine_; }

 private:
  http::HttpResponsePtr NtlmRoundTrip(http::HttpClient* p_client,
                                      http::HttpRequest* p_request,
                                      boost::system::error_code& ec);

 private:
  Credentials credentials_;
  std::shared_ptr<http::Transport> p_inner_;
  std::shared_ptr<http::CookieJar> p_jar_;
  std::shared_ptr<ntlm::Engine> p_engine_;
};

}  // transport
}  // httpntlm

#endif  // HTTPNTLM_TRANSPORT_NTLM_TRANSPORT_H_
