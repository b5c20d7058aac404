#ifndef HTTPNTLM_HTTP_TRANSPORT_H_
#define HTTPNTLM_HTTP_TRANSPORT_H_

#include <boost/system/error_code.hpp>

#include "httpntlm/http/http_request.h"
#include "httpntlm/http/http_response.h"

namespace httpntlm {
namespace http {

// Executes a single HTTP exchange: one request in, one response or an error
// out. The request is not modified. The caller owns the returned response
// and is responsible for reading and closing its body.
class Transport {
 public:
  virtual ~Transport() {}

  virtual HttpResponsePtr RoundTrip(const HttpRequest& request,
                                    boost::system::error_code& ec) = 0;
};

}  // http
}  // httpntlm

#endif  // HTTPNTLM_HTTP_TRANSPORT_H_
