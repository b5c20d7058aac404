#include "httpntlm/error/error.h"

namespace httpntlm {
namespace error {
namespace detail {

const char* httpntlm_category::name() const BOOST_SYSTEM_NOEXCEPT {
  return "httpntlm";
}

std::string httpntlm_category::message(int value) const {
  switch (value) {
    case error::success:
      return "success";
    case error::interrupted:
      return "connection interrupted";
    case error::invalid_argument:
      return "invalid argument";
    case error::broken_pipe:
      return "broken pipe";
    case error::connection_aborted:
      return "connection aborted";
    case error::connection_refused:
      return "connection refused";
    case error::connection_reset:
      return "connection reset";
    case error::not_connected:
      return "not connected";
    case error::protocol_error:
      return "protocol error";
    case error::operation_canceled:
      return "operation canceled";
    case error::out_of_range:
      return "out of range";
    case error::invalid_url:
      return "invalid url";
    case error::unsupported_scheme:
      return "unsupported url scheme";
    case error::malformed_response:
      return "malformed http response";
    case error::unexpected_end_of_body:
      return "unexpected end of response body";
    case error::body_closed:
      return "response body closed";
    case error::invalid_base64:
      return "illegal base64 data";
    case error::www_authenticate_header_missing:
      return "WWW-Authenticate header missing";
    case error::wrong_www_authenticate_header:
      return "wrong WWW-Authenticate header";
    case error::empty_ntlm_challenge:
      return "empty NTLM challenge";
    case error::ntlm_unsupported_version:
      return "unsupported NTLM version";
    case error::ntlm_unsupported_mode:
      return "unsupported NTLM mode";
    case error::ntlm_invalid_message:
      return "invalid NTLM message";
    case error::ntlm_invalid_session_state:
      return "invalid NTLM session state";
    case error::ntlm_crypto_error:
      return "NTLM cryptographic operation failed";
    default:
      return "httpntlm error";
  }
}

}  // detail
}  // error
}  // httpntlm
