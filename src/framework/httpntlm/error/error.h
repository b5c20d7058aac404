#ifndef HTTPNTLM_ERROR_ERROR_H_
#define HTTPNTLM_ERROR_ERROR_H_

#include <string>

#include <boost/asio/error.hpp>
#include <boost/system/error_code.hpp>

namespace httpntlm {
namespace error {

enum errors {
  success = boost::system::errc::success,
  interrupted = boost::system::errc::interrupted,
  invalid_argument = boost::system::errc::invalid_argument,
  broken_pipe = boost::system::errc::broken_pipe,
  connection_aborted = boost::system::errc::connection_aborted,
  connection_refused = boost::system::errc::connection_refused,
  connection_reset = boost::system::errc::connection_reset,
  not_connected = boost::system::errc::not_connected,
  protocol_error = boost::system::errc::protocol_error,
  operation_canceled = boost::system::errc::operation_canceled,
  out_of_range = 10000,

  // http
  invalid_url = 11000,
  unsupported_scheme = 11001,
  malformed_response = 11002,
  unexpected_end_of_body = 11003,
  body_closed = 11004,
  invalid_base64 = 11005,

  // ntlm handshake
  www_authenticate_header_missing = 12000,
  wrong_www_authenticate_header = 12001,
  empty_ntlm_challenge = 12002,

  // ntlm engine
  ntlm_unsupported_version = 13000,
  ntlm_unsupported_mode = 13001,
  ntlm_invalid_message = 13002,
  ntlm_invalid_session_state = 13003,
  ntlm_crypto_error = 13004
};

namespace detail {
class httpntlm_category : public boost::system::error_category {
 public:
  const char* name() const BOOST_SYSTEM_NOEXCEPT;

  std::string message(int value) const;
};
}  // detail

inline const boost::system::error_category& get_httpntlm_category() {
  static detail::httpntlm_category instance;
  return instance;
}

inline boost::system::error_code make_error_code(errors value) {
  return boost::system::error_code(value, get_httpntlm_category());
}

}  // error
}  // httpntlm

#endif  // HTTPNTLM_ERROR_ERROR_H_
