#ifndef HTTPNTLM_HTTP_TCP_TRANSPORT_H_
#define HTTPNTLM_HTTP_TCP_TRANSPORT_H_

#include <cstddef>

#include <array>
#include <list>
#include <map>
#include <memory>
#include <mutex>
#include <string>

#include <boost/asio/io_service.hpp>
#include <boost/asio/ssl/context.hpp>
#include <boost/system/error_code.hpp>

#include "httpntlm/http/connection.h"
#include "httpntlm/http/response_body.h"
#include "httpntlm/http/transport.h"

namespace httpntlm {
namespace http {

struct TcpTransportOptions {
  TcpTransportOptions();

  std::size_t max_idle_connections_per_host;
  bool verify_peer;
  // Empty for the system trust store
  std::string ca_file;
};

namespace detail {

// Idle keep-alive connections, keyed by origin
class ConnectionPool {
 public:
  explicit ConnectionPool(std::size_t max_idle_per_host);

  inline boost::asio::io_service& io_service() { return io_service_; }
  inline boost::asio::ssl::context& ssl_context() { return ssl_context_; }

  // Null if no idle connection is available for key
  std::shared_ptr<Connection> Get(const std::string& key);

  void Put(std::shared_ptr<Connection> p_connection);

  std::size_t IdleCount();

 private:
  boost::asio::io_service io_service_;
  boost::asio::ssl::context ssl_context_;
  std::size_t max_idle_per_host_;
  std::mutex mutex_;
  std::map<std::string, std::list<std::shared_ptr<Connection>>> idle_;
};

// Body streamed from a pooled connection. The connection goes back to the
// pool on Close if the response was read completely and is keep-alive.
class ConnectionBody : public ResponseBody {
 public:
  ConnectionBody(std::shared_ptr<ConnectionPool> p_pool,
                 std::shared_ptr<Connection> p_connection);

  ~ConnectionBody();

  std::size_t Read(char* p_data, std::size_t size,
                   boost::system::error_code& ec) override;

  void Close(boost::system::error_code& ec) override;

 private:
  std::shared_ptr<ConnectionPool> p_pool_;
  std::shared_ptr<Connection> p_connection_;
  std::array<char, 4 * 1024> buffer_;
};

}  // detail

// HTTP/1.1 transport over plain TCP or TLS with keep-alive connection reuse
class TcpTransport : public Transport {
 public:
  TcpTransport();
  explicit TcpTransport(const TcpTransportOptions& options);

  HttpResponsePtr RoundTrip(const HttpRequest& request,
                            boost::system::error_code& ec) override;

  std::size_t IdleConnections();

 private:
  std::shared_ptr<detail::Connection> Connect(const Url& url,
                                              const std::string& key,
                                              boost::system::error_code& ec);

  HttpResponsePtr Exchange(std::shared_ptr<detail::Connection> p_connection,
                           const std::string& request_data, bool head_request,
                           boost::system::error_code& ec);

  static std::string ConnectionKey(const Url& url);

 private:
  TcpTransportOptions options_;
  std::shared_ptr<detail::ConnectionPool> p_pool_;
  boost::system::error_code tls_init_ec_;
};

}  // http
}  // httpntlm

#endif  // HTTPNTLM_HTTP_TCP_TRANSPORT_H_
