#ifndef HTTPNTLM_HTTP_CONNECTION_H_
#define HTTPNTLM_HTTP_CONNECTION_H_

#include <cstddef>

#include <string>
#include <utility>

#include <boost/asio/buffer.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl/stream.hpp>
#include <boost/asio/write.hpp>
#include <boost/system/error_code.hpp>

#include "httpntlm/http/http_response_builder.h"

namespace httpntlm {
namespace http {
namespace detail {

// Persistent connection to an origin, with the parser state of the response
// currently read from it
class Connection {
 public:
  explicit Connection(const std::string& key)
      : key_(key), response_builder_() {}

  virtual ~Connection() {}

  virtual void Write(const std::string& data,
                     boost::system::error_code& ec) = 0;

  virtual std::size_t ReadSome(char* p_data, std::size_t size,
                               boost::system::error_code& ec) = 0;

  virtual void Close() = 0;

  inline const std::string& key() const { return key_; }

  inline HttpResponseBuilder& response_builder() { return response_builder_; }

 private:
  std::string key_;
  HttpResponseBuilder response_builder_;
};

template <class Stream>
class BasicConnection : public Connection {
 public:
  template <class... Args>
  BasicConnection(const std::string& key, Args&&... args)
      : Connection(key), stream_(std::forward<Args>(args)...) {}

  ~BasicConnection() { Close(); }

  inline Stream& stream() { return stream_; }

  void Write(const std::string& data, boost::system::error_code& ec) override {
    boost::asio::write(stream_, boost::asio::buffer(data), ec);
  }

  std::size_t ReadSome(char* p_data, std::size_t size,
                       boost::system::error_code& ec) override {
    return stream_.read_some(boost::asio::buffer(p_data, size), ec);
  }

  void Close() override {
    boost::system::error_code close_ec;
    auto& socket = stream_.lowest_layer();
    if (!socket.is_open()) {
      return;
    }
    socket.shutdown(boost::asio::ip::tcp::socket::shutdown_both, close_ec);
    socket.close(close_ec);
  }

 private:
  Stream stream_;
};

using TcpConnection = BasicConnection<boost::asio::ip::tcp::socket>;
using TlsConnection =
    BasicConnection<boost::asio::ssl::stream<boost::asio::ip::tcp::socket>>;

}  // detail
}  // http
}  // httpntlm

#endif  // HTTPNTLM_HTTP_CONNECTION_H_
