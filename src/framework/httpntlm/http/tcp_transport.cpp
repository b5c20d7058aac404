#include <boost/asio/connect.hpp>
#include <boost/asio/error.hpp>
#include <boost/asio/ip/address.hpp>
#include <boost/asio/ssl/error.hpp>
#include <boost/asio/ssl/host_name_verification.hpp>

#include <openssl/err.h>
#include <openssl/ssl.h>

#include "httpntlm/error/error.h"
#include "httpntlm/http/tcp_transport.h"
#include "httpntlm/log/log.h"

namespace httpntlm {
namespace http {

namespace {

bool IsEndOfStream(const boost::system::error_code& ec) {
  return ec == boost::asio::error::eof ||
         ec == boost::asio::ssl::error::stream_truncated;
}

}  // namespace

TcpTransportOptions::TcpTransportOptions()
    : max_idle_connections_per_host(2), verify_peer(true), ca_file() {}

namespace detail {

ConnectionPool::ConnectionPool(std::size_t max_idle_per_host)
    : io_service_(),
      ssl_context_(boost::asio::ssl::context::tls_client),
      max_idle_per_host_(max_idle_per_host),
      mutex_(),
      idle_() {}

std::shared_ptr<Connection> ConnectionPool::Get(const std::string& key) {
  std::unique_lock<std::mutex> lock(mutex_);
  auto it = idle_.find(key);
  if (it == idle_.end() || it->second.empty()) {
    return nullptr;
  }

  auto p_connection = it->second.front();
  it->second.pop_front();
  if (it->second.empty()) {
    idle_.erase(it);
  }

  return p_connection;
}

void ConnectionPool::Put(std::shared_ptr<Connection> p_connection) {
  std::unique_lock<std::mutex> lock(mutex_);
  auto& connections = idle_[p_connection->key()];
  if (connections.size() >= max_idle_per_host_) {
    p_connection->Close();
    if (connections.empty()) {
      idle_.erase(p_connection->key());
    }
    return;
  }

  connections.push_back(std::move(p_connection));
}

std::size_t ConnectionPool::IdleCount() {
  std::unique_lock<std::mutex> lock(mutex_);
  std::size_t count = 0;
  for (const auto& connections : idle_) {
    count += connections.second.size();
  }

  return count;
}

ConnectionBody::ConnectionBody(std::shared_ptr<ConnectionPool> p_pool,
                               std::shared_ptr<Connection> p_connection)
    : p_pool_(std::move(p_pool)),
      p_connection_(std::move(p_connection)),
      buffer_() {}

ConnectionBody::~ConnectionBody() {
  if (p_connection_) {
    p_connection_->Close();
  }
}

std::size_t ConnectionBody::Read(char* p_data, std::size_t size,
                                 boost::system::error_code& ec) {
  if (!p_connection_) {
    ec.assign(error::body_closed, error::get_httpntlm_category());
    return 0;
  }

  auto& builder = p_connection_->response_builder();
  while (!builder.HasBodyData()) {
    if (builder.complete()) {
      ec = boost::asio::error::eof;
      return 0;
    }

    auto read_size = p_connection_->ReadSome(buffer_.data(), buffer_.size(), ec);
    if (IsEndOfStream(ec)) {
      if (builder.ProcessEof() != HttpResponseBuilder::kParserOk ||
          !builder.complete()) {
        ec.assign(error::unexpected_end_of_body,
                  error::get_httpntlm_category());
        return 0;
      }
      continue;
    }
    if (ec) {
      return 0;
    }

    if (builder.ProcessInput(buffer_.data(), read_size) !=
        HttpResponseBuilder::kParserOk) {
      ec.assign(error::malformed_response, error::get_httpntlm_category());
      return 0;
    }
  }

  ec.assign(error::success, error::get_httpntlm_category());
  return builder.ReadBody(p_data, size);
}

void ConnectionBody::Close(boost::system::error_code& ec) {
  ec.assign(error::success, error::get_httpntlm_category());
  if (!p_connection_) {
    return;
  }

  auto& builder = p_connection_->response_builder();
  if (builder.complete() && !builder.HasBodyData() && builder.keep_alive()) {
    p_pool_->Put(p_connection_);
  } else {
    p_connection_->Close();
  }
  p_connection_.reset();
}

}  // detail

TcpTransport::TcpTransport() : TcpTransport(TcpTransportOptions()) {}

TcpTransport::TcpTransport(const TcpTransportOptions& options)
    : options_(options),
      p_pool_(std::make_shared<detail::ConnectionPool>(
          options.max_idle_connections_per_host)),
      tls_init_ec_() {
  auto& ssl_context = p_pool_->ssl_context();
  if (options_.ca_file.empty()) {
    ssl_context.set_default_verify_paths(tls_init_ec_);
  } else {
    ssl_context.load_verify_file(options_.ca_file, tls_init_ec_);
  }
  if (tls_init_ec_) {
    HTTPNTLM_LOG("http", warn, "could not load trust store ({})",
                 tls_init_ec_.message());
  }
}

HttpResponsePtr TcpTransport::RoundTrip(const HttpRequest& request,
                                        boost::system::error_code& ec) {
  const auto& url = request.url();
  if (!url.valid()) {
    ec.assign(error::invalid_url, error::get_httpntlm_category());
    return nullptr;
  }
  if (url.scheme() != "http" && url.scheme() != "https") {
    ec.assign(error::unsupported_scheme, error::get_httpntlm_category());
    return nullptr;
  }

  auto key = ConnectionKey(url);
  auto request_data = request.Serialize();
  bool head_request = request.method() == "HEAD";

  // an idle connection may have been closed by the server meanwhile: the
  // request is sent again on another connection if nothing was received
  for (;;) {
    auto p_connection = p_pool_->Get(key);
    bool reused = p_connection != nullptr;
    if (!reused) {
      p_connection = Connect(url, key, ec);
      if (ec) {
        return nullptr;
      }
    }

    auto p_response = Exchange(p_connection, request_data, head_request, ec);
    if (!ec) {
      return p_response;
    }

    p_connection->Close();
    if (!reused || p_connection->response_builder().started()) {
      return nullptr;
    }

    HTTPNTLM_LOG("http", debug, "idle connection to <{}> lost ({}), retrying",
                 key, ec.message());
  }
}

std::size_t TcpTransport::IdleConnections() { return p_pool_->IdleCount(); }

std::shared_ptr<detail::Connection> TcpTransport::Connect(
    const Url& url, const std::string& key, boost::system::error_code& ec) {
  boost::asio::ip::tcp::resolver resolver(p_pool_->io_service());
  auto endpoints = resolver.resolve(url.host(), url.port(), ec);
  if (ec) {
    HTTPNTLM_LOG("http", debug, "could not resolve <{}> ({})", url.host(),
                 ec.message());
    return nullptr;
  }

  if (!url.secure()) {
    auto p_connection =
        std::make_shared<detail::TcpConnection>(key, p_pool_->io_service());
    boost::asio::connect(p_connection->stream(), endpoints, ec);
    if (ec) {
      return nullptr;
    }
    HTTPNTLM_LOG("http", debug, "connected to <{}>", key);
    return p_connection;
  }

  if (tls_init_ec_ && options_.verify_peer) {
    ec = tls_init_ec_;
    return nullptr;
  }

  auto p_connection = std::make_shared<detail::TlsConnection>(
      key, p_pool_->io_service(), p_pool_->ssl_context());
  auto& stream = p_connection->stream();
  boost::asio::connect(stream.next_layer(), endpoints, ec);
  if (ec) {
    return nullptr;
  }

  // no SNI for IP literals
  boost::system::error_code address_ec;
  boost::asio::ip::make_address(url.host(), address_ec);
  if (address_ec &&
      !SSL_set_tlsext_host_name(stream.native_handle(), url.host().c_str())) {
    ec.assign(static_cast<int>(::ERR_get_error()),
              boost::asio::error::get_ssl_category());
    return nullptr;
  }

  if (options_.verify_peer) {
    stream.set_verify_mode(boost::asio::ssl::verify_peer, ec);
    if (!ec) {
      stream.set_verify_callback(
          boost::asio::ssl::host_name_verification(url.host()), ec);
    }
  } else {
    stream.set_verify_mode(boost::asio::ssl::verify_none, ec);
  }
  if (ec) {
    return nullptr;
  }

  stream.handshake(boost::asio::ssl::stream_base::client, ec);
  if (ec) {
    HTTPNTLM_LOG("http", debug, "TLS handshake with <{}> failed ({})", key,
                 ec.message());
    return nullptr;
  }

  HTTPNTLM_LOG("http", debug, "connected to <{}>", key);
  return p_connection;
}

HttpResponsePtr TcpTransport::Exchange(
    std::shared_ptr<detail::Connection> p_connection,
    const std::string& request_data, bool head_request,
    boost::system::error_code& ec) {
  auto& builder = p_connection->response_builder();
  builder.Reset(head_request);

  p_connection->Write(request_data, ec);
  if (ec) {
    return nullptr;
  }

  std::array<char, 4 * 1024> buffer;
  while (!builder.headers_complete()) {
    auto read_size = p_connection->ReadSome(buffer.data(), buffer.size(), ec);
    if (IsEndOfStream(ec) && builder.started()) {
      ec.assign(error::malformed_response, error::get_httpntlm_category());
    }
    if (ec) {
      return nullptr;
    }

    if (builder.ProcessInput(buffer.data(), read_size) !=
        HttpResponseBuilder::kParserOk) {
      ec.assign(error::malformed_response, error::get_httpntlm_category());
      return nullptr;
    }
  }

  auto p_response = std::make_shared<HttpResponse>(builder.Get());
  p_response->set_body(
      std::make_shared<detail::ConnectionBody>(p_pool_, p_connection));

  ec.assign(error::success, error::get_httpntlm_category());
  return p_response;
}

std::string TcpTransport::ConnectionKey(const Url& url) {
  return url.scheme() + "://" + url.host() + ":" + url.port();
}

}  // http
}  // httpntlm
