#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include <boost/asio/buffers_iterator.hpp>
#include <boost/asio/io_service.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/read_until.hpp>
#include <boost/asio/streambuf.hpp>
#include <boost/asio/write.hpp>
#include <boost/system/error_code.hpp>
#include <gtest/gtest.h>

#include "httpntlm/error/error.h"
#include "httpntlm/http/base64.h"
#include "httpntlm/http/http_request.h"
#include "httpntlm/http/response_body.h"
#include "httpntlm/http/tcp_transport.h"
#include "httpntlm/ntlm/ntlm_buffer.h"
#include "httpntlm/transport/ntlm_transport.h"

namespace http = httpntlm::http;
namespace ntlm = httpntlm::ntlm;

namespace {

// HTTP/1.1 server on the loopback interface answering every request head
// with the response returned by the handler
class LoopbackServer {
 public:
  using Handler = std::function<std::string(const std::string&)>;

 public:
  explicit LoopbackServer(Handler handler)
      : io_service_(),
        acceptor_(io_service_,
                  boost::asio::ip::tcp::endpoint(
                      boost::asio::ip::address_v4::loopback(), 0)),
        handler_(std::move(handler)),
        accepted_(0),
        mutex_(),
        requests_(),
        thread_() {
    DoAccept();
    thread_ = std::thread([this]() { io_service_.run(); });
  }

  ~LoopbackServer() {
    io_service_.stop();
    thread_.join();
  }

  std::string Url(const std::string& path) const {
    return "http://127.0.0.1:" +
           std::to_string(acceptor_.local_endpoint().port()) + path;
  }

  int accepted() const { return accepted_; }

  std::vector<std::string> requests() {
    std::unique_lock<std::mutex> lock(mutex_);
    return requests_;
  }

 private:
  struct Session {
    explicit Session(boost::asio::io_service& io_service)
        : socket(io_service), request(), response() {}

    boost::asio::ip::tcp::socket socket;
    boost::asio::streambuf request;
    std::string response;
  };
  using SessionPtr = std::shared_ptr<Session>;

  void DoAccept() {
    auto p_session = std::make_shared<Session>(io_service_);
    acceptor_.async_accept(
        p_session->socket,
        [this, p_session](const boost::system::error_code& ec) {
          if (ec) {
            return;
          }
          ++accepted_;
          DoRead(p_session);
          DoAccept();
        });
  }

  void DoRead(SessionPtr p_session) {
    boost::asio::async_read_until(
        p_session->socket, p_session->request, "\r\n\r\n",
        [this, p_session](const boost::system::error_code& ec,
                          std::size_t length) {
          if (ec) {
            return;
          }

          std::string head(
              boost::asio::buffers_begin(p_session->request.data()),
              boost::asio::buffers_begin(p_session->request.data()) + length);
          p_session->request.consume(length);
          {
            std::unique_lock<std::mutex> lock(mutex_);
            requests_.push_back(head);
          }

          p_session->response = handler_(head);
          boost::asio::async_write(
              p_session->socket, boost::asio::buffer(p_session->response),
              [this, p_session](const boost::system::error_code& ec,
                                std::size_t) {
                if (ec) {
                  return;
                }
                DoRead(p_session);
              });
        });
  }

 private:
  boost::asio::io_service io_service_;
  boost::asio::ip::tcp::acceptor acceptor_;
  Handler handler_;
  std::atomic<int> accepted_;
  std::mutex mutex_;
  std::vector<std::string> requests_;
  std::thread thread_;
};

std::string OkResponse(const std::string& head) {
  return "HTTP/1.1 200 OK\r\nContent-Length: 5\r\n\r\nhello";
}

}  // namespace

TEST(TcpTransportTest, InvalidRequests) {
  http::TcpTransport transport;
  boost::system::error_code ec;

  auto p_response =
      transport.RoundTrip(http::HttpRequest("GET", "no url"), ec);
  ASSERT_EQ(nullptr, p_response);
  ASSERT_EQ(httpntlm::error::invalid_url, ec.value());

  p_response =
      transport.RoundTrip(http::HttpRequest("GET", "ftp://server/file"), ec);
  ASSERT_EQ(nullptr, p_response);
  ASSERT_EQ(httpntlm::error::unsupported_scheme, ec.value());
}

TEST(TcpTransportTest, ConnectionIsReusedAfterBodyIsClosed) {
  LoopbackServer server(&OkResponse);
  http::TcpTransport transport;
  boost::system::error_code ec;

  for (int i = 0; i < 3; ++i) {
    auto p_response =
        transport.RoundTrip(http::HttpRequest("GET", server.Url("/")), ec);
    ASSERT_FALSE(ec) << ec.message();
    ASSERT_EQ(200, p_response->status_code());
    ASSERT_EQ("5", p_response->headers().Get("Content-Length"));

    auto body = http::ReadBody(p_response->body().get(), ec);
    ASSERT_FALSE(ec) << ec.message();
    ASSERT_EQ("hello", body);

    p_response->body()->Close(ec);
    ASSERT_FALSE(ec);
    ASSERT_EQ(1u, transport.IdleConnections());
  }

  ASSERT_EQ(1, server.accepted());
  ASSERT_EQ(3u, server.requests().size());
}

TEST(TcpTransportTest, UnreadBodyClosesConnection) {
  LoopbackServer server(&OkResponse);
  http::TcpTransport transport;
  boost::system::error_code ec;

  for (int i = 0; i < 2; ++i) {
    auto p_response =
        transport.RoundTrip(http::HttpRequest("GET", server.Url("/")), ec);
    ASSERT_FALSE(ec) << ec.message();

    p_response->body()->Close(ec);
    ASSERT_FALSE(ec);
    ASSERT_EQ(0u, transport.IdleConnections());

    char byte = 0;
    p_response->body()->Read(&byte, 1, ec);
    ASSERT_EQ(httpntlm::error::body_closed, ec.value());
  }

  ASSERT_EQ(2, server.accepted());
}

TEST(TcpTransportTest, ConnectionCloseIsNotPooled) {
  LoopbackServer server([](const std::string&) {
    return std::string(
        "HTTP/1.1 200 OK\r\nContent-Length: 2\r\nConnection: close\r\n\r\nok");
  });
  http::TcpTransport transport;
  boost::system::error_code ec;

  auto p_response =
      transport.RoundTrip(http::HttpRequest("GET", server.Url("/")), ec);
  ASSERT_FALSE(ec) << ec.message();
  ASSERT_EQ("ok", http::ReadBody(p_response->body().get(), ec));
  p_response->body()->Close(ec);

  ASSERT_EQ(0u, transport.IdleConnections());
}

TEST(TcpTransportTest, RequestIsSerialized) {
  LoopbackServer server(&OkResponse);
  http::TcpTransport transport;
  boost::system::error_code ec;

  http::HttpRequest request("GET", server.Url("/path?query=1"));
  request.SetHeader("Authorization", "NTLM abc=");

  auto p_response = transport.RoundTrip(request, ec);
  ASSERT_FALSE(ec) << ec.message();
  http::DiscardBody(p_response->body().get(), ec);
  ASSERT_FALSE(ec);

  auto requests = server.requests();
  ASSERT_EQ(1u, requests.size());
  ASSERT_EQ(0u, requests.front().find("GET /path?query=1 HTTP/1.1\r\n"));
  ASSERT_NE(std::string::npos,
            requests.front().find("\r\nAuthorization: NTLM abc=\r\n"));
  ASSERT_NE(std::string::npos, requests.front().find("\r\nHost: 127.0.0.1:"));
}

TEST(TcpTransportTest, ConnectionRefused) {
  std::string url;
  {
    LoopbackServer server(&OkResponse);
    url = server.Url("/");
  }

  http::TcpTransport transport;
  boost::system::error_code ec;
  auto p_response = transport.RoundTrip(http::HttpRequest("GET", url), ec);

  ASSERT_EQ(nullptr, p_response);
  ASSERT_TRUE(ec);
}

TEST(TcpTransportTest, NtlmHandshakeOnOneConnection) {
  ntlm::NtlmBufferWriter writer(32);
  writer.WriteSignature();
  writer.WriteMessageType(ntlm::kChallengeMessage);
  writer.WriteSecurityBuffer(ntlm::SecurityBuffer());
  writer.WriteUInt32(ntlm::kNegotiateUnicode | ntlm::kNegotiateNtlm);
  writer.WriteBytes(ntlm::Buffer({1, 2, 3, 4, 5, 6, 7, 8}));
  auto challenge = http::Base64::Encode(writer.Pass());

  // NTLMSSP\0 followed by message type 1 or 3
  LoopbackServer server([&challenge](const std::string& head) -> std::string {
    if (head.find("Authorization: NTLM TlRMTVNTUAAB") != std::string::npos) {
      return "HTTP/1.1 401 Unauthorized\r\nWWW-Authenticate: NTLM " +
             challenge + "\r\nContent-Length: 6\r\n\r\ndenied";
    }
    if (head.find("Authorization: NTLM TlRMTVNTUAAD") != std::string::npos) {
      return "HTTP/1.1 200 OK\r\nContent-Length: 7\r\n\r\nwelcome";
    }
    return "HTTP/1.1 401 Unauthorized\r\nWWW-Authenticate: NTLM\r\n"
           "Content-Length: 0\r\n\r\n";
  });

  auto p_tcp_transport = std::make_shared<http::TcpTransport>();
  httpntlm::transport::NtlmTransport transport(
      httpntlm::transport::Credentials("DOMAIN", "user", "password", ""),
      p_tcp_transport);

  boost::system::error_code ec;
  auto p_response =
      transport.RoundTrip(http::HttpRequest("GET", server.Url("/secure")), ec);

  ASSERT_FALSE(ec) << ec.message();
  ASSERT_EQ(200, p_response->status_code());
  ASSERT_EQ("welcome", http::ReadBody(p_response->body().get(), ec));
  p_response->body()->Close(ec);

  ASSERT_EQ(2u, server.requests().size());
  ASSERT_EQ(1, server.accepted());
  ASSERT_EQ(1u, p_tcp_transport->IdleConnections());
}
