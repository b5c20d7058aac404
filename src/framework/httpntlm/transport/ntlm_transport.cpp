#include <cctype>

#include <boost/algorithm/string.hpp>

#include "httpntlm/error/error.h"
#include "httpntlm/http/base64.h"
#include "httpntlm/http/response_body.h"
#include "httpntlm/http/tcp_transport.h"
#include "httpntlm/log/log.h"
#include "httpntlm/ntlm/default_engine.h"
#include "httpntlm/transport/ntlm_transport.h"

namespace httpntlm {
namespace transport {

namespace {

const char kNtlmScheme[] = "NTLM";
const std::size_t kNtlmSchemeLength = sizeof(kNtlmScheme) - 1;

bool IsEmptyChallenge(const boost::system::error_code& ec) {
  return ec.category() == error::get_httpntlm_category() &&
         ec.value() == error::empty_ntlm_challenge;
}

}  // namespace

Credentials::Credentials()
    : domain(), username(), password(), workstation() {}

Credentials::Credentials(const std::string& domain_name,
                         const std::string& user_name,
                         const std::string& user_password,
                         const std::string& workstation_name)
    : domain(domain_name),
      username(user_name),
      password(user_password),
      workstation(workstation_name) {}

namespace detail {

std::string ExtractNtlmChallenge(const http::HttpResponse& response,
                                 boost::system::error_code& ec) {
  auto values = response.Header("WWW-Authenticate");
  if (values.empty()) {
    ec.assign(error::www_authenticate_header_missing,
              error::get_httpntlm_category());
    return "";
  }

  for (const auto& value : values) {
    if (!boost::starts_with(value, kNtlmScheme)) {
      continue;
    }
    // "NTLMv2 ..." is another scheme
    if (value.size() > kNtlmSchemeLength &&
        !std::isspace(static_cast<unsigned char>(value[kNtlmSchemeLength]))) {
      continue;
    }

    auto payload = boost::trim_copy(value.substr(kNtlmSchemeLength));
    if (payload.empty()) {
      ec.assign(error::empty_ntlm_challenge, error::get_httpntlm_category());
      return "";
    }

    ec.assign(error::success, error::get_httpntlm_category());
    return payload;
  }

  ec.assign(error::wrong_www_authenticate_header,
            error::get_httpntlm_category());
  return "";
}

}  // detail

NtlmTransport::NtlmTransport(const Credentials& credentials,
                             std::shared_ptr<http::Transport> p_inner,
                             std::shared_ptr<http::CookieJar> p_jar,
                             std::shared_ptr<ntlm::Engine> p_engine)
    : credentials_(credentials),
      p_inner_(p_inner ? std::move(p_inner)
                       : std::make_shared<http::TcpTransport>()),
      p_jar_(std::move(p_jar)),
      p_engine_(p_engine ? std::move(p_engine)
                         : std::make_shared<ntlm::DefaultEngine>()) {}

http::HttpResponsePtr NtlmTransport::Send(http::HttpRequest* p_request,
                                          boost::system::error_code& ec) {
  if (p_request == nullptr) {
    ec.assign(error::invalid_argument, error::get_httpntlm_category());
    return nullptr;
  }
  if (!p_request->url().valid()) {
    ec.assign(error::invalid_url, error::get_httpntlm_category());
    return nullptr;
  }

  http::HttpClient client(p_inner_, p_jar_);

  http::HttpResponsePtr p_response;
  for (int attempt = 1; attempt <= kMaxHandshakeAttempts; ++attempt) {
    p_response = NtlmRoundTrip(&client, p_request, ec);
    if (!IsEmptyChallenge(ec)) {
      break;
    }
    HTTPNTLM_LOG("transport", debug,
                 "empty NTLM challenge from <{}> (attempt {}/{})",
                 p_request->url().HostHeader(), attempt,
                 static_cast<int>(kMaxHandshakeAttempts));
  }

  return p_response;
}

http::HttpResponsePtr NtlmTransport::RoundTrip(
    const http::HttpRequest& request, boost::system::error_code& ec) {
  http::HttpRequest authenticated_request(request);
  return Send(&authenticated_request, ec);
}

http::HttpResponsePtr NtlmTransport::NtlmRoundTrip(
    http::HttpClient* p_client, http::HttpRequest* p_request,
    boost::system::error_code& ec) {
  http::HttpRequest probe("GET", p_request->url());
  probe.SetHeader("Authorization", std::string(kNtlmScheme) + " " +
                                       http::Base64::Encode(
                                           p_engine_->Negotiate()));

  HTTPNTLM_LOG("transport", debug, "send NTLM negotiate to <{}>",
               p_request->url().ToString());
  auto p_probe_response = p_client->Do(probe, ec);
  if (ec) {
    return nullptr;
  }

  if (!p_probe_response->Unauthorized()) {
    HTTPNTLM_LOG("transport", debug, "no authentication required ({})",
                 p_probe_response->status_code());
    return p_probe_response;
  }

  // the connection is reused for the authenticated request only if the
  // probe body is read to the end and closed
  auto p_probe_body = p_probe_response->body();
  http::DiscardBody(p_probe_body.get(), ec);
  if (ec) {
    return nullptr;
  }
  p_probe_body->Close(ec);
  if (ec) {
    return nullptr;
  }

  auto challenge_payload = detail::ExtractNtlmChallenge(*p_probe_response, ec);
  if (ec) {
    return nullptr;
  }

  auto challenge_bytes = http::Base64::Decode(challenge_payload, ec);
  if (ec) {
    return nullptr;
  }

  HTTPNTLM_LOG("transport", debug, "NTLM challenge received ({} bytes)",
               challenge_bytes.size());

  auto p_session = p_engine_->CreateClientSession(
      ntlm::kVersion2, ntlm::kConnectionlessMode, ec);
  if (ec) {
    return nullptr;
  }
  if (!p_session) {
    ec.assign(error::ntlm_invalid_session_state,
              error::get_httpntlm_category());
    return nullptr;
  }
  p_session->SetUserInfo(credentials_.username, credentials_.password,
                         credentials_.domain, credentials_.workstation);

  auto challenge = p_engine_->ParseChallengeMessage(challenge_bytes, ec);
  if (ec) {
    return nullptr;
  }

  p_session->ProcessChallengeMessage(challenge, ec);
  if (ec) {
    return nullptr;
  }

  auto authenticate = p_session->GenerateAuthenticateMessage(ec);
  if (ec) {
    return nullptr;
  }

  auto authenticate_bytes = authenticate.Bytes();
  if (authenticate_bytes.empty()) {
    ec.assign(error::ntlm_invalid_message, error::get_httpntlm_category());
    return nullptr;
  }

  p_request->SetHeader("Authorization",
                       std::string(kNtlmScheme) + " " +
                           http::Base64::Encode(authenticate_bytes));

  HTTPNTLM_LOG("transport", debug, "send NTLM authenticate to <{}>",
               p_request->url().ToString());
  return p_client->Do(*p_request, ec);
}

}  // transport
}  // httpntlm
