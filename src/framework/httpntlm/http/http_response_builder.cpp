#include <algorithm>

#include "httpntlm/http/http_response_builder.h"

#define HTTP_PARSER_C_CALLBACK_IMPL(method)                                  \
  int HttpResponseBuilder::HTTP_PARSER_C_CALLBACK_NAME(method)(http_parser * \
                                                               p_parser) {   \
    HttpResponseBuilder* p_response_builder =                                \
        static_cast<HttpResponseBuilder*>(p_parser->data);                   \
    return p_response_builder->method(p_parser);                             \
  }

#define HTTP_PARSER_C_DATA_CALLBACK_IMPL(method)                \
  int HttpResponseBuilder::HTTP_PARSER_C_CALLBACK_NAME(method)( \
      http_parser * p_parser, const char* data, size_t len) {   \
    HttpResponseBuilder* p_response_builder =                   \
        static_cast<HttpResponseBuilder*>(p_parser->data);      \
    return p_response_builder->method(p_parser, data, len);     \
  }

namespace httpntlm {
namespace http {

HttpResponseBuilder::HttpResponseBuilder()
    : response_(),
      head_request_(false),
      started_(false),
      informational_(false),
      headers_complete_(false),
      complete_(false),
      keep_alive_(false),
      processing_header_name_(true),
      current_header_name_(),
      current_header_value_(),
      body_(),
      body_offset_(0) {
  http_parser_init(&parser_, HTTP_RESPONSE);
  parser_.data = this;

  http_parser_settings_init(&parser_settings_);
  parser_settings_.on_message_begin =
      HTTP_PARSER_C_CALLBACK_NAME(OnMessageBegin);
  parser_settings_.on_status = HTTP_PARSER_C_CALLBACK_NAME(OnStatus);
  parser_settings_.on_header_field = HTTP_PARSER_C_CALLBACK_NAME(OnHeaderName);
  parser_settings_.on_header_value = HTTP_PARSER_C_CALLBACK_NAME(OnHeaderValue);
  parser_settings_.on_headers_complete =
      HTTP_PARSER_C_CALLBACK_NAME(OnHeadersComplete);
  parser_settings_.on_body = HTTP_PARSER_C_CALLBACK_NAME(OnBody);
  parser_settings_.on_message_complete =
      HTTP_PARSER_C_CALLBACK_NAME(OnMessageComplete);
}

HttpResponse HttpResponseBuilder::Get() const { return response_; }

void HttpResponseBuilder::Reset(bool head_request) {
  head_request_ = head_request;
  started_ = false;
  informational_ = false;
  headers_complete_ = false;
  complete_ = false;
  keep_alive_ = false;
  processing_header_name_ = true;
  current_header_name_.clear();
  current_header_value_.clear();
  body_.clear();
  body_offset_ = 0;

  http_parser_init(&parser_, HTTP_RESPONSE);
  parser_.data = this;

  response_.Reset();
}

HttpResponseBuilder::ParserStatus HttpResponseBuilder::ProcessInput(
    const char* p_data, std::size_t size) {
  std::size_t parsed_size =
      http_parser_execute(&parser_, &parser_settings_, p_data, size);

  if (parser_.upgrade) {
    // not implemented
    return kParserError;
  }

  if (HTTP_PARSER_ERRNO(&parser_) != HPE_OK || parsed_size != size) {
    return kParserError;
  }

  return kParserOk;
}

HttpResponseBuilder::ParserStatus HttpResponseBuilder::ProcessEof() {
  http_parser_execute(&parser_, &parser_settings_, nullptr, 0);

  if (HTTP_PARSER_ERRNO(&parser_) != HPE_OK) {
    return kParserError;
  }

  return kParserOk;
}

std::size_t HttpResponseBuilder::ReadBody(char* p_data, std::size_t size) {
  std::size_t read_size = std::min(size, body_.size() - body_offset_);
  std::copy(body_.begin() + body_offset_,
            body_.begin() + body_offset_ + read_size, p_data);
  body_offset_ += read_size;

  if (body_offset_ == body_.size()) {
    body_.clear();
    body_offset_ = 0;
  }

  return read_size;
}

HttpResponseBuilder::ParserStatus HttpResponseBuilder::OnMessageBegin(
    http_parser* p_parser) {
  started_ = true;
  return kParserOk;
}

HttpResponseBuilder::ParserStatus HttpResponseBuilder::OnStatus(
    http_parser* p_parser, const char* at, size_t length) {
  response_.set_status_code(p_parser->status_code);
  response_.set_reason(response_.reason() + std::string(at, length));
  return kParserOk;
}

HttpResponseBuilder::ParserStatus HttpResponseBuilder::OnHeaderName(
    http_parser* p_parser, const char* at, size_t length) {
  if (!processing_header_name_) {
    FlushHeader();
  }
  current_header_name_.append(at, length);
  return kParserOk;
}

HttpResponseBuilder::ParserStatus HttpResponseBuilder::OnHeaderValue(
    http_parser* p_parser, const char* at, size_t length) {
  processing_header_name_ = false;
  current_header_value_.append(at, length);
  return kParserOk;
}

HttpResponseBuilder::ParserStatus HttpResponseBuilder::OnHeadersComplete(
    http_parser* p_parser) {
  if (!processing_header_name_) {
    FlushHeader();
  }

  response_.set_status_code(p_parser->status_code);

  if (p_parser->status_code >= 100 && p_parser->status_code < 200 &&
      p_parser->status_code != 101) {
    // interim response, the final one follows on the same connection
    informational_ = true;
    return kParserOk;
  }

  headers_complete_ = true;

  if (head_request_) {
    return kParserNoBody;
  }

  return kParserOk;
}

HttpResponseBuilder::ParserStatus HttpResponseBuilder::OnBody(
    http_parser* p_parser, const char* at, size_t length) {
  body_.append(at, length);

  return kParserOk;
}

HttpResponseBuilder::ParserStatus HttpResponseBuilder::OnMessageComplete(
    http_parser* p_parser) {
  if (informational_) {
    informational_ = false;
    response_.Reset();
    return kParserOk;
  }

  keep_alive_ = http_should_keep_alive(p_parser) != 0;
  complete_ = true;

  return kParserOk;
}

void HttpResponseBuilder::FlushHeader() {
  response_.AddHeader(current_header_name_, current_header_value_);
  current_header_name_.clear();
  current_header_value_.clear();
  processing_header_name_ = true;
}

HTTP_PARSER_C_CALLBACK_IMPL(OnMessageBegin)
HTTP_PARSER_C_DATA_CALLBACK_IMPL(OnStatus)
HTTP_PARSER_C_DATA_CALLBACK_IMPL(OnHeaderName)
HTTP_PARSER_C_DATA_CALLBACK_IMPL(OnHeaderValue)
HTTP_PARSER_C_CALLBACK_IMPL(OnHeadersComplete)
HTTP_PARSER_C_DATA_CALLBACK_IMPL(OnBody)
HTTP_PARSER_C_CALLBACK_IMPL(OnMessageComplete)

}  // http
}  // httpntlm
