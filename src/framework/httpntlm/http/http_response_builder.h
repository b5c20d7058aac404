#ifndef HTTPNTLM_HTTP_HTTP_RESPONSE_BUILDER_H_
#define HTTPNTLM_HTTP_HTTP_RESPONSE_BUILDER_H_

#include <cstddef>

#include <string>

#include <http_parser.h>

#include "httpntlm/http/http_response.h"

#define HTTP_PARSER_C_CALLBACK_NAME(method) C##method##Cb

#define HTTP_PARSER_C_CALLBACK_DEF(method) \
  static int HTTP_PARSER_C_CALLBACK_NAME(method)(http_parser * p_parser)

#define HTTP_PARSER_C_DATA_CALLBACK_DEF(method)                                \
  static int HTTP_PARSER_C_CALLBACK_NAME(method)(http_parser*, const char* at, \
                                                 size_t length)

namespace httpntlm {
namespace http {

// Incremental HTTP/1.x response parser.
//
// Status line and headers are available once headers_complete() is true.
// Body bytes are buffered as they are parsed and consumed with ReadBody, so
// the payload can be streamed to the caller while the connection is read.
class HttpResponseBuilder {
 public:
  enum ParserStatus : int {
    kParserError = -1,
    kParserOk = 0,
    kParserNoBody = 1
  };

 public:
  HttpResponseBuilder();

  // A response to a HEAD request never carries a payload
  void Reset(bool head_request = false);

  ParserStatus ProcessInput(const char* p_data, std::size_t size);

  // Signals the end of the connection (read until close payloads)
  ParserStatus ProcessEof();

  inline bool started() const { return started_; }
  inline bool headers_complete() const { return headers_complete_; }
  inline bool complete() const { return complete_; }
  inline bool keep_alive() const { return keep_alive_; }

  // Status line and headers of the current response
  HttpResponse Get() const;

  inline bool HasBodyData() const { return body_offset_ < body_.size(); }

  std::size_t ReadBody(char* p_data, std::size_t size);

 private:
  ParserStatus OnMessageBegin(http_parser* p_parser);
  ParserStatus OnStatus(http_parser*, const char* at, size_t length);
  ParserStatus OnHeaderName(http_parser*, const char* at, size_t length);
  ParserStatus OnHeaderValue(http_parser*, const char* at, size_t length);
  ParserStatus OnHeadersComplete(http_parser* p_parser);
  ParserStatus OnBody(http_parser*, const char* at, size_t length);
  ParserStatus OnMessageComplete(http_parser* p_parser);

  void FlushHeader();

  // C parser callbacks
  HTTP_PARSER_C_CALLBACK_DEF(OnMessageBegin);
  HTTP_PARSER_C_DATA_CALLBACK_DEF(OnStatus);
  HTTP_PARSER_C_DATA_CALLBACK_DEF(OnHeaderName);
  HTTP_PARSER_C_DATA_CALLBACK_DEF(OnHeaderValue);
  HTTP_PARSER_C_CALLBACK_DEF(OnHeadersComplete);
  HTTP_PARSER_C_DATA_CALLBACK_DEF(OnBody);
  HTTP_PARSER_C_CALLBACK_DEF(OnMessageComplete);

 private:
  http_parser parser_;
  http_parser_settings parser_settings_;

  HttpResponse response_;

  bool head_request_;
  bool started_;
  bool informational_;
  bool headers_complete_;
  bool complete_;
  bool keep_alive_;
  bool processing_header_name_;
  std::string current_header_name_;
  std::string current_header_value_;
  std::string body_;
  std::size_t body_offset_;
};

}  // http
}  // httpntlm

#endif  // HTTPNTLM_HTTP_HTTP_RESPONSE_BUILDER_H_
