#pragma once

#include "http1_common.hpp"
#include "http_message.hpp"
#include "parser.hpp"

#include <llhttp.h>

#include <cstddef>
#include <string>
#include <string_view>

namespace convgate::net::http {

class Http1RequestParser : public IHttpRequestParser {
public:
    Http1RequestParser();

    void reset() override;
    bool feed(std::string_view data, std::string* error_reason = nullptr) override;
    bool finish(std::string* error_reason = nullptr) override;

    bool               is_headers_complete() const override { return headers_complete_; }
    bool               is_message_complete() const override { return message_complete_; }
    const HttpRequest& request() const override { return request_; }
    HttpRequest        take_request() { return std::move(request_); }
    bool               has_error() const override { return has_error_; }
    const std::string& last_error() const override { return error_reason_; }

    // Bodies larger than this fail the parse with "body too large".
    void   set_max_body_bytes(size_t limit) { max_body_bytes_ = limit; }
    bool   body_too_large() const noexcept { return body_too_large_; }
    bool   headers_too_large() const noexcept { return header_acc_.overflowed(); }

private:
    static int on_message_begin(llhttp_t* parser);
    static int on_method(llhttp_t* parser, const char* at, size_t length);
    static int on_url(llhttp_t* parser, const char* at, size_t length);
    static int on_header_field(llhttp_t* parser, const char* at, size_t length);
    static int on_header_value(llhttp_t* parser, const char* at, size_t length);
    static int on_header_value_complete(llhttp_t* parser);
    static int on_headers_complete(llhttp_t* parser);
    static int on_body(llhttp_t* parser, const char* at, size_t length);
    static int on_message_complete(llhttp_t* parser);

    void clear_state();
    bool record_error(llhttp_errno_t err, std::string* error_reason);

    llhttp_t          parser_ {};
    llhttp_settings_t settings_ {};
    HttpRequest       request_ {};
    HeaderAccumulator header_acc_ {};
    bool              headers_complete_ { false };
    bool              message_complete_ { false };
    bool              has_error_ { false };
    bool              body_too_large_ { false };
    size_t            max_body_bytes_ { 16 * 1024 * 1024 };
    std::string       error_reason_;
};

std::string build_http1_response(const HttpResponse& response, bool close_connection = true);

} // namespace convgate::net::http
