#pragma once

#include "http1_common.hpp"
#include "http_message.hpp"
#include "parser.hpp"

#include <llhttp.h>

#include <string>
#include <string_view>

namespace convgate::net::http {

/**
 * @brief llhttp based response parser that buffers the whole message into an HttpResponse.
 */
class Http1ResponseParser : public IHttpResponseParser {
public:
    Http1ResponseParser();

    void               reset() override;
    bool               feed(std::string_view data, std::string* error_reason = nullptr) override;
    bool               finish(std::string* error_reason = nullptr) override;
    bool               is_headers_complete() const override { return headers_complete_; }
    bool               is_message_complete() const override { return message_complete_; }
    bool               has_error() const override { return has_error_; }
    const std::string& last_error() const override { return last_error_; }

    const HttpResponse& response() const override { return response_; }
    HttpResponse        take_response() { return std::move(response_); }

    // Responses to HEAD carry no body regardless of Content-Length.
    void set_skip_body(bool skip) { skip_body_ = skip; }

private:
    static int on_status_cb(llhttp_t* parser, const char* at, size_t length);
    static int on_header_field_cb(llhttp_t* parser, const char* at, size_t length);
    static int on_header_value_cb(llhttp_t* parser, const char* at, size_t length);
    static int on_header_value_complete_cb(llhttp_t* parser);
    static int on_headers_complete_cb(llhttp_t* parser);
    static int on_body_cb(llhttp_t* parser, const char* at, size_t length);
    static int on_message_complete_cb(llhttp_t* parser);

    bool record_error(llhttp_errno_t err, std::string* error_reason);

    llhttp_t          parser_ {};
    llhttp_settings_t settings_ {};
    HttpResponse      response_ {};
    HeaderAccumulator header_acc_ {};
    std::string       status_text_;
    bool              headers_complete_ { false };
    bool              message_complete_ { false };
    bool              skip_body_ { false };
    bool              has_error_ { false };
    std::string       last_error_;
};

} // namespace convgate::net::http
