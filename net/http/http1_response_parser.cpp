#include "http1_response_parser.hpp"

#include "http_common.hpp"

namespace convgate::net::http {

Http1ResponseParser::Http1ResponseParser()
{
    llhttp_settings_init(&settings_);
    settings_.on_status                = &Http1ResponseParser::on_status_cb;
    settings_.on_header_field          = &Http1ResponseParser::on_header_field_cb;
    settings_.on_header_value          = &Http1ResponseParser::on_header_value_cb;
    settings_.on_header_value_complete = &Http1ResponseParser::on_header_value_complete_cb;
    settings_.on_headers_complete      = &Http1ResponseParser::on_headers_complete_cb;
    settings_.on_body                  = &Http1ResponseParser::on_body_cb;
    settings_.on_message_complete      = &Http1ResponseParser::on_message_complete_cb;
    llhttp_init(&parser_, HTTP_RESPONSE, &settings_);
    parser_.data = this;
    response_.status_code = 0;
    response_.reason.clear();
}

void Http1ResponseParser::reset()
{
    llhttp_reset(&parser_);
    header_acc_.clear();
    status_text_.clear();
    headers_complete_ = false;
    message_complete_ = false;
    has_error_        = false;
    last_error_.clear();
    response_.reset();
    response_.status_code = 0;
    response_.reason.clear();
}

bool Http1ResponseParser::record_error(llhttp_errno_t err, std::string* error_reason)
{
    const char* reason = llhttp_get_error_reason(&parser_);
    if (header_acc_.overflowed())
        last_error_ = "headers too large";
    else if (reason && *reason)
        last_error_ = reason;
    else
        last_error_ = llhttp_errno_name(err);
    if (error_reason)
        *error_reason = last_error_;
    has_error_ = true;
    return false;
}

bool Http1ResponseParser::feed(std::string_view data, std::string* error_reason)
{
    if (has_error_)
        return false;
    auto err = llhttp_execute(&parser_, data.data(), data.size());
    if (err == HPE_OK)
        return true;
    return record_error(err, error_reason);
}

bool Http1ResponseParser::finish(std::string* error_reason)
{
    if (has_error_)
        return false;
    auto err = llhttp_finish(&parser_);
    if (err == HPE_OK || err == HPE_PAUSED_UPGRADE)
        return true;
    return record_error(err, error_reason);
}

int Http1ResponseParser::on_status_cb(llhttp_t* parser, const char* at, size_t length)
{
    auto* ctx = static_cast<Http1ResponseParser*>(parser->data);
    ctx->status_text_.append(at, length);
    return 0;
}

int Http1ResponseParser::on_header_field_cb(llhttp_t* parser, const char* at, size_t length)
{
    auto* ctx = static_cast<Http1ResponseParser*>(parser->data);
    return ctx->header_acc_.add_field(at, length) ? 0 : -1;
}

int Http1ResponseParser::on_header_value_cb(llhttp_t* parser, const char* at, size_t length)
{
    auto* ctx = static_cast<Http1ResponseParser*>(parser->data);
    return ctx->header_acc_.add_value(at, length) ? 0 : -1;
}

int Http1ResponseParser::on_header_value_complete_cb(llhttp_t* parser)
{
    auto* ctx = static_cast<Http1ResponseParser*>(parser->data);
    ctx->header_acc_.commit(ctx->response_.headers);
    return 0;
}

int Http1ResponseParser::on_headers_complete_cb(llhttp_t* parser)
{
    auto* ctx              = static_cast<Http1ResponseParser*>(parser->data);
    ctx->headers_complete_ = true;
    ctx->response_.set_http_version(parser->http_major, parser->http_minor);
    ctx->response_.set_status(parser->status_code, ctx->status_text_);
    // 1: no body follows
    return ctx->skip_body_ ? 1 : 0;
}

int Http1ResponseParser::on_body_cb(llhttp_t* parser, const char* at, size_t length)
{
    auto* ctx = static_cast<Http1ResponseParser*>(parser->data);
    ctx->response_.append_body(std::string_view(at, length));
    return 0;
}

int Http1ResponseParser::on_message_complete_cb(llhttp_t* parser)
{
    auto* ctx                       = static_cast<Http1ResponseParser*>(parser->data);
    ctx->message_complete_          = true;
    ctx->response_.close_connection = (llhttp_should_keep_alive(parser) == 0);
    return 0;
}

} // namespace convgate::net::http
