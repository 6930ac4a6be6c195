#include "http1_request_parser.hpp"

#include "header_utils.hpp"
#include "http_common.hpp"

namespace convgate::net::http {

Http1RequestParser::Http1RequestParser()
{
    llhttp_settings_init(&settings_);
    settings_.on_message_begin         = &Http1RequestParser::on_message_begin;
    settings_.on_method                = &Http1RequestParser::on_method;
    settings_.on_url                   = &Http1RequestParser::on_url;
    settings_.on_header_field          = &Http1RequestParser::on_header_field;
    settings_.on_header_value          = &Http1RequestParser::on_header_value;
    settings_.on_header_value_complete = &Http1RequestParser::on_header_value_complete;
    settings_.on_headers_complete      = &Http1RequestParser::on_headers_complete;
    settings_.on_body                  = &Http1RequestParser::on_body;
    settings_.on_message_complete      = &Http1RequestParser::on_message_complete;
    llhttp_init(&parser_, HTTP_REQUEST, &settings_);
    parser_.data = this;
    clear_state();
}

void Http1RequestParser::reset()
{
    llhttp_reset(&parser_);
    clear_state();
    has_error_      = false;
    body_too_large_ = false;
    error_reason_.clear();
}

void Http1RequestParser::clear_state()
{
    request_.reset();
    header_acc_.clear();
    headers_complete_ = false;
    message_complete_ = false;
}

bool Http1RequestParser::record_error(llhttp_errno_t err, std::string* error_reason)
{
    has_error_ = true;
    if (body_too_large_) {
        error_reason_ = "body too large";
    } else if (header_acc_.overflowed()) {
        error_reason_ = "headers too large";
    } else {
        const char* reason = llhttp_get_error_reason(&parser_);
        error_reason_      = (reason && *reason) ? reason : llhttp_errno_name(err);
    }
    if (error_reason)
        *error_reason = error_reason_;
    return false;
}

bool Http1RequestParser::feed(std::string_view data, std::string* error_reason)
{
    if (has_error_)
        return false;
    auto err = llhttp_execute(&parser_, data.data(), data.size());
    if (err == HPE_PAUSED && message_complete_)
        return true;
    if (err != HPE_OK)
        return record_error(err, error_reason);
    return true;
}

bool Http1RequestParser::finish(std::string* error_reason)
{
    if (has_error_)
        return false;
    auto err = llhttp_finish(&parser_);
    if (err != HPE_OK)
        return record_error(err, error_reason);
    return true;
}

int Http1RequestParser::on_message_begin(llhttp_t* parser)
{
    auto* self = static_cast<Http1RequestParser*>(parser->data);
    self->clear_state();
    return 0;
}

int Http1RequestParser::on_method(llhttp_t* parser, const char* at, size_t length)
{
    auto* self = static_cast<Http1RequestParser*>(parser->data);
    self->request_.method.append(at, length);
    return 0;
}

int Http1RequestParser::on_url(llhttp_t* parser, const char* at, size_t length)
{
    auto* self = static_cast<Http1RequestParser*>(parser->data);
    self->request_.target.append(at, length);
    return 0;
}

int Http1RequestParser::on_header_field(llhttp_t* parser, const char* at, size_t length)
{
    auto* self = static_cast<Http1RequestParser*>(parser->data);
    return self->header_acc_.add_field(at, length) ? 0 : -1;
}

int Http1RequestParser::on_header_value(llhttp_t* parser, const char* at, size_t length)
{
    auto* self = static_cast<Http1RequestParser*>(parser->data);
    return self->header_acc_.add_value(at, length) ? 0 : -1;
}

int Http1RequestParser::on_header_value_complete(llhttp_t* parser)
{
    auto* self = static_cast<Http1RequestParser*>(parser->data);
    self->header_acc_.commit(self->request_.headers);
    return 0;
}

int Http1RequestParser::on_headers_complete(llhttp_t* parser)
{
    auto* self              = static_cast<Http1RequestParser*>(parser->data);
    self->headers_complete_ = true;
    self->request_.set_http_version(parser->http_major, parser->http_minor);
    return 0;
}

int Http1RequestParser::on_body(llhttp_t* parser, const char* at, size_t length)
{
    auto* self = static_cast<Http1RequestParser*>(parser->data);
    if (self->request_.body.size() + length > self->max_body_bytes_) {
        self->body_too_large_ = true;
        return -1;
    }
    self->request_.body.append(at, length);
    return 0;
}

int Http1RequestParser::on_message_complete(llhttp_t* parser)
{
    auto* self              = static_cast<Http1RequestParser*>(parser->data);
    self->message_complete_ = true;
    // one request per connection: stop before any pipelined bytes
    return HPE_PAUSED;
}

std::string build_http1_response(const HttpResponse& response, bool close_connection)
{
    std::string out;
    out.reserve(128 + response.body.size() + response.headers.size() * 32);
    out.append("HTTP/1.1 ");
    out.append(std::to_string(response.status_code));
    out.push_back(' ');
    if (!response.reason.empty())
        out.append(response.reason);
    else
        out.append(default_reason(response.status_code));
    out.append("\r\n");

    bool has_content_type = false;

    for (const auto& h : response.headers) {
        // framing is recomputed for the buffered body
        if (iequals(h.name, "content-length") || iequals(h.name, "transfer-encoding") || iequals(h.name, "connection"))
            continue;
        if (iequals(h.name, "content-type"))
            has_content_type = true;
        out.append(h.name);
        out.append(": ");
        out.append(h.value);
        out.append("\r\n");
    }

    if (!has_content_type && !response.body.empty())
        out.append("Content-Type: text/plain; charset=utf-8\r\n");

    out.append("Content-Length: ");
    out.append(std::to_string(response.body.size()));
    out.append("\r\n");

    if (close_connection)
        out.append("Connection: close\r\n");

    out.append("\r\n");
    out.append(response.body);
    return out;
}

} // namespace convgate::net::http
