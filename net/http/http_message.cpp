#include "http_message.hpp"

#include "header_utils.hpp"

#include <utility>

namespace convgate::net::http {

HttpMessage::HttpMessage() = default;

void HttpMessage::reset()
{
    http_major_ = 1;
    http_minor_ = 1;
    clear_headers();
    body.clear();
}

void HttpMessage::set_http_version(int major, int minor)
{
    http_major_ = major;
    http_minor_ = minor;
}

void HttpMessage::clear_headers()
{
    headers.clear();
}

void HttpMessage::add_header(std::string name, std::string value)
{
    headers.push_back({ std::move(name), std::move(value) });
}

void HttpMessage::set_header(std::string name, std::string value)
{
    http::set_header(headers, std::move(name), std::move(value));
}

bool HttpMessage::has_header(std::string_view name) const
{
    return header_exists(headers, name);
}

std::optional<std::string> HttpMessage::header(std::string_view name) const
{
    return find_header(headers, name);
}

std::vector<std::string> HttpMessage::header_values(std::string_view name) const
{
    return http::header_values(headers, name);
}

void HttpMessage::remove_header(std::string_view name)
{
    http::remove_header(headers, name);
}

void HttpMessage::set_body(std::string body_value)
{
    body = std::move(body_value);
}

void HttpMessage::append_body(std::string_view chunk)
{
    body.append(chunk.data(), chunk.size());
}

HttpRequest::HttpRequest() = default;

void HttpRequest::reset()
{
    HttpMessage::reset();
    method.clear();
    target.clear();
}

HttpResponse::HttpResponse() = default;

void HttpResponse::reset()
{
    HttpMessage::reset();
    status_code      = 200;
    reason           = "OK";
    close_connection = false;
}

void HttpResponse::set_status(int code, std::string reason_text)
{
    status_code = code;
    if (!reason_text.empty()) {
        reason = std::move(reason_text);
    } else {
        reason = default_reason(code);
    }
}

const char* default_reason(int status_code)
{
    switch (status_code) {
    case 200:
        return "OK";
    case 201:
        return "Created";
    case 204:
        return "No Content";
    case 400:
        return "Bad Request";
    case 401:
        return "Unauthorized";
    case 403:
        return "Forbidden";
    case 404:
        return "Not Found";
    case 405:
        return "Method Not Allowed";
    case 413:
        return "Payload Too Large";
    case 429:
        return "Too Many Requests";
    case 431:
        return "Request Header Fields Too Large";
    case 500:
        return "Internal Server Error";
    case 501:
        return "Not Implemented";
    case 502:
        return "Bad Gateway";
    case 503:
        return "Service Unavailable";
    default:
        return "";
    }
}

} // namespace convgate::net::http
