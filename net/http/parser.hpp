#pragma once

#include "http_message.hpp"

#include <string>
#include <string_view>

namespace convgate::net::http {

enum class MessageRole {
    Request,
    Response,
};

/**
 * @brief Incremental HTTP/1 parser: feed bytes as they arrive, call finish() at EOF.
 */
class IHttpParser {
public:
    virtual ~IHttpParser() = default;

    virtual MessageRole role() const = 0;

    virtual void reset()                                                   = 0;
    virtual bool feed(std::string_view data, std::string* error = nullptr) = 0;
    virtual bool finish(std::string* error = nullptr)                      = 0;

    virtual bool is_headers_complete() const = 0;
    virtual bool is_message_complete() const = 0;

    virtual bool               has_error() const  = 0;
    virtual const std::string& last_error() const = 0;
};

class IHttpRequestParser : public IHttpParser {
public:
    MessageRole                role() const final { return MessageRole::Request; }
    virtual const HttpRequest& request() const = 0;
};

class IHttpResponseParser : public IHttpParser {
public:
    MessageRole                 role() const final { return MessageRole::Response; }
    virtual const HttpResponse& response() const = 0;
};

} // namespace convgate::net::http
