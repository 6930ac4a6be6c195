#include "http_common.hpp"

#include <cctype>
#include <cstdint>
#include <limits>

namespace {

bool parse_port(std::string_view input, uint16_t& port_out)
{
    if (input.empty() || input.size() > 5)
        return false;

    uint32_t value = 0;
    for (unsigned char ch : input) {
        if (!std::isdigit(ch))
            return false;
        value = value * 10 + static_cast<uint32_t>(ch - '0');
        if (value > std::numeric_limits<uint16_t>::max())
            return false;
    }

    port_out = static_cast<uint16_t>(value);
    return true;
}

} // namespace

namespace convgate::net::http {

std::string to_lower(std::string_view input)
{
    std::string out;
    out.reserve(input.size());
    for (char ch : input) {
        out.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(ch))));
    }
    return out;
}

void to_upper_inplace(std::string& input)
{
    for (char& ch : input) {
        ch = static_cast<char>(std::toupper(static_cast<unsigned char>(ch)));
    }
}

std::string trim_leading_spaces(std::string_view input)
{
    size_t pos = 0;
    while (pos < input.size() && (input[pos] == ' ' || input[pos] == '\t')) {
        ++pos;
    }
    return std::string(input.substr(pos));
}

std::string trim(std::string_view input)
{
    size_t begin = 0;
    size_t end   = input.size();
    while (begin < end && (input[begin] == ' ' || input[begin] == '\t'))
        ++begin;
    while (end > begin && (input[end - 1] == ' ' || input[end - 1] == '\t'))
        --end;
    return std::string(input.substr(begin, end - begin));
}

bool istarts_with(std::string_view input, std::string_view prefix)
{
    return input.size() >= prefix.size() && iequals(input.substr(0, prefix.size()), prefix);
}

bool iequals(std::string_view a, std::string_view b)
{
    if (a.size() != b.size())
        return false;
    for (size_t i = 0; i < a.size(); ++i) {
        unsigned char ca = static_cast<unsigned char>(a[i]);
        unsigned char cb = static_cast<unsigned char>(b[i]);
        if (std::tolower(ca) != std::tolower(cb))
            return false;
    }
    return true;
}

bool split_host_port(std::string_view input, uint16_t default_port, std::string& host_out, uint16_t& port_out)
{
    host_out.clear();
    port_out = default_port;

    if (input.empty())
        return false;

    if (input.front() == '[') {
        auto closing = input.find(']');
        if (closing == std::string_view::npos)
            return false;
        host_out.assign(input.substr(1, closing - 1));
        if (closing + 1 == input.size())
            return true;
        if (input[closing + 1] != ':')
            return false;
        std::string_view port_part = input.substr(closing + 2);
        uint16_t         port      = 0;
        if (!parse_port(port_part, port))
            return false;
        port_out = port;
        return true;
    }

    auto first_colon = input.find(':');
    auto last_colon  = input.rfind(':');
    if (first_colon != std::string_view::npos && first_colon == last_colon) {
        std::string_view host_part = input.substr(0, first_colon);
        std::string_view port_part = input.substr(first_colon + 1);
        if (host_part.empty())
            return false;
        uint16_t port = 0;
        if (!parse_port(port_part, port))
            return false;
        host_out.assign(host_part);
        port_out = port;
        return true;
    }

    host_out.assign(input);
    return true;
}

std::optional<UrlParts> parse_url(const std::string& url)
{
    auto scheme_pos = url.find("://");
    if (scheme_pos == std::string::npos)
        return std::nullopt;

    UrlParts result;
    result.scheme = to_lower(url.substr(0, scheme_pos));
    if (result.scheme != "http" && result.scheme != "https")
        return std::nullopt;

    size_t authority_start = scheme_pos + 3;
    if (authority_start >= url.size())
        return std::nullopt;

    auto        slash_pos = url.find('/', authority_start);
    std::string authority = slash_pos == std::string::npos ? url.substr(authority_start)
                                                           : url.substr(authority_start, slash_pos - authority_start);
    result.path           = slash_pos == std::string::npos ? std::string("/") : url.substr(slash_pos);
    if (authority.empty())
        return std::nullopt;

    uint16_t default_port = (result.scheme == "https") ? 443 : 80;
    if (!split_host_port(authority, default_port, result.host, result.port))
        return std::nullopt;
    if (result.host.empty())
        return std::nullopt;

    return result;
}

std::string UrlParts::authority() const
{
    std::string value = host.find(':') != std::string::npos ? "[" + host + "]" : host;
    if (!default_port()) {
        value.push_back(':');
        value.append(std::to_string(port));
    }
    return value;
}

void split_target(std::string_view target, std::string& path_out, std::string& query_out)
{
    auto q = target.find('?');
    if (q == std::string_view::npos) {
        path_out.assign(target);
        query_out.clear();
    } else {
        path_out.assign(target.substr(0, q));
        query_out.assign(target.substr(q + 1));
    }
    if (path_out.empty())
        path_out = "/";
}

} // namespace convgate::net::http
