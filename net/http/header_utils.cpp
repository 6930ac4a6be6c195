#include "header_utils.hpp"

#include <algorithm>

namespace convgate::net::http {

bool header_exists(const Headers& headers, std::string_view name)
{
    for (const auto& h : headers) {
        if (iequals(h.name, name))
            return true;
    }
    return false;
}

std::optional<std::string> find_header(const Headers& headers, std::string_view name)
{
    for (const auto& h : headers) {
        if (iequals(h.name, name))
            return h.value;
    }
    return std::nullopt;
}

std::vector<std::string> header_values(const Headers& headers, std::string_view name)
{
    std::vector<std::string> out;
    for (const auto& h : headers) {
        if (iequals(h.name, name))
            out.push_back(h.value);
    }
    return out;
}

void set_header(Headers& headers, std::string name, std::string value)
{
    for (auto it = headers.begin(); it != headers.end(); ++it) {
        if (iequals(it->name, name)) {
            it->value = std::move(value);
            headers.erase(std::remove_if(std::next(it),
                                         headers.end(),
                                         [&](const HeaderEntry& h) { return iequals(h.name, it->name); }),
                          headers.end());
            return;
        }
    }
    headers.push_back({ std::move(name), std::move(value) });
}

void remove_header(Headers& headers, std::string_view name)
{
    headers.erase(std::remove_if(headers.begin(),
                                 headers.end(),
                                 [&](const HeaderEntry& h) { return iequals(h.name, name); }),
                  headers.end());
}

void remove_content_headers(Headers& headers)
{
    headers.erase(std::remove_if(headers.begin(),
                                 headers.end(),
                                 [](const HeaderEntry& h) {
                                     return iequals(h.name, "content-type") || iequals(h.name, "content-length")
                                         || iequals(h.name, "transfer-encoding");
                                 }),
                  headers.end());
}

} // namespace convgate::net::http
