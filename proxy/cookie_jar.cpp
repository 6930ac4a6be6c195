#include "cookie_jar.hpp"

#include "../net/http/http_common.hpp"

namespace convgate::proxy {

CookieJar CookieJar::from_header(std::string_view cookie_header)
{
    CookieJar jar;
    size_t    pos = 0;
    while (pos < cookie_header.size()) {
        size_t end = cookie_header.find(';', pos);
        if (end == std::string_view::npos)
            end = cookie_header.size();
        std::string pair = net::http::trim(cookie_header.substr(pos, end - pos));
        pos              = end + 1;
        auto eq          = pair.find('=');
        if (pair.empty() || eq == std::string::npos || eq == 0)
            continue;
        Cookie cookie;
        cookie.name  = net::http::trim(std::string_view(pair).substr(0, eq));
        cookie.value = net::http::trim(std::string_view(pair).substr(eq + 1));
        jar.add(std::move(cookie));
    }
    return jar;
}

void CookieJar::add(Cookie cookie)
{
    for (auto& existing : cookies_) {
        if (existing.name == cookie.name && existing.domain == cookie.domain && existing.path == cookie.path) {
            existing.value = std::move(cookie.value);
            return;
        }
    }
    cookies_.push_back(std::move(cookie));
}

bool CookieJar::domain_matches(std::string_view cookie_domain, std::string_view host)
{
    if (cookie_domain.empty())
        return true;
    if (cookie_domain.front() == '.')
        cookie_domain.remove_prefix(1);
    if (net::http::iequals(cookie_domain, host))
        return true;
    // suffix match on a label boundary
    if (host.size() > cookie_domain.size()) {
        auto suffix = host.substr(host.size() - cookie_domain.size());
        return host[host.size() - cookie_domain.size() - 1] == '.' && net::http::iequals(suffix, cookie_domain);
    }
    return false;
}

bool CookieJar::path_matches(std::string_view cookie_path, std::string_view request_path)
{
    if (cookie_path.empty() || cookie_path == "/")
        return true;
    if (request_path.substr(0, cookie_path.size()) != cookie_path)
        return false;
    return request_path.size() == cookie_path.size() || cookie_path.back() == '/'
        || request_path[cookie_path.size()] == '/';
}

std::vector<Cookie> CookieJar::matching(std::string_view host, std::string_view path) const
{
    std::vector<Cookie> out;
    for (const auto& cookie : cookies_) {
        if (domain_matches(cookie.domain, host) && path_matches(cookie.path, path))
            out.push_back(cookie);
    }
    return out;
}

} // namespace convgate::proxy
