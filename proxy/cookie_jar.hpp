#pragma once

#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace convgate::proxy {

struct Cookie {
    std::string name;
    std::string value;
    std::string domain; // empty matches any host
    std::string path { "/" };
};

/**
 * @brief Cookies the caller attached to an inbound request. The dispatcher never edits it; the
 * header converter reads it when building the outbound Cookie header.
 */
class CookieJar {
public:
    // Parse a `name=value; name2=value2` request header. Malformed pairs are skipped.
    static CookieJar from_header(std::string_view cookie_header);

    void add(Cookie cookie);
    bool empty() const noexcept { return cookies_.empty(); }

    const std::vector<Cookie>& cookies() const& noexcept { return cookies_; }
    std::vector<Cookie>        cookies() && noexcept { return std::move(cookies_); }
    std::vector<Cookie>        matching(std::string_view host, std::string_view path) const;

    static bool domain_matches(std::string_view cookie_domain, std::string_view host);
    static bool path_matches(std::string_view cookie_path, std::string_view request_path);

private:
    std::vector<Cookie> cookies_;
};

} // namespace convgate::proxy
