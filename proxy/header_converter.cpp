#include "header_converter.hpp"

#include "header_mutator.hpp"

#include "../net/http/header_utils.hpp"

#include <set>

namespace convgate::proxy {

namespace {

    std::set<std::string> cookie_names(std::string_view header)
    {
        std::set<std::string> names;
        auto                  jar = CookieJar::from_header(header);
        for (const auto& cookie : jar.cookies())
            names.insert(cookie.name);
        return names;
    }

    void append_cookie(std::string& header, const Cookie& cookie)
    {
        if (!header.empty()) {
            if (header.back() != ';')
                header.push_back(';');
            header.push_back(' ');
        }
        header.append(cookie.name);
        header.push_back('=');
        header.append(cookie.value);
    }

} // namespace

bool HeaderConverter::is_dropped(std::string_view lower_name)
{
    static const std::set<std::string, std::less<>> kDropped = {
        "host",          "connection",          "keep-alive",        "proxy-connection",
        "proxy-authorization", "proxy-authenticate", "te",           "trailer",
        "transfer-encoding",   "upgrade",            "content-length", "x-real-ip",
        "forwarded",     "origin",              "referer",           "cookie",
    };
    if (kDropped.find(lower_name) != kDropped.end())
        return true;
    return lower_name.substr(0, 12) == "x-forwarded-";
}

Status HeaderConverter::convert(const net::http::Headers& in,
                                const CookieJar&          jar,
                                std::string_view          origin,
                                std::string_view          path,
                                net::http::Headers&       out) const
{
    out.clear();
    auto url = net::http::parse_url(std::string(origin));
    if (!url)
        return Status::error(ErrorKind::Internal, "invalid upstream origin: " + std::string(origin));

    HeaderMutator mutator(out);
    for (const auto& h : in) {
        std::string name = net::http::to_lower(h.name);
        if (is_dropped(name))
            continue;
        if (!HeaderMutator::valid_name(name))
            return Status::error(ErrorKind::InvalidHeaderValue, "invalid header name: " + h.name);
        if (!HeaderMutator::valid_value(h.value))
            return Status::error(ErrorKind::InvalidHeaderValue, "invalid value for header " + name);
        out.push_back({ std::move(name), h.value });
    }

    std::string origin_value(origin);
    while (!origin_value.empty() && origin_value.back() == '/')
        origin_value.pop_back();

    Status st = mutator.insert("host", url->authority());
    if (st.ok())
        st = mutator.insert("origin", origin_value);
    if (st.ok())
        st = mutator.insert("referer", origin_value + "/");
    if (st.ok() && !net::http::header_exists(out, "user-agent"))
        st = mutator.insert("user-agent", default_user_agent_);
    if (!st.ok())
        return st;

    // Cookie: the (possibly rewritten) request header first, then jar cookies it does not name.
    std::string cookie_header;
    for (const auto& value : net::http::header_values(in, "cookie")) {
        std::string part = net::http::trim(value);
        if (part.empty())
            continue;
        if (!cookie_header.empty()) {
            if (cookie_header.back() != ';')
                cookie_header.push_back(';');
            cookie_header.push_back(' ');
        }
        cookie_header.append(part);
    }
    auto present = cookie_names(cookie_header);
    for (const auto& cookie : jar.matching(url->host, path)) {
        if (present.insert(cookie.name).second)
            append_cookie(cookie_header, cookie);
    }
    if (!cookie_header.empty()) {
        st = mutator.insert("cookie", cookie_header);
        if (!st.ok())
            return st;
    }
    return Status::ok_status();
}

} // namespace convgate::proxy
