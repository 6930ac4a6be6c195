#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace convgate::net::http {

struct HeaderEntry {
    std::string name;
    std::string value;
};

// Ordered header list; names compare case-insensitively and may repeat (Set-Cookie).
using Headers = std::vector<HeaderEntry>;

std::string to_lower(std::string_view input);
void        to_upper_inplace(std::string& input);
std::string trim_leading_spaces(std::string_view input);
std::string trim(std::string_view input);
bool        iequals(std::string_view a, std::string_view b);
bool        istarts_with(std::string_view input, std::string_view prefix);

struct UrlParts {
    std::string scheme;
    std::string host;
    uint16_t    port { 0 };
    std::string path; // path plus query, "/" when absent

    bool        is_https() const { return scheme == "https"; }
    bool        default_port() const { return (is_https() && port == 443) || (!is_https() && port == 80); }
    std::string authority() const; // host[:port], port omitted when default
};

bool split_host_port(std::string_view input, uint16_t default_port, std::string& host_out, uint16_t& port_out);
std::optional<UrlParts> parse_url(const std::string& url);

// Split "/a/b?x=1" into path and query (without '?').
void split_target(std::string_view target, std::string& path_out, std::string& query_out);

} // namespace convgate::net::http
