#pragma once

#include "http_common.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace convgate::net::http {

bool                       header_exists(const Headers& headers, std::string_view name);
std::optional<std::string> find_header(const Headers& headers, std::string_view name);
std::vector<std::string>   header_values(const Headers& headers, std::string_view name);
// Replace every occurrence of @p name with a single entry.
void set_header(Headers& headers, std::string name, std::string value);
void remove_header(Headers& headers, std::string_view name);
void remove_content_headers(Headers& headers);

} // namespace convgate::net::http
