#include "header_mutator.hpp"

#include "../net/http/header_utils.hpp"

#include <cctype>
#include <string>

namespace convgate::proxy {

bool HeaderMutator::valid_value(std::string_view value)
{
    for (unsigned char ch : value) {
        if ((ch < 0x20 && ch != '\t') || ch == 0x7f)
            return false;
    }
    return true;
}

bool HeaderMutator::valid_name(std::string_view name)
{
    if (name.empty())
        return false;
    static constexpr std::string_view kTokenSpecials = "!#$%&'*+-.^_`|~";
    for (unsigned char ch : name) {
        if (std::isalnum(ch))
            continue;
        if (kTokenSpecials.find(static_cast<char>(ch)) == std::string_view::npos)
            return false;
    }
    return true;
}

Status HeaderMutator::insert(std::string_view name, std::string_view value)
{
    if (!valid_name(name))
        return Status::error(ErrorKind::InvalidHeaderValue, "invalid header name: " + std::string(name));
    if (!valid_value(value))
        return Status::error(ErrorKind::InvalidHeaderValue, "invalid value for header " + std::string(name));
    net::http::set_header(headers_, net::http::to_lower(name), std::string(value));
    return Status::ok_status();
}

} // namespace convgate::proxy
