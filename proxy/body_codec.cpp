#include "body_codec.hpp"

namespace convgate::proxy {

Status JsonBody::parse(std::string_view bytes, JsonBody& out)
{
    try {
        out.doc_   = json::parse(bytes.begin(), bytes.end());
        out.dirty_ = false;
    } catch (const json::exception& ex) {
        return Status::error(ErrorKind::InvalidJson, ex.what());
    }
    if (!out.doc_.is_object())
        return Status::error(ErrorKind::BodyMustBeJsonObject, "body must be a JSON object");
    return Status::ok_status();
}

bool JsonBody::contains(std::string_view key) const
{
    return find(key) != nullptr;
}

const JsonBody::json* JsonBody::find(std::string_view key) const
{
    auto it = doc_.find(std::string(key));
    if (it == doc_.end())
        return nullptr;
    return &*it;
}

std::optional<std::string> JsonBody::string_field(std::string_view key) const
{
    const json* value = find(key);
    if (!value || !value->is_string())
        return std::nullopt;
    return value->get<std::string>();
}

void JsonBody::set_string(std::string_view key, std::string value)
{
    doc_[std::string(key)] = std::move(value);
    dirty_                 = true;
}

Status JsonBody::commit(std::optional<std::string>& body)
{
    if (!dirty_)
        return Status::ok_status();
    std::string serialized;
    try {
        serialized = doc_.dump();
    } catch (const json::exception& ex) {
        return Status::error(ErrorKind::InvalidJson, ex.what());
    }
    body   = std::move(serialized);
    dirty_ = false;
    return Status::ok_status();
}

} // namespace convgate::proxy
