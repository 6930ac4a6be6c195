#include "gpt_model.hpp"

namespace convgate::proxy {

namespace {
    bool starts_with(std::string_view s, std::string_view prefix)
    {
        return s.size() >= prefix.size() && s.compare(0, prefix.size(), prefix) == 0;
    }
} // namespace

std::optional<ChatModel> ChatModel::parse(std::string_view name)
{
    if (starts_with(name, "gpt-3") || starts_with(name, "text-davinci") || name == "auto")
        return ChatModel(ModelFamily::Gpt35, std::string(name));
    if (starts_with(name, "gpt-4")) {
        if (name.find("mobile") != std::string_view::npos)
            return ChatModel(ModelFamily::Gpt4Mobile, std::string(name));
        return ChatModel(ModelFamily::Gpt4, std::string(name));
    }
    return std::nullopt;
}

} // namespace convgate::proxy
