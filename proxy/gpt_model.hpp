#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace convgate::proxy {

enum class ModelFamily {
    Gpt35,
    Gpt4,
    Gpt4Mobile,
};

/**
 * @brief Model identifier from a conversation body, classified into the family that decides
 * whether a challenge token is needed.
 */
class ChatModel {
public:
    // nullopt when the identifier is not a known family.
    static std::optional<ChatModel> parse(std::string_view name);

    ModelFamily        family() const noexcept { return family_; }
    const std::string& name() const noexcept { return name_; }
    bool               is_gpt3() const noexcept { return family_ == ModelFamily::Gpt35; }
    bool               is_gpt4() const noexcept { return family_ == ModelFamily::Gpt4 || family_ == ModelFamily::Gpt4Mobile; }

private:
    ChatModel(ModelFamily family, std::string name) : family_(family), name_(std::move(name)) { }

    ModelFamily family_;
    std::string name_;
};

} // namespace convgate::proxy
