#pragma once

#include "status.hpp"

#include <nlohmann/json.hpp>

#include <optional>
#include <string>
#include <string_view>

namespace convgate::proxy {

/**
 * @brief Mutable view of a JSON object request body.
 *
 * Parsed once, edited through set_string(), then written back through commit(). commit() leaves
 * the original bytes untouched unless an edit happened, so an unmodified body is forwarded
 * byte for byte. Key order is preserved.
 */
class JsonBody {
public:
    using json = nlohmann::ordered_json;

    /**
     * @brief Parse @p bytes into @p out.
     * @return InvalidJson for malformed text, BodyMustBeJsonObject for a non-object top level.
     */
    static Status parse(std::string_view bytes, JsonBody& out);

    bool                       contains(std::string_view key) const;
    const json*                find(std::string_view key) const;
    std::optional<std::string> string_field(std::string_view key) const;

    void set_string(std::string_view key, std::string value);

    bool        dirty() const noexcept { return dirty_; }
    const json& document() const noexcept { return doc_; }

    /**
     * @brief Substitute the serialized document into @p body when dirty.
     * @return InvalidJson when the document cannot be serialized (invalid UTF-8).
     */
    Status commit(std::optional<std::string>& body);

private:
    json doc_ = json::object();
    bool dirty_ { false };
};

} // namespace convgate::proxy
