#include "chat_request.hpp" // IWYU pragma: keep

#include "bridge_errors.hpp" // IWYU pragma: keep

#include <models/model_host.hpp>
#include <ollama/json.hpp>

#include <optional>
#include <string>
#include <utility>

namespace {
/// @returns Value of the key if it is non-empty string.
std::optional<std::string> NonEmptyString(const nlohmann::json &body, const char *key)
{
    const auto it = body.find(key);
    if (it == body.end() || !it->is_string())
    {
        return std::nullopt;
    }
    auto value = it->get<std::string>();
    if (value.empty())
    {
        return std::nullopt;
    }
    return value;
}
} // namespace

TChatRequest TChatRequest::FromJson(const nlohmann::json &body, const std::string &defaultVendor)
{
    if (!body.is_object())
    {
        throw CMissingPromptError();
    }

    auto prompt = NonEmptyString(body, "prompt");
    if (!prompt)
    {
        throw CMissingPromptError();
    }

    TChatRequest request;
    request.prompt = std::move(*prompt);
    request.vendor = NonEmptyString(body, "vendor").value_or(defaultVendor);
    request.family = NonEmptyString(body, "family");

    const auto options = body.find("options");
    if (options != body.end() && !options->is_null())
    {
        request.options = *options;
    }
    return request;
}

TChatMessages TChatRequest::ToMessages() const
{
    return {TChatMessage{EChatRole::User, prompt}};
}
