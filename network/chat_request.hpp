#pragma once

#include <models/model_host.hpp>
#include <ollama/json.hpp>

#include <optional>
#include <string>

/// @brief Validated body of the POST /chat.
struct TChatRequest
{
    std::string prompt;
    std::string vendor;
    std::optional<std::string> family;
    /// @brief Passed to the model as-is, empty object if client sent none.
    nlohmann::json options{nlohmann::json::object()};

    /// @brief Builds request from the decoded body.
    /// @param defaultVendor used when body does not name vendor.
    /// @throws CMissingPromptError if prompt is absent, empty or not a string.
    static TChatRequest FromJson(const nlohmann::json &body, const std::string &defaultVendor);

    /// @returns Conversation to send to the model: single user turn with the prompt.
    [[nodiscard]]
    TChatMessages ToMessages() const;

    [[nodiscard]]
    TModelSelector ToSelector() const
    {
        return TModelSelector{vendor, family};
    }
};
