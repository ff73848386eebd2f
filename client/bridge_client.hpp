#pragma once

#include <ollama/json.hpp>

#include <cctype>
#include <chrono>
#include <functional>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

/// @brief Where the bridge is and what to ask it for by default.
struct TBridgeClientConfig
{
    std::string host{"localhost"};
    int port{3000};
    std::string chatPath{"/chat"};
    std::string vendor{"copilot"};
    std::optional<std::string> family{std::nullopt};
    std::chrono::seconds requestTimeout{300};

    /// @brief Checks if the configuration is valid.
    [[nodiscard]]
    bool Validate() const
    {
        bool res = !host.empty() && port > 0 && port <= 65535 && chatPath.size() > 1
                   && chatPath.front() == '/' && requestTimeout.count() > 0;
        for (const char ch : host)
        {
            if (!res)
            {
                break;
            }
            if (ch == '-' || ch == '.' || ch == ':' || std::isalnum(static_cast<unsigned char>(ch)))
            {
                continue;
            }
            res = false;
        }
        return res;
    }

    /// @returns URL of the chat endpoint, used in messages.
    [[nodiscard]]
    std::string CreateChatUrl() const
    {
        return "http://" + host + ":" + std::to_string(port) + chatPath;
    }
};

/// @brief Bridge refused the request or could not be reached.
class CBridgeClientError : public std::runtime_error
{
  public:
    CBridgeClientError(const int status, const std::string &message) :
        std::runtime_error(message),
        status(status)
    {
    }

    /// @returns HTTP status of the response, 0 if there was no response.
    [[nodiscard]]
    int Status() const
    {
        return status;
    }

  private:
    int status;
};

/// @brief Calls POST /chat of the bridge and reads the streamed answer.
class CBridgeClient
{
  public:
    /// @brief Receives fragments as they arrive. Returning false stops reading and disconnects.
    using TFragmentCallback = std::function<bool(std::string_view)>;

    CBridgeClient() = delete;
    explicit CBridgeClient(TBridgeClientConfig config);

    /// @brief Sends prompt and passes each received piece of the answer to the callback.
    /// Stopping by the callback is not an error.
    /// @param vendor overrides the configured one if set.
    /// @param family overrides the configured one if set.
    /// @throws CBridgeClientError on non-200 response or connection failure.
    void ChatStream(const std::string &prompt, const TFragmentCallback &onFragment,
                    const nlohmann::json &options = nlohmann::json::object(),
                    const std::optional<std::string> &vendor = std::nullopt,
                    const std::optional<std::string> &family = std::nullopt) const;

    /// @returns Whole answer of the model.
    /// @throws CBridgeClientError on non-200 response or connection failure.
    [[nodiscard]]
    std::string Chat(const std::string &prompt,
                     const nlohmann::json &options = nlohmann::json::object(),
                     const std::optional<std::string> &vendor = std::nullopt,
                     const std::optional<std::string> &family = std::nullopt) const;

    /// @returns Body sent to the bridge.
    [[nodiscard]]
    nlohmann::json BuildRequestBody(const std::string &prompt, const nlohmann::json &options,
                                    const std::optional<std::string> &vendor,
                                    const std::optional<std::string> &family) const;

    [[nodiscard]]
    const TBridgeClientConfig &Config() const
    {
        return config;
    }

  private:
    const TBridgeClientConfig config;
};
