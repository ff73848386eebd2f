#pragma once

#include <common/cancellation.hpp>
#include <ollama/json.hpp>

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <variant>
#include <vector>

enum class EChatRole : std::uint8_t {
    User,
    Assistant,
};

/// @returns Role name as chat backends expect it.
inline const char *ChatRoleName(const EChatRole role)
{
    return role == EChatRole::Assistant ? "assistant" : "user";
}

struct TChatMessage
{
    EChatRole role{EChatRole::User};
    std::string content;
};

using TChatMessages = std::vector<TChatMessage>;

/// @brief Query used to find models. Family is optional, vendor is not.
struct TModelSelector
{
    std::string vendor;
    std::optional<std::string> family;
};

// Events produced by IFragmentStream::Next().

/// @brief One piece of generated text.
struct TFragment
{
    std::string text;
};

/// @brief Model finished producing text.
struct TStreamCompleted
{
};

/// @brief Model failed while producing text.
struct TStreamFailed
{
    std::string message;
};

/// @brief Nothing arrived within the waiting time, ask again later.
struct TStreamPending
{
};

using TStreamEvent = std::variant<TFragment, TStreamCompleted, TStreamFailed, TStreamPending>;

/// @brief Pull side of the model's output. Single consumer.
class IFragmentStream
{
  public:
    virtual ~IFragmentStream() = default;

    /// @brief Waits up to maxWait for the next event of the stream.
    virtual TStreamEvent Next(std::chrono::milliseconds maxWait) = 0;
};

/// @brief One model selected from a host. Callers treat it as opaque and only invoke it.
class IModelHandle
{
  public:
    virtual ~IModelHandle() = default;

    /// @returns Human readable name of the model, used for logs only.
    [[nodiscard]]
    virtual std::string Name() const = 0;

    /// @brief Starts chat request. Implementation must stop producing fragments once
    /// cancellation is requested on the token.
    /// @param options Request options of the caller, passed through as-is.
    /// @throws std::exception if request cannot be started.
    virtual std::unique_ptr<IFragmentStream> SendRequest(const TChatMessages &messages,
                                                         const nlohmann::json &options,
                                                         utility::CCancellationToken token) = 0;
};

using TModelHandles = std::vector<std::shared_ptr<IModelHandle>>;

/// @brief Environment which knows available models.
class IModelHost
{
  public:
    virtual ~IModelHost() = default;

    /// @returns Models matching the selector, best first. Empty if nothing matches.
    virtual TModelHandles SelectChatModels(const TModelSelector &selector) = 0;
};
