#pragma once

#include "model_host.hpp"            // IWYU pragma: keep
#include "ollama_backend_config.hpp" // IWYU pragma: keep

#include <common/cancellation.hpp>
#include <ollama/json.hpp>

#include <memory>
#include <optional>
#include <string>
#include <vector>

/// @brief Model host backed by local Ollama server.
class COllamaModelHost : public IModelHost
{
  public:
    COllamaModelHost() = delete;
    explicit COllamaModelHost(TOllamaBackendConfig config);

    TModelHandles SelectChatModels(const TModelSelector &selector) override;

    /// @returns Family of the model by its Ollama name, i.e. "llama3.2" for "llama3.2:3b".
    [[nodiscard]]
    static std::string FamilyOf(const std::string &modelName);

    /// @brief Filters installed model names by selector's family, keeping original order.
    [[nodiscard]]
    static std::vector<std::string> FilterByFamily(const std::vector<std::string> &modelNames,
                                                   const std::optional<std::string> &family);

    /// @returns Ollama's chat request body for the messages.
    [[nodiscard]]
    static nlohmann::json BuildChatJson(const std::string &model, const TChatMessages &messages,
                                        const nlohmann::json &options);

    /// @returns Text carried by one streamed chat response of Ollama, empty if none.
    [[nodiscard]]
    static std::string ExtractFragment(const nlohmann::json &chatResponse);

    /// @brief Tries to parse boolean value of the "done" field and @returns it.
    /// @returns std::nullopt if "done" field is not present or cannot be parsed.
    [[nodiscard]]
    static std::optional<bool> IsModelDone(const nlohmann::json &chatResponse);

  private:
    const TOllamaBackendConfig config;
};

/// @brief One Ollama model. Each request runs in own producer thread.
class COllamaModelHandle : public IModelHandle
{
  public:
    COllamaModelHandle(std::string modelName, std::string ollamaUrl);

    [[nodiscard]]
    std::string Name() const override;

    std::unique_ptr<IFragmentStream> SendRequest(const TChatMessages &messages,
                                                 const nlohmann::json &options,
                                                 utility::CCancellationToken token) override;

  private:
    const std::string modelName;
    const std::string ollamaUrl;
};
