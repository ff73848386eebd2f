#include "ollama_model_host.hpp" // IWYU pragma: keep

#include "fragment_channel.hpp" // IWYU pragma: keep

#include <common/cancellation.hpp>
#include <common/runners.h>
#include <ollama/json.hpp>
#include <ollama/ollama.hpp>

#include <algorithm>
#include <exception>
#include <iterator>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

namespace {

// Protection against library changes which can break our hack.
// Checks if library object defines operator=, if so we cannot use static_cast<> below.
template <typename T>
struct has_own_assignment_from_json
{
  private:
    template <typename U>
    static auto test(U *)
      -> decltype(std::declval<U &>().U::operator=(std::declval<const nlohmann::json &>()),
                  std::true_type());

    template <typename>
    static auto test(...) -> std::false_type;

  public:
    static constexpr bool value = decltype(test<T>(nullptr))::value;
};

/// @returns A new ollama::request chat object holding the given JSON body.
ollama::request CreateChatRequest(const nlohmann::json &chatJson)
{
    using namespace ollama;
    request req(message_type::chat);

    static_assert(std::is_base_of_v<nlohmann::json, ollama::request>,
                  "ollama::request must be derived from nlohmann::json");
    static_assert(
      !has_own_assignment_from_json<ollama::request>::value,
      "ollama::request defines its own operator=(const nlohmann::json&) which may override "
      "json base operator=. Code below is invalid.");

    // It is safe hack until 2 assertions above are valid.
    static_cast<nlohmann::json &>(req) = chatJson;

    return req;
}

} // namespace

COllamaModelHost::COllamaModelHost(TOllamaBackendConfig config) :
    config{std::move(config)}
{
    if (!this->config.Validate())
    {
        throw std::invalid_argument("Invalid configuration for Ollama model host passed.");
    }
}

TModelHandles COllamaModelHost::SelectChatModels(const TModelSelector &selector)
{
    if (selector.vendor != config.vendor)
    {
        return {};
    }

    Ollama ollamaServer(config.CreateOllamaUrl());
    const auto names = FilterByFamily(ollamaServer.list_models(), selector.family);

    TModelHandles handles;
    handles.reserve(names.size());
    std::transform(names.begin(), names.end(), std::back_inserter(handles),
                   [this](const std::string &name) {
                       return std::make_shared<COllamaModelHandle>(name,
                                                                   config.CreateOllamaUrl());
                   });
    return handles;
}

std::string COllamaModelHost::FamilyOf(const std::string &modelName)
{
    return modelName.substr(0, modelName.find(':'));
}

std::vector<std::string>
COllamaModelHost::FilterByFamily(const std::vector<std::string> &modelNames,
                                 const std::optional<std::string> &family)
{
    if (!family)
    {
        return modelNames;
    }
    std::vector<std::string> result;
    std::copy_if(modelNames.begin(), modelNames.end(), std::back_inserter(result),
                 [&family](const std::string &name) {
                     return name == *family || FamilyOf(name) == *family;
                 });
    return result;
}

nlohmann::json COllamaModelHost::BuildChatJson(const std::string &model,
                                               const TChatMessages &messages,
                                               const nlohmann::json &options)
{
    nlohmann::json js;
    js["model"] = model;
    js["stream"] = true;
    js["messages"] = nlohmann::json::array();
    for (const auto &message : messages)
    {
        nlohmann::json msg;
        msg["role"] = ChatRoleName(message.role);
        msg["content"] = message.content;
        js["messages"].push_back(std::move(msg));
    }
    if (!options.is_null() && !options.empty())
    {
        js["options"] = options;
    }
    return js;
}

std::string COllamaModelHost::ExtractFragment(const nlohmann::json &chatResponse)
{
    // Example of ollama answer:
    //{"created_at":"2025-04-26T12:13:59.246926495Z","done":false,
    //"message":{"content":"0","role":"assistant"},"model":"qwen2.5-coder:7b"}
    const auto message = chatResponse.find("message");
    if (message == chatResponse.end() || !message->is_object())
    {
        return {};
    }
    const auto content = message->find("content");
    if (content == message->end() || !content->is_string())
    {
        return {};
    }
    return content->get<std::string>();
}

std::optional<bool> COllamaModelHost::IsModelDone(const nlohmann::json &chatResponse)
{
    constexpr auto kDoneKey = "done";
    if (chatResponse.contains(kDoneKey) && chatResponse[kDoneKey].is_boolean())
    {
        return chatResponse[kDoneKey].get<bool>();
    }
    return std::nullopt;
}

COllamaModelHandle::COllamaModelHandle(std::string modelName, std::string ollamaUrl) :
    modelName(std::move(modelName)),
    ollamaUrl(std::move(ollamaUrl))
{
}

std::string COllamaModelHandle::Name() const
{
    return modelName;
}

std::unique_ptr<IFragmentStream> COllamaModelHandle::SendRequest(const TChatMessages &messages,
                                                                 const nlohmann::json &options,
                                                                 utility::CCancellationToken token)
{
    auto channel = std::make_shared<CFragmentChannel>();
    auto producerBody = [channel, url = ollamaUrl, token = std::move(token),
                         chatJson = COllamaModelHost::BuildChatJson(modelName, messages, options)](
                          const utility::runnerint_t &shouldStop) {
        const auto isStopped = [&]() {
            return utility::isInterrupted(shouldStop) || token.IsCancellationRequested();
        };
        try
        {
            Ollama ollamaServer(url);
            auto request = CreateChatRequest(chatJson);
            ollamaServer.chat(request, [&](const ollama::response &ollamaResponse) -> bool {
                // Returning false stops reading of Ollama.
                if (isStopped())
                {
                    return false;
                }
                const auto &js = ollamaResponse.as_json();
                if (js.contains("error"))
                {
                    channel->Fail(js["error"].is_string() ? js["error"].get<std::string>()
                                                          : js["error"].dump());
                    return false;
                }
                channel->Push(COllamaModelHost::ExtractFragment(js));
                if (COllamaModelHost::IsModelDone(js).value_or(false))
                {
                    channel->Complete();
                }
                return !isStopped();
            });
            channel->Complete();
        }
        catch (std::exception &e)
        {
            // Interrupted reading is reported by the library as an error too.
            if (isStopped())
            {
                channel->Complete();
            }
            else
            {
                channel->Fail(e.what());
            }
        }
    };

    return std::make_unique<CProducedFragmentStream>(
      channel, utility::startNewRunner(std::move(producerBody)));
}
