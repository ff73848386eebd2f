#include "bridge_client.hpp" // IWYU pragma: keep

#include <ollama/httplib.h>
#include <ollama/json.hpp>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

namespace {

// Server answers errors as {"error": "..."}, anything else is passed as-is.
std::string ExtractErrorText(const std::string &body)
{
    const auto js = nlohmann::json::parse(body, nullptr, false);
    if (!js.is_discarded() && js.is_object() && js.contains("error") && js["error"].is_string())
    {
        return js["error"].get<std::string>();
    }
    return body;
}

} // namespace

CBridgeClient::CBridgeClient(TBridgeClientConfig config) :
    config(std::move(config))
{
    if (!this->config.Validate())
    {
        throw std::invalid_argument("Invalid configuration for LLM bridge client passed.");
    }
}

nlohmann::json CBridgeClient::BuildRequestBody(const std::string &prompt,
                                               const nlohmann::json &options,
                                               const std::optional<std::string> &vendor,
                                               const std::optional<std::string> &family) const
{
    nlohmann::json body;
    body["prompt"] = prompt;

    const auto usedVendor = vendor ? vendor : std::optional<std::string>{config.vendor};
    if (usedVendor && !usedVendor->empty())
    {
        body["vendor"] = *usedVendor;
    }
    const auto usedFamily = family ? family : config.family;
    if (usedFamily && !usedFamily->empty())
    {
        body["family"] = *usedFamily;
    }
    if (options.is_object() && !options.empty())
    {
        body["options"] = options;
    }
    return body;
}

void CBridgeClient::ChatStream(const std::string &prompt, const TFragmentCallback &onFragment,
                               const nlohmann::json &options,
                               const std::optional<std::string> &vendor,
                               const std::optional<std::string> &family) const
{
    httplib::Client cli(config.host, config.port);
    cli.set_read_timeout(config.requestTimeout.count(), 0);
    cli.set_write_timeout(config.requestTimeout.count(), 0);

    httplib::Request request;
    request.method = "POST";
    request.path = config.chatPath;
    request.set_header("Content-Type", "application/json");
    request.body = BuildRequestBody(prompt, options, vendor, family).dump();

    int status = 0;
    bool isStoppedByCaller = false;
    std::string errorBody;
    request.response_handler = [&status](const httplib::Response &response) {
        status = response.status;
        return true;
    };
    request.content_receiver = [&](const char *data, std::size_t size, std::uint64_t /*offset*/,
                                   std::uint64_t /*total*/) {
        if (status != 200)
        {
            errorBody.append(data, size);
            return true;
        }
        if (size == 0 || onFragment(std::string_view(data, size)))
        {
            return true;
        }
        isStoppedByCaller = true;
        return false;
    };

    httplib::Response response;
    httplib::Error error{httplib::Error::Unknown};
    const bool isSent = cli.send(request, response, error);

    if (isStoppedByCaller)
    {
        return;
    }
    if (errorBody.empty())
    {
        errorBody = response.body;
    }
    if (!isSent || error != httplib::Error::Success)
    {
        if (status != 0 && status != 200)
        {
            throw CBridgeClientError(status, "API request failed with status "
                                               + std::to_string(status) + ": "
                                               + ExtractErrorText(errorBody));
        }
        throw CBridgeClientError(0, "Failed to connect to LLM Bridge server at "
                                      + config.CreateChatUrl() + ": " + httplib::to_string(error));
    }
    if (status != 200)
    {
        throw CBridgeClientError(status, "API request failed with status " + std::to_string(status)
                                           + ": " + ExtractErrorText(errorBody));
    }
}

std::string CBridgeClient::Chat(const std::string &prompt, const nlohmann::json &options,
                                const std::optional<std::string> &vendor,
                                const std::optional<std::string> &family) const
{
    std::string answer;
    ChatStream(
      prompt,
      [&answer](std::string_view fragment) {
          answer.append(fragment);
          return true;
      },
      options, vendor, family);
    return answer;
}
