#include "bridge_server.hpp" // IWYU pragma: keep

#include "body_decoder.hpp"    // IWYU pragma: keep
#include "bridge_config.hpp"   // IWYU pragma: keep
#include "bridge_errors.hpp"   // IWYU pragma: keep
#include "chat_request.hpp"    // IWYU pragma: keep
#include "model_selector.hpp"  // IWYU pragma: keep
#include "streaming_relay.hpp" // IWYU pragma: keep

#include <common/runners.h>
#include <models/model_host.hpp>
#include <ollama/httplib.h>
#include <ollama/json.hpp>

#include <chrono> // IWYU pragma: keep
#include <cstddef>
#include <exception>
#include <memory>
#include <ostream>
#include <stdexcept>
#include <string>
#include <thread>
#include <utility>

using namespace std::chrono_literals;

namespace {

constexpr auto kListenerReadyTimeout = 5s;
constexpr auto kListenerReadyStep = 5ms;
constexpr auto kListenerStopStep = 5ms;

void SetJsonResponse(httplib::Response &response, const int status, const nlohmann::json &body)
{
    response.status = status;
    response.set_content(body.dump(), "application/json");
}

void SetJsonError(httplib::Response &response, const int status, const std::string &message)
{
    nlohmann::json js;
    js["error"] = message;
    SetJsonResponse(response, status, js);
}

void DumpRequest(const TBridgeConfig &config, const char *where, const httplib::Request &request)
{
    config.ExecIfFittingVerbosity(EBridgeVerbosity::Debug, [&](auto &ostream) {
        ostream << "[DEBUG] " << where << ": " << request.method << " " << request.path
                << std::endl;
        for (const auto &header : request.headers)
        {
            ostream << "[DEBUG] \tHeader from user " << header.first << ": " << header.second
                    << std::endl;
        }
    });
}

void ReportListenerError(const TBridgeConfig &config, const std::string &message)
{
    config.ExecIfFittingVerbosity(EBridgeVerbosity::Error, [&message](auto &ostream) {
        ostream << "[ERROR] LLM Bridge server error: " << message << std::endl;
    });
}

// Handles POST /chat: body -> request -> model -> streamed response. Once the model is selected
// response is committed as 200 and all further failures go into the body.
void HandlePostChat(const TBridgeConfig &config, IModelHost &modelHost,
                    const httplib::Request &request, httplib::Response &response,
                    const httplib::ContentReader &contentReader)
{
    DumpRequest(config, "HandlePostChat()", request);
    try
    {
        const auto chatRequest =
          TChatRequest::FromJson(DecodeJsonBody(contentReader), config.defaultVendor);
        auto model = CModelSelector(modelHost).Select(chatRequest.ToSelector());

        config.ExecIfFittingVerbosity(EBridgeVerbosity::Info, [&](auto &ostream) {
            ostream << "[INFO] Chat request for vendor '" << chatRequest.vendor << "'"
                    << (chatRequest.family ? " and family '" + *chatRequest.family + "'" : "")
                    << " is served by " << model->Name() << std::endl;
        });

        AttachStreamSession(response, std::make_shared<CStreamSession>(
                                        std::move(model), chatRequest.ToMessages(),
                                        chatRequest.options, config));
    }
    catch (const CMissingPromptError &e)
    {
        SetJsonError(response, 400, e.what());
    }
    catch (const CNoModelAvailableError &e)
    {
        config.ExecIfFittingVerbosity(EBridgeVerbosity::Warning, [&e](auto &ostream) {
            ostream << "[WARNING] " << e.what() << std::endl;
        });
        SetJsonError(response, 503, e.what());
    }
    catch (std::exception &e)
    {
        config.ExecIfFittingVerbosity(EBridgeVerbosity::Error, [&e](auto &ostream) {
            ostream << "[ERROR] Error processing chat request: " << e.what() << std::endl;
        });
        nlohmann::json js;
        js["error"] = "Failed to process chat request.";
        js["details"] = e.what();
        SetJsonResponse(response, 500, js);
    }
}

void HandleNotFound(const TBridgeConfig &config, const httplib::Request &request,
                    httplib::Response &response)
{
    DumpRequest(config, "HandleNotFound()", request);
    SetJsonError(response, 404, CBridgeServer::kNotFoundMessage);
}

// Body of the request which is answered without looking into it must still be consumed, so the
// connection stays usable for the next request.
void SkipBody(const TBridgeConfig &config, const httplib::ContentReader &contentReader)
{
    const bool isRead = contentReader([](const char * /*data*/, std::size_t /*dataLength*/) {
        return true;
    });
    if (!isRead)
    {
        config.ExecIfFittingVerbosity(EBridgeVerbosity::Warning, [](auto &ostream) {
            ostream << "[WARNING] Connection failed while skipping request body." << std::endl;
        });
    }
}

} // namespace

CBridgeServerState::~CBridgeServerState()
{
    Release();
}

void CBridgeServerState::Release()
{
    stopRequested.store(true);
    if (server)
    {
        // stop() is ignored by httplib until listener is running, so repeat it until thread exits.
        while (listenThread && !isListenerDone.load())
        {
            server->stop();
            std::this_thread::sleep_for(kListenerStopStep);
        }
    }
    listenThread.reset();
    server.reset();
    boundPort = -1;
    status.store(EBridgeServerStatus::Stopped);
}

CBridgeServer::CBridgeServer(TBridgeConfig config, std::shared_ptr<IModelHost> modelHost) :
    config{std::move(config)},
    modelHost{std::move(modelHost)}
{
    if (!this->config.Validate())
    {
        throw std::invalid_argument("Invalid configuration for LLM bridge server passed.");
    }
    if (!this->modelHost)
    {
        throw std::invalid_argument("LLM bridge server requires model host.");
    }
}

EStartResult CBridgeServer::Start(CBridgeServerState &state) const
{
    if (state.IsListening())
    {
        config.ExecIfFittingVerbosity(EBridgeVerbosity::Info, [&](auto &ostream) {
            ostream << "[INFO] LLM Bridge server is already running on "
                    << config.CreateBaseUrl(state.BoundPort()) << "." << std::endl;
        });
        return EStartResult::AlreadyRunning;
    }

    // Listener could die on its own before, dropping whatever is left of it.
    state.Release();

    config.ExecIfFittingVerbosity(EBridgeVerbosity::Info, [](auto &ostream) {
        ostream << "[INFO] Starting LLM Bridge HTTP server." << std::endl;
    });
    state.status.store(EBridgeServerStatus::Starting);
    state.stopRequested.store(false);
    state.server = std::make_unique<httplib::Server>();
    InstallHandlers(*state.server);

    try
    {
        state.boundPort = BindListener(*state.server);
        StartListenerThread(state);
    }
    catch (const CListenerError &e)
    {
        ReportListenerError(config, e.what());
        state.Release();
        return EStartResult::Failed;
    }

    config.ExecIfFittingVerbosity(EBridgeVerbosity::Info, [&](auto &ostream) {
        const auto url = config.CreateBaseUrl(state.BoundPort());
        ostream << "[INFO] LLM Bridge server listening on " << url
                << ". You can send POST requests to " << url << config.chatPath << std::endl;
    });
    return EStartResult::Started;
}

void CBridgeServer::Stop(CBridgeServerState &state) const
{
    if (!state.server)
    {
        return;
    }
    state.Release();
    config.ExecIfFittingVerbosity(EBridgeVerbosity::Info, [](auto &ostream) {
        ostream << "[INFO] LLM Bridge server stopped." << std::endl;
    });
}

void CBridgeServer::InstallHandlers(httplib::Server &server) const
{
    const auto handleChat = [config = config, modelHost = modelHost](
                              const httplib::Request &request, httplib::Response &response,
                              const httplib::ContentReader &contentReader) {
        // Route is matched by path only, chat path with query is another route.
        if (!request.params.empty())
        {
            SkipBody(config, contentReader);
            HandleNotFound(config, request, response);
            return;
        }
        HandlePostChat(config, *modelHost, request, response, contentReader);
    };
    const auto handleNotFound = [config = config](const httplib::Request &request,
                                                  httplib::Response &response) {
        HandleNotFound(config, request, response);
    };

    server.Post(config.chatPath, handleChat);

    // Anything else is not supported.
    constexpr auto kAnyPath = R"(/.*)";
    server.Get(kAnyPath, handleNotFound);
    server.Post(kAnyPath, handleNotFound);
    server.Put(kAnyPath, handleNotFound);
    server.Patch(kAnyPath, handleNotFound);
    server.Delete(kAnyPath, handleNotFound);
    server.Options(kAnyPath, handleNotFound);
    server.set_error_handler([config = config](const httplib::Request &request,
                                               httplib::Response &response) {
        // Keep bodies handlers have set already. Anything else which failed before or during
        // routing (unknown route, unsupported or unparsable method) is not found.
        if (response.body.empty())
        {
            HandleNotFound(config, request, response);
        }
    });
}

int CBridgeServer::BindListener(httplib::Server &server) const
{
    if (config.listenPort == 0)
    {
        const int port = server.bind_to_any_port(config.listenHost);
        if (port < 0)
        {
            throw CListenerError("Cannot bind any port on " + config.listenHost + ".");
        }
        return port;
    }
    if (!server.bind_to_port(config.listenHost, config.listenPort))
    {
        throw CListenerError("Cannot bind " + config.CreateBaseUrl(config.listenPort) + ".");
    }
    return config.listenPort;
}

void CBridgeServer::StartListenerThread(CBridgeServerState &state) const
{
    // State joins this thread before it releases server, so raw pointers are valid inside.
    auto *const server = state.server.get();
    auto *const statePtr = &state;
    state.isListenerDone.store(false);
    state.listenThread = utility::startNewRunner(
      [server, statePtr, config = config](const utility::runnerint_t & /*shouldStop*/) {
          const bool isListenOk = server->listen_after_bind();
          if (!statePtr->stopRequested.load())
          {
              ReportListenerError(config, isListenOk ? "Listener stopped unexpectedly."
                                                      : "Listener failed to accept connections.");
              statePtr->status.store(EBridgeServerStatus::Stopped);
          }
          statePtr->isListenerDone.store(true);
      });

    const auto startedAt = std::chrono::steady_clock::now();
    while (!server->is_running())
    {
        if (std::chrono::steady_clock::now() - startedAt > kListenerReadyTimeout
            || state.Status() != EBridgeServerStatus::Starting)
        {
            throw CListenerError("Listener did not start.");
        }
        std::this_thread::sleep_for(kListenerReadyStep);
    }

    auto expected = EBridgeServerStatus::Starting;
    if (!state.status.compare_exchange_strong(expected, EBridgeServerStatus::Listening))
    {
        throw CListenerError("Listener failed right after start.");
    }
}
