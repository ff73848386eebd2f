#pragma once

#include "bridge_config.hpp" // IWYU pragma: keep

#include <common/cm_ctors.h>
#include <common/runners.h>
#include <models/model_host.hpp>
#include <ollama/httplib.h>

#include <atomic>
#include <cstdint>
#include <memory>
#include <string>

enum class EBridgeServerStatus : std::uint8_t {
    Stopped,
    Starting,
    Listening,
};

enum class EStartResult : std::uint8_t {
    Started,
    AlreadyRunning,
    Failed,
};

/// @brief The only listening bridge of the process. Explicitly owned by whoever starts/stops the
/// bridge; destruction releases the listening socket.
class CBridgeServerState
{
  public:
    CBridgeServerState() = default;
    ~CBridgeServerState();
    NO_COPYMOVE(CBridgeServerState);

    [[nodiscard]]
    EBridgeServerStatus Status() const
    {
        return status.load();
    }

    [[nodiscard]]
    bool IsListening() const
    {
        return Status() == EBridgeServerStatus::Listening;
    }

    /// @returns Port the listener is bound to, or -1 if there is no listener.
    [[nodiscard]]
    int BoundPort() const
    {
        return IsListening() ? boundPort : -1;
    }

  private:
    friend class CBridgeServer;

    /// @brief Closes listener (if any) and waits for its thread.
    void Release();

    std::atomic<EBridgeServerStatus> status{EBridgeServerStatus::Stopped};
    std::atomic<bool> stopRequested{false};
    std::atomic<bool> isListenerDone{true};
    std::unique_ptr<httplib::Server> server{nullptr};
    utility::runner_t listenThread{nullptr};
    int boundPort{-1};
};

/// @brief HTTP bridge: POST /chat is streamed from the selected model, everything else is 404.
class CBridgeServer
{
  public:
    CBridgeServer() = delete;
    ~CBridgeServer() = default;
    NO_COPYMOVE(CBridgeServer);

    CBridgeServer(TBridgeConfig config, std::shared_ptr<IModelHost> modelHost);

    /// @brief Starts listening unless state is listening already.
    /// @returns AlreadyRunning without side effects if state is listening, Failed if listener
    /// could not be opened (state stays Stopped).
    EStartResult Start(CBridgeServerState &state) const;

    /// @brief Closes listener of the state. Does nothing if it is stopped already.
    void Stop(CBridgeServerState &state) const;

    [[nodiscard]]
    const TBridgeConfig &Config() const
    {
        return config;
    }

    /// @brief Fixed message of the 404 response.
    static constexpr auto kNotFoundMessage = "Not Found. Use POST /chat";

  private:
    /// @brief Installs the necessary HTTP handlers for the bridge.
    void InstallHandlers(httplib::Server &server) const;
    /// @throws CListenerError if port cannot be bound.
    [[nodiscard]]
    int BindListener(httplib::Server &server) const;
    /// @throws CListenerError if listener did not come up.
    void StartListenerThread(CBridgeServerState &state) const;

    const TBridgeConfig config;
    const std::shared_ptr<IModelHost> modelHost;
};
