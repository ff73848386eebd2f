#pragma once

#include "bridge_config.hpp" // IWYU pragma: keep
#include "bridge_server.hpp" // IWYU pragma: keep

#include <common/cm_ctors.h>
#include <models/model_host.hpp>

#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

/// @brief What owning process gives to the bridge on activation: place to register commands and
/// things to dispose when the process deactivates it.
class CLifecycleContext
{
  public:
    using TAction = std::function<void()>;

    CLifecycleContext() = default;
    ~CLifecycleContext();
    NO_COPYMOVE(CLifecycleContext);

    /// @brief Registers (or replaces) command which can be triggered by name later.
    void RegisterCommand(const std::string &name, TAction action);

    /// @returns false if there is no such command.
    bool ExecuteCommand(const std::string &name) const;

    /// @brief Adds action to run on DisposeAll().
    void PushDisposable(TAction dispose);

    /// @brief Runs disposables in reverse order of registration, once.
    void DisposeAll();

  private:
    std::map<std::string, TAction> commands;
    std::vector<TAction> disposables;
};

/// @brief Activation/deactivation hooks of the bridge. Server is started by the command only.
class CBridgeActivation
{
  public:
    static constexpr auto kStartCommand = "llm-bridge.start";
    static constexpr auto kStopCommand = "llm-bridge.stop";

    CBridgeActivation() = delete;
    ~CBridgeActivation();
    NO_COPYMOVE(CBridgeActivation);

    CBridgeActivation(TBridgeConfig config, std::shared_ptr<IModelHost> modelHost);

    /// @brief Registers start/stop commands and stopping of the server on dispose.
    /// Context must be disposed before this object is destroyed.
    void Activate(CLifecycleContext &context);

    /// @brief Releases listening socket.
    void Deactivate();

    [[nodiscard]]
    const CBridgeServerState &State() const
    {
        return state;
    }

    /// @returns Result of the last start command, if there was one.
    [[nodiscard]]
    std::optional<EStartResult> LastStartResult() const
    {
        return lastStartResult;
    }

  private:
    CBridgeServer server;
    CBridgeServerState state;
    std::optional<EStartResult> lastStartResult;
};
