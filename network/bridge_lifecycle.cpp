#include "bridge_lifecycle.hpp" // IWYU pragma: keep

#include "bridge_config.hpp" // IWYU pragma: keep
#include "bridge_server.hpp" // IWYU pragma: keep

#include <models/model_host.hpp>

#include <memory>
#include <ostream>
#include <string>
#include <utility>
#include <vector>

CLifecycleContext::~CLifecycleContext()
{
    DisposeAll();
}

void CLifecycleContext::RegisterCommand(const std::string &name, TAction action)
{
    commands[name] = std::move(action);
}

bool CLifecycleContext::ExecuteCommand(const std::string &name) const
{
    const auto it = commands.find(name);
    if (it == commands.end() || !it->second)
    {
        return false;
    }
    it->second();
    return true;
}

void CLifecycleContext::PushDisposable(TAction dispose)
{
    disposables.push_back(std::move(dispose));
}

void CLifecycleContext::DisposeAll()
{
    std::vector<TAction> toDispose;
    std::swap(toDispose, disposables);
    for (auto it = toDispose.rbegin(); it != toDispose.rend(); ++it)
    {
        if (*it)
        {
            (*it)();
        }
    }
    commands.clear();
}

CBridgeActivation::CBridgeActivation(TBridgeConfig config, std::shared_ptr<IModelHost> modelHost) :
    server(std::move(config), std::move(modelHost)),
    state(),
    lastStartResult(std::nullopt)
{
}

CBridgeActivation::~CBridgeActivation()
{
    Deactivate();
}

void CBridgeActivation::Activate(CLifecycleContext &context)
{
    server.Config().ExecIfFittingVerbosity(EBridgeVerbosity::Info, [](auto &ostream) {
        ostream << "[INFO] LLM bridge is active. Run '" << kStartCommand
                << "' to start the server." << std::endl;
    });

    context.RegisterCommand(kStartCommand, [this]() {
        lastStartResult = server.Start(state);
    });
    context.RegisterCommand(kStopCommand, [this]() {
        server.Stop(state);
    });
    context.PushDisposable([this]() {
        Deactivate();
    });
}

void CBridgeActivation::Deactivate()
{
    server.Stop(state);
}
