#include <models/ollama_backend_config.hpp>
#include <models/ollama_model_host.hpp>
#include <network/bridge_config.hpp>
#include <network/bridge_lifecycle.hpp>
#include <network/bridge_server.hpp>

#include <atomic>
#include <chrono> // IWYU pragma: keep
#include <csignal>
#include <exception>
#include <iostream>
#include <memory>
#include <thread>

namespace {
constexpr int kPort = 3000;
constexpr auto kOllamaHost = "localhost";
constexpr int kOllamaPort = 11434;

std::atomic<bool> isInterrupted{false};
void HandleSignal(int /*signum*/)
{
    isInterrupted = true;
}
} // namespace

int main()
{
    using namespace std::chrono_literals;

    signal(SIGINT, HandleSignal);
    signal(SIGTERM, HandleSignal);

    int retCode = 0;
    try
    {
        TBridgeConfig bridgeConfig;
        bridgeConfig.listenPort = kPort;

        // Local Ollama answers to the default vendor, so plain requests are served.
        TOllamaBackendConfig ollamaConfig;
        ollamaConfig.vendor = bridgeConfig.defaultVendor;
        ollamaConfig.ollamaHost = kOllamaHost;
        ollamaConfig.ollamaPort = kOllamaPort;

        CBridgeActivation activation(bridgeConfig,
                                     std::make_shared<COllamaModelHost>(ollamaConfig));
        CLifecycleContext context;
        activation.Activate(context);

        if (!context.ExecuteCommand(CBridgeActivation::kStartCommand)
            || activation.LastStartResult() == EStartResult::Failed)
        {
            std::cerr << "LLM Bridge server failed to start. Exiting." << std::endl;
            retCode = 1;
        }
        else
        {
            while (!isInterrupted && activation.State().IsListening())
            {
                std::this_thread::sleep_for(500ms); // NOLINT
            }
            if (isInterrupted)
            {
                std::cout << "Received signal, shutting down..." << std::endl;
            }
            else
            {
                std::cerr << "LLM Bridge server stopped unexpectedly." << std::endl;
                retCode = 1;
            }
        }
        context.DisposeAll();
    }
    catch (std::exception &e)
    {
        std::cerr << "Server exception: " << e.what() << ". Exiting." << std::endl;
        retCode = 255;
    }

    return retCode;
}
