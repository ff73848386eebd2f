#pragma once

#include <cctype>
#include <chrono>
#include <cstdint>
#include <iostream>
#include <mutex>
#include <ostream>
#include <string>

enum class EBridgeVerbosity : std::uint8_t {
    Silent = 0,
    Error = 0x10,
    Warning = 0x20,
    Info = 0x40,
    Debug = 0xFF,
};

struct TBridgeConfig
{
    EBridgeVerbosity verbosity{EBridgeVerbosity::Info};
    std::string listenHost{"127.0.0.1"};
    /// @brief 0 means any free port, actual one is reported by the server state.
    int listenPort{3000};
    std::string chatPath{"/chat"};
    /// @brief Vendor used when request does not name one.
    std::string defaultVendor{"copilot"};
    /// @brief How long relay waits for the next fragment before checking the client again.
    std::chrono::milliseconds fragmentPollInterval{100};
    std::ostream &outStream{std::cout};
    std::ostream &errorStream{std::cerr};

    /// @brief Checks if the verbosity level is fitting.
    [[nodiscard]]
    bool IsFittingVerbosity(const EBridgeVerbosity value) const
    {
        return static_cast<std::uint8_t>(verbosity) >= static_cast<std::uint8_t>(value);
    }

    /// @brief Executes the given function if the verbosity level is fitting. Usable for logging.
    /// Passes the output stream to the function. Calls from different threads are serialized.
    /// @param value The verbosity level to check against. If it's higher or equal, the function
    /// will be executed.
    /// @param func The function to execute if the verbosity level is fitting. It should take an
    /// std::ostream& as parameter.
    template <typename taFunc>
    void ExecIfFittingVerbosity(const EBridgeVerbosity value, const taFunc &func) const
    {
        if (IsFittingVerbosity(value))
        {
            const std::lock_guard lock(LogMutex());
            func(value == EBridgeVerbosity::Error ? errorStream : outStream);
        }
    }

    /// @brief Checks if the configuration is valid.
    [[nodiscard]]
    bool Validate() const
    {
        bool res = !listenHost.empty() && listenPort >= 0 && listenPort <= 65535
                   && chatPath.size() > 1 && chatPath.front() == '/' && !defaultVendor.empty()
                   && fragmentPollInterval.count() > 0;
        for (const char ch : listenHost)
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

    /// @returns Base URL of the bridge for the given (actually bound) port.
    [[nodiscard]]
    std::string CreateBaseUrl(const int port) const
    {
        return "http://" + listenHost + ":" + std::to_string(port);
    }

  private:
    static std::mutex &LogMutex()
    {
        static std::mutex mutex;
        return mutex;
    }
};
