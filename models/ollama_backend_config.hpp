#pragma once

#include <cctype>
#include <string>

/// @brief Where local Ollama lives and which vendor name it answers to.
struct TOllamaBackendConfig
{
    /// @brief Vendor requested by clients which should be served by Ollama.
    std::string vendor{"ollama"};
    std::string ollamaHost{"localhost"};
    int ollamaPort{11434};

    /// @brief Checks if the configuration is valid.
    [[nodiscard]]
    bool Validate() const
    {
        bool res = !vendor.empty() && !ollamaHost.empty() && ollamaPort > 0 && ollamaPort <= 65535;
        for (const char ch : ollamaHost)
        {
            if (!res)
            {
                break;
            }
            if (ch == '-' || ch == '.' || std::isalnum(static_cast<unsigned char>(ch)))
            {
                continue;
            }
            res = false;
        }
        return res;
    }

    /// @returns A string representing the URL to connect to Ollama.
    [[nodiscard]]
    std::string CreateOllamaUrl() const
    {
        return "http://" + ollamaHost + ":" + std::to_string(ollamaPort);
    }
};
