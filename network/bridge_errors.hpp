#pragma once

#include <optional>
#include <stdexcept>
#include <string>
#include <utility>

/// @brief Request body is not a valid JSON.
class CMalformedBodyError : public std::runtime_error
{
  public:
    explicit CMalformedBodyError(const std::string &diagnostic) :
        std::runtime_error("Invalid JSON body: " + diagnostic)
    {
    }
};

/// @brief Connection failed before the whole request body was received.
class CIoError : public std::runtime_error
{
  public:
    using std::runtime_error::runtime_error;
};

/// @brief Request has no usable prompt.
class CMissingPromptError : public std::runtime_error
{
  public:
    CMissingPromptError() :
        std::runtime_error("Prompt is required in the request body.")
    {
    }
};

/// @brief Model host returned nothing for the selector.
class CNoModelAvailableError : public std::runtime_error
{
  public:
    CNoModelAvailableError(std::string vendor, std::optional<std::string> family) :
        std::runtime_error(BuildMessage(vendor, family)),
        vendor(std::move(vendor)),
        family(std::move(family))
    {
    }

    [[nodiscard]]
    const std::string &Vendor() const
    {
        return vendor;
    }

    [[nodiscard]]
    const std::optional<std::string> &Family() const
    {
        return family;
    }

  private:
    static std::string BuildMessage(const std::string &vendor,
                                    const std::optional<std::string> &family)
    {
        std::string msg = "No suitable language model found for vendor '" + vendor + "'";
        if (family)
        {
            msg += " and family '" + *family + "'";
        }
        msg += ". Ensure the provider (e.g., GitHub Copilot) is active and available.";
        return msg;
    }

    std::string vendor;
    std::optional<std::string> family;
};

/// @brief Model failed to start or to continue producing output.
class CInvocationError : public std::runtime_error
{
  public:
    using std::runtime_error::runtime_error;
};

/// @brief Listening socket could not be opened or failed.
class CListenerError : public std::runtime_error
{
  public:
    using std::runtime_error::runtime_error;
};
