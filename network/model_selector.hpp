#pragma once

#include <models/model_host.hpp>

#include <memory>
#include <optional>
#include <string>

/// @brief Picks model for the request: first one host returns for vendor/family.
class CModelSelector
{
  public:
    explicit CModelSelector(IModelHost &modelHost) :
        modelHost(modelHost)
    {
    }

    /// @throws CNoModelAvailableError if host has nothing for the selector.
    [[nodiscard]]
    std::shared_ptr<IModelHandle> Select(const std::string &vendor,
                                         const std::optional<std::string> &family) const;

    [[nodiscard]]
    std::shared_ptr<IModelHandle> Select(const TModelSelector &selector) const
    {
        return Select(selector.vendor, selector.family);
    }

  private:
    IModelHost &modelHost;
};
