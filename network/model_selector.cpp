#include "model_selector.hpp" // IWYU pragma: keep

#include "bridge_errors.hpp" // IWYU pragma: keep

#include <models/model_host.hpp>

#include <memory>
#include <optional>
#include <string>

std::shared_ptr<IModelHandle> CModelSelector::Select(const std::string &vendor,
                                                     const std::optional<std::string> &family) const
{
    TModelSelector selector{vendor, std::nullopt};
    if (family)
    {
        selector.family = family;
    }

    const auto models = modelHost.SelectChatModels(selector);
    if (models.empty() || !models.front())
    {
        throw CNoModelAvailableError(vendor, family);
    }
    // Host orders models, we do not rank them again.
    return models.front();
}
