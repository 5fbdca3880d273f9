// SPDX-License-Identifier: Apache-2.0
#include "StaticModelsRegistryService.hpp"

#include <core/Log.hpp>
#include <core/StringUtils.hpp>

#include <algorithm>
#include <iterator>

namespace pagent
{

StaticModelsRegistryService::StaticModelsRegistryService(std::vector<ModelInfo> models): _models(std::move(models))
{
    rebuildProviders();
}

// Caller holds the mutex (or is the constructor).
void StaticModelsRegistryService::rebuildProviders()
{
    _providers.clear();
    for (auto const& model: _models)
    {
        auto it = std::ranges::find(_providers, model.providerId, &ProviderInfo::id);
        if (it == _providers.end())
        {
            _providers.push_back(ProviderInfo { .id = model.providerId, .name = model.providerId, .modelCount = 0 });
            it = std::prev(_providers.end());
        }
        ++it->modelCount;
    }
    std::ranges::sort(_providers, {}, &ProviderInfo::id);
}

auto StaticModelsRegistryService::refresh() -> VoidResult
{
    auto lock = std::lock_guard(_mutex);
    rebuildProviders();
    log::debug("Models registry: {} models from {} providers", _models.size(), _providers.size());
    return {};
}

auto StaticModelsRegistryService::getModel(std::string_view providerId, std::string_view modelId)
    -> Result<std::optional<ModelInfo>>
{
    auto lock = std::lock_guard(_mutex);
    auto const it = std::ranges::find_if(
        _models, [&](const ModelInfo& m) { return m.providerId == providerId && m.modelId == modelId; });
    if (it == _models.end())
        return std::nullopt;
    return *it;
}

auto StaticModelsRegistryService::getProvider(std::string_view providerId) -> Result<std::optional<ProviderInfo>>
{
    auto lock = std::lock_guard(_mutex);
    auto const it = std::ranges::find(_providers, providerId, &ProviderInfo::id);
    if (it == _providers.end())
        return std::nullopt;
    return *it;
}

auto StaticModelsRegistryService::listProviders() -> Result<std::vector<ProviderInfo>>
{
    auto lock = std::lock_guard(_mutex);
    return _providers;
}

auto StaticModelsRegistryService::listAll() -> Result<std::vector<ModelInfo>>
{
    auto lock = std::lock_guard(_mutex);
    return _models;
}

auto StaticModelsRegistryService::search(std::string_view query) -> Result<std::vector<ModelInfo>>
{
    auto const needle = trim(query);
    auto lock = std::lock_guard(_mutex);
    auto result = std::vector<ModelInfo> {};
    std::ranges::copy_if(_models, std::back_inserter(result), [needle](const ModelInfo& m) {
        return containsIgnoreCase(m.modelId, needle) || containsIgnoreCase(m.name, needle);
    });
    return result;
}

} // namespace pagent
