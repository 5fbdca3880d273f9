// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <services/ModelsRegistryService.hpp>

#include <mutex>
#include <vector>

namespace pagent
{

/// @brief ModelsRegistryService over a fixed model catalog (loaded from the configuration).
class StaticModelsRegistryService final: public ModelsRegistryService
{
  public:
    explicit StaticModelsRegistryService(std::vector<ModelInfo> models);

    auto refresh() -> VoidResult override;
    auto getModel(std::string_view providerId, std::string_view modelId) -> Result<std::optional<ModelInfo>> override;
    auto getProvider(std::string_view providerId) -> Result<std::optional<ProviderInfo>> override;
    auto listProviders() -> Result<std::vector<ProviderInfo>> override;
    auto listAll() -> Result<std::vector<ModelInfo>> override;
    auto search(std::string_view query) -> Result<std::vector<ModelInfo>> override;

  private:
    void rebuildProviders();

    std::mutex _mutex;
    std::vector<ModelInfo> _models;
    std::vector<ProviderInfo> _providers;
};

} // namespace pagent
