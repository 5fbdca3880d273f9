// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <core/Types.hpp>

#include <optional>
#include <string_view>
#include <vector>

namespace pagent
{

/// @brief Catalog of model providers and their models.
class ModelsRegistryService
{
  public:
    virtual ~ModelsRegistryService() = default;

    [[nodiscard]] virtual auto refresh() -> VoidResult = 0;

    [[nodiscard]] virtual auto getModel(std::string_view providerId, std::string_view modelId)
        -> Result<std::optional<ModelInfo>> = 0;
    [[nodiscard]] virtual auto getProvider(std::string_view providerId) -> Result<std::optional<ProviderInfo>> = 0;
    [[nodiscard]] virtual auto listProviders() -> Result<std::vector<ProviderInfo>> = 0;
    [[nodiscard]] virtual auto listAll() -> Result<std::vector<ModelInfo>> = 0;

    /// @brief Case-insensitive search over model id and name.
    [[nodiscard]] virtual auto search(std::string_view query) -> Result<std::vector<ModelInfo>> = 0;
};

} // namespace pagent
