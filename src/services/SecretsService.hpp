// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <core/Uuid.hpp>

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace pagent
{

/// @brief Key/value store for credentials.
class SecretsService
{
  public:
    virtual ~SecretsService() = default;

    [[nodiscard]] virtual auto store(std::string_view key, std::string value) -> VoidResult = 0;
    [[nodiscard]] virtual auto get(std::string_view key) -> Result<std::optional<std::string>> = 0;
    [[nodiscard]] virtual auto remove(std::string_view key) -> VoidResult = 0;
    [[nodiscard]] virtual auto listKeys() -> Result<std::vector<std::string>> = 0;
    [[nodiscard]] virtual auto exists(std::string_view key) -> Result<bool> = 0;

    /// @brief Stores the API key of a model profile under "api_key.<profile id>".
    [[nodiscard]] virtual auto storeApiKey(Uuid profileId, std::string apiKey) -> VoidResult = 0;
    [[nodiscard]] virtual auto getApiKey(Uuid profileId) -> Result<std::optional<std::string>> = 0;
    [[nodiscard]] virtual auto removeApiKey(Uuid profileId) -> VoidResult = 0;
};

} // namespace pagent
