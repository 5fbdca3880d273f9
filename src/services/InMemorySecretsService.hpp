// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <services/SecretsService.hpp>

#include <map>
#include <mutex>

namespace pagent
{

/// @brief SecretsService backed by a process-local map.
class InMemorySecretsService final: public SecretsService
{
  public:
    auto store(std::string_view key, std::string value) -> VoidResult override;
    auto get(std::string_view key) -> Result<std::optional<std::string>> override;
    auto remove(std::string_view key) -> VoidResult override;
    auto listKeys() -> Result<std::vector<std::string>> override;
    auto exists(std::string_view key) -> Result<bool> override;
    auto storeApiKey(Uuid profileId, std::string apiKey) -> VoidResult override;
    auto getApiKey(Uuid profileId) -> Result<std::optional<std::string>> override;
    auto removeApiKey(Uuid profileId) -> VoidResult override;

  private:
    std::mutex _mutex;
    std::map<std::string, std::string, std::less<>> _secrets;
};

} // namespace pagent
