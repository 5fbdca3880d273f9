// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <services/ProfileService.hpp>

#include <mutex>
#include <vector>

namespace pagent
{

/// @brief Thread-safe ProfileService keeping profiles in memory.
///
/// testConnection() performs a local plausibility check of the endpoint (model id present,
/// http(s) base URL) instead of contacting the provider.
class InMemoryProfileService final: public ProfileService
{
  public:
    auto list() -> Result<std::vector<ModelProfile>> override;
    auto get(Uuid id) -> Result<ModelProfile> override;
    auto create(const ProfileDraft& draft) -> Result<ModelProfile> override;
    auto update(Uuid id, const ProfileDraft& draft) -> Result<ModelProfile> override;
    auto remove(Uuid id) -> VoidResult override;
    auto testConnection(Uuid id) -> Result<ConnectionTestResult> override;
    auto getDefault() -> Result<std::optional<Uuid>> override;
    auto setDefault(Uuid id) -> VoidResult override;

  private:
    auto find(Uuid id) -> ModelProfile*;

    std::mutex _mutex;
    std::vector<ModelProfile> _profiles;
    std::optional<Uuid> _defaultId;
};

} // namespace pagent
