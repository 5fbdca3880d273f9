// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <core/Types.hpp>
#include <core/Uuid.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace pagent
{

/// @brief Outcome of probing a profile's model endpoint.
struct ConnectionTestResult
{
    bool success = false;
    std::optional<std::uint64_t> responseTimeMs;
    std::optional<std::string> error;
};

/// @brief Manages model profiles and the default profile.
class ProfileService
{
  public:
    virtual ~ProfileService() = default;

    [[nodiscard]] virtual auto list() -> Result<std::vector<ModelProfile>> = 0;
    [[nodiscard]] virtual auto get(Uuid id) -> Result<ModelProfile> = 0;

    /// @brief Creates a profile from a draft; the draft id is ignored.
    [[nodiscard]] virtual auto create(const ProfileDraft& draft) -> Result<ModelProfile> = 0;
    [[nodiscard]] virtual auto update(Uuid id, const ProfileDraft& draft) -> Result<ModelProfile> = 0;
    [[nodiscard]] virtual auto remove(Uuid id) -> VoidResult = 0;

    [[nodiscard]] virtual auto testConnection(Uuid id) -> Result<ConnectionTestResult> = 0;

    [[nodiscard]] virtual auto getDefault() -> Result<std::optional<Uuid>> = 0;
    [[nodiscard]] virtual auto setDefault(Uuid id) -> VoidResult = 0;
};

/// @brief Returns true if @p url uses the http or https scheme.
[[nodiscard]] auto hasHttpScheme(std::string_view url) -> bool;

/// @brief Returns the validation problems of a profile draft, empty when it is valid.
[[nodiscard]] auto validateProfileDraft(const ProfileDraft& draft) -> std::vector<std::string>;

} // namespace pagent
