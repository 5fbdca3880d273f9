// SPDX-License-Identifier: Apache-2.0
#include "InMemoryProfileService.hpp"

#include <core/Log.hpp>

#include <algorithm>
#include <chrono>
#include <format>

namespace pagent
{

namespace
{

    auto notFound(Uuid id) -> std::unexpected<Error>
    {
        return makeError(ErrorCode::NotFound, std::format("Profile {} not found", id));
    }

    auto profileFromDraft(Uuid id, const ProfileDraft& draft) -> ModelProfile
    {
        return ModelProfile {
            .id = id,
            .name = draft.name,
            .providerId = draft.providerId,
            .modelId = draft.modelId,
            .baseUrl = draft.baseUrl,
            .systemPrompt = draft.systemPrompt,
            .parameters = draft.parameters,
        };
    }

} // namespace

auto InMemoryProfileService::find(Uuid id) -> ModelProfile*
{
    auto const it = std::ranges::find(_profiles, id, &ModelProfile::id);
    return it != _profiles.end() ? &*it : nullptr;
}

auto InMemoryProfileService::list() -> Result<std::vector<ModelProfile>>
{
    auto lock = std::lock_guard(_mutex);
    return _profiles;
}

auto InMemoryProfileService::get(Uuid id) -> Result<ModelProfile>
{
    auto lock = std::lock_guard(_mutex);
    if (auto const* profile = find(id))
        return *profile;
    return notFound(id);
}

auto InMemoryProfileService::create(const ProfileDraft& draft) -> Result<ModelProfile>
{
    if (auto const errors = validateProfileDraft(draft); !errors.empty())
        return makeError(ErrorCode::Validation, errors.front());

    auto profile = profileFromDraft(Uuid::generate(), draft);

    auto lock = std::lock_guard(_mutex);
    _profiles.push_back(profile);
    log::debug("Created profile '{}' ({})", profile.name, profile.id);
    return profile;
}

auto InMemoryProfileService::update(Uuid id, const ProfileDraft& draft) -> Result<ModelProfile>
{
    if (auto const errors = validateProfileDraft(draft); !errors.empty())
        return makeError(ErrorCode::Validation, errors.front());

    auto lock = std::lock_guard(_mutex);
    auto* profile = find(id);
    if (!profile)
        return notFound(id);
    *profile = profileFromDraft(id, draft);
    return *profile;
}

auto InMemoryProfileService::remove(Uuid id) -> VoidResult
{
    auto lock = std::lock_guard(_mutex);
    if (std::erase_if(_profiles, [id](const ModelProfile& p) { return p.id == id; }) == 0)
        return notFound(id);
    if (_defaultId == id)
        _defaultId.reset();
    return {};
}

auto InMemoryProfileService::testConnection(Uuid id) -> Result<ConnectionTestResult>
{
    auto const start = std::chrono::steady_clock::now();

    auto profile = get(id);
    if (!profile)
        return std::unexpected(profile.error());

    auto result = ConnectionTestResult {};
    if (profile->modelId.empty())
        result.error = "Profile has no model configured";
    else if (!profile->baseUrl.empty() && !hasHttpScheme(profile->baseUrl))
        result.error = std::format("Unsupported endpoint: {}", profile->baseUrl);
    else
        result.success = true;

    auto const elapsed = std::chrono::steady_clock::now() - start;
    result.responseTimeMs =
        static_cast<std::uint64_t>(std::chrono::duration_cast<std::chrono::milliseconds>(elapsed).count());
    return result;
}

auto InMemoryProfileService::getDefault() -> Result<std::optional<Uuid>>
{
    auto lock = std::lock_guard(_mutex);
    return _defaultId;
}

auto InMemoryProfileService::setDefault(Uuid id) -> VoidResult
{
    auto lock = std::lock_guard(_mutex);
    if (!find(id))
        return notFound(id);
    _defaultId = id;
    return {};
}

} // namespace pagent
