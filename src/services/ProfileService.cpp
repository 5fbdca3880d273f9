// SPDX-License-Identifier: Apache-2.0
#include "ProfileService.hpp"

namespace pagent
{

auto hasHttpScheme(std::string_view url) -> bool
{
    return url.starts_with("http://") || url.starts_with("https://");
}

auto validateProfileDraft(const ProfileDraft& draft) -> std::vector<std::string>
{
    auto errors = std::vector<std::string> {};
    if (draft.name.empty())
        errors.emplace_back("Name is required");
    if (draft.providerId.empty())
        errors.emplace_back("Provider is required");
    if (draft.modelId.empty())
        errors.emplace_back("Model is required");
    if (!draft.baseUrl.empty() && !hasHttpScheme(draft.baseUrl))
        errors.emplace_back("Base URL must start with http:// or https://");
    if (draft.parameters.temperature < 0.0 || draft.parameters.temperature > 2.0)
        errors.emplace_back("Temperature must be between 0 and 2");
    if (draft.parameters.maxTokens <= 0)
        errors.emplace_back("Max tokens must be positive");
    return errors;
}

} // namespace pagent
