// SPDX-License-Identifier: Apache-2.0
#include "InMemorySecretsService.hpp"

#include <format>

namespace pagent
{

namespace
{
    auto apiKeyName(Uuid profileId) -> std::string
    {
        return std::format("api_key.{}", profileId);
    }
} // namespace

auto InMemorySecretsService::store(std::string_view key, std::string value) -> VoidResult
{
    if (key.empty())
        return makeError(ErrorCode::InvalidArgument, "Secret key must not be empty");

    auto lock = std::lock_guard(_mutex);
    _secrets.insert_or_assign(std::string(key), std::move(value));
    return {};
}

auto InMemorySecretsService::get(std::string_view key) -> Result<std::optional<std::string>>
{
    auto lock = std::lock_guard(_mutex);
    if (auto const it = _secrets.find(key); it != _secrets.end())
        return it->second;
    return std::nullopt;
}

// Removing a missing key is not an error.
auto InMemorySecretsService::remove(std::string_view key) -> VoidResult
{
    auto lock = std::lock_guard(_mutex);
    if (auto const it = _secrets.find(key); it != _secrets.end())
        _secrets.erase(it);
    return {};
}

auto InMemorySecretsService::listKeys() -> Result<std::vector<std::string>>
{
    auto lock = std::lock_guard(_mutex);
    auto keys = std::vector<std::string> {};
    keys.reserve(_secrets.size());
    for (auto const& [key, _]: _secrets)
        keys.push_back(key);
    return keys;
}

auto InMemorySecretsService::exists(std::string_view key) -> Result<bool>
{
    auto lock = std::lock_guard(_mutex);
    return _secrets.contains(key);
}

auto InMemorySecretsService::storeApiKey(Uuid profileId, std::string apiKey) -> VoidResult
{
    return store(apiKeyName(profileId), std::move(apiKey));
}

auto InMemorySecretsService::getApiKey(Uuid profileId) -> Result<std::optional<std::string>>
{
    return get(apiKeyName(profileId));
}

auto InMemorySecretsService::removeApiKey(Uuid profileId) -> VoidResult
{
    return remove(apiKeyName(profileId));
}

} // namespace pagent
