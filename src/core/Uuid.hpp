// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>

#include <array>
#include <compare>
#include <cstddef>
#include <cstdint>
#include <format>
#include <functional>
#include <string>
#include <string_view>

namespace pagent
{

/// @brief 128-bit identifier used for conversations, profiles, MCP servers and messages.
class Uuid
{
  public:
    using Bytes = std::array<std::uint8_t, 16>;

    /// @brief Constructs the nil UUID.
    constexpr Uuid() = default;
    constexpr explicit Uuid(Bytes bytes): _bytes(bytes) {}

    /// @brief Generates a random version 4 UUID.
    [[nodiscard]] static auto generate() -> Uuid;

    /// @brief Parses the canonical 8-4-4-4-12 hexadecimal form.
    [[nodiscard]] static auto parse(std::string_view text) -> Result<Uuid>;

    [[nodiscard]] constexpr auto isNil() const noexcept -> bool { return _bytes == Bytes {}; }
    [[nodiscard]] constexpr auto bytes() const noexcept -> const Bytes& { return _bytes; }

    /// @brief Returns the canonical lowercase string form.
    [[nodiscard]] auto toString() const -> std::string;

    /// @brief Returns the first eight hex digits, for compact display.
    [[nodiscard]] auto shortString() const -> std::string;

    constexpr auto operator<=>(const Uuid&) const = default;

  private:
    Bytes _bytes {};
};

} // namespace pagent

template <>
struct std::hash<pagent::Uuid>
{
    auto operator()(const pagent::Uuid& id) const noexcept -> std::size_t
    {
        auto h = std::size_t { 14695981039346656037ull };
        for (auto const b: id.bytes())
        {
            h ^= b;
            h *= 1099511628211ull;
        }
        return h;
    }
};

template <>
struct std::formatter<pagent::Uuid>: std::formatter<std::string>
{
    auto format(const pagent::Uuid& id, auto& ctx) const
    {
        return std::formatter<std::string>::format(id.toString(), ctx);
    }
};
