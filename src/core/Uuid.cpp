// SPDX-License-Identifier: Apache-2.0
#include "Uuid.hpp"

#include <mutex>
#include <random>

namespace pagent
{

namespace
{

    auto hexValue(char c) -> int
    {
        if (c >= '0' && c <= '9')
            return c - '0';
        if (c >= 'a' && c <= 'f')
            return c - 'a' + 10;
        if (c >= 'A' && c <= 'F')
            return c - 'A' + 10;
        return -1;
    }

    constexpr auto isDashPosition(std::size_t i) -> bool
    {
        return i == 8 || i == 13 || i == 18 || i == 23;
    }

} // namespace

auto Uuid::generate() -> Uuid
{
    static auto mutex = std::mutex {};
    static auto engine = std::mt19937_64 { std::random_device {}() };

    auto bytes = Bytes {};
    {
        auto lock = std::lock_guard(mutex);
        auto const hi = engine();
        auto const lo = engine();
        for (auto i = 0u; i < 8; ++i)
        {
            bytes[i] = static_cast<std::uint8_t>(hi >> (i * 8));
            bytes[i + 8] = static_cast<std::uint8_t>(lo >> (i * 8));
        }
    }

    bytes[6] = static_cast<std::uint8_t>((bytes[6] & 0x0F) | 0x40); // version 4
    bytes[8] = static_cast<std::uint8_t>((bytes[8] & 0x3F) | 0x80); // RFC 4122 variant
    return Uuid(bytes);
}

auto Uuid::parse(std::string_view text) -> Result<Uuid>
{
    if (text.size() != 36)
        return makeError(ErrorCode::InvalidArgument, std::format("Invalid UUID length: '{}'", text));

    auto bytes = Bytes {};
    auto byteIndex = std::size_t { 0 };
    for (auto i = std::size_t { 0 }; i < text.size();)
    {
        if (isDashPosition(i))
        {
            if (text[i] != '-')
                return makeError(ErrorCode::InvalidArgument, std::format("Invalid UUID: '{}'", text));
            ++i;
            continue;
        }

        auto const high = hexValue(text[i]);
        auto const low = hexValue(text[i + 1]);
        if (high < 0 || low < 0 || isDashPosition(i + 1))
            return makeError(ErrorCode::InvalidArgument, std::format("Invalid UUID: '{}'", text));
        bytes[byteIndex++] = static_cast<std::uint8_t>((high << 4) | low);
        i += 2;
    }

    return Uuid(bytes);
}

auto Uuid::toString() const -> std::string
{
    constexpr auto digits = std::string_view { "0123456789abcdef" };

    auto out = std::string {};
    out.reserve(36);
    for (auto i = std::size_t { 0 }; i < _bytes.size(); ++i)
    {
        if (i == 4 || i == 6 || i == 8 || i == 10)
            out.push_back('-');
        out.push_back(digits[_bytes[i] >> 4]);
        out.push_back(digits[_bytes[i] & 0x0F]);
    }
    return out;
}

auto Uuid::shortString() const -> std::string
{
    return toString().substr(0, 8);
}

} // namespace pagent
