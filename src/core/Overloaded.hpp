// SPDX-License-Identifier: Apache-2.0
#pragma once

namespace pagent
{

/// @brief Combines several lambdas into one visitor for std::visit.
template <typename... Ts>
struct Overloaded: Ts...
{
    using Ts::operator()...;
};

} // namespace pagent
