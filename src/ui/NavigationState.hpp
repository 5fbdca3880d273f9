// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <events/ViewId.hpp>

#include <cstddef>
#include <vector>

namespace pagent
{

/// @brief Stack of views consumed by the top-level UI router.
///
/// The stack is never empty; its bottom is always the home view.
class NavigationState
{
  public:
    NavigationState();

    /// @brief Pushes @p view unless it is already the current view.
    void navigate(ViewId view);

    /// @brief Pops the current view.
    /// @return False, without changing anything, when only the home view is left.
    auto navigateBack() -> bool;

    [[nodiscard]] auto current() const noexcept -> ViewId { return _stack.back(); }
    [[nodiscard]] auto canGoBack() const noexcept -> bool { return _stack.size() > 1; }
    [[nodiscard]] auto stackDepth() const noexcept -> std::size_t { return _stack.size(); }

    /// @brief Returns to the initial single-entry stack.
    void reset();

  private:
    std::vector<ViewId> _stack;
};

} // namespace pagent
