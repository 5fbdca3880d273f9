// SPDX-License-Identifier: Apache-2.0
#include "NavigationState.hpp"

#include <core/Log.hpp>

namespace pagent
{

NavigationState::NavigationState(): _stack { HomeView }
{
}

void NavigationState::navigate(ViewId view)
{
    if (view == current())
        return;
    _stack.push_back(view);
    log::trace("Navigation: -> {} (depth {})", viewIdToString(view), _stack.size());
}

auto NavigationState::navigateBack() -> bool
{
    if (!canGoBack())
        return false;
    _stack.pop_back();
    log::trace("Navigation: back to {} (depth {})", viewIdToString(current()), _stack.size());
    return true;
}

void NavigationState::reset()
{
    _stack.assign(1, HomeView);
}

} // namespace pagent
