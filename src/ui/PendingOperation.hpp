// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <optional>
#include <utility>

namespace pagent
{

/// @brief Single-slot holder for a UI operation that must run after the current callback returns.
///
/// Toolkit callbacks must not re-enter the native widget they were invoked from. They record the
/// operation here instead, and the render loop applies it once the callback has unwound. A newer
/// request replaces an older pending one.
template <typename Operation>
class PendingOperationSlot
{
  public:
    /// @brief Stores @p operation, replacing any pending one. Nothing is executed.
    void request(Operation operation) { _pending = std::move(operation); }

    /// @brief Takes the pending operation, if any, and passes it to @p apply exactly once.
    /// @return True if an operation was applied.
    template <typename Apply>
    auto drainAndApply(Apply&& apply) -> bool
    {
        if (!_pending)
            return false;
        auto operation = std::move(*_pending);
        _pending.reset();
        std::forward<Apply>(apply)(std::move(operation));
        return true;
    }

    [[nodiscard]] auto hasPending() const noexcept -> bool { return _pending.has_value(); }
    [[nodiscard]] auto peek() const noexcept -> const Operation* { return _pending ? &*_pending : nullptr; }

  private:
    std::optional<Operation> _pending;
};

} // namespace pagent
