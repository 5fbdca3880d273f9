// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <ui/PendingOperation.hpp>

#include <memory>
#include <string_view>
#include <variant>

namespace pagent
{

class EventBus;

/// @brief Screen position the popover is attached to, usually the status item.
struct PopoverAnchor
{
    int x = 0;
    int y = 0;
};

/// @brief Native popover window abstraction.
class PopoverHost
{
  public:
    virtual ~PopoverHost() = default;

    virtual void show(PopoverAnchor anchor) = 0;
    virtual void close() = 0;
    [[nodiscard]] virtual auto isShown() const -> bool = 0;
};

/// @brief Owns the popover host and applies show/hide requests outside toolkit callbacks.
///
/// All methods must be called from the UI thread.
class PopoverController
{
  public:
    struct Show
    {
        PopoverAnchor anchor;
    };
    struct Hide
    {
    };
    struct Toggle
    {
        PopoverAnchor anchor;
    };
    using Operation = std::variant<Show, Hide, Toggle>;

    PopoverController(PopoverHost& host, std::shared_ptr<EventBus> bus);

    void requestShow(PopoverAnchor anchor) { _slot.request(Show { anchor }); }
    void requestHide() { _slot.request(Hide {}); }
    void requestToggle(PopoverAnchor anchor) { _slot.request(Toggle { anchor }); }

    /// @brief Applies the pending request, if any. Call after the toolkit callback returned.
    /// @return True if a request was applied.
    auto processPendingOperations() -> bool;

    [[nodiscard]] auto hasPendingOperation() const noexcept -> bool { return _slot.hasPending(); }
    [[nodiscard]] auto isShown() const -> bool { return _host.isShown(); }

  private:
    void show(PopoverAnchor anchor);
    void hide();
    void announce(bool shown);

    PopoverHost& _host;
    std::shared_ptr<EventBus> _bus;
    PendingOperationSlot<Operation> _slot;
};

} // namespace pagent
