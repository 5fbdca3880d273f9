// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <presentation/Presenter.hpp>

namespace pagent
{

/// @brief Turns error-carrying events from any source into user-visible ShowError commands.
class ErrorPresenter final: public Presenter
{
  public:
    ErrorPresenter(std::shared_ptr<EventBus> bus, ViewCommandSink sink);
    ~ErrorPresenter() override;

  protected:
    void handleEvent(const AppEvent& event) override;
};

} // namespace pagent
