// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <presentation/Presenter.hpp>
#include <services/ConversationService.hpp>

#include <memory>

namespace pagent
{

/// @brief Maintains the conversation history list.
class HistoryPresenter final: public Presenter
{
  public:
    HistoryPresenter(std::shared_ptr<EventBus> bus,
                     ViewCommandSink sink,
                     std::shared_ptr<ConversationService> conversations);
    ~HistoryPresenter() override;

  protected:
    void handleEvent(const AppEvent& event) override;

  private:
    void handleUserEvent(const UserEvent& event);
    void handleConversationEvent(const ConversationEvent& event);

    void selectConversation(Uuid id);
    void deleteConversation(Uuid id);
    void refreshList();

    std::shared_ptr<ConversationService> _conversations;
};

} // namespace pagent
