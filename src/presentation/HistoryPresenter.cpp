// SPDX-License-Identifier: Apache-2.0
#include "HistoryPresenter.hpp"

#include <core/Overloaded.hpp>

namespace pagent
{

namespace
{
    constexpr auto HistoryErrorTitle = std::string_view { "History Error" };
}

HistoryPresenter::HistoryPresenter(std::shared_ptr<EventBus> bus,
                                   ViewCommandSink sink,
                                   std::shared_ptr<ConversationService> conversations):
    Presenter("HistoryPresenter", std::move(bus), std::move(sink)), _conversations(std::move(conversations))
{
}

HistoryPresenter::~HistoryPresenter()
{
    shutdown();
}

void HistoryPresenter::handleEvent(const AppEvent& event)
{
    std::visit(Overloaded {
                   [this](const UserEvent& e) { handleUserEvent(e); },
                   [this](const ConversationEvent& e) { handleConversationEvent(e); },
                   [](const auto&) {},
               },
               event);
}

void HistoryPresenter::handleUserEvent(const UserEvent& event)
{
    using UE = UserEvent;
    using VC = ViewCommand;
    std::visit(Overloaded {
                   [this](const UE::SelectConversation& e) { selectConversation(e.id); },
                   [this](const UE::DeleteConversation& e) { deleteConversation(e.id); },
                   [this](const UE::RefreshHistory&) { refreshList(); },
                   [this](const UE::Navigate& e) {
                       if (e.to == ViewId::History)
                           refreshList();
                   },
                   [this](const UE::StartRenameConversation& e) {
                       send(VC { VC::ShowModal { .modal = ModalId::RenameConversation, .target = e.id } });
                   },
                   [this](const UE::CancelRenameConversation&) { send(VC { VC::DismissModal {} }); },
                   [](const auto&) {},
               },
               event.value);
}

void HistoryPresenter::handleConversationEvent(const ConversationEvent& event)
{
    using CE = ConversationEvent;
    using VC = ViewCommand;
    std::visit(Overloaded {
                   [this](const CE::Created&) { refreshList(); },
                   [this](const CE::TitleUpdated& e) {
                       send(VC { VC::ConversationTitleUpdated { .id = e.id, .title = e.title } });
                       send(VC { VC::DismissModal {} });
                   },
                   [](const auto&) {},
               },
               event.value);
}

void HistoryPresenter::selectConversation(Uuid id)
{
    if (auto activated = _conversations->setActive(id); !activated)
    {
        reportError(std::string(HistoryErrorTitle), "Opening conversation", activated.error());
        return;
    }

    send(ViewCommand { ViewCommand::ConversationActivated { .id = id } });
    send(ViewCommand { ViewCommand::NavigateTo { .view = ViewId::Chat } });
    publish(ConversationEvent { ConversationEvent::Activated { .id = id } });
}

void HistoryPresenter::deleteConversation(Uuid id)
{
    if (auto removed = _conversations->remove(id); !removed)
    {
        reportError(std::string(HistoryErrorTitle), "Deleting conversation", removed.error());
        return;
    }

    send(ViewCommand { ViewCommand::ConversationDeleted { .id = id } });
    publish(ConversationEvent { ConversationEvent::Deleted { .id = id } });
    refreshList();
}

void HistoryPresenter::refreshList()
{
    auto conversations = _conversations->list(std::nullopt, std::nullopt);
    if (!conversations)
    {
        reportError(std::string(HistoryErrorTitle), "Loading history", conversations.error());
        return;
    }

    auto const count = conversations->size();
    send(ViewCommand { ViewCommand::ConversationListRefreshed { .conversations = std::move(*conversations) } });
    publish(ConversationEvent { ConversationEvent::ListRefreshed { .count = count } });
}

} // namespace pagent
