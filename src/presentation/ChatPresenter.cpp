// SPDX-License-Identifier: Apache-2.0
#include "ChatPresenter.hpp"

#include <core/Log.hpp>
#include <core/Overloaded.hpp>
#include <core/StringUtils.hpp>

namespace pagent
{

namespace
{
    constexpr auto ChatErrorTitle = std::string_view { "Chat Error" };
}

ChatPresenter::ChatPresenter(std::shared_ptr<EventBus> bus,
                             ViewCommandSink sink,
                             std::shared_ptr<ConversationService> conversations,
                             std::shared_ptr<ChatService> chat,
                             std::shared_ptr<ProfileService> profiles):
    Presenter("ChatPresenter", std::move(bus), std::move(sink)),
    _conversations(std::move(conversations)),
    _chat(std::move(chat)),
    _profiles(std::move(profiles))
{
}

ChatPresenter::~ChatPresenter()
{
    shutdown();
}

void ChatPresenter::handleEvent(const AppEvent& event)
{
    std::visit(Overloaded {
                   [this](const UserEvent& e) { handleUserEvent(e); },
                   [this](const ChatEvent& e) { handleChatEvent(e); },
                   [this](const ConversationEvent& e) { handleConversationEvent(e); },
                   [](const auto&) {},
               },
               event);
}

void ChatPresenter::handleUserEvent(const UserEvent& event)
{
    using UE = UserEvent;
    std::visit(Overloaded {
                   [this](const UE::SendMessage& e) { sendMessage(e.text); },
                   [this](const UE::StopStreaming&) { _chat->cancel(); },
                   [this](const UE::NewConversation&) { newConversation(); },
                   [this](const UE::ToggleThinking&) { send(ViewCommand { ViewCommand::ToggleThinkingVisibility {} }); },
                   [this](const UE::ConfirmRenameConversation& e) { renameConversation(e.id, e.title); },
                   [](const auto&) {},
               },
               event.value);
}

void ChatPresenter::handleChatEvent(const ChatEvent& event)
{
    using CE = ChatEvent;
    using VC = ViewCommand;
    auto const id = _streamConversation;

    std::visit(Overloaded {
                   [this](const CE::StreamStarted& e) {
                       _streamConversation = e.conversationId;
                       send(VC { VC::ShowThinking { .conversationId = e.conversationId } });
                   },
                   [&](const CE::TextDelta& e) { send(VC { VC::AppendStream { .conversationId = id, .chunk = e.text } }); },
                   [&](const CE::ThinkingDelta& e) {
                       send(VC { VC::AppendThinking { .conversationId = id, .content = e.text } });
                   },
                   [&](const CE::ToolCallStarted& e) {
                       send(VC { VC::ShowToolCall { .conversationId = id, .toolName = e.toolName, .status = "running" } });
                   },
                   [&](const CE::ToolCallCompleted& e) {
                       send(VC { VC::UpdateToolCall {
                           .conversationId = id,
                           .toolName = e.toolName,
                           .status = e.success ? "completed" : "failed",
                           .result = e.result,
                           .durationMs = e.durationMs,
                       } });
                   },
                   [this](const CE::StreamCompleted& e) {
                       send(VC { VC::FinalizeStream { .conversationId = e.conversationId, .tokens = e.totalTokens } });
                       send(VC { VC::HideThinking { .conversationId = e.conversationId } });
                   },
                   [this](const CE::StreamCancelled& e) {
                       send(VC { VC::StreamCancelled {
                           .conversationId = e.conversationId, .partialContent = e.partialContent } });
                       send(VC { VC::HideThinking { .conversationId = e.conversationId } });
                   },
                   [this](const CE::StreamError& e) {
                       send(VC { VC::StreamError {
                           .conversationId = e.conversationId, .error = e.error, .recoverable = e.recoverable } });
                       send(VC { VC::HideThinking { .conversationId = e.conversationId } });
                   },
                   [this](const CE::MessageSaved& e) {
                       send(VC { VC::MessageSaved { .conversationId = e.conversationId } });
                   },
               },
               event.value);
}

void ChatPresenter::handleConversationEvent(const ConversationEvent& event)
{
    using CE = ConversationEvent;
    using VC = ViewCommand;
    std::visit(Overloaded {
                   [this](const CE::Activated& e) { reloadTranscript(e.id); },
                   [this](const CE::Deactivated&) {
                       _displayedConversation = Uuid {};
                       send(VC { VC::ConversationCleared {} });
                   },
                   [this](const CE::Deleted& e) {
                       if (e.id != _displayedConversation)
                           return;
                       _displayedConversation = Uuid {};
                       send(VC { VC::ConversationCleared {} });
                   },
                   [this](const CE::ListRefreshed& e) { send(VC { VC::HistoryUpdated { .count = e.count } }); },
                   [](const auto&) {},
               },
               event.value);
}

auto ChatPresenter::createConversation() -> Result<Conversation>
{
    auto profileId = Uuid {};
    if (auto defaultProfile = _profiles->getDefault(); defaultProfile && *defaultProfile)
        profileId = **defaultProfile;
    else if (!defaultProfile)
        log::warning("cannot determine default profile: {}", defaultProfile.error());

    auto conversation = _conversations->create(std::string(NewConversationTitle), profileId);
    if (!conversation)
        return conversation;

    if (auto activated = _conversations->setActive(conversation->id); !activated)
        return std::unexpected(activated.error());

    _displayedConversation = conversation->id;
    send(ViewCommand { ViewCommand::ConversationCreated { .id = conversation->id, .profileId = profileId } });
    send(ViewCommand { ViewCommand::ConversationActivated { .id = conversation->id } });
    publish(ConversationEvent { ConversationEvent::Created { .id = conversation->id, .title = conversation->title } });
    return conversation;
}

auto ChatPresenter::activeOrNewConversation() -> Result<Uuid>
{
    auto active = _conversations->getActive();
    if (!active)
        return std::unexpected(active.error());
    if (*active)
        return **active;

    auto conversation = createConversation();
    if (!conversation)
        return std::unexpected(conversation.error());
    return conversation->id;
}

void ChatPresenter::sendMessage(std::string_view text)
{
    auto const content = trim(text);
    if (content.empty())
        return;

    auto conversationId = activeOrNewConversation();
    if (!conversationId)
    {
        reportError(std::string(ChatErrorTitle), "Preparing conversation", conversationId.error());
        return;
    }

    auto const id = *conversationId;
    send(ViewCommand { ViewCommand::MessageAppended {
        .conversationId = id, .role = MessageRole::User, .content = std::string(content) } });
    send(ViewCommand { ViewCommand::ShowThinking { .conversationId = id } });

    if (auto sent = _chat->sendMessage(id, std::string(content)); !sent)
    {
        send(ViewCommand { ViewCommand::StreamError {
            .conversationId = id, .error = sent.error().message, .recoverable = false } });
        send(ViewCommand { ViewCommand::HideThinking { .conversationId = id } });
        reportError(std::string(ChatErrorTitle), "Sending message", sent.error());
    }
}

void ChatPresenter::newConversation()
{
    if (auto conversation = createConversation(); !conversation)
        reportError(std::string(ChatErrorTitle), "Creating conversation", conversation.error());
}

void ChatPresenter::renameConversation(Uuid id, const std::string& title)
{
    auto const newTitle = std::string(trim(title));
    if (auto renamed = _conversations->rename(id, newTitle); !renamed)
    {
        reportError(std::string(ChatErrorTitle), "Renaming conversation", renamed.error());
        return;
    }
    send(ViewCommand { ViewCommand::ConversationRenamed { .id = id, .title = newTitle } });
    publish(ConversationEvent { ConversationEvent::TitleUpdated { .id = id, .title = newTitle } });
}

void ChatPresenter::reloadTranscript(Uuid id)
{
    auto messages = _conversations->getMessages(id);
    if (!messages)
    {
        reportError(std::string(ChatErrorTitle), "Loading conversation", messages.error());
        return;
    }

    _displayedConversation = id;
    send(ViewCommand { ViewCommand::ConversationCleared {} });
    for (auto const& message: *messages)
    {
        send(ViewCommand { ViewCommand::MessageAppended {
            .conversationId = id, .role = message.role, .content = message.content } });
    }
}

} // namespace pagent
