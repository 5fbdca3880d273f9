// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <presentation/Presenter.hpp>
#include <services/ChatService.hpp>
#include <services/ConversationService.hpp>
#include <services/ProfileService.hpp>

#include <memory>

namespace pagent
{

/// @brief Drives the chat view: sending messages, streaming replies and the visible transcript.
class ChatPresenter final: public Presenter
{
  public:
    static constexpr std::string_view NewConversationTitle = "New Conversation";

    ChatPresenter(std::shared_ptr<EventBus> bus,
                  ViewCommandSink sink,
                  std::shared_ptr<ConversationService> conversations,
                  std::shared_ptr<ChatService> chat,
                  std::shared_ptr<ProfileService> profiles);
    ~ChatPresenter() override;

  protected:
    void handleEvent(const AppEvent& event) override;

  private:
    void handleUserEvent(const UserEvent& event);
    void handleChatEvent(const ChatEvent& event);
    void handleConversationEvent(const ConversationEvent& event);

    void sendMessage(std::string_view text);
    void newConversation();
    void renameConversation(Uuid id, const std::string& title);
    void reloadTranscript(Uuid id);

    /// @brief Creates a conversation bound to the default profile and makes it active.
    auto createConversation() -> Result<Conversation>;

    /// @brief Returns the active conversation, creating one when there is none.
    auto activeOrNewConversation() -> Result<Uuid>;

    std::shared_ptr<ConversationService> _conversations;
    std::shared_ptr<ChatService> _chat;
    std::shared_ptr<ProfileService> _profiles;

    // Worker-thread state.
    Uuid _displayedConversation;
    Uuid _streamConversation;
};

} // namespace pagent
