// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <bridge/UiBridge.hpp>
#include <ui/PopoverController.hpp>
#include <ui/ViewState.hpp>

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace pagent
{

/// @brief Translates console input lines into user events and UI-local actions.
///
/// This is the UI side of the console front end. Plain text is sent as a chat message and
/// lines starting with '/' are commands. Lists are addressed by their 1-based position in
/// the current ViewState.
class ConsoleController
{
  public:
    enum class Outcome
    {
        Continue,
        Quit,
    };

    ConsoleController(UiBridge& bridge, ViewState& view, PopoverController& popover);

    /// @brief Handles one input line.
    auto handleLine(std::string_view line) -> Outcome;

    /// @brief Applies drained commands to the view state and keeps local editor copies in sync.
    void applyCommands(const std::vector<ViewCommand>& commands);

    /// @brief Messages produced for the user since the last call (help text, usage errors).
    [[nodiscard]] auto takeOutput() -> std::vector<std::string>;

    [[nodiscard]] static auto helpText() -> std::string_view;

  private:
    void emit(UserEvent::Variant event);
    void navigate(ViewId view);
    void back();
    void print(std::string message);

    void handleConversationCommand(std::string_view command, std::string_view args);
    void handleProfileCommand(std::string_view args);
    void handleMcpCommand(std::string_view args);
    void handleModelsCommand(std::string_view args);
    void confirmModal();
    void cancelModal();

    [[nodiscard]] auto conversationAt(std::string_view index) -> std::optional<Uuid>;
    [[nodiscard]] auto profileAt(std::string_view index) -> std::optional<Uuid>;
    [[nodiscard]] auto mcpServerAt(std::string_view index) -> std::optional<Uuid>;

    UiBridge& _bridge;
    ViewState& _view;
    PopoverController& _popover;
    std::vector<std::string> _output;

    // Editable copies of the forms currently loaded into the view.
    std::optional<ProfileDraft> _profileDraft;
    std::optional<McpConfig> _mcpDraft;
};

/// @brief Splits @p text at the first run of whitespace.
[[nodiscard]] auto splitFirstWord(std::string_view text) -> std::pair<std::string_view, std::string_view>;

/// @brief Parses a 1-based list position, std::nullopt when not a positive number.
[[nodiscard]] auto parseIndex(std::string_view text) -> std::optional<std::size_t>;

} // namespace pagent
