// SPDX-License-Identifier: Apache-2.0
#include "ConsoleController.hpp"

#include <core/StringUtils.hpp>

#include <algorithm>
#include <charconv>
#include <format>
#include <utility>

namespace pagent
{

namespace
{
    constexpr auto HelpText = std::string_view {
        "Commands:\n"
        "  <text>                       send a chat message\n"
        "  /tool NAME                   ask the assistant to call tool NAME\n"
        "  /new  /stop  /thinking       new conversation, stop streaming, toggle thinking\n"
        "  /chat  /history  /settings   switch view\n"
        "  /back                        go back to the previous view\n"
        "  /open N  /rename N TITLE  /delete N\n"
        "  /default N                   make profile N the default\n"
        "  /profile new|edit N|set FIELD VALUE|save|test N|delete N\n"
        "  /mcp add|search Q|install NAME|toggle N|configure N|set FIELD VALUE|save|oauth N PROVIDER|delete N\n"
        "  /models [search Q|provider ID|provider all]  /model N\n"
        "  /confirm  /cancel            answer the open dialog\n"
        "  /popover                     toggle the popover\n"
        "  /help  /quit"
    };

    template <typename T>
    auto parseNumber(std::string_view text) -> std::optional<T>
    {
        auto value = T {};
        auto const* const end = text.data() + text.size();
        auto const [ptr, ec] = std::from_chars(text.data(), end, value);
        if (ec != std::errc {} || ptr != end)
            return std::nullopt;
        return value;
    }

    auto splitWords(std::string_view text) -> std::vector<std::string>
    {
        auto words = std::vector<std::string> {};
        auto rest = trim(text);
        while (!rest.empty())
        {
            auto [word, tail] = splitFirstWord(rest);
            words.emplace_back(word);
            rest = tail;
        }
        return words;
    }
} // namespace

auto splitFirstWord(std::string_view text) -> std::pair<std::string_view, std::string_view>
{
    text = trim(text);
    auto const space = text.find_first_of(" \t");
    if (space == std::string_view::npos)
        return { text, {} };
    return { text.substr(0, space), trim(text.substr(space)) };
}

auto parseIndex(std::string_view text) -> std::optional<std::size_t>
{
    auto const index = parseNumber<std::size_t>(trim(text));
    if (!index || *index == 0)
        return std::nullopt;
    return index;
}

ConsoleController::ConsoleController(UiBridge& bridge, ViewState& view, PopoverController& popover):
    _bridge(bridge), _view(view), _popover(popover)
{
}

auto ConsoleController::helpText() -> std::string_view
{
    return HelpText;
}

auto ConsoleController::takeOutput() -> std::vector<std::string>
{
    return std::exchange(_output, {});
}

void ConsoleController::print(std::string message)
{
    _output.push_back(std::move(message));
}

void ConsoleController::emit(UserEvent::Variant event)
{
    if (!_bridge.emit(UserEvent { std::move(event) }))
        print("Input dropped: the runtime is busy or gone");
}

void ConsoleController::navigate(ViewId view)
{
    _view.navigation().navigate(view);
    emit(UserEvent::Navigate { .to = view });
}

void ConsoleController::back()
{
    if (!_view.navigation().navigateBack())
        print("Already at the home view");
    emit(UserEvent::NavigateBack {});
}

void ConsoleController::applyCommands(const std::vector<ViewCommand>& commands)
{
    for (auto const& command: commands)
    {
        _view.apply(command);
        if (auto const* loaded = command.get<ViewCommand::ProfileEditorLoaded>())
            _profileDraft = loaded->profile;
        else if (auto const* loaded = command.get<ViewCommand::McpConfigureLoaded>())
            _mcpDraft = loaded->config;
    }
}

auto ConsoleController::conversationAt(std::string_view index) -> std::optional<Uuid>
{
    auto const position = parseIndex(index);
    auto const& list = _view.conversations();
    if (!position || *position > list.size())
    {
        print(std::format("No conversation #{} (use /history)", index));
        return std::nullopt;
    }
    return list[*position - 1].id;
}

auto ConsoleController::profileAt(std::string_view index) -> std::optional<Uuid>
{
    auto const position = parseIndex(index);
    auto const& list = _view.profiles();
    if (!position || *position > list.size())
    {
        print(std::format("No profile #{} (use /settings)", index));
        return std::nullopt;
    }
    return list[*position - 1].id;
}

auto ConsoleController::mcpServerAt(std::string_view index) -> std::optional<Uuid>
{
    auto const position = parseIndex(index);
    auto const& list = _view.mcpServers();
    if (!position || *position > list.size())
    {
        print(std::format("No MCP server #{} (use /settings)", index));
        return std::nullopt;
    }
    return list[*position - 1].id;
}

auto ConsoleController::handleLine(std::string_view line) -> Outcome
{
    auto const input = trim(line);
    if (input.empty())
        return Outcome::Continue;

    if (!input.starts_with('/'))
    {
        emit(UserEvent::SendMessage { .text = std::string(input) });
        return Outcome::Continue;
    }

    auto const [command, args] = splitFirstWord(input);

    if (command == "/quit" || command == "/exit")
        return Outcome::Quit;

    if (command == "/help")
        print(std::string(HelpText));
    else if (command == "/new")
        emit(UserEvent::NewConversation {});
    else if (command == "/tool")
        emit(UserEvent::SendMessage { .text = std::string(input) });
    else if (command == "/stop")
        emit(UserEvent::StopStreaming {});
    else if (command == "/thinking")
        emit(UserEvent::ToggleThinking {});
    else if (command == "/chat")
        navigate(ViewId::Chat);
    else if (command == "/history")
        navigate(ViewId::History);
    else if (command == "/settings")
        navigate(ViewId::Settings);
    else if (command == "/back")
        back();
    else if (command == "/open" || command == "/rename" || command == "/delete")
        handleConversationCommand(command, args);
    else if (command == "/default")
    {
        if (auto id = profileAt(args))
            emit(UserEvent::SelectProfile { .id = *id });
    }
    else if (command == "/profile")
        handleProfileCommand(args);
    else if (command == "/mcp")
        handleMcpCommand(args);
    else if (command == "/models")
        handleModelsCommand(args);
    else if (command == "/model")
    {
        auto const position = parseIndex(args);
        auto const& models = _view.modelResults();
        if (!position || *position > models.size())
            print(std::format("No model #{} (use /models)", args));
        else
            emit(UserEvent::SelectModel { .providerId = models[*position - 1].providerId,
                                          .modelId = models[*position - 1].modelId });
    }
    else if (command == "/confirm")
        confirmModal();
    else if (command == "/cancel")
        cancelModal();
    else if (command == "/popover")
        _popover.requestToggle(PopoverAnchor {});
    else
        print(std::format("Unknown command: {}", command));

    return Outcome::Continue;
}

void ConsoleController::handleConversationCommand(std::string_view command, std::string_view args)
{
    auto const [index, rest] = splitFirstWord(args);
    auto const id = conversationAt(index);
    if (!id)
        return;

    if (command == "/open")
        emit(UserEvent::SelectConversation { .id = *id });
    else if (command == "/delete")
        emit(UserEvent::DeleteConversation { .id = *id });
    else if (rest.empty())
        print("Usage: /rename N TITLE");
    else
    {
        emit(UserEvent::StartRenameConversation { .id = *id });
        emit(UserEvent::ConfirmRenameConversation { .id = *id, .title = std::string(rest) });
    }
}

void ConsoleController::handleProfileCommand(std::string_view args)
{
    auto const [action, rest] = splitFirstWord(args);

    if (action == "new")
        emit(UserEvent::CreateProfile {});
    else if (action == "edit")
    {
        if (auto id = profileAt(rest))
            emit(UserEvent::EditProfile { .id = *id });
    }
    else if (action == "test")
    {
        if (auto id = profileAt(rest))
            emit(UserEvent::TestProfileConnection { .id = *id });
    }
    else if (action == "delete")
    {
        if (auto id = profileAt(rest))
            emit(UserEvent::DeleteProfile { .id = *id });
    }
    else if (action == "save")
    {
        if (!_profileDraft)
            print("No profile is being edited (use /profile new or /profile edit N)");
        else
            emit(UserEvent::SaveProfile { .profile = *_profileDraft });
    }
    else if (action == "set")
    {
        if (!_profileDraft)
        {
            print("No profile is being edited (use /profile new or /profile edit N)");
            return;
        }

        auto const [field, value] = splitFirstWord(rest);
        auto& draft = *_profileDraft;
        if (field == "name")
            draft.name = value;
        else if (field == "provider")
            draft.providerId = value;
        else if (field == "model")
            draft.modelId = value;
        else if (field == "url")
            draft.baseUrl = value;
        else if (field == "prompt")
            draft.systemPrompt = value;
        else if (field == "key")
            draft.apiKey = std::string(value);
        else if (field == "thinking")
            draft.parameters.showThinking = value == "on" || value == "true";
        else if (field == "temperature")
        {
            if (auto number = parseNumber<double>(value))
                draft.parameters.temperature = *number;
            else
                print(std::format("Not a number: {}", value));
        }
        else if (field == "maxTokens")
        {
            if (auto number = parseNumber<int>(value))
                draft.parameters.maxTokens = *number;
            else
                print(std::format("Not a number: {}", value));
        }
        else
            print(std::format("Unknown profile field: {}", field));
    }
    else
        print("Usage: /profile new|edit N|set FIELD VALUE|save|test N|delete N");
}

void ConsoleController::handleMcpCommand(std::string_view args)
{
    auto const [action, rest] = splitFirstWord(args);

    if (action == "add")
        emit(UserEvent::AddMcp {});
    else if (action == "search")
        emit(UserEvent::SearchMcpRegistry { .query = std::string(rest), .source = {} });
    else if (action == "install")
    {
        if (rest.empty())
            print("Usage: /mcp install NAME");
        else
            emit(UserEvent::SelectMcpFromRegistry { .source = std::string(rest) });
    }
    else if (action == "toggle")
    {
        auto const id = mcpServerAt(rest);
        if (!id)
            return;
        auto const& servers = _view.mcpServers();
        auto const server = std::ranges::find(servers, *id, &McpSummary::id);
        auto const enabled = server != servers.end() && server->enabled;
        emit(UserEvent::ToggleMcp { .id = *id, .enabled = !enabled });
    }
    else if (action == "configure")
    {
        if (auto id = mcpServerAt(rest))
            emit(UserEvent::ConfigureMcp { .id = *id });
    }
    else if (action == "delete")
    {
        if (auto id = mcpServerAt(rest))
            emit(UserEvent::DeleteMcp { .id = *id });
    }
    else if (action == "oauth")
    {
        auto const [index, provider] = splitFirstWord(rest);
        auto const id = mcpServerAt(index);
        if (!id)
            return;
        if (provider.empty())
            print("Usage: /mcp oauth N PROVIDER");
        else
            emit(UserEvent::StartMcpOAuth { .id = *id, .provider = std::string(provider) });
    }
    else if (action == "save")
    {
        if (!_mcpDraft)
            print("No MCP server is being configured (use /mcp configure N)");
        else
            emit(UserEvent::SaveMcpConfig { .id = _mcpDraft->id, .config = *_mcpDraft });
    }
    else if (action == "set")
    {
        if (!_mcpDraft)
        {
            print("No MCP server is being configured (use /mcp configure N)");
            return;
        }

        auto const [field, value] = splitFirstWord(rest);
        if (field == "name")
            _mcpDraft->name = value;
        else if (field == "command")
            _mcpDraft->command = value;
        else if (field == "args")
            _mcpDraft->args = splitWords(value);
        else if (field == "enabled")
            _mcpDraft->enabled = value == "on" || value == "true";
        else if (field == "env")
        {
            auto const separator = value.find('=');
            if (separator == std::string_view::npos)
                print("Usage: /mcp set env KEY=VALUE");
            else
                _mcpDraft->env[std::string(value.substr(0, separator))] = std::string(value.substr(separator + 1));
        }
        else
            print(std::format("Unknown MCP field: {}", field));
    }
    else
        print("Usage: /mcp add|search Q|install NAME|toggle N|configure N|set FIELD VALUE|save|oauth N PROVIDER|delete N");
}

void ConsoleController::handleModelsCommand(std::string_view args)
{
    auto const [action, rest] = splitFirstWord(args);

    if (action.empty())
        emit(UserEvent::OpenModelSelector {});
    else if (action == "search")
        emit(UserEvent::SearchModels { .query = std::string(rest) });
    else if (action == "provider")
    {
        auto providerId = rest.empty() || rest == "all" ? std::nullopt : std::optional<std::string>(rest);
        emit(UserEvent::FilterModelsByProvider { .providerId = std::move(providerId) });
    }
    else
        print("Usage: /models [search Q|provider ID|provider all]");
}

void ConsoleController::confirmModal()
{
    auto const& modal = _view.modal();
    if (!modal || !modal->target)
    {
        print("Nothing to confirm");
        return;
    }

    switch (modal->modal)
    {
        case ModalId::ConfirmDeleteProfile: emit(UserEvent::ConfirmDeleteProfile { .id = *modal->target }); break;
        case ModalId::ConfirmDeleteMcp: emit(UserEvent::ConfirmDeleteMcp { .id = *modal->target }); break;
        case ModalId::ConfirmDeleteConversation: emit(UserEvent::DeleteConversation { .id = *modal->target }); break;
        case ModalId::RenameConversation: print("Use /rename N TITLE to rename a conversation"); break;
    }
}

void ConsoleController::cancelModal()
{
    auto const& modal = _view.modal();
    if (!modal)
    {
        print("No dialog is open");
        return;
    }

    if (modal->modal == ModalId::RenameConversation)
        emit(UserEvent::CancelRenameConversation {});
    else
        _view.apply(ViewCommand { ViewCommand::DismissModal {} });
}

} // namespace pagent
