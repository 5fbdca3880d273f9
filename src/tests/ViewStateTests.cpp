// SPDX-License-Identifier: Apache-2.0
#include <ui/ViewState.hpp>

#include <catch2/catch_test_macros.hpp>

#include <vector>

using namespace pagent;

namespace
{
    using VC = ViewCommand;

    void startStream(ViewState& view, Uuid id)
    {
        view.applyAll({
            VC { VC::ConversationActivated { .id = id } },
            VC { VC::MessageAppended { .conversationId = id, .role = MessageRole::User, .content = "hi" } },
            VC { VC::ShowThinking { .conversationId = id } },
        });
    }
} // namespace

TEST_CASE("ViewState accumulates a streamed reply into the transcript", "[viewstate]")
{
    auto view = ViewState {};
    auto const id = Uuid::generate();
    startStream(view, id);

    CHECK(view.isStreaming());
    CHECK(view.isThinkingIndicatorVisible());

    view.apply(VC { VC::AppendStream { .conversationId = id, .chunk = "You " } });
    view.apply(VC { VC::AppendStream { .conversationId = id, .chunk = "said" } });
    CHECK(view.streamBuffer() == "You said");

    view.apply(VC { VC::FinalizeStream { .conversationId = id, .tokens = 2 } });
    view.apply(VC { VC::HideThinking { .conversationId = id } });

    REQUIRE(view.transcript().size() == 2);
    CHECK(view.transcript()[0].role == MessageRole::User);
    CHECK(view.transcript()[1].role == MessageRole::Assistant);
    CHECK(view.transcript()[1].content == "You said");
    CHECK(!view.transcript()[1].cancelled);
    CHECK(view.streamBuffer().empty());
    CHECK(!view.isStreaming());
    CHECK(!view.isThinkingIndicatorVisible());
    CHECK(view.lastTokenCount() == 2u);
}

TEST_CASE("ViewState keeps the reasoning text with the reply", "[viewstate]")
{
    auto view = ViewState {};
    auto const id = Uuid::generate();
    startStream(view, id);

    view.apply(VC { VC::AppendThinking { .conversationId = id, .content = "pondering" } });
    view.apply(VC { VC::AppendStream { .conversationId = id, .chunk = "answer" } });
    view.apply(VC { VC::FinalizeStream { .conversationId = id, .tokens = std::nullopt } });

    REQUIRE(view.transcript().size() == 2);
    CHECK(view.transcript()[1].thinking == "pondering");
    CHECK(view.thinkingBuffer().empty());
}

TEST_CASE("ViewState marks a cancelled reply with its partial content", "[viewstate]")
{
    auto view = ViewState {};
    auto const id = Uuid::generate();
    startStream(view, id);

    view.apply(VC { VC::AppendStream { .conversationId = id, .chunk = "You " } });
    view.apply(VC { VC::StreamCancelled { .conversationId = id, .partialContent = "You " } });

    REQUIRE(view.transcript().size() == 2);
    CHECK(view.transcript()[1].content == "You ");
    CHECK(view.transcript()[1].cancelled);
    CHECK(!view.isStreaming());
}

TEST_CASE("ViewState discards the partial reply on a stream error", "[viewstate]")
{
    auto view = ViewState {};
    auto const id = Uuid::generate();
    startStream(view, id);

    view.apply(VC { VC::AppendStream { .conversationId = id, .chunk = "partial" } });
    view.apply(VC { VC::StreamError { .conversationId = id, .error = "boom", .recoverable = false } });

    CHECK(view.transcript().size() == 1);
    CHECK(view.lastStreamError() == "boom");
    CHECK(view.streamBuffer().empty());
    CHECK(!view.isStreaming());
}

TEST_CASE("ViewState ignores transcript updates of other conversations", "[viewstate]")
{
    auto view = ViewState {};
    auto const displayed = Uuid::generate();
    auto const other = Uuid::generate();
    startStream(view, displayed);

    view.apply(VC { VC::MessageAppended { .conversationId = other, .role = MessageRole::User, .content = "x" } });
    view.apply(VC { VC::AppendStream { .conversationId = other, .chunk = "y" } });

    CHECK(view.transcript().size() == 1);
    CHECK(view.streamBuffer().empty());
}

TEST_CASE("ViewState replaces the running tool call row on completion", "[viewstate]")
{
    auto view = ViewState {};
    auto const id = Uuid::generate();
    startStream(view, id);

    view.apply(VC { VC::ShowToolCall { .conversationId = id, .toolName = "search", .status = "running" } });
    view.apply(VC { VC::UpdateToolCall {
        .conversationId = id, .toolName = "search", .status = "completed", .result = "3 hits", .durationMs = 12 } });

    REQUIRE(view.toolCalls().size() == 1);
    CHECK(view.toolCalls()[0].status == "completed");
    CHECK(view.toolCalls()[0].result == "3 hits");
    CHECK(view.toolCalls()[0].durationMs == 12u);
}

TEST_CASE("ViewState clears the transcript when the conversation is cleared or deleted", "[viewstate]")
{
    auto view = ViewState {};
    auto const id = Uuid::generate();
    startStream(view, id);

    SECTION("cleared")
    {
        view.apply(VC { VC::ConversationCleared {} });
        CHECK(view.transcript().empty());
        CHECK(view.activeConversation() == id);
    }

    SECTION("deleted")
    {
        view.apply(VC { VC::ConversationDeleted { .id = id } });
        CHECK(view.transcript().empty());
        CHECK(!view.activeConversation().has_value());
    }
}

TEST_CASE("ViewState tracks the conversation list and titles", "[viewstate]")
{
    auto view = ViewState {};
    auto const first = Uuid::generate();
    auto const second = Uuid::generate();

    view.apply(VC { VC::ConversationListRefreshed {
        .conversations = {
            ConversationSummary { .id = first, .title = "First" },
            ConversationSummary { .id = second, .title = "Second" },
        } } });
    CHECK(view.conversations().size() == 2);
    CHECK(view.historyCount() == 2);

    view.apply(VC { VC::ConversationActivated { .id = second } });
    CHECK(view.activeTitle() == "Second");

    view.apply(VC { VC::ConversationTitleUpdated { .id = second, .title = "Renamed" } });
    CHECK(view.activeTitle() == "Renamed");
    CHECK(view.conversations()[1].title == "Renamed");

    view.apply(VC { VC::ConversationDeleted { .id = first } });
    REQUIRE(view.conversations().size() == 1);
    CHECK(view.conversations()[0].id == second);
}

TEST_CASE("ViewState tracks profiles and the default profile", "[viewstate]")
{
    auto view = ViewState {};
    auto const a = Uuid::generate();
    auto const b = Uuid::generate();

    view.apply(VC { VC::ShowSettings {
        .profiles = { ProfileSummary { .id = a, .name = "A", .isDefault = true }, ProfileSummary { .id = b, .name = "B" } },
        .mcpServers = {},
        .defaultProfileId = a,
    } });

    view.apply(VC { VC::DefaultProfileChanged { .profileId = b } });
    CHECK(view.defaultProfileId() == b);
    CHECK(!view.profiles()[0].isDefault);
    CHECK(view.profiles()[1].isDefault);

    view.apply(VC { VC::ProfileDeleted { .id = b } });
    CHECK(view.profiles().size() == 1);
    CHECK(!view.defaultProfileId().has_value());

    auto const c = Uuid::generate();
    view.apply(VC { VC::ProfileCreated { .id = c, .name = "C" } });
    view.apply(VC { VC::ProfileUpdated { .id = c, .name = "C2" } });
    REQUIRE(view.profiles().size() == 2);
    CHECK(view.profiles()[1].name == "C2");
}

TEST_CASE("ViewState follows MCP server status changes", "[viewstate]")
{
    auto view = ViewState {};
    auto const id = Uuid::generate();

    view.apply(VC { VC::McpConfigureLoaded {
        .config = McpConfig { .id = id, .name = "files", .command = "mcp-files", .args = {}, .env = {}, .enabled = false } } });
    REQUIRE(view.mcpServers().size() == 1);
    CHECK(view.mcpServers()[0].status == McpStatus::Stopped);
    CHECK(view.mcpConfigure().has_value());

    view.apply(VC { VC::McpStatusChanged { .id = id, .status = McpStatus::Starting } });
    CHECK(view.mcpServers()[0].enabled);

    view.apply(VC { VC::McpServerStarted { .id = id, .toolCount = 1 } });
    view.apply(VC { VC::McpToolsUpdated { .id = id, .tools = { ToolInfo { .name = "read_file", .description = {} } } } });
    CHECK(view.mcpServers()[0].status == McpStatus::Running);
    CHECK(view.mcpTools(id).size() == 1);

    view.apply(VC { VC::McpConfigSaved { .id = id } });
    CHECK(!view.mcpConfigure().has_value());

    view.apply(VC { VC::McpDeleted { .id = id } });
    CHECK(view.mcpServers().empty());
    CHECK(view.mcpTools(id).empty());
}

TEST_CASE("ViewState applies navigation, modal and error commands", "[viewstate]")
{
    auto view = ViewState {};
    auto const target = Uuid::generate();

    view.apply(VC { VC::NavigateTo { .view = ViewId::Settings } });
    view.apply(VC { VC::NavigateTo { .view = ViewId::ProfileEditor } });
    CHECK(view.navigation().current() == ViewId::ProfileEditor);
    view.apply(VC { VC::NavigateBack {} });
    CHECK(view.navigation().current() == ViewId::Settings);

    view.apply(VC { VC::ShowModal { .modal = ModalId::ConfirmDeleteProfile, .target = target } });
    REQUIRE(view.modal().has_value());
    CHECK(view.modal()->target == target);
    view.apply(VC { VC::DismissModal {} });
    CHECK(!view.modal().has_value());

    view.apply(VC { VC::ShowError { .title = "Oops", .message = "broken", .severity = ErrorSeverity::Warning } });
    REQUIRE(view.error().has_value());
    CHECK(view.error()->severity == ErrorSeverity::Warning);
    view.apply(VC { VC::ClearError {} });
    CHECK(!view.error().has_value());
}

TEST_CASE("ViewState records profile test progress", "[viewstate]")
{
    auto view = ViewState {};
    auto const id = Uuid::generate();

    view.apply(VC { VC::ProfileTestStarted { .id = id } });
    REQUIRE(view.profileTest().has_value());
    CHECK(view.profileTest()->running);

    view.apply(VC { VC::ProfileTestCompleted { .id = id, .success = false, .responseTimeMs = 5, .error = "refused" } });
    CHECK(!view.profileTest()->running);
    CHECK(view.profileTest()->error == "refused");
}

TEST_CASE("ViewState resets validation errors when a profile is loaded into the editor", "[viewstate]")
{
    auto view = ViewState {};

    view.apply(VC { VC::ProfileValidationFailed { .errors = { "Name is required" } } });
    CHECK(view.validationErrors().size() == 1);

    view.apply(VC { VC::ProfileEditorLoaded { .profile = ProfileDraft { .name = "Work" } } });
    REQUIRE(view.profileEditor().has_value());
    CHECK(view.profileEditor()->name == "Work");
    CHECK(view.validationErrors().empty());
}

TEST_CASE("ViewState keeps registry results and the selected model", "[viewstate]")
{
    auto view = ViewState {};

    view.apply(VC { VC::McpRegistryResults { .entries = { McpRegistryEntry { .name = "github", .trending = true } } } });
    REQUIRE(view.registryResults().size() == 1);
    CHECK(view.registryResults().front().name == "github");

    CHECK(!view.selectedModel().has_value());
    view.apply(VC { VC::ModelSelected { .providerId = "openai", .modelId = "gpt-4o", .contextLength = 128000 } });
    REQUIRE(view.selectedModel().has_value());
    CHECK(view.selectedModel()->modelId == "gpt-4o");
    CHECK(view.selectedModel()->contextLength == 128000u);
}
