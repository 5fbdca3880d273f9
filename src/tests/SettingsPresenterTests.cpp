// SPDX-License-Identifier: Apache-2.0
#include "PresenterFixture.hpp"

#include <presentation/ProfileEditorPresenter.hpp>
#include <presentation/SettingsPresenter.hpp>

#include <catch2/catch_test_macros.hpp>

#include <algorithm>

using namespace pagent;
using namespace pagent::test;

using VC = ViewCommand;
using UE = UserEvent;

namespace
{
    auto makeDraft(std::string name, std::optional<std::string> apiKey = std::nullopt) -> ProfileDraft
    {
        return ProfileDraft {
            .id = {},
            .name = std::move(name),
            .providerId = "openai",
            .modelId = "gpt-4o",
            .baseUrl = "https://api.openai.com/v1",
            .systemPrompt = "Be brief.",
            .apiKey = std::move(apiKey),
            .parameters = {},
        };
    }

    auto addServer(PresenterFixture& f, std::string name, bool enabled) -> Uuid
    {
        auto config = McpConfig {};
        config.name = std::move(name);
        config.command = "mcp-server";
        config.enabled = enabled;
        auto added = f.mcp->add(std::move(config));
        REQUIRE(added.has_value());
        return added->id;
    }

    void addSettings(PresenterFixture& f)
    {
        f.add<SettingsPresenter>(f.profiles, f.appSettings, f.mcp);
    }
} // namespace

// SettingsPresenter

TEST_CASE("Opening settings lists profiles and MCP servers", "[presenter][settings]")
{
    auto f = PresenterFixture {};
    auto const first = f.createProfile("First", false);
    auto const second = f.createProfile("Second", true);
    auto const server = addServer(f, "search", true);
    addSettings(f);

    f.emit(UE::Navigate { .to = ViewId::Settings });
    REQUIRE(f.collector.waitFor<VC::ShowSettings>());

    auto const settings = *f.collector.last<VC::ShowSettings>();
    REQUIRE(settings.profiles.size() == 2);
    CHECK(settings.profiles[0].id == first);
    CHECK(!settings.profiles[0].isDefault);
    CHECK(settings.profiles[1].isDefault);
    CHECK(settings.defaultProfileId == second);
    REQUIRE(settings.mcpServers.size() == 1);
    CHECK(settings.mcpServers[0].id == server);
    CHECK(settings.mcpServers[0].status == McpStatus::Running);
}

TEST_CASE("Selecting a profile makes it the default", "[presenter][settings]")
{
    auto f = PresenterFixture {};
    f.createProfile("First", true);
    auto const second = f.createProfile("Second", false);
    addSettings(f);

    f.emit(UE::SelectProfile { .id = second });
    REQUIRE(f.collector.waitFor<VC::DefaultProfileChanged>());

    CHECK(f.collector.last<VC::DefaultProfileChanged>()->profileId == second);
    CHECK(f.profiles->getDefault().value() == second);
    CHECK(f.appSettings->getDefaultProfileId().value() == second);
}

TEST_CASE("Selecting an unknown profile reports a settings error", "[presenter][settings]")
{
    auto f = PresenterFixture {};
    addSettings(f);

    f.emit(UE::SelectProfile { .id = Uuid::generate() });
    REQUIRE(f.collector.waitFor<VC::ShowError>());

    auto const error = f.collector.last<VC::ShowError>();
    CHECK(error->title == "Settings Error");
    CHECK(error->message.starts_with("Setting default profile: Profile "));
    CHECK(f.collector.count<VC::DefaultProfileChanged>() == 0);
}

TEST_CASE("Deleting a profile asks for confirmation first", "[presenter][settings]")
{
    auto f = PresenterFixture {};
    auto const id = f.createProfile("Doomed", true);
    addSettings(f);

    f.emit(UE::DeleteProfile { .id = id });
    REQUIRE(f.collector.waitFor<VC::ShowModal>());
    CHECK(f.collector.last<VC::ShowModal>()->modal == ModalId::ConfirmDeleteProfile);
    CHECK(f.collector.last<VC::ShowModal>()->target == id);
    CHECK(f.profiles->get(id).has_value());

    f.emit(UE::ConfirmDeleteProfile { .id = id });
    REQUIRE(f.collector.waitFor<VC::ProfileDeleted>());

    CHECK(f.collector.indexOf<VC::DismissModal>() < f.collector.indexOf<VC::ProfileDeleted>());
    CHECK(!f.profiles->get(id).has_value());
    CHECK(!f.profiles->getDefault().value().has_value());
}

TEST_CASE("Enabling an MCP server reports its startup and tools", "[presenter][settings][mcp]")
{
    auto f = PresenterFixture {};
    auto const id = addServer(f, "search", false);
    f.mcp->registerTools(id, { ToolInfo { .name = "web_search", .description = "" }, ToolInfo { .name = "fetch", .description = "" } });
    addSettings(f);

    f.emit(UE::ToggleMcp { .id = id, .enabled = true });
    REQUIRE(f.collector.waitFor<VC::McpToolsUpdated>());

    auto statuses = std::vector<McpStatus> {};
    for (auto const& command: f.collector.drain())
    {
        if (auto const* changed = command.get<VC::McpStatusChanged>())
            statuses.push_back(changed->status);
    }
    CHECK((statuses == std::vector { McpStatus::Starting, McpStatus::Running }));
    CHECK(f.collector.last<VC::McpServerStarted>()->toolCount == 2);
    CHECK(f.collector.last<VC::McpToolsUpdated>()->tools.size() == 2);
    CHECK(f.mcp->getStatus(id).value() == McpStatus::Running);
}

TEST_CASE("Disabling an MCP server marks it stopped", "[presenter][settings][mcp]")
{
    auto f = PresenterFixture {};
    auto const id = addServer(f, "search", true);
    addSettings(f);

    f.emit(UE::ToggleMcp { .id = id, .enabled = false });
    REQUIRE(f.collector.waitFor<VC::McpStatusChanged>());

    // Anything the toggle produced is queued ahead of the settings view.
    f.emit(UE::Navigate { .to = ViewId::Settings });
    REQUIRE(f.collector.waitFor<VC::ShowSettings>());

    CHECK(f.collector.count<VC::McpStatusChanged>() == 1);
    CHECK(f.collector.last<VC::McpStatusChanged>()->status == McpStatus::Stopped);
    CHECK(f.collector.count<VC::McpServerStarted>() == 0);
    CHECK(!f.mcp->get(id)->enabled);
}

TEST_CASE("Toggling an unknown MCP server reports a settings error", "[presenter][settings][mcp]")
{
    auto f = PresenterFixture {};
    addSettings(f);

    f.emit(UE::ToggleMcp { .id = Uuid::generate(), .enabled = true });
    REQUIRE(f.collector.waitFor<VC::ShowError>());
    CHECK(f.collector.last<VC::ShowError>()->message.starts_with("Enabling MCP server: MCP server "));
    CHECK(f.collector.count<VC::McpStatusChanged>() == 0);
}

TEST_CASE("Deleting an MCP server goes through the confirmation dialog", "[presenter][settings][mcp]")
{
    auto f = PresenterFixture {};
    auto const id = addServer(f, "search", true);
    addSettings(f);

    f.emit(UE::DeleteMcp { .id = id });
    REQUIRE(f.collector.waitFor<VC::ShowModal>());
    CHECK(f.collector.last<VC::ShowModal>()->modal == ModalId::ConfirmDeleteMcp);

    f.emit(UE::ConfirmDeleteMcp { .id = id });
    REQUIRE(f.collector.waitFor<VC::McpDeleted>());
    CHECK(f.collector.count<VC::DismissModal>() == 1);
    CHECK(f.mcp->list()->empty());
}

TEST_CASE("Configuration lifecycle events become notifications", "[presenter][settings]")
{
    auto f = PresenterFixture {};
    addSettings(f);

    f.publish(SystemEvent { SystemEvent::ConfigLoaded {} });
    f.publish(SystemEvent { SystemEvent::ModelsRegistryRefreshed { .providerCount = 2, .modelCount = 3 } });
    REQUIRE(f.collector.waitFor<VC::ShowNotification>(2));

    auto messages = std::vector<std::string> {};
    for (auto const& command: f.collector.drain())
    {
        if (auto const* notification = command.get<VC::ShowNotification>())
            messages.push_back(notification->message);
    }
    CHECK(messages[0] == "Configuration loaded");
    CHECK(messages[1] == "Model catalog updated: 3 models from 2 providers");
}

// ProfileEditorPresenter

TEST_CASE("Creating a profile opens an empty editor", "[presenter][profile]")
{
    auto f = PresenterFixture {};
    f.add<ProfileEditorPresenter>(f.profiles, f.secrets);

    f.emit(UE::CreateProfile {});
    REQUIRE(f.collector.waitFor<VC::NavigateTo>());

    auto const loaded = f.collector.last<VC::ProfileEditorLoaded>();
    REQUIRE(loaded.has_value());
    CHECK(loaded->profile.id.isNil());
    CHECK(loaded->profile.name.empty());
    CHECK(f.collector.last<VC::NavigateTo>()->view == ViewId::ProfileEditor);
}

TEST_CASE("Saving an invalid profile lists every validation problem", "[presenter][profile]")
{
    auto f = PresenterFixture {};
    f.add<ProfileEditorPresenter>(f.profiles, f.secrets);

    auto draft = makeDraft("");
    draft.baseUrl = "ftp://example.com";
    f.emit(UE::SaveProfile { .profile = draft });
    REQUIRE(f.collector.waitFor<VC::ProfileValidationFailed>());

    auto const errors = f.collector.last<VC::ProfileValidationFailed>()->errors;
    CHECK(errors.size() == 2);
    CHECK(std::ranges::find(errors, std::string("Name is required")) != errors.end());
    CHECK(f.collector.count<VC::NavigateBack>() == 0);
    CHECK(f.profiles->list()->empty());
}

TEST_CASE("Saving a new profile stores it with its API key", "[presenter][profile]")
{
    auto f = PresenterFixture {};
    f.add<ProfileEditorPresenter>(f.profiles, f.secrets);
    addSettings(f);

    f.emit(UE::SaveProfile { .profile = makeDraft("Work", "sk-test") });
    REQUIRE(f.collector.waitFor<VC::ProfileCreated>());

    auto const created = f.collector.last<VC::ProfileCreated>();
    CHECK(created->name == "Work");
    CHECK(f.collector.indexOf<VC::NavigateBack>() < f.collector.indexOf<VC::ProfileCreated>());
    CHECK(f.secrets->getApiKey(created->id).value() == "sk-test");
}

TEST_CASE("Editing a profile loads it together with its API key", "[presenter][profile]")
{
    auto f = PresenterFixture {};
    auto const id = f.createProfile("Work", false);
    REQUIRE(f.secrets->storeApiKey(id, "sk-stored").has_value());
    f.add<ProfileEditorPresenter>(f.profiles, f.secrets);
    addSettings(f);

    f.emit(UE::EditProfile { .id = id });
    REQUIRE(f.collector.waitFor<VC::ProfileEditorLoaded>());
    auto draft = f.collector.last<VC::ProfileEditorLoaded>()->profile;
    CHECK(draft.id == id);
    CHECK(draft.apiKey == "sk-stored");

    draft.name = "Home";
    f.emit(UE::SaveProfile { .profile = draft });
    REQUIRE(f.collector.waitFor<VC::ProfileUpdated>());
    CHECK(f.collector.last<VC::ProfileUpdated>()->name == "Home");
    CHECK(f.profiles->get(id)->name == "Home");
    CHECK(f.collector.count<VC::ProfileCreated>() == 0);
}

TEST_CASE("Editing an unknown profile reports a profile error", "[presenter][profile]")
{
    auto f = PresenterFixture {};
    f.add<ProfileEditorPresenter>(f.profiles, f.secrets);

    f.emit(UE::EditProfile { .id = Uuid::generate() });
    REQUIRE(f.collector.waitFor<VC::ShowError>());
    CHECK(f.collector.last<VC::ShowError>()->title == "Profile Error");
    CHECK(f.collector.count<VC::ProfileEditorLoaded>() == 0);
}

TEST_CASE("Testing a profile connection reports start and result", "[presenter][profile]")
{
    auto f = PresenterFixture {};
    f.add<ProfileEditorPresenter>(f.profiles, f.secrets);

    SECTION("reachable profile")
    {
        auto const id = f.createProfile("Local", false);
        f.emit(UE::TestProfileConnection { .id = id });
        REQUIRE(f.collector.waitFor<VC::ProfileTestCompleted>());

        CHECK(f.collector.indexOf<VC::ProfileTestStarted>() < f.collector.indexOf<VC::ProfileTestCompleted>());
        auto const completed = f.collector.last<VC::ProfileTestCompleted>();
        CHECK(completed->success);
        CHECK(completed->responseTimeMs.has_value());
        CHECK(f.collector.count<VC::ShowError>() == 0);
    }

    SECTION("missing profile")
    {
        f.emit(UE::TestProfileConnection { .id = Uuid::generate() });
        REQUIRE(f.collector.waitFor<VC::ShowError>());

        auto const completed = f.collector.last<VC::ProfileTestCompleted>();
        REQUIRE(completed.has_value());
        CHECK(!completed->success);
        CHECK(f.collector.last<VC::ShowError>()->title == "Connection Failed");
    }
}
