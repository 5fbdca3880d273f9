// SPDX-License-Identifier: Apache-2.0
#include "PresenterFixture.hpp"

#include <presentation/ErrorPresenter.hpp>
#include <presentation/McpAddPresenter.hpp>
#include <presentation/McpConfigurePresenter.hpp>
#include <presentation/ModelSelectorPresenter.hpp>
#include <presentation/SettingsPresenter.hpp>

#include <catch2/catch_test_macros.hpp>

using namespace pagent;
using namespace pagent::test;

using VC = ViewCommand;
using UE = UserEvent;

namespace
{
    auto entryNames(const std::vector<McpRegistryEntry>& entries) -> std::vector<std::string>
    {
        auto names = std::vector<std::string> {};
        for (auto const& entry: entries)
            names.push_back(entry.name);
        return names;
    }

    auto modelIds(const std::vector<ModelInfo>& models) -> std::vector<std::string>
    {
        auto ids = std::vector<std::string> {};
        for (auto const& model: models)
            ids.push_back(model.modelId);
        return ids;
    }
} // namespace

// McpAddPresenter

TEST_CASE("Adding an MCP server starts with the trending registry entries", "[presenter][mcp]")
{
    auto f = PresenterFixture {};
    f.add<McpAddPresenter>(f.registry, f.mcp);

    f.emit(UE::AddMcp {});
    REQUIRE(f.collector.waitFor<VC::NavigateTo>());

    auto const results = f.collector.last<VC::McpRegistryResults>();
    REQUIRE(results.has_value());
    CHECK(entryNames(results->entries) == std::vector<std::string> { "filesystem" });
    CHECK(f.collector.last<VC::NavigateTo>()->view == ViewId::McpAdd);
}

TEST_CASE("Searching the MCP registry matches names, descriptions and tags", "[presenter][mcp]")
{
    auto f = PresenterFixture {};
    f.add<McpAddPresenter>(f.registry, f.mcp);

    SECTION("by display name")
    {
        f.emit(UE::SearchMcpRegistry { .query = "GIT", .source = "" });
        REQUIRE(f.collector.waitFor<VC::McpRegistryResults>());
        CHECK(entryNames(f.collector.last<VC::McpRegistryResults>()->entries) == std::vector<std::string> { "github" });
    }

    SECTION("by tag within the local source")
    {
        f.emit(UE::SearchMcpRegistry { .query = "files", .source = "local" });
        REQUIRE(f.collector.waitFor<VC::McpRegistryResults>());
        CHECK(entryNames(f.collector.last<VC::McpRegistryResults>()->entries)
              == std::vector<std::string> { "filesystem" });
    }

    SECTION("unknown source")
    {
        f.emit(UE::SearchMcpRegistry { .query = "git", .source = "smithery" });
        REQUIRE(f.collector.waitFor<VC::McpRegistryResults>());
        CHECK(f.collector.last<VC::McpRegistryResults>()->entries.empty());
    }
}

TEST_CASE("Installing a registry entry adds a disabled server and opens its configuration", "[presenter][mcp]")
{
    auto f = PresenterFixture {};
    f.add<McpAddPresenter>(f.registry, f.mcp);

    f.emit(UE::SelectMcpFromRegistry { .source = "github" });
    REQUIRE(f.collector.waitFor<VC::NavigateTo>());

    auto const loaded = f.collector.last<VC::McpConfigureLoaded>();
    REQUIRE(loaded.has_value());
    CHECK(loaded->config.name == "GitHub");
    CHECK(loaded->config.command == "mcp-server-github");
    CHECK(loaded->config.source == "github");
    CHECK(!loaded->config.enabled);
    CHECK(f.collector.last<VC::NavigateTo>()->view == ViewId::McpConfigure);

    auto const servers = f.mcp->list();
    REQUIRE(servers->size() == 1);
    CHECK((*servers)[0].id == loaded->config.id);
    CHECK(f.mcp->getStatus(loaded->config.id).value() == McpStatus::Stopped);
}

TEST_CASE("Installing an unlisted server reports a registry error", "[presenter][mcp]")
{
    auto f = PresenterFixture {};
    f.add<McpAddPresenter>(f.registry, f.mcp);

    f.emit(UE::SelectMcpFromRegistry { .source = "nonexistent" });
    REQUIRE(f.collector.waitFor<VC::ShowError>());

    auto const error = f.collector.last<VC::ShowError>();
    CHECK(error->title == "MCP Registry Error");
    CHECK(error->message == "Server 'nonexistent' is not listed in the registry");
    CHECK(f.mcp->list()->empty());
}

// McpConfigurePresenter

TEST_CASE("Configuring an MCP server loads and saves its settings", "[presenter][mcp]")
{
    auto f = PresenterFixture {};
    auto config = McpConfig {};
    config.name = "files";
    config.command = "mcp-server-filesystem";
    auto const added = f.mcp->add(config);
    REQUIRE(added.has_value());
    auto const id = added->id;
    f.add<McpConfigurePresenter>(f.mcp, f.secrets);

    f.emit(UE::ConfigureMcp { .id = id });
    REQUIRE(f.collector.waitFor<VC::McpConfigureLoaded>());
    CHECK(f.collector.last<VC::McpConfigureLoaded>()->config.name == "files");

    SECTION("valid change")
    {
        auto changed = *added;
        changed.args = { "/home" };
        changed.env = { { "LOG", "debug" } };
        f.emit(UE::SaveMcpConfig { .id = id, .config = changed });
        REQUIRE(f.collector.waitFor<VC::McpConfigSaved>());

        CHECK(f.collector.last<VC::McpConfigSaved>()->id == id);
        CHECK(f.collector.indexOf<VC::NavigateBack>() < f.collector.indexOf<VC::McpConfigSaved>());
        auto const stored = f.mcp->get(id);
        CHECK(stored->args == std::vector<std::string> { "/home" });
        CHECK(stored->env.at("LOG") == "debug");
    }

    SECTION("disabling through the form")
    {
        auto changed = *added;
        changed.enabled = false;
        f.emit(UE::SaveMcpConfig { .id = id, .config = changed });
        REQUIRE(f.collector.waitFor<VC::McpConfigSaved>());

        CHECK(f.mcp->getStatus(id).value() == McpStatus::Stopped);
        CHECK(f.mcp->listEnabled()->empty());
    }

    SECTION("missing command")
    {
        auto changed = *added;
        changed.command.clear();
        f.emit(UE::SaveMcpConfig { .id = id, .config = changed });
        REQUIRE(f.collector.waitFor<VC::ShowError>());

        CHECK(f.collector.last<VC::ShowError>()->title == "MCP Configuration Error");
        CHECK(f.collector.last<VC::ShowError>()->message == "Saving MCP server: MCP server 'files' has no command");
        CHECK(f.collector.count<VC::McpConfigSaved>() == 0);
        CHECK(f.mcp->get(id)->command == "mcp-server-filesystem");
    }
}

TEST_CASE("Configuring an unknown MCP server reports an error", "[presenter][mcp]")
{
    auto f = PresenterFixture {};
    f.add<McpConfigurePresenter>(f.mcp, f.secrets);

    f.emit(UE::ConfigureMcp { .id = Uuid::generate() });
    REQUIRE(f.collector.waitFor<VC::ShowError>());
    CHECK(f.collector.last<VC::ShowError>()->message.starts_with("Loading MCP server: "));
}

TEST_CASE("MCP OAuth uses stored provider credentials", "[presenter][mcp]")
{
    auto f = PresenterFixture {};
    auto const id = Uuid::generate();
    f.add<McpConfigurePresenter>(f.mcp, f.secrets);

    SECTION("no credentials")
    {
        f.emit(UE::StartMcpOAuth { .id = id, .provider = "github" });
        REQUIRE(f.collector.waitFor<VC::ShowError>());

        auto const error = f.collector.last<VC::ShowError>();
        CHECK(error->title == "OAuth Required");
        CHECK(error->severity == ErrorSeverity::Warning);
    }

    SECTION("stored token")
    {
        REQUIRE(f.secrets->store(McpConfigurePresenter::oauthTokenKey("github"), "gho_token").has_value());
        f.emit(UE::StartMcpOAuth { .id = id, .provider = "github" });
        REQUIRE(f.collector.waitFor<VC::ShowNotification>());

        CHECK(f.collector.last<VC::ShowNotification>()->message.starts_with("Using stored github credentials"));
        CHECK(f.collector.count<VC::ShowError>() == 0);
    }
}

TEST_CASE("The OAuth token key is namespaced by provider", "[presenter][mcp]")
{
    CHECK(McpConfigurePresenter::oauthTokenKey("github") == "oauth.github");
}

// ModelSelectorPresenter

TEST_CASE("Model selector searches and filters the catalog", "[presenter][models]")
{
    auto f = PresenterFixture {};
    f.add<ModelSelectorPresenter>(f.models);

    f.emit(UE::OpenModelSelector {});
    REQUIRE(f.collector.waitFor<VC::NavigateTo>());
    CHECK(f.collector.last<VC::ModelSearchResults>()->models.size() == 3);
    CHECK(f.collector.last<VC::NavigateTo>()->view == ViewId::ModelSelector);

    f.emit(UE::FilterModelsByProvider { .providerId = "openai" });
    REQUIRE(f.collector.waitFor<VC::ModelSearchResults>(2));
    CHECK((modelIds(f.collector.last<VC::ModelSearchResults>()->models)
           == std::vector<std::string> { "gpt-4o", "gpt-4o-mini" }));

    f.emit(UE::SearchModels { .query = " MINI " });
    REQUIRE(f.collector.waitFor<VC::ModelSearchResults>(3));
    CHECK(modelIds(f.collector.last<VC::ModelSearchResults>()->models) == std::vector<std::string> { "gpt-4o-mini" });

    f.emit(UE::FilterModelsByProvider { .providerId = "anthropic" });
    REQUIRE(f.collector.waitFor<VC::ModelSearchResults>(4));
    CHECK(f.collector.last<VC::ModelSearchResults>()->models.empty());

    SECTION("reopening resets the query and the filter")
    {
        f.emit(UE::OpenModelSelector {});
        REQUIRE(f.collector.waitFor<VC::ModelSearchResults>(5));
        CHECK(f.collector.last<VC::ModelSearchResults>()->models.size() == 3);
    }
}

TEST_CASE("Selecting a model returns to the previous view", "[presenter][models]")
{
    auto f = PresenterFixture {};
    f.add<ModelSelectorPresenter>(f.models);

    SECTION("known model")
    {
        f.emit(UE::SelectModel { .providerId = "anthropic", .modelId = "claude-sonnet" });
        REQUIRE(f.collector.waitFor<VC::NavigateBack>());

        auto const selected = f.collector.last<VC::ModelSelected>();
        REQUIRE(selected.has_value());
        CHECK(selected->providerId == "anthropic");
        CHECK(selected->contextLength == 200000u);
    }

    SECTION("unknown model")
    {
        f.emit(UE::SelectModel { .providerId = "openai", .modelId = "gpt-9" });
        REQUIRE(f.collector.waitFor<VC::ShowError>());

        CHECK(f.collector.last<VC::ShowError>()->title == "Model Catalog Error");
        CHECK(f.collector.last<VC::ShowError>()->message == "Unknown model openai/gpt-9");
        CHECK(f.collector.count<VC::NavigateBack>() == 0);
    }
}

TEST_CASE("A refreshed model catalog updates the open results", "[presenter][models]")
{
    auto f = PresenterFixture {};
    f.add<ModelSelectorPresenter>(f.models);

    f.publish(SystemEvent { SystemEvent::ModelsRegistryRefreshed { .providerCount = 2, .modelCount = 3 } });
    REQUIRE(f.collector.waitFor<VC::ModelSearchResults>());
    CHECK(f.collector.count<VC::NavigateTo>() == 0);
}

// ErrorPresenter

TEST_CASE("System errors are shown as critical with their context", "[presenter][error]")
{
    auto f = PresenterFixture {};
    f.add<ErrorPresenter>();

    f.publish(SystemEvent { SystemEvent::Error { .source = "Storage", .error = "disk full", .context = "saving" } });
    REQUIRE(f.collector.waitFor<VC::ShowError>());

    auto const error = f.collector.last<VC::ShowError>();
    CHECK(error->title == "Storage Error");
    CHECK(error->message == "Storage: disk full\nContext: saving");
    CHECK(error->severity == ErrorSeverity::Critical);
}

TEST_CASE("Background failures are mapped to user facing errors", "[presenter][error]")
{
    auto f = PresenterFixture {};
    f.add<ErrorPresenter>();

    SECTION("model catalog refresh")
    {
        f.publish(SystemEvent { SystemEvent::ModelsRegistryRefreshFailed { .error = "offline" } });
        REQUIRE(f.collector.waitFor<VC::ShowError>());
        CHECK(f.collector.last<VC::ShowError>()->title == "Model Catalog");
        CHECK(f.collector.last<VC::ShowError>()->severity == ErrorSeverity::Warning);
    }

    SECTION("chat stream")
    {
        f.publish(ChatEvent { ChatEvent::StreamError { .conversationId = Uuid::generate(), .error = "timeout", .recoverable = true } });
        REQUIRE(f.collector.waitFor<VC::ShowError>());
        CHECK(f.collector.last<VC::ShowError>()->title == "Chat Error");
        CHECK(f.collector.last<VC::ShowError>()->severity == ErrorSeverity::Warning);
    }

    SECTION("MCP server start")
    {
        f.publish(McpEvent { McpEvent::StartFailed { .id = Uuid::generate(), .name = "search", .error = "exit 1" } });
        REQUIRE(f.collector.waitFor<VC::ShowError>());
        CHECK(f.collector.last<VC::ShowError>()->title == "MCP Server Error");
        CHECK(f.collector.last<VC::ShowError>()->message == "search failed to start: exit 1");
    }

    SECTION("unhealthy MCP server")
    {
        f.publish(McpEvent { McpEvent::Unhealthy { .id = Uuid::generate(), .name = "search", .error = "no ping" } });
        REQUIRE(f.collector.waitFor<VC::ShowError>());
        CHECK(f.collector.last<VC::ShowError>()->title == "MCP Server Unhealthy");
    }
}

TEST_CASE("Failed MCP starts update the settings list and raise one error", "[presenter][error][settings]")
{
    auto f = PresenterFixture {};
    f.add<ErrorPresenter>();
    f.add<SettingsPresenter>(f.profiles, f.appSettings, f.mcp);

    auto const id = Uuid::generate();
    f.publish(McpEvent { McpEvent::StartFailed { .id = id, .name = "search", .error = "exit 1" } });
    REQUIRE(f.collector.waitFor<VC::McpServerFailed>());
    REQUIRE(f.collector.waitFor<VC::ShowError>());

    CHECK(f.collector.last<VC::McpStatusChanged>()->status == McpStatus::Failed);
    CHECK(f.collector.count<VC::ShowError>() == 1);
}
