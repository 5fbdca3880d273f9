// SPDX-License-Identifier: Apache-2.0
#include "App.hpp"

#include <bridge/UiBridge.hpp>
#include <bridge/UserEventForwarder.hpp>
#include <core/Channel.hpp>
#include <core/Log.hpp>
#include <events/EventBus.hpp>
#include <presentation/ChatPresenter.hpp>
#include <presentation/ErrorPresenter.hpp>
#include <presentation/HistoryPresenter.hpp>
#include <presentation/McpAddPresenter.hpp>
#include <presentation/McpConfigurePresenter.hpp>
#include <presentation/ModelSelectorPresenter.hpp>
#include <presentation/ProfileEditorPresenter.hpp>
#include <presentation/SettingsPresenter.hpp>
#include <services/EchoChatService.hpp>
#include <services/InMemoryAppSettingsService.hpp>
#include <services/InMemoryConversationService.hpp>
#include <services/InMemoryMcpService.hpp>
#include <services/InMemoryProfileService.hpp>
#include <services/InMemorySecretsService.hpp>
#include <services/StaticMcpRegistryService.hpp>
#include <services/StaticModelsRegistryService.hpp>
#include <ui/ConsoleController.hpp>
#include <ui/PopoverController.hpp>
#include <ui/ViewState.hpp>

#include <chrono>
#include <condition_variable>
#include <format>
#include <mutex>
#include <optional>
#include <print>
#include <string>
#include <thread>
#include <vector>

namespace pagent
{

namespace
{
    constexpr auto LineQueueCapacity = std::size_t { 256 };
    constexpr auto EchoChunkDelay = std::chrono::milliseconds { 20 };

    /// Number of consecutive quiet ticks after which the runtime is considered settled.
    constexpr auto SettleTicks = 2;

    /// Popover stand-in for the console: it only reports its state.
    class ConsolePopoverHost final: public PopoverHost
    {
      public:
        void show(PopoverAnchor anchor) override
        {
            _shown = true;
            std::println("[popover shown at {},{}]", anchor.x, anchor.y);
        }

        void close() override
        {
            _shown = false;
            std::println("[popover hidden]");
        }

        [[nodiscard]] auto isShown() const -> bool override { return _shown; }

      private:
        bool _shown = false;
    };

    auto draftFromSeed(const ProfileSeed& seed) -> ProfileDraft
    {
        return ProfileDraft {
            .id = {},
            .name = seed.name,
            .providerId = seed.providerId,
            .modelId = seed.modelId,
            .baseUrl = seed.baseUrl,
            .systemPrompt = seed.systemPrompt,
            .apiKey = std::nullopt,
            .parameters = seed.parameters,
        };
    }

    /// Profile used when the configuration defines none, so the chat works out of the box.
    auto builtinProfile() -> ProfileSeed
    {
        return ProfileSeed {
            .name = "Local Echo",
            .providerId = "local",
            .modelId = "echo",
            .baseUrl = {},
            .systemPrompt = {},
            .parameters = {},
            .isDefault = true,
        };
    }
} // namespace

struct App::Impl
{
    explicit Impl(AppConfig cfg): config(std::move(cfg)) {}

    ~Impl() { shutdownRuntime(); }

    AppConfig config;

    // UI wake-up, signalled by the view command sink from presenter threads.
    std::mutex wakeMutex;
    std::condition_variable_any wakeCondition;
    bool wakeRequested = false;

    std::shared_ptr<EventBus> bus;

    std::shared_ptr<InMemoryConversationService> conversations;
    std::shared_ptr<InMemoryProfileService> profiles;
    std::shared_ptr<InMemorySecretsService> secrets;
    std::shared_ptr<InMemoryAppSettingsService> appSettings;
    std::shared_ptr<InMemoryMcpService> mcp;
    std::shared_ptr<StaticMcpRegistryService> mcpRegistry;
    std::shared_ptr<StaticModelsRegistryService> modelsRegistry;
    std::shared_ptr<EchoChatService> chat;

    std::optional<BridgeChannels> bridge;
    std::unique_ptr<UserEventForwarder> forwarder;
    std::vector<std::unique_ptr<Presenter>> presenters;
    bool runtimeStarted = false;

    ViewState view;
    ConsolePopoverHost popoverHost;
    std::unique_ptr<PopoverController> popover;
    std::unique_ptr<ConsoleController> console;

    void wake()
    {
        {
            auto lock = std::lock_guard(wakeMutex);
            wakeRequested = true;
        }
        wakeCondition.notify_one();
    }

    void waitForTick(std::chrono::milliseconds interval)
    {
        auto lock = std::unique_lock(wakeMutex);
        wakeCondition.wait_for(lock, interval, [this] { return wakeRequested; });
        wakeRequested = false;
    }

    void publishSystem(SystemEvent event)
    {
        auto const name = eventName(AppEvent { event });
        if (auto published = bus->publish(std::move(event)); !published)
            log::debug("App: {} not published: {}", name, publishErrorToString(published.error()));
    }

    auto seedProfiles() -> VoidResult;
    auto seedMcpServers() -> VoidResult;
    void refreshModelCatalog();
    void startRuntime();
    void shutdownRuntime();

    /// Drains pending view commands, applies and prints them. Returns how many were applied.
    auto render() -> std::size_t;
    void flushConsoleOutput();
};

auto App::Impl::seedProfiles() -> VoidResult
{
    auto seeds = config.profiles;
    if (seeds.empty())
        seeds.push_back(builtinProfile());

    auto defaultId = std::optional<Uuid> {};
    for (auto const& seed: seeds)
    {
        auto created = profiles->create(draftFromSeed(seed));
        if (!created)
            return makeError(ErrorCode::ConfigError,
                             std::format("Invalid profile '{}': {}", seed.name, created.error().message));
        if (seed.isDefault || !defaultId)
            defaultId = created->id;
    }

    if (auto result = profiles->setDefault(*defaultId); !result)
        return result;
    if (auto result = appSettings->setDefaultProfileId(*defaultId); !result)
        return result;

    log::debug("Seeded {} profile(s)", seeds.size());
    return {};
}

auto App::Impl::seedMcpServers() -> VoidResult
{
    for (auto const& [name, seed]: config.mcpServers)
    {
        auto added = mcp->add(McpConfig {
            .id = {},
            .name = name,
            .command = seed.command,
            .args = seed.args,
            .env = seed.env,
            .enabled = seed.enabled,
            .source = {},
        });
        if (!added)
            return makeError(ErrorCode::ConfigError,
                             std::format("Invalid MCP server '{}': {}", name, added.error().message));

        auto tools = std::vector<ToolInfo> {};
        for (auto const& tool: seed.tools)
            tools.push_back(ToolInfo { .name = tool, .description = {} });
        mcp->registerTools(added->id, std::move(tools));
    }
    return {};
}

void App::Impl::refreshModelCatalog()
{
    if (auto refreshed = modelsRegistry->refresh(); !refreshed)
    {
        publishSystem(SystemEvent { SystemEvent::ModelsRegistryRefreshFailed { .error = refreshed.error().message } });
        return;
    }

    auto providers = modelsRegistry->listProviders();
    auto models = modelsRegistry->listAll();
    if (!providers || !models)
    {
        auto const& error = !providers ? providers.error() : models.error();
        publishSystem(SystemEvent { SystemEvent::ModelsRegistryRefreshFailed { .error = error.message } });
        return;
    }

    publishSystem(SystemEvent { SystemEvent::ModelsRegistryRefreshed {
        .providerCount = providers->size(), .modelCount = models->size() } });
}

void App::Impl::startRuntime()
{
    if (runtimeStarted)
        return;

    for (auto& presenter: presenters)
        presenter->start();
    forwarder->start();
    runtimeStarted = true;

    publishSystem(SystemEvent { SystemEvent::AppLaunched {} });
    publishSystem(SystemEvent { SystemEvent::ConfigLoaded {} });
    refreshModelCatalog();
}

void App::Impl::shutdownRuntime()
{
    if (!runtimeStarted)
        return;
    runtimeStarted = false;

    publishSystem(SystemEvent { SystemEvent::AppWillTerminate {} });
    for (auto& presenter: presenters)
        presenter->stop();

    bridge->ui.disconnect();
    forwarder->join();
    bus->close();

    // Destroying a presenter joins its worker.
    presenters.clear();

    chat->cancel();
    chat->waitIdle();
    log::debug("App: runtime stopped");
}

auto App::Impl::render() -> std::size_t
{
    auto const commands = bridge->ui.drainCommands();
    console->applyCommands(commands);
    for (auto const& command: commands)
        std::println("< {}", describe(command));
    return commands.size();
}

void App::Impl::flushConsoleOutput()
{
    for (auto const& message: console->takeOutput())
        std::println("{}", message);
}

App::App(AppConfig config): _impl(std::make_unique<Impl>(std::move(config)))
{
}

App::~App() = default;

auto App::initialize() -> VoidResult
{
    if (auto valid = validateConfig(_impl->config); !valid)
        return valid;

    if (auto level = log::levelFromString(_impl->config.log.level))
        log::setLevel(*level);

    auto& impl = *_impl;
    impl.bus = std::make_shared<EventBus>(impl.config.bus.capacity);

    impl.conversations = std::make_shared<InMemoryConversationService>();
    impl.profiles = std::make_shared<InMemoryProfileService>();
    impl.secrets = std::make_shared<InMemorySecretsService>();
    impl.appSettings = std::make_shared<InMemoryAppSettingsService>();
    impl.mcp = std::make_shared<InMemoryMcpService>(impl.bus);
    impl.mcpRegistry = std::make_shared<StaticMcpRegistryService>(impl.config.mcpRegistry);
    impl.modelsRegistry = std::make_shared<StaticModelsRegistryService>(impl.config.models);
    impl.chat = std::make_shared<EchoChatService>(
        impl.bus, impl.conversations, impl.profiles, impl.mcp, EchoChatConfig { .chunkDelay = EchoChunkDelay });

    if (auto seeded = impl.seedProfiles(); !seeded)
        return seeded;
    if (auto seeded = impl.seedMcpServers(); !seeded)
        return seeded;

    impl.bridge.emplace(makeBridge(
        impl.config.bridge.userEventCapacity, impl.config.bridge.viewCommandCapacity, [&impl] { impl.wake(); }));
    impl.forwarder = std::make_unique<UserEventForwarder>(std::move(impl.bridge->userEvents), impl.bus);

    auto const& sink = impl.bridge->sink;
    impl.presenters.push_back(
        std::make_unique<ChatPresenter>(impl.bus, sink, impl.conversations, impl.chat, impl.profiles));
    impl.presenters.push_back(std::make_unique<HistoryPresenter>(impl.bus, sink, impl.conversations));
    impl.presenters.push_back(
        std::make_unique<SettingsPresenter>(impl.bus, sink, impl.profiles, impl.appSettings, impl.mcp));
    impl.presenters.push_back(std::make_unique<ProfileEditorPresenter>(impl.bus, sink, impl.profiles, impl.secrets));
    impl.presenters.push_back(std::make_unique<McpAddPresenter>(impl.bus, sink, impl.mcpRegistry, impl.mcp));
    impl.presenters.push_back(std::make_unique<McpConfigurePresenter>(impl.bus, sink, impl.mcp, impl.secrets));
    impl.presenters.push_back(std::make_unique<ModelSelectorPresenter>(impl.bus, sink, impl.modelsRegistry));
    impl.presenters.push_back(std::make_unique<ErrorPresenter>(impl.bus, sink));

    impl.popover = std::make_unique<PopoverController>(impl.popoverHost, impl.bus);
    impl.console = std::make_unique<ConsoleController>(impl.bridge->ui, impl.view, *impl.popover);

    if (impl.config.ui.showThinking)
        impl.view.apply(ViewCommand { ViewCommand::ToggleThinkingVisibility {} });

    log::debug("App: initialized with bus capacity {}", impl.config.bus.capacity);
    return {};
}

auto App::run(std::istream& input, InputMode mode) -> int
{
    auto& impl = *_impl;
    if (!impl.console)
    {
        log::error("App::run() called before initialize()");
        return 1;
    }

    impl.startRuntime();
    if (mode == InputMode::Interactive)
        std::println("Type /help for commands, /quit to exit");

    auto [lineSender, lineReceiver] = makeChannel<std::string>(LineQueueCapacity);
    auto reader = std::jthread([&input, &impl, sender = std::move(lineSender)](std::stop_token stopToken) mutable {
        log::setThreadTag("input");
        auto line = std::string {};
        while (!stopToken.stop_requested() && std::getline(input, line))
        {
            auto sent = sender.trySend(line);
            while (!sent && sent.error() == TrySendError::Full && !stopToken.stop_requested())
            {
                std::this_thread::sleep_for(std::chrono::milliseconds { 10 });
                sent = sender.trySend(line);
            }
            impl.wake();

            auto const command = splitFirstWord(line).first;
            if (command == "/quit" || command == "/exit")
                break;
        }
        sender.reset();
        impl.wake();
    });

    auto const tickInterval = std::chrono::milliseconds { impl.config.ui.tickIntervalMs };
    auto inputClosed = false;
    auto quietTicks = 0;
    auto running = true;

    while (running)
    {
        quietTicks = impl.render() == 0 ? quietTicks + 1 : 0;
        impl.popover->processPendingOperations();

        auto const settled = quietTicks >= SettleTicks && !impl.chat->isStreaming();
        if (inputClosed)
        {
            if (settled)
                break;
        }
        else if (mode == InputMode::Interactive || settled)
        {
            // In script mode a single line is handled per settled tick.
            while (true)
            {
                auto line = lineReceiver.tryReceive();
                if (!line)
                {
                    if (line.error() == TryReceiveError::Disconnected)
                        inputClosed = true;
                    break;
                }
                if (impl.console->handleLine(*line) == ConsoleController::Outcome::Quit)
                {
                    running = false;
                    break;
                }
                impl.flushConsoleOutput();
                impl.popover->processPendingOperations();
                quietTicks = 0;
                if (mode == InputMode::Script)
                    break;
            }
        }

        if (running)
            impl.waitForTick(tickInterval);
    }

    impl.shutdownRuntime();
    impl.render();
    impl.flushConsoleOutput();

    reader.join();
    return 0;
}

} // namespace pagent
