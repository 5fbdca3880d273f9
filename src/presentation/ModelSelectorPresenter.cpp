// SPDX-License-Identifier: Apache-2.0
#include "ModelSelectorPresenter.hpp"

#include <core/Overloaded.hpp>
#include <core/StringUtils.hpp>

#include <algorithm>
#include <format>

namespace pagent
{

namespace
{
    constexpr auto ModelsErrorTitle = std::string_view { "Model Catalog Error" };
}

ModelSelectorPresenter::ModelSelectorPresenter(std::shared_ptr<EventBus> bus,
                                               ViewCommandSink sink,
                                               std::shared_ptr<ModelsRegistryService> models):
    Presenter("ModelSelectorPresenter", std::move(bus), std::move(sink)), _models(std::move(models))
{
}

ModelSelectorPresenter::~ModelSelectorPresenter()
{
    shutdown();
}

void ModelSelectorPresenter::handleEvent(const AppEvent& event)
{
    std::visit(Overloaded {
                   [this](const UserEvent& e) { handleUserEvent(e); },
                   [this](const SystemEvent& e) {
                       if (std::holds_alternative<SystemEvent::ModelsRegistryRefreshed>(e.value))
                           refreshResults();
                   },
                   [](const auto&) {},
               },
               event);
}

void ModelSelectorPresenter::handleUserEvent(const UserEvent& event)
{
    using UE = UserEvent;
    std::visit(Overloaded {
                   [this](const UE::OpenModelSelector&) {
                       _query.clear();
                       _providerFilter.reset();
                       refreshResults();
                       send(ViewCommand { ViewCommand::NavigateTo { .view = ViewId::ModelSelector } });
                   },
                   [this](const UE::SearchModels& e) {
                       _query = std::string(trim(e.query));
                       refreshResults();
                   },
                   [this](const UE::FilterModelsByProvider& e) {
                       _providerFilter = e.providerId;
                       refreshResults();
                   },
                   [this](const UE::SelectModel& e) { selectModel(e.providerId, e.modelId); },
                   [](const auto&) {},
               },
               event.value);
}

void ModelSelectorPresenter::refreshResults()
{
    auto models = _query.empty() ? _models->listAll() : _models->search(_query);
    if (!models)
    {
        reportError(std::string(ModelsErrorTitle), "Searching models", models.error());
        return;
    }

    if (_providerFilter)
        std::erase_if(*models, [this](const ModelInfo& model) { return model.providerId != *_providerFilter; });

    send(ViewCommand { ViewCommand::ModelSearchResults { .models = std::move(*models) } });
}

void ModelSelectorPresenter::selectModel(const std::string& providerId, const std::string& modelId)
{
    auto model = _models->getModel(providerId, modelId);
    if (!model)
    {
        reportError(std::string(ModelsErrorTitle), "Loading model", model.error());
        return;
    }
    if (!*model)
    {
        showError(std::string(ModelsErrorTitle), std::format("Unknown model {}/{}", providerId, modelId));
        return;
    }

    send(ViewCommand { ViewCommand::ModelSelected {
        .providerId = providerId, .modelId = modelId, .contextLength = (*model)->contextLength } });
    send(ViewCommand { ViewCommand::NavigateBack {} });
}

} // namespace pagent
