// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <presentation/Presenter.hpp>
#include <services/ModelsRegistryService.hpp>

#include <memory>
#include <optional>
#include <string>

namespace pagent
{

/// @brief Drives the model picker: catalog search, provider filter and selection.
class ModelSelectorPresenter final: public Presenter
{
  public:
    ModelSelectorPresenter(std::shared_ptr<EventBus> bus,
                           ViewCommandSink sink,
                           std::shared_ptr<ModelsRegistryService> models);
    ~ModelSelectorPresenter() override;

  protected:
    void handleEvent(const AppEvent& event) override;

  private:
    void handleUserEvent(const UserEvent& event);
    void selectModel(const std::string& providerId, const std::string& modelId);

    /// @brief Re-runs the current query with the current provider filter.
    void refreshResults();

    std::shared_ptr<ModelsRegistryService> _models;

    // Worker-thread state.
    std::string _query;
    std::optional<std::string> _providerFilter;
};

} // namespace pagent
