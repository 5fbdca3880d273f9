// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <presentation/Presenter.hpp>
#include <services/ProfileService.hpp>
#include <services/SecretsService.hpp>

#include <memory>

namespace pagent
{

/// @brief Drives the profile editor: loading, validating, saving and testing profiles.
class ProfileEditorPresenter final: public Presenter
{
  public:
    ProfileEditorPresenter(std::shared_ptr<EventBus> bus,
                           ViewCommandSink sink,
                           std::shared_ptr<ProfileService> profiles,
                           std::shared_ptr<SecretsService> secrets);
    ~ProfileEditorPresenter() override;

  protected:
    void handleEvent(const AppEvent& event) override;

  private:
    void handleUserEvent(const UserEvent& event);
    void handleProfileEvent(const ProfileEvent& event);

    void createProfile();
    void editProfile(Uuid id);
    void saveProfile(const ProfileDraft& draft);
    void testConnection(Uuid id);

    std::shared_ptr<ProfileService> _profiles;
    std::shared_ptr<SecretsService> _secrets;
};

} // namespace pagent
