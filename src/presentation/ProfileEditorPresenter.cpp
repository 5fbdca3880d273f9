// SPDX-License-Identifier: Apache-2.0
#include "ProfileEditorPresenter.hpp"

#include <core/Log.hpp>
#include <core/Overloaded.hpp>

namespace pagent
{

namespace
{
    constexpr auto ProfileErrorTitle = std::string_view { "Profile Error" };
}

ProfileEditorPresenter::ProfileEditorPresenter(std::shared_ptr<EventBus> bus,
                                               ViewCommandSink sink,
                                               std::shared_ptr<ProfileService> profiles,
                                               std::shared_ptr<SecretsService> secrets):
    Presenter("ProfileEditorPresenter", std::move(bus), std::move(sink)),
    _profiles(std::move(profiles)),
    _secrets(std::move(secrets))
{
}

ProfileEditorPresenter::~ProfileEditorPresenter()
{
    shutdown();
}

void ProfileEditorPresenter::handleEvent(const AppEvent& event)
{
    std::visit(Overloaded {
                   [this](const UserEvent& e) { handleUserEvent(e); },
                   [this](const ProfileEvent& e) { handleProfileEvent(e); },
                   [](const auto&) {},
               },
               event);
}

void ProfileEditorPresenter::handleUserEvent(const UserEvent& event)
{
    using UE = UserEvent;
    std::visit(Overloaded {
                   [this](const UE::CreateProfile&) { createProfile(); },
                   [this](const UE::EditProfile& e) { editProfile(e.id); },
                   [this](const UE::SaveProfile& e) { saveProfile(e.profile); },
                   [this](const UE::TestProfileConnection& e) { testConnection(e.id); },
                   [](const auto&) {},
               },
               event.value);
}

void ProfileEditorPresenter::handleProfileEvent(const ProfileEvent& event)
{
    using PE = ProfileEvent;
    using VC = ViewCommand;
    std::visit(Overloaded {
                   [this](const PE::TestStarted& e) { send(VC { VC::ProfileTestStarted { .id = e.id } }); },
                   [this](const PE::TestCompleted& e) {
                       send(VC { VC::ProfileTestCompleted {
                           .id = e.id,
                           .success = e.success,
                           .responseTimeMs = e.responseTimeMs,
                           .error = e.error,
                       } });
                       if (!e.success)
                           showError("Connection Failed", e.error.value_or("Connection test failed"));
                   },
                   [this](const PE::ValidationFailed& e) {
                       send(VC { VC::ProfileValidationFailed { .errors = e.errors } });
                   },
                   [](const auto&) {},
               },
               event.value);
}

void ProfileEditorPresenter::createProfile()
{
    send(ViewCommand { ViewCommand::ProfileEditorLoaded { .profile = ProfileDraft {} } });
    send(ViewCommand { ViewCommand::NavigateTo { .view = ViewId::ProfileEditor } });
}

void ProfileEditorPresenter::editProfile(Uuid id)
{
    auto profile = _profiles->get(id);
    if (!profile)
    {
        reportError(std::string(ProfileErrorTitle), "Loading profile", profile.error());
        return;
    }

    auto draft = ProfileDraft {
        .id = profile->id,
        .name = profile->name,
        .providerId = profile->providerId,
        .modelId = profile->modelId,
        .baseUrl = profile->baseUrl,
        .systemPrompt = profile->systemPrompt,
        .apiKey = std::nullopt,
        .parameters = profile->parameters,
    };

    if (auto apiKey = _secrets->getApiKey(id); apiKey)
        draft.apiKey = *apiKey;
    else
        log::warning("cannot read API key of {}: {}", id, apiKey.error());

    send(ViewCommand { ViewCommand::ProfileEditorLoaded { .profile = std::move(draft) } });
    send(ViewCommand { ViewCommand::NavigateTo { .view = ViewId::ProfileEditor } });
}

void ProfileEditorPresenter::saveProfile(const ProfileDraft& draft)
{
    if (auto errors = validateProfileDraft(draft); !errors.empty())
    {
        publish(ProfileEvent { ProfileEvent::ValidationFailed { .id = draft.id, .errors = std::move(errors) } });
        return;
    }

    auto const isNew = draft.id.isNil();
    auto saved = isNew ? _profiles->create(draft) : _profiles->update(draft.id, draft);
    if (!saved)
    {
        reportError(std::string(ProfileErrorTitle), "Saving profile", saved.error());
        return;
    }

    if (draft.apiKey && !draft.apiKey->empty())
    {
        if (auto stored = _secrets->storeApiKey(saved->id, *draft.apiKey); !stored)
        {
            reportError(std::string(ProfileErrorTitle), "Storing API key", stored.error());
            return;
        }
    }

    send(ViewCommand { ViewCommand::NavigateBack {} });
    if (isNew)
        publish(ProfileEvent { ProfileEvent::Created { .id = saved->id, .name = saved->name } });
    else
        publish(ProfileEvent { ProfileEvent::Updated { .id = saved->id, .name = saved->name } });
}

void ProfileEditorPresenter::testConnection(Uuid id)
{
    publish(ProfileEvent { ProfileEvent::TestStarted { .id = id } });

    auto result = _profiles->testConnection(id);
    if (!result)
    {
        publish(ProfileEvent { ProfileEvent::TestCompleted {
            .id = id, .success = false, .responseTimeMs = std::nullopt, .error = result.error().message } });
        return;
    }

    publish(ProfileEvent { ProfileEvent::TestCompleted {
        .id = id,
        .success = result->success,
        .responseTimeMs = result->responseTimeMs,
        .error = result->error,
    } });
}

} // namespace pagent
