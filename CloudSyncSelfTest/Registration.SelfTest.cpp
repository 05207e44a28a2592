#include "Registration.SelfTest.h"

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <string>
#include <string_view>

#include "CloudError.h"
#include "Helpers.h"
#include "MockCloudFilterApi.h"
#include "Registration.h"
#include "SelfTestCommon.h"

namespace
{
using SelfTest::CaseState;
using SelfTest::HrText;
using SelfTest::MockCloudFilterApi;

const std::filesystem::path kSyncRootPath{L"C:\\Users\\Test\\CloudSyncRoot"};

[[nodiscard]] CloudSync::SyncRootId MakeId()
{
    CloudSync::SyncRootId id;
    id.providerName = L"CloudSyncTest";
    id.securityId   = L"S-1-5-21-1000-2000-3000-1001";
    id.accountName  = L"user@example.com";
    return id;
}

[[nodiscard]] bool EndsWithNoCase(std::wstring_view text, std::wstring_view suffix) noexcept
{
    if (text.size() < suffix.size())
    {
        return false;
    }

    const std::wstring_view tail = text.substr(text.size() - suffix.size());
    return CompareStringOrdinal(tail.data(), static_cast<int>(tail.size()), suffix.data(), static_cast<int>(suffix.size()), TRUE) == CSTR_EQUAL;
}
} // namespace

bool RegistrationSelfTest::Run(const SelfTest::SelfTestOptions& options, SelfTest::SelfTestSuiteResult* outResult) noexcept
{
    const auto startedAt = std::chrono::steady_clock::now();
    Debug::Info(L"RegistrationSelfTest: begin");

    SelfTest::SelfTestSuiteResult result{};
    result.suite = SelfTest::SelfTestSuite::Registration;

    SelfTest::RunCase(options,
                      result,
                      L"validate rejects bundles the OS would refuse",
                      [](CaseState& state)
                      {
                          const CloudSync::SyncRootId id = MakeId();
                          CloudSync::SyncRootRegistration registration;
                          state.Require(registration.Validate(id, kSyncRootPath) == S_OK, L"default bundle should validate");

                          CloudSync::SyncRootId bangProvider = id;
                          bangProvider.providerName          = L"Cloud!Sync";
                          state.Require(registration.Validate(bangProvider, kSyncRootPath) == E_INVALIDARG, L"provider name with '!' should be rejected");

                          CloudSync::SyncRootId noSid = id;
                          noSid.securityId.clear();
                          state.Require(registration.Validate(noSid, kSyncRootPath) == E_INVALIDARG, L"missing security id should be rejected");

                          state.Require(registration.Validate(id, {}) == E_INVALIDARG, L"empty sync root path should be rejected");

                          CloudSync::SyncRootRegistration longVersion;
                          longVersion.version.assign(CloudSync::kMaxProviderVersionLength + 1, L'1');
                          state.Require(longVersion.Validate(id, kSyncRootPath) == E_INVALIDARG, L"version over the limit should be rejected");
                          longVersion.version.resize(CloudSync::kMaxProviderVersionLength);
                          state.Require(longVersion.Validate(id, kSyncRootPath) == S_OK, L"version at the limit should validate");

                          CloudSync::SyncRootRegistration bigContext;
                          bigContext.context = SelfTest::MakePattern(CloudSync::kMaxBlobSize + 1);
                          state.Require(bigContext.Validate(id, kSyncRootPath) == E_INVALIDARG, L"context over the limit should be rejected");

                          CloudSync::SyncRootRegistration conflicting;
                          conflicting.hydrationModifiers.streamingAllowed   = true;
                          conflicting.hydrationModifiers.validationRequired = true;
                          state.Require(conflicting.Validate(id, kSyncRootPath) == E_INVALIDARG, L"streaming with required validation should be rejected");
                          return true;
                      });

    SelfTest::RunCase(options,
                      result,
                      L"invalid bundle never reaches the OS",
                      [](CaseState& state)
                      {
                          MockCloudFilterApi api;
                          CloudSync::SyncRootRegistration registration;
                          registration.hydrationModifiers.streamingAllowed   = true;
                          registration.hydrationModifiers.validationRequired = true;

                          state.Require(CloudSync::RegisterSyncRoot(api, MakeId(), kSyncRootPath, registration) == E_INVALIDARG, L"invalid bundle should be rejected");
                          state.Require(api.Count(MockCloudFilterApi::Call::RegisterSyncRoot) == 0, L"invalid bundle must not reach the OS");
                          return true;
                      });

    SelfTest::RunCase(options,
                      result,
                      L"register and unregister",
                      [](CaseState& state)
                      {
                          MockCloudFilterApi api;
                          const CloudSync::SyncRootId id = MakeId();

                          CloudSync::SyncRootRegistration registration;
                          registration.displayName      = L"Test Cloud";
                          registration.version          = L"1.2.3";
                          registration.hydration        = CloudSync::HydrationType::Full;
                          registration.population       = CloudSync::PopulationType::AlwaysFull;
                          registration.inSyncAttributes = CloudSync::IN_SYNC_FILE_LAST_WRITE_TIME | CloudSync::IN_SYNC_DIRECTORY_LAST_WRITE_TIME;

                          const HRESULT hr = CloudSync::RegisterSyncRoot(api, id, kSyncRootPath, registration);
                          state.Require(hr == S_OK, std::format(L"RegisterSyncRoot failed: {}", HrText(hr)));

                          const auto registeredId     = api.RegisteredId();
                          const auto registeredBundle = api.RegisteredBundle();
                          state.Require(registeredId && *registeredId == id, L"registered id mismatch");
                          state.Require(api.RegisteredPath() == kSyncRootPath, L"registered path mismatch");
                          state.Require(registeredBundle && registeredBundle->hydration == CloudSync::HydrationType::Full &&
                                            registeredBundle->population == CloudSync::PopulationType::AlwaysFull &&
                                            registeredBundle->inSyncAttributes == registration.inSyncAttributes,
                                        L"registered bundle mismatch");

                          api.FailNext(MockCloudFilterApi::Call::RegisterSyncRoot, E_ACCESSDENIED);
                          state.Require(CloudSync::RegisterSyncRoot(api, id, kSyncRootPath, registration) == E_ACCESSDENIED, L"OS failure should be returned");

                          state.Require(CloudSync::UnregisterSyncRoot(api, id) == S_OK, L"unregister should succeed");
                          state.Require(! api.RegisteredId().has_value(), L"sync root should be gone after unregister");
                          state.Require(CloudSync::UnregisterSyncRoot(api, id) == HRESULT_FROM_WIN32(ERROR_NOT_FOUND), L"second unregister should report not found");
                          state.Require(CloudSync::UnregisterSyncRoot(api, CloudSync::SyncRootId{}) == E_INVALIDARG, L"empty id should be rejected");
                          return true;
                      });

    SelfTest::RunCase(options,
                      result,
                      L"sync root id text form",
                      [](CaseState& state)
                      {
                          CloudSync::SyncRootId id = MakeId();
                          id.accountName           = L"team!shared";
                          const std::wstring text  = id.ToString();
                          state.Require(text == L"CloudSyncTest!S-1-5-21-1000-2000-3000-1001!team!shared", std::format(L"unexpected id text '{}'", text));

                          CloudSync::SyncRootId parsed;
                          state.Require(CloudSync::SyncRootId::Parse(text, parsed) == S_OK, L"parse should succeed");
                          state.Require(parsed == id, L"parsed id should keep '!' inside the account name");

                          state.Require(CloudSync::SyncRootId::Parse(L"no-separators", parsed) == E_INVALIDARG, L"text without separators should be rejected");
                          state.Require(CloudSync::SyncRootId::Parse(L"!S-1-5!acct", parsed) == E_INVALIDARG, L"empty provider should be rejected");
                          state.Require(CloudSync::SyncRootId::Parse(L"provider!!acct", parsed) == E_INVALIDARG, L"empty security id should be rejected");

                          state.Require(CloudSync::SyncRootId::Parse(L"provider!S-1-5!", parsed) == S_OK && parsed.accountName.empty(),
                                        L"empty account name is allowed");
                          return true;
                      });

    SelfTest::RunCase(options,
                      result,
                      L"id for current user",
                      [](CaseState& state)
                      {
                          CloudSync::SyncRootId id;
                          const HRESULT hr = CloudSync::SyncRootId::ForCurrentUser(L"CloudSyncTest", L"account", id);
                          state.Require(hr == S_OK, std::format(L"ForCurrentUser failed: {}", HrText(hr)));
                          state.Require(id.securityId.starts_with(L"S-1-"), std::format(L"unexpected SID '{}'", id.securityId));
                          state.Require(id.providerName == L"CloudSyncTest" && id.accountName == L"account", L"id parts mismatch");

                          CloudSync::SyncRootId rejected;
                          state.Require(CloudSync::SyncRootId::ForCurrentUser(L"bad!name", L"account", rejected) == E_INVALIDARG, L"provider with '!' should be rejected");
                          return true;
                      });

    SelfTest::RunCase(options,
                      result,
                      L"display defaults",
                      [](CaseState& state)
                      {
                          const CloudSync::SyncRootId id = MakeId();
                          CloudSync::SyncRootRegistration registration;
                          state.Require(registration.EffectiveDisplayName(id) == id.providerName, L"display name should default to the provider name");
                          state.Require(EndsWithNoCase(registration.EffectiveIconResource(), L"\\imageres.dll,1525"), L"default icon should be the imageres cloud icon");

                          registration.displayName  = L"Custom";
                          registration.iconResource = L"C:\\icons\\cloud.ico,0";
                          state.Require(registration.EffectiveDisplayName(id) == L"Custom", L"explicit display name should win");
                          state.Require(registration.EffectiveIconResource() == L"C:\\icons\\cloud.ico,0", L"explicit icon should win");
                          return true;
                      });

    SelfTest::RunCase(options,
                      result,
                      L"policy names",
                      [](CaseState& state)
                      {
                          CloudSync::HydrationType hydration{};
                          state.Require(CloudSync::TryParseHydrationType(L"ALWAYSFULL", hydration) && hydration == CloudSync::HydrationType::AlwaysFull,
                                        L"hydration names should parse case-insensitively");
                          state.Require(! CloudSync::TryParseHydrationType(L"streaming", hydration), L"unknown hydration name should fail");
                          state.Require(CloudSync::HydrationTypeName(CloudSync::HydrationType::Progressive) == L"progressive", L"hydration name mismatch");

                          CloudSync::PopulationType population{};
                          state.Require(CloudSync::TryParsePopulationType(L"full", population) && population == CloudSync::PopulationType::Full, L"population parse failed");
                          state.Require(! CloudSync::TryParsePopulationType(L"partial", population), L"partial population is not a policy");

                          CloudSync::ProtectionMode protection{};
                          state.Require(CloudSync::TryParseProtectionMode(L"Personal", protection) && protection == CloudSync::ProtectionMode::Personal,
                                        L"protection parse failed");
                          state.Require(CloudSync::ProtectionModeName(CloudSync::ProtectionMode::Unknown) == L"unknown", L"protection name mismatch");
                          return true;
                      });

    return SelfTest::FinishSuite(result, startedAt, outResult);
}
