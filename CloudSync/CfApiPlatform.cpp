#include "CfApiPlatform.h"

#include <limits>
#include <mutex>
#include <new>
#include <string>
#include <vector>

#include <cfapi.h>

#pragma warning(push)
// C++/WinRT headers: deleted copy/move, non-virtual destructors and padding
#pragma warning(disable : 4625 4626 4265 5026 5027 5246)
#include <winrt/Windows.Foundation.h>
#include <winrt/Windows.Storage.h>
#include <winrt/Windows.Storage.Provider.h>
#include <winrt/Windows.Storage.Streams.h>
#include <winrt/base.h>
#pragma warning(pop)

#pragma comment(lib, "CldApi.lib")
#pragma comment(lib, "WindowsApp.lib")

namespace CloudSync
{
namespace
{
namespace Provider = winrt::Windows::Storage::Provider;

// Serializes Register/Unregister; the shell misbehaves on parallel registrations of one provider.
std::mutex g_registrationMutex;

[[nodiscard]] CF_OPERATION_INFO MakeOperationInfo(const CorrelationKeyPair& keys, CF_OPERATION_TYPE type) noexcept
{
    CF_OPERATION_INFO info{};
    info.StructSize               = sizeof(info);
    info.Type                     = type;
    info.ConnectionKey.Internal   = keys.connection.value;
    info.TransferKey.QuadPart     = keys.transfer.value;
    info.CorrelationVector        = nullptr;
    info.SyncStatus               = nullptr;
    info.RequestKey               = keys.requestKey;
    return info;
}

[[nodiscard]] HRESULT Execute(const CF_OPERATION_INFO& info, CF_OPERATION_PARAMETERS& parameters) noexcept
{
    const HRESULT hr = CfExecute(&info, &parameters);
    if (FAILED(hr))
    {
        Debug::Warning(L"CloudSync: CfExecute type {} for {}/{} failed (hr=0x{:08X})",
                       static_cast<int>(info.Type),
                       info.ConnectionKey.Internal,
                       info.TransferKey.QuadPart,
                       static_cast<unsigned long>(hr));
    }
    return hr;
}

[[nodiscard]] Provider::StorageProviderHydrationPolicy ToWinRt(HydrationType type) noexcept
{
    switch (type)
    {
        case HydrationType::Partial: return Provider::StorageProviderHydrationPolicy::Partial;
        case HydrationType::Full: return Provider::StorageProviderHydrationPolicy::Full;
        case HydrationType::AlwaysFull: return Provider::StorageProviderHydrationPolicy::AlwaysFull;
        case HydrationType::Progressive:
        default: return Provider::StorageProviderHydrationPolicy::Progressive;
    }
}

[[nodiscard]] Provider::StorageProviderHydrationPolicyModifier ToWinRt(const HydrationPolicyModifiers& modifiers) noexcept
{
    auto value = Provider::StorageProviderHydrationPolicyModifier::None;
    if (modifiers.validationRequired)
    {
        value |= Provider::StorageProviderHydrationPolicyModifier::ValidationRequired;
    }
    if (modifiers.streamingAllowed)
    {
        value |= Provider::StorageProviderHydrationPolicyModifier::StreamingAllowed;
    }
    if (modifiers.autoDehydrationAllowed)
    {
        value |= Provider::StorageProviderHydrationPolicyModifier::AutoDehydrationAllowed;
    }
    if (modifiers.allowFullRestartHydration)
    {
        value |= Provider::StorageProviderHydrationPolicyModifier::AllowFullRestartHydration;
    }
    return value;
}

[[nodiscard]] Provider::StorageProviderPopulationPolicy ToWinRt(PopulationType type) noexcept
{
    return type == PopulationType::AlwaysFull ? Provider::StorageProviderPopulationPolicy::AlwaysFull : Provider::StorageProviderPopulationPolicy::Full;
}

[[nodiscard]] Provider::StorageProviderProtectionMode ToWinRt(ProtectionMode mode) noexcept
{
    return mode == ProtectionMode::Personal ? Provider::StorageProviderProtectionMode::Personal : Provider::StorageProviderProtectionMode::Unknown;
}

[[nodiscard]] bool IsNullGuid(const GUID& guid) noexcept
{
    return IsEqualGUID(guid, GUID_NULL) != FALSE;
}

[[nodiscard]] CF_PLACEHOLDER_CREATE_FLAGS ToCreateFlags(const PlaceholderFlags& flags) noexcept
{
    CF_PLACEHOLDER_CREATE_FLAGS value = CF_PLACEHOLDER_CREATE_FLAG_NONE;
    if (flags.markInSync)
    {
        value |= CF_PLACEHOLDER_CREATE_FLAG_MARK_IN_SYNC;
    }
    if (flags.disableOnDemandPopulation)
    {
        value |= CF_PLACEHOLDER_CREATE_FLAG_DISABLE_ON_DEMAND_POPULATION;
    }
    if (flags.supersede)
    {
        value |= CF_PLACEHOLDER_CREATE_FLAG_SUPERSEDE;
    }
    if (flags.alwaysFull)
    {
        value |= CF_PLACEHOLDER_CREATE_FLAG_ALWAYS_FULL;
    }
    return value;
}

void FillCreateInfo(const Placeholder& placeholder, CF_PLACEHOLDER_CREATE_INFO& info) noexcept
{
    info                    = {};
    info.RelativeFileName   = placeholder.relativeName.c_str();
    info.FileIdentity       = placeholder.identity.empty() ? nullptr : placeholder.identity.data();
    info.FileIdentityLength = static_cast<DWORD>(placeholder.identity.size());
    info.Flags              = ToCreateFlags(placeholder.flags);

    const PlaceholderMetadata& metadata           = placeholder.metadata;
    info.FsMetadata.FileSize.QuadPart             = metadata.IsDirectory() ? 0 : static_cast<LONGLONG>(metadata.size);
    info.FsMetadata.BasicInfo.FileAttributes      = metadata.fileAttributes;
    info.FsMetadata.BasicInfo.CreationTime.QuadPart   = metadata.creationTime;
    info.FsMetadata.BasicInfo.LastAccessTime.QuadPart = metadata.lastAccessTime;
    info.FsMetadata.BasicInfo.LastWriteTime.QuadPart  = metadata.lastWriteTime;
    info.FsMetadata.BasicInfo.ChangeTime.QuadPart     = metadata.changeTime;
}
} // namespace

HRESULT CfApiCloudFilterApi::TransferData(const CorrelationKeyPair& keys, std::span<const std::byte> buffer, int64_t offset, int64_t length, NTSTATUS completionStatus) noexcept
{
    const CF_OPERATION_INFO info = MakeOperationInfo(keys, CF_OPERATION_TYPE_TRANSFER_DATA);

    CF_OPERATION_PARAMETERS parameters{};
    parameters.ParamSize                     = static_cast<ULONG>(CF_SIZE_OF_OP_PARAM(TransferData));
    parameters.TransferData.Flags            = CF_OPERATION_TRANSFER_DATA_FLAG_NONE;
    parameters.TransferData.CompletionStatus = completionStatus;
    parameters.TransferData.Buffer           = buffer.empty() ? nullptr : buffer.data();
    parameters.TransferData.Offset.QuadPart  = offset;
    parameters.TransferData.Length.QuadPart  = length;
    return Execute(info, parameters);
}

HRESULT CfApiCloudFilterApi::RetrieveData(const CorrelationKeyPair& keys, std::span<std::byte> buffer, int64_t offset, uint64_t& bytesRead) noexcept
{
    bytesRead = 0;

    const CF_OPERATION_INFO info = MakeOperationInfo(keys, CF_OPERATION_TYPE_RETRIEVE_DATA);

    CF_OPERATION_PARAMETERS parameters{};
    parameters.ParamSize                    = static_cast<ULONG>(CF_SIZE_OF_OP_PARAM(RetrieveData));
    parameters.RetrieveData.Flags           = CF_OPERATION_RETRIEVE_DATA_FLAG_NONE;
    parameters.RetrieveData.Buffer          = buffer.data();
    parameters.RetrieveData.Offset.QuadPart = offset;
    parameters.RetrieveData.Length.QuadPart = static_cast<LONGLONG>(buffer.size());

    const HRESULT hr = Execute(info, parameters);
    if (SUCCEEDED(hr) && parameters.RetrieveData.ReturnLength.QuadPart > 0)
    {
        bytesRead = static_cast<uint64_t>(parameters.RetrieveData.ReturnLength.QuadPart);
    }
    return hr;
}

HRESULT CfApiCloudFilterApi::AckData(const CorrelationKeyPair& keys, int64_t offset, int64_t length, NTSTATUS completionStatus) noexcept
{
    const CF_OPERATION_INFO info = MakeOperationInfo(keys, CF_OPERATION_TYPE_ACK_DATA);

    CF_OPERATION_PARAMETERS parameters{};
    parameters.ParamSize                = static_cast<ULONG>(CF_SIZE_OF_OP_PARAM(AckData));
    parameters.AckData.Flags            = CF_OPERATION_ACK_DATA_FLAG_NONE;
    parameters.AckData.CompletionStatus = completionStatus;
    parameters.AckData.Offset.QuadPart  = offset;
    parameters.AckData.Length.QuadPart  = length;
    return Execute(info, parameters);
}

HRESULT CfApiCloudFilterApi::TransferPlaceholders(const CorrelationKeyPair& keys,
                                                  std::span<const Placeholder> placeholders,
                                                  const TransferPlaceholdersFlags& flags,
                                                  NTSTATUS completionStatus,
                                                  std::span<PlaceholderResult> results) noexcept
{
    if (results.size() < placeholders.size())
    {
        return E_INVALIDARG;
    }

    std::vector<CF_PLACEHOLDER_CREATE_INFO> createInfos;
    try
    {
        createInfos.resize(placeholders.size());
    }
    catch (const std::bad_alloc&)
    {
        return E_OUTOFMEMORY;
    }

    for (size_t i = 0; i < placeholders.size(); ++i)
    {
        FillCreateInfo(placeholders[i], createInfos[i]);
    }

    CF_OPERATION_TRANSFER_PLACEHOLDERS_FLAGS transferFlags = CF_OPERATION_TRANSFER_PLACEHOLDERS_FLAG_NONE;
    if (flags.stopOnError)
    {
        transferFlags |= CF_OPERATION_TRANSFER_PLACEHOLDERS_FLAG_STOP_ON_ERROR;
    }
    if (flags.disableOnDemandPopulation)
    {
        transferFlags |= CF_OPERATION_TRANSFER_PLACEHOLDERS_FLAG_DISABLE_ON_DEMAND_POPULATION;
    }

    const CF_OPERATION_INFO info = MakeOperationInfo(keys, CF_OPERATION_TYPE_TRANSFER_PLACEHOLDERS);

    CF_OPERATION_PARAMETERS parameters{};
    parameters.ParamSize                                          = static_cast<ULONG>(CF_SIZE_OF_OP_PARAM(TransferPlaceholders));
    parameters.TransferPlaceholders.Flags                         = transferFlags;
    parameters.TransferPlaceholders.CompletionStatus              = completionStatus;
    parameters.TransferPlaceholders.PlaceholderTotalCount.QuadPart = static_cast<LONGLONG>(placeholders.size());
    parameters.TransferPlaceholders.PlaceholderArray              = createInfos.empty() ? nullptr : createInfos.data();
    parameters.TransferPlaceholders.PlaceholderCount              = static_cast<DWORD>(placeholders.size());

    const HRESULT hr = Execute(info, parameters);

    // Entries past EntriesProcessed were never attempted (STOP_ON_ERROR or a rejected batch).
    const size_t processed = FAILED(hr) ? 0u : static_cast<size_t>(parameters.TransferPlaceholders.EntriesProcessed);
    for (size_t i = 0; i < placeholders.size(); ++i)
    {
        if (i < processed)
        {
            results[i].result    = createInfos[i].Result;
            results[i].createUsn = createInfos[i].CreateUsn;
        }
        else
        {
            results[i].result    = FAILED(hr) ? hr : E_ABORT;
            results[i].createUsn = 0;
        }
    }
    return hr;
}

HRESULT CfApiCloudFilterApi::AckDehydrate(const CorrelationKeyPair& keys, std::span<const std::byte> blob, NTSTATUS completionStatus) noexcept
{
    const CF_OPERATION_INFO info = MakeOperationInfo(keys, CF_OPERATION_TYPE_ACK_DEHYDRATE);

    CF_OPERATION_PARAMETERS parameters{};
    parameters.ParamSize                          = static_cast<ULONG>(CF_SIZE_OF_OP_PARAM(AckDehydrate));
    parameters.AckDehydrate.Flags                 = CF_OPERATION_ACK_DEHYDRATE_FLAG_NONE;
    parameters.AckDehydrate.CompletionStatus      = completionStatus;
    parameters.AckDehydrate.FileIdentity          = blob.empty() ? nullptr : blob.data();
    parameters.AckDehydrate.FileIdentityLength    = static_cast<DWORD>(blob.size());
    return Execute(info, parameters);
}

HRESULT CfApiCloudFilterApi::AckDelete(const CorrelationKeyPair& keys, NTSTATUS completionStatus) noexcept
{
    const CF_OPERATION_INFO info = MakeOperationInfo(keys, CF_OPERATION_TYPE_ACK_DELETE);

    CF_OPERATION_PARAMETERS parameters{};
    parameters.ParamSize                  = static_cast<ULONG>(CF_SIZE_OF_OP_PARAM(AckDelete));
    parameters.AckDelete.Flags            = CF_OPERATION_ACK_DELETE_FLAG_NONE;
    parameters.AckDelete.CompletionStatus = completionStatus;
    return Execute(info, parameters);
}

HRESULT CfApiCloudFilterApi::AckRename(const CorrelationKeyPair& keys, NTSTATUS completionStatus) noexcept
{
    const CF_OPERATION_INFO info = MakeOperationInfo(keys, CF_OPERATION_TYPE_ACK_RENAME);

    CF_OPERATION_PARAMETERS parameters{};
    parameters.ParamSize                  = static_cast<ULONG>(CF_SIZE_OF_OP_PARAM(AckRename));
    parameters.AckRename.Flags            = CF_OPERATION_ACK_RENAME_FLAG_NONE;
    parameters.AckRename.CompletionStatus = completionStatus;
    return Execute(info, parameters);
}

HRESULT CfApiCloudFilterApi::ReportProgress(const CorrelationKeyPair& keys, int64_t total, int64_t completed) noexcept
{
    CF_CONNECTION_KEY connectionKey{};
    connectionKey.Internal = keys.connection.value;

    CF_TRANSFER_KEY transferKey{};
    transferKey.QuadPart = keys.transfer.value;

    LARGE_INTEGER totalValue{};
    totalValue.QuadPart = total;
    LARGE_INTEGER completedValue{};
    completedValue.QuadPart = completed;

    return CfReportProviderProgress(connectionKey, transferKey, totalValue, completedValue);
}

HRESULT CfApiCloudFilterApi::RegisterSyncRoot(const SyncRootId& id, const std::filesystem::path& syncRootPath, const SyncRootRegistration& registration) noexcept
{
    Debug::Perf::Scope perf(L"CloudSync.RegisterSyncRoot");

    try
    {
        Provider::StorageProviderSyncRootInfo info;
        info.Id(id.ToString());
        info.Path(winrt::Windows::Storage::StorageFolder::GetFolderFromPathAsync(syncRootPath.native()).get());
        info.DisplayNameResource(registration.EffectiveDisplayName(id));
        info.IconResource(registration.EffectiveIconResource());
        info.HydrationPolicy(ToWinRt(registration.hydration));
        info.HydrationPolicyModifier(ToWinRt(registration.hydrationModifiers));
        info.PopulationPolicy(ToWinRt(registration.population));
        info.InSyncPolicy(static_cast<Provider::StorageProviderInSyncPolicy>(registration.inSyncAttributes));
        info.HardlinkPolicy(registration.hardlinks == HardlinkPolicy::Allowed ? Provider::StorageProviderHardlinkPolicy::Allowed
                                                                               : Provider::StorageProviderHardlinkPolicy::None);
        info.ProtectionMode(ToWinRt(registration.protection));
        info.ShowSiblingsAsGroup(registration.showSiblingsAsGroup);
        info.AllowPinning(registration.allowPinning);

        if (! registration.version.empty())
        {
            info.Version(registration.version);
        }
        if (! IsNullGuid(registration.providerId))
        {
            info.ProviderId(winrt::guid{registration.providerId});
        }
        if (! registration.recycleBinUri.empty())
        {
            info.RecycleBinUri(winrt::Windows::Foundation::Uri(registration.recycleBinUri));
        }
        if (! registration.context.empty())
        {
            const auto* first = reinterpret_cast<const uint8_t*>(registration.context.data());
            winrt::Windows::Storage::Streams::DataWriter writer;
            writer.WriteBytes(winrt::array_view<const uint8_t>(first, first + registration.context.size()));
            info.Context(writer.DetachBuffer());
        }

        std::lock_guard lock(g_registrationMutex);
        Provider::StorageProviderSyncRootManager::Register(info);
    }
    catch (const winrt::hresult_error& ex)
    {
        const HRESULT hr = ex.code();
        perf.SetHr(hr);
        Debug::Error(L"CloudSync: registering sync root '{}' at '{}' failed (hr=0x{:08X}): {}",
                     id.ToString(),
                     syncRootPath.native(),
                     static_cast<unsigned long>(hr),
                     std::wstring_view(ex.message()));
        return hr;
    }
    catch (const std::bad_alloc&)
    {
        perf.SetHr(E_OUTOFMEMORY);
        return E_OUTOFMEMORY;
    }

    Debug::Info(L"CloudSync: registered sync root '{}' at '{}'", id.ToString(), syncRootPath.native());
    return S_OK;
}

HRESULT CfApiCloudFilterApi::UnregisterSyncRoot(const SyncRootId& id) noexcept
{
    try
    {
        std::lock_guard lock(g_registrationMutex);
        Provider::StorageProviderSyncRootManager::Unregister(id.ToString());
    }
    catch (const winrt::hresult_error& ex)
    {
        const HRESULT hr = ex.code();
        Debug::Error(L"CloudSync: unregistering sync root '{}' failed (hr=0x{:08X})", id.ToString(), static_cast<unsigned long>(hr));
        return hr;
    }
    catch (const std::bad_alloc&)
    {
        return E_OUTOFMEMORY;
    }

    Debug::Info(L"CloudSync: unregistered sync root '{}'", id.ToString());
    return S_OK;
}

HRESULT CfApiCloudFilterApi::ConnectSyncRoot(const std::filesystem::path& syncRootPath, const CF_CALLBACK_REGISTRATION* callbacks, void* callbackContext, ConnectionKey& key) noexcept
{
    key = ConnectionKey{};

    CF_CONNECTION_KEY connectionKey{};
    const HRESULT hr = ::CfConnectSyncRoot(syncRootPath.c_str(),
                                           callbacks,
                                           callbackContext,
                                           CF_CONNECT_FLAG_REQUIRE_PROCESS_INFO | CF_CONNECT_FLAG_REQUIRE_FULL_FILE_PATH,
                                           &connectionKey);
    if (FAILED(hr))
    {
        Debug::Error(L"CloudSync: CfConnectSyncRoot failed for '{}' (hr=0x{:08X})", syncRootPath.native(), static_cast<unsigned long>(hr));
        return hr;
    }

    key.value = connectionKey.Internal;
    return S_OK;
}

HRESULT CfApiCloudFilterApi::DisconnectSyncRoot(ConnectionKey key) noexcept
{
    CF_CONNECTION_KEY connectionKey{};
    connectionKey.Internal = key.value;

    const HRESULT hr = ::CfDisconnectSyncRoot(connectionKey);
    if (FAILED(hr))
    {
        Debug::Error(L"CloudSync: CfDisconnectSyncRoot failed for key {} (hr=0x{:08X})", key.value, static_cast<unsigned long>(hr));
    }
    return hr;
}

std::shared_ptr<ICloudFilterApi> CreateCfApiCloudFilterApi()
{
    return std::make_shared<CfApiCloudFilterApi>();
}
} // namespace CloudSync
