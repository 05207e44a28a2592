#include "CallbackTranslation.h"

#include <string>
#include <string_view>

namespace CloudSync
{
namespace
{
template <typename Flags, typename Flag> [[nodiscard]] constexpr bool HasFlag(Flags flags, Flag flag) noexcept
{
    return (static_cast<uint32_t>(flags) & static_cast<uint32_t>(flag)) != 0;
}

[[nodiscard]] uint64_t ToUnsigned(const LARGE_INTEGER& value) noexcept
{
    return value.QuadPart < 0 ? 0u : static_cast<uint64_t>(value.QuadPart);
}

[[nodiscard]] std::wstring_view ViewOf(PCWSTR text) noexcept
{
    return text ? std::wstring_view(text) : std::wstring_view();
}

[[nodiscard]] std::vector<std::byte> CopyBlob(LPCVOID data, DWORD length)
{
    if (! data || length == 0)
    {
        return {};
    }

    const auto* bytes = static_cast<const std::byte*>(data);
    return std::vector<std::byte>(bytes, bytes + length);
}

// Callback paths are volume relative ("\dir\file"); the volume DOS name ("C:") completes them.
[[nodiscard]] std::filesystem::path VolumePath(const CF_CALLBACK_INFO& info, PCWSTR relative)
{
    std::wstring path(ViewOf(info.VolumeDosName));
    path.append(ViewOf(relative));
    return std::filesystem::path(std::move(path));
}
} // namespace

CorrelationKeyPair KeysFromCallbackInfo(const CF_CALLBACK_INFO& info) noexcept
{
    CorrelationKeyPair keys;
    keys.connection.value = info.ConnectionKey.Internal;
    keys.transfer.value   = info.TransferKey.QuadPart;
    keys.requestKey       = info.RequestKey;
    return keys;
}

RequestContext TranslateRequest(const CF_CALLBACK_INFO& info)
{
    RequestContext request;
    request.keys               = KeysFromCallbackInfo(info);
    request.volumeGuidName     = ViewOf(info.VolumeGuidName);
    request.volumeDosName      = ViewOf(info.VolumeDosName);
    request.volumeSerialNumber = info.VolumeSerialNumber;
    request.syncRootFileId     = info.SyncRootFileId.QuadPart;
    request.syncRootIdentity   = CopyBlob(info.SyncRootIdentity, info.SyncRootIdentityLength);
    request.fileId             = info.FileId.QuadPart;
    request.fileSize           = ToUnsigned(info.FileSize);
    request.fileIdentity       = CopyBlob(info.FileIdentity, info.FileIdentityLength);
    request.path               = VolumePath(info, info.NormalizedPath);
    request.priorityHint       = info.PriorityHint;

    if (info.ProcessInfo)
    {
        const CF_PROCESS_INFO& source = *info.ProcessInfo;

        ProcessInfo process;
        process.processId     = source.ProcessId;
        process.imagePath     = ViewOf(source.ImagePath);
        process.packageName   = ViewOf(source.PackageName);
        process.applicationId = ViewOf(source.ApplicationId);
        // SessionId and CommandLine were appended to CF_PROCESS_INFO in later releases.
        if (source.StructSize >= RTL_SIZEOF_THROUGH_FIELD(CF_PROCESS_INFO, CommandLine))
        {
            process.commandLine = ViewOf(source.CommandLine);
        }
        if (source.StructSize >= RTL_SIZEOF_THROUGH_FIELD(CF_PROCESS_INFO, SessionId))
        {
            process.sessionId = source.SessionId;
        }
        request.process = std::move(process);
    }

    return request;
}

DehydrationReason TranslateDehydrationReason(CF_CALLBACK_DEHYDRATION_REASON reason) noexcept
{
    switch (reason)
    {
        case CF_CALLBACK_DEHYDRATION_REASON_USER_MANUAL: return DehydrationReason::UserManually;
        case CF_CALLBACK_DEHYDRATION_REASON_SYSTEM_LOW_SPACE: return DehydrationReason::SystemLowSpace;
        case CF_CALLBACK_DEHYDRATION_REASON_SYSTEM_INACTIVITY: return DehydrationReason::SystemInactivity;
        case CF_CALLBACK_DEHYDRATION_REASON_SYSTEM_OS_UPGRADE: return DehydrationReason::SystemOsUpgrade;
        case CF_CALLBACK_DEHYDRATION_REASON_NONE:
        default: return DehydrationReason::None;
    }
}

FetchDataInfo TranslateFetchData(const CF_CALLBACK_PARAMETERS& parameters) noexcept
{
    const auto& source = parameters.FetchData;

    FetchDataInfo info;
    info.requiredOffset        = ToUnsigned(source.RequiredFileOffset);
    info.requiredLength        = ToUnsigned(source.RequiredLength);
    info.optionalOffset        = ToUnsigned(source.OptionalFileOffset);
    info.optionalLength        = ToUnsigned(source.OptionalLength);
    info.lastDehydrationTime   = source.LastDehydrationTime.QuadPart;
    info.lastDehydrationReason = TranslateDehydrationReason(source.LastDehydrationReason);
    info.explicitHydration     = HasFlag(source.Flags, CF_CALLBACK_FETCH_DATA_FLAG_EXPLICIT_HYDRATION);
    info.recovery              = HasFlag(source.Flags, CF_CALLBACK_FETCH_DATA_FLAG_RECOVERY);
    return info;
}

CancelFetchDataInfo TranslateCancelFetchData(const CF_CALLBACK_PARAMETERS& parameters) noexcept
{
    const auto& source = parameters.Cancel;

    CancelFetchDataInfo info;
    info.offset      = ToUnsigned(source.FetchData.FileOffset);
    info.length      = ToUnsigned(source.FetchData.Length);
    info.timeout     = HasFlag(source.Flags, CF_CALLBACK_CANCEL_FLAG_IO_TIMEOUT);
    info.userRequest = HasFlag(source.Flags, CF_CALLBACK_CANCEL_FLAG_IO_ABORTED);
    return info;
}

ValidateDataInfo TranslateValidateData(const CF_CALLBACK_PARAMETERS& parameters) noexcept
{
    const auto& source = parameters.ValidateData;

    ValidateDataInfo info;
    info.requiredOffset    = ToUnsigned(source.RequiredFileOffset);
    info.requiredLength    = ToUnsigned(source.RequiredLength);
    info.explicitHydration = HasFlag(source.Flags, CF_CALLBACK_VALIDATE_DATA_FLAG_EXPLICIT_HYDRATION);
    return info;
}

FetchPlaceholdersInfo TranslateFetchPlaceholders(const CF_CALLBACK_PARAMETERS& parameters)
{
    FetchPlaceholdersInfo info;
    const std::wstring_view pattern = ViewOf(parameters.FetchPlaceholders.Pattern);
    info.pattern                    = pattern.empty() ? std::wstring(L"*") : std::wstring(pattern);
    return info;
}

CancelFetchPlaceholdersInfo TranslateCancelFetchPlaceholders(const CF_CALLBACK_PARAMETERS& parameters) noexcept
{
    CancelFetchPlaceholdersInfo info;
    info.timeout     = HasFlag(parameters.Cancel.Flags, CF_CALLBACK_CANCEL_FLAG_IO_TIMEOUT);
    info.userRequest = HasFlag(parameters.Cancel.Flags, CF_CALLBACK_CANCEL_FLAG_IO_ABORTED);
    return info;
}

OpenedInfo TranslateOpened(const CF_CALLBACK_PARAMETERS& parameters) noexcept
{
    OpenedInfo info;
    info.metadataCorrupt     = HasFlag(parameters.OpenCompletion.Flags, CF_CALLBACK_OPEN_COMPLETION_FLAG_PLACEHOLDER_UNKNOWN);
    info.metadataUnsupported = HasFlag(parameters.OpenCompletion.Flags, CF_CALLBACK_OPEN_COMPLETION_FLAG_PLACEHOLDER_UNSUPPORTED);
    return info;
}

ClosedInfo TranslateClosed(const CF_CALLBACK_PARAMETERS& parameters) noexcept
{
    ClosedInfo info;
    info.deleted = HasFlag(parameters.CloseCompletion.Flags, CF_CALLBACK_CLOSE_COMPLETION_FLAG_DELETED);
    return info;
}

DehydrateInfo TranslateDehydrate(const CF_CALLBACK_PARAMETERS& parameters) noexcept
{
    DehydrateInfo info;
    info.background = HasFlag(parameters.Dehydrate.Flags, CF_CALLBACK_DEHYDRATE_FLAG_BACKGROUND);
    info.reason     = TranslateDehydrationReason(parameters.Dehydrate.Reason);
    return info;
}

DehydratedInfo TranslateDehydrated(const CF_CALLBACK_PARAMETERS& parameters) noexcept
{
    DehydratedInfo info;
    info.background = HasFlag(parameters.DehydrateCompletion.Flags, CF_CALLBACK_DEHYDRATE_COMPLETION_FLAG_BACKGROUND);
    info.hydrated   = ! HasFlag(parameters.DehydrateCompletion.Flags, CF_CALLBACK_DEHYDRATE_COMPLETION_FLAG_DEHYDRATED);
    info.reason     = TranslateDehydrationReason(parameters.DehydrateCompletion.Reason);
    return info;
}

DeleteInfo TranslateDelete(const CF_CALLBACK_PARAMETERS& parameters) noexcept
{
    DeleteInfo info;
    info.isDirectory = HasFlag(parameters.Delete.Flags, CF_CALLBACK_DELETE_FLAG_IS_DIRECTORY);
    info.isUndelete  = HasFlag(parameters.Delete.Flags, CF_CALLBACK_DELETE_FLAG_IS_UNDELETE);
    return info;
}

RenameInfo TranslateRename(const CF_CALLBACK_INFO& info, const CF_CALLBACK_PARAMETERS& parameters)
{
    RenameInfo rename;
    rename.isDirectory   = HasFlag(parameters.Rename.Flags, CF_CALLBACK_RENAME_FLAG_IS_DIRECTORY);
    rename.sourceInScope = HasFlag(parameters.Rename.Flags, CF_CALLBACK_RENAME_FLAG_SOURCE_IN_SCOPE);
    rename.targetInScope = HasFlag(parameters.Rename.Flags, CF_CALLBACK_RENAME_FLAG_TARGET_IN_SCOPE);
    rename.target        = VolumePath(info, parameters.Rename.TargetPath);
    return rename;
}

RenamedInfo TranslateRenamed(const CF_CALLBACK_INFO& info, const CF_CALLBACK_PARAMETERS& parameters)
{
    RenamedInfo renamed;
    renamed.source = VolumePath(info, parameters.RenameCompletion.SourcePath);
    return renamed;
}
} // namespace CloudSync
