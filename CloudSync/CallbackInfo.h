#pragma once

#include "CorrelationKeys.h"
#include "Helpers.h"

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace CloudSync
{
enum class OperationKind : uint8_t
{
    FetchData,
    CancelFetchData,
    ValidateData,
    FetchPlaceholders,
    CancelFetchPlaceholders,
    Opened,
    Closed,
    Dehydrate,
    Dehydrated,
    Delete,
    Deleted,
    Rename,
    Renamed,
    StateChanged,
};

// Terminating kinds require exactly one response through a ticket; the rest are notifications.
[[nodiscard]] constexpr bool IsTerminating(OperationKind kind) noexcept
{
    switch (kind)
    {
        case OperationKind::FetchData:
        case OperationKind::ValidateData:
        case OperationKind::FetchPlaceholders:
        case OperationKind::Dehydrate:
        case OperationKind::Delete:
        case OperationKind::Rename: return true;
        default: return false;
    }
}

[[nodiscard]] std::wstring_view OperationKindName(OperationKind kind) noexcept;

struct ProcessInfo
{
    uint32_t processId = 0;
    uint32_t sessionId = 0;
    std::wstring imagePath;
    std::wstring packageName;
    std::wstring applicationId;
    std::wstring commandLine;
};

// Read-only metadata delivered with every callback.
struct RequestContext
{
    CorrelationKeyPair keys;

    std::wstring volumeGuidName;
    std::wstring volumeDosName;
    uint32_t volumeSerialNumber = 0;

    int64_t syncRootFileId = 0;
    std::vector<std::byte> syncRootIdentity;

    int64_t fileId    = 0;
    uint64_t fileSize = 0;
    std::vector<std::byte> fileIdentity;

    // Full path of the placeholder, volume DOS name included.
    std::filesystem::path path;
    uint8_t priorityHint = 0;

    // Present when the connection asked the OS for process information.
    std::optional<ProcessInfo> process;
};

enum class DehydrationReason : uint8_t
{
    None,
    UserManually,
    SystemLowSpace,
    SystemInactivity,
    SystemOsUpgrade,
};

struct FetchDataInfo
{
    uint64_t requiredOffset = 0;
    uint64_t requiredLength = 0;
    uint64_t optionalOffset = 0;
    uint64_t optionalLength = 0;
    int64_t lastDehydrationTime            = 0;
    DehydrationReason lastDehydrationReason = DehydrationReason::None;
    bool explicitHydration                 = false;
    bool recovery                          = false;
};

struct CancelFetchDataInfo
{
    uint64_t offset  = 0;
    uint64_t length  = 0;
    bool timeout     = false;
    bool userRequest = false;
};

struct ValidateDataInfo
{
    uint64_t requiredOffset = 0;
    uint64_t requiredLength = 0;
    bool explicitHydration  = false;
};

struct FetchPlaceholdersInfo
{
    // Search pattern of the enumeration that triggered the request, "*" when unfiltered.
    std::wstring pattern;
};

struct CancelFetchPlaceholdersInfo
{
    bool timeout     = false;
    bool userRequest = false;
};

struct OpenedInfo
{
    bool metadataCorrupt     = false;
    bool metadataUnsupported = false;
};

struct ClosedInfo
{
    bool deleted = false;
};

struct DehydrateInfo
{
    bool background          = false;
    DehydrationReason reason = DehydrationReason::None;
};

struct DehydratedInfo
{
    bool background          = false;
    bool hydrated            = false;
    DehydrationReason reason = DehydrationReason::None;
};

struct DeleteInfo
{
    bool isDirectory = false;
    bool isUndelete  = false;
};

struct DeletedInfo
{
};

struct RenameInfo
{
    bool isDirectory   = false;
    bool sourceInScope = false;
    bool targetInScope = false;
    std::filesystem::path target;
};

struct RenamedInfo
{
    std::filesystem::path source;
};
} // namespace CloudSync
