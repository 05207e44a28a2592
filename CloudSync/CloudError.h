#pragma once

#include "Helpers.h"

#include <cstddef>
#include <cstdint>
#include <string_view>

namespace CloudSync
{
// Uniform classification of every failure a command, ticket or registration call can report.
// NotSupported means the provider declined the operation; IoError means the OS (or the provider's
// own I/O) failed while carrying it out. The two are never merged.
enum class CloudErrorKind : uint8_t
{
    NotSupported,
    InvalidArgument,
    IoError,
    Cancelled,
    Unknown,
};

struct CloudError
{
    CloudErrorKind kind = CloudErrorKind::Unknown;
    HRESULT code        = E_FAIL;
};

// Transfers must start on this boundary and span a multiple of it, except the one ending at EOF.
inline constexpr uint64_t kTransferAlignment = 4096u;

// Largest opaque blob the OS accepts with a dehydrate acknowledgement or a sync root registration.
inline constexpr size_t kMaxBlobSize = 65536u;

// Largest file identity blob attached to a placeholder (CF_PLACEHOLDER_MAX_FILE_IDENTITY_LENGTH).
inline constexpr size_t kMaxFileIdentitySize = 4096u;

// Returned by a ticket whose operation was already resolved. No OS call is made.
inline constexpr HRESULT kTicketAlreadyResolved = E_ILLEGAL_METHOD_CALL;

// Returned by a ticket whose operation the OS cancelled before the provider resolved it.
inline const HRESULT kOperationCancelled = HRESULT_FROM_WIN32(ERROR_CANCELLED);

// Returned by ValidateData reads that came back shorter than requested.
inline const HRESULT kShortRead = HRESULT_FROM_WIN32(ERROR_HANDLE_EOF);

// Classifies a failure code. Success codes classify as Unknown; callers check FAILED() first.
[[nodiscard]] CloudError ClassifyError(HRESULT hr) noexcept;

// Maps a provider HRESULT to the NTSTATUS completion status reported with an OS acknowledgement.
// Success maps to STATUS_SUCCESS; HRESULT_FROM_NT values map back to their NTSTATUS.
[[nodiscard]] NTSTATUS CompletionStatusFromHResult(HRESULT hr) noexcept;

[[nodiscard]] std::wstring_view CloudErrorKindName(CloudErrorKind kind) noexcept;

[[nodiscard]] inline bool IsAlreadyResolved(HRESULT hr) noexcept
{
    return hr == kTicketAlreadyResolved;
}
} // namespace CloudSync
