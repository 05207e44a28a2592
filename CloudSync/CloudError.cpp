#include "CloudError.h"

namespace CloudSync
{
namespace
{
constexpr HRESULT kFacilityNtBit = 0x10000000;

[[nodiscard]] bool IsWin32(HRESULT hr, DWORD error) noexcept
{
    return hr == HRESULT_FROM_WIN32(error);
}

[[nodiscard]] bool IsNt(HRESULT hr, NTSTATUS status) noexcept
{
    return hr == HRESULT_FROM_NT(status);
}
} // namespace

CloudError ClassifyError(HRESULT hr) noexcept
{
    CloudError error{};
    error.code = hr;

    if (SUCCEEDED(hr))
    {
        error.kind = CloudErrorKind::Unknown;
        return error;
    }

    if (hr == E_NOTIMPL || IsWin32(hr, ERROR_NOT_SUPPORTED) || IsWin32(hr, ERROR_CALL_NOT_IMPLEMENTED) || IsWin32(hr, ERROR_CLOUD_FILE_NOT_SUPPORTED) ||
        IsNt(hr, STATUS_CLOUD_FILE_NOT_SUPPORTED) || IsNt(hr, STATUS_NOT_SUPPORTED))
    {
        error.kind = CloudErrorKind::NotSupported;
        return error;
    }

    if (hr == E_INVALIDARG || hr == E_POINTER || hr == kTicketAlreadyResolved || IsWin32(hr, ERROR_INVALID_PARAMETER) || IsWin32(hr, ERROR_BAD_ARGUMENTS) ||
        IsWin32(hr, ERROR_INVALID_DATA) || IsNt(hr, STATUS_INVALID_PARAMETER))
    {
        error.kind = CloudErrorKind::InvalidArgument;
        return error;
    }

    if (IsWin32(hr, ERROR_CANCELLED) || IsWin32(hr, ERROR_OPERATION_ABORTED) || IsWin32(hr, ERROR_CLOUD_FILE_REQUEST_CANCELED) ||
        IsWin32(hr, ERROR_CLOUD_FILE_REQUEST_ABORTED) || IsNt(hr, STATUS_CLOUD_FILE_REQUEST_CANCELED) || IsNt(hr, STATUS_CLOUD_FILE_REQUEST_ABORTED) ||
        IsNt(hr, STATUS_CANCELLED))
    {
        error.kind = CloudErrorKind::Cancelled;
        return error;
    }

    if (hr == E_OUTOFMEMORY || hr == E_FAIL || hr == E_UNEXPECTED)
    {
        error.kind = CloudErrorKind::Unknown;
        return error;
    }

    // Everything else the OS reports about the file or the transfer is an I/O failure, including
    // ERROR_CLOUD_FILE_INVALID_REQUEST coming back from CfExecute.
    if (HRESULT_FACILITY(hr) == FACILITY_WIN32 || (hr & kFacilityNtBit) != 0)
    {
        error.kind = CloudErrorKind::IoError;
        return error;
    }

    error.kind = CloudErrorKind::Unknown;
    return error;
}

NTSTATUS CompletionStatusFromHResult(HRESULT hr) noexcept
{
    if (SUCCEEDED(hr))
    {
        return STATUS_SUCCESS;
    }

    if ((hr & kFacilityNtBit) != 0)
    {
        return static_cast<NTSTATUS>(hr & ~kFacilityNtBit);
    }

    if (IsWin32(hr, ERROR_ACCESS_DENIED) || hr == E_ACCESSDENIED)
    {
        return STATUS_CLOUD_FILE_ACCESS_DENIED;
    }

    if (IsWin32(hr, ERROR_CLOUD_FILE_NETWORK_UNAVAILABLE) || IsWin32(hr, ERROR_NETWORK_UNREACHABLE) || IsWin32(hr, ERROR_BAD_NETPATH))
    {
        return STATUS_CLOUD_FILE_NETWORK_UNAVAILABLE;
    }

    if (IsWin32(hr, ERROR_CLOUD_FILE_IN_USE) || IsWin32(hr, ERROR_SHARING_VIOLATION))
    {
        return STATUS_CLOUD_FILE_IN_USE;
    }

    if (IsWin32(hr, ERROR_CLOUD_FILE_PINNED))
    {
        return STATUS_CLOUD_FILE_PINNED;
    }

    if (IsWin32(hr, ERROR_CLOUD_FILE_DEHYDRATION_DISALLOWED))
    {
        return STATUS_CLOUD_FILE_DEHYDRATION_DISALLOWED;
    }

    if (hr == E_OUTOFMEMORY)
    {
        return STATUS_CLOUD_FILE_INSUFFICIENT_RESOURCES;
    }

    switch (ClassifyError(hr).kind)
    {
        case CloudErrorKind::NotSupported: return STATUS_CLOUD_FILE_NOT_SUPPORTED;
        case CloudErrorKind::InvalidArgument: return STATUS_CLOUD_FILE_INVALID_REQUEST;
        case CloudErrorKind::Cancelled: return STATUS_CLOUD_FILE_REQUEST_CANCELED;
        case CloudErrorKind::IoError:
        case CloudErrorKind::Unknown: break;
    }

    return STATUS_CLOUD_FILE_UNSUCCESSFUL;
}

std::wstring_view CloudErrorKindName(CloudErrorKind kind) noexcept
{
    switch (kind)
    {
        case CloudErrorKind::NotSupported: return L"NotSupported";
        case CloudErrorKind::InvalidArgument: return L"InvalidArgument";
        case CloudErrorKind::IoError: return L"IoError";
        case CloudErrorKind::Cancelled: return L"Cancelled";
        case CloudErrorKind::Unknown: break;
    }
    return L"Unknown";
}
} // namespace CloudSync
