#include "Commands.h"

#include "CloudFilterApi.h"

#include <limits>
#include <new>

namespace CloudSync
{
namespace
{
constexpr uint64_t kMaxSignedOffset = static_cast<uint64_t>(std::numeric_limits<int64_t>::max());

[[nodiscard]] bool FitsSignedRange(uint64_t offset, uint64_t length) noexcept
{
    return offset <= kMaxSignedOffset && length <= kMaxSignedOffset - offset;
}

[[nodiscard]] bool IsDenial(NTSTATUS status) noexcept
{
    return status != STATUS_SUCCESS;
}
} // namespace

bool IsTransferAligned(uint64_t position, uint64_t length, uint64_t fileSize) noexcept
{
    if ((position % kTransferAlignment) != 0)
    {
        return false;
    }

    if ((length % kTransferAlignment) == 0)
    {
        return true;
    }

    // Only the final chunk of the file may have an unaligned length.
    return position + length == fileSize;
}

HRESULT ReadCommand::Validate() const noexcept
{
    // An unusable read range is reported like the OS reports it, as an I/O failure.
    if (buffer.empty())
    {
        return HRESULT_FROM_WIN32(ERROR_INVALID_USER_BUFFER);
    }
    if (! FitsSignedRange(position, buffer.size()))
    {
        return HRESULT_FROM_WIN32(ERROR_NEGATIVE_SEEK);
    }
    return S_OK;
}

HRESULT ReadCommand::Execute(ICloudFilterApi& api, const CorrelationKeyPair& keys, uint64_t& bytesRead) const noexcept
{
    bytesRead = 0;

    const HRESULT validateHr = Validate();
    if (FAILED(validateHr))
    {
        return validateHr;
    }

    const HRESULT hr = api.RetrieveData(keys, buffer, static_cast<int64_t>(position), bytesRead);
    if (FAILED(hr))
    {
        Debug::Warning(L"CloudSync: RETRIEVE_DATA at {} ({} bytes) failed (hr=0x{:08X})", position, buffer.size(), static_cast<unsigned long>(hr));
        bytesRead = 0;
        return hr;
    }

    if (bytesRead > buffer.size())
    {
        bytesRead = buffer.size();
    }
    return S_OK;
}

HRESULT WriteCommand::Validate() const noexcept
{
    if (IsDenial(completionStatus))
    {
        return E_INVALIDARG;
    }

    if (buffer.empty() || ! FitsSignedRange(position, buffer.size()))
    {
        return E_INVALIDARG;
    }

    if (position + buffer.size() > fileSize)
    {
        return E_INVALIDARG;
    }

    if (! IsTransferAligned(position, buffer.size(), fileSize))
    {
        return E_INVALIDARG;
    }

    return S_OK;
}

HRESULT WriteCommand::Execute(ICloudFilterApi& api, const CorrelationKeyPair& keys) const noexcept
{
    const HRESULT validateHr = Validate();
    if (FAILED(validateHr))
    {
        Debug::Warning(L"CloudSync: rejected TRANSFER_DATA at {} ({} bytes, file size {}): writes must be {}-byte aligned and end within the file",
                       position,
                       buffer.size(),
                       fileSize,
                       kTransferAlignment);
        return validateHr;
    }

    const HRESULT hr =
        api.TransferData(keys, buffer, static_cast<int64_t>(position), static_cast<int64_t>(buffer.size()), STATUS_SUCCESS);
    if (FAILED(hr))
    {
        Debug::Warning(L"CloudSync: TRANSFER_DATA at {} ({} bytes) failed (hr=0x{:08X})", position, buffer.size(), static_cast<unsigned long>(hr));
    }
    return hr;
}

HRESULT FailTransferCommand::Validate() const noexcept
{
    if (! IsDenial(completionStatus) || ! FitsSignedRange(offset, length))
    {
        return E_INVALIDARG;
    }
    return S_OK;
}

HRESULT FailTransferCommand::Execute(ICloudFilterApi& api, const CorrelationKeyPair& keys) const noexcept
{
    const HRESULT validateHr = Validate();
    if (FAILED(validateHr))
    {
        return validateHr;
    }

    return api.TransferData(keys, {}, static_cast<int64_t>(offset), static_cast<int64_t>(length), completionStatus);
}

HRESULT ValidateCommand::Validate() const noexcept
{
    if (! FitsSignedRange(offset, length))
    {
        return E_INVALIDARG;
    }

    if (! IsDenial(completionStatus) && length == 0)
    {
        return E_INVALIDARG;
    }

    return S_OK;
}

HRESULT ValidateCommand::Execute(ICloudFilterApi& api, const CorrelationKeyPair& keys) const noexcept
{
    const HRESULT validateHr = Validate();
    if (FAILED(validateHr))
    {
        return validateHr;
    }

    const HRESULT hr = api.AckData(keys, static_cast<int64_t>(offset), static_cast<int64_t>(length), completionStatus);
    if (FAILED(hr))
    {
        Debug::Warning(L"CloudSync: ACK_DATA for [{}, +{}) failed (hr=0x{:08X})", offset, length, static_cast<unsigned long>(hr));
    }
    return hr;
}

HRESULT CreatePlaceholdersCommand::Validate() const noexcept
{
    if (placeholders.size() > static_cast<size_t>(std::numeric_limits<DWORD>::max()))
    {
        return E_INVALIDARG;
    }

    if (IsDenial(completionStatus) && ! placeholders.empty())
    {
        return E_INVALIDARG;
    }

    for (const Placeholder& placeholder : placeholders)
    {
        if (placeholder.relativeName.empty() || placeholder.identity.size() > kMaxFileIdentitySize)
        {
            return E_INVALIDARG;
        }
    }

    return S_OK;
}

HRESULT CreatePlaceholdersCommand::Execute(ICloudFilterApi& api, const CorrelationKeyPair& keys, std::vector<PlaceholderResult>& results) const noexcept
{
    results.clear();

    const HRESULT validateHr = Validate();
    if (FAILED(validateHr))
    {
        Debug::Warning(L"CloudSync: rejected TRANSFER_PLACEHOLDERS batch of {} entries (empty name or identity over {} bytes)",
                       placeholders.size(),
                       kMaxFileIdentitySize);
        return validateHr;
    }

    try
    {
        results.resize(placeholders.size());
    }
    catch (const std::bad_alloc&)
    {
        return E_OUTOFMEMORY;
    }

    Debug::Perf::Scope perf(L"CloudSync.CreatePlaceholders");
    perf.SetValue0(placeholders.size());

    const HRESULT hr = api.TransferPlaceholders(keys, placeholders, flags, completionStatus, results);
    perf.SetHr(hr);
    if (FAILED(hr))
    {
        Debug::Warning(L"CloudSync: TRANSFER_PLACEHOLDERS with {} entries failed (hr=0x{:08X})", placeholders.size(), static_cast<unsigned long>(hr));
        return hr;
    }

    size_t failed = 0;
    for (size_t i = 0; i < results.size(); ++i)
    {
        if (FAILED(results[i].result))
        {
            ++failed;
            Debug::Warning(L"CloudSync: placeholder '{}' was not created (hr=0x{:08X})",
                           placeholders[i].relativeName,
                           static_cast<unsigned long>(results[i].result));
        }
    }

    perf.SetValue1(failed);
    return failed == 0 ? S_OK : S_FALSE;
}

HRESULT DehydrateCommand::Validate() const noexcept
{
    if (blob.size() > kMaxBlobSize)
    {
        return E_INVALIDARG;
    }

    if (IsDenial(completionStatus) && ! blob.empty())
    {
        return E_INVALIDARG;
    }

    return S_OK;
}

HRESULT DehydrateCommand::Execute(ICloudFilterApi& api, const CorrelationKeyPair& keys) const noexcept
{
    const HRESULT validateHr = Validate();
    if (FAILED(validateHr))
    {
        Debug::Warning(L"CloudSync: rejected ACK_DEHYDRATE blob of {} bytes (limit {})", blob.size(), kMaxBlobSize);
        return validateHr;
    }

    const HRESULT hr = api.AckDehydrate(keys, blob, completionStatus);
    if (FAILED(hr))
    {
        Debug::Warning(L"CloudSync: ACK_DEHYDRATE failed (hr=0x{:08X})", static_cast<unsigned long>(hr));
    }
    return hr;
}

HRESULT DeleteCommand::Execute(ICloudFilterApi& api, const CorrelationKeyPair& keys) const noexcept
{
    const HRESULT hr = api.AckDelete(keys, completionStatus);
    if (FAILED(hr))
    {
        Debug::Warning(L"CloudSync: ACK_DELETE failed (hr=0x{:08X})", static_cast<unsigned long>(hr));
    }
    return hr;
}

HRESULT RenameCommand::Execute(ICloudFilterApi& api, const CorrelationKeyPair& keys) const noexcept
{
    const HRESULT hr = api.AckRename(keys, completionStatus);
    if (FAILED(hr))
    {
        Debug::Warning(L"CloudSync: ACK_RENAME failed (hr=0x{:08X})", static_cast<unsigned long>(hr));
    }
    return hr;
}
} // namespace CloudSync
