#include "Tickets.h"

#include "CloudFilterApi.h"

#include <algorithm>
#include <new>
#include <utility>

namespace CloudSync
{
namespace
{
const CorrelationKeyPair kEmptyKeys{};

// Denials must carry a failure status; a success reason is a caller bug.
[[nodiscard]] bool TryDenialStatus(HRESULT reason, NTSTATUS& status) noexcept
{
    if (SUCCEEDED(reason))
    {
        return false;
    }

    status = CompletionStatusFromHResult(reason);
    return status != STATUS_SUCCESS;
}
} // namespace

TicketBase::TicketBase(std::shared_ptr<ICloudFilterApi> api, std::shared_ptr<OperationState> state) noexcept
    : _api(std::move(api)),
      _state(std::move(state))
{
}

TicketBase::~TicketBase()
{
    if (! _state || _state->Kind() == OperationKind::FetchData || _state->IsInCallback())
    {
        return;
    }

    if (_state->Status() == OperationStatus::Pending)
    {
        Debug::Warning(L"CloudSync: {} ticket {}/{} dropped without a response; the file operation will hang",
                       OperationKindName(_state->Kind()),
                       _state->Keys().connection.value,
                       _state->Keys().transfer.value);
    }
}

const CorrelationKeyPair& TicketBase::Keys() const noexcept
{
    return _state ? _state->Keys() : kEmptyKeys;
}

OperationStatus TicketBase::Status() const noexcept
{
    return _state ? _state->Status() : OperationStatus::Resolved;
}

bool TicketBase::IsResolved() const noexcept
{
    return Status() != OperationStatus::Pending;
}

HRESULT TicketBase::Gate() const noexcept
{
    if (! _state || ! _api)
    {
        return kTicketAlreadyResolved;
    }
    return _state->GateResult();
}

HRESULT TicketBase::Claim() noexcept
{
    if (! _state || ! _api)
    {
        return kTicketAlreadyResolved;
    }

    if (! _state->TryBeginResolve())
    {
        const HRESULT hr = _state->GateResult();
        Debug::Warning(L"CloudSync: {} ticket {}/{} resolved twice (hr=0x{:08X})",
                       OperationKindName(_state->Kind()),
                       _state->Keys().connection.value,
                       _state->Keys().transfer.value,
                       static_cast<unsigned long>(hr));
        return FAILED(hr) ? hr : kTicketAlreadyResolved;
    }

    return S_OK;
}

FetchDataTicket::FetchDataTicket(std::shared_ptr<ICloudFilterApi> api, std::shared_ptr<OperationState> state, const FetchDataInfo& info, uint64_t fileSize) noexcept
    : TicketBase(std::move(api), std::move(state)),
      _requiredOffset(info.requiredOffset),
      _requiredLength(info.requiredLength),
      _fileSize(fileSize)
{
}

HRESULT FetchDataTicket::ReadAt(std::span<std::byte> buffer, uint64_t position, uint64_t& bytesRead) noexcept
{
    bytesRead = 0;

    const HRESULT gateHr = Gate();
    if (FAILED(gateHr))
    {
        return gateHr;
    }

    const ReadCommand command{buffer, position};
    return command.Execute(*_api, _state->Keys(), bytesRead);
}

HRESULT FetchDataTicket::WriteAt(std::span<const std::byte> buffer, uint64_t position) noexcept
{
    WriteCommand command;
    command.buffer   = buffer;
    command.position = position;
    command.fileSize = _fileSize;

    if (! _state || ! _api)
    {
        return kTicketAlreadyResolved;
    }

    const auto lock       = _state->LockCommands();
    const HRESULT claimHr = Claim();
    if (FAILED(claimHr))
    {
        return claimHr;
    }

    const HRESULT hr = command.Execute(*_api, _state->Keys());
    if (FAILED(hr))
    {
        _state->ReleaseClaim();
        return hr;
    }

    bool covered = false;
    try
    {
        covered = RecordWrittenLocked(position, position + buffer.size());
    }
    catch (const std::bad_alloc&)
    {
        // The chunk reached the OS; only the bookkeeping is lost, so the fetch stays open.
        Debug::Error(L"CloudSync: out of memory tracking FetchData {}/{} coverage", _state->Keys().connection.value, _state->Keys().transfer.value);
    }

    if (covered)
    {
        _state->CompleteResolve(true);
    }
    else
    {
        _state->ReleaseClaim();
    }
    return S_OK;
}

uint64_t FetchDataTicket::RequiredBytesWritten() const noexcept
{
    uint64_t total = 0;
    for (const auto& [begin, end] : _written)
    {
        total += end - begin;
    }
    return total;
}

bool FetchDataTicket::RecordWrittenLocked(uint64_t begin, uint64_t end)
{
    const uint64_t requiredEnd = _requiredOffset + _requiredLength;
    begin                      = std::max(begin, _requiredOffset);
    end                        = std::min(end, requiredEnd);

    if (begin < end)
    {
        auto it = std::lower_bound(_written.begin(), _written.end(), begin, [](const auto& range, uint64_t value) { return range.second < value; });
        while (it != _written.end() && it->first <= end)
        {
            begin = std::min(begin, it->first);
            end   = std::max(end, it->second);
            it    = _written.erase(it);
        }
        _written.insert(it, {begin, end});
    }

    if (_requiredLength == 0)
    {
        return true;
    }
    return _written.size() == 1 && _written.front().first == _requiredOffset && _written.front().second == requiredEnd;
}

HRESULT FetchDataTicket::ReportProgress(uint64_t total, uint64_t completed) noexcept
{
    const HRESULT gateHr = Gate();
    if (FAILED(gateHr))
    {
        return gateHr;
    }

    if (completed > total || total > static_cast<uint64_t>(INT64_MAX))
    {
        return E_INVALIDARG;
    }

    return _api->ReportProgress(_state->Keys(), static_cast<int64_t>(total), static_cast<int64_t>(completed));
}

HRESULT FetchDataTicket::Fail(HRESULT reason) noexcept
{
    FailTransferCommand command;
    command.offset = _requiredOffset;
    command.length = _requiredLength;
    if (! TryDenialStatus(reason, command.completionStatus))
    {
        return E_INVALIDARG;
    }

    return Resolve(command);
}

ValidateDataTicket::ValidateDataTicket(std::shared_ptr<ICloudFilterApi> api, std::shared_ptr<OperationState> state, const ValidateDataInfo& info) noexcept
    : TicketBase(std::move(api), std::move(state)),
      _requiredOffset(info.requiredOffset),
      _requiredLength(info.requiredLength)
{
}

HRESULT ValidateDataTicket::ReadAt(std::span<std::byte> buffer, uint64_t position, uint64_t& bytesRead) noexcept
{
    bytesRead = 0;

    const HRESULT gateHr = Gate();
    if (FAILED(gateHr))
    {
        return gateHr;
    }

    const ReadCommand command{buffer, position};
    const HRESULT hr = command.Execute(*_api, _state->Keys(), bytesRead);
    if (FAILED(hr))
    {
        return hr;
    }

    // Validation cannot complete on partial data.
    if (bytesRead != buffer.size())
    {
        Debug::Warning(L"CloudSync: validation read at {} returned {} of {} bytes", position, bytesRead, buffer.size());
        return kShortRead;
    }
    return S_OK;
}

HRESULT ValidateDataTicket::Pass(uint64_t offset, uint64_t length) noexcept
{
    ValidateCommand command;
    command.offset = offset;
    command.length = length;
    return Resolve(command);
}

HRESULT ValidateDataTicket::Fail(HRESULT reason) noexcept
{
    ValidateCommand command;
    command.offset = _requiredOffset;
    command.length = _requiredLength;
    if (! TryDenialStatus(reason, command.completionStatus))
    {
        return E_INVALIDARG;
    }

    return Resolve(command);
}

FetchPlaceholdersTicket::FetchPlaceholdersTicket(std::shared_ptr<ICloudFilterApi> api, std::shared_ptr<OperationState> state) noexcept
    : TicketBase(std::move(api), std::move(state))
{
}

HRESULT FetchPlaceholdersTicket::PassWithPlaceholders(std::span<const Placeholder> placeholders,
                                                      std::vector<PlaceholderResult>& results,
                                                      const TransferPlaceholdersFlags& flags) noexcept
{
    results.clear();

    CreatePlaceholdersCommand command;
    command.placeholders = placeholders;
    command.flags        = flags;

    const HRESULT validateHr = command.Validate();
    if (FAILED(validateHr))
    {
        return validateHr;
    }

    const HRESULT claimHr = Claim();
    if (FAILED(claimHr))
    {
        return claimHr;
    }

    // S_FALSE still completes the enumeration; the failed entries are reported in results.
    const HRESULT hr = command.Execute(*_api, _state->Keys(), results);
    _state->CompleteResolve(SUCCEEDED(hr));
    return hr;
}

HRESULT FetchPlaceholdersTicket::Fail(HRESULT reason) noexcept
{
    CreatePlaceholdersCommand command;
    command.flags.disableOnDemandPopulation = false;
    if (! TryDenialStatus(reason, command.completionStatus))
    {
        return E_INVALIDARG;
    }

    const HRESULT validateHr = command.Validate();
    if (FAILED(validateHr))
    {
        return validateHr;
    }

    const HRESULT claimHr = Claim();
    if (FAILED(claimHr))
    {
        return claimHr;
    }

    std::vector<PlaceholderResult> results;
    const HRESULT hr = command.Execute(*_api, _state->Keys(), results);
    _state->CompleteResolve(SUCCEEDED(hr));
    return hr;
}

DehydrateTicket::DehydrateTicket(std::shared_ptr<ICloudFilterApi> api, std::shared_ptr<OperationState> state) noexcept
    : TicketBase(std::move(api), std::move(state))
{
}

HRESULT DehydrateTicket::Pass() noexcept
{
    return Resolve(DehydrateCommand{});
}

HRESULT DehydrateTicket::PassWithBlob(std::span<const std::byte> blob) noexcept
{
    DehydrateCommand command;
    command.blob = blob;
    return Resolve(command);
}

HRESULT DehydrateTicket::Fail(HRESULT reason) noexcept
{
    DehydrateCommand command;
    if (! TryDenialStatus(reason, command.completionStatus))
    {
        return E_INVALIDARG;
    }

    return Resolve(command);
}

DeleteTicket::DeleteTicket(std::shared_ptr<ICloudFilterApi> api, std::shared_ptr<OperationState> state) noexcept
    : TicketBase(std::move(api), std::move(state))
{
}

HRESULT DeleteTicket::Pass() noexcept
{
    return Resolve(DeleteCommand{});
}

HRESULT DeleteTicket::Fail(HRESULT reason) noexcept
{
    DeleteCommand command;
    if (! TryDenialStatus(reason, command.completionStatus))
    {
        return E_INVALIDARG;
    }

    return Resolve(command);
}

RenameTicket::RenameTicket(std::shared_ptr<ICloudFilterApi> api, std::shared_ptr<OperationState> state) noexcept
    : TicketBase(std::move(api), std::move(state))
{
}

HRESULT RenameTicket::Pass() noexcept
{
    return Resolve(RenameCommand{});
}

HRESULT RenameTicket::Fail(HRESULT reason) noexcept
{
    RenameCommand command;
    if (! TryDenialStatus(reason, command.completionStatus))
    {
        return E_INVALIDARG;
    }

    return Resolve(command);
}
} // namespace CloudSync
