#pragma once

#include "CallbackInfo.h"
#include "CloudError.h"
#include "Commands.h"
#include "CorrelationKeys.h"
#include "Helpers.h"
#include "OperationState.h"
#include "Placeholder.h"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <span>
#include <utility>
#include <vector>

namespace CloudSync
{
struct ICloudFilterApi;

// Tickets are capability-scoped handles on one in-flight OS operation.
// Notes:
// - A ticket is move-only and exposes only the commands legal for its operation kind.
// - It may be moved to another thread and resolved after the callback returned.
// - Resolving commands (Pass*, Fail) succeed at most once. Later calls return kTicketAlreadyResolved,
//   or kOperationCancelled when the OS cancelled the operation first, without calling the OS.
// - Arguments rejected by validation return E_INVALIDARG and leave the ticket unresolved.
// - When the OS rejects a resolving command the ticket stays unresolved and the call may be retried.
class TicketBase
{
public:
    TicketBase(const TicketBase&)            = delete;
    TicketBase& operator=(const TicketBase&) = delete;
    TicketBase(TicketBase&&) noexcept            = default;
    TicketBase& operator=(TicketBase&&) noexcept = default;

    [[nodiscard]] const CorrelationKeyPair& Keys() const noexcept;
    [[nodiscard]] OperationStatus Status() const noexcept;
    [[nodiscard]] bool IsResolved() const noexcept;

protected:
    TicketBase(std::shared_ptr<ICloudFilterApi> api, std::shared_ptr<OperationState> state) noexcept;
    ~TicketBase();

    // S_OK when commands may still run against the operation.
    [[nodiscard]] HRESULT Gate() const noexcept;

    template <typename Command> [[nodiscard]] HRESULT Resolve(const Command& command) noexcept
    {
        const HRESULT validateHr = command.Validate();
        if (FAILED(validateHr))
        {
            return validateHr;
        }

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
        _state->CompleteResolve(SUCCEEDED(hr));
        return hr;
    }

    [[nodiscard]] HRESULT Claim() noexcept;

    std::shared_ptr<ICloudFilterApi> _api;
    std::shared_ptr<OperationState> _state;
};

class FetchDataTicket final : public TicketBase
{
public:
    FetchDataTicket(std::shared_ptr<ICloudFilterApi> api, std::shared_ptr<OperationState> state, const FetchDataInfo& info, uint64_t fileSize) noexcept;

    FetchDataTicket(FetchDataTicket&&) noexcept            = default;
    FetchDataTicket& operator=(FetchDataTicket&&) noexcept = default;

    // Reads bytes already present in the placeholder.
    [[nodiscard]] HRESULT ReadAt(std::span<std::byte> buffer, uint64_t position, uint64_t& bytesRead) noexcept;

    // Transfers one chunk of file content. Chunks follow the alignment rule of WriteCommand and may
    // be sent in any order. The operation is held for the duration of the transfer, so a concurrent
    // cancellation or denial waits for it; once the written chunks cover the required range the
    // ticket is resolved and later writes return kTicketAlreadyResolved.
    [[nodiscard]] HRESULT WriteAt(std::span<const std::byte> buffer, uint64_t position) noexcept;

    // Advisory progress for the shell. Cheap error once the operation was resolved or cancelled.
    [[nodiscard]] HRESULT ReportProgress(uint64_t total, uint64_t completed) noexcept;

    // Denies the required range with a completion status derived from reason.
    [[nodiscard]] HRESULT Fail(HRESULT reason) noexcept;

    [[nodiscard]] uint64_t FileSize() const noexcept
    {
        return _fileSize;
    }

    // Bytes of the required range accepted by the OS so far.
    [[nodiscard]] uint64_t RequiredBytesWritten() const noexcept;

private:
    // Merges [begin, end) into the written ranges; returns true once the required range is covered.
    [[nodiscard]] bool RecordWrittenLocked(uint64_t begin, uint64_t end);

    uint64_t _requiredOffset = 0;
    uint64_t _requiredLength = 0;
    uint64_t _fileSize       = 0;
    // Disjoint, sorted [begin, end) ranges clipped to the required range.
    std::vector<std::pair<uint64_t, uint64_t>> _written;
};

class ValidateDataTicket final : public TicketBase
{
public:
    ValidateDataTicket(std::shared_ptr<ICloudFilterApi> api, std::shared_ptr<OperationState> state, const ValidateDataInfo& info) noexcept;

    ValidateDataTicket(ValidateDataTicket&&) noexcept            = default;
    ValidateDataTicket& operator=(ValidateDataTicket&&) noexcept = default;

    // Reads back the transferred data to validate. Anything shorter than the buffer fails with kShortRead.
    [[nodiscard]] HRESULT ReadAt(std::span<std::byte> buffer, uint64_t position, uint64_t& bytesRead) noexcept;

    // Confirms [offset, offset + length) as valid.
    [[nodiscard]] HRESULT Pass(uint64_t offset, uint64_t length) noexcept;

    [[nodiscard]] HRESULT Fail(HRESULT reason) noexcept;

private:
    uint64_t _requiredOffset = 0;
    uint64_t _requiredLength = 0;
};

class FetchPlaceholdersTicket final : public TicketBase
{
public:
    FetchPlaceholdersTicket(std::shared_ptr<ICloudFilterApi> api, std::shared_ptr<OperationState> state) noexcept;

    FetchPlaceholdersTicket(FetchPlaceholdersTicket&&) noexcept            = default;
    FetchPlaceholdersTicket& operator=(FetchPlaceholdersTicket&&) noexcept = default;

    // Creates the directory listing. results receives one outcome per placeholder.
    // Returns S_OK, S_FALSE when some entries failed, or the error that rejected the batch.
    [[nodiscard]] HRESULT PassWithPlaceholders(std::span<const Placeholder> placeholders,
                                               std::vector<PlaceholderResult>& results,
                                               const TransferPlaceholdersFlags& flags = {}) noexcept;

    [[nodiscard]] HRESULT Fail(HRESULT reason) noexcept;
};

class DehydrateTicket final : public TicketBase
{
public:
    DehydrateTicket(std::shared_ptr<ICloudFilterApi> api, std::shared_ptr<OperationState> state) noexcept;

    DehydrateTicket(DehydrateTicket&&) noexcept            = default;
    DehydrateTicket& operator=(DehydrateTicket&&) noexcept = default;

    [[nodiscard]] HRESULT Pass() noexcept;

    // Approves and stores blob as the new file identity. Blobs over kMaxBlobSize are rejected up front.
    [[nodiscard]] HRESULT PassWithBlob(std::span<const std::byte> blob) noexcept;

    [[nodiscard]] HRESULT Fail(HRESULT reason) noexcept;
};

class DeleteTicket final : public TicketBase
{
public:
    DeleteTicket(std::shared_ptr<ICloudFilterApi> api, std::shared_ptr<OperationState> state) noexcept;

    DeleteTicket(DeleteTicket&&) noexcept            = default;
    DeleteTicket& operator=(DeleteTicket&&) noexcept = default;

    [[nodiscard]] HRESULT Pass() noexcept;
    [[nodiscard]] HRESULT Fail(HRESULT reason) noexcept;
};

class RenameTicket final : public TicketBase
{
public:
    RenameTicket(std::shared_ptr<ICloudFilterApi> api, std::shared_ptr<OperationState> state) noexcept;

    RenameTicket(RenameTicket&&) noexcept            = default;
    RenameTicket& operator=(RenameTicket&&) noexcept = default;

    [[nodiscard]] HRESULT Pass() noexcept;
    [[nodiscard]] HRESULT Fail(HRESULT reason) noexcept;
};
} // namespace CloudSync
