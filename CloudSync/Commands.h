#pragma once

#include "CloudError.h"
#include "CorrelationKeys.h"
#include "Helpers.h"
#include "Placeholder.h"

#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

namespace CloudSync
{
struct ICloudFilterApi;

// Operation commands: one value per OS acknowledgement, constructed per call.
// Validate() checks everything that can be checked without the OS; Execute() validates again,
// performs the blocking OS call against the given key pair and translates its result.
// A completionStatus other than STATUS_SUCCESS turns the command into an explicit denial.

// Reads bytes already present in the placeholder (CF_OPERATION_TYPE_RETRIEVE_DATA).
struct ReadCommand
{
    std::span<std::byte> buffer;
    uint64_t position = 0;

    [[nodiscard]] HRESULT Validate() const noexcept;
    // bytesRead is shorter than the buffer only at end of file.
    [[nodiscard]] HRESULT Execute(ICloudFilterApi& api, const CorrelationKeyPair& keys, uint64_t& bytesRead) const noexcept;
};

// Hydrates a range of the placeholder (CF_OPERATION_TYPE_TRANSFER_DATA).
// position must be a multiple of kTransferAlignment, and so must the length unless the write ends
// exactly at fileSize. Writes past fileSize are rejected.
struct WriteCommand
{
    std::span<const std::byte> buffer;
    uint64_t position          = 0;
    uint64_t fileSize          = 0;
    NTSTATUS completionStatus  = STATUS_SUCCESS;

    [[nodiscard]] HRESULT Validate() const noexcept;
    [[nodiscard]] HRESULT Execute(ICloudFilterApi& api, const CorrelationKeyPair& keys) const noexcept;
};

// Denies a FetchData range (CF_OPERATION_TYPE_TRANSFER_DATA with a failure status and no data).
struct FailTransferCommand
{
    uint64_t offset           = 0;
    uint64_t length           = 0;
    NTSTATUS completionStatus = STATUS_CLOUD_FILE_UNSUCCESSFUL;

    [[nodiscard]] HRESULT Validate() const noexcept;
    [[nodiscard]] HRESULT Execute(ICloudFilterApi& api, const CorrelationKeyPair& keys) const noexcept;
};

// Confirms or rejects a range during ValidateData (CF_OPERATION_TYPE_ACK_DATA).
struct ValidateCommand
{
    uint64_t offset           = 0;
    uint64_t length           = 0;
    NTSTATUS completionStatus = STATUS_SUCCESS;

    [[nodiscard]] HRESULT Validate() const noexcept;
    [[nodiscard]] HRESULT Execute(ICloudFilterApi& api, const CorrelationKeyPair& keys) const noexcept;
};

// Creates child placeholders (CF_OPERATION_TYPE_TRANSFER_PLACEHOLDERS).
// results receives one entry per placeholder in input order. Execute returns S_OK when every
// entry succeeded, S_FALSE when the OS accepted the batch but some entries failed, and the OS
// error when the batch itself was rejected.
struct CreatePlaceholdersCommand
{
    std::span<const Placeholder> placeholders;
    TransferPlaceholdersFlags flags;
    NTSTATUS completionStatus = STATUS_SUCCESS;

    [[nodiscard]] HRESULT Validate() const noexcept;
    [[nodiscard]] HRESULT Execute(ICloudFilterApi& api, const CorrelationKeyPair& keys, std::vector<PlaceholderResult>& results) const noexcept;
};

// Acknowledges a dehydration, optionally replacing the file identity blob (CF_OPERATION_TYPE_ACK_DEHYDRATE).
struct DehydrateCommand
{
    std::span<const std::byte> blob;
    NTSTATUS completionStatus = STATUS_SUCCESS;

    [[nodiscard]] HRESULT Validate() const noexcept;
    [[nodiscard]] HRESULT Execute(ICloudFilterApi& api, const CorrelationKeyPair& keys) const noexcept;
};

// CF_OPERATION_TYPE_ACK_DELETE.
struct DeleteCommand
{
    NTSTATUS completionStatus = STATUS_SUCCESS;

    [[nodiscard]] HRESULT Validate() const noexcept
    {
        return S_OK;
    }
    [[nodiscard]] HRESULT Execute(ICloudFilterApi& api, const CorrelationKeyPair& keys) const noexcept;
};

// CF_OPERATION_TYPE_ACK_RENAME.
struct RenameCommand
{
    NTSTATUS completionStatus = STATUS_SUCCESS;

    [[nodiscard]] HRESULT Validate() const noexcept
    {
        return S_OK;
    }
    [[nodiscard]] HRESULT Execute(ICloudFilterApi& api, const CorrelationKeyPair& keys) const noexcept;
};

[[nodiscard]] bool IsTransferAligned(uint64_t position, uint64_t length, uint64_t fileSize) noexcept;
} // namespace CloudSync
