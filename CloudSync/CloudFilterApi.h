#pragma once

#include "CorrelationKeys.h"
#include "Helpers.h"
#include "Placeholder.h"
#include "Registration.h"

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <span>

#include <unknwn.h>

#include <cfapi.h>

namespace CloudSync
{
// OS boundary for everything CloudSync asks of the Cloud Filter platform.
// Notes:
// - This is NOT a COM interface; lifetime is owned by the caller (typically std::shared_ptr).
// - Every method is synchronous and blocking, and may be called concurrently from OS pool threads
//   for different correlation key pairs.
// - completionStatus is STATUS_SUCCESS to approve an operation; any other NTSTATUS is an explicit
//   denial and the payload arguments are ignored by the OS.
// - Implementations report failures as HRESULT and never throw.
interface __declspec(novtable) ICloudFilterApi
{
    virtual ~ICloudFilterApi() = default;

    // CF_OPERATION_TYPE_TRANSFER_DATA for [offset, offset + length). Alignment is checked by the caller.
    // On success length equals buffer.size(); a denial passes an empty buffer and the requested range.
    virtual HRESULT TransferData(const CorrelationKeyPair& keys, std::span<const std::byte> buffer, int64_t offset, int64_t length, NTSTATUS completionStatus) noexcept = 0;

    // CF_OPERATION_TYPE_RETRIEVE_DATA. bytesRead may be less than buffer.size() only at end of file.
    virtual HRESULT RetrieveData(const CorrelationKeyPair& keys, std::span<std::byte> buffer, int64_t offset, uint64_t& bytesRead) noexcept = 0;

    // CF_OPERATION_TYPE_ACK_DATA for [offset, offset + length).
    virtual HRESULT AckData(const CorrelationKeyPair& keys, int64_t offset, int64_t length, NTSTATUS completionStatus) noexcept = 0;

    // CF_OPERATION_TYPE_TRANSFER_PLACEHOLDERS.
    // results has one slot per placeholder and receives the per-entry outcome in input order.
    // The return value describes the batch as a whole: a failure means the OS rejected the batch.
    virtual HRESULT TransferPlaceholders(const CorrelationKeyPair& keys,
                                         std::span<const Placeholder> placeholders,
                                         const TransferPlaceholdersFlags& flags,
                                         NTSTATUS completionStatus,
                                         std::span<PlaceholderResult> results) noexcept = 0;

    // CF_OPERATION_TYPE_ACK_DEHYDRATE. blob may be empty; the caller enforces kMaxBlobSize.
    virtual HRESULT AckDehydrate(const CorrelationKeyPair& keys, std::span<const std::byte> blob, NTSTATUS completionStatus) noexcept = 0;

    virtual HRESULT AckDelete(const CorrelationKeyPair& keys, NTSTATUS completionStatus) noexcept = 0;
    virtual HRESULT AckRename(const CorrelationKeyPair& keys, NTSTATUS completionStatus) noexcept = 0;

    // CfReportProviderProgress. Advisory only.
    virtual HRESULT ReportProgress(const CorrelationKeyPair& keys, int64_t total, int64_t completed) noexcept = 0;

    // Registers (or updates) the sync root; registration has already been validated.
    virtual HRESULT RegisterSyncRoot(const SyncRootId& id, const std::filesystem::path& syncRootPath, const SyncRootRegistration& registration) noexcept = 0;
    virtual HRESULT UnregisterSyncRoot(const SyncRootId& id) noexcept = 0;

    // CfConnectSyncRoot. callbacks ends with CF_CALLBACK_REGISTRATION_END; callbackContext comes
    // back in CF_CALLBACK_INFO::CallbackContext until DisconnectSyncRoot succeeds.
    virtual HRESULT ConnectSyncRoot(const std::filesystem::path& syncRootPath, const CF_CALLBACK_REGISTRATION* callbacks, void* callbackContext, ConnectionKey& key) noexcept = 0;

    // CfDisconnectSyncRoot. Blocks until callbacks already delivered on the connection have returned.
    virtual HRESULT DisconnectSyncRoot(ConnectionKey key) noexcept = 0;
};
} // namespace CloudSync
