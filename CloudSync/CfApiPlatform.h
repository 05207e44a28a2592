#pragma once

#include "CloudFilterApi.h"
#include "Helpers.h"

#include <memory>

namespace CloudSync
{
// ICloudFilterApi over the Cloud Filter API (CldApi) for commands and
// Windows.Storage.Provider (C++/WinRT) for sync root registration.
// Registration blocks on WinRT async calls and must not run on an STA thread.
class CfApiCloudFilterApi final : public ICloudFilterApi
{
public:
    CfApiCloudFilterApi() = default;

    CfApiCloudFilterApi(const CfApiCloudFilterApi&)            = delete;
    CfApiCloudFilterApi& operator=(const CfApiCloudFilterApi&) = delete;
    CfApiCloudFilterApi(CfApiCloudFilterApi&&)                 = delete;
    CfApiCloudFilterApi& operator=(CfApiCloudFilterApi&&)      = delete;

    HRESULT TransferData(const CorrelationKeyPair& keys, std::span<const std::byte> buffer, int64_t offset, int64_t length, NTSTATUS completionStatus) noexcept override;
    HRESULT RetrieveData(const CorrelationKeyPair& keys, std::span<std::byte> buffer, int64_t offset, uint64_t& bytesRead) noexcept override;
    HRESULT AckData(const CorrelationKeyPair& keys, int64_t offset, int64_t length, NTSTATUS completionStatus) noexcept override;
    HRESULT TransferPlaceholders(const CorrelationKeyPair& keys,
                                 std::span<const Placeholder> placeholders,
                                 const TransferPlaceholdersFlags& flags,
                                 NTSTATUS completionStatus,
                                 std::span<PlaceholderResult> results) noexcept override;
    HRESULT AckDehydrate(const CorrelationKeyPair& keys, std::span<const std::byte> blob, NTSTATUS completionStatus) noexcept override;
    HRESULT AckDelete(const CorrelationKeyPair& keys, NTSTATUS completionStatus) noexcept override;
    HRESULT AckRename(const CorrelationKeyPair& keys, NTSTATUS completionStatus) noexcept override;
    HRESULT ReportProgress(const CorrelationKeyPair& keys, int64_t total, int64_t completed) noexcept override;
    HRESULT RegisterSyncRoot(const SyncRootId& id, const std::filesystem::path& syncRootPath, const SyncRootRegistration& registration) noexcept override;
    HRESULT UnregisterSyncRoot(const SyncRootId& id) noexcept override;
    HRESULT ConnectSyncRoot(const std::filesystem::path& syncRootPath, const CF_CALLBACK_REGISTRATION* callbacks, void* callbackContext, ConnectionKey& key) noexcept override;
    HRESULT DisconnectSyncRoot(ConnectionKey key) noexcept override;
};

[[nodiscard]] std::shared_ptr<ICloudFilterApi> CreateCfApiCloudFilterApi();
} // namespace CloudSync
