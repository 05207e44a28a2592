#pragma once

#include "CloudFilterApi.h"
#include "Helpers.h"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace SelfTest
{
// In-memory ICloudFilterApi that records every command per key pair.
// Failures can be scripted per call type; RetrieveData serves bytes from SetFileContent.
class MockCloudFilterApi final : public CloudSync::ICloudFilterApi
{
public:
    enum class Call : uint8_t
    {
        TransferData,
        RetrieveData,
        AckData,
        TransferPlaceholders,
        AckDehydrate,
        AckDelete,
        AckRename,
        ReportProgress,
        RegisterSyncRoot,
        UnregisterSyncRoot,
        ConnectSyncRoot,
        DisconnectSyncRoot,
    };

    struct Record
    {
        Call call{};
        CloudSync::CorrelationKeyPair keys;
        int64_t offset            = 0;
        int64_t length            = 0;
        NTSTATUS completionStatus = STATUS_SUCCESS;
        std::vector<std::byte> payload;
        CloudSync::TransferPlaceholdersFlags flags;
        std::vector<std::wstring> names;
        int64_t total     = 0;
        int64_t completed = 0;
    };

    MockCloudFilterApi() = default;

    MockCloudFilterApi(const MockCloudFilterApi&)            = delete;
    MockCloudFilterApi& operator=(const MockCloudFilterApi&) = delete;
    MockCloudFilterApi(MockCloudFilterApi&&)                 = delete;
    MockCloudFilterApi& operator=(MockCloudFilterApi&&)      = delete;

    // The next call of this type returns hr without recording a success.
    void FailNext(Call call, HRESULT hr);
    // The placeholder at index reports hr in every following batch.
    void FailPlaceholderEntry(size_t index, HRESULT hr);
    void SetFileContent(std::vector<std::byte> content);
    // Invoked (outside the lock) at the start of every call.
    void SetOnCall(std::function<void(Call)> onCall);

    [[nodiscard]] std::vector<Record> Records() const;
    [[nodiscard]] std::vector<Record> Records(const CloudSync::CorrelationKeyPair& keys) const;
    [[nodiscard]] size_t Count(Call call) const;

    // Calls that answer the operation: denials, acknowledgements and placeholder batches.
    [[nodiscard]] size_t ResolutionCount(const CloudSync::CorrelationKeyPair& keys) const;

    [[nodiscard]] std::optional<CloudSync::SyncRootId> RegisteredId() const;
    [[nodiscard]] std::filesystem::path RegisteredPath() const;
    [[nodiscard]] std::optional<CloudSync::SyncRootRegistration> RegisteredBundle() const;

    // Connection state; the callback table and context are what an OS callback would carry.
    [[nodiscard]] bool IsConnected() const;
    [[nodiscard]] void* CallbackContext() const;
    // Registered callback for type, or nullptr.
    [[nodiscard]] CF_CALLBACK FindCallback(CF_CALLBACK_TYPE type) const;

    HRESULT TransferData(const CloudSync::CorrelationKeyPair& keys, std::span<const std::byte> buffer, int64_t offset, int64_t length, NTSTATUS completionStatus) noexcept override;
    HRESULT RetrieveData(const CloudSync::CorrelationKeyPair& keys, std::span<std::byte> buffer, int64_t offset, uint64_t& bytesRead) noexcept override;
    HRESULT AckData(const CloudSync::CorrelationKeyPair& keys, int64_t offset, int64_t length, NTSTATUS completionStatus) noexcept override;
    HRESULT TransferPlaceholders(const CloudSync::CorrelationKeyPair& keys,
                                 std::span<const CloudSync::Placeholder> placeholders,
                                 const CloudSync::TransferPlaceholdersFlags& flags,
                                 NTSTATUS completionStatus,
                                 std::span<CloudSync::PlaceholderResult> results) noexcept override;
    HRESULT AckDehydrate(const CloudSync::CorrelationKeyPair& keys, std::span<const std::byte> blob, NTSTATUS completionStatus) noexcept override;
    HRESULT AckDelete(const CloudSync::CorrelationKeyPair& keys, NTSTATUS completionStatus) noexcept override;
    HRESULT AckRename(const CloudSync::CorrelationKeyPair& keys, NTSTATUS completionStatus) noexcept override;
    HRESULT ReportProgress(const CloudSync::CorrelationKeyPair& keys, int64_t total, int64_t completed) noexcept override;
    HRESULT RegisterSyncRoot(const CloudSync::SyncRootId& id, const std::filesystem::path& syncRootPath, const CloudSync::SyncRootRegistration& registration) noexcept override;
    HRESULT UnregisterSyncRoot(const CloudSync::SyncRootId& id) noexcept override;
    HRESULT ConnectSyncRoot(const std::filesystem::path& syncRootPath, const CF_CALLBACK_REGISTRATION* callbacks, void* callbackContext, CloudSync::ConnectionKey& key) noexcept override;
    HRESULT DisconnectSyncRoot(CloudSync::ConnectionKey key) noexcept override;

private:
    // Runs the hook, consumes a scripted failure and records the call. Returns the failure, if any.
    [[nodiscard]] HRESULT Begin(Call call) noexcept;
    void Append(Record record) noexcept;

    mutable std::mutex _mutex;
    std::vector<Record> _records;
    std::map<Call, HRESULT> _failNext;
    std::map<size_t, HRESULT> _entryFailures;
    std::vector<std::byte> _content;
    std::function<void(Call)> _onCall;

    std::optional<CloudSync::SyncRootId> _registeredId;
    std::filesystem::path _registeredPath;
    std::optional<CloudSync::SyncRootRegistration> _registeredBundle;

    std::optional<CloudSync::ConnectionKey> _connectionKey;
    const CF_CALLBACK_REGISTRATION* _callbacks = nullptr;
    void* _callbackContext                     = nullptr;
};

// Correlation keys for test operations; transfer distinguishes concurrent operations.
[[nodiscard]] CloudSync::CorrelationKeyPair MakeKeys(int64_t transfer, int64_t connection = 0x5A5A) noexcept;

[[nodiscard]] std::vector<std::byte> MakePattern(size_t size, uint8_t seed = 0);
} // namespace SelfTest
