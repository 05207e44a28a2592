#include "MockCloudFilterApi.h"

#include <algorithm>
#include <new>
#include <utility>

namespace SelfTest
{
namespace
{
[[nodiscard]] bool IsResolution(const MockCloudFilterApi::Record& record) noexcept
{
    switch (record.call)
    {
        // Successful data transfers hydrate the file; only a denial answers the fetch.
        case MockCloudFilterApi::Call::TransferData: return record.completionStatus != STATUS_SUCCESS;
        case MockCloudFilterApi::Call::AckData:
        case MockCloudFilterApi::Call::TransferPlaceholders:
        case MockCloudFilterApi::Call::AckDehydrate:
        case MockCloudFilterApi::Call::AckDelete:
        case MockCloudFilterApi::Call::AckRename: return true;
        default: return false;
    }
}
} // namespace

CloudSync::CorrelationKeyPair MakeKeys(int64_t transfer, int64_t connection) noexcept
{
    CloudSync::CorrelationKeyPair keys;
    keys.connection.value = connection;
    keys.transfer.value   = transfer;
    keys.requestKey       = transfer * 10;
    return keys;
}

std::vector<std::byte> MakePattern(size_t size, uint8_t seed)
{
    std::vector<std::byte> bytes(size);
    for (size_t i = 0; i < size; ++i)
    {
        bytes[i] = static_cast<std::byte>((i * 31u + seed) & 0xFFu);
    }
    return bytes;
}

void MockCloudFilterApi::FailNext(Call call, HRESULT hr)
{
    std::lock_guard lock(_mutex);
    _failNext[call] = hr;
}

void MockCloudFilterApi::FailPlaceholderEntry(size_t index, HRESULT hr)
{
    std::lock_guard lock(_mutex);
    _entryFailures[index] = hr;
}

void MockCloudFilterApi::SetFileContent(std::vector<std::byte> content)
{
    std::lock_guard lock(_mutex);
    _content = std::move(content);
}

void MockCloudFilterApi::SetOnCall(std::function<void(Call)> onCall)
{
    std::lock_guard lock(_mutex);
    _onCall = std::move(onCall);
}

std::vector<MockCloudFilterApi::Record> MockCloudFilterApi::Records() const
{
    std::lock_guard lock(_mutex);
    return _records;
}

std::vector<MockCloudFilterApi::Record> MockCloudFilterApi::Records(const CloudSync::CorrelationKeyPair& keys) const
{
    std::lock_guard lock(_mutex);

    std::vector<Record> matching;
    for (const Record& record : _records)
    {
        if (record.keys == keys)
        {
            matching.push_back(record);
        }
    }
    return matching;
}

size_t MockCloudFilterApi::Count(Call call) const
{
    std::lock_guard lock(_mutex);
    return static_cast<size_t>(std::count_if(_records.begin(), _records.end(), [call](const Record& record) { return record.call == call; }));
}

size_t MockCloudFilterApi::ResolutionCount(const CloudSync::CorrelationKeyPair& keys) const
{
    std::lock_guard lock(_mutex);
    return static_cast<size_t>(
        std::count_if(_records.begin(), _records.end(), [&keys](const Record& record) { return record.keys == keys && IsResolution(record); }));
}

std::optional<CloudSync::SyncRootId> MockCloudFilterApi::RegisteredId() const
{
    std::lock_guard lock(_mutex);
    return _registeredId;
}

std::filesystem::path MockCloudFilterApi::RegisteredPath() const
{
    std::lock_guard lock(_mutex);
    return _registeredPath;
}

std::optional<CloudSync::SyncRootRegistration> MockCloudFilterApi::RegisteredBundle() const
{
    std::lock_guard lock(_mutex);
    return _registeredBundle;
}

HRESULT MockCloudFilterApi::Begin(Call call) noexcept
{
    std::function<void(Call)> onCall;
    {
        std::lock_guard lock(_mutex);
        try
        {
            onCall = _onCall;
        }
        catch (const std::bad_alloc&)
        {
            return E_OUTOFMEMORY;
        }
    }

    if (onCall)
    {
        try
        {
            onCall(call);
        }
        catch (const std::exception&)
        {
            return E_FAIL;
        }
    }

    std::lock_guard lock(_mutex);
    const auto it = _failNext.find(call);
    if (it == _failNext.end())
    {
        return S_OK;
    }

    const HRESULT hr = it->second;
    _failNext.erase(it);
    return hr;
}

void MockCloudFilterApi::Append(Record record) noexcept
{
    std::lock_guard lock(_mutex);
    try
    {
        _records.push_back(std::move(record));
    }
    catch (const std::bad_alloc&)
    {
        Debug::Error(L"MockCloudFilterApi: dropped a record, out of memory");
    }
}

HRESULT MockCloudFilterApi::TransferData(const CloudSync::CorrelationKeyPair& keys,
                                         std::span<const std::byte> buffer,
                                         int64_t offset,
                                         int64_t length,
                                         NTSTATUS completionStatus) noexcept
{
    const HRESULT hr = Begin(Call::TransferData);
    if (FAILED(hr))
    {
        return hr;
    }

    try
    {
        Record record;
        record.call             = Call::TransferData;
        record.keys             = keys;
        record.offset           = offset;
        record.length           = length;
        record.completionStatus = completionStatus;
        record.payload.assign(buffer.begin(), buffer.end());
        Append(std::move(record));
    }
    catch (const std::bad_alloc&)
    {
        return E_OUTOFMEMORY;
    }
    return S_OK;
}

HRESULT MockCloudFilterApi::RetrieveData(const CloudSync::CorrelationKeyPair& keys, std::span<std::byte> buffer, int64_t offset, uint64_t& bytesRead) noexcept
{
    bytesRead = 0;

    const HRESULT hr = Begin(Call::RetrieveData);
    if (FAILED(hr))
    {
        return hr;
    }

    {
        std::lock_guard lock(_mutex);
        const uint64_t start = static_cast<uint64_t>(offset);
        if (start < _content.size())
        {
            const size_t available = static_cast<size_t>(_content.size() - start);
            const size_t count     = std::min(available, buffer.size());
            std::copy_n(_content.begin() + static_cast<ptrdiff_t>(start), count, buffer.begin());
            bytesRead = count;
        }
    }

    Record record;
    record.call   = Call::RetrieveData;
    record.keys   = keys;
    record.offset = offset;
    record.length = static_cast<int64_t>(buffer.size());
    Append(std::move(record));
    return S_OK;
}

HRESULT MockCloudFilterApi::AckData(const CloudSync::CorrelationKeyPair& keys, int64_t offset, int64_t length, NTSTATUS completionStatus) noexcept
{
    const HRESULT hr = Begin(Call::AckData);
    if (FAILED(hr))
    {
        return hr;
    }

    Record record;
    record.call             = Call::AckData;
    record.keys             = keys;
    record.offset           = offset;
    record.length           = length;
    record.completionStatus = completionStatus;
    Append(std::move(record));
    return S_OK;
}

HRESULT MockCloudFilterApi::TransferPlaceholders(const CloudSync::CorrelationKeyPair& keys,
                                                 std::span<const CloudSync::Placeholder> placeholders,
                                                 const CloudSync::TransferPlaceholdersFlags& flags,
                                                 NTSTATUS completionStatus,
                                                 std::span<CloudSync::PlaceholderResult> results) noexcept
{
    const HRESULT hr = Begin(Call::TransferPlaceholders);
    if (FAILED(hr))
    {
        for (auto& result : results)
        {
            result.result = hr;
        }
        return hr;
    }

    try
    {
        Record record;
        record.call             = Call::TransferPlaceholders;
        record.keys             = keys;
        record.flags            = flags;
        record.completionStatus = completionStatus;

        std::lock_guard lock(_mutex);
        bool stopped = false;
        for (size_t i = 0; i < placeholders.size() && i < results.size(); ++i)
        {
            record.names.push_back(placeholders[i].relativeName);

            if (stopped)
            {
                results[i].result = E_ABORT;
                continue;
            }

            const auto failure = _entryFailures.find(i);
            if (failure != _entryFailures.end())
            {
                results[i].result = failure->second;
                stopped           = flags.stopOnError;
                continue;
            }

            results[i].result    = S_OK;
            results[i].createUsn = static_cast<int64_t>(i + 1u);
        }

        _records.push_back(std::move(record));
    }
    catch (const std::bad_alloc&)
    {
        return E_OUTOFMEMORY;
    }
    return S_OK;
}

HRESULT MockCloudFilterApi::AckDehydrate(const CloudSync::CorrelationKeyPair& keys, std::span<const std::byte> blob, NTSTATUS completionStatus) noexcept
{
    const HRESULT hr = Begin(Call::AckDehydrate);
    if (FAILED(hr))
    {
        return hr;
    }

    try
    {
        Record record;
        record.call             = Call::AckDehydrate;
        record.keys             = keys;
        record.completionStatus = completionStatus;
        record.payload.assign(blob.begin(), blob.end());
        Append(std::move(record));
    }
    catch (const std::bad_alloc&)
    {
        return E_OUTOFMEMORY;
    }
    return S_OK;
}

HRESULT MockCloudFilterApi::AckDelete(const CloudSync::CorrelationKeyPair& keys, NTSTATUS completionStatus) noexcept
{
    const HRESULT hr = Begin(Call::AckDelete);
    if (FAILED(hr))
    {
        return hr;
    }

    Record record;
    record.call             = Call::AckDelete;
    record.keys             = keys;
    record.completionStatus = completionStatus;
    Append(std::move(record));
    return S_OK;
}

HRESULT MockCloudFilterApi::AckRename(const CloudSync::CorrelationKeyPair& keys, NTSTATUS completionStatus) noexcept
{
    const HRESULT hr = Begin(Call::AckRename);
    if (FAILED(hr))
    {
        return hr;
    }

    Record record;
    record.call             = Call::AckRename;
    record.keys             = keys;
    record.completionStatus = completionStatus;
    Append(std::move(record));
    return S_OK;
}

HRESULT MockCloudFilterApi::ReportProgress(const CloudSync::CorrelationKeyPair& keys, int64_t total, int64_t completed) noexcept
{
    const HRESULT hr = Begin(Call::ReportProgress);
    if (FAILED(hr))
    {
        return hr;
    }

    Record record;
    record.call      = Call::ReportProgress;
    record.keys      = keys;
    record.total     = total;
    record.completed = completed;
    Append(std::move(record));
    return S_OK;
}

HRESULT MockCloudFilterApi::RegisterSyncRoot(const CloudSync::SyncRootId& id, const std::filesystem::path& syncRootPath, const CloudSync::SyncRootRegistration& registration) noexcept
{
    const HRESULT hr = Begin(Call::RegisterSyncRoot);
    if (FAILED(hr))
    {
        return hr;
    }

    try
    {
        std::lock_guard lock(_mutex);
        _registeredId     = id;
        _registeredPath   = syncRootPath;
        _registeredBundle = registration;

        Record record;
        record.call = Call::RegisterSyncRoot;
        _records.push_back(std::move(record));
    }
    catch (const std::bad_alloc&)
    {
        return E_OUTOFMEMORY;
    }
    return S_OK;
}

HRESULT MockCloudFilterApi::UnregisterSyncRoot(const CloudSync::SyncRootId& id) noexcept
{
    const HRESULT hr = Begin(Call::UnregisterSyncRoot);
    if (FAILED(hr))
    {
        return hr;
    }

    std::lock_guard lock(_mutex);
    if (! _registeredId || ! (*_registeredId == id))
    {
        return HRESULT_FROM_WIN32(ERROR_NOT_FOUND);
    }

    _registeredId.reset();
    _registeredBundle.reset();
    _registeredPath.clear();

    try
    {
        Record record;
        record.call = Call::UnregisterSyncRoot;
        _records.push_back(std::move(record));
    }
    catch (const std::bad_alloc&)
    {
        return E_OUTOFMEMORY;
    }
    return S_OK;
}
HRESULT MockCloudFilterApi::ConnectSyncRoot(const std::filesystem::path& syncRootPath,
                                            const CF_CALLBACK_REGISTRATION* callbacks,
                                            void* callbackContext,
                                            CloudSync::ConnectionKey& key) noexcept
{
    key = CloudSync::ConnectionKey{};

    const HRESULT hr = Begin(Call::ConnectSyncRoot);
    if (FAILED(hr))
    {
        return hr;
    }

    std::lock_guard lock(_mutex);
    if (_connectionKey)
    {
        return HRESULT_FROM_WIN32(ERROR_CLOUD_FILE_ALREADY_CONNECTED);
    }

    try
    {
        Record record;
        record.call = Call::ConnectSyncRoot;
        record.names.push_back(syncRootPath.native());
        _records.push_back(std::move(record));
    }
    catch (const std::bad_alloc&)
    {
        return E_OUTOFMEMORY;
    }

    _connectionKey   = MakeKeys(0).connection;
    _callbacks       = callbacks;
    _callbackContext = callbackContext;
    key              = *_connectionKey;
    return S_OK;
}

HRESULT MockCloudFilterApi::DisconnectSyncRoot(CloudSync::ConnectionKey key) noexcept
{
    const HRESULT hr = Begin(Call::DisconnectSyncRoot);
    if (FAILED(hr))
    {
        return hr;
    }

    std::lock_guard lock(_mutex);
    if (! _connectionKey || ! (*_connectionKey == key))
    {
        return HRESULT_FROM_WIN32(ERROR_NOT_FOUND);
    }

    _connectionKey.reset();
    _callbacks       = nullptr;
    _callbackContext = nullptr;

    try
    {
        Record record;
        record.call = Call::DisconnectSyncRoot;
        _records.push_back(std::move(record));
    }
    catch (const std::bad_alloc&)
    {
        return E_OUTOFMEMORY;
    }
    return S_OK;
}

bool MockCloudFilterApi::IsConnected() const
{
    std::lock_guard lock(_mutex);
    return _connectionKey.has_value();
}

void* MockCloudFilterApi::CallbackContext() const
{
    std::lock_guard lock(_mutex);
    return _callbackContext;
}

CF_CALLBACK MockCloudFilterApi::FindCallback(CF_CALLBACK_TYPE type) const
{
    std::lock_guard lock(_mutex);
    for (const CF_CALLBACK_REGISTRATION* entry = _callbacks; entry && entry->Type != CF_CALLBACK_TYPE_NONE; ++entry)
    {
        if (entry->Type == type)
        {
            return entry->Callback;
        }
    }
    return nullptr;
}
} // namespace SelfTest
