#include "DirectoryChangeWatcher.h"

#include "CloudSync.Internal.h"

#include <algorithm>
#include <cstring>
#include <new>
#include <string>
#include <utility>

namespace CloudSync
{
namespace
{
constexpr size_t kWatchBufferBytes = 64u * 1024u;
constexpr size_t kWatchBufferPool  = 3u;
constexpr size_t kMaxPendingBatches = 4u;

// Pin state, in-sync state and hydration all show up as attribute changes.
constexpr DWORD kWatchFilter = FILE_NOTIFY_CHANGE_ATTRIBUTES | FILE_NOTIFY_CHANGE_FILE_NAME | FILE_NOTIFY_CHANGE_DIR_NAME;

void AppendUnique(std::vector<std::filesystem::path>& changes, std::filesystem::path path)
{
    if (std::find(changes.begin(), changes.end(), path) == changes.end())
    {
        changes.emplace_back(std::move(path));
    }
}
} // namespace

bool ParseNotifyBuffer(const std::filesystem::path& root, std::span<const std::byte> buffer, std::vector<std::filesystem::path>& changes)
{
    if (buffer.empty())
    {
        return false;
    }

    const std::byte* bufferBegin = buffer.data();
    const std::byte* bufferEnd   = bufferBegin + buffer.size();
    const std::byte* entryBytes  = bufferBegin;

    for (;;)
    {
        if (static_cast<size_t>(bufferEnd - entryBytes) < offsetof(FILE_NOTIFY_INFORMATION, FileName))
        {
            return false;
        }

        FILE_NOTIFY_INFORMATION header{};
        std::memcpy(&header, entryBytes, offsetof(FILE_NOTIFY_INFORMATION, FileName));

        const std::byte* nameBytes = entryBytes + offsetof(FILE_NOTIFY_INFORMATION, FileName);
        if (header.FileNameLength % sizeof(wchar_t) != 0 || static_cast<size_t>(bufferEnd - nameBytes) < header.FileNameLength)
        {
            return false;
        }

        if (header.Action != FILE_ACTION_REMOVED && header.Action != FILE_ACTION_RENAMED_OLD_NAME && header.FileNameLength > 0)
        {
            std::wstring name(header.FileNameLength / sizeof(wchar_t), L'\0');
            std::memcpy(name.data(), nameBytes, header.FileNameLength);
            AppendUnique(changes, root / name);
        }

        if (header.NextEntryOffset == 0)
        {
            return true;
        }

        if (header.NextEntryOffset % sizeof(DWORD) != 0 || static_cast<size_t>(bufferEnd - entryBytes) <= header.NextEntryOffset)
        {
            return false;
        }

        entryBytes += header.NextEntryOffset;
    }
}

DirectoryChangeWatcher::DirectoryChangeWatcher(std::filesystem::path root, Callback callback) noexcept
    : _root(std::move(root)),
      _callback(std::move(callback))
{
}

DirectoryChangeWatcher::~DirectoryChangeWatcher()
{
    Stop();
}

HRESULT DirectoryChangeWatcher::Start() noexcept
{
    std::unique_lock lock(_mutex);

    if (_running.load(std::memory_order_acquire))
    {
        return S_OK;
    }

    if (_root.empty() || ! _callback)
    {
        return E_INVALIDARG;
    }

    try
    {
        _activeBuffer.resize(kWatchBufferBytes);
    }
    catch (const std::bad_alloc&)
    {
        return E_OUTOFMEMORY;
    }

    _stopping.store(false, std::memory_order_release);

    _directory.reset(::CreateFileW(_root.c_str(),
                                   FILE_LIST_DIRECTORY,
                                   FILE_SHARE_READ | FILE_SHARE_WRITE | FILE_SHARE_DELETE,
                                   nullptr,
                                   OPEN_EXISTING,
                                   FILE_FLAG_BACKUP_SEMANTICS | FILE_FLAG_OVERLAPPED,
                                   nullptr));
    if (! _directory)
    {
        const DWORD lastError = Debug::ErrorWithLastError(L"CloudSync: failed to open '{}' for change notifications", _root.native());
        return HRESULT_FROM_WIN32(lastError);
    }

    _tpIo.reset(::CreateThreadpoolIo(_directory.get(), &DirectoryChangeWatcher::IoCallback, this, nullptr));
    if (! _tpIo)
    {
        const DWORD lastError = Debug::ErrorWithLastError(L"CloudSync: failed to create thread pool I/O for '{}'", _root.native());
        _directory.reset();
        return HRESULT_FROM_WIN32(lastError);
    }

    _tpWork.reset(::CreateThreadpoolWork(&DirectoryChangeWatcher::WorkCallback, this, nullptr));
    if (! _tpWork)
    {
        const DWORD lastError = Debug::ErrorWithLastError(L"CloudSync: failed to create thread pool work for '{}'", _root.native());
        _tpIo.reset();
        _directory.reset();
        return HRESULT_FROM_WIN32(lastError);
    }

    const HRESULT hr = IssueReadLocked();
    if (FAILED(hr))
    {
        Debug::Warning(L"CloudSync: failed to start watching '{}' (hr=0x{:08X})", _root.native(), static_cast<unsigned long>(hr));
        _tpWork.reset();
        _tpIo.reset();
        _directory.reset();
        return hr;
    }

    _running.store(true, std::memory_order_release);
    Debug::Info(L"CloudSync: watching '{}' for state changes", _root.native());
    return S_OK;
}

void DirectoryChangeWatcher::Stop() noexcept
{
    std::unique_lock lock(_mutex);

    if (! _running.load(std::memory_order_acquire) && ! _tpIo && ! _directory)
    {
        return;
    }

    _stopping.store(true, std::memory_order_release);

    if (_directory)
    {
        ::CancelIoEx(_directory.get(), &_overlapped);
    }

    if (_tpIo)
    {
        PTP_IO tpIo = _tpIo.get();
        lock.unlock();
        ::WaitForThreadpoolIoCallbacks(tpIo, FALSE);
        lock.lock();
    }

    if (_tpWork)
    {
        PTP_WORK tpWork = _tpWork.get();
        lock.unlock();
        ::WaitForThreadpoolWorkCallbacks(tpWork, TRUE);
        lock.lock();
    }

    _pending.clear();
    _workSubmitted  = false;
    _overflowQueued = false;

    _tpWork.reset();
    _tpIo.reset();
    _directory.reset();
    std::memset(&_overlapped, 0, sizeof(_overlapped));
    _running.store(false, std::memory_order_release);
}

void CALLBACK DirectoryChangeWatcher::IoCallback([[maybe_unused]] PTP_CALLBACK_INSTANCE instance,
                                                 void* context,
                                                 [[maybe_unused]] void* overlapped,
                                                 ULONG ioResult,
                                                 ULONG_PTR bytesTransferred,
                                                 [[maybe_unused]] PTP_IO io) noexcept
{
    auto* self = static_cast<DirectoryChangeWatcher*>(context);
    if (self)
    {
        self->OnIoCompleted(ioResult, bytesTransferred);
    }
}

void CALLBACK DirectoryChangeWatcher::WorkCallback([[maybe_unused]] PTP_CALLBACK_INSTANCE instance, void* context, [[maybe_unused]] PTP_WORK work) noexcept
{
    auto* self = static_cast<DirectoryChangeWatcher*>(context);
    if (self)
    {
        self->ProcessPendingBatches();
    }
}

HRESULT DirectoryChangeWatcher::IssueReadLocked() noexcept
{
    if (! _directory || ! _tpIo)
    {
        return E_HANDLE;
    }

    if (_activeBuffer.empty())
    {
        return E_OUTOFMEMORY;
    }

    std::memset(&_overlapped, 0, sizeof(_overlapped));
    ::StartThreadpoolIo(_tpIo.get());

    DWORD bytesReturned = 0;
    if (::ReadDirectoryChangesW(_directory.get(), _activeBuffer.data(), static_cast<DWORD>(_activeBuffer.size()), TRUE, kWatchFilter, &bytesReturned, &_overlapped, nullptr))
    {
        return S_OK;
    }

    const DWORD lastError = ::GetLastError();
    if (lastError == ERROR_IO_PENDING)
    {
        return S_OK;
    }

    ::CancelThreadpoolIo(_tpIo.get());
    return HRESULT_FROM_WIN32(lastError);
}

void DirectoryChangeWatcher::OnIoCompleted(ULONG ioResult, ULONG_PTR bytesTransferred) noexcept
{
    if (ioResult == ERROR_OPERATION_ABORTED)
    {
        return;
    }

    bool submitWork = false;
    {
        std::lock_guard lock(_mutex);

        if (_stopping.load(std::memory_order_acquire))
        {
            return;
        }

        const size_t transferred = static_cast<size_t>(bytesTransferred);
        if (ioResult != NO_ERROR || transferred == 0 || transferred > _activeBuffer.size())
        {
            // ERROR_NOTIFY_ENUM_DIR and zero-byte completions mean the OS dropped notifications.
            if (ioResult != NO_ERROR && ioResult != ERROR_NOTIFY_ENUM_DIR)
            {
                Debug::Warning(L"CloudSync: ReadDirectoryChangesW failed for '{}' (err={})", _root.native(), ioResult);
            }
            EnqueueOverflowLocked();
        }
        else if (_pending.size() >= kMaxPendingBatches)
        {
            for (auto& batch : _pending)
            {
                ReturnBufferLocked(std::move(batch.buffer));
            }
            _pending.clear();
            _overflowQueued = false;
            EnqueueOverflowLocked();
        }
        else
        {
            try
            {
                PendingBatch batch;
                batch.buffer           = std::move(_activeBuffer);
                batch.bytesTransferred = transferred;
                _pending.emplace_back(std::move(batch));
                AcquireActiveBufferLocked();
            }
            catch (const std::bad_alloc&)
            {
                EnqueueOverflowLocked();
            }
        }

        const HRESULT hr = IssueReadLocked();
        if (FAILED(hr))
        {
            Debug::Warning(L"CloudSync: failed to re-arm the watch on '{}' (hr=0x{:08X})", _root.native(), static_cast<unsigned long>(hr));
        }

        if (! _pending.empty() && _tpWork && ! _workSubmitted)
        {
            _workSubmitted = true;
            submitWork     = true;
        }
    }

    if (submitWork)
    {
        ::SubmitThreadpoolWork(_tpWork.get());
    }
}

void DirectoryChangeWatcher::EnqueueOverflowLocked() noexcept
{
    if (_overflowQueued)
    {
        return;
    }

    try
    {
        PendingBatch batch;
        batch.overflow = true;
        _pending.emplace_back(std::move(batch));
        _overflowQueued = true;
    }
    catch (const std::bad_alloc&)
    {
        Debug::Error(L"CloudSync: dropped an overflow notification for '{}'", _root.native());
    }
}

void DirectoryChangeWatcher::AcquireActiveBufferLocked() noexcept
{
    if (! _activeBuffer.empty())
    {
        return;
    }

    if (! _freeBuffers.empty())
    {
        _activeBuffer = std::move(_freeBuffers.back());
        _freeBuffers.pop_back();
        return;
    }

    try
    {
        _activeBuffer.resize(kWatchBufferBytes);
    }
    catch (const std::bad_alloc&)
    {
        _activeBuffer.clear();
    }
}

void DirectoryChangeWatcher::ReturnBufferLocked(std::vector<std::byte> buffer) noexcept
{
    if (buffer.size() != kWatchBufferBytes || _freeBuffers.size() >= kWatchBufferPool)
    {
        return;
    }

    try
    {
        _freeBuffers.emplace_back(std::move(buffer));
    }
    catch (const std::bad_alloc&)
    {
    }
}

void DirectoryChangeWatcher::ProcessPendingBatches() noexcept
{
    for (;;)
    {
        PendingBatch batch;
        {
            std::lock_guard lock(_mutex);

            if (_stopping.load(std::memory_order_acquire) || _pending.empty())
            {
                _workSubmitted = false;
                return;
            }

            batch = std::move(_pending.front());
            _pending.pop_front();
            if (batch.overflow)
            {
                _overflowQueued = false;
            }
        }

        std::vector<std::filesystem::path> changes;
        try
        {
            if (batch.overflow)
            {
                changes.push_back(_root);
            }
            else if (! ParseNotifyBuffer(_root, std::span<const std::byte>(batch.buffer.data(), batch.bytesTransferred), changes))
            {
                Debug::Warning(L"CloudSync: malformed change notification for '{}'; reporting the whole root", _root.native());
                AppendUnique(changes, _root);
            }
        }
        catch (const std::bad_alloc&)
        {
            Debug::Error(L"CloudSync: out of memory decoding changes for '{}'", _root.native());
            changes.clear();
        }

        if (! batch.overflow)
        {
            std::lock_guard lock(_mutex);
            ReturnBufferLocked(std::move(batch.buffer));
        }

        if (! changes.empty())
        {
            Deliver(std::move(changes));
        }
    }
}

void DirectoryChangeWatcher::Deliver(std::vector<std::filesystem::path> changes) noexcept
{
    if (_stopping.load(std::memory_order_acquire))
    {
        return;
    }

    Debug::Perf::Scope perf(L"CloudSync.StateChanged");
    perf.SetDetail(_root.native());
    perf.SetValue0(changes.size());

    try
    {
        _callback(std::move(changes));
    }
    catch (const std::exception& ex)
    {
        Debug::Error(L"CloudSync: state change callback for '{}' threw: {}", _root.native(), CloudSyncInternal::DescribeException(ex));
    }
}
} // namespace CloudSync
