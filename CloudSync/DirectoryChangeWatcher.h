#pragma once

#include "Helpers.h"

#include <atomic>
#include <cstddef>
#include <deque>
#include <filesystem>
#include <functional>
#include <mutex>
#include <span>
#include <vector>

namespace CloudSync
{
// Recursive attribute watch over a sync root (ReadDirectoryChangesW on a thread-pool I/O object).
// Pinning, unpinning and in-sync transitions surface as attribute changes, which is how placeholder
// state changes reach ISyncFilter::StateChanged.
// Notes:
// - Changes are delivered in batches of absolute paths, de-duplicated within a batch.
// - When the OS notification buffer overflows the batch holds only the watched root.
// - The callback runs on a thread-pool worker, never concurrently with itself.
class DirectoryChangeWatcher final
{
public:
    using Callback = std::function<void(std::vector<std::filesystem::path> changes)>;

    DirectoryChangeWatcher(std::filesystem::path root, Callback callback) noexcept;
    ~DirectoryChangeWatcher();

    DirectoryChangeWatcher(const DirectoryChangeWatcher&)            = delete;
    DirectoryChangeWatcher& operator=(const DirectoryChangeWatcher&) = delete;
    DirectoryChangeWatcher(DirectoryChangeWatcher&&)                 = delete;
    DirectoryChangeWatcher& operator=(DirectoryChangeWatcher&&)      = delete;

    [[nodiscard]] HRESULT Start() noexcept;

    // Cancels the pending read and waits for in-flight callbacks. Safe to call repeatedly.
    void Stop() noexcept;

    [[nodiscard]] bool IsRunning() const noexcept
    {
        return _running.load(std::memory_order_acquire);
    }

    [[nodiscard]] const std::filesystem::path& Root() const noexcept
    {
        return _root;
    }

private:
    struct PendingBatch
    {
        bool overflow = false;
        std::vector<std::byte> buffer;
        size_t bytesTransferred = 0;
    };

    static void CALLBACK IoCallback(PTP_CALLBACK_INSTANCE instance, void* context, void* overlapped, ULONG ioResult, ULONG_PTR bytesTransferred, PTP_IO io) noexcept;
    static void CALLBACK WorkCallback(PTP_CALLBACK_INSTANCE instance, void* context, PTP_WORK work) noexcept;

    [[nodiscard]] HRESULT IssueReadLocked() noexcept;
    void OnIoCompleted(ULONG ioResult, ULONG_PTR bytesTransferred) noexcept;
    void EnqueueOverflowLocked() noexcept;
    void AcquireActiveBufferLocked() noexcept;
    void ReturnBufferLocked(std::vector<std::byte> buffer) noexcept;
    void ProcessPendingBatches() noexcept;
    void Deliver(std::vector<std::filesystem::path> changes) noexcept;

    std::filesystem::path _root;
    Callback _callback;

    std::mutex _mutex;
    wil::unique_handle _directory;
    wil::unique_any<PTP_IO, decltype(&::CloseThreadpoolIo), ::CloseThreadpoolIo> _tpIo;
    wil::unique_any<PTP_WORK, decltype(&::CloseThreadpoolWork), ::CloseThreadpoolWork> _tpWork;
    OVERLAPPED _overlapped{};
    std::vector<std::byte> _activeBuffer;
    std::vector<std::vector<std::byte>> _freeBuffers;
    std::deque<PendingBatch> _pending;
    bool _workSubmitted  = false;
    bool _overflowQueued = false;

    std::atomic<bool> _running{false};
    std::atomic<bool> _stopping{false};
};

// Decodes a FILE_NOTIFY_INFORMATION chain into absolute paths under root. Removals and rename
// sources are skipped since those paths no longer exist. Duplicates are dropped.
// Returns false when the chain is malformed; paths decoded before the fault are kept.
[[nodiscard]] bool ParseNotifyBuffer(const std::filesystem::path& root, std::span<const std::byte> buffer, std::vector<std::filesystem::path>& changes);
} // namespace CloudSync
