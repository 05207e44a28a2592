#pragma once

#include "CallbackInfo.h"
#include "CorrelationKeys.h"
#include "Helpers.h"

#include <atomic>
#include <cstddef>
#include <memory>
#include <mutex>
#include <unordered_map>

namespace CloudSync
{
enum class OperationStatus : uint8_t
{
    Pending,
    // A resolving command is talking to the OS; it either commits (Resolved) or rolls back.
    Resolving,
    Resolved,
    Cancelled,
};

// One-shot state shared by a ticket, the dispatcher and the operation registry.
// Whoever claims the Pending state first decides the outcome of the operation.
class OperationState final
{
public:
    OperationState(const CorrelationKeyPair& keys, OperationKind kind) noexcept;

    OperationState(const OperationState&)            = delete;
    OperationState& operator=(const OperationState&) = delete;
    OperationState(OperationState&&)                 = delete;
    OperationState& operator=(OperationState&&)      = delete;

    [[nodiscard]] const CorrelationKeyPair& Keys() const noexcept
    {
        return _keys;
    }

    [[nodiscard]] OperationKind Kind() const noexcept
    {
        return _kind;
    }

    [[nodiscard]] OperationStatus Status() const noexcept
    {
        return _status.load(std::memory_order_acquire);
    }

    // Pending -> Resolving. Fails when the operation is resolved, cancelled or being resolved.
    [[nodiscard]] bool TryBeginResolve() noexcept;

    // Resolving -> Resolved when the OS accepted the response. On failure the claim is released
    // so the handler can retry, unless a cancellation arrived meanwhile.
    void CompleteResolve(bool accepted) noexcept;

    // Resolving -> Pending, or Cancelled when a cancellation arrived while the claim was held.
    // Used by commands that talk to the OS without settling the operation (partial data transfer).
    void ReleaseClaim() noexcept;

    // Pending -> Cancelled. Returns false when a resolution already claimed the operation;
    // the cancellation is then only recorded.
    [[nodiscard]] bool TryCancel() noexcept;

    // S_OK while pending, otherwise the error a command on this operation must return.
    [[nodiscard]] HRESULT GateResult() const noexcept;

    void SetInCallback(bool inCallback) noexcept
    {
        _inCallback.store(inCallback, std::memory_order_release);
    }

    [[nodiscard]] bool IsInCallback() const noexcept
    {
        return _inCallback.load(std::memory_order_acquire);
    }

    // Serializes commands on one operation, so a data transfer in flight and a denial never overlap.
    [[nodiscard]] std::unique_lock<std::mutex> LockCommands() noexcept
    {
        return std::unique_lock<std::mutex>(_commandMutex);
    }

private:
    CorrelationKeyPair _keys;
    OperationKind _kind;
    std::atomic<OperationStatus> _status{OperationStatus::Pending};
    std::atomic<bool> _cancelRequested{false};
    std::atomic<bool> _inCallback{false};
    std::mutex _commandMutex;
};

// Index of live operations by correlation key pair, consulted by cancellation callbacks.
// Entries are weak: an operation lives as long as its ticket or the dispatcher frame holding it.
class OperationRegistry final
{
public:
    OperationRegistry() = default;

    OperationRegistry(const OperationRegistry&)            = delete;
    OperationRegistry& operator=(const OperationRegistry&) = delete;
    OperationRegistry(OperationRegistry&&)                 = delete;
    OperationRegistry& operator=(OperationRegistry&&)      = delete;

    // Creates and indexes a new operation. Returns nullptr on allocation failure.
    [[nodiscard]] std::shared_ptr<OperationState> Begin(const CorrelationKeyPair& keys, OperationKind kind) noexcept;

    [[nodiscard]] std::shared_ptr<OperationState> Find(const CorrelationKeyPair& keys) const noexcept;

    // Drops the entry for keys if it still refers to state.
    void Forget(const CorrelationKeyPair& keys, const OperationState* state) noexcept;

    // Operations still alive and not yet resolved or cancelled.
    [[nodiscard]] size_t PendingCount() const noexcept;

    // Map size that triggers the next sweep of expired entries.
    [[nodiscard]] size_t PruneHighWaterMark() const noexcept;

private:
    // Smallest sweep threshold; the mark grows with the live entries so sweeps stay amortized.
    static constexpr size_t kPruneThreshold = 64u;

    void PruneExpiredLocked() noexcept;

    mutable std::mutex _mutex;
    std::unordered_map<CorrelationKeyPair, std::weak_ptr<OperationState>, CorrelationKeyPairHash> _operations;
    size_t _pruneAt = kPruneThreshold;
};
} // namespace CloudSync
