#include "OperationState.h"

#include "CloudError.h"

#include <algorithm>
#include <new>

namespace CloudSync
{
std::wstring_view OperationKindName(OperationKind kind) noexcept
{
    switch (kind)
    {
        case OperationKind::FetchData: return L"FetchData";
        case OperationKind::CancelFetchData: return L"CancelFetchData";
        case OperationKind::ValidateData: return L"ValidateData";
        case OperationKind::FetchPlaceholders: return L"FetchPlaceholders";
        case OperationKind::CancelFetchPlaceholders: return L"CancelFetchPlaceholders";
        case OperationKind::Opened: return L"Opened";
        case OperationKind::Closed: return L"Closed";
        case OperationKind::Dehydrate: return L"Dehydrate";
        case OperationKind::Dehydrated: return L"Dehydrated";
        case OperationKind::Delete: return L"Delete";
        case OperationKind::Deleted: return L"Deleted";
        case OperationKind::Rename: return L"Rename";
        case OperationKind::Renamed: return L"Renamed";
        case OperationKind::StateChanged: return L"StateChanged";
    }
    return L"Unknown";
}

OperationState::OperationState(const CorrelationKeyPair& keys, OperationKind kind) noexcept : _keys(keys), _kind(kind)
{
}

bool OperationState::TryBeginResolve() noexcept
{
    OperationStatus expected = OperationStatus::Pending;
    return _status.compare_exchange_strong(expected, OperationStatus::Resolving, std::memory_order_acq_rel);
}

void OperationState::CompleteResolve(bool accepted) noexcept
{
    if (accepted)
    {
        _status.store(OperationStatus::Resolved, std::memory_order_release);
        return;
    }

    ReleaseClaim();
}

void OperationState::ReleaseClaim() noexcept
{
    // A cancellation that lost the race against this claim takes effect once the claim is released.
    _status.store(OperationStatus::Pending);
    if (_cancelRequested.load())
    {
        OperationStatus expected = OperationStatus::Pending;
        static_cast<void>(_status.compare_exchange_strong(expected, OperationStatus::Cancelled));
    }
}

bool OperationState::TryCancel() noexcept
{
    _cancelRequested.store(true);

    OperationStatus expected = OperationStatus::Pending;
    return _status.compare_exchange_strong(expected, OperationStatus::Cancelled);
}

HRESULT OperationState::GateResult() const noexcept
{
    switch (Status())
    {
        case OperationStatus::Pending: return S_OK;
        case OperationStatus::Cancelled: return kOperationCancelled;
        case OperationStatus::Resolving:
        case OperationStatus::Resolved: break;
    }
    return kTicketAlreadyResolved;
}

std::shared_ptr<OperationState> OperationRegistry::Begin(const CorrelationKeyPair& keys, OperationKind kind) noexcept
{
    std::shared_ptr<OperationState> state;
    try
    {
        state = std::make_shared<OperationState>(keys, kind);

        std::lock_guard lock(_mutex);
        if (_operations.size() >= _pruneAt)
        {
            PruneExpiredLocked();
            // Live entries stay; without growing the mark every Begin would sweep them again.
            _pruneAt = std::max(kPruneThreshold, 2 * _operations.size());
        }

        auto& slot = _operations[keys];
        if (const auto previous = slot.lock(); previous && previous->Status() == OperationStatus::Pending)
        {
            Debug::Warning(L"CloudSync: correlation keys {}/{} reused while a {} operation is still pending",
                           keys.connection.value,
                           keys.transfer.value,
                           OperationKindName(previous->Kind()));
        }
        slot = state;
    }
    catch (const std::bad_alloc&)
    {
        return {};
    }

    return state;
}

std::shared_ptr<OperationState> OperationRegistry::Find(const CorrelationKeyPair& keys) const noexcept
{
    std::lock_guard lock(_mutex);
    const auto it = _operations.find(keys);
    if (it == _operations.end())
    {
        return {};
    }

    return it->second.lock();
}

void OperationRegistry::Forget(const CorrelationKeyPair& keys, const OperationState* state) noexcept
{
    std::lock_guard lock(_mutex);
    const auto it = _operations.find(keys);
    if (it == _operations.end())
    {
        return;
    }

    const auto current = it->second.lock();
    if (! current || current.get() == state)
    {
        _operations.erase(it);
    }
}

size_t OperationRegistry::PendingCount() const noexcept
{
    std::lock_guard lock(_mutex);

    size_t count = 0;
    for (const auto& [keys, weak] : _operations)
    {
        const auto state = weak.lock();
        if (state && (state->Status() == OperationStatus::Pending || state->Status() == OperationStatus::Resolving))
        {
            ++count;
        }
    }
    return count;
}

size_t OperationRegistry::PruneHighWaterMark() const noexcept
{
    std::lock_guard lock(_mutex);
    return _pruneAt;
}

void OperationRegistry::PruneExpiredLocked() noexcept
{
    for (auto it = _operations.begin(); it != _operations.end();)
    {
        if (it->second.expired())
        {
            it = _operations.erase(it);
        }
        else
        {
            ++it;
        }
    }
}
} // namespace CloudSync
