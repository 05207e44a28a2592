#include "CallbackDispatcher.h"

#include "CloudError.h"
#include "CloudFilterApi.h"
#include "CloudSync.Internal.h"
#include "Commands.h"
#include "Tickets.h"

#include <new>
#include <utility>

#pragma warning(push)
#pragma warning(disable : 4625 4626 5026 5027 4514 28182)
#include <wil/result.h>
#pragma warning(pop)

#pragma warning(push)
// C++/WinRT headers: deleted copy/move, non-virtual destructors and padding
#pragma warning(disable : 4625 4626 4265 5026 5027 5246)
#include <winrt/base.h>
#pragma warning(pop)

namespace CloudSync
{
namespace
{
// Runs a terminating handler and folds anything it throws into an HRESULT.
template <typename Invoke> [[nodiscard]] HRESULT InvokeTerminating(OperationKind kind, Invoke&& invoke) noexcept
{
    try
    {
        return invoke();
    }
    catch (const wil::ResultException& ex)
    {
        Debug::Error(L"CloudSync: {} handler threw (hr=0x{:08X})", OperationKindName(kind), static_cast<unsigned long>(ex.GetErrorCode()));
        return ex.GetErrorCode();
    }
    catch (const winrt::hresult_error& ex)
    {
        Debug::Error(L"CloudSync: {} handler threw: {} (hr=0x{:08X})", OperationKindName(kind), ex.message().c_str(), static_cast<unsigned long>(ex.code().value));
        return ex.code();
    }
    catch (const std::bad_alloc&)
    {
        Debug::Error(L"CloudSync: {} handler ran out of memory", OperationKindName(kind));
        return E_OUTOFMEMORY;
    }
    catch (const std::exception& ex)
    {
        Debug::Error(L"CloudSync: {} handler threw: {}", OperationKindName(kind), CloudSyncInternal::DescribeException(ex));
        return E_FAIL;
    }
    catch (...)
    {
        // Not derived from std::exception; the operation is still denied.
        Debug::Error(L"CloudSync: {} handler threw a non-standard exception", OperationKindName(kind));
        return E_UNEXPECTED;
    }
}
} // namespace

CallbackDispatcher::CallbackDispatcher(std::shared_ptr<ISyncFilter> filter, std::shared_ptr<ICloudFilterApi> api) noexcept
    : _filter(std::move(filter)),
      _api(std::move(api))
{
}

template <typename Invoke, typename Deny>
void CallbackDispatcher::DispatchTerminating(OperationKind kind, const RequestContext& request, Invoke&& invoke, Deny&& deny) noexcept
{
    Debug::Perf::Scope perf(OperationKindName(kind));
    perf.SetDetail(request.path.native());

    if (! _api)
    {
        Debug::Error(L"CloudSync: {} for '{}' dropped, no platform bound", OperationKindName(kind), request.path.native());
        return;
    }

    const std::shared_ptr<OperationState> state = _registry.Begin(request.keys, kind);
    if (! state)
    {
        const HRESULT denyHr = deny(CompletionStatusFromHResult(E_OUTOFMEMORY));
        Debug::Error(L"CloudSync: {} for '{}' denied, out of memory (hr=0x{:08X})", OperationKindName(kind), request.path.native(), static_cast<unsigned long>(denyHr));
        return;
    }

    HRESULT hr = E_NOTIMPL;
    if (_filter)
    {
        state->SetInCallback(true);
        hr = InvokeTerminating(kind, [&]() { return invoke(state); });
        state->SetInCallback(false);
    }
    perf.SetHr(hr);

    if (FAILED(hr))
    {
        // Waits for a data transfer still running on another thread; a transfer that covered the
        // required range has resolved the operation and the denial is skipped.
        const auto lock = state->LockCommands();
        if (state->TryBeginResolve())
        {
            const NTSTATUS status = CompletionStatusFromHResult(hr);
            const HRESULT denyHr  = deny(status);
            state->CompleteResolve(SUCCEEDED(denyHr));

            if (FAILED(denyHr))
            {
                Debug::Error(L"CloudSync: denying {} for '{}' failed (hr=0x{:08X})", OperationKindName(kind), request.path.native(), static_cast<unsigned long>(denyHr));
            }
            else
            {
                Debug::Info(L"CloudSync: {} for '{}' denied with status 0x{:08X} ({}, hr=0x{:08X})",
                            OperationKindName(kind),
                            request.path.native(),
                            static_cast<unsigned long>(status),
                            CloudErrorKindName(ClassifyError(hr).kind),
                            static_cast<unsigned long>(hr));
            }
        }
        else if (state->Status() == OperationStatus::Cancelled)
        {
            Debug::Info(L"CloudSync: {} handler for '{}' stopped after cancellation (hr=0x{:08X})",
                        OperationKindName(kind),
                        request.path.native(),
                        static_cast<unsigned long>(hr));
        }
        else
        {
            Debug::Warning(L"CloudSync: {} handler for '{}' failed after the operation was settled (hr=0x{:08X})",
                           OperationKindName(kind),
                           request.path.native(),
                           static_cast<unsigned long>(hr));
        }
    }
    else if (state->Status() == OperationStatus::Pending && kind != OperationKind::FetchData && state.use_count() == 1)
    {
        // Nothing else holds the operation: no ticket survived the handler.
        Debug::Warning(L"CloudSync: {} handler for '{}' returned without resolving its ticket; the file operation will hang",
                       OperationKindName(kind),
                       request.path.native());
    }

    const OperationStatus status = state->Status();
    if (status == OperationStatus::Resolved || status == OperationStatus::Cancelled)
    {
        _registry.Forget(request.keys, state.get());
    }
}

template <typename Invoke> void CallbackDispatcher::DispatchNotification(OperationKind kind, const RequestContext* request, Invoke&& invoke) noexcept
{
    if (! _filter)
    {
        return;
    }

    try
    {
        invoke();
    }
    catch (const winrt::hresult_error& ex)
    {
        Debug::Error(L"CloudSync: {} notification threw (hr=0x{:08X})", OperationKindName(kind), static_cast<unsigned long>(ex.code().value));
    }
    catch (const std::bad_alloc&)
    {
        Debug::Error(L"CloudSync: {} notification ran out of memory", OperationKindName(kind));
    }
    catch (const std::exception& ex)
    {
        Debug::Error(L"CloudSync: {} notification for '{}' threw: {}",
                     OperationKindName(kind),
                     request ? request->path.native() : std::wstring(),
                     CloudSyncInternal::DescribeException(ex));
    }
    catch (...)
    {
        Debug::Error(L"CloudSync: {} notification for '{}' threw a non-standard exception",
                     OperationKindName(kind),
                     request ? request->path.native() : std::wstring());
    }
}

bool CallbackDispatcher::CancelOperation(const RequestContext& request, OperationKind cancelledKind) noexcept
{
    const std::shared_ptr<OperationState> state = _registry.Find(request.keys);
    if (! state || state->Kind() != cancelledKind)
    {
        Debug::Info(L"CloudSync: cancellation for '{}' matched no pending {}", request.path.native(), OperationKindName(cancelledKind));
        return false;
    }

    const bool cancelled = state->TryCancel();
    if (cancelled)
    {
        _registry.Forget(request.keys, state.get());
    }

    Debug::Info(L"CloudSync: {} for '{}' {}",
                OperationKindName(cancelledKind),
                request.path.native(),
                cancelled ? L"cancelled" : L"already resolved, cancellation ignored");
    return cancelled;
}

void CallbackDispatcher::FetchData(const RequestContext& request, const FetchDataInfo& info) noexcept
{
    DispatchTerminating(
        OperationKind::FetchData,
        request,
        [&](const std::shared_ptr<OperationState>& state) { return _filter->FetchData(request, FetchDataTicket(_api, state, info, request.fileSize), info); },
        [&](NTSTATUS status)
        {
            FailTransferCommand command;
            command.offset           = info.requiredOffset;
            command.length           = info.requiredLength;
            command.completionStatus = status;
            return command.Execute(*_api, request.keys);
        });
}

void CallbackDispatcher::CancelFetchData(const RequestContext& request, const CancelFetchDataInfo& info) noexcept
{
    static_cast<void>(CancelOperation(request, OperationKind::FetchData));
    DispatchNotification(OperationKind::CancelFetchData, &request, [&]() { _filter->CancelFetchData(request, info); });
}

void CallbackDispatcher::ValidateData(const RequestContext& request, const ValidateDataInfo& info) noexcept
{
    DispatchTerminating(
        OperationKind::ValidateData,
        request,
        [&](const std::shared_ptr<OperationState>& state) { return _filter->ValidateData(request, ValidateDataTicket(_api, state, info), info); },
        [&](NTSTATUS status)
        {
            ValidateCommand command;
            command.offset           = info.requiredOffset;
            command.length           = info.requiredLength;
            command.completionStatus = status;
            return command.Execute(*_api, request.keys);
        });
}

void CallbackDispatcher::FetchPlaceholders(const RequestContext& request, const FetchPlaceholdersInfo& info) noexcept
{
    DispatchTerminating(
        OperationKind::FetchPlaceholders,
        request,
        [&](const std::shared_ptr<OperationState>& state) { return _filter->FetchPlaceholders(request, FetchPlaceholdersTicket(_api, state), info); },
        [&](NTSTATUS status)
        {
            CreatePlaceholdersCommand command;
            command.flags.disableOnDemandPopulation = false;
            command.completionStatus                = status;

            std::vector<PlaceholderResult> results;
            return command.Execute(*_api, request.keys, results);
        });
}

void CallbackDispatcher::CancelFetchPlaceholders(const RequestContext& request, const CancelFetchPlaceholdersInfo& info) noexcept
{
    static_cast<void>(CancelOperation(request, OperationKind::FetchPlaceholders));
    DispatchNotification(OperationKind::CancelFetchPlaceholders, &request, [&]() { _filter->CancelFetchPlaceholders(request, info); });
}

void CallbackDispatcher::Opened(const RequestContext& request, const OpenedInfo& info) noexcept
{
    DispatchNotification(OperationKind::Opened, &request, [&]() { _filter->Opened(request, info); });
}

void CallbackDispatcher::Closed(const RequestContext& request, const ClosedInfo& info) noexcept
{
    DispatchNotification(OperationKind::Closed, &request, [&]() { _filter->Closed(request, info); });
}

void CallbackDispatcher::Dehydrate(const RequestContext& request, const DehydrateInfo& info) noexcept
{
    DispatchTerminating(
        OperationKind::Dehydrate,
        request,
        [&](const std::shared_ptr<OperationState>& state) { return _filter->Dehydrate(request, DehydrateTicket(_api, state), info); },
        [&](NTSTATUS status)
        {
            DehydrateCommand command;
            command.completionStatus = status;
            return command.Execute(*_api, request.keys);
        });
}

void CallbackDispatcher::Dehydrated(const RequestContext& request, const DehydratedInfo& info) noexcept
{
    DispatchNotification(OperationKind::Dehydrated, &request, [&]() { _filter->Dehydrated(request, info); });
}

void CallbackDispatcher::Delete(const RequestContext& request, const DeleteInfo& info) noexcept
{
    DispatchTerminating(
        OperationKind::Delete,
        request,
        [&](const std::shared_ptr<OperationState>& state) { return _filter->Delete(request, DeleteTicket(_api, state), info); },
        [&](NTSTATUS status)
        {
            DeleteCommand command;
            command.completionStatus = status;
            return command.Execute(*_api, request.keys);
        });
}

void CallbackDispatcher::Deleted(const RequestContext& request, const DeletedInfo& info) noexcept
{
    DispatchNotification(OperationKind::Deleted, &request, [&]() { _filter->Deleted(request, info); });
}

void CallbackDispatcher::Rename(const RequestContext& request, const RenameInfo& info) noexcept
{
    DispatchTerminating(
        OperationKind::Rename,
        request,
        [&](const std::shared_ptr<OperationState>& state) { return _filter->Rename(request, RenameTicket(_api, state), info); },
        [&](NTSTATUS status)
        {
            RenameCommand command;
            command.completionStatus = status;
            return command.Execute(*_api, request.keys);
        });
}

void CallbackDispatcher::Renamed(const RequestContext& request, const RenamedInfo& info) noexcept
{
    DispatchNotification(OperationKind::Renamed, &request, [&]() { _filter->Renamed(request, info); });
}

void CallbackDispatcher::StateChanged(const std::vector<std::filesystem::path>& changes) noexcept
{
    if (changes.empty())
    {
        return;
    }

    DispatchNotification(OperationKind::StateChanged, nullptr, [&]() { _filter->StateChanged(changes); });
}

size_t CallbackDispatcher::PendingOperationCount() const noexcept
{
    return _registry.PendingCount();
}
} // namespace CloudSync
