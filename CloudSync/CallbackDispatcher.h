#pragma once

#include "CallbackInfo.h"
#include "Helpers.h"
#include "OperationState.h"
#include "SyncFilter.h"

#include <cstddef>
#include <filesystem>
#include <memory>
#include <vector>

namespace CloudSync
{
struct ICloudFilterApi;

// Routes translated OS callbacks to an ISyncFilter and guarantees every terminating operation
// gets a response: when the handler fails, throws, or is not implemented, the dispatcher sends
// the denial itself. Entry points are noexcept and safe to call concurrently for distinct pairs.
class CallbackDispatcher final
{
public:
    CallbackDispatcher(std::shared_ptr<ISyncFilter> filter, std::shared_ptr<ICloudFilterApi> api) noexcept;

    CallbackDispatcher(const CallbackDispatcher&)            = delete;
    CallbackDispatcher& operator=(const CallbackDispatcher&) = delete;
    CallbackDispatcher(CallbackDispatcher&&)                 = delete;
    CallbackDispatcher& operator=(CallbackDispatcher&&)      = delete;

    void FetchData(const RequestContext& request, const FetchDataInfo& info) noexcept;
    void CancelFetchData(const RequestContext& request, const CancelFetchDataInfo& info) noexcept;
    void ValidateData(const RequestContext& request, const ValidateDataInfo& info) noexcept;
    void FetchPlaceholders(const RequestContext& request, const FetchPlaceholdersInfo& info) noexcept;
    void CancelFetchPlaceholders(const RequestContext& request, const CancelFetchPlaceholdersInfo& info) noexcept;
    void Opened(const RequestContext& request, const OpenedInfo& info) noexcept;
    void Closed(const RequestContext& request, const ClosedInfo& info) noexcept;
    void Dehydrate(const RequestContext& request, const DehydrateInfo& info) noexcept;
    void Dehydrated(const RequestContext& request, const DehydratedInfo& info) noexcept;
    void Delete(const RequestContext& request, const DeleteInfo& info) noexcept;
    void Deleted(const RequestContext& request, const DeletedInfo& info) noexcept;
    void Rename(const RequestContext& request, const RenameInfo& info) noexcept;
    void Renamed(const RequestContext& request, const RenamedInfo& info) noexcept;
    void StateChanged(const std::vector<std::filesystem::path>& changes) noexcept;

    // Terminating operations whose ticket is still alive and unresolved.
    [[nodiscard]] size_t PendingOperationCount() const noexcept;

private:
    template <typename Invoke, typename Deny>
    void DispatchTerminating(OperationKind kind, const RequestContext& request, Invoke&& invoke, Deny&& deny) noexcept;

    template <typename Invoke> void DispatchNotification(OperationKind kind, const RequestContext* request, Invoke&& invoke) noexcept;

    // Marks the operation of a Cancel* callback cancelled. Returns true when the cancellation won.
    bool CancelOperation(const RequestContext& request, OperationKind cancelledKind) noexcept;

    std::shared_ptr<ISyncFilter> _filter;
    std::shared_ptr<ICloudFilterApi> _api;
    OperationRegistry _registry;
};
} // namespace CloudSync
