#pragma once

#include "CallbackInfo.h"
#include "Helpers.h"
#include "Tickets.h"

#include <filesystem>
#include <vector>

#include <unknwn.h>

namespace CloudSync
{
// Provider-implemented handler for every callback of one connected sync root.
// Notes:
// - This is NOT a COM interface; the connection holds it as std::shared_ptr<ISyncFilter>.
// - Methods are invoked on OS pool threads, concurrently for different correlation key pairs
//   (never for the same pair). Implementations synchronize their own state.
// - Terminating methods receive a ticket by value. Resolve it before returning, or move it to a
//   worker and resolve it there. Returning a failure while the ticket is still unresolved makes the
//   dispatcher deny the operation with a status derived from the returned HRESULT.
// - Optional terminating methods default to E_NOTIMPL, which the dispatcher turns into a
//   STATUS_CLOUD_FILE_NOT_SUPPORTED denial.
// - Notifications have nothing to answer. Exceptions thrown from any method are caught and logged.
interface __declspec(novtable) ISyncFilter
{
    virtual ~ISyncFilter() = default;

    // Hydration request for [requiredOffset, requiredOffset + requiredLength).
    virtual HRESULT FetchData(const RequestContext& request, FetchDataTicket ticket, const FetchDataInfo& info) = 0;

    virtual void CancelFetchData(const RequestContext& /*request*/, const CancelFetchDataInfo& /*info*/)
    {
    }

    // Only delivered when the sync root was registered with HydrationPolicyModifiers::validationRequired.
    virtual HRESULT ValidateData(const RequestContext& /*request*/, ValidateDataTicket /*ticket*/, const ValidateDataInfo& /*info*/)
    {
        return E_NOTIMPL;
    }

    // Only delivered under PopulationType::Full, when a directory is enumerated for the first time.
    virtual HRESULT FetchPlaceholders(const RequestContext& /*request*/, FetchPlaceholdersTicket /*ticket*/, const FetchPlaceholdersInfo& /*info*/)
    {
        return E_NOTIMPL;
    }

    virtual void CancelFetchPlaceholders(const RequestContext& /*request*/, const CancelFetchPlaceholdersInfo& /*info*/)
    {
    }

    virtual void Opened(const RequestContext& /*request*/, const OpenedInfo& /*info*/)
    {
    }

    virtual void Closed(const RequestContext& /*request*/, const ClosedInfo& /*info*/)
    {
    }

    virtual HRESULT Dehydrate(const RequestContext& /*request*/, DehydrateTicket /*ticket*/, const DehydrateInfo& /*info*/)
    {
        return E_NOTIMPL;
    }

    virtual void Dehydrated(const RequestContext& /*request*/, const DehydratedInfo& /*info*/)
    {
    }

    virtual HRESULT Delete(const RequestContext& /*request*/, DeleteTicket /*ticket*/, const DeleteInfo& /*info*/)
    {
        return E_NOTIMPL;
    }

    virtual void Deleted(const RequestContext& /*request*/, const DeletedInfo& /*info*/)
    {
    }

    virtual HRESULT Rename(const RequestContext& /*request*/, RenameTicket /*ticket*/, const RenameInfo& /*info*/)
    {
        return E_NOTIMPL;
    }

    virtual void Renamed(const RequestContext& /*request*/, const RenamedInfo& /*info*/)
    {
    }

    // Batch of paths under the sync root whose state changed. Delivered by the directory watcher,
    // possibly coalescing several changes into one call.
    virtual void StateChanged(const std::vector<std::filesystem::path>& /*changes*/)
    {
    }
};
} // namespace CloudSync
