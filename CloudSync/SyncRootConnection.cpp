#include "SyncRootConnection.h"

#include "CallbackTranslation.h"
#include "CloudError.h"
#include "CloudFilterApi.h"
#include "CloudSync.Internal.h"
#include "Commands.h"

#include <new>
#include <utility>
#include <vector>

namespace CloudSync
{
namespace
{
[[nodiscard]] bool IsTerminating(CF_CALLBACK_TYPE type) noexcept
{
    switch (type)
    {
        case CF_CALLBACK_TYPE_FETCH_DATA:
        case CF_CALLBACK_TYPE_VALIDATE_DATA:
        case CF_CALLBACK_TYPE_FETCH_PLACEHOLDERS:
        case CF_CALLBACK_TYPE_NOTIFY_DEHYDRATE:
        case CF_CALLBACK_TYPE_NOTIFY_DELETE:
        case CF_CALLBACK_TYPE_NOTIFY_RENAME: return true;
        default: return false;
    }
}

[[nodiscard]] uint64_t ToUnsigned(const LARGE_INTEGER& value) noexcept
{
    return value.QuadPart < 0 ? 0u : static_cast<uint64_t>(value.QuadPart);
}
} // namespace

SyncRootConnection::SyncRootConnection(std::filesystem::path syncRootPath, std::unique_ptr<Session> session) noexcept
    : _syncRootPath(std::move(syncRootPath)),
      _session(std::move(session))
{
}

SyncRootConnection::~SyncRootConnection()
{
    if (FAILED(Disconnect()))
    {
        // The OS may still deliver callbacks carrying the session; it must outlive this object.
        Debug::Error(L"CloudSync: keeping the callback session of '{}' alive after a failed disconnect", _syncRootPath.native());
        static_cast<void>(_session.release());
    }
}

HRESULT SyncRootConnection::Connect(const std::filesystem::path& syncRootPath,
                                    std::shared_ptr<ISyncFilter> filter,
                                    std::shared_ptr<ICloudFilterApi> api,
                                    const Options& options,
                                    std::unique_ptr<SyncRootConnection>& out) noexcept
{
    out.reset();

    if (syncRootPath.empty() || ! filter || ! api)
    {
        return E_INVALIDARG;
    }

    Debug::Perf::Scope perf(L"CloudSync.Connect");
    perf.SetDetail(syncRootPath.native());

    std::unique_ptr<SyncRootConnection> connection;
    try
    {
        auto session        = std::make_unique<Session>();
        session->dispatcher = std::make_unique<CallbackDispatcher>(std::move(filter), api);
        session->api        = std::move(api);
        connection.reset(new SyncRootConnection(syncRootPath, std::move(session)));
    }
    catch (const std::bad_alloc&)
    {
        return E_OUTOFMEMORY;
    }

    static const CF_CALLBACK_REGISTRATION kCallbackTable[] = {
        {CF_CALLBACK_TYPE_FETCH_DATA, &SyncRootConnection::OnFetchData},
        {CF_CALLBACK_TYPE_VALIDATE_DATA, &SyncRootConnection::OnValidateData},
        {CF_CALLBACK_TYPE_CANCEL_FETCH_DATA, &SyncRootConnection::OnCancelFetchData},
        {CF_CALLBACK_TYPE_FETCH_PLACEHOLDERS, &SyncRootConnection::OnFetchPlaceholders},
        {CF_CALLBACK_TYPE_CANCEL_FETCH_PLACEHOLDERS, &SyncRootConnection::OnCancelFetchPlaceholders},
        {CF_CALLBACK_TYPE_NOTIFY_FILE_OPEN_COMPLETION, &SyncRootConnection::OnOpenCompletion},
        {CF_CALLBACK_TYPE_NOTIFY_FILE_CLOSE_COMPLETION, &SyncRootConnection::OnCloseCompletion},
        {CF_CALLBACK_TYPE_NOTIFY_DEHYDRATE, &SyncRootConnection::OnDehydrate},
        {CF_CALLBACK_TYPE_NOTIFY_DEHYDRATE_COMPLETION, &SyncRootConnection::OnDehydrateCompletion},
        {CF_CALLBACK_TYPE_NOTIFY_DELETE, &SyncRootConnection::OnDelete},
        {CF_CALLBACK_TYPE_NOTIFY_DELETE_COMPLETION, &SyncRootConnection::OnDeleteCompletion},
        {CF_CALLBACK_TYPE_NOTIFY_RENAME, &SyncRootConnection::OnRename},
        {CF_CALLBACK_TYPE_NOTIFY_RENAME_COMPLETION, &SyncRootConnection::OnRenameCompletion},
        CF_CALLBACK_REGISTRATION_END,
    };

    Session* session = connection->_session.get();
    const HRESULT hr = session->api->ConnectSyncRoot(connection->_syncRootPath, kCallbackTable, session, connection->_connectionKey);
    perf.SetHr(hr);
    if (FAILED(hr))
    {
        return hr;
    }
    connection->_connected = true;

    if (options.watchStateChanges)
    {
        CallbackDispatcher* dispatcher = session->dispatcher.get();
        try
        {
            connection->_watcher = std::make_unique<DirectoryChangeWatcher>(connection->_syncRootPath,
                                                                            [dispatcher](std::vector<std::filesystem::path> changes) { dispatcher->StateChanged(changes); });
        }
        catch (const std::bad_alloc&)
        {
            return E_OUTOFMEMORY;
        }

        const HRESULT watchHr = connection->_watcher->Start();
        if (FAILED(watchHr))
        {
            // State change notifications are advisory; the connection stays usable without them.
            Debug::Warning(L"CloudSync: state changes for '{}' will not be reported (hr=0x{:08X})", syncRootPath.native(), static_cast<unsigned long>(watchHr));
            connection->_watcher.reset();
        }
    }

    Debug::Info(L"CloudSync: connected '{}' (key={})", syncRootPath.native(), connection->_connectionKey.value);
    out = std::move(connection);
    return S_OK;
}

HRESULT SyncRootConnection::Disconnect() noexcept
{
    if (_watcher)
    {
        _watcher->Stop();
    }

    if (! _connected)
    {
        return S_OK;
    }

    // Blocks until callbacks already delivered on this connection have returned.
    const HRESULT hr = _session->api->DisconnectSyncRoot(_connectionKey);
    if (FAILED(hr))
    {
        Debug::Error(L"CloudSync: disconnecting '{}' failed, the connection stays live (hr=0x{:08X})", _syncRootPath.native(), static_cast<unsigned long>(hr));
        return hr;
    }
    _connected = false;

    const size_t pending = PendingOperationCount();
    if (pending > 0)
    {
        Debug::Warning(L"CloudSync: disconnected '{}' with {} unresolved operation(s)", _syncRootPath.native(), pending);
    }
    else
    {
        Debug::Info(L"CloudSync: disconnected '{}'", _syncRootPath.native());
    }
    return S_OK;
}

void SyncRootConnection::Session::DenyUntranslated(const CF_CALLBACK_INFO& info, const CF_CALLBACK_PARAMETERS& parameters, CF_CALLBACK_TYPE type) noexcept
{
    if (! api || ! IsTerminating(type))
    {
        return;
    }

    const CorrelationKeyPair keys = KeysFromCallbackInfo(info);
    const NTSTATUS status         = CompletionStatusFromHResult(E_OUTOFMEMORY);

    HRESULT hr = S_OK;
    switch (type)
    {
        case CF_CALLBACK_TYPE_FETCH_DATA:
        {
            FailTransferCommand command;
            command.offset           = ToUnsigned(parameters.FetchData.RequiredFileOffset);
            command.length           = ToUnsigned(parameters.FetchData.RequiredLength);
            command.completionStatus = status;
            hr                       = command.Execute(*api, keys);
            break;
        }
        case CF_CALLBACK_TYPE_VALIDATE_DATA:
        {
            ValidateCommand command;
            command.offset           = ToUnsigned(parameters.ValidateData.RequiredFileOffset);
            command.length           = ToUnsigned(parameters.ValidateData.RequiredLength);
            command.completionStatus = status;
            hr                       = command.Execute(*api, keys);
            break;
        }
        case CF_CALLBACK_TYPE_FETCH_PLACEHOLDERS:
        {
            CreatePlaceholdersCommand command;
            command.completionStatus = status;
            std::vector<PlaceholderResult> results;
            hr = command.Execute(*api, keys, results);
            break;
        }
        case CF_CALLBACK_TYPE_NOTIFY_DEHYDRATE:
        {
            DehydrateCommand command;
            command.completionStatus = status;
            hr                       = command.Execute(*api, keys);
            break;
        }
        case CF_CALLBACK_TYPE_NOTIFY_DELETE:
        {
            DeleteCommand command;
            command.completionStatus = status;
            hr                       = command.Execute(*api, keys);
            break;
        }
        case CF_CALLBACK_TYPE_NOTIFY_RENAME:
        {
            RenameCommand command;
            command.completionStatus = status;
            hr                       = command.Execute(*api, keys);
            break;
        }
        default: break;
    }

    if (FAILED(hr))
    {
        Debug::Error(L"CloudSync: failed to deny an untranslated callback (type={}, hr=0x{:08X})", static_cast<int>(type), static_cast<unsigned long>(hr));
    }
}

// Translation allocates; when it fails a terminating callback is denied here.
template <typename Route>
void SyncRootConnection::RouteCallback(const CF_CALLBACK_INFO* info, const CF_CALLBACK_PARAMETERS* parameters, CF_CALLBACK_TYPE type, Route&& route) noexcept
{
    if (! info || ! parameters)
    {
        return;
    }

    auto* session = static_cast<Session*>(info->CallbackContext);
    if (! session || ! session->dispatcher)
    {
        Debug::Error(L"CloudSync: callback type {} arrived without a connection context", static_cast<int>(type));
        return;
    }

    try
    {
        route(*session, *info, *parameters);
    }
    catch (const std::bad_alloc&)
    {
        Debug::Error(L"CloudSync: out of memory translating callback type {}", static_cast<int>(type));
        session->DenyUntranslated(*info, *parameters, type);
    }
}

void CALLBACK SyncRootConnection::OnFetchData(const CF_CALLBACK_INFO* info, const CF_CALLBACK_PARAMETERS* parameters)
{
    RouteCallback(info,
                  parameters,
                  CF_CALLBACK_TYPE_FETCH_DATA,
                  [](Session& self, const CF_CALLBACK_INFO& callbackInfo, const CF_CALLBACK_PARAMETERS& callbackParameters)
                  { self.dispatcher->FetchData(TranslateRequest(callbackInfo), TranslateFetchData(callbackParameters)); });
}

void CALLBACK SyncRootConnection::OnValidateData(const CF_CALLBACK_INFO* info, const CF_CALLBACK_PARAMETERS* parameters)
{
    RouteCallback(info,
                  parameters,
                  CF_CALLBACK_TYPE_VALIDATE_DATA,
                  [](Session& self, const CF_CALLBACK_INFO& callbackInfo, const CF_CALLBACK_PARAMETERS& callbackParameters)
                  { self.dispatcher->ValidateData(TranslateRequest(callbackInfo), TranslateValidateData(callbackParameters)); });
}

void CALLBACK SyncRootConnection::OnCancelFetchData(const CF_CALLBACK_INFO* info, const CF_CALLBACK_PARAMETERS* parameters)
{
    RouteCallback(info,
                  parameters,
                  CF_CALLBACK_TYPE_CANCEL_FETCH_DATA,
                  [](Session& self, const CF_CALLBACK_INFO& callbackInfo, const CF_CALLBACK_PARAMETERS& callbackParameters)
                  { self.dispatcher->CancelFetchData(TranslateRequest(callbackInfo), TranslateCancelFetchData(callbackParameters)); });
}

void CALLBACK SyncRootConnection::OnFetchPlaceholders(const CF_CALLBACK_INFO* info, const CF_CALLBACK_PARAMETERS* parameters)
{
    RouteCallback(info,
                  parameters,
                  CF_CALLBACK_TYPE_FETCH_PLACEHOLDERS,
                  [](Session& self, const CF_CALLBACK_INFO& callbackInfo, const CF_CALLBACK_PARAMETERS& callbackParameters)
                  { self.dispatcher->FetchPlaceholders(TranslateRequest(callbackInfo), TranslateFetchPlaceholders(callbackParameters)); });
}

void CALLBACK SyncRootConnection::OnCancelFetchPlaceholders(const CF_CALLBACK_INFO* info, const CF_CALLBACK_PARAMETERS* parameters)
{
    RouteCallback(info,
                  parameters,
                  CF_CALLBACK_TYPE_CANCEL_FETCH_PLACEHOLDERS,
                  [](Session& self, const CF_CALLBACK_INFO& callbackInfo, const CF_CALLBACK_PARAMETERS& callbackParameters)
                  { self.dispatcher->CancelFetchPlaceholders(TranslateRequest(callbackInfo), TranslateCancelFetchPlaceholders(callbackParameters)); });
}

void CALLBACK SyncRootConnection::OnOpenCompletion(const CF_CALLBACK_INFO* info, const CF_CALLBACK_PARAMETERS* parameters)
{
    RouteCallback(info,
                  parameters,
                  CF_CALLBACK_TYPE_NOTIFY_FILE_OPEN_COMPLETION,
                  [](Session& self, const CF_CALLBACK_INFO& callbackInfo, const CF_CALLBACK_PARAMETERS& callbackParameters)
                  { self.dispatcher->Opened(TranslateRequest(callbackInfo), TranslateOpened(callbackParameters)); });
}

void CALLBACK SyncRootConnection::OnCloseCompletion(const CF_CALLBACK_INFO* info, const CF_CALLBACK_PARAMETERS* parameters)
{
    RouteCallback(info,
                  parameters,
                  CF_CALLBACK_TYPE_NOTIFY_FILE_CLOSE_COMPLETION,
                  [](Session& self, const CF_CALLBACK_INFO& callbackInfo, const CF_CALLBACK_PARAMETERS& callbackParameters)
                  { self.dispatcher->Closed(TranslateRequest(callbackInfo), TranslateClosed(callbackParameters)); });
}

void CALLBACK SyncRootConnection::OnDehydrate(const CF_CALLBACK_INFO* info, const CF_CALLBACK_PARAMETERS* parameters)
{
    RouteCallback(info,
                  parameters,
                  CF_CALLBACK_TYPE_NOTIFY_DEHYDRATE,
                  [](Session& self, const CF_CALLBACK_INFO& callbackInfo, const CF_CALLBACK_PARAMETERS& callbackParameters)
                  { self.dispatcher->Dehydrate(TranslateRequest(callbackInfo), TranslateDehydrate(callbackParameters)); });
}

void CALLBACK SyncRootConnection::OnDehydrateCompletion(const CF_CALLBACK_INFO* info, const CF_CALLBACK_PARAMETERS* parameters)
{
    RouteCallback(info,
                  parameters,
                  CF_CALLBACK_TYPE_NOTIFY_DEHYDRATE_COMPLETION,
                  [](Session& self, const CF_CALLBACK_INFO& callbackInfo, const CF_CALLBACK_PARAMETERS& callbackParameters)
                  { self.dispatcher->Dehydrated(TranslateRequest(callbackInfo), TranslateDehydrated(callbackParameters)); });
}

void CALLBACK SyncRootConnection::OnDelete(const CF_CALLBACK_INFO* info, const CF_CALLBACK_PARAMETERS* parameters)
{
    RouteCallback(info,
                  parameters,
                  CF_CALLBACK_TYPE_NOTIFY_DELETE,
                  [](Session& self, const CF_CALLBACK_INFO& callbackInfo, const CF_CALLBACK_PARAMETERS& callbackParameters)
                  { self.dispatcher->Delete(TranslateRequest(callbackInfo), TranslateDelete(callbackParameters)); });
}

void CALLBACK SyncRootConnection::OnDeleteCompletion(const CF_CALLBACK_INFO* info, const CF_CALLBACK_PARAMETERS* parameters)
{
    RouteCallback(info,
                  parameters,
                  CF_CALLBACK_TYPE_NOTIFY_DELETE_COMPLETION,
                  [](Session& self, const CF_CALLBACK_INFO& callbackInfo, const CF_CALLBACK_PARAMETERS&)
                  { self.dispatcher->Deleted(TranslateRequest(callbackInfo), DeletedInfo{}); });
}

void CALLBACK SyncRootConnection::OnRename(const CF_CALLBACK_INFO* info, const CF_CALLBACK_PARAMETERS* parameters)
{
    RouteCallback(info,
                  parameters,
                  CF_CALLBACK_TYPE_NOTIFY_RENAME,
                  [](Session& self, const CF_CALLBACK_INFO& callbackInfo, const CF_CALLBACK_PARAMETERS& callbackParameters)
                  { self.dispatcher->Rename(TranslateRequest(callbackInfo), TranslateRename(callbackInfo, callbackParameters)); });
}

void CALLBACK SyncRootConnection::OnRenameCompletion(const CF_CALLBACK_INFO* info, const CF_CALLBACK_PARAMETERS* parameters)
{
    RouteCallback(info,
                  parameters,
                  CF_CALLBACK_TYPE_NOTIFY_RENAME_COMPLETION,
                  [](Session& self, const CF_CALLBACK_INFO& callbackInfo, const CF_CALLBACK_PARAMETERS& callbackParameters)
                  { self.dispatcher->Renamed(TranslateRequest(callbackInfo), TranslateRenamed(callbackInfo, callbackParameters)); });
}
} // namespace CloudSync
