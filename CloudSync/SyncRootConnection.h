#pragma once

#include "CallbackDispatcher.h"
#include "CorrelationKeys.h"
#include "DirectoryChangeWatcher.h"
#include "Helpers.h"
#include "SyncFilter.h"

#include <filesystem>
#include <memory>

#include <cfapi.h>

namespace CloudSync
{
struct ICloudFilterApi;

// A live CfConnectSyncRoot session. Destroying it disconnects the sync root; callbacks already
// running finish before the destructor returns.
// Notes:
// - The sync root must already be registered (RegisterSyncRoot).
// - Every callback type is registered; unimplemented filter methods are denied by the dispatcher.
// - OS callbacks reach the dispatcher through a separately owned session. When the disconnect
//   fails the session is kept alive, since the OS may still deliver callbacks carrying it.
class SyncRootConnection final
{
public:
    struct Options
    {
        // Feed ISyncFilter::StateChanged from a recursive attribute watch on the sync root.
        bool watchStateChanges = true;
    };

    ~SyncRootConnection();

    SyncRootConnection(const SyncRootConnection&)            = delete;
    SyncRootConnection& operator=(const SyncRootConnection&) = delete;
    SyncRootConnection(SyncRootConnection&&)                 = delete;
    SyncRootConnection& operator=(SyncRootConnection&&)      = delete;

    [[nodiscard]] static HRESULT Connect(const std::filesystem::path& syncRootPath,
                                         std::shared_ptr<ISyncFilter> filter,
                                         std::shared_ptr<ICloudFilterApi> api,
                                         const Options& options,
                                         std::unique_ptr<SyncRootConnection>& out) noexcept;

    // Stops state change reporting and disconnects the sync root. On failure the connection stays
    // live and the call may be retried. S_OK when already disconnected.
    [[nodiscard]] HRESULT Disconnect() noexcept;

    [[nodiscard]] bool IsConnected() const noexcept
    {
        return _connected;
    }

    [[nodiscard]] ConnectionKey Key() const noexcept
    {
        return _connectionKey;
    }

    [[nodiscard]] const std::filesystem::path& SyncRootPath() const noexcept
    {
        return _syncRootPath;
    }

    [[nodiscard]] size_t PendingOperationCount() const noexcept
    {
        return _session && _session->dispatcher ? _session->dispatcher->PendingOperationCount() : 0u;
    }

private:
    // Everything an OS callback needs; passed as the CfConnectSyncRoot callback context.
    struct Session
    {
        std::shared_ptr<ICloudFilterApi> api;
        std::unique_ptr<CallbackDispatcher> dispatcher;

        // Answers a terminating callback whose parameters could not be translated.
        void DenyUntranslated(const CF_CALLBACK_INFO& info, const CF_CALLBACK_PARAMETERS& parameters, CF_CALLBACK_TYPE type) noexcept;
    };

    SyncRootConnection(std::filesystem::path syncRootPath, std::unique_ptr<Session> session) noexcept;

    // Resolves the session from the callback context, then translates and dispatches.
    template <typename Route>
    static void RouteCallback(const CF_CALLBACK_INFO* info, const CF_CALLBACK_PARAMETERS* parameters, CF_CALLBACK_TYPE type, Route&& route) noexcept;

    static void CALLBACK OnFetchData(const CF_CALLBACK_INFO* info, const CF_CALLBACK_PARAMETERS* parameters);
    static void CALLBACK OnValidateData(const CF_CALLBACK_INFO* info, const CF_CALLBACK_PARAMETERS* parameters);
    static void CALLBACK OnCancelFetchData(const CF_CALLBACK_INFO* info, const CF_CALLBACK_PARAMETERS* parameters);
    static void CALLBACK OnFetchPlaceholders(const CF_CALLBACK_INFO* info, const CF_CALLBACK_PARAMETERS* parameters);
    static void CALLBACK OnCancelFetchPlaceholders(const CF_CALLBACK_INFO* info, const CF_CALLBACK_PARAMETERS* parameters);
    static void CALLBACK OnOpenCompletion(const CF_CALLBACK_INFO* info, const CF_CALLBACK_PARAMETERS* parameters);
    static void CALLBACK OnCloseCompletion(const CF_CALLBACK_INFO* info, const CF_CALLBACK_PARAMETERS* parameters);
    static void CALLBACK OnDehydrate(const CF_CALLBACK_INFO* info, const CF_CALLBACK_PARAMETERS* parameters);
    static void CALLBACK OnDehydrateCompletion(const CF_CALLBACK_INFO* info, const CF_CALLBACK_PARAMETERS* parameters);
    static void CALLBACK OnDelete(const CF_CALLBACK_INFO* info, const CF_CALLBACK_PARAMETERS* parameters);
    static void CALLBACK OnDeleteCompletion(const CF_CALLBACK_INFO* info, const CF_CALLBACK_PARAMETERS* parameters);
    static void CALLBACK OnRename(const CF_CALLBACK_INFO* info, const CF_CALLBACK_PARAMETERS* parameters);
    static void CALLBACK OnRenameCompletion(const CF_CALLBACK_INFO* info, const CF_CALLBACK_PARAMETERS* parameters);

    std::filesystem::path _syncRootPath;
    std::unique_ptr<Session> _session;
    std::unique_ptr<DirectoryChangeWatcher> _watcher;
    ConnectionKey _connectionKey;
    bool _connected = false;
};
} // namespace CloudSync
