#include "Helpers.h"

#include <cstdio>
#include <filesystem>
#include <iterator>
#include <memory>
#include <string_view>

#pragma warning(push)
// WIL: C4625 (copy ctor deleted), C4626 (copy assign deleted), C5026 (move ctor deleted), C5027 (move assign deleted)
#pragma warning(disable : 4625 4626 5026 5027 28182)
#include <wil/resource.h>
#pragma warning(pop)

#pragma warning(push)
// C++/WinRT headers: deleted copy/move, non-virtual destructors and padding
#pragma warning(disable : 4625 4626 4265 5026 5027 5246)
#include <winrt/base.h>
#pragma warning(pop)

#include "CfApiPlatform.h"
#include "Configuration.h"
#include "MirrorFilter.h"
#include "Registration.h"
#include "SyncRootConnection.h"
#include "Version.h"

namespace
{
wil::unique_event g_stopEvent;

BOOL WINAPI ConsoleCtrlHandler(DWORD ctrlType) noexcept
{
    switch (ctrlType)
    {
        case CTRL_C_EVENT:
        case CTRL_BREAK_EVENT:
        case CTRL_CLOSE_EVENT:
            if (g_stopEvent)
            {
                g_stopEvent.SetEvent();
            }
            return TRUE;
        default: return FALSE;
    }
}

// Blocks until Enter is pressed on the console or a console control event arrives.
void WaitForStop() noexcept
{
    const HANDLE input = ::GetStdHandle(STD_INPUT_HANDLE);
    DWORD mode         = 0;
    if (input == nullptr || input == INVALID_HANDLE_VALUE || ! ::GetConsoleMode(input, &mode))
    {
        // Input is redirected: only Ctrl+C ends the session.
        static_cast<void>(g_stopEvent.wait(INFINITE));
        return;
    }

    const HANDLE handles[] = {g_stopEvent.get(), input};
    for (;;)
    {
        const DWORD wait = ::WaitForMultipleObjects(static_cast<DWORD>(std::size(handles)), handles, FALSE, INFINITE);
        if (wait != WAIT_OBJECT_0 + 1)
        {
            return;
        }

        INPUT_RECORD records[16]{};
        DWORD count = 0;
        if (! ::ReadConsoleInputW(input, records, static_cast<DWORD>(std::size(records)), &count))
        {
            Debug::ErrorWithLastError(L"ReadConsoleInputW failed");
            return;
        }

        for (DWORD i = 0; i < count; ++i)
        {
            if (records[i].EventType == KEY_EVENT && records[i].Event.KeyEvent.bKeyDown && records[i].Event.KeyEvent.wVirtualKeyCode == VK_RETURN)
            {
                return;
            }
        }
    }
}

void PrintUsage() noexcept
{
    fwprintf(stderr, L"usage: CloudSyncSample <config.json> [--unregister]\n");
    fwprintf(stderr, L"  --unregister  remove the sync root registration on exit\n");
}

[[nodiscard]] HRESULT EnsureFolder(const std::filesystem::path& path) noexcept
{
    std::error_code ec;
    std::filesystem::create_directories(path, ec);
    if (ec)
    {
        return HRESULT_FROM_WIN32(static_cast<DWORD>(ec.value()));
    }
    return S_OK;
}

[[nodiscard]] int Run(const std::filesystem::path& configPath, bool unregisterOnExit)
{
    CloudSync::ProviderConfiguration configuration;
    HRESULT hr = CloudSync::LoadProviderConfiguration(configPath, configuration);
    if (FAILED(hr))
    {
        fwprintf(stderr, L"cannot load '%ls' (hr=0x%08X)\n", configPath.c_str(), static_cast<unsigned>(hr));
        return 1;
    }

    if (configuration.providerName.empty() || configuration.syncRootPath.empty() || configuration.serverPath.empty())
    {
        fwprintf(stderr, L"providerName, syncRootPath and serverPath are required\n");
        return 1;
    }

    if (! std::filesystem::is_directory(configuration.serverPath))
    {
        fwprintf(stderr, L"server folder '%ls' does not exist\n", configuration.serverPath.c_str());
        return 1;
    }

    hr = EnsureFolder(configuration.syncRootPath);
    if (FAILED(hr))
    {
        fwprintf(stderr, L"cannot create '%ls' (hr=0x%08X)\n", configuration.syncRootPath.c_str(), static_cast<unsigned>(hr));
        return 1;
    }

    if (configuration.registration.version.empty())
    {
        configuration.registration.version = CLOUDSYNC_VERSION_STRING;
    }

    CloudSync::SyncRootId id;
    hr = CloudSync::SyncRootId::ForCurrentUser(configuration.providerName, configuration.accountName, id);
    if (FAILED(hr))
    {
        fwprintf(stderr, L"cannot build the sync root id (hr=0x%08X)\n", static_cast<unsigned>(hr));
        return 1;
    }

    const std::shared_ptr<CloudSync::ICloudFilterApi> api = CloudSync::CreateCfApiCloudFilterApi();
    hr                                                     = CloudSync::RegisterSyncRoot(*api, id, configuration.syncRootPath, configuration.registration);
    if (FAILED(hr))
    {
        fwprintf(stderr, L"registration of '%ls' failed (hr=0x%08X)\n", id.ToString().c_str(), static_cast<unsigned>(hr));
        return 1;
    }

    int exitCode = 0;
    {
        auto filter = std::make_shared<MirrorFilter>(configuration.syncRootPath, configuration.serverPath);

        CloudSync::SyncRootConnection::Options options;
        options.watchStateChanges = configuration.watchStateChanges;

        std::unique_ptr<CloudSync::SyncRootConnection> connection;
        hr = CloudSync::SyncRootConnection::Connect(configuration.syncRootPath, filter, api, options, connection);
        if (FAILED(hr))
        {
            fwprintf(stderr, L"connect failed (hr=0x%08X)\n", static_cast<unsigned>(hr));
            exitCode = 1;
        }
        else
        {
            wprintf(L"Serving '%ls' from '%ls'. Press Enter or Ctrl+C to stop.\n", configuration.syncRootPath.c_str(), configuration.serverPath.c_str());
            WaitForStop();

            if (connection->PendingOperationCount() != 0)
            {
                Debug::Warning(L"Disconnecting with {} pending operations", connection->PendingOperationCount());
            }
            connection.reset();
        }
    }

    if (unregisterOnExit)
    {
        hr = CloudSync::UnregisterSyncRoot(*api, id);
        if (FAILED(hr))
        {
            fwprintf(stderr, L"unregister failed (hr=0x%08X)\n", static_cast<unsigned>(hr));
            exitCode = 1;
        }
        else
        {
            wprintf(L"Unregistered '%ls'.\n", id.ToString().c_str());
        }
    }

    return exitCode;
}
} // namespace

int wmain(int argc, wchar_t* argv[])
{
    std::filesystem::path configPath;
    bool unregisterOnExit = false;
    for (int i = 1; i < argc; ++i)
    {
        const std::wstring_view arg(argv[i]);
        if (arg == L"--unregister")
        {
            unregisterOnExit = true;
        }
        else if (configPath.empty() && ! arg.starts_with(L"--"))
        {
            configPath = arg;
        }
        else
        {
            PrintUsage();
            return 2;
        }
    }

    if (configPath.empty())
    {
        PrintUsage();
        return 2;
    }

    wprintf(L"CloudSyncSample %ls\n", CLOUDSYNC_VERSION_STRING);

    try
    {
        // Sync root registration waits on WinRT async operations, which an STA must not do.
        winrt::init_apartment(winrt::apartment_type::multi_threaded);

        g_stopEvent.create(wil::EventOptions::ManualReset);
        if (! ::SetConsoleCtrlHandler(ConsoleCtrlHandler, TRUE))
        {
            Debug::ErrorWithLastError(L"SetConsoleCtrlHandler failed");
        }

        const int exitCode = Run(configPath, unregisterOnExit);
        static_cast<void>(::SetConsoleCtrlHandler(ConsoleCtrlHandler, FALSE));
        winrt::uninit_apartment();
        return exitCode;
    }
    catch (const winrt::hresult_error& ex)
    {
        fwprintf(stderr, L"fatal: %ls (hr=0x%08X)\n", ex.message().c_str(), static_cast<unsigned>(ex.code().value));
    }
    catch (const wil::ResultException& ex)
    {
        fwprintf(stderr, L"fatal: hr=0x%08X\n", static_cast<unsigned>(ex.GetErrorCode()));
    }
    catch (const std::exception& ex)
    {
        fwprintf(stderr, L"fatal: %hs\n", ex.what());
    }
    return 1;
}
