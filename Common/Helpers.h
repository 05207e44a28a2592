#pragma once

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <exception>
#include <format>
#include <limits>
#include <mutex>
#include <string>
#include <string_view>
#include <utility>

#define WIN32_LEAN_AND_MEAN
#define NOMINMAX
// ntstatus.h carries the STATUS_CLOUD_FILE_* completion codes; windows.h must not define its subset first.
#define WIN32_NO_STATUS
#include <windows.h>
#undef WIN32_NO_STATUS
#include <ntstatus.h>

#include <evntrace.h>

#pragma warning(push)
// WIL headers: deleted copy/move and padding
#pragma warning(disable : 4625 4626 5026 5027 4820)
#include <TraceLoggingProvider.h>
#include <wil/resource.h>
#pragma warning(pop)

#pragma warning(push)
#pragma warning(disable : 4514) // unreferenced inline function has been removed

//////////////////////////////////////////////////////////////////////////////////
// DEBUG helpers
namespace Debug
{
struct InfoParam
{
    enum Type : uint32_t
    {
        Text    = 0x0,
        Error   = 0x1,
        Warning = 0x2,
        Info    = 0x4,
        Debug   = 0x8,
        All     = 0x1F
    };
    FILETIME time;
    DWORD processID;
    DWORD threadID;
    Type type;
};

// TraceLogging provider declaration.
// TraceLogging provider handles cannot be shared across module boundaries, so every EXE/DLL
// defines its own instance with the same GUID:
//   - exactly one .cpp per module defines CLOUDSYNC_DEFINE_TRACE_PROVIDER before including Helpers.h
//   - every other file just includes Helpers.h

#if ! defined(CLOUDSYNC_DEFINE_TRACE_PROVIDER)
TRACELOGGING_DECLARE_PROVIDER(g_CloudSyncProvider);
#else
TRACELOGGING_DEFINE_PROVIDER(g_CloudSyncProvider,
                             "CloudSync",
                             // {8c2f4f5e-3b7a-4d19-a6c1-52e0d9b4a7f3}
                             (0x8c2f4f5e, 0x3b7a, 0x4d19, 0xa6, 0xc1, 0x52, 0xe0, 0xd9, 0xb4, 0xa7, 0xf3));
#endif

namespace detail
{
inline std::once_flag g_traceLoggingRegisterOnce;
inline std::atomic<bool> g_etwRegistered{false};

inline bool EnsureTraceLoggingRegistered() noexcept
{
    std::call_once(g_traceLoggingRegisterOnce,
                   []() noexcept
                   {
                       const HRESULT hr = TraceLoggingRegister(g_CloudSyncProvider);
                       g_etwRegistered.store(SUCCEEDED(hr), std::memory_order_release);

#ifdef _DEBUG
                       if (FAILED(hr))
                       {
                           wchar_t msg[128]{};
                           static_cast<void>(std::format_to_n(msg, 127, L"CloudSync: TraceLoggingRegister failed (hr=0x{:08X})\n", static_cast<unsigned long>(hr)));
                           OutputDebugStringW(msg);
                       }
#endif
                   });
    return g_etwRegistered.load(std::memory_order_acquire);
}

constexpr ULONGLONG kDebugKeyword = 0x0000000000000001ull;
constexpr ULONGLONG kPerfKeyword  = 0x0000000000000002ull;

inline bool IsEtwEnabled(ULONGLONG keyword) noexcept
{
    if (! EnsureTraceLoggingRegistered())
    {
        return false;
    }

    return TraceLoggingProviderEnabled(g_CloudSyncProvider, TRACE_LEVEL_INFORMATION, keyword) != 0;
}

inline InfoParam BuildInfoParam(InfoParam::Type type) noexcept
{
    InfoParam dbg{};
    GetSystemTimeAsFileTime(&dbg.time);
    dbg.processID = GetCurrentProcessId();
    dbg.threadID  = GetCurrentThreadId();
    dbg.type      = type;
    return dbg;
}

inline void Publish(const InfoParam& info, std::wstring_view message) noexcept
{
    if (! EnsureTraceLoggingRegistered())
    {
        return;
    }

    ULARGE_INTEGER fileTime{};
    fileTime.LowPart   = info.time.dwLowDateTime;
    fileTime.HighPart  = info.time.dwHighDateTime;
    const USHORT length = static_cast<USHORT>(std::min<size_t>(message.size(), std::numeric_limits<USHORT>::max()));

    // TraceLoggingWrite has no result; disabled sessions simply drop the event.
    TraceLoggingWrite(g_CloudSyncProvider,
                      "DebugMessage",
                      TraceLoggingLevel(TRACE_LEVEL_INFORMATION),
                      TraceLoggingKeyword(kDebugKeyword),
                      TraceLoggingUInt32(static_cast<UINT32>(info.type), "Type"),
                      TraceLoggingUInt32(info.processID, "ProcessId"),
                      TraceLoggingUInt32(info.threadID, "ThreadId"),
                      TraceLoggingUInt64(fileTime.QuadPart, "FileTime"),
                      TraceLoggingCountedWideString(message.data(), length, "Message"));
}
} // namespace detail

namespace Perf
{
inline bool IsEnabled() noexcept
{
    return detail::IsEtwEnabled(detail::kPerfKeyword);
}

inline void Emit(std::wstring_view name, std::wstring_view detail, uint64_t durationUs, uint64_t value0 = 0, uint64_t value1 = 0, HRESULT hr = S_OK) noexcept
{
    if (! IsEnabled())
    {
        return;
    }

    const USHORT nameLen   = static_cast<USHORT>(std::min<size_t>(name.size(), std::numeric_limits<USHORT>::max()));
    const USHORT detailLen = static_cast<USHORT>(std::min<size_t>(detail.size(), std::numeric_limits<USHORT>::max()));

    TraceLoggingWrite(g_CloudSyncProvider,
                      "PerfScope",
                      TraceLoggingLevel(TRACE_LEVEL_INFORMATION),
                      TraceLoggingKeyword(detail::kPerfKeyword),
                      TraceLoggingCountedWideString(name.data() ? name.data() : L"", nameLen, "Name"),
                      TraceLoggingCountedWideString(detail.data() ? detail.data() : L"", detailLen, "Detail"),
                      TraceLoggingUInt64(durationUs, "DurationUs"),
                      TraceLoggingUInt64(value0, "Value0"),
                      TraceLoggingUInt64(value1, "Value1"),
                      TraceLoggingUInt32(static_cast<uint32_t>(hr), "Hr"));
}

// Emits one PerfScope event on destruction. Name and detail must outlive the scope.
class Scope final
{
public:
    explicit Scope(std::wstring_view name) noexcept
        : _enabled(IsEnabled()),
          _name(name),
          _start(_enabled ? std::chrono::steady_clock::now() : std::chrono::steady_clock::time_point{})
    {
    }

    Scope(const Scope&)            = delete;
    Scope& operator=(const Scope&) = delete;
    Scope(Scope&&)                 = delete;
    Scope& operator=(Scope&&)      = delete;

    ~Scope() noexcept
    {
        if (! _enabled)
        {
            return;
        }

        const auto elapsed        = std::chrono::steady_clock::now() - _start;
        const uint64_t durationUs = static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::microseconds>(elapsed).count());
        Emit(_name, _detail, durationUs, _value0, _value1, _hr);
    }

    void SetDetail(std::wstring_view detail) noexcept
    {
        _detail = detail;
    }

    void SetValue0(uint64_t value) noexcept
    {
        _value0 = value;
    }

    void SetValue1(uint64_t value) noexcept
    {
        _value1 = value;
    }

    void SetHr(HRESULT hr) noexcept
    {
        _hr = hr;
    }

private:
    bool _enabled = false;
    std::wstring_view _name;
    std::wstring_view _detail;
    std::chrono::steady_clock::time_point _start;
    uint64_t _value0 = 0;
    uint64_t _value1 = 0;
    HRESULT _hr      = S_OK;
};
} // namespace Perf

inline void Out(InfoParam::Type type, std::wstring_view message) noexcept
{
    if (! detail::IsEtwEnabled(detail::kDebugKeyword))
    {
#ifdef _DEBUG
        // Errors still reach the debugger when nobody listens on ETW.
        if (type == InfoParam::Type::Error)
        {
            try
            {
                std::wstring line{message};
                line.push_back(L'\n');
                OutputDebugStringW(line.c_str());
            }
            catch (const std::bad_alloc&)
            {
                std::terminate();
            }
        }
#endif
        return;
    }

    detail::Publish(detail::BuildInfoParam(type), message);
}

template <typename... Args> inline void Out(InfoParam::Type type, std::wformat_string<Args...> format, Args&&... args) noexcept
{
    // noexcept boundary: formatting can throw, debug output stays best-effort.
    try
    {
        const std::wstring formatted = std::vformat(format.get(), std::make_wformat_args(args...));
        Debug::Out(type, std::wstring_view{formatted});
    }
    catch (const std::bad_alloc&)
    {
        std::terminate();
    }
    catch (const std::format_error&)
    {
        Debug::Out(type, std::wstring_view{L"[Formatting Error in Debug::Out]"});
    }
    catch (const std::exception&)
    {
        Debug::Out(type, std::wstring_view{L"[Unexpected Error in Debug::Out]"});
    }
}

// Logs the message with the calling thread's last error appended; returns that error.
template <typename... Args> inline DWORD LastError(InfoParam::Type type, std::wformat_string<Args...> format, Args&&... args) noexcept
{
    const DWORD lastError = ::GetLastError();

    try
    {
        std::wstring formatted = std::vformat(format.get(), std::make_wformat_args(args...));
        if (lastError == 0)
        {
            formatted.append(L" --> (NO ERROR)");
            Debug::Out(type, std::wstring_view{formatted});
            return 0;
        }

        wil::unique_hlocal_string message;
        const DWORD result = ::FormatMessageW(FORMAT_MESSAGE_ALLOCATE_BUFFER | FORMAT_MESSAGE_FROM_SYSTEM | FORMAT_MESSAGE_IGNORE_INSERTS,
                                              nullptr,
                                              lastError,
                                              MAKELANGID(LANG_NEUTRAL, SUBLANG_DEFAULT),
                                              reinterpret_cast<PWSTR>(message.addressof()),
                                              0,
                                              nullptr);

        if (result > 0 && message)
        {
            std::wstring_view text{message.get()};
            while (! text.empty() && (text.back() == L'\r' || text.back() == L'\n'))
            {
                text.remove_suffix(1);
            }

            formatted.append(std::format(L" --> ({}) {}", lastError, text));
        }
        else
        {
            formatted.append(std::format(L" --> ({}) Unknown error", lastError));
        }

        Debug::Out(type, std::wstring_view{formatted});
    }
    catch (const std::bad_alloc&)
    {
        std::terminate();
    }
    catch (const std::exception&)
    {
        Debug::Out(type, L"[Formatting Error in Debug::LastError] LastError: {}", lastError);
    }

    return lastError;
}

template <typename... Args> inline void Info(std::wformat_string<Args...> format, Args&&... args) noexcept
{
    Debug::Out(InfoParam::Type::Info, format, std::forward<Args>(args)...);
}

template <typename... Args> inline void Warning(std::wformat_string<Args...> format, Args&&... args) noexcept
{
    Debug::Out(InfoParam::Type::Warning, format, std::forward<Args>(args)...);
}

template <typename... Args> inline void Error(std::wformat_string<Args...> format, Args&&... args) noexcept
{
    Debug::Out(InfoParam::Type::Error, format, std::forward<Args>(args)...);
}

template <typename... Args> inline DWORD ErrorWithLastError(std::wformat_string<Args...> format, Args&&... args) noexcept
{
    return Debug::LastError(InfoParam::Type::Error, format, std::forward<Args>(args)...);
}

} // namespace Debug

#pragma warning(pop)
