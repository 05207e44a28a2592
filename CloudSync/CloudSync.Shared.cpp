// The CloudSync library owns the TraceLogging provider of every module that links it.
#define CLOUDSYNC_DEFINE_TRACE_PROVIDER
#include "Helpers.h"

#include "CloudSync.Internal.h"

#include <limits>

namespace CloudSyncInternal
{
namespace
{
[[nodiscard]] std::wstring WideFromCodePage(UINT codePage, DWORD flags, std::string_view text) noexcept
{
    if (text.empty() || text.size() > static_cast<size_t>((std::numeric_limits<int>::max)()))
    {
        return {};
    }

    const int required = MultiByteToWideChar(codePage, flags, text.data(), static_cast<int>(text.size()), nullptr, 0);
    if (required <= 0)
    {
        return {};
    }

    std::wstring out(static_cast<size_t>(required), L'\0');
    const int written = MultiByteToWideChar(codePage, flags, text.data(), static_cast<int>(text.size()), out.data(), required);
    if (written != required)
    {
        return {};
    }

    return out;
}
} // namespace

std::wstring Utf16FromUtf8(std::string_view text) noexcept
{
    return WideFromCodePage(CP_UTF8, MB_ERR_INVALID_CHARS, text);
}

std::wstring Utf16FromUtf8(const char* text) noexcept
{
    if (! text)
    {
        return {};
    }

    return Utf16FromUtf8(std::string_view(text));
}

std::string Utf8FromUtf16(std::wstring_view text) noexcept
{
    if (text.empty())
    {
        return {};
    }

    if (text.size() > static_cast<size_t>((std::numeric_limits<int>::max)()))
    {
        return {};
    }

    const int required = WideCharToMultiByte(CP_UTF8, WC_ERR_INVALID_CHARS, text.data(), static_cast<int>(text.size()), nullptr, 0, nullptr, nullptr);
    if (required <= 0)
    {
        return {};
    }

    std::string out(static_cast<size_t>(required), '\0');
    const int written = WideCharToMultiByte(CP_UTF8, WC_ERR_INVALID_CHARS, text.data(), static_cast<int>(text.size()), out.data(), required, nullptr, nullptr);
    if (written != required)
    {
        return {};
    }

    return out;
}

std::wstring DescribeException(const std::exception& ex) noexcept
{
    const char* what = ex.what();
    if (! what || ! what[0])
    {
        return L"(no message)";
    }

    std::wstring message = Utf16FromUtf8(what);
    if (message.empty())
    {
        message = WideFromCodePage(CP_ACP, 0, what);
    }
    return message;
}

std::optional<std::wstring> TryGetJsonString(yyjson_val* root, const char* key) noexcept
{
    if (! root || ! yyjson_is_obj(root) || ! key)
    {
        return std::nullopt;
    }

    yyjson_val* v = yyjson_obj_get(root, key);
    if (! v || ! yyjson_is_str(v))
    {
        return std::nullopt;
    }

    const char* s    = yyjson_get_str(v);
    const size_t len = yyjson_get_len(v);
    if (! s)
    {
        return std::nullopt;
    }

    return Utf16FromUtf8(std::string_view(s, len));
}

std::optional<uint64_t> TryGetJsonUInt(yyjson_val* root, const char* key) noexcept
{
    if (! root || ! yyjson_is_obj(root) || ! key)
    {
        return std::nullopt;
    }

    yyjson_val* v = yyjson_obj_get(root, key);
    if (! v || ! yyjson_is_uint(v))
    {
        return std::nullopt;
    }

    return yyjson_get_uint(v);
}

std::optional<bool> TryGetJsonBool(yyjson_val* root, const char* key) noexcept
{
    if (! root || ! yyjson_is_obj(root) || ! key)
    {
        return std::nullopt;
    }

    yyjson_val* v = yyjson_obj_get(root, key);
    if (! v || ! yyjson_is_bool(v))
    {
        return std::nullopt;
    }

    return yyjson_get_bool(v) != 0;
}

bool EqualsNoCase(std::wstring_view a, std::wstring_view b) noexcept
{
    if (a.size() > static_cast<size_t>((std::numeric_limits<int>::max)()) || b.size() > static_cast<size_t>((std::numeric_limits<int>::max)()))
    {
        return false;
    }

    return CompareStringOrdinal(a.data(), static_cast<int>(a.size()), b.data(), static_cast<int>(b.size()), TRUE) == CSTR_EQUAL;
}
} // namespace CloudSyncInternal
