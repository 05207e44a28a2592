#include "Registration.h"

#include "CloudError.h"
#include "CloudFilterApi.h"
#include "CloudSync.Internal.h"

#include <array>
#include <format>
#include <limits>
#include <memory>
#include <new>
#include <utility>

#include <sddl.h>

namespace CloudSync
{
namespace
{
constexpr wchar_t kIdSeparator = L'!';
constexpr std::wstring_view kDefaultIconFile{L"imageres.dll"};
constexpr int kDefaultIconIndex = 1525;

[[nodiscard]] std::wstring GetSystemDirectoryPath()
{
    std::array<wchar_t, MAX_PATH> buffer{};
    const UINT length = GetSystemDirectoryW(buffer.data(), static_cast<UINT>(buffer.size()));
    if (length == 0 || length >= buffer.size())
    {
        return L"C:\\Windows\\System32";
    }

    return std::wstring(buffer.data(), length);
}

constexpr std::array<std::pair<HydrationType, std::wstring_view>, 4> kHydrationTypeNames{{
    {HydrationType::Partial, L"partial"},
    {HydrationType::Progressive, L"progressive"},
    {HydrationType::Full, L"full"},
    {HydrationType::AlwaysFull, L"alwaysFull"},
}};

constexpr std::array<std::pair<PopulationType, std::wstring_view>, 2> kPopulationTypeNames{{
    {PopulationType::Full, L"full"},
    {PopulationType::AlwaysFull, L"alwaysFull"},
}};

constexpr std::array<std::pair<ProtectionMode, std::wstring_view>, 2> kProtectionModeNames{{
    {ProtectionMode::Unknown, L"unknown"},
    {ProtectionMode::Personal, L"personal"},
}};

template <typename T, size_t N> std::wstring_view NameOf(const std::array<std::pair<T, std::wstring_view>, N>& table, T value) noexcept
{
    for (const auto& [key, name] : table)
    {
        if (key == value)
        {
            return name;
        }
    }
    return L"unknown";
}

template <typename T, size_t N> bool TryParse(const std::array<std::pair<T, std::wstring_view>, N>& table, std::wstring_view text, T& out) noexcept
{
    for (const auto& [key, name] : table)
    {
        if (CloudSyncInternal::EqualsNoCase(name, text))
        {
            out = key;
            return true;
        }
    }
    return false;
}
} // namespace

std::wstring SyncRootId::ToString() const
{
    return std::format(L"{}{}{}{}{}", providerName, kIdSeparator, securityId, kIdSeparator, accountName);
}

HRESULT SyncRootId::ForCurrentUser(std::wstring_view providerName, std::wstring_view accountName, SyncRootId& out) noexcept
{
    out = {};

    if (providerName.empty() || providerName.find(kIdSeparator) != std::wstring_view::npos)
    {
        return E_INVALIDARG;
    }

    wil::unique_handle token;
    if (! OpenProcessToken(GetCurrentProcess(), TOKEN_QUERY, token.put()))
    {
        const DWORD lastError = Debug::ErrorWithLastError(L"CloudSync: OpenProcessToken failed");
        return HRESULT_FROM_WIN32(lastError);
    }

    DWORD required = 0;
    static_cast<void>(GetTokenInformation(token.get(), TokenUser, nullptr, 0, &required));
    if (required == 0)
    {
        const DWORD lastError = Debug::ErrorWithLastError(L"CloudSync: GetTokenInformation(TokenUser) size query failed");
        return HRESULT_FROM_WIN32(lastError);
    }

    std::unique_ptr<std::byte[]> buffer(new (std::nothrow) std::byte[required]);
    if (! buffer)
    {
        return E_OUTOFMEMORY;
    }

    if (! GetTokenInformation(token.get(), TokenUser, buffer.get(), required, &required))
    {
        const DWORD lastError = Debug::ErrorWithLastError(L"CloudSync: GetTokenInformation(TokenUser) failed");
        return HRESULT_FROM_WIN32(lastError);
    }

    const auto* tokenUser = reinterpret_cast<const TOKEN_USER*>(buffer.get());
    wil::unique_hlocal_string sidText;
    if (! ConvertSidToStringSidW(tokenUser->User.Sid, sidText.put()))
    {
        const DWORD lastError = Debug::ErrorWithLastError(L"CloudSync: ConvertSidToStringSidW failed");
        return HRESULT_FROM_WIN32(lastError);
    }

    try
    {
        out.providerName.assign(providerName);
        out.securityId.assign(sidText.get());
        out.accountName.assign(accountName);
    }
    catch (const std::bad_alloc&)
    {
        out = {};
        return E_OUTOFMEMORY;
    }

    return S_OK;
}

HRESULT SyncRootId::Parse(std::wstring_view text, SyncRootId& out) noexcept
{
    out = {};

    const size_t first = text.find(kIdSeparator);
    if (first == std::wstring_view::npos || first == 0)
    {
        return E_INVALIDARG;
    }

    const size_t second = text.find(kIdSeparator, first + 1u);
    if (second == std::wstring_view::npos || second == first + 1u)
    {
        return E_INVALIDARG;
    }

    try
    {
        out.providerName.assign(text.substr(0, first));
        out.securityId.assign(text.substr(first + 1u, second - first - 1u));
        out.accountName.assign(text.substr(second + 1u));
    }
    catch (const std::bad_alloc&)
    {
        out = {};
        return E_OUTOFMEMORY;
    }

    return S_OK;
}

HRESULT SyncRootRegistration::Validate(const SyncRootId& id, const std::filesystem::path& syncRootPath) const noexcept
{
    if (id.providerName.empty() || id.providerName.find(kIdSeparator) != std::wstring::npos)
    {
        Debug::Error(L"CloudSync: sync root provider name must be non-empty and must not contain '!'");
        return E_INVALIDARG;
    }

    if (id.securityId.empty() || id.securityId.find(kIdSeparator) != std::wstring::npos)
    {
        Debug::Error(L"CloudSync: sync root security id is missing or malformed");
        return E_INVALIDARG;
    }

    if (syncRootPath.empty())
    {
        Debug::Error(L"CloudSync: sync root path is empty");
        return E_INVALIDARG;
    }

    if (version.size() > kMaxProviderVersionLength)
    {
        Debug::Error(L"CloudSync: provider version is {} characters, the limit is {}", version.size(), kMaxProviderVersionLength);
        return E_INVALIDARG;
    }

    if (context.size() > kMaxBlobSize)
    {
        Debug::Error(L"CloudSync: registration context is {} bytes, the limit is {}", context.size(), kMaxBlobSize);
        return E_INVALIDARG;
    }

    if (hydrationModifiers.streamingAllowed && hydrationModifiers.validationRequired)
    {
        Debug::Error(L"CloudSync: streaming hydration cannot be combined with required validation");
        return E_INVALIDARG;
    }

    return S_OK;
}

std::wstring SyncRootRegistration::EffectiveDisplayName(const SyncRootId& id) const
{
    return displayName.empty() ? id.providerName : displayName;
}

std::wstring SyncRootRegistration::EffectiveIconResource() const
{
    if (! iconResource.empty())
    {
        return iconResource;
    }

    return std::format(L"{}\\{},{}", GetSystemDirectoryPath(), kDefaultIconFile, kDefaultIconIndex);
}

HRESULT RegisterSyncRoot(ICloudFilterApi& api, const SyncRootId& id, const std::filesystem::path& syncRootPath, const SyncRootRegistration& registration) noexcept
{
    const HRESULT validateHr = registration.Validate(id, syncRootPath);
    if (FAILED(validateHr))
    {
        return validateHr;
    }

    const HRESULT hr = api.RegisterSyncRoot(id, syncRootPath, registration);
    if (FAILED(hr))
    {
        Debug::Error(L"CloudSync: failed to register sync root '{}' at '{}' (hr=0x{:08X})", id.providerName, syncRootPath.native(), static_cast<unsigned long>(hr));
        return hr;
    }

    Debug::Info(L"CloudSync: registered sync root '{}' at '{}'", id.providerName, syncRootPath.native());
    return S_OK;
}

HRESULT UnregisterSyncRoot(ICloudFilterApi& api, const SyncRootId& id) noexcept
{
    if (id.providerName.empty())
    {
        return E_INVALIDARG;
    }

    const HRESULT hr = api.UnregisterSyncRoot(id);
    if (FAILED(hr))
    {
        Debug::Warning(L"CloudSync: failed to unregister sync root '{}' (hr=0x{:08X})", id.providerName, static_cast<unsigned long>(hr));
    }
    return hr;
}

std::wstring_view HydrationTypeName(HydrationType type) noexcept
{
    return NameOf(kHydrationTypeNames, type);
}

std::wstring_view PopulationTypeName(PopulationType type) noexcept
{
    return NameOf(kPopulationTypeNames, type);
}

std::wstring_view ProtectionModeName(ProtectionMode mode) noexcept
{
    return NameOf(kProtectionModeNames, mode);
}

bool TryParseHydrationType(std::wstring_view text, HydrationType& out) noexcept
{
    return TryParse(kHydrationTypeNames, text, out);
}

bool TryParsePopulationType(std::wstring_view text, PopulationType& out) noexcept
{
    return TryParse(kPopulationTypeNames, text, out);
}

bool TryParseProtectionMode(std::wstring_view text, ProtectionMode& out) noexcept
{
    return TryParse(kProtectionModeNames, text, out);
}
} // namespace CloudSync
