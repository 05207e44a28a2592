#include "Configuration.h"

#include "CloudSync.Internal.h"

#include <array>
#include <fstream>
#include <new>
#include <optional>

#include <objbase.h>

namespace CloudSync
{
namespace
{
using unique_yyjson_doc     = wil::unique_any<yyjson_doc*, decltype(&yyjson_doc_free), yyjson_doc_free>;
using unique_yyjson_mut_doc = wil::unique_any<yyjson_mut_doc*, decltype(&yyjson_mut_doc_free), yyjson_mut_doc_free>;
using unique_json_text      = wil::unique_any<char*, decltype(&::free), ::free>;

// Accepts "{xxxxxxxx-...}" or the same without braces.
[[nodiscard]] bool TryParseGuid(std::wstring_view text, GUID& out) noexcept
{
    std::array<wchar_t, 39> braced{};
    if (text.size() == 36)
    {
        braced[0] = L'{';
        text.copy(braced.data() + 1, text.size());
        braced[37] = L'}';
    }
    else if (text.size() == 38)
    {
        text.copy(braced.data(), text.size());
    }
    else
    {
        return false;
    }

    return SUCCEEDED(::CLSIDFromString(braced.data(), &out));
}

[[nodiscard]] bool IsNullGuid(const GUID& guid) noexcept
{
    return guid == GUID{};
}

[[nodiscard]] std::string GuidToUtf8(const GUID& guid) noexcept
{
    std::array<wchar_t, 40> buffer{};
    const int length = ::StringFromGUID2(guid, buffer.data(), static_cast<int>(buffer.size()));
    if (length <= 1)
    {
        return {};
    }
    return CloudSyncInternal::Utf8FromUtf16(std::wstring_view(buffer.data(), static_cast<size_t>(length - 1)));
}

template <typename T> void AssignIfPresent(T& target, std::optional<T> value)
{
    if (value)
    {
        target = std::move(*value);
    }
}

[[nodiscard]] HRESULT ParseRegistration(yyjson_val* object, SyncRootRegistration& registration)
{
    using namespace CloudSyncInternal;

    AssignIfPresent(registration.displayName, TryGetJsonString(object, "displayName"));
    AssignIfPresent(registration.iconResource, TryGetJsonString(object, "iconResource"));
    AssignIfPresent(registration.version, TryGetJsonString(object, "version"));
    AssignIfPresent(registration.recycleBinUri, TryGetJsonString(object, "recycleBinUri"));

    if (const auto providerId = TryGetJsonString(object, "providerId"); providerId && ! providerId->empty())
    {
        if (! TryParseGuid(*providerId, registration.providerId))
        {
            Debug::Warning(L"CloudSync: configuration providerId '{}' is not a GUID", *providerId);
            return E_INVALIDARG;
        }
    }

    if (yyjson_val* context = yyjson_obj_get(object, "context"); context && yyjson_is_str(context))
    {
        const auto* bytes = reinterpret_cast<const std::byte*>(yyjson_get_str(context));
        registration.context.assign(bytes, bytes + yyjson_get_len(context));
    }

    if (const auto hydration = TryGetJsonString(object, "hydration"))
    {
        if (! TryParseHydrationType(*hydration, registration.hydration))
        {
            Debug::Warning(L"CloudSync: configuration hydration '{}' is not recognized", *hydration);
            return E_INVALIDARG;
        }
    }

    if (const auto population = TryGetJsonString(object, "population"))
    {
        if (! TryParsePopulationType(*population, registration.population))
        {
            Debug::Warning(L"CloudSync: configuration population '{}' is not recognized", *population);
            return E_INVALIDARG;
        }
    }

    if (const auto protection = TryGetJsonString(object, "protection"))
    {
        if (! TryParseProtectionMode(*protection, registration.protection))
        {
            Debug::Warning(L"CloudSync: configuration protection '{}' is not recognized", *protection);
            return E_INVALIDARG;
        }
    }

    AssignIfPresent(registration.hydrationModifiers.validationRequired, TryGetJsonBool(object, "validationRequired"));
    AssignIfPresent(registration.hydrationModifiers.streamingAllowed, TryGetJsonBool(object, "streamingAllowed"));
    AssignIfPresent(registration.hydrationModifiers.autoDehydrationAllowed, TryGetJsonBool(object, "autoDehydrationAllowed"));
    AssignIfPresent(registration.hydrationModifiers.allowFullRestartHydration, TryGetJsonBool(object, "allowFullRestartHydration"));
    AssignIfPresent(registration.showSiblingsAsGroup, TryGetJsonBool(object, "showSiblingsAsGroup"));
    AssignIfPresent(registration.allowPinning, TryGetJsonBool(object, "allowPinning"));

    if (const auto hardlinks = TryGetJsonBool(object, "allowHardlinks"))
    {
        registration.hardlinks = *hardlinks ? HardlinkPolicy::Allowed : HardlinkPolicy::None;
    }

    if (const auto inSync = TryGetJsonUInt(object, "inSyncAttributes"); inSync && *inSync <= UINT32_MAX)
    {
        registration.inSyncAttributes = static_cast<uint32_t>(*inSync);
    }

    return S_OK;
}

[[nodiscard]] bool AddString(yyjson_mut_doc* doc, yyjson_mut_val* object, const char* key, std::wstring_view value) noexcept
{
    const std::string utf8 = CloudSyncInternal::Utf8FromUtf16(value);
    if (! value.empty() && utf8.empty())
    {
        return false;
    }

    yyjson_mut_val* text = yyjson_mut_strncpy(doc, utf8.data(), utf8.size());
    return text && yyjson_mut_obj_add_val(doc, object, key, text);
}

[[nodiscard]] bool AddRegistration(yyjson_mut_doc* doc, yyjson_mut_val* root, const SyncRootRegistration& registration) noexcept
{
    yyjson_mut_val* object = yyjson_mut_obj(doc);
    if (! object || ! yyjson_mut_obj_add_val(doc, root, "registration", object))
    {
        return false;
    }

    if (! AddString(doc, object, "displayName", registration.displayName) || ! AddString(doc, object, "iconResource", registration.iconResource) ||
        ! AddString(doc, object, "version", registration.version) || ! AddString(doc, object, "recycleBinUri", registration.recycleBinUri))
    {
        return false;
    }

    if (! IsNullGuid(registration.providerId))
    {
        const std::string providerId = GuidToUtf8(registration.providerId);
        yyjson_mut_val* text         = yyjson_mut_strncpy(doc, providerId.data(), providerId.size());
        if (providerId.empty() || ! text || ! yyjson_mut_obj_add_val(doc, object, "providerId", text))
        {
            return false;
        }
    }

    if (! registration.context.empty())
    {
        yyjson_mut_val* text = yyjson_mut_strncpy(doc, reinterpret_cast<const char*>(registration.context.data()), registration.context.size());
        if (! text || ! yyjson_mut_obj_add_val(doc, object, "context", text))
        {
            return false;
        }
    }

    if (! AddString(doc, object, "hydration", HydrationTypeName(registration.hydration)) ||
        ! AddString(doc, object, "population", PopulationTypeName(registration.population)) ||
        ! AddString(doc, object, "protection", ProtectionModeName(registration.protection)))
    {
        return false;
    }

    yyjson_mut_obj_add_bool(doc, object, "validationRequired", registration.hydrationModifiers.validationRequired);
    yyjson_mut_obj_add_bool(doc, object, "streamingAllowed", registration.hydrationModifiers.streamingAllowed);
    yyjson_mut_obj_add_bool(doc, object, "autoDehydrationAllowed", registration.hydrationModifiers.autoDehydrationAllowed);
    yyjson_mut_obj_add_bool(doc, object, "allowFullRestartHydration", registration.hydrationModifiers.allowFullRestartHydration);
    yyjson_mut_obj_add_bool(doc, object, "showSiblingsAsGroup", registration.showSiblingsAsGroup);
    yyjson_mut_obj_add_bool(doc, object, "allowPinning", registration.allowPinning);
    yyjson_mut_obj_add_bool(doc, object, "allowHardlinks", registration.hardlinks == HardlinkPolicy::Allowed);
    return yyjson_mut_obj_add_uint(doc, object, "inSyncAttributes", registration.inSyncAttributes);
}
} // namespace

HRESULT ParseProviderConfiguration(std::string_view json, ProviderConfiguration& out) noexcept
{
    using namespace CloudSyncInternal;

    try
    {
        // yyjson_read_opts takes a mutable buffer.
        std::string buffer(json);

        yyjson_read_err err{};
        unique_yyjson_doc doc(yyjson_read_opts(buffer.data(), buffer.size(), YYJSON_READ_JSON5 | YYJSON_READ_ALLOW_BOM, nullptr, &err));
        if (! doc)
        {
            Debug::Warning(L"CloudSync: configuration is not valid JSON at {}: {}", err.pos, Utf16FromUtf8(err.msg ? err.msg : ""));
            return HRESULT_FROM_WIN32(ERROR_INVALID_DATA);
        }

        yyjson_val* root = yyjson_doc_get_root(doc.get());
        if (! root || ! yyjson_is_obj(root))
        {
            Debug::Warning(L"CloudSync: configuration root is not an object");
            return HRESULT_FROM_WIN32(ERROR_INVALID_DATA);
        }

        ProviderConfiguration configuration;
        AssignIfPresent(configuration.providerName, TryGetJsonString(root, "providerName"));
        AssignIfPresent(configuration.accountName, TryGetJsonString(root, "accountName"));
        AssignIfPresent(configuration.watchStateChanges, TryGetJsonBool(root, "watchStateChanges"));

        if (const auto syncRootPath = TryGetJsonString(root, "syncRootPath"))
        {
            configuration.syncRootPath = *syncRootPath;
        }
        if (const auto serverPath = TryGetJsonString(root, "serverPath"))
        {
            configuration.serverPath = *serverPath;
        }

        if (yyjson_val* registration = yyjson_obj_get(root, "registration"); registration && yyjson_is_obj(registration))
        {
            const HRESULT hr = ParseRegistration(registration, configuration.registration);
            if (FAILED(hr))
            {
                return hr;
            }
        }

        out = std::move(configuration);
        return S_OK;
    }
    catch (const std::bad_alloc&)
    {
        return E_OUTOFMEMORY;
    }
}

HRESULT SerializeProviderConfiguration(const ProviderConfiguration& configuration, std::string& outJson) noexcept
{
    outJson.clear();

    unique_yyjson_mut_doc doc(yyjson_mut_doc_new(nullptr));
    if (! doc)
    {
        return E_OUTOFMEMORY;
    }

    yyjson_mut_val* root = yyjson_mut_obj(doc.get());
    if (! root)
    {
        return E_OUTOFMEMORY;
    }
    yyjson_mut_doc_set_root(doc.get(), root);

    if (! AddString(doc.get(), root, "providerName", configuration.providerName) || ! AddString(doc.get(), root, "accountName", configuration.accountName) ||
        ! AddString(doc.get(), root, "syncRootPath", configuration.syncRootPath.native()) ||
        ! AddString(doc.get(), root, "serverPath", configuration.serverPath.native()) ||
        ! yyjson_mut_obj_add_bool(doc.get(), root, "watchStateChanges", configuration.watchStateChanges) ||
        ! AddRegistration(doc.get(), root, configuration.registration))
    {
        return E_OUTOFMEMORY;
    }

    size_t length = 0;
    yyjson_write_err err{};
    unique_json_text text(yyjson_mut_write_opts(doc.get(), YYJSON_WRITE_PRETTY, nullptr, &length, &err));
    if (! text || length == 0)
    {
        Debug::Error(L"CloudSync: failed to write configuration JSON (code={})", static_cast<unsigned int>(err.code));
        return E_FAIL;
    }

    try
    {
        outJson.assign(text.get(), length);
    }
    catch (const std::bad_alloc&)
    {
        return E_OUTOFMEMORY;
    }
    return S_OK;
}

HRESULT LoadProviderConfiguration(const std::filesystem::path& file, ProviderConfiguration& out) noexcept
{
    try
    {
        std::ifstream stream(file, std::ios::binary);
        if (! stream)
        {
            Debug::Error(L"CloudSync: cannot open configuration '{}'", file.native());
            return HRESULT_FROM_WIN32(ERROR_FILE_NOT_FOUND);
        }

        stream.seekg(0, std::ios::end);
        const std::streamoff end = stream.tellg();
        if (end < 0)
        {
            return HRESULT_FROM_WIN32(ERROR_READ_FAULT);
        }

        std::string json(static_cast<size_t>(end), '\0');
        stream.seekg(0, std::ios::beg);
        if (end > 0 && ! stream.read(json.data(), static_cast<std::streamsize>(end)))
        {
            Debug::Error(L"CloudSync: failed to read configuration '{}'", file.native());
            return HRESULT_FROM_WIN32(ERROR_READ_FAULT);
        }

        return ParseProviderConfiguration(json, out);
    }
    catch (const std::bad_alloc&)
    {
        return E_OUTOFMEMORY;
    }
}
} // namespace CloudSync
