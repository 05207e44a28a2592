#pragma once

#include "Helpers.h"

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace CloudSync
{
struct ICloudFilterApi;

// Sync root identifier in the "provider!SID!account" form the shell expects.
struct SyncRootId
{
    std::wstring providerName;
    std::wstring securityId;
    std::wstring accountName;

    [[nodiscard]] std::wstring ToString() const;

    // Builds an id for the user owning the current process token.
    [[nodiscard]] static HRESULT ForCurrentUser(std::wstring_view providerName, std::wstring_view accountName, SyncRootId& out) noexcept;

    // Splits "provider!SID!account"; the account part may itself contain '!'.
    [[nodiscard]] static HRESULT Parse(std::wstring_view text, SyncRootId& out) noexcept;

    friend bool operator==(const SyncRootId&, const SyncRootId&) = default;
};

enum class HydrationType : uint8_t
{
    // Only the requested ranges are hydrated; the file stays partially populated.
    Partial,
    // The whole file is hydrated in the background once the first range arrives.
    Progressive,
    // The whole file is hydrated before the first read completes.
    Full,
    // Like Full, and the OS never dehydrates the file on its own.
    AlwaysFull,
};

struct HydrationPolicyModifiers
{
    // Every transferred range is confirmed through ValidateData before the OS uses it.
    bool validationRequired = false;
    // Ranges may be consumed before the whole file is hydrated. Cannot be combined with validationRequired.
    bool streamingAllowed = false;
    bool autoDehydrationAllowed = false;
    bool allowFullRestartHydration = false;
};

enum class PopulationType : uint8_t
{
    // Directory contents are requested on first enumeration through FetchPlaceholders.
    Full,
    // The provider keeps directories populated; FetchPlaceholders is never sent.
    AlwaysFull,
};

enum class ProtectionMode : uint8_t
{
    Unknown,
    Personal,
};

enum class HardlinkPolicy : uint8_t
{
    None,
    Allowed,
};

// Attribute changes that do not clear the in-sync state of a placeholder.
// Values follow StorageProviderInSyncPolicy.
enum InSyncAttributes : uint32_t
{
    IN_SYNC_DEFAULT                       = 0x00000000,
    IN_SYNC_FILE_CREATION_TIME            = 0x00000001,
    IN_SYNC_FILE_READONLY_ATTRIBUTE       = 0x00000002,
    IN_SYNC_FILE_HIDDEN_ATTRIBUTE         = 0x00000004,
    IN_SYNC_FILE_SYSTEM_ATTRIBUTE         = 0x00000008,
    IN_SYNC_DIRECTORY_CREATION_TIME       = 0x00000010,
    IN_SYNC_DIRECTORY_READONLY_ATTRIBUTE  = 0x00000020,
    IN_SYNC_DIRECTORY_HIDDEN_ATTRIBUTE    = 0x00000040,
    IN_SYNC_DIRECTORY_SYSTEM_ATTRIBUTE    = 0x00000080,
    IN_SYNC_FILE_LAST_WRITE_TIME          = 0x00000100,
    IN_SYNC_DIRECTORY_LAST_WRITE_TIME     = 0x00000200,
    IN_SYNC_PRESERVE_INSYNC_FOR_SYNC_ENGINE = 0x80000000,
};

// Largest provider version string the OS stores (CF_MAX_PROVIDER_VERSION_LENGTH).
inline constexpr size_t kMaxProviderVersionLength = 255u;

// Static policy bundle deciding which callbacks the OS will deliver for a sync root.
struct SyncRootRegistration
{
    // Shown in Explorer's navigation pane; defaults to the provider name when empty.
    std::wstring displayName;
    // "path,index" icon resource; defaults to the cloud icon in imageres.dll when empty.
    std::wstring iconResource;
    std::wstring version;
    std::wstring recycleBinUri;
    GUID providerId{};
    // Opaque provider context stored with the registration.
    std::vector<std::byte> context;

    HydrationType hydration = HydrationType::Progressive;
    HydrationPolicyModifiers hydrationModifiers;
    PopulationType population  = PopulationType::Full;
    ProtectionMode protection  = ProtectionMode::Unknown;
    HardlinkPolicy hardlinks   = HardlinkPolicy::None;
    uint32_t inSyncAttributes  = IN_SYNC_DEFAULT;
    bool showSiblingsAsGroup   = false;
    bool allowPinning          = false;

    // Checks the bundle against the limits the OS enforces; nothing is sent to the OS.
    [[nodiscard]] HRESULT Validate(const SyncRootId& id, const std::filesystem::path& syncRootPath) const noexcept;

    [[nodiscard]] std::wstring EffectiveDisplayName(const SyncRootId& id) const;
    [[nodiscard]] std::wstring EffectiveIconResource() const;
};

// Validates the bundle, then registers it with the OS. Invalid bundles never reach the OS.
[[nodiscard]] HRESULT RegisterSyncRoot(ICloudFilterApi& api, const SyncRootId& id, const std::filesystem::path& syncRootPath, const SyncRootRegistration& registration) noexcept;
[[nodiscard]] HRESULT UnregisterSyncRoot(ICloudFilterApi& api, const SyncRootId& id) noexcept;

[[nodiscard]] std::wstring_view HydrationTypeName(HydrationType type) noexcept;
[[nodiscard]] std::wstring_view PopulationTypeName(PopulationType type) noexcept;
[[nodiscard]] std::wstring_view ProtectionModeName(ProtectionMode mode) noexcept;
[[nodiscard]] bool TryParseHydrationType(std::wstring_view text, HydrationType& out) noexcept;
[[nodiscard]] bool TryParsePopulationType(std::wstring_view text, PopulationType& out) noexcept;
[[nodiscard]] bool TryParseProtectionMode(std::wstring_view text, ProtectionMode& out) noexcept;
} // namespace CloudSync
