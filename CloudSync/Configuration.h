#pragma once

#include "Helpers.h"
#include "Registration.h"

#include <filesystem>
#include <string>
#include <string_view>

namespace CloudSync
{
// Everything a provider process needs to register and connect one sync root.
struct ProviderConfiguration
{
    std::wstring providerName;
    std::wstring accountName;
    std::filesystem::path syncRootPath;
    // Folder the sample provider mirrors into the sync root.
    std::filesystem::path serverPath;
    SyncRootRegistration registration;
    bool watchStateChanges = true;
};

// Parses a JSON (JSON5 tolerated) configuration document.
// Notes:
// - Missing or wrong-typed keys keep their defaults; unknown keys are ignored.
// - An unparsable document or a non-object root fails with HRESULT_FROM_WIN32(ERROR_INVALID_DATA).
// - Unknown enum names or a malformed providerId fail with E_INVALIDARG.
// - The "registration.context" string is stored as its UTF-8 bytes.
[[nodiscard]] HRESULT ParseProviderConfiguration(std::string_view json, ProviderConfiguration& out) noexcept;

// Writes the configuration back as pretty-printed UTF-8 JSON.
[[nodiscard]] HRESULT SerializeProviderConfiguration(const ProviderConfiguration& configuration, std::string& outJson) noexcept;

[[nodiscard]] HRESULT LoadProviderConfiguration(const std::filesystem::path& file, ProviderConfiguration& out) noexcept;
} // namespace CloudSync
