#pragma once

#include "Helpers.h"

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace CloudSync
{
// Times are FILETIME ticks (100ns since 1601-01-01 UTC), as LARGE_INTEGER values in FILE_BASIC_INFO.
struct PlaceholderMetadata
{
    uint64_t size           = 0;
    uint32_t fileAttributes = FILE_ATTRIBUTE_NORMAL;
    int64_t creationTime    = 0;
    int64_t lastAccessTime  = 0;
    int64_t lastWriteTime   = 0;
    int64_t changeTime      = 0;

    [[nodiscard]] bool IsDirectory() const noexcept
    {
        return (fileAttributes & FILE_ATTRIBUTE_DIRECTORY) != 0;
    }
};

struct PlaceholderFlags
{
    // Mark the new placeholder in sync with the cloud.
    bool markInSync = false;
    // Directories only: the provider populated it up front, the OS must not ask for its children.
    bool disableOnDemandPopulation = false;
    // Replace an existing placeholder with the same name.
    bool supersede = false;
    // The placeholder is always hydrated and never dehydrated by the OS.
    bool alwaysFull = false;
};

// Description of one placeholder to create under the directory named by a FetchPlaceholders
// request (or under an explicit base directory when created outside a callback).
struct Placeholder
{
    std::wstring relativeName;
    // Opaque provider bytes stored with the placeholder; at most kMaxFileIdentitySize bytes.
    std::vector<std::byte> identity;
    PlaceholderMetadata metadata;
    PlaceholderFlags flags;
};

// Per-entry outcome of a placeholder batch. result is S_OK or the failure the OS reported for this
// entry; createUsn is the USN of the creation and is only meaningful on success.
struct PlaceholderResult
{
    HRESULT result    = E_PENDING;
    int64_t createUsn = 0;
};

struct TransferPlaceholdersFlags
{
    // The listing is complete: the OS stops sending FetchPlaceholders for the directory.
    bool disableOnDemandPopulation = true;
    // The OS stops creating entries at the first failure; later entries report E_ABORT.
    bool stopOnError = false;
};
} // namespace CloudSync
