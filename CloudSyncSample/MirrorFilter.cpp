#include "MirrorFilter.h"

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <utility>

#pragma warning(push)
// WIL: C4625 (copy ctor deleted), C4626 (copy assign deleted), C5026 (move ctor deleted), C5027 (move assign deleted)
#pragma warning(disable : 4625 4626 5026 5027 28182)
#include <wil/resource.h>
#pragma warning(pop)

#include "CloudError.h"
#include "Helpers.h"
#include "Placeholder.h"

namespace
{
// Multiple of the transfer alignment; one TransferData per chunk.
constexpr uint64_t kChunkBytes = 1024u * 1024u;

[[nodiscard]] constexpr uint64_t AlignDown(uint64_t value) noexcept
{
    return value & ~(CloudSync::kTransferAlignment - 1u);
}

[[nodiscard]] constexpr uint64_t AlignUp(uint64_t value) noexcept
{
    return AlignDown(value + CloudSync::kTransferAlignment - 1u);
}

[[nodiscard]] int64_t FileTimeToInt64(const FILETIME& time) noexcept
{
    return static_cast<int64_t>((static_cast<uint64_t>(time.dwHighDateTime) << 32) | time.dwLowDateTime);
}

[[nodiscard]] bool IsDotEntry(const wchar_t* name) noexcept
{
    return name[0] == L'.' && (name[1] == L'\0' || (name[1] == L'.' && name[2] == L'\0'));
}

[[nodiscard]] CloudSync::Placeholder MakePlaceholder(const WIN32_FIND_DATAW& data, std::wstring_view identityPath)
{
    CloudSync::Placeholder placeholder;
    placeholder.relativeName = data.cFileName;

    const std::span<const std::byte> identity = std::as_bytes(std::span<const wchar_t>(identityPath.data(), identityPath.size()));
    if (identity.size() <= CloudSync::kMaxFileIdentitySize)
    {
        placeholder.identity.assign(identity.begin(), identity.end());
    }

    CloudSync::PlaceholderMetadata& metadata = placeholder.metadata;
    metadata.fileAttributes                  = data.dwFileAttributes & (FILE_ATTRIBUTE_DIRECTORY | FILE_ATTRIBUTE_READONLY | FILE_ATTRIBUTE_HIDDEN);
    if (metadata.fileAttributes == 0)
    {
        metadata.fileAttributes = FILE_ATTRIBUTE_NORMAL;
    }
    metadata.creationTime   = FileTimeToInt64(data.ftCreationTime);
    metadata.lastAccessTime = FileTimeToInt64(data.ftLastAccessTime);
    metadata.lastWriteTime  = FileTimeToInt64(data.ftLastWriteTime);
    metadata.changeTime     = metadata.lastWriteTime;
    metadata.size           = metadata.IsDirectory() ? 0u : ((static_cast<uint64_t>(data.nFileSizeHigh) << 32) | data.nFileSizeLow);

    placeholder.flags.markInSync = true;
    return placeholder;
}
} // namespace

MirrorFilter::MirrorFilter(std::filesystem::path syncRootPath, std::filesystem::path serverPath) noexcept
    : _syncRootPath(std::move(syncRootPath)),
      _serverPath(std::move(serverPath))
{
}

HRESULT MirrorFilter::MapToServer(const std::filesystem::path& clientPath, std::filesystem::path& serverPath) const
{
    const std::wstring& client = clientPath.native();
    const std::wstring& root   = _syncRootPath.native();
    if (client.size() < root.size() ||
        CompareStringOrdinal(client.data(), static_cast<int>(root.size()), root.data(), static_cast<int>(root.size()), TRUE) != CSTR_EQUAL)
    {
        return E_INVALIDARG;
    }

    std::wstring_view relative = std::wstring_view(client).substr(root.size());
    if (! relative.empty() && ! root.empty() && root.back() != L'\\' && relative.front() != L'\\')
    {
        // Prefix matched inside a longer sibling name.
        return E_INVALIDARG;
    }

    while (! relative.empty() && relative.front() == L'\\')
    {
        relative.remove_prefix(1);
    }

    serverPath = relative.empty() ? _serverPath : _serverPath / relative;
    return S_OK;
}

HRESULT MirrorFilter::FetchData(const CloudSync::RequestContext& request, CloudSync::FetchDataTicket ticket, const CloudSync::FetchDataInfo& info)
{
    Debug::Perf::Scope perf(L"Sample.FetchData");
    perf.SetValue0(info.requiredOffset);
    perf.SetValue1(info.requiredLength);

    std::filesystem::path source;
    HRESULT hr = MapToServer(request.path, source);
    if (FAILED(hr))
    {
        Debug::Warning(L"FetchData: '{}' is outside the sync root", request.path.native());
        perf.SetHr(hr);
        return hr;
    }

    wil::unique_hfile file(
        ::CreateFileW(source.c_str(), GENERIC_READ, FILE_SHARE_READ | FILE_SHARE_DELETE, nullptr, OPEN_EXISTING, FILE_FLAG_SEQUENTIAL_SCAN, nullptr));
    if (! file)
    {
        hr = HRESULT_FROM_WIN32(::GetLastError());
        Debug::Error(L"FetchData: cannot open '{}' hr=0x{:08X}", source.native(), static_cast<unsigned long>(hr));
        perf.SetHr(hr);
        return hr;
    }

    const uint64_t fileSize = ticket.FileSize();
    const uint64_t start    = AlignDown(info.requiredOffset);
    const uint64_t end      = (std::min)(fileSize, AlignUp(info.requiredOffset + info.requiredLength));
    const uint64_t total    = end > start ? end - start : 0u;

    std::vector<std::byte> buffer(static_cast<size_t>((std::min)(kChunkBytes, total)));
    for (uint64_t position = start; position < end;)
    {
        const uint64_t length = (std::min)(kChunkBytes, end - position);

        OVERLAPPED overlapped{};
        overlapped.Offset     = static_cast<DWORD>(position & 0xFFFFFFFFu);
        overlapped.OffsetHigh = static_cast<DWORD>(position >> 32);

        DWORD bytesRead = 0;
        if (! ::ReadFile(file.get(), buffer.data(), static_cast<DWORD>(length), &bytesRead, &overlapped))
        {
            hr = HRESULT_FROM_WIN32(::GetLastError());
            Debug::Error(L"FetchData: read of '{}' at {} failed hr=0x{:08X}", source.native(), position, static_cast<unsigned long>(hr));
            perf.SetHr(hr);
            return hr;
        }

        if (bytesRead != length)
        {
            // The server copy shrank since the placeholder was created.
            hr = HRESULT_FROM_WIN32(ERROR_HANDLE_EOF);
            Debug::Error(L"FetchData: '{}' is shorter than its placeholder ({} of {} bytes at {})", source.native(), bytesRead, length, position);
            perf.SetHr(hr);
            return hr;
        }

        hr = ticket.WriteAt(std::span<const std::byte>(buffer.data(), static_cast<size_t>(length)), position);
        if (FAILED(hr))
        {
            Debug::Error(L"FetchData: transfer of {} bytes at {} failed hr=0x{:08X}", length, position, static_cast<unsigned long>(hr));
            perf.SetHr(hr);
            return hr;
        }

        position += length;

        const HRESULT progressHr = ticket.ReportProgress(total, position - start);
        if (FAILED(progressHr))
        {
            Debug::Warning(L"FetchData: progress report failed hr=0x{:08X}", static_cast<unsigned long>(progressHr));
        }
    }

    Debug::Info(L"FetchData: served '{}' [{}, {})", request.path.native(), start, end);
    return S_OK;
}

void MirrorFilter::CancelFetchData(const CloudSync::RequestContext& request, const CloudSync::CancelFetchDataInfo& info)
{
    Debug::Info(L"CancelFetchData: '{}' [{}, +{}) timeout={} user={}", request.path.native(), info.offset, info.length, info.timeout, info.userRequest);
}

HRESULT MirrorFilter::FetchPlaceholders(const CloudSync::RequestContext& request, CloudSync::FetchPlaceholdersTicket ticket, const CloudSync::FetchPlaceholdersInfo& info)
{
    Debug::Perf::Scope perf(L"Sample.FetchPlaceholders");

    std::filesystem::path directory;
    HRESULT hr = MapToServer(request.path, directory);
    if (FAILED(hr))
    {
        perf.SetHr(hr);
        return hr;
    }

    std::filesystem::path relativeDirectory = directory.lexically_relative(_serverPath);
    if (relativeDirectory == L".")
    {
        relativeDirectory.clear();
    }

    const std::filesystem::path searchPath = directory / info.pattern;
    WIN32_FIND_DATAW data{};
    wil::unique_hfind find(::FindFirstFileExW(searchPath.c_str(), FindExInfoBasic, &data, FindExSearchNameMatch, nullptr, FIND_FIRST_EX_LARGE_FETCH));

    std::vector<CloudSync::Placeholder> placeholders;
    if (! find)
    {
        const DWORD lastError = ::GetLastError();
        if (lastError != ERROR_FILE_NOT_FOUND)
        {
            hr = HRESULT_FROM_WIN32(lastError);
            Debug::Error(L"FetchPlaceholders: cannot enumerate '{}' hr=0x{:08X}", searchPath.native(), static_cast<unsigned long>(hr));
            perf.SetHr(hr);
            return hr;
        }
    }
    else
    {
        do
        {
            if (IsDotEntry(data.cFileName))
            {
                continue;
            }

            const std::filesystem::path identityPath = relativeDirectory / data.cFileName;
            placeholders.push_back(MakePlaceholder(data, identityPath.native()));
        } while (::FindNextFileW(find.get(), &data) != 0);

        const DWORD lastError = ::GetLastError();
        if (lastError != ERROR_NO_MORE_FILES)
        {
            hr = HRESULT_FROM_WIN32(lastError);
            Debug::Error(L"FetchPlaceholders: enumeration of '{}' stopped hr=0x{:08X}", searchPath.native(), static_cast<unsigned long>(hr));
            perf.SetHr(hr);
            return hr;
        }
    }

    perf.SetValue0(placeholders.size());

    std::vector<CloudSync::PlaceholderResult> results;
    hr = ticket.PassWithPlaceholders(placeholders, results);
    perf.SetHr(hr);
    if (FAILED(hr))
    {
        Debug::Error(L"FetchPlaceholders: '{}' rejected hr=0x{:08X}", request.path.native(), static_cast<unsigned long>(hr));
        return hr;
    }

    if (hr == S_FALSE)
    {
        for (size_t i = 0; i < results.size() && i < placeholders.size(); ++i)
        {
            if (FAILED(results[i].result))
            {
                Debug::Warning(L"FetchPlaceholders: '{}' not created hr=0x{:08X}", placeholders[i].relativeName, static_cast<unsigned long>(results[i].result));
            }
        }
    }

    Debug::Info(L"FetchPlaceholders: '{}' pattern '{}' -> {} entries", request.path.native(), info.pattern, placeholders.size());
    return S_OK;
}

HRESULT MirrorFilter::Dehydrate(const CloudSync::RequestContext& request, CloudSync::DehydrateTicket ticket, const CloudSync::DehydrateInfo& info)
{
    Debug::Info(L"Dehydrate: '{}' background={}", request.path.native(), info.background);
    return ticket.Pass();
}

void MirrorFilter::Dehydrated(const CloudSync::RequestContext& request, const CloudSync::DehydratedInfo& info)
{
    Debug::Info(L"Dehydrated: '{}' hydrated={}", request.path.native(), info.hydrated);
}

HRESULT MirrorFilter::Delete(const CloudSync::RequestContext& request, CloudSync::DeleteTicket ticket, const CloudSync::DeleteInfo& info)
{
    Debug::Info(L"Delete: '{}' directory={} undelete={}", request.path.native(), info.isDirectory, info.isUndelete);
    return ticket.Pass();
}

HRESULT MirrorFilter::Rename(const CloudSync::RequestContext& request, CloudSync::RenameTicket ticket, const CloudSync::RenameInfo& info)
{
    Debug::Info(L"Rename: '{}' -> '{}' targetInScope={}", request.path.native(), info.target.native(), info.targetInScope);
    return ticket.Pass();
}

void MirrorFilter::Renamed(const CloudSync::RequestContext& request, const CloudSync::RenamedInfo& info)
{
    Debug::Info(L"Renamed: '{}' -> '{}'", info.source.native(), request.path.native());
}

void MirrorFilter::StateChanged(const std::vector<std::filesystem::path>& changes)
{
    for (const std::filesystem::path& path : changes)
    {
        Debug::Info(L"StateChanged: '{}'", path.native());
    }
}
