#pragma once

#include <filesystem>
#include <vector>

#include "SyncFilter.h"

// Serves a sync root from a local folder that plays the role of the cloud.
// Placeholders mirror the server folder layout; hydration copies bytes from the matching server file.
class MirrorFilter final : public CloudSync::ISyncFilter
{
public:
    MirrorFilter(std::filesystem::path syncRootPath, std::filesystem::path serverPath) noexcept;

    MirrorFilter(const MirrorFilter&)            = delete;
    MirrorFilter& operator=(const MirrorFilter&) = delete;
    MirrorFilter(MirrorFilter&&)                 = delete;
    MirrorFilter& operator=(MirrorFilter&&)      = delete;

    HRESULT FetchData(const CloudSync::RequestContext& request, CloudSync::FetchDataTicket ticket, const CloudSync::FetchDataInfo& info) override;
    void CancelFetchData(const CloudSync::RequestContext& request, const CloudSync::CancelFetchDataInfo& info) override;
    HRESULT FetchPlaceholders(const CloudSync::RequestContext& request, CloudSync::FetchPlaceholdersTicket ticket, const CloudSync::FetchPlaceholdersInfo& info) override;
    HRESULT Dehydrate(const CloudSync::RequestContext& request, CloudSync::DehydrateTicket ticket, const CloudSync::DehydrateInfo& info) override;
    void Dehydrated(const CloudSync::RequestContext& request, const CloudSync::DehydratedInfo& info) override;
    HRESULT Delete(const CloudSync::RequestContext& request, CloudSync::DeleteTicket ticket, const CloudSync::DeleteInfo& info) override;
    HRESULT Rename(const CloudSync::RequestContext& request, CloudSync::RenameTicket ticket, const CloudSync::RenameInfo& info) override;
    void Renamed(const CloudSync::RequestContext& request, const CloudSync::RenamedInfo& info) override;
    void StateChanged(const std::vector<std::filesystem::path>& changes) override;

private:
    // Maps a path under the sync root to the same relative path under the server folder.
    [[nodiscard]] HRESULT MapToServer(const std::filesystem::path& clientPath, std::filesystem::path& serverPath) const;

    std::filesystem::path _syncRootPath;
    std::filesystem::path _serverPath;
};
