#include "DirectoryChanges.SelfTest.h"

#include <algorithm>
#include <chrono>
#include <cstddef>
#include <cstring>
#include <filesystem>
#include <mutex>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#pragma warning(push)
// WIL: C4625 (copy ctor deleted), C4626 (copy assign deleted), C5026 (move ctor deleted), C5027 (move assign deleted)
#pragma warning(disable : 4625 4626 5026 5027 28182)
#include <wil/resource.h>
#pragma warning(pop)

#include "CallbackTranslation.h"
#include "DirectoryChangeWatcher.h"
#include "Helpers.h"
#include "SelfTestCommon.h"

namespace
{
using SelfTest::CaseState;
using SelfTest::HrText;

constexpr std::chrono::milliseconds kWatchTimeout{5'000};

struct NotifyEntry
{
    DWORD action = FILE_ACTION_MODIFIED;
    std::wstring_view name;
};

// Lays out a FILE_NOTIFY_INFORMATION chain the way ReadDirectoryChangesW does: DWORD-aligned
// records linked by NextEntryOffset, the last one with offset 0.
[[nodiscard]] std::vector<std::byte> BuildNotifyBuffer(std::span<const NotifyEntry> entries)
{
    constexpr size_t kHeaderSize = offsetof(FILE_NOTIFY_INFORMATION, FileName);

    std::vector<std::byte> buffer;
    for (size_t i = 0; i < entries.size(); ++i)
    {
        const size_t nameBytes  = entries[i].name.size() * sizeof(wchar_t);
        const size_t recordSize = (kHeaderSize + nameBytes + sizeof(DWORD) - 1u) & ~(sizeof(DWORD) - 1u);
        const bool last         = i + 1u == entries.size();

        FILE_NOTIFY_INFORMATION header{};
        header.NextEntryOffset = last ? 0u : static_cast<DWORD>(recordSize);
        header.Action          = entries[i].action;
        header.FileNameLength  = static_cast<DWORD>(nameBytes);

        const size_t start = buffer.size();
        buffer.resize(start + recordSize);
        std::memcpy(buffer.data() + start, &header, kHeaderSize);
        std::memcpy(buffer.data() + start + kHeaderSize, entries[i].name.data(), nameBytes);
    }
    return buffer;
}

[[nodiscard]] bool Contains(const std::vector<std::filesystem::path>& paths, const std::filesystem::path& path)
{
    return std::find(paths.begin(), paths.end(), path) != paths.end();
}

// Collects watcher batches and signals each arrival.
struct BatchCollector
{
    std::mutex mutex;
    std::vector<std::filesystem::path> seen;
    wil::unique_event arrived;

    BatchCollector()
    {
        arrived.create(wil::EventOptions::None);
    }

    void Add(std::vector<std::filesystem::path> changes)
    {
        {
            std::lock_guard lock(mutex);
            seen.insert(seen.end(), changes.begin(), changes.end());
        }
        arrived.SetEvent();
    }

    [[nodiscard]] bool WaitFor(const std::filesystem::path& path, std::chrono::milliseconds timeout)
    {
        const auto deadline = std::chrono::steady_clock::now() + timeout;
        for (;;)
        {
            {
                std::lock_guard lock(mutex);
                if (Contains(seen, path))
                {
                    return true;
                }
            }

            const auto now = std::chrono::steady_clock::now();
            if (now >= deadline)
            {
                return false;
            }

            const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
            static_cast<void>(arrived.wait(static_cast<DWORD>(remaining.count())));
        }
    }
};
} // namespace

bool DirectoryChangesSelfTest::Run(const SelfTest::SelfTestOptions& options, SelfTest::SelfTestSuiteResult* outResult) noexcept
{
    const auto startedAt = std::chrono::steady_clock::now();
    Debug::Info(L"DirectoryChangesSelfTest: begin");

    SelfTest::SelfTestSuiteResult result{};
    result.suite = SelfTest::SelfTestSuite::DirectoryChanges;

    SelfTest::RunCase(options,
                      result,
                      L"parse notification chain",
                      [](CaseState& state)
                      {
                          const std::filesystem::path root(L"C:\\SyncRoot");
                          const NotifyEntry entries[] = {
                              {FILE_ACTION_MODIFIED, L"docs\\a.txt"},
                              {FILE_ACTION_REMOVED, L"gone.txt"},
                              {FILE_ACTION_RENAMED_OLD_NAME, L"old.txt"},
                              {FILE_ACTION_RENAMED_NEW_NAME, L"new.txt"},
                              {FILE_ACTION_MODIFIED, L"docs\\a.txt"},
                              {FILE_ACTION_ADDED, L"b"},
                          };
                          const std::vector<std::byte> buffer = BuildNotifyBuffer(entries);

                          std::vector<std::filesystem::path> changes;
                          state.Require(CloudSync::ParseNotifyBuffer(root, buffer, changes), L"well-formed chain should parse");
                          state.Require(changes.size() == 3, std::format(L"expected 3 distinct surviving paths, got {}", changes.size()));
                          state.Require(Contains(changes, root / L"docs\\a.txt"), L"modified path missing");
                          state.Require(Contains(changes, root / L"new.txt"), L"rename target missing");
                          state.Require(Contains(changes, root / L"b"), L"added path missing");
                          state.Require(! Contains(changes, root / L"gone.txt") && ! Contains(changes, root / L"old.txt"), L"removed paths must be skipped");
                          return true;
                      });

    SelfTest::RunCase(options,
                      result,
                      L"parse rejects malformed chains",
                      [](CaseState& state)
                      {
                          const std::filesystem::path root(L"C:\\SyncRoot");
                          std::vector<std::filesystem::path> changes;

                          state.Require(! CloudSync::ParseNotifyBuffer(root, {}, changes) && changes.empty(), L"empty buffer should be rejected");

                          const NotifyEntry entries[] = {
                              {FILE_ACTION_MODIFIED, L"first.txt"},
                              {FILE_ACTION_MODIFIED, L"second-with-a-long-name.txt"},
                          };
                          std::vector<std::byte> truncated = BuildNotifyBuffer(entries);
                          truncated.resize(truncated.size() - 8u);
                          state.Require(! CloudSync::ParseNotifyBuffer(root, truncated, changes), L"truncated chain should be rejected");
                          state.Require(changes.size() == 1 && changes[0] == root / L"first.txt", L"entries before the fault should be kept");

                          std::vector<std::byte> misaligned = BuildNotifyBuffer(entries);
                          const DWORD badOffset             = 6;
                          std::memcpy(misaligned.data(), &badOffset, sizeof(badOffset));
                          changes.clear();
                          state.Require(! CloudSync::ParseNotifyBuffer(root, misaligned, changes), L"misaligned NextEntryOffset should be rejected");

                          std::vector<std::byte> pastEnd = BuildNotifyBuffer(entries);
                          const DWORD hugeOffset         = 0x10000;
                          std::memcpy(pastEnd.data(), &hugeOffset, sizeof(hugeOffset));
                          changes.clear();
                          state.Require(! CloudSync::ParseNotifyBuffer(root, pastEnd, changes), L"NextEntryOffset past the buffer should be rejected");
                          return true;
                      });

    SelfTest::RunCase(options,
                      result,
                      L"translate request metadata",
                      [](CaseState& state)
                      {
                          CF_PROCESS_INFO process{};
                          process.StructSize  = static_cast<DWORD>(offsetof(CF_PROCESS_INFO, CommandLine));
                          process.ProcessId   = 4242;
                          process.ImagePath   = L"C:\\Windows\\explorer.exe";
                          process.CommandLine = L"must not be read";

                          const std::byte identity[] = {std::byte{1}, std::byte{2}, std::byte{3}};

                          CF_CALLBACK_INFO info{};
                          info.StructSize             = sizeof(info);
                          info.ConnectionKey.Internal = 77;
                          info.TransferKey.QuadPart   = 88;
                          info.RequestKey             = 99;
                          info.VolumeDosName          = L"C:";
                          info.NormalizedPath         = L"\\SyncRoot\\docs\\report.docx";
                          info.FileSize.QuadPart      = 123456;
                          info.FileIdentity           = identity;
                          info.FileIdentityLength     = sizeof(identity);
                          info.ProcessInfo            = &process;

                          const CloudSync::RequestContext request = CloudSync::TranslateRequest(info);
                          state.Require(request.keys.connection.value == 77 && request.keys.transfer.value == 88 && request.keys.requestKey == 99,
                                        L"correlation keys mismatch");
                          state.Require(request.path == std::filesystem::path(L"C:\\SyncRoot\\docs\\report.docx"), std::format(L"unexpected path '{}'", request.path.native()));
                          state.Require(request.fileSize == 123456u, L"file size mismatch");
                          state.Require(request.fileIdentity.size() == 3 && request.fileIdentity[2] == std::byte{3}, L"file identity mismatch");
                          if (state.Require(request.process.has_value(), L"process info should be present"))
                          {
                              state.Require(request.process->processId == 4242 && request.process->imagePath == L"C:\\Windows\\explorer.exe", L"process fields mismatch");
                              state.Require(request.process->commandLine.empty(), L"fields past StructSize must not be read");
                          }

                          info.ProcessInfo = nullptr;
                          state.Require(! CloudSync::TranslateRequest(info).process.has_value(), L"missing process info should stay empty");
                          return true;
                      });

    SelfTest::RunCase(options,
                      result,
                      L"translate callback parameters",
                      [](CaseState& state)
                      {
                          CF_CALLBACK_INFO info{};
                          info.VolumeDosName  = L"D:";
                          info.NormalizedPath = L"\\Root\\a.txt";

                          CF_CALLBACK_PARAMETERS parameters{};
                          parameters.FetchPlaceholders.Pattern = nullptr;
                          state.Require(CloudSync::TranslateFetchPlaceholders(parameters).pattern == L"*", L"null pattern should become '*'");

                          parameters                           = {};
                          parameters.FetchData.RequiredFileOffset.QuadPart = 4096;
                          parameters.FetchData.RequiredLength.QuadPart     = 8192;
                          parameters.FetchData.Flags                       = CF_CALLBACK_FETCH_DATA_FLAG_EXPLICIT_HYDRATION;
                          const CloudSync::FetchDataInfo fetch             = CloudSync::TranslateFetchData(parameters);
                          state.Require(fetch.requiredOffset == 4096 && fetch.requiredLength == 8192 && fetch.explicitHydration && ! fetch.recovery,
                                        L"fetch data parameters mismatch");

                          parameters                                 = {};
                          parameters.DehydrateCompletion.Flags       = CF_CALLBACK_DEHYDRATE_COMPLETION_FLAG_DEHYDRATED;
                          parameters.DehydrateCompletion.Reason      = CF_CALLBACK_DEHYDRATION_REASON_SYSTEM_LOW_SPACE;
                          const CloudSync::DehydratedInfo dehydrated = CloudSync::TranslateDehydrated(parameters);
                          state.Require(! dehydrated.hydrated && dehydrated.reason == CloudSync::DehydrationReason::SystemLowSpace, L"dehydrated completion mismatch");

                          parameters.DehydrateCompletion.Flags = CF_CALLBACK_DEHYDRATE_COMPLETION_FLAG_NONE;
                          state.Require(CloudSync::TranslateDehydrated(parameters).hydrated, L"completion without the dehydrated flag means the file stayed hydrated");

                          parameters                   = {};
                          parameters.Rename.Flags      = CF_CALLBACK_RENAME_FLAG_TARGET_IN_SCOPE;
                          parameters.Rename.TargetPath = L"\\Root\\b.txt";
                          const CloudSync::RenameInfo rename = CloudSync::TranslateRename(info, parameters);
                          state.Require(rename.target == std::filesystem::path(L"D:\\Root\\b.txt"), L"rename target should carry the volume");
                          state.Require(rename.targetInScope && ! rename.sourceInScope && ! rename.isDirectory, L"rename flags mismatch");

                          parameters                             = {};
                          parameters.RenameCompletion.SourcePath = L"\\Root\\old.txt";
                          state.Require(CloudSync::TranslateRenamed(info, parameters).source == std::filesystem::path(L"D:\\Root\\old.txt"), L"renamed source mismatch");

                          parameters              = {};
                          parameters.Delete.Flags = CF_CALLBACK_DELETE_FLAG_IS_DIRECTORY;
                          const CloudSync::DeleteInfo del = CloudSync::TranslateDelete(parameters);
                          state.Require(del.isDirectory && ! del.isUndelete, L"delete flags mismatch");
                          return true;
                      });

    SelfTest::RunCase(options,
                      result,
                      L"watcher reports attribute changes",
                      [](CaseState& state)
                      {
                          const std::filesystem::path tempRoot = SelfTest::GetTempRoot(SelfTest::SelfTestSuite::DirectoryChanges);
                          const std::filesystem::path root     = tempRoot / L"watch";
                          if (! state.Require(! tempRoot.empty() && SelfTest::EnsureDirectory(root), L"watch root not available"))
                          {
                              return false;
                          }

                          const std::filesystem::path file = root / L"pinned.txt";
                          if (! state.Require(SelfTest::WriteTextFile(file, "content"), L"failed to create watched file"))
                          {
                              return false;
                          }

                          BatchCollector collector;
                          CloudSync::DirectoryChangeWatcher watcher(root, [&collector](std::vector<std::filesystem::path> changes) { collector.Add(std::move(changes)); });

                          const HRESULT startHr = watcher.Start();
                          if (! state.Require(SUCCEEDED(startHr), std::format(L"Start failed: {}", HrText(startHr))))
                          {
                              return false;
                          }
                          state.Require(watcher.IsRunning(), L"watcher should be running");

                          state.Require(::SetFileAttributesW(file.c_str(), FILE_ATTRIBUTE_HIDDEN) != 0, L"SetFileAttributesW failed");
                          state.Require(collector.WaitFor(file, SelfTest::Scale(kWatchTimeout)), L"attribute change was not reported");

                          watcher.Stop();
                          watcher.Stop();
                          state.Require(! watcher.IsRunning(), L"watcher should be stopped");

                          static_cast<void>(::SetFileAttributesW(file.c_str(), FILE_ATTRIBUTE_NORMAL));
                          return true;
                      });

    SelfTest::RunCase(options,
                      result,
                      L"watcher start on a missing folder",
                      [](CaseState& state)
                      {
                          const std::filesystem::path root = SelfTest::GetTempRoot(SelfTest::SelfTestSuite::DirectoryChanges) / L"does-not-exist";
                          CloudSync::DirectoryChangeWatcher watcher(root, [](std::vector<std::filesystem::path>) {});
                          const HRESULT hr = watcher.Start();
                          state.Require(FAILED(hr), L"Start on a missing folder should fail");
                          state.Require(! watcher.IsRunning(), L"failed watcher must not be running");

                          CloudSync::DirectoryChangeWatcher noCallback(root, {});
                          state.Require(noCallback.Start() == E_INVALIDARG, L"watcher without a callback should be rejected");
                          return true;
                      });

    return SelfTest::FinishSuite(result, startedAt, outResult);
}
