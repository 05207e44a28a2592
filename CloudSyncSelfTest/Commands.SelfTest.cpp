#include "Commands.SelfTest.h"

#include <array>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <vector>

#include "CloudError.h"
#include "Commands.h"
#include "Helpers.h"
#include "MockCloudFilterApi.h"
#include "SelfTestCommon.h"

namespace
{
using SelfTest::CaseState;
using SelfTest::HrText;
using SelfTest::MockCloudFilterApi;

[[nodiscard]] CloudSync::Placeholder MakePlaceholder(std::wstring name, size_t identitySize = 16)
{
    CloudSync::Placeholder placeholder;
    placeholder.relativeName = std::move(name);
    placeholder.identity     = SelfTest::MakePattern(identitySize);
    placeholder.metadata.size = 1234;
    return placeholder;
}
} // namespace

bool CommandsSelfTest::Run(const SelfTest::SelfTestOptions& options, SelfTest::SelfTestSuiteResult* outResult) noexcept
{
    const auto startedAt = std::chrono::steady_clock::now();
    Debug::Info(L"CommandsSelfTest: begin");

    SelfTest::SelfTestSuiteResult result{};
    result.suite = SelfTest::SelfTestSuite::Commands;

    SelfTest::RunCase(options,
                      result,
                      L"transfer alignment",
                      [](CaseState& state)
                      {
                          constexpr uint64_t kSize = 3 * CloudSync::kTransferAlignment + 100;
                          state.Require(CloudSync::IsTransferAligned(0, CloudSync::kTransferAlignment, kSize), L"aligned chunk at 0 should pass");
                          state.Require(CloudSync::IsTransferAligned(CloudSync::kTransferAlignment, 2 * CloudSync::kTransferAlignment, kSize),
                                        L"aligned two-block chunk should pass");
                          state.Require(CloudSync::IsTransferAligned(3 * CloudSync::kTransferAlignment, 100, kSize), L"unaligned tail ending at EOF should pass");
                          state.Require(! CloudSync::IsTransferAligned(3 * CloudSync::kTransferAlignment, 99, kSize), L"unaligned tail short of EOF should fail");
                          state.Require(! CloudSync::IsTransferAligned(512, CloudSync::kTransferAlignment, kSize), L"unaligned start should fail");
                          state.Require(! CloudSync::IsTransferAligned(0, 100, kSize), L"short unaligned head should fail");
                          return true;
                      });

    SelfTest::RunCase(options,
                      result,
                      L"write validation",
                      [](CaseState& state)
                      {
                          const std::vector<std::byte> block = SelfTest::MakePattern(CloudSync::kTransferAlignment);
                          const std::vector<std::byte> tail  = SelfTest::MakePattern(100);

                          CloudSync::WriteCommand ok{};
                          ok.buffer   = block;
                          ok.position = 0;
                          ok.fileSize = CloudSync::kTransferAlignment + 100;
                          state.Require(ok.Validate() == S_OK, L"aligned first block should validate");

                          CloudSync::WriteCommand eof{};
                          eof.buffer   = tail;
                          eof.position = CloudSync::kTransferAlignment;
                          eof.fileSize = CloudSync::kTransferAlignment + 100;
                          state.Require(eof.Validate() == S_OK, L"tail ending at EOF should validate");

                          CloudSync::WriteCommand pastEnd = eof;
                          pastEnd.fileSize                = CloudSync::kTransferAlignment + 50;
                          state.Require(pastEnd.Validate() == E_INVALIDARG, L"write past file size should be rejected");

                          CloudSync::WriteCommand empty{};
                          empty.fileSize = 10;
                          state.Require(empty.Validate() == E_INVALIDARG, L"empty buffer should be rejected");

                          CloudSync::WriteCommand denial = ok;
                          denial.completionStatus        = STATUS_CLOUD_FILE_UNSUCCESSFUL;
                          state.Require(denial.Validate() == E_INVALIDARG, L"write with a denial status should be rejected");

                          CloudSync::WriteCommand overflow{};
                          overflow.buffer   = block;
                          overflow.position = static_cast<uint64_t>(std::numeric_limits<int64_t>::max()) - 4095u;
                          overflow.fileSize = std::numeric_limits<uint64_t>::max();
                          state.Require(overflow.Validate() == E_INVALIDARG, L"range beyond the signed offset limit should be rejected");
                          return true;
                      });

    SelfTest::RunCase(options,
                      result,
                      L"write execute",
                      [](CaseState& state)
                      {
                          MockCloudFilterApi api;
                          const auto keys = SelfTest::MakeKeys(1);
                          const std::vector<std::byte> tail = SelfTest::MakePattern(100, 7);

                          CloudSync::WriteCommand misaligned{};
                          misaligned.buffer   = tail;
                          misaligned.position = 0;
                          misaligned.fileSize = 200;
                          state.Require(misaligned.Execute(api, keys) == E_INVALIDARG, L"misaligned write should fail before the OS call");
                          state.Require(api.Count(MockCloudFilterApi::Call::TransferData) == 0, L"rejected write must not reach the OS");

                          CloudSync::WriteCommand write{};
                          write.buffer   = tail;
                          write.position = 0;
                          write.fileSize = 100;
                          const HRESULT hr = write.Execute(api, keys);
                          state.Require(hr == S_OK, std::format(L"whole small file write failed: {}", HrText(hr)));

                          const auto records = api.Records(keys);
                          if (state.Require(records.size() == 1, L"expected exactly one TransferData record"))
                          {
                              state.Require(records[0].offset == 0 && records[0].length == 100, L"recorded range mismatch");
                              state.Require(records[0].payload == tail, L"recorded payload mismatch");
                              state.Require(records[0].completionStatus == STATUS_SUCCESS, L"write should be sent with STATUS_SUCCESS");
                          }

                          api.FailNext(MockCloudFilterApi::Call::TransferData, HRESULT_FROM_WIN32(ERROR_CLOUD_FILE_INVALID_REQUEST));
                          state.Require(write.Execute(api, keys) == HRESULT_FROM_WIN32(ERROR_CLOUD_FILE_INVALID_REQUEST), L"OS failure should be returned as is");
                          return true;
                      });

    SelfTest::RunCase(options,
                      result,
                      L"fail transfer requires a denial",
                      [](CaseState& state)
                      {
                          MockCloudFilterApi api;
                          const auto keys = SelfTest::MakeKeys(2);

                          CloudSync::FailTransferCommand approve{};
                          approve.offset           = 0;
                          approve.length           = 4096;
                          approve.completionStatus = STATUS_SUCCESS;
                          state.Require(approve.Execute(api, keys) == E_INVALIDARG, L"FailTransfer with STATUS_SUCCESS should be rejected");

                          CloudSync::FailTransferCommand deny{};
                          deny.offset           = 8192;
                          deny.length           = 100;
                          deny.completionStatus = STATUS_CLOUD_FILE_NETWORK_UNAVAILABLE;
                          state.Require(deny.Execute(api, keys) == S_OK, L"denial should be sent");

                          const auto records = api.Records(keys);
                          if (state.Require(records.size() == 1, L"expected one TransferData denial"))
                          {
                              state.Require(records[0].payload.empty(), L"denial must carry no data");
                              state.Require(records[0].offset == 8192 && records[0].length == 100, L"denial must cover the requested range");
                              state.Require(records[0].completionStatus == STATUS_CLOUD_FILE_NETWORK_UNAVAILABLE, L"denial status mismatch");
                          }
                          return true;
                      });

    SelfTest::RunCase(options,
                      result,
                      L"validate and read commands",
                      [](CaseState& state)
                      {
                          CloudSync::ValidateCommand empty{};
                          empty.offset = 0;
                          empty.length = 0;
                          state.Require(empty.Validate() == E_INVALIDARG, L"approval of an empty range should be rejected");

                          CloudSync::ValidateCommand emptyDenial = empty;
                          emptyDenial.completionStatus           = STATUS_CLOUD_FILE_VALIDATION_FAILED;
                          state.Require(emptyDenial.Validate() == S_OK, L"denial of an empty range is allowed");

                          MockCloudFilterApi api;
                          api.SetFileContent(SelfTest::MakePattern(300, 3));
                          const auto keys = SelfTest::MakeKeys(3);

                          std::array<std::byte, 256> buffer{};
                          uint64_t bytesRead = 0;
                          CloudSync::ReadCommand read{};
                          read.buffer   = buffer;
                          read.position = 200;
                          state.Require(read.Execute(api, keys, bytesRead) == S_OK, L"read should succeed");
                          state.Require(bytesRead == 100, std::format(L"read at 200 of a 300 byte file should return 100 bytes, got {}", bytesRead));

                          CloudSync::ReadCommand emptyRead{};
                          const HRESULT emptyHr = emptyRead.Execute(api, keys, bytesRead);
                          state.Require(emptyHr == HRESULT_FROM_WIN32(ERROR_INVALID_USER_BUFFER) && bytesRead == 0, L"empty read buffer should be rejected");
                          state.Require(CloudSync::ClassifyError(emptyHr).kind == CloudSync::CloudErrorKind::IoError, L"empty read buffer should classify as IoError");

                          CloudSync::ReadCommand farRead{};
                          farRead.buffer   = buffer;
                          farRead.position = UINT64_MAX - 10;
                          const HRESULT farHr = farRead.Execute(api, keys, bytesRead);
                          state.Require(CloudSync::ClassifyError(farHr).kind == CloudSync::CloudErrorKind::IoError, std::format(L"read beyond the signed range should be an IoError, got {}", HrText(farHr)));
                          state.Require(api.Count(MockCloudFilterApi::Call::RetrieveData) == 1, L"invalid reads must not reach the OS");
                          return true;
                      });

    SelfTest::RunCase(options,
                      result,
                      L"placeholder batch validation",
                      [](CaseState& state)
                      {
                          std::vector<CloudSync::Placeholder> placeholders;
                          placeholders.push_back(MakePlaceholder(L"a.txt"));
                          placeholders.push_back(MakePlaceholder(L"b.txt", CloudSync::kMaxFileIdentitySize));

                          CloudSync::CreatePlaceholdersCommand ok{};
                          ok.placeholders = placeholders;
                          state.Require(ok.Validate() == S_OK, L"valid batch should validate");

                          CloudSync::CreatePlaceholdersCommand emptyBatch{};
                          state.Require(emptyBatch.Validate() == S_OK, L"an empty listing is valid");

                          std::vector<CloudSync::Placeholder> unnamed{MakePlaceholder(L"")};
                          CloudSync::CreatePlaceholdersCommand unnamedCommand{};
                          unnamedCommand.placeholders = unnamed;
                          state.Require(unnamedCommand.Validate() == E_INVALIDARG, L"empty placeholder name should be rejected");

                          std::vector<CloudSync::Placeholder> oversized{MakePlaceholder(L"big.bin", CloudSync::kMaxFileIdentitySize + 1)};
                          CloudSync::CreatePlaceholdersCommand oversizedCommand{};
                          oversizedCommand.placeholders = oversized;
                          state.Require(oversizedCommand.Validate() == E_INVALIDARG, L"identity over the limit should be rejected");

                          CloudSync::CreatePlaceholdersCommand denialWithEntries = ok;
                          denialWithEntries.completionStatus                     = STATUS_CLOUD_FILE_UNSUCCESSFUL;
                          state.Require(denialWithEntries.Validate() == E_INVALIDARG, L"denial carrying entries should be rejected");
                          return true;
                      });

    SelfTest::RunCase(options,
                      result,
                      L"placeholder batch results",
                      [](CaseState& state)
                      {
                          MockCloudFilterApi api;
                          const auto keys = SelfTest::MakeKeys(4);

                          std::vector<CloudSync::Placeholder> placeholders;
                          placeholders.push_back(MakePlaceholder(L"one"));
                          placeholders.push_back(MakePlaceholder(L"two"));
                          placeholders.push_back(MakePlaceholder(L"three"));

                          CloudSync::CreatePlaceholdersCommand command{};
                          command.placeholders = placeholders;

                          std::vector<CloudSync::PlaceholderResult> results;
                          state.Require(command.Execute(api, keys, results) == S_OK, L"batch without failures should return S_OK");
                          state.Require(results.size() == 3, L"one result per placeholder expected");

                          api.FailPlaceholderEntry(1, HRESULT_FROM_WIN32(ERROR_ALREADY_EXISTS));
                          const HRESULT partialHr = command.Execute(api, keys, results);
                          state.Require(partialHr == S_FALSE, std::format(L"partial failure should return S_FALSE, got {}", HrText(partialHr)));
                          if (state.Require(results.size() == 3, L"one result per placeholder expected after partial failure"))
                          {
                              state.Require(SUCCEEDED(results[0].result) && results[0].createUsn != 0, L"first entry should succeed with a USN");
                              state.Require(results[1].result == HRESULT_FROM_WIN32(ERROR_ALREADY_EXISTS), L"second entry should carry its failure");
                              state.Require(SUCCEEDED(results[2].result), L"third entry should succeed without stopOnError");
                          }

                          command.flags.stopOnError = true;
                          state.Require(command.Execute(api, keys, results) == S_FALSE, L"stopOnError batch should still be partial");
                          state.Require(results.size() == 3 && results[2].result == E_ABORT, L"entries after the failure should be aborted");

                          api.FailNext(MockCloudFilterApi::Call::TransferPlaceholders, HRESULT_FROM_WIN32(ERROR_CLOUD_FILE_INVALID_REQUEST));
                          state.Require(command.Execute(api, keys, results) == HRESULT_FROM_WIN32(ERROR_CLOUD_FILE_INVALID_REQUEST),
                                        L"rejected batch should return the OS error");
                          return true;
                      });

    SelfTest::RunCase(options,
                      result,
                      L"dehydrate blob limits",
                      [](CaseState& state)
                      {
                          MockCloudFilterApi api;
                          const auto keys = SelfTest::MakeKeys(5);

                          const std::vector<std::byte> maxBlob  = SelfTest::MakePattern(CloudSync::kMaxBlobSize);
                          const std::vector<std::byte> overBlob = SelfTest::MakePattern(CloudSync::kMaxBlobSize + 1);

                          CloudSync::DehydrateCommand over{};
                          over.blob = overBlob;
                          state.Require(over.Execute(api, keys) == E_INVALIDARG, L"blob over the limit should be rejected");
                          state.Require(api.Count(MockCloudFilterApi::Call::AckDehydrate) == 0, L"rejected blob must not reach the OS");

                          CloudSync::DehydrateCommand denialWithBlob{};
                          denialWithBlob.blob             = maxBlob;
                          denialWithBlob.completionStatus = STATUS_CLOUD_FILE_DEHYDRATION_DISALLOWED;
                          state.Require(denialWithBlob.Validate() == E_INVALIDARG, L"denial carrying a blob should be rejected");

                          CloudSync::DehydrateCommand atLimit{};
                          atLimit.blob = maxBlob;
                          state.Require(atLimit.Execute(api, keys) == S_OK, L"blob at the limit should be accepted");

                          const auto records = api.Records(keys);
                          state.Require(records.size() == 1 && records[0].payload == maxBlob, L"blob should be forwarded unchanged");

                          CloudSync::DeleteCommand del{};
                          CloudSync::RenameCommand rename{};
                          rename.completionStatus = STATUS_CLOUD_FILE_IN_USE;
                          state.Require(del.Execute(api, keys) == S_OK && rename.Execute(api, keys) == S_OK, L"delete and rename acknowledgements should be sent");
                          return true;
                      });

    SelfTest::RunCase(options,
                      result,
                      L"error classification",
                      [](CaseState& state)
                      {
                          using CloudSync::CloudErrorKind;
                          struct Expectation
                          {
                              HRESULT hr;
                              CloudErrorKind kind;
                          };

                          const std::array<Expectation, 10> expectations{{
                              {E_NOTIMPL, CloudErrorKind::NotSupported},
                              {HRESULT_FROM_WIN32(ERROR_NOT_SUPPORTED), CloudErrorKind::NotSupported},
                              {E_INVALIDARG, CloudErrorKind::InvalidArgument},
                              {CloudSync::kTicketAlreadyResolved, CloudErrorKind::InvalidArgument},
                              {HRESULT_FROM_WIN32(ERROR_INVALID_DATA), CloudErrorKind::InvalidArgument},
                              {CloudSync::kOperationCancelled, CloudErrorKind::Cancelled},
                              {HRESULT_FROM_NT(STATUS_CLOUD_FILE_REQUEST_ABORTED), CloudErrorKind::Cancelled},
                              {HRESULT_FROM_WIN32(ERROR_FILE_NOT_FOUND), CloudErrorKind::IoError},
                              {HRESULT_FROM_WIN32(ERROR_CLOUD_FILE_INVALID_REQUEST), CloudErrorKind::IoError},
                              {E_OUTOFMEMORY, CloudErrorKind::Unknown},
                          }};

                          for (const Expectation& expectation : expectations)
                          {
                              const CloudSync::CloudError error = CloudSync::ClassifyError(expectation.hr);
                              state.Require(error.kind == expectation.kind && error.code == expectation.hr,
                                            std::format(L"{} classified as {}, expected {}",
                                                        HrText(expectation.hr),
                                                        CloudSync::CloudErrorKindName(error.kind),
                                                        CloudSync::CloudErrorKindName(expectation.kind)));
                          }
                          return true;
                      });

    SelfTest::RunCase(options,
                      result,
                      L"completion status mapping",
                      [](CaseState& state)
                      {
                          struct Expectation
                          {
                              HRESULT hr;
                              NTSTATUS status;
                          };

                          const std::array<Expectation, 10> expectations{{
                              {S_OK, STATUS_SUCCESS},
                              {S_FALSE, STATUS_SUCCESS},
                              {E_NOTIMPL, STATUS_CLOUD_FILE_NOT_SUPPORTED},
                              {E_INVALIDARG, STATUS_CLOUD_FILE_INVALID_REQUEST},
                              {CloudSync::kOperationCancelled, STATUS_CLOUD_FILE_REQUEST_CANCELED},
                              {E_ACCESSDENIED, STATUS_CLOUD_FILE_ACCESS_DENIED},
                              {HRESULT_FROM_WIN32(ERROR_SHARING_VIOLATION), STATUS_CLOUD_FILE_IN_USE},
                              {HRESULT_FROM_NT(STATUS_CLOUD_FILE_PINNED), STATUS_CLOUD_FILE_PINNED},
                              {E_OUTOFMEMORY, STATUS_CLOUD_FILE_INSUFFICIENT_RESOURCES},
                              {E_FAIL, STATUS_CLOUD_FILE_UNSUCCESSFUL},
                          }};

                          for (const Expectation& expectation : expectations)
                          {
                              const NTSTATUS status = CloudSync::CompletionStatusFromHResult(expectation.hr);
                              state.Require(status == expectation.status,
                                            std::format(L"{} mapped to 0x{:08X}, expected 0x{:08X}",
                                                        HrText(expectation.hr),
                                                        static_cast<unsigned long>(status),
                                                        static_cast<unsigned long>(expectation.status)));
                          }
                          return true;
                      });

    return SelfTest::FinishSuite(result, startedAt, outResult);
}
