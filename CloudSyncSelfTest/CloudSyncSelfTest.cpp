#include "Helpers.h"

#include <cerrno>
#include <chrono>
#include <cstdio>
#include <cwchar>
#include <ctime>
#include <filesystem>
#include <iterator>
#include <optional>
#include <span>
#include <string>
#include <string_view>

#include "Commands.SelfTest.h"
#include "Configuration.SelfTest.h"
#include "DirectoryChanges.SelfTest.h"
#include "Dispatcher.SelfTest.h"
#include "Registration.SelfTest.h"
#include "SelfTestCommon.h"
#include "Tickets.SelfTest.h"

namespace
{
using SuiteRunner = bool (*)(const SelfTest::SelfTestOptions&, SelfTest::SelfTestSuiteResult*) noexcept;

struct SuiteEntry
{
    const wchar_t* name;
    SuiteRunner run;
};

constexpr SuiteEntry kSuites[] = {
    {L"commands", &CommandsSelfTest::Run},
    {L"tickets", &TicketsSelfTest::Run},
    {L"dispatcher", &DispatcherSelfTest::Run},
    {L"registration", &RegistrationSelfTest::Run},
    {L"configuration", &ConfigurationSelfTest::Run},
    {L"directory-changes", &DirectoryChangesSelfTest::Run},
};

constexpr std::wstring_view kTimeoutMultiplierArg = L"--selftest-timeout-multiplier=";
constexpr std::wstring_view kSuiteArg             = L"--suite=";

[[nodiscard]] std::wstring GetSelfTestUtcIso8601() noexcept
{
    const std::chrono::system_clock::time_point now = std::chrono::system_clock::now();
    const std::time_t nowUtc                        = std::chrono::system_clock::to_time_t(now);
    tm utc{};
    if (gmtime_s(&utc, &nowUtc) != 0)
    {
        return {};
    }

    const auto nowMs      = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch());
    const auto millisPart = nowMs.count() % 1000;

    return std::format(
        L"{0:04}-{1:02}-{2:02}T{3:02}:{4:02}:{5:02}.{6:03}Z", utc.tm_year + 1900, utc.tm_mon + 1, utc.tm_mday, utc.tm_hour, utc.tm_min, utc.tm_sec, millisPart);
}

[[nodiscard]] std::optional<double> ParseTimeoutMultiplier(std::wstring_view text) noexcept
{
    const std::wstring value(text);
    wchar_t* end        = nullptr;
    errno               = 0;
    const double parsed = wcstod(value.c_str(), &end);
    if (end == value.c_str() || errno != 0 || parsed <= 0.0)
    {
        return std::nullopt;
    }
    return parsed;
}

void PrintUsage() noexcept
{
    fwprintf(stderr, L"usage: CloudSyncSelfTest [--fail-fast] [--selftest-timeout-multiplier=<factor>] [--suite=<name>]...\n");
    fwprintf(stderr, L"suites:");
    for (const SuiteEntry& entry : kSuites)
    {
        fwprintf(stderr, L" %ls", entry.name);
    }
    fwprintf(stderr, L"\n");
}
} // namespace

int wmain(int argc, wchar_t* argv[])
{
    SelfTest::SelfTestOptions options{};
    options.writeJsonSummary = true;

    bool selected[std::size(kSuites)]{};
    bool anySelected = false;

    for (int i = 1; i < argc; ++i)
    {
        const std::wstring_view arg(argv[i]);
        if (arg == L"--fail-fast")
        {
            options.failFast = true;
        }
        else if (arg.starts_with(kTimeoutMultiplierArg))
        {
            const std::optional<double> scale = ParseTimeoutMultiplier(arg.substr(kTimeoutMultiplierArg.size()));
            if (! scale.has_value())
            {
                fwprintf(stderr, L"invalid timeout multiplier: %ls\n", argv[i]);
                return 2;
            }
            options.timeoutScale = scale.value();
        }
        else if (arg.starts_with(kSuiteArg))
        {
            const std::wstring_view name = arg.substr(kSuiteArg.size());
            bool known                   = false;
            for (size_t s = 0; s < std::size(kSuites); ++s)
            {
                if (name == kSuites[s].name)
                {
                    selected[s] = true;
                    known       = true;
                }
            }

            if (! known)
            {
                fwprintf(stderr, L"unknown suite: %.*ls\n", static_cast<int>(name.size()), name.data());
                PrintUsage();
                return 2;
            }
            anySelected = true;
        }
        else if (arg == L"--help" || arg == L"-?")
        {
            PrintUsage();
            return 0;
        }
        else
        {
            fwprintf(stderr, L"unknown argument: %ls\n", argv[i]);
            PrintUsage();
            return 2;
        }
    }

    SelfTest::GetSelfTestOptions() = options;
    SelfTest::RotateSelfTestRuns();
    SelfTest::InitSelfTestRun(options);

    const std::wstring startedUtc = GetSelfTestUtcIso8601();
    SelfTest::SetRunStartedUtcIso(startedUtc);

    SelfTest::SelfTestRunResult run{};
    run.startedUtcIso = startedUtc;
    run.failFast      = options.failFast;
    run.timeoutScale  = options.timeoutScale;

    Debug::Info(L"CloudSyncSelfTest: run started {} (failFast={} timeoutScale={})", startedUtc, options.failFast, options.timeoutScale);

    const auto startedAt = std::chrono::steady_clock::now();
    bool allPassed       = true;
    for (size_t s = 0; s < std::size(kSuites); ++s)
    {
        if (anySelected && ! selected[s])
        {
            continue;
        }

        if (options.failFast && ! allPassed)
        {
            break;
        }

        SelfTest::SelfTestSuiteResult suiteResult{};
        const bool passed = kSuites[s].run(options, &suiteResult);
        allPassed         = allPassed && passed;

        wprintf(L"[%ls] %ls: %d passed, %d failed, %d skipped (%llu ms)\n",
                passed ? L"PASS" : L"FAIL",
                kSuites[s].name,
                suiteResult.passed,
                suiteResult.failed,
                suiteResult.skipped,
                static_cast<unsigned long long>(suiteResult.durationMs));
        for (const SelfTest::SelfTestCaseResult& caseResult : suiteResult.cases)
        {
            if (caseResult.status == SelfTest::SelfTestCaseResult::Status::failed)
            {
                wprintf(L"    %ls: %ls\n", caseResult.name.c_str(), caseResult.reason.c_str());
            }
        }

        run.suites.push_back(std::move(suiteResult));
    }

    run.durationMs = static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - startedAt).count());

    const std::filesystem::path runJsonPath = SelfTest::SelfTestRoot() / L"last_run" / L"results.json";
    SelfTest::WriteRunJson(run, runJsonPath);

    const int exitCode = allPassed ? 0 : 1;
    SelfTest::AppendSelfTestTrace(std::format(L"CloudSyncSelfTest: exit_code={}", exitCode));
    Debug::Info(L"CloudSyncSelfTest: run finished in {} ms exit_code={}", run.durationMs, exitCode);
    wprintf(L"%ls (%llu ms) results: %ls\n", allPassed ? L"ALL PASSED" : L"FAILURES", static_cast<unsigned long long>(run.durationMs), runJsonPath.c_str());
    return exitCode;
}
