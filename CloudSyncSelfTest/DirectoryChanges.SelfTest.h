#pragma once

#include "SelfTestCommon.h"

namespace DirectoryChangesSelfTest
{
[[nodiscard]] bool Run(const SelfTest::SelfTestOptions& options = {}, SelfTest::SelfTestSuiteResult* outResult = nullptr) noexcept;
}
