#pragma once

#include "SelfTestCommon.h"

namespace ConfigurationSelfTest
{
[[nodiscard]] bool Run(const SelfTest::SelfTestOptions& options = {}, SelfTest::SelfTestSuiteResult* outResult = nullptr) noexcept;
}
