#pragma once

#include "Helpers.h"

#include <cstdint>
#include <exception>
#include <optional>
#include <string>
#include <string_view>

#pragma warning(push)
// (C6297) Arithmetic overflow. Results might not be an expected value.
// (C28182) Dereferencing NULL pointer.
#pragma warning(disable : 6297 28182)
#include <yyjson.h>
#pragma warning(pop)

namespace CloudSyncInternal
{
[[nodiscard]] std::wstring Utf16FromUtf8(std::string_view text) noexcept;
[[nodiscard]] std::wstring Utf16FromUtf8(const char* text) noexcept;
[[nodiscard]] std::string Utf8FromUtf16(std::wstring_view text) noexcept;

// Message of a caught exception for logging. Falls back to the ANSI code page when what() is not UTF-8.
[[nodiscard]] std::wstring DescribeException(const std::exception& ex) noexcept;

[[nodiscard]] std::optional<std::wstring> TryGetJsonString(yyjson_val* root, const char* key) noexcept;
[[nodiscard]] std::optional<uint64_t> TryGetJsonUInt(yyjson_val* root, const char* key) noexcept;
[[nodiscard]] std::optional<bool> TryGetJsonBool(yyjson_val* root, const char* key) noexcept;

[[nodiscard]] bool EqualsNoCase(std::wstring_view a, std::wstring_view b) noexcept;
} // namespace CloudSyncInternal
