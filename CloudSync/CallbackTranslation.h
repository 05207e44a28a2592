#pragma once

#include "CallbackInfo.h"
#include "CorrelationKeys.h"
#include "Helpers.h"

#include <cfapi.h>

namespace CloudSync
{
// Conversions from the raw cfapi callback structures into the typed values handed to ISyncFilter.
// Paths are absolute: VolumeDosName followed by the normalized path the OS reports.
// These allocate and may throw std::bad_alloc.

[[nodiscard]] CorrelationKeyPair KeysFromCallbackInfo(const CF_CALLBACK_INFO& info) noexcept;
[[nodiscard]] RequestContext TranslateRequest(const CF_CALLBACK_INFO& info);

[[nodiscard]] FetchDataInfo TranslateFetchData(const CF_CALLBACK_PARAMETERS& parameters) noexcept;
[[nodiscard]] CancelFetchDataInfo TranslateCancelFetchData(const CF_CALLBACK_PARAMETERS& parameters) noexcept;
[[nodiscard]] ValidateDataInfo TranslateValidateData(const CF_CALLBACK_PARAMETERS& parameters) noexcept;
[[nodiscard]] FetchPlaceholdersInfo TranslateFetchPlaceholders(const CF_CALLBACK_PARAMETERS& parameters);
[[nodiscard]] CancelFetchPlaceholdersInfo TranslateCancelFetchPlaceholders(const CF_CALLBACK_PARAMETERS& parameters) noexcept;
[[nodiscard]] OpenedInfo TranslateOpened(const CF_CALLBACK_PARAMETERS& parameters) noexcept;
[[nodiscard]] ClosedInfo TranslateClosed(const CF_CALLBACK_PARAMETERS& parameters) noexcept;
[[nodiscard]] DehydrateInfo TranslateDehydrate(const CF_CALLBACK_PARAMETERS& parameters) noexcept;
[[nodiscard]] DehydratedInfo TranslateDehydrated(const CF_CALLBACK_PARAMETERS& parameters) noexcept;
[[nodiscard]] DeleteInfo TranslateDelete(const CF_CALLBACK_PARAMETERS& parameters) noexcept;
[[nodiscard]] RenameInfo TranslateRename(const CF_CALLBACK_INFO& info, const CF_CALLBACK_PARAMETERS& parameters);
[[nodiscard]] RenamedInfo TranslateRenamed(const CF_CALLBACK_INFO& info, const CF_CALLBACK_PARAMETERS& parameters);

[[nodiscard]] DehydrationReason TranslateDehydrationReason(CF_CALLBACK_DEHYDRATION_REASON reason) noexcept;
} // namespace CloudSync
