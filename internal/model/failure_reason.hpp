#pragma once

#include <string>
#include <string_view>

namespace batchsync::model {

/*
  Prefixes of FAILED reasons. The full reason is "<prefix><detail>",
  e.g. "copy-error:raw/scan_001.tif".
*/
inline constexpr std::string_view kCopyError            = "copy-error:";
inline constexpr std::string_view kVerificationMismatch = "verification-mismatch:";
inline constexpr std::string_view kSourceUnreadable     = "source-unreadable:";
inline constexpr std::string_view kSuperseded           = "superseded:";
inline constexpr std::string_view kAbandoned            = "abandoned:";
inline constexpr std::string_view kUnexpectedError      = "error:";

inline std::string FailureReason(std::string_view prefix, std::string_view detail) {
  std::string reason(prefix);
  reason.append(detail);
  return reason;
}

inline bool HasReasonPrefix(std::string_view reason, std::string_view prefix) {
  return reason.substr(0, prefix.size()) == prefix;
}

} // namespace batchsync::model
