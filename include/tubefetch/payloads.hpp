#pragma once

#include <tubefetch/tubefetch_api_export.h>

#include <nlohmann/json.hpp>
#include <string_view>
#include <tubefetch/result.hpp>
#include <tubefetch/types.hpp>

namespace tubefetch {

using json = nlohmann::json;

// JSON bodies of the REST surface: every response carries "success"; failed
// ones carry "error" with the job's or the validator's message.

/// {"status": ..., "percent"?, "speed"?, "eta"?, "error"?}
TUBEFETCH_API_EXPORT void to_json(json &j, const ProgressSnapshot &snapshot);

/// {"success": true, "downloadId": ..., "downloadUrl": ...}
TUBEFETCH_API_EXPORT void to_json(json &j, const DownloadResult &result);

/// {"success": false, "error": message}
TUBEFETCH_API_EXPORT json error_payload(const Error &error);

/// {"success": true, "progress": {...}}
TUBEFETCH_API_EXPORT json progress_payload(const ProgressSnapshot &snapshot);

/// {"success": valid, "valid": valid}
TUBEFETCH_API_EXPORT json validation_payload(bool valid);

/// {"success": true, "formats": text}
TUBEFETCH_API_EXPORT json formats_payload(std::string_view formats);

/// Parses `yt-dlp -j` output into {"success": true, "data": {...}}.
/// Fails with errc::metadata_parse_failed on malformed JSON.
TUBEFETCH_API_EXPORT Result<json> video_info_payload(std::string_view raw);

/// HTTP status a REST handler should answer with for `error`.
TUBEFETCH_API_EXPORT int http_status(const Error &error);

}  // namespace tubefetch
