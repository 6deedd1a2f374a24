#include <spdlog/spdlog.h>

#include <string>
#include <tubefetch/payloads.hpp>

namespace tubefetch {

void to_json(json &j, const ProgressSnapshot &snapshot) {
	j = json{{"status", std::string(to_string(snapshot.status))}};
	if (snapshot.percent) j["percent"] = *snapshot.percent;
	if (snapshot.speed) j["speed"] = *snapshot.speed;
	if (snapshot.eta) j["eta"] = *snapshot.eta;
	if (snapshot.error_message) j["error"] = *snapshot.error_message;
}

void to_json(json &j, const DownloadResult &result) {
	j = json{
		{"success", true},
		{"downloadId", result.id},
		{"downloadUrl", result.download_url},
	};
}

json error_payload(const Error &error) {
	return json{{"success", false}, {"error", error.message}};
}

json progress_payload(const ProgressSnapshot &snapshot) {
	return json{{"success", true}, {"progress", snapshot}};
}

json validation_payload(bool valid) {
	return json{{"success", valid}, {"valid", valid}};
}

json formats_payload(std::string_view formats) {
	return json{{"success", true}, {"formats", std::string(formats)}};
}

Result<json> video_info_payload(std::string_view raw) {
	auto data = json::parse(raw.begin(), raw.end(), nullptr, false);
	if (data.is_discarded()) {
		spdlog::warn("Extractor returned malformed metadata ({} bytes)",
					 raw.size());
		return Error{errc::metadata_parse_failed, "Failed to parse metadata"};
	}
	return json{{"success", true}, {"data", std::move(data)}};
}

int http_status(const Error &error) {
	if (error.is(errc::invalid_request)) return 400;
	if (error.is(errc::unknown_job)) return 404;
	if (error.is(errc::not_running)) return 409;
	return 500;
}

}  // namespace tubefetch
