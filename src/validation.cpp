#include <algorithm>
#include <array>
#include <boost/regex.hpp>
#include <tubefetch/validation.hpp>

namespace tubefetch {

namespace {

constexpr std::array<std::string_view, 3> kVideoContainers = {
	"mp4", "webm", "mkv"};
constexpr std::array<std::string_view, 7> kAudioFormats = {
	"mp3", "m4a", "opus", "flac", "wav", "aac", "vorbis"};

bool matches(std::string_view text, const boost::regex &re) {
	return boost::regex_match(text.begin(), text.end(), re);
}

Result<void> invalid(std::string message) {
	return Error{errc::invalid_request, std::move(message)};
}

Result<void> validate_url(std::string_view url) {
	if (url.empty() || !is_valid_youtube_url(url)) {
		return invalid("Invalid or missing YouTube URL");
	}
	return outcome::success();
}

Result<void> validate_quality(std::string_view quality) {
	static const boost::regex re(R"(^\d{3,4}[pP]?$)");
	if (!matches(quality, re)) {
		return invalid("Unsupported quality: " + std::string(quality));
	}
	return outcome::success();
}

Result<void> validate_time(std::string_view field, std::string_view value) {
	// Seconds ("90", "12.5") or clock form ("1:30", "01:02:03")
	static const boost::regex re(R"(^(\d+:){0,2}\d+(\.\d+)?$)");
	if (!matches(value, re)) {
		return invalid("Invalid " + std::string(field) + ": " +
					   std::string(value));
	}
	return outcome::success();
}

}  // namespace

bool is_valid_youtube_url(std::string_view url) {
	static const boost::regex re(
		R"(^(https?://)?(www\.)?(youtube\.com|youtu\.be)/)");
	return boost::regex_search(url.begin(), url.end(), re);
}

bool is_valid_video_id(std::string_view id) {
	static const boost::regex re(R"(^[\w-]{11}$)");
	return matches(id, re);
}

std::string watch_url(std::string_view video_id) {
	return "https://www.youtube.com/watch?v=" + std::string(video_id);
}

bool is_video_container(std::string_view format) {
	return std::find(kVideoContainers.begin(), kVideoContainers.end(),
					 format) != kVideoContainers.end();
}

bool is_audio_format(std::string_view format) {
	return std::find(kAudioFormats.begin(), kAudioFormats.end(), format) !=
		   kAudioFormats.end();
}

Result<void> validate(const VideoRequest &request) {
	BOOST_OUTCOME_TRYV(validate_url(request.url));
	BOOST_OUTCOME_TRYV(validate_quality(request.quality));
	if (!is_video_container(request.format)) {
		return invalid("Unsupported video format: " + request.format);
	}
	if (request.start_time) {
		BOOST_OUTCOME_TRYV(validate_time("startTime", *request.start_time));
	}
	if (request.end_time) {
		BOOST_OUTCOME_TRYV(validate_time("endTime", *request.end_time));
	}
	return outcome::success();
}

Result<void> validate(const AudioRequest &request) {
	BOOST_OUTCOME_TRYV(validate_url(request.url));
	if (!is_audio_format(request.format)) {
		return invalid("Unsupported audio format: " + request.format);
	}
	// yt-dlp accepts a VBR level 0-10 or a bitrate such as "192k"
	static const boost::regex re(R"(^(10|\d|\d{2,3}[kK])$)");
	if (!matches(request.quality, re)) {
		return invalid("Unsupported audio quality: " + request.quality);
	}
	return outcome::success();
}

Result<void> validate(const PlaylistRequest &request) {
	BOOST_OUTCOME_TRYV(validate_url(request.url));
	if (request.audio_only) {
		if (!is_audio_format(request.format)) {
			return invalid("Unsupported audio format: " + request.format);
		}
		return outcome::success();
	}
	BOOST_OUTCOME_TRYV(validate_quality(request.quality));
	if (!is_video_container(request.format)) {
		return invalid("Unsupported video format: " + request.format);
	}
	return outcome::success();
}

}  // namespace tubefetch
