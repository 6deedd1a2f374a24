#include <fmt/format.h>

#include <tubefetch/job_planner.hpp>
#include <utility>

namespace tubefetch {

namespace {

// yt-dlp output template field for the final extension
constexpr std::string_view kExtField = "%(ext)s";
constexpr std::string_view kPlaylistItemName =
	"%(playlist_index)s-%(id)s.%(ext)s";

// "720p" / "720P" -> "720"
std::string strip_quality_suffix(std::string_view quality) {
	if (!quality.empty() && (quality.back() == 'p' || quality.back() == 'P')) {
		quality.remove_suffix(1);
	}
	return std::string(quality);
}

}  // namespace

JobPlanner::JobPlanner(std::filesystem::path download_dir)
	: download_dir_(std::move(download_dir)) {}

std::string JobPlanner::video_format_filter(std::string_view quality,
											std::string_view format) {
	return fmt::format("bestvideo[height<={}]+bestaudio/best[ext={}]",
					   strip_quality_suffix(quality), format);
}

std::string JobPlanner::audio_extension(std::string_view format) {
	if (format == "vorbis") return "ogg";
	if (format == "aac") return "m4a";
	return std::string(format);
}

std::string JobPlanner::download_section(
	const std::optional<std::string> &start,
	const std::optional<std::string> &end) {
	return fmt::format("*{}-{}", start.value_or("0"), end.value_or("inf"));
}

ExtractionArguments JobPlanner::plan_video(const JobId &id,
										   const VideoRequest &request) const {
	ExtractionArguments plan;
	plan.kind = JobKind::video;
	plan.public_name = fmt::format("{}.{}", id, request.format);
	plan.artifact = download_dir_ / plan.public_name;
	plan.output_template =
		(download_dir_ / fmt::format("{}.{}", id, kExtField)).string();

	plan.args = {
		request.url,
		"-f",
		video_format_filter(request.quality, request.format),
		"--merge-output-format",
		request.format,
		"-o",
		plan.output_template,
		"--no-playlist",
		"--newline",
		"--no-colors",
	};

	if (request.start_time || request.end_time) {
		plan.args.emplace_back("--download-sections");
		plan.args.push_back(
			download_section(request.start_time, request.end_time));
	}
	return plan;
}

ExtractionArguments JobPlanner::plan_audio(const JobId &id,
										   const AudioRequest &request) const {
	ExtractionArguments plan;
	plan.kind = JobKind::audio;
	plan.public_name =
		fmt::format("{}.{}", id, audio_extension(request.format));
	plan.artifact = download_dir_ / plan.public_name;
	plan.output_template =
		(download_dir_ / fmt::format("{}.{}", id, kExtField)).string();

	plan.args = {
		request.url,
		"-x",
		"--audio-format",
		request.format,
		"--audio-quality",
		request.quality,
		"-o",
		plan.output_template,
		"--no-playlist",
		"--newline",
		"--no-colors",
	};
	return plan;
}

ExtractionArguments JobPlanner::plan_playlist(
	const JobId &id, const PlaylistRequest &request) const {
	ExtractionArguments plan;
	plan.kind = JobKind::playlist;
	plan.public_name = id + "/";
	plan.artifact = download_dir_ / id;
	plan.output_template = (plan.artifact / kPlaylistItemName).string();

	if (request.audio_only) {
		plan.args = {
			request.url,
			"-x",
			"--audio-format",
			request.format,
			"-o",
			plan.output_template,
			"--newline",
			"--no-colors",
		};
	} else {
		plan.args = {
			request.url,
			"-f",
			video_format_filter(request.quality, request.format),
			"--merge-output-format",
			request.format,
			"-o",
			plan.output_template,
			"--newline",
			"--no-colors",
		};
	}
	return plan;
}

}  // namespace tubefetch
