#pragma once

#include <tubefetch/tubefetch_export.h>

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <tubefetch/types.hpp>

namespace tubefetch {

/// Builds yt-dlp argument lists and output locations. Inputs are expected to
/// have passed validate(); nothing here sanitizes them.
class TUBEFETCH_EXPORT JobPlanner {
   public:
	explicit JobPlanner(std::filesystem::path download_dir);

	/// <dir>/<id>.<format>, merged to the requested container, no playlist
	/// expansion, optional --download-sections trim.
	[[nodiscard]] ExtractionArguments plan_video(
		const JobId &id, const VideoRequest &request) const;

	/// <dir>/<id>.<ext>, audio extracted with the requested codec and
	/// quality, no playlist expansion. <ext> is audio_extension(format).
	[[nodiscard]] ExtractionArguments plan_audio(
		const JobId &id, const AudioRequest &request) const;

	/// <dir>/<id>/<playlist_index>-<item id>.<ext>
	[[nodiscard]] ExtractionArguments plan_playlist(
		const JobId &id, const PlaylistRequest &request) const;

	/// "bestvideo[height<=720]+bestaudio/best[ext=mp4]"
	static std::string video_format_filter(std::string_view quality,
										   std::string_view format);

	/// File extension yt-dlp gives an extracted codec: "vorbis" -> "ogg",
	/// "aac" -> "m4a", other codecs keep their name.
	static std::string audio_extension(std::string_view format);

	/// "*START-END", START defaults to 0 and END to inf.
	static std::string download_section(
		const std::optional<std::string> &start,
		const std::optional<std::string> &end);

   private:
	std::filesystem::path download_dir_;
};

}  // namespace tubefetch
