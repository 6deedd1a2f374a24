#pragma once

#include <tubefetch/tubefetch_export.h>

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace tubefetch {

/// Opaque job handle: canonical text form of a random 128-bit UUID.
using JobId = std::string;

enum class JobKind : std::uint8_t {
	video,
	audio,
	playlist,
};

/// Lifecycle order: queued -> starting -> downloading* -> terminal.
enum class JobStatus : std::uint8_t {
	queued,
	starting,
	downloading,
	completed,
	error,
	cancelled,
};

TUBEFETCH_EXPORT std::string_view to_string(JobKind kind);
TUBEFETCH_EXPORT std::string_view to_string(JobStatus status);
TUBEFETCH_EXPORT bool is_terminal(JobStatus status);

// One parsed progress report of the extractor. Speed and ETA are raw
// substrings of the output line ("1.23MiB/s", "00:10").
struct TUBEFETCH_EXPORT ProgressUpdate {
	double percent = 0.0;
	std::string speed;
	std::string eta;
};

/// Latest known state of a job.
struct TUBEFETCH_EXPORT ProgressSnapshot {
	JobStatus status = JobStatus::starting;
	std::optional<double> percent;			   // starting, downloading, completed
	std::optional<std::string> speed;		   // downloading only
	std::optional<std::string> eta;			   // downloading only
	std::optional<std::string> error_message;  // error, cancelled

	static ProgressSnapshot queued();
	static ProgressSnapshot starting();
	static ProgressSnapshot downloading(const ProgressUpdate &update);
	static ProgressSnapshot completed();
	static ProgressSnapshot failed(std::string message);
	static ProgressSnapshot cancelled(std::string message);

	[[nodiscard]] bool terminal() const { return is_terminal(status); }
};

// =============================================================================
// Requests (shape checked by validation.hpp before planning)
// =============================================================================

struct TUBEFETCH_EXPORT VideoRequest {
	std::string url;
	std::string quality = "720p";  // maximum height, "p" suffix optional
	std::string format = "mp4";	   // container
	std::optional<std::string> start_time;
	std::optional<std::string> end_time;
};

struct TUBEFETCH_EXPORT AudioRequest {
	std::string url;
	std::string format = "mp3";	   // --audio-format
	std::string quality = "192k";  // --audio-quality
};

struct TUBEFETCH_EXPORT PlaylistRequest {
	std::string url;
	std::string quality = "720p";
	std::string format = "mp4";	 // container, or audio codec when audio_only
	bool audio_only = false;
};

/// Planned extractor invocation for one job. Immutable once built.
struct TUBEFETCH_EXPORT ExtractionArguments {
	JobKind kind = JobKind::video;
	std::vector<std::string> args;	// tokens after the executable name
	std::string output_template;	// value passed with -o
	std::filesystem::path artifact;	// expected file, or directory for playlists
	std::string public_name;		// artifact path relative to the downloads root
};

/// Successful outcome of a download job.
struct TUBEFETCH_EXPORT DownloadResult {
	JobId id;
	JobKind kind = JobKind::video;
	std::string download_url;  // file URL, or directory URL for playlists
	std::filesystem::path artifact;
};

}  // namespace tubefetch
