#pragma once

#include <tubefetch/tubefetch_export.h>

#include <optional>
#include <string_view>
#include <tubefetch/types.hpp>

namespace tubefetch {

/// Maps one line of extractor output to a progress update. Implementations
/// must be stateless; one parser is shared by all running jobs.
class TUBEFETCH_EXPORT OutputParser {
   public:
	virtual ~OutputParser() = default;

	/// Returns std::nullopt for lines that carry no progress (warnings, merge
	/// notices, headers). Never fails.
	[[nodiscard]] virtual std::optional<ProgressUpdate> parse(
		std::string_view line) const = 0;
};

/// Parser for yt-dlp's "[download]  12.3% of 10.00MiB at 1.23MiB/s ETA 00:10"
/// progress lines.
class TUBEFETCH_EXPORT YtDlpProgressParser final : public OutputParser {
   public:
	[[nodiscard]] std::optional<ProgressUpdate> parse(
		std::string_view line) const override;
};

/// Free-function form of YtDlpProgressParser::parse.
TUBEFETCH_EXPORT std::optional<ProgressUpdate> parse_progress_line(
	std::string_view line);

}  // namespace tubefetch
