#include <boost/regex.hpp>
#include <tubefetch/output_parser.hpp>

#include "utils.hpp"

namespace tubefetch {

std::optional<ProgressUpdate> parse_progress_line(std::string_view line) {
	// [download] <pct>% ... <rate>/s ETA <eta>
	// The rate must be preceded by whitespace so "of 10.00MiB" is skipped.
	static const boost::regex re(
		R"(\[download\]\s+(\d+\.\d+)%.*?\s(\d+\.\d+\w+/s)\sETA\s([\d:]+))");

	boost::cmatch m;
	if (!boost::regex_search(line.data(), line.data() + line.size(), m, re)) {
		return std::nullopt;
	}

	auto percent = utils::to_double(
		std::string_view(m[1].first, static_cast<std::size_t>(m[1].length())));
	if (!percent) return std::nullopt;

	ProgressUpdate update;
	update.percent = percent.value();
	update.speed = m[2].str();
	update.eta = m[3].str();
	return update;
}

std::optional<ProgressUpdate> YtDlpProgressParser::parse(
	std::string_view line) const {
	return parse_progress_line(line);
}

}  // namespace tubefetch
