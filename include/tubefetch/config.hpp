#pragma once

#include <tubefetch/tubefetch_export.h>

#include <boost/program_options/options_description.hpp>
#include <boost/program_options/variables_map.hpp>
#include <chrono>
#include <cstddef>
#include <filesystem>
#include <string>
#include <tubefetch/result.hpp>

namespace tubefetch {

namespace po = boost::program_options;

struct TUBEFETCH_EXPORT ServiceConfig {
	std::filesystem::path download_dir = "downloads";
	std::string public_prefix = "/downloads";  // URL prefix of download_dir
	std::string extractor = "yt-dlp";		   // name on PATH or a path
	std::size_t max_concurrent_downloads = 5;
	std::chrono::seconds job_timeout{0};  // zero disables the limit
	std::chrono::seconds progress_ttl{3600};
	std::size_t store_capacity = 10000;
};

/// Service options, usable both on a command line and in the environment.
TUBEFETCH_EXPORT po::options_description config_options();

/// Maps TUBEFETCH_MAX_CONCURRENT_DOWNLOADS to "max-concurrent-downloads" and
/// so on. DOWNLOAD_DIR and MAX_CONCURRENT_DOWNLOADS are accepted when their
/// TUBEFETCH_ form is not set. Returns "" for unrelated variables.
TUBEFETCH_EXPORT std::string environment_option_name(const std::string &var);

/// Adds environment values to `vm`. Values already stored (e.g. from the
/// command line) take precedence.
TUBEFETCH_EXPORT Result<void> store_environment(
	const po::options_description &options, po::variables_map &vm);

/// Checks ranges and normalizes the public prefix: trailing slashes are
/// dropped, so "/" becomes the empty (root) prefix.
TUBEFETCH_EXPORT Result<ServiceConfig> validate_config(ServiceConfig config);

TUBEFETCH_EXPORT Result<ServiceConfig> config_from_variables(
	const po::variables_map &vm);

/// Configuration from the process environment alone.
TUBEFETCH_EXPORT Result<ServiceConfig> config_from_environment();

}  // namespace tubefetch
