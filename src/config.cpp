#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <boost/any.hpp>
#include <boost/program_options/errors.hpp>
#include <boost/program_options/parsers.hpp>
#include <boost/program_options/value_semantic.hpp>
#include <cctype>
#include <cstdlib>
#include <tubefetch/config.hpp>

namespace tubefetch {

namespace {

constexpr std::string_view env_prefix = "TUBEFETCH_";

std::string to_option_name(std::string_view var) {
	std::string name(var);
	std::transform(name.begin(), name.end(), name.begin(), [](unsigned char c) {
		return c == '_' ? '-' : static_cast<char>(std::tolower(c));
	});
	return name;
}

bool is_set(const char *var) {
	const char *value = std::getenv(var);
	return value != nullptr;
}

}  // namespace

po::options_description config_options() {
	ServiceConfig defaults;
	po::options_description desc("Service");
	// clang-format off
	desc.add_options()
		("download-dir", po::value<std::string>()->default_value(
			defaults.download_dir.string()),
		 "Directory receiving downloaded files")
		("public-prefix", po::value<std::string>()->default_value(
			defaults.public_prefix),
		 "URL prefix under which the download directory is served")
		("extractor", po::value<std::string>()->default_value(
			defaults.extractor),
		 "Extractor executable (name on PATH or a path)")
		("max-concurrent-downloads", po::value<std::size_t>()->default_value(
			defaults.max_concurrent_downloads),
		 "Jobs allowed to run at once; others wait in FIFO order")
		("job-timeout", po::value<long>()->default_value(
			defaults.job_timeout.count()),
		 "Seconds before a running job is killed (0 = no limit)")
		("progress-ttl", po::value<long>()->default_value(
			defaults.progress_ttl.count()),
		 "Seconds a finished job's progress stays queryable")
		("store-capacity", po::value<std::size_t>()->default_value(
			defaults.store_capacity),
		 "Maximum number of tracked jobs");
	// clang-format on
	return desc;
}

std::string environment_option_name(const std::string &var) {
	static const po::options_description known = config_options();

	std::string name;
	if (var.rfind(env_prefix, 0) == 0) {
		name = to_option_name(std::string_view(var).substr(env_prefix.size()));
	} else if (var == "DOWNLOAD_DIR" &&
			   !is_set("TUBEFETCH_DOWNLOAD_DIR")) {
		name = "download-dir";
	} else if (var == "MAX_CONCURRENT_DOWNLOADS" &&
			   !is_set("TUBEFETCH_MAX_CONCURRENT_DOWNLOADS")) {
		name = "max-concurrent-downloads";
	}

	if (name.empty() || !known.find_nothrow(name, false)) return {};
	return name;
}

Result<void> store_environment(const po::options_description &options,
							   po::variables_map &vm) {
	try {
		po::store(po::parse_environment(options, &environment_option_name),
				  vm);
	} catch (const po::error &e) {
		return Error{errc::invalid_config,
					 fmt::format("Invalid environment setting: {}", e.what())};
	}
	return outcome::success();
}

Result<ServiceConfig> validate_config(ServiceConfig config) {
	if (config.download_dir.empty()) {
		return Error{errc::invalid_config, "download-dir must not be empty"};
	}
	if (config.extractor.empty()) {
		return Error{errc::invalid_config, "extractor must not be empty"};
	}
	if (config.max_concurrent_downloads < 1) {
		return Error{errc::invalid_config,
					 "max-concurrent-downloads must be at least 1"};
	}
	if (config.store_capacity < 1) {
		return Error{errc::invalid_config, "store-capacity must be at least 1"};
	}
	if (config.job_timeout.count() < 0 || config.progress_ttl.count() < 0) {
		return Error{errc::invalid_config, "durations must not be negative"};
	}
	if (!config.public_prefix.empty() && config.public_prefix.front() != '/') {
		return Error{errc::invalid_config,
					 fmt::format("public-prefix must start with '/': {}",
								 config.public_prefix)};
	}
	// "/downloads/" is "/downloads"; "/" is the root, spelled ""
	while (!config.public_prefix.empty() &&
		   config.public_prefix.back() == '/') {
		config.public_prefix.pop_back();
	}

	return config;
}

Result<ServiceConfig> config_from_variables(const po::variables_map &vm) {
	ServiceConfig config;
	try {
		config.download_dir = vm["download-dir"].as<std::string>();
		config.public_prefix = vm["public-prefix"].as<std::string>();
		config.extractor = vm["extractor"].as<std::string>();
		config.max_concurrent_downloads =
			vm["max-concurrent-downloads"].as<std::size_t>();
		config.job_timeout = std::chrono::seconds(vm["job-timeout"].as<long>());
		config.progress_ttl =
			std::chrono::seconds(vm["progress-ttl"].as<long>());
		config.store_capacity = vm["store-capacity"].as<std::size_t>();
	} catch (const boost::bad_any_cast &) {
		return Error{errc::invalid_config, "Missing configuration option"};
	}

	BOOST_OUTCOME_TRY(valid, validate_config(std::move(config)));

	spdlog::debug(
		"Config: dir={} prefix={} extractor={} concurrency={} timeout={}s "
		"ttl={}s capacity={}",
		valid.download_dir.string(), valid.public_prefix, valid.extractor,
		valid.max_concurrent_downloads, valid.job_timeout.count(),
		valid.progress_ttl.count(), valid.store_capacity);
	return valid;
}

Result<ServiceConfig> config_from_environment() {
	auto options = config_options();
	po::variables_map vm;
	BOOST_OUTCOME_TRYV(store_environment(options, vm));
	po::notify(vm);
	return config_from_variables(vm);
}

}  // namespace tubefetch
