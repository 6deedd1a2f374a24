#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <boost/asio.hpp>
#include <iomanip>
#include <iostream>
#include <tubefetch/config.hpp>
#include <tubefetch/download_service.hpp>

using namespace tubefetch;

int main() {
	// Initialize logger
	auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
	auto logger = std::make_shared<spdlog::logger>("tubefetch", console_sink);
	spdlog::set_default_logger(logger);
	spdlog::set_level(spdlog::level::debug);

	auto config = config_from_environment();
	if (!config) {
		std::cerr << "Bad configuration: " << config.error().message << "\n";
		return 1;
	}

	boost::asio::io_context ioc;
	auto service = DownloadService::create(ioc, config.value());
	if (!service) {
		std::cerr << service.error().message << "\n";
		return 1;
	}

	VideoRequest request;
	request.url = "https://www.youtube.com/watch?v=F0tYP4OQ0-k";  // Example URL
	request.quality = "480p";
	request.end_time = "30";

	service.value().store()->set_observer(
		[](const JobId &, const ProgressSnapshot &snapshot) {
			if (snapshot.status != JobStatus::downloading) return;
			std::cout << "\r" << std::fixed << std::setprecision(1)
					  << snapshot.percent.value_or(0.0) << "% "
					  << "Speed: " << snapshot.speed.value_or("?") << " "
					  << "ETA: " << snapshot.eta.value_or("?") << "   "
					  << std::flush;
		});

	std::cout << "Starting download of the first 30s at 480p...\n";

	service.value().async_download_video(
		request,
		[](const JobId &id) { std::cout << "Download id: " << id << "\n"; },
		[](Result<DownloadResult> res) {
			if (res.has_error()) {
				spdlog::error("Download failed: {}", res.error().message);
				return;
			}
			std::cout << "\nOperation complete.\n"
					  << "Downloaded to: " << res.value().artifact.string()
					  << "\n"
					  << "Served at: " << res.value().download_url << "\n";
		});

	ioc.run();
	return 0;
}
