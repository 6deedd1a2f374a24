#include <fmt/format.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>
#include <boost/program_options.hpp>
#include <csignal>
#include <iostream>
#include <optional>
#include <string>
#include <tubefetch/config.hpp>
#include <tubefetch/download_service.hpp>
#include <tubefetch/payloads.hpp>
#include <tubefetch/validation.hpp>
#include <utility>

namespace po = boost::program_options;
namespace asio = boost::asio;

using tubefetch::json;

// =============================================================================
// Output helpers
// =============================================================================

void print_payload(const json &payload) {
	std::cout << payload.dump(2) << "\n";
}

int fail(const tubefetch::Error &error) {
	spdlog::error("{}", error.message);
	print_payload(tubefetch::error_payload(error));
	return 1;
}

// One stderr line per status change or progress report.
void print_progress(const tubefetch::JobId &id,
					const tubefetch::ProgressSnapshot &snapshot) {
	using tubefetch::JobStatus;
	switch (snapshot.status) {
		case JobStatus::downloading:
			fmt::print(stderr, "[download] {:5.1f}% at {} ETA {}\n",
						 snapshot.percent.value_or(0.0),
						 snapshot.speed.value_or("?"),
						 snapshot.eta.value_or("?"));
			break;
		case JobStatus::error:
		case JobStatus::cancelled:
			fmt::print(stderr, "[{}] {}: {}\n", id,
						 tubefetch::to_string(snapshot.status),
						 snapshot.error_message.value_or(""));
			break;
		default:
			fmt::print(stderr, "[{}] {}\n", id,
						 tubefetch::to_string(snapshot.status));
	}
}

// =============================================================================
// CLI
// =============================================================================

struct CliOptions {
	std::string mode = "video";
	std::string url;
	std::optional<std::string> quality;
	std::optional<std::string> format;
	std::optional<std::string> start_time;
	std::optional<std::string> end_time;
	bool audio_only = false;
};

int run_download(asio::io_context &ioc, tubefetch::DownloadService &service,
				 const CliOptions &opts) {
	int exit_code = 1;
	std::optional<tubefetch::JobId> job;

	asio::signal_set signals(ioc, SIGINT, SIGTERM);
	signals.async_wait([&](const boost::system::error_code &ec, int sig) {
		if (ec) return;
		fmt::print(stderr, "\nReceived signal {}, cancelling.\n", sig);
		if (!job) return ioc.stop();
		if (auto cancelled = service.cancel(*job); !cancelled) {
			spdlog::warn("{}", cancelled.error().message);
		}
	});

	service.store()->set_observer(&print_progress);

	auto on_accepted = [&](const tubefetch::JobId &id) {
		job = id;
		spdlog::info("Download id {}", id);
	};
	auto on_done = [&](tubefetch::Result<tubefetch::DownloadResult> result) {
		signals.cancel();
		if (!result) {
			exit_code = fail(result.error());
			return;
		}
		spdlog::info("Saved to {}", result.value().artifact.string());
		print_payload(json(result.value()));
		exit_code = 0;
	};

	if (opts.mode == "audio") {
		tubefetch::AudioRequest request;
		request.url = opts.url;
		if (opts.format) request.format = *opts.format;
		if (opts.quality) request.quality = *opts.quality;
		service.async_download_audio(request, on_accepted, on_done);
	} else if (opts.mode == "playlist") {
		tubefetch::PlaylistRequest request;
		request.url = opts.url;
		request.audio_only = opts.audio_only;
		if (request.audio_only) request.format = "mp3";
		if (opts.format) request.format = *opts.format;
		if (opts.quality) request.quality = *opts.quality;
		service.async_download_playlist(request, on_accepted, on_done);
	} else {
		tubefetch::VideoRequest request;
		request.url = opts.url;
		if (opts.format) request.format = *opts.format;
		if (opts.quality) request.quality = *opts.quality;
		request.start_time = opts.start_time;
		request.end_time = opts.end_time;
		service.async_download_video(request, on_accepted, on_done);
	}

	ioc.run();
	return exit_code;
}

int run_query(asio::io_context &ioc, tubefetch::DownloadService &service,
			  const CliOptions &opts) {
	int exit_code = 1;

	if (opts.mode == "info") {
		service.async_video_info(
			opts.url, [&](tubefetch::Result<std::string> raw) {
				if (!raw) {
					exit_code = fail(raw.error());
					return;
				}
				auto payload = tubefetch::video_info_payload(raw.value());
				if (!payload) {
					exit_code = fail(payload.error());
					return;
				}
				print_payload(payload.value());
				exit_code = 0;
			});
	} else {
		service.async_list_formats(
			opts.url, [&](tubefetch::Result<std::string> formats) {
				if (!formats) {
					exit_code = fail(formats.error());
					return;
				}
				print_payload(tubefetch::formats_payload(formats.value()));
				exit_code = 0;
			});
	}

	ioc.run();
	return exit_code;
}

// =============================================================================
// Main Entry Point
// =============================================================================

int main(int argc, char *argv[]) {
	try {
		auto stderr_logger = spdlog::stderr_color_mt("stderr");
		spdlog::set_default_logger(stderr_logger);
		spdlog::set_pattern("[tubefetch] %^%l%$: %v");

		po::options_description desc("Options");
		// clang-format off
		desc.add_options()
			("help,h", "Print help message")
			("mode,m", po::value<std::string>()->default_value("video"),
			 "video, audio, playlist, info, formats or validate")
			("url", po::value<std::string>(),
			 "YouTube URL (video id for --mode formats)")
			("quality,q", po::value<std::string>(),
			 "Maximum height (e.g. 720p) or audio quality (e.g. 192k)")
			("format,f", po::value<std::string>(),
			 "Container (mp4, webm, mkv) or audio codec (mp3, m4a, ...)")
			("start-time", po::value<std::string>(),
			 "Trim start, seconds or [HH:]MM:SS")
			("end-time", po::value<std::string>(),
			 "Trim end, seconds or [HH:]MM:SS")
			("audio-only,x", "Playlist: extract audio only")
			("verbose,v", "Enable verbose logging");
		// clang-format on
		desc.add(tubefetch::config_options());

		po::positional_options_description p;
		p.add("url", 1);

		po::variables_map vm;
		po::store(po::command_line_parser(argc, argv)
					  .options(desc)
					  .positional(p)
					  .run(),
				  vm);
		if (auto env = tubefetch::store_environment(desc, vm); !env) {
			return fail(env.error());
		}
		po::notify(vm);

		if (vm.count("help") || !vm.count("url")) {
			std::cout << "Usage: tubefetch [options] <url>\n" << desc << "\n";
			return vm.count("help") ? 0 : 1;
		}

		spdlog::set_level(vm.count("verbose") ? spdlog::level::debug
											  : spdlog::level::info);

		CliOptions opts;
		opts.mode = vm["mode"].as<std::string>();
		opts.url = vm["url"].as<std::string>();
		if (vm.count("quality")) opts.quality = vm["quality"].as<std::string>();
		if (vm.count("format")) opts.format = vm["format"].as<std::string>();
		if (vm.count("start-time")) {
			opts.start_time = vm["start-time"].as<std::string>();
		}
		if (vm.count("end-time")) {
			opts.end_time = vm["end-time"].as<std::string>();
		}
		opts.audio_only = vm.count("audio-only") > 0;

		if (opts.mode == "validate") {
			bool valid = tubefetch::is_valid_youtube_url(opts.url);
			print_payload(tubefetch::validation_payload(valid));
			return valid ? 0 : 1;
		}

		auto config = tubefetch::config_from_variables(vm);
		if (!config) return fail(config.error());

		asio::io_context ioc;
		auto service = tubefetch::DownloadService::create(ioc, config.value());
		if (!service) return fail(service.error());

		if (opts.mode == "info" || opts.mode == "formats") {
			return run_query(ioc, service.value(), opts);
		}
		if (opts.mode == "video" || opts.mode == "audio" ||
			opts.mode == "playlist") {
			return run_download(ioc, service.value(), opts);
		}

		return fail(tubefetch::Error{tubefetch::errc::invalid_request,
									 fmt::format("Unknown mode: {}", opts.mode)});

	} catch (const std::exception &e) {
		fmt::print(stderr, "ERROR: {}\n", e.what());
		return 1;
	}
}
