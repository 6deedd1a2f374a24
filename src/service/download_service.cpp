#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <boost/asio/dispatch.hpp>
#include <boost/asio/post.hpp>
#include <filesystem>
#include <functional>
#include <memory>
#include <tubefetch/download_service.hpp>
#include <tubefetch/job_id.hpp>
#include <tubefetch/job_planner.hpp>
#include <tubefetch/process_runner.hpp>
#include <tubefetch/validation.hpp>
#include <utility>

#include "service/admission.hpp"

namespace tubefetch {

namespace fs = std::filesystem;

namespace {

using JobCallback = std::function<void(Result<DownloadResult>)>;
using TextCallback = std::function<void(Result<std::string>)>;

// Shares the move-only handler between the paths that may complete it;
// exactly one of them does. Completion is posted to `io_ex` so it never runs
// inside the initiating call, then dispatched to the handler's executor.
template <typename T>
std::function<void(Result<T>)> complete_on(
	asio::any_completion_handler<void(Result<T>)> handler,
	DownloadService::CompletionExecutor handler_ex,
	asio::any_io_executor io_ex) {
	auto shared =
		std::make_shared<asio::any_completion_handler<void(Result<T>)>>(
			std::move(handler));
	return [shared, handler_ex = std::move(handler_ex),
			io_ex = std::move(io_ex)](Result<T> result) {
		asio::post(io_ex, [shared, handler_ex,
						   result = std::move(result)]() mutable {
			asio::dispatch(handler_ex,
						   [shared, result = std::move(result)]() mutable {
							   (*shared)(std::move(result));
						   });
		});
	};
}

}  // namespace

struct DownloadService::Impl : std::enable_shared_from_this<Impl> {
	asio::io_context &ioc;
	ServiceConfig config;
	std::shared_ptr<ProgressStore> store;
	JobPlanner planner;
	ProcessRunner runner;
	service::AdmissionQueue admission;

	Impl(asio::io_context &ioc_, ServiceConfig config_)
		: ioc(ioc_),
		  config(std::move(config_)),
		  store(std::make_shared<ProgressStore>(ProgressStore::Options{
			  config.progress_ttl, config.store_capacity})),
		  planner(config.download_dir),
		  runner(ioc, config.extractor, store),
		  admission(config.max_concurrent_downloads) {}

	[[nodiscard]] std::string artifact_url(
		const ExtractionArguments &plan) const {
		return fmt::format("{}/{}", config.public_prefix, plan.public_name);
	}

	template <typename Request, typename PlanFn>
	void start_job(const Request &request, PlanFn &&plan_fn,
				   AcceptCallback on_accepted, JobCallback handler);

	void admit(JobId id, ExtractionArguments plan, JobCallback handler);
};

template <typename Request, typename PlanFn>
void DownloadService::Impl::start_job(const Request &request, PlanFn &&plan_fn,
									  AcceptCallback on_accepted,
									  JobCallback handler) {
	if (auto valid = validate(request); !valid) {
		spdlog::warn("Rejected request for '{}': {}", request.url,
					 valid.error().message);
		return handler(valid.error());
	}

	auto id = allocate_job_id();
	ExtractionArguments plan = plan_fn(id);

	if (plan.kind == JobKind::playlist) {
		std::error_code ec;
		fs::create_directories(plan.artifact, ec);
		if (ec) {
			spdlog::error("[{}] cannot create {}: {}", id,
						  plan.artifact.string(), ec.message());
			return handler(Error{errc::directory_create_failed,
								 fmt::format("Cannot create {}: {}",
											 plan.artifact.string(),
											 ec.message())});
		}
	}

	if (auto evicted = store->sweep(); evicted > 0) {
		spdlog::debug("Evicted {} expired job(s)", evicted);
	}
	store->set(id, ProgressSnapshot::queued());
	spdlog::info("[{}] accepted {} download of {}", id, to_string(plan.kind),
				 request.url);

	if (on_accepted) on_accepted(id);
	admit(std::move(id), std::move(plan), std::move(handler));
}

void DownloadService::Impl::admit(JobId id, ExtractionArguments plan,
								  JobCallback handler) {
	auto self = shared_from_this();

	auto start = [self, id, plan, handler] {
		RunOptions options;
		options.timeout = self->config.job_timeout;
		self->runner.run(
			id, plan, options,
			[self, id, plan, handler](Result<void> ran) {
				self->admission.release();
				if (!ran) return handler(ran.error());
				handler(DownloadResult{id, plan.kind, self->artifact_url(plan),
									   plan.artifact});
			});
	};

	auto abandon = [self, id, handler] {
		spdlog::info("[{}] cancelled while queued", id);
		self->store->set(id, ProgressSnapshot::cancelled("cancelled"));
		handler(Error{errc::cancelled, "cancelled"});
	};

	admission.submit(id, std::move(start), std::move(abandon));
}

DownloadService::DownloadService(std::shared_ptr<Impl> impl)
	: m_impl(std::move(impl)) {}
DownloadService::~DownloadService() = default;
DownloadService::DownloadService(DownloadService &&) noexcept = default;
DownloadService &DownloadService::operator=(DownloadService &&) noexcept =
	default;

Result<DownloadService> DownloadService::create(asio::io_context &ioc,
												ServiceConfig config) {
	BOOST_OUTCOME_TRY(valid, validate_config(std::move(config)));
	config = std::move(valid);

	std::error_code ec;
	fs::create_directories(config.download_dir, ec);
	if (ec) {
		return Error{errc::directory_create_failed,
					 fmt::format("Cannot create download directory {}: {}",
								 config.download_dir.string(), ec.message())};
	}
	return DownloadService(std::make_shared<Impl>(ioc, std::move(config)));
}

asio::any_io_executor DownloadService::get_executor() const {
	return m_impl->ioc.get_executor();
}

const ServiceConfig &DownloadService::config() const { return m_impl->config; }

std::shared_ptr<ProgressStore> DownloadService::store() const {
	return m_impl->store;
}

void DownloadService::download_video_impl(VideoRequest request,
										  AcceptCallback on_accepted,
										  DownloadHandler handler,
										  CompletionExecutor handler_ex) {
	auto &impl = *m_impl;
	impl.start_job(
		request,
		[&](const JobId &id) { return impl.planner.plan_video(id, request); },
		std::move(on_accepted),
		complete_on(std::move(handler), std::move(handler_ex),
					get_executor()));
}

void DownloadService::download_audio_impl(AudioRequest request,
										  AcceptCallback on_accepted,
										  DownloadHandler handler,
										  CompletionExecutor handler_ex) {
	auto &impl = *m_impl;
	impl.start_job(
		request,
		[&](const JobId &id) { return impl.planner.plan_audio(id, request); },
		std::move(on_accepted),
		complete_on(std::move(handler), std::move(handler_ex),
					get_executor()));
}

void DownloadService::download_playlist_impl(PlaylistRequest request,
											 AcceptCallback on_accepted,
											 DownloadHandler handler,
											 CompletionExecutor handler_ex) {
	auto &impl = *m_impl;
	impl.start_job(
		request,
		[&](const JobId &id) {
			return impl.planner.plan_playlist(id, request);
		},
		std::move(on_accepted),
		complete_on(std::move(handler), std::move(handler_ex),
					get_executor()));
}

void DownloadService::video_info_impl(std::string url, TextHandler handler,
									  CompletionExecutor handler_ex) {
	TextCallback done = complete_on(std::move(handler), std::move(handler_ex),
									get_executor());
	if (!is_valid_youtube_url(url)) {
		return done(
			Error{errc::invalid_request, "Invalid or missing YouTube URL"});
	}
	m_impl->runner.capture({"-j", "--no-warnings", std::move(url)},
						   std::move(done));
}

void DownloadService::list_formats_impl(std::string video_id,
										TextHandler handler,
										CompletionExecutor handler_ex) {
	TextCallback done = complete_on(std::move(handler), std::move(handler_ex),
									get_executor());
	if (!is_valid_video_id(video_id)) {
		return done(Error{errc::invalid_request,
						  fmt::format("Invalid video id: {}", video_id)});
	}
	m_impl->runner.capture({watch_url(video_id), "-F"}, std::move(done));
}

Result<ProgressSnapshot> DownloadService::progress(const JobId &id) const {
	return m_impl->store->get(id);
}

Result<void> DownloadService::cancel(const JobId &id) {
	if (m_impl->admission.withdraw(id)) return outcome::success();
	if (m_impl->runner.cancel(id)) return outcome::success();

	BOOST_OUTCOME_TRY(snapshot, m_impl->store->get(id));
	return Error{errc::not_running,
				 fmt::format("Download {} is already {}", id,
							 to_string(snapshot.status))};
}

std::size_t DownloadService::running_jobs() const {
	return m_impl->admission.running();
}

std::size_t DownloadService::queued_jobs() const {
	return m_impl->admission.waiting();
}

}  // namespace tubefetch
