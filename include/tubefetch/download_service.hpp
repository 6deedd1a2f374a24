#pragma once

#include <tubefetch/tubefetch_export.h>

#include <boost/asio/any_completion_executor.hpp>
#include <boost/asio/any_completion_handler.hpp>
#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/associated_executor.hpp>
#include <boost/asio/async_result.hpp>
#include <boost/asio/io_context.hpp>
#include <cstddef>
#include <functional>
#include <memory>
#include <string>
#include <tubefetch/config.hpp>
#include <tubefetch/progress_store.hpp>
#include <tubefetch/result.hpp>
#include <tubefetch/types.hpp>

namespace tubefetch {

namespace asio = boost::asio;

/// Accepts download requests and runs them through the extractor.
///
/// A request is validated, given a fresh job id and planned; the id is then
/// reported through `on_accepted` (before the job is admitted) so callers
/// can poll progress() while the job runs. The completion handler fires once
/// the job is terminal, with the artifact URL or the job's error.
///
/// At most `max_concurrent_downloads` extractor processes run at once;
/// further jobs stay `queued` in FIFO order.
class TUBEFETCH_EXPORT DownloadService {
   public:
	using AcceptCallback = std::function<void(const JobId &)>;
	using CompletionExecutor = asio::any_completion_executor;
	using DownloadHandler =
		asio::any_completion_handler<void(Result<DownloadResult>)>;
	using TextHandler = asio::any_completion_handler<void(Result<std::string>)>;

	DownloadService(const DownloadService &) = delete;
	DownloadService &operator=(const DownloadService &) = delete;
	DownloadService(DownloadService &&) noexcept;
	DownloadService &operator=(DownloadService &&) noexcept;
	~DownloadService();

	/// Creates the download directory and binds the service to `ioc`.
	static Result<DownloadService> create(asio::io_context &ioc,
										  ServiceConfig config);

	[[nodiscard]] asio::any_io_executor get_executor() const;
	[[nodiscard]] const ServiceConfig &config() const;

	template <BOOST_ASIO_COMPLETION_TOKEN_FOR(void(Result<DownloadResult>))
				  CompletionToken>
	auto async_download_video(VideoRequest request, AcceptCallback on_accepted,
							  CompletionToken &&token) {
		return asio::async_initiate<CompletionToken,
									void(Result<DownloadResult>)>(
			[this, request = std::move(request),
			 on_accepted = std::move(on_accepted)](auto &&handler) mutable {
				CompletionExecutor handler_ex =
					asio::get_associated_executor(handler, get_executor());
				download_video_impl(
					std::move(request), std::move(on_accepted),
					DownloadHandler{std::forward<decltype(handler)>(handler)},
					std::move(handler_ex));
			},
			token);
	}

	template <BOOST_ASIO_COMPLETION_TOKEN_FOR(void(Result<DownloadResult>))
				  CompletionToken>
	auto async_download_audio(AudioRequest request, AcceptCallback on_accepted,
							  CompletionToken &&token) {
		return asio::async_initiate<CompletionToken,
									void(Result<DownloadResult>)>(
			[this, request = std::move(request),
			 on_accepted = std::move(on_accepted)](auto &&handler) mutable {
				CompletionExecutor handler_ex =
					asio::get_associated_executor(handler, get_executor());
				download_audio_impl(
					std::move(request), std::move(on_accepted),
					DownloadHandler{std::forward<decltype(handler)>(handler)},
					std::move(handler_ex));
			},
			token);
	}

	/// Completes with the playlist directory URL once every item finished.
	/// Any failure fails the whole job; files already written stay on disk.
	template <BOOST_ASIO_COMPLETION_TOKEN_FOR(void(Result<DownloadResult>))
				  CompletionToken>
	auto async_download_playlist(PlaylistRequest request,
								 AcceptCallback on_accepted,
								 CompletionToken &&token) {
		return asio::async_initiate<CompletionToken,
									void(Result<DownloadResult>)>(
			[this, request = std::move(request),
			 on_accepted = std::move(on_accepted)](auto &&handler) mutable {
				CompletionExecutor handler_ex =
					asio::get_associated_executor(handler, get_executor());
				download_playlist_impl(
					std::move(request), std::move(on_accepted),
					DownloadHandler{std::forward<decltype(handler)>(handler)},
					std::move(handler_ex));
			},
			token);
	}

	/// Raw `-j` JSON of one video. Not tracked in the progress store.
	template <BOOST_ASIO_COMPLETION_TOKEN_FOR(void(Result<std::string>))
				  CompletionToken>
	auto async_video_info(std::string url, CompletionToken &&token) {
		return asio::async_initiate<CompletionToken, void(Result<std::string>)>(
			[this, url = std::move(url)](auto &&handler) mutable {
				CompletionExecutor handler_ex =
					asio::get_associated_executor(handler, get_executor());
				video_info_impl(
					std::move(url),
					TextHandler{std::forward<decltype(handler)>(handler)},
					std::move(handler_ex));
			},
			token);
	}

	/// Raw `-F` format table of one video id.
	template <BOOST_ASIO_COMPLETION_TOKEN_FOR(void(Result<std::string>))
				  CompletionToken>
	auto async_list_formats(std::string video_id, CompletionToken &&token) {
		return asio::async_initiate<CompletionToken, void(Result<std::string>)>(
			[this, video_id = std::move(video_id)](auto &&handler) mutable {
				CompletionExecutor handler_ex =
					asio::get_associated_executor(handler, get_executor());
				list_formats_impl(
					std::move(video_id),
					TextHandler{std::forward<decltype(handler)>(handler)},
					std::move(handler_ex));
			},
			token);
	}

	/// Latest snapshot of a job, or errc::unknown_job.
	[[nodiscard]] Result<ProgressSnapshot> progress(const JobId &id) const;

	/// Cancels a queued or running job. Fails with errc::unknown_job for ids
	/// never seen (or evicted) and errc::not_running for finished jobs.
	Result<void> cancel(const JobId &id);

	[[nodiscard]] std::size_t running_jobs() const;
	[[nodiscard]] std::size_t queued_jobs() const;

	/// Shared store, e.g. to attach an observer.
	[[nodiscard]] std::shared_ptr<ProgressStore> store() const;

   private:
	struct Impl;
	std::shared_ptr<Impl> m_impl;

	explicit DownloadService(std::shared_ptr<Impl> impl);

	void download_video_impl(VideoRequest request, AcceptCallback on_accepted,
							 DownloadHandler handler,
							 CompletionExecutor handler_ex);
	void download_audio_impl(AudioRequest request, AcceptCallback on_accepted,
							 DownloadHandler handler,
							 CompletionExecutor handler_ex);
	void download_playlist_impl(PlaylistRequest request,
								AcceptCallback on_accepted,
								DownloadHandler handler,
								CompletionExecutor handler_ex);
	void video_info_impl(std::string url, TextHandler handler,
						 CompletionExecutor handler_ex);
	void list_formats_impl(std::string video_id, TextHandler handler,
						   CompletionExecutor handler_ex);
};

}  // namespace tubefetch
