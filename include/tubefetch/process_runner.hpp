#pragma once

#include <tubefetch/tubefetch_export.h>

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/io_context.hpp>
#include <chrono>
#include <functional>
#include <memory>
#include <string>
#include <tubefetch/output_parser.hpp>
#include <tubefetch/progress_store.hpp>
#include <tubefetch/result.hpp>
#include <tubefetch/types.hpp>
#include <vector>

namespace tubefetch {

namespace asio = boost::asio;

struct TUBEFETCH_EXPORT RunOptions {
	// Zero disables the limit.
	std::chrono::seconds timeout{0};
};

/// Launches the extractor executable and drives a job's state machine:
///
///   starting -> downloading* -> completed | error | cancelled
///
/// stdout is consumed line by line as it arrives and fed to the OutputParser;
/// stderr is accumulated for the error message. On exit the job is
/// `completed` only if the exit code is 0 and the planned artifact exists.
/// The snapshot is written to the store before the completion is invoked.
///
/// All process I/O runs on the io_context passed at construction; it must
/// be running for jobs to make progress.
class TUBEFETCH_EXPORT ProcessRunner {
   public:
	using Completion = std::function<void(Result<void>)>;
	using CaptureCompletion = std::function<void(Result<std::string>)>;

	ProcessRunner(asio::io_context &ioc, std::string executable,
				  std::shared_ptr<ProgressStore> store,
				  std::shared_ptr<const OutputParser> parser =
					  std::make_shared<YtDlpProgressParser>());
	~ProcessRunner();

	ProcessRunner(const ProcessRunner &) = delete;
	ProcessRunner &operator=(const ProcessRunner &) = delete;

	[[nodiscard]] asio::any_io_executor get_executor() const;

	/// Runs a tracked job. `on_done` is invoked exactly once, from the
	/// runner's executor, after the job's terminal snapshot is stored.
	void run(const JobId &id, const ExtractionArguments &plan,
			 RunOptions options, Completion on_done);

	/// Runs the extractor untracked and collects its stdout unchanged (used
	/// for metadata queries). Fails with the stderr text on a nonzero exit.
	void capture(std::vector<std::string> args, CaptureCompletion on_done);

	/// Terminates the process of a running job; the job ends `cancelled`.
	/// Returns false if `id` has no running process.
	bool cancel(const JobId &id);

	[[nodiscard]] std::size_t active_jobs() const;

	/// True if the planned output exists: the file, or for playlists a
	/// directory holding at least one file.
	[[nodiscard]] static bool artifact_present(const ExtractionArguments &plan);

   private:
	struct Impl;
	std::shared_ptr<Impl> m_impl;
};

}  // namespace tubefetch
