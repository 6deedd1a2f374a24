#include <fmt/format.h>
#include <fmt/ranges.h>
#include <spdlog/spdlog.h>

#include <boost/asio/post.hpp>
#include <filesystem>
#include <mutex>
#include <tubefetch/process_runner.hpp>
#include <unordered_map>
#include <utility>

#include "process/process_session.hpp"
#include "utils.hpp"

namespace tubefetch {

namespace fs = std::filesystem;

struct ProcessRunner::Impl {
	asio::io_context &ioc;
	std::string executable;
	std::string display_name;  // executable file name, used in messages
	std::shared_ptr<ProgressStore> store;
	std::shared_ptr<const OutputParser> parser;

	mutable std::mutex mutex;
	std::unordered_map<JobId, std::weak_ptr<process::ProcessSession>> active;

	Impl(asio::io_context &ioc_, std::string exe,
		 std::shared_ptr<ProgressStore> store_,
		 std::shared_ptr<const OutputParser> parser_)
		: ioc(ioc_),
		  executable(std::move(exe)),
		  display_name(fs::path(executable).filename().string()),
		  store(std::move(store_)),
		  parser(std::move(parser_)) {}

	void finish_job(const JobId &id, const ExtractionArguments &plan,
					process::ProcessExit exit, const Completion &on_done);

	[[nodiscard]] std::string failure_message(
		const process::ProcessExit &exit) const;
};

std::string ProcessRunner::Impl::failure_message(
	const process::ProcessExit &exit) const {
	auto stderr_text = utils::trim(exit.error_output);
	if (!stderr_text.empty()) return std::string(stderr_text);
	if (exit.exit_code == 0) {
		return fmt::format("{} exited with code 0 but produced no output",
						   display_name);
	}
	return fmt::format("{} exited with code {}", display_name, exit.exit_code);
}

void ProcessRunner::Impl::finish_job(const JobId &id,
									 const ExtractionArguments &plan,
									 process::ProcessExit exit,
									 const Completion &on_done) {
	{
		std::lock_guard lock(mutex);
		active.erase(id);
	}

	Result<void> result = outcome::success();
	if (exit.interruption) {
		spdlog::warn("[{}] {}", id, exit.interruption->message);
		store->set(id, ProgressSnapshot::cancelled(exit.interruption->message));
		result = *exit.interruption;
	} else if (exit.exit_code == 0 && artifact_present(plan)) {
		spdlog::info("[{}] completed: {}", id, plan.artifact.string());
		store->set(id, ProgressSnapshot::completed());
	} else {
		auto message = failure_message(exit);
		spdlog::error("[{}] failed (exit code {}): {}", id, exit.exit_code,
					  message);
		store->set(id, ProgressSnapshot::failed(message));
		result = Error{errc::extraction_failed, std::move(message)};
	}

	if (on_done) on_done(std::move(result));
}

ProcessRunner::ProcessRunner(asio::io_context &ioc, std::string executable,
							 std::shared_ptr<ProgressStore> store,
							 std::shared_ptr<const OutputParser> parser)
	: m_impl(std::make_shared<Impl>(ioc, std::move(executable),
									std::move(store), std::move(parser))) {}

ProcessRunner::~ProcessRunner() = default;

asio::any_io_executor ProcessRunner::get_executor() const {
	return m_impl->ioc.get_executor();
}

void ProcessRunner::run(const JobId &id, const ExtractionArguments &plan,
						RunOptions options, Completion on_done) {
	auto impl = m_impl;

	auto session = std::make_shared<process::ProcessSession>(
		impl->ioc,
		[impl, id](std::string_view line) {
			if (auto update = impl->parser->parse(line)) {
				impl->store->set(id, ProgressSnapshot::downloading(*update));
			} else {
				spdlog::trace("[{}] {}", id, line);
			}
		},
		[impl, id, plan, on_done](process::ProcessExit exit) {
			impl->finish_job(id, plan, std::move(exit), on_done);
		});

	spdlog::info("[{}] launching {} {}", id, impl->executable,
				 fmt::join(plan.args, " "));

	auto spawned = session->spawn(impl->executable, plan.args);
	if (!spawned) {
		auto error = spawned.error();
		spdlog::error("[{}] {}", id, error.message);
		impl->store->set(id, ProgressSnapshot::failed(error.message));
		asio::post(impl->ioc,
				   [on_done = std::move(on_done), error]() mutable {
					   if (on_done) on_done(std::move(error));
				   });
		return;
	}

	impl->store->set(id, ProgressSnapshot::starting());
	{
		std::lock_guard lock(impl->mutex);
		impl->active[id] = session;
	}
	session->begin(options.timeout);
}

void ProcessRunner::capture(std::vector<std::string> args,
							CaptureCompletion on_done) {
	auto impl = m_impl;

	auto session = std::make_shared<process::ProcessSession>(
		impl->ioc, nullptr,
		[impl, on_done](process::ProcessExit exit) {
			if (exit.exit_code == 0 && !exit.interruption) {
				return on_done(std::move(exit.output));
			}
			auto stderr_text = utils::trim(exit.error_output);
			on_done(Error{errc::extraction_failed,
						  stderr_text.empty()
							  ? fmt::format("{} failed ({})",
											impl->display_name, exit.exit_code)
							  : std::string(stderr_text)});
		},
		process::OutputMode::raw);

	spdlog::debug("Running {} {}", impl->executable, fmt::join(args, " "));

	auto spawned = session->spawn(impl->executable, args);
	if (!spawned) {
		asio::post(impl->ioc, [on_done = std::move(on_done),
							   error = spawned.error()]() mutable {
			on_done(std::move(error));
		});
		return;
	}
	session->begin(std::chrono::seconds{0});
}

bool ProcessRunner::cancel(const JobId &id) {
	std::shared_ptr<process::ProcessSession> session;
	{
		std::lock_guard lock(m_impl->mutex);
		auto it = m_impl->active.find(id);
		if (it == m_impl->active.end()) return false;
		session = it->second.lock();
	}
	if (!session) return false;

	spdlog::info("[{}] cancelling", id);
	session->interrupt(Error{errc::cancelled, "cancelled"});
	return true;
}

std::size_t ProcessRunner::active_jobs() const {
	std::lock_guard lock(m_impl->mutex);
	return m_impl->active.size();
}

bool ProcessRunner::artifact_present(const ExtractionArguments &plan) {
	std::error_code ec;
	if (plan.kind != JobKind::playlist) {
		return fs::is_regular_file(plan.artifact, ec);
	}
	if (!fs::is_directory(plan.artifact, ec)) return false;
	for (const auto &entry : fs::directory_iterator(plan.artifact, ec)) {
		if (entry.is_regular_file(ec)) return true;
	}
	return false;
}

}  // namespace tubefetch
