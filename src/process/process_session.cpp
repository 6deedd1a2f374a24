#include "process/process_session.hpp"

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <boost/asio/bind_executor.hpp>
#include <boost/asio/buffers_iterator.hpp>
#include <boost/asio/dispatch.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/read_until.hpp>
#include <boost/filesystem/operations.hpp>
#include <boost/process/args.hpp>
#include <boost/process/async.hpp>
#include <boost/process/exe.hpp>
#include <boost/process/io.hpp>
#include <boost/process/search_path.hpp>
#include <istream>
#include <utility>

namespace tubefetch::process {

std::string resolve_executable(const std::string &executable) {
	if (executable.find('/') != std::string::npos) {
		boost::system::error_code ec;
		if (boost::filesystem::exists(executable, ec)) return executable;
		return {};
	}
	return bp::search_path(executable).string();
}

ProcessSession::ProcessSession(asio::io_context &ioc, LineHandler on_line,
							   ExitHandler on_exit, OutputMode mode)
	: ioc_(ioc),
	  strand_(asio::make_strand(ioc)),
	  out_pipe_(ioc),
	  err_pipe_(ioc),
	  timer_(ioc),
	  mode_(mode),
	  on_line_(std::move(on_line)),
	  on_exit_(std::move(on_exit)) {}

Result<void> ProcessSession::spawn(const std::string &executable,
								   const std::vector<std::string> &args) {
	auto exe = resolve_executable(executable);
	if (exe.empty()) {
		return Error{errc::launch_failed,
					 fmt::format("spawn {} ENOENT", executable)};
	}

	std::error_code ec;
	auto self = shared_from_this();
	bp::child spawned(
		bp::exe = exe, bp::args = args, bp::std_out > out_pipe_,
		bp::std_err > err_pipe_, bp::std_in < bp::null, ioc_,
		bp::on_exit([self](int exit_code, const std::error_code &exit_ec) {
			asio::post(self->strand_, [self, exit_code, exit_ec] {
				self->on_process_exit(exit_code, exit_ec);
			});
		}),
		ec);

	if (ec) {
		// A failed child must not wait on an unrelated pid when destroyed.
		spawned.detach();
		return Error{errc::launch_failed,
					 fmt::format("spawn {} failed: {}", executable,
								 ec.message())};
	}

	spdlog::debug("Spawned {} (pid {})", exe, spawned.id());
	child_.emplace(std::move(spawned));
	return outcome::success();
}

void ProcessSession::begin(std::chrono::seconds timeout) {
	auto self = shared_from_this();
	asio::dispatch(strand_, [self, timeout] {
		if (self->mode_ == OutputMode::raw) {
			self->read_stdout_raw();
		} else {
			self->read_stdout();
		}
		self->read_stderr();

		if (timeout.count() > 0) {
			self->timer_.expires_after(timeout);
			self->timer_.async_wait(asio::bind_executor(
				self->strand_,
				[self, timeout](const boost::system::error_code &ec) {
					if (ec || self->finished_) return;
					self->interrupt(
						Error{errc::timed_out,
							  fmt::format("timed out after {}s",
										  timeout.count())});
				}));
		}
	});
}

void ProcessSession::interrupt(Error reason) {
	auto self = shared_from_this();
	asio::dispatch(strand_, [self, reason = std::move(reason)]() mutable {
		if (self->finished_ || self->interruption_) return;
		self->interruption_ = std::move(reason);

		if (!self->child_) return;
		if (self->exit_code_) {
			// Already exited; descendants may still hold the pipes.
			boost::system::error_code ignored;
			self->out_pipe_.close(ignored);
			self->err_pipe_.close(ignored);
			return;
		}
		std::error_code ec;
		self->child_->terminate(ec);
		if (ec) {
			spdlog::warn("Failed to terminate pid {}: {}", self->child_->id(),
						 ec.message());
		}
	});
}

void ProcessSession::read_stdout() {
	asio::async_read_until(
		out_pipe_, out_buf_, '\n',
		asio::bind_executor(
			strand_, [self = shared_from_this()](
						 const boost::system::error_code &ec, std::size_t n) {
				if (!ec) {
					std::string line;
					line.reserve(n);
					std::istream is(&self->out_buf_);
					std::getline(is, line);
					self->deliver(line);
					return self->read_stdout();
				}

				// EOF (or the pipe was closed): flush an unterminated tail
				if (self->out_buf_.size() > 0) {
					auto data = self->out_buf_.data();
					std::string tail(asio::buffers_begin(data),
									 asio::buffers_end(data));
					self->out_buf_.consume(self->out_buf_.size());
					self->deliver(tail);
				}
				if (ec != asio::error::eof &&
					ec != asio::error::operation_aborted) {
					spdlog::debug("stdout read ended: {}", ec.message());
				}
				self->stdout_done_ = true;
				self->try_finish();
			}));
}

void ProcessSession::read_stdout_raw() {
	out_pipe_.async_read_some(
		asio::buffer(out_chunk_),
		asio::bind_executor(
			strand_, [self = shared_from_this()](
						 const boost::system::error_code &ec, std::size_t n) {
				if (n > 0) self->output_.append(self->out_chunk_.data(), n);
				if (!ec) return self->read_stdout_raw();

				self->stdout_done_ = true;
				self->try_finish();
			}));
}

void ProcessSession::read_stderr() {
	err_pipe_.async_read_some(
		asio::buffer(err_chunk_),
		asio::bind_executor(
			strand_, [self = shared_from_this()](
						 const boost::system::error_code &ec, std::size_t n) {
				if (n > 0) self->error_output_.append(self->err_chunk_.data(), n);
				if (!ec) return self->read_stderr();

				self->stderr_done_ = true;
				self->try_finish();
			}));
}

void ProcessSession::deliver(std::string_view chunk) {
	// Progress bars may redraw with carriage returns inside one line.
	while (!chunk.empty()) {
		auto pos = chunk.find('\r');
		auto line = chunk.substr(0, pos);
		if (!line.empty() && on_line_) on_line_(line);
		if (pos == std::string_view::npos) break;
		chunk.remove_prefix(pos + 1);
	}
}

void ProcessSession::on_process_exit(int exit_code, const std::error_code &ec) {
	if (ec) {
		// The child was already reaped (e.g. by terminate()); its status is
		// unknown.
		spdlog::debug("Exit status unavailable: {}", ec.message());
		exit_code = -1;
	}
	exit_code_ = exit_code;

	if (interruption_) {
		// Do not wait for descendants that still hold the pipes open.
		boost::system::error_code ignored;
		out_pipe_.close(ignored);
		err_pipe_.close(ignored);
	}
	try_finish();
}

void ProcessSession::try_finish() {
	if (finished_ || !exit_code_ || !stdout_done_ || !stderr_done_) return;
	finished_ = true;
	timer_.cancel();

	ProcessExit exit;
	exit.exit_code = *exit_code_;
	exit.output = std::move(output_);
	exit.error_output = std::move(error_output_);
	exit.interruption = std::move(interruption_);

	auto handler = std::move(on_exit_);
	on_line_ = nullptr;
	if (handler) handler(std::move(exit));
}

}  // namespace tubefetch::process
