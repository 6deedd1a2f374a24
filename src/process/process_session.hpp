#pragma once

#include <array>
#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/strand.hpp>
#include <boost/asio/streambuf.hpp>
#include <boost/process/async_pipe.hpp>
#include <boost/process/child.hpp>
#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <tubefetch/result.hpp>
#include <vector>

namespace tubefetch::process {

namespace asio = boost::asio;
namespace bp = boost::process;

/// How stdout is consumed: split into lines for the line handler, or kept
/// byte for byte in ProcessExit::output.
enum class OutputMode { lines, raw };

struct ProcessExit {
	int exit_code = -1;
	std::string output;					// stdout, OutputMode::raw only
	std::string error_output;			// everything read from stderr
	std::optional<Error> interruption;	// set when cancelled or timed out
};

/// One child process with both output pipes read asynchronously.
///
/// Every handler runs on the session's strand, so stdout lines are delivered
/// in order and never concurrently. The exit handler fires once, after the
/// process exited and both pipes reached EOF.
class ProcessSession : public std::enable_shared_from_this<ProcessSession> {
   public:
	using LineHandler = std::function<void(std::string_view)>;
	using ExitHandler = std::function<void(ProcessExit)>;

	ProcessSession(asio::io_context &ioc, LineHandler on_line,
				   ExitHandler on_exit, OutputMode mode = OutputMode::lines);

	/// Spawns the process. On failure nothing is running and the exit
	/// handler will never be called.
	Result<void> spawn(const std::string &executable,
					   const std::vector<std::string> &args);

	/// Starts reading output and arms the timeout (zero disables it).
	void begin(std::chrono::seconds timeout);

	/// Kills the process; the exit handler reports `reason`. Thread-safe.
	void interrupt(Error reason);

   private:
	void read_stdout();
	void read_stdout_raw();
	void read_stderr();
	void deliver(std::string_view chunk);
	void on_process_exit(int exit_code, const std::error_code &ec);
	void try_finish();

	asio::io_context &ioc_;
	asio::strand<asio::io_context::executor_type> strand_;
	bp::async_pipe out_pipe_;
	bp::async_pipe err_pipe_;
	std::optional<bp::child> child_;  // engaged only after a successful spawn
	asio::steady_timer timer_;

	OutputMode mode_;
	asio::streambuf out_buf_;
	std::array<char, 4096> out_chunk_{};
	std::array<char, 4096> err_chunk_{};
	std::string output_;
	std::string error_output_;

	LineHandler on_line_;
	ExitHandler on_exit_;

	std::optional<Error> interruption_;
	std::optional<int> exit_code_;
	bool stdout_done_ = false;
	bool stderr_done_ = false;
	bool finished_ = false;
};

/// Resolves a bare program name through PATH; names containing a slash are
/// used as given. Returns an empty path when nothing is found.
std::string resolve_executable(const std::string &executable);

}  // namespace tubefetch::process
