#pragma once

#include <boost/outcome.hpp>
#include <string>
#include <system_error>
#include <utility>

namespace tubefetch {

namespace outcome = boost::outcome_v2;

enum class errc {
	success = 0,
	// Request errors
	invalid_request = 10,
	invalid_config,
	invalid_number_format,

	// Job lifecycle
	unknown_job = 20,
	not_running,
	launch_failed,
	extraction_failed,
	cancelled,
	timed_out,

	// Metadata
	metadata_parse_failed = 30,

	// I/O
	directory_create_failed = 40,

	unknown = 100
};

std::error_code make_error_code(errc e);

}  // namespace tubefetch

namespace std {
template <>
struct is_error_code_enum<tubefetch::errc> : true_type {};
}  // namespace std

namespace tubefetch {

/// Error code plus the text surfaced to callers: captured stderr, the launch
/// error or a validation message. Falls back to the category message.
struct Error {
	std::error_code code;
	std::string message;

	Error() = default;
	Error(errc e) : code(make_error_code(e)), message(code.message()) {}
	Error(errc e, std::string msg)
		: code(make_error_code(e)), message(std::move(msg)) {}
	Error(std::error_code ec, std::string msg)
		: code(ec), message(std::move(msg)) {}

	[[nodiscard]] bool is(errc e) const { return code == make_error_code(e); }
};

// Lets Outcome treat Error as an error_code carrying a payload.
inline std::error_code make_error_code(const Error &e) { return e.code; }

[[noreturn]] inline void outcome_throw_as_system_error_with_payload(
	const Error &e) {
	throw std::system_error(e.code, e.message);
}

template <typename T>
using Result = outcome::result<T, Error>;

}  // namespace tubefetch
