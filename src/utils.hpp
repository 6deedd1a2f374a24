#pragma once

#include <boost/charconv.hpp>
#include <string>
#include <string_view>
#include <tubefetch/result.hpp>

namespace tubefetch::utils {

// =============================================================================
// Numeric conversions utilizing boost::charconv
// =============================================================================

template <typename T>
Result<T> to_number(std::string_view sv) {
	T val{};
	auto res =
		boost::charconv::from_chars(sv.data(), sv.data() + sv.size(), val);
	if (res.ec == std::errc{} && res.ptr == sv.data() + sv.size()) {
		return val;
	}
	return Error{errc::invalid_number_format,
				 "Invalid number: " + std::string(sv)};
}

inline Result<double> to_double(std::string_view sv) {
	return to_number<double>(sv);
}

// =============================================================================
// String helpers
// =============================================================================

inline std::string_view trim(std::string_view sv) {
	constexpr std::string_view ws = " \t\r\n";
	auto first = sv.find_first_not_of(ws);
	if (first == std::string_view::npos) return {};
	auto last = sv.find_last_not_of(ws);
	return sv.substr(first, last - first + 1);
}

}  // namespace tubefetch::utils
