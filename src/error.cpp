#include <string>
#include <tubefetch/result.hpp>

namespace tubefetch {

struct tubefetch_error_category : std::error_category {
	const char *name() const noexcept override { return "tubefetch"; }

	std::string message(int ev) const override {
		switch (static_cast<errc>(ev)) {
			case errc::success: return "Success";
			case errc::invalid_request: return "Invalid request";
			case errc::invalid_config: return "Invalid configuration";
			case errc::invalid_number_format: return "Invalid number format";
			case errc::unknown_job: return "Unknown download id";
			case errc::not_running: return "Download is not running";
			case errc::launch_failed: return "Failed to launch extractor";
			case errc::extraction_failed: return "Extraction failed";
			case errc::cancelled: return "Download cancelled";
			case errc::timed_out: return "Download timed out";
			case errc::metadata_parse_failed:
				return "Failed to parse metadata";
			case errc::directory_create_failed:
				return "Failed to create output directory";
			default: return "Unknown error";
		}
	}
};

const std::error_category &tubefetch_category() {
	static tubefetch_error_category category;
	return category;
}

std::error_code make_error_code(errc e) {
	return {static_cast<int>(e), tubefetch_category()};
}

}  // namespace tubefetch
