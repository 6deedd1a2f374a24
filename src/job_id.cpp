#include <boost/regex.hpp>
#include <boost/uuid/random_generator.hpp>
#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_io.hpp>
#include <tubefetch/job_id.hpp>

namespace tubefetch {

JobId allocate_job_id() {
	// random_generator is not thread-safe; one per thread.
	thread_local boost::uuids::random_generator generator;
	return boost::uuids::to_string(generator());
}

bool is_well_formed_job_id(std::string_view id) {
	static const boost::regex re(
		R"(^[0-9a-f]{8}-[0-9a-f]{4}-[0-9a-f]{4}-[0-9a-f]{4}-[0-9a-f]{12}$)");
	return boost::regex_match(id.begin(), id.end(), re);
}

}  // namespace tubefetch
