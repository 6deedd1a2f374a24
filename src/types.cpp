#include <tubefetch/types.hpp>
#include <utility>

namespace tubefetch {

std::string_view to_string(JobKind kind) {
	switch (kind) {
		case JobKind::video: return "video";
		case JobKind::audio: return "audio";
		case JobKind::playlist: return "playlist";
	}
	return "unknown";
}

std::string_view to_string(JobStatus status) {
	switch (status) {
		case JobStatus::queued: return "queued";
		case JobStatus::starting: return "starting";
		case JobStatus::downloading: return "downloading";
		case JobStatus::completed: return "completed";
		case JobStatus::error: return "error";
		case JobStatus::cancelled: return "cancelled";
	}
	return "unknown";
}

bool is_terminal(JobStatus status) {
	return status == JobStatus::completed || status == JobStatus::error ||
		   status == JobStatus::cancelled;
}

ProgressSnapshot ProgressSnapshot::queued() {
	ProgressSnapshot s;
	s.status = JobStatus::queued;
	s.percent = 0.0;
	return s;
}

ProgressSnapshot ProgressSnapshot::starting() {
	ProgressSnapshot s;
	s.status = JobStatus::starting;
	s.percent = 0.0;
	return s;
}

ProgressSnapshot ProgressSnapshot::downloading(const ProgressUpdate &update) {
	ProgressSnapshot s;
	s.status = JobStatus::downloading;
	s.percent = update.percent;
	s.speed = update.speed;
	s.eta = update.eta;
	return s;
}

ProgressSnapshot ProgressSnapshot::completed() {
	ProgressSnapshot s;
	s.status = JobStatus::completed;
	s.percent = 100.0;
	return s;
}

ProgressSnapshot ProgressSnapshot::failed(std::string message) {
	ProgressSnapshot s;
	s.status = JobStatus::error;
	s.error_message = std::move(message);
	return s;
}

ProgressSnapshot ProgressSnapshot::cancelled(std::string message) {
	ProgressSnapshot s;
	s.status = JobStatus::cancelled;
	s.error_message = std::move(message);
	return s;
}

}  // namespace tubefetch
