#include "service/admission.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <utility>

namespace tubefetch::service {

AdmissionQueue::AdmissionQueue(std::size_t limit)
	: limit_(std::max<std::size_t>(limit, 1)) {}

bool AdmissionQueue::submit(const JobId &id, Start start, Abandon abandon) {
	{
		std::lock_guard lock(mutex_);
		if (running_ >= limit_) {
			waiting_.push_back({id, std::move(start), std::move(abandon)});
			spdlog::debug("[{}] queued ({} running, {} waiting)", id, running_,
						  waiting_.size());
			return false;
		}
		++running_;
	}
	start();
	return true;
}

void AdmissionQueue::release() {
	Start next;
	{
		std::lock_guard lock(mutex_);
		if (waiting_.empty()) {
			if (running_ > 0) --running_;
			return;
		}
		// The slot passes straight to the next waiter.
		auto waiter = std::move(waiting_.front());
		waiting_.pop_front();
		spdlog::debug("[{}] admitted from queue", waiter.id);
		next = std::move(waiter.start);
	}
	next();
}

bool AdmissionQueue::withdraw(const JobId &id) {
	Abandon abandon;
	{
		std::lock_guard lock(mutex_);
		auto it = std::find_if(waiting_.begin(), waiting_.end(),
							   [&](const Waiter &w) { return w.id == id; });
		if (it == waiting_.end()) return false;
		abandon = std::move(it->abandon);
		waiting_.erase(it);
	}
	if (abandon) abandon();
	return true;
}

std::size_t AdmissionQueue::running() const {
	std::lock_guard lock(mutex_);
	return running_;
}

std::size_t AdmissionQueue::waiting() const {
	std::lock_guard lock(mutex_);
	return waiting_.size();
}

}  // namespace tubefetch::service
