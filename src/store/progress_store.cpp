#include <spdlog/spdlog.h>

#include <algorithm>
#include <tubefetch/progress_store.hpp>
#include <utility>
#include <vector>

namespace tubefetch {

ProgressStore::ProgressStore() : ProgressStore(Options{}) {}

ProgressStore::ProgressStore(Options options, NowFn now)
	: options_(options), now_(std::move(now)) {}

bool ProgressStore::set(const JobId &id, ProgressSnapshot snapshot) {
	Observer observer;
	{
		std::lock_guard lock(mutex_);
		auto now = now_();

		auto it = entries_.find(id);
		if (it != entries_.end()) {
			if (it->second.snapshot.terminal()) {
				spdlog::debug("[{}] ignoring {} update after terminal state {}",
							  id, to_string(snapshot.status),
							  to_string(it->second.snapshot.status));
				return false;
			}
			it->second.snapshot = snapshot;
			it->second.updated = now;
		} else {
			if (entries_.size() >= options_.capacity) {
				enforce_capacity_locked(now);
			}
			entries_.emplace(id, Entry{snapshot, now});
		}
		observer = observer_;
	}

	if (observer) observer(id, snapshot);
	return true;
}

Result<ProgressSnapshot> ProgressStore::get(const JobId &id) {
	std::lock_guard lock(mutex_);
	auto it = entries_.find(id);
	if (it == entries_.end()) {
		return Error{errc::unknown_job, "Unknown download id"};
	}
	if (expired(it->second, now_())) {
		entries_.erase(it);
		return Error{errc::unknown_job, "Unknown download id"};
	}
	return it->second.snapshot;
}

std::size_t ProgressStore::sweep() {
	std::lock_guard lock(mutex_);
	return sweep_locked(now_());
}

std::size_t ProgressStore::size() const {
	std::lock_guard lock(mutex_);
	return entries_.size();
}

void ProgressStore::set_observer(Observer observer) {
	std::lock_guard lock(mutex_);
	observer_ = std::move(observer);
}

bool ProgressStore::expired(const Entry &entry, Clock::time_point now) const {
	return entry.snapshot.terminal() && now - entry.updated >= options_.ttl;
}

std::size_t ProgressStore::sweep_locked(Clock::time_point now) {
	std::size_t removed = 0;
	for (auto it = entries_.begin(); it != entries_.end();) {
		if (expired(it->second, now)) {
			it = entries_.erase(it);
			++removed;
		} else {
			++it;
		}
	}
	if (removed > 0) {
		spdlog::debug("Progress store evicted {} expired entries", removed);
	}
	return removed;
}

void ProgressStore::enforce_capacity_locked(Clock::time_point now) {
	sweep_locked(now);
	if (entries_.size() < options_.capacity) return;

	// Oldest terminal entries first
	std::vector<std::pair<Clock::time_point, JobId>> terminal;
	for (const auto &[id, entry] : entries_) {
		if (entry.snapshot.terminal()) terminal.emplace_back(entry.updated, id);
	}
	std::sort(terminal.begin(), terminal.end());

	std::size_t excess = entries_.size() - options_.capacity + 1;
	for (std::size_t i = 0; i < terminal.size() && i < excess; ++i) {
		entries_.erase(terminal[i].second);
	}

	if (entries_.size() >= options_.capacity) {
		spdlog::warn(
			"Progress store holds {} running jobs, above capacity {}",
			entries_.size(), options_.capacity);
	}
}

}  // namespace tubefetch
