#pragma once

#include <tubefetch/tubefetch_export.h>

#include <chrono>
#include <cstddef>
#include <functional>
#include <mutex>
#include <tubefetch/result.hpp>
#include <tubefetch/types.hpp>
#include <unordered_map>

namespace tubefetch {

/// Process-wide map from job id to its latest ProgressSnapshot.
///
/// Each job is written only by its own runner session, so writes for
/// different ids never interact beyond the map itself. Terminal snapshots
/// are kept for `ttl` after their last update and are then treated as
/// unknown. When more than `capacity` entries exist, the oldest terminal
/// entries are dropped first; running jobs are never evicted.
class TUBEFETCH_EXPORT ProgressStore {
   public:
	using Clock = std::chrono::steady_clock;
	using NowFn = std::function<Clock::time_point()>;
	using Observer =
		std::function<void(const JobId &, const ProgressSnapshot &)>;

	struct Options {
		Clock::duration ttl = std::chrono::hours(1);
		std::size_t capacity = 10000;
	};

	ProgressStore();
	explicit ProgressStore(Options options, NowFn now = &Clock::now);

	ProgressStore(const ProgressStore &) = delete;
	ProgressStore &operator=(const ProgressStore &) = delete;

	/// Replaces the snapshot for `id`. Returns false (and keeps the old
	/// value) when the stored snapshot is already terminal.
	bool set(const JobId &id, ProgressSnapshot snapshot);

	/// Latest snapshot, or errc::unknown_job for ids never stored or evicted.
	[[nodiscard]] Result<ProgressSnapshot> get(const JobId &id);

	/// Drops expired terminal entries. Returns the number removed.
	std::size_t sweep();

	[[nodiscard]] std::size_t size() const;

	/// Called after every accepted write, outside the lock.
	void set_observer(Observer observer);

   private:
	struct Entry {
		ProgressSnapshot snapshot;
		Clock::time_point updated;
	};

	[[nodiscard]] bool expired(const Entry &entry,
							   Clock::time_point now) const;
	std::size_t sweep_locked(Clock::time_point now);
	void enforce_capacity_locked(Clock::time_point now);

	Options options_;
	NowFn now_;
	Observer observer_;

	mutable std::mutex mutex_;
	std::unordered_map<JobId, Entry> entries_;
};

}  // namespace tubefetch
