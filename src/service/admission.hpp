#pragma once

#include <cstddef>
#include <deque>
#include <functional>
#include <mutex>
#include <tubefetch/types.hpp>

namespace tubefetch::service {

/// Counting gate in front of the process runner. At most `limit` jobs hold a
/// slot; further submissions wait in FIFO order. Callbacks are invoked
/// outside the lock.
class AdmissionQueue {
   public:
	using Start = std::function<void()>;
	using Abandon = std::function<void()>;

	explicit AdmissionQueue(std::size_t limit);

	/// Runs `start` now if a slot is free, otherwise queues it under `id`.
	/// Returns true if the job started immediately.
	bool submit(const JobId &id, Start start, Abandon abandon);

	/// Frees the caller's slot and starts the next waiting job, if any.
	void release();

	/// Removes a waiting job and runs its `abandon` callback. Returns false
	/// if `id` is not waiting (already started or never queued).
	bool withdraw(const JobId &id);

	[[nodiscard]] std::size_t running() const;
	[[nodiscard]] std::size_t waiting() const;
	[[nodiscard]] std::size_t limit() const { return limit_; }

   private:
	struct Waiter {
		JobId id;
		Start start;
		Abandon abandon;
	};

	const std::size_t limit_;
	mutable std::mutex mutex_;
	std::size_t running_ = 0;
	std::deque<Waiter> waiting_;
};

}  // namespace tubefetch::service
