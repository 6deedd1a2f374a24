#include <gtest/gtest.h>

#include <tubefetch/progress_store.hpp>
#include <vector>

using namespace tubefetch;
using namespace std::chrono_literals;

namespace {

// Store whose clock only moves when the test says so.
struct FakeClockStore {
	ProgressStore::Clock::time_point now{};
	ProgressStore store;

	explicit FakeClockStore(ProgressStore::Options options)
		: store(options, [this] { return now; }) {}
};

ProgressUpdate update(double percent) {
	return ProgressUpdate{percent, "1.00MiB/s", "00:05"};
}

}  // namespace

TEST(ProgressStore, UnknownIdFails) {
	ProgressStore store;
	auto result = store.get("never-issued");
	ASSERT_FALSE(result);
	EXPECT_TRUE(result.error().is(errc::unknown_job));
	EXPECT_EQ(result.error().message, "Unknown download id");
}

TEST(ProgressStore, LastWriteWins) {
	ProgressStore store;
	store.set("a", ProgressSnapshot::starting());
	store.set("a", ProgressSnapshot::downloading(update(40.0)));
	store.set("a", ProgressSnapshot::downloading(update(12.5)));

	auto snapshot = store.get("a");
	ASSERT_TRUE(snapshot);
	EXPECT_EQ(snapshot.value().status, JobStatus::downloading);
	// Percent may go backwards (e.g. video then audio stream)
	EXPECT_DOUBLE_EQ(*snapshot.value().percent, 12.5);
	EXPECT_EQ(*snapshot.value().speed, "1.00MiB/s");
	EXPECT_EQ(*snapshot.value().eta, "00:05");
}

TEST(ProgressStore, TerminalSnapshotNeverReverts) {
	ProgressStore store;
	store.set("a", ProgressSnapshot::starting());
	EXPECT_TRUE(store.set("a", ProgressSnapshot::failed("boom")));
	EXPECT_FALSE(store.set("a", ProgressSnapshot::downloading(update(1.0))));
	EXPECT_FALSE(store.set("a", ProgressSnapshot::completed()));

	auto snapshot = store.get("a");
	ASSERT_TRUE(snapshot);
	EXPECT_EQ(snapshot.value().status, JobStatus::error);
	EXPECT_EQ(*snapshot.value().error_message, "boom");
	EXPECT_FALSE(snapshot.value().percent);
}

TEST(ProgressStore, SnapshotsAreIndependentPerJob) {
	ProgressStore store;
	store.set("a", ProgressSnapshot::downloading(update(10.0)));
	store.set("b", ProgressSnapshot::completed());

	EXPECT_EQ(store.get("a").value().status, JobStatus::downloading);
	EXPECT_EQ(store.get("b").value().status, JobStatus::completed);
	EXPECT_DOUBLE_EQ(*store.get("b").value().percent, 100.0);
	EXPECT_EQ(store.size(), 2u);
}

TEST(ProgressStore, TerminalEntriesExpireAfterTtl) {
	FakeClockStore fixture({10min, 100});
	auto &store = fixture.store;

	store.set("done", ProgressSnapshot::completed());
	store.set("running", ProgressSnapshot::downloading(update(5.0)));

	fixture.now += 9min;
	EXPECT_TRUE(store.get("done"));

	fixture.now += 1min;
	auto expired = store.get("done");
	ASSERT_FALSE(expired);
	EXPECT_TRUE(expired.error().is(errc::unknown_job));

	// Running jobs are never evicted
	fixture.now += 24h;
	EXPECT_TRUE(store.get("running"));
}

TEST(ProgressStore, SweepRemovesExpiredEntries) {
	FakeClockStore fixture({1min, 100});
	auto &store = fixture.store;

	store.set("a", ProgressSnapshot::completed());
	store.set("b", ProgressSnapshot::cancelled("cancelled"));
	store.set("c", ProgressSnapshot::queued());

	fixture.now += 30s;
	EXPECT_EQ(store.sweep(), 0u);

	fixture.now += 30s;
	EXPECT_EQ(store.sweep(), 2u);
	EXPECT_EQ(store.size(), 1u);
}

TEST(ProgressStore, CapacityEvictsOldestTerminalFirst) {
	FakeClockStore fixture({24h, 3});
	auto &store = fixture.store;

	store.set("old", ProgressSnapshot::completed());
	fixture.now += 1s;
	store.set("running", ProgressSnapshot::starting());
	fixture.now += 1s;
	store.set("newer", ProgressSnapshot::failed("x"));
	fixture.now += 1s;
	store.set("fresh", ProgressSnapshot::queued());

	EXPECT_EQ(store.size(), 3u);
	EXPECT_FALSE(store.get("old"));
	EXPECT_TRUE(store.get("running"));
	EXPECT_TRUE(store.get("newer"));
	EXPECT_TRUE(store.get("fresh"));
}

TEST(ProgressStore, CapacityNeverDropsRunningJobs) {
	FakeClockStore fixture({24h, 2});
	auto &store = fixture.store;

	store.set("a", ProgressSnapshot::starting());
	store.set("b", ProgressSnapshot::starting());
	store.set("c", ProgressSnapshot::starting());

	EXPECT_EQ(store.size(), 3u);
	EXPECT_TRUE(store.get("a"));
}

TEST(ProgressStore, ObserverSeesAcceptedWritesInOrder) {
	ProgressStore store;
	std::vector<JobStatus> seen;
	store.set_observer([&](const JobId &id, const ProgressSnapshot &s) {
		EXPECT_EQ(id, "a");
		seen.push_back(s.status);
	});

	store.set("a", ProgressSnapshot::queued());
	store.set("a", ProgressSnapshot::starting());
	store.set("a", ProgressSnapshot::downloading(update(50.0)));
	store.set("a", ProgressSnapshot::completed());
	store.set("a", ProgressSnapshot::failed("late"));  // rejected

	std::vector<JobStatus> expected = {JobStatus::queued, JobStatus::starting,
									   JobStatus::downloading,
									   JobStatus::completed};
	EXPECT_EQ(seen, expected);
}
