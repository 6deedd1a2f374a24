#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "service/admission.hpp"

using tubefetch::service::AdmissionQueue;

TEST(AdmissionQueue, StartsUpToLimit) {
	AdmissionQueue queue(2);
	std::vector<std::string> started;

	EXPECT_TRUE(queue.submit("a", [&] { started.push_back("a"); }, {}));
	EXPECT_TRUE(queue.submit("b", [&] { started.push_back("b"); }, {}));
	EXPECT_FALSE(queue.submit("c", [&] { started.push_back("c"); }, {}));

	EXPECT_EQ(started, (std::vector<std::string>{"a", "b"}));
	EXPECT_EQ(queue.running(), 2u);
	EXPECT_EQ(queue.waiting(), 1u);
}

TEST(AdmissionQueue, ReleaseAdmitsInFifoOrder) {
	AdmissionQueue queue(1);
	std::vector<std::string> started;

	queue.submit("a", [&] { started.push_back("a"); }, {});
	queue.submit("b", [&] { started.push_back("b"); }, {});
	queue.submit("c", [&] { started.push_back("c"); }, {});

	queue.release();
	queue.release();
	EXPECT_EQ(started, (std::vector<std::string>{"a", "b", "c"}));
	EXPECT_EQ(queue.running(), 1u);
	EXPECT_EQ(queue.waiting(), 0u);

	queue.release();
	EXPECT_EQ(queue.running(), 0u);
}

TEST(AdmissionQueue, WithdrawRunsAbandon) {
	AdmissionQueue queue(1);
	bool b_started = false;
	bool b_abandoned = false;

	queue.submit("a", [] {}, {});
	queue.submit(
		"b", [&] { b_started = true; }, [&] { b_abandoned = true; });

	EXPECT_FALSE(queue.withdraw("a"));	// running, not waiting
	EXPECT_TRUE(queue.withdraw("b"));
	EXPECT_TRUE(b_abandoned);
	EXPECT_FALSE(queue.withdraw("b"));

	queue.release();
	EXPECT_FALSE(b_started);
	EXPECT_EQ(queue.running(), 0u);
}

TEST(AdmissionQueue, ZeroLimitStillAdmitsOne) {
	AdmissionQueue queue(0);
	EXPECT_EQ(queue.limit(), 1u);
	EXPECT_TRUE(queue.submit("a", [] {}, {}));
}
