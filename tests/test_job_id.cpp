#include <gtest/gtest.h>

#include <set>
#include <tubefetch/job_id.hpp>

using namespace tubefetch;

TEST(JobId, CanonicalUuidText) {
	auto id = allocate_job_id();
	EXPECT_EQ(id.size(), 36u);
	EXPECT_TRUE(is_well_formed_job_id(id)) << id;
	// Version 4
	EXPECT_EQ(id[14], '4');
}

TEST(JobId, DistinctAcrossCalls) {
	std::set<JobId> ids;
	for (int i = 0; i < 1000; ++i) ids.insert(allocate_job_id());
	EXPECT_EQ(ids.size(), 1000u);
}

TEST(JobId, RejectsMalformed) {
	EXPECT_FALSE(is_well_formed_job_id(""));
	EXPECT_FALSE(is_well_formed_job_id("not-a-uuid"));
	EXPECT_FALSE(is_well_formed_job_id("0F8FAD5B-D9CB-469F-A165-70867728950E"));
	EXPECT_FALSE(is_well_formed_job_id("../etc/passwd"));
}
