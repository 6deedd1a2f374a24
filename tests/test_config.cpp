#include <gtest/gtest.h>
#include <stdlib.h>

#include <boost/program_options/parsers.hpp>
#include <tubefetch/config.hpp>

using namespace tubefetch;

namespace {

// Sets an environment variable for the lifetime of the guard.
class ScopedEnv {
   public:
	ScopedEnv(const char *name, const char *value) : name_(name) {
		::setenv(name, value, 1);
	}
	~ScopedEnv() { ::unsetenv(name_); }

	ScopedEnv(const ScopedEnv &) = delete;
	ScopedEnv &operator=(const ScopedEnv &) = delete;

   private:
	const char *name_;
};

Result<ServiceConfig> parse(std::vector<std::string> args) {
	auto options = config_options();
	po::variables_map vm;
	po::store(po::command_line_parser(args).options(options).run(), vm);
	BOOST_OUTCOME_TRYV(store_environment(options, vm));
	po::notify(vm);
	return config_from_variables(vm);
}

}  // namespace

TEST(Config, Defaults) {
	auto config = parse({});
	ASSERT_TRUE(config) << config.error().message;
	EXPECT_EQ(config.value().download_dir.string(), "downloads");
	EXPECT_EQ(config.value().public_prefix, "/downloads");
	EXPECT_EQ(config.value().extractor, "yt-dlp");
	EXPECT_EQ(config.value().max_concurrent_downloads, 5u);
	EXPECT_EQ(config.value().job_timeout.count(), 0);
	EXPECT_EQ(config.value().progress_ttl.count(), 3600);
	EXPECT_EQ(config.value().store_capacity, 10000u);
}

TEST(Config, EnvironmentNames) {
	EXPECT_EQ(environment_option_name("TUBEFETCH_DOWNLOAD_DIR"), "download-dir");
	EXPECT_EQ(environment_option_name("TUBEFETCH_JOB_TIMEOUT"), "job-timeout");
	EXPECT_EQ(environment_option_name("DOWNLOAD_DIR"), "download-dir");
	EXPECT_EQ(environment_option_name("MAX_CONCURRENT_DOWNLOADS"),
			  "max-concurrent-downloads");
	EXPECT_EQ(environment_option_name("TUBEFETCH_NO_SUCH_OPTION"), "");
	EXPECT_EQ(environment_option_name("PATH"), "");
}

TEST(Config, ReadsEnvironment) {
	ScopedEnv dir("TUBEFETCH_DOWNLOAD_DIR", "/srv/media");
	ScopedEnv jobs("TUBEFETCH_MAX_CONCURRENT_DOWNLOADS", "2");
	ScopedEnv timeout("TUBEFETCH_JOB_TIMEOUT", "600");

	auto config = config_from_environment();
	ASSERT_TRUE(config) << config.error().message;
	EXPECT_EQ(config.value().download_dir.string(), "/srv/media");
	EXPECT_EQ(config.value().max_concurrent_downloads, 2u);
	EXPECT_EQ(config.value().job_timeout.count(), 600);
}

TEST(Config, LegacyVariablesYieldToPrefixedOnes) {
	ScopedEnv legacy("DOWNLOAD_DIR", "/legacy");
	ScopedEnv jobs("MAX_CONCURRENT_DOWNLOADS", "3");

	auto config = config_from_environment();
	ASSERT_TRUE(config) << config.error().message;
	EXPECT_EQ(config.value().download_dir.string(), "/legacy");
	EXPECT_EQ(config.value().max_concurrent_downloads, 3u);

	ScopedEnv prefixed("TUBEFETCH_DOWNLOAD_DIR", "/preferred");
	config = config_from_environment();
	ASSERT_TRUE(config) << config.error().message;
	EXPECT_EQ(config.value().download_dir.string(), "/preferred");
}

TEST(Config, CommandLineOverridesEnvironment) {
	ScopedEnv dir("TUBEFETCH_DOWNLOAD_DIR", "/from-env");
	auto config = parse({"--download-dir", "/from-cli", "--extractor",
						 "/opt/yt-dlp"});
	ASSERT_TRUE(config) << config.error().message;
	EXPECT_EQ(config.value().download_dir.string(), "/from-cli");
	EXPECT_EQ(config.value().extractor, "/opt/yt-dlp");
}

TEST(Config, NormalizesPrefix) {
	auto config = parse({"--public-prefix", "/files/"});
	ASSERT_TRUE(config) << config.error().message;
	EXPECT_EQ(config.value().public_prefix, "/files");

	auto root = parse({"--public-prefix", "/"});
	ASSERT_TRUE(root) << root.error().message;
	EXPECT_EQ(root.value().public_prefix, "");
}

TEST(Config, RejectsInvalidValues) {
	auto zero = parse({"--max-concurrent-downloads", "0"});
	ASSERT_FALSE(zero);
	EXPECT_TRUE(zero.error().is(errc::invalid_config));

	auto prefix = parse({"--public-prefix", "downloads"});
	ASSERT_FALSE(prefix);
	EXPECT_TRUE(prefix.error().is(errc::invalid_config));

	auto negative = parse({"--job-timeout=-5"});
	ASSERT_FALSE(negative);
	EXPECT_TRUE(negative.error().is(errc::invalid_config));
}

TEST(Config, RejectsMalformedEnvironment) {
	ScopedEnv jobs("TUBEFETCH_MAX_CONCURRENT_DOWNLOADS", "many");
	auto config = config_from_environment();
	ASSERT_FALSE(config);
	EXPECT_TRUE(config.error().is(errc::invalid_config));
}
