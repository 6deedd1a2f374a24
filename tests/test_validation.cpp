#include <gtest/gtest.h>

#include <tubefetch/validation.hpp>

using namespace tubefetch;

TEST(Validation, YoutubeUrls) {
	EXPECT_TRUE(is_valid_youtube_url("https://www.youtube.com/watch?v=dQw4w9WgXcQ"));
	EXPECT_TRUE(is_valid_youtube_url("http://youtube.com/playlist?list=PL1"));
	EXPECT_TRUE(is_valid_youtube_url("youtu.be/dQw4w9WgXcQ"));
	EXPECT_TRUE(is_valid_youtube_url("https://youtu.be/dQw4w9WgXcQ"));

	EXPECT_FALSE(is_valid_youtube_url(""));
	EXPECT_FALSE(is_valid_youtube_url("https://vimeo.com/123"));
	EXPECT_FALSE(is_valid_youtube_url("https://m.youtube.com/watch?v=x"));
	EXPECT_FALSE(is_valid_youtube_url("ftp://youtube.com/"));
	EXPECT_FALSE(is_valid_youtube_url("https://youtube.com"));
}

TEST(Validation, VideoIds) {
	EXPECT_TRUE(is_valid_video_id("dQw4w9WgXcQ"));
	EXPECT_TRUE(is_valid_video_id("a-b_c-d_e-f"));
	EXPECT_FALSE(is_valid_video_id("short"));
	EXPECT_FALSE(is_valid_video_id("dQw4w9WgXcQ&x"));
	EXPECT_EQ(watch_url("dQw4w9WgXcQ"),
			  "https://www.youtube.com/watch?v=dQw4w9WgXcQ");
}

TEST(Validation, VideoRequest) {
	VideoRequest request;
	request.url = "https://youtu.be/dQw4w9WgXcQ";
	EXPECT_TRUE(validate(request));

	request.quality = "1080";
	request.start_time = "1:30";
	request.end_time = "125.5";
	EXPECT_TRUE(validate(request));

	request.format = "avi";
	auto bad_format = validate(request);
	ASSERT_FALSE(bad_format);
	EXPECT_TRUE(bad_format.error().is(errc::invalid_request));
	EXPECT_EQ(bad_format.error().message, "Unsupported video format: avi");

	request.format = "mkv";
	request.quality = "best";
	EXPECT_FALSE(validate(request));

	request.quality = "720p";
	request.end_time = "1:30; rm -rf /";
	EXPECT_FALSE(validate(request));
}

TEST(Validation, MissingUrl) {
	VideoRequest request;
	auto result = validate(request);
	ASSERT_FALSE(result);
	EXPECT_EQ(result.error().message, "Invalid or missing YouTube URL");
}

TEST(Validation, AudioRequest) {
	AudioRequest request;
	request.url = "https://www.youtube.com/watch?v=dQw4w9WgXcQ";
	EXPECT_TRUE(validate(request));

	request.quality = "0";
	EXPECT_TRUE(validate(request));
	request.quality = "10";
	EXPECT_TRUE(validate(request));
	request.quality = "320K";
	EXPECT_TRUE(validate(request));

	request.quality = "11";
	EXPECT_FALSE(validate(request));
	request.quality = "loud";
	EXPECT_FALSE(validate(request));

	request.quality = "128k";
	request.format = "mp4";
	EXPECT_FALSE(validate(request));
	request.format = "flac";
	EXPECT_TRUE(validate(request));
}

TEST(Validation, PlaylistRequest) {
	PlaylistRequest request;
	request.url = "https://www.youtube.com/playlist?list=PL1";
	EXPECT_TRUE(validate(request));

	request.audio_only = true;
	EXPECT_FALSE(validate(request));  // mp4 is not an audio codec
	request.format = "mp3";
	request.quality = "ignored-in-audio-mode";
	EXPECT_TRUE(validate(request));
}
