#pragma once

#include <tubefetch/tubefetch_export.h>

#include <string>
#include <string_view>
#include <tubefetch/result.hpp>
#include <tubefetch/types.hpp>

namespace tubefetch {

/// Accepts youtube.com/... and youtu.be/... URLs, scheme and "www." optional.
TUBEFETCH_EXPORT bool is_valid_youtube_url(std::string_view url);

/// 11-character YouTube video id.
TUBEFETCH_EXPORT bool is_valid_video_id(std::string_view id);

TUBEFETCH_EXPORT std::string watch_url(std::string_view video_id);

TUBEFETCH_EXPORT bool is_video_container(std::string_view format);
TUBEFETCH_EXPORT bool is_audio_format(std::string_view format);

// Each returns errc::invalid_request with a message naming the bad field.
TUBEFETCH_EXPORT Result<void> validate(const VideoRequest &request);
TUBEFETCH_EXPORT Result<void> validate(const AudioRequest &request);
TUBEFETCH_EXPORT Result<void> validate(const PlaylistRequest &request);

}  // namespace tubefetch
