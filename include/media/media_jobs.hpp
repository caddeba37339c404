#ifndef MEDIAFORGE_MEDIA_JOBS_HPP
#define MEDIAFORGE_MEDIA_JOBS_HPP

#include <filesystem>
#include <memory>
#include <string>

#include "execution/job.hpp"
#include "media/media_converter.hpp"
#include "media/video_downloader.hpp"


/// Job results are the path of the produced file as a JSON string.
std::shared_ptr<Job> make_download_video_job(
		VideoDownloader downloader,
		std::string url,
		std::filesystem::path output_dir,
		std::string format_selector
);

std::shared_ptr<Job> make_download_audio_job(
		VideoDownloader downloader,
		std::string url,
		std::filesystem::path output_dir,
		std::string audio_format
);

/// Result is the array of downloaded paths.
std::shared_ptr<Job> make_download_playlist_job(
		VideoDownloader downloader,
		std::string url,
		std::filesystem::path output_dir,
		bool audio_only,
		std::string format
);

/// Result is the video metadata object.
std::shared_ptr<Job> make_video_info_job(VideoDownloader downloader, std::string url);

/// Extracts or converts audio when the output is an audio file, converts video otherwise.
std::shared_ptr<Job> make_convert_job(
		MediaConverter converter,
		std::filesystem::path input,
		std::filesystem::path output,
		ConversionOptions options
);

#endif //MEDIAFORGE_MEDIA_JOBS_HPP
