#ifndef MEDIAFORGE_VIDEO_DOWNLOADER_HPP
#define MEDIAFORGE_VIDEO_DOWNLOADER_HPP

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

#include "execution/job.hpp"
#include "model/progress.hpp"


struct DownloadError: public std::runtime_error
{
	using std::runtime_error::runtime_error;
};

struct VideoInfo
{
	std::string title;
	double duration_seconds = 0.0;
	std::string uploader;
	std::string upload_date;
	std::int64_t view_count = 0;
	std::size_t format_count = 0;
	std::string thumbnail;
	std::string description;
	std::string url;
};

void to_json(nlohmann::json& json, const VideoInfo& info);

struct PlaylistEntry
{
	std::string url;
	std::string title;
};

/// Downloads media through the yt-dlp command line tool.
class VideoDownloader
{
public:
	struct Settings
	{
		std::string executable = "yt-dlp";
		std::size_t retries = 3;
		std::chrono::milliseconds base_backoff{1000};
	};

	constexpr static std::string_view FILEPATH_MARKER = "MEDIAFORGE_FILE=";

	VideoDownloader();
	explicit VideoDownloader(Settings settings);

	std::filesystem::path download_video(
			const std::string& url,
			const std::filesystem::path& output_dir,
			const std::string& format_selector,
			JobContext& context
	) const;

	std::filesystem::path download_audio(
			const std::string& url,
			const std::filesystem::path& output_dir,
			const std::string& audio_format,
			JobContext& context
	) const;

	/// Metadata of a single video, nothing is downloaded.
	VideoInfo get_video_info(const std::string& url, JobContext& context) const;

	std::vector<PlaylistEntry> list_playlist(const std::string& url, JobContext& context) const;

	/// Downloads the playlist entries one after another. format is the format selector,
	/// or the audio format when audio_only is set. Entries that fail are logged and
	/// skipped; the call fails only when no entry could be downloaded.
	std::vector<std::filesystem::path> download_playlist(
			const std::string& url,
			const std::filesystem::path& output_dir,
			bool audio_only,
			const std::string& format,
			JobContext& context
	) const;

	[[nodiscard]] static VideoInfo parse_video_info(const nlohmann::json& json);
	[[nodiscard]] static std::vector<PlaylistEntry> parse_playlist(const nlohmann::json& json);

	/// Parses a "[download]  42.3% of ~ 10.00MiB at 1.23MiB/s ETA 00:05" line.
	[[nodiscard]] static std::optional<ProgressSnapshot> parse_progress_line(std::string_view line);

private:
	Settings settings_;

	[[nodiscard]] std::vector<std::string> base_arguments(const std::filesystem::path& output_dir, const std::string& format_selector) const;

	std::filesystem::path run_with_retries(const std::string& url, std::vector<std::string> arguments, JobContext& context) const;
	nlohmann::json query_metadata(std::vector<std::string> arguments, const std::string& url, JobContext& context) const;

	std::filesystem::path run_once(const std::string& url, const std::vector<std::string>& arguments, JobContext& context) const;
};

#endif //MEDIAFORGE_VIDEO_DOWNLOADER_HPP
