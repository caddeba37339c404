#include "media/media_jobs.hpp"


std::shared_ptr<Job> make_download_video_job(
		VideoDownloader downloader,
		std::string url,
		std::filesystem::path output_dir,
		std::string format_selector
)
{
	return make_job(
			"download_video",
			[downloader = std::move(downloader), url = std::move(url), output_dir = std::move(output_dir), format_selector = std::move(format_selector)](JobContext& context)
			{
				return downloader.download_video(url, output_dir, format_selector, context).string();
			}
	);
}

std::shared_ptr<Job> make_download_audio_job(
		VideoDownloader downloader,
		std::string url,
		std::filesystem::path output_dir,
		std::string audio_format
)
{
	return make_job(
			"download_audio",
			[downloader = std::move(downloader), url = std::move(url), output_dir = std::move(output_dir), audio_format = std::move(audio_format)](JobContext& context)
			{
				return downloader.download_audio(url, output_dir, audio_format, context).string();
			}
	);
}

std::shared_ptr<Job> make_download_playlist_job(
		VideoDownloader downloader,
		std::string url,
		std::filesystem::path output_dir,
		bool audio_only,
		std::string format
)
{
	return make_job(
			"download_playlist",
			[downloader = std::move(downloader), url = std::move(url), output_dir = std::move(output_dir), audio_only, format = std::move(format)](JobContext& context)
			{
				nlohmann::json paths = nlohmann::json::array();
				for(const auto& path: downloader.download_playlist(url, output_dir, audio_only, format, context))
				{
					paths.push_back(path.string());
				}
				return paths;
			}
	);
}

std::shared_ptr<Job> make_video_info_job(VideoDownloader downloader, std::string url)
{
	return make_job(
			"video_info",
			[downloader = std::move(downloader), url = std::move(url)](JobContext& context)
			{
				return nlohmann::json(downloader.get_video_info(url, context));
			}
	);
}

std::shared_ptr<Job> make_convert_job(
		MediaConverter converter,
		std::filesystem::path input,
		std::filesystem::path output,
		ConversionOptions options
)
{
	return make_job(
			"convert",
			[converter = std::move(converter), input = std::move(input), output = std::move(output), options = std::move(options)](JobContext& context)
			{
				return converter.convert_any(input, output, options, context).string();
			}
	);
}
