#ifndef MEDIAFORGE_CONFIG_HPP
#define MEDIAFORGE_CONFIG_HPP

#include <cstdint>
#include <filesystem>
#include <string>


struct Config
{
	struct ParallelConfig
	{
		std::size_t max_workers = 4;
		bool use_multiprocessing = false;
	};

	struct DownloadConfig
	{
		std::string output_dir = "./downloads";
		std::string format = "bestvideo+bestaudio/best";
		std::string audio_format = "mp3";
		std::size_t retries = 3;
	};

	struct ConvertConfig
	{
		std::string video_codec = "h264";
		std::string audio_codec = "aac";
		std::string video_bitrate = "8000k";
		std::string audio_bitrate = "320k";
		bool hardware_acceleration = false;
	};

	struct LoggingConfig
	{
		enum class LogLevel
		{
			INFO,
			WARNING,
			ERROR,
			DEBUG
		};

		LogLevel level = LogLevel::INFO;
	};

	ParallelConfig parallel;
	DownloadConfig download;
	ConvertConfig convert;
	LoggingConfig logging;
};


/// A missing file yields the defaults. Invalid values throw std::runtime_error.
Config load_config(const std::filesystem::path& path);

void log_config(const Config& config);

#endif //MEDIAFORGE_CONFIG_HPP
