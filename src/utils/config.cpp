#include "utils/config.hpp"

#include <string_view>
#include <unordered_map>

#include <spdlog/spdlog.h>
#include <yaml-cpp/yaml.h>


namespace
{
	template<typename T>
	T get_optional_value(const YAML::Node& root_node, const std::string& name, T default_value)
	{
		if(const auto node = root_node[name]; node)
		{
			try
			{
				return node.as<T>();
			}
			catch(const YAML::Exception& error)
			{
				spdlog::error("Invalid value of node {}: {}", name, error.what());
				throw std::runtime_error("Invalid value of node " + name);
			}
		}
		else
		{
			return default_value;
		}
	}

	Config::ParallelConfig load_parallel_config(const YAML::Node& node)
	{
		Config::ParallelConfig parallel_config;

		const auto max_workers = get_optional_value<int64_t>(node, "max_workers", static_cast<int64_t>(parallel_config.max_workers));
		if(max_workers < 1)
		{
			spdlog::error("Invalid number of workers: {}", max_workers);
			throw std::runtime_error("Invalid number of workers");
		}
		parallel_config.max_workers = static_cast<std::size_t>(max_workers);
		parallel_config.use_multiprocessing = get_optional_value<bool>(node, "use_multiprocessing", parallel_config.use_multiprocessing);

		return parallel_config;
	}

	Config::DownloadConfig load_download_config(const YAML::Node& node)
	{
		Config::DownloadConfig download_config;

		download_config.output_dir = get_optional_value<std::string>(node, "output_dir", download_config.output_dir);
		download_config.format = get_optional_value<std::string>(node, "format", download_config.format);
		download_config.audio_format = get_optional_value<std::string>(node, "audio_format", download_config.audio_format);

		const auto retries = get_optional_value<int64_t>(node, "retries", static_cast<int64_t>(download_config.retries));
		if(retries < 1)
		{
			spdlog::error("Invalid number of download retries: {}", retries);
			throw std::runtime_error("Invalid number of download retries");
		}
		download_config.retries = static_cast<std::size_t>(retries);

		return download_config;
	}

	Config::ConvertConfig load_convert_config(const YAML::Node& node)
	{
		Config::ConvertConfig convert_config;

		convert_config.video_codec = get_optional_value<std::string>(node, "video_codec", convert_config.video_codec);
		convert_config.audio_codec = get_optional_value<std::string>(node, "audio_codec", convert_config.audio_codec);
		convert_config.video_bitrate = get_optional_value<std::string>(node, "video_bitrate", convert_config.video_bitrate);
		convert_config.audio_bitrate = get_optional_value<std::string>(node, "audio_bitrate", convert_config.audio_bitrate);
		convert_config.hardware_acceleration = get_optional_value<bool>(node, "hardware_acceleration", convert_config.hardware_acceleration);

		return convert_config;
	}

	Config::LoggingConfig::LogLevel map_log_level(const std::string& log_level_name)
	{
		const std::unordered_map<std::string, Config::LoggingConfig::LogLevel> level_mapping{
				{"INFO", Config::LoggingConfig::LogLevel::INFO},
				{"WARNING", Config::LoggingConfig::LogLevel::WARNING},
				{"ERROR", Config::LoggingConfig::LogLevel::ERROR},
				{"DEBUG", Config::LoggingConfig::LogLevel::DEBUG}
		};

		if(const auto level = level_mapping.find(log_level_name); level != std::end(level_mapping))
		{
			return level->second;
		}

		spdlog::error("Invalid logging level: {}", log_level_name);
		throw std::runtime_error("Invalid logging level");
	}

	std::string_view to_string(Config::LoggingConfig::LogLevel level)
	{
		using enum Config::LoggingConfig::LogLevel;

		switch(level)
		{
			case INFO:
				return "INFO";
			case WARNING:
				return "WARNING";
			case ERROR:
				return "ERROR";
			case DEBUG:
				return "DEBUG";
		}

		return "UNKNOWN";
	}

	Config::LoggingConfig load_logging_config(const YAML::Node& node)
	{
		Config::LoggingConfig logging_config = {};

		const auto level_string = get_optional_value<std::string>(node, "level", "INFO");
		logging_config.level = map_log_level(level_string);

		return logging_config;
	}
}

Config load_config(const std::filesystem::path &path)
{
	Config config;

	if(!std::filesystem::exists(path))
	{
		spdlog::info("Config file {} not found, using defaults", path.string());
		return config;
	}

	if(!std::filesystem::is_regular_file(path))
	{
		throw std::runtime_error(path.string() + " is not a regular file");
	}

	YAML::Node root_node;
	try
	{
		root_node = YAML::LoadFile(path.string());
	}
	catch(const YAML::Exception& error)
	{
		spdlog::error("Failed to parse config file {}: {}", path.string(), error.what());
		throw std::runtime_error("Failed to parse config file " + path.string());
	}

	if(const auto node = root_node["parallel"]; node)
	{
		config.parallel = load_parallel_config(node);
	}

	if(const auto node = root_node["download"]; node)
	{
		config.download = load_download_config(node);
	}

	if(const auto node = root_node["convert"]; node)
	{
		config.convert = load_convert_config(node);
	}

	if(const auto node = root_node["logging"]; node)
	{
		config.logging = load_logging_config(node);
	}

	return config;
}

void log_config(const Config& config)
{
	spdlog::info(
			"Parallel: max_workers={}, use_multiprocessing={}",
			config.parallel.max_workers, config.parallel.use_multiprocessing
	);
	spdlog::info(
			"Download: output_dir={}, format={}, audio_format={}, retries={}",
			config.download.output_dir, config.download.format, config.download.audio_format, config.download.retries
	);
	spdlog::info(
			"Convert: video_codec={}, audio_codec={}, video_bitrate={}, audio_bitrate={}, hardware_acceleration={}",
			config.convert.video_codec, config.convert.audio_codec, config.convert.video_bitrate, config.convert.audio_bitrate,
			config.convert.hardware_acceleration
	);
	spdlog::info("Logging: level={}", to_string(config.logging.level));
}
