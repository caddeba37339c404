#include <chrono>
#include <filesystem>
#include <iostream>
#include <iterator>
#include <limits>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "media/hardware_encoders.hpp"
#include "media/media_jobs.hpp"
#include "service/batch_coordinator.hpp"
#include "service/task_manager.hpp"
#include "utils/config.hpp"
#include "utils/file_utils.hpp"


namespace
{
	constexpr std::string_view CONFIG_PATH = "./mediaforge.yaml";

	struct CommandLine
	{
		std::string mode;
		std::vector<std::string> positional;
		bool audio = false;
	};

	void init_global_logger(const Config::LoggingConfig& config)
	{
		using enum Config::LoggingConfig::LogLevel;

		const std::unordered_map<Config::LoggingConfig::LogLevel, spdlog::level::level_enum> spdlog_log_level_map{
			{INFO, spdlog::level::level_enum::info},
			{WARNING, spdlog::level::level_enum::warn},
			{ERROR, spdlog::level::level_enum::err},
			{DEBUG, spdlog::level::level_enum::debug}
		};

		const auto spdlog_level = spdlog_log_level_map.at(config.level);
		spdlog::set_level(spdlog_level);
		spdlog::info("Logger set up to: {} level", spdlog::level::to_short_c_str(spdlog_level));
	}

	void print_usage()
	{
		std::cerr << "Usage:\n"
				  << "  mediaforge download <url> [--audio]\n"
				  << "  mediaforge batch <url-list-file> [--audio]\n"
				  << "  mediaforge playlist <url> [--audio]\n"
				  << "  mediaforge info <url>\n"
				  << "  mediaforge convert <input> <output>\n"
				  << "  mediaforge batch-convert <output-dir> <extension> <input>...\n";
	}

	std::optional<CommandLine> parse_command_line(int argc, char* argv[])
	{
		if(argc < 2)
		{
			return std::nullopt;
		}

		CommandLine command_line;
		command_line.mode = argv[1];

		for(int i = 2; i < argc; ++i)
		{
			const std::string_view argument = argv[i];
			if(argument == "--audio")
			{
				command_line.audio = true;
			}
			else if(argument.starts_with("--"))
			{
				std::cerr << "Unknown option: " << argument << "\n";
				return std::nullopt;
			}
			else
			{
				command_line.positional.emplace_back(argument);
			}
		}

		// Minimum and maximum number of positional arguments per mode.
		const std::unordered_map<std::string, std::pair<std::size_t, std::size_t>> expected_arguments{
			{"download", {1, 1}},
			{"batch", {1, 1}},
			{"playlist", {1, 1}},
			{"info", {1, 1}},
			{"convert", {2, 2}},
			{"batch-convert", {3, std::numeric_limits<std::size_t>::max()}}
		};

		const auto expected = expected_arguments.find(command_line.mode);
		if(expected == std::end(expected_arguments))
		{
			return std::nullopt;
		}

		const auto [min_count, max_count] = expected->second;
		if(command_line.positional.size() < min_count || command_line.positional.size() > max_count)
		{
			return std::nullopt;
		}

		return command_line;
	}

	TaskManagerConfig build_task_manager_config(const Config& config)
	{
		TaskManagerConfig task_manager_config;
		task_manager_config.max_workers = config.parallel.max_workers;
		task_manager_config.executor_kind = config.parallel.use_multiprocessing ? ExecutorKind::PROCESSES : ExecutorKind::THREADS;

		return task_manager_config;
	}

	VideoDownloader build_downloader(const Config& config)
	{
		return VideoDownloader(VideoDownloader::Settings{"yt-dlp", config.download.retries, std::chrono::milliseconds(1000)});
	}

	std::shared_ptr<Job> build_download_job(const Config& config, const std::string& url, bool audio)
	{
		auto downloader = build_downloader(config);

		if(audio)
		{
			return make_download_audio_job(std::move(downloader), url, config.download.output_dir, config.download.audio_format);
		}

		return make_download_video_job(std::move(downloader), url, config.download.output_dir, config.download.format);
	}

	ProgressSink build_logging_sink()
	{
		return [](const ProgressSnapshot& snapshot)
		{
			spdlog::debug("{}: {:.1f}% ({})", snapshot.label.value_or("task"), snapshot.percentage, snapshot.status);
		};
	}

	int report_single_task(TaskManager& task_manager, const TaskId& task_id)
	{
		const auto records = task_manager.wait_for_completion(std::vector<TaskId>{task_id});
		const auto& record = records.at(task_id);

		spdlog::info("Task {}: {}", task_id, nlohmann::json(record).dump());

		if(record.status != TaskStatus::COMPLETED)
		{
			spdlog::error("Task {} {}: {}", task_id, to_string(record.status), record.error.value_or("no error reported"));
			return 1;
		}

		std::cout << record.result.value_or(JobResult()).dump() << "\n";
		return 0;
	}

	int run_download(TaskManager& task_manager, const Config& config, const std::string& url, bool audio)
	{
		const auto task_id = task_manager.submit(build_download_job(config, url, audio), build_logging_sink());
		return report_single_task(task_manager, task_id);
	}

	int run_playlist(TaskManager& task_manager, const Config& config, const std::string& url, bool audio)
	{
		const auto& format = audio ? config.download.audio_format : config.download.format;
		const auto task_id = task_manager.submit(
				make_download_playlist_job(build_downloader(config), url, config.download.output_dir, audio, format),
				build_logging_sink()
		);
		return report_single_task(task_manager, task_id);
	}

	int run_info(TaskManager& task_manager, const Config& config, const std::string& url)
	{
		const auto task_id = task_manager.submit(make_video_info_job(build_downloader(config), url));
		return report_single_task(task_manager, task_id);
	}

	ConversionOptions build_conversion_options(const Config& config)
	{
		ConversionOptions options{
			config.convert.video_codec,
			config.convert.audio_codec,
			config.convert.video_bitrate,
			config.convert.audio_bitrate,
			std::nullopt
		};

		if(config.convert.hardware_acceleration)
		{
			options.video_encoder = HardwareEncoders::detect().best_encoder(config.convert.video_codec);
			spdlog::info("Using video encoder {}", options.video_encoder.value());
		}

		return options;
	}

	int run_convert(TaskManager& task_manager, const Config& config, const std::string& input, const std::string& output)
	{
		const auto task_id = task_manager.submit(make_convert_job(MediaConverter(), input, output, build_conversion_options(config)), build_logging_sink());
		return report_single_task(task_manager, task_id);
	}

	int run_batch_convert(TaskManager& task_manager, const Config& config, const std::vector<std::string>& arguments)
	{
		const std::filesystem::path output_dir = arguments[0];
		const auto extension = arguments[1].starts_with('.') ? arguments[1] : "." + arguments[1];
		const std::vector<std::string> inputs(std::next(std::begin(arguments), 2), std::end(arguments));
		const auto options = build_conversion_options(config);

		BatchCoordinator coordinator(task_manager);
		const auto result = coordinator.process(
				inputs,
				[&output_dir, &extension, &options](const std::string& input)
				{
					auto output = output_dir / std::filesystem::path(input).stem();
					output += extension;
					return make_convert_job(MediaConverter(), input, std::move(output), options);
				}
		);

		for(const auto& completed: result.completed)
		{
			std::cout << completed.item << " -> " << completed.result.dump() << "\n";
		}

		for(const auto& failed: result.failed)
		{
			spdlog::error("Failed {}: {}", failed.item, failed.error);
		}

		spdlog::info("Batch conversion finished: {} completed, {} failed out of {}", result.completed.size(), result.failed.size(), result.total);

		return result.failed.empty() ? 0 : 1;
	}

	int run_batch(TaskManager& task_manager, const Config& config, const std::string& url_list_file, bool audio)
	{
		const auto urls = parse_url_list_file(url_list_file);
		spdlog::info("Loaded {} URLs from {}", urls.size(), url_list_file);

		BatchCoordinator::Options options;
		options.on_progress = [](double overall)
		{
			spdlog::debug("Batch progress: {:.1f}%", overall);
		};

		BatchCoordinator coordinator(task_manager);
		const auto result = coordinator.process(
				urls,
				[&config, audio](const std::string& url)
				{
					return build_download_job(config, url, audio);
				},
				options
		);

		for(const auto& completed: result.completed)
		{
			std::cout << completed.item << " -> " << completed.result.dump() << "\n";
		}

		for(const auto& failed: result.failed)
		{
			spdlog::error("Failed {}: {}", failed.item, failed.error);
		}

		spdlog::info(
				"Batch finished: {} completed, {} failed out of {} in {} rounds",
				result.completed.size(), result.failed.size(), result.total, result.rounds
		);

		return result.failed.empty() ? 0 : 1;
	}
}

int main(int argc, char* argv[])
{
	const auto command_line = parse_command_line(argc, argv);
	if(!command_line.has_value())
	{
		print_usage();
		return 2;
	}

	try
	{
		const auto config = load_config(std::string(CONFIG_PATH));

		init_global_logger(config.logging);
		log_config(config);

		TaskManager task_manager(build_task_manager_config(config));
		task_manager.start();

		int exit_code = 0;
		const auto& arguments = command_line->positional;
		if(command_line->mode == "download")
		{
			exit_code = run_download(task_manager, config, arguments[0], command_line->audio);
		}
		else if(command_line->mode == "batch")
		{
			exit_code = run_batch(task_manager, config, arguments[0], command_line->audio);
		}
		else if(command_line->mode == "playlist")
		{
			exit_code = run_playlist(task_manager, config, arguments[0], command_line->audio);
		}
		else if(command_line->mode == "info")
		{
			exit_code = run_info(task_manager, config, arguments[0]);
		}
		else if(command_line->mode == "convert")
		{
			exit_code = run_convert(task_manager, config, arguments[0], arguments[1]);
		}
		else
		{
			exit_code = run_batch_convert(task_manager, config, arguments);
		}

		spdlog::info("Statistics: {}", nlohmann::json(task_manager.get_statistics()).dump());
		task_manager.shutdown();

		return exit_code;
	}
	catch(const std::exception& error)
	{
		spdlog::error("{}", error.what());
		return 1;
	}
}
