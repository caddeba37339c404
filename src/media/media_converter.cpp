#include "media/media_converter.hpp"

#include <algorithm>
#include <cctype>
#include <regex>
#include <unordered_map>
#include <unordered_set>

#include <spdlog/spdlog.h>

#include "utils/file_utils.hpp"
#include "utils/subprocess.hpp"


namespace
{
	const std::unordered_set<std::string> AUDIO_EXTENSIONS{"mp3", "aac", "m4a", "ogg", "opus", "flac", "wav"};
	const std::unordered_set<std::string> VIDEO_EXTENSIONS{"mp4", "avi", "mkv", "webm", "mov", "flv"};
	const std::unordered_set<std::string> LOSSLESS_AUDIO_FORMATS{"flac", "wav"};

	/// Lower case extension without the dot.
	std::string extension_of(const std::filesystem::path& path)
	{
		auto extension = path.extension().string();
		if(!extension.empty())
		{
			extension.erase(0, 1);
		}
		std::ranges::transform(extension, std::begin(extension), [](unsigned char character) { return static_cast<char>(std::tolower(character)); });

		return extension;
	}

	/// "HH:MM:SS.ss" to seconds.
	std::optional<double> parse_timestamp(const std::string& value)
	{
		static const std::regex timestamp_regex(R"(^(\d+):(\d+):(\d+(?:\.\d+)?)$)");

		std::smatch match;
		if(!std::regex_match(value, match, timestamp_regex))
		{
			return std::nullopt;
		}

		return std::stod(match[1].str()) * 3600.0 + std::stod(match[2].str()) * 60.0 + std::stod(match[3].str());
	}
}

std::optional<ProgressSnapshot> FfmpegProgressParser::parse_line(std::string_view line)
{
	static const std::regex duration_regex(R"(Duration:\s*([\d:.]+))");
	static const std::regex time_regex(R"(time=\s*([\d:.]+))");
	static const std::regex speed_regex(R"(speed=\s*([\d.]+)x)");

	std::match_results<std::string_view::const_iterator> match;

	if(std::regex_search(std::begin(line), std::end(line), match, duration_regex))
	{
		duration_seconds_ = parse_timestamp(match[1].str());
		return std::nullopt;
	}

	if(!duration_seconds_.has_value() || duration_seconds_.value() <= 0.0)
	{
		return std::nullopt;
	}

	if(!std::regex_search(std::begin(line), std::end(line), match, time_regex))
	{
		return std::nullopt;
	}

	const auto elapsed = parse_timestamp(match[1].str());
	if(!elapsed.has_value())
	{
		return std::nullopt;
	}

	ProgressSnapshot snapshot;
	snapshot.percentage = std::clamp(elapsed.value() / duration_seconds_.value() * 100.0, 0.0, 100.0);
	snapshot.status = "converting";

	if(std::regex_search(std::begin(line), std::end(line), match, speed_regex))
	{
		const double speed = std::stod(match[1].str());
		snapshot.rate = speed;
		if(speed > 0.0)
		{
			snapshot.eta_seconds = std::max(0.0, duration_seconds_.value() - elapsed.value()) / speed;
		}
	}

	return snapshot;
}

std::optional<double> FfmpegProgressParser::duration_seconds() const noexcept
{
	return duration_seconds_;
}

MediaConverter::MediaConverter(std::string executable)
	: executable_(std::move(executable))
{
}

std::filesystem::path MediaConverter::convert(
		const std::filesystem::path& input,
		const std::filesystem::path& output,
		const ConversionOptions& options,
		JobContext& context
) const
{
	return run_ffmpeg(input, output, build_arguments(input, output, options), context);
}

std::filesystem::path MediaConverter::extract_audio(
		const std::filesystem::path& input,
		const std::filesystem::path& output,
		const std::string& audio_format,
		const ConversionOptions& options,
		JobContext& context
) const
{
	return run_ffmpeg(input, output, build_audio_arguments(input, output, audio_format, options, true), context);
}

std::filesystem::path MediaConverter::convert_audio(
		const std::filesystem::path& input,
		const std::filesystem::path& output,
		const std::string& audio_format,
		const ConversionOptions& options,
		JobContext& context
) const
{
	return run_ffmpeg(input, output, build_audio_arguments(input, output, audio_format, options, false), context);
}

std::filesystem::path MediaConverter::convert_any(
		const std::filesystem::path& input,
		const std::filesystem::path& output,
		const ConversionOptions& options,
		JobContext& context
) const
{
	const auto audio_format = extension_of(output);

	// The output extension decides the audio encoder.
	auto audio_options = options;
	audio_options.audio_codec.reset();

	switch(classify(input, output))
	{
		case ConversionKind::EXTRACT_AUDIO:
			return extract_audio(input, output, audio_format, audio_options, context);
		case ConversionKind::AUDIO:
			return convert_audio(input, output, audio_format, audio_options, context);
		case ConversionKind::VIDEO:
			break;
	}

	return convert(input, output, options, context);
}

ConversionKind MediaConverter::classify(const std::filesystem::path& input, const std::filesystem::path& output)
{
	if(!AUDIO_EXTENSIONS.contains(extension_of(output)))
	{
		return ConversionKind::VIDEO;
	}

	return VIDEO_EXTENSIONS.contains(extension_of(input)) ? ConversionKind::EXTRACT_AUDIO : ConversionKind::AUDIO;
}

std::filesystem::path MediaConverter::run_ffmpeg(
		const std::filesystem::path& input,
		const std::filesystem::path& output,
		const std::vector<std::string>& arguments,
		JobContext& context
) const
{
	if(!file_exist(input))
	{
		throw ConversionError("Input file " + input.string() + " not found");
	}

	if(output.has_parent_path())
	{
		std::filesystem::create_directories(output.parent_path());
	}

	spdlog::info("Converting {} to {}", input.string(), output.string());

	FfmpegProgressParser progress_parser;
	std::string last_output;
	const auto label = input.filename().string();

	int exit_code = 0;
	try
	{
		exit_code = run_process(
				arguments,
				[&](std::string_view line)
				{
					if(auto snapshot = progress_parser.parse_line(line); snapshot.has_value())
					{
						snapshot->label = label;
						context.report_progress(snapshot.value());
						return;
					}
					last_output = line;
				},
				context.stop_token()
		);
	}
	catch(const ProcessError& error)
	{
		throw ConversionError(error.what());
	}

	if(exit_code != 0)
	{
		spdlog::error("Conversion of {} failed with code {}: {}", input.string(), exit_code, last_output);
		throw ConversionError(executable_ + " exited with code " + std::to_string(exit_code) + (last_output.empty() ? "" : ": " + last_output));
	}

	context.report_progress(ProgressSnapshot{100.0, std::nullopt, std::nullopt, "finished", label});
	spdlog::info("Converted {} to {}", input.string(), output.string());

	return output;
}

std::vector<std::string> MediaConverter::build_arguments(
		const std::filesystem::path& input,
		const std::filesystem::path& output,
		const ConversionOptions& options
) const
{
	std::vector<std::string> arguments{executable_, "-hide_banner", "-nostdin", "-y", "-i", input.string()};

	if(options.video_encoder)
	{
		arguments.insert(std::end(arguments), {"-c:v", options.video_encoder.value()});
	}
	else if(options.video_codec)
	{
		arguments.insert(std::end(arguments), {"-c:v", video_encoder(options.video_codec.value())});
	}
	if(options.video_bitrate)
	{
		arguments.insert(std::end(arguments), {"-b:v", options.video_bitrate.value()});
	}
	if(options.audio_codec)
	{
		arguments.insert(std::end(arguments), {"-c:a", audio_encoder(options.audio_codec.value())});
	}
	if(options.audio_bitrate)
	{
		arguments.insert(std::end(arguments), {"-b:a", options.audio_bitrate.value()});
	}

	arguments.push_back(output.string());

	return arguments;
}

std::vector<std::string> MediaConverter::build_audio_arguments(
		const std::filesystem::path& input,
		const std::filesystem::path& output,
		const std::string& audio_format,
		const ConversionOptions& options,
		bool drop_video
) const
{
	std::vector<std::string> arguments{executable_, "-hide_banner", "-nostdin", "-y", "-i", input.string()};

	if(drop_video)
	{
		arguments.emplace_back("-vn");
	}

	arguments.insert(std::end(arguments), {"-c:a", audio_encoder(options.audio_codec.value_or(audio_format))});

	if(options.audio_bitrate && !LOSSLESS_AUDIO_FORMATS.contains(audio_format))
	{
		arguments.insert(std::end(arguments), {"-b:a", options.audio_bitrate.value()});
	}

	arguments.push_back(output.string());

	return arguments;
}

std::string MediaConverter::video_encoder(const std::string& codec)
{
	if(codec == "h264")
	{
		return "libx264";
	}
	if(codec == "h265" || codec == "hevc")
	{
		return "libx265";
	}
	if(codec == "vp9")
	{
		return "libvpx-vp9";
	}
	if(codec == "vp8")
	{
		return "libvpx";
	}
	if(codec == "copy" || codec.starts_with("lib"))
	{
		return codec;
	}

	return "lib" + codec;
}

std::string MediaConverter::audio_encoder(const std::string& codec)
{
	const std::unordered_map<std::string, std::string> encoders{
			{"mp3", "libmp3lame"},
			{"aac", "aac"},
			{"opus", "libopus"},
			{"ogg", "libvorbis"},
			{"vorbis", "libvorbis"},
			{"flac", "flac"},
			{"wav", "pcm_s16le"},
			{"m4a", "aac"},
			{"copy", "copy"}
	};

	if(const auto encoder = encoders.find(codec); encoder != std::end(encoders))
	{
		return encoder->second;
	}

	return codec;
}
