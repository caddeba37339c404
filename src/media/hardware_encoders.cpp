#include "media/hardware_encoders.hpp"

#include <regex>
#include <sstream>

#include <spdlog/spdlog.h>

#include "media/media_converter.hpp"
#include "utils/subprocess.hpp"


HardwareEncoders HardwareEncoders::detect(const std::string& ffmpeg_executable)
{
	HardwareEncoders encoders;

	try
	{
		const int exit_code = run_process(
				{ffmpeg_executable, "-hide_banner", "-encoders"},
				[&encoders](std::string_view line)
				{
					encoders.add_encoder_line(line);
				}
		);

		if(exit_code != 0)
		{
			spdlog::warn("{} -encoders exited with code {}, using software encoders", ffmpeg_executable, exit_code);
			return HardwareEncoders();
		}
	}
	catch(const ProcessError& error)
	{
		spdlog::warn("Cannot query encoders of {}: {}", ffmpeg_executable, error.what());
		return HardwareEncoders();
	}

	spdlog::info("Hardware encoders: nvenc={}, qsv={}", encoders.has_nvenc(), encoders.has_qsv());

	return encoders;
}

HardwareEncoders HardwareEncoders::from_encoder_list(std::string_view encoder_list)
{
	HardwareEncoders encoders;

	std::istringstream lines{std::string(encoder_list)};
	for(std::string line; std::getline(lines, line);)
	{
		encoders.add_encoder_line(line);
	}

	return encoders;
}

bool HardwareEncoders::has_nvenc() const
{
	return offers("h264_nvenc");
}

bool HardwareEncoders::has_qsv() const
{
	return offers("h264_qsv");
}

bool HardwareEncoders::offers(const std::string& encoder) const
{
	return encoders_.contains(encoder);
}

std::string HardwareEncoders::best_encoder(const std::string& codec) const
{
	std::string prefix;
	if(codec == "h264")
	{
		prefix = "h264";
	}
	else if(codec == "h265" || codec == "hevc")
	{
		prefix = "hevc";
	}
	else
	{
		return MediaConverter::video_encoder(codec);
	}

	for(const auto* backend: {"_nvenc", "_qsv"})
	{
		if(const auto encoder = prefix + backend; offers(encoder))
		{
			return encoder;
		}
	}

	return MediaConverter::video_encoder(codec);
}

void HardwareEncoders::add_encoder_line(std::string_view line)
{
	// " V....D h264_nvenc    NVIDIA NVENC H.264 encoder (codec h264)"
	static const std::regex encoder_regex(R"(^\s*V[F.][S.][X.][B.][D.]\s+([A-Za-z0-9_]\S*))");

	std::match_results<std::string_view::const_iterator> match;
	if(std::regex_search(std::begin(line), std::end(line), match, encoder_regex))
	{
		encoders_.insert(match[1].str());
	}
}
