#ifndef MEDIAFORGE_MEDIA_CONVERTER_HPP
#define MEDIAFORGE_MEDIA_CONVERTER_HPP

#include <filesystem>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

#include "execution/job.hpp"
#include "model/progress.hpp"


struct ConversionError: public std::runtime_error
{
	using std::runtime_error::runtime_error;
};

struct ConversionOptions
{
	std::optional<std::string> video_codec;
	std::optional<std::string> audio_codec;
	std::optional<std::string> video_bitrate;
	std::optional<std::string> audio_bitrate;
	/// Overrides the encoder derived from video_codec, e.g. a hardware encoder.
	std::optional<std::string> video_encoder;
};

enum class ConversionKind
{
	VIDEO,
	EXTRACT_AUDIO,
	AUDIO
};

/// Turns ffmpeg's "Duration:" and "time=" output into progress snapshots.
class FfmpegProgressParser
{
public:
	std::optional<ProgressSnapshot> parse_line(std::string_view line);

	[[nodiscard]] std::optional<double> duration_seconds() const noexcept;

private:
	std::optional<double> duration_seconds_;
};

/// Converts media files through the ffmpeg command line tool. Every conversion is a
/// single attempt.
class MediaConverter
{
public:
	explicit MediaConverter(std::string executable = "ffmpeg");

	std::filesystem::path convert(
			const std::filesystem::path& input,
			const std::filesystem::path& output,
			const ConversionOptions& options,
			JobContext& context
	) const;

	/// Writes only the audio stream of a video file.
	std::filesystem::path extract_audio(
			const std::filesystem::path& input,
			const std::filesystem::path& output,
			const std::string& audio_format,
			const ConversionOptions& options,
			JobContext& context
	) const;

	std::filesystem::path convert_audio(
			const std::filesystem::path& input,
			const std::filesystem::path& output,
			const std::string& audio_format,
			const ConversionOptions& options,
			JobContext& context
	) const;

	/// Picks convert, extract_audio or convert_audio from the file extensions.
	std::filesystem::path convert_any(
			const std::filesystem::path& input,
			const std::filesystem::path& output,
			const ConversionOptions& options,
			JobContext& context
	) const;

	[[nodiscard]] static ConversionKind classify(const std::filesystem::path& input, const std::filesystem::path& output);

	[[nodiscard]] std::vector<std::string> build_arguments(
			const std::filesystem::path& input,
			const std::filesystem::path& output,
			const ConversionOptions& options
	) const;

	[[nodiscard]] std::vector<std::string> build_audio_arguments(
			const std::filesystem::path& input,
			const std::filesystem::path& output,
			const std::string& audio_format,
			const ConversionOptions& options,
			bool drop_video
	) const;

	[[nodiscard]] static std::string video_encoder(const std::string& codec);
	[[nodiscard]] static std::string audio_encoder(const std::string& codec);

private:
	std::string executable_;

	std::filesystem::path run_ffmpeg(
			const std::filesystem::path& input,
			const std::filesystem::path& output,
			const std::vector<std::string>& arguments,
			JobContext& context
	) const;
};

#endif //MEDIAFORGE_MEDIA_CONVERTER_HPP
