#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <stop_token>
#include <string>
#include <vector>

#include "media/hardware_encoders.hpp"
#include "media/media_converter.hpp"
#include "utils/file_utils.hpp"

#include "temporary_directory.hpp"


using testing::DoubleEq;
using testing::ElementsAre;
using testing::Eq;
using testing::HasSubstr;
using testing::IsFalse;
using testing::IsTrue;
using testing::Not;

namespace
{
	TEST(FfmpegProgressParserTest, DerivesPercentageFromDurationAndTime)
	{
		FfmpegProgressParser parser;

		EXPECT_THAT(parser.parse_line("  Duration: 00:01:40.00, start: 0.000000, bitrate: 1000 kb/s").has_value(), IsFalse());
		EXPECT_THAT(parser.duration_seconds().value_or(0.0), DoubleEq(100.0));

		const auto snapshot = parser.parse_line(
				"frame=  100 fps= 25 q=28.0 size=    1024kB time=00:00:25.00 bitrate= 335.5kbits/s speed=2.0x"
		);

		ASSERT_THAT(snapshot.has_value(), IsTrue());
		EXPECT_THAT(snapshot->percentage, DoubleEq(25.0));
		EXPECT_THAT(snapshot->rate.value_or(0.0), DoubleEq(2.0));
		EXPECT_THAT(snapshot->eta_seconds.value_or(0.0), DoubleEq(37.5));
		EXPECT_THAT(snapshot->status, Eq("converting"));
	}

	TEST(FfmpegProgressParserTest, IgnoresTimeBeforeDurationIsKnown)
	{
		FfmpegProgressParser parser;

		EXPECT_THAT(parser.parse_line("size=    1024kB time=00:00:25.00 bitrate= 335.5kbits/s").has_value(), IsFalse());
	}

	TEST(FfmpegProgressParserTest, IgnoresUnavailableTime)
	{
		FfmpegProgressParser parser;
		static_cast<void>(parser.parse_line("Duration: 00:00:10.00, start: 0.000000"));

		EXPECT_THAT(parser.parse_line("size=N/A time=N/A bitrate=N/A speed=N/A").has_value(), IsFalse());
	}

	TEST(MediaConverterTest, MapsCodecsToEncoders)
	{
		EXPECT_THAT(MediaConverter::video_encoder("h264"), Eq("libx264"));
		EXPECT_THAT(MediaConverter::video_encoder("h265"), Eq("libx265"));
		EXPECT_THAT(MediaConverter::video_encoder("vp9"), Eq("libvpx-vp9"));
		EXPECT_THAT(MediaConverter::video_encoder("vp8"), Eq("libvpx"));
		EXPECT_THAT(MediaConverter::video_encoder("copy"), Eq("copy"));
		EXPECT_THAT(MediaConverter::audio_encoder("mp3"), Eq("libmp3lame"));
		EXPECT_THAT(MediaConverter::audio_encoder("aac"), Eq("aac"));
		EXPECT_THAT(MediaConverter::audio_encoder("wav"), Eq("pcm_s16le"));
		EXPECT_THAT(MediaConverter::audio_encoder("pcm_s16le"), Eq("pcm_s16le"));
	}

	TEST(MediaConverterTest, BuildsCommandLine)
	{
		const MediaConverter converter("ffmpeg");
		ConversionOptions options;
		options.video_codec = "h264";
		options.audio_bitrate = "320k";

		const std::vector<std::string> expected{
				"ffmpeg", "-hide_banner", "-nostdin", "-y", "-i", "in.webm", "-c:v", "libx264", "-b:a", "320k", "out.mp4"
		};
		EXPECT_THAT(converter.build_arguments("in.webm", "out.mp4", options), Eq(expected));
	}

	TEST(MediaConverterTest, ExplicitVideoEncoderOverridesCodec)
	{
		const MediaConverter converter("ffmpeg");
		ConversionOptions options;
		options.video_codec = "h264";
		options.video_encoder = "h264_nvenc";

		const std::vector<std::string> expected{
				"ffmpeg", "-hide_banner", "-nostdin", "-y", "-i", "in.mkv", "-c:v", "h264_nvenc", "out.mp4"
		};
		EXPECT_THAT(converter.build_arguments("in.mkv", "out.mp4", options), Eq(expected));
	}

	TEST(MediaConverterTest, AudioExtractionDropsVideoStream)
	{
		const MediaConverter converter("ffmpeg");
		ConversionOptions options;
		options.audio_bitrate = "192k";

		const std::vector<std::string> expected{
				"ffmpeg", "-hide_banner", "-nostdin", "-y", "-i", "clip.mp4", "-vn", "-c:a", "libmp3lame", "-b:a", "192k", "clip.mp3"
		};
		EXPECT_THAT(converter.build_audio_arguments("clip.mp4", "clip.mp3", "mp3", options, true), Eq(expected));
	}

	TEST(MediaConverterTest, LosslessAudioIgnoresBitrate)
	{
		const MediaConverter converter("ffmpeg");
		ConversionOptions options;
		options.audio_bitrate = "320k";

		const std::vector<std::string> expected{
				"ffmpeg", "-hide_banner", "-nostdin", "-y", "-i", "song.mp3", "-c:a", "flac", "song.flac"
		};
		EXPECT_THAT(converter.build_audio_arguments("song.mp3", "song.flac", "flac", options, false), Eq(expected));
	}

	TEST(MediaConverterTest, ClassifiesByExtension)
	{
		EXPECT_THAT(MediaConverter::classify("video.MP4", "audio.mp3"), Eq(ConversionKind::EXTRACT_AUDIO));
		EXPECT_THAT(MediaConverter::classify("video.webm", "audio.wav"), Eq(ConversionKind::EXTRACT_AUDIO));
		EXPECT_THAT(MediaConverter::classify("song.flac", "song.ogg"), Eq(ConversionKind::AUDIO));
		EXPECT_THAT(MediaConverter::classify("video.webm", "video.mp4"), Eq(ConversionKind::VIDEO));
		EXPECT_THAT(MediaConverter::classify("video.mkv", "video"), Eq(ConversionKind::VIDEO));
	}

	TEST(MediaConverterTest, ConvertAnyExtractsAudioFromVideo)
	{
		TemporaryDirectory directory;
		const auto input = directory.write_file("clip.mkv", "media");
		const auto arguments_file = directory.path() / "arguments";
		const auto tool = directory.write_script(
				"fake-ffmpeg",
				"printf '%s\\n' \"$@\" > '" + arguments_file.string() + "'\n"
				"exit 0"
		);

		ConversionOptions options;
		options.audio_codec = "aac";
		options.video_codec = "h264";

		JobContext context;
		const auto output = MediaConverter(tool.string()).convert_any(input, directory.path() / "clip.mp3", options, context);

		EXPECT_THAT(output == directory.path() / "clip.mp3", IsTrue());

		const auto arguments = read_file(arguments_file);
		EXPECT_THAT(arguments, HasSubstr("-vn\n"));
		EXPECT_THAT(arguments, HasSubstr("-c:a\nlibmp3lame\n"));
		EXPECT_THAT(arguments, Not(HasSubstr("-c:v")));
	}

	TEST(MediaConverterTest, MissingInputFailsImmediately)
	{
		TemporaryDirectory directory;
		JobContext context;

		EXPECT_THROW(
				static_cast<void>(MediaConverter("/bin/false").convert(directory.path() / "missing.webm", directory.path() / "out.mp4", {}, context)),
				ConversionError
		);
	}

	TEST(MediaConverterTest, ConvertsAndReportsProgress)
	{
		TemporaryDirectory directory;
		const auto input = directory.write_file("input.webm", "media");
		const auto tool = directory.write_script(
				"fake-ffmpeg",
				"echo '  Duration: 00:00:10.00, start: 0.000000, bitrate: 1000 kb/s' 1>&2\n"
				"printf 'frame=1 size=1kB time=00:00:05.00 bitrate=1kbits/s speed=1.0x\\r' 1>&2\n"
				"exit 0"
		);

		std::vector<double> reported;
		JobContext context(std::stop_token(), [&reported](const ProgressSnapshot& snapshot) { reported.push_back(snapshot.percentage); });

		const auto output = MediaConverter(tool.string()).convert(input, directory.path() / "converted" / "out.mp4", {}, context);

		EXPECT_THAT(output == directory.path() / "converted" / "out.mp4", IsTrue());
		EXPECT_THAT(reported, ElementsAre(DoubleEq(50.0), DoubleEq(100.0)));
	}

	TEST(MediaConverterTest, MissingInputFailsAudioConversion)
	{
		TemporaryDirectory directory;
		JobContext context;

		EXPECT_THROW(
				static_cast<void>(MediaConverter("/bin/false").extract_audio(directory.path() / "missing.mp4", directory.path() / "out.mp3", "mp3", {}, context)),
				ConversionError
		);
	}

	TEST(MediaConverterTest, ReportsToolFailure)
	{
		TemporaryDirectory directory;
		const auto input = directory.write_file("input.webm", "media");
		const auto tool = directory.write_script(
				"failing-ffmpeg",
				"echo 'input.webm: Invalid data found when processing input' 1>&2\n"
				"exit 1"
		);

		JobContext context;
		try
		{
			static_cast<void>(MediaConverter(tool.string()).convert(input, directory.path() / "out.mp4", {}, context));
			FAIL() << "Expected ConversionError";
		}
		catch(const ConversionError& error)
		{
			EXPECT_THAT(error.what(), HasSubstr("Invalid data found"));
		}
	}

	TEST(HardwareEncodersTest, ParsesEncoderList)
	{
		const auto encoders = HardwareEncoders::from_encoder_list(
				"Encoders:\n"
				" V..... = Video\n"
				" ------\n"
				" V....D libx264              libx264 H.264 / AVC (codec h264)\n"
				" V....D h264_qsv             H.264 / AVC (Intel Quick Sync Video acceleration) (codec h264)\n"
				" V....D hevc_qsv             HEVC (Intel Quick Sync Video acceleration) (codec hevc)\n"
				" A....D aac                  AAC (Advanced Audio Coding)\n"
		);

		EXPECT_THAT(encoders.has_qsv(), IsTrue());
		EXPECT_THAT(encoders.has_nvenc(), IsFalse());
		EXPECT_THAT(encoders.offers("libx264"), IsTrue());
		EXPECT_THAT(encoders.offers("aac"), IsFalse());
		EXPECT_THAT(encoders.offers("="), IsFalse());
	}

	TEST(HardwareEncodersTest, PrefersNvencThenQsvThenSoftware)
	{
		const auto both = HardwareEncoders::from_encoder_list(
				" V....D h264_nvenc           NVIDIA NVENC H.264 encoder (codec h264)\n"
				" V....D h264_qsv             H.264 / AVC (Intel Quick Sync Video acceleration) (codec h264)\n"
				" V....D hevc_qsv             HEVC (Intel Quick Sync Video acceleration) (codec hevc)\n"
		);
		const auto none = HardwareEncoders::from_encoder_list("");

		EXPECT_THAT(both.best_encoder("h264"), Eq("h264_nvenc"));
		EXPECT_THAT(both.best_encoder("h265"), Eq("hevc_qsv"));
		EXPECT_THAT(both.best_encoder("vp9"), Eq("libvpx-vp9"));
		EXPECT_THAT(none.best_encoder("h264"), Eq("libx264"));
		EXPECT_THAT(none.best_encoder("hevc"), Eq("libx265"));
	}

	TEST(HardwareEncodersTest, DetectsThroughFfmpeg)
	{
		TemporaryDirectory directory;
		const auto tool = directory.write_script(
				"fake-ffmpeg",
				"echo ' V....D h264_nvenc           NVIDIA NVENC H.264 encoder (codec h264)'"
		);

		EXPECT_THAT(HardwareEncoders::detect(tool.string()).has_nvenc(), IsTrue());
	}

	TEST(HardwareEncodersTest, UnusableFfmpegOffersNoHardwareEncoders)
	{
		TemporaryDirectory directory;

		EXPECT_THAT(HardwareEncoders::detect((directory.path() / "missing-ffmpeg").string()).best_encoder("h264"), Eq("libx264"));
		EXPECT_THAT(HardwareEncoders::detect("/bin/false").has_nvenc(), IsFalse());
	}
}
