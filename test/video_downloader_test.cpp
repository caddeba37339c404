#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <chrono>
#include <filesystem>
#include <sstream>
#include <stdexcept>
#include <thread>
#include <stop_token>
#include <vector>

#include "media/video_downloader.hpp"
#include "utils/file_utils.hpp"
#include "utils/subprocess.hpp"

#include "temporary_directory.hpp"


using testing::Contains;
using testing::DoubleEq;
using testing::DoubleNear;
using testing::ElementsAre;
using testing::Eq;
using testing::HasSubstr;
using testing::IsFalse;
using testing::IsTrue;

namespace
{
	VideoDownloader make_downloader(const std::filesystem::path& executable, std::size_t retries = 3)
	{
		return VideoDownloader(VideoDownloader::Settings{executable.string(), retries, std::chrono::milliseconds(1)});
	}

	std::vector<std::string> read_lines(const std::filesystem::path& path)
	{
		std::vector<std::string> lines;
		std::istringstream content(read_file(path));
		for(std::string line; std::getline(content, line);)
		{
			lines.push_back(line);
		}

		return lines;
	}

	TEST(VideoDownloaderTest, ParsesProgressLine)
	{
		const auto snapshot = VideoDownloader::parse_progress_line("[download]  42.3% of ~ 10.00MiB at 1.50MiB/s ETA 01:05");

		ASSERT_THAT(snapshot.has_value(), IsTrue());
		EXPECT_THAT(snapshot->percentage, DoubleEq(42.3));
		EXPECT_THAT(snapshot->rate.value_or(0.0), DoubleEq(1.5 * 1024 * 1024));
		EXPECT_THAT(snapshot->eta_seconds.value_or(0.0), DoubleEq(65.0));
		EXPECT_THAT(snapshot->status, Eq("downloading"));
	}

	TEST(VideoDownloaderTest, ParsesProgressLineWithUnknownRate)
	{
		const auto snapshot = VideoDownloader::parse_progress_line("[download]   0.1% of 3.20GiB at Unknown B/s ETA Unknown");

		ASSERT_THAT(snapshot.has_value(), IsTrue());
		EXPECT_THAT(snapshot->percentage, DoubleEq(0.1));
		EXPECT_THAT(snapshot->rate.has_value(), IsFalse());
		EXPECT_THAT(snapshot->eta_seconds.has_value(), IsFalse());
	}

	TEST(VideoDownloaderTest, IgnoresOtherOutput)
	{
		EXPECT_THAT(VideoDownloader::parse_progress_line("[download] Destination: video.mp4").has_value(), IsFalse());
		EXPECT_THAT(VideoDownloader::parse_progress_line("[youtube] abc: Downloading webpage").has_value(), IsFalse());
	}

	TEST(VideoDownloaderTest, DownloadsVideoAndReportsProgress)
	{
		TemporaryDirectory directory;
		const auto arguments_file = directory.path() / "arguments";
		const auto tool = directory.write_script(
				"fake-yt-dlp",
				"printf '%s\\n' \"$@\" > '" + arguments_file.string() + "'\n"
				"echo '[youtube] JC-uvbOfag4: Downloading webpage'\n"
				"echo '[download]  10.0% of ~ 10.00MiB at 1.00MiB/s ETA 00:09'\n"
				"printf '[download]  55.5%% of 10.00MiB at 2.00MiB/s ETA 00:04\\r'\n"
				"echo 'MEDIAFORGE_FILE=/downloads/video.mp4'"
		);

		std::vector<double> reported;
		JobContext context(std::stop_token(), [&reported](const ProgressSnapshot& snapshot) { reported.push_back(snapshot.percentage); });

		const auto path = make_downloader(tool).download_video(
				"https://www.youtube.com/watch?v=JC-uvbOfag4&t=127s",
				directory.path() / "out",
				"best",
				context
		);

		EXPECT_THAT(path.string(), Eq("/downloads/video.mp4"));
		EXPECT_THAT(reported, ElementsAre(DoubleEq(10.0), DoubleEq(55.5), DoubleEq(100.0)));
		EXPECT_THAT(std::filesystem::is_directory(directory.path() / "out"), IsTrue());

		const auto arguments = read_lines(arguments_file);
		ASSERT_THAT(arguments.empty(), IsFalse());
		EXPECT_THAT(arguments, Contains("--no-playlist"));
		EXPECT_THAT(arguments, Contains("best"));
		EXPECT_THAT(arguments.back(), Eq("https://www.youtube.com/watch?v=JC-uvbOfag4"));
	}

	TEST(VideoDownloaderTest, AudioDownloadExtractsAudio)
	{
		TemporaryDirectory directory;
		const auto arguments_file = directory.path() / "arguments";
		const auto tool = directory.write_script(
				"fake-yt-dlp",
				"printf '%s\\n' \"$@\" > '" + arguments_file.string() + "'\n"
				"echo 'MEDIAFORGE_FILE=/downloads/song.mp3'"
		);

		JobContext context;
		const auto path = make_downloader(tool).download_audio("https://youtu.be/ABC123DEF456", directory.path(), "mp3", context);

		EXPECT_THAT(path.string(), Eq("/downloads/song.mp3"));

		const auto arguments = read_lines(arguments_file);
		EXPECT_THAT(arguments, Contains("-x"));
		EXPECT_THAT(arguments, Contains("--audio-format"));
		EXPECT_THAT(arguments, Contains("mp3"));
		EXPECT_THAT(arguments, Contains("bestaudio/best"));
	}

	TEST(VideoDownloaderTest, RetriesUntilAttemptSucceeds)
	{
		TemporaryDirectory directory;
		const auto attempts_file = directory.path() / "attempts";
		const auto tool = directory.write_script(
				"flaky-yt-dlp",
				"echo attempt >> '" + attempts_file.string() + "'\n"
				"if [ \"$(wc -l < '" + attempts_file.string() + "')\" -lt 2 ]; then echo 'ERROR: network unreachable'; exit 1; fi\n"
				"echo 'MEDIAFORGE_FILE=/downloads/video.mp4'"
		);

		JobContext context;
		const auto path = make_downloader(tool).download_video("https://example.com/v", directory.path(), "best", context);

		EXPECT_THAT(path.string(), Eq("/downloads/video.mp4"));
		EXPECT_THAT(read_lines(attempts_file).size(), Eq(2u));
	}

	TEST(VideoDownloaderTest, FailsAfterAllRetries)
	{
		TemporaryDirectory directory;
		const auto attempts_file = directory.path() / "attempts";
		const auto tool = directory.write_script(
				"broken-yt-dlp",
				"echo attempt >> '" + attempts_file.string() + "'\n"
				"echo 'ERROR: Video unavailable'\n"
				"exit 1"
		);

		JobContext context;
		try
		{
			static_cast<void>(make_downloader(tool, 3).download_video("https://example.com/v", directory.path(), "best", context));
			FAIL() << "Expected DownloadError";
		}
		catch(const DownloadError& error)
		{
			EXPECT_THAT(error.what(), HasSubstr("Video unavailable"));
		}

		EXPECT_THAT(read_lines(attempts_file).size(), Eq(3u));
	}

	TEST(VideoDownloaderTest, FailsWhenToolReportsNoFile)
	{
		TemporaryDirectory directory;
		const auto tool = directory.write_script("silent-yt-dlp", "exit 0");

		JobContext context;
		EXPECT_THROW(
				static_cast<void>(make_downloader(tool, 1).download_video("https://example.com/v", directory.path(), "best", context)),
				DownloadError
		);
	}

	TEST(VideoDownloaderTest, CancellationIsNotRetried)
	{
		TemporaryDirectory directory;
		const auto attempts_file = directory.path() / "attempts";
		const auto tool = directory.write_script(
				"slow-yt-dlp",
				"echo attempt >> '" + attempts_file.string() + "'\n"
				"exec sleep 10"
		);

		std::stop_source stop_source;
		JobContext context(stop_source.get_token(), {});
		std::jthread stopper([&stop_source]()
		{
			std::this_thread::sleep_for(std::chrono::milliseconds(100));
			stop_source.request_stop();
		});

		EXPECT_THROW(
				static_cast<void>(make_downloader(tool).download_video("https://example.com/v", directory.path(), "best", context)),
				ProcessCancelledError
		);
		EXPECT_THAT(read_lines(attempts_file).size(), Eq(1u));
	}

	TEST(VideoDownloaderTest, RequiresAtLeastOneAttempt)
	{
		EXPECT_THROW(VideoDownloader(VideoDownloader::Settings{"yt-dlp", 0, std::chrono::milliseconds(1)}), std::invalid_argument);
	}

	TEST(VideoDownloaderTest, ParsesVideoInfoWithMissingFields)
	{
		const auto info = VideoDownloader::parse_video_info(nlohmann::json::parse(R"({
			"title": "Sample clip",
			"duration": 127.5,
			"uploader": null,
			"upload_date": "20240102",
			"view_count": 4200,
			"formats": [{"format_id": "18"}, {"format_id": "22"}],
			"description": null
		})"));

		EXPECT_THAT(info.title, Eq("Sample clip"));
		EXPECT_THAT(info.duration_seconds, DoubleEq(127.5));
		EXPECT_THAT(info.uploader, Eq("Unknown"));
		EXPECT_THAT(info.upload_date, Eq("20240102"));
		EXPECT_THAT(info.view_count, Eq(4200));
		EXPECT_THAT(info.format_count, Eq(2u));
		EXPECT_THAT(info.thumbnail.empty(), IsTrue());
		EXPECT_THAT(info.description.empty(), IsTrue());
	}

	TEST(VideoDownloaderTest, ParsesPlaylistEntries)
	{
		const auto entries = VideoDownloader::parse_playlist(nlohmann::json::parse(R"({
			"title": "Mix",
			"entries": [
				{"url": "https://example.com/one", "title": "One"},
				{"webpage_url": "https://example.com/two", "url": "two", "title": null},
				{"title": "No link"},
				null
			]
		})"));

		ASSERT_THAT(entries.size(), Eq(2u));
		EXPECT_THAT(entries[0].url, Eq("https://example.com/one"));
		EXPECT_THAT(entries[0].title, Eq("One"));
		EXPECT_THAT(entries[1].url, Eq("https://example.com/two"));
		EXPECT_THAT(entries[1].title, Eq("Unknown"));
	}

	TEST(VideoDownloaderTest, RejectsMetadataWithoutEntries)
	{
		EXPECT_THROW(
				static_cast<void>(VideoDownloader::parse_playlist(nlohmann::json::parse(R"({"title": "Single video"})"))),
				DownloadError
		);
	}

	TEST(VideoDownloaderTest, QueriesVideoInfoWithoutDownloading)
	{
		TemporaryDirectory directory;
		const auto arguments_file = directory.path() / "arguments";
		const auto tool = directory.write_script(
				"fake-yt-dlp",
				"printf '%s\\n' \"$@\" > '" + arguments_file.string() + "'\n"
				"echo 'WARNING: falling back to generic extractor'\n"
				"echo '{\"title\": \"Clip\", \"duration\": 60, \"view_count\": 7}'"
		);

		JobContext context;
		const auto info = make_downloader(tool).get_video_info("https://www.youtube.com/watch?v=JC-uvbOfag4&t=127s", context);

		EXPECT_THAT(info.title, Eq("Clip"));
		EXPECT_THAT(info.duration_seconds, DoubleEq(60.0));
		EXPECT_THAT(info.view_count, Eq(7));
		EXPECT_THAT(info.url, Eq("https://www.youtube.com/watch?v=JC-uvbOfag4"));

		const auto arguments = read_lines(arguments_file);
		EXPECT_THAT(arguments, Contains("--dump-single-json"));
		EXPECT_THAT(arguments, Contains("--skip-download"));
		EXPECT_THAT(arguments, Contains("--no-playlist"));
	}

	TEST(VideoDownloaderTest, VideoInfoFailsWithoutMetadata)
	{
		TemporaryDirectory directory;
		const auto tool = directory.write_script("fake-yt-dlp", "echo 'ERROR: Unsupported URL'\nexit 1");

		JobContext context;
		try
		{
			static_cast<void>(make_downloader(tool).get_video_info("https://example.com/v", context));
			FAIL() << "Expected DownloadError";
		}
		catch(const DownloadError& error)
		{
			EXPECT_THAT(error.what(), HasSubstr("Unsupported URL"));
		}
	}

	TEST(VideoDownloaderTest, PlaylistDownloadSkipsFailedEntries)
	{
		TemporaryDirectory directory;
		const auto tool = directory.write_script(
				"fake-yt-dlp",
				"for last; do :; done\n"
				"if [ \"$1\" = --dump-single-json ]; then\n"
				"  echo '{\"entries\": [{\"url\": \"https://example.com/one\", \"title\": \"One\"}, {\"url\": \"https://example.com/broken\", \"title\": \"Broken\"}, {\"url\": \"https://example.com/three\", \"title\": \"Three\"}]}'\n"
				"  exit 0\n"
				"fi\n"
				"case \"$last\" in *broken) echo 'ERROR: Video unavailable'; exit 1;; esac\n"
				"echo \"MEDIAFORGE_FILE=/downloads/${last##*/}.mp4\""
		);

		std::vector<double> reported;
		JobContext context(std::stop_token(), [&reported](const ProgressSnapshot& snapshot) { reported.push_back(snapshot.percentage); });

		const auto paths = make_downloader(tool, 1).download_playlist(
				"https://www.youtube.com/playlist?list=PL123",
				directory.path(),
				false,
				"best",
				context
		);

		ASSERT_THAT(paths.size(), Eq(2u));
		EXPECT_THAT(paths[0].string(), Eq("/downloads/one.mp4"));
		EXPECT_THAT(paths[1].string(), Eq("/downloads/three.mp4"));

		ASSERT_THAT(reported.size(), Eq(2u));
		EXPECT_THAT(reported[0], DoubleNear(100.0 / 3.0, 1e-9));
		EXPECT_THAT(reported[1], DoubleEq(100.0));
	}

	TEST(VideoDownloaderTest, PlaylistDownloadFailsWhenEveryEntryFails)
	{
		TemporaryDirectory directory;
		const auto tool = directory.write_script(
				"fake-yt-dlp",
				"if [ \"$1\" = --dump-single-json ]; then\n"
				"  echo '{\"entries\": [{\"url\": \"https://example.com/one\"}]}'\n"
				"  exit 0\n"
				"fi\n"
				"exit 1"
		);

		JobContext context;
		EXPECT_THROW(
				static_cast<void>(make_downloader(tool, 1).download_playlist("https://example.com/list", directory.path(), true, "mp3", context)),
				DownloadError
		);
	}

	TEST(VideoDownloaderTest, EmptyPlaylistFails)
	{
		TemporaryDirectory directory;
		const auto tool = directory.write_script("fake-yt-dlp", "echo '{\"entries\": []}'");

		JobContext context;
		EXPECT_THROW(
				static_cast<void>(make_downloader(tool).download_playlist("https://example.com/list", directory.path(), false, "best", context)),
				DownloadError
		);
	}
}
