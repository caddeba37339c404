#include "media/video_downloader.hpp"

#include <condition_variable>
#include <mutex>
#include <regex>

#include <spdlog/spdlog.h>

#include "media/url_cleaner.hpp"
#include "utils/string_utils.hpp"
#include "utils/subprocess.hpp"


namespace
{
	std::optional<double> parse_byte_size(const std::string& value)
	{
		static const std::regex size_regex(R"(^([\d.]+)\s*([KMGT]?i?B)$)");

		std::smatch match;
		if(!std::regex_match(value, match, size_regex))
		{
			return std::nullopt;
		}

		const std::string unit = match[2].str();
		double multiplier = 1.0;
		if(unit.size() > 1)
		{
			const double base = unit.find('i') != std::string::npos ? 1024.0 : 1000.0;
			const auto exponent = std::string_view("KMGT").find(unit.front()) + 1;
			for(std::size_t i = 0; i < exponent; ++i)
			{
				multiplier *= base;
			}
		}

		return std::stod(match[1].str()) * multiplier;
	}

	std::optional<double> parse_clock_seconds(const std::string& value)
	{
		static const std::regex clock_regex(R"(^(?:(\d+):)?(\d+):(\d+)$)");

		std::smatch match;
		if(!std::regex_match(value, match, clock_regex))
		{
			return std::nullopt;
		}

		const double hours = match[1].matched ? std::stod(match[1].str()) : 0.0;
		return hours * 3600.0 + std::stod(match[2].str()) * 60.0 + std::stod(match[3].str());
	}

	/// yt-dlp reports missing metadata as null.
	std::string string_field(const nlohmann::json& json, const std::string& key, const std::string& fallback)
	{
		const auto field = json.find(key);
		if(field == std::end(json) || !field->is_string())
		{
			return fallback;
		}

		return field->get<std::string>();
	}

	void wait_for_backoff(std::chrono::milliseconds delay, std::stop_token stop_token)
	{
		std::mutex mutex;
		std::condition_variable_any wakeup;

		std::unique_lock lock(mutex);
		wakeup.wait_for(lock, stop_token, delay, []() { return false; });
	}
}

void to_json(nlohmann::json& json, const VideoInfo& info)
{
	json = nlohmann::json{
		{"title", info.title},
		{"duration", info.duration_seconds},
		{"uploader", info.uploader},
		{"upload_date", info.upload_date},
		{"view_count", info.view_count},
		{"formats", info.format_count},
		{"thumbnail", info.thumbnail},
		{"description", info.description},
		{"url", info.url}
	};
}

VideoDownloader::VideoDownloader()
	: VideoDownloader(Settings{})
{
}

VideoDownloader::VideoDownloader(Settings settings)
	: settings_(std::move(settings))
{
	if(settings_.retries == 0)
	{
		throw std::invalid_argument("Download retries must be positive");
	}
}

std::filesystem::path VideoDownloader::download_video(
		const std::string& url,
		const std::filesystem::path& output_dir,
		const std::string& format_selector,
		JobContext& context
) const
{
	return run_with_retries(url, base_arguments(output_dir, format_selector), context);
}

std::filesystem::path VideoDownloader::download_audio(
		const std::string& url,
		const std::filesystem::path& output_dir,
		const std::string& audio_format,
		JobContext& context
) const
{
	auto arguments = base_arguments(output_dir, "bestaudio/best");
	arguments.insert(
			std::end(arguments),
			{"-x", "--audio-format", audio_format, "--audio-quality", "320K"}
	);

	return run_with_retries(url, std::move(arguments), context);
}

VideoInfo VideoDownloader::get_video_info(const std::string& url, JobContext& context) const
{
	const auto clean_url = UrlCleaner::clean(url);

	auto info = parse_video_info(query_metadata({"--no-playlist"}, clean_url, context));
	info.url = clean_url;

	return info;
}

std::vector<PlaylistEntry> VideoDownloader::list_playlist(const std::string& url, JobContext& context) const
{
	// Cleaning would reduce a playlist link to its current video.
	const auto playlist_url = trim(url);

	auto entries = parse_playlist(query_metadata({"--flat-playlist"}, playlist_url, context));
	spdlog::info("Playlist {} has {} entries", playlist_url, entries.size());

	return entries;
}

std::vector<std::filesystem::path> VideoDownloader::download_playlist(
		const std::string& url,
		const std::filesystem::path& output_dir,
		bool audio_only,
		const std::string& format,
		JobContext& context
) const
{
	const auto entries = list_playlist(url, context);
	if(entries.empty())
	{
		throw DownloadError("Playlist " + url + " has no entries");
	}

	std::vector<std::filesystem::path> downloaded;
	for(std::size_t index = 0; index < entries.size(); ++index)
	{
		if(context.stop_requested())
		{
			throw ProcessCancelledError("Playlist download of " + url + " cancelled");
		}

		const auto& entry = entries[index];
		spdlog::info("Downloading playlist entry {}/{}: {}", index + 1, entries.size(), entry.title);

		const auto entry_count = static_cast<double>(entries.size());
		JobContext entry_context(
			context.stop_token(),
			[&context, index, entry_count](const ProgressSnapshot& snapshot)
			{
				auto overall = snapshot;
				overall.percentage = (static_cast<double>(index) + snapshot.percentage / 100.0) / entry_count * 100.0;
				context.report_progress(overall);
			}
		);

		try
		{
			downloaded.push_back(
					audio_only
					? download_audio(entry.url, output_dir, format, entry_context)
					: download_video(entry.url, output_dir, format, entry_context)
			);
		}
		catch(const DownloadError& error)
		{
			spdlog::error("Playlist entry {}/{} failed: {}", index + 1, entries.size(), error.what());
		}
	}

	if(downloaded.empty())
	{
		throw DownloadError("None of the " + std::to_string(entries.size()) + " entries of " + url + " could be downloaded");
	}

	return downloaded;
}

VideoInfo VideoDownloader::parse_video_info(const nlohmann::json& json)
{
	VideoInfo info;
	info.title = string_field(json, "title", "Unknown");
	info.uploader = string_field(json, "uploader", "Unknown");
	info.upload_date = string_field(json, "upload_date", "");
	info.thumbnail = string_field(json, "thumbnail", "");
	info.description = string_field(json, "description", "");
	info.url = string_field(json, "webpage_url", "");

	if(const auto duration = json.find("duration"); duration != std::end(json) && duration->is_number())
	{
		info.duration_seconds = duration->get<double>();
	}
	if(const auto view_count = json.find("view_count"); view_count != std::end(json) && view_count->is_number_integer())
	{
		info.view_count = view_count->get<std::int64_t>();
	}
	if(const auto formats = json.find("formats"); formats != std::end(json) && formats->is_array())
	{
		info.format_count = formats->size();
	}

	return info;
}

std::vector<PlaylistEntry> VideoDownloader::parse_playlist(const nlohmann::json& json)
{
	const auto entries = json.find("entries");
	if(entries == std::end(json) || !entries->is_array())
	{
		throw DownloadError("Not a playlist: metadata has no entries");
	}

	std::vector<PlaylistEntry> playlist;
	for(const auto& entry: *entries)
	{
		if(!entry.is_object())
		{
			continue;
		}

		auto entry_url = string_field(entry, "webpage_url", "");
		if(entry_url.empty())
		{
			entry_url = string_field(entry, "url", "");
		}
		if(entry_url.empty())
		{
			continue;
		}

		playlist.push_back({std::move(entry_url), string_field(entry, "title", "Unknown")});
	}

	return playlist;
}

std::optional<ProgressSnapshot> VideoDownloader::parse_progress_line(std::string_view line)
{
	static const std::regex progress_regex(
			R"(^\[download\]\s+([\d.]+)%(?:\s+of\s+~?\s*(\S+))?(?:\s+at\s+(\S+))?(?:\s+ETA\s+(\S+))?)"
	);

	std::match_results<std::string_view::const_iterator> match;
	if(!std::regex_search(std::begin(line), std::end(line), match, progress_regex))
	{
		return std::nullopt;
	}

	ProgressSnapshot snapshot;
	snapshot.percentage = std::stod(match[1].str());
	snapshot.status = "downloading";

	if(match[3].matched)
	{
		auto rate = match[3].str();
		if(rate.ends_with("/s"))
		{
			rate.resize(rate.size() - 2);
		}
		snapshot.rate = parse_byte_size(rate);
	}

	if(match[4].matched)
	{
		snapshot.eta_seconds = parse_clock_seconds(match[4].str());
	}

	return snapshot;
}

std::vector<std::string> VideoDownloader::base_arguments(const std::filesystem::path& output_dir, const std::string& format_selector) const
{
	std::filesystem::create_directories(output_dir);

	return {
		settings_.executable,
		"--newline",
		"--progress",
		"--no-playlist",
		"-f", format_selector,
		"-o", (output_dir / "%(title)s.%(ext)s").string(),
		"--print", "after_move:" + std::string(FILEPATH_MARKER) + "%(filepath)s"
	};
}

std::filesystem::path VideoDownloader::run_with_retries(const std::string& url, std::vector<std::string> arguments, JobContext& context) const
{
	const auto clean_url = UrlCleaner::clean(url);
	arguments.push_back(clean_url);

	std::string last_error;
	for(std::size_t attempt = 0; attempt < settings_.retries; ++attempt)
	{
		try
		{
			auto filepath = run_once(clean_url, arguments, context);
			spdlog::info("Downloaded {} to {}", clean_url, filepath.string());
			return filepath;
		}
		catch(const DownloadError& error)
		{
			last_error = error.what();
		}
		catch(const ProcessError& error)
		{
			last_error = error.what();
		}

		spdlog::warn("Download attempt {}/{} of {} failed: {}", attempt + 1, settings_.retries, clean_url, last_error);

		if(attempt + 1 < settings_.retries)
		{
			wait_for_backoff(settings_.base_backoff * (1LL << attempt), context.stop_token());
			if(context.stop_requested())
			{
				throw ProcessCancelledError("Download of " + clean_url + " cancelled");
			}
		}
	}

	spdlog::error("All {} download attempts of {} failed", settings_.retries, clean_url);
	throw DownloadError("Download of " + clean_url + " failed after " + std::to_string(settings_.retries) + " attempts: " + last_error);
}

nlohmann::json VideoDownloader::query_metadata(std::vector<std::string> arguments, const std::string& url, JobContext& context) const
{
	arguments.insert(std::begin(arguments), {settings_.executable, "--dump-single-json", "--skip-download"});
	arguments.push_back(url);

	std::optional<nlohmann::json> metadata;
	std::string last_output;

	int exit_code = 0;
	try
	{
		exit_code = run_process(
				arguments,
				[&metadata, &last_output](std::string_view line)
				{
					if(!metadata.has_value() && line.starts_with('{'))
					{
						auto parsed = nlohmann::json::parse(std::string(line), nullptr, false);
						if(!parsed.is_discarded())
						{
							metadata = std::move(parsed);
							return;
						}
					}
					last_output = line;
				},
				context.stop_token()
		);
	}
	catch(const ProcessError& error)
	{
		throw DownloadError(error.what());
	}

	if(exit_code != 0)
	{
		throw DownloadError(settings_.executable + " exited with code " + std::to_string(exit_code) + (last_output.empty() ? "" : ": " + last_output));
	}

	if(!metadata.has_value())
	{
		throw DownloadError(settings_.executable + " returned no metadata for " + url);
	}

	return std::move(metadata.value());
}

std::filesystem::path VideoDownloader::run_once(const std::string& url, const std::vector<std::string>& arguments, JobContext& context) const
{
	std::optional<std::filesystem::path> filepath;
	std::string last_output;

	const int exit_code = run_process(
			arguments,
			[&](std::string_view line)
			{
				if(line.starts_with(FILEPATH_MARKER))
				{
					filepath = std::filesystem::path(line.substr(FILEPATH_MARKER.size()));
					return;
				}

				if(auto snapshot = parse_progress_line(line); snapshot.has_value())
				{
					snapshot->label = url;
					context.report_progress(snapshot.value());
					return;
				}

				last_output = line;
			},
			context.stop_token()
	);

	if(exit_code != 0)
	{
		throw DownloadError(settings_.executable + " exited with code " + std::to_string(exit_code) + (last_output.empty() ? "" : ": " + last_output));
	}

	if(!filepath.has_value())
	{
		throw DownloadError(settings_.executable + " did not report the downloaded file");
	}

	context.report_progress(ProgressSnapshot{100.0, std::nullopt, std::nullopt, "finished", url});

	return filepath.value();
}
