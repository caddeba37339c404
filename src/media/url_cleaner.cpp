#include "media/url_cleaner.hpp"

#include <regex>

#include <spdlog/spdlog.h>

#include "utils/string_utils.hpp"


namespace
{
	constexpr std::string_view YOUTUBE_WATCH_PREFIX = "https://www.youtube.com/watch?v=";
	constexpr std::string_view NICONICO_WATCH_PREFIX = "https://www.nicovideo.jp/watch/";

	/// Video id following marker, cut at the first query or parameter separator.
	std::string extract_id_after(const std::string& url, std::string_view marker)
	{
		const auto id_begin = url.rfind(marker) + marker.size();
		const auto id_end = url.find_first_of("?&#/", id_begin);

		return url.substr(id_begin, id_end == std::string::npos ? std::string::npos : id_end - id_begin);
	}

	std::string find_query_parameter(const std::string& url, std::string_view name)
	{
		const auto query_begin = url.find('?');
		if(query_begin == std::string::npos)
		{
			return {};
		}

		const auto query_end = url.find('#', query_begin);
		const std::string_view query = std::string_view(url).substr(query_begin + 1, query_end == std::string::npos ? std::string::npos : query_end - query_begin - 1);

		std::size_t parameter_begin = 0;
		while(parameter_begin <= query.size())
		{
			auto parameter_end = query.find('&', parameter_begin);
			if(parameter_end == std::string_view::npos)
			{
				parameter_end = query.size();
			}

			const auto parameter = query.substr(parameter_begin, parameter_end - parameter_begin);
			const auto separator = parameter.find('=');
			if(separator != std::string_view::npos && parameter.substr(0, separator) == name)
			{
				return std::string(parameter.substr(separator + 1));
			}

			parameter_begin = parameter_end + 1;
		}

		return {};
	}
}

std::string UrlCleaner::clean(std::string_view url)
{
	const auto trimmed = trim(url);

	if(trimmed.find("youtube.com") != std::string::npos || trimmed.find("youtu.be") != std::string::npos)
	{
		return clean_youtube_url(trimmed);
	}

	if(trimmed.find("nicovideo.jp") != std::string::npos)
	{
		return clean_niconico_url(trimmed);
	}

	return trimmed;
}

std::string UrlCleaner::clean_youtube_url(const std::string& url)
{
	std::string video_id;

	if(url.find("/shorts/") != std::string::npos)
	{
		video_id = extract_id_after(url, "/shorts/");
	}
	else if(url.find("youtu.be/") != std::string::npos)
	{
		video_id = extract_id_after(url, "youtu.be/");
	}
	else if(url.find("youtube.com/watch") != std::string::npos)
	{
		video_id = find_query_parameter(url, "v");
	}

	if(video_id.empty())
	{
		return url;
	}

	auto cleaned = std::string(YOUTUBE_WATCH_PREFIX) + video_id;
	spdlog::debug("Cleaned URL {} -> {}", url, cleaned);

	return cleaned;
}

std::string UrlCleaner::clean_niconico_url(const std::string& url)
{
	if(url.find("nicovideo.jp/watch/") == std::string::npos)
	{
		return url;
	}

	static const std::regex watch_id_regex("/watch/([a-z0-9]+)");

	std::smatch match;
	if(!std::regex_search(url, match, watch_id_regex))
	{
		return url;
	}

	auto cleaned = std::string(NICONICO_WATCH_PREFIX) + match[1].str();
	spdlog::debug("Cleaned URL {} -> {}", url, cleaned);

	return cleaned;
}
