#ifndef MEDIAFORGE_URL_CLEANER_HPP
#define MEDIAFORGE_URL_CLEANER_HPP

#include <string>
#include <string_view>


/// Normalises video page URLs to their canonical form, dropping tracking parameters.
/// URLs of unknown sites are only trimmed.
class UrlCleaner
{
public:
	[[nodiscard]] static std::string clean(std::string_view url);

	[[nodiscard]] static std::string clean_youtube_url(const std::string& url);
	[[nodiscard]] static std::string clean_niconico_url(const std::string& url);
};

#endif //MEDIAFORGE_URL_CLEANER_HPP
