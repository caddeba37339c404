#ifndef MEDIAFORGE_STRING_UTILS_HPP
#define MEDIAFORGE_STRING_UTILS_HPP

#include <algorithm>
#include <cctype>
#include <string>
#include <string_view>


/// Removes leading and trailing whitespace.
inline std::string trim(std::string_view value)
{
	const auto is_space = [](unsigned char character) { return std::isspace(character) != 0; };

	const auto begin = std::find_if_not(std::begin(value), std::end(value), is_space);
	const auto end = std::find_if_not(std::rbegin(value), std::rend(value), is_space).base();

	if(begin >= end)
	{
		return {};
	}

	return std::string(begin, end);
}


#endif //MEDIAFORGE_STRING_UTILS_HPP
